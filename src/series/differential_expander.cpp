#include "series/differential_expander.hpp"

#include "eval/semantics.hpp"
#include "form/derivative.hpp"
#include "form/expression_util.hpp"
#include "form/substitution.hpp"
#include "series/singularity_checker.hpp"
#include "sys/log.hpp"

using E = ExpressionUtil;

Expression DifferentialExpander::expand(const Expression& e,
                                        const ExpansionSpecList& specs) {
  SingularityChecker::checkPoints(specs);
  return expandFrom(e, specs, 0);
}

Expression DifferentialExpander::expandFrom(const Expression& e,
                                            const ExpansionSpecList& specs,
                                            size_t index) {
  if (index >= specs.size()) {
    return e;
  }
  const auto& spec = specs[index];
  const auto& var = spec.varName();
  Expression sum(Expression::Type::SUM);
  Expression d = e;
  for (int64_t k = 0; k <= spec.order; k++) {
    if (k > 0) {
      d = Derivative::derive(d, var, 1);
    }
    auto c = Substitution::substitute(d, var, spec.point);
    if (Substitution::isIndeterminate(c)) {
      // keep the unevaluated derivative
      Log::get().debug("Indeterminate coefficient " + std::to_string(k) +
                       " at " + var + "=" + spec.point.toString() +
                       ", using " + d.toString());
      c = d;
    }
    c = expandFrom(c, specs, index + 1);
    auto factorial = Semantics::factorial(k);
    auto shifted = E::newDifference(spec.variable, spec.point);
    Expression term(
        Expression::Type::PRODUCT, "",
        {c, E::newFraction(E::newConstant(Number::ONE), E::newConstant(factorial)),
         E::newPower(shifted, E::newConstant(Number(k)))});
    sum.newChild(term);
  }
  return sum;
}
