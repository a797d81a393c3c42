#include "series/expansion_driver.hpp"

#include <algorithm>

#include "form/expression_util.hpp"
#include "series/differential_expander.hpp"
#include "series/known_series.hpp"
#include "series/self_reference.hpp"
#include "series/series_error.hpp"
#include "series/singularity_checker.hpp"
#include "sys/log.hpp"

ExpansionDriver::ExpansionDriver(const Settings& settings)
    : settings(settings) {}

Expression ExpansionDriver::expand(const Expression& e,
                                   const ExpansionSpecList& specs) const {
  SingularityChecker::checkPoints(specs);
  Expression cur = e;
  Expression result;
  for (int64_t round = 1; round <= settings.max_rounds; round++) {
    Log::get().debug("Expansion round " + std::to_string(round) + ": " +
                     cur.toString());
    if (expandKnown(cur, specs, result)) {
      return result;
    }
    if (isFree(cur, specs)) {
      return cur;
    }
    auto candidate = DifferentialExpander::expand(cur, specs);
    auto matches = SelfReference::search(cur, candidate);
    auto unresolved = SelfReference::unresolved(matches);
    if (!unresolved.empty()) {
      throw DivergentExpansionError("expansion of " + cur.toString() +
                                    " contains itself in " +
                                    unresolved.front().toString());
    }
    result = candidate;
    ExpressionUtil::normalize(result);
    if (!matches.empty()) {
      // only derivative markers refer to the expression
      return result;
    }
    auto normalized = cur;
    ExpressionUtil::normalize(normalized);
    if (result == normalized) {
      return result;
    }
    cur = result;
  }
  Log::get().warn("Reached maximum number of expansion rounds (" +
                  std::to_string(settings.max_rounds) + ")");
  return cur;
}

bool ExpansionDriver::isFree(const Expression& e,
                             const ExpansionSpecList& specs) const {
  for (const auto& spec : specs) {
    if (!ExpressionUtil::isFreeOf(e, spec.varName())) {
      return false;
    }
  }
  return true;
}

// Variables are expanded from left to right, so the closed form is used for
// the first spec whose variable occurs in e. Its coefficients may depend on
// the variables of the following specs and are expanded in those.
bool ExpansionDriver::expandKnown(const Expression& e,
                                  const ExpansionSpecList& specs,
                                  Expression& result) const {
  auto it = std::find_if(specs.begin(), specs.end(),
                         [&e](const ExpansionSpec& spec) {
                           return !ExpressionUtil::isFreeOf(e, spec.varName());
                         });
  std::vector<Expression> coefficients;
  if (it == specs.end() || !KnownSeries::apply(e, *it, coefficients)) {
    return false;
  }
  const ExpansionSpecList rest(it + 1, specs.end());
  const auto shifted = ExpressionUtil::newDifference(it->variable, it->point);
  Expression sum(Expression::Type::SUM);
  for (size_t k = 0; k < coefficients.size(); k++) {
    auto c = rest.empty() ? coefficients[k] : expand(coefficients[k], rest);
    sum.newChild(ExpressionUtil::newProduct(
        c, ExpressionUtil::newPower(
               shifted, ExpressionUtil::newConstant(static_cast<int64_t>(k)))));
  }
  ExpressionUtil::normalize(sum);
  result = sum;
  return true;
}
