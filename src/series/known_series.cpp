#include "series/known_series.hpp"

#include "eval/semantics.hpp"
#include "form/expression_util.hpp"

using E = ExpressionUtil;

Number reciprocalFactorial(int64_t k) {
  return Semantics::div(Number::ONE, Semantics::factorial(k));
}

int64_t alternating(int64_t k) { return k % 2 == 0 ? 1 : -1; }

bool KnownSeries::coefficient(const std::string& func, const Expression& point,
                              int64_t k, Expression& result) {
  if (func == "exp") {
    result = E::newProduct(E::newFunction("exp", point),
                           E::newConstant(reciprocalFactorial(k)));
    E::normalize(result);
    return true;
  }
  const bool odd = k % 2 == 1;
  Number c;
  if (E::isConstant(point, Number::ZERO)) {
    if (func == "sin") {
      c = odd ? Semantics::mul(alternating((k - 1) / 2), reciprocalFactorial(k))
              : Number::ZERO;
    } else if (func == "cos") {
      c = odd ? Number::ZERO
              : Semantics::mul(alternating(k / 2), reciprocalFactorial(k));
    } else if (func == "sinh") {
      c = odd ? reciprocalFactorial(k) : Number::ZERO;
    } else if (func == "cosh") {
      c = odd ? Number::ZERO : reciprocalFactorial(k);
    } else if (func == "atan") {
      c = odd ? Number(alternating((k - 1) / 2), k) : Number::ZERO;
    } else {
      return false;
    }
  } else if (E::isConstant(point, Number::ONE) && func == "log") {
    c = k == 0 ? Number::ZERO : Number(alternating(k + 1), k);
  } else {
    return false;
  }
  result = E::newConstant(c);
  return true;
}

bool KnownSeries::apply(const Expression& e, const ExpansionSpec& spec,
                        std::vector<Expression>& coefficients) {
  if (e.type != Expression::Type::FUNCTION || e.children.size() != 1 ||
      e.children[0].type != Expression::Type::PARAMETER ||
      e.children[0].name != spec.varName()) {
    return false;
  }
  auto point = spec.point;
  E::normalize(point);
  std::vector<Expression> result;
  for (int64_t k = 0; k <= spec.order; k++) {
    Expression c;
    if (!coefficient(e.name, point, k, c)) {
      return false;
    }
    result.push_back(c);
  }
  coefficients = result;
  return true;
}
