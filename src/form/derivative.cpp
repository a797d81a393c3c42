#include "form/derivative.hpp"

#include <stdexcept>

#include "form/expression_util.hpp"

using E = ExpressionUtil;

Expression Derivative::derive(const Expression& e, const std::string& var,
                              int64_t order) {
  if (order < 0) {
    throw std::runtime_error("invalid derivative order: " +
                             std::to_string(order));
  }
  auto result = e;
  for (int64_t i = 0; i < order; i++) {
    result = deriveOnce(result, var);
    E::normalize(result);
  }
  return result;
}

Expression Derivative::deriveOnce(const Expression& e,
                                  const std::string& var) {
  if (e.type != Expression::Type::VECTOR && E::isFreeOf(e, var)) {
    return E::newConstant(Number::ZERO);
  }
  switch (e.type) {
    case Expression::Type::CONSTANT:
    case Expression::Type::INFINITE:
      return E::newConstant(Number::ZERO);
    case Expression::Type::PARAMETER:
      return E::newConstant(e.name == var ? Number::ONE : Number::ZERO);
    case Expression::Type::VECTOR:
    case Expression::Type::SUM: {
      Expression result(e.type);
      for (const auto& c : e.children) {
        result.newChild(deriveOnce(c, var));
      }
      return result;
    }
    case Expression::Type::PRODUCT: {
      // (f*g*h)' = f'*g*h + f*g'*h + f*g*h'
      Expression result(Expression::Type::SUM);
      for (size_t i = 0; i < e.children.size(); i++) {
        if (E::isFreeOf(e.children[i], var)) {
          continue;
        }
        auto term = e;
        term.children[i] = deriveOnce(e.children[i], var);
        result.newChild(term);
      }
      return result;
    }
    case Expression::Type::FRACTION: {
      // (f/g)' = (f'*g - f*g')/g^2
      const auto& f = e.children[0];
      const auto& g = e.children[1];
      auto numerator =
          E::newDifference(E::newProduct(deriveOnce(f, var), g),
                           E::newProduct(f, deriveOnce(g, var)));
      return E::newFraction(numerator,
                            E::newPower(g, E::newConstant(Number::TWO)));
    }
    case Expression::Type::POWER: {
      const auto& base = e.children[0];
      const auto& exp = e.children[1];
      auto logBase = E::newFunction("log", base);
      if (E::isFreeOf(exp, var)) {
        // (f^c)' = c*f^(c-1)*f'
        auto reduced =
            E::newPower(base, E::newSum(exp, E::newConstant(Number::MINUS_ONE)));
        return Expression(Expression::Type::PRODUCT, "",
                          {exp, reduced, deriveOnce(base, var)});
      }
      if (E::isFreeOf(base, var)) {
        // (c^g)' = c^g*log(c)*g'
        return Expression(Expression::Type::PRODUCT, "",
                          {e, logBase, deriveOnce(exp, var)});
      }
      // (f^g)' = f^g*(g'*log(f) + g*f'/f)
      auto inner = E::newSum(
          E::newProduct(deriveOnce(exp, var), logBase),
          E::newFraction(E::newProduct(exp, deriveOnce(base, var)), base));
      return E::newProduct(e, inner);
    }
    case Expression::Type::FUNCTION:
      return deriveFunction(e, var);
    case Expression::Type::DERIVATIVE:
      return deriveMarker(e, var);
  }
  return E::newConstant(Number::ZERO);
}

Expression Derivative::deriveFunction(const Expression& e,
                                      const std::string& var) {
  if (e.children.size() != 1) {
    return E::newDerivative(e, var, 1);
  }
  const auto& u = e.children[0];
  const auto& f = e.name;
  const auto one = E::newConstant(Number::ONE);
  const auto minusOne = E::newConstant(Number::MINUS_ONE);
  const auto two = E::newConstant(Number::TWO);
  Expression outer;
  if (f == "sin") {
    outer = E::newFunction("cos", u);
  } else if (f == "cos") {
    outer = E::newProduct(minusOne, E::newFunction("sin", u));
  } else if (f == "tan") {
    outer = E::newPower(E::newFunction("cos", u), E::newConstant(-2));
  } else if (f == "exp") {
    outer = e;
  } else if (f == "log") {
    outer = E::newFraction(one, u);
  } else if (f == "sqrt") {
    outer = E::newFraction(one, E::newProduct(two, e));
  } else if (f == "sinh") {
    outer = E::newFunction("cosh", u);
  } else if (f == "cosh") {
    outer = E::newFunction("sinh", u);
  } else if (f == "atan") {
    outer = E::newFraction(one, E::newSum(one, E::newPower(u, two)));
  } else if (f == "asin" || f == "acos") {
    auto root = E::newFunction(
        "sqrt", E::newDifference(one, E::newPower(u, two)));
    outer = E::newFraction(f == "asin" ? one : minusOne, root);
  } else if (f == "abs") {
    outer = E::newFraction(u, e);
  } else {
    return E::newDerivative(e, var, 1);
  }
  // chain rule
  return E::newProduct(outer, deriveOnce(u, var));
}

// d/dx diff(f,x,k) = diff(f,x,k+1), d/dy diff(f,x,k) = diff(diff(f,x,k),y,1)
Expression Derivative::deriveMarker(const Expression& e,
                                    const std::string& var) {
  if (e.name == var) {
    auto result = e;
    result.value += Number::ONE;
    return result;
  }
  return E::newDerivative(e, var, 1);
}
