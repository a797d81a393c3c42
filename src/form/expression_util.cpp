#include "form/expression_util.hpp"

#include <algorithm>
#include <map>

#include "eval/semantics.hpp"

Expression ExpressionUtil::newConstant(const Number& value) {
  return Expression(Expression::Type::CONSTANT, "", value);
}

Expression ExpressionUtil::newParameter(const std::string& name) {
  return Expression(Expression::Type::PARAMETER, name);
}

Expression ExpressionUtil::newFunction(const std::string& name,
                                       const Expression& arg) {
  return Expression(Expression::Type::FUNCTION, name, {arg});
}

Expression ExpressionUtil::newSum(const Expression& a, const Expression& b) {
  return Expression(Expression::Type::SUM, "", {a, b});
}

Expression ExpressionUtil::newDifference(const Expression& a,
                                         const Expression& b) {
  return newSum(a, newProduct(newConstant(Number::MINUS_ONE), b));
}

Expression ExpressionUtil::newProduct(const Expression& a,
                                      const Expression& b) {
  return Expression(Expression::Type::PRODUCT, "", {a, b});
}

Expression ExpressionUtil::newFraction(const Expression& a,
                                       const Expression& b) {
  return Expression(Expression::Type::FRACTION, "", {a, b});
}

Expression ExpressionUtil::newPower(const Expression& base,
                                    const Expression& exp) {
  return Expression(Expression::Type::POWER, "", {base, exp});
}

Expression ExpressionUtil::newDerivative(const Expression& e,
                                         const std::string& var,
                                         int64_t order) {
  Expression result(Expression::Type::DERIVATIVE, var, Number(order));
  result.newChild(e);
  return result;
}

bool ExpressionUtil::isConstant(const Expression& e, const Number& value) {
  return e.type == Expression::Type::CONSTANT && e.value == value;
}

bool ExpressionUtil::isFreeOf(const Expression& e, const std::string& var) {
  return !e.contains(Expression::Type::PARAMETER, var);
}

bool ExpressionUtil::isIndeterminate(const Expression& e) {
  if (isConstant(e, Number::INF)) {
    return true;
  }
  return std::any_of(e.children.begin(), e.children.end(),
                     [](const Expression& c) { return isIndeterminate(c); });
}

void ExpressionUtil::collectNames(const Expression& e, Expression::Type type,
                                  std::set<std::string>& target) {
  if (e.type == type) {
    target.insert(e.name);
  }
  for (const auto& c : e.children) {
    collectNames(c, type, target);
  }
}

// ---------------------------------------------------------------------------
// normalization
// ---------------------------------------------------------------------------

void normalizeNode(Expression& e);

bool lessExpr(const Expression& lhs, const Expression& rhs) {
  return lhs < rhs;
}

Number ExpressionUtil::degree(const Expression& e) {
  switch (e.type) {
    case Expression::Type::PARAMETER:
      return Number::ONE;
    case Expression::Type::SUM: {
      if (e.children.empty()) {
        return Number::ZERO;
      }
      Number result = degree(e.children[0]);
      for (const auto& c : e.children) {
        result = std::max(result, degree(c));
      }
      return result;
    }
    case Expression::Type::PRODUCT: {
      Number result = Number::ZERO;
      for (const auto& c : e.children) {
        result += degree(c);
      }
      return result;
    }
    case Expression::Type::FRACTION:
      return Semantics::sub(degree(e.children.at(0)),
                            degree(e.children.at(1)));
    case Expression::Type::POWER:
      if (e.children.at(1).type == Expression::Type::CONSTANT) {
        return Semantics::mul(degree(e.children[0]), e.children[1].value);
      }
      return Number::ZERO;
    default:
      return Number::ZERO;
  }
}

// terms of higher degree first, equal degrees in descending order
void sortTerms(Expression& sum) {
  std::vector<std::pair<Number, Expression>> terms;
  for (auto& c : sum.children) {
    terms.emplace_back(ExpressionUtil::degree(c), std::move(c));
  }
  std::sort(terms.begin(), terms.end(),
            [](const std::pair<Number, Expression>& lhs,
               const std::pair<Number, Expression>& rhs) {
              if (lhs.first != rhs.first) {
                return rhs.first < lhs.first;
              }
              return lhs.second > rhs.second;
            });
  sum.children.clear();
  for (auto& t : terms) {
    sum.children.push_back(std::move(t.second));
  }
}

bool collapseIndeterminate(Expression& e) {
  switch (e.type) {
    case Expression::Type::SUM:
    case Expression::Type::PRODUCT:
    case Expression::Type::FRACTION:
    case Expression::Type::POWER:
    case Expression::Type::FUNCTION:
      break;
    default:
      return false;
  }
  bool found = std::any_of(
      e.children.begin(), e.children.end(), [](const Expression& c) {
        return ExpressionUtil::isConstant(c, Number::INF);
      });
  if (found) {
    e = ExpressionUtil::newConstant(Number::INF);
  }
  return found;
}

void pullUpChildren(Expression& e) {
  std::vector<Expression> result;
  for (auto& c : e.children) {
    if (c.type == e.type) {
      for (auto& d : c.children) {
        result.push_back(std::move(d));
      }
    } else {
      result.push_back(std::move(c));
    }
  }
  e.children = std::move(result);
}

// splits a term into its constant factor and the remaining expression
std::pair<Number, Expression> extractFactor(const Expression& e) {
  std::pair<Number, Expression> result;
  result.first = Number::ONE;
  if (e.type != Expression::Type::PRODUCT) {
    result.second = e;
    return result;
  }
  result.second.type = Expression::Type::PRODUCT;
  for (auto& c : e.children) {
    if (c.type == Expression::Type::CONSTANT) {
      result.first *= c.value;
    } else {
      result.second.newChild(c);
    }
  }
  if (result.second.children.size() == 1) {
    result.second = Expression(result.second.children[0]);  // copy first
  }
  return result;
}

void normalizeProduct(Expression& e);

void normalizeSum(Expression& e) {
  pullUpChildren(e);
  Number constant = Number::ZERO;
  std::map<Expression, Number> terms;
  for (const auto& c : e.children) {
    if (c.type == Expression::Type::CONSTANT) {
      constant += c.value;
      continue;
    }
    auto f = extractFactor(c);
    auto it = terms.find(f.second);
    if (it == terms.end()) {
      terms[f.second] = f.first;
    } else {
      it->second += f.first;
    }
  }
  if (constant == Number::INF) {
    e = ExpressionUtil::newConstant(Number::INF);
    return;
  }
  Expression result(Expression::Type::SUM);
  for (const auto& t : terms) {
    if (t.second == Number::ZERO) {
      continue;
    }
    if (t.second == Number::ONE) {
      result.newChild(t.first);
      continue;
    }
    auto term = ExpressionUtil::newProduct(
        ExpressionUtil::newConstant(t.second), t.first);
    normalizeProduct(term);
    result.newChild(term);
  }
  if (constant != Number::ZERO) {
    result.newChild(ExpressionUtil::newConstant(constant));
  }
  sortTerms(result);
  if (result.children.empty()) {
    e = ExpressionUtil::newConstant(Number::ZERO);
  } else if (result.children.size() == 1) {
    e = Expression(result.children[0]);  // copy first
  } else {
    e = result;
  }
}

bool multiplyThrough(Expression& e) {
  if (e.type != Expression::Type::PRODUCT || e.children.size() != 2) {
    return false;
  }
  if (e.children[0].type != Expression::Type::CONSTANT ||
      e.children[1].type != Expression::Type::SUM) {
    return false;
  }
  auto constant = e.children[0];  // copy
  auto sum = e.children[1];       // copy
  e = Expression(Expression::Type::SUM);
  for (const auto& c : sum.children) {
    auto prod = ExpressionUtil::newProduct(constant, c);
    normalizeProduct(prod);
    e.newChild(prod);
  }
  normalizeSum(e);
  return true;
}

void normalizeProduct(Expression& e) {
  pullUpChildren(e);
  Number constant = Number::ONE;
  std::map<Expression, Number> powers;
  std::map<Expression, size_t> counts;
  std::vector<Expression> others;
  Expression infinity;
  bool has_infinity = false;
  for (const auto& c : e.children) {
    if (c.type == Expression::Type::CONSTANT) {
      constant *= c.value;
    } else if (c.type == Expression::Type::INFINITE && !has_infinity) {
      infinity = c;
      has_infinity = true;
    } else if (c.type == Expression::Type::POWER &&
               c.children[1].type == Expression::Type::CONSTANT) {
      powers[c.children[0]] += c.children[1].value;
      counts[c.children[0]]++;
    } else if (c.type == Expression::Type::POWER) {
      others.push_back(c);
    } else {
      powers[c] += Number::ONE;
      counts[c]++;
    }
  }
  if (constant == Number::INF) {
    e = ExpressionUtil::newConstant(Number::INF);
    return;
  }
  if (constant == Number::ZERO) {
    e = ExpressionUtil::newConstant(Number::ZERO);
    return;
  }
  if (has_infinity && powers.empty() && others.empty()) {
    // c*oo => oo or -oo
    if (constant < Number::ZERO) {
      infinity.value.negate();
    }
    e = infinity;
    return;
  }
  if (has_infinity) {
    others.push_back(infinity);
  }
  bool rerun = false;
  for (const auto& p : powers) {
    if (p.second == Number::ZERO) {
      continue;
    }
    if (counts[p.first] == 1) {
      others.push_back(p.second == Number::ONE
                           ? p.first
                           : ExpressionUtil::newPower(
                                 p.first, ExpressionUtil::newConstant(p.second)));
      continue;
    }
    auto merged = ExpressionUtil::newPower(
        p.first, ExpressionUtil::newConstant(p.second));
    normalizeNode(merged);
    if (merged.type == Expression::Type::CONSTANT ||
        merged.type == Expression::Type::PRODUCT) {
      rerun = true;
    }
    others.push_back(merged);
  }
  Expression result(Expression::Type::PRODUCT);
  if (constant != Number::ONE) {
    result.newChild(ExpressionUtil::newConstant(constant));
  }
  for (auto& o : others) {
    result.newChild(o);
  }
  if (rerun) {
    normalizeProduct(result);
    e = result;
    return;
  }
  std::sort(result.children.begin(), result.children.end(), lessExpr);
  if (result.children.empty()) {
    e = ExpressionUtil::newConstant(Number::ONE);
  } else if (result.children.size() == 1) {
    e = Expression(result.children[0]);  // copy first
  } else {
    e = result;
    multiplyThrough(e);
  }
}

void normalizePower(Expression& e) {
  const auto& base = e.children[0];
  const auto& exp = e.children[1];
  if (exp.type == Expression::Type::CONSTANT) {
    const auto& k = exp.value;
    if (k == Number::ZERO) {
      e = ExpressionUtil::newConstant(Number::ONE);
      return;
    }
    if (k == Number::ONE) {
      e = Expression(base);  // copy first
      return;
    }
    if (base.type == Expression::Type::CONSTANT) {
      if (k.isInteger()) {
        e = ExpressionUtil::newConstant(Semantics::pow(base.value, k));
      } else if (base.value == Number::ZERO) {
        e = ExpressionUtil::newConstant(k < Number::ZERO ? Number::INF
                                                         : Number::ZERO);
      } else if (base.value == Number::ONE) {
        e = ExpressionUtil::newConstant(Number::ONE);
      }
      return;
    }
    if (!k.isInteger()) {
      return;
    }
    if (base.type == Expression::Type::POWER) {
      // (x^a)^k = x^(a*k) for integer k
      auto inner = base.children[1];
      auto product = ExpressionUtil::newProduct(inner, exp);
      normalizeNode(product);
      auto result = ExpressionUtil::newPower(base.children[0], product);
      normalizeNode(result);
      e = result;
      return;
    }
    if (base.type == Expression::Type::PRODUCT) {
      // (x*y)^k = x^k*y^k for integer k
      Expression result(Expression::Type::PRODUCT);
      for (const auto& c : base.children) {
        auto p = ExpressionUtil::newPower(c, exp);
        normalizeNode(p);
        result.newChild(p);
      }
      normalizeProduct(result);
      e = result;
      return;
    }
  } else if (ExpressionUtil::isConstant(base, Number::ONE)) {
    e = ExpressionUtil::newConstant(Number::ONE);
  }
}

void normalizeFraction(Expression& e) {
  const auto& num = e.children[0];
  const auto& den = e.children[1];
  Expression result(Expression::Type::PRODUCT);
  if (den.type == Expression::Type::CONSTANT) {
    if (den.value == Number::ZERO) {
      e = ExpressionUtil::newConstant(Number::INF);
      return;
    }
    result.newChild(ExpressionUtil::newConstant(
        Semantics::div(Number::ONE, den.value)));
    result.newChild(num);
  } else {
    auto reciprocal = ExpressionUtil::newPower(
        den, ExpressionUtil::newConstant(Number::MINUS_ONE));
    normalizePower(reciprocal);
    result.newChild(num);
    result.newChild(reciprocal);
  }
  normalizeProduct(result);
  e = result;
}

// exact values of elementary functions at special points
void evalFunction(Expression& e) {
  if (e.children.size() != 1 ||
      e.children[0].type != Expression::Type::CONSTANT) {
    return;
  }
  const auto arg = e.children[0].value;
  const auto f = e.name;
  if (arg == Number::ZERO) {
    if (f == "sin" || f == "tan" || f == "atan" || f == "asin" ||
        f == "sinh" || f == "tanh" || f == "sqrt") {
      e = ExpressionUtil::newConstant(Number::ZERO);
    } else if (f == "cos" || f == "cosh" || f == "exp") {
      e = ExpressionUtil::newConstant(Number::ONE);
    } else if (f == "log") {
      e = ExpressionUtil::newConstant(Number::INF);
    }
  } else if (arg == Number::ONE) {
    if (f == "log" || f == "acos") {
      e = ExpressionUtil::newConstant(Number::ZERO);
    } else if (f == "sqrt") {
      e = ExpressionUtil::newConstant(Number::ONE);
    }
  }
  if (e.type == Expression::Type::FUNCTION && f == "abs") {
    e = ExpressionUtil::newConstant(Semantics::abs(arg));
  }
}

void normalizeNode(Expression& e) {
  for (auto& c : e.children) {
    normalizeNode(c);
  }
  if (collapseIndeterminate(e)) {
    return;
  }
  switch (e.type) {
    case Expression::Type::SUM:
      normalizeSum(e);
      break;
    case Expression::Type::PRODUCT:
      normalizeProduct(e);
      break;
    case Expression::Type::FRACTION:
      normalizeFraction(e);
      break;
    case Expression::Type::POWER:
      normalizePower(e);
      break;
    case Expression::Type::FUNCTION:
      evalFunction(e);
      break;
    case Expression::Type::DERIVATIVE:
      if (e.value == Number::ZERO) {
        e = Expression(e.children[0]);  // copy first
      } else if (ExpressionUtil::isFreeOf(e.children[0], e.name)) {
        e = ExpressionUtil::newConstant(Number::ZERO);
      }
      break;
    default:
      break;
  }
}

bool ExpressionUtil::normalize(Expression& e) {
  const auto original = e;
  normalizeNode(e);
  return e != original;
}
