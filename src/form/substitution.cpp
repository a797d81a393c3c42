#include "form/substitution.hpp"

#include "form/expression_util.hpp"

Expression Substitution::substitute(const Expression& e,
                                    const std::string& var,
                                    const Expression& value) {
  auto result = e;
  replace(result, var, value);
  ExpressionUtil::normalize(result);
  return result;
}

bool Substitution::isIndeterminate(const Expression& e) {
  return ExpressionUtil::isIndeterminate(e);
}

void Substitution::replace(Expression& e, const std::string& var,
                           const Expression& value) {
  if (e.type == Expression::Type::PARAMETER && e.name == var) {
    e = value;
    return;
  }
  if (e.type == Expression::Type::DERIVATIVE && e.name == var) {
    return;
  }
  for (auto& c : e.children) {
    replace(c, var, value);
  }
}
