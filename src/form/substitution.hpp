#pragma once

#include "form/expression.hpp"

/**
 * Replaces a variable by a value and simplifies the result. Derivative
 * markers taken with respect to the replaced variable are not entered,
 * because their variable is bound.
 */
class Substitution {
 public:
  static Expression substitute(const Expression& e, const std::string& var,
                               const Expression& value);

  static bool isIndeterminate(const Expression& e);

 private:
  static void replace(Expression& e, const std::string& var,
                      const Expression& value);
};
