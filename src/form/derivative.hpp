#pragma once

#include "form/expression.hpp"

/**
 * Symbolic differentiation. Calls of functions without a known chain rule
 * are kept as unresolved derivative markers, i.e. diff(f(x),x,1).
 */
class Derivative {
 public:
  /**
   * Derives an expression order times with respect to a variable. The
   * result is normalized after every step. Order 0 returns the expression
   * unchanged.
   */
  static Expression derive(const Expression& e, const std::string& var,
                           int64_t order = 1);

 private:
  static Expression deriveOnce(const Expression& e, const std::string& var);

  static Expression deriveFunction(const Expression& e,
                                   const std::string& var);

  static Expression deriveMarker(const Expression& e, const std::string& var);
};
