#pragma once

#include <set>

#include "form/expression.hpp"

/**
 * Expression utility functions.
 */
class ExpressionUtil {
 public:
  static Expression newConstant(const Number& value);

  static Expression newParameter(const std::string& name);

  static Expression newFunction(const std::string& name,
                                const Expression& arg);

  static Expression newSum(const Expression& a, const Expression& b);

  static Expression newDifference(const Expression& a, const Expression& b);

  static Expression newProduct(const Expression& a, const Expression& b);

  static Expression newFraction(const Expression& a, const Expression& b);

  static Expression newPower(const Expression& base, const Expression& exp);

  static Expression newDerivative(const Expression& e, const std::string& var,
                                  int64_t order);

  /**
   * Brings an expression into its canonical form: nested sums and products
   * are flattened, constants are folded, like terms and equal bases are
   * merged, quotients become products with negative powers and operands
   * are sorted. Indeterminate constants absorb their enclosing node.
   *
   * @return true if the expression was changed
   */
  static bool normalize(Expression& e);

  static bool isConstant(const Expression& e, const Number& value);

  static bool isFreeOf(const Expression& e, const std::string& var);

  static bool isIndeterminate(const Expression& e);

  /**
   * Total degree of a term in its symbols, e.g. 3 for 2*x^2*y and 0 for
   * constants and function calls. Used to order the terms of sums.
   */
  static Number degree(const Expression& e);

  static void collectNames(const Expression& e, Expression::Type type,
                           std::set<std::string>& target);
};
