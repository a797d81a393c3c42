#pragma once

#include "series/expansion_spec.hpp"
#include "sys/util.hpp"

/**
 * Computes truncated Taylor series. Known closed forms are used where
 * available, with their coefficients expanded in the remaining variables;
 * otherwise the expression is expanded by differentiation and
 * the result is expanded again until it no longer changes. Every round is
 * checked for expansions that still contain the expanded expression.
 *
 * Throws ExpansionPointError for points at infinity and
 * DivergentExpansionError for self-referencing expansions.
 */
class ExpansionDriver {
 public:
  explicit ExpansionDriver(const Settings& settings);

  Expression expand(const Expression& e, const ExpansionSpecList& specs) const;

 private:
  bool isFree(const Expression& e, const ExpansionSpecList& specs) const;

  bool expandKnown(const Expression& e, const ExpansionSpecList& specs,
                   Expression& result) const;

  const Settings& settings;
};
