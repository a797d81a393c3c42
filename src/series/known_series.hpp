#pragma once

#include <vector>

#include "series/expansion_spec.hpp"

/**
 * Closed-form Taylor series of elementary functions, e.g.
 * sin(x) = x - 1/6*x^3 + 1/120*x^5 - ... about x = 0.
 */
class KnownSeries {
 public:
  /**
   * Closed-form coefficients c_0, ..., c_n of the series of f(v) about the
   * point of the spec, where the argument of f is the spec variable v.
   * Returns false if no rule applies.
   */
  static bool apply(const Expression& e, const ExpansionSpec& spec,
                    std::vector<Expression>& coefficients);

  // coefficient of (v-p)^k in the series of the named function about p
  static bool coefficient(const std::string& func, const Expression& point,
                          int64_t k, Expression& result);
};
