#pragma once

#include "series/expansion_spec.hpp"

/**
 * Generic Taylor expansion by repeated differentiation:
 *
 *   sum_{k=0}^{n} f^(k)(p)/k! * (x-p)^k
 *
 * Further specs expand the coefficients in their variables. The result is
 * not simplified, so the caller can inspect its structure.
 */
class DifferentialExpander {
 public:
  static Expression expand(const Expression& e, const ExpansionSpecList& specs);

 private:
  static Expression expandFrom(const Expression& e,
                               const ExpansionSpecList& specs, size_t index);
};
