#pragma once

#include "series/expansion_spec.hpp"

class SingularityChecker {
 public:
  /**
   * Rejects expansions about a point at infinity (positive or negative).
   * Throws an ExpansionPointError for the first such point.
   */
  static void checkPoints(const ExpansionSpecList& specs);
};
