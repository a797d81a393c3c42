#pragma once

#include <vector>

#include "form/expression.hpp"

/**
 * Expansion of a single variable about a point up to a given order.
 * Text form: "x=0:3" (variable, point, order).
 */
class ExpansionSpec {
 public:
  // upper bound for the order of an expansion
  static constexpr int64_t MAX_ORDER = 20;

  ExpansionSpec(const Expression& variable, const Expression& point,
                int64_t order);

  static ExpansionSpec parse(const std::string& str, int64_t default_order);

  const std::string& varName() const { return variable.name; }

  Expression variable;
  Expression point;
  int64_t order;
};

using ExpansionSpecList = std::vector<ExpansionSpec>;

std::ostream& operator<<(std::ostream& out, const ExpansionSpec& spec);
