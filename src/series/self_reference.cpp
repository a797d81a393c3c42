#include "series/self_reference.hpp"

std::vector<Expression> SelfReference::unresolved(
    const std::vector<Expression>& matches) {
  std::vector<Expression> result;
  for (const auto& m : matches) {
    if (m.type != Expression::Type::DERIVATIVE) {
      result.push_back(m);
    }
  }
  return result;
}
