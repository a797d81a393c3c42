#include "series/singularity_checker.hpp"

#include "series/series_error.hpp"

void SingularityChecker::checkPoints(const ExpansionSpecList& specs) {
  for (const auto& spec : specs) {
    if (spec.point.contains(Expression::Type::INFINITE)) {
      throw ExpansionPointError("cannot expand about " + spec.point.toString() +
                                " for " + spec.varName());
    }
  }
}
