#pragma once

#include <stdexcept>
#include <string>

/**
 * Base class of the errors raised while computing a series expansion.
 */
class ExpansionError : public std::runtime_error {
 public:
  explicit ExpansionError(const std::string& msg) : std::runtime_error(msg) {}
};

// expansion about a point at infinity
class ExpansionPointError : public ExpansionError {
 public:
  explicit ExpansionPointError(const std::string& msg) : ExpansionError(msg) {}
};

// fallback expansion still contains the expression being expanded
class DivergentExpansionError : public ExpansionError {
 public:
  explicit DivergentExpansionError(const std::string& msg)
      : ExpansionError(msg) {}
};
