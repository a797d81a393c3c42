#pragma once

#include <string>

#include "form/expression.hpp"

/**
 * Parser for Expression objects. Parses expressions from their string
 * representation as produced by Expression::toString(). Throws a
 * std::runtime_error with the position of the problem on malformed input.
 *
 * Example input: "sin(x)/abs(sin(x)) + diff(f(x),x,2) - x^-1"
 */
class ExpressionParser {
 public:
  Expression parse(const std::string& str);

 private:
  std::string input;
  size_t pos;

  void skipWhitespace();
  char peek();
  char next();
  bool match(char c);
  void expect(char c);
  void fail(const std::string& msg) const;

  Expression parseAddSub();
  Expression parseTerm();
  Expression parseUnary();
  Expression parsePower();
  Expression parsePrimary();
  Expression parseCall(const std::string& name);
  Expression parseVector();
  std::string parseName();
  Number parseNumber();
};
