#include "form/expression_parser.hpp"

#include <cctype>
#include <stdexcept>

#include "form/expression_util.hpp"

Expression negated(Expression e) {
  if (e.type == Expression::Type::CONSTANT ||
      e.type == Expression::Type::INFINITE) {
    e.value.negate();
    return e;
  }
  auto negOne = ExpressionUtil::newConstant(Number::MINUS_ONE);
  if (e.type == Expression::Type::PRODUCT) {
    // flatten: prepend -1 to existing product
    e.children.insert(e.children.begin(), negOne);
    return e;
  }
  return ExpressionUtil::newProduct(negOne, e);
}

Expression ExpressionParser::parse(const std::string& str) {
  input = str;
  pos = 0;
  auto result = parseAddSub();
  skipWhitespace();
  if (pos < input.length()) {
    fail("unexpected character '" + std::string(1, input[pos]) + "'");
  }
  return result;
}

void ExpressionParser::skipWhitespace() {
  while (pos < input.length() && std::isspace(input[pos])) {
    pos++;
  }
}

char ExpressionParser::peek() {
  if (pos >= input.length()) {
    return '\0';
  }
  return input[pos];
}

char ExpressionParser::next() {
  if (pos >= input.length()) {
    return '\0';
  }
  return input[pos++];
}

bool ExpressionParser::match(char c) {
  skipWhitespace();
  if (peek() == c) {
    pos++;
    return true;
  }
  return false;
}

void ExpressionParser::expect(char c) {
  if (!match(c)) {
    fail("expected '" + std::string(1, c) + "'");
  }
}

void ExpressionParser::fail(const std::string& msg) const {
  throw std::runtime_error("error parsing '" + input + "' at position " +
                           std::to_string(pos) + ": " + msg);
}

Expression ExpressionParser::parseAddSub() {
  Expression left = parseTerm();
  while (true) {
    skipWhitespace();
    char op = peek();
    if (op != '+' && op != '-') {
      break;
    }
    next();
    Expression right = parseTerm();
    if (op == '-') {
      right = negated(right);
    }
    if (left.type == Expression::Type::SUM) {
      left.newChild(right);
    } else {
      left = ExpressionUtil::newSum(left, right);
    }
  }
  return left;
}

Expression ExpressionParser::parseTerm() {
  Expression left = parseUnary();
  while (true) {
    skipWhitespace();
    char op = peek();
    if (op != '*' && op != '/') {
      break;
    }
    next();
    Expression right = parseUnary();
    if (op == '*') {
      if (left.type == Expression::Type::PRODUCT) {
        left.newChild(right);
      } else {
        left = ExpressionUtil::newProduct(left, right);
      }
    } else {
      left = ExpressionUtil::newFraction(left, right);
    }
  }
  return left;
}

Expression ExpressionParser::parseUnary() {
  skipWhitespace();
  if (peek() == '-') {
    next();
    return negated(parseUnary());
  }
  if (peek() == '+') {
    next();
    return parseUnary();
  }
  return parsePower();
}

Expression ExpressionParser::parsePower() {
  Expression left = parsePrimary();
  if (match('^')) {
    // right-associative, the exponent may carry a sign: x^-2
    Expression right = parseUnary();
    return ExpressionUtil::newPower(left, right);
  }
  return left;
}

Expression ExpressionParser::parsePrimary() {
  skipWhitespace();
  if (peek() == '(') {
    next();
    Expression expr = parseAddSub();
    expect(')');
    return expr;
  }
  if (peek() == '[') {
    return parseVector();
  }
  if (std::isdigit(peek())) {
    return ExpressionUtil::newConstant(parseNumber());
  }
  if (std::isalpha(peek()) || peek() == '_') {
    auto name = parseName();
    skipWhitespace();
    if (peek() == '(') {
      return parseCall(name);
    }
    if (name == "oo" || name == "infinity") {
      return Expression(Expression::Type::INFINITE, "", Number::ONE);
    }
    return ExpressionUtil::newParameter(name);
  }
  if (pos >= input.length()) {
    fail("unexpected end of input");
  }
  fail("unexpected character '" + std::string(1, peek()) + "'");
  return Expression();
}

Expression ExpressionParser::parseCall(const std::string& name) {
  expect('(');
  Expression func(Expression::Type::FUNCTION, name);
  skipWhitespace();
  if (peek() != ')') {
    while (true) {
      func.newChild(parseAddSub());
      if (!match(',')) {
        break;
      }
    }
  }
  expect(')');
  if (name != "diff") {
    return func;
  }
  // diff(e,x) or diff(e,x,k) denotes an unresolved derivative
  const auto& args = func.children;
  if (args.size() < 2 || args.size() > 3 ||
      args[1].type != Expression::Type::PARAMETER ||
      (args.size() == 3 && (args[2].type != Expression::Type::CONSTANT ||
                            !args[2].value.isInteger() ||
                            args[2].value < Number::ONE))) {
    fail("invalid derivative: " + func.toString());
  }
  int64_t order = args.size() == 3 ? args[2].value.asInt() : 1;
  return ExpressionUtil::newDerivative(args[0], args[1].name, order);
}

Expression ExpressionParser::parseVector() {
  expect('[');
  Expression vec(Expression::Type::VECTOR);
  skipWhitespace();
  if (peek() != ']') {
    while (true) {
      vec.newChild(parseAddSub());
      if (!match(',')) {
        break;
      }
    }
  }
  expect(']');
  return vec;
}

std::string ExpressionParser::parseName() {
  std::string name;
  while (pos < input.length() &&
         (std::isalnum(input[pos]) || input[pos] == '_')) {
    name += input[pos];
    pos++;
  }
  if (name.empty()) {
    fail("expected identifier");
  }
  return name;
}

Number ExpressionParser::parseNumber() {
  std::string numStr;
  while (pos < input.length() && std::isdigit(input[pos])) {
    numStr += input[pos];
    pos++;
  }
  if (numStr.empty()) {
    fail("expected number");
  }
  return Number(numStr);
}
