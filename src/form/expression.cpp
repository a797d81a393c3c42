#include "form/expression.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

Expression::Expression()
    : type(Expression::Type::CONSTANT), value(Number::ZERO) {};

Expression::Expression(Type type, const std::string& name, const Number& value)
    : type(type), name(name), value(value) {};

Expression::Expression(Type type, const std::string& name,
                       std::initializer_list<Expression> children)
    : type(type), name(name) {
  for (auto& c : children) {
    newChild(c);
  }
}

Expression::Expression(const Expression& e) { *this = e; }

Expression::Expression(Expression&& e) { *this = std::move(e); }

Expression& Expression::operator=(const Expression& e) {
  if (this != &e) {
    type = e.type;
    name = e.name;
    value = e.value;
    children = e.children;
  }
  return *this;
}

Expression& Expression::operator=(Expression&& e) {
  if (this != &e) {
    type = e.type;
    name = std::move(e.name);
    value = std::move(e.value);
    children = std::move(e.children);
  }
  return *this;
}

int Expression::compare(const Expression& e) const {
  if (type < e.type) {
    return -1;
  } else if (e.type < type) {
    return 1;
  }
  // same type => compare content
  switch (type) {
    case Expression::Type::CONSTANT:
    case Expression::Type::INFINITE:
      if (value < e.value) {
        return -1;
      } else if (e.value < value) {
        return 1;
      } else {
        return 0;
      }
    case Expression::Type::PARAMETER:
      if (name < e.name) {
        return -1;
      } else if (e.name < name) {
        return 1;
      } else {
        return 0;
      }
    case Expression::Type::FUNCTION:
      if (name < e.name) {
        return -1;
      } else if (e.name < name) {
        return 1;
      } else {
        return compareChildren(e);
      }
    case Expression::Type::DERIVATIVE:
      if (name < e.name) {
        return -1;
      } else if (e.name < name) {
        return 1;
      } else if (value < e.value) {
        return -1;
      } else if (e.value < value) {
        return 1;
      } else {
        return compareChildren(e);
      }
    case Expression::Type::VECTOR:
    case Expression::Type::SUM:
    case Expression::Type::PRODUCT:
    case Expression::Type::FRACTION:
    case Expression::Type::POWER:
      return compareChildren(e);
  }
  return 0;  // equal
}

bool Expression::contains(const Expression& e) const {
  if (*this == e) {
    return true;
  }
  return std::any_of(children.begin(), children.end(),
                     [&](const Expression& c) { return c.contains(e); });
}

bool Expression::contains(Type t) const {
  if (type == t) {
    return true;
  }
  return std::any_of(children.begin(), children.end(),
                     [&](const Expression& c) { return c.contains(t); });
}

bool Expression::contains(Type t, const std::string& name) const {
  if (type == t && this->name == name) {
    return true;
  }
  return std::any_of(children.begin(), children.end(),
                     [&](const Expression& c) { return c.contains(t, name); });
}

size_t Expression::numTerms() const {
  size_t result = 1;
  for (const auto& c : children) {
    result += c.numTerms();
  }
  return result;
}

void Expression::assertNumChildren(size_t num) const {
  if (children.size() != num) {
    throw std::runtime_error("unexpected number of children: " +
                             std::to_string(children.size()));
  }
}

int Expression::compareChildren(const Expression& e) const {
  if (children.size() < e.children.size()) {
    return -1;
  } else if (children.size() > e.children.size()) {
    return 1;
  }
  // same number of children => compare them one by one
  for (size_t i = 0; i < children.size(); i++) {
    auto r = children[i].compare(e.children[i]);
    if (r != 0) {
      return r;
    }
  }
  return 0;  // equal
}

Expression& Expression::newChild(const Expression& e) {
  children.push_back(e);
  return children.back();
}

Expression& Expression::newChild(Expression::Type type, const std::string& name,
                                 const Number& value) {
  children.emplace_back(Expression(type, name, value));
  return children.back();
}

std::ostream& operator<<(std::ostream& out, const Expression& e) {
  e.print(out, true, Expression::Type::CONSTANT);
  return out;
}

std::string Expression::toString() const {
  std::stringstream ss;
  print(ss, true, Expression::Type::CONSTANT);
  return ss.str();
}

bool isReciprocal(const Expression& e) {
  return e.type == Expression::Type::POWER && e.children.size() == 2 &&
         e.children[1].type == Expression::Type::CONSTANT &&
         e.children[1].value < Number::ZERO;
}

std::pair<Expression, bool> extractSign(const Expression& e) {
  std::pair<Expression, bool> result;
  switch (e.type) {
    case Expression::Type::CONSTANT:
    case Expression::Type::INFINITE:
      result.first = e;
      if (e.value < Number::ZERO) {
        result.first.value.negate();
        result.second = true;
      } else {
        result.second = false;
      }
      break;
    case Expression::Type::PRODUCT:
      result.first.type = Expression::Type::PRODUCT;
      result.second = false;
      for (auto& c : e.children) {
        if (c.type == Expression::Type::CONSTANT && c.value < Number::ZERO) {
          auto constant = c;  // copy
          constant.value.negate();
          if (constant.value != Number::ONE) {
            result.first.newChild(constant);
          }
          result.second = !result.second;
        } else {
          result.first.newChild(c);
        }
      }
      if (result.first.children.empty() ||
          std::all_of(result.first.children.begin(),
                      result.first.children.end(), isReciprocal)) {
        result.first.children.insert(
            result.first.children.begin(),
            Expression(Expression::Type::CONSTANT, "", Number::ONE));
      }
      break;
    default:
      result.first = e;
      result.second = false;
      break;
  }
  return result;
}

void Expression::print(std::ostream& out, bool isRoot,
                       Expression::Type parentType) const {
  const bool brackets = needsBrackets(isRoot, parentType);
  if (brackets) {
    out << "(";
  }
  auto extracted = extractSign(*this);
  if (extracted.second) {
    out << "-";
  }
  extracted.first.printExtracted(out);
  if (brackets) {
    out << ")";
  }
}

void Expression::printExtracted(std::ostream& out) const {
  switch (type) {
    case Expression::Type::CONSTANT:
      out << value;
      break;
    case Expression::Type::PARAMETER:
      out << name;
      break;
    case Expression::Type::INFINITE:
      out << "oo";
      break;
    case Expression::Type::FUNCTION:
      printChildrenWrapped(out, ",", name + "(", ")");
      break;
    case Expression::Type::VECTOR:
      printChildrenWrapped(out, ",", "[", "]");
      break;
    case Expression::Type::SUM:
      printChildren(out, "+");
      break;
    case Expression::Type::PRODUCT:
      printProduct(out);
      break;
    case Expression::Type::FRACTION:
      assertNumChildren(2);
      printChildren(out, "/");
      break;
    case Expression::Type::POWER:
      assertNumChildren(2);
      if (isReciprocal(*this) && children[1].value.isInteger()) {
        Expression(Expression::Type::PRODUCT, "", {*this}).printProduct(out);
      } else {
        printChildren(out, "^");
      }
      break;
    case Expression::Type::DERIVATIVE:
      assertNumChildren(1);
      out << "diff(";
      children[0].print(out, false, type);
      out << "," << name << "," << value << ")";
      break;
  }
}

// negative integer powers are printed as quotients: x*y^-2 => x/y^2
void Expression::printProduct(std::ostream& out) const {
  std::vector<Expression> numerator, denominator;
  for (const auto& c : children) {
    if (isReciprocal(c) && c.children[1].value.isInteger()) {
      auto d = c.children[1].value;
      d.negate();
      if (d == Number::ONE) {
        denominator.push_back(c.children[0]);
      } else {
        denominator.push_back(Expression(
            Expression::Type::POWER, "",
            {c.children[0],
             Expression(Expression::Type::CONSTANT, "", d)}));
      }
    } else {
      numerator.push_back(c);
    }
  }
  if (numerator.empty()) {
    out << "1";
  }
  for (size_t i = 0; i < numerator.size(); i++) {
    if (i > 0) {
      out << "*";
    }
    numerator[i].print(out, false, Expression::Type::PRODUCT);
  }
  for (const auto& d : denominator) {
    out << "/";
    d.print(out, false, Expression::Type::FRACTION);
  }
}

bool Expression::needsBrackets(bool isRoot, Expression::Type parentType) const {
  if (isRoot) {
    return false;
  }
  if (parentType == Expression::Type::FUNCTION ||
      parentType == Expression::Type::VECTOR ||
      parentType == Expression::Type::DERIVATIVE) {
    return false;
  }
  switch (type) {
    case Expression::Type::CONSTANT:
      if (value < Number::ZERO) {
        return parentType != Expression::Type::SUM;
      }
      if (!value.isInteger()) {
        return parentType == Expression::Type::FRACTION ||
               parentType == Expression::Type::POWER;
      }
      return false;
    case Expression::Type::INFINITE:
      return value < Number::ZERO && parentType != Expression::Type::SUM;
    case Expression::Type::PARAMETER:
    case Expression::Type::FUNCTION:
    case Expression::Type::VECTOR:
    case Expression::Type::DERIVATIVE:
      return false;
    case Expression::Type::SUM:
      return true;
    case Expression::Type::PRODUCT:
    case Expression::Type::FRACTION:
      return parentType != Expression::Type::SUM;
    case Expression::Type::POWER:
      return parentType == Expression::Type::POWER ||
             (parentType == Expression::Type::FRACTION && isReciprocal(*this));
  }
  return true;
}

void Expression::printChildren(std::ostream& out, const std::string& op) const {
  for (size_t i = 0; i < children.size(); i++) {
    auto extracted = extractSign(children[i]);
    if (i > 0 && (op != "+" || !extracted.second)) {
      out << op;
    }
    children[i].print(out, false, type);
  }
}

void Expression::printChildrenWrapped(std::ostream& out, const std::string& op,
                                      const std::string& prefix,
                                      const std::string& suffix) const {
  out << prefix;
  printChildren(out, op);
  out << suffix;
}
