#include "math/number.hpp"

#include <cctype>
#include <limits>
#include <sstream>
#include <stdexcept>

const Number Number::ZERO(0);
const Number Number::ONE(1);
const Number Number::TWO(2);
const Number Number::MINUS_ONE(-1);
const Number Number::INF = Number::infinity();

constexpr std::size_t MAX_SIZE = std::numeric_limits<std::size_t>::max();

Number::Number() : num(0), den(1), inf(false) {}

Number::Number(int64_t value) : num(value), den(1), inf(false) {}

Number::Number(int64_t numerator, int64_t denominator)
    : num(numerator), den(denominator), inf(false) {
  reduce();
}

Number::Number(const Integer& numerator, const Integer& denominator)
    : num(numerator), den(denominator), inf(false) {
  reduce();
}

void throwParseError(const std::string& s) {
  throw std::runtime_error("error reading number: '" + s + "'");
}

Number::Number(const std::string& s) : num(0), den(1), inf(false) {
  std::string str;
  for (char ch : s) {
    if (!std::isspace(static_cast<unsigned char>(ch))) {
      str += ch;
    }
  }
  if (str == "undefined") {
    makeInf();
    return;
  }
  auto slash = str.find('/');
  try {
    if (slash == std::string::npos) {
      num = Integer(str);
    } else {
      num = Integer(str.substr(0, slash));
      den = Integer(str.substr(slash + 1));
    }
  } catch (const std::runtime_error&) {
    throwParseError(s);
  }
  reduce();
}

bool Number::operator==(const Number& n) const {
  if (inf || n.inf) {
    return inf == n.inf;
  }
  return num == n.num && den == n.den;
}

bool Number::operator!=(const Number& n) const { return !(*this == n); }

bool Number::operator<(const Number& n) const {
  if (n.inf) {
    return !inf;
  }
  if (inf) {
    return false;
  }
  // denominators are positive: a/b < c/d <=> a*d < c*b
  auto l = num;
  l *= n.den;
  auto r = n.num;
  r *= den;
  return l < r;
}

bool Number::operator>(const Number& n) const { return (n < *this); }

bool Number::operator<=(const Number& n) const {
  return (*this < n || *this == n);
}

bool Number::operator>=(const Number& n) const {
  return (n < *this || *this == n);
}

Number& Number::negate() {
  if (!inf) {
    num.negate();
  }
  return *this;
}

Number& Number::operator+=(const Number& n) {
  if (checkInfArgs(n)) {
    return *this;
  }
  // a/b + c/d = (a*(d/g) + c*(b/g)) / (b*(d/g)) with g = gcd(b,d)
  const auto g = Integer::gcd(den, n.den);
  auto f = n.den;
  f /= g;
  auto r = den;
  r /= g;
  r *= n.num;
  num *= f;
  num += r;
  den *= f;
  reduce();
  return *this;
}

Number& Number::operator-=(const Number& n) {
  auto m = n;
  m.negate();
  *this += m;
  return *this;
}

Number& Number::operator*=(const Number& n) {
  if (checkInfArgs(n)) {
    return *this;
  }
  // cross-reduce first to keep the intermediate values small
  const auto g1 = Integer::gcd(num, n.den);
  const auto g2 = Integer::gcd(n.num, den);
  auto a = n.num;
  a /= g2;
  auto b = n.den;
  b /= g1;
  num /= g1;
  num *= a;
  den /= g2;
  den *= b;
  reduce();
  return *this;
}

Number& Number::operator/=(const Number& n) {
  if (checkInfArgs(n)) {
    return *this;
  }
  if (n.num == Integer::ZERO) {
    makeInf();
    return *this;
  }
  Number reciprocal;
  reciprocal.num = n.den;
  reciprocal.den = n.num;
  reciprocal.reduce();
  *this *= reciprocal;
  return *this;
}

bool Number::isInteger() const { return !inf && den == Integer::ONE; }

int64_t Number::asInt() const {
  if (inf) {
    throw std::runtime_error("Infinity error");
  }
  if (den != Integer::ONE) {
    throw std::runtime_error("Not an integer: " + to_string());
  }
  return num.asInt();
}

bool Number::odd() const {
  if (!isInteger()) {
    return false;  // by convention
  }
  return num.odd();
}

std::size_t Number::hash() const {
  if (inf) {
    return MAX_SIZE;
  }
  return num.hash() * 31 + den.hash();
}

std::ostream& operator<<(std::ostream& out, const Number& n) {
  if (n.inf) {
    out << "undefined";
  } else if (n.den == Integer::ONE) {
    out << n.num;
  } else {
    out << n.num << "/" << n.den;
  }
  return out;
}

std::string Number::to_string() const {
  std::stringstream ss;
  ss << (*this);
  return ss.str();
}

Number Number::infinity() {
  Number result;
  result.makeInf();
  return result;
}

bool Number::checkInfArgs(const Number& n) {
  if (inf) {
    return true;
  }
  if (n.inf) {
    makeInf();
    return true;
  }
  return false;
}

void Number::makeInf() {
  num = 0;
  den = 1;
  inf = true;
}

void Number::reduce() {
  if (inf) {
    return;
  }
  // an infinite part means the value exceeded the big number width
  if (num.isInfinite() || den.isInfinite() || den == Integer::ZERO) {
    makeInf();
    return;
  }
  if (den < Integer::ZERO) {
    num.negate();
    den.negate();
  }
  if (num == Integer::ZERO) {
    den = 1;
    return;
  }
  const auto g = Integer::gcd(num, den);
  if (g != Integer::ONE) {
    num /= g;
    den /= g;
  }
}
