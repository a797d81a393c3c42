#include "math/integer.hpp"

#include <cstdlib>
#include <functional>
#include <limits>
#include <sstream>
#include <stdexcept>

#include "math/big_number.hpp"

BigNumber* INF_PTR = reinterpret_cast<BigNumber*>(1);

const Integer Integer::ZERO(0);
const Integer Integer::ONE(1);
const Integer Integer::INF = Integer::infinity();

constexpr int64_t MIN_INT = std::numeric_limits<int64_t>::min();
constexpr int64_t MAX_INT = std::numeric_limits<int64_t>::max();
constexpr std::size_t MAX_SIZE = std::numeric_limits<std::size_t>::max();

Integer::Integer() : value(0), big(nullptr) {}

Integer::Integer(const Integer& n)
    : value(n.value),
      big((n.big && n.big != INF_PTR) ? new BigNumber(*n.big) : n.big) {}

Integer::Integer(int64_t value) : value(value), big(nullptr) {}

Integer::Integer(const std::string& s) : value(0), big(nullptr) {
  size_t start = (!s.empty() && s[0] == '-') ? 1 : 0;
  if (start == s.size() ||
      s.find_first_not_of("0123456789", start) != std::string::npos) {
    throw std::runtime_error("error reading number: '" + s + "'");
  }
  if (s.size() <= 18) {
    value = std::stoll(s);
  } else {
    big = new BigNumber(s);
    checkInfBig();
  }
}

Integer::~Integer() {
  if (big && big != INF_PTR) {
    delete big;
  }
}

Integer& Integer::operator=(const Integer& n) {
  if (this != &n) {
    value = n.value;
    if (big && big != INF_PTR) {
      delete big;
    }
    big = (n.big && n.big != INF_PTR) ? new BigNumber(*n.big) : n.big;
  }
  return *this;
}

bool Integer::operator==(const Integer& n) const {
  if (big == INF_PTR || n.big == INF_PTR) {
    return big == n.big;
  }
  if (big) {
    return n.big ? (*big) == (*n.big) : (*big) == BigNumber(n.value);
  }
  if (n.big) {
    return BigNumber(value) == (*n.big);
  }
  return value == n.value;
}

bool Integer::operator!=(const Integer& n) const { return !(*this == n); }

bool Integer::operator<(const Integer& n) const {
  if (n.big == INF_PTR) {
    return big != INF_PTR;
  }
  if (big == INF_PTR) {
    return false;
  }
  if (big) {
    return n.big ? (*big) < (*n.big) : (*big) < BigNumber(n.value);
  }
  if (n.big) {
    return BigNumber(value) < (*n.big);
  }
  return value < n.value;
}

bool Integer::operator>(const Integer& n) const { return (n < *this); }

bool Integer::operator<=(const Integer& n) const {
  return (*this < n || *this == n);
}

bool Integer::operator>=(const Integer& n) const {
  return (n < *this || *this == n);
}

Integer& Integer::negate() {
  if (big == INF_PTR) {
    return *this;
  }
  if (!big && value != MIN_INT) {
    value = -value;
    return *this;
  }
  convertToBig();
  big->negate();
  checkInfBig();
  return *this;
}

Integer& Integer::operator+=(const Integer& n) {
  if (checkInfArgs(n)) {
    return *this;
  }
  if (!big && !n.big &&
      !((value > 0 && n.value > MAX_INT - value) ||
        (value < 0 && n.value < MIN_INT - value))) {
    value += n.value;
    return *this;
  }
  // the operand is copied before the conversion, since it may be *this
  BigNumber m = n.big ? *n.big : BigNumber(n.value);
  convertToBig();
  (*big) += m;
  checkInfBig();
  return *this;
}

Integer& Integer::operator-=(const Integer& n) {
  auto m = n;
  m.negate();
  *this += m;
  return *this;
}

Integer& Integer::operator*=(const Integer& n) {
  if (checkInfArgs(n)) {
    return *this;
  }
  if (!big && !n.big && value != MIN_INT && n.value != MIN_INT &&
      (n.value == 0 || MAX_INT / std::abs(n.value) >= std::abs(value))) {
    value *= n.value;
    return *this;
  }
  BigNumber m = n.big ? *n.big : BigNumber(n.value);
  convertToBig();
  (*big) *= m;
  checkInfBig();
  return *this;
}

Integer& Integer::operator/=(const Integer& n) {
  if (checkInfArgs(n)) {
    return *this;
  }
  if (n == ZERO) {
    makeInf();
    return *this;
  }
  if (!big && !n.big && value != MIN_INT) {
    value /= n.value;
    return *this;
  }
  BigNumber m = n.big ? *n.big : BigNumber(n.value);
  convertToBig();
  (*big) /= m;
  checkInfBig();
  return *this;
}

Integer& Integer::operator%=(const Integer& n) {
  if (checkInfArgs(n)) {
    return *this;
  }
  if (n == ZERO) {
    makeInf();
    return *this;
  }
  if (!big && !n.big && value != MIN_INT) {
    value %= n.value;
    return *this;
  }
  BigNumber m = n.big ? *n.big : BigNumber(n.value);
  convertToBig();
  (*big) %= m;
  checkInfBig();
  return *this;
}

bool Integer::isInfinite() const { return big == INF_PTR; }

bool Integer::isBig() const { return big && big != INF_PTR; }

int64_t Integer::asInt() const {
  if (big == INF_PTR) {
    throw std::runtime_error("Infinity error");
  }
  if (big) {
    return big->asInt();
  }
  return value;
}

bool Integer::odd() const {
  if (big == INF_PTR) {
    return false;  // by convention
  }
  if (big) {
    return big->odd();
  }
  return (value & 1);
}

std::size_t Integer::hash() const {
  if (big == INF_PTR) {
    return MAX_SIZE;
  }
  if (big) {
    return big->hash();
  }
  return std::hash<int64_t>()(value);
}

std::ostream& operator<<(std::ostream& out, const Integer& n) {
  if (n.big == INF_PTR) {
    out << "inf";
  } else if (n.big) {
    out << *n.big;
  } else {
    out << n.value;
  }
  return out;
}

std::string Integer::to_string() const {
  std::stringstream ss;
  ss << (*this);
  return ss.str();
}

Integer Integer::gcd(const Integer& a, const Integer& b) {
  if (a.isInfinite() || b.isInfinite()) {
    return INF;
  }
  Integer x = a;
  Integer y = b;
  if (x < ZERO) {
    x.negate();
  }
  if (y < ZERO) {
    y.negate();
  }
  while (y != ZERO) {
    auto r = x;
    r %= y;
    x = y;
    y = r;
  }
  return x;
}

Integer Integer::infinity() {
  Integer inf;
  inf.big = INF_PTR;
  return inf;
}

bool Integer::checkInfArgs(const Integer& n) {
  if (big == INF_PTR) {
    return true;
  }
  if (n.big == INF_PTR) {
    makeInf();
    return true;
  }
  return false;
}

// INF when the big number overflowed; back to 64 bits when it fits again
void Integer::checkInfBig() {
  if (!big || big == INF_PTR) {
    return;
  }
  if (big->isInfinite()) {
    makeInf();
  } else if (big->fitsInt()) {
    value = big->asInt();
    delete big;
    big = nullptr;
  }
}

void Integer::convertToBig() {
  if (!big) {
    big = new BigNumber(value);
    value = 0;
  }
}

void Integer::makeInf() {
  if (big && big != INF_PTR) {
    delete big;
  }
  value = 0;
  big = INF_PTR;
}
