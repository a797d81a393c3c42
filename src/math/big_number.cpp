#include "math/big_number.hpp"

#include <algorithm>
#include <initializer_list>
#include <limits>
#include <stdexcept>
#include <vector>

BigNumber::BigNumber() : is_negative(false), is_infinite(false) {
  words.fill(0);
}

BigNumber::BigNumber(int64_t value)
    : is_negative(value < 0), is_infinite(false) {
  words.fill(0);
  // two-step negation so that the minimal int64 value does not overflow
  words[0] = is_negative ? static_cast<uint64_t>(-(value + 1)) + 1
                         : static_cast<uint64_t>(value);
}

BigNumber::BigNumber(const std::string& s) { load(s); }

void throwNumberParseError(const std::string& s) {
  throw std::invalid_argument("error reading number: '" + s + "'");
}

void BigNumber::load(const std::string& s) {
  is_infinite = false;
  int64_t size = s.length();
  int64_t start = 0;
  while (start < size && s[start] == ' ') {
    start++;
  }
  if (start == size) {
    throwNumberParseError(s);
  }
  if (s[start] == '-') {
    is_negative = true;
    if (++start == size) {
      throwNumberParseError(s);
    }
  } else {
    is_negative = false;
  }
  size -= start;
  while (size > 0 && s[start + size - 1] == ' ') {
    size--;
  }
  if (size == 0) {
    throwNumberParseError(s);
  }
  words.fill(0);
  for (int64_t i = 0; i < size && !is_infinite; i++) {
    char ch = s[start + i];
    if (ch < '0' || ch > '9') {
      throwNumberParseError(s);
    }
    mulShort(10);
    add(BigNumber(ch - '0'));
  }
}

bool BigNumber::isZero() const {
  return !is_infinite && std::all_of(words.begin(), words.end(),
                                     [](uint64_t w) { return w == 0; });
}

void BigNumber::makeInfinite() {
  is_negative = false;
  is_infinite = true;
  words.fill(0);
}

bool BigNumber::fitsInt() const {
  if (is_infinite) {
    return false;
  }
  if (words[0] > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    return false;
  }
  return std::all_of(words.begin() + 1, words.end(),
                     [](uint64_t w) { return w == 0; });
}

int64_t BigNumber::asInt() const {
  if (is_infinite) {
    throw std::runtime_error("Infinity error");
  }
  if (!fitsInt()) {
    throw std::runtime_error("Integer overflow");
  }
  const auto v = static_cast<int64_t>(words[0]);
  return is_negative ? -v : v;
}

int64_t BigNumber::getNumUsedWords() const {
  for (int64_t i = NUM_WORDS - 1; i >= 0; i--) {
    if (words[i] != 0) {
      return i + 1;
    }
  }
  return 1;
}

bool BigNumber::odd() const {
  if (is_infinite) {
    return false;  // by convention
  }
  return (words[0] & 1);
}

bool lessAbs(const std::array<uint64_t, BigNumber::NUM_WORDS>& a,
             const std::array<uint64_t, BigNumber::NUM_WORDS>& b) {
  for (int64_t i = BigNumber::NUM_WORDS - 1; i >= 0; i--) {
    if (a[i] != b[i]) {
      return a[i] < b[i];
    }
  }
  return false;
}

bool BigNumber::operator==(const BigNumber& n) const {
  if (is_infinite != n.is_infinite) {
    return false;
  }
  if (words != n.words) {
    return false;
  }
  return ((is_negative == n.is_negative) || isZero());
}

bool BigNumber::operator!=(const BigNumber& n) const { return !(*this == n); }

bool BigNumber::operator<(const BigNumber& n) const {
  const bool neg = is_negative && !isZero();
  const bool n_neg = n.is_negative && !n.isZero();
  if (neg != n_neg) {
    return neg;
  }
  return neg ? lessAbs(n.words, words) : lessAbs(words, n.words);
}

BigNumber& BigNumber::negate() {
  is_negative = !is_negative;
  return *this;
}

BigNumber& BigNumber::operator+=(const BigNumber& n) {
  if (is_infinite || n.is_infinite) {
    makeInfinite();
    return *this;
  }
  if (is_negative == n.is_negative) {
    add(n);
  } else if (lessAbs(words, n.words)) {
    // |this| < |n| => the result has the sign of n
    BigNumber m(n);
    m.sub(*this);
    *this = m;
  } else {
    sub(n);
  }
  return *this;
}

// adds the magnitude of n
void BigNumber::add(const BigNumber& n) {
  uint64_t carry = 0;
  for (size_t i = 0; i < NUM_WORDS; i++) {
    uint64_t low, high;
    low = (words[i] & LOW_BIT_MASK) + (n.words[i] & LOW_BIT_MASK) + carry;
    carry = low >> 32;
    high = (words[i] >> 32) + (n.words[i] >> 32) + carry;
    carry = high >> 32;
    words[i] = ((high & LOW_BIT_MASK) << 32) | (low & LOW_BIT_MASK);
  }
  if (carry) {
    makeInfinite();
  }
}

// subtracts the magnitude of n; requires |n| <= |this|
void BigNumber::sub(const BigNumber& n) {
  uint64_t carry = 0;
  for (size_t i = 0; i < NUM_WORDS; i++) {
    uint64_t low, high;
    low = (words[i] & LOW_BIT_MASK) - (n.words[i] & LOW_BIT_MASK) - carry;
    carry = (low >> 32) != 0;
    high = (words[i] >> 32) - (n.words[i] >> 32) - carry;
    carry = (high >> 32) != 0;
    words[i] = ((high & LOW_BIT_MASK) << 32) | (low & LOW_BIT_MASK);
  }
}

BigNumber& BigNumber::operator*=(const BigNumber& n) {
  if (is_infinite || n.is_infinite) {
    makeInfinite();
    return *this;
  }
  BigNumber result(0);
  int64_t shift = 0;
  const int64_t s = n.getNumUsedWords();
  for (int64_t i = 0; i < s && !result.is_infinite; i++) {
    for (auto half : {n.words[i] & LOW_BIT_MASK, n.words[i] >> 32}) {
      auto copy = *this;
      copy.is_negative = false;
      copy.mulShort(half);
      copy.shift(shift++);
      result += copy;
    }
  }
  if (!result.is_infinite) {
    result.is_negative = (is_negative != n.is_negative);
  }
  *this = result;
  return *this;
}

// multiplies the magnitude by a 32-bit factor
void BigNumber::mulShort(uint64_t n) {
  uint64_t carry = 0;
  const int64_t s = std::min<int64_t>(getNumUsedWords() + 1, NUM_WORDS);
  for (int64_t i = 0; i < s; i++) {
    uint64_t low, high;
    auto& w = words[i];
    high = (w >> 32) * n;
    low = (w & LOW_BIT_MASK) * n;
    w = low + ((high & LOW_BIT_MASK) << 32) + carry;
    carry = ((high + ((low + carry) >> 32)) >> 32);
  }
  if (carry) {
    makeInfinite();
  }
}

// shifts the magnitude left by n half-words
void BigNumber::shift(int64_t n) {
  for (; n > 0; n--) {
    uint64_t next = 0;
    for (size_t i = 0; i < NUM_WORDS; i++) {
      uint64_t h = words[i] >> 32;
      uint64_t l = words[i] & LOW_BIT_MASK;
      words[i] = (l << 32) + next;
      next = h;
    }
    if (next) {
      makeInfinite();
      break;
    }
  }
}

BigNumber& BigNumber::operator/=(const BigNumber& n) {
  if (is_infinite || n.is_infinite || n.isZero()) {
    makeInfinite();
    return *this;
  }
  const bool new_is_negative = (n.is_negative != is_negative);
  auto m = n;
  m.is_negative = false;
  is_negative = false;
  div(m);
  is_negative = new_is_negative;
  return *this;
}

void BigNumber::div(const BigNumber& n) {
  if (n.getNumUsedWords() == 1 && !(n.words[0] >> 32)) {
    divShort(n.words[0]);
  } else {
    divBig(n);
  }
}

// divides the magnitude by a 32-bit divisor and returns the remainder
uint64_t BigNumber::divShort(const uint64_t n) {
  uint64_t carry = 0;
  for (int64_t i = NUM_WORDS - 1; i >= 0; i--) {
    uint64_t h, l, t, h2, u, l2;
    auto& w = words[i];
    h = w >> 32;
    l = w & LOW_BIT_MASK;
    t = (carry << 32) + h;
    h2 = t / n;
    carry = t % n;
    u = (carry << 32) + l;
    l2 = u / n;
    carry = u % n;
    w = (h2 << 32) + l2;
  }
  return carry;
}

void BigNumber::divBig(const BigNumber& n) {
  std::vector<std::pair<BigNumber, BigNumber>> d;
  BigNumber f(n);
  BigNumber g(1);
  while (!lessAbs(words, f.words)) {
    d.emplace_back(f, g);
    f.add(f);
    g.add(g);
    if (f.is_infinite || g.is_infinite) {
      break;  // f exceeds the width, so it exceeds this as well
    }
  }
  BigNumber r(0);
  for (auto it = d.rbegin(); it != d.rend(); it++) {
    while (!lessAbs(words, it->first.words)) {
      sub(it->first);
      r.add(it->second);
    }
  }
  *this = r;
}

BigNumber& BigNumber::operator%=(const BigNumber& n) {
  if (is_infinite || n.is_infinite || n.isZero()) {
    makeInfinite();
    return *this;
  }
  const bool new_is_negative = is_negative;
  auto m = n;
  m.is_negative = false;
  is_negative = false;
  auto q = *this;
  q.div(m);
  q *= m;
  sub(q);
  is_negative = new_is_negative;
  return *this;
}

std::size_t BigNumber::hash() const {
  if (is_infinite) {
    return std::numeric_limits<std::size_t>::max();
  }
  std::size_t seed = 0;
  for (const auto& w : words) {
    seed ^= w + 0x9e3779b9 + (seed << 6) + (seed >> 2);
  }
  if (is_negative && !isZero()) {
    seed ^= 0x9e3779b9 + (seed << 6) + (seed >> 2);
  }
  return seed;
}

std::string BigNumber::toString() const {
  if (is_infinite) {
    return "inf";
  }
  if (isZero()) {
    return "0";
  }
  std::string result;
  BigNumber m = *this;
  while (!m.isZero()) {
    result += static_cast<char>('0' + m.divShort(10));
  }
  if (is_negative) {
    result += '-';
  }
  std::reverse(result.begin(), result.end());
  return result;
}

std::ostream& operator<<(std::ostream& out, const BigNumber& n) {
  out << n.toString();
  return out;
}
