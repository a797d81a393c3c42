#include "eval/semantics.hpp"

#include <stdexcept>

Number Semantics::add(const Number& a, const Number& b) {
  auto r = a;
  r += b;
  return r;
}

Number Semantics::sub(const Number& a, const Number& b) {
  auto r = a;
  r -= b;
  return r;
}

Number Semantics::mul(const Number& a, const Number& b) {
  auto r = a;
  r *= b;
  return r;
}

Number Semantics::div(const Number& a, const Number& b) {
  auto r = a;
  r /= b;
  return r;
}

Number Semantics::pow(const Number& base, const Number& exp) {
  if (base == Number::INF || exp == Number::INF) {
    return Number::INF;
  }
  if (!exp.isInteger()) {
    throw std::runtime_error("non-integer exponent: " + exp.to_string());
  }
  if (base == Number::ONE) {
    return 1;  // 1^x is always 1
  }
  if (base == Number::MINUS_ONE) {
    return exp.odd() ? -1 : 1;  // (-1)^x
  }
  if (base == Number::ZERO) {
    if (Number::ZERO < exp) {
      return 0;  // 0^(positive number)
    }
    if (exp == Number::ZERO) {
      return 1;  // 0^0
    }
    return Number::INF;  // 0^(negative number)
  }
  Number b = base;
  Integer e = exp.numerator();
  if (e < Integer::ZERO) {
    b = div(Number::ONE, b);
    e.negate();
  }
  Number r = 1;
  while (r != Number::INF && e != Integer::ZERO) {
    if (e.odd()) {
      r = mul(r, b);
    }
    e /= 2;
    if (e != Integer::ZERO) {
      b = mul(b, b);
      if (b == Number::INF) {
        r = Number::INF;
      }
    }
  }
  return r;
}

Number Semantics::gcd(const Number& a, const Number& b) {
  if (a == Number::INF || b == Number::INF) {
    return Number::INF;
  }
  if (!a.isInteger() || !b.isInteger()) {
    throw std::runtime_error("gcd of non-integers: " + a.to_string() + ", " +
                             b.to_string());
  }
  return Number(Integer::gcd(a.numerator(), b.numerator()), Integer::ONE);
}

Number Semantics::abs(const Number& a) {
  if (a < Number::ZERO) {
    auto r = a;
    return r.negate();
  }
  return a;
}

Number Semantics::sign(const Number& a) {
  if (a == Number::INF) {
    return Number::INF;
  }
  if (a < Number::ZERO) {
    return -1;
  }
  return (a == Number::ZERO) ? 0 : 1;
}

Number Semantics::factorial(const Number& n) {
  if (n == Number::INF || !n.isInteger() || n < Number::ZERO) {
    return Number::INF;
  }
  Number r = 1;
  for (Number i = 2; i <= n && r != Number::INF; i += Number::ONE) {
    r = mul(r, i);
  }
  return r;
}
