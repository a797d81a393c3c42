#pragma once

#include "math/number.hpp"

class Semantics {
 public:
  static Number add(const Number& a, const Number& b);

  static Number sub(const Number& a, const Number& b);

  static Number mul(const Number& a, const Number& b);

  static Number div(const Number& a, const Number& b);

  static Number pow(const Number& base, const Number& exp);

  static Number gcd(const Number& a, const Number& b);

  static Number abs(const Number& a);

  static Number sign(const Number& a);

  static Number factorial(const Number& n);
};
