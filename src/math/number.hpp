#pragma once

#include <cstdint>
#include <iostream>
#include <string>

#include "math/integer.hpp"

/**
 * Exact rational number. Numerator and denominator are integers that are
 * promoted to big numbers when they outgrow 64 bits. The value is always
 * kept in lowest terms with a positive denominator. Division by zero turns
 * into the indeterminate value INF, which absorbs all further arithmetic.
 *
 * Examples: 3, -1/2, 717897987691852588770249, undefined
 */
class Number {
 public:
  static const Number ZERO;
  static const Number ONE;
  static const Number TWO;
  static const Number MINUS_ONE;
  static const Number INF;

  Number();

  Number(int64_t value);

  Number(int64_t numerator, int64_t denominator);

  Number(const Integer& numerator, const Integer& denominator);

  explicit Number(const std::string& s);

  bool operator==(const Number& n) const;

  bool operator!=(const Number& n) const;

  bool operator<(const Number& n) const;

  bool operator>(const Number& n) const;

  bool operator<=(const Number& n) const;

  bool operator>=(const Number& n) const;

  Number& negate();

  Number& operator+=(const Number& n);

  Number& operator-=(const Number& n);

  Number& operator*=(const Number& n);

  Number& operator/=(const Number& n);

  bool isInteger() const;

  bool isInfinite() const { return inf; }

  int64_t asInt() const;

  const Integer& numerator() const { return num; }

  const Integer& denominator() const { return den; }

  bool odd() const;

  std::size_t hash() const;

  friend std::ostream& operator<<(std::ostream& out, const Number& n);

  std::string to_string() const;

 private:
  static Number infinity();

  bool checkInfArgs(const Number& n);

  void makeInf();

  void reduce();

  Integer num;
  Integer den;
  bool inf;
};
