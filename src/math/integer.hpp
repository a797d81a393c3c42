#pragma once

#include <cstdint>
#include <iostream>
#include <string>

class BigNumber;

/**
 * Signed integer that is stored as a 64-bit value and promoted to a
 * BigNumber on overflow. It is demoted again as soon as the value fits.
 * Results beyond the width of BigNumber, and divisions by zero, are INF.
 */
class Integer {
 public:
  static const Integer ZERO;
  static const Integer ONE;
  static const Integer INF;

  Integer();

  Integer(const Integer& n);

  Integer(int64_t value);

  explicit Integer(const std::string& s);

  ~Integer();

  Integer& operator=(const Integer& n);

  bool operator==(const Integer& n) const;

  bool operator!=(const Integer& n) const;

  bool operator<(const Integer& n) const;

  bool operator>(const Integer& n) const;

  bool operator<=(const Integer& n) const;

  bool operator>=(const Integer& n) const;

  Integer& negate();

  Integer& operator+=(const Integer& n);

  Integer& operator-=(const Integer& n);

  Integer& operator*=(const Integer& n);

  // truncating division
  Integer& operator/=(const Integer& n);

  Integer& operator%=(const Integer& n);

  bool isInfinite() const;

  bool isBig() const;

  int64_t asInt() const;

  bool odd() const;

  std::size_t hash() const;

  friend std::ostream& operator<<(std::ostream& out, const Integer& n);

  std::string to_string() const;

  static Integer gcd(const Integer& a, const Integer& b);

 private:
  static Integer infinity();

  bool checkInfArgs(const Integer& n);

  void checkInfBig();

  void convertToBig();

  void makeInf();

  int64_t value;
  BigNumber* big;
};
