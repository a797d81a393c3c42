#pragma once

#include <array>
#include <cstdint>
#include <iostream>
#include <string>

/**
 * Fixed-width signed integer used by Integer once a value no longer fits
 * into 64 bits. Values that exceed the width become infinite.
 */
class BigNumber {
 public:
  static constexpr size_t NUM_WORDS = 50;

  BigNumber();

  BigNumber(int64_t value);

  explicit BigNumber(const std::string& s);

  bool operator==(const BigNumber& n) const;

  bool operator!=(const BigNumber& n) const;

  bool operator<(const BigNumber& n) const;

  BigNumber& negate();

  BigNumber& operator+=(const BigNumber& n);

  BigNumber& operator*=(const BigNumber& n);

  BigNumber& operator/=(const BigNumber& n);

  BigNumber& operator%=(const BigNumber& n);

  std::size_t hash() const;

  std::string toString() const;

  friend std::ostream& operator<<(std::ostream& out, const BigNumber& n);

  inline bool isInfinite() const { return is_infinite; }

  void makeInfinite();

  bool isZero() const;

  bool fitsInt() const;

  int64_t asInt() const;

  bool odd() const;

 private:
  static constexpr uint64_t LOW_BIT_MASK = 0x00000000FFFFFFFFull;

  void load(const std::string& s);

  int64_t getNumUsedWords() const;

  void add(const BigNumber& n);

  void sub(const BigNumber& n);

  void mulShort(uint64_t n);

  void shift(int64_t n);

  void div(const BigNumber& n);

  uint64_t divShort(const uint64_t n);

  void divBig(const BigNumber& n);

  std::array<uint64_t, NUM_WORDS> words;
  bool is_negative;  // can be set for zero, see isZero()
  bool is_infinite;
};
