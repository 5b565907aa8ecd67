#pragma once

#include <array>
#include <cstdint>
#include <span>

#include <gmpxx.h>

namespace frostcoord {

// Element of Z_q, q = secp256k1 group order.
class Scalar {
 public:
  Scalar();
  explicit Scalar(const mpz_class& value);

  static Scalar FromUint64(uint64_t value);
  static Scalar FromBigEndianModQ(std::span<const uint8_t> bytes);
  static Scalar FromCanonicalBytes(std::span<const uint8_t> bytes);

  std::array<uint8_t, 32> ToCanonicalBytes() const;

  bool IsZero() const;

  Scalar operator+(const Scalar& other) const;
  Scalar operator-(const Scalar& other) const;
  Scalar operator*(const Scalar& other) const;
  Scalar Negate() const;
  // Throws std::invalid_argument for zero.
  Scalar Inverse() const;

  bool operator==(const Scalar& other) const;
  bool operator!=(const Scalar& other) const;

 private:
  mpz_class value_;
};

}  // namespace frostcoord
