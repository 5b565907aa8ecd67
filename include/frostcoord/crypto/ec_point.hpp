#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/crypto/scalar.hpp"

namespace frostcoord {

constexpr size_t kCompressedPointLen = 33;

// secp256k1 point held in compressed SEC1 form. The point at infinity is not
// representable; operations that would produce it throw.
class ECPoint {
 public:
  ECPoint();

  static ECPoint FromCompressed(std::span<const uint8_t> compressed_bytes);
  static ECPoint GeneratorMultiply(const Scalar& scalar);
  static ECPoint Sum(const std::vector<ECPoint>& points);

  ECPoint Add(const ECPoint& other) const;
  ECPoint Mul(const Scalar& scalar) const;

  Bytes ToCompressedBytes() const;

  bool operator==(const ECPoint& other) const;
  bool operator!=(const ECPoint& other) const;

 private:
  std::array<uint8_t, kCompressedPointLen> compressed_{};
};

}  // namespace frostcoord
