#pragma once

#include <cstddef>
#include <string>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/crypto/scalar.hpp"

namespace frostcoord {

class Csprng {
 public:
  static Bytes RandomBytes(size_t size);
  // Uniform in [1, q-1].
  static Scalar RandomScalar();
  // Hex token of `byte_len` random bytes, used for session ids.
  static std::string RandomToken(size_t byte_len = 16);
};

}  // namespace frostcoord
