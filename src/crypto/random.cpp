#include "frostcoord/crypto/random.hpp"

#include <stdexcept>

#include <openssl/rand.h>

namespace frostcoord {

Bytes Csprng::RandomBytes(size_t size) {
  Bytes out(size);
  if (size == 0) {
    return out;
  }

  if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
    throw std::runtime_error("RAND_bytes failed");
  }
  return out;
}

Scalar Csprng::RandomScalar() {
  while (true) {
    const Bytes bytes = RandomBytes(32);
    try {
      Scalar candidate = Scalar::FromCanonicalBytes(bytes);
      if (!candidate.IsZero()) {
        return candidate;
      }
    } catch (const std::invalid_argument&) {
      continue;
    }
  }
}

std::string Csprng::RandomToken(size_t byte_len) {
  if (byte_len == 0) {
    throw std::invalid_argument("token length must be positive");
  }
  return ToHex(RandomBytes(byte_len));
}

}  // namespace frostcoord
