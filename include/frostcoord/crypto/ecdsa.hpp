#pragma once

#include <span>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/crypto/scalar.hpp"

namespace frostcoord {

constexpr size_t kCompactEcdsaSignatureLen = 64;

// secp256k1 ECDSA over a 32-byte digest, 64-byte compact (r || s) encoding.
// Signing is used by token simulators and tests; the coordinator only verifies.
Bytes EcdsaSignDigest(const Scalar& secret_key, std::span<const uint8_t> digest32);

// Accepts either form of s. Returns false for malformed signatures rather
// than throwing.
bool EcdsaVerifyDigest(const ECPoint& public_key,
                       std::span<const uint8_t> digest32,
                       std::span<const uint8_t> compact_signature);

}  // namespace frostcoord
