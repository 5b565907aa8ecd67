#include "frostcoord/crypto/ecdsa.hpp"

#include <array>
#include <stdexcept>

#include "frostcoord/crypto/secp256k1_context.hpp"

namespace frostcoord {

Bytes EcdsaSignDigest(const Scalar& secret_key, std::span<const uint8_t> digest32) {
  if (digest32.size() != 32) {
    throw std::invalid_argument("ECDSA digest must be 32 bytes");
  }
  if (secret_key.IsZero()) {
    throw std::invalid_argument("ECDSA secret key must be non-zero");
  }

  const std::array<uint8_t, 32> key_bytes = secret_key.ToCanonicalBytes();
  secp256k1_ecdsa_signature signature;
  if (secp256k1_ecdsa_sign(SecpContext(), &signature, digest32.data(), key_bytes.data(),
                           nullptr, nullptr) != 1) {
    throw std::runtime_error("secp256k1_ecdsa_sign failed");
  }

  Bytes out(kCompactEcdsaSignatureLen);
  if (secp256k1_ecdsa_signature_serialize_compact(SecpContext(), out.data(), &signature) != 1) {
    throw std::runtime_error("Failed to serialize ECDSA signature");
  }
  return out;
}

bool EcdsaVerifyDigest(const ECPoint& public_key,
                       std::span<const uint8_t> digest32,
                       std::span<const uint8_t> compact_signature) {
  if (digest32.size() != 32 || compact_signature.size() != kCompactEcdsaSignatureLen) {
    return false;
  }

  secp256k1_ecdsa_signature signature;
  if (secp256k1_ecdsa_signature_parse_compact(SecpContext(), &signature,
                                              compact_signature.data()) != 1) {
    return false;
  }
  // Tokens do not canonicalize s; (r, s) and (r, q - s) are both valid.
  secp256k1_ecdsa_signature_normalize(SecpContext(), &signature, &signature);

  const Bytes key_bytes = public_key.ToCompressedBytes();
  secp256k1_pubkey pubkey;
  if (secp256k1_ec_pubkey_parse(SecpContext(), &pubkey, key_bytes.data(), key_bytes.size()) != 1) {
    return false;
  }

  return secp256k1_ecdsa_verify(SecpContext(), &signature, digest32.data(), &pubkey) == 1;
}

}  // namespace frostcoord
