#pragma once

#include <cstdint>
#include <map>
#include <span>
#include <unordered_map>
#include <vector>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/crypto/scalar.hpp"

namespace frostcoord {

using ShareIndex = uint32_t;

constexpr size_t kMessageHashLen = 32;
constexpr size_t kEncodedSignatureLen = kCompressedPointLen + 32;

struct SchnorrSignature {
  ECPoint R;
  Scalar s;
};

Bytes EncodeSignature(const SchnorrSignature& signature);
SchnorrSignature DecodeSignature(std::span<const uint8_t> encoded);

// Lagrange basis polynomials evaluated at x = 0 over the given share indices.
std::unordered_map<ShareIndex, Scalar> ComputeLagrangeAtZero(
    const std::vector<ShareIndex>& indices);

// c = H("frostcoord/schnorr/challenge/v1", R, Y, m) mod q.
Scalar ComputeChallenge(const ECPoint& group_nonce,
                        const ECPoint& group_public_key,
                        std::span<const uint8_t> message_hash);

// R = sum(lambda_i * R_i) over the active signer subset.
ECPoint ComputeGroupNonce(const std::map<ShareIndex, ECPoint>& nonce_commitments);

// Signer side of round 2: z_i = r_i + c * x_i.
Scalar ComputePartialSignature(const Scalar& secret_share,
                               const Scalar& nonce,
                               const Scalar& challenge);

// z_i * G == R_i + c * Y_i
bool VerifyPartialSignature(const ECPoint& verification_share,
                            const ECPoint& nonce_commitment,
                            const Scalar& challenge,
                            const Scalar& partial_signature);

// s = sum(lambda_i * z_i); R as above.
SchnorrSignature CombinePartialSignatures(const std::map<ShareIndex, ECPoint>& nonce_commitments,
                                          const std::map<ShareIndex, Scalar>& partial_signatures);

// s * G == R + c * Y
bool VerifySchnorrSignature(const SchnorrSignature& signature,
                            std::span<const uint8_t> message_hash,
                            const ECPoint& group_public_key);

// Trusted-dealer Shamir split of `secret` with a degree threshold-1 polynomial.
std::unordered_map<ShareIndex, Scalar> DealShares(const Scalar& secret,
                                                  uint32_t threshold,
                                                  const std::vector<ShareIndex>& indices);

}  // namespace frostcoord
