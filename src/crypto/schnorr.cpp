#include "frostcoord/crypto/schnorr.hpp"

#include <stdexcept>
#include <unordered_set>

#include "frostcoord/crypto/random.hpp"
#include "frostcoord/crypto/transcript.hpp"

namespace frostcoord {
namespace {

constexpr char kChallengeDomain[] = "frostcoord/schnorr/challenge/v1";

std::vector<ShareIndex> CollectIndices(const std::map<ShareIndex, ECPoint>& nonce_commitments) {
  std::vector<ShareIndex> indices;
  indices.reserve(nonce_commitments.size());
  for (const auto& [index, commitment] : nonce_commitments) {
    (void)commitment;
    indices.push_back(index);
  }
  return indices;
}

}  // namespace

Bytes EncodeSignature(const SchnorrSignature& signature) {
  Bytes out = signature.R.ToCompressedBytes();
  const std::array<uint8_t, 32> s_bytes = signature.s.ToCanonicalBytes();
  out.insert(out.end(), s_bytes.begin(), s_bytes.end());
  return out;
}

SchnorrSignature DecodeSignature(std::span<const uint8_t> encoded) {
  if (encoded.size() != kEncodedSignatureLen) {
    throw std::invalid_argument("Encoded signature must be 65 bytes");
  }

  SchnorrSignature out;
  out.R = ECPoint::FromCompressed(encoded.subspan(0, kCompressedPointLen));
  out.s = Scalar::FromCanonicalBytes(encoded.subspan(kCompressedPointLen, 32));
  return out;
}

std::unordered_map<ShareIndex, Scalar> ComputeLagrangeAtZero(
    const std::vector<ShareIndex>& indices) {
  if (indices.empty()) {
    throw std::invalid_argument("lagrange coefficient set must not be empty");
  }

  std::unordered_set<ShareIndex> dedup;
  for (ShareIndex index : indices) {
    if (index == 0) {
      throw std::invalid_argument("share index must be non-zero");
    }
    if (!dedup.insert(index).second) {
      throw std::invalid_argument("duplicate share index in lagrange coefficient set");
    }
  }

  std::unordered_map<ShareIndex, Scalar> out;
  out.reserve(indices.size());

  for (ShareIndex i : indices) {
    Scalar numerator = Scalar::FromUint64(1);
    Scalar denominator = Scalar::FromUint64(1);

    for (ShareIndex j : indices) {
      if (j == i) {
        continue;
      }
      const Scalar x_j = Scalar::FromUint64(j);
      numerator = numerator * x_j.Negate();
      denominator = denominator * (Scalar::FromUint64(i) - x_j);
    }

    out.emplace(i, numerator * denominator.Inverse());
  }
  return out;
}

Scalar ComputeChallenge(const ECPoint& group_nonce,
                        const ECPoint& group_public_key,
                        std::span<const uint8_t> message_hash) {
  if (message_hash.size() != kMessageHashLen) {
    throw std::invalid_argument("message hash must be 32 bytes");
  }

  const Bytes r_bytes = group_nonce.ToCompressedBytes();
  const Bytes y_bytes = group_public_key.ToCompressedBytes();

  Transcript transcript(kChallengeDomain);
  transcript.append_fields({
      {"R", r_bytes},
      {"Y", y_bytes},
      {"m", message_hash},
  });
  return transcript.challenge_scalar_mod_q();
}

ECPoint ComputeGroupNonce(const std::map<ShareIndex, ECPoint>& nonce_commitments) {
  const std::unordered_map<ShareIndex, Scalar> lambdas =
      ComputeLagrangeAtZero(CollectIndices(nonce_commitments));

  std::vector<ECPoint> weighted;
  weighted.reserve(nonce_commitments.size());
  for (const auto& [index, commitment] : nonce_commitments) {
    weighted.push_back(commitment.Mul(lambdas.at(index)));
  }
  return ECPoint::Sum(weighted);
}

Scalar ComputePartialSignature(const Scalar& secret_share,
                               const Scalar& nonce,
                               const Scalar& challenge) {
  return nonce + challenge * secret_share;
}

bool VerifyPartialSignature(const ECPoint& verification_share,
                            const ECPoint& nonce_commitment,
                            const Scalar& challenge,
                            const Scalar& partial_signature) {
  try {
    const ECPoint lhs = ECPoint::GeneratorMultiply(partial_signature);
    const ECPoint rhs = nonce_commitment.Add(verification_share.Mul(challenge));
    return lhs == rhs;
  } catch (const std::invalid_argument&) {
    return false;
  }
}

SchnorrSignature CombinePartialSignatures(const std::map<ShareIndex, ECPoint>& nonce_commitments,
                                          const std::map<ShareIndex, Scalar>& partial_signatures) {
  if (nonce_commitments.size() != partial_signatures.size()) {
    throw std::invalid_argument("commitment and partial signature sets differ in size");
  }

  const std::unordered_map<ShareIndex, Scalar> lambdas =
      ComputeLagrangeAtZero(CollectIndices(nonce_commitments));

  SchnorrSignature out;
  out.R = ComputeGroupNonce(nonce_commitments);
  for (const auto& [index, z_i] : partial_signatures) {
    const auto lambda_it = lambdas.find(index);
    if (lambda_it == lambdas.end()) {
      throw std::invalid_argument("partial signature from index outside the signer set");
    }
    out.s = out.s + lambda_it->second * z_i;
  }
  return out;
}

bool VerifySchnorrSignature(const SchnorrSignature& signature,
                            std::span<const uint8_t> message_hash,
                            const ECPoint& group_public_key) {
  if (message_hash.size() != kMessageHashLen) {
    return false;
  }

  try {
    const Scalar c = ComputeChallenge(signature.R, group_public_key, message_hash);
    const ECPoint lhs = ECPoint::GeneratorMultiply(signature.s);
    const ECPoint rhs = signature.R.Add(group_public_key.Mul(c));
    return lhs == rhs;
  } catch (const std::invalid_argument&) {
    return false;
  }
}

std::unordered_map<ShareIndex, Scalar> DealShares(const Scalar& secret,
                                                  uint32_t threshold,
                                                  const std::vector<ShareIndex>& indices) {
  if (threshold == 0 || threshold > indices.size()) {
    throw std::invalid_argument("threshold must be in [1, number of shares]");
  }

  std::vector<Scalar> coefficients;
  coefficients.reserve(threshold);
  coefficients.push_back(secret);
  for (uint32_t i = 1; i < threshold; ++i) {
    coefficients.push_back(Csprng::RandomScalar());
  }

  std::unordered_map<ShareIndex, Scalar> shares;
  shares.reserve(indices.size());
  for (ShareIndex index : indices) {
    if (index == 0) {
      throw std::invalid_argument("share index must be non-zero");
    }
    const Scalar x = Scalar::FromUint64(index);
    Scalar y;
    for (auto it = coefficients.rbegin(); it != coefficients.rend(); ++it) {
      y = y * x + *it;
    }
    if (!shares.emplace(index, y).second) {
      throw std::invalid_argument("duplicate share index");
    }
  }
  return shares;
}

}  // namespace frostcoord
