#pragma once

#include <cstddef>
#include <memory>
#include <span>
#include <vector>

#include "frostcoord/common/thread_pool.hpp"
#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/crypto/scalar.hpp"
#include "frostcoord/crypto/schnorr.hpp"
#include "frostcoord/protocol/collaborators.hpp"
#include "frostcoord/protocol/types.hpp"

namespace frostcoord {

struct SignerEntry {
  ParticipantId participant_id;
  ShareIndex share_index = 0;
  ECPoint commitment;
  Scalar lagrange_coefficient;
};

// Everything an active signer needs to compute z_i = r_i + c * x_i.
struct SigningPackage {
  SessionId session_id;
  Bytes message_hash;
  ECPoint group_public_key;
  std::vector<SignerEntry> signers;
  ECPoint group_nonce;
  Scalar challenge;
};

// Stateless over sessions: callers pass the locked session snapshot and the
// aggregate is cached on the session record itself.
class PartialSignatureAggregator {
 public:
  PartialSignatureAggregator(std::shared_ptr<IIdentityResolver> identities,
                             size_t verify_threads);

  SigningPackage BuildPackage(const SigningSession& session) const;

  // Checks phase, signer membership and encoding for a round-2 submission.
  // Returns the decoded scalar.
  Scalar CheckSubmission(const SigningSession& session,
                         const ParticipantId& participant,
                         std::span<const uint8_t> encoded_partial) const;

  // Requires exactly `threshold` partial signatures. Returns the cached
  // candidate or final signature when the session already has one.
  SchnorrSignature Aggregate(const SigningSession& session) const;

  bool Verify(const SchnorrSignature& signature,
              std::span<const uint8_t> message_hash,
              const ECPoint& group_public_key) const;

  // Active signers whose partial fails z_i * G == R_i + c * Y_i. Signers
  // without a published verification share are not checked.
  std::vector<ParticipantId> FindInvalidPartials(const SigningSession& session);

  ECPoint GroupPublicKey(const GroupId& group_id) const;

 private:
  std::shared_ptr<IIdentityResolver> identities_;
  std::unique_ptr<ThreadPool> verify_pool_;
};

}  // namespace frostcoord
