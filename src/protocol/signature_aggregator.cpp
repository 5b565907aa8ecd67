#include "frostcoord/protocol/signature_aggregator.hpp"

#include <map>
#include <optional>
#include <stdexcept>
#include <utility>

#include "frostcoord/common/logging.hpp"
#include "frostcoord/protocol/session_state.hpp"

namespace frostcoord {
namespace {

struct ShareCheck {
  ParticipantId participant_id;
  std::optional<ECPoint> verification_share;
  ECPoint commitment;
  Scalar partial;
};

}  // namespace

PartialSignatureAggregator::PartialSignatureAggregator(
    std::shared_ptr<IIdentityResolver> identities,
    size_t verify_threads)
    : identities_(std::move(identities)),
      verify_pool_(std::make_unique<ThreadPool>(verify_threads == 0 ? 1 : verify_threads)) {
  if (!identities_) {
    throw std::invalid_argument("PartialSignatureAggregator requires an identity resolver");
  }
}

ECPoint PartialSignatureAggregator::GroupPublicKey(const GroupId& group_id) const {
  const std::optional<ECPoint> key = identities_->GroupPublicKey(group_id);
  if (!key.has_value()) {
    throw SigningError(ErrorCode::kMalformedInput, "group " + group_id + " has no public key");
  }
  return *key;
}

SigningPackage PartialSignatureAggregator::BuildPackage(const SigningSession& session) const {
  if (StateRank(session.state) < StateRank(SessionState::kSigning) ||
      session.active_signers.size() != session.threshold) {
    throw SigningError(ErrorCode::kInvalidStateTransition,
                       "session " + session.id + " has no fixed signer set yet");
  }

  SigningPackage package;
  package.session_id = session.id;
  package.message_hash = session.message_hash;
  package.group_public_key = GroupPublicKey(session.group_id);

  std::map<ShareIndex, ECPoint> commitments;
  std::vector<ShareIndex> indices;
  for (const ParticipantId& signer : session.active_signers) {
    const std::optional<ParticipantIdentity> identity =
        identities_->Participant(session.group_id, signer);
    if (!identity.has_value()) {
      throw SigningError(ErrorCode::kUnknownParticipant,
                         signer + " has no share index in group " + session.group_id);
    }
    const auto commitment_it = session.nonce_commitments.find(signer);
    if (commitment_it == session.nonce_commitments.end()) {
      throw SigningError(ErrorCode::kInvalidStateTransition,
                         "active signer " + signer + " has no commitment");
    }
    if (!commitments.emplace(identity->share_index, commitment_it->second).second) {
      throw SigningError(ErrorCode::kInvalidParticipants,
                         "share index " + std::to_string(identity->share_index) +
                             " is held by more than one signer");
    }
    indices.push_back(identity->share_index);

    SignerEntry entry;
    entry.participant_id = signer;
    entry.share_index = identity->share_index;
    entry.commitment = commitment_it->second;
    package.signers.push_back(std::move(entry));
  }

  const std::unordered_map<ShareIndex, Scalar> lambdas = ComputeLagrangeAtZero(indices);
  for (SignerEntry& entry : package.signers) {
    entry.lagrange_coefficient = lambdas.at(entry.share_index);
  }

  package.group_nonce = ComputeGroupNonce(commitments);
  package.challenge =
      ComputeChallenge(package.group_nonce, package.group_public_key, session.message_hash);
  return package;
}

Scalar PartialSignatureAggregator::CheckSubmission(const SigningSession& session,
                                                   const ParticipantId& participant,
                                                   std::span<const uint8_t> encoded_partial) const {
  if (!session.HasParticipant(participant)) {
    throw SigningError(ErrorCode::kUnknownParticipant,
                       participant + " is not a participant of session " + session.id);
  }
  if (session.state != SessionState::kSigning) {
    throw SigningError(ErrorCode::kInvalidStateTransition,
                       "session " + session.id + " does not accept partial signatures in state " +
                           SessionStateName(session.state));
  }
  if (!session.IsActiveSigner(participant)) {
    throw SigningError(ErrorCode::kNotActiveSigner,
                       participant + " is not in the active signer set of session " + session.id);
  }
  if (session.partial_signatures.count(participant) != 0) {
    throw SigningError(ErrorCode::kAlreadySubmitted,
                       participant + " already signed in session " + session.id);
  }

  try {
    return Scalar::FromCanonicalBytes(encoded_partial);
  } catch (const std::invalid_argument&) {
    throw SigningError(ErrorCode::kMalformedInput,
                       "partial signature " + OpaqueId(encoded_partial) +
                           " is not a canonical scalar");
  }
}

SchnorrSignature PartialSignatureAggregator::Aggregate(const SigningSession& session) const {
  if (session.final_signature.has_value()) {
    return *session.final_signature;
  }
  if (session.candidate_signature.has_value()) {
    return *session.candidate_signature;
  }
  if (session.partial_signatures.size() != session.threshold) {
    throw SigningError(ErrorCode::kInvalidStateTransition,
                       "session " + session.id + " has " +
                           std::to_string(session.partial_signatures.size()) + " of " +
                           std::to_string(session.threshold) + " partial signatures");
  }

  const SigningPackage package = BuildPackage(session);
  std::map<ShareIndex, ECPoint> commitments;
  std::map<ShareIndex, Scalar> partials;
  for (const SignerEntry& signer : package.signers) {
    const auto partial_it = session.partial_signatures.find(signer.participant_id);
    if (partial_it == session.partial_signatures.end()) {
      throw SigningError(ErrorCode::kInvalidStateTransition,
                         "missing partial signature from " + signer.participant_id);
    }
    commitments.emplace(signer.share_index, signer.commitment);
    partials.emplace(signer.share_index, partial_it->second);
  }
  return CombinePartialSignatures(commitments, partials);
}

bool PartialSignatureAggregator::Verify(const SchnorrSignature& signature,
                                        std::span<const uint8_t> message_hash,
                                        const ECPoint& group_public_key) const {
  return VerifySchnorrSignature(signature, message_hash, group_public_key);
}

std::vector<ParticipantId> PartialSignatureAggregator::FindInvalidPartials(
    const SigningSession& session) {
  const SigningPackage package = BuildPackage(session);

  std::vector<ShareCheck> checks;
  for (const SignerEntry& signer : package.signers) {
    const auto partial_it = session.partial_signatures.find(signer.participant_id);
    if (partial_it == session.partial_signatures.end()) {
      continue;
    }
    const std::optional<ParticipantIdentity> identity =
        identities_->Participant(session.group_id, signer.participant_id);
    ShareCheck check;
    check.participant_id = signer.participant_id;
    check.verification_share = identity.has_value() ? identity->verification_share : std::nullopt;
    check.commitment = signer.commitment;
    check.partial = partial_it->second;
    checks.push_back(std::move(check));
  }

  const Scalar challenge = package.challenge;
  const std::vector<bool> valid = verify_pool_->Map(checks, [&challenge](const ShareCheck& check) {
    if (!check.verification_share.has_value()) {
      return true;
    }
    return VerifyPartialSignature(*check.verification_share, check.commitment, challenge,
                                  check.partial);
  });

  std::vector<ParticipantId> culprits;
  for (size_t i = 0; i < checks.size(); ++i) {
    if (!valid[i]) {
      culprits.push_back(checks[i].participant_id);
    }
  }
  if (!culprits.empty()) {
    Logger()->warn("session {}: {} invalid partial signature(s)", session.id, culprits.size());
  }
  return culprits;
}

}  // namespace frostcoord
