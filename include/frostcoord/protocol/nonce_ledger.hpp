#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/protocol/types.hpp"
#include "frostcoord/storage/record_store.hpp"

namespace frostcoord {

// Append-only record of round-1 commitments. A commitment value is accepted
// once across every session the coordinator has ever run, including sessions
// that were since cleaned up.
class NonceCommitmentLedger {
 public:
  explicit NonceCommitmentLedger(std::shared_ptr<IRecordStore> records);

  // The caller holds the session's store handle. Commitments that arrive in
  // signing are late: kept for audit, never part of the signer set.
  // Throws SigningError: kInvalidStateTransition after signing,
  // kUnknownParticipant, kAlreadySubmitted, kNonceReuseDetected.
  NonceCommitment Record(const SigningSession& session,
                         const ParticipantId& participant,
                         const ECPoint& commitment,
                         TimePoint now = Clock::now());

  // Throws kNonceAlreadyUsed on a second call for the same value.
  void MarkUsed(const ECPoint& commitment, TimePoint now = Clock::now());

  size_t Count(const SessionId& session_id) const;
  std::vector<NonceCommitment> ForSession(const SessionId& session_id) const;
  std::optional<NonceCommitment> Find(const ECPoint& commitment) const;
  size_t size() const;

  size_t Recover();

 private:
  static std::string ValueKey(const ECPoint& commitment);

  std::shared_ptr<IRecordStore> records_;

  mutable std::mutex mu_;
  std::unordered_map<std::string, NonceCommitment> by_value_;
  std::unordered_map<SessionId, std::vector<std::string>> by_session_;
};

}  // namespace frostcoord
