#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/common/errors.hpp"
#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/crypto/scalar.hpp"
#include "frostcoord/crypto/schnorr.hpp"

namespace frostcoord {

using SessionId = std::string;
using GroupId = std::string;
using ParticipantId = std::string;
using ApproverId = std::string;

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

enum class SessionState : uint32_t {
  kPending = 1,
  kNonceCollection = 2,
  kSigning = 3,
  kAggregating = 4,
  kCompleted = 5,
  kFailed = 6,
  kExpired = 7,
};

enum class SessionEvent : uint32_t {
  kParticipantsNotified = 1,
  kNonceThresholdReached = 2,
  kSignatureThresholdReached = 3,
  kAggregateVerified = 4,
  kAggregateRejected = 5,
  kDeadlineExceeded = 6,
  kUnrecoverableError = 7,
  kAdministrativeAbort = 8,
};

struct NonceCommitment {
  SessionId session_id;
  ParticipantId participant_id;
  ECPoint commitment;
  bool used = false;
  TimePoint created_at;
  std::optional<TimePoint> used_at;
};

struct SigningSession {
  SessionId id;
  GroupId group_id;
  Bytes message_hash;
  std::vector<ParticipantId> participants;
  uint32_t threshold = 0;
  SessionState state = SessionState::kPending;

  std::string destination;
  std::optional<uint64_t> operation_amount;
  std::string created_by;

  std::map<ParticipantId, ECPoint> nonce_commitments;
  // First `threshold` committers in arrival order; fixed on entering signing.
  std::vector<ParticipantId> active_signers;
  std::map<ParticipantId, Scalar> partial_signatures;

  std::optional<SchnorrSignature> candidate_signature;
  std::optional<SchnorrSignature> final_signature;
  std::optional<SchnorrSignature> withheld_signature;
  std::optional<std::string> publication_id;

  TimePoint created_at;
  TimePoint updated_at;
  TimePoint deadline;
  std::optional<TimePoint> nonce_collection_started_at;
  std::optional<TimePoint> signing_started_at;
  std::optional<TimePoint> aggregating_started_at;
  std::optional<TimePoint> terminal_at;

  std::optional<ErrorCode> failure_code;
  std::optional<std::string> failure_reason;

  bool IsTerminal() const;
  bool HasParticipant(const ParticipantId& participant) const;
  bool IsActiveSigner(const ParticipantId& participant) const;
};

struct SessionRequest {
  GroupId group_id;
  Bytes message_hash;
  std::vector<ParticipantId> participants;
  uint32_t threshold = 0;
  // Defaults to now + CoordinatorConfig::default_session_ttl.
  std::optional<TimePoint> deadline;
  std::string destination;
  std::optional<uint64_t> operation_amount;
  std::string created_by;
};

}  // namespace frostcoord
