#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_set>
#include <vector>

#include "frostcoord/common/config.hpp"
#include "frostcoord/protocol/collaborators.hpp"
#include "frostcoord/protocol/mfa_gate.hpp"
#include "frostcoord/protocol/mfa_policy.hpp"
#include "frostcoord/protocol/nonce_ledger.hpp"
#include "frostcoord/protocol/session_store.hpp"
#include "frostcoord/protocol/signature_aggregator.hpp"
#include "frostcoord/protocol/types.hpp"
#include "frostcoord/storage/record_store.hpp"

namespace frostcoord {

struct CoordinatorDependencies {
  std::shared_ptr<IRecordStore> records;
  std::shared_ptr<IIdentityResolver> identities;
  std::shared_ptr<IEventPublishingGateway> publisher;
  std::shared_ptr<IHardwareApprovalTransport> approval_transport;
};

struct SessionStatus {
  SessionId session_id;
  SessionState state = SessionState::kPending;
  // Commitments while collecting nonces, partial signatures afterwards.
  size_t participants_responded = 0;
  size_t participant_count = 0;
  uint32_t threshold = 0;
  TimePoint deadline;
  std::optional<ErrorCode> failure_code;
  std::optional<std::string> failure_reason;
};

enum class FinalizeStatus : uint32_t {
  kPublished = 1,
  kAwaitingApproval = 2,
  kBlocked = 3,
};

struct FinalizeResult {
  FinalizeStatus status = FinalizeStatus::kAwaitingApproval;
  std::optional<SchnorrSignature> signature;
  std::optional<std::string> publication_id;
  std::string reason;
};

struct RecoveryReport {
  SessionId session_id;
  SessionState state = SessionState::kPending;
  std::vector<ParticipantId> missing_commitments;
  std::vector<ParticipantId> missing_signatures;
  bool can_aggregate = false;
  bool overdue = false;
  std::optional<MfaDecision> mfa_decision;
};

struct RecoverySummary {
  size_t sessions = 0;
  size_t commitments = 0;
  size_t approvals = 0;
};

const char* FinalizeStatusName(FinalizeStatus status);

// Public entry point. Drives a session from creation to completion, failure
// or expiry; every operation either succeeds or throws SigningError.
class SessionCoordinator {
 public:
  SessionCoordinator(CoordinatorDependencies dependencies, CoordinatorConfig config);

  // Reloads sessions, commitments and approvals after a restart.
  RecoverySummary Recover();

  void ConfigureGroupPolicy(const GroupId& group_id, MfaPolicyConfig policy);

  SigningSession CreateSession(const SessionRequest& request, TimePoint now = Clock::now());
  SessionStatus OpenNonceCollection(const SessionId& session_id, TimePoint now = Clock::now());

  SessionStatus SubmitNonceCommitment(const SessionId& session_id,
                                      const ParticipantId& participant,
                                      std::span<const uint8_t> commitment,
                                      TimePoint now = Clock::now());
  SessionStatus SubmitPartialSignature(const SessionId& session_id,
                                       const ParticipantId& participant,
                                       std::span<const uint8_t> partial_signature,
                                       TimePoint now = Clock::now());

  SigningPackage GetSigningPackage(const SessionId& session_id);

  // Aggregate, verify, run the MFA gate and publish. On a completed session
  // returns the cached result, retrying publication if it had failed.
  FinalizeResult Finalize(const SessionId& session_id, TimePoint now = Clock::now());

  HardwareApprovalRecord RequestHardwareApproval(const SessionId& session_id,
                                                 const ApproverId& approver,
                                                 TimePoint now = Clock::now());

  void AbortSession(const SessionId& session_id,
                    const std::string& reason,
                    TimePoint now = Clock::now());

  SessionStatus GetSessionStatus(const SessionId& session_id);
  SigningSession GetSession(const SessionId& session_id);
  std::vector<SigningSession> ListActiveSessions(const GroupId& group_id);
  std::vector<SigningSession> ListPendingSessions(const ParticipantId& participant);
  RecoveryReport RecoverSession(const SessionId& session_id, TimePoint now = Clock::now());
  bool VerifyCompletedSignature(const SessionId& session_id);

  std::vector<SessionId> ExpireOverdue(TimePoint now = Clock::now());
  size_t Cleanup(TimePoint now = Clock::now());

  const NonceCommitmentLedger& ledger() const;
  const HardwareMFAGate& gate() const;
  const CoordinatorConfig& config() const;

 private:
  using Handle = SigningSessionStore::Handle;

  void RequireLive(const SigningSession& session, TimePoint now) const;
  void FailSession(Handle& handle,
                   ErrorCode code,
                   const std::string& reason,
                   TimePoint now,
                   std::optional<SchnorrSignature> withheld = std::nullopt);
  void EnterSigning(Handle& handle, TimePoint now);
  // Aggregates, verifies and gates under the entry lock. Returns the result
  // unless a completed session still needs publishing.
  std::optional<FinalizeResult> Settle(Handle& handle, TimePoint now);
  FinalizeResult Publish(const SigningSession& session, TimePoint now);
  static SessionStatus StatusOf(const SigningSession& session);

  CoordinatorConfig config_;
  std::shared_ptr<IIdentityResolver> identities_;
  std::shared_ptr<IEventPublishingGateway> publisher_;
  SigningSessionStore store_;
  NonceCommitmentLedger ledger_;
  PartialSignatureAggregator aggregator_;
  HardwareMFAGate gate_;

  std::mutex publish_mu_;
  std::unordered_set<SessionId> publishing_;
};

}  // namespace frostcoord
