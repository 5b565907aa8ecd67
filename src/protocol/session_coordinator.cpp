#include "frostcoord/protocol/session_coordinator.hpp"

#include <mutex>
#include <optional>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "frostcoord/common/logging.hpp"
#include "frostcoord/protocol/session_state.hpp"

namespace frostcoord {
namespace {

std::shared_ptr<IRecordStore> RequireRecords(const CoordinatorDependencies& dependencies) {
  if (!dependencies.records) {
    throw std::invalid_argument("SessionCoordinator requires a record store");
  }
  return dependencies.records;
}

std::string DescribeCulprits(const std::vector<ParticipantId>& culprits) {
  if (culprits.empty()) {
    return "no individual share could be blamed";
  }
  std::string out = "invalid partial signature from";
  for (const ParticipantId& culprit : culprits) {
    out += " " + OpaqueId(culprit);
  }
  return out;
}

// Clears the in-flight publication marker for a session on scope exit.
class InFlightPublication {
 public:
  InFlightPublication(std::mutex& mu, std::unordered_set<SessionId>& publishing, SessionId id)
      : mu_(mu), publishing_(publishing), id_(std::move(id)) {}
  ~InFlightPublication() {
    std::lock_guard<std::mutex> lock(mu_);
    publishing_.erase(id_);
  }

  InFlightPublication(const InFlightPublication&) = delete;
  InFlightPublication& operator=(const InFlightPublication&) = delete;

 private:
  std::mutex& mu_;
  std::unordered_set<SessionId>& publishing_;
  SessionId id_;
};

}  // namespace

const char* FinalizeStatusName(FinalizeStatus status) {
  switch (status) {
    case FinalizeStatus::kPublished:
      return "published";
    case FinalizeStatus::kAwaitingApproval:
      return "awaiting_approval";
    case FinalizeStatus::kBlocked:
      return "blocked";
  }
  return "unknown";
}

SessionCoordinator::SessionCoordinator(CoordinatorDependencies dependencies,
                                       CoordinatorConfig config)
    : config_(std::move(config)),
      identities_(dependencies.identities),
      publisher_(dependencies.publisher),
      store_(RequireRecords(dependencies), config_),
      ledger_(dependencies.records),
      aggregator_(dependencies.identities, ResolveVerifyWorkerCount(config_)),
      gate_(dependencies.approval_transport, dependencies.identities, dependencies.records,
            config_.approval) {
  if (!identities_ || !publisher_) {
    throw std::invalid_argument("SessionCoordinator requires identities and a publisher");
  }
  SetLogLevel(config_.log_level);
}

RecoverySummary SessionCoordinator::Recover() {
  RecoverySummary summary;
  summary.commitments = ledger_.Recover();
  summary.approvals = gate_.Recover();
  summary.sessions = store_.Recover();
  Logger()->info("recovery loaded {} sessions, {} commitments, {} approvals", summary.sessions,
                 summary.commitments, summary.approvals);
  return summary;
}

void SessionCoordinator::ConfigureGroupPolicy(const GroupId& group_id, MfaPolicyConfig policy) {
  gate_.ConfigureGroupPolicy(group_id, std::move(policy));
}

SigningSession SessionCoordinator::CreateSession(const SessionRequest& request, TimePoint now) {
  if (!identities_->GroupPublicKey(request.group_id).has_value()) {
    throw SigningError(ErrorCode::kMalformedInput,
                       "group " + request.group_id + " has no registered public key");
  }
  const std::optional<MemberRole> role =
      request.created_by.empty() ? std::nullopt
                                 : identities_->MemberRoleOf(request.group_id, request.created_by);
  if (!role.has_value() || *role < config_.min_initiator_role) {
    Logger()->warn("session request from {} for group {} denied", OpaqueId(request.created_by),
                   request.group_id);
    throw SigningError(ErrorCode::kPermissionDenied,
                       "'" + request.created_by + "' may not open sessions for group " +
                           request.group_id + " (requires " +
                           MemberRoleName(config_.min_initiator_role) + ")");
  }
  for (const ParticipantId& participant : request.participants) {
    if (!participant.empty() &&
        !identities_->Participant(request.group_id, participant).has_value()) {
      throw SigningError(ErrorCode::kUnknownParticipant,
                         participant + " holds no share of group " + request.group_id);
    }
  }
  return store_.Create(request, now);
}

SessionStatus SessionCoordinator::OpenNonceCollection(const SessionId& session_id, TimePoint now) {
  Handle handle = store_.Acquire(session_id);
  RequireLive(handle.session(), now);
  store_.Advance(handle, SessionEvent::kParticipantsNotified, {}, now);
  return StatusOf(handle.session());
}

SessionStatus SessionCoordinator::SubmitNonceCommitment(const SessionId& session_id,
                                                        const ParticipantId& participant,
                                                        std::span<const uint8_t> commitment,
                                                        TimePoint now) {
  ECPoint point;
  try {
    point = ECPoint::FromCompressed(commitment);
  } catch (const std::invalid_argument&) {
    throw SigningError(ErrorCode::kMalformedInput,
                       "commitment " + OpaqueId(commitment) + " is not a compressed point");
  }

  Handle handle = store_.Acquire(session_id);
  RequireLive(handle.session(), now);
  if (!handle.session().HasParticipant(participant)) {
    throw SigningError(ErrorCode::kUnknownParticipant,
                       participant + " is not a participant of session " + session_id);
  }
  if (handle.session().nonce_commitments.count(participant) != 0) {
    throw SigningError(ErrorCode::kAlreadySubmitted,
                       participant + " already committed in session " + session_id);
  }
  if (handle.session().state == SessionState::kPending) {
    store_.Advance(handle, SessionEvent::kParticipantsNotified, {}, now);
  }

  // A ledger row without a matching session entry is a write that failed
  // half way; finish it instead of reporting reuse.
  const std::optional<NonceCommitment> existing = ledger_.Find(point);
  const bool resumed = existing.has_value() && existing->session_id == session_id &&
                       existing->participant_id == participant;
  if (!resumed) {
    try {
      ledger_.Record(handle.session(), participant, point, now);
    } catch (const SigningError& ex) {
      if (ex.code() == ErrorCode::kNonceReuseDetected) {
        FailSession(handle, ErrorCode::kNonceReuseDetected,
                    participant + " submitted a commitment already recorded elsewhere", now);
      }
      throw;
    }
  }
  store_.PutCommitment(handle, participant, point, now);

  const SigningSession& session = handle.session();
  if (session.state == SessionState::kNonceCollection &&
      session.active_signers.size() == session.threshold) {
    EnterSigning(handle, now);
  } else if (session.state == SessionState::kSigning) {
    Logger()->info("session {}: late commitment from {} kept for audit", session_id, participant);
  }
  return StatusOf(handle.session());
}

void SessionCoordinator::EnterSigning(Handle& handle, TimePoint now) {
  store_.Advance(handle, SessionEvent::kNonceThresholdReached, {}, now);
  try {
    aggregator_.BuildPackage(handle.session());
  } catch (const std::invalid_argument& ex) {
    FailSession(handle, ErrorCode::kMalformedInput,
                std::string("signer commitments do not form a group nonce: ") + ex.what(), now);
    throw SigningError(ErrorCode::kMalformedInput, "session " + handle.session().id +
                                                       " has an unusable signer set");
  }
  Logger()->info("session {} entered signing with {} signers", handle.session().id,
                 handle.session().active_signers.size());
}

SessionStatus SessionCoordinator::SubmitPartialSignature(const SessionId& session_id,
                                                         const ParticipantId& participant,
                                                         std::span<const uint8_t> partial_signature,
                                                         TimePoint now) {
  Handle handle = store_.Acquire(session_id);
  RequireLive(handle.session(), now);

  const Scalar z = aggregator_.CheckSubmission(handle.session(), participant, partial_signature);
  const ECPoint& commitment = handle.session().nonce_commitments.at(participant);

  const std::optional<NonceCommitment> recorded = ledger_.Find(commitment);
  if (!recorded.has_value() || !recorded->used) {
    ledger_.MarkUsed(commitment, now);
  }
  store_.PutPartialSignature(handle, participant, z, now);

  if (handle.session().partial_signatures.size() == handle.session().threshold) {
    store_.Advance(handle, SessionEvent::kSignatureThresholdReached, {}, now);
  }
  return StatusOf(handle.session());
}

SigningPackage SessionCoordinator::GetSigningPackage(const SessionId& session_id) {
  Handle handle = store_.Acquire(session_id);
  return aggregator_.BuildPackage(handle.session());
}

FinalizeResult SessionCoordinator::Finalize(const SessionId& session_id, TimePoint now) {
  SigningSession completed;
  {
    Handle handle = store_.Acquire(session_id);
    std::optional<FinalizeResult> settled = Settle(handle, now);
    if (settled.has_value()) {
      return *settled;
    }
    completed = handle.session();
  }
  return Publish(completed, now);
}

std::optional<FinalizeResult> SessionCoordinator::Settle(Handle& handle, TimePoint now) {
  const SigningSession& session = handle.session();
  const SessionId& session_id = session.id;

  switch (session.state) {
    case SessionState::kCompleted:
      if (session.publication_id.has_value()) {
        FinalizeResult published;
        published.status = FinalizeStatus::kPublished;
        published.signature = session.final_signature;
        published.publication_id = session.publication_id;
        return published;
      }
      return std::nullopt;
    case SessionState::kFailed:
      if (session.failure_code == ErrorCode::kMfaGateBlocked) {
        FinalizeResult blocked;
        blocked.status = FinalizeStatus::kBlocked;
        blocked.reason = session.failure_reason.value_or("");
        return blocked;
      }
      throw SigningError(session.failure_code.value_or(ErrorCode::kSessionAborted),
                         "session " + session_id + " failed: " +
                             session.failure_reason.value_or(""));
    case SessionState::kAggregating:
      break;
    default:
      RequireLive(session, now);
      throw SigningError(ErrorCode::kInvalidStateTransition,
                         "session " + session_id + " cannot finalize in state " +
                             SessionStateName(session.state) + " with " +
                             std::to_string(session.partial_signatures.size()) + " of " +
                             std::to_string(session.threshold) + " partial signatures");
  }
  RequireLive(session, now);

  if (!session.candidate_signature.has_value()) {
    const ECPoint group_key = aggregator_.GroupPublicKey(session.group_id);
    std::optional<SchnorrSignature> aggregate;
    try {
      aggregate = aggregator_.Aggregate(session);
    } catch (const std::invalid_argument& ex) {
      Logger()->warn("session {}: aggregation failed: {}", session_id, ex.what());
    }
    if (!aggregate.has_value() ||
        !aggregator_.Verify(*aggregate, session.message_hash, group_key)) {
      const std::string reason = DescribeCulprits(aggregator_.FindInvalidPartials(session));
      FailSession(handle, ErrorCode::kAggregationVerificationFailed,
                  "aggregate signature does not verify: " + reason, now);
      throw SigningError(ErrorCode::kAggregationVerificationFailed,
                         "session " + session_id + ": " + reason);
    }
    store_.PutCandidateSignature(handle, *aggregate, now);
  }

  std::string detail;
  const MfaDecision decision = gate_.Evaluate(handle.session(), &detail);
  if (decision == MfaDecision::kPending) {
    FinalizeResult pending;
    pending.status = FinalizeStatus::kAwaitingApproval;
    pending.reason = detail;
    return pending;
  }
  if (decision == MfaDecision::kBlocked) {
    const SchnorrSignature withheld = *handle.session().candidate_signature;
    FailSession(handle, ErrorCode::kMfaGateBlocked, detail, now, withheld);
    FinalizeResult blocked;
    blocked.status = FinalizeStatus::kBlocked;
    blocked.reason = detail;
    return blocked;
  }

  TransitionDetails details;
  details.final_signature = handle.session().candidate_signature;
  store_.Advance(handle, SessionEvent::kAggregateVerified, details, now);
  Logger()->info("session {} completed ({})", session_id, detail);
  return std::nullopt;
}

// Runs without the session entry lock; the gateway may block.
FinalizeResult SessionCoordinator::Publish(const SigningSession& session, TimePoint now) {
  {
    std::lock_guard<std::mutex> lock(publish_mu_);
    if (!publishing_.insert(session.id).second) {
      throw SigningError(ErrorCode::kPublicationFailed,
                         "session " + session.id + " is already being published");
    }
  }
  InFlightPublication in_flight(publish_mu_, publishing_, session.id);

  std::string receipt;
  try {
    receipt = publisher_->Publish(*session.final_signature, session.message_hash,
                                  session.destination);
  } catch (const SigningError& ex) {
    Logger()->warn("session {}: publication failed: {}", session.id, ex.what());
    throw SigningError(ErrorCode::kPublicationFailed,
                       "session " + session.id + " completed but was not published: " +
                           ex.reason());
  }

  FinalizeResult result;
  result.status = FinalizeStatus::kPublished;
  result.signature = session.final_signature;
  {
    Handle handle = store_.Acquire(session.id);
    if (!handle.session().publication_id.has_value()) {
      store_.PutPublicationId(handle, receipt, now);
    }
    result.publication_id = handle.session().publication_id;
  }
  Logger()->info("session {} published as {}", session.id, *result.publication_id);
  return result;
}

HardwareApprovalRecord SessionCoordinator::RequestHardwareApproval(const SessionId& session_id,
                                                                   const ApproverId& approver,
                                                                   TimePoint now) {
  SigningSession snapshot;
  {
    Handle handle = store_.Acquire(session_id);
    RequireLive(handle.session(), now);
    snapshot = handle.session();
  }
  // The token round trip can take as long as its owner does, so the entry
  // stays unlocked; the gate rejects a second result for the same approver.
  return gate_.RequestApproval(snapshot, approver, snapshot.message_hash, now);
}

void SessionCoordinator::AbortSession(const SessionId& session_id,
                                      const std::string& reason,
                                      TimePoint now) {
  Handle handle = store_.Acquire(session_id);
  TransitionDetails details;
  details.failure_code = ErrorCode::kSessionAborted;
  details.reason = reason.empty() ? "aborted by administrator" : reason;
  store_.Advance(handle, SessionEvent::kAdministrativeAbort, details, now);
}

SessionStatus SessionCoordinator::GetSessionStatus(const SessionId& session_id) {
  Handle handle = store_.Acquire(session_id);
  return StatusOf(handle.session());
}

SigningSession SessionCoordinator::GetSession(const SessionId& session_id) {
  Handle handle = store_.Acquire(session_id);
  return handle.session();
}

std::vector<SigningSession> SessionCoordinator::ListActiveSessions(const GroupId& group_id) {
  return store_.ListActive(group_id);
}

std::vector<SigningSession> SessionCoordinator::ListPendingSessions(
    const ParticipantId& participant) {
  return store_.ListPendingFor(participant);
}

RecoveryReport SessionCoordinator::RecoverSession(const SessionId& session_id, TimePoint now) {
  Handle handle = store_.Acquire(session_id);
  const SigningSession& session = handle.session();

  RecoveryReport report;
  report.session_id = session.id;
  report.state = session.state;
  report.overdue = !session.IsTerminal() && session.deadline < now;

  if (session.state == SessionState::kPending ||
      session.state == SessionState::kNonceCollection) {
    for (const ParticipantId& participant : session.participants) {
      if (session.nonce_commitments.count(participant) == 0) {
        report.missing_commitments.push_back(participant);
      }
    }
  }
  if (session.state == SessionState::kSigning || session.state == SessionState::kAggregating) {
    for (const ParticipantId& signer : session.active_signers) {
      if (session.partial_signatures.count(signer) == 0) {
        report.missing_signatures.push_back(signer);
      }
    }
  }
  report.can_aggregate = session.state == SessionState::kAggregating && !report.overdue;
  if (session.state == SessionState::kAggregating) {
    report.mfa_decision = gate_.Evaluate(session);
  }
  return report;
}

bool SessionCoordinator::VerifyCompletedSignature(const SessionId& session_id) {
  Handle handle = store_.Acquire(session_id);
  const SigningSession& session = handle.session();
  if (session.state != SessionState::kCompleted || !session.final_signature.has_value()) {
    return false;
  }
  return aggregator_.Verify(*session.final_signature, session.message_hash,
                            aggregator_.GroupPublicKey(session.group_id));
}

std::vector<SessionId> SessionCoordinator::ExpireOverdue(TimePoint now) {
  return store_.ExpireOverdue(now);
}

size_t SessionCoordinator::Cleanup(TimePoint now) {
  const std::vector<SessionId> removed = store_.Cleanup(config_.retention_window, now);
  for (const SessionId& session_id : removed) {
    (void)gate_.ForgetSession(session_id);
  }
  return removed.size();
}

const NonceCommitmentLedger& SessionCoordinator::ledger() const {
  return ledger_;
}

const HardwareMFAGate& SessionCoordinator::gate() const {
  return gate_;
}

const CoordinatorConfig& SessionCoordinator::config() const {
  return config_;
}

void SessionCoordinator::RequireLive(const SigningSession& session, TimePoint now) const {
  switch (session.state) {
    case SessionState::kExpired:
      throw SigningError(ErrorCode::kSessionExpired, "session " + session.id + " has expired");
    case SessionState::kFailed:
      throw SigningError(ErrorCode::kSessionAborted,
                         "session " + session.id + " failed: " +
                             session.failure_reason.value_or(""));
    case SessionState::kCompleted:
      throw SigningError(ErrorCode::kInvalidStateTransition,
                         "session " + session.id + " is already completed");
    default:
      break;
  }
  if (now > session.deadline) {
    throw SigningError(ErrorCode::kSessionExpired,
                       "session " + session.id + " passed its deadline");
  }
}

void SessionCoordinator::FailSession(Handle& handle,
                                     ErrorCode code,
                                     const std::string& reason,
                                     TimePoint now,
                                     std::optional<SchnorrSignature> withheld) {
  TransitionDetails details;
  details.failure_code = code;
  details.reason = reason;
  details.withheld_signature = std::move(withheld);
  const SessionEvent event = code == ErrorCode::kAggregationVerificationFailed
                                 ? SessionEvent::kAggregateRejected
                                 : SessionEvent::kUnrecoverableError;
  store_.Advance(handle, event, details, now);
}

SessionStatus SessionCoordinator::StatusOf(const SigningSession& session) {
  SessionStatus status;
  status.session_id = session.id;
  status.state = session.state;
  status.participants_responded = StateRank(session.state) <= StateRank(SessionState::kNonceCollection)
                                      ? session.nonce_commitments.size()
                                      : session.partial_signatures.size();
  status.participant_count = session.participants.size();
  status.threshold = session.threshold;
  status.deadline = session.deadline;
  status.failure_code = session.failure_code;
  status.failure_reason = session.failure_reason;
  return status;
}

}  // namespace frostcoord
