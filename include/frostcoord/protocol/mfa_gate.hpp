#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

#include "frostcoord/common/config.hpp"
#include "frostcoord/protocol/collaborators.hpp"
#include "frostcoord/protocol/mfa_policy.hpp"
#include "frostcoord/protocol/types.hpp"
#include "frostcoord/storage/record_store.hpp"

namespace frostcoord {

// Digest a hardware token signs to approve `operation_digest` for a session:
// SHA-256 transcript of (session id, operation digest, unix-ms timestamp).
Bytes HardwareApprovalDigest(const SessionId& session_id,
                             std::span<const uint8_t> operation_digest,
                             TimePoint signed_at);

// Post-aggregation approval gate. Owns approval records and approver
// lockouts; evaluation is a pure function of the records.
class HardwareMFAGate {
 public:
  HardwareMFAGate(std::shared_ptr<IHardwareApprovalTransport> transport,
                  std::shared_ptr<IIdentityResolver> identities,
                  std::shared_ptr<IRecordStore> records,
                  ApprovalConfig config);

  // Throws SigningError(kMalformedInput) for an invalid policy.
  void ConfigureGroupPolicy(const GroupId& group_id, MfaPolicyConfig policy);
  // Groups without a configured policy are disabled.
  MfaPolicyConfig PolicyFor(const GroupId& group_id) const;

  // Round trip to the approver's token, local verification, then a recorded
  // pass or fail. Transport failures propagate as kTransportUnavailable and
  // leave no record.
  HardwareApprovalRecord RequestApproval(const SigningSession& session,
                                         const ApproverId& approver,
                                         std::span<const uint8_t> operation_digest,
                                         TimePoint now = Clock::now());

  MfaDecision Evaluate(const SigningSession& session, std::string* detail = nullptr) const;

  std::vector<HardwareApprovalRecord> RecordsFor(const SessionId& session_id) const;
  std::optional<ApproverLockout> LockoutFor(const ApproverId& approver) const;

  // Drops the approval records of a removed session, in memory and in
  // storage. Lockout counters are kept.
  size_t ForgetSession(const SessionId& session_id);

  // Reloads approval records and lockouts. Returns the number of records.
  size_t Recover();

 private:
  std::string VerifyResponse(const SigningSession& session,
                             const ApproverId& approver,
                             std::span<const uint8_t> operation_digest,
                             const Bytes& registered_key,
                             const ApprovalResponse& response,
                             TimePoint now) const;

  static std::string RecordKey(const SessionId& session_id, const ApproverId& approver);

  std::shared_ptr<IHardwareApprovalTransport> transport_;
  std::shared_ptr<IIdentityResolver> identities_;
  std::shared_ptr<IRecordStore> records_;
  ApprovalConfig config_;

  mutable std::mutex mu_;
  std::unordered_map<GroupId, MfaPolicyConfig> policies_;
  std::unordered_map<SessionId, std::vector<HardwareApprovalRecord>> approvals_;
  std::unordered_map<ApproverId, ApproverLockout> lockouts_;
};

}  // namespace frostcoord
