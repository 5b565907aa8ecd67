#include "frostcoord/protocol/mfa_gate.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>
#include <utility>

#include "frostcoord/common/logging.hpp"
#include "frostcoord/crypto/ecdsa.hpp"
#include "frostcoord/crypto/transcript.hpp"
#include "frostcoord/storage/record_codec.hpp"

namespace frostcoord {
namespace {

constexpr char kApprovalDomain[] = "frostcoord/hardware-approval/v1";

uint64_t UnixMillis(TimePoint time) {
  return static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count());
}

}  // namespace

Bytes HardwareApprovalDigest(const SessionId& session_id,
                             std::span<const uint8_t> operation_digest,
                             TimePoint signed_at) {
  Transcript transcript(kApprovalDomain);
  transcript.append_ascii("session_id", session_id);
  transcript.append("operation_digest", operation_digest);
  transcript.append_u64_be("timestamp_ms", UnixMillis(signed_at));
  return transcript.digest();
}

HardwareMFAGate::HardwareMFAGate(std::shared_ptr<IHardwareApprovalTransport> transport,
                                 std::shared_ptr<IIdentityResolver> identities,
                                 std::shared_ptr<IRecordStore> records,
                                 ApprovalConfig config)
    : transport_(std::move(transport)),
      identities_(std::move(identities)),
      records_(std::move(records)),
      config_(config) {
  if (!transport_ || !identities_ || !records_) {
    throw std::invalid_argument("HardwareMFAGate requires transport, identities and records");
  }
  if (config_.max_failed_attempts == 0) {
    throw std::invalid_argument("max_failed_attempts must be > 0");
  }
}

void HardwareMFAGate::ConfigureGroupPolicy(const GroupId& group_id, MfaPolicyConfig policy) {
  ValidateMfaPolicyConfig(policy);
  std::lock_guard<std::mutex> lock(mu_);
  Logger()->info("group {} MFA policy set to {} ({} approvers)", group_id,
                 MfaPolicyName(policy.policy), policy.approvers.size());
  policies_.insert_or_assign(group_id, std::move(policy));
}

MfaPolicyConfig HardwareMFAGate::PolicyFor(const GroupId& group_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = policies_.find(group_id);
  if (it == policies_.end()) {
    return MfaPolicyConfig{};
  }
  return it->second;
}

HardwareApprovalRecord HardwareMFAGate::RequestApproval(const SigningSession& session,
                                                        const ApproverId& approver,
                                                        std::span<const uint8_t> operation_digest,
                                                        TimePoint now) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto policy_it = policies_.find(session.group_id);
    const bool designated =
        policy_it != policies_.end() &&
        std::find(policy_it->second.approvers.begin(), policy_it->second.approvers.end(),
                  approver) != policy_it->second.approvers.end();
    if (!designated) {
      throw SigningError(ErrorCode::kApproverNotDesignated,
                         approver + " is not a designated approver for group " + session.group_id);
    }

    const auto lockout_it = lockouts_.find(approver);
    if (lockout_it != lockouts_.end() && lockout_it->second.locked_until.has_value() &&
        *lockout_it->second.locked_until > now) {
      throw SigningError(ErrorCode::kApproverLockedOut,
                         approver + " is locked out after repeated failed approvals");
    }

    const auto records_it = approvals_.find(session.id);
    if (records_it != approvals_.end()) {
      for (const HardwareApprovalRecord& existing : records_it->second) {
        if (existing.approver_id == approver) {
          throw SigningError(ErrorCode::kApprovalAlreadyRecorded,
                             approver + " already has a result for session " + session.id);
        }
      }
    }
  }

  const std::optional<Bytes> registered_key = identities_->ApproverPublicKey(approver);
  if (!registered_key.has_value()) {
    throw SigningError(ErrorCode::kApproverNotDesignated,
                       approver + " has no registered hardware key");
  }

  ApprovalRequest request;
  request.session_id = session.id;
  request.approver_id = approver;
  request.operation_digest.assign(operation_digest.begin(), operation_digest.end());
  const ApprovalResponse response = transport_->RequestApproval(request);

  const std::string failure =
      VerifyResponse(session, approver, operation_digest, *registered_key, response, now);

  HardwareApprovalRecord record;
  record.session_id = session.id;
  record.approver_id = approver;
  record.public_key = response.public_key;
  record.signature = response.signature;
  record.signed_at = response.signed_at;
  record.passed = failure.empty();
  record.failure_reason = failure;
  record.recorded_at = now;

  std::lock_guard<std::mutex> lock(mu_);
  std::vector<HardwareApprovalRecord>& session_records = approvals_[session.id];
  for (const HardwareApprovalRecord& existing : session_records) {
    if (existing.approver_id == approver) {
      throw SigningError(ErrorCode::kApprovalAlreadyRecorded,
                         approver + " already has a result for session " + session.id);
    }
  }

  ApproverLockout lockout = lockouts_.count(approver) != 0 ? lockouts_.at(approver)
                                                           : ApproverLockout{approver, 0, {}};
  if (lockout.locked_until.has_value() && *lockout.locked_until <= now) {
    lockout.consecutive_failures = 0;
    lockout.locked_until.reset();
  }
  if (record.passed) {
    lockout.consecutive_failures = 0;
  } else {
    ++lockout.consecutive_failures;
    if (lockout.consecutive_failures >= config_.max_failed_attempts) {
      lockout.locked_until = now + config_.lockout_cooldown;
      Logger()->warn("approver {} locked out for {}s after {} failures", approver,
                     config_.lockout_cooldown.count(), lockout.consecutive_failures);
    }
  }
  record.failure_count = lockout.consecutive_failures;

  records_->Put(kApprovalsTable, RecordKey(session.id, approver), EncodeApprovalRecord(record));
  records_->Put(kApproverLockoutsTable, approver, EncodeLockoutRecord(lockout));
  session_records.push_back(record);
  lockouts_.insert_or_assign(approver, std::move(lockout));

  if (record.passed) {
    Logger()->info("session {}: approval from {} verified", session.id, approver);
  } else {
    Logger()->warn("session {}: approval from {} rejected: {}", session.id, approver, failure);
  }
  return record;
}

std::string HardwareMFAGate::VerifyResponse(const SigningSession& session,
                                            const ApproverId& approver,
                                            std::span<const uint8_t> operation_digest,
                                            const Bytes& registered_key,
                                            const ApprovalResponse& response,
                                            TimePoint now) const {
  if (response.approver_id != approver) {
    return "response came from a different approver";
  }
  if (!response.approved) {
    return "approver declined";
  }
  if (response.public_key != registered_key) {
    return "token key does not match the registered key";
  }

  const auto skew = response.signed_at > now ? response.signed_at - now : now - response.signed_at;
  if (skew > config_.timestamp_window) {
    return "approval timestamp outside the accepted window";
  }

  ECPoint key;
  try {
    key = ECPoint::FromCompressed(response.public_key);
  } catch (const std::invalid_argument&) {
    return "token key is not a valid secp256k1 point";
  }
  const Bytes digest = HardwareApprovalDigest(session.id, operation_digest, response.signed_at);
  if (!EcdsaVerifyDigest(key, digest, response.signature)) {
    return "approval signature does not verify";
  }
  return {};
}

MfaDecision HardwareMFAGate::Evaluate(const SigningSession& session, std::string* detail) const {
  MfaPolicyConfig policy;
  std::vector<HardwareApprovalRecord> records;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto policy_it = policies_.find(session.group_id);
    if (policy_it != policies_.end()) {
      policy = policy_it->second;
    }
    const auto records_it = approvals_.find(session.id);
    if (records_it != approvals_.end()) {
      records = records_it->second;
    }
  }
  return EvaluateMfaPolicy(policy, records, session.operation_amount, detail);
}

std::vector<HardwareApprovalRecord> HardwareMFAGate::RecordsFor(const SessionId& session_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = approvals_.find(session_id);
  if (it == approvals_.end()) {
    return {};
  }
  return it->second;
}

std::optional<ApproverLockout> HardwareMFAGate::LockoutFor(const ApproverId& approver) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = lockouts_.find(approver);
  if (it == lockouts_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t HardwareMFAGate::ForgetSession(const SessionId& session_id) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = approvals_.find(session_id);
  if (it == approvals_.end()) {
    return 0;
  }
  for (const HardwareApprovalRecord& record : it->second) {
    records_->Erase(kApprovalsTable, RecordKey(session_id, record.approver_id));
  }
  const size_t forgotten = it->second.size();
  approvals_.erase(it);
  return forgotten;
}

size_t HardwareMFAGate::Recover() {
  std::unordered_map<SessionId, std::vector<HardwareApprovalRecord>> approvals;
  std::unordered_map<ApproverId, ApproverLockout> lockouts;
  size_t loaded = 0;

  for (const StoredRow& row : records_->LoadAll(kApprovalsTable)) {
    try {
      HardwareApprovalRecord record = DecodeApprovalRecord(row.second);
      approvals[record.session_id].push_back(std::move(record));
      ++loaded;
    } catch (const std::invalid_argument& ex) {
      throw SigningError(ErrorCode::kStorageUnavailable,
                         "unreadable approval row " + row.first + ": " + ex.what());
    }
  }
  for (const StoredRow& row : records_->LoadAll(kApproverLockoutsTable)) {
    try {
      ApproverLockout lockout = DecodeLockoutRecord(row.second);
      lockouts.insert_or_assign(lockout.approver_id, std::move(lockout));
    } catch (const std::invalid_argument& ex) {
      throw SigningError(ErrorCode::kStorageUnavailable,
                         "unreadable lockout row " + row.first + ": " + ex.what());
    }
  }
  for (auto& [session_id, records] : approvals) {
    (void)session_id;
    std::sort(records.begin(), records.end(),
              [](const HardwareApprovalRecord& lhs, const HardwareApprovalRecord& rhs) {
                return lhs.recorded_at < rhs.recorded_at;
              });
  }

  std::lock_guard<std::mutex> lock(mu_);
  approvals_ = std::move(approvals);
  lockouts_ = std::move(lockouts);
  return loaded;
}

std::string HardwareMFAGate::RecordKey(const SessionId& session_id, const ApproverId& approver) {
  return session_id + "/" + approver;
}

}  // namespace frostcoord
