#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "frostcoord/protocol/types.hpp"

namespace frostcoord {

enum class MfaPolicy : uint32_t {
  kDisabled = 0,
  kOptional = 1,
  kRequired = 2,
  kRequiredAboveAmount = 3,
  kKOfNRequired = 4,
};

enum class MfaDecision : uint32_t {
  kPass = 1,
  kBlocked = 2,
  kPending = 3,
};

struct MfaPolicyConfig {
  MfaPolicy policy = MfaPolicy::kDisabled;
  std::vector<ApproverId> approvers;
  // k for kKOfNRequired; independent of the signing threshold.
  uint32_t required_approvals = 0;
  // kRequiredAboveAmount enforces only when operation_amount > amount_limit.
  uint64_t amount_limit = 0;
};

struct HardwareApprovalRecord {
  SessionId session_id;
  ApproverId approver_id;
  Bytes public_key;
  Bytes signature;
  TimePoint signed_at;
  bool passed = false;
  std::string failure_reason;
  // Approver's consecutive failures at the time this record was written.
  uint32_t failure_count = 0;
  TimePoint recorded_at;
};

struct ApproverLockout {
  ApproverId approver_id;
  uint32_t consecutive_failures = 0;
  std::optional<TimePoint> locked_until;
};

const char* MfaPolicyName(MfaPolicy policy);
bool ParseMfaPolicy(std::string_view name, MfaPolicy* out);
const char* MfaDecisionName(MfaDecision decision);

// Throws SigningError(kMalformedInput) for inconsistent configurations.
void ValidateMfaPolicyConfig(const MfaPolicyConfig& config);

// Pure decision over recorded results. Records from approvers that are not
// designated by `config` are ignored.
MfaDecision EvaluateMfaPolicy(const MfaPolicyConfig& config,
                              const std::vector<HardwareApprovalRecord>& records,
                              std::optional<uint64_t> operation_amount,
                              std::string* detail = nullptr);

}  // namespace frostcoord
