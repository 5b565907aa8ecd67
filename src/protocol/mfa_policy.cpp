#include "frostcoord/protocol/mfa_policy.hpp"

#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace frostcoord {
namespace {

struct Tally {
  uint32_t passed = 0;
  uint32_t failed = 0;
};

Tally CountDesignated(const MfaPolicyConfig& config,
                      const std::vector<HardwareApprovalRecord>& records) {
  const std::unordered_set<ApproverId> designated(config.approvers.begin(), config.approvers.end());
  std::unordered_map<ApproverId, bool> outcomes;
  for (const HardwareApprovalRecord& record : records) {
    if (designated.count(record.approver_id) == 0) {
      continue;
    }
    outcomes.emplace(record.approver_id, record.passed);
  }

  Tally tally;
  for (const auto& [approver, passed] : outcomes) {
    (void)approver;
    if (passed) {
      ++tally.passed;
    } else {
      ++tally.failed;
    }
  }
  return tally;
}

void SetDetail(std::string* detail, std::string text) {
  if (detail != nullptr) {
    *detail = std::move(text);
  }
}

MfaDecision EvaluateAllRequired(const MfaPolicyConfig& config,
                                const Tally& tally,
                                std::string* detail) {
  if (tally.failed > 0) {
    SetDetail(detail, std::to_string(tally.failed) + " required approver(s) failed");
    return MfaDecision::kBlocked;
  }
  if (tally.passed == config.approvers.size()) {
    SetDetail(detail, "all required approvers passed");
    return MfaDecision::kPass;
  }
  SetDetail(detail, std::to_string(tally.passed) + "/" + std::to_string(config.approvers.size()) +
                        " required approvals");
  return MfaDecision::kPending;
}

}  // namespace

const char* MfaPolicyName(MfaPolicy policy) {
  switch (policy) {
    case MfaPolicy::kDisabled:
      return "disabled";
    case MfaPolicy::kOptional:
      return "optional";
    case MfaPolicy::kRequired:
      return "required";
    case MfaPolicy::kRequiredAboveAmount:
      return "required_above_amount";
    case MfaPolicy::kKOfNRequired:
      return "k_of_n_required";
  }
  return "unknown";
}

bool ParseMfaPolicy(std::string_view name, MfaPolicy* out) {
  for (uint32_t raw = static_cast<uint32_t>(MfaPolicy::kDisabled);
       raw <= static_cast<uint32_t>(MfaPolicy::kKOfNRequired); ++raw) {
    const MfaPolicy policy = static_cast<MfaPolicy>(raw);
    if (name == MfaPolicyName(policy)) {
      if (out != nullptr) {
        *out = policy;
      }
      return true;
    }
  }
  return false;
}

const char* MfaDecisionName(MfaDecision decision) {
  switch (decision) {
    case MfaDecision::kPass:
      return "pass";
    case MfaDecision::kBlocked:
      return "blocked";
    case MfaDecision::kPending:
      return "pending";
  }
  return "unknown";
}

void ValidateMfaPolicyConfig(const MfaPolicyConfig& config) {
  std::unordered_set<ApproverId> dedup;
  for (const ApproverId& approver : config.approvers) {
    if (approver.empty()) {
      throw SigningError(ErrorCode::kMalformedInput, "approver id must not be empty");
    }
    if (!dedup.insert(approver).second) {
      throw SigningError(ErrorCode::kMalformedInput, "approver ids must be unique");
    }
  }

  switch (config.policy) {
    case MfaPolicy::kDisabled:
    case MfaPolicy::kOptional:
      return;
    case MfaPolicy::kRequired:
    case MfaPolicy::kRequiredAboveAmount:
      if (config.approvers.empty()) {
        throw SigningError(ErrorCode::kMalformedInput,
                           std::string(MfaPolicyName(config.policy)) +
                               " policy needs at least one approver");
      }
      return;
    case MfaPolicy::kKOfNRequired:
      if (config.required_approvals == 0 ||
          config.required_approvals > config.approvers.size()) {
        throw SigningError(ErrorCode::kMalformedInput,
                           "k_of_n_required needs 1 <= k <= number of approvers");
      }
      return;
  }
  throw SigningError(ErrorCode::kMalformedInput, "unknown MFA policy");
}

MfaDecision EvaluateMfaPolicy(const MfaPolicyConfig& config,
                              const std::vector<HardwareApprovalRecord>& records,
                              std::optional<uint64_t> operation_amount,
                              std::string* detail) {
  const Tally tally = CountDesignated(config, records);

  switch (config.policy) {
    case MfaPolicy::kDisabled:
      SetDetail(detail, "gate disabled");
      return MfaDecision::kPass;
    case MfaPolicy::kOptional:
      SetDetail(detail, "optional gate: " + std::to_string(tally.passed) + " passed, " +
                            std::to_string(tally.failed) + " failed");
      return MfaDecision::kPass;
    case MfaPolicy::kRequired:
      return EvaluateAllRequired(config, tally, detail);
    case MfaPolicy::kRequiredAboveAmount:
      if (!operation_amount.has_value() || *operation_amount <= config.amount_limit) {
        SetDetail(detail, "operation amount within limit");
        return MfaDecision::kPass;
      }
      return EvaluateAllRequired(config, tally, detail);
    case MfaPolicy::kKOfNRequired: {
      const uint32_t n = static_cast<uint32_t>(config.approvers.size());
      const uint32_t k = config.required_approvals;
      if (tally.passed >= k) {
        SetDetail(detail, std::to_string(tally.passed) + " of " + std::to_string(k) +
                              " approvals collected");
        return MfaDecision::kPass;
      }
      if (tally.failed > n - k) {
        SetDetail(detail, std::to_string(tally.failed) + " failures exceed the " +
                              std::to_string(n - k) + " tolerated");
        return MfaDecision::kBlocked;
      }
      SetDetail(detail, std::to_string(tally.passed) + "/" + std::to_string(k) + " approvals");
      return MfaDecision::kPending;
    }
  }
  SetDetail(detail, "unknown MFA policy");
  return MfaDecision::kBlocked;
}

}  // namespace frostcoord
