#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace frostcoord {

// Federation member roles, lowest first. A role holds every permission of
// the roles below it.
enum class MemberRole : uint32_t {
  kOffspring = 1,
  kAdult = 2,
  kSteward = 3,
  kGuardian = 4,
};

const char* MemberRoleName(MemberRole role);
bool ParseMemberRole(std::string_view name, MemberRole* out);

struct ApprovalConfig {
  // Accepted clock skew between a hardware approval timestamp and now.
  std::chrono::seconds timestamp_window = std::chrono::minutes(5);
  uint32_t max_failed_attempts = 3;
  std::chrono::seconds lockout_cooldown = std::chrono::minutes(15);
};

struct CoordinatorConfig {
  std::chrono::seconds default_session_ttl = std::chrono::minutes(10);
  std::chrono::hours retention_window = std::chrono::hours(24 * 90);
  uint32_t max_threshold = 7;
  // Lowest role allowed to open a signing session for a group.
  MemberRole min_initiator_role = MemberRole::kSteward;
  size_t verify_threads = 0;  // 0 = hardware concurrency
  ApprovalConfig approval;
  std::string log_level = "info";
};

// Defaults overridden by FROSTCOORD_* environment variables. Malformed values
// are ignored and the default is kept.
CoordinatorConfig LoadConfigFromEnvironment();

size_t ResolveVerifyWorkerCount(const CoordinatorConfig& config);

}  // namespace frostcoord
