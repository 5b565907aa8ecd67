#include "frostcoord/common/config.hpp"

#include <algorithm>
#include <cstdlib>
#include <initializer_list>
#include <optional>
#include <thread>

namespace frostcoord {
namespace {

std::optional<unsigned long> ReadPositiveEnv(const char* name) {
  const char* env = std::getenv(name);
  if (env == nullptr || env[0] == '\0') {
    return std::nullopt;
  }

  char* end = nullptr;
  const unsigned long parsed = std::strtoul(env, &end, 10);
  if (end == env || end == nullptr || *end != '\0' || parsed == 0) {
    return std::nullopt;
  }
  return parsed;
}

}  // namespace

const char* MemberRoleName(MemberRole role) {
  switch (role) {
    case MemberRole::kOffspring:
      return "offspring";
    case MemberRole::kAdult:
      return "adult";
    case MemberRole::kSteward:
      return "steward";
    case MemberRole::kGuardian:
      return "guardian";
  }
  return "unknown";
}

bool ParseMemberRole(std::string_view name, MemberRole* out) {
  for (const MemberRole role : {MemberRole::kOffspring, MemberRole::kAdult, MemberRole::kSteward,
                                MemberRole::kGuardian}) {
    if (name == MemberRoleName(role)) {
      if (out != nullptr) {
        *out = role;
      }
      return true;
    }
  }
  return false;
}

CoordinatorConfig LoadConfigFromEnvironment() {
  CoordinatorConfig config;

  if (const auto ttl = ReadPositiveEnv("FROSTCOORD_SESSION_TTL_SECONDS")) {
    config.default_session_ttl = std::chrono::seconds(*ttl);
  }
  if (const auto days = ReadPositiveEnv("FROSTCOORD_RETENTION_DAYS")) {
    config.retention_window = std::chrono::hours(24 * *days);
  }
  if (const auto max_threshold = ReadPositiveEnv("FROSTCOORD_MAX_THRESHOLD")) {
    config.max_threshold = static_cast<uint32_t>(*max_threshold);
  }
  if (const auto threads = ReadPositiveEnv("FROSTCOORD_VERIFY_THREADS")) {
    config.verify_threads = static_cast<size_t>(*threads);
  }
  if (const auto window = ReadPositiveEnv("FROSTCOORD_APPROVAL_WINDOW_SECONDS")) {
    config.approval.timestamp_window = std::chrono::seconds(*window);
  }
  if (const auto failures = ReadPositiveEnv("FROSTCOORD_APPROVAL_MAX_FAILURES")) {
    config.approval.max_failed_attempts = static_cast<uint32_t>(*failures);
  }
  if (const auto cooldown = ReadPositiveEnv("FROSTCOORD_APPROVAL_COOLDOWN_SECONDS")) {
    config.approval.lockout_cooldown = std::chrono::seconds(*cooldown);
  }

  const char* role = std::getenv("FROSTCOORD_MIN_INITIATOR_ROLE");
  if (role != nullptr) {
    (void)ParseMemberRole(role, &config.min_initiator_role);
  }

  const char* level = std::getenv("FROSTCOORD_LOG_LEVEL");
  if (level != nullptr && level[0] != '\0') {
    config.log_level = level;
  }
  return config;
}

size_t ResolveVerifyWorkerCount(const CoordinatorConfig& config) {
  if (config.verify_threads > 0) {
    return config.verify_threads;
  }
  const unsigned int hw = std::thread::hardware_concurrency();
  return std::max<size_t>(1, hw == 0 ? 1 : hw);
}

}  // namespace frostcoord
