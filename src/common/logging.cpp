#include "frostcoord/common/logging.hpp"

#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace frostcoord {
namespace {

constexpr char kLoggerName[] = "frostcoord";

}  // namespace

std::shared_ptr<spdlog::logger> Logger() {
  static std::shared_ptr<spdlog::logger> logger = []() {
    std::shared_ptr<spdlog::logger> existing = spdlog::get(kLoggerName);
    if (existing) {
      return existing;
    }
    auto created = spdlog::stderr_color_mt(kLoggerName);
    created->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
    return created;
  }();
  return logger;
}

void SetLogLevel(std::string_view level) {
  spdlog::level::level_enum parsed = spdlog::level::from_str(std::string(level));
  if (parsed == spdlog::level::off && level != "off") {
    parsed = spdlog::level::info;
  }
  Logger()->set_level(parsed);
}

}  // namespace frostcoord
