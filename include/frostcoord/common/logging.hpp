#pragma once

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace frostcoord {

// Process-wide "frostcoord" logger writing to stderr.
std::shared_ptr<spdlog::logger> Logger();

// Accepts spdlog level names ("trace" .. "off"); unknown names map to info.
void SetLogLevel(std::string_view level);

}  // namespace frostcoord
