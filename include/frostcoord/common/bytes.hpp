#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace frostcoord {

using Bytes = std::vector<uint8_t>;

std::string ToHex(std::span<const uint8_t> data);
Bytes FromHex(std::string_view hex);

inline std::span<const uint8_t> AsByteSpan(std::string_view value) {
  return std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(value.data()), value.size());
}

}  // namespace frostcoord
