#pragma once

#include <cstdint>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/crypto/scalar.hpp"

namespace frostcoord {

struct TranscriptFieldRef {
  std::string_view label;
  std::span<const uint8_t> data;
};

// Length-prefixed (label, data) sequence hashed with SHA-256.
class Transcript {
 public:
  explicit Transcript(std::string_view domain);

  void append(std::string_view label, std::span<const uint8_t> data);
  void append_ascii(std::string_view label, std::string_view ascii);
  void append_u64_be(std::string_view label, uint64_t value);
  void append_fields(std::initializer_list<TranscriptFieldRef> fields);

  Bytes digest() const;
  Scalar challenge_scalar_mod_q() const;

 private:
  Bytes transcript_;
};

}  // namespace frostcoord
