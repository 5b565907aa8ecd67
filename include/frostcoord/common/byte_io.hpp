#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include "frostcoord/common/bytes.hpp"

namespace frostcoord {

// Big-endian, length-prefixed field writer shared by the envelope and record
// codecs.
class ByteWriter {
 public:
  void PutU8(uint8_t value);
  void PutU32(uint32_t value);
  void PutU64(uint64_t value);
  void PutField(std::span<const uint8_t> field);
  void PutString(std::string_view value);

  const Bytes& bytes() const;
  Bytes Take();

 private:
  Bytes out_;
};

class ByteReader {
 public:
  explicit ByteReader(std::span<const uint8_t> input);

  uint8_t GetU8();
  uint32_t GetU32();
  uint64_t GetU64();
  Bytes GetField(size_t max_len, const char* field_name);
  std::string GetString(size_t max_len, const char* field_name);

  bool AtEnd() const;
  void ExpectEnd(const char* what) const;

 private:
  void Require(size_t count, const char* what) const;

  std::span<const uint8_t> input_;
  size_t offset_ = 0;
};

}  // namespace frostcoord
