#include "frostcoord/common/byte_io.hpp"

#include <stdexcept>

namespace frostcoord {

void ByteWriter::PutU8(uint8_t value) {
  out_.push_back(value);
}

void ByteWriter::PutU32(uint32_t value) {
  out_.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out_.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out_.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out_.push_back(static_cast<uint8_t>(value & 0xFF));
}

void ByteWriter::PutU64(uint64_t value) {
  PutU32(static_cast<uint32_t>(value >> 32));
  PutU32(static_cast<uint32_t>(value & 0xFFFFFFFFu));
}

void ByteWriter::PutField(std::span<const uint8_t> field) {
  if (field.size() > UINT32_MAX) {
    throw std::invalid_argument("field exceeds uint32 length");
  }
  PutU32(static_cast<uint32_t>(field.size()));
  out_.insert(out_.end(), field.begin(), field.end());
}

void ByteWriter::PutString(std::string_view value) {
  PutField(AsByteSpan(value));
}

const Bytes& ByteWriter::bytes() const {
  return out_;
}

Bytes ByteWriter::Take() {
  Bytes out = std::move(out_);
  out_.clear();
  return out;
}

ByteReader::ByteReader(std::span<const uint8_t> input) : input_(input) {}

uint8_t ByteReader::GetU8() {
  Require(1, "u8");
  return input_[offset_++];
}

uint32_t ByteReader::GetU32() {
  Require(4, "u32");
  const size_t i = offset_;
  offset_ += 4;
  return (static_cast<uint32_t>(input_[i]) << 24) |
         (static_cast<uint32_t>(input_[i + 1]) << 16) |
         (static_cast<uint32_t>(input_[i + 2]) << 8) |
         static_cast<uint32_t>(input_[i + 3]);
}

uint64_t ByteReader::GetU64() {
  const uint64_t high = GetU32();
  const uint64_t low = GetU32();
  return (high << 32) | low;
}

Bytes ByteReader::GetField(size_t max_len, const char* field_name) {
  const uint32_t len = GetU32();
  if (len > max_len) {
    throw std::invalid_argument(std::string(field_name) + " exceeds max length");
  }
  if (offset_ + len > input_.size()) {
    throw std::invalid_argument(std::string(field_name) + " has inconsistent length");
  }

  Bytes out(input_.begin() + static_cast<std::ptrdiff_t>(offset_),
            input_.begin() + static_cast<std::ptrdiff_t>(offset_ + len));
  offset_ += len;
  return out;
}

std::string ByteReader::GetString(size_t max_len, const char* field_name) {
  const Bytes raw = GetField(max_len, field_name);
  return std::string(raw.begin(), raw.end());
}

bool ByteReader::AtEnd() const {
  return offset_ == input_.size();
}

void ByteReader::ExpectEnd(const char* what) const {
  if (!AtEnd()) {
    throw std::invalid_argument(std::string(what) + " has trailing bytes");
  }
}

void ByteReader::Require(size_t count, const char* what) const {
  if (offset_ + count > input_.size()) {
    throw std::invalid_argument(std::string("Not enough bytes to read ") + what);
  }
}

}  // namespace frostcoord
