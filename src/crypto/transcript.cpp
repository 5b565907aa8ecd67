#include "frostcoord/crypto/transcript.hpp"

#include <array>
#include <stdexcept>

#include "frostcoord/crypto/hash.hpp"

namespace frostcoord {
namespace {

void AppendU32Be(uint32_t value, Bytes* out) {
  out->push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
  out->push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
  out->push_back(static_cast<uint8_t>(value & 0xFF));
}

}  // namespace

Transcript::Transcript(std::string_view domain) {
  append_ascii("domain", domain);
}

void Transcript::append(std::string_view label, std::span<const uint8_t> data) {
  if (label.size() > UINT32_MAX || data.size() > UINT32_MAX) {
    throw std::invalid_argument("Transcript field exceeds uint32 length");
  }

  AppendU32Be(static_cast<uint32_t>(label.size()), &transcript_);
  transcript_.insert(transcript_.end(), label.begin(), label.end());

  AppendU32Be(static_cast<uint32_t>(data.size()), &transcript_);
  transcript_.insert(transcript_.end(), data.begin(), data.end());
}

void Transcript::append_ascii(std::string_view label, std::string_view ascii) {
  append(label, AsByteSpan(ascii));
}

void Transcript::append_u64_be(std::string_view label, uint64_t value) {
  std::array<uint8_t, 8> encoded{};
  for (size_t i = 0; i < encoded.size(); ++i) {
    encoded[i] = static_cast<uint8_t>((value >> (56 - 8 * i)) & 0xFF);
  }
  append(label, encoded);
}

void Transcript::append_fields(std::initializer_list<TranscriptFieldRef> fields) {
  for (const TranscriptFieldRef& field : fields) {
    append(field.label, field.data);
  }
}

Bytes Transcript::digest() const {
  return Sha256(transcript_);
}

Scalar Transcript::challenge_scalar_mod_q() const {
  return Scalar::FromBigEndianModQ(digest());
}

}  // namespace frostcoord
