#include "frostcoord/net/envelope.hpp"

#include <stdexcept>

#include "frostcoord/common/byte_io.hpp"
#include "frostcoord/protocol/session_state.hpp"

namespace frostcoord {
namespace {

constexpr uint32_t kEnvelopeVersion = 1;
constexpr size_t kMaxReplyIdLen = 128;
constexpr size_t kMaxReplyMessageLen = 4096;

}  // namespace

const char* EnvelopeTypeName(uint32_t type) {
  switch (static_cast<EnvelopeType>(type)) {
    case EnvelopeType::kNonceCommitment:
      return "nonce_commitment";
    case EnvelopeType::kPartialSignature:
      return "partial_signature";
    case EnvelopeType::kStatusQuery:
      return "status_query";
  }
  return "unknown";
}

Bytes EncodeEnvelope(const Envelope& envelope) {
  ByteWriter out;
  out.PutU32(kEnvelopeVersion);
  out.PutString(envelope.session_id);
  out.PutString(envelope.sender);
  out.PutU32(envelope.type);
  out.PutField(envelope.payload);
  return out.Take();
}

Envelope DecodeEnvelope(std::span<const uint8_t> encoded,
                        size_t max_id_len,
                        size_t max_payload_len) {
  ByteReader in(encoded);
  if (in.GetU32() != kEnvelopeVersion) {
    throw std::invalid_argument("Unsupported envelope version");
  }

  Envelope out;
  out.session_id = in.GetString(max_id_len, "session_id");
  out.sender = in.GetString(max_id_len, "sender");
  out.type = in.GetU32();
  out.payload = in.GetField(max_payload_len, "payload");
  in.ExpectEnd("Envelope");
  return out;
}

Bytes EncodeEnvelopeReply(const EnvelopeReply& reply) {
  ByteWriter out;
  out.PutU32(kEnvelopeVersion);
  out.PutString(reply.session_id);
  out.PutU8(reply.ok ? 1 : 0);
  out.PutU32(reply.error.has_value() ? static_cast<uint32_t>(*reply.error) : 0);
  out.PutString(reply.message);
  out.PutU32(reply.state.has_value() ? static_cast<uint32_t>(*reply.state) : 0);
  out.PutU32(reply.participants_responded);
  return out.Take();
}

EnvelopeReply DecodeEnvelopeReply(std::span<const uint8_t> encoded) {
  ByteReader in(encoded);
  if (in.GetU32() != kEnvelopeVersion) {
    throw std::invalid_argument("Unsupported envelope reply version");
  }

  EnvelopeReply out;
  out.session_id = in.GetString(kMaxReplyIdLen, "session_id");
  out.ok = in.GetU8() != 0;
  const uint32_t error = in.GetU32();
  if (error != 0) {
    if (std::string_view(ErrorCodeName(static_cast<ErrorCode>(error))) == "Unknown") {
      throw std::invalid_argument("Envelope reply carries an unknown error code");
    }
    out.error = static_cast<ErrorCode>(error);
  }
  out.message = in.GetString(kMaxReplyMessageLen, "message");
  const uint32_t state = in.GetU32();
  if (state != 0) {
    if (std::string_view(SessionStateName(static_cast<SessionState>(state))) == "unknown") {
      throw std::invalid_argument("Envelope reply carries an unknown session state");
    }
    out.state = static_cast<SessionState>(state);
  }
  out.participants_responded = in.GetU32();
  in.ExpectEnd("EnvelopeReply");
  return out;
}

}  // namespace frostcoord
