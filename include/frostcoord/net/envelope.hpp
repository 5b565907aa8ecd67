#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/common/errors.hpp"
#include "frostcoord/protocol/types.hpp"

namespace frostcoord {

enum class EnvelopeType : uint32_t {
  kNonceCommitment = 1,
  kPartialSignature = 2,
  kStatusQuery = 3,
};

// Participant-to-coordinator message on the store-and-forward channel.
struct Envelope {
  SessionId session_id;
  ParticipantId sender;
  uint32_t type = 0;
  Bytes payload;
};

struct EnvelopeReply {
  SessionId session_id;
  bool ok = false;
  std::optional<ErrorCode> error;
  std::string message;
  std::optional<SessionState> state;
  uint32_t participants_responded = 0;
};

const char* EnvelopeTypeName(uint32_t type);

Bytes EncodeEnvelope(const Envelope& envelope);
Envelope DecodeEnvelope(std::span<const uint8_t> encoded,
                        size_t max_id_len = 128,
                        size_t max_payload_len = 1 << 12);

Bytes EncodeEnvelopeReply(const EnvelopeReply& reply);
EnvelopeReply DecodeEnvelopeReply(std::span<const uint8_t> encoded);

}  // namespace frostcoord
