#include "frostcoord/protocol/submission_router.hpp"

#include <stdexcept>

#include "frostcoord/common/logging.hpp"

namespace frostcoord {
namespace {

constexpr size_t kMaxReplyMessageLen = 1024;

EnvelopeReply Reject(const SessionId& session_id, ErrorCode code, const std::string& message) {
  EnvelopeReply reply;
  reply.session_id = session_id;
  reply.ok = false;
  reply.error = code;
  reply.message = message.substr(0, kMaxReplyMessageLen);
  return reply;
}

EnvelopeReply Accept(const SessionStatus& status) {
  EnvelopeReply reply;
  reply.session_id = status.session_id;
  reply.ok = true;
  reply.state = status.state;
  reply.participants_responded = static_cast<uint32_t>(status.participants_responded);
  return reply;
}

}  // namespace

SubmissionRouter::SubmissionRouter(SessionCoordinator& coordinator) : coordinator_(coordinator) {}

EnvelopeReply SubmissionRouter::Route(const Envelope& envelope, TimePoint now) {
  EnvelopeReply reply;
  if (envelope.session_id.empty() || envelope.sender.empty()) {
    reply = Reject(envelope.session_id, ErrorCode::kMalformedInput,
                   "envelope needs a session id and a sender");
  } else {
    try {
      reply = Dispatch(envelope, now);
    } catch (const SigningError& ex) {
      reply = Reject(envelope.session_id, ex.code(), ex.reason());
    }
  }

  if (reply.ok) {
    ++routed_count_;
  } else {
    ++rejected_count_;
    Logger()->debug("rejected {} from {} for session {}: {}", EnvelopeTypeName(envelope.type),
                    envelope.sender, envelope.session_id, ErrorCodeName(*reply.error));
  }
  return reply;
}

Bytes SubmissionRouter::RouteEncoded(std::span<const uint8_t> encoded, TimePoint now) {
  Envelope envelope;
  try {
    envelope = DecodeEnvelope(encoded);
  } catch (const std::invalid_argument& ex) {
    ++rejected_count_;
    return EncodeEnvelopeReply(Reject({}, ErrorCode::kMalformedInput, ex.what()));
  }
  return EncodeEnvelopeReply(Route(envelope, now));
}

size_t SubmissionRouter::routed_count() const {
  return routed_count_.load();
}

size_t SubmissionRouter::rejected_count() const {
  return rejected_count_.load();
}

EnvelopeReply SubmissionRouter::Dispatch(const Envelope& envelope, TimePoint now) {
  switch (static_cast<EnvelopeType>(envelope.type)) {
    case EnvelopeType::kNonceCommitment:
      return Accept(coordinator_.SubmitNonceCommitment(envelope.session_id, envelope.sender,
                                                       envelope.payload, now));
    case EnvelopeType::kPartialSignature:
      return Accept(coordinator_.SubmitPartialSignature(envelope.session_id, envelope.sender,
                                                        envelope.payload, now));
    case EnvelopeType::kStatusQuery: {
      const SigningSession session = coordinator_.GetSession(envelope.session_id);
      if (!session.HasParticipant(envelope.sender)) {
        return Reject(envelope.session_id, ErrorCode::kUnknownParticipant,
                      envelope.sender + " is not a participant of this session");
      }
      return Accept(coordinator_.GetSessionStatus(envelope.session_id));
    }
  }
  return Reject(envelope.session_id, ErrorCode::kMalformedInput,
                "unknown envelope type " + std::to_string(envelope.type));
}

}  // namespace frostcoord
