#include "frostcoord/protocol/session_state.hpp"

#include <algorithm>

namespace frostcoord {

bool SigningSession::IsTerminal() const {
  return IsTerminalState(state);
}

bool SigningSession::HasParticipant(const ParticipantId& participant) const {
  return std::find(participants.begin(), participants.end(), participant) != participants.end();
}

bool SigningSession::IsActiveSigner(const ParticipantId& participant) const {
  return std::find(active_signers.begin(), active_signers.end(), participant) !=
         active_signers.end();
}

const char* SessionStateName(SessionState state) {
  switch (state) {
    case SessionState::kPending:
      return "pending";
    case SessionState::kNonceCollection:
      return "nonce_collection";
    case SessionState::kSigning:
      return "signing";
    case SessionState::kAggregating:
      return "aggregating";
    case SessionState::kCompleted:
      return "completed";
    case SessionState::kFailed:
      return "failed";
    case SessionState::kExpired:
      return "expired";
  }
  return "unknown";
}

bool ParseSessionState(std::string_view name, SessionState* out) {
  for (uint32_t raw = static_cast<uint32_t>(SessionState::kPending);
       raw <= static_cast<uint32_t>(SessionState::kExpired); ++raw) {
    const SessionState state = static_cast<SessionState>(raw);
    if (name == SessionStateName(state)) {
      if (out != nullptr) {
        *out = state;
      }
      return true;
    }
  }
  return false;
}

const char* SessionEventName(SessionEvent event) {
  switch (event) {
    case SessionEvent::kParticipantsNotified:
      return "participants_notified";
    case SessionEvent::kNonceThresholdReached:
      return "nonce_threshold_reached";
    case SessionEvent::kSignatureThresholdReached:
      return "signature_threshold_reached";
    case SessionEvent::kAggregateVerified:
      return "aggregate_verified";
    case SessionEvent::kAggregateRejected:
      return "aggregate_rejected";
    case SessionEvent::kDeadlineExceeded:
      return "deadline_exceeded";
    case SessionEvent::kUnrecoverableError:
      return "unrecoverable_error";
    case SessionEvent::kAdministrativeAbort:
      return "administrative_abort";
  }
  return "unknown";
}

bool IsTerminalState(SessionState state) {
  return state == SessionState::kCompleted ||
         state == SessionState::kFailed ||
         state == SessionState::kExpired;
}

int StateRank(SessionState state) {
  switch (state) {
    case SessionState::kPending:
      return 0;
    case SessionState::kNonceCollection:
      return 1;
    case SessionState::kSigning:
      return 2;
    case SessionState::kAggregating:
      return 3;
    case SessionState::kCompleted:
    case SessionState::kFailed:
    case SessionState::kExpired:
      return 4;
  }
  return 4;
}

bool TryTransition(SessionState from,
                   SessionEvent event,
                   SessionState* to,
                   std::string* error) {
  auto reject = [&]() {
    if (error != nullptr) {
      *error = std::string("illegal transition: ") + SessionEventName(event) +
               " in state " + SessionStateName(from);
    }
    return false;
  };

  if (IsTerminalState(from)) {
    return reject();
  }

  SessionState next = from;
  switch (event) {
    case SessionEvent::kParticipantsNotified:
      if (from != SessionState::kPending) {
        return reject();
      }
      next = SessionState::kNonceCollection;
      break;
    case SessionEvent::kNonceThresholdReached:
      if (from != SessionState::kNonceCollection) {
        return reject();
      }
      next = SessionState::kSigning;
      break;
    case SessionEvent::kSignatureThresholdReached:
      if (from != SessionState::kSigning) {
        return reject();
      }
      next = SessionState::kAggregating;
      break;
    case SessionEvent::kAggregateVerified:
      if (from != SessionState::kAggregating) {
        return reject();
      }
      next = SessionState::kCompleted;
      break;
    case SessionEvent::kAggregateRejected:
      if (from != SessionState::kAggregating) {
        return reject();
      }
      next = SessionState::kFailed;
      break;
    case SessionEvent::kDeadlineExceeded:
      next = SessionState::kExpired;
      break;
    case SessionEvent::kUnrecoverableError:
    case SessionEvent::kAdministrativeAbort:
      next = SessionState::kFailed;
      break;
    default:
      return reject();
  }

  if (to != nullptr) {
    *to = next;
  }
  return true;
}

}  // namespace frostcoord
