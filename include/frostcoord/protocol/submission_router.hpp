#pragma once

#include <atomic>
#include <cstddef>
#include <span>

#include "frostcoord/net/envelope.hpp"
#include "frostcoord/protocol/session_coordinator.hpp"

namespace frostcoord {

// Dispatches decoded participant envelopes to the coordinator. Every envelope
// gets a reply; rejected ones carry the error code instead of throwing.
class SubmissionRouter {
 public:
  explicit SubmissionRouter(SessionCoordinator& coordinator);

  EnvelopeReply Route(const Envelope& envelope, TimePoint now = Clock::now());
  Bytes RouteEncoded(std::span<const uint8_t> encoded, TimePoint now = Clock::now());

  size_t routed_count() const;
  size_t rejected_count() const;

 private:
  EnvelopeReply Dispatch(const Envelope& envelope, TimePoint now);

  SessionCoordinator& coordinator_;
  std::atomic<size_t> routed_count_{0};
  std::atomic<size_t> rejected_count_{0};
};

}  // namespace frostcoord
