#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "frostcoord/common/config.hpp"
#include "frostcoord/protocol/types.hpp"
#include "frostcoord/storage/record_store.hpp"

namespace frostcoord {

struct TransitionDetails {
  std::optional<ErrorCode> failure_code;
  std::string reason;
  std::optional<SchnorrSignature> final_signature;
  std::optional<SchnorrSignature> withheld_signature;
};

// Owns every SigningSession and is the only writer of its state. Sessions live
// in an id-indexed arena of independently locked entries; a Handle is the
// per-session critical section. Every mutation is persisted before it becomes
// visible.
class SigningSessionStore {
 private:
  struct Entry {
    std::mutex mu;
    SigningSession session;
    bool removed = false;
  };

 public:
  class Handle {
   public:
    Handle(Handle&&) noexcept = default;
    Handle& operator=(Handle&&) noexcept = default;
    Handle(const Handle&) = delete;
    Handle& operator=(const Handle&) = delete;

    const SigningSession& session() const;

   private:
    friend class SigningSessionStore;
    explicit Handle(std::shared_ptr<Entry> entry);

    std::shared_ptr<Entry> entry_;
    std::unique_lock<std::mutex> lock_;
  };

  SigningSessionStore(std::shared_ptr<IRecordStore> records, CoordinatorConfig config);

  SigningSession Create(const SessionRequest& request, TimePoint now = Clock::now());

  // Throws SigningError(kSessionNotFound).
  Handle Acquire(const SessionId& session_id);
  std::optional<SigningSession> Get(const SessionId& session_id);

  // Applies `event` if legal from the current state, otherwise throws
  // SigningError(kInvalidStateTransition).
  void Advance(Handle& handle,
               SessionEvent event,
               const TransitionDetails& details = {},
               TimePoint now = Clock::now());

  // Appends a commitment; the first `threshold` committers become the active
  // signer subset.
  void PutCommitment(Handle& handle,
                     const ParticipantId& participant,
                     const ECPoint& commitment,
                     TimePoint now = Clock::now());
  void PutPartialSignature(Handle& handle,
                           const ParticipantId& participant,
                           const Scalar& partial_signature,
                           TimePoint now = Clock::now());
  void PutCandidateSignature(Handle& handle,
                             const SchnorrSignature& signature,
                             TimePoint now = Clock::now());
  void PutPublicationId(Handle& handle,
                        const std::string& publication_id,
                        TimePoint now = Clock::now());

  // Moves every overdue non-terminal session to expired. Returns the ids that
  // this call expired; a repeated call returns an empty list.
  std::vector<SessionId> ExpireOverdue(TimePoint now = Clock::now());

  // Removes terminal sessions whose terminal time is older than `retention`.
  // Returns the removed ids.
  std::vector<SessionId> Cleanup(std::chrono::seconds retention, TimePoint now = Clock::now());

  std::vector<SigningSession> ListActive(const GroupId& group_id);
  std::vector<SigningSession> ListPendingFor(const ParticipantId& participant);

  // Rebuilds the arena from the record store. Returns the number of sessions
  // loaded.
  size_t Recover();

  size_t size() const;
  const CoordinatorConfig& config() const;

 private:
  template <typename Fn>
  void Mutate(Handle& handle, TimePoint now, Fn&& fn);

  void ValidateRequest(const SessionRequest& request, TimePoint now) const;
  void Persist(const SigningSession& session);
  std::vector<std::shared_ptr<Entry>> SnapshotEntries() const;
  static std::string MessageKey(const GroupId& group_id, const Bytes& message_hash);

  std::shared_ptr<IRecordStore> records_;
  CoordinatorConfig config_;

  mutable std::mutex mu_;
  std::unordered_map<SessionId, std::shared_ptr<Entry>> entries_;
  std::unordered_map<std::string, SessionId> active_messages_;
  // Ids whose initial record is still being written.
  std::unordered_set<SessionId> creating_;
};

}  // namespace frostcoord
