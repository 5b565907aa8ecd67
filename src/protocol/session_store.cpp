#include "frostcoord/protocol/session_store.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "frostcoord/common/logging.hpp"
#include "frostcoord/crypto/random.hpp"
#include "frostcoord/protocol/session_state.hpp"
#include "frostcoord/storage/record_codec.hpp"

namespace frostcoord {
namespace {

constexpr size_t kSessionIdBytes = 16;

bool IsFailureEvent(SessionEvent event) {
  return event == SessionEvent::kAggregateRejected ||
         event == SessionEvent::kUnrecoverableError ||
         event == SessionEvent::kAdministrativeAbort;
}

}  // namespace

SigningSessionStore::Handle::Handle(std::shared_ptr<Entry> entry)
    : entry_(std::move(entry)), lock_(entry_->mu) {}

const SigningSession& SigningSessionStore::Handle::session() const {
  return entry_->session;
}

SigningSessionStore::SigningSessionStore(std::shared_ptr<IRecordStore> records,
                                         CoordinatorConfig config)
    : records_(std::move(records)), config_(std::move(config)) {
  if (!records_) {
    throw std::invalid_argument("SigningSessionStore requires a record store");
  }
}

SigningSession SigningSessionStore::Create(const SessionRequest& request, TimePoint now) {
  ValidateRequest(request, now);

  SigningSession session;
  session.group_id = request.group_id;
  session.message_hash = request.message_hash;
  session.participants = request.participants;
  session.threshold = request.threshold;
  session.state = SessionState::kPending;
  session.destination = request.destination;
  session.operation_amount = request.operation_amount;
  session.created_by = request.created_by;
  session.created_at = now;
  session.updated_at = now;
  session.deadline = request.deadline.value_or(now + config_.default_session_ttl);

  const std::string message_key = MessageKey(request.group_id, request.message_hash);

  {
    std::lock_guard<std::mutex> lock(mu_);
    if (active_messages_.count(message_key) != 0) {
      throw SigningError(ErrorCode::kDuplicateMessage,
                         "an active session already signs message " +
                             OpaqueId(request.message_hash) + " for group " + request.group_id);
    }
    do {
      session.id = Csprng::RandomToken(kSessionIdBytes);
    } while (entries_.count(session.id) != 0 || creating_.count(session.id) != 0);
    // Reserve the message and id so the write below can run unlocked.
    active_messages_.emplace(message_key, session.id);
    creating_.insert(session.id);
  }

  try {
    Persist(session);
  } catch (...) {
    std::lock_guard<std::mutex> lock(mu_);
    active_messages_.erase(message_key);
    creating_.erase(session.id);
    throw;
  }

  auto entry = std::make_shared<Entry>();
  entry->session = session;
  {
    std::lock_guard<std::mutex> lock(mu_);
    creating_.erase(session.id);
    entries_.emplace(session.id, std::move(entry));
  }

  Logger()->info("session {} created: group={} n={} k={} message={}",
                 session.id, session.group_id, session.participants.size(),
                 session.threshold, OpaqueId(session.message_hash));
  return session;
}

SigningSessionStore::Handle SigningSessionStore::Acquire(const SessionId& session_id) {
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = entries_.find(session_id);
    if (it != entries_.end()) {
      entry = it->second;
    }
  }
  if (!entry) {
    throw SigningError(ErrorCode::kSessionNotFound, "unknown session " + session_id);
  }

  Handle handle(std::move(entry));
  if (handle.entry_->removed) {
    throw SigningError(ErrorCode::kSessionNotFound, "session " + session_id + " was removed");
  }
  return handle;
}

std::optional<SigningSession> SigningSessionStore::Get(const SessionId& session_id) {
  try {
    Handle handle = Acquire(session_id);
    return handle.session();
  } catch (const SigningError& ex) {
    if (ex.code() == ErrorCode::kSessionNotFound) {
      return std::nullopt;
    }
    throw;
  }
}

template <typename Fn>
void SigningSessionStore::Mutate(Handle& handle, TimePoint now, Fn&& fn) {
  SigningSession updated = handle.entry_->session;
  fn(updated);
  updated.updated_at = now;
  Persist(updated);
  handle.entry_->session = std::move(updated);
}

void SigningSessionStore::Advance(Handle& handle,
                                  SessionEvent event,
                                  const TransitionDetails& details,
                                  TimePoint now) {
  const SigningSession& current = handle.session();

  SessionState next = current.state;
  std::string error;
  if (!TryTransition(current.state, event, &next, &error)) {
    throw SigningError(ErrorCode::kInvalidStateTransition,
                       "session " + current.id + ": " + error);
  }
  if (event == SessionEvent::kAggregateVerified && !details.final_signature.has_value()) {
    throw std::invalid_argument("aggregate_verified requires the final signature");
  }
  if (IsFailureEvent(event) && event != SessionEvent::kAdministrativeAbort &&
      !details.failure_code.has_value()) {
    throw std::invalid_argument(std::string(SessionEventName(event)) + " requires a failure code");
  }
  if (event == SessionEvent::kNonceThresholdReached &&
      current.active_signers.size() != current.threshold) {
    throw SigningError(ErrorCode::kInvalidStateTransition,
                       "session " + current.id + " has not collected threshold commitments");
  }
  if (event == SessionEvent::kSignatureThresholdReached &&
      current.partial_signatures.size() != current.threshold) {
    throw SigningError(ErrorCode::kInvalidStateTransition,
                       "session " + current.id + " has not collected threshold signatures");
  }

  Mutate(handle, now, [&](SigningSession& session) {
    session.state = next;
    switch (next) {
      case SessionState::kNonceCollection:
        session.nonce_collection_started_at = now;
        break;
      case SessionState::kSigning:
        session.signing_started_at = now;
        break;
      case SessionState::kAggregating:
        session.aggregating_started_at = now;
        break;
      case SessionState::kCompleted:
        session.final_signature = details.final_signature;
        session.candidate_signature.reset();
        session.terminal_at = now;
        break;
      case SessionState::kFailed:
        session.failure_code = details.failure_code.value_or(ErrorCode::kSessionAborted);
        session.failure_reason =
            details.reason.empty() ? std::string(SessionEventName(event)) : details.reason;
        session.withheld_signature = details.withheld_signature;
        session.candidate_signature.reset();
        session.terminal_at = now;
        break;
      case SessionState::kExpired:
        session.failure_code = ErrorCode::kSessionExpired;
        session.failure_reason.reset();
        session.candidate_signature.reset();
        session.terminal_at = now;
        break;
      case SessionState::kPending:
        break;
    }
  });

  const SigningSession& updated = handle.session();
  if (updated.IsTerminal()) {
    std::lock_guard<std::mutex> lock(mu_);
    const auto it = active_messages_.find(MessageKey(updated.group_id, updated.message_hash));
    if (it != active_messages_.end() && it->second == updated.id) {
      active_messages_.erase(it);
    }
  }

  if (IsFailureEvent(event)) {
    Logger()->warn("session {} failed: {} ({})", updated.id,
                   ErrorCodeName(*updated.failure_code), *updated.failure_reason);
  } else {
    Logger()->debug("session {} {} -> {}", updated.id, SessionEventName(event),
                    SessionStateName(updated.state));
  }
}

void SigningSessionStore::PutCommitment(Handle& handle,
                                        const ParticipantId& participant,
                                        const ECPoint& commitment,
                                        TimePoint now) {
  Mutate(handle, now, [&](SigningSession& session) {
    session.nonce_commitments.insert_or_assign(participant, commitment);
    if (session.state == SessionState::kNonceCollection &&
        session.active_signers.size() < session.threshold) {
      session.active_signers.push_back(participant);
    }
  });
}

void SigningSessionStore::PutPartialSignature(Handle& handle,
                                              const ParticipantId& participant,
                                              const Scalar& partial_signature,
                                              TimePoint now) {
  Mutate(handle, now, [&](SigningSession& session) {
    session.partial_signatures.insert_or_assign(participant, partial_signature);
  });
}

void SigningSessionStore::PutCandidateSignature(Handle& handle,
                                                const SchnorrSignature& signature,
                                                TimePoint now) {
  Mutate(handle, now, [&](SigningSession& session) { session.candidate_signature = signature; });
}

void SigningSessionStore::PutPublicationId(Handle& handle,
                                           const std::string& publication_id,
                                           TimePoint now) {
  Mutate(handle, now, [&](SigningSession& session) { session.publication_id = publication_id; });
}

std::vector<SessionId> SigningSessionStore::ExpireOverdue(TimePoint now) {
  std::vector<SessionId> expired;
  for (const std::shared_ptr<Entry>& entry : SnapshotEntries()) {
    Handle handle(entry);
    if (entry->removed) {
      continue;
    }
    const SigningSession& session = handle.session();
    // Compare-and-swap on state: whoever holds the entry first wins.
    if (session.IsTerminal() || session.deadline >= now) {
      continue;
    }
    const SessionState previous = session.state;
    Advance(handle, SessionEvent::kDeadlineExceeded, {}, now);
    expired.push_back(session.id);
    Logger()->info("session {} expired during {}", session.id, SessionStateName(previous));
  }
  return expired;
}

std::vector<SessionId> SigningSessionStore::Cleanup(std::chrono::seconds retention,
                                                    TimePoint now) {
  std::vector<SessionId> removed;
  for (const std::shared_ptr<Entry>& entry : SnapshotEntries()) {
    Handle handle(entry);
    const SigningSession& session = handle.session();
    if (entry->removed || !session.IsTerminal()) {
      continue;
    }
    const TimePoint terminal_at = session.terminal_at.value_or(session.updated_at);
    if (now - terminal_at <= retention) {
      continue;
    }

    records_->Erase(kSessionsTable, session.id);
    entry->removed = true;
    {
      std::lock_guard<std::mutex> lock(mu_);
      entries_.erase(session.id);
    }
    removed.push_back(session.id);
  }
  if (!removed.empty()) {
    Logger()->info("cleanup removed {} terminal sessions", removed.size());
  }
  return removed;
}

std::vector<SigningSession> SigningSessionStore::ListActive(const GroupId& group_id) {
  std::vector<SigningSession> out;
  for (const std::shared_ptr<Entry>& entry : SnapshotEntries()) {
    Handle handle(entry);
    const SigningSession& session = handle.session();
    if (!entry->removed && !session.IsTerminal() && session.group_id == group_id) {
      out.push_back(session);
    }
  }
  std::sort(out.begin(), out.end(), [](const SigningSession& lhs, const SigningSession& rhs) {
    return lhs.created_at > rhs.created_at;
  });
  return out;
}

std::vector<SigningSession> SigningSessionStore::ListPendingFor(const ParticipantId& participant) {
  std::vector<SigningSession> out;
  for (const std::shared_ptr<Entry>& entry : SnapshotEntries()) {
    Handle handle(entry);
    const SigningSession& session = handle.session();
    if (entry->removed) {
      continue;
    }
    if (session.state != SessionState::kPending &&
        session.state != SessionState::kNonceCollection) {
      continue;
    }
    if (session.HasParticipant(participant) &&
        session.nonce_commitments.count(participant) == 0) {
      out.push_back(session);
    }
  }
  std::sort(out.begin(), out.end(), [](const SigningSession& lhs, const SigningSession& rhs) {
    return lhs.deadline < rhs.deadline;
  });
  return out;
}

size_t SigningSessionStore::Recover() {
  const std::vector<StoredRow> rows = records_->LoadAll(kSessionsTable);

  std::unordered_map<SessionId, std::shared_ptr<Entry>> entries;
  std::unordered_map<std::string, SessionId> active_messages;
  size_t skipped = 0;
  for (const StoredRow& row : rows) {
    SigningSession session;
    try {
      session = DecodeSessionRecord(row.second);
    } catch (const std::invalid_argument& ex) {
      ++skipped;
      Logger()->error("skipping unreadable session row {}: {}", row.first, ex.what());
      continue;
    }
    if (session.id != row.first) {
      ++skipped;
      Logger()->error("skipping session row {} with mismatched id", row.first);
      continue;
    }
    if (!session.IsTerminal()) {
      active_messages.emplace(MessageKey(session.group_id, session.message_hash), session.id);
    }
    auto entry = std::make_shared<Entry>();
    entry->session = std::move(session);
    entries.emplace(row.first, std::move(entry));
  }

  const size_t loaded = entries.size();
  {
    std::lock_guard<std::mutex> lock(mu_);
    entries_ = std::move(entries);
    active_messages_ = std::move(active_messages);
  }
  Logger()->info("recovered {} sessions ({} skipped)", loaded, skipped);
  return loaded;
}

size_t SigningSessionStore::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

const CoordinatorConfig& SigningSessionStore::config() const {
  return config_;
}

void SigningSessionStore::ValidateRequest(const SessionRequest& request, TimePoint now) const {
  if (request.group_id.empty()) {
    throw SigningError(ErrorCode::kMalformedInput, "group id must not be empty");
  }
  if (request.message_hash.size() != kMessageHashLen) {
    throw SigningError(ErrorCode::kMalformedInput, "message hash must be 32 bytes");
  }
  if (request.participants.empty()) {
    throw SigningError(ErrorCode::kInvalidParticipants, "participant list is empty");
  }

  std::unordered_set<ParticipantId> seen;
  for (const ParticipantId& participant : request.participants) {
    if (participant.empty()) {
      throw SigningError(ErrorCode::kInvalidParticipants, "participant id must not be empty");
    }
    if (!seen.insert(participant).second) {
      throw SigningError(ErrorCode::kInvalidParticipants,
                         "duplicate participant " + participant);
    }
  }

  if (request.threshold < 1 || request.threshold > request.participants.size()) {
    throw SigningError(ErrorCode::kInvalidThreshold,
                       "threshold " + std::to_string(request.threshold) + " outside [1, " +
                           std::to_string(request.participants.size()) + "]");
  }
  if (request.threshold > config_.max_threshold) {
    throw SigningError(ErrorCode::kInvalidThreshold,
                       "threshold " + std::to_string(request.threshold) +
                           " exceeds configured maximum " +
                           std::to_string(config_.max_threshold));
  }
  if (request.deadline.has_value() && *request.deadline <= now) {
    throw SigningError(ErrorCode::kMalformedInput, "deadline must be in the future");
  }
}

void SigningSessionStore::Persist(const SigningSession& session) {
  records_->Put(kSessionsTable, session.id, EncodeSessionRecord(session));
}

std::vector<std::shared_ptr<SigningSessionStore::Entry>> SigningSessionStore::SnapshotEntries()
    const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<std::shared_ptr<Entry>> out;
  out.reserve(entries_.size());
  for (const auto& [id, entry] : entries_) {
    out.push_back(entry);
  }
  return out;
}

std::string SigningSessionStore::MessageKey(const GroupId& group_id, const Bytes& message_hash) {
  return group_id + '\x00' + ToHex(message_hash);
}

}  // namespace frostcoord
