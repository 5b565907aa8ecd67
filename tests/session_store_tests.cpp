#include <chrono>
#include <condition_variable>
#include <iostream>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "frostcoord/protocol/session_state.hpp"
#include "frostcoord/protocol/session_store.hpp"
#include "frostcoord/storage/in_memory_record_store.hpp"
#include "frostcoord/storage/record_codec.hpp"
#include "test_support.hpp"

namespace {

using frostcoord::CoordinatorConfig;
using frostcoord::ECPoint;
using frostcoord::ErrorCode;
using frostcoord::InMemoryRecordStore;
using frostcoord::Scalar;
using frostcoord::SessionEvent;
using frostcoord::SessionRequest;
using frostcoord::SessionState;
using frostcoord::SigningSession;
using frostcoord::SigningSessionStore;
using frostcoord::TimePoint;
using frostcoord::TransitionDetails;
using frostcoord_test::Expect;
using frostcoord_test::ExpectCode;
using frostcoord_test::ExpectThrow;
using frostcoord_test::MessageHash;

const std::vector<SessionState> kAllStates = {
    SessionState::kPending,   SessionState::kNonceCollection, SessionState::kSigning,
    SessionState::kAggregating, SessionState::kCompleted,     SessionState::kFailed,
    SessionState::kExpired};

const std::vector<SessionEvent> kAllEvents = {
    SessionEvent::kParticipantsNotified,    SessionEvent::kNonceThresholdReached,
    SessionEvent::kSignatureThresholdReached, SessionEvent::kAggregateVerified,
    SessionEvent::kAggregateRejected,       SessionEvent::kDeadlineExceeded,
    SessionEvent::kUnrecoverableError,      SessionEvent::kAdministrativeAbort};

SessionRequest MakeRequest(const std::string& message, uint32_t threshold = 2) {
  SessionRequest request;
  request.group_id = "federation-1";
  request.message_hash = MessageHash(message);
  request.participants = {"alice", "bob", "carol"};
  request.threshold = threshold;
  request.destination = "relay://federation-1";
  return request;
}

// Record store whose writes can be held open, like a slow disk.
class SlowRecordStore : public frostcoord::IRecordStore {
 public:
  void Put(std::string_view table, const std::string& key,
           const frostcoord::Bytes& value) override {
    {
      std::unique_lock<std::mutex> lock(mu_);
      ++writes_;
      cv_.notify_all();
      cv_.wait_for(lock, std::chrono::seconds(3), [this]() { return !held_; });
    }
    inner_.Put(table, key, value);
  }
  void Erase(std::string_view table, const std::string& key) override {
    inner_.Erase(table, key);
  }
  std::vector<frostcoord::StoredRow> LoadAll(std::string_view table) override {
    return inner_.LoadAll(table);
  }

  void Hold() {
    std::lock_guard<std::mutex> lock(mu_);
    held_ = true;
  }
  void Release() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      held_ = false;
    }
    cv_.notify_all();
  }
  bool WaitForWrites(size_t count) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, std::chrono::seconds(2), [&]() { return writes_ >= count; });
  }
  size_t RowCount(std::string_view table) { return inner_.RowCount(table); }

 private:
  InMemoryRecordStore inner_;
  std::mutex mu_;
  std::condition_variable cv_;
  bool held_ = false;
  size_t writes_ = 0;
};

ECPoint RandomPoint() {
  return ECPoint::GeneratorMultiply(frostcoord::Csprng::RandomScalar());
}

void TestTransitionFunctionIsTotalAndMonotone() {
  for (SessionState from : kAllStates) {
    for (SessionEvent event : kAllEvents) {
      SessionState to = from;
      std::string error;
      const bool ok = frostcoord::TryTransition(from, event, &to, &error);
      if (frostcoord::IsTerminalState(from)) {
        Expect(!ok && !error.empty(), "terminal states reject every event");
        continue;
      }
      if (ok) {
        Expect(frostcoord::StateRank(to) > frostcoord::StateRank(from),
               "every legal transition moves forward");
      } else {
        Expect(error.find("illegal transition") != std::string::npos,
               "illegal pairs report a typed error");
      }
    }
    if (!frostcoord::IsTerminalState(from)) {
      SessionState to = from;
      Expect(frostcoord::TryTransition(from, SessionEvent::kDeadlineExceeded, &to, nullptr) &&
                 to == SessionState::kExpired,
             "deadline expires any live state");
      Expect(frostcoord::TryTransition(from, SessionEvent::kAdministrativeAbort, &to, nullptr) &&
                 to == SessionState::kFailed,
             "abort fails any live state");
    }
  }

  SessionState to = SessionState::kPending;
  Expect(!frostcoord::TryTransition(SessionState::kPending, SessionEvent::kAggregateVerified, &to,
                                    nullptr),
         "pending cannot jump to completed");
  Expect(to == SessionState::kPending, "rejected transitions leave the output untouched");

  SessionState parsed = SessionState::kPending;
  Expect(frostcoord::ParseSessionState("nonce_collection", &parsed) &&
             parsed == SessionState::kNonceCollection,
         "state names parse back");
}

void TestCreateValidation() {
  auto records = std::make_shared<InMemoryRecordStore>();
  SigningSessionStore store(records, frostcoord_test::TestConfig());
  const TimePoint now = frostcoord::Clock::now();

  ExpectCode([&]() { (void)store.Create(MakeRequest("m", 0), now); },
             ErrorCode::kInvalidThreshold, "threshold 0");
  ExpectCode([&]() { (void)store.Create(MakeRequest("m", 4), now); },
             ErrorCode::kInvalidThreshold, "threshold above n");

  SessionRequest empty = MakeRequest("m");
  empty.participants.clear();
  ExpectCode([&]() { (void)store.Create(empty, now); }, ErrorCode::kInvalidParticipants,
             "empty participant list");

  SessionRequest duplicate = MakeRequest("m");
  duplicate.participants = {"alice", "alice", "bob"};
  ExpectCode([&]() { (void)store.Create(duplicate, now); }, ErrorCode::kInvalidParticipants,
             "duplicate participants");

  SessionRequest short_hash = MakeRequest("m");
  short_hash.message_hash.resize(31);
  ExpectCode([&]() { (void)store.Create(short_hash, now); }, ErrorCode::kMalformedInput,
             "message hash length");

  SessionRequest past = MakeRequest("m");
  past.deadline = now - std::chrono::seconds(1);
  ExpectCode([&]() { (void)store.Create(past, now); }, ErrorCode::kMalformedInput,
             "deadline in the past");

  CoordinatorConfig capped = frostcoord_test::TestConfig();
  capped.max_threshold = 1;
  SigningSessionStore capped_store(records, capped);
  ExpectCode([&]() { (void)capped_store.Create(MakeRequest("m", 2), now); },
             ErrorCode::kInvalidThreshold, "configured threshold cap");

  const SigningSession session = store.Create(MakeRequest("m"), now);
  Expect(session.state == SessionState::kPending, "new sessions are pending");
  Expect(session.id.size() == 32, "session ids are 32 hex chars");
  Expect(session.deadline == now + store.config().default_session_ttl, "default TTL applied");
  Expect(!session.final_signature.has_value() && !session.failure_reason.has_value(),
         "no terminal data on a new session");
  Expect(records->RowCount(frostcoord::kSessionsTable) == 1, "session persisted on create");
}

void TestDuplicateMessageOnlyWhileActive() {
  SigningSessionStore store(std::make_shared<InMemoryRecordStore>(),
                            frostcoord_test::TestConfig());
  const TimePoint now = frostcoord::Clock::now();

  const SigningSession first = store.Create(MakeRequest("pay invoice"), now);
  ExpectCode([&]() { (void)store.Create(MakeRequest("pay invoice"), now); },
             ErrorCode::kDuplicateMessage, "same message while first is active");

  SessionRequest other_group = MakeRequest("pay invoice");
  other_group.group_id = "federation-2";
  (void)store.Create(other_group, now);

  {
    SigningSessionStore::Handle handle = store.Acquire(first.id);
    TransitionDetails details;
    details.reason = "operator cancelled";
    store.Advance(handle, SessionEvent::kAdministrativeAbort, details, now);
  }
  const SigningSession retry = store.Create(MakeRequest("pay invoice"), now);
  Expect(retry.id != first.id, "a terminal session frees its message for a fresh session");
}

void TestAdvanceRecordsPhaseData() {
  SigningSessionStore store(std::make_shared<InMemoryRecordStore>(),
                            frostcoord_test::TestConfig());
  const TimePoint now = frostcoord::Clock::now();
  const SigningSession created = store.Create(MakeRequest("advance"), now);

  SigningSessionStore::Handle handle = store.Acquire(created.id);
  ExpectCode([&]() { store.Advance(handle, SessionEvent::kSignatureThresholdReached, {}, now); },
             ErrorCode::kInvalidStateTransition, "cannot skip round 1");

  store.Advance(handle, SessionEvent::kParticipantsNotified, {}, now);
  Expect(handle.session().nonce_collection_started_at.has_value(), "phase time recorded");

  ExpectCode([&]() { store.Advance(handle, SessionEvent::kNonceThresholdReached, {}, now); },
             ErrorCode::kInvalidStateTransition, "signing needs k commitments");

  store.PutCommitment(handle, "carol", RandomPoint(), now);
  store.PutCommitment(handle, "alice", RandomPoint(), now);
  store.PutCommitment(handle, "bob", RandomPoint(), now);
  Expect(handle.session().active_signers == std::vector<std::string>({"carol", "alice"}),
         "first k committers become the active signers in arrival order");
  Expect(handle.session().nonce_commitments.size() == 3, "every commitment is kept");

  store.Advance(handle, SessionEvent::kNonceThresholdReached, {}, now);
  Expect(handle.session().state == SessionState::kSigning, "signing entered");

  ExpectThrow([&]() {
    TransitionDetails missing_code;
    store.Advance(handle, SessionEvent::kUnrecoverableError, missing_code, now);
  }, "failures need a code");

  TransitionDetails failure;
  failure.failure_code = ErrorCode::kNonceReuseDetected;
  failure.reason = "reused commitment";
  store.Advance(handle, SessionEvent::kUnrecoverableError, failure, now);
  Expect(handle.session().state == SessionState::kFailed, "failed");
  Expect(handle.session().failure_code == ErrorCode::kNonceReuseDetected, "failure code kept");
  Expect(handle.session().failure_reason == std::string("reused commitment"), "reason kept");
  Expect(handle.session().terminal_at.has_value(), "terminal time recorded");

  ExpectCode([&]() { store.Advance(handle, SessionEvent::kDeadlineExceeded, {}, now); },
             ErrorCode::kInvalidStateTransition, "terminal states never change");
}

void TestFailedWriteLeavesSessionUnchanged() {
  auto records = std::make_shared<InMemoryRecordStore>();
  SigningSessionStore store(records, frostcoord_test::TestConfig());
  const TimePoint now = frostcoord::Clock::now();
  const SigningSession created = store.Create(MakeRequest("outage"), now);

  records->SetAvailable(false);
  {
    SigningSessionStore::Handle handle = store.Acquire(created.id);
    ExpectCode([&]() { store.Advance(handle, SessionEvent::kParticipantsNotified, {}, now); },
               ErrorCode::kStorageUnavailable, "outage surfaces as StorageUnavailable");
    Expect(handle.session().state == SessionState::kPending,
           "unpersisted transition is not visible");
  }
  records->SetAvailable(true);

  SigningSessionStore::Handle handle = store.Acquire(created.id);
  store.Advance(handle, SessionEvent::kParticipantsNotified, {}, now);
  Expect(handle.session().state == SessionState::kNonceCollection, "retry after outage succeeds");
}

void TestFailedCreateReleasesMessage() {
  auto records = std::make_shared<InMemoryRecordStore>();
  SigningSessionStore store(records, frostcoord_test::TestConfig());
  const TimePoint now = frostcoord::Clock::now();

  records->SetAvailable(false);
  ExpectCode([&]() { (void)store.Create(MakeRequest("unwritten"), now); },
             ErrorCode::kStorageUnavailable, "create surfaces the outage");
  Expect(store.size() == 0, "unpersisted session is not registered");
  records->SetAvailable(true);

  const SigningSession created = store.Create(MakeRequest("unwritten"), now);
  Expect(store.Get(created.id).has_value(), "message is free again after the outage");
  Expect(records->RowCount(frostcoord::kSessionsTable) == 1, "one row written");
}

void TestSlowCreateDoesNotBlockReaders() {
  auto records = std::make_shared<SlowRecordStore>();
  SigningSessionStore store(records, frostcoord_test::TestConfig());
  const TimePoint now = frostcoord::Clock::now();
  const SigningSession existing = store.Create(MakeRequest("existing"), now);

  records->Hold();
  std::thread creator([&]() {
    try {
      (void)store.Create(MakeRequest("slow write"), now);
    } catch (const std::exception& ex) {
      std::cerr << "create failed: " << ex.what() << '\n';
    }
  });
  Expect(records->WaitForWrites(2), "second create reached storage");

  const auto started = std::chrono::steady_clock::now();
  Expect(store.Get(existing.id).has_value(), "reads proceed during the write");
  Expect(store.ListActive("federation-1").size() == 1, "in-flight session not listed yet");
  ExpectCode([&]() { (void)store.Create(MakeRequest("slow write"), now); },
             ErrorCode::kDuplicateMessage, "message reserved while its write is in flight");
  const auto elapsed = std::chrono::steady_clock::now() - started;
  records->Release();
  creator.join();

  Expect(elapsed < std::chrono::milliseconds(1000), "store lock not held across the write");
  Expect(store.ListActive("federation-1").size() == 2, "slow session registered once written");
  Expect(records->RowCount(frostcoord::kSessionsTable) == 2, "both sessions persisted");
}

void TestExpireOverdueIsIdempotent() {
  auto records = std::make_shared<InMemoryRecordStore>();
  SigningSessionStore store(records, frostcoord_test::TestConfig());
  const TimePoint now = frostcoord::Clock::now();

  SessionRequest short_lived = MakeRequest("short");
  short_lived.deadline = now + std::chrono::seconds(30);
  const SigningSession overdue = store.Create(short_lived, now);
  const SigningSession fresh = store.Create(MakeRequest("fresh"), now);

  const TimePoint later = now + std::chrono::minutes(1);
  const std::vector<std::string> first = store.ExpireOverdue(later);
  Expect(first.size() == 1 && first.front() == overdue.id, "only the overdue session expires");

  const SigningSession expired = *store.Get(overdue.id);
  Expect(expired.state == SessionState::kExpired, "state is expired");
  Expect(expired.failure_code == ErrorCode::kSessionExpired, "expiry code recorded");
  Expect(!expired.failure_reason.has_value(), "expired sessions carry no failure reason");

  const std::vector<std::string> second = store.ExpireOverdue(later);
  Expect(second.empty(), "second sweep has nothing to do");
  const SigningSession again = *store.Get(overdue.id);
  Expect(again.updated_at == expired.updated_at && again.terminal_at == expired.terminal_at,
         "second sweep has no side effects");
  Expect(store.Get(fresh.id)->state == SessionState::kPending, "fresh session untouched");
}

void TestCleanupRemovesOnlyOldTerminalSessions() {
  auto records = std::make_shared<InMemoryRecordStore>();
  SigningSessionStore store(records, frostcoord_test::TestConfig());
  const TimePoint now = frostcoord::Clock::now();

  const SigningSession aborted = store.Create(MakeRequest("old"), now);
  const SigningSession live = store.Create(MakeRequest("live"), now);
  {
    SigningSessionStore::Handle handle = store.Acquire(aborted.id);
    store.Advance(handle, SessionEvent::kAdministrativeAbort, {}, now);
  }

  const auto retention = std::chrono::hours(24);
  Expect(store.Cleanup(retention, now + std::chrono::hours(1)).empty(),
         "sessions inside the retention window stay");
  const std::vector<std::string> removed = store.Cleanup(retention, now + std::chrono::hours(48));
  Expect(removed.size() == 1 && removed.front() == aborted.id, "old terminal session removed");
  Expect(!store.Get(aborted.id).has_value(), "removed session is gone");
  ExpectCode([&]() { (void)store.Acquire(aborted.id); }, ErrorCode::kSessionNotFound,
             "removed session is not found");
  Expect(store.Get(live.id).has_value(), "non-terminal sessions are never removed");
  Expect(records->RowCount(frostcoord::kSessionsTable) == 1, "removed row erased from storage");
}

void TestListingAndRecovery() {
  auto records = std::make_shared<InMemoryRecordStore>();
  SigningSessionStore store(records, frostcoord_test::TestConfig());
  const TimePoint now = frostcoord::Clock::now();

  const SigningSession older = store.Create(MakeRequest("one"), now);
  const SigningSession newer = store.Create(MakeRequest("two"), now + std::chrono::seconds(1));
  {
    SigningSessionStore::Handle handle = store.Acquire(older.id);
    store.Advance(handle, SessionEvent::kParticipantsNotified, {}, now);
    store.PutCommitment(handle, "alice", RandomPoint(), now);
  }

  const auto active = store.ListActive("federation-1");
  Expect(active.size() == 2 && active.front().id == newer.id, "active list is newest first");
  Expect(store.ListActive("federation-9").empty(), "other groups have no sessions");

  Expect(store.ListPendingFor("alice").size() == 1, "alice already committed to one session");
  Expect(store.ListPendingFor("bob").size() == 2, "bob owes both sessions");
  Expect(store.ListPendingFor("mallory").empty(), "non-participants owe nothing");

  SigningSessionStore restarted(records, frostcoord_test::TestConfig());
  Expect(restarted.Recover() == 2, "both sessions reload");
  const SigningSession reloaded = *restarted.Get(older.id);
  Expect(reloaded.state == SessionState::kNonceCollection, "state survives restart");
  Expect(reloaded.active_signers == std::vector<std::string>({"alice"}), "signers survive");
  ExpectCode([&]() { (void)restarted.Create(MakeRequest("one"), now); },
             ErrorCode::kDuplicateMessage, "duplicate index rebuilt on recovery");
}

}  // namespace

int main() {
  try {
    TestTransitionFunctionIsTotalAndMonotone();
    TestCreateValidation();
    TestDuplicateMessageOnlyWhileActive();
    TestAdvanceRecordsPhaseData();
    TestFailedWriteLeavesSessionUnchanged();
    TestFailedCreateReleasesMessage();
    TestSlowCreateDoesNotBlockReaders();
    TestExpireOverdueIsIdempotent();
    TestCleanupRemovesOnlyOldTerminalSessions();
    TestListingAndRecovery();
  } catch (const std::exception& ex) {
    std::cerr << ex.what() << '\n';
    return 1;
  }

  std::cout << "Session store tests passed" << '\n';
  return 0;
}
