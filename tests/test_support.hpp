#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/common/config.hpp"
#include "frostcoord/common/errors.hpp"
#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/crypto/ecdsa.hpp"
#include "frostcoord/crypto/hash.hpp"
#include "frostcoord/crypto/random.hpp"
#include "frostcoord/crypto/scalar.hpp"
#include "frostcoord/crypto/schnorr.hpp"
#include "frostcoord/protocol/collaborators.hpp"
#include "frostcoord/protocol/mfa_gate.hpp"
#include "frostcoord/protocol/session_coordinator.hpp"
#include "frostcoord/storage/in_memory_record_store.hpp"

namespace frostcoord_test {

using frostcoord::ApprovalRequest;
using frostcoord::ApprovalResponse;
using frostcoord::ApproverId;
using frostcoord::Bytes;
using frostcoord::Clock;
using frostcoord::CoordinatorConfig;
using frostcoord::ECPoint;
using frostcoord::ErrorCode;
using frostcoord::GroupId;
using frostcoord::ParticipantId;
using frostcoord::Scalar;
using frostcoord::SchnorrSignature;
using frostcoord::ShareIndex;
using frostcoord::SigningError;
using frostcoord::SigningPackage;
using frostcoord::TimePoint;

inline void Expect(bool condition, const std::string& message) {
  if (!condition) {
    throw std::runtime_error("Test failed: " + message);
  }
}

inline void ExpectThrow(const std::function<void()>& fn, const std::string& message) {
  try {
    fn();
  } catch (const std::exception&) {
    return;
  }
  throw std::runtime_error("Expected exception: " + message);
}

inline void ExpectCode(const std::function<void()>& fn,
                       ErrorCode expected,
                       const std::string& message) {
  try {
    fn();
  } catch (const SigningError& ex) {
    if (ex.code() != expected) {
      throw std::runtime_error("Test failed: " + message + " (expected " +
                               frostcoord::ErrorCodeName(expected) + ", got " +
                               frostcoord::ErrorCodeName(ex.code()) + ")");
    }
    return;
  }
  throw std::runtime_error("Expected SigningError " +
                           std::string(frostcoord::ErrorCodeName(expected)) + ": " + message);
}

inline Bytes MessageHash(const std::string& text) {
  return frostcoord::Sha256(frostcoord::AsByteSpan(text));
}

inline Bytes ScalarBytes(const Scalar& scalar) {
  const auto bytes = scalar.ToCanonicalBytes();
  return Bytes(bytes.begin(), bytes.end());
}

inline CoordinatorConfig TestConfig() {
  CoordinatorConfig config;
  config.verify_threads = 2;
  config.log_level = "warn";
  return config;
}

struct Guardian {
  ParticipantId id;
  ShareIndex index = 0;
  Scalar share;
  ECPoint verification_share;
  // Nonce of the most recent commitment handed out.
  Scalar nonce;
};

// Trusted-dealer group with Shamir shares at indices 1..n, registered in an
// in-memory identity resolver.
class GroupFixture {
 public:
  GroupFixture(GroupId group_id,
               const std::vector<ParticipantId>& participants,
               uint32_t threshold,
               bool publish_verification_shares = true)
      : group_id_(std::move(group_id)),
        identities_(std::make_shared<frostcoord::InMemoryIdentityResolver>()) {
    std::vector<ShareIndex> indices;
    for (size_t i = 0; i < participants.size(); ++i) {
      indices.push_back(static_cast<ShareIndex>(i + 1));
    }
    const Scalar secret = frostcoord::Csprng::RandomScalar();
    const auto shares = frostcoord::DealShares(secret, threshold, indices);
    group_public_key_ = ECPoint::GeneratorMultiply(secret);
    identities_->RegisterGroup(group_id_, group_public_key_);

    for (size_t i = 0; i < participants.size(); ++i) {
      Guardian guardian;
      guardian.id = participants[i];
      guardian.index = indices[i];
      guardian.share = shares.at(indices[i]);
      guardian.verification_share = ECPoint::GeneratorMultiply(guardian.share);
      identities_->RegisterParticipant(
          group_id_, guardian.id, guardian.index,
          publish_verification_shares ? std::optional<ECPoint>(guardian.verification_share)
                                      : std::nullopt);
      identities_->RegisterMember(group_id_, guardian.id, frostcoord::MemberRole::kGuardian);
      guardians_.emplace(guardian.id, guardian);
    }
  }

  // Draws a fresh nonce for the guardian and returns its compressed commitment.
  Bytes Commit(const ParticipantId& participant) {
    Guardian& guardian = guardians_.at(participant);
    guardian.nonce = frostcoord::Csprng::RandomScalar();
    return ECPoint::GeneratorMultiply(guardian.nonce).ToCompressedBytes();
  }

  Bytes Sign(const SigningPackage& package, const ParticipantId& participant) const {
    const Guardian& guardian = guardians_.at(participant);
    return ScalarBytes(
        frostcoord::ComputePartialSignature(guardian.share, guardian.nonce, package.challenge));
  }

  const GroupId& group_id() const { return group_id_; }
  const ECPoint& group_public_key() const { return group_public_key_; }
  const Guardian& guardian(const ParticipantId& participant) const {
    return guardians_.at(participant);
  }
  std::shared_ptr<frostcoord::InMemoryIdentityResolver> identities() const { return identities_; }

 private:
  GroupId group_id_;
  std::shared_ptr<frostcoord::InMemoryIdentityResolver> identities_;
  ECPoint group_public_key_;
  std::map<ParticipantId, Guardian> guardians_;
};

class FakePublisher : public frostcoord::IEventPublishingGateway {
 public:
  std::string Publish(const SchnorrSignature& signature,
                      const Bytes& message_hash,
                      const std::string& destination) override {
    std::unique_lock<std::mutex> lock(mu_);
    ++attempts_;
    cv_.notify_all();
    cv_.wait_for(lock, max_wait_, [this]() { return !held_; });
    if (failing_) {
      throw SigningError(ErrorCode::kTransportUnavailable, "relay unreachable");
    }
    (void)signature;
    (void)message_hash;
    destinations_.push_back(destination);
    return "receipt-" + std::to_string(destinations_.size());
  }

  void SetFailing(bool failing) {
    std::lock_guard<std::mutex> lock(mu_);
    failing_ = failing;
  }
  size_t published() {
    std::lock_guard<std::mutex> lock(mu_);
    return destinations_.size();
  }
  size_t attempts() {
    std::lock_guard<std::mutex> lock(mu_);
    return attempts_;
  }

  // While held, Publish waits (at most `max_wait`) before answering.
  void Hold(std::chrono::milliseconds max_wait) {
    std::lock_guard<std::mutex> lock(mu_);
    held_ = true;
    max_wait_ = max_wait;
  }

  void Release() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      held_ = false;
    }
    cv_.notify_all();
  }

  bool WaitForAttempts(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [&]() { return attempts_ >= count; });
  }

 private:
  std::mutex mu_;
  std::condition_variable cv_;
  bool held_ = false;
  std::chrono::milliseconds max_wait_{0};
  bool failing_ = false;
  size_t attempts_ = 0;
  std::vector<std::string> destinations_;
};

enum class TokenBehavior {
  kApprove,
  kDecline,
  kWrongKey,
  kStaleTimestamp,
  kBadSignature,
  // Valid signature with s replaced by q - s, as tokens that skip low-S
  // normalization produce.
  kHighS,
  kUnreachable,
};

// Simulated approval tokens. Each approver holds a secp256k1 key registered
// with the identity resolver; the token signs with the transport's clock.
class FakeApprovalTransport : public frostcoord::IHardwareApprovalTransport {
 public:
  explicit FakeApprovalTransport(std::shared_ptr<frostcoord::InMemoryIdentityResolver> identities)
      : identities_(std::move(identities)) {}

  void AddToken(const ApproverId& approver, TokenBehavior behavior = TokenBehavior::kApprove) {
    Token token;
    token.secret = frostcoord::Csprng::RandomScalar();
    token.behavior = behavior;
    identities_->RegisterApprover(approver,
                                  ECPoint::GeneratorMultiply(token.secret).ToCompressedBytes());
    std::lock_guard<std::mutex> lock(mu_);
    tokens_.insert_or_assign(approver, token);
  }

  void SetBehavior(const ApproverId& approver, TokenBehavior behavior) {
    std::lock_guard<std::mutex> lock(mu_);
    tokens_.at(approver).behavior = behavior;
  }

  void SetClock(TimePoint now) {
    std::lock_guard<std::mutex> lock(mu_);
    now_ = now;
  }

  size_t calls() {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

  // While held, RequestApproval waits (at most `max_wait`) before answering,
  // like a token waiting on its owner.
  void Hold(std::chrono::milliseconds max_wait) {
    std::lock_guard<std::mutex> lock(mu_);
    held_ = true;
    max_wait_ = max_wait;
  }

  void Release() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      held_ = false;
    }
    cv_.notify_all();
  }

  // Blocks until `count` requests have reached the token.
  bool WaitForCalls(size_t count, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [&]() { return calls_ >= count; });
  }

  ApprovalResponse RequestApproval(const ApprovalRequest& request) override {
    Token token;
    TimePoint now;
    {
      std::unique_lock<std::mutex> lock(mu_);
      ++calls_;
      cv_.notify_all();
      cv_.wait_for(lock, max_wait_, [this]() { return !held_; });
      token = tokens_.at(request.approver_id);
      now = now_;
    }
    if (token.behavior == TokenBehavior::kUnreachable) {
      throw SigningError(ErrorCode::kTransportUnavailable, "token did not answer");
    }

    Scalar signing_key = token.secret;
    if (token.behavior == TokenBehavior::kWrongKey) {
      signing_key = frostcoord::Csprng::RandomScalar();
    }
    ApprovalResponse response;
    response.approver_id = request.approver_id;
    response.approved = token.behavior != TokenBehavior::kDecline;
    response.public_key = ECPoint::GeneratorMultiply(signing_key).ToCompressedBytes();
    response.signed_at =
        token.behavior == TokenBehavior::kStaleTimestamp ? now - std::chrono::minutes(10) : now;

    const Bytes digest = frostcoord::HardwareApprovalDigest(
        request.session_id, request.operation_digest, response.signed_at);
    response.signature = frostcoord::EcdsaSignDigest(signing_key, digest);
    if (token.behavior == TokenBehavior::kBadSignature) {
      response.signature[10] ^= 0x01;
    }
    if (token.behavior == TokenBehavior::kHighS) {
      const Scalar s = Scalar::FromCanonicalBytes(
          std::span<const uint8_t>(response.signature).subspan(32, 32));
      const auto high = s.Negate().ToCanonicalBytes();
      std::copy(high.begin(), high.end(), response.signature.begin() + 32);
    }
    return response;
  }

 private:
  struct Token {
    Scalar secret;
    TokenBehavior behavior = TokenBehavior::kApprove;
  };

  std::shared_ptr<frostcoord::InMemoryIdentityResolver> identities_;
  std::mutex mu_;
  std::unordered_map<ApproverId, Token> tokens_;
  std::condition_variable cv_;
  TimePoint now_ = Clock::now();
  size_t calls_ = 0;
  bool held_ = false;
  std::chrono::milliseconds max_wait_{0};
};

// Coordinator wired to in-memory collaborators over one guardian group.
struct Harness {
  explicit Harness(std::vector<ParticipantId> participants = {"alice", "bob", "carol"},
                   uint32_t threshold = 2,
                   std::shared_ptr<frostcoord::IRecordStore> store = nullptr,
                   CoordinatorConfig config = TestConfig())
      : group("federation-1", participants, threshold),
        records(store ? std::move(store) : std::make_shared<frostcoord::InMemoryRecordStore>()),
        publisher(std::make_shared<FakePublisher>()),
        tokens(std::make_shared<FakeApprovalTransport>(group.identities())),
        threshold(threshold),
        participants(std::move(participants)) {
    frostcoord::CoordinatorDependencies dependencies;
    dependencies.records = records;
    dependencies.identities = group.identities();
    dependencies.publisher = publisher;
    dependencies.approval_transport = tokens;
    coordinator = std::make_unique<frostcoord::SessionCoordinator>(dependencies, config);
  }

  frostcoord::SessionRequest Request(const std::string& message) const {
    frostcoord::SessionRequest request;
    request.group_id = group.group_id();
    request.message_hash = MessageHash(message);
    request.participants = participants;
    request.threshold = threshold;
    request.destination = "relay://federation-1";
    request.created_by = "alice";
    return request;
  }

  frostcoord::SessionId Create(const std::string& message, TimePoint now) {
    return coordinator->CreateSession(Request(message), now).id;
  }

  void Commit(const frostcoord::SessionId& session_id,
              const std::vector<ParticipantId>& signers,
              TimePoint now) {
    for (const ParticipantId& signer : signers) {
      coordinator->SubmitNonceCommitment(session_id, signer, group.Commit(signer), now);
    }
  }

  void SignAll(const frostcoord::SessionId& session_id,
               const std::vector<ParticipantId>& signers,
               TimePoint now) {
    const SigningPackage package = coordinator->GetSigningPackage(session_id);
    for (const ParticipantId& signer : signers) {
      coordinator->SubmitPartialSignature(session_id, signer, group.Sign(package, signer), now);
    }
  }

  // Creates a session and drives it to aggregating with the first k
  // participants as signers.
  frostcoord::SessionId RunToAggregating(const std::string& message, TimePoint now) {
    const frostcoord::SessionId session_id = Create(message, now);
    const std::vector<ParticipantId> signers(participants.begin(),
                                             participants.begin() + threshold);
    Commit(session_id, signers, now);
    SignAll(session_id, signers, now);
    return session_id;
  }

  GroupFixture group;
  std::shared_ptr<frostcoord::IRecordStore> records;
  std::shared_ptr<FakePublisher> publisher;
  std::shared_ptr<FakeApprovalTransport> tokens;
  uint32_t threshold;
  std::vector<ParticipantId> participants;
  std::unique_ptr<frostcoord::SessionCoordinator> coordinator;
};

}  // namespace frostcoord_test
