#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/common/config.hpp"
#include "frostcoord/crypto/ec_point.hpp"
#include "frostcoord/crypto/schnorr.hpp"
#include "frostcoord/protocol/types.hpp"

namespace frostcoord {

// Hands a completed signature to the outside world. Implementations throw
// SigningError(kPublicationFailed) or (kTransportUnavailable) on failure.
class IEventPublishingGateway {
 public:
  virtual ~IEventPublishingGateway() = default;

  // Returns the publication receipt id.
  virtual std::string Publish(const SchnorrSignature& signature,
                              const Bytes& message_hash,
                              const std::string& destination) = 0;
};

struct ApprovalRequest {
  SessionId session_id;
  ApproverId approver_id;
  Bytes operation_digest;
  std::chrono::milliseconds timeout{30000};
};

struct ApprovalResponse {
  ApproverId approver_id;
  bool approved = false;
  Bytes public_key;
  // 64-byte compact secp256k1 ECDSA signature.
  Bytes signature;
  TimePoint signed_at;
};

// Blocking round trip to a physical approval token. Throws
// SigningError(kTransportUnavailable) if the token cannot be reached.
class IHardwareApprovalTransport {
 public:
  virtual ~IHardwareApprovalTransport() = default;

  virtual ApprovalResponse RequestApproval(const ApprovalRequest& request) = 0;
};

struct ParticipantIdentity {
  ShareIndex share_index = 0;
  // Y_i = x_i * G when published by the group.
  std::optional<ECPoint> verification_share;
};

class IIdentityResolver {
 public:
  virtual ~IIdentityResolver() = default;

  virtual std::optional<ECPoint> GroupPublicKey(const GroupId& group_id) = 0;
  virtual std::optional<ParticipantIdentity> Participant(const GroupId& group_id,
                                                         const ParticipantId& participant) = 0;
  // 33-byte compressed secp256k1 key registered for the approver's token.
  virtual std::optional<Bytes> ApproverPublicKey(const ApproverId& approver) = 0;
  // Role of a federation member, or nullopt if they do not belong to the group.
  virtual std::optional<MemberRole> MemberRoleOf(const GroupId& group_id,
                                                 const std::string& member) = 0;
};

class InMemoryIdentityResolver : public IIdentityResolver {
 public:
  void RegisterGroup(const GroupId& group_id, const ECPoint& group_public_key);
  void RegisterParticipant(const GroupId& group_id,
                           const ParticipantId& participant,
                           ShareIndex share_index,
                           std::optional<ECPoint> verification_share = std::nullopt);
  void RegisterApprover(const ApproverId& approver, const Bytes& public_key);
  void RegisterMember(const GroupId& group_id, const std::string& member, MemberRole role);

  std::optional<ECPoint> GroupPublicKey(const GroupId& group_id) override;
  std::optional<ParticipantIdentity> Participant(const GroupId& group_id,
                                                 const ParticipantId& participant) override;
  std::optional<Bytes> ApproverPublicKey(const ApproverId& approver) override;
  std::optional<MemberRole> MemberRoleOf(const GroupId& group_id,
                                         const std::string& member) override;

 private:
  std::mutex mu_;
  std::unordered_map<GroupId, ECPoint> groups_;
  std::unordered_map<GroupId, std::unordered_map<ParticipantId, ParticipantIdentity>> participants_;
  std::unordered_map<ApproverId, Bytes> approvers_;
  std::unordered_map<GroupId, std::unordered_map<std::string, MemberRole>> members_;
};

}  // namespace frostcoord
