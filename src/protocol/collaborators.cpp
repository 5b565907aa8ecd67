#include "frostcoord/protocol/collaborators.hpp"

#include <stdexcept>
#include <utility>

namespace frostcoord {

void InMemoryIdentityResolver::RegisterGroup(const GroupId& group_id,
                                             const ECPoint& group_public_key) {
  if (group_id.empty()) {
    throw std::invalid_argument("group_id must not be empty");
  }
  std::lock_guard<std::mutex> lock(mu_);
  groups_.insert_or_assign(group_id, group_public_key);
}

void InMemoryIdentityResolver::RegisterParticipant(const GroupId& group_id,
                                                   const ParticipantId& participant,
                                                   ShareIndex share_index,
                                                   std::optional<ECPoint> verification_share) {
  if (participant.empty()) {
    throw std::invalid_argument("participant id must not be empty");
  }
  if (share_index == 0) {
    throw std::invalid_argument("share index must be non-zero");
  }

  ParticipantIdentity identity;
  identity.share_index = share_index;
  identity.verification_share = std::move(verification_share);

  std::lock_guard<std::mutex> lock(mu_);
  participants_[group_id].insert_or_assign(participant, std::move(identity));
}

void InMemoryIdentityResolver::RegisterApprover(const ApproverId& approver,
                                                const Bytes& public_key) {
  if (public_key.size() != kCompressedPointLen) {
    throw std::invalid_argument("approver public key must be a compressed point");
  }
  std::lock_guard<std::mutex> lock(mu_);
  approvers_.insert_or_assign(approver, public_key);
}

void InMemoryIdentityResolver::RegisterMember(const GroupId& group_id,
                                              const std::string& member,
                                              MemberRole role) {
  if (member.empty()) {
    throw std::invalid_argument("member id must not be empty");
  }
  std::lock_guard<std::mutex> lock(mu_);
  members_[group_id].insert_or_assign(member, role);
}

std::optional<ECPoint> InMemoryIdentityResolver::GroupPublicKey(const GroupId& group_id) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = groups_.find(group_id);
  if (it == groups_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<ParticipantIdentity> InMemoryIdentityResolver::Participant(
    const GroupId& group_id,
    const ParticipantId& participant) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto group_it = participants_.find(group_id);
  if (group_it == participants_.end()) {
    return std::nullopt;
  }
  const auto it = group_it->second.find(participant);
  if (it == group_it->second.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<Bytes> InMemoryIdentityResolver::ApproverPublicKey(const ApproverId& approver) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = approvers_.find(approver);
  if (it == approvers_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<MemberRole> InMemoryIdentityResolver::MemberRoleOf(const GroupId& group_id,
                                                                const std::string& member) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto group_it = members_.find(group_id);
  if (group_it == members_.end()) {
    return std::nullopt;
  }
  const auto it = group_it->second.find(member);
  if (it == group_it->second.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace frostcoord
