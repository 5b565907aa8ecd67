#include "frostcoord/protocol/nonce_ledger.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

#include "frostcoord/common/logging.hpp"
#include "frostcoord/protocol/session_state.hpp"
#include "frostcoord/storage/record_codec.hpp"

namespace frostcoord {

NonceCommitmentLedger::NonceCommitmentLedger(std::shared_ptr<IRecordStore> records)
    : records_(std::move(records)) {
  if (!records_) {
    throw std::invalid_argument("NonceCommitmentLedger requires a record store");
  }
}

NonceCommitment NonceCommitmentLedger::Record(const SigningSession& session,
                                              const ParticipantId& participant,
                                              const ECPoint& commitment,
                                              TimePoint now) {
  if (session.state != SessionState::kPending &&
      session.state != SessionState::kNonceCollection &&
      session.state != SessionState::kSigning) {
    throw SigningError(ErrorCode::kInvalidStateTransition,
                       "session " + session.id + " does not accept commitments in state " +
                           SessionStateName(session.state));
  }
  if (!session.HasParticipant(participant)) {
    throw SigningError(ErrorCode::kUnknownParticipant,
                       participant + " is not a participant of session " + session.id);
  }

  const std::string key = ValueKey(commitment);

  std::lock_guard<std::mutex> lock(mu_);
  const auto session_it = by_session_.find(session.id);
  if (session_it != by_session_.end()) {
    for (const std::string& existing : session_it->second) {
      if (by_value_.at(existing).participant_id == participant) {
        throw SigningError(ErrorCode::kAlreadySubmitted,
                           participant + " already committed in session " + session.id);
      }
    }
  }

  const auto reused = by_value_.find(key);
  if (reused != by_value_.end()) {
    Logger()->critical("nonce reuse: commitment {} from {} in session {} first seen in session {}",
                       OpaqueId(commitment.ToCompressedBytes()), participant, session.id,
                       reused->second.session_id);
    throw SigningError(ErrorCode::kNonceReuseDetected,
                       "commitment " + OpaqueId(commitment.ToCompressedBytes()) +
                           " was already recorded");
  }

  NonceCommitment record;
  record.session_id = session.id;
  record.participant_id = participant;
  record.commitment = commitment;
  record.used = false;
  record.created_at = now;

  records_->Put(kCommitmentsTable, key, EncodeCommitmentRecord(record));
  by_value_.emplace(key, record);
  by_session_[session.id].push_back(key);
  return record;
}

void NonceCommitmentLedger::MarkUsed(const ECPoint& commitment, TimePoint now) {
  const std::string key = ValueKey(commitment);

  std::lock_guard<std::mutex> lock(mu_);
  const auto it = by_value_.find(key);
  if (it == by_value_.end()) {
    throw SigningError(ErrorCode::kMalformedInput,
                       "commitment " + OpaqueId(commitment.ToCompressedBytes()) +
                           " is not in the ledger");
  }
  if (it->second.used) {
    throw SigningError(ErrorCode::kNonceAlreadyUsed,
                       "commitment " + OpaqueId(commitment.ToCompressedBytes()) +
                           " was already consumed");
  }

  NonceCommitment updated = it->second;
  updated.used = true;
  updated.used_at = now;
  records_->Put(kCommitmentsTable, key, EncodeCommitmentRecord(updated));
  it->second = std::move(updated);
}

size_t NonceCommitmentLedger::Count(const SessionId& session_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = by_session_.find(session_id);
  return it == by_session_.end() ? 0 : it->second.size();
}

std::vector<NonceCommitment> NonceCommitmentLedger::ForSession(const SessionId& session_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<NonceCommitment> out;
  const auto it = by_session_.find(session_id);
  if (it == by_session_.end()) {
    return out;
  }
  out.reserve(it->second.size());
  for (const std::string& key : it->second) {
    out.push_back(by_value_.at(key));
  }
  return out;
}

std::optional<NonceCommitment> NonceCommitmentLedger::Find(const ECPoint& commitment) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = by_value_.find(ValueKey(commitment));
  if (it == by_value_.end()) {
    return std::nullopt;
  }
  return it->second;
}

size_t NonceCommitmentLedger::size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return by_value_.size();
}

size_t NonceCommitmentLedger::Recover() {
  const std::vector<StoredRow> rows = records_->LoadAll(kCommitmentsTable);

  std::unordered_map<std::string, NonceCommitment> by_value;
  for (const StoredRow& row : rows) {
    NonceCommitment record;
    try {
      record = DecodeCommitmentRecord(row.second);
    } catch (const std::invalid_argument& ex) {
      // An unreadable row still reserves its key; losing it would let the
      // value be accepted again.
      throw SigningError(ErrorCode::kStorageUnavailable,
                         "unreadable commitment row " + row.first + ": " + ex.what());
    }
    by_value.emplace(row.first, std::move(record));
  }

  // Arrival order within a session follows creation time.
  std::vector<const std::pair<const std::string, NonceCommitment>*> ordered;
  ordered.reserve(by_value.size());
  for (const auto& item : by_value) {
    ordered.push_back(&item);
  }
  std::sort(ordered.begin(), ordered.end(), [](const auto* lhs, const auto* rhs) {
    return lhs->second.created_at < rhs->second.created_at;
  });
  std::unordered_map<SessionId, std::vector<std::string>> by_session;
  for (const auto* item : ordered) {
    by_session[item->second.session_id].push_back(item->first);
  }

  const size_t loaded = by_value.size();
  std::lock_guard<std::mutex> lock(mu_);
  by_value_ = std::move(by_value);
  by_session_ = std::move(by_session);
  return loaded;
}

std::string NonceCommitmentLedger::ValueKey(const ECPoint& commitment) {
  return ToHex(commitment.ToCompressedBytes());
}

}  // namespace frostcoord
