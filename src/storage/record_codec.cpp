#include "frostcoord/storage/record_codec.hpp"

#include <stdexcept>

#include "frostcoord/common/byte_io.hpp"
#include "frostcoord/protocol/session_state.hpp"

namespace frostcoord {
namespace {

constexpr uint32_t kSessionRecordVersion = 1;
constexpr uint32_t kCommitmentRecordVersion = 1;
constexpr uint32_t kApprovalRecordVersion = 1;
constexpr uint32_t kLockoutRecordVersion = 1;

constexpr size_t kMaxIdLen = 256;
constexpr size_t kMaxTextLen = 4096;
constexpr size_t kMaxListLen = 1024;

void PutTime(ByteWriter* out, TimePoint value) {
  const auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(value.time_since_epoch()).count();
  out->PutU64(static_cast<uint64_t>(millis));
}

TimePoint GetTime(ByteReader* in) {
  const int64_t millis = static_cast<int64_t>(in->GetU64());
  return TimePoint(std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds(millis)));
}

void PutOptionalTime(ByteWriter* out, const std::optional<TimePoint>& value) {
  out->PutU8(value.has_value() ? 1 : 0);
  if (value.has_value()) {
    PutTime(out, *value);
  }
}

std::optional<TimePoint> GetOptionalTime(ByteReader* in) {
  if (in->GetU8() == 0) {
    return std::nullopt;
  }
  return GetTime(in);
}

void PutPoint(ByteWriter* out, const ECPoint& point) {
  out->PutField(point.ToCompressedBytes());
}

ECPoint GetPoint(ByteReader* in) {
  return ECPoint::FromCompressed(in->GetField(kCompressedPointLen, "point"));
}

void PutScalar(ByteWriter* out, const Scalar& scalar) {
  const auto bytes = scalar.ToCanonicalBytes();
  out->PutField(bytes);
}

Scalar GetScalar(ByteReader* in) {
  return Scalar::FromCanonicalBytes(in->GetField(32, "scalar"));
}

void PutOptionalSignature(ByteWriter* out, const std::optional<SchnorrSignature>& signature) {
  out->PutU8(signature.has_value() ? 1 : 0);
  if (signature.has_value()) {
    out->PutField(EncodeSignature(*signature));
  }
}

std::optional<SchnorrSignature> GetOptionalSignature(ByteReader* in) {
  if (in->GetU8() == 0) {
    return std::nullopt;
  }
  return DecodeSignature(in->GetField(kEncodedSignatureLen, "signature"));
}

void PutOptionalString(ByteWriter* out, const std::optional<std::string>& value) {
  out->PutU8(value.has_value() ? 1 : 0);
  if (value.has_value()) {
    out->PutString(*value);
  }
}

std::optional<std::string> GetOptionalString(ByteReader* in, const char* field_name) {
  if (in->GetU8() == 0) {
    return std::nullopt;
  }
  return in->GetString(kMaxTextLen, field_name);
}

void ExpectVersion(ByteReader* in, uint32_t expected, const char* what) {
  const uint32_t version = in->GetU32();
  if (version != expected) {
    throw std::invalid_argument(std::string(what) + " has unsupported version");
  }
}

uint32_t GetListLen(ByteReader* in, const char* what) {
  const uint32_t len = in->GetU32();
  if (len > kMaxListLen) {
    throw std::invalid_argument(std::string(what) + " list is too long");
  }
  return len;
}

}  // namespace

Bytes EncodeSessionRecord(const SigningSession& session) {
  ByteWriter out;
  out.PutU32(kSessionRecordVersion);
  out.PutString(session.id);
  out.PutString(session.group_id);
  out.PutField(session.message_hash);
  out.PutU32(static_cast<uint32_t>(session.participants.size()));
  for (const ParticipantId& participant : session.participants) {
    out.PutString(participant);
  }
  out.PutU32(session.threshold);
  out.PutU32(static_cast<uint32_t>(session.state));
  out.PutString(session.destination);
  out.PutU8(session.operation_amount.has_value() ? 1 : 0);
  if (session.operation_amount.has_value()) {
    out.PutU64(*session.operation_amount);
  }
  out.PutString(session.created_by);

  out.PutU32(static_cast<uint32_t>(session.nonce_commitments.size()));
  for (const auto& [participant, commitment] : session.nonce_commitments) {
    out.PutString(participant);
    PutPoint(&out, commitment);
  }
  out.PutU32(static_cast<uint32_t>(session.active_signers.size()));
  for (const ParticipantId& signer : session.active_signers) {
    out.PutString(signer);
  }
  out.PutU32(static_cast<uint32_t>(session.partial_signatures.size()));
  for (const auto& [participant, partial] : session.partial_signatures) {
    out.PutString(participant);
    PutScalar(&out, partial);
  }

  PutOptionalSignature(&out, session.candidate_signature);
  PutOptionalSignature(&out, session.final_signature);
  PutOptionalSignature(&out, session.withheld_signature);
  PutOptionalString(&out, session.publication_id);

  PutTime(&out, session.created_at);
  PutTime(&out, session.updated_at);
  PutTime(&out, session.deadline);
  PutOptionalTime(&out, session.nonce_collection_started_at);
  PutOptionalTime(&out, session.signing_started_at);
  PutOptionalTime(&out, session.aggregating_started_at);
  PutOptionalTime(&out, session.terminal_at);

  out.PutU8(session.failure_code.has_value() ? 1 : 0);
  if (session.failure_code.has_value()) {
    out.PutU32(static_cast<uint32_t>(*session.failure_code));
  }
  PutOptionalString(&out, session.failure_reason);
  return out.Take();
}

SigningSession DecodeSessionRecord(std::span<const uint8_t> encoded) {
  ByteReader in(encoded);
  ExpectVersion(&in, kSessionRecordVersion, "session record");

  SigningSession session;
  session.id = in.GetString(kMaxIdLen, "session_id");
  session.group_id = in.GetString(kMaxIdLen, "group_id");
  session.message_hash = in.GetField(kMessageHashLen, "message_hash");

  const uint32_t participant_count = GetListLen(&in, "participants");
  for (uint32_t i = 0; i < participant_count; ++i) {
    session.participants.push_back(in.GetString(kMaxIdLen, "participant"));
  }
  session.threshold = in.GetU32();

  const uint32_t raw_state = in.GetU32();
  if (raw_state < static_cast<uint32_t>(SessionState::kPending) ||
      raw_state > static_cast<uint32_t>(SessionState::kExpired)) {
    throw std::invalid_argument("session record has unknown state");
  }
  session.state = static_cast<SessionState>(raw_state);
  session.destination = in.GetString(kMaxTextLen, "destination");
  if (in.GetU8() != 0) {
    session.operation_amount = in.GetU64();
  }
  session.created_by = in.GetString(kMaxIdLen, "created_by");

  const uint32_t commitment_count = GetListLen(&in, "commitments");
  for (uint32_t i = 0; i < commitment_count; ++i) {
    ParticipantId participant = in.GetString(kMaxIdLen, "commitment participant");
    session.nonce_commitments.emplace(std::move(participant), GetPoint(&in));
  }
  const uint32_t signer_count = GetListLen(&in, "active signers");
  for (uint32_t i = 0; i < signer_count; ++i) {
    session.active_signers.push_back(in.GetString(kMaxIdLen, "active signer"));
  }
  const uint32_t partial_count = GetListLen(&in, "partial signatures");
  for (uint32_t i = 0; i < partial_count; ++i) {
    ParticipantId participant = in.GetString(kMaxIdLen, "partial participant");
    session.partial_signatures.emplace(std::move(participant), GetScalar(&in));
  }

  session.candidate_signature = GetOptionalSignature(&in);
  session.final_signature = GetOptionalSignature(&in);
  session.withheld_signature = GetOptionalSignature(&in);
  session.publication_id = GetOptionalString(&in, "publication_id");

  session.created_at = GetTime(&in);
  session.updated_at = GetTime(&in);
  session.deadline = GetTime(&in);
  session.nonce_collection_started_at = GetOptionalTime(&in);
  session.signing_started_at = GetOptionalTime(&in);
  session.aggregating_started_at = GetOptionalTime(&in);
  session.terminal_at = GetOptionalTime(&in);

  if (in.GetU8() != 0) {
    const uint32_t raw_code = in.GetU32();
    const ErrorCode code = static_cast<ErrorCode>(raw_code);
    if (std::string(ErrorCodeName(code)) == "Unknown") {
      throw std::invalid_argument("session record has unknown failure code");
    }
    session.failure_code = code;
  }
  session.failure_reason = GetOptionalString(&in, "failure_reason");
  in.ExpectEnd("session record");
  return session;
}

Bytes EncodeCommitmentRecord(const NonceCommitment& commitment) {
  ByteWriter out;
  out.PutU32(kCommitmentRecordVersion);
  out.PutString(commitment.session_id);
  out.PutString(commitment.participant_id);
  PutPoint(&out, commitment.commitment);
  out.PutU8(commitment.used ? 1 : 0);
  PutTime(&out, commitment.created_at);
  PutOptionalTime(&out, commitment.used_at);
  return out.Take();
}

NonceCommitment DecodeCommitmentRecord(std::span<const uint8_t> encoded) {
  ByteReader in(encoded);
  ExpectVersion(&in, kCommitmentRecordVersion, "commitment record");

  NonceCommitment commitment;
  commitment.session_id = in.GetString(kMaxIdLen, "session_id");
  commitment.participant_id = in.GetString(kMaxIdLen, "participant_id");
  commitment.commitment = GetPoint(&in);
  commitment.used = in.GetU8() != 0;
  commitment.created_at = GetTime(&in);
  commitment.used_at = GetOptionalTime(&in);
  in.ExpectEnd("commitment record");
  return commitment;
}

Bytes EncodeApprovalRecord(const HardwareApprovalRecord& record) {
  ByteWriter out;
  out.PutU32(kApprovalRecordVersion);
  out.PutString(record.session_id);
  out.PutString(record.approver_id);
  out.PutField(record.public_key);
  out.PutField(record.signature);
  PutTime(&out, record.signed_at);
  out.PutU8(record.passed ? 1 : 0);
  out.PutString(record.failure_reason);
  out.PutU32(record.failure_count);
  PutTime(&out, record.recorded_at);
  return out.Take();
}

HardwareApprovalRecord DecodeApprovalRecord(std::span<const uint8_t> encoded) {
  ByteReader in(encoded);
  ExpectVersion(&in, kApprovalRecordVersion, "approval record");

  HardwareApprovalRecord record;
  record.session_id = in.GetString(kMaxIdLen, "session_id");
  record.approver_id = in.GetString(kMaxIdLen, "approver_id");
  record.public_key = in.GetField(kCompressedPointLen, "public_key");
  record.signature = in.GetField(128, "approval signature");
  record.signed_at = GetTime(&in);
  record.passed = in.GetU8() != 0;
  record.failure_reason = in.GetString(kMaxTextLen, "failure_reason");
  record.failure_count = in.GetU32();
  record.recorded_at = GetTime(&in);
  in.ExpectEnd("approval record");
  return record;
}

Bytes EncodeLockoutRecord(const ApproverLockout& lockout) {
  ByteWriter out;
  out.PutU32(kLockoutRecordVersion);
  out.PutString(lockout.approver_id);
  out.PutU32(lockout.consecutive_failures);
  PutOptionalTime(&out, lockout.locked_until);
  return out.Take();
}

ApproverLockout DecodeLockoutRecord(std::span<const uint8_t> encoded) {
  ByteReader in(encoded);
  ExpectVersion(&in, kLockoutRecordVersion, "lockout record");

  ApproverLockout lockout;
  lockout.approver_id = in.GetString(kMaxIdLen, "approver_id");
  lockout.consecutive_failures = in.GetU32();
  lockout.locked_until = GetOptionalTime(&in);
  in.ExpectEnd("lockout record");
  return lockout;
}

}  // namespace frostcoord
