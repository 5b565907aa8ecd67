#include "frostcoord/common/errors.hpp"

#include <array>
#include <utility>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/crypto/hash.hpp"

namespace frostcoord {
namespace {

struct CodeEntry {
  ErrorCode code;
  const char* name;
  ErrorCategory category;
};

constexpr std::array<CodeEntry, 22> kCodes = {{
    {ErrorCode::kInvalidThreshold, "InvalidThreshold", ErrorCategory::kValidation},
    {ErrorCode::kInvalidParticipants, "InvalidParticipants", ErrorCategory::kValidation},
    {ErrorCode::kMalformedInput, "MalformedInput", ErrorCategory::kValidation},
    {ErrorCode::kDuplicateMessage, "DuplicateMessage", ErrorCategory::kValidation},
    {ErrorCode::kSessionNotFound, "SessionNotFound", ErrorCategory::kValidation},
    {ErrorCode::kUnknownParticipant, "UnknownParticipant", ErrorCategory::kValidation},
    {ErrorCode::kInvalidStateTransition, "InvalidStateTransition", ErrorCategory::kProtocolState},
    {ErrorCode::kAlreadySubmitted, "AlreadySubmitted", ErrorCategory::kProtocolState},
    {ErrorCode::kNotActiveSigner, "NotActiveSigner", ErrorCategory::kProtocolState},
    {ErrorCode::kNonceReuseDetected, "NonceReuseDetected", ErrorCategory::kSecurity},
    {ErrorCode::kNonceAlreadyUsed, "NonceAlreadyUsed", ErrorCategory::kSecurity},
    {ErrorCode::kAggregationVerificationFailed, "AggregationVerificationFailed",
     ErrorCategory::kSecurity},
    {ErrorCode::kMfaGateBlocked, "MfaGateBlocked", ErrorCategory::kSecurity},
    {ErrorCode::kApproverNotDesignated, "ApproverNotDesignated", ErrorCategory::kValidation},
    {ErrorCode::kApproverLockedOut, "ApproverLockedOut", ErrorCategory::kSecurity},
    {ErrorCode::kApprovalAlreadyRecorded, "ApprovalAlreadyRecorded", ErrorCategory::kProtocolState},
    {ErrorCode::kSessionExpired, "SessionExpired", ErrorCategory::kTimeout},
    {ErrorCode::kSessionAborted, "SessionAborted", ErrorCategory::kProtocolState},
    {ErrorCode::kStorageUnavailable, "StorageUnavailable", ErrorCategory::kTransient},
    {ErrorCode::kTransportUnavailable, "TransportUnavailable", ErrorCategory::kTransient},
    {ErrorCode::kPublicationFailed, "PublicationFailed", ErrorCategory::kTransient},
    {ErrorCode::kPermissionDenied, "PermissionDenied", ErrorCategory::kSecurity},
}};

const CodeEntry* FindEntry(ErrorCode code) {
  for (const CodeEntry& entry : kCodes) {
    if (entry.code == code) {
      return &entry;
    }
  }
  return nullptr;
}

}  // namespace

const char* ErrorCodeName(ErrorCode code) {
  const CodeEntry* entry = FindEntry(code);
  return entry == nullptr ? "Unknown" : entry->name;
}

bool ParseErrorCode(std::string_view name, ErrorCode* out) {
  for (const CodeEntry& entry : kCodes) {
    if (name == entry.name) {
      if (out != nullptr) {
        *out = entry.code;
      }
      return true;
    }
  }
  return false;
}

ErrorCategory CategoryOf(ErrorCode code) {
  const CodeEntry* entry = FindEntry(code);
  return entry == nullptr ? ErrorCategory::kValidation : entry->category;
}

const char* ErrorCategoryName(ErrorCategory category) {
  switch (category) {
    case ErrorCategory::kValidation:
      return "validation";
    case ErrorCategory::kProtocolState:
      return "protocol_state";
    case ErrorCategory::kSecurity:
      return "security";
    case ErrorCategory::kTimeout:
      return "timeout";
    case ErrorCategory::kTransient:
      return "transient";
  }
  return "unknown";
}

bool IsRetryable(ErrorCode code) {
  const ErrorCategory category = CategoryOf(code);
  return category == ErrorCategory::kProtocolState || category == ErrorCategory::kTransient;
}

SigningError::SigningError(ErrorCode code, const std::string& reason)
    : std::runtime_error(std::string(ErrorCodeName(code)) + ": " + reason),
      code_(code),
      reason_(reason) {}

ErrorCode SigningError::code() const {
  return code_;
}

const std::string& SigningError::reason() const {
  return reason_;
}

std::string OpaqueId(std::span<const uint8_t> value) {
  const Bytes digest = Sha256(value);
  return ToHex(std::span<const uint8_t>(digest.data(), 8));
}

std::string OpaqueId(std::string_view value) {
  return OpaqueId(AsByteSpan(value));
}

}  // namespace frostcoord
