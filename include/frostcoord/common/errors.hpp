#pragma once

#include <cstdint>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace frostcoord {

enum class ErrorCode : uint32_t {
  kInvalidThreshold = 1,
  kInvalidParticipants = 2,
  kMalformedInput = 3,
  kDuplicateMessage = 4,
  kSessionNotFound = 5,
  kUnknownParticipant = 6,
  kInvalidStateTransition = 7,
  kAlreadySubmitted = 8,
  kNotActiveSigner = 9,
  kNonceReuseDetected = 10,
  kNonceAlreadyUsed = 11,
  kAggregationVerificationFailed = 12,
  kMfaGateBlocked = 13,
  kApproverNotDesignated = 14,
  kApproverLockedOut = 15,
  kApprovalAlreadyRecorded = 16,
  kSessionExpired = 17,
  kSessionAborted = 18,
  kStorageUnavailable = 19,
  kTransportUnavailable = 20,
  kPublicationFailed = 21,
  kPermissionDenied = 22,
};

enum class ErrorCategory : uint32_t {
  kValidation = 1,
  kProtocolState = 2,
  kSecurity = 3,
  kTimeout = 4,
  kTransient = 5,
};

// Stable wire/audit name, e.g. "NonceReuseDetected".
const char* ErrorCodeName(ErrorCode code);
bool ParseErrorCode(std::string_view name, ErrorCode* out);
ErrorCategory CategoryOf(ErrorCode code);
const char* ErrorCategoryName(ErrorCategory category);
bool IsRetryable(ErrorCode code);

class SigningError : public std::runtime_error {
 public:
  SigningError(ErrorCode code, const std::string& reason);

  ErrorCode code() const;
  const std::string& reason() const;

 private:
  ErrorCode code_;
  std::string reason_;
};

// Short audit fingerprint of a sensitive value: hex of the first 8 bytes of
// its SHA-256. Safe to log and to put in error messages.
std::string OpaqueId(std::span<const uint8_t> value);
std::string OpaqueId(std::string_view value);

}  // namespace frostcoord
