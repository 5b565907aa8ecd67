#pragma once

#include <span>

#include "frostcoord/common/bytes.hpp"
#include "frostcoord/protocol/mfa_policy.hpp"
#include "frostcoord/protocol/types.hpp"

namespace frostcoord {

// Versioned binary rows for the persisted tables. Decoders throw
// std::invalid_argument on malformed input.
Bytes EncodeSessionRecord(const SigningSession& session);
SigningSession DecodeSessionRecord(std::span<const uint8_t> encoded);

Bytes EncodeCommitmentRecord(const NonceCommitment& commitment);
NonceCommitment DecodeCommitmentRecord(std::span<const uint8_t> encoded);

Bytes EncodeApprovalRecord(const HardwareApprovalRecord& record);
HardwareApprovalRecord DecodeApprovalRecord(std::span<const uint8_t> encoded);

Bytes EncodeLockoutRecord(const ApproverLockout& lockout);
ApproverLockout DecodeLockoutRecord(std::span<const uint8_t> encoded);

}  // namespace frostcoord
