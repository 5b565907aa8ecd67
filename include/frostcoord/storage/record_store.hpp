#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "frostcoord/common/bytes.hpp"

namespace frostcoord {

constexpr char kSessionsTable[] = "sessions";
constexpr char kCommitmentsTable[] = "commitments";
constexpr char kApprovalsTable[] = "approvals";
constexpr char kApproverLockoutsTable[] = "approver_lockouts";

using StoredRow = std::pair<std::string, Bytes>;

// Keyed tables of opaque rows. Implementations report outages by throwing
// SigningError(kStorageUnavailable).
class IRecordStore {
 public:
  virtual ~IRecordStore() = default;

  virtual void Put(std::string_view table, const std::string& key, const Bytes& value) = 0;
  virtual void Erase(std::string_view table, const std::string& key) = 0;
  virtual std::vector<StoredRow> LoadAll(std::string_view table) = 0;
};

}  // namespace frostcoord
