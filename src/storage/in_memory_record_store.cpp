#include "frostcoord/storage/in_memory_record_store.hpp"

#include "frostcoord/common/errors.hpp"

namespace frostcoord {

void InMemoryRecordStore::Put(std::string_view table, const std::string& key, const Bytes& value) {
  CheckAvailable();
  std::lock_guard<std::mutex> lock(mu_);
  auto table_it = tables_.find(table);
  if (table_it == tables_.end()) {
    table_it = tables_.emplace(std::string(table), std::map<std::string, Bytes>{}).first;
  }
  table_it->second[key] = value;
}

void InMemoryRecordStore::Erase(std::string_view table, const std::string& key) {
  CheckAvailable();
  std::lock_guard<std::mutex> lock(mu_);
  const auto table_it = tables_.find(table);
  if (table_it != tables_.end()) {
    table_it->second.erase(key);
  }
}

std::vector<StoredRow> InMemoryRecordStore::LoadAll(std::string_view table) {
  CheckAvailable();
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<StoredRow> out;
  const auto table_it = tables_.find(table);
  if (table_it == tables_.end()) {
    return out;
  }
  out.reserve(table_it->second.size());
  for (const auto& [key, value] : table_it->second) {
    out.emplace_back(key, value);
  }
  return out;
}

size_t InMemoryRecordStore::RowCount(std::string_view table) {
  std::lock_guard<std::mutex> lock(mu_);
  const auto table_it = tables_.find(table);
  return table_it == tables_.end() ? 0 : table_it->second.size();
}

void InMemoryRecordStore::SetAvailable(bool available) {
  available_.store(available);
}

void InMemoryRecordStore::CheckAvailable() const {
  if (!available_.load()) {
    throw SigningError(ErrorCode::kStorageUnavailable, "in-memory record store is offline");
  }
}

}  // namespace frostcoord
