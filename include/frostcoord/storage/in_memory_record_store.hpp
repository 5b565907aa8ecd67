#pragma once

#include <atomic>
#include <map>
#include <mutex>
#include <string>

#include "frostcoord/storage/record_store.hpp"

namespace frostcoord {

class InMemoryRecordStore : public IRecordStore {
 public:
  void Put(std::string_view table, const std::string& key, const Bytes& value) override;
  void Erase(std::string_view table, const std::string& key) override;
  std::vector<StoredRow> LoadAll(std::string_view table) override;

  size_t RowCount(std::string_view table);

  // While unavailable every call throws kStorageUnavailable.
  void SetAvailable(bool available);

 private:
  void CheckAvailable() const;

  std::map<std::string, std::map<std::string, Bytes>, std::less<>> tables_;
  std::mutex mu_;
  std::atomic<bool> available_{true};
};

}  // namespace frostcoord
