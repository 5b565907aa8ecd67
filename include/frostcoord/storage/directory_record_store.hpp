#pragma once

#include <filesystem>
#include <mutex>

#include "frostcoord/storage/record_store.hpp"

namespace frostcoord {

// One file per row under <root>/<table>/<hex(key)>.rec. Writes go through a
// temporary file and a rename so a crash never leaves a torn row.
class DirectoryRecordStore : public IRecordStore {
 public:
  explicit DirectoryRecordStore(std::filesystem::path root);

  void Put(std::string_view table, const std::string& key, const Bytes& value) override;
  void Erase(std::string_view table, const std::string& key) override;
  std::vector<StoredRow> LoadAll(std::string_view table) override;

  const std::filesystem::path& root() const;

 private:
  std::filesystem::path TableDir(std::string_view table) const;

  std::filesystem::path root_;
  std::mutex mu_;
};

}  // namespace frostcoord
