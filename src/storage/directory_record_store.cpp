#include "frostcoord/storage/directory_record_store.hpp"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>

#include "frostcoord/common/errors.hpp"

namespace frostcoord {
namespace {

constexpr char kRowExtension[] = ".rec";
constexpr char kTempExtension[] = ".tmp";

[[noreturn]] void ThrowUnavailable(const std::string& what, const std::error_code& ec) {
  throw SigningError(ErrorCode::kStorageUnavailable, what + ": " + ec.message());
}

}  // namespace

DirectoryRecordStore::DirectoryRecordStore(std::filesystem::path root) : root_(std::move(root)) {
  std::error_code ec;
  std::filesystem::create_directories(root_, ec);
  if (ec) {
    ThrowUnavailable("cannot create record store root", ec);
  }
}

void DirectoryRecordStore::Put(std::string_view table, const std::string& key, const Bytes& value) {
  std::lock_guard<std::mutex> lock(mu_);
  const std::filesystem::path dir = TableDir(table);
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    ThrowUnavailable("cannot create table directory", ec);
  }

  const std::string file_stem = ToHex(AsByteSpan(key));
  const std::filesystem::path final_path = dir / (file_stem + kRowExtension);
  const std::filesystem::path temp_path = dir / (file_stem + kTempExtension);
  {
    std::ofstream out(temp_path, std::ios::binary | std::ios::trunc);
    if (!out) {
      throw SigningError(ErrorCode::kStorageUnavailable, "cannot open row file for writing");
    }
    out.write(reinterpret_cast<const char*>(value.data()),
              static_cast<std::streamsize>(value.size()));
    out.flush();
    if (!out) {
      throw SigningError(ErrorCode::kStorageUnavailable, "short write to row file");
    }
  }

  std::filesystem::rename(temp_path, final_path, ec);
  if (ec) {
    ThrowUnavailable("cannot commit row file", ec);
  }
}

void DirectoryRecordStore::Erase(std::string_view table, const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  const std::filesystem::path path = TableDir(table) / (ToHex(AsByteSpan(key)) + kRowExtension);
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) {
    ThrowUnavailable("cannot remove row file", ec);
  }
}

std::vector<StoredRow> DirectoryRecordStore::LoadAll(std::string_view table) {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<StoredRow> out;
  const std::filesystem::path dir = TableDir(table);
  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) {
    if (ec) {
      ThrowUnavailable("cannot stat table directory", ec);
    }
    return out;
  }

  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::filesystem::path& path = it->path();
    if (path.extension() != kRowExtension) {
      continue;
    }

    const Bytes key_bytes = FromHex(path.stem().string());
    std::ifstream in(path, std::ios::binary);
    if (!in) {
      throw SigningError(ErrorCode::kStorageUnavailable, "cannot open row file for reading");
    }
    Bytes value((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    out.emplace_back(std::string(key_bytes.begin(), key_bytes.end()), std::move(value));
  }
  if (ec) {
    ThrowUnavailable("cannot list table directory", ec);
  }
  return out;
}

const std::filesystem::path& DirectoryRecordStore::root() const {
  return root_;
}

std::filesystem::path DirectoryRecordStore::TableDir(std::string_view table) const {
  return root_ / std::string(table);
}

}  // namespace frostcoord
