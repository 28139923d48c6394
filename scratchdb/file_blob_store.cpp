#include "scratchdb/file_blob_store.h"

#include <fstream>
#include <iterator>
#include <system_error>

#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"

#include "scratchdb/status_macros.h"

namespace scratchdb {

namespace {

absl::Status MaybeCreateDirectory(const std::filesystem::path& dir) {
  std::error_code ec;
  if (!std::filesystem::create_directories(dir, ec) && ec) {
    return absl::InternalError(absl::StrCat("Cannot create ", dir.string(), ": ", ec.message()));
  }
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<std::filesystem::path> FileBlobStore::Resolve(const std::string& key) const {
  if (key.empty() || key.front() == '/') return absl::InvalidArgumentError(absl::StrCat("Invalid blob key: ", key));
  for (absl::string_view segment : absl::StrSplit(key, '/')) {
    if (segment.empty() || segment == "." || segment == "..") {
      return absl::InvalidArgumentError(absl::StrCat("Invalid blob key: ", key));
    }
  }
  return root_ / key;
}

absl::StatusOr<bool> FileBlobStore::Exists(const std::string& key) {
  ASSIGN_OR_RETURN(auto path, Resolve(key));
  std::error_code ec;
  bool exists = std::filesystem::is_regular_file(path, ec);
  if (ec && ec != std::errc::no_such_file_or_directory) {
    return absl::InternalError(absl::StrCat("Cannot stat ", path.string(), ": ", ec.message()));
  }
  return exists;
}

absl::StatusOr<std::string> FileBlobStore::Get(const std::string& key) {
  ASSIGN_OR_RETURN(auto path, Resolve(key));
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return absl::NotFoundError(absl::StrCat("Blob not found: ", key));
  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) return absl::DataLossError(absl::StrCat("Failed reading blob: ", key));
  return content;
}

absl::Status FileBlobStore::Put(const std::string& key, const std::string& bytes) {
  ASSIGN_OR_RETURN(auto path, Resolve(key));
  RETURN_IF_ERROR(MaybeCreateDirectory(path.parent_path()));
  std::filesystem::path tmp = path;
  tmp += ".tmp";
  {
    std::ofstream file(tmp, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) return absl::InternalError(absl::StrCat("Failed to open ", tmp.string(), " for writing"));
    file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    if (!file.good()) return absl::InternalError(absl::StrCat("Failed writing ", tmp.string()));
  }
  std::error_code ec;
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code cleanup;
    std::filesystem::remove(tmp, cleanup);
    return absl::InternalError(absl::StrCat("Failed to store blob ", key, ": ", ec.message()));
  }
  return absl::OkStatus();
}

absl::Status FileBlobStore::Delete(const std::string& key) {
  ASSIGN_OR_RETURN(auto path, Resolve(key));
  std::error_code ec;
  std::filesystem::remove(path, ec);
  if (ec) return absl::InternalError(absl::StrCat("Failed to delete blob ", key, ": ", ec.message()));
  return absl::OkStatus();
}

}  // namespace scratchdb
