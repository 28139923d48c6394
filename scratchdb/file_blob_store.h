#ifndef SCRATCHDB_FILE_BLOB_STORE_H_
#define SCRATCHDB_FILE_BLOB_STORE_H_

#include <filesystem>
#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "scratchdb/blob_store.h"

namespace scratchdb {

/**
 * @brief BlobStore backed by a local directory.
 *
 * Each key maps to `<root>/<key>`. Keys that are absolute or contain a ".."
 * segment are rejected with InvalidArgumentError. Put writes a sibling
 * temp file and renames it into place.
 */
class FileBlobStore : public BlobStore {
 public:
  explicit FileBlobStore(std::string root) : root_(std::move(root)) {}

  absl::StatusOr<bool> Exists(const std::string& key) override;
  absl::StatusOr<std::string> Get(const std::string& key) override;
  absl::Status Put(const std::string& key, const std::string& bytes) override;
  absl::Status Delete(const std::string& key) override;

  const std::filesystem::path& root() const { return root_; }

 private:
  absl::StatusOr<std::filesystem::path> Resolve(const std::string& key) const;

  std::filesystem::path root_;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_FILE_BLOB_STORE_H_
