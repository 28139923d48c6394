#ifndef SCRATCHDB_BLOB_STORE_H_
#define SCRATCHDB_BLOB_STORE_H_

#include <string>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

namespace scratchdb {

// Object storage holding one compressed archive per agent. Keys are
// slash-separated relative paths. Calls block until complete.
class BlobStore {
 public:
  virtual ~BlobStore() = default;

  virtual absl::StatusOr<bool> Exists(const std::string& key) = 0;
  // NotFoundError when the key is absent.
  virtual absl::StatusOr<std::string> Get(const std::string& key) = 0;
  // Replaces any existing object under `key`.
  virtual absl::Status Put(const std::string& key, const std::string& bytes) = 0;
  // Deleting a missing key is not an error.
  virtual absl::Status Delete(const std::string& key) = 0;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_BLOB_STORE_H_
