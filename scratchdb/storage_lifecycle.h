#ifndef SCRATCHDB_STORAGE_LIFECYCLE_H_
#define SCRATCHDB_STORAGE_LIFECYCLE_H_

#include <memory>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "scratchdb/blob_store.h"
#include "scratchdb/config.h"

namespace scratchdb {

// "agent_state/<h[0:2]>/<h[2:4]>/<agent_id>.db.gz", where h is the id
// without dashes.
std::string StorageKey(const std::string& agent_id);

enum class PersistOutcome {
  kPersisted,  // archive replaced
  kWiped,      // over the hard ceiling; archive deleted, nothing written
  kSkipped,    // no database file to persist
  kFailed,     // compression or upload failed; prior archive may remain
};

const char* PersistOutcomeName(PersistOutcome outcome);

/**
 * @brief The scratch database file of one processing cycle.
 *
 * Owns a private temporary directory holding `state.db`. The directory and
 * everything in it are removed when this object is destroyed.
 */
class ScratchDatabase {
 public:
  static absl::StatusOr<std::unique_ptr<ScratchDatabase>> Create(const std::string& agent_id);
  ~ScratchDatabase();

  ScratchDatabase(const ScratchDatabase&) = delete;
  ScratchDatabase& operator=(const ScratchDatabase&) = delete;

  const std::string& agent_id() const { return agent_id_; }
  const std::string& directory() const { return directory_; }
  const std::string& path() const { return path_; }

  // Set once the cycle has handed the file back to storage. A released
  // database must not be opened again.
  bool released() const { return released_; }
  void MarkReleased() { released_ = true; }

 private:
  ScratchDatabase(std::string agent_id, std::string directory);

  std::string agent_id_;
  std::string directory_;
  std::string path_;
  bool released_ = false;
};

/**
 * @brief Restores the scratch database before a cycle and persists it after.
 *
 * Both directions degrade instead of failing: a corrupt archive restores as an
 * empty database, and a failed upload is logged and reported as kFailed.
 */
class StorageLifecycle {
 public:
  StorageLifecycle(BlobStore* blobs, Config config) : blobs_(blobs), config_(std::move(config)) {}

  // Only failing to create the temporary directory is an error.
  absl::StatusOr<std::unique_ptr<ScratchDatabase>> Restore(const std::string& agent_id);

  // Drops the ephemeral tables, compacts, then uploads or wipes. The
  // database is marked released on every path.
  PersistOutcome Persist(const std::string& agent_id, ScratchDatabase* database);

 private:
  absl::Status RestoreArchive(const std::string& key, const std::string& path);
  absl::Status Compact(const std::string& path);
  absl::Status Upload(const std::string& key, const std::string& path);

  BlobStore* blobs_;
  Config config_;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_STORAGE_LIFECYCLE_H_
