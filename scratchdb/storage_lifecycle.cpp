#include "scratchdb/storage_lifecycle.h"

#include <stdlib.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <vector>

#include "absl/log/log.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_replace.h"

#include "scratchdb/compression.h"
#include "scratchdb/constants.h"
#include "scratchdb/guarded_session.h"
#include "scratchdb/statement.h"
#include "scratchdb/status_macros.h"

namespace scratchdb {

namespace {

constexpr char kSqliteHeader[] = "SQLite format 3";
// Persisted databases never exceed the hard limit; restores allow this much more.
constexpr int64_t kRestoreHeadroomBytes = 1024 * 1024;

absl::StatusOr<std::string> ReadWholeFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file.is_open()) return absl::NotFoundError(absl::StrCat("Could not open file: ", path));
  std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if (file.bad()) return absl::DataLossError(absl::StrCat("Failed reading ", path));
  return content;
}

absl::Status WriteWholeFile(const std::string& path, const std::string& bytes) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.is_open()) return absl::InternalError(absl::StrCat("Could not open file for writing: ", path));
  file.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
  if (!file.good()) return absl::InternalError(absl::StrCat("Failed writing ", path));
  return absl::OkStatus();
}

int64_t FileSize(const std::string& path) {
  std::error_code ec;
  auto size = std::filesystem::file_size(path, ec);
  return ec ? 0 : static_cast<int64_t>(size);
}

double ToMb(int64_t bytes) { return static_cast<double>(bytes) / kBytesPerMb; }

}  // namespace

std::string StorageKey(const std::string& agent_id) {
  std::string clean = absl::StrReplaceAll(agent_id, {{"-", ""}});
  return absl::StrCat(kStorageKeyPrefix, "/", clean.substr(0, 2), "/", clean.size() > 2 ? clean.substr(2, 2) : "",
                      "/", agent_id, ".db.gz");
}

const char* PersistOutcomeName(PersistOutcome outcome) {
  switch (outcome) {
    case PersistOutcome::kPersisted:
      return "persisted";
    case PersistOutcome::kWiped:
      return "wiped";
    case PersistOutcome::kSkipped:
      return "skipped";
    case PersistOutcome::kFailed:
      return "failed";
  }
  return "unknown";
}

ScratchDatabase::ScratchDatabase(std::string agent_id, std::string directory)
    : agent_id_(std::move(agent_id)), directory_(std::move(directory)) {
  path_ = (std::filesystem::path(directory_) / kScratchFileName).string();
}

absl::StatusOr<std::unique_ptr<ScratchDatabase>> ScratchDatabase::Create(const std::string& agent_id) {
  std::error_code ec;
  std::filesystem::path base = std::filesystem::temp_directory_path(ec);
  if (ec) return absl::InternalError(absl::StrCat("No temp directory: ", ec.message()));
  std::string pattern = (base / "scratchdb-XXXXXX").string();
  std::vector<char> buffer(pattern.begin(), pattern.end());
  buffer.push_back('\0');
  if (mkdtemp(buffer.data()) == nullptr) {
    return absl::InternalError(absl::StrCat("mkdtemp failed for ", pattern));
  }
  return std::unique_ptr<ScratchDatabase>(new ScratchDatabase(agent_id, buffer.data()));
}

ScratchDatabase::~ScratchDatabase() {
  std::error_code ec;
  std::filesystem::remove_all(directory_, ec);
  if (ec) LOG(WARNING) << "Failed to remove scratch directory " << directory_ << ": " << ec.message();
}

absl::StatusOr<std::unique_ptr<ScratchDatabase>> StorageLifecycle::Restore(const std::string& agent_id) {
  ASSIGN_OR_RETURN(auto database, ScratchDatabase::Create(agent_id));
  std::string key = StorageKey(agent_id);
  absl::Status status = RestoreArchive(key, database->path());
  if (!status.ok()) {
    LOG(WARNING) << "Failed to restore SQLite DB for agent " << agent_id << " - starting fresh: "
                 << status.message();
    std::error_code ec;
    std::filesystem::remove(database->path(), ec);
  }
  return database;
}

absl::Status StorageLifecycle::RestoreArchive(const std::string& key, const std::string& path) {
  ASSIGN_OR_RETURN(bool exists, blobs_->Exists(key));
  if (!exists) return absl::OkStatus();
  ASSIGN_OR_RETURN(std::string archive, blobs_->Get(key));
  int64_t max_bytes = std::max<int64_t>(config_.hard_size_bytes, 0) + kRestoreHeadroomBytes;
  ASSIGN_OR_RETURN(std::string bytes, GzipDecompress(archive, static_cast<size_t>(max_bytes)));
  if (!bytes.empty() && !absl::StartsWith(bytes, kSqliteHeader)) {
    return absl::DataLossError("Archive does not contain a SQLite database");
  }
  RETURN_IF_ERROR(WriteWholeFile(path, bytes));
  LOG(INFO) << "Restored " << key << " (" << bytes.size() << " bytes)";
  return absl::OkStatus();
}

PersistOutcome StorageLifecycle::Persist(const std::string& agent_id, ScratchDatabase* database) {
  database->MarkReleased();
  const std::string& path = database->path();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return PersistOutcome::kSkipped;

  absl::Status compact = Compact(path);
  if (!compact.ok()) {
    LOG(WARNING) << "SQLite maintenance (VACUUM/optimize) failed for agent " << agent_id << ": "
                 << compact.message();
  }

  std::string key = StorageKey(agent_id);
  int64_t size = FileSize(path);
  if (size > config_.hard_size_bytes) {
    LOG(INFO) << "SQLite DB for agent " << agent_id
              << absl::StrFormat(" exceeds %.0fMB (%.2f MB) - wiping database instead of persisting",
                                 ToMb(config_.hard_size_bytes), ToMb(size));
    absl::Status deleted = blobs_->Delete(key);
    if (!deleted.ok()) {
      LOG(ERROR) << "Failed to delete archive for agent " << agent_id << ": " << deleted.message();
      return PersistOutcome::kFailed;
    }
    return PersistOutcome::kWiped;
  }
  if (size > config_.soft_size_bytes) {
    LOG(WARNING) << "SQLite DB for agent " << agent_id << absl::StrFormat(" is %.2f MB", ToMb(size))
                 << "; it is wiped above " << ToMb(config_.hard_size_bytes) << " MB";
  }

  absl::Status uploaded = Upload(key, path);
  if (!uploaded.ok()) {
    LOG(ERROR) << "Failed to persist SQLite DB for agent " << agent_id << ": " << uploaded.message();
    return PersistOutcome::kFailed;
  }
  return PersistOutcome::kPersisted;
}

absl::Status StorageLifecycle::Compact(const std::string& path) {
  ASSIGN_OR_RETURN(auto session, GuardedSession::Open(path, SessionOptions::ForMaintenance(config_)));
  for (const char* table : kEphemeralTables) {
    absl::Status dropped = session->ExecuteScript(absl::StrCat("DROP TABLE IF EXISTS ", QuoteIdentifier(table), ";"));
    if (!dropped.ok()) LOG(WARNING) << "Failed to drop ephemeral table " << table << ": " << dropped.message();
  }
  RETURN_IF_ERROR(session->ExecuteScript("VACUUM;"));
  absl::Status optimized = session->ExecuteScript("PRAGMA optimize;");
  if (!optimized.ok()) LOG(INFO) << "PRAGMA optimize skipped: " << optimized.message();
  return absl::OkStatus();
}

absl::Status StorageLifecycle::Upload(const std::string& key, const std::string& path) {
  ASSIGN_OR_RETURN(std::string bytes, ReadWholeFile(path));
  ASSIGN_OR_RETURN(std::string archive, GzipCompress(bytes));
  RETURN_IF_ERROR(blobs_->Put(key, archive));
  LOG(INFO) << "Persisted " << key << " (" << bytes.size() << " -> " << archive.size() << " bytes)";
  return absl::OkStatus();
}

}  // namespace scratchdb
