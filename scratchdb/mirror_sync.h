#ifndef SCRATCHDB_MIRROR_SYNC_H_
#define SCRATCHDB_MIRROR_SYNC_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "nlohmann/json.hpp"

#include "scratchdb/guarded_session.h"
#include "scratchdb/record_store.h"
#include "scratchdb/record_types.h"

namespace scratchdb {

// One entry of the change timeline reported to the host.
struct ChangeEvent {
  std::string id;
  std::string label;
  std::string action;  // created, started, completed, updated, archived, deleted
  std::string from;
  std::string to;
};

struct SyncResult {
  std::string domain;
  std::vector<std::string> created_ids;
  std::vector<std::string> updated_ids;
  std::vector<std::string> removed_ids;
  // removed_ids split by the state the record was in when it went away.
  std::vector<std::string> archived_ids;  // terminal state, expected cleanup
  std::vector<std::string> deleted_ids;   // still active, work discarded
  std::vector<std::string> errors;
  std::vector<ChangeEvent> changes;
  bool changed = false;

  nlohmann::json ToJson() const;
};

// Rows read back from a mirror table. Keys of rows that failed to parse are
// protected: their baseline records are never treated as removed.
template <typename Record>
struct MirrorRead {
  std::vector<Record> rows;
  std::vector<std::string> errors;
  absl::flat_hash_set<std::string> protected_keys;
};

/**
 * @brief Seed, diff and apply one mirror table against the record store.
 *
 * `Domain` supplies the shape of one record family:
 *
 *   using Record = ...;
 *   const char* Label() const;                       // "Kanban", used in messages
 *   const char* TableName() const;
 *   std::string CreateTableSql() const;
 *   absl::StatusOr<std::vector<Record>> LoadDurable();
 *   absl::Status InsertMirrorRow(GuardedSession*, const Record&);
 *   absl::StatusOr<MirrorRead<Record>> ReadMirror(GuardedSession*);
 *   std::string Key(const Record&) const;
 *   bool IsWellFormedKey(const std::string&) const;
 *   std::string Owner(const Record&) const;
 *   bool SameContent(const Record&, const Record&) const;
 *   bool IsTerminal(const Record&) const;
 *   absl::Status BeginApply();
 *   absl::StatusOr<std::optional<std::string>> Create(const Record&, const Baseline&, SyncResult*);
 *   absl::StatusOr<std::optional<std::string>> Update(const Record& before, const Record& after, SyncResult*);
 *   absl::StatusOr<bool> Remove(const Record&, SyncResult*);
 *
 * Create and Update return the id to report when they applied a change, or
 * nullopt after recording a validation error in the result. Remove returns
 * whether a durable record went away. Hooks append their own ChangeEvents.
 * Any non-OK status aborts the whole domain transaction.
 */
template <typename Domain>
class MirrorSync {
 public:
  using Record = typename Domain::Record;
  using Baseline = absl::flat_hash_map<std::string, Record>;

  MirrorSync(GuardedSession* session, RecordStore* store, AgentIdentity agent, Domain domain)
      : session_(session), store_(store), agent_(std::move(agent)), domain_(std::move(domain)) {}

  // Recreates the mirror table from durable records and captures the baseline.
  absl::Status Seed();

  // Diffs the mirror against the baseline, applies the delta in one store
  // transaction and drops the mirror. Errors are reported in the result.
  SyncResult Apply();

  bool seeded() const { return seeded_; }
  const Baseline& baseline() const { return baseline_; }
  Domain& domain() { return domain_; }

 private:
  absl::Status SeedImpl();
  absl::Status ApplyDelta(const MirrorRead<Record>& current, SyncResult* result);
  void Teardown();

  GuardedSession* session_;
  RecordStore* store_;
  AgentIdentity agent_;
  Domain domain_;
  Baseline baseline_;
  std::vector<std::string> baseline_order_;
  bool seeded_ = false;
};

template <typename Domain>
absl::Status MirrorSync<Domain>::Seed() {
  seeded_ = false;
  baseline_.clear();
  baseline_order_.clear();
  absl::Status status = SeedImpl();
  if (!status.ok()) {
    LOG(WARNING) << domain_.Label() << " seed failed for agent " << agent_.agent_id << ": " << status.message();
    if (session_->InTransaction()) {
      absl::Status rollback = session_->ExecuteScript("ROLLBACK;");
      if (!rollback.ok()) LOG(WARNING) << "Seed rollback failed: " << rollback.message();
    }
    Teardown();
    return status;
  }
  seeded_ = true;
  return absl::OkStatus();
}

template <typename Domain>
absl::Status MirrorSync<Domain>::SeedImpl() {
  auto records_or = domain_.LoadDurable();
  if (!records_or.ok()) return records_or.status();

  absl::Status status =
      session_->ExecuteScript(absl::StrCat("DROP TABLE IF EXISTS \"", domain_.TableName(), "\";"));
  if (!status.ok()) return status;
  status = session_->ExecuteScript(domain_.CreateTableSql());
  if (!status.ok()) return status;

  status = session_->ExecuteScript("BEGIN;");
  if (!status.ok()) return status;
  for (const auto& record : *records_or) {
    status = domain_.InsertMirrorRow(session_, record);
    if (!status.ok()) return status;
  }
  status = session_->ExecuteScript("COMMIT;");
  if (!status.ok()) return status;

  // The baseline is read back through the mirror so defaults and
  // normalization match what the diff will see.
  auto read_or = domain_.ReadMirror(session_);
  if (!read_or.ok()) return read_or.status();
  for (const auto& error : read_or->errors) {
    LOG(WARNING) << domain_.Label() << " seed row: " << error;
  }
  for (auto& row : read_or->rows) {
    std::string key = domain_.Key(row);
    if (baseline_.emplace(key, row).second) baseline_order_.push_back(key);
  }
  return absl::OkStatus();
}

template <typename Domain>
SyncResult MirrorSync<Domain>::Apply() {
  SyncResult result;
  result.domain = domain_.Label();
  if (!seeded_) {
    Teardown();
    return result;
  }

  auto current_or = domain_.ReadMirror(session_);
  if (!current_or.ok()) {
    result.errors.push_back(
        absl::StrCat("Failed to read ", domain_.TableName(), ": ", current_or.status().message()));
    Teardown();
    seeded_ = false;
    return result;
  }
  result.errors = current_or->errors;

  SyncResult staged = result;
  absl::Status status = store_->RunInTransaction([&]() { return ApplyDelta(*current_or, &staged); });
  if (status.ok()) {
    result = std::move(staged);
  } else {
    result.errors = {absl::StrCat(domain_.Label(), " apply aborted: ", status.message())};
    LOG(ERROR) << domain_.Label() << " apply aborted for agent " << agent_.agent_id << ": " << status.message();
  }
  result.changed = !result.created_ids.empty() || !result.updated_ids.empty() || !result.removed_ids.empty();

  Teardown();
  seeded_ = false;
  baseline_.clear();
  baseline_order_.clear();
  return result;
}

template <typename Domain>
absl::Status MirrorSync<Domain>::ApplyDelta(const MirrorRead<Record>& current, SyncResult* result) {
  absl::Status status = domain_.BeginApply();
  if (!status.ok()) return status;

  const std::string label = domain_.Label();
  absl::flat_hash_set<std::string> current_keys;
  for (const auto& row : current.rows) {
    std::string key = domain_.Key(row);
    if (!current_keys.insert(key).second) {
      result->errors.push_back(absl::StrCat(label, " row ignored: duplicate key ", key));
      continue;
    }
    auto it = baseline_.find(key);
    if (it == baseline_.end()) {
      if (!domain_.IsWellFormedKey(key)) {
        result->errors.push_back(absl::StrCat(label, " create ignored for invalid key: ", key));
        continue;
      }
      if (domain_.Owner(row) != agent_.agent_id) {
        result->errors.push_back(
            absl::StrCat(label, " create denied for ", key, ": only records assigned to this agent may be created."));
        continue;
      }
      auto created_or = domain_.Create(row, baseline_, result);
      if (!created_or.ok()) return created_or.status();
      if (created_or->has_value()) result->created_ids.push_back(**created_or);
      continue;
    }

    const Record& before = it->second;
    if (domain_.SameContent(before, row)) continue;
    if (domain_.Owner(before) != agent_.agent_id) {
      result->errors.push_back(
          absl::StrCat(label, " update denied for ", key, ": only records assigned to this agent may be updated."));
      continue;
    }
    if (domain_.Owner(row) != domain_.Owner(before)) {
      result->errors.push_back(
          absl::StrCat(label, " update denied for ", key, ": the owner cannot be changed by the agent."));
      continue;
    }
    auto updated_or = domain_.Update(before, row, result);
    if (!updated_or.ok()) return updated_or.status();
    if (updated_or->has_value()) result->updated_ids.push_back(**updated_or);
  }

  for (const auto& key : baseline_order_) {
    if (current_keys.contains(key) || current.protected_keys.contains(key)) continue;
    const Record& before = baseline_.at(key);
    if (domain_.Owner(before) != agent_.agent_id) {
      result->errors.push_back(
          absl::StrCat(label, " removal denied for ", key, ": only records assigned to this agent may be removed."));
      continue;
    }
    auto removed_or = domain_.Remove(before, result);
    if (!removed_or.ok()) return removed_or.status();
    if (!*removed_or) continue;
    result->removed_ids.push_back(key);
    if (domain_.IsTerminal(before)) {
      result->archived_ids.push_back(key);
    } else {
      result->deleted_ids.push_back(key);
    }
  }
  return absl::OkStatus();
}

template <typename Domain>
void MirrorSync<Domain>::Teardown() {
  absl::Status status =
      session_->ExecuteScript(absl::StrCat("DROP TABLE IF EXISTS \"", domain_.TableName(), "\";"));
  if (!status.ok()) {
    LOG(ERROR) << "Failed to drop " << domain_.TableName() << " for agent " << agent_.agent_id << ": "
               << status.message();
  }
}

}  // namespace scratchdb

#endif  // SCRATCHDB_MIRROR_SYNC_H_
