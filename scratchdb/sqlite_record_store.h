#ifndef SCRATCHDB_SQLITE_RECORD_STORE_H_
#define SCRATCHDB_SQLITE_RECORD_STORE_H_

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/base/thread_annotations.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/synchronization/mutex.h"

#include <sqlite3.h>

#include "scratchdb/record_store.h"
#include "scratchdb/statement.h"

namespace scratchdb {

/**
 * @brief RecordStore backed by a plain SQLite file.
 *
 * Used by the CLI and by tests. The connection is shared and guarded by a
 * mutex; statements are prepared under the lock.
 */
class SqliteRecordStore : public RecordStore {
 public:
  SqliteRecordStore() = default;
  ~SqliteRecordStore() override = default;

  SqliteRecordStore(const SqliteRecordStore&) = delete;
  SqliteRecordStore& operator=(const SqliteRecordStore&) = delete;

  absl::Status Init(const std::string& db_path = ":memory:");

  // Administrative helpers. The agent never reaches these through a mirror.
  absl::Status UpsertAgent(const AgentIdentity& agent);
  // An empty `agent_id` registers a tool every agent can resolve.
  absl::Status RegisterTool(const std::string& tool_id, const std::string& agent_id = "");

  absl::StatusOr<AgentIdentity> GetAgent(const std::string& agent_id) override;

  absl::StatusOr<std::vector<KanbanCard>> ListVisibleCards(const AgentIdentity& agent) override;
  absl::StatusOr<std::optional<KanbanCard>> GetCard(const std::string& card_id) override;
  absl::Status InsertCard(const KanbanCard& card) override;
  absl::Status UpdateCard(const KanbanCard& card, const std::vector<std::string>& fields) override;
  absl::Status DeleteCard(const std::string& card_id) override;

  absl::StatusOr<std::vector<SkillRecord>> ListLatestSkills(const std::string& agent_id) override;
  absl::StatusOr<SkillRecord> InsertSkillVersion(const SkillRecord& skill) override;
  absl::StatusOr<int> DeleteSkill(const std::string& agent_id, const std::string& name) override;
  absl::StatusOr<std::vector<std::string>> ListToolIds(const std::string& agent_id) override;
  // Every stored version of one skill, oldest first.
  absl::StatusOr<std::vector<SkillRecord>> ListSkillVersions(const std::string& agent_id, const std::string& name);

  absl::StatusOr<AgentConfigRecord> GetAgentConfig(const std::string& agent_id) override;
  absl::Status UpdateAgentConfig(const AgentConfigRecord& config) override;

  absl::Status RunInTransaction(const std::function<absl::Status()>& body) override;

  absl::StatusOr<std::unique_ptr<Statement>> Prepare(const std::string& sql);

  template <typename... Args>
  absl::Status Execute(const std::string& sql, Args&&... args) {
    auto stmt_or = Prepare(sql);
    if (!stmt_or.ok()) return stmt_or.status();
    auto bind_status = (*stmt_or)->BindAll(std::forward<Args>(args)...);
    if (!bind_status.ok()) return bind_status;
    return (*stmt_or)->Run();
  }

 private:
  struct DbDeleter {
    void operator()(sqlite3* db) const {
      if (db) sqlite3_close(db);
    }
  };

  int64_t LastInsertRowId();
  int Changes();

  absl::Mutex mu_;
  std::unique_ptr<sqlite3, DbDeleter> db_ ABSL_GUARDED_BY(mu_);
};

}  // namespace scratchdb

#endif  // SCRATCHDB_SQLITE_RECORD_STORE_H_
