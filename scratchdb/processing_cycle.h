#ifndef SCRATCHDB_PROCESSING_CYCLE_H_
#define SCRATCHDB_PROCESSING_CYCLE_H_

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "nlohmann/json.hpp"

#include "scratchdb/batch_executor.h"
#include "scratchdb/config.h"
#include "scratchdb/config_sync.h"
#include "scratchdb/guarded_session.h"
#include "scratchdb/kanban_sync.h"
#include "scratchdb/mirror_sync.h"
#include "scratchdb/record_store.h"
#include "scratchdb/skill_sync.h"
#include "scratchdb/storage_lifecycle.h"
#include "scratchdb/tool_result_cache.h"

namespace scratchdb {

struct CycleReport {
  std::string agent_id;
  SyncResult kanban;
  SyncResult skills;
  SyncResult config;
  // Taken after the Kanban apply when it reported any change events.
  std::optional<KanbanBoardSnapshot> board;
  std::string digest_summary;
  PersistOutcome persist = PersistOutcome::kSkipped;

  nlohmann::json ToJson() const;
};

/**
 * @brief One agent processing cycle over its scratch database.
 *
 * Begin() restores the file, opens the guarded session and seeds the Kanban,
 * skill and config mirrors. The agent then runs SQL through ExecuteBatch() or
 * ExecuteSingle(). End() applies the three mirrors independently, closes the
 * session and persists. The destructor calls End() when the caller did not.
 */
class ProcessingCycle {
 public:
  ProcessingCycle(StorageLifecycle* storage, RecordStore* store, Config config = Config());
  ~ProcessingCycle();

  ProcessingCycle(const ProcessingCycle&) = delete;
  ProcessingCycle& operator=(const ProcessingCycle&) = delete;

  absl::Status Begin(const std::string& agent_id);

  absl::Status StoreToolResults(const std::vector<ToolResultRecord>& results);
  BatchResponse ExecuteBatch(const BatchRequest& request);
  BatchResponse ExecuteSingle(const std::string& sql, bool will_continue_work = true);

  std::string SchemaSummary();
  std::string DigestPrompt();

  CycleReport End();

  bool active() const { return session_ != nullptr; }
  GuardedSession* session() { return session_.get(); }
  const AgentIdentity& agent() const { return agent_; }

 private:
  static BatchResponse InactiveResponse();

  StorageLifecycle* storage_;
  RecordStore* store_;
  Config config_;
  AgentIdentity agent_;

  std::unique_ptr<ScratchDatabase> database_;
  std::unique_ptr<GuardedSession> session_;
  std::unique_ptr<BatchExecutor> executor_;
  std::unique_ptr<KanbanSync> kanban_;
  std::unique_ptr<SkillSync> skills_;
  std::unique_ptr<AgentConfigSync> agent_config_;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_PROCESSING_CYCLE_H_
