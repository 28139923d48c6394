#include "scratchdb/processing_cycle.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

#include "scratchdb/digest.h"
#include "scratchdb/schema_summary.h"
#include "scratchdb/status_macros.h"

namespace scratchdb {

nlohmann::json CycleReport::ToJson() const {
  nlohmann::json j;
  j["agent_id"] = agent_id;
  j["kanban"] = kanban.ToJson();
  j["skills"] = skills.ToJson();
  j["config"] = config.ToJson();
  if (board.has_value()) j["board"] = board->ToJson();
  j["digest"] = digest_summary;
  j["persist"] = PersistOutcomeName(persist);
  return j;
}

ProcessingCycle::ProcessingCycle(StorageLifecycle* storage, RecordStore* store, Config config)
    : storage_(storage), store_(store), config_(std::move(config)) {}

ProcessingCycle::~ProcessingCycle() {
  if (database_ != nullptr) End();
}

absl::Status ProcessingCycle::Begin(const std::string& agent_id) {
  if (database_ != nullptr) return absl::FailedPreconditionError("Cycle already started");
  ASSIGN_OR_RETURN(agent_, store_->GetAgent(agent_id));
  ASSIGN_OR_RETURN(database_, storage_->Restore(agent_id));

  auto session_or = GuardedSession::Open(database_->path(), SessionOptions::FromConfig(config_));
  if (!session_or.ok()) {
    LOG(ERROR) << "Failed to open scratch database for agent " << agent_id << ": " << session_or.status().message();
    database_.reset();
    return session_or.status();
  }
  session_ = std::move(*session_or);
  auto executor_or = BatchExecutor::Create(session_.get(), config_);
  if (!executor_or.ok()) {
    session_.reset();
    database_.reset();
    return executor_or.status();
  }
  executor_ = std::move(*executor_or);

  kanban_ = std::make_unique<KanbanSync>(session_.get(), store_, agent_, KanbanDomain(store_, agent_));
  skills_ = std::make_unique<SkillSync>(session_.get(), store_, agent_, SkillDomain(store_, agent_));
  agent_config_ =
      std::make_unique<AgentConfigSync>(session_.get(), store_, agent_, AgentConfigDomain(store_, agent_));

  // A mirror that fails to seed is simply absent for this cycle.
  absl::Status seeded = kanban_->Seed();
  if (!seeded.ok()) LOG(WARNING) << "Kanban mirror unavailable for agent " << agent_id;
  seeded = skills_->Seed();
  if (!seeded.ok()) LOG(WARNING) << "Skill mirror unavailable for agent " << agent_id;
  seeded = agent_config_->Seed();
  if (!seeded.ok()) LOG(WARNING) << "Agent config mirror unavailable for agent " << agent_id;

  LOG(INFO) << "Cycle started for agent " << agent_id << " at " << database_->path();
  return absl::OkStatus();
}

absl::Status ProcessingCycle::StoreToolResults(const std::vector<ToolResultRecord>& results) {
  if (!active()) return absl::FailedPreconditionError("Cycle is not active");
  return ToolResultCache(config_.tool_result_stored_bytes).Store(session_.get(), results);
}

BatchResponse ProcessingCycle::InactiveResponse() {
  BatchResponse response;
  response.error = BatchError{0, "", "unavailable", "No scratch database is open for this cycle.", ""};
  response.message = response.error->message;
  return response;
}

BatchResponse ProcessingCycle::ExecuteBatch(const BatchRequest& request) {
  if (!active()) return InactiveResponse();
  return executor_->ExecuteBatch(request);
}

BatchResponse ProcessingCycle::ExecuteSingle(const std::string& sql, bool will_continue_work) {
  if (!active()) return InactiveResponse();
  return executor_->ExecuteSingle(sql, will_continue_work);
}

std::string ProcessingCycle::SchemaSummary() {
  if (!active()) return "SQLite database is not available.";
  return BuildSchemaSummary(session_.get(), SchemaSummaryOptions::FromConfig(config_));
}

std::string ProcessingCycle::DigestPrompt() {
  if (!active()) return ErrorDigest("database not available").ToPrompt();
  return Digestor(DigestOptions::FromConfig(config_)).Digest(session_.get()).ToPrompt();
}

CycleReport ProcessingCycle::End() {
  CycleReport report;
  report.agent_id = agent_.agent_id;
  if (database_ == nullptr) return report;

  if (active()) {
    report.kanban = kanban_->Apply();
    report.skills = skills_->Apply();
    report.config = agent_config_->Apply();
    for (const SyncResult* result : {&report.kanban, &report.skills, &report.config}) {
      for (const auto& error : result->errors) {
        LOG(WARNING) << result->domain << " sync for agent " << agent_.agent_id << ": " << error;
      }
    }
    if (!report.kanban.changes.empty()) {
      auto board_or = BuildBoardSnapshot(store_, agent_);
      if (board_or.ok()) {
        report.board = *std::move(board_or);
      } else {
        LOG(WARNING) << "Board snapshot failed for agent " << agent_.agent_id << ": " << board_or.status().message();
      }
    }
    report.digest_summary = Digestor(DigestOptions::FromConfig(config_)).Digest(session_.get()).SummaryLine();
  }

  kanban_.reset();
  skills_.reset();
  agent_config_.reset();
  executor_.reset();
  session_.reset();

  report.persist = storage_->Persist(agent_.agent_id, database_.get());
  LOG(INFO) << "Cycle ended for agent " << agent_.agent_id << ": " << PersistOutcomeName(report.persist);
  database_.reset();
  return report;
}

}  // namespace scratchdb
