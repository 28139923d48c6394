#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "absl/log/initialize.h"
#include "absl/log/log.h"
#include "absl/log/log_sink.h"
#include "absl/log/log_sink_registry.h"
#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

#include "scratchdb/batch_executor.h"
#include "scratchdb/config.h"
#include "scratchdb/file_blob_store.h"
#include "scratchdb/processing_cycle.h"
#include "scratchdb/sqlite_record_store.h"
#include "scratchdb/storage_lifecycle.h"

ABSL_FLAG(std::string, agent_id, "", "Agent whose scratch database is restored and persisted");
ABSL_FLAG(std::string, organization_id, "", "Organization registered for a new agent");
ABSL_FLAG(std::string, user_id, "", "Owning user registered for a new agent");
ABSL_FLAG(std::string, blob_root, "scratchdb_blobs", "Directory holding the compressed archives");
ABSL_FLAG(std::string, records_db, "scratchdb_records.db", "Path to the durable record store");
ABSL_FLAG(std::vector<std::string>, register_tools, {}, "Canonical tool ids to register for the agent");
ABSL_FLAG(std::string, sql, "", "SQL to run; may hold several statements");
ABSL_FLAG(bool, will_continue_work, true, "Whether the agent plans more work after this batch");
ABSL_FLAG(bool, schema, false, "Print the schema summary after the batch");
ABSL_FLAG(bool, digest, false, "Print the database digest after the batch");
ABSL_FLAG(std::string, log, "", "Log file path");

ABSL_FLAG(int, query_timeout_ms, 0, "Per-statement timeout (0 keeps the environment/default value)");
ABSL_FLAG(int, row_limit, 0, "Rows returned per statement (0 keeps the environment/default value)");
ABSL_FLAG(int, hard_size_mb, 0, "Persist ceiling in MB (0 keeps the environment/default value)");
ABSL_FLAG(int, digest_sample_size, 0, "Rows sampled per table by the digest (0 keeps the default)");

namespace {

class FileLogSink : public absl::LogSink {
 public:
  explicit FileLogSink(const std::string& path) : stream_(path, std::ios::app) {
    if (!stream_.is_open()) {
      std::cerr << "Failed to open log file: " << path << std::endl;
    }
  }
  ~FileLogSink() override = default;

  void Send(const absl::LogEntry& entry) override {
    if (stream_.is_open()) {
      std::lock_guard<std::mutex> lock(mu_);
      stream_ << entry.text_message_with_prefix() << "\n";
    }
  }

 private:
  std::mutex mu_;
  std::ofstream stream_;
};

absl::StatusOr<scratchdb::Config> LoadConfig() {
  auto config_or = scratchdb::Config::FromEnv();
  if (!config_or.ok()) return config_or.status();
  scratchdb::Config config = *config_or;
  if (int v = absl::GetFlag(FLAGS_query_timeout_ms); v > 0) config.query_timeout = absl::Milliseconds(v);
  if (int v = absl::GetFlag(FLAGS_row_limit); v > 0) config.row_limit = v;
  if (int v = absl::GetFlag(FLAGS_hard_size_mb); v > 0) config.hard_size_bytes = v * scratchdb::kBytesPerMb;
  if (int v = absl::GetFlag(FLAGS_digest_sample_size); v > 0) config.digest_sample_size = v;
  auto valid = config.Validate();
  if (!valid.ok()) return valid;
  return config;
}

absl::Status EnsureAgent(scratchdb::SqliteRecordStore* store, const std::string& agent_id) {
  auto agent_or = store->GetAgent(agent_id);
  if (agent_or.ok()) return absl::OkStatus();
  if (!absl::IsNotFound(agent_or.status())) return agent_or.status();
  scratchdb::AgentIdentity agent;
  agent.agent_id = agent_id;
  agent.organization_id = absl::GetFlag(FLAGS_organization_id);
  agent.user_id = absl::GetFlag(FLAGS_user_id);
  LOG(INFO) << "Registering agent " << agent_id;
  return store->UpsertAgent(agent);
}

}  // namespace

int main(int argc, char** argv) {
  absl::SetProgramUsageMessage(
      "Runs one processing cycle against an agent's scratch database.\n"
      "  scratchdb_cli --agent_id=<id> [--sql=<sql>] [<statement> ...] [--schema] [--digest]");
  std::vector<char*> positional_args = absl::ParseCommandLine(argc, argv);
  absl::InitializeLog();

  std::string log_path = absl::GetFlag(FLAGS_log);
  std::unique_ptr<FileLogSink> log_sink;
  if (!log_path.empty()) {
    log_sink = std::make_unique<FileLogSink>(log_path);
    absl::AddLogSink(log_sink.get());
  }

  std::string agent_id = absl::GetFlag(FLAGS_agent_id);
  if (agent_id.empty()) {
    std::cerr << "--agent_id is required" << std::endl;
    return 1;
  }

  auto config_or = LoadConfig();
  if (!config_or.ok()) {
    std::cerr << "Configuration error: " << config_or.status().message() << std::endl;
    return 1;
  }

  scratchdb::SqliteRecordStore store;
  auto status = store.Init(absl::GetFlag(FLAGS_records_db));
  if (!status.ok()) {
    LOG(ERROR) << "Failed to open record store: " << status.message();
    return 1;
  }
  status = EnsureAgent(&store, agent_id);
  if (!status.ok()) {
    LOG(ERROR) << "Failed to load agent " << agent_id << ": " << status.message();
    return 1;
  }
  for (const auto& tool_id : absl::GetFlag(FLAGS_register_tools)) {
    status = store.RegisterTool(tool_id, agent_id);
    if (!status.ok()) {
      LOG(ERROR) << "Failed to register tool " << tool_id << ": " << status.message();
      return 1;
    }
  }

  scratchdb::FileBlobStore blobs(absl::GetFlag(FLAGS_blob_root));
  scratchdb::StorageLifecycle storage(&blobs, *config_or);
  scratchdb::ProcessingCycle cycle(&storage, &store, *config_or);
  status = cycle.Begin(agent_id);
  if (!status.ok()) {
    LOG(ERROR) << "Failed to start cycle: " << status.message();
    return 1;
  }

  scratchdb::BatchRequest request;
  request.will_continue_work = absl::GetFlag(FLAGS_will_continue_work);
  if (std::string sql = absl::GetFlag(FLAGS_sql); !sql.empty()) request.statements.push_back(sql);
  for (size_t i = 1; i < positional_args.size(); ++i) request.statements.push_back(positional_args[i]);

  bool batch_ok = true;
  if (!request.statements.empty()) {
    scratchdb::BatchResponse response = cycle.ExecuteBatch(request);
    batch_ok = response.ok;
    std::cout << response.ToJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  }
  if (absl::GetFlag(FLAGS_schema)) std::cout << cycle.SchemaSummary() << std::endl;
  if (absl::GetFlag(FLAGS_digest)) std::cout << cycle.DigestPrompt() << std::endl;

  scratchdb::CycleReport report = cycle.End();
  std::cerr << report.ToJson().dump(2, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
  if (log_sink) absl::RemoveLogSink(log_sink.get());
  return batch_ok && report.persist != scratchdb::PersistOutcome::kFailed ? 0 : 1;
}
