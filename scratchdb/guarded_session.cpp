#include "scratchdb/guarded_session.h"

#include <filesystem>
#include <system_error>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/time/clock.h"

#include "scratchdb/sql_functions.h"
#include "scratchdb/statement_classifier.h"
#include "scratchdb/status_macros.h"

namespace scratchdb {

SessionOptions SessionOptions::FromConfig(const Config& config) {
  SessionOptions options;
  options.timeout = config.query_timeout;
  options.progress_ops = config.progress_ops;
  return options;
}

SessionOptions SessionOptions::ForMaintenance(const Config& config) {
  SessionOptions options = FromConfig(config);
  options.policy = SandboxPolicy::Maintenance();
  return options;
}

absl::StatusOr<std::unique_ptr<GuardedSession>> GuardedSession::Open(const std::string& path,
                                                                     SessionOptions options) {
  std::unique_ptr<GuardedSession> session(new GuardedSession(path, std::move(options)));
  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open_v2(path.c_str(), &raw_db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  session->db_.reset(raw_db);
  if (rc != SQLITE_OK) {
    absl::Status status = SqliteStatus(raw_db, rc, absl::StrCat("Failed to open ", path));
    LOG(ERROR) << status.message();
    return status;
  }
  RETURN_IF_ERROR(session->Configure());
  return session;
}

absl::Status GuardedSession::Configure() {
  sqlite3* db = db_.get();
  // Set before the authorizer goes in; the policy denies this pragma afterwards.
  RETURN_IF_ERROR(ExecuteScript("PRAGMA temp_store = MEMORY;"));

  int rc = sqlite3_db_config(db, SQLITE_DBCONFIG_ENABLE_LOAD_EXTENSION, 0, nullptr);
  if (rc != SQLITE_OK) return SqliteStatus(db, rc, "Failed to disable extension loading");
  rc = sqlite3_db_config(db, SQLITE_DBCONFIG_DEFENSIVE, 1, nullptr);
  if (rc != SQLITE_OK) LOG(WARNING) << "SQLITE_DBCONFIG_DEFENSIVE unavailable: " << sqlite3_errstr(rc);

  if (!options_.policy.allow_attach) sqlite3_limit(db, SQLITE_LIMIT_ATTACHED, 0);
  sqlite3_busy_timeout(db, 2000);

  RETURN_IF_ERROR(RegisterSafeFunctions(db));

  rc = sqlite3_set_authorizer(db, &GuardedSession::AuthorizerCallback, this);
  if (rc != SQLITE_OK) {
    LOG(ERROR) << "Failed to enable SQLite guardrails for " << path_;
    return absl::FailedPreconditionError(
        absl::StrCat("Failed to enable SQLite guardrails: ", sqlite3_errstr(rc)));
  }
  sqlite3_progress_handler(db, options_.progress_ops, &GuardedSession::ProgressCallback, this);
  return absl::OkStatus();
}

GuardedSession::~GuardedSession() {
  if (db_) {
    sqlite3_progress_handler(db_.get(), 0, nullptr, nullptr);
    sqlite3_set_authorizer(db_.get(), nullptr, nullptr);
  }
  statement_started_.reset();
}

std::optional<std::string> GuardedSession::GuardStatementText(const std::string& sql) {
  return GetBlockedStatementReason(sql);
}

absl::StatusOr<std::unique_ptr<Statement>> GuardedSession::Prepare(const std::string& sql) {
  auto stmt = std::make_unique<Statement>(db_.get(), sql, this);
  RETURN_IF_ERROR(stmt->Prepare());
  return stmt;
}

absl::Status GuardedSession::ExecuteScript(const std::string& sql) {
  OnStatementStart();
  char* err = nullptr;
  int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string message = err ? err : sqlite3_errstr(rc);
    sqlite3_free(err);
    LOG(WARNING) << "Script error: " << message;
    return SqliteStatus(db_.get(), rc);
  }
  return absl::OkStatus();
}

absl::StatusOr<int64_t> GuardedSession::QueryInt64(const std::string& sql) {
  ASSIGN_OR_RETURN(auto stmt, Prepare(sql));
  ASSIGN_OR_RETURN(bool has_row, stmt->Step());
  if (!has_row) return absl::NotFoundError(absl::StrCat("No rows: ", sql));
  return stmt->ColumnInt64(0);
}

int64_t GuardedSession::Changes() const { return sqlite3_changes64(db_.get()); }

int64_t GuardedSession::LastInsertRowId() const { return sqlite3_last_insert_rowid(db_.get()); }

bool GuardedSession::InTransaction() const { return sqlite3_get_autocommit(db_.get()) == 0; }

absl::StatusOr<bool> GuardedSession::TableExists(const std::string& name) {
  ASSIGN_OR_RETURN(auto stmt, Prepare("SELECT 1 FROM sqlite_master WHERE type = 'table' AND name = ?"));
  RETURN_IF_ERROR(stmt->BindText(1, name));
  return stmt->Step();
}

int64_t GuardedSession::FileSizeBytes() const {
  std::error_code ec;
  auto size = std::filesystem::file_size(path_, ec);
  if (ec) return 0;
  return static_cast<int64_t>(size);
}

void GuardedSession::OnStatementStart() {
  statement_started_ = absl::Now();
  timed_out_ = false;
}

int GuardedSession::AuthorizerCallback(void* self, int action, const char* arg1, const char* arg2,
                                       const char* /*db_name*/, const char* /*trigger*/) {
  return static_cast<GuardedSession*>(self)->options_.policy.Authorize(action, arg1, arg2);
}

int GuardedSession::ProgressCallback(void* self) {
  auto* session = static_cast<GuardedSession*>(self);
  if (!session->statement_started_.has_value()) return 0;
  if (absl::Now() - *session->statement_started_ > session->options_.timeout) {
    session->timed_out_ = true;
    return 1;
  }
  return 0;
}

}  // namespace scratchdb
