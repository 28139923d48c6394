#ifndef SCRATCHDB_GUARDED_SESSION_H_
#define SCRATCHDB_GUARDED_SESSION_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include <sqlite3.h>

#include "scratchdb/config.h"
#include "scratchdb/sandbox_policy.h"
#include "scratchdb/statement.h"

namespace scratchdb {

struct SessionOptions {
  absl::Duration timeout = absl::Milliseconds(kDefaultQueryTimeoutMs);
  int progress_ops = kDefaultProgressOps;
  SandboxPolicy policy = SandboxPolicy::Default();

  static SessionOptions FromConfig(const Config& config);
  static SessionOptions ForMaintenance(const Config& config);
};

/**
 * @brief A sandboxed connection to one scratch database file.
 *
 * The authorizer rejects denied actions, functions and pragmas while a
 * statement compiles. A progress handler aborts any statement that runs past
 * the timeout; the clock re-arms on the first step of every statement. All of
 * that state lives in this object and goes away with it.
 *
 * Not thread-safe: one session serves one processing cycle.
 */
class GuardedSession : public StatementObserver {
 public:
  static absl::StatusOr<std::unique_ptr<GuardedSession>> Open(const std::string& path,
                                                              SessionOptions options = SessionOptions());
  ~GuardedSession() override;

  GuardedSession(const GuardedSession&) = delete;
  GuardedSession& operator=(const GuardedSession&) = delete;

  // Lexical pre-check. Callers must not execute `sql` when a reason is returned.
  static std::optional<std::string> GuardStatementText(const std::string& sql);

  absl::StatusOr<std::unique_ptr<Statement>> Prepare(const std::string& sql);

  template <typename... Args>
  absl::Status Execute(const std::string& sql, Args&&... args) {
    auto stmt_or = Prepare(sql);
    if (!stmt_or.ok()) return stmt_or.status();
    auto bind_status = (*stmt_or)->BindAll(std::forward<Args>(args)...);
    if (!bind_status.ok()) return bind_status;
    return (*stmt_or)->Run();
  }

  // Runs a multi-statement script. Internal use only; agent SQL goes through
  // BatchExecutor so each statement is guarded and classified.
  absl::Status ExecuteScript(const std::string& sql);

  // First column of the first row, or NotFound when there is no row.
  absl::StatusOr<int64_t> QueryInt64(const std::string& sql);

  int64_t Changes() const;
  int64_t LastInsertRowId() const;
  bool InTransaction() const;
  absl::StatusOr<bool> TableExists(const std::string& name);

  // Size of the database file on disk, 0 when it does not exist yet.
  int64_t FileSizeBytes() const;

  const std::string& path() const { return path_; }
  const SessionOptions& options() const { return options_; }
  bool timed_out() const { return timed_out_; }

  void OnStatementStart() override;

 private:
  struct DbDeleter {
    void operator()(sqlite3* db) const {
      if (db) sqlite3_close_v2(db);
    }
  };

  GuardedSession(std::string path, SessionOptions options) : path_(std::move(path)), options_(std::move(options)) {}

  absl::Status Configure();

  static int AuthorizerCallback(void* self, int action, const char* arg1, const char* arg2, const char* db_name,
                                const char* trigger);
  static int ProgressCallback(void* self);

  std::string path_;
  SessionOptions options_;
  std::unique_ptr<sqlite3, DbDeleter> db_;
  std::optional<absl::Time> statement_started_;
  bool timed_out_ = false;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_GUARDED_SESSION_H_
