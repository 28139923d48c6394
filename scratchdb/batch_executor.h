#ifndef SCRATCHDB_BATCH_EXECUTOR_H_
#define SCRATCHDB_BATCH_EXECUTOR_H_

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "nlohmann/json.hpp"

#include "scratchdb/config.h"
#include "scratchdb/guarded_session.h"
#include "scratchdb/sql_value.h"
#include "scratchdb/statement_classifier.h"

namespace scratchdb {

struct StatementResult {
  int index = 0;  // position in execution order
  int entry = 0;  // position in the caller's statement list
  std::string sql;
  StatementKind kind = StatementKind::kRead;
  bool has_rows = false;  // the statement produced a result set
  std::vector<std::string> columns;
  std::vector<std::vector<SqlValue>> rows;
  bool truncated = false;
  int64_t changes = 0;
  std::optional<int64_t> last_insert_rowid;
  int64_t elapsed_ms = 0;

  nlohmann::json ToJson() const;
};

struct BatchError {
  int index = 0;  // position in execution order
  // Position in the caller's statement list; `part` is the failing statement
  // within that entry when the entry held `parts` > 1 statements.
  int entry = 0;
  int part = 0;
  int parts = 1;
  std::string sql;
  std::string code;  // blocked, invalid_input, syntax_error, constraint_violation, ...
  std::string message;
  std::string hint;

  nlohmann::json ToJson() const;
};

struct BatchRequest {
  std::vector<std::string> statements;  // each entry may hold several statements
  bool will_continue_work = true;
};

struct BatchResponse {
  bool ok = false;
  // Successful statements only, in execution order. When `error` is set its
  // index equals results.size().
  std::vector<StatementResult> results;
  std::optional<BatchError> error;
  double db_size_mb = 0.0;
  std::vector<std::string> warnings;
  std::string message;
  bool continuation_allowed = false;

  // Payload handed back to the agent tool layer.
  nlohmann::json ToJson() const;
};

/**
 * @brief Runs agent SQL against a GuardedSession, one statement at a time.
 *
 * Each statement commits on its own, so work done before a failure stays.
 * The first blocked, malformed or failing statement stops the batch.
 */
class BatchExecutor {
 public:
  static absl::StatusOr<std::unique_ptr<BatchExecutor>> Create(GuardedSession* session,
                                                               const Config& config = Config());

  BatchResponse ExecuteBatch(const BatchRequest& request);

  // Same contract for exactly one statement; several statements in `sql` is an error.
  BatchResponse ExecuteSingle(const std::string& sql, bool will_continue_work = true);

  // Normalizes typographic quotes and backslash-escaped apostrophes.
  static std::string SanitizeSql(const std::string& sql);
  // Short actionable advice for a known engine error text, or "".
  static std::string HintForError(const std::string& message);
  static std::string ErrorCode(const absl::Status& status);

 private:
  BatchExecutor(GuardedSession* session, const Config& config) : session_(session), config_(config) {}

  // Fills *result on success; returns the failure otherwise.
  std::optional<BatchError> RunStatement(int index, const std::string& sql, StatementResult* result);
  void Finish(BatchResponse* response, bool will_continue_work);

  GuardedSession* session_;
  Config config_;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_BATCH_EXECUTOR_H_
