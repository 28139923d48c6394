#ifndef SCRATCHDB_STATEMENT_H_
#define SCRATCHDB_STATEMENT_H_

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include <sqlite3.h>

#include "scratchdb/sql_value.h"

namespace scratchdb {

// Converts an engine result code into a status, keeping the engine message.
// INTERRUPT maps to DeadlineExceeded, AUTH to PermissionDenied, CONSTRAINT to
// FailedPrecondition, BUSY/LOCKED to Unavailable and ERROR to InvalidArgument.
absl::Status SqliteStatus(sqlite3* db, int rc, const std::string& context = "");

// Double-quotes an identifier for interpolation into SQL text.
std::string QuoteIdentifier(const std::string& name);

// Notified when a prepared statement takes its first step. GuardedSession uses
// this to arm the per-statement timeout.
class StatementObserver {
 public:
  virtual ~StatementObserver() = default;
  virtual void OnStatementStart() = 0;
};

struct StmtDeleter {
  void operator()(sqlite3_stmt* stmt) const {
    if (stmt) sqlite3_finalize(stmt);
  }
};
using UniqueStmt = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql, StatementObserver* observer = nullptr)
      : db_(db), sql_(sql), observer_(observer) {}

  absl::Status Prepare();
  absl::Status BindInt(int index, int value);
  absl::Status BindInt64(int index, int64_t value);
  absl::Status BindDouble(int index, double value);
  absl::Status BindText(int index, const std::string& value);
  absl::Status BindBlob(int index, const std::string& value);
  absl::Status BindNull(int index);
  absl::Status BindValue(int index, const SqlValue& value);

  absl::Status Bind(int index, int value) { return BindInt(index, value); }
  absl::Status Bind(int index, int64_t value) { return BindInt64(index, value); }
  absl::Status Bind(int index, double value) { return BindDouble(index, value); }
  absl::Status Bind(int index, bool value) { return BindInt(index, value ? 1 : 0); }
  absl::Status Bind(int index, const std::string& value) { return BindText(index, value); }
  absl::Status Bind(int index, const char* value) { return BindText(index, value ? value : ""); }
  absl::Status Bind(int index, std::nullptr_t) { return BindNull(index); }
  absl::Status Bind(int index, const SqlValue& value) { return BindValue(index, value); }

  template <typename... Args>
  absl::Status BindAll(Args&&... args) {
    return BindRecursive(1, std::forward<Args>(args)...);
  }

  absl::StatusOr<bool> Step();  // true when a row is available (SQLITE_ROW)
  absl::Status Run();           // for statements that return no rows
  absl::Status Reset();

  int ColumnInt(int index);
  int64_t ColumnInt64(int index);
  double ColumnDouble(int index);
  std::string ColumnText(int index);
  int ColumnType(int index);
  bool ColumnIsNull(int index) { return ColumnType(index) == SQLITE_NULL; }
  SqlValue ColumnValue(int index);
  const char* ColumnName(int index);
  int ColumnCount();
  std::vector<std::string> ColumnNames();

  // True when the statement cannot modify the database (sqlite3_stmt_readonly).
  bool IsReadOnly();
  // Unconsumed SQL after the first statement, as reported by the engine.
  const std::string& tail() const { return tail_; }
  const std::string& sql() const { return sql_; }

 private:
  absl::Status BindRecursive(int /*index*/) { return absl::OkStatus(); }

  template <typename T, typename... Rest>
  absl::Status BindRecursive(int index, T&& first, Rest&&... rest) {
    auto status = Bind(index, std::forward<T>(first));
    if (!status.ok()) return status;
    return BindRecursive(index + 1, std::forward<Rest>(rest)...);
  }

  sqlite3* db_;
  std::string sql_;
  std::string tail_;
  StatementObserver* observer_;
  bool started_ = false;
  UniqueStmt stmt_;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_STATEMENT_H_
