#include "scratchdb/statement.h"

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"

namespace scratchdb {

std::string QuoteIdentifier(const std::string& name) {
  std::string quoted = "\"";
  for (char c : name) {
    if (c == '"') quoted.push_back('"');
    quoted.push_back(c);
  }
  quoted.push_back('"');
  return quoted;
}

absl::Status SqliteStatus(sqlite3* db, int rc, const std::string& context) {
  if (rc == SQLITE_OK || rc == SQLITE_ROW || rc == SQLITE_DONE) return absl::OkStatus();
  std::string message = db != nullptr ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
  if (!context.empty()) message = absl::StrCat(context, ": ", message);
  switch (rc & 0xff) {
    case SQLITE_INTERRUPT:
      return absl::DeadlineExceededError(message);
    case SQLITE_AUTH:
      return absl::PermissionDeniedError(message);
    case SQLITE_CONSTRAINT:
      return absl::FailedPreconditionError(message);
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return absl::UnavailableError(message);
    case SQLITE_ERROR:
    case SQLITE_RANGE:
    case SQLITE_MISMATCH:
    case SQLITE_TOOBIG:
      return absl::InvalidArgumentError(message);
    case SQLITE_FULL:
      return absl::ResourceExhaustedError(message);
    case SQLITE_NOTADB:
    case SQLITE_CORRUPT:
      return absl::DataLossError(message);
    default:
      return absl::InternalError(message);
  }
}

absl::Status Statement::Prepare() {
  sqlite3_stmt* raw_stmt = nullptr;
  const char* tail = nullptr;
  int rc = sqlite3_prepare_v2(db_, sql_.c_str(), -1, &raw_stmt, &tail);
  if (rc != SQLITE_OK) {
    if (raw_stmt) sqlite3_finalize(raw_stmt);
    LOG(WARNING) << "Prepare error: " << sqlite3_errmsg(db_) << " (SQL: " << sql_ << ")";
    return SqliteStatus(db_, rc);
  }
  if (raw_stmt == nullptr) {
    return absl::InvalidArgumentError("Empty statement");
  }
  tail_ = tail ? std::string(tail) : "";
  stmt_.reset(raw_stmt);
  started_ = false;
  return absl::OkStatus();
}

absl::Status Statement::BindInt(int index, int value) {
  return SqliteStatus(db_, sqlite3_bind_int(stmt_.get(), index, value), "BindInt");
}

absl::Status Statement::BindInt64(int index, int64_t value) {
  return SqliteStatus(db_, sqlite3_bind_int64(stmt_.get(), index, value), "BindInt64");
}

absl::Status Statement::BindDouble(int index, double value) {
  return SqliteStatus(db_, sqlite3_bind_double(stmt_.get(), index, value), "BindDouble");
}

absl::Status Statement::BindText(int index, const std::string& value) {
  return SqliteStatus(
      db_, sqlite3_bind_text(stmt_.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
      "BindText");
}

absl::Status Statement::BindBlob(int index, const std::string& value) {
  return SqliteStatus(
      db_, sqlite3_bind_blob(stmt_.get(), index, value.data(), static_cast<int>(value.size()), SQLITE_TRANSIENT),
      "BindBlob");
}

absl::Status Statement::BindNull(int index) {
  return SqliteStatus(db_, sqlite3_bind_null(stmt_.get(), index), "BindNull");
}

absl::Status Statement::BindValue(int index, const SqlValue& value) {
  switch (value.type) {
    case ValueType::kNull:
      return BindNull(index);
    case ValueType::kInteger:
      return BindInt64(index, value.int_value);
    case ValueType::kReal:
      return BindDouble(index, value.real_value);
    case ValueType::kText:
      return BindText(index, value.bytes);
    case ValueType::kBlob:
      return BindBlob(index, value.bytes);
  }
  return absl::InvalidArgumentError("Unknown value type");
}

absl::StatusOr<bool> Statement::Step() {
  if (!stmt_) return absl::FailedPreconditionError("Step on unprepared statement");
  if (!started_) {
    started_ = true;
    if (observer_ != nullptr) observer_->OnStatementStart();
  }
  int rc = sqlite3_step(stmt_.get());
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;
  LOG(WARNING) << "Step error: " << sqlite3_errmsg(db_) << " (SQL: " << sql_ << ")";
  return SqliteStatus(db_, rc);
}

absl::Status Statement::Run() {
  while (true) {
    auto row_or = Step();
    if (!row_or.ok()) return row_or.status();
    if (!*row_or) break;
  }
  return absl::OkStatus();
}

absl::Status Statement::Reset() {
  started_ = false;
  sqlite3_clear_bindings(stmt_.get());
  // sqlite3_reset echoes the last step error; the step already reported it.
  sqlite3_reset(stmt_.get());
  return absl::OkStatus();
}

int Statement::ColumnInt(int index) { return sqlite3_column_int(stmt_.get(), index); }

int64_t Statement::ColumnInt64(int index) { return sqlite3_column_int64(stmt_.get(), index); }

double Statement::ColumnDouble(int index) { return sqlite3_column_double(stmt_.get(), index); }

std::string Statement::ColumnText(int index) {
  const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_.get(), index));
  if (text == nullptr) return "";
  return std::string(text, sqlite3_column_bytes(stmt_.get(), index));
}

int Statement::ColumnType(int index) { return sqlite3_column_type(stmt_.get(), index); }

SqlValue Statement::ColumnValue(int index) {
  switch (ColumnType(index)) {
    case SQLITE_INTEGER:
      return SqlValue::Integer(ColumnInt64(index));
    case SQLITE_FLOAT:
      return SqlValue::Real(ColumnDouble(index));
    case SQLITE_TEXT:
      return SqlValue::Text(ColumnText(index));
    case SQLITE_BLOB: {
      const void* data = sqlite3_column_blob(stmt_.get(), index);
      int size = sqlite3_column_bytes(stmt_.get(), index);
      return SqlValue::Blob(data ? std::string(static_cast<const char*>(data), size) : std::string());
    }
    default:
      return SqlValue::Null();
  }
}

const char* Statement::ColumnName(int index) { return sqlite3_column_name(stmt_.get(), index); }

int Statement::ColumnCount() { return sqlite3_column_count(stmt_.get()); }

std::vector<std::string> Statement::ColumnNames() {
  std::vector<std::string> names;
  int count = ColumnCount();
  names.reserve(count);
  for (int i = 0; i < count; ++i) {
    const char* name = ColumnName(i);
    names.push_back(name ? name : "");
  }
  return names;
}

bool Statement::IsReadOnly() { return sqlite3_stmt_readonly(stmt_.get()) != 0; }

}  // namespace scratchdb
