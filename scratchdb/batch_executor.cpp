#include "scratchdb/batch_executor.h"

#include <utility>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/strip.h"
#include "absl/time/clock.h"

#include "scratchdb/statement_classifier.h"

namespace scratchdb {

namespace {

constexpr size_t kPreviewChars = 160;
constexpr size_t kPreviewStatements = 10;

std::string Preview(const std::string& sql) {
  std::string trimmed(absl::StripAsciiWhitespace(sql));
  if (trimmed.size() <= kPreviewChars) return trimmed;
  return absl::StrCat(trimmed.substr(0, kPreviewChars), "...");
}

BatchError MakeError(int index, const std::string& sql, std::string code, std::string message,
                     std::string hint = "") {
  BatchError error;
  error.index = index;
  error.sql = sql;
  error.code = std::move(code);
  error.message = std::move(message);
  error.hint = std::move(hint);
  return error;
}

}  // namespace

nlohmann::json StatementResult::ToJson() const {
  nlohmann::json out;
  out["index"] = index;
  out["entry"] = entry;
  if (has_rows) {
    nlohmann::json records = nlohmann::json::array();
    for (const auto& row : rows) {
      nlohmann::json record = nlohmann::json::object();
      for (size_t i = 0; i < columns.size() && i < row.size(); ++i) {
        record[columns[i]] = row[i].ToJson();
      }
      records.push_back(std::move(record));
    }
    out["columns"] = columns;
    out["rows"] = std::move(records);
    out["row_count"] = rows.size();
    if (truncated) out["truncated"] = true;
  } else {
    out["changes"] = changes;
    if (last_insert_rowid.has_value()) out["last_insert_rowid"] = *last_insert_rowid;
  }
  return out;
}

nlohmann::json BatchError::ToJson() const {
  nlohmann::json out = {{"index", index}, {"entry", entry}, {"code", code}, {"message", message}};
  if (parts > 1) {
    out["part"] = part;
    out["parts"] = parts;
  }
  if (!hint.empty()) out["hint"] = hint;
  if (!sql.empty()) out["sql"] = Preview(sql);
  return out;
}

nlohmann::json BatchResponse::ToJson() const {
  nlohmann::json out;
  out["status"] = ok ? "ok" : "error";
  nlohmann::json items = nlohmann::json::array();
  for (const auto& result : results) items.push_back(result.ToJson());
  out["results"] = std::move(items);
  if (error.has_value()) out["error"] = error->ToJson();
  out["db_size_mb"] = db_size_mb;
  if (!warnings.empty()) out["warnings"] = warnings;
  if (!message.empty()) out["message"] = message;
  if (continuation_allowed) out["auto_sleep_ok"] = true;
  return out;
}

absl::StatusOr<std::unique_ptr<BatchExecutor>> BatchExecutor::Create(GuardedSession* session,
                                                                     const Config& config) {
  if (session == nullptr) {
    return absl::InvalidArgumentError("GuardedSession cannot be null");
  }
  return std::unique_ptr<BatchExecutor>(new BatchExecutor(session, config));
}

std::string BatchExecutor::SanitizeSql(const std::string& sql) {
  return absl::StrReplaceAll(sql, {{"\xE2\x80\x9C", "\""},    // left double quotation mark
                                   {"\xE2\x80\x9D", "\""},    // right double quotation mark
                                   {"\xE2\x80\x99", "''"},    // right single quotation mark
                                   {"\\'", "''"}});
}

std::string BatchExecutor::HintForError(const std::string& message) {
  std::string lower = absl::AsciiStrToLower(message);
  if (absl::StrContains(lower, "do not have the same number of result columns")) {
    return "Every SELECT in a UNION/INTERSECT/EXCEPT must return the same number of columns.";
  }
  if (absl::StrContains(lower, "no such column")) {
    return "Check the column names with PRAGMA table_info('<table>') before querying.";
  }
  if (absl::StrContains(lower, "no such table")) {
    return "Create the table first, or look up existing names in sqlite_master.";
  }
  if (absl::StrContains(lower, "syntax error")) {
    return "Use single quotes for strings, double quotes for identifiers, and one statement per item.";
  }
  if (absl::StrContains(lower, "unique constraint failed")) {
    return "The row already exists. Use UPDATE or INSERT ... ON CONFLICT DO UPDATE instead.";
  }
  return "";
}

std::string BatchExecutor::ErrorCode(const absl::Status& status) {
  switch (status.code()) {
    case absl::StatusCode::kDeadlineExceeded:
      return "timeout";
    case absl::StatusCode::kPermissionDenied:
      return "sandbox_denied";
    case absl::StatusCode::kFailedPrecondition:
      return "constraint_violation";
    case absl::StatusCode::kUnavailable:
      return "busy";
    default:
      break;
  }
  if (absl::StrContains(absl::AsciiStrToLower(status.message()), "syntax")) return "syntax_error";
  return "unknown";
}

std::optional<BatchError> BatchExecutor::RunStatement(int index, const std::string& raw_sql,
                                                      StatementResult* result) {
  if (absl::StripAsciiWhitespace(raw_sql).empty()) {
    return MakeError(index, raw_sql, "invalid_input", "Statement must be a non-empty SQL string");
  }
  std::string sql = SanitizeSql(raw_sql);
  Classification classification = Classify(sql);
  if (classification.kind == StatementKind::kBlocked) {
    return MakeError(index, raw_sql, "blocked", absl::StrCat("Query blocked: ", classification.reason));
  }
  if (IsTransactionControl(sql)) {
    return MakeError(index, raw_sql, "transaction_control_disallowed",
                     "Remove explicit BEGIN/COMMIT/ROLLBACK. Each statement commits automatically.");
  }

  absl::Time start = absl::Now();
  auto stmt_or = session_->Prepare(sql);
  if (!stmt_or.ok()) {
    std::string message(stmt_or.status().message());
    return MakeError(index, raw_sql, ErrorCode(stmt_or.status()), message, HintForError(message));
  }
  auto& stmt = *stmt_or;
  if (!absl::StripAsciiWhitespace(StripCommentsAndLiterals(stmt->tail())).empty()) {
    return MakeError(index, raw_sql, "multiple_statements",
                     "Provide exactly one SQL statement per item, or pass the script as separate statements.");
  }

  result->index = index;
  result->sql = raw_sql;
  result->kind = classification.kind;
  result->has_rows = stmt->ColumnCount() > 0;
  if (result->has_rows) result->columns = stmt->ColumnNames();

  absl::Status step_status;
  while (true) {
    auto row_or = stmt->Step();
    if (!row_or.ok()) {
      step_status = row_or.status();
      break;
    }
    if (!*row_or) break;
    if (static_cast<int>(result->rows.size()) >= config_.row_limit) {
      result->truncated = true;
      break;
    }
    std::vector<SqlValue> row;
    row.reserve(result->columns.size());
    for (int i = 0; i < static_cast<int>(result->columns.size()); ++i) row.push_back(stmt->ColumnValue(i));
    result->rows.push_back(std::move(row));
  }
  stmt.reset();

  if (!step_status.ok()) {
    if (session_->InTransaction()) {
      // The engine normally undoes a failed statement itself; make sure nothing stays pending.
      absl::Status rollback = session_->ExecuteScript("ROLLBACK;");
      if (!rollback.ok()) LOG(WARNING) << "Rollback after failed statement: " << rollback.message();
    }
    std::string message(step_status.message());
    if (step_status.code() == absl::StatusCode::kDeadlineExceeded) {
      message = absl::StrFormat("Query timed out after %.0f seconds",
                                absl::ToDoubleSeconds(session_->options().timeout));
    }
    return MakeError(index, raw_sql, ErrorCode(step_status), message, HintForError(message));
  }

  if (!result->has_rows) {
    result->changes = session_->Changes();
    std::string upper = absl::AsciiStrToUpper(absl::StripLeadingAsciiWhitespace(StripCommentsAndLiterals(sql)));
    if (absl::StartsWith(upper, "INSERT") || absl::StartsWith(upper, "REPLACE")) {
      result->last_insert_rowid = session_->LastInsertRowId();
    }
  }
  result->elapsed_ms = absl::ToInt64Milliseconds(absl::Now() - start);
  return std::nullopt;
}

void BatchExecutor::Finish(BatchResponse* response, bool will_continue_work) {
  int64_t size_bytes = session_->FileSizeBytes();
  response->db_size_mb = static_cast<double>(size_bytes) / kBytesPerMb;
  if (size_bytes > config_.soft_size_bytes) {
    response->warnings.push_back(absl::StrFormat(
        "WARNING: DB SIZE EXCEEDS %dMB. YOU MUST EXECUTE MORE QUERIES TO SHRINK THE SIZE, OR THE WHOLE DB WILL BE "
        "WIPED AT %dMB!",
        config_.soft_size_bytes / kBytesPerMb, config_.hard_size_bytes / kBytesPerMb));
  }

  bool any_rows = false;
  bool all_writes = !response->results.empty();
  for (const auto& result : response->results) {
    any_rows = any_rows || result.has_rows;
    all_writes = all_writes && result.kind == StatementKind::kWrite;
  }
  response->continuation_allowed = !will_continue_work && response->ok && !any_rows && all_writes;

  if (response->ok) {
    response->message = absl::StrFormat("%d statement(s) executed. Database size: %.2f MB.",
                                        response->results.size(), response->db_size_mb);
  } else if (response->error.has_value()) {
    const BatchError& error = *response->error;
    std::string where = absl::StrCat("Statement ", error.entry);
    if (error.parts > 1) absl::StrAppend(&where, " (part ", error.part + 1, " of ", error.parts, ")");
    response->message = absl::StrFormat("%s failed after %d successful statement(s): %s", where,
                                        response->results.size(), error.message);
  }
}

BatchResponse BatchExecutor::ExecuteBatch(const BatchRequest& request) {
  BatchResponse response;
  struct Origin {
    int entry;
    int part;
    int parts;
  };
  std::vector<std::string> statements;
  std::vector<Origin> origins;
  for (size_t e = 0; e < request.statements.size(); ++e) {
    const std::string& entry = request.statements[e];
    std::vector<std::string> parts = SplitStatements(entry);
    if (parts.empty()) {
      // Keep the slot so a blank entry is reported instead of skipped.
      statements.push_back(entry);
      origins.push_back({static_cast<int>(e), 0, 1});
      continue;
    }
    int count = static_cast<int>(parts.size());
    for (int p = 0; p < count; ++p) {
      statements.push_back(std::move(parts[p]));
      origins.push_back({static_cast<int>(e), p, count});
    }
  }
  if (statements.empty()) {
    response.ok = false;
    response.message = "'statements' must be a non-empty array of SQL strings.";
    Finish(&response, request.will_continue_work);
    return response;
  }

  std::vector<std::string> preview;
  for (size_t i = 0; i < statements.size() && i < kPreviewStatements; ++i) preview.push_back(Preview(statements[i]));
  LOG(INFO) << "Executing SQL batch: " << statements.size() << " statement(s), preview="
            << nlohmann::json(preview).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  response.ok = true;
  for (size_t i = 0; i < statements.size(); ++i) {
    StatementResult result;
    if (auto error = RunStatement(static_cast<int>(i), statements[i], &result); error.has_value()) {
      error->entry = origins[i].entry;
      error->part = origins[i].part;
      error->parts = origins[i].parts;
      LOG(INFO) << "SQL batch stopped at entry " << error->entry << " (index " << i << "): " << error->code << ": "
                << error->message;
      response.ok = false;
      response.error = std::move(error);
      break;
    }
    result.entry = origins[i].entry;
    response.results.push_back(std::move(result));
  }
  Finish(&response, request.will_continue_work);
  return response;
}

BatchResponse BatchExecutor::ExecuteSingle(const std::string& sql, bool will_continue_work) {
  if (SplitStatements(sql).size() > 1) {
    BatchResponse response;
    response.error = MakeError(0, sql, "multiple_statements",
                               "Provide exactly one SQL statement, or use the batch call for several.");
    Finish(&response, will_continue_work);
    return response;
  }
  BatchRequest request;
  request.statements = {sql};
  request.will_continue_work = will_continue_work;
  return ExecuteBatch(request);
}

}  // namespace scratchdb
