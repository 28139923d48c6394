#include "scratchdb/schema_summary.h"

#include <algorithm>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/log/log.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

#include "scratchdb/status_macros.h"
#include "scratchdb/table_profile.h"

namespace scratchdb {

namespace {

constexpr int kMaxSampleColumns = 8;
constexpr int kMaxValueChars = 60;
constexpr int64_t kFullSampleRowLimit = 200;
constexpr int64_t kHeadRows = 30;
constexpr int64_t kTailRows = 10;
constexpr int64_t kMaxOffsetRowCount = 50000;

constexpr char kTruncatedNotice[] = "... (truncated - schema exceeds 30KB limit)";

// Accumulates lines under a byte budget, counting the joining newlines.
class LineBudget {
 public:
  explicit LineBudget(int max_bytes) : max_bytes_(max_bytes) {}

  bool Append(const std::string& line) {
    int64_t cost = static_cast<int64_t>(line.size()) + (lines_.empty() ? 0 : 1);
    if (total_ + cost > max_bytes_) return false;
    lines_.push_back(line);
    total_ += cost;
    return true;
  }

  std::string Finish() const { return absl::StrJoin(lines_, "\n"); }

  std::string FinishTruncated() {
    Append(kTruncatedNotice);
    return Finish();
  }

 private:
  int64_t max_bytes_;
  int64_t total_ = 0;
  std::vector<std::string> lines_;
};

std::string FormatValue(const SqlValue& value) {
  switch (value.type) {
    case ValueType::kNull:
      return "NULL";
    case ValueType::kBlob:
      return absl::StrCat("<blob ", value.bytes.size(), " bytes>");
    case ValueType::kText:
      return absl::StrCat("'", CompactText(value.bytes, kMaxValueChars), "'");
    default:
      return value.ToString();
  }
}

std::string FormatRow(const std::vector<SqlValue>& row) {
  std::vector<std::string> cells;
  for (size_t i = 0; i < row.size() && i < static_cast<size_t>(kMaxSampleColumns); ++i) {
    cells.push_back(FormatValue(row[i]));
  }
  if (row.size() > static_cast<size_t>(kMaxSampleColumns)) {
    cells.push_back(absl::StrCat("...+", row.size() - kMaxSampleColumns, " cols"));
  }
  return absl::StrCat("(", absl::StrJoin(cells, ", "), ")");
}

absl::Status AppendRows(GuardedSession* session, const std::string& sql, std::vector<std::vector<SqlValue>>* rows) {
  ASSIGN_OR_RETURN(auto stmt, session->Prepare(sql));
  while (true) {
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (!has_row) break;
    std::vector<SqlValue> row;
    int columns = stmt->ColumnCount();
    row.reserve(columns);
    for (int i = 0; i < columns; ++i) row.push_back(stmt->ColumnValue(i));
    rows->push_back(std::move(row));
  }
  return absl::OkStatus();
}

// Small tables are read whole; larger ones contribute their head and tail.
std::vector<std::vector<SqlValue>> FetchSampleRows(GuardedSession* session, const std::string& table,
                                                   int64_t row_count) {
  std::vector<std::vector<SqlValue>> rows;
  std::string from = absl::StrCat(" FROM ", QuoteIdentifier(table));
  absl::Status status;
  if (row_count <= kFullSampleRowLimit) {
    status = AppendRows(session, absl::StrCat("SELECT *", from, ";"), &rows);
  } else {
    status = AppendRows(session, absl::StrCat("SELECT *", from, " LIMIT ", kHeadRows, ";"), &rows);
    if (status.ok() && row_count <= kMaxOffsetRowCount) {
      int64_t tail = std::min(kTailRows, row_count - kHeadRows);
      status = AppendRows(session,
                          absl::StrCat("SELECT *", from, " LIMIT ", tail, " OFFSET ", row_count - tail, ";"), &rows);
    }
  }
  if (!status.ok()) rows.clear();
  return rows;
}

absl::StatusOr<std::vector<ColumnInfo>> TableColumns(GuardedSession* session, const std::string& table) {
  ASSIGN_OR_RETURN(auto stmt, session->Prepare(absl::StrCat("PRAGMA table_info(", QuoteIdentifier(table), ");")));
  std::vector<ColumnInfo> columns;
  while (true) {
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (!has_row) break;
    ColumnInfo column;
    column.name = stmt->ColumnText(1);
    if (!stmt->ColumnIsNull(2)) column.declared_type = stmt->ColumnText(2);
    columns.push_back(std::move(column));
  }
  return columns;
}

absl::StatusOr<std::string> BuildSummary(GuardedSession* session, const SchemaSummaryOptions& options) {
  std::vector<std::pair<std::string, std::string>> tables;
  {
    ASSIGN_OR_RETURN(auto stmt, session->Prepare("SELECT name, sql FROM sqlite_master WHERE type='table' "
                                                 "AND name NOT LIKE 'sqlite_%' ORDER BY name;"));
    while (true) {
      ASSIGN_OR_RETURN(bool has_row, stmt->Step());
      if (!has_row) break;
      tables.emplace_back(stmt->ColumnText(0), stmt->ColumnText(1));
    }
  }
  if (tables.empty()) return std::string("SQLite database has no user tables yet.");

  LineBudget budget(options.max_bytes);
  size_t table_limit = std::min(tables.size(), static_cast<size_t>(std::max(options.max_tables, 0)));
  for (size_t i = 0; i < table_limit; ++i) {
    const auto& [name, create_sql] = tables[i];
    auto count_or = session->QueryInt64(absl::StrCat("SELECT COUNT(*) FROM ", QuoteIdentifier(name), ";"));
    std::string count = count_or.ok() ? absl::StrCat(*count_or) : "?";

    std::string create_line = CompactText(create_sql, options.create_sql_chars);
    const char* note = BuiltinTableNote(name);
    std::string line = note != nullptr
                           ? absl::StrCat("Table ", name, " (rows: ", count, ", ", note, "): ", create_line)
                           : absl::StrCat("Table ", name, " (rows: ", count, "): ", create_line);
    if (!budget.Append(line)) return budget.FinishTruncated();

    if (note != nullptr || !count_or.ok() || *count_or <= 0) continue;
    std::vector<std::vector<SqlValue>> rows = FetchSampleRows(session, name, *count_or);
    auto display = SelectDisplayRows(rows);
    if (display.empty()) continue;
    std::vector<std::string> formatted;
    for (const auto& row : display) formatted.push_back(FormatRow(row));
    if (!budget.Append(absl::StrCat("  sample: ", absl::StrJoin(formatted, ", ")))) {
      return budget.FinishTruncated();
    }

    auto columns_or = TableColumns(session, name);
    if (!columns_or.ok()) {
      VLOG(1) << "Skipping profile of " << name << ": " << columns_or.status();
      continue;
    }
    bool sample_complete = *count_or <= kFullSampleRowLimit && static_cast<int64_t>(rows.size()) == *count_or;
    std::vector<ColumnProfile> profiles = ProfileColumns(*columns_or, rows, sample_complete);
    for (const std::string& extra :
         {FormatProfileLine(profiles, options.max_bytes / 2), FormatTextPeekLine(profiles)}) {
      if (!extra.empty() && !budget.Append(extra)) return budget.FinishTruncated();
    }
  }
  if (tables.size() > table_limit) {
    budget.Append(absl::StrCat("... (", tables.size() - table_limit, " more tables omitted)"));
  }
  return budget.Finish();
}

}  // namespace

SchemaSummaryOptions SchemaSummaryOptions::FromConfig(const Config& config) {
  SchemaSummaryOptions options;
  options.max_bytes = config.schema_prompt_bytes;
  options.max_tables = config.schema_table_cap;
  return options;
}

const char* BuiltinTableNote(const std::string& table_name) {
  static const auto* const kNotes = new absl::flat_hash_map<std::string, const char*>({
      {kToolResultsTable, "built-in, ephemeral (dropped before persistence)"},
      {kAgentConfigTable, "built-in, ephemeral (reset every cycle; charter/schedule updates)"},
      {kKanbanTable, "built-in, ephemeral (syncs to kanban cards after the batch)"},
      {kMessagesTable, "built-in, ephemeral (recent messages snapshot for this cycle)"},
      {kFilesTable, "built-in, ephemeral (recent file index for this cycle; metadata only)"},
      {kSkillsTable, "built-in, ephemeral (versioned skill mirror synced to persistent storage after the batch)"},
  });
  auto it = kNotes->find(table_name);
  return it == kNotes->end() ? nullptr : it->second;
}

std::string CompactText(const std::string& text, int max_chars) {
  std::string compact = absl::StrJoin(absl::StrSplit(text, absl::ByAnyChar(" \t\r\n\f\v"), absl::SkipEmpty()), " ");
  if (max_chars <= 0) return "";
  if (static_cast<int>(compact.size()) <= max_chars) return compact;
  if (max_chars <= 3) return compact.substr(0, max_chars);
  return absl::StrCat(compact.substr(0, max_chars - 3), "...");
}

std::vector<std::vector<SqlValue>> SelectDisplayRows(const std::vector<std::vector<SqlValue>>& rows) {
  std::vector<std::vector<SqlValue>> selected;
  if (rows.empty()) return selected;
  std::vector<size_t> indices = {0};
  if (rows.size() > 2) indices.push_back(rows.size() / 2);
  if (rows.size() > 1) indices.push_back(rows.size() - 1);
  for (size_t index : indices) {
    bool seen = false;
    for (const auto& row : selected) {
      if (row == rows[index]) {
        seen = true;
        break;
      }
    }
    if (!seen) selected.push_back(rows[index]);
  }
  return selected;
}

std::string BuildSchemaSummary(GuardedSession* session, const SchemaSummaryOptions& options) {
  auto summary_or = BuildSummary(session, options);
  if (!summary_or.ok()) return absl::StrCat("Failed to inspect SQLite DB: ", summary_or.status().message());
  return *summary_or;
}

}  // namespace scratchdb
