#ifndef SCRATCHDB_DIGEST_H_
#define SCRATCHDB_DIGEST_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "nlohmann/json.hpp"

#include "scratchdb/config.h"
#include "scratchdb/constants.h"
#include "scratchdb/guarded_session.h"
#include "scratchdb/sql_value.h"

namespace scratchdb {

struct ColumnDigest {
  std::string name;
  std::string declared_type;
  std::string actual_type;  // INTEGER, FLOAT, TEXT, BLOB, JSON, UUID, ..., MIXED
  double null_pct = 0.0;
  double unique_pct = 0.0;
  std::string cardinality_class;
  std::string sample_values;
  std::optional<double> min_val;
  std::optional<double> max_val;
  std::optional<double> avg_length;
  std::optional<std::string> content_pattern;
  std::optional<double> entropy;
  bool is_primary_key = false;
  bool is_foreign_key = false;
  bool is_indexed = false;

  // "name: TYPE(pattern) | null:N% uniq:N% [PK,FK,IDX]"
  std::string ToCompact() const;
};

struct TableDigest {
  std::string name;
  int64_t row_count = 0;
  int column_count = 0;
  int64_t size_bytes = 0;  // rows * columns * 50, a rough estimate
  std::vector<ColumnDigest> columns;
  std::optional<std::string> primary_key;
  std::vector<std::string> foreign_keys;  // "col -> table.col"
  std::vector<std::string> indexes;
  double null_density = 0.0;
  bool is_junction = false;
  bool is_lookup = false;
  bool is_log = false;

  std::string ToCompact() const;
};

struct RelationshipDigest {
  std::string from_table;
  std::string from_column;
  std::string to_table;
  std::string to_column;
  std::string relation_type;  // "explicit_fk" or "implicit_fk"
  double confidence = 1.0;

  std::string ToCompact() const;
};

/**
 * @brief Bounded statistical summary of the user tables in one database.
 *
 * The verdict/action pair and the flags are the headline; per-column detail
 * stays in `tables` and is only emitted by ToJson().
 */
struct SqliteDigest {
  int64_t file_size = 0;
  int64_t page_count = 0;
  int table_count = 0;
  int view_count = 0;
  int index_count = 0;
  int trigger_count = 0;
  int64_t total_rows = 0;
  int total_columns = 0;
  std::string tables_summary;
  std::string largest_tables;
  int explicit_fk_count = 0;
  int implicit_fk_count = 0;
  std::string relationships_summary;
  double overall_null_pct = 0.0;
  std::string overall_null_verdict;
  double type_consistency = 0.0;
  std::string type_consistency_verdict;
  int detected_json_columns = 0;
  int detected_datetime_columns = 0;
  int detected_id_columns = 0;
  bool has_junction_tables = false;
  bool has_lookup_tables = false;
  bool has_log_tables = false;
  bool has_soft_deletes = false;
  bool has_timestamps = false;
  bool has_audit_fields = false;
  std::string schema_pattern;
  std::string verdict;
  std::string action;
  std::string flags;  // comma separated, may be empty
  std::string sample_table;

  std::vector<TableDigest> tables;

  // One line: "tables=N rows=N verdict=V action=A schema=S [flags=F]".
  std::string SummaryLine() const;
  // The <sqlite_digest> block placed in the prompt.
  std::string ToPrompt() const;
  nlohmann::json ToJson() const;
};

// Digest for an unreadable database: verdict "error", action "investigate".
SqliteDigest ErrorDigest(const std::string& error);
// Digest for a database without user tables: verdict "minimal", action "skip".
SqliteDigest EmptyDigest(int64_t file_size, int64_t page_count);

struct DigestOptions {
  int sample_size = kDigestSampleSize;
  int max_tables = kDigestMaxTables;
  int max_columns = kDigestMaxColumns;

  static DigestOptions FromConfig(const Config& config);
};

// Profiles one column from its sampled values. `values` may contain NULLs.
ColumnDigest AnalyzeColumn(const std::string& name, const std::string& declared_type,
                           const std::vector<SqlValue>& values, bool is_primary_key = false,
                           bool is_foreign_key = false, bool is_indexed = false);

// unique / high / medium / low / constant.
const char* ClassifyCardinality(double unique_pct);

// Shannon entropy in bits per byte.
double CalculateEntropy(const std::string& text);

class Digestor {
 public:
  explicit Digestor(DigestOptions options = DigestOptions()) : options_(options) {}

  // Never fails: engine errors come back as ErrorDigest().
  SqliteDigest Digest(GuardedSession* session) const;
  SqliteDigest DigestFile(const std::string& path) const;

 private:
  absl::StatusOr<SqliteDigest> Analyze(GuardedSession* session) const;
  absl::StatusOr<TableDigest> AnalyzeTable(GuardedSession* session, const std::string& table) const;

  DigestOptions options_;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_DIGEST_H_
