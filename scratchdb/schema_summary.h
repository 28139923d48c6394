#ifndef SCRATCHDB_SCHEMA_SUMMARY_H_
#define SCRATCHDB_SCHEMA_SUMMARY_H_

#include <string>
#include <vector>

#include "scratchdb/config.h"
#include "scratchdb/constants.h"
#include "scratchdb/guarded_session.h"
#include "scratchdb/sql_value.h"

namespace scratchdb {

struct SchemaSummaryOptions {
  int max_bytes = kDefaultSchemaPromptBytes;
  int max_tables = kDefaultSchemaTableCap;
  int create_sql_chars = kCreateSqlPreviewChars;

  static SchemaSummaryOptions FromConfig(const Config& config);
};

// Note shown next to a built-in table, or nullptr for agent tables.
const char* BuiltinTableNote(const std::string& table_name);

// Collapses whitespace runs to one space and cuts to `max_chars` with "...".
std::string CompactText(const std::string& text, int max_chars);

// Up to three distinct rows: first, middle and last.
std::vector<std::vector<SqlValue>> SelectDisplayRows(const std::vector<std::vector<SqlValue>>& rows);

/**
 * @brief Human-readable schema for the prompt.
 *
 * One line per table in name order:
 *   Table <name> (rows: <n>[, <note>]): <single-line CREATE>
 * followed, for agent tables that hold rows, by a sample line, a per-column
 * "profile:" line and, for long or multiline text, a "text_peek:" line. Output is capped
 * at `max_bytes`; tables past `max_tables` are counted, not listed.
 * Never fails: errors come back as "Failed to inspect SQLite DB: ...".
 */
std::string BuildSchemaSummary(GuardedSession* session, const SchemaSummaryOptions& options = SchemaSummaryOptions());

}  // namespace scratchdb

#endif  // SCRATCHDB_SCHEMA_SUMMARY_H_
