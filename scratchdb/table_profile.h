#ifndef SCRATCHDB_TABLE_PROFILE_H_
#define SCRATCHDB_TABLE_PROFILE_H_

#include <cstddef>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

#include "scratchdb/sql_value.h"

namespace scratchdb {

struct ColumnInfo {
  std::string name;
  std::string declared_type;  // as written in CREATE TABLE, may be empty
};

struct ColumnProfile {
  std::string name;
  std::string summary;  // "name: part; part" or just the name
  int priority = 10;
  std::string text_peek;  // empty unless the column holds long or multiline text
  size_t text_max_len = 0;
};

// json, int, text, blob, float, bool, num or "" from SQLite's affinity rules.
std::string DeclaredTypeCategory(absl::string_view declared_type);

/**
 * @brief Describes one column from the sampled `values`.
 *
 * JSON text is summarized by its shape (kind, keys, paths, array lengths,
 * nested JSON). Failing that, CSV text reports its column count and header;
 * plain text its length range and recognizable patterns (email, url, uuid,
 * iso_date, iso_datetime, ipv4, phone); numbers their range. Small domains
 * list their values, and the null share is reported from 10% up, marked "~"
 * when `sample_complete` is false.
 */
ColumnProfile ProfileColumn(const ColumnInfo& column, const std::vector<SqlValue>& values, bool sample_complete);

std::vector<ColumnProfile> ProfileColumns(const std::vector<ColumnInfo>& columns,
                                          const std::vector<std::vector<SqlValue>>& rows, bool sample_complete);

// "  profile: ..." with the twelve most telling columns in table order, cut to
// `max_chars`. Empty when there is nothing to say.
std::string FormatProfileLine(const std::vector<ColumnProfile>& profiles, int max_chars);

// "  text_peek: name=\"...\"" for up to two columns with the longest text.
std::string FormatTextPeekLine(const std::vector<ColumnProfile>& profiles);

}  // namespace scratchdb

#endif  // SCRATCHDB_TABLE_PROFILE_H_
