#ifndef SCRATCHDB_CSV_READER_H_
#define SCRATCHDB_CSV_READER_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/strings/string_view.h"

namespace scratchdb {

constexpr size_t kMaxCsvRows = 10000;
constexpr size_t kMaxCsvColumns = 100;

struct CsvDialect {
  char delimiter = ',';
  char quote = '"';
  bool skip_initial_space = false;
};

struct NormalizedCsv {
  std::string text;
  std::optional<char> explicit_delimiter;  // from an Excel "sep=" first line
};

// Unifies line endings, drops a UTF-8 BOM and consumes a leading "sep=X" line.
NormalizedCsv NormalizeCsvText(absl::string_view text);

/**
 * @brief Guesses the dialect from the first lines of `text`.
 *
 * Candidates are comma, tab, semicolon, pipe and caret. A delimiter must show
 * up on at least two sample lines; the one with the most consistent per-line
 * count wins. Returns nullopt when nothing looks delimited, in which case the
 * default (comma) dialect applies.
 */
std::optional<CsvDialect> DetectCsvDialect(absl::string_view text,
                                           std::optional<char> explicit_delimiter = std::nullopt);

// Quoted fields may hold delimiters, doubled quotes and newlines.
std::vector<std::vector<std::string>> ReadCsvRows(absl::string_view text, const CsvDialect& dialect,
                                                  size_t max_rows);

// Blank headers become col_<i>; repeats get _2, _3, ... suffixes.
std::vector<std::string> DedupeCsvHeaders(const std::vector<std::string>& headers);

// SQL-facing helpers. Each returns a JSON array, "[]" for blank input.
namespace text {

// Array of objects keyed by header, or of arrays without a header row.
std::string CsvParse(const std::string& csv, bool has_header);
// Values of the 0-based `column`; nullopt for a negative column.
std::optional<std::string> CsvColumn(const std::string& csv, int64_t column, bool has_header);
std::string CsvHeaders(const std::string& csv);

}  // namespace text

}  // namespace scratchdb

#endif  // SCRATCHDB_CSV_READER_H_
