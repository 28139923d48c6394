#include "scratchdb/csv_reader.h"

#include <algorithm>
#include <map>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

#include "nlohmann/json.hpp"

namespace scratchdb {

namespace {

constexpr char kCandidateDelimiters[] = {',', '\t', ';', '|', '^'};
constexpr size_t kSampleBytes = 20000;
constexpr size_t kSampleLines = 20;
constexpr char kUtf8Bom[] = "\xEF\xBB\xBF";

bool IsBlank(absl::string_view s) { return absl::StripAsciiWhitespace(s).empty(); }

bool IsBlankRow(const std::vector<std::string>& row) {
  return std::all_of(row.begin(), row.end(), [](const std::string& cell) { return IsBlank(cell); });
}

std::vector<absl::string_view> SampleLines(absl::string_view text) {
  std::vector<absl::string_view> lines;
  for (absl::string_view line : absl::StrSplit(text.substr(0, kSampleBytes), '\n')) {
    if (IsBlank(line)) continue;
    lines.push_back(line);
    if (lines.size() >= kSampleLines) break;
  }
  return lines;
}

// Occurrences of `delimiter` outside double-quoted stretches of one line.
int CountUnquoted(absl::string_view line, char delimiter) {
  int count = 0;
  bool quoted = false;
  for (char c : line) {
    if (c == '"') {
      quoted = !quoted;
    } else if (c == delimiter && !quoted) {
      ++count;
    }
  }
  return count;
}

bool SkipsInitialSpace(const std::vector<absl::string_view>& lines, char delimiter) {
  const char spaced[] = {delimiter, ' ', '\0'};
  return std::any_of(lines.begin(), lines.end(),
                     [&spaced](absl::string_view line) { return absl::StrContains(line, spaced); });
}

// Score is the share of lines agreeing on the most common count, times that count.
std::optional<char> ChooseDelimiter(const std::vector<absl::string_view>& lines) {
  double best_score = 0.0;
  std::optional<char> best;
  for (char delimiter : kCandidateDelimiters) {
    std::map<int, int> frequency;
    int nonzero = 0;
    for (absl::string_view line : lines) {
      int count = CountUnquoted(line, delimiter);
      if (count == 0) continue;
      ++frequency[count];
      ++nonzero;
    }
    if (nonzero < 2) continue;
    int most_common = 0;
    int most_common_lines = 0;
    for (const auto& [count, lines_with_count] : frequency) {
      if (lines_with_count >= most_common_lines) {
        most_common = count;
        most_common_lines = lines_with_count;
      }
    }
    double score = static_cast<double>(most_common_lines) / nonzero * most_common;
    if (score > best_score) {
      best_score = score;
      best = delimiter;
    }
  }
  return best;
}

std::string Dump(const nlohmann::ordered_json& value) {
  return value.dump(-1, ' ', false, nlohmann::ordered_json::error_handler_t::replace);
}

struct ParsedCsv {
  std::vector<std::vector<std::string>> rows;
  bool blank = false;
};

ParsedCsv ParseForHelpers(const std::string& csv, size_t max_rows) {
  ParsedCsv parsed;
  NormalizedCsv normalized = NormalizeCsvText(csv);
  if (IsBlank(normalized.text)) {
    parsed.blank = true;
    return parsed;
  }
  CsvDialect dialect = DetectCsvDialect(normalized.text, normalized.explicit_delimiter).value_or(CsvDialect());
  parsed.rows = ReadCsvRows(normalized.text, dialect, max_rows);
  return parsed;
}

}  // namespace

NormalizedCsv NormalizeCsvText(absl::string_view text) {
  NormalizedCsv out;
  out.text = absl::StrReplaceAll(text, {{"\r\n", "\n"}, {"\r", "\n"}});
  absl::string_view view = out.text;
  while (absl::ConsumePrefix(&view, kUtf8Bom)) {
  }

  size_t newline = view.find('\n');
  absl::string_view first_line = view.substr(0, newline);
  absl::string_view rest = newline == absl::string_view::npos ? absl::string_view() : view.substr(newline + 1);
  std::string lowered = absl::AsciiStrToLower(first_line);
  absl::string_view directive = lowered;
  if (absl::ConsumePrefix(&directive, "sep=")) {
    if (absl::StartsWith(directive, "\\t")) {
      out.explicit_delimiter = '\t';
    } else if (!directive.empty() && IsBlank(directive.substr(1))) {
      out.explicit_delimiter = first_line[4];
    }
  }
  out.text = std::string(out.explicit_delimiter.has_value() ? rest : view);
  return out;
}

std::optional<CsvDialect> DetectCsvDialect(absl::string_view text, std::optional<char> explicit_delimiter) {
  std::vector<absl::string_view> lines = SampleLines(text);
  if (explicit_delimiter.has_value()) {
    CsvDialect dialect;
    dialect.delimiter = *explicit_delimiter;
    dialect.skip_initial_space = SkipsInitialSpace(lines, dialect.delimiter);
    return dialect;
  }
  if (lines.empty()) return std::nullopt;
  std::optional<char> delimiter = ChooseDelimiter(lines);
  if (!delimiter.has_value()) return std::nullopt;
  CsvDialect dialect;
  dialect.delimiter = *delimiter;
  dialect.skip_initial_space = SkipsInitialSpace(lines, dialect.delimiter);
  return dialect;
}

std::vector<std::vector<std::string>> ReadCsvRows(absl::string_view text, const CsvDialect& dialect,
                                                  size_t max_rows) {
  enum class State { kStartRecord, kStartField, kInField, kInQuoted, kQuoteInQuoted };
  std::vector<std::vector<std::string>> rows;
  std::vector<std::string> row;
  std::string field;
  State state = State::kStartRecord;

  auto end_field = [&]() {
    row.push_back(std::move(field));
    field.clear();
  };
  auto end_record = [&]() {
    rows.push_back(std::move(row));
    row.clear();
    state = State::kStartRecord;
  };

  for (size_t i = 0; i < text.size() && rows.size() < max_rows; ++i) {
    char c = text[i];
    switch (state) {
      case State::kStartRecord:
        if (c == '\n') {
          end_record();
          break;
        }
        state = State::kStartField;
        [[fallthrough]];
      case State::kStartField:
        if (c == dialect.quote) {
          state = State::kInQuoted;
        } else if (c == dialect.delimiter) {
          end_field();
        } else if (c == '\n') {
          end_field();
          end_record();
        } else if (c != ' ' || !dialect.skip_initial_space) {
          field.push_back(c);
          state = State::kInField;
        }
        break;
      case State::kInField:
        if (c == dialect.delimiter) {
          end_field();
          state = State::kStartField;
        } else if (c == '\n') {
          end_field();
          end_record();
        } else {
          field.push_back(c);
        }
        break;
      case State::kInQuoted:
        if (c == dialect.quote) {
          state = State::kQuoteInQuoted;
        } else {
          field.push_back(c);
        }
        break;
      case State::kQuoteInQuoted:
        if (c == dialect.quote) {
          field.push_back(c);
          state = State::kInQuoted;
        } else if (c == dialect.delimiter) {
          end_field();
          state = State::kStartField;
        } else if (c == '\n') {
          end_field();
          end_record();
        } else {
          field.push_back(c);
          state = State::kInField;
        }
        break;
    }
  }
  // Input without a trailing newline, or an unterminated quote, ends the last record.
  if (state != State::kStartRecord && rows.size() < max_rows) {
    end_field();
    end_record();
  }
  return rows;
}

std::vector<std::string> DedupeCsvHeaders(const std::vector<std::string>& headers) {
  absl::flat_hash_map<std::string, int> seen;
  std::vector<std::string> out;
  out.reserve(headers.size());
  for (size_t i = 0; i < headers.size(); ++i) {
    std::string base(absl::StripAsciiWhitespace(headers[i]));
    if (base.empty()) base = absl::StrCat("col_", i);
    int& count = seen[base];
    out.push_back(count > 0 ? absl::StrCat(base, "_", count + 1) : base);
    ++count;
  }
  return out;
}

namespace text {

std::string CsvParse(const std::string& csv, bool has_header) {
  size_t header_rows = has_header ? 1 : 0;
  ParsedCsv parsed = ParseForHelpers(csv, kMaxCsvRows + header_rows + 10);
  if (parsed.blank) return "[]";

  std::optional<std::vector<std::string>> headers;
  std::vector<std::vector<std::string>> records;
  size_t consumed = 0;
  for (auto& row : parsed.rows) {
    if (consumed >= kMaxCsvRows + header_rows) break;
    if (row.size() > kMaxCsvColumns) row.resize(kMaxCsvColumns);
    if (row.empty() || IsBlankRow(row)) continue;
    ++consumed;
    if (has_header && !headers.has_value()) {
      headers = DedupeCsvHeaders(row);
      continue;
    }
    if (headers.has_value()) {
      // Columns past the header get generated names; earlier rows read "" there.
      for (size_t i = headers->size(); i < row.size(); ++i) headers->push_back(absl::StrCat("col_", i));
      row.resize(headers->size());
    }
    records.push_back(std::move(row));
  }
  if (records.empty()) return "[]";

  nlohmann::ordered_json out = nlohmann::ordered_json::array();
  for (const auto& record : records) {
    if (!headers.has_value()) {
      out.push_back(record);
      continue;
    }
    nlohmann::ordered_json object = nlohmann::ordered_json::object();
    for (size_t i = 0; i < headers->size(); ++i) object[(*headers)[i]] = i < record.size() ? record[i] : "";
    out.push_back(std::move(object));
  }
  return Dump(out);
}

std::optional<std::string> CsvColumn(const std::string& csv, int64_t column, bool has_header) {
  if (column < 0) return std::nullopt;
  ParsedCsv parsed = ParseForHelpers(csv, kMaxCsvRows + (has_header ? 1 : 0) + 10);
  if (parsed.blank) return std::string("[]");

  nlohmann::ordered_json values = nlohmann::ordered_json::array();
  bool skipped_header = !has_header;
  for (const auto& row : parsed.rows) {
    if (values.size() >= kMaxCsvRows) break;
    if (row.empty() || IsBlankRow(row)) continue;
    if (!skipped_header) {
      skipped_header = true;
      continue;
    }
    if (static_cast<size_t>(column) < row.size()) values.push_back(row[column]);
  }
  return Dump(values);
}

std::string CsvHeaders(const std::string& csv) {
  ParsedCsv parsed = ParseForHelpers(csv, 2);
  for (const auto& row : parsed.rows) {
    if (!row.empty() && !IsBlankRow(row)) return Dump(DedupeCsvHeaders(row));
  }
  return "[]";
}

}  // namespace text

}  // namespace scratchdb
