#include "scratchdb/table_profile.h"

#include <algorithm>
#include <cmath>
#include <limits>
#include <optional>
#include <set>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"

#include "nlohmann/json.hpp"

#include "scratchdb/csv_reader.h"
#include "scratchdb/schema_summary.h"
#include "scratchdb/sql_functions.h"
#include "scratchdb/text_cleaning.h"

namespace scratchdb {

namespace {

using Json = nlohmann::ordered_json;

constexpr size_t kMaxColumnSummaries = 12;
constexpr size_t kMaxColumnSummaryChars = 220;
constexpr int kMaxTextPeekChars = 140;
constexpr size_t kMaxTextPeeks = 2;
constexpr size_t kMaxPatternValues = 12;
constexpr size_t kMaxPatterns = 4;
constexpr size_t kMaxJsonKeys = 8;
constexpr size_t kMaxJsonPaths = 6;
constexpr size_t kMaxNestedJsonPaths = 4;
constexpr size_t kMaxJsonStrings = 20;
constexpr int kMaxJsonDepth = 3;
constexpr size_t kMaxJsonParseChars = 8000;
constexpr size_t kJsonSampleDocs = 3;
constexpr size_t kMaxCsvSampleChars = 2000;
constexpr size_t kMaxCsvSampleColumns = 8;
constexpr size_t kMaxCsvSampleRows = 6;
constexpr size_t kMaxDistinctValues = 4;
constexpr int kMaxDistinctValueChars = 20;
constexpr size_t kLongTextLength = 120;
constexpr double kJsonDetectionThreshold = 0.6;
constexpr double kJsonHintThreshold = 0.2;
constexpr double kCsvDetectionThreshold = 0.4;
constexpr double kNullReportThreshold = 0.1;

// Cuts to `max_chars` code points, ending in "..." when something was dropped.
std::string Truncate(const std::string& s, size_t max_chars) {
  if (text::CodePointCount(s) <= max_chars) return s;
  if (max_chars <= 3) return text::Left(s, static_cast<int64_t>(max_chars));
  return absl::StrCat(text::Left(s, static_cast<int64_t>(max_chars - 3)), "...");
}

// Tally that breaks ties by first appearance.
class Tally {
 public:
  void Add(const std::string& key) {
    auto [it, inserted] = index_.try_emplace(key, entries_.size());
    if (inserted) entries_.emplace_back(key, 0);
    ++entries_[it->second].second;
  }

  std::vector<std::string> MostCommon(size_t n) const {
    std::vector<std::pair<std::string, int>> sorted = entries_;
    std::stable_sort(sorted.begin(), sorted.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    std::vector<std::string> out;
    for (size_t i = 0; i < sorted.size() && i < n; ++i) out.push_back(sorted[i].first);
    return out;
  }

  bool empty() const { return entries_.empty(); }

 private:
  absl::flat_hash_map<std::string, size_t> index_;
  std::vector<std::pair<std::string, int>> entries_;
};

// --- JSON ---

std::optional<Json> ParseJsonText(const std::string& text) {
  if (text.empty() || text.size() > kMaxJsonParseChars) return std::nullopt;
  size_t first = text.find_first_not_of(" \t\r\n\f\v");
  if (first == std::string::npos || (text[first] != '{' && text[first] != '[')) return std::nullopt;
  Json parsed = Json::parse(text, nullptr, false);
  if (parsed.is_discarded()) return std::nullopt;
  return parsed;
}

const char* JsonKind(const Json& value) {
  if (value.is_object()) return "obj";
  if (value.is_array()) return "arr";
  if (value.is_string()) return "text";
  if (value.is_boolean()) return "bool";
  if (value.is_number()) return "num";
  if (value.is_null()) return "null";
  return "other";
}

void CollectJsonPaths(const Json& value, std::vector<std::string>* paths, absl::flat_hash_set<std::string>* seen,
                      const std::string& prefix, int depth, size_t max_paths) {
  if (depth >= kMaxJsonDepth || paths->size() >= max_paths) return;
  if (value.is_object()) {
    size_t taken = 0;
    for (auto it = value.begin(); it != value.end() && taken < kMaxJsonKeys; ++it, ++taken) {
      std::string path = prefix.empty() ? it.key() : absl::StrCat(prefix, ".", it.key());
      if (seen->insert(path).second) {
        paths->push_back(path);
        if (paths->size() >= max_paths) return;
      }
      CollectJsonPaths(it.value(), paths, seen, path, depth + 1, max_paths);
    }
  } else if (value.is_array()) {
    std::string path = absl::StrCat(prefix, "[]");
    if (seen->insert(path).second) paths->push_back(path);
    if (!value.empty()) CollectJsonPaths(value.front(), paths, seen, path, depth + 1, max_paths);
  }
}

void CollectJsonStrings(const Json& value, std::vector<std::string>* strings, int depth) {
  if (strings->size() >= kMaxJsonStrings || depth >= kMaxJsonDepth) return;
  if (value.is_object() || value.is_array()) {
    size_t taken = 0;
    for (auto it = value.begin(); it != value.end() && taken < kMaxJsonKeys; ++it, ++taken) {
      CollectJsonStrings(it.value(), strings, depth + 1);
      if (strings->size() >= kMaxJsonStrings) return;
    }
  } else if (value.is_string()) {
    strings->push_back(value.get<std::string>());
  }
}

struct CsvShape {
  size_t columns = 0;
  std::vector<std::string> header;
};

std::optional<CsvShape> SniffCsv(const std::string& text);

struct JsonInsight {
  double ratio = 0.0;
  std::string summary;  // empty below the detection threshold
};

std::optional<JsonInsight> AnalyzeJson(const std::vector<const std::string*>& texts) {
  std::vector<Json> parsed;
  for (const std::string* text : texts) {
    auto doc = ParseJsonText(*text);
    if (doc.has_value()) parsed.push_back(std::move(*doc));
  }
  if (parsed.empty()) return std::nullopt;
  JsonInsight insight;
  insight.ratio = static_cast<double>(parsed.size()) / texts.size();
  if (insight.ratio < kJsonDetectionThreshold) return insight;

  Tally kinds;
  for (const Json& doc : parsed) kinds.Add(JsonKind(doc));
  Tally keys;
  Tally elem_types;
  std::vector<std::string> paths;
  absl::flat_hash_set<std::string> seen_paths;
  std::vector<size_t> array_lengths;
  std::vector<std::string> strings;
  size_t sampled = std::min(parsed.size(), kJsonSampleDocs);
  for (size_t i = 0; i < sampled; ++i) {
    const Json& doc = parsed[i];
    if (doc.is_object()) {
      for (auto it = doc.begin(); it != doc.end(); ++it) keys.Add(it.key());
      CollectJsonPaths(doc, &paths, &seen_paths, "", 0, kMaxJsonPaths);
    } else if (doc.is_array()) {
      array_lengths.push_back(doc.size());
      for (size_t j = 0; j < doc.size() && j < kMaxJsonKeys; ++j) elem_types.Add(JsonKind(doc[j]));
      CollectJsonPaths(doc, &paths, &seen_paths, "", 0, kMaxJsonPaths);
    }
  }
  for (size_t i = 0; i < sampled; ++i) CollectJsonStrings(parsed[i], &strings, 0);

  int nested_json = 0;
  int csv_in_json = 0;
  std::vector<std::string> nested_paths;
  absl::flat_hash_set<std::string> seen_nested;
  for (const std::string& s : strings) {
    auto nested = ParseJsonText(s);
    if (nested.has_value()) {
      ++nested_json;
      if (nested_paths.size() < kMaxNestedJsonPaths) {
        CollectJsonPaths(*nested, &nested_paths, &seen_nested, "", 0, kMaxNestedJsonPaths);
      }
    }
    if (SniffCsv(s).has_value()) ++csv_in_json;
  }

  std::vector<std::string> parts = {"json", kinds.MostCommon(1).front()};
  if (!keys.empty()) parts.push_back(absl::StrCat("keys[", absl::StrJoin(keys.MostCommon(kMaxJsonKeys), ", "), "]"));
  if (!paths.empty()) parts.push_back(absl::StrCat("paths[", absl::StrJoin(paths, ", "), "]"));
  if (!elem_types.empty()) {
    parts.push_back(absl::StrCat("elem_types[", absl::StrJoin(elem_types.MostCommon(3), ", "), "]"));
  }
  if (!array_lengths.empty()) {
    auto [shortest, longest] = std::minmax_element(array_lengths.begin(), array_lengths.end());
    parts.push_back(absl::StrCat("len ", *shortest, "-", *longest));
  }
  if (nested_json > 0) parts.push_back(absl::StrCat("nested_json=", nested_json));
  if (!nested_paths.empty()) parts.push_back(absl::StrCat("nested_paths[", absl::StrJoin(nested_paths, ", "), "]"));
  if (csv_in_json > 0) parts.push_back(absl::StrCat("csv_in_json=", csv_in_json));
  insight.summary = absl::StrJoin(parts, " ");
  return insight;
}

// --- CSV ---

bool LooksLikeNumber(const std::string& s) {
  double ignored = 0;
  return absl::SimpleAtod(s, &ignored);
}

bool LooksLikeHeader(const std::vector<std::string>& first, const std::vector<std::string>& second) {
  if (first.size() != second.size() || first.empty()) return false;
  size_t first_numeric = std::count_if(first.begin(), first.end(), LooksLikeNumber);
  size_t second_numeric = std::count_if(second.begin(), second.end(), LooksLikeNumber);
  if (first_numeric == 0 && second_numeric >= std::max<size_t>(1, second.size() / 2)) return true;
  std::set<std::string> distinct(first.begin(), first.end());
  return distinct.size() == first.size() && first_numeric == 0;
}

// A value counts as CSV when its first line has a delimiter and the first few
// records all have the same two or more fields.
std::optional<CsvShape> SniffCsv(const std::string& text) {
  absl::string_view sample = absl::StripAsciiWhitespace(text);
  if (sample.empty()) return std::nullopt;
  std::string normalized =
      absl::StrReplaceAll(sample.substr(0, kMaxCsvSampleChars), {{"\r\n", "\n"}, {"\r", "\n"}});
  absl::string_view first_line = absl::string_view(normalized).substr(0, normalized.find('\n'));

  CsvDialect dialect;
  size_t best = 0;
  for (char delimiter : {',', '\t', '|', ';'}) {
    size_t count = std::count(first_line.begin(), first_line.end(), delimiter);
    if (count > best) {
      best = count;
      dialect.delimiter = delimiter;
    }
  }
  if (best == 0) return std::nullopt;

  std::vector<std::vector<std::string>> rows;
  for (auto& row : ReadCsvRows(normalized, dialect, normalized.size() + 1)) {
    if (row.empty()) continue;
    rows.push_back(std::move(row));
    if (rows.size() >= kMaxCsvSampleRows) break;
  }
  if (rows.empty()) return std::nullopt;
  CsvShape shape;
  shape.columns = rows.front().size();
  for (const auto& row : rows) {
    if (row.size() != shape.columns) return std::nullopt;
  }
  if (shape.columns < 2) return std::nullopt;
  if (rows.size() >= 2 && LooksLikeHeader(rows[0], rows[1])) {
    for (size_t i = 0; i < rows[0].size() && i < kMaxCsvSampleColumns; ++i) {
      shape.header.push_back(CompactText(rows[0][i], 20));
    }
  }
  return shape;
}

struct CsvInsight {
  double ratio = 0.0;
  CsvShape shape;
};

std::optional<CsvInsight> AnalyzeCsv(const std::vector<const std::string*>& texts) {
  constexpr size_t kEnoughShapes = 3;
  std::vector<CsvShape> shapes;
  for (const std::string* text : texts) {
    auto shape = SniffCsv(*text);
    if (shape.has_value()) shapes.push_back(std::move(*shape));
    if (shapes.size() >= kEnoughShapes) break;
  }
  if (shapes.empty()) return std::nullopt;
  CsvInsight insight;
  insight.ratio = static_cast<double>(shapes.size()) / texts.size();
  Tally columns;
  for (const auto& shape : shapes) columns.Add(absl::StrCat(shape.columns));
  size_t most_common = 0;
  if (!absl::SimpleAtoi(columns.MostCommon(1).front(), &most_common)) most_common = shapes.front().columns;
  insight.shape.columns = most_common;
  for (const auto& shape : shapes) {
    if (!shape.header.empty()) {
      insight.shape.header = shape.header;
      break;
    }
  }
  return insight;
}

std::string FormatCsvSummary(const CsvInsight& insight, bool tentative) {
  std::vector<std::string> parts = {tentative ? "csv?" : "csv"};
  if (insight.shape.columns > 0) parts.push_back(absl::StrCat("cols=", insight.shape.columns));
  if (!insight.shape.header.empty()) {
    parts.push_back(absl::StrCat("header[", absl::StrJoin(insight.shape.header, ", "), "]"));
  }
  return absl::StrJoin(parts, " ");
}

// --- Text patterns ---

bool IsWordByte(char c) {
  unsigned char u = static_cast<unsigned char>(c);
  return absl::ascii_isalnum(u) || c == '_' || u >= 0x80;
}

bool IsDigit(char c) { return absl::ascii_isdigit(static_cast<unsigned char>(c)); }

bool IsHex(char c) { return absl::ascii_isxdigit(static_cast<unsigned char>(c)); }

bool BoundaryBefore(absl::string_view s, size_t i) { return i == 0 || !IsWordByte(s[i - 1]); }

bool BoundaryAfter(absl::string_view s, size_t i) { return i >= s.size() || !IsWordByte(s[i]); }

bool RunAt(absl::string_view s, size_t i, size_t n, bool (*accept)(char)) {
  if (i + n > s.size()) return false;
  for (size_t k = i; k < i + n; ++k) {
    if (!accept(s[k])) return false;
  }
  return true;
}

bool CharAt(absl::string_view s, size_t i, char c) { return i < s.size() && s[i] == c; }

bool IsoDateAt(absl::string_view s, size_t i) {
  return RunAt(s, i, 4, IsDigit) && CharAt(s, i + 4, '-') && RunAt(s, i + 5, 2, IsDigit) && CharAt(s, i + 7, '-') &&
         RunAt(s, i + 8, 2, IsDigit);
}

bool HasIsoDate(absl::string_view s) {
  for (size_t i = 0; i < s.size(); ++i) {
    if (IsDigit(s[i]) && BoundaryBefore(s, i) && IsoDateAt(s, i) && BoundaryAfter(s, i + 10)) return true;
  }
  return false;
}

bool HasIsoDatetime(absl::string_view s) {
  for (size_t i = 0; i < s.size(); ++i) {
    if (!IsDigit(s[i]) || !BoundaryBefore(s, i) || !IsoDateAt(s, i)) continue;
    if (i + 10 >= s.size() || !(s[i + 10] == 'T' || absl::ascii_isspace(static_cast<unsigned char>(s[i + 10])))) {
      continue;
    }
    if (!RunAt(s, i + 11, 2, IsDigit) || !CharAt(s, i + 13, ':') || !RunAt(s, i + 14, 2, IsDigit)) continue;
    if (CharAt(s, i + 16, ':') && RunAt(s, i + 17, 2, IsDigit) && BoundaryAfter(s, i + 19)) return true;
    if (BoundaryAfter(s, i + 16)) return true;
  }
  return false;
}

bool HasUuid(absl::string_view s) {
  auto variant = [](char c) { return c == '8' || c == '9' || c == 'a' || c == 'b' || c == 'A' || c == 'B'; };
  for (size_t i = 0; i + 36 <= s.size(); ++i) {
    if (!IsHex(s[i]) || !BoundaryBefore(s, i)) continue;
    if (RunAt(s, i, 8, IsHex) && s[i + 8] == '-' && RunAt(s, i + 9, 4, IsHex) && s[i + 13] == '-' &&
        s[i + 14] >= '1' && s[i + 14] <= '5' && RunAt(s, i + 15, 3, IsHex) && s[i + 18] == '-' &&
        variant(s[i + 19]) && RunAt(s, i + 20, 3, IsHex) && s[i + 23] == '-' && RunAt(s, i + 24, 12, IsHex) &&
        BoundaryAfter(s, i + 36)) {
      return true;
    }
  }
  return false;
}

bool HasIpv4(absl::string_view s) {
  for (size_t i = 0; i < s.size(); ++i) {
    if (!IsDigit(s[i]) || !BoundaryBefore(s, i)) continue;
    size_t pos = i;
    bool ok = true;
    for (int group = 0; group < 4 && ok; ++group) {
      if (group > 0) {
        ok = CharAt(s, pos, '.');
        ++pos;
      }
      size_t digits = 0;
      while (ok && digits < 3 && pos < s.size() && IsDigit(s[pos])) {
        ++digits;
        ++pos;
      }
      ok = ok && digits > 0;
    }
    if (ok && BoundaryAfter(s, pos)) return true;
  }
  return false;
}

// A digit, eight or more digits, blanks or ().- and a final digit.
bool HasPhone(absl::string_view s) {
  auto run_char = [](char c) {
    return IsDigit(c) || absl::ascii_isspace(static_cast<unsigned char>(c)) || c == '(' || c == ')' || c == '.' ||
           c == '-';
  };
  size_t p = 0;
  while (p < s.size()) {
    if (!IsDigit(s[p]) || !BoundaryBefore(s, p)) {
      ++p;
      continue;
    }
    size_t end = p + 1;
    while (end < s.size() && run_char(s[end])) ++end;
    for (size_t q = end; q-- > p + 8;) {
      if (IsDigit(s[q]) && BoundaryAfter(s, q + 1)) return true;
    }
    p = end;
  }
  return false;
}

bool HasUrl(absl::string_view s) {
  for (absl::string_view prefix : {"http://", "https://", "www."}) {
    size_t pos = 0;
    while ((pos = s.find(prefix, pos)) != absl::string_view::npos) {
      pos += prefix.size();
      if (pos < s.size() && !absl::ascii_isspace(static_cast<unsigned char>(s[pos]))) return true;
    }
  }
  return false;
}

bool HasEmail(absl::string_view s) { return text::ExtractEmails(std::string(s)).has_value(); }

std::vector<std::string> DetectTextPatterns(const std::vector<const std::string*>& texts) {
  static const std::pair<const char*, bool (*)(absl::string_view)> kPatterns[] = {
      {"email", HasEmail},       {"url", HasUrl},   {"uuid", HasUuid},   {"iso_date", HasIsoDate},
      {"iso_datetime", HasIsoDatetime}, {"ipv4", HasIpv4}, {"phone", HasPhone},
  };
  std::vector<std::pair<std::string, int>> matched;
  for (const auto& [name, matcher] : kPatterns) {
    int count = 0;
    for (size_t i = 0; i < texts.size() && i < kMaxPatternValues; ++i) {
      if (matcher(*texts[i])) ++count;
    }
    if (count > 0) matched.emplace_back(name, count);
  }
  std::sort(matched.begin(), matched.end(), [](const auto& a, const auto& b) {
    return a.second != b.second ? a.second > b.second : a.first < b.first;
  });
  std::vector<std::string> names;
  for (size_t i = 0; i < matched.size() && i < kMaxPatterns; ++i) names.push_back(matched[i].first);
  return names;
}

// --- Values ---

const char* TypeLabel(const SqlValue& value) {
  switch (value.type) {
    case ValueType::kInteger:
      return "int";
    case ValueType::kReal:
      return "float";
    case ValueType::kText:
      return "text";
    case ValueType::kBlob:
      return "blob";
    default:
      return "other";
  }
}

std::string FormatNumber(const SqlValue& value) {
  if (value.type == ValueType::kReal) return absl::StrFormat("%.2f", value.real_value);
  return value.ToString();
}

std::string FormatDistinctValue(const SqlValue& value) {
  std::string shown;
  switch (value.type) {
    case ValueType::kText:
      shown = absl::StrCat("'", CompactText(value.bytes, kMaxDistinctValueChars), "'");
      break;
    case ValueType::kBlob:
      shown = absl::StrCat("<blob ", value.bytes.size(), " bytes>");
      break;
    default:
      shown = value.ToString();
  }
  return Truncate(shown, kMaxDistinctValueChars);
}

// Newlines stay visible as \n so a multiline value still reads as one.
std::string PeekText(const std::string& value) {
  return CompactText(absl::StrReplaceAll(value, {{"\r", "\\r"}, {"\n", "\\n"}}), kMaxTextPeekChars);
}

}  // namespace

std::string DeclaredTypeCategory(absl::string_view declared_type) {
  std::string decl = absl::AsciiStrToUpper(declared_type);
  if (decl.empty()) return "";
  if (absl::StrContains(decl, "JSON")) return "json";
  if (absl::StrContains(decl, "INT")) return "int";
  if (absl::StrContains(decl, "CHAR") || absl::StrContains(decl, "TEXT") || absl::StrContains(decl, "CLOB")) {
    return "text";
  }
  if (absl::StrContains(decl, "BLOB")) return "blob";
  if (absl::StrContains(decl, "REAL") || absl::StrContains(decl, "FLOA") || absl::StrContains(decl, "DOUB")) {
    return "float";
  }
  if (absl::StrContains(decl, "BOOL")) return "bool";
  if (absl::StrContains(decl, "NUM") || absl::StrContains(decl, "DEC")) return "num";
  return "";
}

ColumnProfile ProfileColumn(const ColumnInfo& column, const std::vector<SqlValue>& values, bool sample_complete) {
  std::vector<const SqlValue*> non_null;
  std::vector<const std::string*> texts;
  std::set<std::string> type_labels;
  for (const SqlValue& value : values) {
    if (value.is_null()) continue;
    non_null.push_back(&value);
    type_labels.insert(TypeLabel(value));
    if (value.type == ValueType::kText) texts.push_back(&value.bytes);
  }
  double null_ratio = values.empty() ? 0.0 : static_cast<double>(values.size() - non_null.size()) / values.size();

  ColumnProfile profile;
  profile.name = column.name;

  std::optional<JsonInsight> json;
  double json_hint = 0.0;
  if (!texts.empty()) {
    json = AnalyzeJson(texts);
    if (json.has_value() && json->summary.empty()) {
      if (json->ratio >= kJsonHintThreshold) json_hint = json->ratio;
      json.reset();
    }
  }

  std::optional<CsvInsight> csv;
  std::vector<std::string> patterns;
  std::optional<std::pair<size_t, size_t>> text_len;
  if (!json.has_value() && !texts.empty()) {
    csv = AnalyzeCsv(texts);
    patterns = DetectTextPatterns(texts);
    size_t shortest = std::numeric_limits<size_t>::max();
    size_t longest = 0;
    bool multiline = false;
    for (const std::string* text : texts) {
      size_t length = text::CodePointCount(*text);
      shortest = std::min(shortest, length);
      longest = std::max(longest, length);
      multiline = multiline || text->find('\n') != std::string::npos;
    }
    text_len = std::make_pair(shortest, longest);
    profile.text_max_len = longest;
    if (longest >= kLongTextLength || multiline) {
      std::vector<std::string> peeks;
      for (size_t i = 0; i < texts.size() && i < 2; ++i) peeks.push_back(PeekText(*texts[i]));
      profile.text_peek = absl::StrJoin(peeks, " | ");
    }
  }

  const SqlValue* low = nullptr;
  const SqlValue* high = nullptr;
  if (!json.has_value() && !csv.has_value()) {
    for (const SqlValue* value : non_null) {
      if (!value->is_numeric()) continue;
      if (low == nullptr || value->AsDouble() < low->AsDouble()) low = value;
      if (high == nullptr || value->AsDouble() > high->AsDouble()) high = value;
    }
  }

  std::string values_summary;
  if (!non_null.empty()) {
    std::vector<const SqlValue*> distinct;
    for (const SqlValue* value : non_null) {
      bool seen = std::any_of(distinct.begin(), distinct.end(), [&](const SqlValue* d) { return *d == *value; });
      if (!seen) distinct.push_back(value);
      if (distinct.size() > kMaxDistinctValues) break;
    }
    if (distinct.size() <= kMaxDistinctValues) {
      std::vector<std::string> shown;
      for (const SqlValue* value : distinct) shown.push_back(FormatDistinctValue(*value));
      values_summary = absl::StrCat("values[", absl::StrJoin(shown, ", "), "]");
    }
  }

  std::string type_label;
  std::vector<std::string> parts;
  if (json.has_value()) {
    type_label = "json";
    parts.push_back(json->summary);
    profile.priority = 100;
  } else if (csv.has_value() && csv->ratio >= kCsvDetectionThreshold) {
    type_label = "csv";
    parts.push_back(FormatCsvSummary(*csv, /*tentative=*/false));
    profile.priority = 90;
  } else {
    if (csv.has_value()) {
      parts.push_back(FormatCsvSummary(*csv, /*tentative=*/true));
      profile.priority = std::max(profile.priority, 80);
    }
    if (!texts.empty()) {
      type_label = "text";
      if (json_hint > 0) parts.push_back(absl::StrCat("json? ", std::lround(json_hint * 100), "%"));
      if (text_len.has_value()) parts.push_back(absl::StrCat("len ", text_len->first, "-", text_len->second));
      if (!patterns.empty()) parts.push_back(absl::StrCat("patterns ", absl::StrJoin(patterns, ",")));
      if (!profile.text_peek.empty()) profile.priority = std::max(profile.priority, 80);
    }
    if (low != nullptr) {
      if (type_label.empty()) type_label = "num";
      parts.push_back(absl::StrCat("range ", FormatNumber(*low), "-", FormatNumber(*high)));
      profile.priority = std::max(profile.priority, 60);
    }
  }

  if (!values_summary.empty()) parts.push_back(values_summary);
  if (type_labels.size() > 1) parts.push_back(absl::StrCat("types ", absl::StrJoin(type_labels, ",")));

  std::string declared = DeclaredTypeCategory(column.declared_type);
  if (!declared.empty() && !type_label.empty()) {
    bool numeric_ok = (declared == "int" || declared == "float" || declared == "num") && type_label == "num";
    bool text_ok = declared == "text" && (type_label == "json" || type_label == "csv" || type_label == "text");
    if (!numeric_ok && !text_ok && declared != type_label) parts.push_back(absl::StrCat("decl ", declared));
  }

  if (!values.empty() && null_ratio >= kNullReportThreshold) {
    parts.push_back(absl::StrCat(sample_complete ? "nulls " : "nulls~ ", std::lround(null_ratio * 100), "%"));
  }

  std::string summary = parts.empty() ? column.name : absl::StrCat(column.name, ": ", absl::StrJoin(parts, "; "));
  profile.summary = Truncate(summary, kMaxColumnSummaryChars);
  return profile;
}

std::vector<ColumnProfile> ProfileColumns(const std::vector<ColumnInfo>& columns,
                                          const std::vector<std::vector<SqlValue>>& rows, bool sample_complete) {
  std::vector<std::vector<SqlValue>> by_column(columns.size());
  for (const auto& row : rows) {
    if (row.size() < columns.size()) continue;
    for (size_t i = 0; i < columns.size(); ++i) by_column[i].push_back(row[i]);
  }
  std::vector<ColumnProfile> profiles;
  profiles.reserve(columns.size());
  for (size_t i = 0; i < columns.size(); ++i) {
    profiles.push_back(ProfileColumn(columns[i], by_column[i], sample_complete));
  }
  return profiles;
}

std::string FormatProfileLine(const std::vector<ColumnProfile>& profiles, int max_chars) {
  std::vector<size_t> order(profiles.size());
  for (size_t i = 0; i < order.size(); ++i) order[i] = i;
  std::stable_sort(order.begin(), order.end(),
                   [&](size_t a, size_t b) { return profiles[a].priority > profiles[b].priority; });
  if (order.size() > kMaxColumnSummaries) order.resize(kMaxColumnSummaries);
  std::sort(order.begin(), order.end());

  std::vector<std::string> summaries;
  for (size_t i : order) {
    if (!profiles[i].summary.empty()) summaries.push_back(profiles[i].summary);
  }
  if (summaries.empty()) return "";
  return absl::StrCat("  profile: ", Truncate(absl::StrJoin(summaries, "; "), std::max(max_chars, 0)));
}

std::string FormatTextPeekLine(const std::vector<ColumnProfile>& profiles) {
  std::vector<const ColumnProfile*> candidates;
  for (const auto& profile : profiles) {
    if (!profile.text_peek.empty()) candidates.push_back(&profile);
  }
  if (candidates.empty()) return "";
  std::stable_sort(candidates.begin(), candidates.end(),
                   [](const ColumnProfile* a, const ColumnProfile* b) { return a->text_max_len > b->text_max_len; });
  std::vector<std::string> parts;
  for (size_t i = 0; i < candidates.size() && i < kMaxTextPeeks; ++i) {
    std::string peek = absl::StrReplaceAll(candidates[i]->text_peek, {{"\"", "'"}});
    parts.push_back(absl::StrCat(candidates[i]->name, "=\"", peek, "\""));
  }
  return absl::StrCat("  text_peek: ", absl::StrJoin(parts, "; "));
}

}  // namespace scratchdb
