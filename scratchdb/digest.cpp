#include "scratchdb/digest.h"

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <map>
#include <regex>
#include <tuple>
#include <utility>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"

#include "scratchdb/status_macros.h"

namespace scratchdb {

namespace {

constexpr double kUniqueThreshold = 0.95;
constexpr double kHighThreshold = 0.50;
constexpr double kMediumThreshold = 0.10;
constexpr double kLowThreshold = 0.01;
constexpr double kDominantTypeShare = 0.8;
constexpr double kImplicitFkConfidence = 0.8;
constexpr int64_t kLargeTableRows = 1000000;
constexpr int kSummaryTables = 8;
constexpr int kSummaryRelationships = 5;

struct ContentPattern {
  const char* name;
  std::regex regex;
};

// Checked in order; the first match wins.
const std::vector<ContentPattern>& ContentPatterns() {
  static const auto* const kPatterns = new std::vector<ContentPattern>{
      {"uuid", std::regex("^[0-9a-f]{8}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{4}-[0-9a-f]{12}$", std::regex::icase)},
      {"email", std::regex("^[^@]+@[^@]+\\.[^@]+$")},
      {"url", std::regex("^https?://\\S+$")},
      {"json_object", std::regex("^\\s*\\{[\\s\\S]*\\}\\s*$")},
      {"json_array", std::regex("^\\s*\\[[\\s\\S]*\\]\\s*$")},
      {"iso_datetime", std::regex("^\\d{4}-\\d{2}-\\d{2}[T ]\\d{2}:\\d{2}:\\d{2}")},
      {"iso_date", std::regex("^\\d{4}-\\d{2}-\\d{2}$")},
      {"unix_timestamp", std::regex("^1[0-9]{9}$")},
      {"base64", std::regex("^[A-Za-z0-9+/]{20,}={0,2}$")},
      {"hex", std::regex("^[0-9a-fA-F]{16,}$")},
      {"numeric_string", std::regex("^-?\\d+\\.?\\d*$")},
      {"empty", std::regex("^\\s*$")},
      {"path", std::regex("^(/|[A-Za-z]:\\\\)[\\w./\\\\-]+$")},
  };
  return *kPatterns;
}

// Counter that remembers first-seen order, so ties go to the earliest key.
class OrderedCounter {
 public:
  void Add(const std::string& key) {
    auto it = index_.find(key);
    if (it == index_.end()) {
      index_[key] = counts_.size();
      counts_.emplace_back(key, 1);
    } else {
      ++counts_[it->second].second;
    }
  }

  bool empty() const { return counts_.empty(); }

  int Get(const std::string& key) const {
    auto it = index_.find(key);
    return it == index_.end() ? 0 : counts_[it->second].second;
  }

  int Total() const {
    int total = 0;
    for (const auto& entry : counts_) total += entry.second;
    return total;
  }

  const std::pair<std::string, int>& MostCommon() const {
    const auto* best = &counts_.front();
    for (const auto& entry : counts_) {
      if (entry.second > best->second) best = &entry;
    }
    return *best;
  }

 private:
  absl::flat_hash_map<std::string, size_t> index_;
  std::vector<std::pair<std::string, int>> counts_;
};

double Round(double value, int digits) {
  double scale = std::pow(10.0, digits);
  return std::round(value * scale) / scale;
}

std::string Percent(double fraction) { return absl::StrFormat("%.0f%%", fraction * 100.0); }

std::string WithThousands(int64_t value) {
  std::string digits = absl::StrCat(value < 0 ? -value : value);
  std::string out;
  int count = 0;
  for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
    if (count > 0 && count % 3 == 0) out.push_back(',');
    out.push_back(*it);
    ++count;
  }
  if (value < 0) out.push_back('-');
  std::reverse(out.begin(), out.end());
  return out;
}

std::string HumanBytes(int64_t bytes) {
  if (bytes < 1024) return absl::StrCat(bytes, "B");
  if (bytes < 1024 * 1024) return absl::StrFormat("%.1fKB", bytes / 1024.0);
  if (bytes < 1024LL * 1024 * 1024) return absl::StrFormat("%.1fMB", bytes / (1024.0 * 1024));
  return absl::StrFormat("%.1fGB", bytes / (1024.0 * 1024 * 1024));
}

const char* TypeTag(const SqlValue& value) {
  switch (value.type) {
    case ValueType::kInteger:
      return "INTEGER";
    case ValueType::kReal:
      return "FLOAT";
    case ValueType::kText:
      return "TEXT";
    case ValueType::kBlob:
      return "BLOB";
    default:
      return "UNKNOWN";
  }
}

// Dominant runtime type plus the content pattern shared by most text values.
std::pair<std::string, std::optional<std::string>> DetectActualType(const std::vector<SqlValue>& values) {
  OrderedCounter types;
  OrderedCounter patterns;
  size_t limit = std::min<size_t>(values.size(), kDigestTypeSampleValues);
  for (size_t i = 0; i < limit; ++i) {
    const SqlValue& value = values[i];
    types.Add(TypeTag(value));
    if (value.type != ValueType::kText) continue;
    std::string sample = value.bytes.substr(0, kDigestMaxStringSampleLen);
    for (const auto& pattern : ContentPatterns()) {
      if (std::regex_search(sample, pattern.regex)) {
        patterns.Add(pattern.name);
        break;
      }
    }
  }
  if (types.empty()) return {"UNKNOWN", std::nullopt};

  const auto& dominant = types.MostCommon();
  std::string actual_type =
      static_cast<double>(dominant.second) / types.Total() < kDominantTypeShare ? "MIXED" : dominant.first;

  std::optional<std::string> content_pattern;
  int text_count = types.Get("TEXT");
  if (patterns.empty() || text_count == 0) return {actual_type, content_pattern};
  const auto& top = patterns.MostCommon();
  if (static_cast<double>(top.second) / text_count <= 0.5) return {actual_type, content_pattern};

  const std::string& name = top.first;
  content_pattern = name;
  if (name == "json_object" || name == "json_array") {
    actual_type = "JSON";
    content_pattern = "json";
  } else if (name == "uuid") {
    actual_type = "UUID";
  } else if (name == "email") {
    actual_type = "EMAIL";
  } else if (name == "url") {
    actual_type = "URL";
  } else if (name == "path") {
    actual_type = "PATH";
  } else if (name == "iso_datetime" || name == "iso_date" || name == "unix_timestamp") {
    actual_type = "DATETIME";
    content_pattern = name == "iso_date" ? "date" : name == "unix_timestamp" ? "timestamp" : "datetime";
  } else if (name == "base64" || name == "hex") {
    content_pattern = "hash";
  }
  return {actual_type, content_pattern};
}

std::string BuildSampleValues(const std::vector<const SqlValue*>& non_null) {
  std::vector<std::string> samples;
  for (size_t i = 0; i < non_null.size() && i < 5; ++i) {
    std::string s = non_null[i]->ToString();
    if (s.size() > 30) s = s.substr(0, 27) + "...";
    samples.push_back(std::move(s));
  }
  if (samples.empty()) return "(empty)";
  std::string result = absl::StrJoin(samples, ", ");
  if (result.size() > 80) result = result.substr(0, 77) + "...";
  return result;
}

bool ContainsAny(const std::string& haystack, std::initializer_list<const char*> needles) {
  for (const char* needle : needles) {
    if (absl::StrContains(haystack, needle)) return true;
  }
  return false;
}

bool HasColumnNamed(const std::vector<std::string>& names, std::initializer_list<const char*> wanted) {
  for (const char* name : wanted) {
    if (std::find(names.begin(), names.end(), name) != names.end()) return true;
  }
  return false;
}

std::vector<std::string> LowerColumnNames(const std::vector<ColumnDigest>& columns) {
  std::vector<std::string> names;
  names.reserve(columns.size());
  for (const auto& column : columns) names.push_back(absl::AsciiStrToLower(column.name));
  return names;
}

bool IsJunctionTable(const std::vector<ColumnDigest>& columns) {
  if (columns.size() < 2 || columns.size() > 5) return false;
  int fk_count = 0;
  for (const auto& column : columns) fk_count += column.is_foreign_key ? 1 : 0;
  return fk_count >= 2;
}

bool IsLookupTable(int64_t row_count, const std::vector<ColumnDigest>& columns) {
  if (row_count > 100 || row_count < 1) return false;
  if (columns.size() < 2 || columns.size() > 5) return false;
  bool has_id = false;
  bool has_label = false;
  for (const auto& column : columns) {
    std::string lower = absl::AsciiStrToLower(column.name);
    has_id = has_id || column.is_primary_key || absl::StrContains(lower, "id");
    has_label = has_label || ContainsAny(lower, {"name", "label", "value", "code", "title"});
  }
  return has_id && has_label;
}

bool IsLogTable(const std::string& table, const std::vector<ColumnDigest>& columns) {
  if (ContainsAny(absl::AsciiStrToLower(table), {"log", "audit", "history", "event", "activity"})) return true;
  std::vector<std::string> names = LowerColumnNames(columns);
  return HasColumnNamed(names, {"timestamp", "created_at", "logged_at", "event_time"}) &&
         HasColumnNamed(names, {"action", "event", "type", "operation"});
}

absl::StatusOr<std::vector<std::string>> ListNames(GuardedSession* session, const std::string& sql) {
  ASSIGN_OR_RETURN(auto stmt, session->Prepare(sql));
  std::vector<std::string> names;
  while (true) {
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (!has_row) break;
    names.push_back(stmt->ColumnText(0));
  }
  return names;
}

// One column of `PRAGMA <pragma>("<arg>")`.
absl::StatusOr<std::vector<std::string>> PragmaColumn(GuardedSession* session, const char* pragma,
                                                      const std::string& arg, int column) {
  ASSIGN_OR_RETURN(auto stmt, session->Prepare(absl::StrCat("PRAGMA ", pragma, "(", QuoteIdentifier(arg), ");")));
  std::vector<std::string> values;
  while (true) {
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (!has_row) break;
    values.push_back(stmt->ColumnText(column));
  }
  return values;
}

bool IsEphemeralTable(const std::string& name) {
  for (const char* ephemeral : kEphemeralTables) {
    if (name == ephemeral) return true;
  }
  return false;
}

struct TableInfoRow {
  std::string name;
  std::string type;
  int pk = 0;
};

struct ForeignKeyRow {
  std::string table;
  std::string from;
  std::string to;
};

absl::StatusOr<std::vector<ForeignKeyRow>> ForeignKeyList(GuardedSession* session, const std::string& table) {
  ASSIGN_OR_RETURN(auto stmt, session->Prepare(absl::StrCat("PRAGMA foreign_key_list(", QuoteIdentifier(table), ");")));
  std::vector<ForeignKeyRow> rows;
  while (true) {
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (!has_row) break;
    rows.push_back({stmt->ColumnText(2), stmt->ColumnText(3), stmt->ColumnText(4)});
  }
  return rows;
}

std::string ClassifyNullDensity(double null_pct) {
  if (null_pct < 0.05) return "dense";
  if (null_pct < 0.20) return "normal";
  if (null_pct < 0.50) return "sparse";
  return "very_sparse";
}

std::string ClassifyTypeConsistency(double consistency) {
  if (consistency >= 0.95) return "excellent";
  if (consistency >= 0.80) return "good";
  if (consistency >= 0.60) return "fair";
  return "poor";
}

std::string ClassifySchemaPattern(const std::vector<TableDigest>& tables,
                                  const std::vector<RelationshipDigest>& relationships) {
  if (tables.empty()) return "empty";
  if (tables.size() == 1 || relationships.empty()) return "flat";

  double density = static_cast<double>(relationships.size()) / tables.size();
  bool has_junction = std::any_of(tables.begin(), tables.end(), [](const TableDigest& t) { return t.is_junction; });
  if (has_junction && density > 1) return "normalized";

  if (density > 2) {
    OrderedCounter targets;
    for (const auto& rel : relationships) targets.Add(rel.to_table);
    if (targets.MostCommon().second >= tables.size() * 0.5) return "star";
  }
  if (density > 1) return "normalized";
  if (density > 0.3) return "relational";
  return "loosely_coupled";
}

std::pair<std::string, std::string> DetermineVerdict(double type_consistency, double null_pct, size_t rel_count,
                                                     const std::string& schema_pattern,
                                                     const std::vector<TableDigest>& tables) {
  double score = type_consistency * 0.3 + (1 - null_pct) * 0.2;
  if (rel_count > 0) score += 0.2;
  if (schema_pattern == "normalized" || schema_pattern == "star" || schema_pattern == "relational") {
    score += 0.2;
  } else if (schema_pattern == "flat") {
    score += 0.1;
  }
  if (std::any_of(tables.begin(), tables.end(), [](const TableDigest& t) { return t.is_lookup; })) score += 0.05;
  if (std::any_of(tables.begin(), tables.end(), [](const TableDigest& t) { return t.is_log; })) score += 0.05;

  if (score >= 0.75) return {"clean", "query_directly"};
  if (score >= 0.55) return {"usable", "inspect_schema"};
  if (score >= 0.35) return {"messy", "needs_cleaning"};
  return {"chaotic", "investigate"};
}

std::string CompileFlags(const std::vector<TableDigest>& tables, const std::vector<const ColumnDigest*>& columns,
                         size_t rel_count) {
  std::vector<std::string> flags;
  auto large = std::count_if(tables.begin(), tables.end(),
                             [](const TableDigest& t) { return t.row_count > kLargeTableRows; });
  if (large > 0) flags.push_back(absl::StrCat("large_tables(", large, ")"));
  int mixed = 0;
  int json = 0;
  int high_null = 0;
  for (const ColumnDigest* column : columns) {
    mixed += column->actual_type == "MIXED" ? 1 : 0;
    json += column->actual_type == "JSON" ? 1 : 0;
    high_null += column->null_pct > 0.5 ? 1 : 0;
  }
  if (mixed > 3) flags.push_back(absl::StrCat("mixed_types(", mixed, ")"));
  if (json > 0) flags.push_back(absl::StrCat("has_json(", json, ")"));
  if (high_null > 3) flags.push_back(absl::StrCat("high_nulls(", high_null, ")"));
  if (rel_count == 0 && tables.size() > 1) flags.push_back("no_relationships");
  return absl::StrJoin(flags, ",");
}

std::string BuildTablesSummary(const std::vector<TableDigest>& tables, size_t total_tables) {
  std::vector<std::string> parts;
  for (size_t i = 0; i < tables.size() && i < static_cast<size_t>(kSummaryTables); ++i) {
    parts.push_back(absl::StrCat(tables[i].name, "(", tables[i].column_count, ")"));
  }
  if (total_tables > static_cast<size_t>(kSummaryTables)) {
    parts.push_back(absl::StrCat("+", total_tables - kSummaryTables, " more"));
  }
  return absl::StrJoin(parts, ", ");
}

std::string BuildLargestTables(const std::vector<TableDigest>& tables) {
  std::vector<const TableDigest*> sorted;
  for (const auto& table : tables) sorted.push_back(&table);
  std::stable_sort(sorted.begin(), sorted.end(),
                   [](const TableDigest* a, const TableDigest* b) { return a->row_count > b->row_count; });
  std::vector<std::string> parts;
  for (size_t i = 0; i < sorted.size() && i < 3; ++i) {
    parts.push_back(absl::StrCat(sorted[i]->name, ": ", WithThousands(sorted[i]->row_count)));
  }
  return parts.empty() ? "none" : absl::StrJoin(parts, ", ");
}

std::string BuildRelationshipsSummary(const std::vector<RelationshipDigest>& relationships) {
  if (relationships.empty()) return "none detected";
  std::vector<std::string> parts;
  for (size_t i = 0; i < relationships.size() && i < static_cast<size_t>(kSummaryRelationships); ++i) {
    parts.push_back(relationships[i].ToCompact());
  }
  if (relationships.size() > static_cast<size_t>(kSummaryRelationships)) {
    parts.push_back(absl::StrCat("+", relationships.size() - kSummaryRelationships, " more"));
  }
  return absl::StrJoin(parts, "; ");
}

// Prefers mid-sized tables, then more foreign keys, then wider tables.
std::string BuildSampleTable(const std::vector<TableDigest>& tables) {
  if (tables.empty()) return "no tables";
  auto rank = [](const TableDigest& t) {
    return std::make_tuple(t.row_count > 100 && t.row_count < 10000 ? 1 : 0, t.foreign_keys.size(), t.column_count);
  };
  const TableDigest* best = &tables.front();
  for (const auto& table : tables) {
    if (rank(table) > rank(*best)) best = &table;
  }
  return best->ToCompact();
}

std::vector<RelationshipDigest> DetectImplicitForeignKeys(const std::vector<TableDigest>& tables) {
  absl::flat_hash_map<std::string, const ColumnDigest*> pk_index;
  for (const auto& table : tables) {
    for (const auto& column : table.columns) {
      if (column.is_primary_key) pk_index[table.name] = &column;
    }
  }
  std::vector<RelationshipDigest> relationships;
  for (const auto& table : tables) {
    for (const auto& column : table.columns) {
      if (column.is_foreign_key || column.is_primary_key) continue;
      std::string lower = absl::AsciiStrToLower(column.name);
      if (!absl::EndsWith(lower, "_id")) continue;
      std::string noun = lower.substr(0, lower.size() - 3);
      for (const auto& other : tables) {
        if (absl::AsciiStrToLower(other.name) != noun) continue;
        auto pk = pk_index.find(other.name);
        if (pk != pk_index.end()) {
          relationships.push_back(
              {table.name, column.name, other.name, pk->second->name, "implicit_fk", kImplicitFkConfidence});
        }
        break;
      }
    }
  }
  if (relationships.size() > static_cast<size_t>(kDigestMaxImplicitFks)) relationships.resize(kDigestMaxImplicitFks);
  return relationships;
}

}  // namespace

std::string ColumnDigest::ToCompact() const {
  std::vector<std::string> flags;
  if (is_primary_key) flags.push_back("PK");
  if (is_foreign_key) flags.push_back("FK");
  if (is_indexed && !is_primary_key) flags.push_back("IDX");
  std::string type = actual_type;
  if (content_pattern.has_value() && *content_pattern != actual_type) {
    type = absl::StrCat(actual_type, "(", *content_pattern, ")");
  }
  return absl::StrCat(name, ": ", type, " | null:", Percent(null_pct), " uniq:", Percent(unique_pct),
                      flags.empty() ? "" : absl::StrCat(" [", absl::StrJoin(flags, ","), "]"));
}

std::string TableDigest::ToCompact() const {
  std::vector<std::string> roles;
  if (is_junction) roles.push_back("junction");
  if (is_lookup) roles.push_back("lookup");
  if (is_log) roles.push_back("log");
  std::vector<std::string> names;
  for (size_t i = 0; i < columns.size() && i < 5; ++i) names.push_back(columns[i].name);
  std::string column_summary = absl::StrJoin(names, ", ");
  if (columns.size() > 5) absl::StrAppend(&column_summary, ", +", columns.size() - 5, " more");
  return absl::StrCat(name, ": ", WithThousands(row_count), " rows x ", column_count, " cols",
                      roles.empty() ? "" : absl::StrCat(" (", absl::StrJoin(roles, ", "), ")"), " | ",
                      column_summary);
}

std::string RelationshipDigest::ToCompact() const {
  std::string suffix = relation_type == "implicit_fk" ? absl::StrCat(" (", Percent(confidence), ")") : "";
  return absl::StrCat(from_table, ".", from_column, " -> ", to_table, ".", to_column, suffix);
}

std::string SqliteDigest::SummaryLine() const {
  std::vector<std::string> parts = {absl::StrCat("tables=", table_count), absl::StrCat("rows=", total_rows),
                                    absl::StrCat("verdict=", verdict), absl::StrCat("action=", action),
                                    absl::StrCat("schema=", schema_pattern)};
  if (!flags.empty()) parts.push_back(absl::StrCat("flags=", flags));
  return absl::StrJoin(parts, " ");
}

std::string SqliteDigest::ToPrompt() const {
  std::vector<std::string> patterns;
  if (has_junction_tables) patterns.push_back("junction_tables");
  if (has_lookup_tables) patterns.push_back("lookup_tables");
  if (has_log_tables) patterns.push_back("log_tables");
  if (has_soft_deletes) patterns.push_back("soft_deletes");
  if (has_timestamps) patterns.push_back("timestamps");
  if (has_audit_fields) patterns.push_back("audit_fields");
  std::string pattern_text = patterns.empty() ? "none detected" : absl::StrJoin(patterns, ", ");

  std::string out = "<sqlite_digest>\n";
  absl::StrAppend(&out, "file: ", HumanBytes(file_size), " | ", page_count, " pages\n");
  absl::StrAppend(&out, "schema: ", table_count, " tables, ", view_count, " views, ", index_count, " indexes, ",
                  trigger_count, " triggers\n");
  absl::StrAppend(&out, "data: ", WithThousands(total_rows), " total rows across ", total_columns, " columns\n\n");
  absl::StrAppend(&out, "tables: ", tables_summary, "\n");
  absl::StrAppend(&out, "largest: ", largest_tables, "\n\n");
  absl::StrAppend(&out, "relationships: ", explicit_fk_count, " explicit FK, ", implicit_fk_count, " implicit\n");
  absl::StrAppend(&out, "  ", relationships_summary, "\n\n");
  absl::StrAppend(&out, "quality: nulls=", overall_null_verdict, " (", Percent(overall_null_pct),
                  ") | types=", type_consistency_verdict, " (", Percent(type_consistency), ")\n");
  absl::StrAppend(&out, "content: ", detected_json_columns, " json cols, ", detected_datetime_columns,
                  " datetime cols, ", detected_id_columns, " id cols\n\n");
  absl::StrAppend(&out, "patterns: ", pattern_text, "\n");
  absl::StrAppend(&out, "schema_style: ", schema_pattern, "\n\n");
  absl::StrAppend(&out, "VERDICT: ", verdict, " -> ", action, "\n");
  absl::StrAppend(&out, flags.empty() ? "" : absl::StrCat("flags: ", flags), "\n\n");
  absl::StrAppend(&out, "sample_table: ", sample_table, "\n");
  absl::StrAppend(&out, "</sqlite_digest>");
  return out;
}

nlohmann::json SqliteDigest::ToJson() const {
  nlohmann::json j = {
      {"file_size", file_size},
      {"page_count", page_count},
      {"table_count", table_count},
      {"view_count", view_count},
      {"index_count", index_count},
      {"trigger_count", trigger_count},
      {"total_rows", total_rows},
      {"total_columns", total_columns},
      {"tables_summary", tables_summary},
      {"largest_tables", largest_tables},
      {"explicit_fk_count", explicit_fk_count},
      {"implicit_fk_count", implicit_fk_count},
      {"relationships_summary", relationships_summary},
      {"overall_null_pct", overall_null_pct},
      {"overall_null_verdict", overall_null_verdict},
      {"type_consistency", type_consistency},
      {"type_consistency_verdict", type_consistency_verdict},
      {"detected_json_columns", detected_json_columns},
      {"detected_datetime_columns", detected_datetime_columns},
      {"detected_id_columns", detected_id_columns},
      {"has_junction_tables", has_junction_tables},
      {"has_lookup_tables", has_lookup_tables},
      {"has_log_tables", has_log_tables},
      {"has_soft_deletes", has_soft_deletes},
      {"has_timestamps", has_timestamps},
      {"has_audit_fields", has_audit_fields},
      {"schema_pattern", schema_pattern},
      {"verdict", verdict},
      {"action", action},
      {"flags", flags},
      {"sample_table", sample_table},
  };
  nlohmann::json details = nlohmann::json::array();
  for (const auto& table : tables) {
    nlohmann::json columns = nlohmann::json::array();
    for (const auto& column : table.columns) columns.push_back(column.ToCompact());
    details.push_back({{"name", table.name},
                       {"row_count", table.row_count},
                       {"column_count", table.column_count},
                       {"columns", std::move(columns)}});
  }
  j["tables"] = std::move(details);
  return j;
}

SqliteDigest ErrorDigest(const std::string& error) {
  SqliteDigest digest;
  digest.tables_summary = "error";
  digest.largest_tables = "error";
  digest.relationships_summary = "error";
  digest.overall_null_verdict = "error";
  digest.type_consistency = 0.0;
  digest.type_consistency_verdict = "error";
  digest.schema_pattern = "error";
  digest.verdict = "error";
  digest.action = "investigate";
  digest.flags = absl::StrCat("error: ", error.substr(0, 50));
  digest.sample_table = "error";
  return digest;
}

SqliteDigest EmptyDigest(int64_t file_size, int64_t page_count) {
  SqliteDigest digest;
  digest.file_size = file_size;
  digest.page_count = page_count;
  digest.tables_summary = "none";
  digest.largest_tables = "none";
  digest.relationships_summary = "none";
  digest.overall_null_verdict = "n/a";
  digest.type_consistency = 1.0;
  digest.type_consistency_verdict = "n/a";
  digest.schema_pattern = "empty";
  digest.verdict = "minimal";
  digest.action = "skip";
  digest.flags = "empty";
  digest.sample_table = "none";
  return digest;
}

DigestOptions DigestOptions::FromConfig(const Config& config) {
  DigestOptions options;
  options.sample_size = config.digest_sample_size;
  options.max_tables = config.digest_max_tables;
  options.max_columns = config.digest_max_columns;
  return options;
}

const char* ClassifyCardinality(double unique_pct) {
  if (unique_pct >= kUniqueThreshold) return "unique";
  if (unique_pct >= kHighThreshold) return "high";
  if (unique_pct >= kMediumThreshold) return "medium";
  if (unique_pct >= kLowThreshold) return "low";
  return "constant";
}

double CalculateEntropy(const std::string& text) {
  if (text.empty()) return 0.0;
  std::map<unsigned char, int> freq;
  for (char c : text) ++freq[static_cast<unsigned char>(c)];
  double n = static_cast<double>(text.size());
  double entropy = 0.0;
  for (const auto& entry : freq) {
    double p = entry.second / n;
    entropy -= p * std::log2(p);
  }
  return entropy;
}

ColumnDigest AnalyzeColumn(const std::string& name, const std::string& declared_type,
                           const std::vector<SqlValue>& values, bool is_primary_key, bool is_foreign_key,
                           bool is_indexed) {
  ColumnDigest column;
  column.name = name;
  column.declared_type = declared_type;
  column.is_primary_key = is_primary_key;
  column.is_foreign_key = is_foreign_key;
  column.is_indexed = is_indexed;

  if (values.empty()) {
    column.actual_type = "UNKNOWN";
    column.null_pct = 1.0;
    column.cardinality_class = "unknown";
    column.sample_values = "(no data)";
    return column;
  }

  std::vector<const SqlValue*> non_null;
  std::vector<SqlValue> non_null_values;
  for (const auto& value : values) {
    if (value.is_null()) continue;
    non_null.push_back(&value);
    non_null_values.push_back(value);
  }
  if (non_null.empty()) {
    column.actual_type = "NULL";
    column.null_pct = 1.0;
    column.cardinality_class = "constant";
    column.sample_values = "(all null)";
    return column;
  }

  double null_pct = static_cast<double>(values.size() - non_null.size()) / values.size();
  absl::flat_hash_set<std::string> distinct;
  for (size_t i = 0; i < non_null.size() && i < static_cast<size_t>(kDigestMaxUniqueValues); ++i) {
    distinct.insert(non_null[i]->ToString().substr(0, 100));
  }
  double unique_pct = static_cast<double>(distinct.size()) / non_null.size();

  auto [actual_type, content_pattern] = DetectActualType(non_null_values);

  if (actual_type == "INTEGER" || actual_type == "FLOAT") {
    for (const SqlValue* value : non_null) {
      if (!value->is_numeric()) continue;
      double v = value->AsDouble();
      column.min_val = column.min_val.has_value() ? std::min(*column.min_val, v) : v;
      column.max_val = column.max_val.has_value() ? std::max(*column.max_val, v) : v;
    }
  }

  static const absl::flat_hash_set<std::string>* const kTextualTypes =
      new absl::flat_hash_set<std::string>({"TEXT", "JSON", "UUID", "EMAIL", "URL", "PATH"});
  if (kTextualTypes->contains(actual_type)) {
    size_t length_count = std::min<size_t>(non_null.size(), 100);
    double total_length = 0;
    for (size_t i = 0; i < length_count; ++i) total_length += non_null[i]->ToString().size();
    column.avg_length = Round(total_length / length_count, 1);
    std::string combined;
    for (size_t i = 0; i < non_null.size() && i < 50; ++i) combined += non_null[i]->ToString();
    if (combined.size() > 5000) combined.resize(5000);
    column.entropy = Round(CalculateEntropy(combined), 2);
  }

  column.actual_type = actual_type;
  column.content_pattern = content_pattern;
  column.null_pct = Round(null_pct, 3);
  column.unique_pct = Round(unique_pct, 3);
  column.cardinality_class = ClassifyCardinality(unique_pct);
  column.sample_values = BuildSampleValues(non_null);
  return column;
}

SqliteDigest Digestor::Digest(GuardedSession* session) const {
  auto digest_or = Analyze(session);
  if (!digest_or.ok()) {
    LOG(WARNING) << "Digest failed for " << session->path() << ": " << digest_or.status().message();
    return ErrorDigest(std::string(digest_or.status().message()));
  }
  return *std::move(digest_or);
}

SqliteDigest Digestor::DigestFile(const std::string& path) const {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) return ErrorDigest(absl::StrCat("File not found: ", path));
  auto session_or = GuardedSession::Open(path);
  if (!session_or.ok()) return ErrorDigest(std::string(session_or.status().message()));
  return Digest(session_or->get());
}

absl::StatusOr<SqliteDigest> Digestor::Analyze(GuardedSession* session) const {
  auto page_count_or = session->QueryInt64("PRAGMA page_count;");
  int64_t page_count = page_count_or.ok() ? *page_count_or : 0;
  int64_t file_size = session->FileSizeBytes();

  ASSIGN_OR_RETURN(std::vector<std::string> all_tables,
                   ListNames(session, "SELECT name FROM sqlite_master WHERE type='table' "
                                      "AND name NOT LIKE 'sqlite_%' ORDER BY name;"));
  std::vector<std::string> tables;
  for (auto& name : all_tables) {
    if (!IsEphemeralTable(name)) tables.push_back(std::move(name));
  }
  ASSIGN_OR_RETURN(auto views, ListNames(session, "SELECT name FROM sqlite_master WHERE type='view';"));
  ASSIGN_OR_RETURN(auto indexes, ListNames(session, "SELECT name FROM sqlite_master WHERE type='index' "
                                                    "AND name NOT LIKE 'sqlite_%';"));
  ASSIGN_OR_RETURN(auto triggers, ListNames(session, "SELECT name FROM sqlite_master WHERE type='trigger';"));

  if (tables.empty()) return EmptyDigest(file_size, page_count);

  SqliteDigest digest;
  digest.file_size = file_size;
  digest.page_count = page_count;
  digest.table_count = static_cast<int>(tables.size());
  digest.view_count = static_cast<int>(views.size());
  digest.index_count = static_cast<int>(indexes.size());
  digest.trigger_count = static_cast<int>(triggers.size());

  size_t detail_limit = std::min(tables.size(), static_cast<size_t>(std::max(options_.max_tables, 0)));
  for (size_t i = 0; i < detail_limit; ++i) {
    ASSIGN_OR_RETURN(TableDigest table, AnalyzeTable(session, tables[i]));
    digest.tables.push_back(std::move(table));
  }
  std::vector<const ColumnDigest*> columns;
  for (const auto& table : digest.tables) {
    for (const auto& column : table.columns) columns.push_back(&column);
  }

  std::vector<RelationshipDigest> relationships;
  for (const auto& table : tables) {
    auto fks_or = ForeignKeyList(session, table);
    if (!fks_or.ok()) continue;
    for (const auto& fk : *fks_or) {
      relationships.push_back({table, fk.from, fk.table, fk.to, "explicit_fk", 1.0});
    }
  }
  digest.explicit_fk_count = static_cast<int>(relationships.size());
  std::vector<RelationshipDigest> implicit = DetectImplicitForeignKeys(digest.tables);
  digest.implicit_fk_count = static_cast<int>(implicit.size());
  relationships.insert(relationships.end(), implicit.begin(), implicit.end());

  double null_total = 0;
  int consistent = 0;
  absl::flat_hash_set<std::string> column_names;
  for (const ColumnDigest* column : columns) {
    null_total += column->null_pct;
    consistent += column->actual_type != "MIXED" ? 1 : 0;
    const std::string pattern = column->content_pattern.value_or("");
    if (pattern == "json") ++digest.detected_json_columns;
    if (pattern == "datetime" || pattern == "date" || pattern == "timestamp") ++digest.detected_datetime_columns;
    if (pattern == "uuid" || pattern == "hash" || pattern == "id") ++digest.detected_id_columns;
    column_names.insert(absl::AsciiStrToLower(column->name));
  }
  double overall_null = columns.empty() ? 0.0 : null_total / columns.size();
  double type_consistency = static_cast<double>(consistent) / std::max<size_t>(1, columns.size());

  for (const auto& table : digest.tables) {
    digest.total_rows += table.row_count;
    digest.total_columns += table.column_count;
    digest.has_junction_tables = digest.has_junction_tables || table.is_junction;
    digest.has_lookup_tables = digest.has_lookup_tables || table.is_lookup;
    digest.has_log_tables = digest.has_log_tables || table.is_log;
  }
  auto any_column = [&column_names](std::initializer_list<const char*> names) {
    for (const char* name : names) {
      if (column_names.contains(name)) return true;
    }
    return false;
  };
  digest.has_soft_deletes = any_column({"deleted_at", "is_deleted", "deleted", "removed_at"});
  digest.has_timestamps = any_column({"created_at", "updated_at", "modified_at", "timestamp"});
  digest.has_audit_fields = any_column({"created_by", "updated_by", "modified_by", "author_id"});

  digest.overall_null_pct = Round(overall_null, 3);
  digest.overall_null_verdict = ClassifyNullDensity(overall_null);
  digest.type_consistency = Round(type_consistency, 3);
  digest.type_consistency_verdict = ClassifyTypeConsistency(type_consistency);
  digest.schema_pattern = ClassifySchemaPattern(digest.tables, relationships);
  std::tie(digest.verdict, digest.action) =
      DetermineVerdict(type_consistency, overall_null, relationships.size(), digest.schema_pattern, digest.tables);
  digest.flags = CompileFlags(digest.tables, columns, relationships.size());
  digest.tables_summary = BuildTablesSummary(digest.tables, tables.size());
  digest.largest_tables = BuildLargestTables(digest.tables);
  digest.relationships_summary = BuildRelationshipsSummary(relationships);
  digest.sample_table = BuildSampleTable(digest.tables);
  return digest;
}

absl::StatusOr<TableDigest> Digestor::AnalyzeTable(GuardedSession* session, const std::string& table) const {
  TableDigest digest;
  digest.name = table;
  std::string quoted = QuoteIdentifier(table);
  auto count_or = session->QueryInt64(absl::StrCat("SELECT COUNT(*) FROM ", quoted, ";"));
  digest.row_count = count_or.ok() ? *count_or : 0;

  std::vector<TableInfoRow> info;
  {
    ASSIGN_OR_RETURN(auto stmt, session->Prepare(absl::StrCat("PRAGMA table_info(", quoted, ");")));
    while (true) {
      ASSIGN_OR_RETURN(bool has_row, stmt->Step());
      if (!has_row) break;
      info.push_back({stmt->ColumnText(1), stmt->ColumnText(2), stmt->ColumnInt(5)});
    }
  }

  absl::flat_hash_set<std::string> indexed_columns;
  ASSIGN_OR_RETURN(digest.indexes, PragmaColumn(session, "index_list", table, 1));
  for (const auto& index : digest.indexes) {
    auto cols_or = PragmaColumn(session, "index_info", index, 2);
    if (!cols_or.ok()) continue;
    for (auto& col : *cols_or) indexed_columns.insert(std::move(col));
  }

  ASSIGN_OR_RETURN(std::vector<ForeignKeyRow> fks, ForeignKeyList(session, table));
  absl::flat_hash_set<std::string> fk_columns;
  for (const auto& fk : fks) {
    if (fk_columns.insert(fk.from).second) {
      digest.foreign_keys.push_back(absl::StrCat(fk.from, " -> ", fk.table, ".", fk.to));
    }
  }

  std::vector<std::string> pk_columns;
  for (const auto& col : info) {
    if (col.pk > 0) pk_columns.push_back(col.name);
  }
  if (pk_columns.size() == 1) {
    digest.primary_key = pk_columns.front();
  } else if (!pk_columns.empty()) {
    digest.primary_key = absl::StrCat("(", absl::StrJoin(pk_columns, ", "), ")");
  }

  size_t detail_columns = std::min(info.size(), static_cast<size_t>(std::max(options_.max_columns, 0)));
  std::vector<std::vector<SqlValue>> samples(detail_columns);
  if (detail_columns > 0) {
    std::vector<std::string> names;
    for (size_t i = 0; i < detail_columns; ++i) names.push_back(QuoteIdentifier(info[i].name));
    auto stmt_or = session->Prepare(absl::StrCat("SELECT ", absl::StrJoin(names, ", "), " FROM ", quoted,
                                                 " ORDER BY RANDOM() LIMIT ", options_.sample_size, ";"));
    absl::Status sample_status = stmt_or.status();
    while (sample_status.ok()) {
      auto has_row = (*stmt_or)->Step();
      if (!has_row.ok()) {
        sample_status = has_row.status();
        break;
      }
      if (!*has_row) break;
      for (size_t i = 0; i < detail_columns; ++i) samples[i].push_back((*stmt_or)->ColumnValue(static_cast<int>(i)));
    }
    if (!sample_status.ok()) {
      LOG(WARNING) << "Sampling " << table << " failed: " << sample_status.message();
      for (auto& column_samples : samples) column_samples.clear();
    }
  }

  double null_total = 0;
  for (size_t i = 0; i < detail_columns; ++i) {
    const auto& col = info[i];
    ColumnDigest column = AnalyzeColumn(col.name, col.type.empty() ? "NONE" : col.type, samples[i], col.pk > 0,
                                        fk_columns.contains(col.name), indexed_columns.contains(col.name));
    null_total += column.null_pct;
    digest.columns.push_back(std::move(column));
  }
  digest.null_density = digest.columns.empty() ? 0.0 : null_total / digest.columns.size();
  digest.column_count = static_cast<int>(info.size());
  digest.size_bytes = digest.row_count * digest.column_count * 50;
  digest.is_junction = IsJunctionTable(digest.columns);
  digest.is_lookup = IsLookupTable(digest.row_count, digest.columns);
  digest.is_log = IsLogTable(table, digest.columns);
  return digest;
}

}  // namespace scratchdb
