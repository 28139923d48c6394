#include "scratchdb/tool_result_cache.h"

#include <algorithm>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/strip.h"

#include "scratchdb/record_store.h"
#include "scratchdb/status_macros.h"

namespace scratchdb {

namespace {

std::string DumpCompact(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

bool ContainsIgnoreCase(absl::string_view haystack, absl::string_view needle) {
  return absl::StrContains(absl::AsciiStrToLower(haystack), needle);
}

// Cuts to at most `max_bytes` without leaving a partial UTF-8 sequence.
std::string TruncateToBytes(const std::string& text, int64_t max_bytes, int64_t* dropped) {
  *dropped = 0;
  if (max_bytes < 0 || static_cast<int64_t>(text.size()) <= max_bytes) return text;
  *dropped = static_cast<int64_t>(text.size()) - max_bytes;
  size_t end = static_cast<size_t>(max_bytes);
  while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) --end;
  return text.substr(0, end);
}

std::vector<std::string> TopKeys(const nlohmann::json& value) {
  const nlohmann::json* object = nullptr;
  if (value.is_object()) {
    object = &value;
  } else if (value.is_array() && !value.empty() && value.front().is_object()) {
    object = &value.front();
  }
  std::vector<std::string> keys;
  if (object == nullptr) return keys;
  for (auto it = object->begin(); it != object->end() && static_cast<int>(keys.size()) < kMaxToolResultTopKeys;
       ++it) {
    keys.push_back(it.key());
  }
  return keys;
}

}  // namespace

std::string JsonTypeName(const nlohmann::json& value) {
  switch (value.type()) {
    case nlohmann::json::value_t::object:
      return "object";
    case nlohmann::json::value_t::array:
      return "array";
    case nlohmann::json::value_t::string:
      return "string";
    case nlohmann::json::value_t::boolean:
      return "boolean";
    case nlohmann::json::value_t::number_integer:
    case nlohmann::json::value_t::number_unsigned:
      return "integer";
    case nlohmann::json::value_t::number_float:
      return "number";
    case nlohmann::json::value_t::null:
      return "null";
    default:
      return "unknown";
  }
}

nlohmann::json InferJsonSchema(const nlohmann::json& value, int depth) {
  nlohmann::json schema = {{"type", JsonTypeName(value)}};
  if (depth <= 0) return schema;
  if (value.is_object()) {
    nlohmann::json properties = nlohmann::json::object();
    for (auto it = value.begin(); it != value.end(); ++it) {
      properties[it.key()] = InferJsonSchema(it.value(), depth - 1);
    }
    schema["properties"] = std::move(properties);
  } else if (value.is_array() && !value.empty()) {
    schema["items"] = InferJsonSchema(value.front(), depth - 1);
  }
  return schema;
}

bool IsProbablyBinary(const std::string& text) {
  if (text.find('\0') != std::string::npos) return true;
  size_t sample = std::min<size_t>(text.size(), 1000);
  if (sample == 0) return false;
  size_t control = 0;
  for (size_t i = 0; i < sample; ++i) {
    unsigned char c = static_cast<unsigned char>(text[i]);
    if (c < 9 || (c > 13 && c < 32)) ++control;
  }
  return static_cast<double>(control) / sample > 0.3;
}

ToolResultMeta SummarizeToolResult(const std::string& text, int64_t max_stored_bytes) {
  ToolResultMeta meta;
  meta.bytes = static_cast<int64_t>(text.size());
  meta.line_count = text.empty() ? 0 : std::count(text.begin(), text.end(), '\n') + 1;
  meta.is_binary = IsProbablyBinary(text);
  meta.has_images = ContainsIgnoreCase(text, "data:image/") || ContainsIgnoreCase(text, "image_base64") ||
                    ContainsIgnoreCase(text, "image_url");
  meta.has_base64 = ContainsIgnoreCase(text, "base64,");

  std::string storage = text;
  absl::string_view trimmed = absl::StripAsciiWhitespace(text);
  if (!trimmed.empty() && (trimmed.front() == '{' || trimmed.front() == '[')) {
    auto parsed = nlohmann::json::parse(std::string(trimmed), nullptr, false);
    if (!parsed.is_discarded()) {
      meta.is_json = true;
      meta.json_type = JsonTypeName(parsed);
      meta.top_keys = TopKeys(parsed);
      meta.json_schema = DumpCompact(InferJsonSchema(parsed));
      storage = DumpCompact(parsed);
    }
  }

  std::string stored = TruncateToBytes(storage, max_stored_bytes, &meta.truncated_bytes);
  meta.is_truncated = meta.truncated_bytes > 0;
  if (meta.is_json && !meta.is_truncated) {
    meta.stored_json = std::move(stored);
  } else {
    meta.stored_text = std::move(stored);
  }
  return meta;
}

absl::Status ToolResultCache::Store(GuardedSession* session, const std::vector<ToolResultRecord>& results) const {
  RETURN_IF_ERROR(session->ExecuteScript(absl::StrCat("CREATE TABLE IF NOT EXISTS \"", kToolResultsTable,
                                                      "\" ("
                                                      "result_id TEXT PRIMARY KEY, "
                                                      "tool_name TEXT, "
                                                      "created_at TEXT, "
                                                      "bytes INTEGER, "
                                                      "line_count INTEGER, "
                                                      "is_json INTEGER, "
                                                      "json_type TEXT, "
                                                      "top_keys TEXT, "
                                                      "json_schema TEXT, "
                                                      "is_binary INTEGER, "
                                                      "has_images INTEGER, "
                                                      "has_base64 INTEGER, "
                                                      "is_truncated INTEGER, "
                                                      "truncated_bytes INTEGER, "
                                                      "result_json TEXT, "
                                                      "result_text TEXT);")));
  RETURN_IF_ERROR(session->ExecuteScript("BEGIN;"));
  absl::Status status = StoreRows(session, results);
  if (!status.ok()) {
    absl::Status rollback = session->ExecuteScript("ROLLBACK;");
    if (!rollback.ok()) LOG(WARNING) << "Tool result rollback failed: " << rollback.message();
    LOG(WARNING) << "Failed to store tool results: " << status.message();
    return status;
  }
  return session->ExecuteScript("COMMIT;");
}

absl::Status ToolResultCache::StoreRows(GuardedSession* session, const std::vector<ToolResultRecord>& results) const {
  RETURN_IF_ERROR(session->ExecuteScript(absl::StrCat("DELETE FROM \"", kToolResultsTable, "\";")));
  std::string now = RecordTimeNow();
  for (const auto& result : results) {
    if (result.result_id.empty()) return absl::InvalidArgumentError("Tool result without a result_id");
    ToolResultMeta meta = SummarizeToolResult(result.text, max_stored_bytes_);
    ASSIGN_OR_RETURN(auto stmt, session->Prepare(absl::StrCat(
                                    "INSERT OR REPLACE INTO \"", kToolResultsTable,
                                    "\" (result_id, tool_name, created_at, bytes, line_count, is_json, json_type, "
                                    "top_keys, json_schema, is_binary, has_images, has_base64, is_truncated, "
                                    "truncated_bytes, result_json, result_text) "
                                    "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);")));
    RETURN_IF_ERROR(stmt->BindAll(result.result_id, result.tool_name,
                                  result.created_at.empty() ? now : result.created_at, meta.bytes, meta.line_count,
                                  meta.is_json, meta.json_type, absl::StrJoin(meta.top_keys, ","),
                                  meta.json_schema, meta.is_binary, meta.has_images, meta.has_base64,
                                  meta.is_truncated, meta.truncated_bytes));
    RETURN_IF_ERROR(meta.stored_json.has_value() ? stmt->BindText(15, *meta.stored_json) : stmt->BindNull(15));
    RETURN_IF_ERROR(meta.stored_text.has_value() ? stmt->BindText(16, *meta.stored_text) : stmt->BindNull(16));
    RETURN_IF_ERROR(stmt->Run());
  }
  LOG(INFO) << "Stored " << results.size() << " tool results in " << kToolResultsTable;
  return absl::OkStatus();
}

}  // namespace scratchdb
