#ifndef SCRATCHDB_TOOL_RESULT_CACHE_H_
#define SCRATCHDB_TOOL_RESULT_CACHE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "nlohmann/json.hpp"

#include "scratchdb/constants.h"
#include "scratchdb/guarded_session.h"

namespace scratchdb {

constexpr int kMaxToolResultTopKeys = 8;
constexpr int kToolResultSchemaDepth = 3;

// One tool call output from the previous step of the agent loop.
struct ToolResultRecord {
  std::string result_id;
  std::string tool_name;
  std::string text;
  std::string created_at;  // defaults to the time of Store()
};

// What the agent sees in the `__tool_results` metadata columns.
struct ToolResultMeta {
  int64_t bytes = 0;
  int64_t line_count = 0;
  bool is_json = false;
  std::string json_type;
  std::vector<std::string> top_keys;
  std::string json_schema;  // compact JSON, empty unless is_json
  bool is_binary = false;
  bool has_images = false;
  bool has_base64 = false;
  bool is_truncated = false;
  int64_t truncated_bytes = 0;

  // Exactly one of these is set: the JSON column for untruncated JSON, the
  // text column for everything else.
  std::optional<std::string> stored_json;
  std::optional<std::string> stored_text;
};

// "object", "array", "string", "integer", "number", "boolean" or "null".
std::string JsonTypeName(const nlohmann::json& value);

// Compact structural schema: objects list their properties, arrays describe
// their first element. Nesting stops after `depth` levels.
nlohmann::json InferJsonSchema(const nlohmann::json& value, int depth = kToolResultSchemaDepth);

// Heuristic: NUL bytes, or more than 30% control characters in the first
// 1000 bytes.
bool IsProbablyBinary(const std::string& text);

ToolResultMeta SummarizeToolResult(const std::string& text, int64_t max_stored_bytes);

/**
 * @brief Materializes the latest tool outputs as the `__tool_results` table.
 *
 * The table is rebuilt on every Store() and is dropped before the scratch
 * database is persisted.
 */
class ToolResultCache {
 public:
  explicit ToolResultCache(int64_t max_stored_bytes = kDefaultToolResultStoredBytes)
      : max_stored_bytes_(max_stored_bytes) {}

  // Replaces the table contents with `results`. All-or-nothing.
  absl::Status Store(GuardedSession* session, const std::vector<ToolResultRecord>& results) const;

 private:
  absl::Status StoreRows(GuardedSession* session, const std::vector<ToolResultRecord>& results) const;

  int64_t max_stored_bytes_;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_TOOL_RESULT_CACHE_H_
