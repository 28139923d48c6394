#include "scratchdb/config.h"

#include <cstdlib>

#include "absl/status/status.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"

#include "scratchdb/status_macros.h"

namespace scratchdb {

namespace {

// Leaves *out untouched when the variable is unset.
absl::Status ReadPositiveInt(const char* name, int64_t* out) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') return absl::OkStatus();
  int64_t value = 0;
  if (!absl::SimpleAtoi(raw, &value) || value <= 0) {
    return absl::InvalidArgumentError(absl::StrCat(name, " must be a positive integer, got '", raw, "'"));
  }
  *out = value;
  return absl::OkStatus();
}

}  // namespace

absl::StatusOr<Config> Config::FromEnv() {
  Config config;
  int64_t value = absl::ToInt64Milliseconds(config.query_timeout);
  RETURN_IF_ERROR(ReadPositiveInt("SCRATCHDB_QUERY_TIMEOUT_MS", &value));
  config.query_timeout = absl::Milliseconds(value);

  value = config.progress_ops;
  RETURN_IF_ERROR(ReadPositiveInt("SCRATCHDB_PROGRESS_OPS", &value));
  config.progress_ops = static_cast<int>(value);

  value = config.soft_size_bytes / kBytesPerMb;
  RETURN_IF_ERROR(ReadPositiveInt("SCRATCHDB_SOFT_SIZE_MB", &value));
  config.soft_size_bytes = value * kBytesPerMb;

  value = config.hard_size_bytes / kBytesPerMb;
  RETURN_IF_ERROR(ReadPositiveInt("SCRATCHDB_HARD_SIZE_MB", &value));
  config.hard_size_bytes = value * kBytesPerMb;

  value = config.row_limit;
  RETURN_IF_ERROR(ReadPositiveInt("SCRATCHDB_ROW_LIMIT", &value));
  config.row_limit = static_cast<int>(value);

  value = config.schema_prompt_bytes;
  RETURN_IF_ERROR(ReadPositiveInt("SCRATCHDB_SCHEMA_PROMPT_BYTES", &value));
  config.schema_prompt_bytes = static_cast<int>(value);

  value = config.digest_sample_size;
  RETURN_IF_ERROR(ReadPositiveInt("SCRATCHDB_DIGEST_SAMPLE_SIZE", &value));
  config.digest_sample_size = static_cast<int>(value);

  RETURN_IF_ERROR(config.Validate());
  return config;
}

absl::Status Config::Validate() const {
  if (query_timeout <= absl::ZeroDuration()) {
    return absl::InvalidArgumentError("query timeout must be positive");
  }
  if (progress_ops <= 0) return absl::InvalidArgumentError("progress_ops must be positive");
  if (soft_size_bytes > hard_size_bytes) {
    return absl::InvalidArgumentError(
        absl::StrCat("soft size ceiling (", soft_size_bytes, ") exceeds hard ceiling (", hard_size_bytes, ")"));
  }
  if (row_limit <= 0) return absl::InvalidArgumentError("row_limit must be positive");
  if (schema_prompt_bytes <= 0 || schema_table_cap <= 0) {
    return absl::InvalidArgumentError("schema summary limits must be positive");
  }
  if (digest_sample_size <= 0 || digest_max_tables <= 0 || digest_max_columns <= 0) {
    return absl::InvalidArgumentError("digest limits must be positive");
  }
  return absl::OkStatus();
}

}  // namespace scratchdb
