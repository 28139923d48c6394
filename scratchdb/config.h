#ifndef SCRATCHDB_CONFIG_H_
#define SCRATCHDB_CONFIG_H_

#include <cstdint>
#include <string>

#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "scratchdb/constants.h"

namespace scratchdb {

// Tunables for one processing cycle. Defaults match the production ceilings.
struct Config {
  absl::Duration query_timeout = absl::Milliseconds(kDefaultQueryTimeoutMs);
  int progress_ops = kDefaultProgressOps;
  int64_t soft_size_bytes = kDefaultSoftSizeBytes;
  int64_t hard_size_bytes = kDefaultHardSizeBytes;
  int row_limit = kDefaultRowLimit;
  int schema_prompt_bytes = kDefaultSchemaPromptBytes;
  int schema_table_cap = kDefaultSchemaTableCap;
  int digest_sample_size = kDigestSampleSize;
  int digest_max_tables = kDigestMaxTables;
  int digest_max_columns = kDigestMaxColumns;
  int64_t tool_result_stored_bytes = kDefaultToolResultStoredBytes;

  /**
   * @brief Returns the defaults overlaid with SCRATCHDB_* environment variables.
   *
   * Recognized variables: SCRATCHDB_QUERY_TIMEOUT_MS, SCRATCHDB_PROGRESS_OPS,
   * SCRATCHDB_SOFT_SIZE_MB, SCRATCHDB_HARD_SIZE_MB, SCRATCHDB_ROW_LIMIT,
   * SCRATCHDB_SCHEMA_PROMPT_BYTES, SCRATCHDB_DIGEST_SAMPLE_SIZE.
   *
   * @return InvalidArgumentError when a variable is set but not a positive integer.
   */
  static absl::StatusOr<Config> FromEnv();

  absl::Status Validate() const;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_CONFIG_H_
