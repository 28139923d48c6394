#ifndef SCRATCHDB_CONSTANTS_H_
#define SCRATCHDB_CONSTANTS_H_

#include <cstdint>

namespace scratchdb {

// Ephemeral tables. None of these may survive into a persisted archive.
constexpr char kToolResultsTable[] = "__tool_results";
constexpr char kKanbanTable[] = "__kanban_cards";
constexpr char kSkillsTable[] = "__agent_skills";
constexpr char kAgentConfigTable[] = "__agent_config";
constexpr char kMessagesTable[] = "__messages";
constexpr char kFilesTable[] = "__files";

constexpr const char* kEphemeralTables[] = {kToolResultsTable, kKanbanTable, kSkillsTable,
                                            kAgentConfigTable, kMessagesTable, kFilesTable};

// Storage ceilings.
constexpr int64_t kBytesPerMb = 1024 * 1024;
constexpr int64_t kDefaultSoftSizeBytes = 50 * kBytesPerMb;
constexpr int64_t kDefaultHardSizeBytes = 100 * kBytesPerMb;

// Session.
constexpr int kDefaultQueryTimeoutMs = 30000;
constexpr int kDefaultProgressOps = 10000;
constexpr int kDefaultRowLimit = 1000;

// Schema summary.
constexpr int kDefaultSchemaPromptBytes = 30000;
constexpr int kDefaultSchemaTableCap = 25;
constexpr int kCreateSqlPreviewChars = 600;

// Digest.
constexpr int kDigestSampleSize = 1000;
constexpr int kDigestMaxTables = 20;
constexpr int kDigestMaxColumns = 50;
constexpr int kDigestMaxUniqueValues = 500;
constexpr int kDigestTypeSampleValues = 200;
constexpr int kDigestMaxStringSampleLen = 200;
constexpr int kDigestMaxImplicitFks = 20;

// Tool result cache.
constexpr int64_t kDefaultToolResultStoredBytes = 512 * 1024;

// Storage layout.
constexpr char kStorageKeyPrefix[] = "agent_state";
constexpr char kScratchFileName[] = "state.db";

}  // namespace scratchdb

#endif  // SCRATCHDB_CONSTANTS_H_
