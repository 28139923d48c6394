#ifndef SCRATCHDB_CONFIG_SYNC_H_
#define SCRATCHDB_CONFIG_SYNC_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "scratchdb/guarded_session.h"
#include "scratchdb/mirror_sync.h"
#include "scratchdb/record_store.h"
#include "scratchdb/record_types.h"

namespace scratchdb {

// Shortest interval an agent may schedule itself at.
constexpr absl::Duration kMinScheduleInterval = absl::Minutes(30);

/**
 * @brief Checks a schedule expression.
 *
 * Accepts a 5-field cron expression, one of @yearly @annually @monthly
 * @weekly @daily @midnight @hourly, or `@every <duration>` (units s, m, h, d,
 * e.g. `@every 1h30m`). Rejects anything that would run more than twice an
 * hour or more often than every 30 minutes.
 *
 * @return InvalidArgument with a message for the agent, without the
 *         "Invalid schedule format: " prefix.
 */
absl::Status ValidateSchedule(const std::string& schedule);

/**
 * @brief Agent configuration mirror, `__agent_config`.
 *
 * A single row (id = 1) carrying charter and schedule. Each field is applied
 * on its own: an invalid schedule does not hold back a charter change.
 */
class AgentConfigDomain {
 public:
  using Record = AgentConfigRecord;
  using Baseline = absl::flat_hash_map<std::string, AgentConfigRecord>;

  AgentConfigDomain(RecordStore* store, AgentIdentity agent) : store_(store), agent_(std::move(agent)) {}

  const char* Label() const { return "Config"; }
  const char* TableName() const;
  std::string CreateTableSql() const;

  absl::StatusOr<std::vector<AgentConfigRecord>> LoadDurable();
  absl::Status InsertMirrorRow(GuardedSession* session, const AgentConfigRecord& config);
  absl::StatusOr<MirrorRead<AgentConfigRecord>> ReadMirror(GuardedSession* session);

  std::string Key(const AgentConfigRecord& /*config*/) const { return "agent_config"; }
  bool IsWellFormedKey(const std::string& /*key*/) const { return true; }
  std::string Owner(const AgentConfigRecord& /*config*/) const { return agent_.agent_id; }
  bool SameContent(const AgentConfigRecord& a, const AgentConfigRecord& b) const;
  bool IsTerminal(const AgentConfigRecord& /*config*/) const { return false; }

  absl::Status BeginApply() { return absl::OkStatus(); }
  // The mirror is seeded with exactly one row, so a create can only follow a
  // delete of the seeded row inside the same cycle.
  absl::StatusOr<std::optional<std::string>> Create(const AgentConfigRecord& config, const Baseline& baseline,
                                                    SyncResult* result);
  absl::StatusOr<std::optional<std::string>> Update(const AgentConfigRecord& before, const AgentConfigRecord& after,
                                                    SyncResult* result);
  // Configuration cannot be deleted; records an error and changes nothing.
  absl::StatusOr<bool> Remove(const AgentConfigRecord& before, SyncResult* result);

 private:
  RecordStore* store_;
  AgentIdentity agent_;
};

using AgentConfigSync = MirrorSync<AgentConfigDomain>;

}  // namespace scratchdb

#endif  // SCRATCHDB_CONFIG_SYNC_H_
