#ifndef SCRATCHDB_RECORD_STORE_H_
#define SCRATCHDB_RECORD_STORE_H_

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/time/time.h"

#include "scratchdb/record_types.h"

namespace scratchdb {

// UTC, second precision: 2024-05-01T12:00:00Z.
std::string FormatRecordTime(absl::Time time);
inline std::string RecordTimeNow() { return FormatRecordTime(absl::Now()); }

/**
 * @brief The authoritative relational store behind the mirror tables.
 *
 * Reads return what an agent may see; writes are only issued by the
 * synchronizers, always inside RunInTransaction.
 */
class RecordStore {
 public:
  virtual ~RecordStore() = default;

  virtual absl::StatusOr<AgentIdentity> GetAgent(const std::string& agent_id) = 0;

  // Cards in the agent's organization, or owned by the agent's user when it
  // has none. Ordered by priority (highest first), then creation time.
  virtual absl::StatusOr<std::vector<KanbanCard>> ListVisibleCards(const AgentIdentity& agent) = 0;
  virtual absl::StatusOr<std::optional<KanbanCard>> GetCard(const std::string& card_id) = 0;
  virtual absl::Status InsertCard(const KanbanCard& card) = 0;
  // Writes only the named columns of `card`.
  virtual absl::Status UpdateCard(const KanbanCard& card, const std::vector<std::string>& fields) = 0;
  virtual absl::Status DeleteCard(const std::string& card_id) = 0;

  // Highest version per skill name.
  virtual absl::StatusOr<std::vector<SkillRecord>> ListLatestSkills(const std::string& agent_id) = 0;
  // Stores `skill` as version latest + 1 and returns the stored record.
  virtual absl::StatusOr<SkillRecord> InsertSkillVersion(const SkillRecord& skill) = 0;
  // Removes every version; returns how many rows went away.
  virtual absl::StatusOr<int> DeleteSkill(const std::string& agent_id, const std::string& name) = 0;
  // Canonical tool ids the agent can resolve.
  virtual absl::StatusOr<std::vector<std::string>> ListToolIds(const std::string& agent_id) = 0;

  virtual absl::StatusOr<AgentConfigRecord> GetAgentConfig(const std::string& agent_id) = 0;
  virtual absl::Status UpdateAgentConfig(const AgentConfigRecord& config) = 0;

  // Commits when `body` returns OK, rolls back otherwise.
  virtual absl::Status RunInTransaction(const std::function<absl::Status()>& body) = 0;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_RECORD_STORE_H_
