#ifndef SCRATCHDB_SKILL_SYNC_H_
#define SCRATCHDB_SKILL_SYNC_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/status/status.h"
#include "absl/status/statusor.h"

#include "scratchdb/guarded_session.h"
#include "scratchdb/mirror_sync.h"
#include "scratchdb/record_store.h"
#include "scratchdb/record_types.h"

namespace scratchdb {

// Parses the mirror's `tools` column. NULL or blank text is an empty list.
// Entries are trimmed and de-duplicated in order. Returns InvalidArgument with
// a message fit for the agent when the value is not a JSON array of
// non-empty strings.
absl::StatusOr<std::vector<std::string>> ParseSkillTools(const std::optional<std::string>& raw);

// Top `limit` skills by most recent update, rendered for a prompt section.
// Empty when the agent has no skills.
absl::StatusOr<std::string> FormatRecentSkillsForPrompt(RecordStore* store, const std::string& agent_id,
                                                        int limit = 3);

/**
 * @brief Skill library mirror, `__agent_skills`.
 *
 * One row per skill name holding its latest version. Editing a row stores a
 * new version; deleting a row removes every version of that name.
 */
class SkillDomain {
 public:
  using Record = SkillRecord;
  using Baseline = absl::flat_hash_map<std::string, SkillRecord>;

  SkillDomain(RecordStore* store, AgentIdentity agent) : store_(store), agent_(std::move(agent)) {}

  const char* Label() const { return "Skills"; }
  const char* TableName() const;
  std::string CreateTableSql() const;

  absl::StatusOr<std::vector<SkillRecord>> LoadDurable();
  absl::Status InsertMirrorRow(GuardedSession* session, const SkillRecord& skill);
  absl::StatusOr<MirrorRead<SkillRecord>> ReadMirror(GuardedSession* session);

  std::string Key(const SkillRecord& skill) const { return skill.name; }
  bool IsWellFormedKey(const std::string& key) const { return !key.empty(); }
  // Skills are private to one agent.
  std::string Owner(const SkillRecord& /*skill*/) const { return agent_.agent_id; }
  bool SameContent(const SkillRecord& a, const SkillRecord& b) const;
  bool IsTerminal(const SkillRecord& /*skill*/) const { return false; }

  // Loads the tool catalog once per apply.
  absl::Status BeginApply();
  absl::StatusOr<std::optional<std::string>> Create(const SkillRecord& skill, const Baseline& baseline,
                                                    SyncResult* result);
  absl::StatusOr<std::optional<std::string>> Update(const SkillRecord& before, const SkillRecord& after,
                                                    SyncResult* result);
  absl::StatusOr<bool> Remove(const SkillRecord& before, SyncResult* result);

 private:
  // Validates tool ids and stores a new version.
  absl::StatusOr<std::optional<std::string>> StoreVersion(const SkillRecord& skill, const char* action,
                                                          SyncResult* result);

  RecordStore* store_;
  AgentIdentity agent_;
  // Mirror row id -> skill name, for rows written at seed time.
  absl::flat_hash_map<std::string, std::string> seeded_names_;
  absl::flat_hash_set<std::string> known_tools_;
};

using SkillSync = MirrorSync<SkillDomain>;

}  // namespace scratchdb

#endif  // SCRATCHDB_SKILL_SYNC_H_
