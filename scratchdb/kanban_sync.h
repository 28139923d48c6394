#ifndef SCRATCHDB_KANBAN_SYNC_H_
#define SCRATCHDB_KANBAN_SYNC_H_

#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "nlohmann/json.hpp"

#include "scratchdb/guarded_session.h"
#include "scratchdb/mirror_sync.h"
#include "scratchdb/record_store.h"
#include "scratchdb/record_types.h"

namespace scratchdb {

constexpr size_t kMaxCardTitleLength = 255;
constexpr size_t kBoardSnapshotTitles = 5;

// Slug of the title ("Fix login bug" -> "fix-login-bug"), or card-<8 hex>
// when the title has no usable characters.
std::string FormatKanbanFriendlyId(const std::string& title, const std::string& card_id = "");

// Accepts 32 hex digits with or without dashes (and {braces} or a urn:uuid:
// prefix). Returns the lowercase 8-4-4-4-12 form.
std::optional<std::string> CanonicalCardId(const std::string& value);

struct KanbanBoardSnapshot {
  int todo_count = 0;
  int doing_count = 0;
  int done_count = 0;
  std::vector<std::string> todo_titles;
  std::vector<std::string> doing_titles;
  std::vector<std::string> done_titles;

  nlohmann::json ToJson() const;
};

// Counts and top titles of the cards assigned to `agent`.
absl::StatusOr<KanbanBoardSnapshot> BuildBoardSnapshot(RecordStore* store, const AgentIdentity& agent);

/**
 * @brief Task board mirror, `__kanban_cards`.
 *
 * Every card visible to the agent is seeded; only cards assigned to the agent
 * can be created, changed or removed.
 */
class KanbanDomain {
 public:
  using Record = KanbanCard;
  using Baseline = absl::flat_hash_map<std::string, KanbanCard>;

  KanbanDomain(RecordStore* store, AgentIdentity agent) : store_(store), agent_(std::move(agent)) {}

  const char* Label() const { return "Kanban"; }
  const char* TableName() const;
  std::string CreateTableSql() const;

  absl::StatusOr<std::vector<KanbanCard>> LoadDurable();
  absl::Status InsertMirrorRow(GuardedSession* session, const KanbanCard& card);
  absl::StatusOr<MirrorRead<KanbanCard>> ReadMirror(GuardedSession* session);

  std::string Key(const KanbanCard& card) const { return card.id; }
  bool IsWellFormedKey(const std::string& key) const { return CanonicalCardId(key).has_value(); }
  std::string Owner(const KanbanCard& card) const { return card.assigned_agent_id; }
  bool SameContent(const KanbanCard& a, const KanbanCard& b) const;
  bool IsTerminal(const KanbanCard& card) const { return card.status == kCardStatusDone; }

  absl::Status BeginApply() { return absl::OkStatus(); }
  absl::StatusOr<std::optional<std::string>> Create(const KanbanCard& card, const Baseline& baseline,
                                                    SyncResult* result);
  absl::StatusOr<std::optional<std::string>> Update(const KanbanCard& before, const KanbanCard& after,
                                                    SyncResult* result);
  absl::StatusOr<bool> Remove(const KanbanCard& before, SyncResult* result);

 private:
  // Parses one mirror row; records an error and returns nullopt when the row
  // cannot be used.
  std::optional<KanbanCard> ParseRow(Statement& stmt, MirrorRead<KanbanCard>* read) const;

  RecordStore* store_;
  AgentIdentity agent_;
};

using KanbanSync = MirrorSync<KanbanDomain>;

}  // namespace scratchdb

#endif  // SCRATCHDB_KANBAN_SYNC_H_
