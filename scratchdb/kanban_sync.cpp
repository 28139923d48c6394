#include "scratchdb/kanban_sync.h"

#include <cmath>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/strip.h"

#include "scratchdb/constants.h"
#include "scratchdb/status_macros.h"

namespace scratchdb {

namespace {

// Cuts at `max_bytes` without splitting a UTF-8 sequence.
std::string TruncateUtf8(const std::string& text, size_t max_bytes) {
  if (text.size() <= max_bytes) return text;
  size_t end = max_bytes;
  while (end > 0 && (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) --end;
  return text.substr(0, end);
}

int64_t ParsePriority(const SqlValue& value) {
  switch (value.type) {
    case ValueType::kInteger:
      return value.int_value;
    case ValueType::kReal:
      return std::isfinite(value.real_value) ? static_cast<int64_t>(value.real_value) : 0;
    case ValueType::kText: {
      int64_t parsed = 0;
      return absl::SimpleAtoi(value.bytes, &parsed) ? parsed : 0;
    }
    default:
      return 0;
  }
}

const char* ActionForStatus(const std::string& status) {
  if (status == kCardStatusDone) return "completed";
  if (status == kCardStatusDoing) return "started";
  return "updated";
}

}  // namespace

std::string FormatKanbanFriendlyId(const std::string& title, const std::string& card_id) {
  std::string slug;
  bool pending_dash = false;
  for (char raw : absl::StripAsciiWhitespace(title)) {
    unsigned char c = static_cast<unsigned char>(raw);
    if (c >= 0x80) continue;
    if (absl::ascii_isalnum(c) || c == '_') {
      if (pending_dash && !slug.empty()) slug.push_back('-');
      pending_dash = false;
      slug.push_back(absl::ascii_tolower(c));
    } else if (c == '-' || absl::ascii_isspace(c)) {
      pending_dash = true;
    }
  }
  while (!slug.empty() && (slug.back() == '_' || slug.back() == '-')) slug.pop_back();
  size_t start = slug.find_first_not_of("-_");
  slug = start == std::string::npos ? "" : slug.substr(start);
  if (!slug.empty()) return slug;
  if (!card_id.empty()) {
    std::string short_id = absl::StrReplaceAll(card_id, {{"-", ""}}).substr(0, 8);
    return absl::StrCat("card-", short_id);
  }
  return "card";
}

std::optional<std::string> CanonicalCardId(const std::string& value) {
  absl::string_view text = absl::StripAsciiWhitespace(value);
  if (absl::StartsWithIgnoreCase(text, "urn:uuid:")) text.remove_prefix(9);
  if (absl::ConsumePrefix(&text, "{") && !absl::ConsumeSuffix(&text, "}")) return std::nullopt;
  std::string hex;
  for (char c : text) {
    if (c == '-') continue;
    if (!absl::ascii_isxdigit(static_cast<unsigned char>(c))) return std::nullopt;
    hex.push_back(absl::ascii_tolower(static_cast<unsigned char>(c)));
  }
  if (hex.size() != 32) return std::nullopt;
  return absl::StrCat(hex.substr(0, 8), "-", hex.substr(8, 4), "-", hex.substr(12, 4), "-", hex.substr(16, 4), "-",
                      hex.substr(20));
}

nlohmann::json KanbanBoardSnapshot::ToJson() const {
  return {{"todo_count", todo_count},   {"doing_count", doing_count}, {"done_count", done_count},
          {"todo_titles", todo_titles}, {"doing_titles", doing_titles}, {"done_titles", done_titles}};
}

absl::StatusOr<KanbanBoardSnapshot> BuildBoardSnapshot(RecordStore* store, const AgentIdentity& agent) {
  ASSIGN_OR_RETURN(auto cards, store->ListVisibleCards(agent));
  KanbanBoardSnapshot snapshot;
  auto add = [](int* count, std::vector<std::string>* titles, const std::string& title) {
    ++*count;
    if (titles->size() < kBoardSnapshotTitles) titles->push_back(title);
  };
  for (const auto& card : cards) {
    if (card.assigned_agent_id != agent.agent_id) continue;
    if (card.status == kCardStatusTodo) {
      add(&snapshot.todo_count, &snapshot.todo_titles, card.title);
    } else if (card.status == kCardStatusDoing) {
      add(&snapshot.doing_count, &snapshot.doing_titles, card.title);
    } else if (card.status == kCardStatusDone) {
      add(&snapshot.done_count, &snapshot.done_titles, card.title);
    }
  }
  return snapshot;
}

const char* KanbanDomain::TableName() const { return kKanbanTable; }

std::string KanbanDomain::CreateTableSql() const {
  std::string default_agent = absl::StrReplaceAll(agent_.agent_id, {{"'", "''"}});
  return absl::StrCat("CREATE TABLE \"", kKanbanTable,
                      "\" ("
                      "id TEXT PRIMARY KEY DEFAULT (lower(hex(randomblob(16)))), "
                      "friendly_id TEXT, "
                      "title TEXT NOT NULL, "
                      "description TEXT, "
                      "status TEXT NOT NULL DEFAULT 'todo', "
                      "priority INTEGER NOT NULL DEFAULT 0, "
                      "assigned_agent_id TEXT NOT NULL DEFAULT '",
                      default_agent,
                      "', "
                      "created_at TEXT, "
                      "updated_at TEXT, "
                      "completed_at TEXT, "
                      "CHECK (status IN ('todo', 'doing', 'done')));");
}

absl::StatusOr<std::vector<KanbanCard>> KanbanDomain::LoadDurable() { return store_->ListVisibleCards(agent_); }

absl::Status KanbanDomain::InsertMirrorRow(GuardedSession* session, const KanbanCard& card) {
  ASSIGN_OR_RETURN(auto stmt, session->Prepare(absl::StrCat(
                                  "INSERT INTO \"", kKanbanTable,
                                  "\" (id, friendly_id, title, description, status, priority, assigned_agent_id, "
                                  "created_at, updated_at, completed_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);")));
  RETURN_IF_ERROR(stmt->BindAll(card.id, FormatKanbanFriendlyId(card.title, card.id), card.title, card.description,
                                card.status, card.priority, card.assigned_agent_id, card.created_at,
                                card.updated_at));
  if (card.completed_at.has_value()) {
    RETURN_IF_ERROR(stmt->BindText(10, *card.completed_at));
  } else {
    RETURN_IF_ERROR(stmt->BindNull(10));
  }
  return stmt->Run();
}

std::optional<KanbanCard> KanbanDomain::ParseRow(Statement& stmt, MirrorRead<KanbanCard>* read) const {
  KanbanCard card;
  card.id = std::string(absl::StripAsciiWhitespace(stmt.ColumnText(0)));
  if (card.id.empty()) {
    read->errors.push_back("Kanban row skipped: missing card id.");
    return std::nullopt;
  }

  card.title = TruncateUtf8(std::string(absl::StripAsciiWhitespace(stmt.ColumnText(1))), kMaxCardTitleLength);
  if (card.title.empty()) {
    read->errors.push_back(absl::StrCat("Kanban row skipped for ", card.id, ": title is required."));
    read->protected_keys.insert(card.id);
    return std::nullopt;
  }

  std::string raw_status = stmt.ColumnIsNull(3) ? "NULL" : stmt.ColumnText(3);
  std::string status = absl::AsciiStrToLower(absl::StripAsciiWhitespace(raw_status));
  if (status != kCardStatusTodo && status != kCardStatusDoing && status != kCardStatusDone) {
    read->errors.push_back(absl::StrCat("Kanban row skipped for ", card.id, ": invalid status '", raw_status, "'."));
    read->protected_keys.insert(card.id);
    return std::nullopt;
  }
  card.status = status;
  card.description = std::string(absl::StripAsciiWhitespace(stmt.ColumnText(2)));
  card.priority = ParsePriority(stmt.ColumnValue(4));
  card.assigned_agent_id = std::string(absl::StripAsciiWhitespace(stmt.ColumnText(5)));
  if (card.assigned_agent_id.empty()) card.assigned_agent_id = agent_.agent_id;
  return card;
}

absl::StatusOr<MirrorRead<KanbanCard>> KanbanDomain::ReadMirror(GuardedSession* session) {
  ASSIGN_OR_RETURN(auto stmt,
                   session->Prepare(absl::StrCat("SELECT id, title, description, status, priority, assigned_agent_id "
                                                 "FROM \"",
                                                 kKanbanTable, "\" ORDER BY rowid;")));
  MirrorRead<KanbanCard> read;
  while (true) {
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (!has_row) break;
    auto card = ParseRow(*stmt, &read);
    if (card.has_value()) read.rows.push_back(std::move(*card));
  }
  return read;
}

bool KanbanDomain::SameContent(const KanbanCard& a, const KanbanCard& b) const {
  return a.title == b.title && a.description == b.description && a.status == b.status && a.priority == b.priority &&
         a.assigned_agent_id == b.assigned_agent_id;
}

absl::StatusOr<std::optional<std::string>> KanbanDomain::Create(const KanbanCard& card, const Baseline& baseline,
                                                                SyncResult* result) {
  std::string lowered = absl::AsciiStrToLower(card.title);
  for (const auto& entry : baseline) {
    const KanbanCard& existing = entry.second;
    if (absl::AsciiStrToLower(existing.title) != lowered) continue;
    result->errors.push_back(absl::StrCat("Kanban duplicate blocked: '", card.title,
                                          "' already exists (friendly_id: ",
                                          FormatKanbanFriendlyId(existing.title, existing.id),
                                          "). Use UPDATE to change status, not INSERT. Cards persist across turns."));
    return std::optional<std::string>();
  }

  KanbanCard stored = card;
  stored.id = *CanonicalCardId(card.id);
  stored.friendly_id = FormatKanbanFriendlyId(card.title, stored.id);
  stored.organization_id = agent_.organization_id;
  stored.user_id = agent_.user_id;
  stored.created_at = RecordTimeNow();
  stored.updated_at = stored.created_at;
  if (stored.status == kCardStatusDone) {
    stored.completed_at = stored.created_at;
  } else {
    stored.completed_at.reset();
  }
  RETURN_IF_ERROR(store_->InsertCard(stored));
  result->changes.push_back({stored.id, stored.title, "created", "", stored.status});
  return std::optional<std::string>(stored.id);
}

absl::StatusOr<std::optional<std::string>> KanbanDomain::Update(const KanbanCard& before, const KanbanCard& after,
                                                                SyncResult* result) {
  auto canonical = CanonicalCardId(after.id);
  if (!canonical.has_value()) {
    result->errors.push_back(absl::StrCat("Kanban update ignored for invalid card id: ", after.id));
    return std::optional<std::string>();
  }
  ASSIGN_OR_RETURN(auto durable, store_->GetCard(*canonical));
  if (!durable.has_value() || durable->assigned_agent_id != agent_.agent_id) {
    result->errors.push_back(
        absl::StrCat("Kanban update ignored for ", after.id, ": card not owned by this agent."));
    return std::optional<std::string>();
  }

  KanbanCard card = *durable;
  std::vector<std::string> fields;
  std::string old_status = card.status;
  bool status_changed = false;
  if (card.title != after.title) {
    card.title = after.title;
    card.friendly_id = FormatKanbanFriendlyId(card.title, card.id);
    fields.push_back("title");
    fields.push_back("friendly_id");
  }
  if (card.description != after.description) {
    card.description = after.description;
    fields.push_back("description");
  }
  if (card.priority != after.priority) {
    card.priority = after.priority;
    fields.push_back("priority");
  }
  if (card.status != after.status) {
    card.status = after.status;
    fields.push_back("status");
    status_changed = true;
    if (card.status == kCardStatusDone) {
      if (!card.completed_at.has_value()) {
        card.completed_at = RecordTimeNow();
        fields.push_back("completed_at");
      }
    } else if (card.completed_at.has_value()) {
      card.completed_at.reset();
      fields.push_back("completed_at");
    }
  }
  if (fields.empty()) return std::optional<std::string>();

  card.updated_at = RecordTimeNow();
  RETURN_IF_ERROR(store_->UpdateCard(card, fields));
  result->changes.push_back(
      {card.id, card.title, status_changed ? ActionForStatus(card.status) : "updated", old_status, card.status});
  LOG(INFO) << "Kanban card " << card.id << " updated for agent " << agent_.agent_id << " (" << fields.size()
            << " fields)";
  return std::optional<std::string>(card.id);
}

absl::StatusOr<bool> KanbanDomain::Remove(const KanbanCard& before, SyncResult* result) {
  auto canonical = CanonicalCardId(before.id);
  if (!canonical.has_value()) {
    result->errors.push_back(absl::StrCat("Kanban removal ignored for invalid card id: ", before.id));
    return false;
  }
  ASSIGN_OR_RETURN(auto durable, store_->GetCard(*canonical));
  if (!durable.has_value() || durable->assigned_agent_id != agent_.agent_id) return false;
  RETURN_IF_ERROR(store_->DeleteCard(*canonical));
  result->changes.push_back({*canonical, before.title, IsTerminal(before) ? "archived" : "deleted", before.status, ""});
  return true;
}

}  // namespace scratchdb
