#include "scratchdb/sqlite_record_store.h"

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"

#include "nlohmann/json.hpp"

#include "scratchdb/status_macros.h"

namespace scratchdb {

namespace {

constexpr char kSchema[] = R"(
    CREATE TABLE IF NOT EXISTS agents (
        agent_id TEXT PRIMARY KEY,
        organization_id TEXT,
        user_id TEXT
    );

    CREATE TABLE IF NOT EXISTS kanban_cards (
        id TEXT PRIMARY KEY,
        friendly_id TEXT,
        title TEXT NOT NULL,
        description TEXT,
        status TEXT NOT NULL DEFAULT 'todo' CHECK(status IN ('todo', 'doing', 'done')),
        priority INTEGER NOT NULL DEFAULT 0,
        assigned_agent_id TEXT,
        organization_id TEXT,
        user_id TEXT,
        created_at TEXT,
        updated_at TEXT,
        completed_at TEXT
    );

    CREATE TABLE IF NOT EXISTS agent_skills (
        id INTEGER PRIMARY KEY AUTOINCREMENT,
        agent_id TEXT NOT NULL,
        name TEXT NOT NULL,
        description TEXT,
        version INTEGER NOT NULL,
        tools TEXT NOT NULL DEFAULT '[]',
        instructions TEXT NOT NULL,
        created_at TEXT,
        updated_at TEXT,
        UNIQUE(agent_id, name, version)
    );

    CREATE TABLE IF NOT EXISTS tools (
        tool_id TEXT NOT NULL,
        agent_id TEXT,
        UNIQUE(tool_id, agent_id)
    );

    CREATE TABLE IF NOT EXISTS agent_config (
        agent_id TEXT PRIMARY KEY,
        charter TEXT,
        schedule TEXT
    );
)";

constexpr char kCardColumns[] =
    "id, friendly_id, title, description, status, priority, assigned_agent_id, organization_id, user_id, "
    "created_at, updated_at, completed_at";

constexpr char kSkillColumns[] =
    "id, agent_id, name, description, version, tools, instructions, created_at, updated_at";

KanbanCard ReadCard(Statement& stmt) {
  KanbanCard card;
  card.id = stmt.ColumnText(0);
  card.friendly_id = stmt.ColumnText(1);
  card.title = stmt.ColumnText(2);
  card.description = stmt.ColumnText(3);
  card.status = stmt.ColumnText(4);
  card.priority = stmt.ColumnInt64(5);
  card.assigned_agent_id = stmt.ColumnText(6);
  card.organization_id = stmt.ColumnText(7);
  card.user_id = stmt.ColumnText(8);
  card.created_at = stmt.ColumnText(9);
  card.updated_at = stmt.ColumnText(10);
  if (!stmt.ColumnIsNull(11)) card.completed_at = stmt.ColumnText(11);
  return card;
}

SkillRecord ReadSkill(Statement& stmt) {
  SkillRecord skill;
  skill.id = stmt.ColumnInt64(0);
  skill.agent_id = stmt.ColumnText(1);
  skill.name = stmt.ColumnText(2);
  skill.description = stmt.ColumnText(3);
  skill.version = stmt.ColumnInt(4);
  auto tools = nlohmann::json::parse(stmt.ColumnText(5), nullptr, false);
  if (!tools.is_discarded() && tools.is_array()) {
    for (const auto& tool : tools) {
      if (tool.is_string()) skill.tools.push_back(tool.get<std::string>());
    }
  } else {
    LOG(WARNING) << "Stored tools for skill " << skill.name << " are not a JSON array";
  }
  skill.instructions = stmt.ColumnText(6);
  skill.created_at = stmt.ColumnText(7);
  skill.updated_at = stmt.ColumnText(8);
  return skill;
}

}  // namespace

absl::StatusOr<std::unique_ptr<Statement>> SqliteRecordStore::Prepare(const std::string& sql) {
  absl::MutexLock lock(&mu_);
  if (!db_) return absl::FailedPreconditionError("Record store is not initialized");
  auto stmt = std::make_unique<Statement>(db_.get(), sql);
  auto status = stmt->Prepare();
  if (!status.ok()) return status;
  return stmt;
}

absl::Status SqliteRecordStore::Init(const std::string& db_path) {
  LOG(INFO) << "Initializing record store at " << db_path;
  sqlite3* raw_db = nullptr;
  int rc = sqlite3_open(db_path.c_str(), &raw_db);
  if (rc != SQLITE_OK) {
    std::string err = raw_db ? sqlite3_errmsg(raw_db) : sqlite3_errstr(rc);
    sqlite3_close(raw_db);
    LOG(ERROR) << "Failed to open record store: " << err;
    return absl::InternalError("Failed to open record store: " + err);
  }

  rc = sqlite3_exec(raw_db, kSchema, nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    std::string err = sqlite3_errmsg(raw_db);
    sqlite3_close(raw_db);
    return absl::InternalError("Schema error: " + err);
  }
  sqlite3_busy_timeout(raw_db, 2000);

  absl::MutexLock lock(&mu_);
  db_.reset(raw_db);
  return absl::OkStatus();
}

int64_t SqliteRecordStore::LastInsertRowId() {
  absl::MutexLock lock(&mu_);
  return sqlite3_last_insert_rowid(db_.get());
}

int SqliteRecordStore::Changes() {
  absl::MutexLock lock(&mu_);
  return sqlite3_changes(db_.get());
}

absl::Status SqliteRecordStore::UpsertAgent(const AgentIdentity& agent) {
  return Execute(
      "INSERT INTO agents (agent_id, organization_id, user_id) VALUES (?, ?, ?) "
      "ON CONFLICT(agent_id) DO UPDATE SET organization_id = excluded.organization_id, user_id = excluded.user_id;",
      agent.agent_id, agent.organization_id, agent.user_id);
}

absl::Status SqliteRecordStore::RegisterTool(const std::string& tool_id, const std::string& agent_id) {
  if (agent_id.empty()) {
    return Execute("INSERT OR IGNORE INTO tools (tool_id, agent_id) VALUES (?, NULL);", tool_id);
  }
  return Execute("INSERT OR IGNORE INTO tools (tool_id, agent_id) VALUES (?, ?);", tool_id, agent_id);
}

absl::StatusOr<AgentIdentity> SqliteRecordStore::GetAgent(const std::string& agent_id) {
  ASSIGN_OR_RETURN(auto stmt, Prepare("SELECT agent_id, organization_id, user_id FROM agents WHERE agent_id = ?;"));
  RETURN_IF_ERROR(stmt->BindText(1, agent_id));
  ASSIGN_OR_RETURN(bool has_row, stmt->Step());
  if (!has_row) return absl::NotFoundError(absl::StrCat("Agent not found: ", agent_id));
  AgentIdentity agent;
  agent.agent_id = stmt->ColumnText(0);
  agent.organization_id = stmt->ColumnText(1);
  agent.user_id = stmt->ColumnText(2);
  return agent;
}

absl::StatusOr<std::vector<KanbanCard>> SqliteRecordStore::ListVisibleCards(const AgentIdentity& agent) {
  std::string sql;
  std::string scope;
  if (!agent.organization_id.empty()) {
    sql = absl::StrCat("SELECT ", kCardColumns, " FROM kanban_cards WHERE organization_id = ? ");
    scope = agent.organization_id;
  } else {
    sql = absl::StrCat("SELECT ", kCardColumns,
                       " FROM kanban_cards WHERE user_id = ? AND (organization_id IS NULL OR organization_id = '') ");
    scope = agent.user_id;
  }
  absl::StrAppend(&sql, "ORDER BY priority DESC, created_at ASC, id ASC;");

  ASSIGN_OR_RETURN(auto stmt, Prepare(sql));
  RETURN_IF_ERROR(stmt->BindText(1, scope));
  std::vector<KanbanCard> cards;
  while (true) {
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (!has_row) break;
    cards.push_back(ReadCard(*stmt));
  }
  return cards;
}

absl::StatusOr<std::optional<KanbanCard>> SqliteRecordStore::GetCard(const std::string& card_id) {
  ASSIGN_OR_RETURN(auto stmt, Prepare(absl::StrCat("SELECT ", kCardColumns, " FROM kanban_cards WHERE id = ?;")));
  RETURN_IF_ERROR(stmt->BindText(1, card_id));
  ASSIGN_OR_RETURN(bool has_row, stmt->Step());
  if (!has_row) return std::optional<KanbanCard>();
  return std::optional<KanbanCard>(ReadCard(*stmt));
}

absl::Status SqliteRecordStore::InsertCard(const KanbanCard& card) {
  std::string now = RecordTimeNow();
  ASSIGN_OR_RETURN(auto stmt, Prepare(absl::StrCat("INSERT INTO kanban_cards (", kCardColumns,
                                                   ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);")));
  RETURN_IF_ERROR(stmt->BindAll(card.id, card.friendly_id, card.title, card.description, card.status, card.priority,
                                card.assigned_agent_id, card.organization_id, card.user_id,
                                card.created_at.empty() ? now : card.created_at,
                                card.updated_at.empty() ? now : card.updated_at));
  if (card.completed_at.has_value()) {
    RETURN_IF_ERROR(stmt->BindText(12, *card.completed_at));
  } else {
    RETURN_IF_ERROR(stmt->BindNull(12));
  }
  return stmt->Run();
}

absl::Status SqliteRecordStore::UpdateCard(const KanbanCard& card, const std::vector<std::string>& fields) {
  if (fields.empty()) return absl::OkStatus();
  std::vector<std::string> assignments;
  std::vector<SqlValue> values;
  for (const auto& field : fields) {
    if (field == "title") {
      values.push_back(SqlValue::Text(card.title));
    } else if (field == "friendly_id") {
      values.push_back(SqlValue::Text(card.friendly_id));
    } else if (field == "description") {
      values.push_back(SqlValue::Text(card.description));
    } else if (field == "status") {
      values.push_back(SqlValue::Text(card.status));
    } else if (field == "priority") {
      values.push_back(SqlValue::Integer(card.priority));
    } else if (field == "assigned_agent_id") {
      values.push_back(SqlValue::Text(card.assigned_agent_id));
    } else if (field == "completed_at") {
      values.push_back(card.completed_at.has_value() ? SqlValue::Text(*card.completed_at) : SqlValue::Null());
    } else {
      return absl::InvalidArgumentError(absl::StrCat("Card field cannot be updated: ", field));
    }
    assignments.push_back(absl::StrCat(field, " = ?"));
  }
  assignments.push_back("updated_at = ?");
  values.push_back(SqlValue::Text(card.updated_at.empty() ? RecordTimeNow() : card.updated_at));

  ASSIGN_OR_RETURN(auto stmt,
                   Prepare(absl::StrCat("UPDATE kanban_cards SET ", absl::StrJoin(assignments, ", "), " WHERE id = ?;")));
  int index = 1;
  for (const auto& value : values) {
    RETURN_IF_ERROR(stmt->BindValue(index++, value));
  }
  RETURN_IF_ERROR(stmt->BindText(index, card.id));
  RETURN_IF_ERROR(stmt->Run());
  if (Changes() == 0) return absl::NotFoundError(absl::StrCat("Card not found: ", card.id));
  return absl::OkStatus();
}

absl::Status SqliteRecordStore::DeleteCard(const std::string& card_id) {
  return Execute("DELETE FROM kanban_cards WHERE id = ?;", card_id);
}

absl::StatusOr<std::vector<SkillRecord>> SqliteRecordStore::ListLatestSkills(const std::string& agent_id) {
  ASSIGN_OR_RETURN(auto stmt, Prepare(absl::StrCat("SELECT ", kSkillColumns,
                                                   " FROM agent_skills s WHERE agent_id = ? AND version = ("
                                                   "SELECT MAX(version) FROM agent_skills "
                                                   "WHERE agent_id = s.agent_id AND name = s.name) "
                                                   "ORDER BY name;")));
  RETURN_IF_ERROR(stmt->BindText(1, agent_id));
  std::vector<SkillRecord> skills;
  while (true) {
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (!has_row) break;
    skills.push_back(ReadSkill(*stmt));
  }
  return skills;
}

absl::StatusOr<std::vector<SkillRecord>> SqliteRecordStore::ListSkillVersions(const std::string& agent_id,
                                                                              const std::string& name) {
  ASSIGN_OR_RETURN(auto stmt, Prepare(absl::StrCat("SELECT ", kSkillColumns,
                                                   " FROM agent_skills WHERE agent_id = ? AND name = ? "
                                                   "ORDER BY version;")));
  RETURN_IF_ERROR(stmt->BindAll(agent_id, name));
  std::vector<SkillRecord> skills;
  while (true) {
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (!has_row) break;
    skills.push_back(ReadSkill(*stmt));
  }
  return skills;
}

absl::StatusOr<SkillRecord> SqliteRecordStore::InsertSkillVersion(const SkillRecord& skill) {
  int latest = 0;
  {
    ASSIGN_OR_RETURN(auto stmt,
                     Prepare("SELECT COALESCE(MAX(version), 0) FROM agent_skills WHERE agent_id = ? AND name = ?;"));
    RETURN_IF_ERROR(stmt->BindAll(skill.agent_id, skill.name));
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (has_row) latest = stmt->ColumnInt(0);
  }

  SkillRecord stored = skill;
  stored.version = latest + 1;
  stored.created_at = RecordTimeNow();
  stored.updated_at = stored.created_at;
  nlohmann::json tools = stored.tools;
  RETURN_IF_ERROR(Execute(
      "INSERT INTO agent_skills (agent_id, name, description, version, tools, instructions, created_at, updated_at) "
      "VALUES (?, ?, ?, ?, ?, ?, ?, ?);",
      stored.agent_id, stored.name, stored.description, stored.version,
      tools.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace), stored.instructions, stored.created_at,
      stored.updated_at));
  stored.id = LastInsertRowId();
  return stored;
}

absl::StatusOr<int> SqliteRecordStore::DeleteSkill(const std::string& agent_id, const std::string& name) {
  RETURN_IF_ERROR(Execute("DELETE FROM agent_skills WHERE agent_id = ? AND name = ?;", agent_id, name));
  return Changes();
}

absl::StatusOr<std::vector<std::string>> SqliteRecordStore::ListToolIds(const std::string& agent_id) {
  ASSIGN_OR_RETURN(auto stmt, Prepare("SELECT DISTINCT tool_id FROM tools WHERE agent_id IS NULL OR agent_id = ? "
                                      "ORDER BY tool_id;"));
  RETURN_IF_ERROR(stmt->BindText(1, agent_id));
  std::vector<std::string> ids;
  while (true) {
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (!has_row) break;
    ids.push_back(stmt->ColumnText(0));
  }
  return ids;
}

absl::StatusOr<AgentConfigRecord> SqliteRecordStore::GetAgentConfig(const std::string& agent_id) {
  ASSIGN_OR_RETURN(auto stmt, Prepare("SELECT charter, schedule FROM agent_config WHERE agent_id = ?;"));
  RETURN_IF_ERROR(stmt->BindText(1, agent_id));
  ASSIGN_OR_RETURN(bool has_row, stmt->Step());
  AgentConfigRecord config;
  config.agent_id = agent_id;
  if (has_row) {
    config.charter = stmt->ColumnText(0);
    config.schedule = stmt->ColumnText(1);
  }
  return config;
}

absl::Status SqliteRecordStore::UpdateAgentConfig(const AgentConfigRecord& config) {
  ASSIGN_OR_RETURN(auto stmt, Prepare("INSERT INTO agent_config (agent_id, charter, schedule) VALUES (?, ?, ?) "
                                      "ON CONFLICT(agent_id) DO UPDATE SET charter = excluded.charter, "
                                      "schedule = excluded.schedule;"));
  RETURN_IF_ERROR(stmt->BindText(1, config.agent_id));
  RETURN_IF_ERROR(stmt->BindText(2, config.charter));
  if (config.schedule.empty()) {
    RETURN_IF_ERROR(stmt->BindNull(3));
  } else {
    RETURN_IF_ERROR(stmt->BindText(3, config.schedule));
  }
  return stmt->Run();
}

absl::Status SqliteRecordStore::RunInTransaction(const std::function<absl::Status()>& body) {
  RETURN_IF_ERROR(Execute("BEGIN IMMEDIATE;"));
  absl::Status status = body();
  if (!status.ok()) {
    absl::Status rollback = Execute("ROLLBACK;");
    if (!rollback.ok()) LOG(ERROR) << "Rollback failed: " << rollback.message();
    return status;
  }
  status = Execute("COMMIT;");
  if (!status.ok()) {
    absl::Status rollback = Execute("ROLLBACK;");
    if (!rollback.ok()) LOG(ERROR) << "Rollback after failed commit failed: " << rollback.message();
  }
  return status;
}

}  // namespace scratchdb
