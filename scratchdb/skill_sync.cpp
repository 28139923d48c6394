#include "scratchdb/skill_sync.h"

#include <algorithm>

#include "absl/log/log.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/strip.h"

#include "nlohmann/json.hpp"

#include "scratchdb/constants.h"
#include "scratchdb/status_macros.h"

namespace scratchdb {

namespace {

std::string Trimmed(const std::string& text) { return std::string(absl::StripAsciiWhitespace(text)); }

std::string ToolsJson(const std::vector<std::string>& tools) {
  nlohmann::json j = tools;
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace

absl::StatusOr<std::vector<std::string>> ParseSkillTools(const std::optional<std::string>& raw) {
  std::vector<std::string> tools;
  if (!raw.has_value()) return tools;
  std::string text = Trimmed(*raw);
  if (text.empty()) return tools;

  auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (parsed.is_discarded()) {
    return absl::InvalidArgumentError("tools must be a JSON array of canonical tool IDs");
  }
  if (!parsed.is_array()) return absl::InvalidArgumentError("tools must be a JSON array");

  absl::flat_hash_set<std::string> seen;
  for (const auto& entry : parsed) {
    if (!entry.is_string()) return absl::InvalidArgumentError("tools entries must be strings");
    std::string tool_id = Trimmed(entry.get<std::string>());
    if (tool_id.empty()) return absl::InvalidArgumentError("tools entries cannot be empty");
    if (seen.insert(tool_id).second) tools.push_back(std::move(tool_id));
  }
  return tools;
}

absl::StatusOr<std::string> FormatRecentSkillsForPrompt(RecordStore* store, const std::string& agent_id,
                                                        int limit) {
  if (limit <= 0) return std::string();
  ASSIGN_OR_RETURN(auto skills, store->ListLatestSkills(agent_id));
  std::stable_sort(skills.begin(), skills.end(),
                   [](const SkillRecord& a, const SkillRecord& b) { return a.updated_at > b.updated_at; });
  if (static_cast<int>(skills.size()) > limit) skills.resize(limit);

  std::vector<std::string> sections;
  for (const auto& skill : skills) {
    std::string description = Trimmed(skill.description);
    std::string instructions = Trimmed(skill.instructions);
    sections.push_back(absl::StrCat("Skill: ", skill.name, " (v", skill.version, ")\n", "Description: ",
                                    description.empty() ? "(no description)" : description, "\n", "Tools: ",
                                    skill.tools.empty() ? "(none)" : absl::StrJoin(skill.tools, ", "), "\n",
                                    "Instructions:\n", instructions.empty() ? "(no instructions)" : instructions));
  }
  return absl::StrJoin(sections, "\n\n");
}

const char* SkillDomain::TableName() const { return kSkillsTable; }

std::string SkillDomain::CreateTableSql() const {
  return absl::StrCat("CREATE TABLE \"", kSkillsTable,
                      "\" ("
                      "id TEXT PRIMARY KEY DEFAULT (lower(hex(randomblob(16)))), "
                      "name TEXT NOT NULL UNIQUE, "
                      "description TEXT, "
                      "version INTEGER NOT NULL DEFAULT 1, "
                      "tools TEXT NOT NULL DEFAULT '[]', "
                      "instructions TEXT NOT NULL, "
                      "created_at TEXT, "
                      "updated_at TEXT);");
}

absl::StatusOr<std::vector<SkillRecord>> SkillDomain::LoadDurable() {
  seeded_names_.clear();
  return store_->ListLatestSkills(agent_.agent_id);
}

absl::Status SkillDomain::InsertMirrorRow(GuardedSession* session, const SkillRecord& skill) {
  std::string row_id = absl::StrCat(skill.id);
  RETURN_IF_ERROR(session->Execute(absl::StrCat("INSERT INTO \"", kSkillsTable,
                                                "\" (id, name, description, version, tools, instructions, "
                                                "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?);"),
                                   row_id, Trimmed(skill.name), Trimmed(skill.description), skill.version,
                                   ToolsJson(skill.tools), Trimmed(skill.instructions), skill.created_at,
                                   skill.updated_at));
  seeded_names_[row_id] = Trimmed(skill.name);
  return absl::OkStatus();
}

absl::StatusOr<MirrorRead<SkillRecord>> SkillDomain::ReadMirror(GuardedSession* session) {
  ASSIGN_OR_RETURN(auto stmt, session->Prepare(absl::StrCat("SELECT id, name, description, tools, instructions, "
                                                            "version FROM \"",
                                                            kSkillsTable, "\" ORDER BY rowid ASC;")));
  MirrorRead<SkillRecord> read;
  while (true) {
    ASSIGN_OR_RETURN(bool has_row, stmt->Step());
    if (!has_row) break;
    std::string row_id = Trimmed(stmt->ColumnText(0));
    SkillRecord skill;
    skill.agent_id = agent_.agent_id;
    skill.name = Trimmed(stmt->ColumnText(1));
    skill.description = Trimmed(stmt->ColumnText(2));
    skill.instructions = Trimmed(stmt->ColumnText(4));
    skill.version = stmt->ColumnInt(5);

    if (row_id.empty()) {
      read.errors.push_back("Skill row ignored: missing id.");
      if (!skill.name.empty()) read.protected_keys.insert(skill.name);
      continue;
    }
    if (skill.name.empty()) {
      read.errors.push_back(absl::StrCat("Skill row ", row_id, " ignored: name is required."));
      auto seeded = seeded_names_.find(row_id);
      if (seeded != seeded_names_.end()) read.protected_keys.insert(seeded->second);
      continue;
    }
    std::optional<std::string> raw_tools;
    if (!stmt->ColumnIsNull(3)) raw_tools = stmt->ColumnText(3);
    auto tools_or = ParseSkillTools(raw_tools);
    if (!tools_or.ok()) {
      read.errors.push_back(absl::StrCat("Skill '", skill.name, "' ignored: ", tools_or.status().message()));
      read.protected_keys.insert(skill.name);
      continue;
    }
    skill.tools = std::move(*tools_or);
    read.rows.push_back(std::move(skill));
  }
  return read;
}

bool SkillDomain::SameContent(const SkillRecord& a, const SkillRecord& b) const {
  return a.description == b.description && a.tools == b.tools && a.instructions == b.instructions;
}

absl::Status SkillDomain::BeginApply() {
  ASSIGN_OR_RETURN(auto tool_ids, store_->ListToolIds(agent_.agent_id));
  known_tools_ = absl::flat_hash_set<std::string>(tool_ids.begin(), tool_ids.end());
  return absl::OkStatus();
}

absl::StatusOr<std::optional<std::string>> SkillDomain::StoreVersion(const SkillRecord& skill, const char* action,
                                                                     SyncResult* result) {
  std::vector<std::string> unknown;
  for (const auto& tool_id : skill.tools) {
    if (!known_tools_.contains(tool_id)) unknown.push_back(tool_id);
  }
  if (!unknown.empty()) {
    result->errors.push_back(absl::StrCat("Skill '", skill.name, "' rejected: unknown canonical tool id(s): ",
                                          absl::StrJoin(unknown, ", ")));
    return std::optional<std::string>();
  }

  SkillRecord candidate = skill;
  candidate.agent_id = agent_.agent_id;
  ASSIGN_OR_RETURN(SkillRecord stored, store_->InsertSkillVersion(candidate));
  std::string version_id = absl::StrCat(stored.name, "@", stored.version);
  result->changes.push_back({version_id, stored.name, action, "", ""});
  LOG(INFO) << "Stored skill " << version_id << " for agent " << agent_.agent_id;
  return std::optional<std::string>(version_id);
}

absl::StatusOr<std::optional<std::string>> SkillDomain::Create(const SkillRecord& skill,
                                                               const Baseline& /*baseline*/, SyncResult* result) {
  return StoreVersion(skill, "created", result);
}

absl::StatusOr<std::optional<std::string>> SkillDomain::Update(const SkillRecord& /*before*/,
                                                               const SkillRecord& after, SyncResult* result) {
  return StoreVersion(after, "updated", result);
}

absl::StatusOr<bool> SkillDomain::Remove(const SkillRecord& before, SyncResult* result) {
  ASSIGN_OR_RETURN(int removed, store_->DeleteSkill(agent_.agent_id, before.name));
  if (removed == 0) return false;
  result->changes.push_back({before.name, before.name, "deleted", absl::StrCat("v", before.version), ""});
  return true;
}

}  // namespace scratchdb
