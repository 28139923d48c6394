#ifndef SCRATCHDB_RECORD_TYPES_H_
#define SCRATCHDB_RECORD_TYPES_H_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace scratchdb {

// Who is running the cycle. Cards are visible across an organization, or
// across a user's agents when the agent has no organization.
struct AgentIdentity {
  std::string agent_id;
  std::string organization_id;
  std::string user_id;
};

constexpr char kCardStatusTodo[] = "todo";
constexpr char kCardStatusDoing[] = "doing";
constexpr char kCardStatusDone[] = "done";

struct KanbanCard {
  std::string id;
  std::string friendly_id;
  std::string title;
  std::string description;
  std::string status = kCardStatusTodo;
  int64_t priority = 0;
  std::string assigned_agent_id;
  std::string organization_id;
  std::string user_id;
  std::string created_at;
  std::string updated_at;
  std::optional<std::string> completed_at;
};

struct SkillRecord {
  int64_t id = 0;
  std::string agent_id;
  std::string name;
  std::string description;
  int version = 1;
  std::vector<std::string> tools;
  std::string instructions;
  std::string created_at;
  std::string updated_at;
};

struct AgentConfigRecord {
  std::string agent_id;
  std::string charter;
  std::string schedule;  // empty means unscheduled
};

}  // namespace scratchdb

#endif  // SCRATCHDB_RECORD_TYPES_H_
