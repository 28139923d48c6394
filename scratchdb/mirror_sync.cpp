#include "scratchdb/mirror_sync.h"

namespace scratchdb {

nlohmann::json SyncResult::ToJson() const {
  nlohmann::json j;
  j["domain"] = domain;
  j["changed"] = changed;
  j["created_ids"] = created_ids;
  j["updated_ids"] = updated_ids;
  j["removed_ids"] = removed_ids;
  j["archived_ids"] = archived_ids;
  j["deleted_ids"] = deleted_ids;
  j["errors"] = errors;
  nlohmann::json timeline = nlohmann::json::array();
  for (const auto& change : changes) {
    nlohmann::json event = {{"id", change.id}, {"label", change.label}, {"action", change.action}};
    if (!change.from.empty()) event["from"] = change.from;
    if (!change.to.empty()) event["to"] = change.to;
    timeline.push_back(std::move(event));
  }
  j["changes"] = std::move(timeline);
  return j;
}

}  // namespace scratchdb
