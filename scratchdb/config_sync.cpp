#include "scratchdb/config_sync.h"

#include <set>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"

#include "scratchdb/constants.h"
#include "scratchdb/status_macros.h"

namespace scratchdb {

namespace {

constexpr const char* kMonthNames[] = {"JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                       "JUL", "AUG", "SEP", "OCT", "NOV", "DEC"};
constexpr const char* kDayNames[] = {"SUN", "MON", "TUE", "WED", "THU", "FRI", "SAT"};

struct CronField {
  const char* name;
  int min;
  int max;
  const char* const* names;  // optional symbolic values
  int name_count;
  int name_base;  // value of names[0]
};

constexpr CronField kCronFields[] = {
    {"minute", 0, 59, nullptr, 0, 0},
    {"hour", 0, 23, nullptr, 0, 0},
    {"day of month", 1, 31, nullptr, 0, 0},
    {"month", 1, 12, kMonthNames, 12, 1},
    {"day of week", 0, 7, kDayNames, 7, 0},
};

absl::StatusOr<int> ParseCronValue(absl::string_view text, const CronField& field) {
  int value = 0;
  if (absl::SimpleAtoi(text, &value)) {
    if (value < field.min || value > field.max) {
      return absl::InvalidArgumentError(
          absl::StrCat("Invalid cron expression: ", field.name, " value ", value, " is out of range"));
    }
    return value;
  }
  std::string upper = absl::AsciiStrToUpper(text);
  for (int i = 0; i < field.name_count; ++i) {
    if (upper == field.names[i]) return field.name_base + i;
  }
  return absl::InvalidArgumentError(absl::StrCat("Invalid cron expression: bad ", field.name, " value '", text, "'"));
}

absl::StatusOr<std::set<int>> ParseCronField(absl::string_view text, const CronField& field) {
  std::set<int> values;
  for (absl::string_view part : absl::StrSplit(text, ',')) {
    if (part.empty()) {
      return absl::InvalidArgumentError(absl::StrCat("Invalid cron expression: empty ", field.name, " entry"));
    }
    int step = 1;
    std::vector<absl::string_view> range_and_step = absl::StrSplit(part, absl::MaxSplits('/', 1));
    if (range_and_step.size() == 2) {
      if (!absl::SimpleAtoi(range_and_step[1], &step) || step <= 0) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid cron expression: bad ", field.name, " step '", range_and_step[1], "'"));
      }
    }
    absl::string_view range = range_and_step[0];
    int low = field.min;
    int high = field.max;
    if (range != "*") {
      std::vector<absl::string_view> bounds = absl::StrSplit(range, absl::MaxSplits('-', 1));
      ASSIGN_OR_RETURN(low, ParseCronValue(bounds[0], field));
      high = low;
      if (bounds.size() == 2) {
        ASSIGN_OR_RETURN(high, ParseCronValue(bounds[1], field));
      } else if (range_and_step.size() == 2) {
        high = field.max;
      }
      if (high < low) {
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid cron expression: ", field.name, " range '", range, "' is reversed"));
      }
    }
    for (int v = low;; v += step) {
      values.insert(v);
      if (high - v < step) break;
    }
  }
  return values;
}

absl::Status CheckMinuteSpread(const std::set<int>& minutes) {
  if (minutes.size() > 2) {
    return absl::InvalidArgumentError("Schedule is too frequent (runs more than twice per hour).");
  }
  if (minutes.size() == 2) {
    int interval = *minutes.rbegin() - *minutes.begin();
    if (interval < 30 || (60 - interval) < 30) {
      return absl::InvalidArgumentError("Schedule is too frequent (interval is less than 30 minutes).");
    }
  }
  return absl::OkStatus();
}

absl::StatusOr<absl::Duration> ParseEveryDuration(absl::string_view text) {
  absl::Duration total = absl::ZeroDuration();
  size_t i = 0;
  bool any = false;
  std::string compact;
  for (char c : text) {
    if (!absl::ascii_isspace(static_cast<unsigned char>(c))) compact.push_back(absl::ascii_tolower(c));
  }
  while (i < compact.size()) {
    size_t start = i;
    while (i < compact.size() && absl::ascii_isdigit(static_cast<unsigned char>(compact[i]))) ++i;
    int64_t amount = 0;
    if (start == i || i >= compact.size() || !absl::SimpleAtoi(compact.substr(start, i - start), &amount)) {
      return absl::InvalidArgumentError(absl::StrCat("Invalid interval '", text, "'. Use forms like 30m, 2h or 1d."));
    }
    switch (compact[i]) {
      case 's':
        total += absl::Seconds(amount);
        break;
      case 'm':
        total += absl::Minutes(amount);
        break;
      case 'h':
        total += absl::Hours(amount);
        break;
      case 'd':
        total += absl::Hours(24 * amount);
        break;
      default:
        return absl::InvalidArgumentError(
            absl::StrCat("Invalid interval '", text, "'. Use forms like 30m, 2h or 1d."));
    }
    ++i;
    any = true;
  }
  if (!any) return absl::InvalidArgumentError("Interval is required after @every.");
  return total;
}

std::string NormalizeCharter(const std::string& charter) { return std::string(absl::StripAsciiWhitespace(charter)); }

}  // namespace

absl::Status ValidateSchedule(const std::string& schedule) {
  std::string text(absl::StripAsciiWhitespace(schedule));
  if (text.empty()) return absl::OkStatus();

  if (text[0] == '@') {
    std::string lower = absl::AsciiStrToLower(text);
    static const absl::flat_hash_set<std::string>* const kMacros = new absl::flat_hash_set<std::string>(
        {"@yearly", "@annually", "@monthly", "@weekly", "@daily", "@midnight", "@hourly"});
    if (kMacros->contains(lower)) return absl::OkStatus();
    absl::string_view rest = lower;
    if (absl::ConsumePrefix(&rest, "@every") && (rest.empty() || absl::ascii_isspace(rest[0]))) {
      ASSIGN_OR_RETURN(absl::Duration interval, ParseEveryDuration(absl::StripAsciiWhitespace(rest)));
      if (interval < kMinScheduleInterval) {
        return absl::InvalidArgumentError(absl::StrCat("Schedule is too frequent. Minimum interval is ",
                                                       absl::ToInt64Seconds(kMinScheduleInterval), " seconds."));
      }
      return absl::OkStatus();
    }
    return absl::InvalidArgumentError(absl::StrCat("Unknown schedule macro '", text, "'."));
  }

  std::vector<absl::string_view> fields = absl::StrSplit(text, absl::ByAnyChar(" \t"), absl::SkipEmpty());
  if (fields.size() != 5) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid cron expression: expected 5 fields, got ", fields.size(), "."));
  }
  std::set<int> minutes;
  for (size_t i = 0; i < fields.size(); ++i) {
    ASSIGN_OR_RETURN(auto values, ParseCronField(fields[i], kCronFields[i]));
    if (i == 0) minutes = std::move(values);
  }
  return CheckMinuteSpread(minutes);
}

const char* AgentConfigDomain::TableName() const { return kAgentConfigTable; }

std::string AgentConfigDomain::CreateTableSql() const {
  return absl::StrCat("CREATE TABLE \"", kAgentConfigTable,
                      "\" (id INTEGER PRIMARY KEY CHECK (id = 1), charter TEXT, schedule TEXT);");
}

absl::StatusOr<std::vector<AgentConfigRecord>> AgentConfigDomain::LoadDurable() {
  ASSIGN_OR_RETURN(auto config, store_->GetAgentConfig(agent_.agent_id));
  return std::vector<AgentConfigRecord>{config};
}

absl::Status AgentConfigDomain::InsertMirrorRow(GuardedSession* session, const AgentConfigRecord& config) {
  ASSIGN_OR_RETURN(auto stmt, session->Prepare(absl::StrCat("INSERT INTO \"", kAgentConfigTable,
                                                            "\" (id, charter, schedule) VALUES (1, ?, ?);")));
  RETURN_IF_ERROR(stmt->BindText(1, config.charter));
  if (config.schedule.empty()) {
    RETURN_IF_ERROR(stmt->BindNull(2));
  } else {
    RETURN_IF_ERROR(stmt->BindText(2, config.schedule));
  }
  return stmt->Run();
}

absl::StatusOr<MirrorRead<AgentConfigRecord>> AgentConfigDomain::ReadMirror(GuardedSession* session) {
  ASSIGN_OR_RETURN(auto stmt,
                   session->Prepare(absl::StrCat("SELECT charter, schedule FROM \"", kAgentConfigTable,
                                                 "\" WHERE id = 1;")));
  MirrorRead<AgentConfigRecord> read;
  ASSIGN_OR_RETURN(bool has_row, stmt->Step());
  if (has_row) {
    AgentConfigRecord config;
    config.agent_id = agent_.agent_id;
    config.charter = NormalizeCharter(stmt->ColumnText(0));
    config.schedule = std::string(absl::StripAsciiWhitespace(stmt->ColumnText(1)));
    read.rows.push_back(std::move(config));
  }
  return read;
}

bool AgentConfigDomain::SameContent(const AgentConfigRecord& a, const AgentConfigRecord& b) const {
  return a.charter == b.charter && a.schedule == b.schedule;
}

absl::StatusOr<std::optional<std::string>> AgentConfigDomain::Create(const AgentConfigRecord& config,
                                                                     const Baseline& /*baseline*/,
                                                                     SyncResult* result) {
  AgentConfigRecord empty;
  empty.agent_id = agent_.agent_id;
  return Update(empty, config, result);
}

absl::StatusOr<std::optional<std::string>> AgentConfigDomain::Update(const AgentConfigRecord& before,
                                                                     const AgentConfigRecord& after,
                                                                     SyncResult* result) {
  ASSIGN_OR_RETURN(AgentConfigRecord durable, store_->GetAgentConfig(agent_.agent_id));
  bool changed = false;

  if (after.charter != before.charter) {
    durable.charter = after.charter;
    result->changes.push_back({"charter", "charter", "updated", "", ""});
    changed = true;
  }

  if (after.schedule != before.schedule) {
    absl::Status valid = ValidateSchedule(after.schedule);
    if (valid.ok()) {
      durable.schedule = after.schedule;
      result->changes.push_back({"schedule", "schedule", "updated", before.schedule, after.schedule});
      changed = true;
      LOG(INFO) << "Agent " << agent_.agent_id << " updating schedule from '"
                << (before.schedule.empty() ? "(none)" : before.schedule) << "' to '"
                << (after.schedule.empty() ? "(none)" : after.schedule) << "'";
    } else {
      LOG(WARNING) << "Invalid schedule format for agent " << agent_.agent_id << ": " << valid.message();
      result->errors.push_back(absl::StrCat("Invalid schedule format: ", valid.message()));
    }
  }

  if (!changed) return std::optional<std::string>();
  RETURN_IF_ERROR(store_->UpdateAgentConfig(durable));
  return std::optional<std::string>(Key(durable));
}

absl::StatusOr<bool> AgentConfigDomain::Remove(const AgentConfigRecord& /*before*/, SyncResult* result) {
  result->errors.push_back("Agent config row removed; configuration cannot be deleted. Use UPDATE instead.");
  return false;
}

}  // namespace scratchdb
