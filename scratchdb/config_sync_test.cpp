#include "scratchdb/config_sync.h"

#include <memory>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "absl/status/status.h"

#include "scratchdb/guarded_session.h"
#include "scratchdb/sqlite_record_store.h"

namespace scratchdb {
namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;

TEST(ValidateScheduleTest, AcceptsReasonableSchedules) {
  EXPECT_TRUE(ValidateSchedule("").ok());
  EXPECT_TRUE(ValidateSchedule("0 9 * * *").ok());
  EXPECT_TRUE(ValidateSchedule("0 9 * * MON-FRI").ok());
  EXPECT_TRUE(ValidateSchedule("*/30 * * * *").ok());
  EXPECT_TRUE(ValidateSchedule("15,45 8-18 * JAN-MAR *").ok());
  EXPECT_TRUE(ValidateSchedule("@daily").ok());
  EXPECT_TRUE(ValidateSchedule("@Hourly").ok());
  EXPECT_TRUE(ValidateSchedule("@every 30m").ok());
  EXPECT_TRUE(ValidateSchedule("@every 1h30m").ok());
}

TEST(ValidateScheduleTest, HugeStepsSelectOnlyTheStart) {
  EXPECT_TRUE(ValidateSchedule("59/2147483647 * * * *").ok());
  EXPECT_TRUE(ValidateSchedule("0 */2147483647 * * *").ok());
  EXPECT_TRUE(ValidateSchedule("0,30/2147483647 * * * *").ok());
  EXPECT_TRUE(ValidateSchedule("0 0 31/2147483647 DEC/2147483647 SUN/2147483647").ok());
}

TEST(ValidateScheduleTest, RejectsFrequentSchedules) {
  absl::Status status = ValidateSchedule("* * * * *");
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(status.message(), "Schedule is too frequent (runs more than twice per hour).");

  status = ValidateSchedule("0,10 * * * *");
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(status.message(), "Schedule is too frequent (interval is less than 30 minutes).");

  status = ValidateSchedule("*/15 * * * *");
  EXPECT_FALSE(status.ok());

  status = ValidateSchedule("@every 10m");
  ASSERT_FALSE(status.ok());
  EXPECT_EQ(status.message(), "Schedule is too frequent. Minimum interval is 1800 seconds.");
}

TEST(ValidateScheduleTest, RejectsMalformedSchedules) {
  EXPECT_TRUE(absl::IsInvalidArgument(ValidateSchedule("0 9 * *")));
  EXPECT_TRUE(absl::IsInvalidArgument(ValidateSchedule("61 * * * *")));
  EXPECT_TRUE(absl::IsInvalidArgument(ValidateSchedule("0 9 * * FUNDAY")));
  EXPECT_TRUE(absl::IsInvalidArgument(ValidateSchedule("0 18-9 * * *")));
  EXPECT_TRUE(absl::IsInvalidArgument(ValidateSchedule("@sometimes")));
  EXPECT_TRUE(absl::IsInvalidArgument(ValidateSchedule("@every")));
  EXPECT_TRUE(absl::IsInvalidArgument(ValidateSchedule("@every soon")));
}

class ConfigSyncTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(store_.Init(":memory:").ok());
    agent_ = {"agent-1", "org-1", "user-1"};
    ASSERT_TRUE(store_.UpsertAgent(agent_).ok());
    ASSERT_TRUE(store_.UpdateAgentConfig({"agent-1", "Watch the market", "0 9 * * *"}).ok());

    auto session_or = GuardedSession::Open(":memory:");
    ASSERT_TRUE(session_or.ok()) << session_or.status().message();
    session_ = std::move(*session_or);
    sync_ = std::make_unique<AgentConfigSync>(session_.get(), &store_, agent_, AgentConfigDomain(&store_, agent_));
    ASSERT_TRUE(sync_->Seed().ok());
  }

  void Exec(const std::string& sql) {
    absl::Status status = session_->ExecuteScript(sql);
    ASSERT_TRUE(status.ok()) << status.message();
  }

  AgentConfigRecord Durable() {
    auto config_or = store_.GetAgentConfig("agent-1");
    EXPECT_TRUE(config_or.ok());
    return config_or.ok() ? *config_or : AgentConfigRecord();
  }

  SqliteRecordStore store_;
  AgentIdentity agent_;
  std::unique_ptr<GuardedSession> session_;
  std::unique_ptr<AgentConfigSync> sync_;
};

TEST_F(ConfigSyncTest, SeedsSingleRow) {
  auto count_or = session_->QueryInt64("SELECT COUNT(*) FROM __agent_config WHERE id = 1");
  ASSERT_TRUE(count_or.ok());
  EXPECT_EQ(*count_or, 1);
  EXPECT_EQ(sync_->baseline().at("agent_config").charter, "Watch the market");

  // The single-row check rejects a second row outright.
  EXPECT_FALSE(session_->ExecuteScript("INSERT INTO __agent_config (id, charter) VALUES (2, 'x');").ok());
}

TEST_F(ConfigSyncTest, UntouchedMirrorChangesNothing) {
  SyncResult result = sync_->Apply();
  EXPECT_EQ(result.domain, "Config");
  EXPECT_FALSE(result.changed);
  EXPECT_THAT(result.errors, IsEmpty());
}

TEST_F(ConfigSyncTest, UpdatesCharterAndSchedule) {
  Exec("UPDATE __agent_config SET charter = '  Watch the market closely ', schedule = '@daily' WHERE id = 1;");
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.errors, IsEmpty());
  EXPECT_TRUE(result.changed);
  AgentConfigRecord config = Durable();
  EXPECT_EQ(config.charter, "Watch the market closely");
  EXPECT_EQ(config.schedule, "@daily");
  EXPECT_EQ(result.changes.size(), 2u);
}

TEST_F(ConfigSyncTest, InvalidScheduleDoesNotHoldBackCharter) {
  Exec("UPDATE __agent_config SET charter = 'New charter', schedule = '*/5 * * * *' WHERE id = 1;");
  SyncResult result = sync_->Apply();
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_THAT(result.errors[0], HasSubstr("Invalid schedule format: Schedule is too frequent"));

  AgentConfigRecord config = Durable();
  EXPECT_EQ(config.charter, "New charter");
  EXPECT_EQ(config.schedule, "0 9 * * *");
}

TEST_F(ConfigSyncTest, ClearingScheduleUnschedules) {
  Exec("UPDATE __agent_config SET schedule = NULL WHERE id = 1;");
  SyncResult result = sync_->Apply();
  EXPECT_THAT(result.errors, IsEmpty());
  EXPECT_EQ(Durable().schedule, "");
}

TEST_F(ConfigSyncTest, DeletingRowIsAnError) {
  Exec("DELETE FROM __agent_config;");
  SyncResult result = sync_->Apply();
  ASSERT_EQ(result.errors.size(), 1u);
  EXPECT_EQ(result.errors[0], "Agent config row removed; configuration cannot be deleted. Use UPDATE instead.");
  EXPECT_FALSE(result.changed);
  EXPECT_EQ(Durable().charter, "Watch the market");
}

}  // namespace
}  // namespace scratchdb
