#include "scratchdb/config.h"

#include <cstdlib>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "absl/status/status.h"
#include "absl/time/time.h"

namespace scratchdb {
namespace {

using ::testing::HasSubstr;

class ConfigTest : public ::testing::Test {
 protected:
  void TearDown() override {
    for (const char* name : {"SCRATCHDB_QUERY_TIMEOUT_MS", "SCRATCHDB_ROW_LIMIT", "SCRATCHDB_SOFT_SIZE_MB",
                             "SCRATCHDB_HARD_SIZE_MB", "SCRATCHDB_DIGEST_SAMPLE_SIZE"}) {
      unsetenv(name);
    }
  }
};

TEST_F(ConfigTest, DefaultsMatchProductionCeilings) {
  Config config;
  EXPECT_EQ(config.query_timeout, absl::Seconds(30));
  EXPECT_EQ(config.soft_size_bytes, 50 * kBytesPerMb);
  EXPECT_EQ(config.hard_size_bytes, 100 * kBytesPerMb);
  EXPECT_EQ(config.schema_prompt_bytes, 30000);
  EXPECT_TRUE(config.Validate().ok());
}

TEST_F(ConfigTest, ReadsEnvironmentOverrides) {
  setenv("SCRATCHDB_QUERY_TIMEOUT_MS", "1500", 1);
  setenv("SCRATCHDB_ROW_LIMIT", "20", 1);
  setenv("SCRATCHDB_HARD_SIZE_MB", "200", 1);
  setenv("SCRATCHDB_DIGEST_SAMPLE_SIZE", "50", 1);
  auto config_or = Config::FromEnv();
  ASSERT_TRUE(config_or.ok()) << config_or.status().message();
  EXPECT_EQ(config_or->query_timeout, absl::Milliseconds(1500));
  EXPECT_EQ(config_or->row_limit, 20);
  EXPECT_EQ(config_or->hard_size_bytes, 200 * kBytesPerMb);
  EXPECT_EQ(config_or->soft_size_bytes, 50 * kBytesPerMb);
  EXPECT_EQ(config_or->digest_sample_size, 50);
}

TEST_F(ConfigTest, RejectsNonPositiveValues) {
  setenv("SCRATCHDB_ROW_LIMIT", "zero", 1);
  auto config_or = Config::FromEnv();
  ASSERT_TRUE(absl::IsInvalidArgument(config_or.status()));
  EXPECT_THAT(config_or.status().message(), HasSubstr("SCRATCHDB_ROW_LIMIT"));

  setenv("SCRATCHDB_ROW_LIMIT", "-5", 1);
  EXPECT_FALSE(Config::FromEnv().ok());
}

TEST_F(ConfigTest, RejectsSoftCeilingAboveHardCeiling) {
  setenv("SCRATCHDB_SOFT_SIZE_MB", "300", 1);
  auto config_or = Config::FromEnv();
  ASSERT_FALSE(config_or.ok());
  EXPECT_THAT(config_or.status().message(), HasSubstr("exceeds hard ceiling"));
}

TEST_F(ConfigTest, ValidateChecksEveryLimit) {
  Config config;
  config.query_timeout = absl::ZeroDuration();
  EXPECT_FALSE(config.Validate().ok());

  config = Config();
  config.row_limit = 0;
  EXPECT_FALSE(config.Validate().ok());

  config = Config();
  config.digest_max_columns = 0;
  EXPECT_FALSE(config.Validate().ok());
}

}  // namespace
}  // namespace scratchdb
