#include "scratchdb/batch_executor.h"

#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "absl/status/status.h"
#include "absl/time/time.h"
#include "nlohmann/json.hpp"

#include "scratchdb/guarded_session.h"
#include "scratchdb/storage_lifecycle.h"

namespace scratchdb {
namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;

class BatchExecutorTest : public ::testing::Test {
 protected:
  void SetUp() override { Reopen(Config()); }

  void Reopen(const Config& config) {
    executor_.reset();
    session_.reset();
    auto session_or = GuardedSession::Open(":memory:", SessionOptions::FromConfig(config));
    ASSERT_TRUE(session_or.ok()) << session_or.status().message();
    session_ = std::move(*session_or);
    auto executor_or = BatchExecutor::Create(session_.get(), config);
    ASSERT_TRUE(executor_or.ok()) << executor_or.status().message();
    executor_ = std::move(*executor_or);
  }

  BatchResponse Run(std::vector<std::string> statements, bool will_continue_work = true) {
    BatchRequest request;
    request.statements = std::move(statements);
    request.will_continue_work = will_continue_work;
    return executor_->ExecuteBatch(request);
  }

  int64_t Count(const std::string& table) {
    auto count_or = session_->QueryInt64("SELECT COUNT(*) FROM " + table);
    EXPECT_TRUE(count_or.ok()) << count_or.status().message();
    return count_or.ok() ? *count_or : -1;
  }

  std::unique_ptr<GuardedSession> session_;
  std::unique_ptr<BatchExecutor> executor_;
};

TEST_F(BatchExecutorTest, CreateInsertSelect) {
  BatchResponse response =
      Run({"CREATE TABLE t (a INTEGER)", "INSERT INTO t VALUES (1), (2)", "SELECT a FROM t ORDER BY a"});
  ASSERT_TRUE(response.ok) << response.message;
  ASSERT_EQ(response.results.size(), 3u);
  EXPECT_FALSE(response.error.has_value());

  EXPECT_FALSE(response.results[1].has_rows);
  EXPECT_EQ(response.results[1].changes, 2);
  ASSERT_TRUE(response.results[1].last_insert_rowid.has_value());
  EXPECT_EQ(*response.results[1].last_insert_rowid, 2);

  const StatementResult& select = response.results[2];
  EXPECT_TRUE(select.has_rows);
  EXPECT_THAT(select.columns, ::testing::ElementsAre("a"));
  ASSERT_EQ(select.rows.size(), 2u);
  EXPECT_EQ(select.rows[0][0], SqlValue::Integer(1));
  EXPECT_EQ(select.rows[1][0], SqlValue::Integer(2));

  nlohmann::json payload = response.ToJson();
  EXPECT_EQ(payload["status"], "ok");
  EXPECT_EQ(payload["results"][2]["rows"], nlohmann::json::parse(R"([{"a":1},{"a":2}])"));
  EXPECT_EQ(payload["results"][2]["row_count"], 2);
}

TEST_F(BatchExecutorTest, StopsAtFirstFailureAndKeepsEarlierWork) {
  BatchResponse response = Run({"CREATE TABLE t (a INTEGER)", "INSERT INTO t VALUES (1)",
                                "SELECT * FROM missing_table", "INSERT INTO t VALUES (2)"});
  EXPECT_FALSE(response.ok);
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->index, 2);
  EXPECT_EQ(response.results.size(), 2u);
  EXPECT_THAT(response.error->message, HasSubstr("no such table"));
  EXPECT_THAT(response.error->hint, HasSubstr("Create the table first"));
  EXPECT_THAT(response.message, HasSubstr("Statement 2 failed after 2 successful statement(s)"));

  // Statements before the failure committed; the one after never ran.
  EXPECT_EQ(Count("t"), 1);
  EXPECT_FALSE(session_->InTransaction());
}

TEST_F(BatchExecutorTest, BlocksVacuum) {
  BatchResponse response = Run({"CREATE TABLE t (a)", "VACUUM"});
  EXPECT_FALSE(response.ok);
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->index, 1);
  EXPECT_EQ(response.error->code, "blocked");
  EXPECT_THAT(response.error->message, HasSubstr("VACUUM"));
  EXPECT_EQ(response.results.size(), 1u);
}

TEST_F(BatchExecutorTest, RejectsTransactionControl) {
  BatchResponse response = Run({"BEGIN", "INSERT INTO t VALUES (1)"});
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->index, 0);
  EXPECT_EQ(response.error->code, "transaction_control_disallowed");
  EXPECT_FALSE(session_->InTransaction());
}

TEST_F(BatchExecutorTest, RejectsEmptyBatch) {
  BatchResponse response = Run({});
  EXPECT_FALSE(response.ok);
  EXPECT_THAT(response.message, HasSubstr("non-empty array"));
  EXPECT_THAT(response.results, IsEmpty());
}

TEST_F(BatchExecutorTest, RejectsBlankStatement) {
  BatchResponse response = Run({"SELECT 1", "   "});
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->index, 1);
  EXPECT_EQ(response.error->code, "invalid_input");
}

TEST_F(BatchExecutorTest, SplitsScriptEntries) {
  BatchResponse response = Run({"CREATE TABLE t (a); INSERT INTO t VALUES (1);", "SELECT COUNT(*) AS n FROM t"});
  ASSERT_TRUE(response.ok) << response.message;
  ASSERT_EQ(response.results.size(), 3u);
  EXPECT_EQ(response.results[2].rows[0][0], SqlValue::Integer(1));
}

TEST_F(BatchExecutorTest, FailureInScriptEntryNamesCallerEntry) {
  BatchResponse response = Run({"CREATE TABLE t (a INTEGER)",
                                "INSERT INTO t VALUES (1); INSERT INTO missing VALUES (2); INSERT INTO t VALUES (3)",
                                "INSERT INTO t VALUES (4)"});
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->index, 2);
  EXPECT_EQ(response.error->entry, 1);
  EXPECT_EQ(response.error->part, 1);
  EXPECT_EQ(response.error->parts, 3);
  EXPECT_EQ(response.results.size(), 2u);
  EXPECT_EQ(response.results[1].entry, 1);
  EXPECT_THAT(response.message, HasSubstr("Statement 1 (part 2 of 3) failed after 2 successful statement(s)"));

  nlohmann::json error = response.ToJson()["error"];
  EXPECT_EQ(error["entry"], 1);
  EXPECT_EQ(error["part"], 1);
  EXPECT_EQ(error["parts"], 3);
  EXPECT_EQ(Count("t"), 1);
}

TEST_F(BatchExecutorTest, TriggerDefinitionRunsAsOneStatement) {
  BatchResponse response = Run({
      "CREATE TABLE items (id INTEGER PRIMARY KEY, name TEXT)",
      "CREATE TABLE audit (item_id INTEGER)",
      "CREATE TRIGGER items_audit AFTER INSERT ON items BEGIN INSERT INTO audit VALUES (new.id); END;",
      "INSERT INTO items (name) VALUES ('a'), ('b')",
  });
  ASSERT_TRUE(response.ok) << response.message;
  EXPECT_EQ(response.results.size(), 4u);
  EXPECT_EQ(Count("audit"), 2);
}

TEST_F(BatchExecutorTest, ExecuteSingleRejectsSeveralStatements) {
  BatchResponse response = executor_->ExecuteSingle("SELECT 1; SELECT 2");
  EXPECT_FALSE(response.ok);
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->code, "multiple_statements");

  response = executor_->ExecuteSingle("SELECT 42 AS answer");
  ASSERT_TRUE(response.ok) << response.message;
  ASSERT_EQ(response.results.size(), 1u);
  EXPECT_EQ(response.results[0].rows[0][0], SqlValue::Integer(42));
}

TEST_F(BatchExecutorTest, ReportsConstraintViolation) {
  BatchResponse response =
      Run({"CREATE TABLE u (id INTEGER PRIMARY KEY, email TEXT UNIQUE)", "INSERT INTO u (email) VALUES ('a@x.io')",
           "INSERT INTO u (email) VALUES ('a@x.io')"});
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->index, 2);
  EXPECT_EQ(response.error->code, "constraint_violation");
  EXPECT_THAT(response.error->hint, HasSubstr("ON CONFLICT"));
}

TEST_F(BatchExecutorTest, ReportsSyntaxError) {
  BatchResponse response = Run({"SELEC 1"});
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->code, "syntax_error");
  EXPECT_FALSE(response.error->hint.empty());
}

TEST_F(BatchExecutorTest, ReportsSandboxDenial) {
  BatchResponse response = Run({"PRAGMA database_list"});
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->code, "sandbox_denied");
}

TEST_F(BatchExecutorTest, ContinuationAllowedOnlyForPureWrites) {
  BatchResponse response = Run({"CREATE TABLE t (a)", "INSERT INTO t VALUES (1)"}, /*will_continue_work=*/false);
  ASSERT_TRUE(response.ok);
  EXPECT_TRUE(response.continuation_allowed);
  EXPECT_EQ(response.ToJson()["auto_sleep_ok"], true);

  response = Run({"INSERT INTO t VALUES (2)", "SELECT * FROM t"}, /*will_continue_work=*/false);
  ASSERT_TRUE(response.ok);
  EXPECT_FALSE(response.continuation_allowed);

  response = Run({"INSERT INTO t VALUES (3)"}, /*will_continue_work=*/true);
  ASSERT_TRUE(response.ok);
  EXPECT_FALSE(response.continuation_allowed);
}

TEST_F(BatchExecutorTest, TruncatesAtRowLimit) {
  Config config;
  config.row_limit = 2;
  Reopen(config);
  BatchResponse response = Run({"WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c WHERE x < 5) "
                                "SELECT x FROM c"});
  ASSERT_TRUE(response.ok) << response.message;
  ASSERT_EQ(response.results.size(), 1u);
  EXPECT_EQ(response.results[0].rows.size(), 2u);
  EXPECT_TRUE(response.results[0].truncated);
}

TEST_F(BatchExecutorTest, ReportsTimeout) {
  Config config;
  config.query_timeout = absl::Milliseconds(50);
  config.progress_ops = 100;
  Reopen(config);
  BatchResponse response =
      Run({"WITH RECURSIVE c(x) AS (SELECT 1 UNION ALL SELECT x + 1 FROM c) SELECT MAX(x) FROM c"});
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->code, "timeout");
  EXPECT_THAT(response.error->message, HasSubstr("timed out"));
}

TEST(BatchExecutorSizeTest, WarnsOverSoftLimit) {
  auto database_or = ScratchDatabase::Create("agent-soft");
  ASSERT_TRUE(database_or.ok()) << database_or.status().message();
  Config config;
  config.soft_size_bytes = 1;
  auto session_or = GuardedSession::Open((*database_or)->path(), SessionOptions::FromConfig(config));
  ASSERT_TRUE(session_or.ok()) << session_or.status().message();
  auto executor_or = BatchExecutor::Create(session_or->get(), config);
  ASSERT_TRUE(executor_or.ok());

  BatchRequest request;
  request.statements = {"CREATE TABLE t (a TEXT)", "INSERT INTO t VALUES ('payload')"};
  BatchResponse response = (*executor_or)->ExecuteBatch(request);
  ASSERT_TRUE(response.ok) << response.message;
  EXPECT_GT(response.db_size_mb, 0.0);
  ASSERT_EQ(response.warnings.size(), 1u);
  EXPECT_THAT(response.warnings[0], HasSubstr("WIPED AT 100MB"));
}

TEST(BatchExecutorStaticTest, CreateRejectsNullSession) {
  auto executor_or = BatchExecutor::Create(nullptr);
  EXPECT_TRUE(absl::IsInvalidArgument(executor_or.status()));
}

TEST(BatchExecutorStaticTest, SanitizesQuotes) {
  EXPECT_EQ(BatchExecutor::SanitizeSql("SELECT 'it\\'s'"), "SELECT 'it''s'");
  EXPECT_EQ(BatchExecutor::SanitizeSql("SELECT \xE2\x80\x9Cname\xE2\x80\x9D FROM t"), "SELECT \"name\" FROM t");
  EXPECT_EQ(BatchExecutor::SanitizeSql("SELECT 'don\xE2\x80\x99t'"), "SELECT 'don''t'");
}

TEST(BatchExecutorStaticTest, HintsForKnownErrors) {
  EXPECT_THAT(BatchExecutor::HintForError("no such column: foo"), HasSubstr("PRAGMA table_info"));
  EXPECT_THAT(BatchExecutor::HintForError("SELECTs to the left and right of UNION do not have the same number of "
                                          "result columns"),
              HasSubstr("same number of columns"));
  EXPECT_EQ(BatchExecutor::HintForError("disk I/O error"), "");
}

TEST(BatchExecutorStaticTest, MapsStatusToErrorCode) {
  EXPECT_EQ(BatchExecutor::ErrorCode(absl::DeadlineExceededError("interrupted")), "timeout");
  EXPECT_EQ(BatchExecutor::ErrorCode(absl::PermissionDeniedError("not authorized")), "sandbox_denied");
  EXPECT_EQ(BatchExecutor::ErrorCode(absl::FailedPreconditionError("UNIQUE constraint failed")),
            "constraint_violation");
  EXPECT_EQ(BatchExecutor::ErrorCode(absl::InvalidArgumentError("near \"x\": syntax error")), "syntax_error");
  EXPECT_EQ(BatchExecutor::ErrorCode(absl::InternalError("boom")), "unknown");
}

}  // namespace
}  // namespace scratchdb
