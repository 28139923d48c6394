#include "scratchdb/processing_cycle.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "absl/status/status.h"

#include "scratchdb/file_blob_store.h"
#include "scratchdb/sqlite_record_store.h"

namespace scratchdb {
namespace {

using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::SizeIs;

class ProcessingCycleTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(store_.Init(":memory:").ok());
    agent_ = {"agent-1", "org-1", "user-1"};
    ASSERT_TRUE(store_.UpsertAgent(agent_).ok());

    auto dir_or = ScratchDatabase::Create("blobs");
    ASSERT_TRUE(dir_or.ok()) << dir_or.status().message();
    blob_dir_ = std::move(*dir_or);
    blobs_ = std::make_unique<FileBlobStore>(blob_dir_->directory());
    storage_ = std::make_unique<StorageLifecycle>(blobs_.get(), config_);
  }

  std::unique_ptr<ProcessingCycle> Start() {
    auto cycle = std::make_unique<ProcessingCycle>(storage_.get(), &store_, config_);
    absl::Status status = cycle->Begin("agent-1");
    EXPECT_TRUE(status.ok()) << status.message();
    return cycle;
  }

  BatchResponse Run(ProcessingCycle* cycle, std::vector<std::string> statements) {
    BatchRequest request;
    request.statements = std::move(statements);
    return cycle->ExecuteBatch(request);
  }

  Config config_;
  SqliteRecordStore store_;
  AgentIdentity agent_;
  std::unique_ptr<ScratchDatabase> blob_dir_;
  std::unique_ptr<FileBlobStore> blobs_;
  std::unique_ptr<StorageLifecycle> storage_;
};

TEST_F(ProcessingCycleTest, AppliesKanbanAndPersists) {
  auto cycle = Start();
  ASSERT_TRUE(cycle->active());
  BatchResponse response = Run(cycle.get(), {"INSERT INTO __kanban_cards (title) VALUES ('Write report');",
                                             "CREATE TABLE notes (body TEXT);",
                                             "INSERT INTO notes VALUES ('kept');"});
  ASSERT_TRUE(response.ok) << response.message;

  CycleReport report = cycle->End();
  EXPECT_FALSE(cycle->active());
  EXPECT_THAT(report.kanban.created_ids, SizeIs(1));
  EXPECT_THAT(report.kanban.errors, IsEmpty());
  EXPECT_FALSE(report.skills.changed);
  EXPECT_FALSE(report.config.changed);
  ASSERT_TRUE(report.board.has_value());
  EXPECT_EQ(report.board->todo_count, 1);
  EXPECT_THAT(report.board->todo_titles, ElementsAre("Write report"));
  EXPECT_EQ(report.persist, PersistOutcome::kPersisted);
  EXPECT_THAT(report.digest_summary, HasSubstr("tables=1"));
  EXPECT_EQ(report.ToJson()["persist"], "persisted");

  auto cards_or = store_.ListVisibleCards(agent_);
  ASSERT_TRUE(cards_or.ok());
  ASSERT_EQ(cards_or->size(), 1u);
  EXPECT_EQ((*cards_or)[0].title, "Write report");
  EXPECT_EQ((*cards_or)[0].assigned_agent_id, "agent-1");
}

TEST_F(ProcessingCycleTest, NextCycleSeesPersistedTablesAndMirrors) {
  {
    auto cycle = Start();
    ASSERT_TRUE(Run(cycle.get(), {"INSERT INTO __kanban_cards (title) VALUES ('Write report');",
                                  "CREATE TABLE notes (body TEXT); INSERT INTO notes VALUES ('kept');"})
                    .ok);
    cycle->End();
  }

  auto cycle = Start();
  EXPECT_THAT(cycle->SchemaSummary(), HasSubstr("Table notes (rows: 1)"));
  auto count_or = cycle->session()->QueryInt64("SELECT COUNT(*) FROM __kanban_cards WHERE title = 'Write report'");
  ASSERT_TRUE(count_or.ok()) << count_or.status().message();
  EXPECT_EQ(*count_or, 1);

  CycleReport report = cycle->End();
  EXPECT_FALSE(report.kanban.changed);
  EXPECT_FALSE(report.board.has_value());
}

TEST_F(ProcessingCycleTest, DestructorEndsCycle) {
  {
    auto cycle = Start();
    ASSERT_TRUE(cycle->ExecuteSingle("CREATE TABLE kept (a INTEGER);").ok);
  }
  auto cycle = Start();
  auto exists_or = cycle->session()->TableExists("kept");
  ASSERT_TRUE(exists_or.ok());
  EXPECT_TRUE(*exists_or);
}

TEST_F(ProcessingCycleTest, InactiveCycleRefusesWork) {
  ProcessingCycle cycle(storage_.get(), &store_, config_);
  BatchResponse response = cycle.ExecuteSingle("SELECT 1;");
  EXPECT_FALSE(response.ok);
  ASSERT_TRUE(response.error.has_value());
  EXPECT_EQ(response.error->code, "unavailable");
  EXPECT_EQ(cycle.SchemaSummary(), "SQLite database is not available.");
  EXPECT_THAT(cycle.DigestPrompt(), HasSubstr("VERDICT: error -> investigate"));
  EXPECT_TRUE(absl::IsFailedPrecondition(cycle.StoreToolResults({})));

  CycleReport report = cycle.End();
  EXPECT_EQ(report.persist, PersistOutcome::kSkipped);
}

TEST_F(ProcessingCycleTest, UnknownAgentFailsToBegin) {
  ProcessingCycle cycle(storage_.get(), &store_, config_);
  EXPECT_TRUE(absl::IsNotFound(cycle.Begin("agent-404")));
  EXPECT_FALSE(cycle.active());
}

TEST_F(ProcessingCycleTest, BeginTwiceIsRejected) {
  auto cycle = Start();
  EXPECT_TRUE(absl::IsFailedPrecondition(cycle->Begin("agent-1")));
}

TEST_F(ProcessingCycleTest, ToolResultsAreQueryableButNotPersisted) {
  {
    auto cycle = Start();
    ASSERT_TRUE(cycle->StoreToolResults({{"r1", "search", R"({"hits": 2})", ""}}).ok());
    BatchResponse response =
        cycle->ExecuteSingle("SELECT json_extract(result_json, '$.hits') AS hits FROM __tool_results;");
    ASSERT_TRUE(response.ok) << response.message;
    ASSERT_EQ(response.results.size(), 1u);
    ASSERT_EQ(response.results[0].rows.size(), 1u);
    EXPECT_EQ(response.results[0].rows[0][0], SqlValue::Integer(2));
  }
  auto cycle = Start();
  auto exists_or = cycle->session()->TableExists("__tool_results");
  ASSERT_TRUE(exists_or.ok());
  EXPECT_FALSE(*exists_or);
}

TEST_F(ProcessingCycleTest, DigestPromptDescribesUserTables) {
  auto cycle = Start();
  ASSERT_TRUE(Run(cycle.get(), {"CREATE TABLE orders (id INTEGER PRIMARY KEY, total REAL);",
                                "INSERT INTO orders (total) VALUES (1.5), (2.5);"})
                  .ok);
  std::string prompt = cycle->DigestPrompt();
  EXPECT_THAT(prompt, HasSubstr("<sqlite_digest>"));
  EXPECT_THAT(prompt, HasSubstr("schema: 1 tables"));
}

}  // namespace
}  // namespace scratchdb
