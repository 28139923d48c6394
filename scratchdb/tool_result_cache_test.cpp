#include "scratchdb/tool_result_cache.h"

#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "nlohmann/json.hpp"

#include "scratchdb/guarded_session.h"

namespace scratchdb {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;

TEST(JsonTypeNameTest, NamesEveryType) {
  EXPECT_EQ(JsonTypeName(nlohmann::json::object()), "object");
  EXPECT_EQ(JsonTypeName(nlohmann::json::array()), "array");
  EXPECT_EQ(JsonTypeName("text"), "string");
  EXPECT_EQ(JsonTypeName(3), "integer");
  EXPECT_EQ(JsonTypeName(2.5), "number");
  EXPECT_EQ(JsonTypeName(true), "boolean");
  EXPECT_EQ(JsonTypeName(nullptr), "null");
}

TEST(InferJsonSchemaTest, DescribesNestedStructure) {
  auto value = nlohmann::json::parse(R"({"items": [{"id": 1, "tags": ["a"]}], "total": 1})");
  nlohmann::json schema = InferJsonSchema(value);
  EXPECT_EQ(schema["type"], "object");
  EXPECT_EQ(schema["properties"]["total"]["type"], "integer");
  EXPECT_EQ(schema["properties"]["items"]["type"], "array");
  EXPECT_EQ(schema["properties"]["items"]["items"]["properties"]["id"]["type"], "integer");
  // Depth runs out before the innermost array is described.
  EXPECT_FALSE(schema["properties"]["items"]["items"]["properties"]["tags"].contains("items"));
}

TEST(IsProbablyBinaryTest, DetectsControlBytes) {
  EXPECT_FALSE(IsProbablyBinary(""));
  EXPECT_FALSE(IsProbablyBinary("plain text\nwith lines\t"));
  EXPECT_TRUE(IsProbablyBinary(std::string("abc\0def", 7)));
  EXPECT_TRUE(IsProbablyBinary("\x01\x02\x03\x04"));
}

TEST(SummarizeToolResultTest, JsonObject) {
  ToolResultMeta meta = SummarizeToolResult(R"(  {"b": 1, "a": {"c": [1, 2]}}  )", 1024);
  EXPECT_TRUE(meta.is_json);
  EXPECT_EQ(meta.json_type, "object");
  EXPECT_THAT(meta.top_keys, ElementsAre("a", "b"));
  EXPECT_FALSE(meta.is_truncated);
  ASSERT_TRUE(meta.stored_json.has_value());
  EXPECT_EQ(*meta.stored_json, R"({"a":{"c":[1,2]},"b":1})");
  EXPECT_FALSE(meta.stored_text.has_value());
  EXPECT_FALSE(meta.json_schema.empty());
}

TEST(SummarizeToolResultTest, ArrayOfObjectsUsesFirstElementKeys) {
  ToolResultMeta meta = SummarizeToolResult(R"([{"name": "x", "id": 1}, {"other": 2}])", 1024);
  EXPECT_EQ(meta.json_type, "array");
  EXPECT_THAT(meta.top_keys, ElementsAre("id", "name"));
}

TEST(SummarizeToolResultTest, PlainText) {
  ToolResultMeta meta = SummarizeToolResult("line one\nline two\nline three", 1024);
  EXPECT_FALSE(meta.is_json);
  EXPECT_EQ(meta.line_count, 3);
  EXPECT_EQ(meta.bytes, 28);
  EXPECT_THAT(meta.top_keys, IsEmpty());
  ASSERT_TRUE(meta.stored_text.has_value());
  EXPECT_EQ(*meta.stored_text, "line one\nline two\nline three");
}

TEST(SummarizeToolResultTest, TruncatedJsonFallsBackToText) {
  std::string big = R"({"data": ")" + std::string(200, 'x') + R"("})";
  ToolResultMeta meta = SummarizeToolResult(big, 50);
  EXPECT_TRUE(meta.is_json);
  EXPECT_TRUE(meta.is_truncated);
  EXPECT_GT(meta.truncated_bytes, 0);
  EXPECT_FALSE(meta.stored_json.has_value());
  ASSERT_TRUE(meta.stored_text.has_value());
  EXPECT_EQ(meta.stored_text->size(), 50u);
}

TEST(SummarizeToolResultTest, TruncationKeepsUtf8Intact) {
  std::string text = "ab\xC3\xA9\xC3\xA9";  // "abéé"
  ToolResultMeta meta = SummarizeToolResult(text, 3);
  ASSERT_TRUE(meta.stored_text.has_value());
  EXPECT_EQ(*meta.stored_text, "ab");
  EXPECT_TRUE(meta.is_truncated);
}

TEST(SummarizeToolResultTest, FlagsImagesAndBase64) {
  ToolResultMeta meta = SummarizeToolResult("<img src=\"data:image/png;base64,iVBORw0\">", 1024);
  EXPECT_TRUE(meta.has_images);
  EXPECT_TRUE(meta.has_base64);
}

class ToolResultCacheTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto session_or = GuardedSession::Open(":memory:");
    ASSERT_TRUE(session_or.ok()) << session_or.status().message();
    session_ = std::move(*session_or);
  }

  std::unique_ptr<GuardedSession> session_;
};

TEST_F(ToolResultCacheTest, StoreReplacesRows) {
  ToolResultCache cache(1024);
  std::vector<ToolResultRecord> first = {
      {"r1", "search", R"({"hits": 3})", "2024-01-01T00:00:00Z"},
      {"r2", "fetch", "<html></html>", ""},
  };
  ASSERT_TRUE(cache.Store(session_.get(), first).ok());
  auto count_or = session_->QueryInt64("SELECT COUNT(*) FROM __tool_results");
  ASSERT_TRUE(count_or.ok());
  EXPECT_EQ(*count_or, 2);

  auto stmt_or = session_->Prepare(
      "SELECT is_json, json_extract(result_json, '$.hits'), top_keys FROM __tool_results WHERE result_id = 'r1'");
  ASSERT_TRUE(stmt_or.ok()) << stmt_or.status().message();
  auto row_or = (*stmt_or)->Step();
  ASSERT_TRUE(row_or.ok() && *row_or);
  EXPECT_EQ((*stmt_or)->ColumnInt(0), 1);
  EXPECT_EQ((*stmt_or)->ColumnInt(1), 3);
  EXPECT_EQ((*stmt_or)->ColumnText(2), "hits");
  stmt_or->reset();

  ASSERT_TRUE(cache.Store(session_.get(), {{"r3", "search", "done", ""}}).ok());
  count_or = session_->QueryInt64("SELECT COUNT(*) FROM __tool_results");
  ASSERT_TRUE(count_or.ok());
  EXPECT_EQ(*count_or, 1);
}

TEST_F(ToolResultCacheTest, MissingIdLeavesPreviousRows) {
  ToolResultCache cache;
  ASSERT_TRUE(cache.Store(session_.get(), {{"r1", "search", "ok", ""}}).ok());
  absl::Status status = cache.Store(session_.get(), {{"r2", "search", "x", ""}, {"", "search", "y", ""}});
  EXPECT_FALSE(status.ok());
  EXPECT_FALSE(session_->InTransaction());

  auto count_or = session_->QueryInt64("SELECT COUNT(*) FROM __tool_results WHERE result_id = 'r1'");
  ASSERT_TRUE(count_or.ok());
  EXPECT_EQ(*count_or, 1);
}

}  // namespace
}  // namespace scratchdb
