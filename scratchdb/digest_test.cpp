#include "scratchdb/digest.h"

#include <memory>
#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

#include "absl/strings/match.h"

#include "scratchdb/guarded_session.h"

namespace scratchdb {
namespace {

using ::testing::DoubleNear;
using ::testing::HasSubstr;
using ::testing::Not;
using ::testing::StartsWith;

std::vector<SqlValue> Texts(const std::vector<std::string>& texts) {
  std::vector<SqlValue> values;
  for (const auto& text : texts) values.push_back(SqlValue::Text(text));
  return values;
}

TEST(CalculateEntropyTest, BitsPerByte) {
  EXPECT_EQ(CalculateEntropy(""), 0.0);
  EXPECT_EQ(CalculateEntropy("aaaa"), 0.0);
  EXPECT_THAT(CalculateEntropy("abab"), DoubleNear(1.0, 1e-9));
  EXPECT_THAT(CalculateEntropy("abcd"), DoubleNear(2.0, 1e-9));
}

TEST(ClassifyCardinalityTest, Thresholds) {
  EXPECT_STREQ(ClassifyCardinality(1.0), "unique");
  EXPECT_STREQ(ClassifyCardinality(0.95), "unique");
  EXPECT_STREQ(ClassifyCardinality(0.6), "high");
  EXPECT_STREQ(ClassifyCardinality(0.2), "medium");
  EXPECT_STREQ(ClassifyCardinality(0.05), "low");
  EXPECT_STREQ(ClassifyCardinality(0.001), "constant");
}

TEST(AnalyzeColumnTest, NoSamples) {
  ColumnDigest column = AnalyzeColumn("x", "TEXT", {});
  EXPECT_EQ(column.actual_type, "UNKNOWN");
  EXPECT_EQ(column.sample_values, "(no data)");
}

TEST(AnalyzeColumnTest, AllNull) {
  ColumnDigest column = AnalyzeColumn("x", "TEXT", {SqlValue::Null(), SqlValue::Null()});
  EXPECT_EQ(column.actual_type, "NULL");
  EXPECT_EQ(column.null_pct, 1.0);
  EXPECT_EQ(column.sample_values, "(all null)");
}

TEST(AnalyzeColumnTest, IntegersWithNulls) {
  ColumnDigest column = AnalyzeColumn(
      "qty", "INTEGER", {SqlValue::Integer(5), SqlValue::Integer(-2), SqlValue::Null(), SqlValue::Integer(9)});
  EXPECT_EQ(column.actual_type, "INTEGER");
  EXPECT_EQ(column.null_pct, 0.25);
  EXPECT_EQ(column.unique_pct, 1.0);
  EXPECT_EQ(column.cardinality_class, "unique");
  ASSERT_TRUE(column.min_val.has_value());
  EXPECT_EQ(*column.min_val, -2.0);
  EXPECT_EQ(*column.max_val, 9.0);
  EXPECT_FALSE(column.avg_length.has_value());
  EXPECT_EQ(column.sample_values, "5, -2, 9");
}

TEST(AnalyzeColumnTest, DetectsContentPatterns) {
  ColumnDigest uuid = AnalyzeColumn("id", "TEXT",
                                    Texts({"0b8f6d4c-51a2-4a77-9a0e-0c0e7c2d8f11", "9d7c3f0e-1a2b-4c3d-8e9f-001122334455"}));
  EXPECT_EQ(uuid.actual_type, "UUID");
  EXPECT_EQ(uuid.content_pattern, "uuid");

  ColumnDigest email = AnalyzeColumn("contact", "TEXT", Texts({"a@example.com", "b@example.org"}));
  EXPECT_EQ(email.actual_type, "EMAIL");
  ASSERT_TRUE(email.avg_length.has_value());
  ASSERT_TRUE(email.entropy.has_value());

  ColumnDigest json = AnalyzeColumn("payload", "TEXT", Texts({R"({"a": 1})", R"({"b": [2]})", "[1, 2]"}));
  EXPECT_EQ(json.actual_type, "JSON");
  EXPECT_EQ(json.content_pattern, "json");

  ColumnDigest when = AnalyzeColumn("created_at", "TEXT", Texts({"2024-03-01T10:00:00Z", "2024-03-02 11:30:00"}));
  EXPECT_EQ(when.actual_type, "DATETIME");
  EXPECT_EQ(when.content_pattern, "datetime");

  ColumnDigest day = AnalyzeColumn("day", "TEXT", Texts({"2024-03-01", "2024-03-02"}));
  EXPECT_EQ(day.content_pattern, "date");

  ColumnDigest plain = AnalyzeColumn("note", "TEXT", Texts({"hello there", "general kenobi"}));
  EXPECT_EQ(plain.actual_type, "TEXT");
  EXPECT_FALSE(plain.content_pattern.has_value());
}

TEST(AnalyzeColumnTest, MixedTypes) {
  ColumnDigest column = AnalyzeColumn(
      "v", "", {SqlValue::Integer(1), SqlValue::Text("one"), SqlValue::Integer(2), SqlValue::Text("two")});
  EXPECT_EQ(column.actual_type, "MIXED");
}

TEST(AnalyzeColumnTest, CompactForm) {
  ColumnDigest column = AnalyzeColumn("id", "INTEGER", {SqlValue::Integer(1), SqlValue::Integer(2)},
                                      /*is_primary_key=*/true, /*is_foreign_key=*/false, /*is_indexed=*/true);
  EXPECT_EQ(column.ToCompact(), "id: INTEGER | null:0% uniq:100% [PK]");

  ColumnDigest email = AnalyzeColumn("email", "TEXT", Texts({"a@example.com", "a@example.com"}), false, true, true);
  EXPECT_EQ(email.ToCompact(), "email: EMAIL(email) | null:0% uniq:50% [FK,IDX]");
}

TEST(DigestHelpersTest, ErrorDigest) {
  SqliteDigest digest = ErrorDigest("boom");
  EXPECT_EQ(digest.verdict, "error");
  EXPECT_EQ(digest.action, "investigate");
  EXPECT_EQ(digest.flags, "error: boom");
}

TEST(DigestHelpersTest, MissingFile) {
  SqliteDigest digest = Digestor().DigestFile("/nonexistent/scratch.db");
  EXPECT_EQ(digest.verdict, "error");
  EXPECT_THAT(digest.flags, StartsWith("error: File not found"));
}

class DigestorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    auto session_or = GuardedSession::Open(":memory:");
    ASSERT_TRUE(session_or.ok()) << session_or.status().message();
    session_ = std::move(*session_or);
  }

  void Exec(const std::string& sql) {
    absl::Status status = session_->ExecuteScript(sql);
    ASSERT_TRUE(status.ok()) << status.message();
  }

  void CreateShop() {
    Exec("CREATE TABLE categories (id INTEGER PRIMARY KEY, name TEXT);"
         "INSERT INTO categories (name) VALUES ('books'), ('games'), ('music');"
         "CREATE TABLE customer (id INTEGER PRIMARY KEY, email TEXT);"
         "INSERT INTO customer (email) VALUES ('a@example.com'), ('b@example.com');"
         "CREATE TABLE orders (id INTEGER PRIMARY KEY, category_id INTEGER REFERENCES categories(id), "
         "customer_id INTEGER, amount REAL, created_at TEXT);"
         "INSERT INTO orders (category_id, customer_id, amount, created_at) VALUES "
         "(1, 1, 9.5, '2024-01-01 10:00:00'), (2, 2, 20.0, '2024-01-02 11:00:00'), "
         "(3, 1, 4.25, '2024-01-03 12:00:00');"
         "CREATE INDEX orders_by_customer ON orders(customer_id);");
  }

  std::unique_ptr<GuardedSession> session_;
};

TEST_F(DigestorTest, EmptyDatabaseIsMinimal) {
  SqliteDigest digest = Digestor().Digest(session_.get());
  EXPECT_EQ(digest.table_count, 0);
  EXPECT_EQ(digest.verdict, "minimal");
  EXPECT_EQ(digest.action, "skip");
  EXPECT_EQ(digest.schema_pattern, "empty");
  EXPECT_EQ(digest.flags, "empty");
}

TEST_F(DigestorTest, ProfilesTablesAndRelationships) {
  CreateShop();
  SqliteDigest digest = Digestor().Digest(session_.get());

  EXPECT_EQ(digest.table_count, 3);
  EXPECT_EQ(digest.index_count, 1);
  EXPECT_EQ(digest.total_rows, 8);
  EXPECT_EQ(digest.total_columns, 2 + 2 + 5);
  EXPECT_EQ(digest.explicit_fk_count, 1);
  EXPECT_EQ(digest.implicit_fk_count, 1);
  EXPECT_THAT(digest.relationships_summary, HasSubstr("orders.category_id -> categories.id"));
  EXPECT_THAT(digest.relationships_summary, HasSubstr("orders.customer_id -> customer.id (80%)"));
  EXPECT_TRUE(digest.has_lookup_tables);
  EXPECT_TRUE(digest.has_timestamps);
  EXPECT_FALSE(digest.has_soft_deletes);
  EXPECT_EQ(digest.detected_datetime_columns, 1);
  EXPECT_EQ(digest.tables_summary, "categories(2), customer(2), orders(5)");
  EXPECT_EQ(digest.largest_tables, "categories: 3, orders: 3, customer: 2");
  EXPECT_NE(digest.verdict, "error");

  ASSERT_EQ(digest.tables.size(), 3u);
  const TableDigest& orders = digest.tables[2];
  EXPECT_EQ(orders.name, "orders");
  EXPECT_EQ(orders.primary_key, "id");
  ASSERT_EQ(orders.foreign_keys.size(), 1u);
  EXPECT_EQ(orders.foreign_keys[0], "category_id -> categories.id");
  ASSERT_EQ(orders.columns.size(), 5u);
  EXPECT_TRUE(orders.columns[1].is_foreign_key);
  EXPECT_TRUE(orders.columns[2].is_indexed);
  EXPECT_EQ(orders.columns[3].actual_type, "FLOAT");
}

TEST_F(DigestorTest, RendersPromptAndJson) {
  CreateShop();
  SqliteDigest digest = Digestor().Digest(session_.get());

  EXPECT_THAT(digest.SummaryLine(), StartsWith("tables=3 rows=8 verdict="));
  std::string prompt = digest.ToPrompt();
  EXPECT_THAT(prompt, StartsWith("<sqlite_digest>\n"));
  EXPECT_TRUE(absl::EndsWith(prompt, "</sqlite_digest>"));
  EXPECT_THAT(prompt, HasSubstr("schema: 3 tables, 0 views, 1 indexes, 0 triggers"));
  EXPECT_THAT(prompt, HasSubstr("relationships: 1 explicit FK, 1 implicit"));
  EXPECT_THAT(prompt, Not(HasSubstr("a@example.com")));

  nlohmann::json j = digest.ToJson();
  EXPECT_EQ(j["table_count"], 3);
  ASSERT_EQ(j["tables"].size(), 3u);
  EXPECT_EQ(j["tables"][0]["name"], "categories");
  EXPECT_EQ(j["tables"][0]["columns"][0], "id: INTEGER | null:0% uniq:100% [PK]");
}

TEST_F(DigestorTest, SkipsEphemeralTables) {
  Exec("CREATE TABLE __kanban_cards (id TEXT, title TEXT);"
       "CREATE TABLE __tool_results (result_id TEXT);"
       "CREATE TABLE notes (body TEXT);");
  SqliteDigest digest = Digestor().Digest(session_.get());
  EXPECT_EQ(digest.table_count, 1);
  EXPECT_EQ(digest.tables_summary, "notes(1)");
}

TEST_F(DigestorTest, HonorsTableAndColumnCaps) {
  for (int i = 0; i < 4; ++i) Exec("CREATE TABLE t" + std::to_string(i) + " (a, b, c);");
  DigestOptions options;
  options.max_tables = 2;
  options.max_columns = 1;
  SqliteDigest digest = Digestor(options).Digest(session_.get());
  EXPECT_EQ(digest.table_count, 4);
  ASSERT_EQ(digest.tables.size(), 2u);
  EXPECT_EQ(digest.tables[0].column_count, 3);
  EXPECT_EQ(digest.tables[0].columns.size(), 1u);
}

TEST_F(DigestorTest, DetectsLogTables) {
  Exec("CREATE TABLE audit_log (id INTEGER PRIMARY KEY, action TEXT, created_at TEXT);"
       "INSERT INTO audit_log (action, created_at) VALUES ('login', '2024-05-01T09:00:00');");
  SqliteDigest digest = Digestor().Digest(session_.get());
  EXPECT_TRUE(digest.has_log_tables);
  EXPECT_EQ(digest.schema_pattern, "flat");
}

}  // namespace
}  // namespace scratchdb
