#include "scratchdb/csv_reader.h"

#include <string>
#include <vector>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace scratchdb {
namespace {

using ::testing::ElementsAre;

TEST(CsvReaderTest, NormalizeHandlesBomLineEndingsAndSepLine) {
  NormalizedCsv plain = NormalizeCsvText("\xEF\xBB\xBF" "a,b\r\n1,2\r3,4");
  EXPECT_EQ(plain.text, "a,b\n1,2\n3,4");
  EXPECT_FALSE(plain.explicit_delimiter.has_value());

  NormalizedCsv excel = NormalizeCsvText("sep=;\na;b\n1;2");
  EXPECT_EQ(excel.text, "a;b\n1;2");
  EXPECT_EQ(excel.explicit_delimiter, ';');

  NormalizedCsv tab = NormalizeCsvText("SEP=\\t\na\tb");
  EXPECT_EQ(tab.explicit_delimiter, '\t');
  EXPECT_EQ(tab.text, "a\tb");
}

TEST(CsvReaderTest, DetectsMostConsistentDelimiter) {
  auto pipes = DetectCsvDialect("id|name|note\n1|x|a,b\n2|y|c");
  ASSERT_TRUE(pipes.has_value());
  EXPECT_EQ(pipes->delimiter, '|');

  auto tabs = DetectCsvDialect("a\tb\n1\t2\n3\t4");
  ASSERT_TRUE(tabs.has_value());
  EXPECT_EQ(tabs->delimiter, '\t');

  auto spaced = DetectCsvDialect("a, b\n1, 2");
  ASSERT_TRUE(spaced.has_value());
  EXPECT_TRUE(spaced->skip_initial_space);

  EXPECT_FALSE(DetectCsvDialect("just one line of prose").has_value());
}

TEST(CsvReaderTest, QuotedFieldsSpanDelimitersAndNewlines) {
  CsvDialect dialect;
  auto rows = ReadCsvRows("a,\"b,c\",\"line1\nline2\"\n\"x\"\"y\",,z", dialect, 10);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_THAT(rows[0], ElementsAre("a", "b,c", "line1\nline2"));
  EXPECT_THAT(rows[1], ElementsAre("x\"y", "", "z"));
}

TEST(CsvReaderTest, ReadStopsAtRowLimit) {
  CsvDialect dialect;
  auto rows = ReadCsvRows("1\n2\n3\n4\n", dialect, 2);
  ASSERT_EQ(rows.size(), 2u);
  EXPECT_THAT(rows[1], ElementsAre("2"));
}

TEST(CsvReaderTest, DedupeHeaders) {
  EXPECT_THAT(DedupeCsvHeaders({" id ", "", "id", "id"}), ElementsAre("id", "col_1", "id_2", "id_3"));
}

TEST(CsvReaderTest, ParseWidensShortHeaders) {
  EXPECT_EQ(text::CsvParse("a,b\n1,2,3\n4,5,6\n", true),
            R"([{"a":"1","b":"2","col_2":"3"},{"a":"4","b":"5","col_2":"6"}])");
  EXPECT_EQ(text::CsvParse("a,b\n\n1,2\n , \n", true), R"([{"a":"1","b":"2"}])");
  EXPECT_EQ(text::CsvParse("a,b\n", true), "[]");
}

TEST(CsvReaderTest, ColumnSkipsShortRows) {
  EXPECT_EQ(text::CsvColumn("a,b\n1,2\n3\n5,6", 1, true), R"(["2","6"])");
  EXPECT_EQ(text::CsvColumn("   ", 0, true), "[]");
  EXPECT_EQ(text::CsvHeaders(""), "[]");
}

}  // namespace
}  // namespace scratchdb
