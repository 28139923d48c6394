#include "scratchdb/text_cleaning.h"

#include <optional>
#include <string>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace scratchdb {
namespace {

using ::testing::DoubleNear;
using ::testing::Optional;

TEST(HtmlToTextTest, EntitiesAndBlocks) {
  EXPECT_EQ(text::HtmlToText("<div>A &amp; B</div>\n\n\n\n<li>caf&#233;</li><li>&euro;5 &bogus; &#xZZ;</li>"),
            "A & B\n\ncaf\xC3\xA9\n\xE2\x82\xAC" "5 &bogus; &#xZZ;");
  EXPECT_EQ(text::HtmlToText("x < y and y > z"), "x z");
  EXPECT_EQ(text::HtmlToText("a <> b"), "a <> b");
  EXPECT_EQ(text::HtmlToText("<script>never closed"), "never closed");
}

TEST(HtmlToTextTest, UnclosedTagsPassThrough) {
  std::string html(200000, '<');
  EXPECT_EQ(text::HtmlToText(html), html);
  std::string scripts;
  for (int i = 0; i < 20000; ++i) scripts += "<script>";
  EXPECT_EQ(text::HtmlToText(scripts), "");
}

TEST(CleanTextTest, StripsZeroWidthAndTidiesWhitespace) {
  EXPECT_EQ(text::CleanText("\xEF\xBB\xBFhello\t\t world \n  next"), "hello world\nnext");
  EXPECT_EQ(text::CleanText("   "), "");
}

TEST(ParseNumberTest, SeparatorsAndSuffixes) {
  EXPECT_THAT(text::ParseNumber("  1 234,50 "), Optional(DoubleNear(1234.5, 1e-9)));
  EXPECT_EQ(text::ParseNumber("1.234.567"), std::nullopt);
  EXPECT_THAT(text::ParseNumber("\xC2\xA3" "3.5b"), Optional(DoubleNear(3.5e9, 1)));
  EXPECT_THAT(text::ParseNumber("(1,000.25)"), Optional(DoubleNear(-1000.25, 1e-9)));
  EXPECT_EQ(text::ParseNumber("-"), std::nullopt);
}

TEST(ParseDateTest, TwoDigitYearsAndTimes) {
  EXPECT_EQ(text::ParseDate("12/25/68"), "2068-12-25");
  EXPECT_EQ(text::ParseDate("12/25/69"), "1969-12-25");
  EXPECT_EQ(text::ParseDate("2024-03-01T08:05:09Z", "%H:%M:%S"), "08:05:09");
  EXPECT_EQ(text::ParseDate("2024-13-01"), std::nullopt);
  EXPECT_EQ(text::ParseDate("2023-02-29"), std::nullopt);
  EXPECT_EQ(text::ParseDate("2024-02-29"), "2024-02-29");
}

TEST(UrlExtractTest, PartsWithoutScheme) {
  EXPECT_EQ(text::UrlExtract("example.com/path", "host"), std::nullopt);
  EXPECT_EQ(text::UrlExtract("example.com/path", "path"), "example.com/path");
  EXPECT_EQ(text::UrlExtract("http://host:/x", "port"), "");
  EXPECT_EQ(text::UrlExtract("https://shop.example.com.au/", "domain"), "example.com.au");
}

TEST(ExtractorsTest, EmailsNeedADottedDomain) {
  EXPECT_EQ(text::ExtractEmails("root@localhost and x@y.z"), std::nullopt);
  EXPECT_EQ(text::ExtractEmails("a@b.io@c.org"), R"(["a@b.io"])");
}

TEST(ExtractorsTest, UrlsStopAtBracketsAndQuotes) {
  EXPECT_EQ(text::ExtractUrls("<a href=\"https://x.org/p\">[https://y.org]</a>"),
            R"(["https://x.org/p","https://y.org"])");
  EXPECT_EQ(text::ExtractUrls("https://"), std::nullopt);
}

TEST(ExtractorsTest, JsonSkipsBracesInsideStrings) {
  EXPECT_EQ(text::ExtractJson(R"(x {"k": "a \" { b"} y)"), R"({"k": "a \" { b"})");
  EXPECT_EQ(text::ExtractJson("nothing"), std::nullopt);
}

}  // namespace
}  // namespace scratchdb
