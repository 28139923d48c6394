#ifndef SCRATCHDB_TEXT_CLEANING_H_
#define SCRATCHDB_TEXT_CLEANING_H_

#include <optional>
#include <string>

namespace scratchdb {
namespace text {

// Drops script/style bodies and tags, decodes entities and tidies whitespace.
// Block-level tags become line breaks.
std::string HtmlToText(const std::string& html);

// Removes zero-width characters, straightens typographic quotes, dashes and
// ellipses, and collapses runs of blanks and blank lines.
std::string CleanText(const std::string& text);

/**
 * @brief Reads a number the way people write them.
 *
 * Understands currency symbols, thousands separators, European decimal commas
 * ("1.234,56", "899,00"), K/M/B/T suffixes, a leading minus and accounting
 * parentheses: "(100)" is -100.
 */
std::optional<double> ParseNumber(const std::string& text);

// Tries ISO, slash, dash and month-name layouts in a fixed order (day/month
// before month/day) and renders the first that fits with `output_format`
// (strftime syntax). Ordinal suffixes such as "5th" are accepted.
std::optional<std::string> ParseDate(const std::string& text, const std::string& output_format = "%Y-%m-%d");

// `part` is one of domain, host, path, query, scheme or port. "domain" drops
// subdomains and knows a few two-label suffixes such as co.uk.
std::optional<std::string> UrlExtract(const std::string& url, const std::string& part = "domain");

// First balanced, valid JSON object (else array) embedded in `text`.
std::optional<std::string> ExtractJson(const std::string& text);

// JSON arrays of distinct matches in order of appearance; nullopt for none.
// Emails are compared case-insensitively.
std::optional<std::string> ExtractEmails(const std::string& text);
std::optional<std::string> ExtractUrls(const std::string& text);

}  // namespace text
}  // namespace scratchdb

#endif  // SCRATCHDB_TEXT_CLEANING_H_
