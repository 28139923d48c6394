#ifndef SCRATCHDB_SQL_FUNCTIONS_H_
#define SCRATCHDB_SQL_FUNCTIONS_H_

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "absl/status/status.h"

#include <sqlite3.h>

namespace scratchdb {

// Regex helpers only look at this many leading bytes of their subject. The
// standard regex engine recurses per matched character.
constexpr size_t kMaxRegexSubjectBytes = 32 * 1024;

// LPAD/RPAD refuse to build anything longer, in code points.
constexpr int64_t kMaxPadLength = 1024 * 1024;

/**
 * @brief Registers the pure text and statistics helpers on a connection.
 *
 * Every function takes strings or numbers and returns strings, booleans or
 * numbers. None of them perform I/O. An invalid regular expression makes the
 * regex helpers return NULL (or false for REGEXP) instead of raising an error;
 * a pattern the engine gives up on while matching raises a SQL error.
 */
absl::Status RegisterSafeFunctions(sqlite3* db);

// Building blocks exposed for tests. Positions and lengths count code points.
namespace text {

size_t CodePointCount(const std::string& s);
std::string Left(const std::string& s, int64_t n);
std::string Right(const std::string& s, int64_t n);
std::string Reverse(const std::string& s);
// `length` is clamped to kMaxPadLength.
std::string LeftPad(const std::string& s, int64_t length, const std::string& pad);
std::string RightPad(const std::string& s, int64_t length, const std::string& pad);
// Slice with negative indices counted from the end, end exclusive.
std::string SubstrRange(const std::string& s, int64_t start, int64_t end);
int64_t WordCount(const std::string& s);
// 1-based; out of range yields "".
std::string SplitPart(const std::string& s, const std::string& delimiter, int64_t part);
std::optional<std::string> SplitSections(const std::string& s, const std::string& delimiter);

// The regex helpers below return nullopt for a pattern that does not compile.
// They throw std::regex_error when the engine gives up during matching.
std::optional<bool> RegexpMatch(const std::string& pattern, const std::string& subject);
std::optional<std::string> RegexpExtract(const std::string& subject, const std::string& pattern, int group);
std::optional<std::string> RegexpFindAll(const std::string& subject, const std::string& pattern,
                                         const std::string& separator);
std::optional<std::string> GrepContext(const std::string& subject, const std::string& pattern, int64_t context_chars);
std::optional<std::string> GrepContextAll(const std::string& subject, const std::string& pattern,
                                          int64_t context_chars, int64_t max_matches);

}  // namespace text

}  // namespace scratchdb

#endif  // SCRATCHDB_SQL_FUNCTIONS_H_
