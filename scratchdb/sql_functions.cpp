#include "scratchdb/sql_functions.h"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <regex>

#include "absl/container/flat_hash_set.h"
#include "absl/log/log.h"
#include "absl/strings/ascii.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "absl/strings/strip.h"
#include "absl/time/clock.h"
#include "absl/time/time.h"

#include "nlohmann/json.hpp"

#include "scratchdb/csv_reader.h"
#include "scratchdb/statement.h"
#include "scratchdb/text_cleaning.h"

namespace scratchdb {

namespace text {

namespace {

bool IsContinuation(unsigned char c) { return (c & 0xC0) == 0x80; }

// Byte offset of every code point start, plus s.size() as a sentinel.
std::vector<size_t> CodePointOffsets(const std::string& s) {
  std::vector<size_t> offsets;
  offsets.reserve(s.size() + 1);
  for (size_t i = 0; i < s.size(); ++i) {
    if (!IsContinuation(static_cast<unsigned char>(s[i]))) offsets.push_back(i);
  }
  offsets.push_back(s.size());
  return offsets;
}

size_t MoveBack(const std::string& s, size_t pos, int64_t count) {
  while (pos > 0 && count > 0) {
    --pos;
    while (pos > 0 && IsContinuation(static_cast<unsigned char>(s[pos]))) --pos;
    --count;
  }
  return pos;
}

size_t MoveForward(const std::string& s, size_t pos, int64_t count) {
  while (pos < s.size() && count > 0) {
    ++pos;
    while (pos < s.size() && IsContinuation(static_cast<unsigned char>(s[pos]))) ++pos;
    --count;
  }
  return pos;
}

std::string CapSubject(const std::string& s) {
  if (s.size() <= kMaxRegexSubjectBytes) return s;
  size_t cut = kMaxRegexSubjectBytes;
  while (cut > 0 && IsContinuation(static_cast<unsigned char>(s[cut]))) --cut;
  return s.substr(0, cut);
}

std::optional<std::regex> Compile(const std::string& pattern, bool ignore_case = false) {
  auto flags = std::regex::ECMAScript;
  if (ignore_case) flags |= std::regex::icase;
  try {
    return std::regex(pattern, flags);
  } catch (const std::regex_error& e) {
    VLOG(1) << "Invalid pattern '" << pattern << "': " << e.what();
    return std::nullopt;
  }
}

std::string Snippet(const std::string& subject, size_t match_begin, size_t match_end, int64_t context_chars,
                    bool flatten_newlines) {
  size_t start = MoveBack(subject, match_begin, context_chars);
  size_t end = MoveForward(subject, match_end, context_chars);
  std::string snippet = subject.substr(start, end - start);
  if (flatten_newlines) {
    for (char& c : snippet) {
      if (c == '\n') c = ' ';
    }
  }
  return absl::StrCat(start > 0 ? "..." : "", snippet, end < subject.size() ? "..." : "");
}

}  // namespace

size_t CodePointCount(const std::string& s) { return CodePointOffsets(s).size() - 1; }

std::string Left(const std::string& s, int64_t n) {
  if (n <= 0) return "";
  return s.substr(0, MoveForward(s, 0, n));
}

std::string Right(const std::string& s, int64_t n) {
  if (n <= 0) return "";
  return s.substr(MoveBack(s, s.size(), n));
}

std::string Reverse(const std::string& s) {
  std::vector<size_t> offsets = CodePointOffsets(s);
  std::string out;
  out.reserve(s.size());
  for (size_t i = offsets.size() - 1; i > 0; --i) {
    out.append(s, offsets[i - 1], offsets[i] - offsets[i - 1]);
  }
  return out;
}

namespace {

// Exactly `count` code points of `pad` repeated, built in one pass.
std::string RepeatToLength(const std::string& pad, int64_t count) {
  int64_t pad_chars = static_cast<int64_t>(CodePointCount(pad));
  if (pad_chars == 0 || count <= 0) return "";
  int64_t repeats = count / pad_chars + 1;
  std::string fill;
  fill.reserve(pad.size() * static_cast<size_t>(repeats));
  for (int64_t i = 0; i < repeats; ++i) fill += pad;
  return Left(fill, count);
}

}  // namespace

std::string LeftPad(const std::string& s, int64_t length, const std::string& pad) {
  length = std::min(length, kMaxPadLength);
  int64_t have = static_cast<int64_t>(CodePointCount(s));
  if (pad.empty() || have >= length) return s;
  return RepeatToLength(pad, length - have) + s;
}

std::string RightPad(const std::string& s, int64_t length, const std::string& pad) {
  length = std::min(length, kMaxPadLength);
  int64_t have = static_cast<int64_t>(CodePointCount(s));
  if (pad.empty() || have >= length) return s;
  return s + RepeatToLength(pad, length - have);
}

std::string SubstrRange(const std::string& s, int64_t start, int64_t end) {
  std::vector<size_t> offsets = CodePointOffsets(s);
  int64_t count = static_cast<int64_t>(offsets.size()) - 1;
  auto clamp = [count](int64_t i) {
    if (i < 0) i += count;
    if (i < 0) return int64_t{0};
    return i > count ? count : i;
  };
  start = clamp(start);
  end = clamp(end);
  if (end <= start) return "";
  return s.substr(offsets[start], offsets[end] - offsets[start]);
}

int64_t WordCount(const std::string& s) {
  std::vector<absl::string_view> words = absl::StrSplit(s, absl::ByAnyChar(" \t\n\r\f\v"), absl::SkipEmpty());
  return static_cast<int64_t>(words.size());
}

std::string SplitPart(const std::string& s, const std::string& delimiter, int64_t part) {
  if (delimiter.empty()) return part == 1 ? s : "";
  std::vector<std::string> parts = absl::StrSplit(s, delimiter);
  if (part < 1 || part > static_cast<int64_t>(parts.size())) return "";
  return parts[part - 1];
}

std::optional<std::string> SplitSections(const std::string& s, const std::string& delimiter) {
  if (delimiter.empty()) return std::nullopt;
  nlohmann::json sections = nlohmann::json::array();
  for (absl::string_view section : absl::StrSplit(s, delimiter)) {
    absl::string_view trimmed = absl::StripAsciiWhitespace(section);
    if (!trimmed.empty()) sections.push_back(std::string(trimmed));
  }
  if (sections.empty()) return std::nullopt;
  return sections.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<bool> RegexpMatch(const std::string& pattern, const std::string& subject) {
  auto re = Compile(pattern);
  if (!re) return std::nullopt;
  return std::regex_search(CapSubject(subject), *re);
}

std::optional<std::string> RegexpExtract(const std::string& subject, const std::string& pattern, int group) {
  auto re = Compile(pattern);
  if (!re || group < 0 || static_cast<size_t>(group) > re->mark_count()) return std::nullopt;
  std::string capped = CapSubject(subject);
  std::smatch match;
  if (!std::regex_search(capped, match, *re)) return std::nullopt;
  if (!match[group].matched) return std::nullopt;
  return match[group].str();
}

std::optional<std::string> RegexpFindAll(const std::string& subject, const std::string& pattern,
                                         const std::string& separator) {
  constexpr size_t kMaxMatches = 20;
  auto re = Compile(pattern);
  if (!re) return std::nullopt;
  // A single capture group reports the group, otherwise the whole match.
  int group = re->mark_count() == 1 ? 1 : 0;
  std::string capped = CapSubject(subject);
  std::vector<std::string> unique;
  absl::flat_hash_set<std::string> seen;
  for (auto it = std::sregex_iterator(capped.begin(), capped.end(), *re); it != std::sregex_iterator(); ++it) {
    std::string value = (*it)[group].str();
    if (seen.insert(value).second) {
      unique.push_back(std::move(value));
      if (unique.size() >= kMaxMatches) break;
    }
  }
  if (unique.empty()) return std::nullopt;
  return absl::StrJoin(unique, separator);
}

std::optional<std::string> GrepContext(const std::string& subject, const std::string& pattern,
                                       int64_t context_chars) {
  auto re = Compile(pattern, /*ignore_case=*/true);
  if (!re) return std::nullopt;
  std::string capped = CapSubject(subject);
  std::smatch match;
  if (!std::regex_search(capped, match, *re)) return std::nullopt;
  size_t begin = static_cast<size_t>(match.position(0));
  return Snippet(capped, begin, begin + match.length(0), std::max<int64_t>(context_chars, 0), false);
}

std::optional<std::string> GrepContextAll(const std::string& subject, const std::string& pattern,
                                          int64_t context_chars, int64_t max_matches) {
  auto re = Compile(pattern);
  if (!re) return std::nullopt;
  std::string capped = CapSubject(subject);
  nlohmann::json results = nlohmann::json::array();
  int64_t seen = 0;
  for (auto it = std::sregex_iterator(capped.begin(), capped.end(), *re); it != std::sregex_iterator(); ++it) {
    if (seen++ >= max_matches) break;
    size_t begin = static_cast<size_t>(it->position(0));
    results.push_back(Snippet(capped, begin, begin + it->length(0), std::max<int64_t>(context_chars, 0), true));
  }
  if (results.empty()) return std::nullopt;
  return results.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

}  // namespace text

namespace {

std::optional<std::string> TextArg(sqlite3_value* value) {
  if (sqlite3_value_type(value) == SQLITE_NULL) return std::nullopt;
  const unsigned char* raw = sqlite3_value_text(value);
  if (raw == nullptr) return std::string();
  return std::string(reinterpret_cast<const char*>(raw), sqlite3_value_bytes(value));
}

std::optional<double> NumberArg(sqlite3_value* value) {
  switch (sqlite3_value_type(value)) {
    case SQLITE_INTEGER:
      return static_cast<double>(sqlite3_value_int64(value));
    case SQLITE_FLOAT:
      return sqlite3_value_double(value);
    case SQLITE_TEXT: {
      double parsed = 0;
      auto text = TextArg(value);
      if (text && absl::SimpleAtod(*text, &parsed)) return parsed;
      return std::nullopt;
    }
    default:
      return std::nullopt;
  }
}

void ResultText(sqlite3_context* ctx, const std::optional<std::string>& out) {
  if (!out) {
    sqlite3_result_null(ctx);
    return;
  }
  sqlite3_result_text(ctx, out->data(), static_cast<int>(out->size()), SQLITE_TRANSIENT);
}

// Exceptions must not cross back into the engine.
template <typename Body>
void GuardRegex(sqlite3_context* ctx, const char* name, Body body) {
  try {
    body();
  } catch (const std::regex_error& e) {
    std::string message = absl::StrCat(name, ": pattern is too complex to evaluate (", e.what(), ")");
    sqlite3_result_error(ctx, message.c_str(), static_cast<int>(message.size()));
  }
}

void RegexpFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto pattern = TextArg(argv[0]);
  auto subject = TextArg(argv[1]);
  GuardRegex(ctx, "REGEXP", [&] {
    bool matched = false;
    if (pattern && subject) matched = text::RegexpMatch(*pattern, *subject).value_or(false);
    sqlite3_result_int(ctx, matched ? 1 : 0);
  });
}

void RegexpExtractFn(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  auto pattern = TextArg(argv[1]);
  if (!subject || !pattern) return sqlite3_result_null(ctx);
  int group = argc > 2 ? sqlite3_value_int(argv[2]) : 0;
  GuardRegex(ctx, "regexp_extract", [&] { ResultText(ctx, text::RegexpExtract(*subject, *pattern, group)); });
}

void RegexpFindAllFn(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  auto pattern = TextArg(argv[1]);
  if (!subject || !pattern) return sqlite3_result_null(ctx);
  std::string separator = argc > 2 ? TextArg(argv[2]).value_or("|") : "|";
  GuardRegex(ctx, "regexp_find_all", [&] { ResultText(ctx, text::RegexpFindAll(*subject, *pattern, separator)); });
}

void GrepContextFn(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  auto pattern = TextArg(argv[1]);
  if (!subject || !pattern) return sqlite3_result_null(ctx);
  int64_t context_chars = argc > 2 ? sqlite3_value_int64(argv[2]) : 100;
  GuardRegex(ctx, "grep_context", [&] { ResultText(ctx, text::GrepContext(*subject, *pattern, context_chars)); });
}

void GrepContextAllFn(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  auto pattern = TextArg(argv[1]);
  if (!subject || !pattern) return sqlite3_result_null(ctx);
  int64_t context_chars = argc > 2 ? sqlite3_value_int64(argv[2]) : 50;
  int64_t max_matches = argc > 3 ? sqlite3_value_int64(argv[3]) : 10;
  GuardRegex(ctx, "grep_context_all", [&] {
    ResultText(ctx, text::GrepContextAll(*subject, *pattern, context_chars, max_matches));
  });
}

void SplitSectionsFn(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  if (!subject) return sqlite3_result_null(ctx);
  std::string delimiter = argc > 1 ? TextArg(argv[1]).value_or("\n\n") : "\n\n";
  ResultText(ctx, text::SplitSections(*subject, delimiter));
}

void SubstrRangeFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  if (!subject) return sqlite3_result_null(ctx);
  ResultText(ctx, text::SubstrRange(*subject, sqlite3_value_int64(argv[1]), sqlite3_value_int64(argv[2])));
}

void WordCountFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  sqlite3_result_int64(ctx, subject ? text::WordCount(*subject) : 0);
}

void CharCountFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  sqlite3_result_int64(ctx, subject ? static_cast<int64_t>(text::CodePointCount(*subject)) : 0);
}

void JsonLengthFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  if (!subject) return sqlite3_result_null(ctx);
  auto parsed = nlohmann::json::parse(*subject, nullptr, false);
  if (parsed.is_discarded() || !(parsed.is_array() || parsed.is_object())) return sqlite3_result_null(ctx);
  sqlite3_result_int64(ctx, static_cast<int64_t>(parsed.size()));
}

void NowFn(sqlite3_context* ctx, int, sqlite3_value**) {
  ResultText(ctx, absl::FormatTime("%Y-%m-%d %H:%M:%S", absl::Now(), absl::UTCTimeZone()));
}

void CurDateFn(sqlite3_context* ctx, int, sqlite3_value**) {
  ResultText(ctx, absl::FormatTime("%Y-%m-%d", absl::Now(), absl::UTCTimeZone()));
}

void LenFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  if (!subject) return sqlite3_result_null(ctx);
  sqlite3_result_int64(ctx, static_cast<int64_t>(text::CodePointCount(*subject)));
}

void NvlFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  sqlite3_result_value(ctx, sqlite3_value_type(argv[0]) != SQLITE_NULL ? argv[0] : argv[1]);
}

void LeftFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  if (!subject) return sqlite3_result_null(ctx);
  ResultText(ctx, text::Left(*subject, sqlite3_value_int64(argv[1])));
}

void RightFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  if (!subject) return sqlite3_result_null(ctx);
  ResultText(ctx, text::Right(*subject, sqlite3_value_int64(argv[1])));
}

void ReverseFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  if (!subject) return sqlite3_result_null(ctx);
  ResultText(ctx, text::Reverse(*subject));
}

void Pad(sqlite3_context* ctx, int argc, sqlite3_value** argv, bool left) {
  auto subject = TextArg(argv[0]);
  if (!subject) return sqlite3_result_null(ctx);
  int64_t length = sqlite3_value_int64(argv[1]);
  if (length > kMaxPadLength) {
    std::string message = absl::StrCat(left ? "LPAD" : "RPAD", ": length ", length, " exceeds ", kMaxPadLength);
    return sqlite3_result_error(ctx, message.c_str(), static_cast<int>(message.size()));
  }
  std::string pad = argc > 2 ? TextArg(argv[2]).value_or(" ") : " ";
  ResultText(ctx, left ? text::LeftPad(*subject, length, pad) : text::RightPad(*subject, length, pad));
}

void LpadFn(sqlite3_context* ctx, int argc, sqlite3_value** argv) { Pad(ctx, argc, argv, /*left=*/true); }

void RpadFn(sqlite3_context* ctx, int argc, sqlite3_value** argv) { Pad(ctx, argc, argv, /*left=*/false); }

void SplitPartFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  if (!subject) return sqlite3_result_null(ctx);
  ResultText(ctx, text::SplitPart(*subject, TextArg(argv[1]).value_or(""), sqlite3_value_int64(argv[2])));
}

// 0/false/no and 1/true/yes; other text parses as an integer. NULL means yes.
bool HeaderFlag(sqlite3_value* value) {
  switch (sqlite3_value_type(value)) {
    case SQLITE_NULL:
      return true;
    case SQLITE_INTEGER:
    case SQLITE_FLOAT:
      return sqlite3_value_int64(value) != 0;
    default: {
      std::string flag = absl::AsciiStrToLower(absl::StripAsciiWhitespace(TextArg(value).value_or("")));
      if (flag == "0" || flag == "false" || flag == "no") return false;
      if (flag == "1" || flag == "true" || flag == "yes") return true;
      int64_t parsed = 0;
      return absl::SimpleAtoi(flag, &parsed) ? parsed != 0 : true;
    }
  }
}

void CsvParseFn(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  auto csv = TextArg(argv[0]);
  if (!csv) return sqlite3_result_null(ctx);
  ResultText(ctx, text::CsvParse(*csv, argc > 1 ? HeaderFlag(argv[1]) : true));
}

void CsvColumnFn(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  auto csv = TextArg(argv[0]);
  if (!csv || sqlite3_value_type(argv[1]) == SQLITE_NULL) return sqlite3_result_null(ctx);
  ResultText(ctx, text::CsvColumn(*csv, sqlite3_value_int64(argv[1]), argc > 2 ? HeaderFlag(argv[2]) : true));
}

void CsvHeadersFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto csv = TextArg(argv[0]);
  if (!csv) return sqlite3_result_null(ctx);
  ResultText(ctx, text::CsvHeaders(*csv));
}

void HtmlToTextFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto html = TextArg(argv[0]);
  if (!html) return sqlite3_result_null(ctx);
  ResultText(ctx, text::HtmlToText(*html));
}

void CleanTextFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  if (!subject) return sqlite3_result_null(ctx);
  ResultText(ctx, text::CleanText(*subject));
}

void ParseNumberFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  std::optional<double> value = subject ? text::ParseNumber(*subject) : std::nullopt;
  if (!value) return sqlite3_result_null(ctx);
  sqlite3_result_double(ctx, *value);
}

void ParseDateFn(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  if (!subject) return sqlite3_result_null(ctx);
  std::string format = argc > 1 ? TextArg(argv[1]).value_or("%Y-%m-%d") : "%Y-%m-%d";
  ResultText(ctx, text::ParseDate(*subject, format));
}

void UrlExtractFn(sqlite3_context* ctx, int argc, sqlite3_value** argv) {
  auto url = TextArg(argv[0]);
  if (!url) return sqlite3_result_null(ctx);
  std::string part = argc > 1 ? TextArg(argv[1]).value_or("domain") : "domain";
  ResultText(ctx, text::UrlExtract(*url, part));
}

void ExtractJsonFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  ResultText(ctx, subject ? text::ExtractJson(*subject) : std::nullopt);
}

void ExtractEmailsFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  ResultText(ctx, subject ? text::ExtractEmails(*subject) : std::nullopt);
}

void ExtractUrlsFn(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto subject = TextArg(argv[0]);
  ResultText(ctx, subject ? text::ExtractUrls(*subject) : std::nullopt);
}

// Welford accumulator shared by the variance family.
struct MomentState {
  int64_t count;
  double mean;
  double m2;
};

void MomentStep(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto* state = static_cast<MomentState*>(sqlite3_aggregate_context(ctx, sizeof(MomentState)));
  if (state == nullptr) return sqlite3_result_error_nomem(ctx);
  auto x = NumberArg(argv[0]);
  if (!x || !std::isfinite(*x)) return;
  state->count += 1;
  double delta = *x - state->mean;
  state->mean += delta / state->count;
  state->m2 += delta * (*x - state->mean);
}

// kind: 0 sample variance, 1 population variance, 2 sample stddev, 3 population stddev.
void MomentFinal(sqlite3_context* ctx) {
  auto* state = static_cast<MomentState*>(sqlite3_aggregate_context(ctx, 0));
  int kind = static_cast<int>(reinterpret_cast<intptr_t>(sqlite3_user_data(ctx)));
  bool sample = kind == 0 || kind == 2;
  int64_t min_count = sample ? 2 : 1;
  if (state == nullptr || state->count < min_count) return sqlite3_result_null(ctx);
  double variance = state->m2 / (sample ? state->count - 1 : state->count);
  sqlite3_result_double(ctx, kind >= 2 ? std::sqrt(variance) : variance);
}

struct CorrState {
  int64_t count;
  double mean_x;
  double mean_y;
  double cov;
  double m2_x;
  double m2_y;
};

void CorrStep(sqlite3_context* ctx, int, sqlite3_value** argv) {
  auto* state = static_cast<CorrState*>(sqlite3_aggregate_context(ctx, sizeof(CorrState)));
  if (state == nullptr) return sqlite3_result_error_nomem(ctx);
  auto x = NumberArg(argv[0]);
  auto y = NumberArg(argv[1]);
  if (!x || !y || !std::isfinite(*x) || !std::isfinite(*y)) return;
  state->count += 1;
  double dx = *x - state->mean_x;
  state->mean_x += dx / state->count;
  double dy = *y - state->mean_y;
  state->mean_y += dy / state->count;
  state->cov += dx * (*y - state->mean_y);
  state->m2_x += dx * (*x - state->mean_x);
  state->m2_y += dy * (*y - state->mean_y);
}

void CorrFinal(sqlite3_context* ctx) {
  auto* state = static_cast<CorrState*>(sqlite3_aggregate_context(ctx, 0));
  if (state == nullptr || state->count < 2) return sqlite3_result_null(ctx);
  double denom = state->m2_x * state->m2_y;
  if (denom <= 0.0) return sqlite3_result_null(ctx);
  sqlite3_result_double(ctx, state->cov / std::sqrt(denom));
}

using ScalarFn = void (*)(sqlite3_context*, int, sqlite3_value**);

struct ScalarDef {
  const char* name;
  int argc;
  ScalarFn fn;
  bool deterministic;
};

}  // namespace

absl::Status RegisterSafeFunctions(sqlite3* db) {
  static const ScalarDef kScalars[] = {
      {"REGEXP", 2, RegexpFn, true},
      {"regexp_extract", 2, RegexpExtractFn, true},
      {"regexp_extract", 3, RegexpExtractFn, true},
      {"regexp_find_all", 2, RegexpFindAllFn, true},
      {"regexp_find_all", 3, RegexpFindAllFn, true},
      {"grep_context", 2, GrepContextFn, true},
      {"grep_context", 3, GrepContextFn, true},
      {"grep_context_all", 2, GrepContextAllFn, true},
      {"grep_context_all", 3, GrepContextAllFn, true},
      {"grep_context_all", 4, GrepContextAllFn, true},
      {"split_sections", 1, SplitSectionsFn, true},
      {"split_sections", 2, SplitSectionsFn, true},
      {"substr_range", 3, SubstrRangeFn, true},
      {"word_count", 1, WordCountFn, true},
      {"char_count", 1, CharCountFn, true},
      {"json_length", 1, JsonLengthFn, true},
      {"csv_parse", 1, CsvParseFn, true},
      {"csv_parse", 2, CsvParseFn, true},
      {"csv_column", 2, CsvColumnFn, true},
      {"csv_column", 3, CsvColumnFn, true},
      {"csv_headers", 1, CsvHeadersFn, true},
      {"html_to_text", 1, HtmlToTextFn, true},
      {"clean_text", 1, CleanTextFn, true},
      {"parse_number", 1, ParseNumberFn, true},
      {"parse_date", 1, ParseDateFn, true},
      {"parse_date", 2, ParseDateFn, true},
      {"url_extract", 1, UrlExtractFn, true},
      {"url_extract", 2, UrlExtractFn, true},
      {"extract_json", 1, ExtractJsonFn, true},
      {"extract_emails", 1, ExtractEmailsFn, true},
      {"extract_urls", 1, ExtractUrlsFn, true},
      // Dialect aliases agents reach for out of habit.
      {"NOW", 0, NowFn, false},
      {"GETDATE", 0, NowFn, false},
      {"CURDATE", 0, CurDateFn, false},
      {"LEN", 1, LenFn, true},
      {"NVL", 2, NvlFn, true},
      {"LEFT", 2, LeftFn, true},
      {"RIGHT", 2, RightFn, true},
      {"REVERSE", 1, ReverseFn, true},
      {"LPAD", 2, LpadFn, true},
      {"LPAD", 3, LpadFn, true},
      {"RPAD", 2, RpadFn, true},
      {"RPAD", 3, RpadFn, true},
      {"SPLIT_PART", 3, SplitPartFn, true},
  };
  for (const auto& def : kScalars) {
    int flags = SQLITE_UTF8 | (def.deterministic ? SQLITE_DETERMINISTIC : 0);
    int rc = sqlite3_create_function_v2(db, def.name, def.argc, flags, nullptr, def.fn, nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) return SqliteStatus(db, rc, absl::StrCat("register ", def.name));
  }

  struct AggregateDef {
    const char* name;
    intptr_t kind;
  };
  static const AggregateDef kMoments[] = {
      {"VARIANCE", 0}, {"VAR_SAMP", 0}, {"VAR_POP", 1},    {"STDDEV", 2},
      {"STDEV", 2},    {"STDDEV_SAMP", 2}, {"STDDEV_POP", 3},
  };
  for (const auto& def : kMoments) {
    int rc = sqlite3_create_function_v2(db, def.name, 1, SQLITE_UTF8 | SQLITE_DETERMINISTIC,
                                        reinterpret_cast<void*>(def.kind), nullptr, MomentStep, MomentFinal, nullptr);
    if (rc != SQLITE_OK) return SqliteStatus(db, rc, absl::StrCat("register ", def.name));
  }
  int rc = sqlite3_create_function_v2(db, "CORR", 2, SQLITE_UTF8 | SQLITE_DETERMINISTIC, nullptr, nullptr, CorrStep,
                                      CorrFinal, nullptr);
  if (rc != SQLITE_OK) return SqliteStatus(db, rc, "register CORR");
  return absl::OkStatus();
}

}  // namespace scratchdb
