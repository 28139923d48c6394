#include "scratchdb/text_cleaning.h"

#include <cstdint>
#include <vector>

#include "absl/container/flat_hash_map.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_replace.h"
#include "absl/strings/str_split.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"
#include "absl/time/civil_time.h"
#include "absl/time/time.h"

#include "nlohmann/json.hpp"

namespace scratchdb {
namespace text {

namespace {

std::string DumpArray(const std::vector<std::string>& values) {
  return nlohmann::json(values).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void AppendUtf8(uint32_t cp, std::string* out) {
  if (cp == 0 || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF)) cp = 0xFFFD;
  if (cp < 0x80) {
    out->push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else if (cp < 0x10000) {
    out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

const absl::flat_hash_map<std::string, uint32_t>& NamedEntities() {
  static const auto* const kEntities = new absl::flat_hash_map<std::string, uint32_t>({
      {"amp", '&'},      {"lt", '<'},       {"gt", '>'},       {"quot", '"'},     {"apos", '\''},
      {"nbsp", 0xA0},    {"copy", 0xA9},    {"reg", 0xAE},     {"trade", 0x2122}, {"hellip", 0x2026},
      {"mdash", 0x2014}, {"ndash", 0x2013}, {"lsquo", 0x2018}, {"rsquo", 0x2019}, {"ldquo", 0x201C},
      {"rdquo", 0x201D}, {"laquo", 0xAB},   {"raquo", 0xBB},   {"middot", 0xB7},  {"bull", 0x2022},
      {"euro", 0x20AC},  {"pound", 0xA3},   {"yen", 0xA5},     {"cent", 0xA2},    {"deg", 0xB0},
      {"times", 0xD7},   {"divide", 0xF7},  {"sect", 0xA7},    {"para", 0xB6},    {"shy", 0xAD},
  });
  return *kEntities;
}

// Decodes &name; &#NNN; and &#xHH; references; anything else stays verbatim.
std::string DecodeEntities(absl::string_view text) {
  constexpr size_t kMaxEntityLength = 10;
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    if (text[i] != '&') {
      out.push_back(text[i++]);
      continue;
    }
    size_t semi = text.find(';', i + 1);
    if (semi == absl::string_view::npos || semi - i - 1 > kMaxEntityLength || semi == i + 1) {
      out.push_back(text[i++]);
      continue;
    }
    absl::string_view body = text.substr(i + 1, semi - i - 1);
    bool decoded = false;
    if (body[0] == '#') {
      absl::string_view digits = body.substr(1);
      uint32_t cp = 0;
      bool hex = !digits.empty() && (digits[0] == 'x' || digits[0] == 'X');
      if (hex) digits.remove_prefix(1);
      decoded = !digits.empty() && (hex ? absl::SimpleHexAtoi(digits, &cp) : absl::SimpleAtoi(digits, &cp));
      if (decoded) AppendUtf8(cp, &out);
    } else {
      auto it = NamedEntities().find(std::string(body));
      if (it != NamedEntities().end()) {
        AppendUtf8(it->second, &out);
        decoded = true;
      }
    }
    if (!decoded) {
      out.push_back(text[i++]);
      continue;
    }
    i = semi + 1;
  }
  return out;
}

// Blank runs become one space, blanks touching a newline go, three or more
// newlines become two, and the ends are trimmed.
std::string TidyWhitespace(absl::string_view text) {
  std::string out;
  out.reserve(text.size());
  bool pending_space = false;
  int newlines = 0;
  for (char c : text) {
    if (c == ' ' || c == '\t') {
      pending_space = true;
      continue;
    }
    if (c == '\n') {
      pending_space = false;
      if (++newlines <= 2) out.push_back('\n');
      continue;
    }
    if (pending_space && newlines == 0) out.push_back(' ');
    pending_space = false;
    newlines = 0;
    out.push_back(c);
  }
  return std::string(absl::StripAsciiWhitespace(out));
}

std::string TagName(absl::string_view tag) {
  size_t end = 0;
  while (end < tag.size() && absl::ascii_isalnum(static_cast<unsigned char>(tag[end]))) ++end;
  return absl::AsciiStrToLower(tag.substr(0, end));
}

bool IsBlockTag(const std::string& name) {
  static const auto* const kBlockTags = new absl::flat_hash_set<std::string>(
      {"p", "div", "br", "hr", "li", "tr", "h1", "h2", "h3", "h4", "h5", "h6"});
  return kBlockTags->contains(name);
}

// Case-insensitive literal matcher for date layouts; whitespace in the layout
// matches one or more blanks.
struct DateFields {
  int year = 1900;
  int month = 1;
  int day = 1;
  int hour = 0;
  int minute = 0;
  int second = 0;
};

constexpr const char* kMonthNames[] = {"january", "february", "march",     "april",   "may",      "june",
                                       "july",    "august",   "september", "october", "november", "december"};

bool ReadDigits(absl::string_view* in, size_t min_digits, size_t max_digits, int* value) {
  size_t n = 0;
  while (n < in->size() && n < max_digits && absl::ascii_isdigit(static_cast<unsigned char>((*in)[n]))) ++n;
  if (n < min_digits) return false;
  if (!absl::SimpleAtoi(in->substr(0, n), value)) return false;
  in->remove_prefix(n);
  return true;
}

bool ReadMonthName(absl::string_view* in, bool full, int* month) {
  for (int i = 0; i < 12; ++i) {
    absl::string_view name = kMonthNames[i];
    if (!full) name = name.substr(0, 3);
    if (in->size() >= name.size() && absl::EqualsIgnoreCase(in->substr(0, name.size()), name)) {
      in->remove_prefix(name.size());
      *month = i + 1;
      return true;
    }
  }
  return false;
}

bool MatchDateLayout(absl::string_view in, absl::string_view layout, DateFields* out) {
  DateFields fields;
  for (size_t i = 0; i < layout.size(); ++i) {
    char c = layout[i];
    if (c == ' ') {
      size_t blanks = 0;
      while (blanks < in.size() && absl::ascii_isspace(static_cast<unsigned char>(in[blanks]))) ++blanks;
      if (blanks == 0) return false;
      in.remove_prefix(blanks);
      continue;
    }
    if (c != '%' || i + 1 >= layout.size()) {
      if (in.empty() || absl::ascii_tolower(in[0]) != absl::ascii_tolower(c)) return false;
      in.remove_prefix(1);
      continue;
    }
    bool ok = false;
    switch (layout[++i]) {
      case 'Y':
        ok = ReadDigits(&in, 4, 4, &fields.year);
        break;
      case 'y':
        ok = ReadDigits(&in, 2, 2, &fields.year);
        if (ok) fields.year += fields.year < 69 ? 2000 : 1900;
        break;
      case 'm':
        ok = ReadDigits(&in, 1, 2, &fields.month);
        break;
      case 'd':
        ok = ReadDigits(&in, 1, 2, &fields.day);
        break;
      case 'H':
        ok = ReadDigits(&in, 1, 2, &fields.hour) && fields.hour <= 23;
        break;
      case 'M':
        ok = ReadDigits(&in, 1, 2, &fields.minute) && fields.minute <= 59;
        break;
      case 'S':
        ok = ReadDigits(&in, 1, 2, &fields.second) && fields.second <= 61;
        break;
      case 'b':
        ok = ReadMonthName(&in, /*full=*/false, &fields.month);
        break;
      case 'B':
        ok = ReadMonthName(&in, /*full=*/true, &fields.month);
        break;
      default:
        return false;
    }
    if (!ok) return false;
  }
  if (!in.empty()) return false;
  absl::CivilDay day(fields.year, fields.month, fields.day);
  if (fields.month < 1 || fields.month > 12 || day.year() != fields.year || day.month() != fields.month ||
      day.day() != fields.day) {
    return false;
  }
  *out = fields;
  return true;
}

// Drops "st", "nd", "rd" and "th" after a number when a word ends there.
std::string StripOrdinalSuffixes(absl::string_view text) {
  std::string out;
  out.reserve(text.size());
  size_t i = 0;
  while (i < text.size()) {
    out.push_back(text[i]);
    bool digit = absl::ascii_isdigit(static_cast<unsigned char>(text[i]));
    ++i;
    if (!digit || i + 2 > text.size()) continue;
    if (absl::ascii_isdigit(static_cast<unsigned char>(text[i]))) continue;
    std::string suffix = absl::AsciiStrToLower(text.substr(i, 2));
    if (suffix != "st" && suffix != "nd" && suffix != "rd" && suffix != "th") continue;
    bool word_ends = i + 2 == text.size() || !(absl::ascii_isalnum(static_cast<unsigned char>(text[i + 2])) ||
                                               text[i + 2] == '_');
    if (word_ends) i += 2;
  }
  return out;
}

bool IsEmailLocalChar(char c) {
  return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '_' || c == '%' || c == '+' ||
         c == '-';
}

bool IsEmailDomainChar(char c) { return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '.' || c == '-'; }

bool EndsUrl(char c) {
  return absl::ascii_isspace(static_cast<unsigned char>(c)) || c == '<' || c == '>' || c == '"' || c == '\'' ||
         c == ')' || c == ']' || c == '}';
}

struct UrlParts {
  std::string scheme;
  std::string netloc;
  std::string path;
  std::string query;
};

UrlParts SplitUrl(absl::string_view url) {
  UrlParts parts;
  url = absl::StripAsciiWhitespace(url);
  size_t colon = url.find(':');
  if (colon != absl::string_view::npos && colon > 0 && absl::ascii_isalpha(static_cast<unsigned char>(url[0]))) {
    bool valid = true;
    for (char c : url.substr(0, colon)) {
      if (!absl::ascii_isalnum(static_cast<unsigned char>(c)) && c != '+' && c != '-' && c != '.') valid = false;
    }
    if (valid) {
      parts.scheme = absl::AsciiStrToLower(url.substr(0, colon));
      url.remove_prefix(colon + 1);
    }
  }
  if (absl::ConsumePrefix(&url, "//")) {
    size_t end = url.find_first_of("/?#");
    parts.netloc = std::string(url.substr(0, end));
    url = end == absl::string_view::npos ? absl::string_view() : url.substr(end);
  }
  url = url.substr(0, url.find('#'));
  size_t question = url.find('?');
  if (question != absl::string_view::npos) {
    parts.query = std::string(url.substr(question + 1));
    url = url.substr(0, question);
  }
  parts.path = std::string(url);
  return parts;
}

std::optional<std::string> NonEmpty(std::string value) {
  if (value.empty()) return std::nullopt;
  return value;
}

}  // namespace

std::string HtmlToText(const std::string& html) {
  std::string lower = absl::AsciiStrToLower(html);
  std::string out;
  out.reserve(html.size());
  bool unclosed_script = false;
  bool unclosed_style = false;
  size_t i = 0;
  while (i < html.size()) {
    if (html[i] != '<') {
      out.push_back(html[i++]);
      continue;
    }
    size_t close = html.find('>', i + 1);
    if (close == std::string::npos) {
      out.append(html, i, std::string::npos);
      break;
    }
    if (close == i + 1) {
      out.push_back(html[i++]);
      continue;
    }
    absl::string_view tag(html.data() + i + 1, close - i - 1);
    bool closing = tag[0] == '/';
    std::string name = TagName(tag);
    bool raw_text = !closing && (name == "script" || name == "style");
    bool& unclosed = name == "script" ? unclosed_script : unclosed_style;
    if (raw_text && !unclosed) {
      size_t end = lower.find(absl::StrCat("</", name, ">"), close + 1);
      if (end != std::string::npos) {
        out.push_back(' ');
        i = end + name.size() + 3;
        continue;
      }
      unclosed = true;
    }
    out.push_back(!closing && IsBlockTag(name) ? '\n' : ' ');
    i = close + 1;
  }
  return TidyWhitespace(DecodeEntities(out));
}

std::string CleanText(const std::string& text) {
  std::string cleaned = absl::StrReplaceAll(text, {
                                                      {"\xE2\x80\x8B", ""},
                                                      {"\xE2\x80\x8C", ""},
                                                      {"\xE2\x80\x8D", ""},
                                                      {"\xEF\xBB\xBF", ""},
                                                      {"\xE2\x80\x9C", "\""},
                                                      {"\xE2\x80\x9D", "\""},
                                                      {"\xE2\x80\x98", "'"},
                                                      {"\xE2\x80\x99", "'"},
                                                      {"\xE2\x80\x93", "-"},
                                                      {"\xE2\x80\x94", "-"},
                                                      {"\xE2\x80\xA6", "..."},
                                                  });
  return TidyWhitespace(cleaned);
}

std::optional<double> ParseNumber(const std::string& input) {
  static const char* const kCurrency[] = {"$", "\xC2\xA3", "\xE2\x82\xAC", "\xC2\xA5", "\xE2\x82\xB9", "\xE2\x82\xBD"};
  absl::string_view s = absl::StripAsciiWhitespace(input);
  if (s.empty()) return std::nullopt;

  bool negative = false;
  if (s.size() >= 2 && s.front() == '(' && s.back() == ')') {
    negative = true;
    s = s.substr(1, s.size() - 2);
  }
  if (absl::ConsumePrefix(&s, "-")) negative = true;

  bool trimmed = true;
  while (trimmed) {
    trimmed = false;
    s = absl::StripAsciiWhitespace(s);
    for (const char* symbol : kCurrency) {
      if (absl::ConsumePrefix(&s, symbol) || absl::ConsumeSuffix(&s, symbol)) trimmed = true;
    }
  }

  double multiplier = 1.0;
  if (!s.empty()) {
    switch (absl::ascii_toupper(s.back())) {
      case 'K':
        multiplier = 1e3;
        break;
      case 'M':
        multiplier = 1e6;
        break;
      case 'B':
        multiplier = 1e9;
        break;
      case 'T':
        multiplier = 1e12;
        break;
    }
    if (multiplier != 1.0) s.remove_suffix(1);
  }

  std::string number = absl::StrReplaceAll(s, {{" ", ""}});
  size_t comma = number.rfind(',');
  size_t dot = number.rfind('.');
  bool has_comma = comma != std::string::npos;
  bool has_dot = dot != std::string::npos;
  size_t after_comma = has_comma ? number.size() - comma - 1 : 0;
  bool european = has_comma && after_comma <= 2 && ((has_dot && comma > dot) || (!has_dot && after_comma == 2));
  if (european) {
    number = absl::StrReplaceAll(number, {{".", ""}, {",", "."}});
  } else {
    number = absl::StrReplaceAll(number, {{",", ""}});
  }

  double value = 0;
  if (!absl::SimpleAtod(number, &value)) return std::nullopt;
  value *= multiplier;
  return negative ? -value : value;
}

std::optional<std::string> ParseDate(const std::string& input, const std::string& output_format) {
  static const char* const kLayouts[] = {
      "%Y-%m-%d %H:%M:%S", "%Y-%m-%dT%H:%M:%S", "%Y-%m-%dT%H:%M:%SZ", "%Y-%m-%d", "%Y/%m/%d",
      "%d/%m/%Y %H:%M:%S", "%d/%m/%Y",          "%m/%d/%Y %H:%M:%S",  "%m/%d/%Y", "%m/%d/%y",
      "%d-%m-%Y",          "%B %d, %Y",         "%b %d, %Y",          "%d %B %Y", "%d %b %Y",
      "%B %d %Y",          "%b %d %Y",          "%d %B, %Y",          "%d %b, %Y", "%Y%m%d",
  };
  absl::string_view trimmed = absl::StripAsciiWhitespace(input);
  if (trimmed.empty()) return std::nullopt;
  std::string text = StripOrdinalSuffixes(trimmed);

  for (const char* layout : kLayouts) {
    DateFields fields;
    if (!MatchDateLayout(text, layout, &fields)) continue;
    absl::CivilSecond civil(fields.year, fields.month, fields.day, fields.hour, fields.minute, fields.second);
    return absl::FormatTime(output_format, absl::FromCivil(civil, absl::UTCTimeZone()), absl::UTCTimeZone());
  }
  return std::nullopt;
}

std::optional<std::string> UrlExtract(const std::string& url, const std::string& part) {
  static const auto* const kTwoLabelSuffixes =
      new absl::flat_hash_set<std::string>({"co.uk", "com.au", "co.nz", "co.jp", "com.br", "co.in"});
  UrlParts parts = SplitUrl(url);
  std::string which = absl::AsciiStrToLower(part);
  std::string host = parts.netloc.substr(0, parts.netloc.find(':'));

  if (which == "scheme") return NonEmpty(parts.scheme);
  if (which == "host") return NonEmpty(host);
  if (which == "path") return NonEmpty(parts.path);
  if (which == "query") return NonEmpty(parts.query);
  if (which == "port") {
    size_t colon = parts.netloc.find(':');
    if (colon == std::string::npos) return std::nullopt;
    std::vector<absl::string_view> pieces = absl::StrSplit(parts.netloc, ':');
    return std::string(pieces[1]);
  }
  if (which == "domain") {
    if (host.empty()) return std::nullopt;
    std::vector<std::string> labels = absl::StrSplit(host, '.');
    size_t n = labels.size();
    if (n < 2) return host;
    if (n >= 3 && kTwoLabelSuffixes->contains(absl::StrCat(labels[n - 2], ".", labels[n - 1]))) {
      return absl::StrJoin(labels.begin() + (n - 3), labels.end(), ".");
    }
    return absl::StrJoin(labels.begin() + (n - 2), labels.end(), ".");
  }
  return std::nullopt;
}

std::optional<std::string> ExtractJson(const std::string& text) {
  static const std::pair<char, char> kBrackets[] = {{'{', '}'}, {'[', ']'}};
  for (const auto& [open, close] : kBrackets) {
    size_t start = text.find(open);
    if (start == std::string::npos) continue;
    int depth = 0;
    bool in_string = false;
    bool escape = false;
    for (size_t i = start; i < text.size(); ++i) {
      char c = text[i];
      if (escape) {
        escape = false;
        continue;
      }
      if (c == '\\' && in_string) {
        escape = true;
        continue;
      }
      if (c == '"') {
        in_string = !in_string;
        continue;
      }
      if (in_string) continue;
      if (c == open) {
        ++depth;
      } else if (c == close && --depth == 0) {
        std::string candidate = text.substr(start, i - start + 1);
        if (nlohmann::json::accept(candidate)) return candidate;
        break;
      }
    }
  }
  return std::nullopt;
}

std::optional<std::string> ExtractEmails(const std::string& text) {
  std::vector<std::string> unique;
  absl::flat_hash_set<std::string> seen;
  size_t pos = 0;
  while (pos < text.size()) {
    size_t at = text.find('@', pos);
    if (at == std::string::npos) break;
    size_t start = at;
    while (start > pos && IsEmailLocalChar(text[start - 1])) --start;
    size_t domain_end = at + 1;
    while (domain_end < text.size() && IsEmailDomainChar(text[domain_end])) ++domain_end;
    // The last dot that leaves a label before it and two or more letters after it.
    size_t end = std::string::npos;
    for (size_t dot = domain_end; start < at && dot > at + 2;) {
      --dot;
      if (text[dot] != '.') continue;
      size_t letters = dot + 1;
      while (letters < domain_end && absl::ascii_isalpha(static_cast<unsigned char>(text[letters]))) ++letters;
      if (letters - dot - 1 >= 2) {
        end = letters;
        break;
      }
    }
    if (end == std::string::npos) {
      pos = at + 1;
      continue;
    }
    std::string email = text.substr(start, end - start);
    if (seen.insert(absl::AsciiStrToLower(email)).second) unique.push_back(std::move(email));
    pos = end;
  }
  if (unique.empty()) return std::nullopt;
  return DumpArray(unique);
}

std::optional<std::string> ExtractUrls(const std::string& text) {
  std::vector<std::string> unique;
  absl::flat_hash_set<std::string> seen;
  size_t pos = 0;
  while (true) {
    size_t found = text.find("http", pos);
    if (found == std::string::npos) break;
    absl::string_view rest(text.data() + found, text.size() - found);
    size_t prefix = absl::StartsWith(rest, "https://") ? 8 : absl::StartsWith(rest, "http://") ? 7 : 0;
    size_t end = found + prefix;
    while (prefix > 0 && end < text.size() && !EndsUrl(text[end])) ++end;
    if (prefix == 0 || end == found + prefix) {
      pos = found + 1;
      continue;
    }
    absl::string_view url(text.data() + found, end - found);
    while (!url.empty() && absl::string_view(".,;:!?").find(url.back()) != absl::string_view::npos) {
      url.remove_suffix(1);
    }
    std::string value(url);
    if (seen.insert(value).second) unique.push_back(std::move(value));
    pos = end;
  }
  if (unique.empty()) return std::nullopt;
  return DumpArray(unique);
}

}  // namespace text
}  // namespace scratchdb
