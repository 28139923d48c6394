#include "scratchdb/statement_classifier.h"

#include <cctype>
#include <regex>

#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/string_view.h"
#include "absl/strings/strip.h"

namespace scratchdb {

namespace {

bool IsSpace(char c) { return absl::ascii_isspace(static_cast<unsigned char>(c)); }

bool IsWordStart(char c) { return absl::ascii_isalpha(static_cast<unsigned char>(c)) || c == '_'; }

bool IsWordChar(char c) { return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '$'; }

absl::string_view LeadingWord(absl::string_view upper) {
  upper = absl::StripLeadingAsciiWhitespace(upper);
  size_t end = 0;
  while (end < upper.size() && absl::ascii_isupper(static_cast<unsigned char>(upper[end]))) ++end;
  return upper.substr(0, end);
}

// True when `word` occurs in `text` with no word character on either side.
bool ContainsWord(absl::string_view text, absl::string_view word) {
  for (size_t pos = text.find(word); pos != absl::string_view::npos; pos = text.find(word, pos + 1)) {
    size_t end = pos + word.size();
    bool starts = pos == 0 || !IsWordChar(text[pos - 1]);
    bool ends = end == text.size() || !IsWordChar(text[end]);
    if (starts && ends) return true;
  }
  return false;
}

// `upper` must be upper-cased and free of comments and literals. Returns the
// text after a leading WITH clause, or `upper` unchanged when the clause does
// not parse.
absl::string_view SkipLeadingWithClause(absl::string_view upper) {
  if (!absl::StartsWith(upper, "WITH")) return upper;
  size_t idx = 4;
  size_t length = upper.size();
  while (idx < length && IsSpace(upper[idx])) ++idx;
  if (upper.substr(idx, 9) == "RECURSIVE") {
    idx += 9;
    while (idx < length && IsSpace(upper[idx])) ++idx;
  }

  int depth = 0;
  bool cte_finished = false;
  bool saw_paren = false;
  while (idx < length) {
    char ch = upper[idx];
    if (depth == 0 && cte_finished) {
      if (ch == ',') {
        cte_finished = false;
        ++idx;
        continue;
      }
      if (IsSpace(ch)) {
        ++idx;
        continue;
      }
      // The parenthesis closed a column list: "name(a, b) AS (...)".
      if (upper.substr(idx, 2) == "AS" && idx + 2 < length &&
          (IsSpace(upper[idx + 2]) || upper[idx + 2] == '(')) {
        cte_finished = false;
        idx += 2;
        continue;
      }
      return upper.substr(idx);
    }
    if (ch == '(') {
      ++depth;
      saw_paren = true;
    } else if (ch == ')') {
      if (depth > 0) --depth;
      if (depth == 0 && saw_paren) cte_finished = true;
    }
    ++idx;
  }
  return upper;
}

// Tracks CREATE TRIGGER bodies while scanning words of one statement.
class TriggerTracker {
 public:
  void OnWord(const std::string& word) {
    if (words_seen_ < 3) {
      if (words_seen_ == 0) {
        is_create_ = word == "CREATE";
      } else if (is_create_ && word == "TRIGGER") {
        in_trigger_ = true;
      } else if (is_create_ && words_seen_ == 1 && (word == "TEMP" || word == "TEMPORARY")) {
        // CREATE TEMP TRIGGER
      } else if (words_seen_ == 1) {
        is_create_ = false;
      }
      ++words_seen_;
    }
    if (!in_trigger_) return;
    if (body_depth_ == 0) {
      if (word == "CASE") {
        ++header_case_depth_;
      } else if (word == "END" && header_case_depth_ > 0) {
        --header_case_depth_;
      } else if (word == "BEGIN" && header_case_depth_ == 0) {
        body_depth_ = 1;
      }
      return;
    }
    if (word == "CASE") {
      ++body_depth_;
    } else if (word == "END") {
      if (--body_depth_ == 0) in_trigger_ = false;
    }
  }

  bool InBody() const { return body_depth_ > 0; }

  void Reset() { *this = TriggerTracker(); }

 private:
  int words_seen_ = 0;
  bool is_create_ = false;
  bool in_trigger_ = false;
  int header_case_depth_ = 0;
  int body_depth_ = 0;
};

}  // namespace

std::string StripCommentsAndLiterals(const std::string& sql) {
  std::string result;
  result.reserve(sql.size());
  size_t i = 0;
  size_t length = sql.size();
  while (i < length) {
    char ch = sql[i];
    if (ch == '-' && i + 1 < length && sql[i + 1] == '-') {
      i += 2;
      while (i < length && sql[i] != '\n') ++i;
      continue;
    }
    if (ch == '/' && i + 1 < length && sql[i + 1] == '*') {
      i += 2;
      while (i + 1 < length && !(sql[i] == '*' && sql[i + 1] == '/')) ++i;
      i = i + 1 < length ? i + 2 : length;
      continue;
    }
    if (ch == '\'' || ch == '"') {
      char quote = ch;
      result.push_back(' ');
      ++i;
      while (i < length) {
        if (sql[i] == quote) {
          if (i + 1 < length && sql[i + 1] == quote) {
            i += 2;
            continue;
          }
          ++i;
          break;
        }
        ++i;
      }
      continue;
    }
    result.push_back(ch);
    ++i;
  }
  return result;
}

std::optional<std::string> GetBlockedStatementReason(const std::string& sql) {
  static const std::regex* const kVacuum = new std::regex(
      R"((?:^|;)\s*(?:EXPLAIN\s+(?:QUERY\s+PLAN\s+)?)?VACUUM\b)", std::regex::ECMAScript | std::regex::icase);
  if (std::regex_search(StripCommentsAndLiterals(sql), *kVacuum)) {
    return "VACUUM statements are disabled for safety.";
  }
  return std::nullopt;
}

Classification Classify(const std::string& sql) {
  Classification result;
  if (auto reason = GetBlockedStatementReason(sql); reason.has_value()) {
    result.kind = StatementKind::kBlocked;
    result.reason = *reason;
    return result;
  }

  std::string upper = absl::AsciiStrToUpper(StripCommentsAndLiterals(sql));
  absl::string_view body = absl::StripLeadingAsciiWhitespace(upper);
  if (body.empty()) return result;
  body = absl::StripLeadingAsciiWhitespace(SkipLeadingWithClause(body));

  static const absl::flat_hash_set<absl::string_view> kWriteKeywords = {"INSERT", "UPDATE", "DELETE", "REPLACE",
                                                                        "CREATE", "ALTER",  "DROP"};
  absl::string_view keyword = LeadingWord(body);
  if (keyword.empty() || !kWriteKeywords.contains(keyword)) return result;
  // RETURNING produces rows the caller has to look at.
  if (ContainsWord(body, "RETURNING")) return result;
  result.kind = StatementKind::kWrite;
  return result;
}

bool IsTransactionControl(const std::string& sql) {
  static const absl::flat_hash_set<absl::string_view> kControl = {"BEGIN", "COMMIT", "ROLLBACK",
                                                                  "END",   "SAVEPOINT", "RELEASE"};
  std::string upper = absl::AsciiStrToUpper(StripCommentsAndLiterals(sql));
  return kControl.contains(LeadingWord(upper));
}

std::vector<std::string> SplitStatements(const std::string& sql) {
  std::vector<std::string> statements;
  std::string current;
  bool has_code = false;  // current holds something besides whitespace/comments
  TriggerTracker trigger;

  auto flush = [&]() {
    if (has_code) {
      statements.push_back(std::string(absl::StripAsciiWhitespace(current)));
    }
    current.clear();
    has_code = false;
    trigger.Reset();
  };

  size_t i = 0;
  size_t length = sql.size();
  while (i < length) {
    char ch = sql[i];
    if (ch == '-' && i + 1 < length && sql[i + 1] == '-') {
      size_t end = sql.find('\n', i);
      end = end == std::string::npos ? length : end;
      current.append(sql, i, end - i);
      i = end;
      continue;
    }
    if (ch == '/' && i + 1 < length && sql[i + 1] == '*') {
      size_t end = sql.find("*/", i + 2);
      end = end == std::string::npos ? length : end + 2;
      current.append(sql, i, end - i);
      i = end;
      continue;
    }
    if (ch == '\'' || ch == '"' || ch == '`' || ch == '[') {
      char close = ch == '[' ? ']' : ch;
      size_t j = i + 1;
      while (j < length) {
        if (sql[j] == close) {
          if (close != ']' && j + 1 < length && sql[j + 1] == close) {
            j += 2;
            continue;
          }
          ++j;
          break;
        }
        ++j;
      }
      current.append(sql, i, j - i);
      has_code = true;
      i = j;
      continue;
    }
    if (IsWordStart(ch)) {
      size_t j = i;
      while (j < length && IsWordChar(sql[j])) ++j;
      std::string word = sql.substr(i, j - i);
      trigger.OnWord(absl::AsciiStrToUpper(word));
      current += word;
      has_code = true;
      i = j;
      continue;
    }
    if (ch == ';' && !trigger.InBody()) {
      flush();
      ++i;
      continue;
    }
    current.push_back(ch);
    if (!IsSpace(ch)) has_code = true;
    ++i;
  }
  flush();
  return statements;
}

}  // namespace scratchdb
