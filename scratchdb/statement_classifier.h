#ifndef SCRATCHDB_STATEMENT_CLASSIFIER_H_
#define SCRATCHDB_STATEMENT_CLASSIFIER_H_

#include <optional>
#include <string>
#include <vector>

namespace scratchdb {

enum class StatementKind { kRead, kWrite, kBlocked };

struct Classification {
  StatementKind kind = StatementKind::kRead;
  std::string reason;  // set when kind == kBlocked
};

/**
 * @brief Removes comments and neutralizes quoted literals.
 *
 * Line (--) and block comments are dropped. Single- and double-quoted
 * literals, including doubled-quote escapes, collapse to a single space so
 * keywords inside string data never reach the keyword checks.
 */
std::string StripCommentsAndLiterals(const std::string& sql);

// Lexical guard for statement shapes the authorizer cannot see. Returns a
// human-readable reason when any statement in `sql` starts with VACUUM
// (optionally behind EXPLAIN [QUERY PLAN]).
std::optional<std::string> GetBlockedStatementReason(const std::string& sql);

// Write means: a mutating leading keyword and no RETURNING clause. Anything
// the scanner cannot classify confidently is a read.
Classification Classify(const std::string& sql);

inline bool IsWriteStatement(const std::string& sql) { return Classify(sql).kind == StatementKind::kWrite; }

// BEGIN/COMMIT/ROLLBACK/END/SAVEPOINT/RELEASE as the leading keyword.
bool IsTransactionControl(const std::string& sql);

/**
 * @brief Splits a script into individual statements.
 *
 * Terminators inside comments, quoted literals and CREATE TRIGGER bodies
 * (BEGIN ... END, with nested CASE ... END) do not split. Returned statements
 * are trimmed, exclude the terminating ';', and fragments holding only
 * whitespace or comments are dropped.
 */
std::vector<std::string> SplitStatements(const std::string& sql);

}  // namespace scratchdb

#endif  // SCRATCHDB_STATEMENT_CLASSIFIER_H_
