#ifndef SCRATCHDB_STATUS_MACROS_H_
#define SCRATCHDB_STATUS_MACROS_H_

#include <utility>

#define RETURN_IF_ERROR(expr) \
  if (auto _status = (expr); !_status.ok()) return _status

#define ASSIGN_OR_RETURN_IMPL(status_or, lhs, rexpr) \
  auto status_or = (rexpr);                          \
  if (!status_or.ok()) return status_or.status();    \
  lhs = std::move(*status_or)

#define SCRATCHDB_CONCAT_IMPL(x, y) x##y
#define SCRATCHDB_CONCAT(x, y) SCRATCHDB_CONCAT_IMPL(x, y)

#define ASSIGN_OR_RETURN(lhs, rexpr) ASSIGN_OR_RETURN_IMPL(SCRATCHDB_CONCAT(_status_or, __LINE__), lhs, rexpr)

#endif  // SCRATCHDB_STATUS_MACROS_H_
