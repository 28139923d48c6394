#ifndef SCRATCHDB_SANDBOX_POLICY_H_
#define SCRATCHDB_SANDBOX_POLICY_H_

#include <string>

#include "absl/container/flat_hash_set.h"

namespace scratchdb {

// Deny lists consulted by the engine authorizer while a statement compiles.
// A denied statement fails to prepare, so no row is ever touched.
struct SandboxPolicy {
  absl::flat_hash_set<int> denied_actions;           // SQLITE_ATTACH, ...
  absl::flat_hash_set<std::string> denied_functions;  // lowercase
  absl::flat_hash_set<std::string> denied_pragmas;    // lowercase
  // When false, SQLITE_LIMIT_ATTACHED is forced to zero on open.
  bool allow_attach = false;

  // Policy for agent-facing sessions.
  static SandboxPolicy Default();
  // Internal compaction only: VACUUM needs attach/detach to rebuild the file.
  static SandboxPolicy Maintenance();

  // Returns SQLITE_OK or SQLITE_DENY for an authorizer callback.
  int Authorize(int action, const char* arg1, const char* arg2) const;
};

}  // namespace scratchdb

#endif  // SCRATCHDB_SANDBOX_POLICY_H_
