#include "scratchdb/sandbox_policy.h"

#include <sqlite3.h>

#include "absl/log/log.h"
#include "absl/strings/ascii.h"

namespace scratchdb {

SandboxPolicy SandboxPolicy::Default() {
  SandboxPolicy policy;
  policy.denied_actions = {SQLITE_ATTACH, SQLITE_DETACH};
  policy.denied_functions = {"load_extension", "readfile", "writefile", "edit", "fts3_tokenizer"};
  policy.denied_pragmas = {"database_list", "key", "rekey", "temp_store", "temp_store_directory"};
  return policy;
}

SandboxPolicy SandboxPolicy::Maintenance() {
  SandboxPolicy policy = Default();
  policy.denied_actions.erase(SQLITE_ATTACH);
  policy.denied_actions.erase(SQLITE_DETACH);
  policy.allow_attach = true;
  return policy;
}

int SandboxPolicy::Authorize(int action, const char* arg1, const char* arg2) const {
  bool deny = false;
  if (denied_actions.contains(action)) {
    deny = true;
  } else if (action == SQLITE_FUNCTION) {
    // arg1 is unused for functions; arg2 carries the function name.
    const char* name = arg2 != nullptr ? arg2 : arg1;
    deny = name != nullptr && denied_functions.contains(absl::AsciiStrToLower(name));
  } else if (action == SQLITE_PRAGMA) {
    deny = arg1 != nullptr && denied_pragmas.contains(absl::AsciiStrToLower(arg1));
  }
  if (!deny) return SQLITE_OK;
  LOG(WARNING) << "Blocked SQLite action=" << action << " arg1=" << (arg1 ? arg1 : "(null)")
               << " arg2=" << (arg2 ? arg2 : "(null)");
  return SQLITE_DENY;
}

}  // namespace scratchdb
