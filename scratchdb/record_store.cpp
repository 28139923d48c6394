#include "scratchdb/record_store.h"

namespace scratchdb {

std::string FormatRecordTime(absl::Time time) {
  return absl::FormatTime("%Y-%m-%dT%H:%M:%SZ", time, absl::UTCTimeZone());
}

}  // namespace scratchdb
