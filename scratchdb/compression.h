#ifndef SCRATCHDB_COMPRESSION_H_
#define SCRATCHDB_COMPRESSION_H_

#include <cstddef>
#include <limits>
#include <string>

#include "absl/status/statusor.h"

namespace scratchdb {

// gzip framing (RFC 1952) over zlib deflate.
absl::StatusOr<std::string> GzipCompress(const std::string& bytes, int level = 6);

// DataLossError on corrupt or truncated input, or once the output would grow
// past `max_output_bytes`.
absl::StatusOr<std::string> GzipDecompress(const std::string& bytes,
                                           size_t max_output_bytes = std::numeric_limits<size_t>::max());

}  // namespace scratchdb

#endif  // SCRATCHDB_COMPRESSION_H_
