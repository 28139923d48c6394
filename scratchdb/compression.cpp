#include "scratchdb/compression.h"

#include <zlib.h>

#include <cstring>

#include "absl/status/status.h"
#include "absl/strings/str_cat.h"

namespace scratchdb {

namespace {

constexpr int kGzipWindowBits = 15 + 16;  // 15-bit window, gzip header
constexpr size_t kChunkSize = 64 * 1024;

std::string ZlibMessage(const z_stream& stream, int rc) {
  return stream.msg != nullptr ? std::string(stream.msg) : absl::StrCat("zlib error ", rc);
}

}  // namespace

absl::StatusOr<std::string> GzipCompress(const std::string& bytes, int level) {
  z_stream stream;
  std::memset(&stream, 0, sizeof(stream));
  int rc = deflateInit2(&stream, level, Z_DEFLATED, kGzipWindowBits, 8, Z_DEFAULT_STRATEGY);
  if (rc != Z_OK) return absl::InternalError(absl::StrCat("deflateInit2 failed: ", ZlibMessage(stream, rc)));

  std::string out;
  out.reserve(deflateBound(&stream, bytes.size()));
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(bytes.data()));
  stream.avail_in = static_cast<uInt>(bytes.size());
  char buffer[kChunkSize];
  do {
    stream.next_out = reinterpret_cast<Bytef*>(buffer);
    stream.avail_out = kChunkSize;
    rc = deflate(&stream, Z_FINISH);
    if (rc == Z_STREAM_ERROR) {
      deflateEnd(&stream);
      return absl::InternalError(absl::StrCat("deflate failed: ", ZlibMessage(stream, rc)));
    }
    out.append(buffer, kChunkSize - stream.avail_out);
  } while (rc != Z_STREAM_END);
  deflateEnd(&stream);
  return out;
}

absl::StatusOr<std::string> GzipDecompress(const std::string& bytes, size_t max_output_bytes) {
  z_stream stream;
  std::memset(&stream, 0, sizeof(stream));
  int rc = inflateInit2(&stream, kGzipWindowBits);
  if (rc != Z_OK) return absl::InternalError(absl::StrCat("inflateInit2 failed: ", ZlibMessage(stream, rc)));

  std::string out;
  stream.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(bytes.data()));
  stream.avail_in = static_cast<uInt>(bytes.size());
  char buffer[kChunkSize];
  do {
    stream.next_out = reinterpret_cast<Bytef*>(buffer);
    stream.avail_out = kChunkSize;
    rc = inflate(&stream, Z_NO_FLUSH);
    if (rc == Z_NEED_DICT || rc == Z_DATA_ERROR || rc == Z_MEM_ERROR || rc == Z_STREAM_ERROR) {
      std::string message = ZlibMessage(stream, rc);
      inflateEnd(&stream);
      return absl::DataLossError(absl::StrCat("Corrupt gzip data: ", message));
    }
    size_t produced = kChunkSize - stream.avail_out;
    if (produced > max_output_bytes - out.size()) {
      inflateEnd(&stream);
      return absl::DataLossError(absl::StrCat("Decompressed size exceeds ", max_output_bytes, " bytes"));
    }
    out.append(buffer, produced);
    if (rc == Z_BUF_ERROR && stream.avail_in == 0) {
      inflateEnd(&stream);
      return absl::DataLossError("Truncated gzip data");
    }
  } while (rc != Z_STREAM_END);
  inflateEnd(&stream);
  return out;
}

}  // namespace scratchdb
