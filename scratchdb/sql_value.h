#ifndef SCRATCHDB_SQL_VALUE_H_
#define SCRATCHDB_SQL_VALUE_H_

#include <cstdint>
#include <string>
#include <utility>

#include "nlohmann/json.hpp"

namespace scratchdb {

// Runtime storage class of a value as reported by the engine. SQLite has no
// boolean storage class; booleans arrive as kInteger.
enum class ValueType { kNull, kInteger, kReal, kText, kBlob };

const char* ValueTypeName(ValueType type);

// A single cell read from (or bound to) the engine.
struct SqlValue {
  ValueType type = ValueType::kNull;
  int64_t int_value = 0;
  double real_value = 0.0;
  std::string bytes;  // text or blob payload

  static SqlValue Null() { return SqlValue(); }
  static SqlValue Integer(int64_t v) {
    SqlValue out;
    out.type = ValueType::kInteger;
    out.int_value = v;
    return out;
  }
  static SqlValue Real(double v) {
    SqlValue out;
    out.type = ValueType::kReal;
    out.real_value = v;
    return out;
  }
  static SqlValue Text(std::string v) {
    SqlValue out;
    out.type = ValueType::kText;
    out.bytes = std::move(v);
    return out;
  }
  static SqlValue Blob(std::string v) {
    SqlValue out;
    out.type = ValueType::kBlob;
    out.bytes = std::move(v);
    return out;
  }

  bool is_null() const { return type == ValueType::kNull; }
  bool is_numeric() const { return type == ValueType::kInteger || type == ValueType::kReal; }
  double AsDouble() const { return type == ValueType::kInteger ? static_cast<double>(int_value) : real_value; }

  // Textual rendering used for comparisons and samples. NULL renders as "".
  std::string ToString() const;

  // Blobs render as a size placeholder since JSON cannot carry raw bytes.
  nlohmann::json ToJson() const;

  bool operator==(const SqlValue& other) const;
  bool operator!=(const SqlValue& other) const { return !(*this == other); }
};

}  // namespace scratchdb

#endif  // SCRATCHDB_SQL_VALUE_H_
