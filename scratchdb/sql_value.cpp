#include "scratchdb/sql_value.h"

#include "absl/strings/str_cat.h"

namespace scratchdb {

const char* ValueTypeName(ValueType type) {
  switch (type) {
    case ValueType::kNull:
      return "NULL";
    case ValueType::kInteger:
      return "INTEGER";
    case ValueType::kReal:
      return "FLOAT";
    case ValueType::kText:
      return "TEXT";
    case ValueType::kBlob:
      return "BLOB";
  }
  return "UNKNOWN";
}

std::string SqlValue::ToString() const {
  switch (type) {
    case ValueType::kNull:
      return "";
    case ValueType::kInteger:
      return absl::StrCat(int_value);
    case ValueType::kReal:
      return absl::StrCat(real_value);
    case ValueType::kText:
    case ValueType::kBlob:
      return bytes;
  }
  return "";
}

nlohmann::json SqlValue::ToJson() const {
  switch (type) {
    case ValueType::kNull:
      return nullptr;
    case ValueType::kInteger:
      return int_value;
    case ValueType::kReal:
      return real_value;
    case ValueType::kText:
      return bytes;
    case ValueType::kBlob:
      return absl::StrCat("<blob ", bytes.size(), " bytes>");
  }
  return nullptr;
}

bool SqlValue::operator==(const SqlValue& other) const {
  if (type != other.type) return false;
  switch (type) {
    case ValueType::kNull:
      return true;
    case ValueType::kInteger:
      return int_value == other.int_value;
    case ValueType::kReal:
      return real_value == other.real_value;
    case ValueType::kText:
    case ValueType::kBlob:
      return bytes == other.bytes;
  }
  return false;
}

}  // namespace scratchdb
