// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump::Value -- one cell read from a SQLite row.
//
// Design:
//   - Tagged by the cell's runtime storage class, not the column's
//     declared type (SQLite lets both disagree per row)
//   - Text and blob share one byte buffer
//   - Copyable value type, built by Sqlite3Query::GetValue()

#pragma once

#include <cstdint>
#include <string>
#include <utility>

namespace dbdump {

// ---------------------------------------------------------------------------
// ValueType -- mirrors SQLITE_NULL / INTEGER / FLOAT / TEXT / BLOB
// ---------------------------------------------------------------------------

enum class ValueType : uint8_t {
  kNull = 0,
  kInteger,
  kFloat,
  kText,
  kBlob,
};

// ---------------------------------------------------------------------------
// Value
// ---------------------------------------------------------------------------

struct Value {
  ValueType type = ValueType::kNull;
  int64_t integer = 0;
  double real = 0.0;
  std::string bytes;  // kText or kBlob payload

  bool IsNull() const { return type == ValueType::kNull; }

  static Value Null() { return Value{}; }

  static Value Integer(int64_t v) {
    Value val;
    val.type = ValueType::kInteger;
    val.integer = v;
    return val;
  }

  static Value Float(double v) {
    Value val;
    val.type = ValueType::kFloat;
    val.real = v;
    return val;
  }

  static Value Text(std::string v) {
    Value val;
    val.type = ValueType::kText;
    val.bytes = std::move(v);
    return val;
  }

  static Value Blob(const uint8_t* data, int32_t len) {
    Value val;
    val.type = ValueType::kBlob;
    if (data != nullptr && len > 0) {
      val.bytes.assign(reinterpret_cast<const char*>(data),
                       static_cast<size_t>(len));
    }
    return val;
  }
};

}  // namespace dbdump
