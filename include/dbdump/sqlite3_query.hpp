// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump::Sqlite3Query -- forward-only, single-pass row cursor.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - Forward iteration via Eof()/NextRow(); a failed step is reported
//     through Error* instead of looking like a clean end of rows
//   - GetValue() tags each cell with its runtime storage class

#pragma once

#include <cstdint>
#include <cstring>
#include <string>

#include "sqlite3.h"

#include "dbdump/error.hpp"
#include "dbdump/value.hpp"

namespace dbdump {

class Sqlite3Db;
class Sqlite3Statement;

// ---------------------------------------------------------------------------
// Sqlite3Query
// ---------------------------------------------------------------------------

class Sqlite3Query {
 public:
  Sqlite3Query() = default;

  ~Sqlite3Query() { Finalize(); }

  // Move
  Sqlite3Query(Sqlite3Query&& other) noexcept
      : db_(other.db_),
        stmt_(other.stmt_),
        eof_(other.eof_),
        num_fields_(other.num_fields_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
    other.eof_ = true;
    other.num_fields_ = 0;
  }

  Sqlite3Query& operator=(Sqlite3Query&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      eof_ = other.eof_;
      num_fields_ = other.num_fields_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
      other.eof_ = true;
      other.num_fields_ = 0;
    }
    return *this;
  }

  // No copy
  Sqlite3Query(const Sqlite3Query&) = delete;
  Sqlite3Query& operator=(const Sqlite3Query&) = delete;

  // --- Field info ---

  int32_t NumFields() const { return num_fields_; }

  int32_t FieldDataType(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) { return -1; }
    return sqlite3_column_type(stmt_, col);
  }

  bool FieldIsNull(int32_t col) const {
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) { return true; }
    return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
  }

  // --- Typed accessors ---

  int32_t GetInt(int32_t col, int32_t null_value = 0) const {
    if (FieldIsNull(col)) { return null_value; }
    return sqlite3_column_int(stmt_, col);
  }

  /// Text of the cell, keeping embedded NUL bytes. Null yields null_value.
  std::string GetString(int32_t col, const char* null_value = "") const {
    if (FieldIsNull(col)) { return null_value; }
    const unsigned char* text = sqlite3_column_text(stmt_, col);
    int32_t len = sqlite3_column_bytes(stmt_, col);
    if (text == nullptr) { return null_value; }
    return std::string(reinterpret_cast<const char*>(text),
                       static_cast<size_t>(len));
  }

  const uint8_t* GetBlob(int32_t col, int32_t& out_len) const {
    out_len = 0;
    if (stmt_ == nullptr || col < 0 || col >= num_fields_) {
      return nullptr;
    }
    const void* data = sqlite3_column_blob(stmt_, col);
    out_len = sqlite3_column_bytes(stmt_, col);
    return static_cast<const uint8_t*>(data);
  }

  /// Cell as a tagged Value. Out-of-range columns read as NULL.
  Value GetValue(int32_t col) const {
    switch (FieldDataType(col)) {
      case SQLITE_INTEGER:
        return Value::Integer(sqlite3_column_int64(stmt_, col));
      case SQLITE_FLOAT:
        return Value::Float(sqlite3_column_double(stmt_, col));
      case SQLITE_TEXT:
        return Value::Text(GetString(col));
      case SQLITE_BLOB: {
        int32_t len = 0;
        const uint8_t* data = GetBlob(col, len);
        return Value::Blob(data, len);
      }
      default:
        return Value::Null();
    }
  }

  // --- Navigation ---

  bool Eof() const { return eof_; }

  /// Step to the next row. On a step failure the cursor ends and
  /// out_error is filled with the SQLite message.
  void NextRow(Error* out_error = nullptr) {
    if (stmt_ == nullptr) { return; }
    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_ROW) { return; }
    eof_ = true;
    if (rc != SQLITE_DONE && out_error != nullptr) {
      out_error->Set(ErrorCode::kError,
                     db_ ? sqlite3_errmsg(db_) : "sqlite3_step failed");
    }
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
    eof_ = true;
    num_fields_ = 0;
  }

 private:
  friend class Sqlite3Db;
  friend class Sqlite3Statement;

  Sqlite3Query(sqlite3* db, sqlite3_stmt* stmt, bool eof)
      : db_(db), stmt_(stmt), eof_(eof) {
    if (stmt_ != nullptr) {
      num_fields_ = sqlite3_column_count(stmt_);
    }
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
  bool eof_ = true;
  int32_t num_fields_ = 0;
};

}  // namespace dbdump
