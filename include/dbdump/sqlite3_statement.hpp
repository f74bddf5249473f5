// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump::Sqlite3Statement -- prepared statement with RAII.
//
// Design:
//   - Wraps sqlite3_stmt* with RAII
//   - Move-only (no copy)
//   - 1-based parameter binding (matches SQLite3 convention)
//   - ExecQuery() hands the stepped handle over to a Sqlite3Query

#pragma once

#include <cstdint>
#include <string>

#include "sqlite3.h"

#include "dbdump/error.hpp"
#include "dbdump/sqlite3_query.hpp"

namespace dbdump {

class Sqlite3Db;

// ---------------------------------------------------------------------------
// Sqlite3Statement
// ---------------------------------------------------------------------------

class Sqlite3Statement {
 public:
  Sqlite3Statement() = default;

  ~Sqlite3Statement() { Finalize(); }

  // Move
  Sqlite3Statement(Sqlite3Statement&& other) noexcept
      : db_(other.db_), stmt_(other.stmt_) {
    other.db_ = nullptr;
    other.stmt_ = nullptr;
  }

  Sqlite3Statement& operator=(Sqlite3Statement&& other) noexcept {
    if (this != &other) {
      Finalize();
      db_ = other.db_;
      stmt_ = other.stmt_;
      other.db_ = nullptr;
      other.stmt_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Statement(const Sqlite3Statement&) = delete;
  Sqlite3Statement& operator=(const Sqlite3Statement&) = delete;

  // --- Execute ---

  /// Step once and transfer the handle to a Sqlite3Query.
  /// This statement becomes empty afterwards.
  Sqlite3Query ExecQuery(Error* out_error = nullptr) {
    if (db_ == nullptr || stmt_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kMisuse, "Statement not initialized");
      }
      return Sqlite3Query{};
    }

    int32_t rc = sqlite3_step(stmt_);
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) {
      Sqlite3Query q(db_, stmt_, rc == SQLITE_DONE);
      stmt_ = nullptr;  // ownership transferred
      return q;
    }

    if (out_error != nullptr) {
      out_error->Set(ErrorCode::kError, sqlite3_errmsg(db_));
    }
    Finalize();
    return Sqlite3Query{};
  }

  // --- Bind (1-based index) ---

  Error Bind(int32_t param, const std::string& value) {
    if (stmt_ == nullptr) { return NotInitialized(); }
    return Check(sqlite3_bind_text(stmt_, param, value.data(),
                                   static_cast<int>(value.size()),
                                   SQLITE_TRANSIENT),
                 "bind text failed");
  }

  void Finalize() {
    if (stmt_ != nullptr) {
      sqlite3_finalize(stmt_);
      stmt_ = nullptr;
    }
  }

  bool Valid() const { return stmt_ != nullptr; }

 private:
  friend class Sqlite3Db;

  Sqlite3Statement(sqlite3* db, sqlite3_stmt* stmt)
      : db_(db), stmt_(stmt) {}

  static Error NotInitialized() {
    return Error::Make(ErrorCode::kMisuse, "Statement not initialized");
  }

  static Error Check(int32_t rc, const char* what) {
    if (rc != SQLITE_OK) { return Error::Make(ErrorCode::kError, what); }
    return Error::Ok();
  }

  sqlite3* db_ = nullptr;
  sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace dbdump
