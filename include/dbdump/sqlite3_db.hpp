// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump::Sqlite3Db -- SQLite3 database connection with RAII.
//
// Design:
//   - Wraps sqlite3* with RAII
//   - Move-only (no copy)
//   - Error reporting via Error* output parameter (no exceptions)
//   - Read-only by default: opening a missing file fails instead of
//     creating an empty database
//   - Zero global state, one connection per export run

#pragma once

#include <cstdint>
#include <cstdio>
#include <cstring>

#include "sqlite3.h"

#include "dbdump/error.hpp"
#include "dbdump/sqlite3_query.hpp"
#include "dbdump/sqlite3_statement.hpp"

namespace dbdump {

enum class OpenMode : uint8_t {
  kReadOnly = 0,
  kReadWriteCreate,
};

// ---------------------------------------------------------------------------
// Sqlite3Db
// ---------------------------------------------------------------------------

class Sqlite3Db {
 public:
  Sqlite3Db() = default;

  ~Sqlite3Db() { Close(); }

  // Move
  Sqlite3Db(Sqlite3Db&& other) noexcept : db_(other.db_) {
    other.db_ = nullptr;
  }

  Sqlite3Db& operator=(Sqlite3Db&& other) noexcept {
    if (this != &other) {
      Close();
      db_ = other.db_;
      other.db_ = nullptr;
    }
    return *this;
  }

  // No copy
  Sqlite3Db(const Sqlite3Db&) = delete;
  Sqlite3Db& operator=(const Sqlite3Db&) = delete;

  // --- Open / Close ---

  Error Open(const char* path, OpenMode mode = OpenMode::kReadOnly) {
    if (path == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "path is null");
    }
    Close();
    int32_t flags = (mode == OpenMode::kReadOnly)
                        ? SQLITE_OPEN_READONLY
                        : (SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE);
    int32_t rc = sqlite3_open_v2(path, &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
      Error err = Error::Make(ErrorCode::kError,
                              db_ ? sqlite3_errmsg(db_) : "sqlite3_open failed");
      if (db_ != nullptr) {
        sqlite3_close(db_);
        db_ = nullptr;
      }
      return err;
    }
    return Error::Ok();
  }

  void Close() {
    if (db_ != nullptr) {
      sqlite3_close(db_);
      db_ = nullptr;
    }
  }

  bool IsOpen() const { return db_ != nullptr; }

  // --- DML ---

  /// Execute DML (CREATE/DROP/INSERT/UPDATE/DELETE).
  /// Returns number of affected rows, or -1 on error.
  int32_t ExecDml(const char* sql, Error* out_error = nullptr) {
    if (!CheckReady(sql, out_error)) { return -1; }

    char* errmsg = nullptr;
    int32_t rc = sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg);
    if (rc == SQLITE_OK) {
      return sqlite3_changes(db_);
    }

    if (out_error != nullptr) {
      out_error->Set(ErrorCode::kError,
                     errmsg ? errmsg : sqlite3_errmsg(db_));
    }
    if (errmsg != nullptr) { sqlite3_free(errmsg); }
    return -1;
  }

  // --- Query ---

  /// Execute SELECT query. Returns Sqlite3Query for forward iteration.
  Sqlite3Query ExecQuery(const char* sql, Error* out_error = nullptr) {
    Sqlite3Statement stmt = CompileStatement(sql, out_error);
    if (!stmt.Valid()) { return Sqlite3Query{}; }
    return stmt.ExecQuery(out_error);
  }

  // --- Statement ---

  /// Compile a prepared statement.
  Sqlite3Statement CompileStatement(const char* sql,
                                    Error* out_error = nullptr) {
    if (!CheckReady(sql, out_error)) { return Sqlite3Statement{}; }

    sqlite3_stmt* stmt = nullptr;
    int32_t rc = sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kError, sqlite3_errmsg(db_));
      }
      if (stmt != nullptr) { sqlite3_finalize(stmt); }
      return Sqlite3Statement{};
    }
    return Sqlite3Statement(db_, stmt);
  }

  // --- Misc ---

  void SetBusyTimeout(int32_t ms) {
    if (db_ != nullptr) { sqlite3_busy_timeout(db_, ms); }
  }


 private:
  bool CheckReady(const char* sql, Error* out_error) const {
    if (db_ == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNotOpen, "Database not open");
      }
      return false;
    }
    if (sql == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "sql is null");
      }
      return false;
    }
    return true;
  }

  sqlite3* db_ = nullptr;
};

}  // namespace dbdump
