// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump::SchemaReader -- structural facts of a SQLite source database.
//
// Design:
//   - Owns the single read-only Sqlite3Db of an export run
//   - ListTables(): user tables only, BINARY-collated name order
//   - Columns(): pragma_table_info() in declaration order
//   - ScanRows(): streaming cursor whose select list follows the column
//     metadata, so cell i is always column i
//   - Failures carry the export error class and the table name
//
// Any type with the same members (Open/Close/ListTables/Columns/ScanRows/
// NextRow and a Cursor alias) can stand in for it in BasicExporter<Reader>.

#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "dbdump/error.hpp"
#include "dbdump/sqlite3_db.hpp"

namespace dbdump {

// ---------------------------------------------------------------------------
// ColumnInfo -- one row of PRAGMA table_info
// ---------------------------------------------------------------------------

struct ColumnInfo {
  int32_t cid = 0;
  std::string name;
  std::string type;          // declared type, free-form, may be empty
  bool notnull = false;
  bool has_default = false;
  std::string default_value; // raw text as SQLite reports it
  int32_t pk = 0;            // 1-based position in the primary key, 0 if none

  bool IsPrimaryKey() const { return pk > 0; }
};

/// Wrap an identifier in double quotes for use in a SQLite statement.
inline std::string QuoteSqliteIdentifier(const std::string& name) {
  std::string out;
  out.reserve(name.size() + 2);
  out += '"';
  for (char c : name) {
    if (c == '"') { out += '"'; }
    out += c;
  }
  out += '"';
  return out;
}

// ---------------------------------------------------------------------------
// SchemaReader
// ---------------------------------------------------------------------------

class SchemaReader {
 public:
  using Cursor = Sqlite3Query;

  SchemaReader() = default;
  ~SchemaReader() = default;

  SchemaReader(SchemaReader&&) noexcept = default;
  SchemaReader& operator=(SchemaReader&&) noexcept = default;

  // No copy
  SchemaReader(const SchemaReader&) = delete;
  SchemaReader& operator=(const SchemaReader&) = delete;

  Error Open(const char* path, int32_t busy_timeout_ms = 0) {
    Error err = db_.Open(path, OpenMode::kReadOnly);
    if (!err.ok()) {
      Error out;
      out.SetFormat(ErrorCode::kConnection, "cannot open '%s': %s",
                    path != nullptr ? path : "(null)", err.message);
      return out;
    }
    if (busy_timeout_ms > 0) { db_.SetBusyTimeout(busy_timeout_ms); }
    return Error::Ok();
  }

  void Close() { db_.Close(); }
  bool IsOpen() const { return db_.IsOpen(); }

  /// User tables sorted by name. Internal sqlite_* tables are skipped.
  Error ListTables(std::vector<std::string>* out) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    out->clear();

    Error err;
    Sqlite3Query q = db_.ExecQuery(
        "SELECT name FROM sqlite_master "
        "WHERE type = 'table' AND name NOT LIKE 'sqlite\\_%' ESCAPE '\\' "
        "ORDER BY name;",
        &err);
    while (err.ok() && !q.Eof()) {
      out->push_back(q.GetString(0));
      q.NextRow(&err);
    }
    if (!err.ok()) {
      out->clear();
      Error failed;
      failed.SetFormat(ErrorCode::kConnection, "cannot list tables: %s",
                       err.message);
      return failed;
    }
    return Error::Ok();
  }

  /// Column metadata of one table, ordered by cid.
  Error Columns(const std::string& table, std::vector<ColumnInfo>* out) {
    if (out == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "out is null");
    }
    out->clear();

    Error err;
    Sqlite3Statement stmt = db_.CompileStatement(
        "SELECT cid, name, type, \"notnull\", dflt_value, pk "
        "FROM pragma_table_info(?) ORDER BY cid;",
        &err);
    if (err.ok()) { err = stmt.Bind(1, table); }

    Sqlite3Query q;
    if (err.ok()) { q = stmt.ExecQuery(&err); }
    while (err.ok() && !q.Eof()) {
      ColumnInfo col;
      col.cid = q.GetInt(0);
      col.name = q.GetString(1);
      col.type = q.GetString(2);
      col.notnull = q.GetInt(3) != 0;
      col.has_default = !q.FieldIsNull(4);
      col.default_value = q.GetString(4);
      col.pk = q.GetInt(5);
      out->push_back(std::move(col));
      q.NextRow(&err);
    }

    Error failed;
    if (!err.ok()) {
      out->clear();
      failed.SetFormat(ErrorCode::kSchemaRead,
                       "cannot read columns of table '%s': %s",
                       table.c_str(), err.message);
      return failed;
    }
    if (out->empty()) {
      failed.SetFormat(ErrorCode::kSchemaRead,
                       "table '%s' not found or has no columns",
                       table.c_str());
      return failed;
    }
    return Error::Ok();
  }

  /// Start a full scan of table in storage order. The cursor is positioned
  /// on the first row (or at Eof for an empty table).
  Cursor ScanRows(const std::string& table,
                  const std::vector<ColumnInfo>& columns,
                  Error* out_error = nullptr) {
    std::string sql = "SELECT ";
    for (size_t i = 0; i < columns.size(); ++i) {
      if (i > 0) { sql += ", "; }
      sql += QuoteSqliteIdentifier(columns[i].name);
    }
    if (columns.empty()) { sql += "*"; }
    sql += " FROM ";
    sql += QuoteSqliteIdentifier(table);
    sql += ";";

    Error err;
    Sqlite3Query q = db_.ExecQuery(sql.c_str(), &err);
    if (!err.ok()) {
      if (out_error != nullptr) {
        out_error->SetFormat(ErrorCode::kRowRead,
                             "cannot scan rows of table '%s': %s",
                             table.c_str(), err.message);
      }
      return Cursor{};
    }
    return q;
  }

  /// Step a cursor returned by ScanRows(), tagging failures as row errors.
  void NextRow(const std::string& table, Cursor& cursor,
               Error* out_error = nullptr) {
    Error err;
    cursor.NextRow(&err);
    if (!err.ok() && out_error != nullptr) {
      out_error->SetFormat(ErrorCode::kRowRead,
                           "row scan of table '%s' failed: %s",
                           table.c_str(), err.message);
    }
  }

 private:
  Sqlite3Db db_;
};

}  // namespace dbdump
