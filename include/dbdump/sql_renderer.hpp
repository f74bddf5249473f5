// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump statement rendering -- MySQL-dialect CREATE TABLE / INSERT text.
//
// Design:
//   - Pure functions over ColumnInfo / Value, no database access
//   - Identifiers in backticks (embedded backticks doubled)
//   - Text literals in single quotes, quotes doubled, nothing else escaped
//   - Cells rendered by their runtime storage class
//   - Blobs as X'..' hex literals
//   - Comment lines never span more than one line

#pragma once

#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "dbdump/schema_reader.hpp"
#include "dbdump/type_mapper.hpp"
#include "dbdump/value.hpp"

namespace dbdump {

// ---------------------------------------------------------------------------
// Literals
// ---------------------------------------------------------------------------

inline std::string QuoteIdentifier(const std::string& name) {
  std::string out;
  out.reserve(name.size() + 2);
  out += '`';
  for (char c : name) {
    if (c == '`') { out += '`'; }
    out += c;
  }
  out += '`';
  return out;
}

inline std::string QuoteString(const std::string& text) {
  std::string out;
  out.reserve(text.size() + 2);
  out += '\'';
  for (char c : text) {
    if (c == '\'') { out += '\''; }
    out += c;
  }
  out += '\'';
  return out;
}

/// "-- <text>" on a single line. Line breaks inside text become spaces so
/// the comment cannot end early.
inline std::string RenderComment(const std::string& text) {
  std::string out = "-- ";
  out.reserve(text.size() + 3);
  for (char c : text) {
    out += (c == '\n' || c == '\r') ? ' ' : c;
  }
  return out;
}

/// Shortest "%.Ng" text that reads back to the same double.
inline std::string FormatDouble(double v) {
  char buf[32];
  for (int precision = 15; precision <= 17; ++precision) {
    std::snprintf(buf, sizeof(buf), "%.*g", precision, v);
    if (std::strtod(buf, nullptr) == v) { break; }
  }
  return buf;
}

inline std::string FormatHexBlob(const std::string& bytes) {
  static const char kDigits[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(bytes.size() * 2 + 3);
  out += "X'";
  for (char c : bytes) {
    uint8_t b = static_cast<uint8_t>(c);
    out += kDigits[b >> 4];
    out += kDigits[b & 0x0F];
  }
  out += '\'';
  return out;
}

inline std::string RenderValue(const Value& value) {
  switch (value.type) {
    case ValueType::kNull:
      return "NULL";
    case ValueType::kInteger:
      return std::to_string(value.integer);
    case ValueType::kFloat:
      if (!std::isfinite(value.real)) {
        spdlog::warn("non-finite float value has no SQL literal, "
                     "rendering NULL");
        return "NULL";
      }
      return FormatDouble(value.real);
    case ValueType::kText:
      return QuoteString(value.bytes);
    case ValueType::kBlob:
      return FormatHexBlob(value.bytes);
  }
  return "NULL";
}

// ---------------------------------------------------------------------------
// Statements
// ---------------------------------------------------------------------------

inline std::string RenderColumnDefinition(const ColumnInfo& col) {
  std::string def = "  " + QuoteIdentifier(col.name) + " " + MapType(col.type);

  if (col.notnull && !col.IsPrimaryKey()) { def += " NOT NULL"; }
  if (col.IsPrimaryKey()) {
    def += " PRIMARY KEY";
    if (IsIntegerAffinity(col.type)) { def += " AUTO_INCREMENT"; }
  }
  // Emitted verbatim: string defaults keep whatever quoting SQLite stored.
  if (col.has_default) { def += " DEFAULT " + col.default_value; }
  return def;
}

inline std::string RenderCreateTable(const std::string& table,
                                     const std::vector<ColumnInfo>& columns) {
  std::string sql = "CREATE TABLE " + QuoteIdentifier(table) + " (\n";
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) { sql += ",\n"; }
    sql += RenderColumnDefinition(columns[i]);
  }
  sql += "\n);";
  return sql;
}

/// "(`a`, `b`)" -- shared by every INSERT of a table.
inline std::string RenderColumnList(const std::vector<ColumnInfo>& columns) {
  std::string list = "(";
  for (size_t i = 0; i < columns.size(); ++i) {
    if (i > 0) { list += ", "; }
    list += QuoteIdentifier(columns[i].name);
  }
  list += ")";
  return list;
}

/// values[i] belongs to column i; missing trailing cells render as NULL.
inline std::string RenderInsert(const std::string& table,
                                const std::string& column_list,
                                const std::vector<Value>& values,
                                size_t column_count) {
  std::string sql = "INSERT INTO " + QuoteIdentifier(table) + " " +
                    column_list + " VALUES (";
  for (size_t i = 0; i < column_count; ++i) {
    if (i > 0) { sql += ", "; }
    sql += (i < values.size()) ? RenderValue(values[i]) : "NULL";
  }
  sql += ");";
  return sql;
}

}  // namespace dbdump
