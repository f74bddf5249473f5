// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump type mapping -- SQLite declared type to target column type.
//
// Case-insensitive substring rules, first match wins:
//   int -> INT, text -> TEXT, real/float/double -> DECIMAL(10,2),
//   blob -> BLOB, char -> declared type uppercased, anything else -> TEXT.

#pragma once

#include <cctype>
#include <string>

namespace dbdump {

namespace detail {

inline std::string ToLower(const std::string& s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  }
  return out;
}

inline std::string ToUpper(const std::string& s) {
  std::string out(s);
  for (char& c : out) {
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

inline bool Contains(const std::string& haystack, const char* needle) {
  return haystack.find(needle) != std::string::npos;
}

}  // namespace detail

/// True when the declared type has integer affinity ("int" anywhere).
inline bool IsIntegerAffinity(const std::string& declared) {
  return detail::Contains(detail::ToLower(declared), "int");
}

inline std::string MapType(const std::string& declared) {
  const std::string type = detail::ToLower(declared);

  if (detail::Contains(type, "int")) { return "INT"; }
  if (detail::Contains(type, "text")) { return "TEXT"; }
  if (detail::Contains(type, "real") || detail::Contains(type, "float") ||
      detail::Contains(type, "double")) {
    return "DECIMAL(10,2)";
  }
  if (detail::Contains(type, "blob")) { return "BLOB"; }
  // Covers VARCHAR/NCHAR/CHARACTER; keeps the length qualifier.
  if (detail::Contains(type, "char")) { return detail::ToUpper(declared); }

  // Untyped or unrecognized columns are legal in SQLite.
  return "TEXT";
}

}  // namespace dbdump
