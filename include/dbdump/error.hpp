// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump::Error -- error reporting for the export pipeline.
//
// Design:
//   - ErrorCode enum class with fixed-width underlying type
//   - Error struct: code + fixed-size message buffer
//   - No exceptions: every fallible call returns or fills an Error
//   - One code per failure class of an export run (connection, schema,
//     rows, write) plus the access-layer misuse codes

#pragma once

#include <cstdarg>
#include <cstdint>
#include <cstdio>
#include <cstring>

namespace dbdump {

// ---------------------------------------------------------------------------
// ErrorCode
// ---------------------------------------------------------------------------

enum class ErrorCode : int32_t {
  kOk = 0,
  kError = -1,
  kNotOpen = -2,
  kNullParam = -3,
  kMisuse = -4,
  kConnection = -5,
  kSchemaRead = -6,
  kRowRead = -7,
  kWrite = -8,
};

inline const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kOk:         return "Ok";
    case ErrorCode::kError:      return "Error";
    case ErrorCode::kNotOpen:    return "NotOpen";
    case ErrorCode::kNullParam:  return "NullParam";
    case ErrorCode::kMisuse:     return "Misuse";
    case ErrorCode::kConnection: return "ConnectionError";
    case ErrorCode::kSchemaRead: return "SchemaReadError";
    case ErrorCode::kRowRead:    return "RowReadError";
    case ErrorCode::kWrite:      return "WriteError";
  }
  return "Unknown";
}

// ---------------------------------------------------------------------------
// Error
// ---------------------------------------------------------------------------

struct Error {
  static constexpr uint32_t kMaxMessageLen = 256;

  ErrorCode code = ErrorCode::kOk;
  char message[kMaxMessageLen] = {};

  bool ok() const { return code == ErrorCode::kOk; }
  explicit operator bool() const { return ok(); }

  void Set(ErrorCode c, const char* msg) {
    code = c;
    if (msg != nullptr) {
      std::strncpy(message, msg, kMaxMessageLen - 1);
      message[kMaxMessageLen - 1] = '\0';
    } else {
      message[0] = '\0';
    }
  }

  void SetFormat(ErrorCode c, const char* fmt, ...) {
    code = c;
    if (fmt != nullptr) {
      va_list ap;
      va_start(ap, fmt);
      std::vsnprintf(message, kMaxMessageLen, fmt, ap);
      va_end(ap);
    } else {
      message[0] = '\0';
    }
  }

  void Clear() {
    code = ErrorCode::kOk;
    message[0] = '\0';
  }

  static Error Ok() { return Error{}; }

  static Error Make(ErrorCode c, const char* msg = nullptr) {
    Error e;
    e.Set(c, msg);
    return e;
  }
};

}  // namespace dbdump
