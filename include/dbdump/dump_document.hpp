// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump::DumpDocument -- ordered output lines of one export run.
//
// Design:
//   - Explicit builder owned by the exporter, never global
//   - Lines are joined with '\n' (no trailing newline added)
//   - WriteTo() opens, writes and closes the destination exactly once,
//     truncating any previous content

#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <string>
#include <utility>
#include <vector>

#include "dbdump/error.hpp"

namespace dbdump {

class DumpDocument {
 public:
  void AppendLine(std::string line) { lines_.push_back(std::move(line)); }
  void AppendBlank() { lines_.emplace_back(); }

  size_t LineCount() const { return lines_.size(); }

  std::string Join() const {
    size_t total = 0;
    for (const auto& line : lines_) { total += line.size() + 1; }

    std::string out;
    out.reserve(total);
    for (size_t i = 0; i < lines_.size(); ++i) {
      if (i > 0) { out += '\n'; }
      out += lines_[i];
    }
    return out;
  }

  /// Write the joined document to path. Returns bytes written, -1 on error.
  int64_t WriteTo(const char* path, Error* out_error = nullptr) const {
    if (path == nullptr) {
      if (out_error != nullptr) {
        out_error->Set(ErrorCode::kNullParam, "path is null");
      }
      return -1;
    }

    const std::string content = Join();
    std::FILE* fp = std::fopen(path, "wb");
    if (fp == nullptr) {
      if (out_error != nullptr) {
        out_error->SetFormat(ErrorCode::kWrite, "cannot open '%s': %s", path,
                             std::strerror(errno));
      }
      return -1;
    }

    errno = 0;
    size_t written = std::fwrite(content.data(), 1, content.size(), fp);
    bool failed = written != content.size();
    int err_no = failed ? errno : 0;
    if (std::fflush(fp) != 0 && !failed) {
      failed = true;
      err_no = errno;
    }
    if (std::fclose(fp) != 0 && !failed) {
      failed = true;
      err_no = errno;
    }

    if (failed) {
      if (out_error != nullptr) {
        out_error->SetFormat(ErrorCode::kWrite, "cannot write '%s': %s", path,
                             std::strerror(err_no != 0 ? err_no : EIO));
      }
      return -1;
    }
    return static_cast<int64_t>(written);
  }

 private:
  std::vector<std::string> lines_;
};

}  // namespace dbdump
