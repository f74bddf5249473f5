// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump output path helpers for the command-line tool.

#pragma once

#include <filesystem>
#include <string>
#include <system_error>

#include "dbdump/error.hpp"

namespace dbdump {

/// "<dir>/<stem>_export.sql" next to the input file.
inline std::string DefaultOutputPath(const std::string& input_path) {
  const std::filesystem::path input(input_path);
  std::filesystem::path out = input.parent_path();
  out /= input.stem().string() + "_export.sql";
  return out.string();
}

/// Create the parent directory of output_path (recursively) if missing.
inline Error EnsureParentDirectory(const std::string& output_path) {
  const std::filesystem::path parent =
      std::filesystem::path(output_path).parent_path();
  if (parent.empty() || parent == ".") { return Error::Ok(); }

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  if (ec) {
    Error err;
    err.SetFormat(ErrorCode::kWrite, "cannot create directory '%s': %s",
                  parent.string().c_str(), ec.message().c_str());
    return err;
  }
  return Error::Ok();
}

}  // namespace dbdump
