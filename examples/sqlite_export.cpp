// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump command-line tool -- export a SQLite file as a SQL dump.
//
// Usage:
//   ./dbdump_sqlite_export <sqlite-file> [output-file]
//   ./dbdump_sqlite_export --help

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include "dbdump/dbdump.hpp"
#include "dbdump/output_path.hpp"

namespace po = boost::program_options;
namespace fs = std::filesystem;

namespace {

void PrintUsage(const po::options_description& desc) {
  std::cout
      << "Usage:\n"
      << "  dbdump_sqlite_export <sqlite-file> [output-file]\n"
      << "  dbdump_sqlite_export --help\n\n"
      << "Arguments:\n"
      << "  <sqlite-file>    Path to the SQLite database file (.db)\n"
      << "  [output-file]    Output SQL file (default: <input>_export.sql "
         "next to the input)\n\n"
      << "Examples:\n"
      << "  dbdump_sqlite_export my-database.db\n"
      << "  dbdump_sqlite_export ./data/products.db ./exports/products.sql\n\n"
      << desc << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
  std::string input_file;
  std::string output_file;

  po::options_description desc("Options");
  desc.add_options()
      ("help,h", "show this help message")
      ("verbose,v", "log per-table details")
      ("quiet,q", "log errors only")
      ("input", po::value<std::string>(&input_file), "SQLite database file")
      ("output", po::value<std::string>(&output_file), "output SQL file");

  po::positional_options_description positional;
  positional.add("input", 1);
  positional.add("output", 1);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(desc)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    std::fprintf(stderr, "Error: %s\n\n", e.what());
    PrintUsage(desc);
    return 1;
  }

  if (vm.count("help") != 0 || input_file.empty()) {
    PrintUsage(desc);
    return 0;
  }

  if (vm.count("verbose") != 0) {
    spdlog::set_level(spdlog::level::debug);
  } else if (vm.count("quiet") != 0) {
    spdlog::set_level(spdlog::level::err);
  }

  if (output_file.empty()) {
    output_file = dbdump::DefaultOutputPath(input_file);
  }

  std::error_code ec;
  if (!fs::exists(input_file, ec)) {
    spdlog::error("SQLite file '{}' not found", input_file);
    return 1;
  }
  if (!fs::is_regular_file(input_file, ec)) {
    spdlog::error("'{}' is not a file", input_file);
    return 1;
  }

  dbdump::Error err = dbdump::EnsureParentDirectory(output_file);
  if (!err.ok()) {
    spdlog::error("{}", err.message);
    return 1;
  }

  spdlog::info("input file:  {}", fs::absolute(input_file, ec).string());
  spdlog::info("output file: {}", fs::absolute(output_file, ec).string());

  dbdump::ExportStats stats;
  err = dbdump::Export(input_file.c_str(), output_file.c_str(),
                       dbdump::ExportOptions{}, &stats);
  if (!err.ok()) {
    spdlog::error("export failed: {}", err.message);
    spdlog::error("make sure the SQLite file is valid and not corrupted");
    return 1;
  }

  spdlog::info("SQL export completed: {}", output_file);
  spdlog::info("total lines: {}, tables: {}, rows: {}", stats.lines,
               stats.tables, stats.rows);
  spdlog::info("file size: {} bytes", stats.bytes);
  return 0;
}
