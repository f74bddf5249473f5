// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump::BasicExporter<Reader> -- one SQLite-to-SQL export run.
//
// Design:
//   - Template over the schema source, default SchemaReader (SQLite3)
//   - Tables processed sequentially in ListTables() order
//   - The whole document is built in memory and written once at the end;
//     any failure aborts the run before anything is written
//   - Observable state machine:
//       Idle -> Connecting -> (ReadingSchema -> ReadingRows -> Rendering)*
//            -> Writing -> Done, and Failed from any state
//
// Usage:
//   dbdump::Exporter exporter;
//   dbdump::ExportStats stats;
//   dbdump::Error err = exporter.Export("app.db", "app_export.sql", &stats);
//   if (!err.ok()) { ... err.message ... }

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "dbdump/dump_document.hpp"
#include "dbdump/error.hpp"
#include "dbdump/schema_reader.hpp"
#include "dbdump/sql_renderer.hpp"
#include "dbdump/value.hpp"

namespace dbdump {

// ---------------------------------------------------------------------------
// ExportState
// ---------------------------------------------------------------------------

enum class ExportState : uint8_t {
  kIdle = 0,
  kConnecting,
  kReadingSchema,
  kReadingRows,
  kRendering,
  kWriting,
  kDone,
  kFailed,
};

inline const char* ExportStateName(ExportState state) {
  switch (state) {
    case ExportState::kIdle:          return "Idle";
    case ExportState::kConnecting:    return "Connecting";
    case ExportState::kReadingSchema: return "ReadingSchema";
    case ExportState::kReadingRows:   return "ReadingRows";
    case ExportState::kRendering:     return "Rendering";
    case ExportState::kWriting:       return "Writing";
    case ExportState::kDone:          return "Done";
    case ExportState::kFailed:        return "Failed";
  }
  return "Unknown";
}

// ---------------------------------------------------------------------------
// ExportOptions / ExportStats
// ---------------------------------------------------------------------------

struct ExportOptions {
  // Wait this long for a locked source before failing.
  int32_t busy_timeout_ms = 5000;

  // Value of the "Generated on" header line. Empty means current UTC time.
  std::string generated_at;

  std::string banner = "-- Exported from SQLite database";
};

struct ExportStats {
  uint32_t tables = 0;
  uint64_t rows = 0;
  size_t lines = 0;
  int64_t bytes = 0;
};

/// ISO-8601 UTC with milliseconds, e.g. "2026-10-19T08:15:30.123Z".
inline std::string CurrentTimestamp() {
  using std::chrono::duration_cast;
  using std::chrono::milliseconds;
  using std::chrono::system_clock;

  const system_clock::time_point now = system_clock::now();
  const int64_t ms_total =
      duration_cast<milliseconds>(now.time_since_epoch()).count();
  const std::time_t secs = static_cast<std::time_t>(ms_total / 1000);

  std::tm tm{};
  gmtime_r(&secs, &tm);  // POSIX

  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour,
                tm.tm_min, tm.tm_sec, static_cast<int>(ms_total % 1000));
  return buf;
}

// ---------------------------------------------------------------------------
// BasicExporter<Reader>
// ---------------------------------------------------------------------------

template <typename Reader = SchemaReader>
class BasicExporter {
 public:
  using CursorType = typename Reader::Cursor;

  BasicExporter() = default;

  explicit BasicExporter(ExportOptions options)
      : options_(std::move(options)) {}

  BasicExporter(Reader reader, ExportOptions options)
      : reader_(std::move(reader)), options_(std::move(options)) {}

  // No copy
  BasicExporter(const BasicExporter&) = delete;
  BasicExporter& operator=(const BasicExporter&) = delete;

  /// Export every user table of source_path into destination_path.
  Error Export(const char* source_path, const char* destination_path,
               ExportStats* out_stats = nullptr) {
    state_ = ExportState::kIdle;
    ExportStats stats;

    if (destination_path == nullptr) {
      return Fail(Error::Make(ErrorCode::kNullParam,
                              "destination path is null"));
    }

    DumpDocument doc;
    Error err = BuildDocument(source_path, &doc, &stats);
    if (!err.ok()) { return Fail(err); }

    state_ = ExportState::kWriting;
    int64_t bytes = doc.WriteTo(destination_path, &err);
    if (bytes < 0) { return Fail(err); }

    stats.lines = doc.LineCount();
    stats.bytes = bytes;
    state_ = ExportState::kDone;
    spdlog::info("export completed: {} tables, {} rows, {} lines -> {}",
                 stats.tables, stats.rows, stats.lines, destination_path);

    if (out_stats != nullptr) { *out_stats = stats; }
    return Error::Ok();
  }

  ExportState State() const { return state_; }
  Reader& GetReader() { return reader_; }

 private:
  // Closes the reader on every exit path of BuildDocument().
  struct ReaderCloser {
    Reader& reader;
    ~ReaderCloser() { reader.Close(); }
  };

  Error BuildDocument(const char* source_path, DumpDocument* doc,
                      ExportStats* stats) {
    if (source_path == nullptr) {
      return Error::Make(ErrorCode::kNullParam, "source path is null");
    }

    state_ = ExportState::kConnecting;
    Error err = reader_.Open(source_path, options_.busy_timeout_ms);
    if (!err.ok()) { return err; }
    ReaderCloser closer{reader_};

    std::vector<std::string> tables;
    err = reader_.ListTables(&tables);
    if (!err.ok()) { return err; }
    spdlog::info("found {} tables to export in {}", tables.size(),
                 source_path);

    doc->AppendLine(options_.banner);
    doc->AppendLine("-- Generated on " + (options_.generated_at.empty()
                                              ? CurrentTimestamp()
                                              : options_.generated_at));
    doc->AppendBlank();

    for (const std::string& table : tables) {
      err = ExportTable(table, doc, stats);
      if (!err.ok()) { return err; }
      ++stats->tables;
    }
    return Error::Ok();
  }

  Error ExportTable(const std::string& table, DumpDocument* doc,
                    ExportStats* stats) {
    spdlog::info("exporting table: {}", table);

    state_ = ExportState::kReadingSchema;
    std::vector<ColumnInfo> columns;
    Error err = reader_.Columns(table, &columns);
    if (!err.ok()) { return err; }

    state_ = ExportState::kRendering;
    doc->AppendLine(RenderComment("Table: " + table));
    doc->AppendLine(RenderCreateTable(table, columns));
    doc->AppendBlank();

    state_ = ExportState::kReadingRows;
    CursorType cursor = reader_.ScanRows(table, columns, &err);
    if (!err.ok()) { return err; }

    const std::string column_list = RenderColumnList(columns);
    std::vector<Value> values;
    values.reserve(columns.size());
    uint64_t rows = 0;

    while (!cursor.Eof()) {
      values.clear();
      const int32_t cells = std::min(cursor.NumFields(),
                                     static_cast<int32_t>(columns.size()));
      for (int32_t i = 0; i < cells; ++i) {
        values.push_back(cursor.GetValue(i));
      }

      state_ = ExportState::kRendering;
      if (rows == 0) {
        doc->AppendLine(RenderComment("Data for table: " + table));
      }
      doc->AppendLine(RenderInsert(table, column_list, values,
                                   columns.size()));
      ++rows;

      state_ = ExportState::kReadingRows;
      reader_.NextRow(table, cursor, &err);
      if (!err.ok()) { return err; }
    }
    if (rows > 0) { doc->AppendBlank(); }

    spdlog::debug("table {}: {} columns, {} rows", table, columns.size(),
                  rows);
    stats->rows += rows;
    return Error::Ok();
  }

  Error Fail(const Error& err) {
    spdlog::error("export failed in state {} ({}): {}",
                  ExportStateName(state_), ErrorCodeName(err.code),
                  err.message);
    state_ = ExportState::kFailed;
    return err;
  }

  Reader reader_;
  ExportOptions options_;
  ExportState state_ = ExportState::kIdle;
};

// ---------------------------------------------------------------------------
// Default alias and one-call entry point
// ---------------------------------------------------------------------------

using Exporter = BasicExporter<SchemaReader>;

/// Export source_path into destination_path with a fresh SQLite exporter.
inline Error Export(const char* source_path, const char* destination_path,
                    const ExportOptions& options = ExportOptions{},
                    ExportStats* out_stats = nullptr) {
  Exporter exporter(options);
  return exporter.Export(source_path, destination_path, out_stats);
}

}  // namespace dbdump
