// Copyright (c) 2024 liudegui. MIT License.
// Tests for dbdump::BasicExporter (SQLite sources and a scripted reader).

#include <catch2/catch.hpp>
#include <filesystem>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

#include "dbdump/exporter.hpp"
#include "test_helpers.hpp"

using namespace dbdump;
using dbdump_test::TempPath;

static const char* kFixedTime = "2026-01-01T00:00:00.000Z";

static ExportOptions FixedOptions() {
  ExportOptions opts;
  opts.generated_at = kFixedTime;
  return opts;
}

static std::vector<std::string> SplitLines(const std::string& text) {
  std::vector<std::string> lines;
  std::istringstream in(text);
  std::string line;
  while (std::getline(in, line)) { lines.push_back(line); }
  return lines;
}

static size_t CountOf(const std::string& text, const std::string& needle) {
  size_t n = 0;
  for (size_t pos = text.find(needle); pos != std::string::npos;
       pos = text.find(needle, pos + needle.size())) {
    ++n;
  }
  return n;
}

// ---------------------------------------------------------------------------
// ScriptedReader -- in-memory reader with injectable failures
// ---------------------------------------------------------------------------

struct ScriptedTable {
  std::string name;
  std::vector<ColumnInfo> columns;
  std::vector<std::vector<Value>> rows;
  bool fail_columns = false;
  int fail_at_row = -1;  // NextRow() fails when leaving this row index
};

class ScriptedCursor {
 public:
  ScriptedCursor() = default;
  explicit ScriptedCursor(const ScriptedTable* table) : table_(table) {}

  bool Eof() const {
    return table_ == nullptr || failed_ || row_ >= table_->rows.size();
  }
  int32_t NumFields() const {
    return static_cast<int32_t>(table_->rows[row_].size());
  }
  Value GetValue(int32_t col) const { return table_->rows[row_][col]; }

  void NextRow(Error* out_error) {
    if (table_->fail_at_row == static_cast<int>(row_)) {
      failed_ = true;
      out_error->Set(ErrorCode::kError, "disk I/O error");
      return;
    }
    ++row_;
  }

 private:
  const ScriptedTable* table_ = nullptr;
  size_t row_ = 0;
  bool failed_ = false;
};

class ScriptedReader {
 public:
  using Cursor = ScriptedCursor;

  std::vector<ScriptedTable> tables;
  bool fail_open = false;
  int close_calls = 0;
  int columns_calls = 0;
  bool open = false;

  Error Open(const char*, int32_t) {
    if (fail_open) {
      return Error::Make(ErrorCode::kConnection, "database is locked");
    }
    open = true;
    return Error::Ok();
  }

  void Close() {
    open = false;
    ++close_calls;
  }

  Error ListTables(std::vector<std::string>* out) {
    out->clear();
    for (const auto& t : tables) { out->push_back(t.name); }
    return Error::Ok();
  }

  Error Columns(const std::string& table, std::vector<ColumnInfo>* out) {
    ++columns_calls;
    const ScriptedTable* t = Find(table);
    if (t->fail_columns) {
      Error err;
      err.SetFormat(ErrorCode::kSchemaRead,
                    "cannot read columns of table '%s'", table.c_str());
      return err;
    }
    *out = t->columns;
    return Error::Ok();
  }

  Cursor ScanRows(const std::string& table, const std::vector<ColumnInfo>&,
                  Error*) {
    return Cursor(Find(table));
  }

  void NextRow(const std::string& table, Cursor& cursor, Error* out_error) {
    Error err;
    cursor.NextRow(&err);
    if (!err.ok()) {
      out_error->SetFormat(ErrorCode::kRowRead,
                           "row scan of table '%s' failed: %s",
                           table.c_str(), err.message);
    }
  }

 private:
  const ScriptedTable* Find(const std::string& name) const {
    for (const auto& t : tables) {
      if (t.name == name) { return &t; }
    }
    return nullptr;
  }
};

static ColumnInfo Column(const char* name, const char* type, int32_t pk = 0) {
  ColumnInfo col;
  col.name = name;
  col.type = type;
  col.pk = pk;
  return col;
}

static ScriptedTable SimpleTable(const char* name, int rows) {
  ScriptedTable t;
  t.name = name;
  t.columns = {Column("id", "INTEGER", 1), Column("label", "TEXT")};
  for (int i = 0; i < rows; ++i) {
    t.rows.push_back({Value::Integer(i + 1), Value::Text("row")});
  }
  return t;
}

// ---------------------------------------------------------------------------
// SQLite sources
// ---------------------------------------------------------------------------

TEST_CASE("Exporter: items example end to end", "[exporter]") {
  TempPath db(".db");
  TempPath out(".sql");
  dbdump_test::CreateDb(
      db.str(),
      "CREATE TABLE items(id INTEGER PRIMARY KEY, name TEXT NOT NULL, "
      "price REAL);"
      "INSERT INTO items VALUES (1, 'Tea', 3.5);"
      "INSERT INTO items VALUES (2, 'O''Brien''s Mug', NULL);");

  Exporter exporter(FixedOptions());
  REQUIRE(exporter.State() == ExportState::kIdle);
  Error err = exporter.Export(db.c_str(), out.c_str());
  REQUIRE(err.ok());
  REQUIRE(exporter.State() == ExportState::kDone);

  REQUIRE(dbdump_test::ReadFile(out.str()) ==
          "-- Exported from SQLite database\n"
          "-- Generated on 2026-01-01T00:00:00.000Z\n"
          "\n"
          "-- Table: items\n"
          "CREATE TABLE `items` (\n"
          "  `id` INT PRIMARY KEY AUTO_INCREMENT,\n"
          "  `name` TEXT NOT NULL,\n"
          "  `price` DECIMAL(10,2)\n"
          ");\n"
          "\n"
          "-- Data for table: items\n"
          "INSERT INTO `items` (`id`, `name`, `price`) "
          "VALUES (1, 'Tea', 3.5);\n"
          "INSERT INTO `items` (`id`, `name`, `price`) "
          "VALUES (2, 'O''Brien''s Mug', NULL);\n");
}

TEST_CASE("Exporter: tables in lexicographic order, one definition each",
          "[exporter]") {
  TempPath db(".db");
  TempPath out(".sql");
  dbdump_test::CreateDb(db.str(),
                        "CREATE TABLE zebra(a INTEGER);"
                        "CREATE TABLE apple(a INTEGER);"
                        "CREATE TABLE mango(a INTEGER);"
                        "CREATE TABLE seq(id INTEGER PRIMARY KEY "
                        "AUTOINCREMENT);"
                        "INSERT INTO seq DEFAULT VALUES;");

  ExportStats stats;
  REQUIRE(Exporter(FixedOptions()).Export(db.c_str(), out.c_str(), &stats)
              .ok());
  const std::string dump = dbdump_test::ReadFile(out.str());

  REQUIRE(CountOf(dump, "CREATE TABLE ") == 4);
  REQUIRE(CountOf(dump, "sqlite_sequence") == 0);
  size_t apple = dump.find("CREATE TABLE `apple`");
  size_t mango = dump.find("CREATE TABLE `mango`");
  size_t seq = dump.find("CREATE TABLE `seq`");
  size_t zebra = dump.find("CREATE TABLE `zebra`");
  REQUIRE(apple < mango);
  REQUIRE(mango < seq);
  REQUIRE(seq < zebra);
  REQUIRE(stats.tables == 4);
  REQUIRE(stats.rows == 1);
}

TEST_CASE("Exporter: empty table has no data section", "[exporter]") {
  TempPath db(".db");
  TempPath out(".sql");
  dbdump_test::CreateDb(db.str(), "CREATE TABLE empty(id INTEGER, v TEXT);");

  REQUIRE(Exporter(FixedOptions()).Export(db.c_str(), out.c_str()).ok());
  const std::string dump = dbdump_test::ReadFile(out.str());

  REQUIRE(CountOf(dump, "CREATE TABLE `empty`") == 1);
  REQUIRE(CountOf(dump, "INSERT INTO") == 0);
  REQUIRE(CountOf(dump, "-- Data for table") == 0);
  REQUIRE(dump.size() >= 2);
  REQUIRE(dump.substr(dump.size() - 2) == ";\n");
}

TEST_CASE("Exporter: database without tables writes the header only",
          "[exporter]") {
  TempPath db(".db");
  TempPath out(".sql");
  dbdump_test::CreateDb(db.str(), "PRAGMA user_version = 1;");

  ExportStats stats;
  REQUIRE(Exporter(FixedOptions()).Export(db.c_str(), out.c_str(), &stats)
              .ok());
  REQUIRE(dbdump_test::ReadFile(out.str()) ==
          "-- Exported from SQLite database\n"
          "-- Generated on 2026-01-01T00:00:00.000Z\n");
  REQUIRE(stats.tables == 0);
  REQUIRE(stats.lines == 3);
}

TEST_CASE("Exporter: cells follow their runtime storage class",
          "[exporter]") {
  TempPath db(".db");
  TempPath out(".sql");
  dbdump_test::CreateDb(db.str(),
                        "CREATE TABLE loose(tag TEXT, payload BLOB, n);"
                        "INSERT INTO loose VALUES (12, x'CAFE', 'seven');"
                        "INSERT INTO loose VALUES ('x', 'plain', 2.5);");

  REQUIRE(Exporter(FixedOptions()).Export(db.c_str(), out.c_str()).ok());
  const std::string dump = dbdump_test::ReadFile(out.str());

  // TEXT affinity stores 12 as text; the blob stays a blob.
  REQUIRE(CountOf(dump, "VALUES ('12', X'CAFE', 'seven');") == 1);
  REQUIRE(CountOf(dump, "VALUES ('x', 'plain', 2.5);") == 1);
  REQUIRE(CountOf(dump, "  `n` TEXT\n") == 1);
}

TEST_CASE("Exporter: primary keys and defaults from a real schema",
          "[exporter]") {
  TempPath db(".db");
  TempPath out(".sql");
  dbdump_test::CreateDb(db.str(),
                        "CREATE TABLE users("
                        "  code VARCHAR(8) PRIMARY KEY,"
                        "  status TEXT NOT NULL DEFAULT 'active',"
                        "  score INTEGER DEFAULT 0);");

  REQUIRE(Exporter(FixedOptions()).Export(db.c_str(), out.c_str()).ok());
  const std::string dump = dbdump_test::ReadFile(out.str());

  REQUIRE(CountOf(dump, "  `code` VARCHAR(8) PRIMARY KEY,\n") == 1);
  REQUIRE(CountOf(dump, "AUTO_INCREMENT") == 0);
  REQUIRE(CountOf(dump,
                  "  `status` TEXT NOT NULL DEFAULT 'active',\n") == 1);
  REQUIRE(CountOf(dump, "  `score` INT DEFAULT 0\n") == 1);
}

TEST_CASE("Exporter: line breaks in a table name stay inside comments",
          "[exporter]") {
  TempPath db(".db");
  TempPath out(".sql");
  dbdump_test::CreateDb(db.str(),
                        "CREATE TABLE \"x\nDROP TABLE items;\"(c TEXT);"
                        "INSERT INTO \"x\nDROP TABLE items;\" "
                        "VALUES ('v');");

  REQUIRE(Exporter(FixedOptions()).Export(db.c_str(), out.c_str()).ok());
  const auto lines = SplitLines(dbdump_test::ReadFile(out.str()));

  size_t table_comments = 0;
  size_t data_comments = 0;
  for (const auto& line : lines) {
    REQUIRE(line != "DROP TABLE items;");
    if (line == "-- Table: x DROP TABLE items;") { ++table_comments; }
    if (line == "-- Data for table: x DROP TABLE items;") { ++data_comments; }
  }
  REQUIRE(table_comments == 1);
  REQUIRE(data_comments == 1);
}

TEST_CASE("Exporter: repeated runs are byte-identical", "[exporter]") {
  TempPath db(".db");
  TempPath out(".sql");
  dbdump_test::CreateDb(db.str(),
                        "CREATE TABLE t(id INTEGER PRIMARY KEY, v REAL);"
                        "INSERT INTO t VALUES (1, 0.1), (2, 1e300);");

  REQUIRE(Exporter(FixedOptions()).Export(db.c_str(), out.c_str()).ok());
  const std::string first = dbdump_test::ReadFile(out.str());
  REQUIRE(Exporter(FixedOptions()).Export(db.c_str(), out.c_str()).ok());
  REQUIRE(dbdump_test::ReadFile(out.str()) == first);
}

TEST_CASE("Exporter: default timestamp only changes the header line",
          "[exporter]") {
  TempPath db(".db");
  TempPath out1(".sql");
  TempPath out2(".sql");
  dbdump_test::CreateDb(db.str(),
                        "CREATE TABLE t(id INTEGER);"
                        "INSERT INTO t VALUES (1);");

  Exporter exporter;
  REQUIRE(exporter.Export(db.c_str(), out1.c_str()).ok());
  REQUIRE(exporter.Export(db.c_str(), out2.c_str()).ok());

  auto lines1 = SplitLines(dbdump_test::ReadFile(out1.str()));
  auto lines2 = SplitLines(dbdump_test::ReadFile(out2.str()));
  REQUIRE(lines1.size() == lines2.size());

  const std::string prefix = "-- Generated on ";
  REQUIRE(lines1[1].compare(0, prefix.size(), prefix) == 0);
  const std::string stamp = lines1[1].substr(prefix.size());
  REQUIRE(stamp.size() == 24);  // 2026-10-19T08:15:30.123Z
  REQUIRE(stamp[10] == 'T');
  REQUIRE(stamp.back() == 'Z');

  lines1[1].clear();
  lines2[1].clear();
  REQUIRE(lines1 == lines2);
}

TEST_CASE("Exporter: stats match the written file", "[exporter]") {
  TempPath db(".db");
  TempPath out(".sql");
  dbdump_test::CreateDb(db.str(),
                        "CREATE TABLE a(x INTEGER);"
                        "CREATE TABLE b(y TEXT);"
                        "INSERT INTO a VALUES (1), (2), (3);"
                        "INSERT INTO b VALUES ('q');");

  ExportStats stats;
  REQUIRE(Export(db.c_str(), out.c_str(), FixedOptions(), &stats).ok());
  REQUIRE(stats.tables == 2);
  REQUIRE(stats.rows == 4);
  REQUIRE(stats.bytes ==
          static_cast<int64_t>(std::filesystem::file_size(out.str())));
  // header(3) + a: comment, create, blank, data comment, 3 rows, blank
  // + b: comment, create, blank, data comment, 1 row, blank
  REQUIRE(stats.lines == 3 + 8 + 6);
}

TEST_CASE("Exporter: missing source fails before writing", "[exporter]") {
  TempPath db(".db");
  TempPath out(".sql");

  Exporter exporter(FixedOptions());
  Error err = exporter.Export(db.c_str(), out.c_str());
  REQUIRE(err.code == ErrorCode::kConnection);
  REQUIRE(exporter.State() == ExportState::kFailed);
  REQUIRE_FALSE(std::filesystem::exists(out.str()));
  REQUIRE_FALSE(std::filesystem::exists(db.str()));
}

TEST_CASE("Exporter: invalid database leaves destination untouched",
          "[exporter]") {
  TempPath db(".db");
  TempPath out(".sql");
  dbdump_test::WriteFile(db.str(),
                         "plain text pretending to be a database file, "
                         "long enough to fill a header page check\n");
  dbdump_test::WriteFile(out.str(), "previous dump");

  Error err = Export(db.c_str(), out.c_str(), FixedOptions());
  REQUIRE(err.code == ErrorCode::kConnection);
  REQUIRE(dbdump_test::ReadFile(out.str()) == "previous dump");
}

TEST_CASE("Exporter: unwritable destination", "[exporter]") {
  TempPath db(".db");
  TempPath dir("_dir");
  dbdump_test::CreateDb(db.str(), "CREATE TABLE t(id INTEGER);");
  const std::string target = dir.str() + "/missing/out.sql";

  Exporter exporter(FixedOptions());
  Error err = exporter.Export(db.c_str(), target.c_str());
  REQUIRE(err.code == ErrorCode::kWrite);
  REQUIRE(exporter.State() == ExportState::kFailed);
}

TEST_CASE("Exporter: null paths", "[exporter]") {
  TempPath out(".sql");
  Exporter exporter;
  REQUIRE(exporter.Export(nullptr, out.c_str()).code ==
          ErrorCode::kNullParam);
  REQUIRE(exporter.Export("x.db", nullptr).code == ErrorCode::kNullParam);
  REQUIRE(exporter.State() == ExportState::kFailed);
}

// ---------------------------------------------------------------------------
// Scripted reader
// ---------------------------------------------------------------------------

TEST_CASE("BasicExporter: schema failure aborts remaining tables",
          "[exporter]") {
  TempPath out(".sql");
  ScriptedReader reader;
  reader.tables = {SimpleTable("a", 2), SimpleTable("b", 1),
                   SimpleTable("c", 1)};
  reader.tables[1].fail_columns = true;

  BasicExporter<ScriptedReader> exporter(std::move(reader), FixedOptions());
  Error err = exporter.Export("scripted", out.c_str());

  REQUIRE(err.code == ErrorCode::kSchemaRead);
  REQUIRE(std::string(err.message).find("'b'") != std::string::npos);
  REQUIRE(exporter.State() == ExportState::kFailed);
  REQUIRE(exporter.GetReader().columns_calls == 2);
  REQUIRE(exporter.GetReader().close_calls == 1);
  REQUIRE_FALSE(exporter.GetReader().open);
  REQUIRE_FALSE(std::filesystem::exists(out.str()));
}

TEST_CASE("BasicExporter: row failure mid-table writes nothing",
          "[exporter]") {
  TempPath out(".sql");
  ScriptedReader reader;
  reader.tables = {SimpleTable("a", 3)};
  reader.tables[0].fail_at_row = 1;

  BasicExporter<ScriptedReader> exporter(std::move(reader), FixedOptions());
  Error err = exporter.Export("scripted", out.c_str());

  REQUIRE(err.code == ErrorCode::kRowRead);
  REQUIRE(std::string(err.message).find("'a'") != std::string::npos);
  REQUIRE(std::string(err.message).find("disk I/O error") !=
          std::string::npos);
  REQUIRE(exporter.State() == ExportState::kFailed);
  REQUIRE(exporter.GetReader().close_calls == 1);
  REQUIRE_FALSE(std::filesystem::exists(out.str()));
}

TEST_CASE("BasicExporter: connection failure", "[exporter]") {
  TempPath out(".sql");
  ScriptedReader reader;
  reader.fail_open = true;

  BasicExporter<ScriptedReader> exporter(std::move(reader), FixedOptions());
  Error err = exporter.Export("scripted", out.c_str());
  REQUIRE(err.code == ErrorCode::kConnection);
  REQUIRE(exporter.GetReader().columns_calls == 0);
  REQUIRE_FALSE(std::filesystem::exists(out.str()));
}

TEST_CASE("BasicExporter: short rows are NULL-filled from metadata",
          "[exporter]") {
  TempPath out(".sql");
  ScriptedReader reader;
  ScriptedTable t;
  t.name = "ragged";
  t.columns = {Column("a", "INTEGER"), Column("b", "TEXT"),
               Column("c", "REAL")};
  t.rows = {{Value::Integer(1), Value::Text("x"), Value::Float(0.5)},
            {Value::Integer(2)}};
  reader.tables = {t};

  BasicExporter<ScriptedReader> exporter(std::move(reader), FixedOptions());
  REQUIRE(exporter.Export("scripted", out.c_str()).ok());
  REQUIRE(exporter.GetReader().close_calls == 1);

  const std::string dump = dbdump_test::ReadFile(out.str());
  REQUIRE(CountOf(dump,
                  "INSERT INTO `ragged` (`a`, `b`, `c`) "
                  "VALUES (1, 'x', 0.5);") == 1);
  REQUIRE(CountOf(dump,
                  "INSERT INTO `ragged` (`a`, `b`, `c`) "
                  "VALUES (2, NULL, NULL);") == 1);
}

TEST_CASE("ExportStateName", "[exporter]") {
  REQUIRE(std::string(ExportStateName(ExportState::kReadingRows)) ==
          "ReadingRows");
  REQUIRE(std::string(ExportStateName(ExportState::kFailed)) == "Failed");
}
