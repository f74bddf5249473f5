// Copyright (c) 2024 liudegui. MIT License.
//
// dbdump -- SQLite database to MySQL-dialect SQL dump.
//
// Single include for the whole library:
//   #include "dbdump/dbdump.hpp"
//   dbdump::Error err = dbdump::Export("app.db", "app_export.sql");

#pragma once

#include "dbdump/dump_document.hpp"
#include "dbdump/error.hpp"
#include "dbdump/exporter.hpp"
#include "dbdump/schema_reader.hpp"
#include "dbdump/sql_renderer.hpp"
#include "dbdump/sqlite3_db.hpp"
#include "dbdump/type_mapper.hpp"
#include "dbdump/value.hpp"
