#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

#include "sqlite_stmt.hpp"

namespace cpandb::db::sqlite {

struct SqliteOptions {
  // PRAGMA journal_mode for the output file.
  std::string journal_mode = "DELETE";

  // PRAGMA cache_size in KiB; 0 leaves the sqlite default.
  int cache_size_kib = 0;

  bool foreign_keys = true;
};

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string with no parameters (pragmas, DDL, BEGIN/COMMIT)
  void Exec(const std::string& sql);

  Statement Prepare(const std::string& sql);

  // Rows touched by the most recent INSERT/UPDATE/DELETE
  int64_t Changes() const;

  // Apply the configured PRAGMAs
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
};

} // namespace cpandb::db::sqlite
