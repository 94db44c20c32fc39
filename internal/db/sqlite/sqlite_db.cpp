#include "sqlite_db.hpp"

#include <cctype>

#include "internal/util/errors.hpp"

namespace cpandb::db::sqlite {

static void ThrowIf(int rc, sqlite3* db, const char* what) {
  if (rc != SQLITE_OK) {
    throw util::StoreError(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

SqliteDB::SqliteDB(std::string path, SqliteOptions options) : path_(std::move(path)), options_(std::move(options)) {
  int rc = sqlite3_open_v2(path_.c_str(), &db_, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_URI, nullptr);

  if (rc != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "sqlite open failed";
    if (db_) sqlite3_close(db_);
    db_ = nullptr;
    throw util::StoreError("cannot open " + path_ + ": " + msg);
  }

  Configure();
}

SqliteDB::~SqliteDB() {
  if (db_) sqlite3_close_v2(db_);
}

void SqliteDB::Exec(const std::string& sql) {
  char* err = nullptr;
  int   rc  = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    std::string msg = err ? err : "sqlite exec failed";
    sqlite3_free(err);
    throw util::StoreError(msg, sql);
  }
}

Statement SqliteDB::Prepare(const std::string& sql) {
  return Statement(db_, sql);
}

int64_t SqliteDB::Changes() const {
  return sqlite3_changes(db_);
}

void SqliteDB::Configure() {
  // journal_mode is a fixed keyword from config; PRAGMA cannot take bound values
  for (char c : options_.journal_mode) {
    if (!std::isalpha(static_cast<unsigned char>(c))) {
      throw util::StoreError("invalid journal_mode: " + options_.journal_mode);
    }
  }
  Exec("PRAGMA journal_mode=" + options_.journal_mode + ";");

  // a failed run leaves an output that is discarded anyway
  Exec("PRAGMA synchronous=OFF;");

  // foreign keys are OFF by default in sqlite
  Exec(options_.foreign_keys ? "PRAGMA foreign_keys=ON;" : "PRAGMA foreign_keys=OFF;");

  ThrowIf(sqlite3_busy_timeout(db_, 5000), db_, "busy_timeout");

  Exec("PRAGMA temp_store=MEMORY;");
  if (options_.cache_size_kib > 0) {
    // negative means KiB
    Exec("PRAGMA cache_size=-" + std::to_string(options_.cache_size_kib) + ";");
  }
}

} // namespace cpandb::db::sqlite
