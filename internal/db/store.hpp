#pragma once

#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/transaction.hpp"
#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"

namespace cpandb::db {

/*
  The index store.

  Every stage receives the Store explicitly; there is no process-wide
  handle. Values always travel as bound parameters. The few places that
  need an identifier in statement text (table, column, schema alias) take
  it from code and reject anything that is not a plain identifier.

  All failures throw util::StoreError carrying the failing statement.
*/
class Store {
 public:
  explicit Store(std::shared_ptr<sqlite::SqliteDB> db);

  // Opens (creating if needed) the store at path.
  static std::unique_ptr<Store> Open(const std::string& path, sqlite::SqliteOptions options = {});

  using RowFn = std::function<void(const sql::Row&)>;

  // Run a statement; returns the number of rows it changed.
  int64_t Exec(const std::string& sql, const sql::Params& params = {});

  // Run one statement once per parameter set, preparing it once.
  int64_t ExecMany(const std::string& sql, const std::vector<sql::Params>& rows);

  void QueryEach(const std::string& sql, const sql::Params& params, const RowFn& fn);

  std::optional<int64_t> QueryInt(const std::string& sql, const sql::Params& params = {});

  // SELECT COUNT(*) FROM table [WHERE condition]; condition is code-owned text
  int64_t Count(const std::string& table, const std::string& condition = {});

  // One index per column, named <table>__<column>.
  void CreateIndex(const std::string& table, std::initializer_list<std::string> columns);
  void CreateIndex(const std::string& table, const std::vector<std::string>& columns);

  bool HasTable(const std::string& table, const std::string& schema = "main");

  void DropTable(const std::string& table);

  // Attach a database file read-only under alias.
  void Attach(const std::string& alias, const std::string& path);
  void Detach(const std::string& alias);

  std::unique_ptr<Transaction> Begin();

  void Vacuum();
  void Analyze(const std::string& schema = "main");

  sqlite::Statement Prepare(const std::string& sql);

  int64_t Changes() const {
    return db_->Changes();
  }

  const std::string& Path() const {
    return db_->Path();
  }

 private:
  std::shared_ptr<sqlite::SqliteDB> db_;
};

// true for [A-Za-z_][A-Za-z0-9_]*
bool IsIdentifier(const std::string& name);

} // namespace cpandb::db
