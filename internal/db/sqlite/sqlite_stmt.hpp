#pragma once

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/sql_params.hpp"
#include "internal/db/sql/sql_row.hpp"

namespace cpandb::db::sqlite {

class SqliteRow final : public sql::Row {
public:
  explicit SqliteRow(sqlite3_stmt* stmt) : stmt_(stmt) {}

  std::string GetText(int col) const override;
  int64_t GetInt64(int col) const override;
  double GetDouble(int col) const override;
  bool IsNull(int col) const override;

private:
  friend class Statement;
  sqlite3_stmt* stmt_;
};

/*
  Owns one prepared statement. Finalized on destruction.

  Bind() resets the statement first, so the same Statement can be
  rebound and stepped once per row of a bulk pass.
*/
class Statement {
public:
  Statement(sqlite3* db, std::string sql);
  ~Statement();

  Statement(Statement&& other) noexcept;
  Statement& operator=(Statement&&) = delete;
  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;

  void Bind(const sql::Params& params);

  // true while a row is available, false once done; throws on error
  bool Step();

  const sql::Row& Row() const { return row_; }

  const std::string& Sql() const { return sql_; }

private:
  sqlite3*      db_;
  sqlite3_stmt* stmt_ = nullptr;
  std::string   sql_;
  SqliteRow     row_;
};

}
