#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace cpandb::db::sqlite {

/*
  BEGIN IMMEDIATE on the output database. Attached extracts are opened
  read-only, so sqlite only takes read locks on them.
*/
class SqliteTx final : public db::Transaction {
public:
  explicit SqliteTx(std::shared_ptr<SqliteDB> db);
  ~SqliteTx() override;

  SqliteTx(const SqliteTx&) = delete;
  SqliteTx& operator=(const SqliteTx&) = delete;

  void Commit() override;
  void Rollback() override;
  bool IsOpen() const override { return open_; }

private:
  void Close(const char* sql);

  std::shared_ptr<SqliteDB> db_;
  bool open_ = false;
};

}
