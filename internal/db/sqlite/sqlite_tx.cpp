#include "sqlite_tx.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cpandb::db::sqlite {

SqliteTx::SqliteTx(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
  open_ = true;
}

SqliteTx::~SqliteTx() {
  if (!open_) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const util::StoreError& e) {
    // sqlite may already have rolled back on its own after a failed statement
    CPANDB_LOG_WARN("rollback failed",
                    {observability::StringField("path", db_->Path()), observability::StringField("error", e.what())});
  }
}

void SqliteTx::Close(const char* sql) {
  if (!open_) {
    throw util::StoreError("transaction already closed", sql);
  }
  db_->Exec(sql);
  open_ = false;
}

void SqliteTx::Commit() {
  Close("COMMIT;");
}

void SqliteTx::Rollback() {
  Close("ROLLBACK;");
}

} // namespace cpandb::db::sqlite
