#include "sqlite_stmt.hpp"

#include <type_traits>

#include "internal/util/errors.hpp"

namespace cpandb::db::sqlite {

std::string SqliteRow::GetText(int col) const {
  const unsigned char* t = sqlite3_column_text(stmt_, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t SqliteRow::GetInt64(int col) const {
  return sqlite3_column_int64(stmt_, col);
}

double SqliteRow::GetDouble(int col) const {
  return sqlite3_column_double(stmt_, col);
}

bool SqliteRow::IsNull(int col) const {
  return sqlite3_column_type(stmt_, col) == SQLITE_NULL;
}

Statement::Statement(sqlite3* db, std::string sql) : db_(db), sql_(std::move(sql)), row_(nullptr) {
  if (sqlite3_prepare_v2(db_, sql_.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
    throw util::StoreError(std::string("sqlite prepare: ") + sqlite3_errmsg(db_), sql_);
  }
  row_.stmt_ = stmt_;
}

Statement::Statement(Statement&& other) noexcept
    : db_(other.db_), stmt_(other.stmt_), sql_(std::move(other.sql_)), row_(other.stmt_) {
  other.stmt_ = nullptr;
  other.row_.stmt_ = nullptr;
}

Statement::~Statement() {
  if (stmt_) sqlite3_finalize(stmt_);
}

void Statement::Bind(const sql::Params& params) {
  sqlite3_reset(stmt_);
  sqlite3_clear_bindings(stmt_);

  int idx = 1;
  for (const auto& param : params) {
    int rc = std::visit(
        [&](const auto& v) -> int {
          using T = std::decay_t<decltype(v)>;
          if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return sqlite3_bind_null(stmt_, idx);
          } else if constexpr (std::is_same_v<T, int32_t>) {
            return sqlite3_bind_int(stmt_, idx, v);
          } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, uint64_t>) {
            return sqlite3_bind_int64(stmt_, idx, static_cast<sqlite3_int64>(v));
          } else if constexpr (std::is_same_v<T, double>) {
            return sqlite3_bind_double(stmt_, idx, v);
          } else {
            return sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
          }
        },
        param);

    if (rc != SQLITE_OK) {
      throw util::StoreError("sqlite bind #" + std::to_string(idx) + ": " + sqlite3_errmsg(db_), sql_);
    }
    ++idx;
  }
}

bool Statement::Step() {
  int rc = sqlite3_step(stmt_);
  if (rc == SQLITE_ROW) return true;
  if (rc == SQLITE_DONE) return false;

  std::string msg = sqlite3_errmsg(db_);
  sqlite3_reset(stmt_);
  throw util::StoreError("sqlite step: " + msg, sql_);
}

} // namespace cpandb::db::sqlite
