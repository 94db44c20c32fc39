#include "store.hpp"

#include <cctype>

#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"

namespace cpandb::db {

namespace {

const std::string& RequireIdentifier(const std::string& name, const char* what) {
  if (!IsIdentifier(name)) {
    throw util::StoreError(std::string("invalid ") + what + " identifier '" + name + "'");
  }
  return name;
}

// file: URI so the extract can be opened read-only; escapes the characters
// that would otherwise start a query string or fragment.
std::string ReadOnlyUri(const std::string& path) {
  std::string uri = "file:";
  for (char c : path) {
    switch (c) {
      case '%': uri += "%25"; break;
      case '?': uri += "%3f"; break;
      case '#': uri += "%23"; break;
      default: uri += c;
    }
  }
  uri += "?mode=ro";
  return uri;
}

} // namespace

bool IsIdentifier(const std::string& name) {
  if (name.empty()) return false;
  if (!std::isalpha(static_cast<unsigned char>(name[0])) && name[0] != '_') return false;
  for (char c : name) {
    if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_') return false;
  }
  return true;
}

Store::Store(std::shared_ptr<sqlite::SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<Store> Store::Open(const std::string& path, sqlite::SqliteOptions options) {
  return std::make_unique<Store>(std::make_shared<sqlite::SqliteDB>(path, std::move(options)));
}

int64_t Store::Exec(const std::string& sql, const sql::Params& params) {
  auto stmt = db_->Prepare(sql);
  stmt.Bind(params);
  while (stmt.Step()) {
  }
  return db_->Changes();
}

int64_t Store::ExecMany(const std::string& sql, const std::vector<sql::Params>& rows) {
  auto    stmt  = db_->Prepare(sql);
  int64_t total = 0;
  for (const auto& params : rows) {
    stmt.Bind(params);
    while (stmt.Step()) {
    }
    total += db_->Changes();
  }
  return total;
}

void Store::QueryEach(const std::string& sql, const sql::Params& params, const RowFn& fn) {
  auto stmt = db_->Prepare(sql);
  stmt.Bind(params);
  while (stmt.Step()) {
    fn(stmt.Row());
  }
}

std::optional<int64_t> Store::QueryInt(const std::string& sql, const sql::Params& params) {
  auto stmt = db_->Prepare(sql);
  stmt.Bind(params);
  if (!stmt.Step()) {
    return std::nullopt;
  }
  return stmt.Row().GetOptionalInt64(0);
}

int64_t Store::Count(const std::string& table, const std::string& condition) {
  std::string sql = "SELECT COUNT(*) FROM " + RequireIdentifier(table, "table");
  if (!condition.empty()) {
    sql += " WHERE " + condition;
  }
  return QueryInt(sql).value_or(0);
}

void Store::CreateIndex(const std::string& table, std::initializer_list<std::string> columns) {
  CreateIndex(table, std::vector<std::string>(columns));
}

void Store::CreateIndex(const std::string& table, const std::vector<std::string>& columns) {
  RequireIdentifier(table, "table");
  for (const auto& column : columns) {
    RequireIdentifier(column, "column");
    db_->Exec("CREATE INDEX " + table + "__" + column + " ON " + table + " ( " + column + " );");
  }
}

bool Store::HasTable(const std::string& table, const std::string& schema) {
  const std::string sql =
      "SELECT COUNT(*) FROM " + RequireIdentifier(schema, "schema") + ".sqlite_master WHERE type = 'table' AND name = ?;";
  return QueryInt(sql, {table}).value_or(0) > 0;
}

void Store::DropTable(const std::string& table) {
  db_->Exec("DROP TABLE IF EXISTS " + RequireIdentifier(table, "table") + ";");
}

void Store::Attach(const std::string& alias, const std::string& path) {
  Exec("ATTACH DATABASE ? AS " + RequireIdentifier(alias, "schema") + ";", {ReadOnlyUri(path)});
}

void Store::Detach(const std::string& alias) {
  db_->Exec("DETACH DATABASE " + RequireIdentifier(alias, "schema") + ";");
}

std::unique_ptr<Transaction> Store::Begin() {
  return std::make_unique<sqlite::SqliteTx>(db_);
}

void Store::Vacuum() {
  db_->Exec("VACUUM;");
}

void Store::Analyze(const std::string& schema) {
  db_->Exec("ANALYZE " + RequireIdentifier(schema, "schema") + ";");
}

sqlite::Statement Store::Prepare(const std::string& sql) {
  return db_->Prepare(sql);
}

} // namespace cpandb::db
