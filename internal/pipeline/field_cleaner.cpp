#include "field_cleaner.hpp"

#include <cctype>
#include <vector>

#include "internal/observability/logging.hpp"

namespace cpandb::pipeline {

FieldCleaner::FieldCleaner(db::Store& store) : store_(store) {
}

std::optional<std::string> FieldCleaner::CleanVersion(const std::optional<std::string>& value) {
  if (!value) {
    return std::nullopt;
  }
  std::string bare;
  bare.reserve(value->size());
  for (char c : *value) {
    if (std::isdigit(static_cast<unsigned char>(c)) || c == '.' || c == '_') {
      bare += c;
    }
  }
  return bare;
}

bool FieldCleaner::NeedsCleaning(const std::string& value) {
  if (value.empty()) {
    return false;
  }
  switch (value.front()) {
    case '>':
    case '<':
    case '=':
    case 'v':
    case 'V':
      return true;
    default:
      return false;
  }
}

int64_t FieldCleaner::RewriteColumn(const char* select_sql, const char* update_sql) {
  std::vector<std::string> dirty;
  store_.QueryEach(select_sql, {}, [&](const db::sql::Row& row) {
    auto value = row.GetOptionalText(0);
    if (value && NeedsCleaning(*value)) {
      dirty.push_back(std::move(*value));
    }
  });

  std::vector<db::sql::Params> rows;
  rows.reserve(dirty.size());
  for (const auto& value : dirty) {
    rows.push_back({*CleanVersion(value), value});
  }
  return store_.ExecMany(update_sql, rows);
}

FieldCleaner::Stats FieldCleaner::Run() {
  Stats stats;
  auto  tx = store_.Begin();

  // GLOB is case sensitive and matches the same set as NeedsCleaning
  stats.versions_rewritten = RewriteColumn(
      "SELECT DISTINCT version FROM t_requires WHERE version GLOB '[<>=vV]*';",
      "UPDATE t_requires SET version = ? WHERE version = ?;");

  stats.cores_rewritten = RewriteColumn(
      "SELECT DISTINCT core FROM t_requires WHERE typeof(core) = 'text' AND core GLOB '[<>=vV]*';",
      "UPDATE t_requires SET core = ? WHERE core = ?;");

  stats.versions_defaulted = store_.Exec("UPDATE t_requires SET version = ? WHERE version IS NULL;", {std::string("0")});
  stats.versions_defaulted += store_.Exec("UPDATE t_requires SET version = ?, core = ? WHERE version = '';", {std::string("0"), int32_t{0}});
  stats.cores_defaulted = store_.Exec("UPDATE t_requires SET core = ? WHERE typeof(core) = 'text' AND core = '';", {int32_t{0}});

  tx->Commit();

  CPANDB_LOG_INFO("cleaned t_requires",
                  {observability::IntField("versions_rewritten", stats.versions_rewritten),
                   observability::IntField("cores_rewritten", stats.cores_rewritten),
                   observability::IntField("versions_defaulted", stats.versions_defaulted),
                   observability::IntField("cores_defaulted", stats.cores_defaulted)});
  return stats;
}

} // namespace cpandb::pipeline
