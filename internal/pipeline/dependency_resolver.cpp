#include "dependency_resolver.hpp"

#include <cctype>
#include <map>
#include <tuple>
#include <utility>
#include <vector>

#include "internal/db/sql/schema.hpp"
#include "internal/observability/logging.hpp"

namespace cpandb::pipeline {

using observability::IntField;

namespace {

// numeric value of the component starting at pos; advances past it and one separator
uint64_t NextComponent(const std::string& version, size_t& pos) {
  uint64_t value = 0;
  while (pos < version.size() && std::isdigit(static_cast<unsigned char>(version[pos]))) {
    value = value * 10 + static_cast<uint64_t>(version[pos] - '0');
    ++pos;
  }
  while (pos < version.size() && version[pos] != '.' && version[pos] != '_') {
    ++pos;
  }
  if (pos < version.size()) {
    ++pos;
  }
  return value;
}

} // namespace

DependencyResolver::DependencyResolver(db::Store& store) : store_(store) {
}

DependencyResolver::Stats DependencyResolver::Run() {
  BuildDependencies();
  BuildRequires();
  return stats_;
}

void DependencyResolver::BuildDependencies() {
  store_.Exec(db::sql::CREATE_DEPENDENCY);

  // cores left as text after cleaning still compare numerically
  stats_.dependencies = store_.Exec(
      "INSERT INTO dependency ( distribution, dependency, phase, core ) "
      "SELECT"
      " r.distribution AS distribution,"
      " m.distribution AS dependency,"
      " r.phase AS phase,"
      " MAX(CAST(r.core AS REAL)) AS core "
      "FROM t_requires r "
      "JOIN module m ON m.module = r.module "
      "GROUP BY r.distribution, m.distribution, r.phase "
      "ORDER BY r.distribution, r.phase, m.distribution;");

  store_.CreateIndex("dependency", {"distribution", "dependency", "phase", "core"});

  stats_.self_edges = store_.Count("dependency", "distribution = dependency");
  const auto unresolved =
      store_.Count("t_requires", "module NOT IN ( SELECT module FROM module )");

  CPANDB_LOG_INFO("dependency edges resolved",
                  {IntField("edges", stats_.dependencies), IntField("self_edges", stats_.self_edges),
                   IntField("unresolved_requires", unresolved)});
}

int DependencyResolver::CompareVersions(const std::optional<std::string>& a, const std::optional<std::string>& b) {
  if (!a || !b) {
    return static_cast<int>(a.has_value()) - static_cast<int>(b.has_value());
  }

  size_t pa = 0;
  size_t pb = 0;
  while (pa < a->size() || pb < b->size()) {
    const auto ca = NextComponent(*a, pa);
    const auto cb = NextComponent(*b, pb);
    if (ca != cb) {
      return ca < cb ? -1 : 1;
    }
  }
  // equal components ("1.0" and "1.00"): fall back to text order so the pick is stable
  return a->compare(*b);
}

void DependencyResolver::BuildRequires() {
  store_.Exec(db::sql::CREATE_REQUIRES);

  using Key = std::tuple<std::string, std::string, std::string>;

  // a release declaring one module twice in a phase keeps the highest version
  std::map<Key, std::optional<std::string>> versions;
  store_.QueryEach("SELECT distribution, phase, module, version FROM t_requires;", {}, [&](const db::sql::Row& row) {
    Key  key{row.GetText(0), row.GetText(1), row.GetText(2)};
    auto version = row.GetOptionalText(3);

    auto it = versions.find(key);
    if (it == versions.end()) {
      versions.emplace(std::move(key), std::move(version));
    } else if (CompareVersions(version, it->second) > 0) {
      it->second = std::move(version);
    }
  });

  // map order is distribution, phase, module
  std::vector<db::sql::Params> rows;
  rows.reserve(versions.size());
  for (const auto& [key, version] : versions) {
    const auto& [distribution, phase, module] = key;
    rows.push_back({distribution, module, db::sql::OptionalText(version), phase});
  }

  auto tx              = store_.Begin();
  stats_.requires_rows = store_.ExecMany("INSERT INTO requires ( distribution, module, version, phase ) VALUES (?, ?, ?, ?);", rows);
  tx->Commit();

  store_.CreateIndex("requires", {"distribution", "module", "version", "phase"});
}

} // namespace cpandb::pipeline
