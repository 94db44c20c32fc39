#include "metrics_stage.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "internal/db/batch_updater.hpp"
#include "internal/observability/logging.hpp"

namespace cpandb::pipeline {

using observability::IntField;
using observability::StringField;

namespace {

uint64_t Backfill(db::Store& store, const char* sql, const std::map<std::string, int64_t>& values, uint32_t batch_size) {
  db::BatchedUpdater updater(store, sql, batch_size);
  for (const auto& [distribution, value] : values) {
    if (!updater.Apply({value, distribution})) {
      CPANDB_LOG_DEBUG("metric for unknown distribution", {StringField("distribution", distribution)});
    }
  }
  updater.Finish();
  return updater.stats().applied;
}

} // namespace

MetricsStage::MetricsStage(db::Store& store, graph::MetricsEngine engine, uint32_t batch_size)
    : store_(store), engine_(std::move(engine)), batch_size_(batch_size) {
}

MetricsStage::Stats MetricsStage::Run() {
  std::vector<std::string> distributions;
  store_.QueryEach("SELECT distribution FROM distribution ORDER BY distribution;", {},
                   [&](const db::sql::Row& row) { distributions.push_back(row.GetText(0)); });

  std::vector<std::pair<std::string, std::string>> edges;
  store_.QueryEach("SELECT DISTINCT distribution, dependency FROM dependency ORDER BY distribution, dependency;", {},
                   [&](const db::sql::Row& row) { edges.emplace_back(row.GetText(0), row.GetText(1)); });

  Stats stats;
  stats.nodes = distributions.size();
  stats.edges = edges.size();

  const auto metrics   = engine_.Compute(distributions, edges);
  stats.dangling_edges = metrics.dangling_edges;

  CPANDB_LOG_INFO("populating distribution.weight", {IntField("rows", static_cast<int64_t>(metrics.weight.size()))});
  stats.weights = Backfill(store_, "UPDATE distribution SET weight = ? WHERE distribution = ?;", metrics.weight, batch_size_);

  CPANDB_LOG_INFO("populating distribution.volatility", {IntField("rows", static_cast<int64_t>(metrics.volatility.size()))});
  stats.volatilities =
      Backfill(store_, "UPDATE distribution SET volatility = ? WHERE distribution = ?;", metrics.volatility, batch_size_);

  return stats;
}

} // namespace cpandb::pipeline
