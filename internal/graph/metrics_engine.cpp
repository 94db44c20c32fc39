#include "metrics_engine.hpp"

#include <algorithm>
#include <cctype>
#include <utility>

#include "dependency_graph.hpp"

namespace cpandb::graph {

namespace {

bool StartsWithIgnoreCase(const std::string& text, const std::string& prefix) {
  if (prefix.size() > text.size()) return false;
  return std::equal(prefix.begin(), prefix.end(), text.begin(), [](char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
  });
}

} // namespace

MetricsEngine::MetricsEngine(MetricsOptions options) : options_(std::move(options)) {
}

bool MetricsEngine::IsExcluded(const std::string& distribution) const {
  return std::any_of(options_.excluded_prefixes.begin(), options_.excluded_prefixes.end(),
                     [&](const std::string& prefix) { return !prefix.empty() && StartsWithIgnoreCase(distribution, prefix); });
}

DistributionMetrics MetricsEngine::Compute(const std::vector<std::string>&                         distributions,
                                           const std::vector<std::pair<std::string, std::string>>& edges) const {
  DistributionMetrics metrics;

  DependencyGraph full;
  DependencyGraph weighted;
  for (const auto& name : distributions) {
    full.AddNode(name);
    if (!IsExcluded(name)) {
      weighted.AddNode(name);
    }
  }

  for (const auto& [distribution, dependency] : edges) {
    if (!full.AddEdge(distribution, dependency)) {
      ++metrics.dangling_edges;
      continue;
    }
    // ignored when either end is excluded
    weighted.AddEdge(distribution, dependency);
  }

  // weight follows edges backwards: who can reach me
  const auto fan_in = weighted.Reversed().ReachableCounts();
  for (DependencyGraph::NodeId id = 0; id < weighted.NodeCount(); ++id) {
    metrics.weight[weighted.Name(id)] = static_cast<int64_t>(fan_in[id]);
  }

  const auto fan_out = full.ReachableCounts();
  for (DependencyGraph::NodeId id = 0; id < full.NodeCount(); ++id) {
    metrics.volatility[full.Name(id)] = static_cast<int64_t>(fan_out[id]);
  }

  return metrics;
}

} // namespace cpandb::graph
