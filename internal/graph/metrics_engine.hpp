#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace cpandb::graph {

struct MetricsOptions {
  // Umbrella and demo distributions (bundles, Acme-*) by name prefix,
  // compared case-insensitively. Removed from the weight graph entirely.
  std::vector<std::string> excluded_prefixes = {"Task-", "Acme-"};
};

struct DistributionMetrics {
  // fan-in: distinct distributions that transitively depend on the key.
  // Excluded distributions have no entry.
  std::map<std::string, int64_t> weight;

  // fan-out: distinct distributions the key transitively depends on.
  std::map<std::string, int64_t> volatility;

  // dependency rows whose endpoints were not distributions
  uint64_t dangling_edges = 0;
};

/*
  Computes weight and volatility over distribution-level dependency
  edges (distribution, dependency). Deterministic for any input,
  including cycles and self-edges.
*/
class MetricsEngine {
 public:
  explicit MetricsEngine(MetricsOptions options = {});

  bool IsExcluded(const std::string& distribution) const;

  DistributionMetrics Compute(const std::vector<std::string>&                         distributions,
                              const std::vector<std::pair<std::string, std::string>>& edges) const;

 private:
  MetricsOptions options_;
};

} // namespace cpandb::graph
