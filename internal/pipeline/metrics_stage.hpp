#pragma once

#include <cstdint>

#include "internal/db/store.hpp"
#include "internal/graph/metrics_engine.hpp"

namespace cpandb::pipeline {

/*
  Loads the final dependency graph from the store, computes weight and
  volatility, and backfills both columns in batches, in distribution
  name order.
*/
class MetricsStage {
 public:
  struct Stats {
    uint64_t nodes          = 0;
    uint64_t edges          = 0;
    uint64_t weights        = 0;
    uint64_t volatilities   = 0;
    uint64_t dangling_edges = 0;
  };

  MetricsStage(db::Store& store, graph::MetricsEngine engine, uint32_t batch_size);

  Stats Run();

 private:
  db::Store&           store_;
  graph::MetricsEngine engine_;
  uint32_t             batch_size_;
};

} // namespace cpandb::pipeline
