#include "internal/graph/dependency_graph.hpp"
#include "internal/graph/metrics_engine.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace {

using cpandb::graph::DependencyGraph;
using cpandb::graph::MetricsEngine;
using cpandb::graph::MetricsOptions;

using Edges = std::vector<std::pair<std::string, std::string>>;

void TestChainCountsBothDirections() {
  MetricsEngine engine;
  auto          metrics = engine.Compute({"A", "B", "C"}, Edges{{"A", "B"}, {"B", "C"}});

  assert(metrics.volatility.at("A") == 2);
  assert(metrics.volatility.at("B") == 1);
  assert(metrics.volatility.at("C") == 0);

  assert(metrics.weight.at("A") == 0);
  assert(metrics.weight.at("B") == 1);
  assert(metrics.weight.at("C") == 2);
  assert(metrics.dangling_edges == 0);
}

void TestDiamondCountsDistinctNodesOnce() {
  MetricsEngine engine;
  auto metrics = engine.Compute({"A", "B", "C", "D"}, Edges{{"A", "B"}, {"A", "C"}, {"B", "D"}, {"C", "D"}, {"A", "B"}});

  assert(metrics.volatility.at("A") == 3);
  assert(metrics.weight.at("D") == 3);
  assert(metrics.weight.at("B") == 1);
}

void TestCycleMembersReachEachOther() {
  MetricsEngine engine;
  auto          metrics = engine.Compute({"X", "Y", "Z", "W"}, Edges{{"X", "Y"}, {"Y", "Z"}, {"Z", "X"}, {"W", "X"}});

  for (const char* name : {"X", "Y", "Z"}) {
    assert(metrics.volatility.at(name) == 2);
  }
  // W reaches the whole cycle, and the cycle is reached from W as well
  assert(metrics.volatility.at("W") == 3);
  assert(metrics.weight.at("X") == 3);
  assert(metrics.weight.at("W") == 0);
}

void TestSelfEdgeCountsNothing() {
  MetricsEngine engine;
  auto          metrics = engine.Compute({"S"}, Edges{{"S", "S"}});
  assert(metrics.weight.at("S") == 0);
  assert(metrics.volatility.at("S") == 0);
}

void TestExcludedPrefixesLeaveWeightGraph() {
  MetricsEngine engine;
  assert(engine.IsExcluded("Task-Kensho"));
  assert(engine.IsExcluded("acme-bleach"));
  assert(!engine.IsExcluded("Taskforce"));

  auto metrics = engine.Compute({"Task-Bundle", "App", "Lib", "Acme-Joke"},
                                Edges{{"Task-Bundle", "Lib"}, {"App", "Lib"}, {"Acme-Joke", "App"}});

  assert(metrics.weight.at("Lib") == 1);
  assert(metrics.weight.at("App") == 0);
  assert(metrics.weight.count("Task-Bundle") == 0);
  assert(metrics.weight.count("Acme-Joke") == 0);

  // volatility is computed over every distribution
  assert(metrics.volatility.at("Task-Bundle") == 1);
  assert(metrics.volatility.at("Acme-Joke") == 2);
}

void TestExcludedNodeBreaksWeightPathThroughIt() {
  MetricsEngine engine;
  auto          metrics = engine.Compute({"App", "Task-Middle", "Lib"}, Edges{{"App", "Task-Middle"}, {"Task-Middle", "Lib"}});

  // App only reaches Lib through Task-Middle
  assert(metrics.weight.at("Lib") == 0);
  assert(metrics.weight.at("App") == 0);
  assert(metrics.volatility.at("App") == 2);
}

void TestCustomPrefixes() {
  MetricsOptions options;
  options.excluded_prefixes = {"Bundle-"};
  MetricsEngine engine(options);

  auto metrics = engine.Compute({"Bundle-X", "Task-Y", "Z"}, Edges{{"Bundle-X", "Z"}, {"Task-Y", "Z"}});
  assert(metrics.weight.at("Z") == 1);
  assert(metrics.weight.count("Task-Y") == 1);
}

void TestDanglingEdgesAreCounted() {
  MetricsEngine engine;
  auto          metrics = engine.Compute({"A"}, Edges{{"A", "Nowhere"}, {"Ghost", "A"}});
  assert(metrics.dangling_edges == 2);
  assert(metrics.volatility.at("A") == 0);
}

void TestEmptyGraph() {
  MetricsEngine engine;
  auto          metrics = engine.Compute({}, {});
  assert(metrics.weight.empty());
  assert(metrics.volatility.empty());
}

void TestGraphBasics() {
  DependencyGraph graph;
  auto            a = graph.AddNode("A");
  assert(graph.AddNode("A") == a);
  graph.AddNode("B");

  assert(graph.AddEdge("A", "B"));
  assert(!graph.AddEdge("A", "C"));
  assert(graph.EdgeCount() == 1);
  assert(!graph.Find("C").has_value());

  auto reversed = graph.Reversed();
  auto counts   = reversed.ReachableCounts();
  assert(counts[*reversed.Find("B")] == 1);
  assert(counts[*reversed.Find("A")] == 0);
}

void TestLongChainDoesNotRecurse() {
  std::vector<std::string> names;
  Edges                    edges;
  const int                n = 5000;
  for (int i = 0; i < n; ++i) {
    names.push_back("D" + std::to_string(i));
    if (i > 0) {
      edges.emplace_back(names[i - 1], names[i]);
    }
  }

  MetricsEngine engine;
  auto          metrics = engine.Compute(names, edges);
  assert(metrics.volatility.at("D0") == n - 1);
  assert(metrics.weight.at(names.back()) == n - 1);
}

} // namespace

int main() {
  TestChainCountsBothDirections();
  TestDiamondCountsDistinctNodesOnce();
  TestCycleMembersReachEachOther();
  TestSelfEdgeCountsNothing();
  TestExcludedPrefixesLeaveWeightGraph();
  TestExcludedNodeBreaksWeightPathThroughIt();
  TestCustomPrefixes();
  TestDanglingEdgesAreCounted();
  TestEmptyGraph();
  TestGraphBasics();
  TestLongChainDoesNotRecurse();

  std::cout << "cpandb_unit_dependency_graph: pass\n";
  return 0;
}
