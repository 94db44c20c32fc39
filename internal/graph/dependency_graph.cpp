#include "dependency_graph.hpp"

#include <algorithm>
#include <iterator>
#include <limits>

namespace cpandb::graph {

namespace {

constexpr uint32_t kUnvisited = std::numeric_limits<uint32_t>::max();

struct Components {
  std::vector<uint32_t>              component_of;
  // reverse topological order: every component appears after all
  // components reachable from it
  std::vector<std::vector<uint32_t>> members;
};

// Iterative Tarjan; the explicit work stack keeps deep dependency chains
// off the call stack.
Components FindComponents(const std::vector<std::vector<uint32_t>>& out) {
  const auto n = static_cast<uint32_t>(out.size());

  std::vector<uint32_t> index(n, kUnvisited);
  std::vector<uint32_t> low(n, 0);
  std::vector<bool>     on_stack(n, false);
  std::vector<uint32_t> stack;

  struct Frame {
    uint32_t    node;
    std::size_t next_edge;
  };
  std::vector<Frame> work;

  Components result;
  result.component_of.assign(n, kUnvisited);

  uint32_t counter = 0;
  auto     visit   = [&](uint32_t v) {
    index[v] = low[v] = counter++;
    stack.push_back(v);
    on_stack[v] = true;
    work.push_back({v, 0});
  };

  for (uint32_t root = 0; root < n; ++root) {
    if (index[root] != kUnvisited) continue;
    visit(root);

    while (!work.empty()) {
      const uint32_t v = work.back().node;

      if (work.back().next_edge < out[v].size()) {
        const uint32_t w = out[v][work.back().next_edge++];
        if (index[w] == kUnvisited) {
          visit(w);
        } else if (on_stack[w]) {
          low[v] = std::min(low[v], index[w]);
        }
        continue;
      }

      if (low[v] == index[v]) {
        const auto            id = static_cast<uint32_t>(result.members.size());
        std::vector<uint32_t> members;
        uint32_t              w;
        do {
          w = stack.back();
          stack.pop_back();
          on_stack[w]            = false;
          result.component_of[w] = id;
          members.push_back(w);
        } while (w != v);
        std::sort(members.begin(), members.end());
        result.members.push_back(std::move(members));
      }

      work.pop_back();
      if (!work.empty()) {
        const uint32_t u = work.back().node;
        low[u]           = std::min(low[u], low[v]);
      }
    }
  }

  return result;
}

} // namespace

DependencyGraph::NodeId DependencyGraph::AddNode(const std::string& name) {
  auto it = ids_.find(name);
  if (it != ids_.end()) {
    return it->second;
  }
  const auto id = static_cast<NodeId>(names_.size());
  names_.push_back(name);
  ids_.emplace(name, id);
  out_.emplace_back();
  return id;
}

bool DependencyGraph::AddEdge(const std::string& from, const std::string& to) {
  auto a = Find(from);
  auto b = Find(to);
  if (!a || !b) {
    return false;
  }
  out_[*a].push_back(*b);
  ++edges_;
  return true;
}

std::optional<DependencyGraph::NodeId> DependencyGraph::Find(const std::string& name) const {
  auto it = ids_.find(name);
  if (it == ids_.end()) {
    return std::nullopt;
  }
  return it->second;
}

DependencyGraph DependencyGraph::Reversed() const {
  DependencyGraph reversed;
  reversed.names_ = names_;
  reversed.ids_   = ids_;
  reversed.out_.resize(out_.size());
  reversed.edges_ = edges_;
  for (NodeId from = 0; from < out_.size(); ++from) {
    for (NodeId to : out_[from]) {
      reversed.out_[to].push_back(from);
    }
  }
  return reversed;
}

std::vector<uint64_t> DependencyGraph::ReachableCounts() const {
  const auto components = FindComponents(out_);
  const auto count      = components.members.size();

  // distinct successor components, and how many predecessors still need
  // each component's reachable set
  std::vector<std::vector<uint32_t>> successors(count);
  std::vector<uint32_t>              pending(count, 0);
  for (uint32_t c = 0; c < count; ++c) {
    auto& next = successors[c];
    for (uint32_t member : components.members[c]) {
      for (uint32_t w : out_[member]) {
        const uint32_t cw = components.component_of[w];
        if (cw != c) next.push_back(cw);
      }
    }
    std::sort(next.begin(), next.end());
    next.erase(std::unique(next.begin(), next.end()), next.end());
    for (uint32_t s : next) ++pending[s];
  }

  std::vector<std::vector<uint32_t>> reach(count);
  std::vector<uint64_t>              result(out_.size(), 0);
  std::vector<uint32_t>              merged;

  for (uint32_t c = 0; c < count; ++c) {
    std::vector<uint32_t> acc = components.members[c];

    for (uint32_t s : successors[c]) {
      merged.clear();
      std::set_union(acc.begin(), acc.end(), reach[s].begin(), reach[s].end(), std::back_inserter(merged));
      acc.swap(merged);
      if (--pending[s] == 0) {
        std::vector<uint32_t>().swap(reach[s]);
      }
    }

    // the set includes the node itself
    for (uint32_t member : components.members[c]) {
      result[member] = acc.size() - 1;
    }

    if (pending[c] > 0) {
      reach[c] = std::move(acc);
    }
  }

  return result;
}

} // namespace cpandb::graph
