#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace cpandb::graph {

/*
  Directed graph over distribution names. An edge (A, B) means
  "A depends on B". Duplicate edges and self-edges are allowed.
*/
class DependencyGraph {
 public:
  using NodeId = uint32_t;

  // Returns the existing id when name is already a node.
  NodeId AddNode(const std::string& name);

  // false when either endpoint is not a node; the edge is then ignored.
  bool AddEdge(const std::string& from, const std::string& to);

  std::optional<NodeId> Find(const std::string& name) const;

  const std::string& Name(NodeId id) const {
    return names_[id];
  }

  std::size_t NodeCount() const {
    return names_.size();
  }

  std::size_t EdgeCount() const {
    return edges_;
  }

  // Same nodes, every edge flipped.
  DependencyGraph Reversed() const;

  /*
    For every node, the number of distinct nodes reachable from it,
    the node itself excluded, indexed by NodeId.

    Cycles are condensed into strongly connected components first, so a
    node on a cycle reaches every member of its component exactly once.
    Components are then visited in reverse topological order and each
    reachable set is the union of the component's members and its
    successors' sets. A successor's set is freed as soon as its last
    predecessor has merged it.
  */
  std::vector<uint64_t> ReachableCounts() const;

 private:
  std::vector<std::string>                names_;
  std::unordered_map<std::string, NodeId> ids_;
  std::vector<std::vector<NodeId>>        out_;
  std::size_t                             edges_ = 0;
};

} // namespace cpandb::graph
