#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

#include "internal/model/record.hpp"

namespace datalens::graph {

using NodeIndex = std::size_t;

struct Node {
  std::string            identity;
  model::RecordPtr       record;
  std::vector<NodeIndex> dependencies; // records this node points to
  std::vector<NodeIndex> dependents;   // records pointing to this node

  size_t ReferenceCount() const {
    return dependents.size();
  }
  size_t DependencyCount() const {
    return dependencies.size();
  }
  bool IsOrphan() const {
    return dependents.empty();
  }

  // "<name> (<type>)", or the identity when the record is gone.
  std::string DisplayName() const;
};

struct GraphStats {
  size_t total_nodes          = 0;
  size_t total_edges          = 0;
  size_t orphan_count         = 0;
  double average_dependencies = 0;

  double OrphanPercentage() const {
    return total_nodes > 0 ? static_cast<double>(orphan_count) / static_cast<double>(total_nodes) * 100.0 : 0.0;
  }
};

/*
  Directed reference graph, dependency -> dependent.

  Nodes live in a dense arena and are addressed by NodeIndex; one identity
  maps to exactly one index per graph. Every edge is stored twice (in the
  source's dependencies and the target's dependents) and only ever added
  as a pair. Adjacency lists keep insertion order, which makes traversal
  deterministic.

  Self-loops are accepted here; builders filter them out.
*/
class DependencyGraph {
 public:
  // Idempotent by identity. Null records and empty identities yield nullopt.
  std::optional<NodeIndex> AddNode(const model::RecordPtr& record);

  // Creates missing endpoints. Returns false when either record cannot be a
  // node. Adding an existing edge is a no-op.
  bool AddDependency(const model::RecordPtr& from, const model::RecordPtr& to);
  void AddDependency(NodeIndex from, NodeIndex to);

  std::optional<NodeIndex> FindNode(std::string_view identity) const;
  std::optional<NodeIndex> FindNode(const model::Record& record) const;

  const Node& GetNode(NodeIndex index) const;

  const std::vector<NodeIndex>& DependenciesOf(NodeIndex index) const;
  const std::vector<NodeIndex>& DependentsOf(NodeIndex index) const;

  bool HasEdge(NodeIndex from, NodeIndex to) const;

  // Insertion order.
  std::vector<NodeIndex> OrphanNodes() const;

  // Descending by dependents; ties by identity ascending.
  std::vector<NodeIndex> MostReferenced(size_t top_n = 10) const;

  // Descending by dependencies; ties by identity ascending.
  std::vector<NodeIndex> MostDependencies(size_t top_n = 10) const;

  GraphStats Stats() const;

  const std::vector<Node>& Nodes() const {
    return nodes_;
  }

  size_t NodeCount() const {
    return nodes_.size();
  }

  size_t EdgeCount() const {
    return edges_.size();
  }

  void Clear();

 private:
  template <typename Degree>
  std::vector<NodeIndex> RankBy(size_t top_n, Degree degree) const;

  std::vector<Node>                          nodes_;
  std::unordered_map<std::string, NodeIndex> by_identity_;
  std::set<std::pair<NodeIndex, NodeIndex>>  edges_;
};

} // namespace datalens::graph
