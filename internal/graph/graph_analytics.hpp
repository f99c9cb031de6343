#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

#include "internal/graph/dependency_graph.hpp"

namespace datalens::graph {

struct DependencyStats {
  size_t reference_count  = 0;
  size_t dependency_count = 0;
  bool   is_orphan        = true;
};

/*
  Read-only analyses over one graph snapshot.
*/
class GraphAnalytics {
 public:
  explicit GraphAnalytics(const DependencyGraph& graph) : graph_(graph) {
  }

  // Breadth-first over the dependency direction. Returns [from] when both
  // ends are the same node, nullopt when either end is absent or `to` is
  // unreachable. The first shortest path discovered wins; neighbours are
  // expanded in insertion order.
  std::optional<std::vector<NodeIndex>> ShortestPath(std::string_view from, std::string_view to) const;
  std::optional<std::vector<NodeIndex>> ShortestPath(NodeIndex from, NodeIndex to) const;

  // Orphans whose runtime type name is not in excluded_types.
  model::RecordSet FindOrphans(const std::unordered_set<std::string>& excluded_types = {}) const;

  // All-zero and orphan when the record has no node.
  DependencyStats StatsFor(const model::Record& record) const;

  model::RecordSet Referencers(const model::Record& record) const;
  model::RecordSet Dependencies(const model::Record& record) const;

  model::RecordSet ToRecords(const std::vector<NodeIndex>& nodes) const;

 private:
  const DependencyGraph& graph_;
};

} // namespace datalens::graph
