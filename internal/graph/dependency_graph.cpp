#include "dependency_graph.hpp"

#include <algorithm>
#include <numeric>

#include "internal/util/errors.hpp"

namespace datalens::graph {

std::string Node::DisplayName() const {
  if (!record) return identity;
  return record->Name() + " (" + record->Type().name() + ")";
}

// ------------------------------------------------------------
// Mutation
// ------------------------------------------------------------

std::optional<NodeIndex> DependencyGraph::AddNode(const model::RecordPtr& record) {
  if (!record || record->Identity().empty()) return std::nullopt;

  const auto& identity = record->Identity();
  if (auto it = by_identity_.find(identity); it != by_identity_.end()) {
    return it->second;
  }

  const NodeIndex index = nodes_.size();
  Node            node;
  node.identity = identity;
  node.record   = record;
  nodes_.push_back(std::move(node));
  by_identity_.emplace(identity, index);
  return index;
}

bool DependencyGraph::AddDependency(const model::RecordPtr& from, const model::RecordPtr& to) {
  const auto from_index = AddNode(from);
  const auto to_index   = AddNode(to);
  if (!from_index || !to_index) return false;

  AddDependency(*from_index, *to_index);
  return true;
}

void DependencyGraph::AddDependency(NodeIndex from, NodeIndex to) {
  if (from >= nodes_.size() || to >= nodes_.size()) {
    throw util::InvalidArgument("dependency endpoint is not a node of this graph");
  }
  if (!edges_.emplace(from, to).second) return;

  nodes_[from].dependencies.push_back(to);
  nodes_[to].dependents.push_back(from);
}

void DependencyGraph::Clear() {
  nodes_.clear();
  by_identity_.clear();
  edges_.clear();
}

// ------------------------------------------------------------
// Reads
// ------------------------------------------------------------

std::optional<NodeIndex> DependencyGraph::FindNode(std::string_view identity) const {
  auto it = by_identity_.find(std::string(identity));
  if (it == by_identity_.end()) return std::nullopt;
  return it->second;
}

std::optional<NodeIndex> DependencyGraph::FindNode(const model::Record& record) const {
  return FindNode(record.Identity());
}

const Node& DependencyGraph::GetNode(NodeIndex index) const {
  if (index >= nodes_.size()) {
    throw util::NotFound("node index " + std::to_string(index) + " out of range");
  }
  return nodes_[index];
}

const std::vector<NodeIndex>& DependencyGraph::DependenciesOf(NodeIndex index) const {
  return GetNode(index).dependencies;
}

const std::vector<NodeIndex>& DependencyGraph::DependentsOf(NodeIndex index) const {
  return GetNode(index).dependents;
}

bool DependencyGraph::HasEdge(NodeIndex from, NodeIndex to) const {
  return edges_.contains({from, to});
}

std::vector<NodeIndex> DependencyGraph::OrphanNodes() const {
  std::vector<NodeIndex> orphans;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    if (nodes_[i].IsOrphan()) orphans.push_back(i);
  }
  return orphans;
}

template <typename Degree>
std::vector<NodeIndex> DependencyGraph::RankBy(size_t top_n, Degree degree) const {
  std::vector<NodeIndex> order(nodes_.size());
  std::iota(order.begin(), order.end(), NodeIndex{0});

  std::sort(order.begin(), order.end(), [&](NodeIndex a, NodeIndex b) {
    const auto da = degree(nodes_[a]);
    const auto db = degree(nodes_[b]);
    if (da != db) return da > db;
    return nodes_[a].identity < nodes_[b].identity;
  });

  if (order.size() > top_n) order.resize(top_n);
  return order;
}

std::vector<NodeIndex> DependencyGraph::MostReferenced(size_t top_n) const {
  return RankBy(top_n, [](const Node& node) { return node.ReferenceCount(); });
}

std::vector<NodeIndex> DependencyGraph::MostDependencies(size_t top_n) const {
  return RankBy(top_n, [](const Node& node) { return node.DependencyCount(); });
}

GraphStats DependencyGraph::Stats() const {
  GraphStats stats;
  stats.total_nodes  = nodes_.size();
  stats.total_edges  = edges_.size();
  stats.orphan_count = static_cast<size_t>(std::count_if(nodes_.begin(), nodes_.end(), [](const Node& n) { return n.IsOrphan(); }));
  if (stats.total_nodes > 0) {
    stats.average_dependencies = static_cast<double>(stats.total_edges) / static_cast<double>(stats.total_nodes);
  }
  return stats;
}

} // namespace datalens::graph
