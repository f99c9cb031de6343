#include "graph_analytics.hpp"

#include <algorithm>
#include <queue>

namespace datalens::graph {

std::optional<std::vector<NodeIndex>> GraphAnalytics::ShortestPath(std::string_view from, std::string_view to) const {
  const auto from_node = graph_.FindNode(from);
  const auto to_node   = graph_.FindNode(to);
  if (!from_node || !to_node) return std::nullopt;

  return ShortestPath(*from_node, *to_node);
}

std::optional<std::vector<NodeIndex>> GraphAnalytics::ShortestPath(NodeIndex from, NodeIndex to) const {
  const auto node_count = graph_.NodeCount();
  if (from >= node_count || to >= node_count) return std::nullopt;
  if (from == to) return std::vector<NodeIndex>{from};

  constexpr NodeIndex    kNoParent = static_cast<NodeIndex>(-1);
  std::vector<bool>      visited(node_count, false);
  std::vector<NodeIndex> parent(node_count, kNoParent);
  std::queue<NodeIndex>  frontier;

  frontier.push(from);
  visited[from] = true;

  while (!frontier.empty()) {
    const NodeIndex current = frontier.front();
    frontier.pop();

    if (current == to) {
      std::vector<NodeIndex> path;
      for (NodeIndex node = to; node != kNoParent; node = parent[node]) {
        path.push_back(node);
        if (node == from) break;
      }
      std::reverse(path.begin(), path.end());
      return path;
    }

    for (NodeIndex dependency : graph_.DependenciesOf(current)) {
      if (visited[dependency]) continue;
      visited[dependency] = true;
      parent[dependency]  = current;
      frontier.push(dependency);
    }
  }

  return std::nullopt;
}

model::RecordSet GraphAnalytics::FindOrphans(const std::unordered_set<std::string>& excluded_types) const {
  model::RecordSet orphans;
  for (NodeIndex index : graph_.OrphanNodes()) {
    const auto& record = graph_.GetNode(index).record;
    if (!record) continue;
    if (excluded_types.contains(record->Type().name())) continue;
    orphans.push_back(record);
  }
  return orphans;
}

DependencyStats GraphAnalytics::StatsFor(const model::Record& record) const {
  const auto index = graph_.FindNode(record);
  if (!index) return {};

  const auto& node = graph_.GetNode(*index);
  return DependencyStats{node.ReferenceCount(), node.DependencyCount(), node.IsOrphan()};
}

model::RecordSet GraphAnalytics::Referencers(const model::Record& record) const {
  const auto index = graph_.FindNode(record);
  if (!index) return {};
  return ToRecords(graph_.DependentsOf(*index));
}

model::RecordSet GraphAnalytics::Dependencies(const model::Record& record) const {
  const auto index = graph_.FindNode(record);
  if (!index) return {};
  return ToRecords(graph_.DependenciesOf(*index));
}

model::RecordSet GraphAnalytics::ToRecords(const std::vector<NodeIndex>& nodes) const {
  model::RecordSet records;
  records.reserve(nodes.size());
  for (NodeIndex index : nodes) {
    const auto& record = graph_.GetNode(index).record;
    if (record) records.push_back(record);
  }
  return records;
}

} // namespace datalens::graph
