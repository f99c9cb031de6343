#include "internal/graph/graph_analytics.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "test_records.hpp"

namespace {

using datalens::graph::DependencyGraph;
using datalens::graph::GraphAnalytics;
using datalens::graph::NodeIndex;
using datalens::model::RecordPtr;
using datalens::schema::TypeRegistry;
using datalens::testing::MakeRecord;

std::shared_ptr<TypeRegistry> Types() {
  static auto types = [] {
    auto registry = std::make_shared<TypeRegistry>();
    registry->Register("Item");
    registry->Register("Database");
    return registry;
  }();
  return types;
}

RecordPtr Item(const std::string& id) {
  return MakeRecord(Types(), "Item", id, id);
}

std::vector<std::string> Identities(const DependencyGraph& graph, const std::vector<NodeIndex>& path) {
  std::vector<std::string> out;
  for (const auto index : path) out.push_back(graph.GetNode(index).identity);
  return out;
}

void TestShortestPathPrefersFewestHops() {
  DependencyGraph graph;
  graph.AddDependency(Item("A"), Item("B"));
  graph.AddDependency(Item("B"), Item("C"));
  graph.AddDependency(Item("A"), Item("C"));

  const auto path = GraphAnalytics(graph).ShortestPath("A", "C");
  assert(path.has_value());
  assert(Identities(graph, *path) == (std::vector<std::string>{"A", "C"}));
}

void TestShortestPathFollowsDependencyDirection() {
  DependencyGraph graph;
  graph.AddDependency(Item("A"), Item("B"));
  graph.AddDependency(Item("B"), Item("C"));

  GraphAnalytics analytics(graph);
  const auto     forward = analytics.ShortestPath("A", "C");
  assert(forward.has_value());
  assert(Identities(graph, *forward) == (std::vector<std::string>{"A", "B", "C"}));
  assert(!analytics.ShortestPath("C", "A").has_value());
}

void TestShortestPathEdgeCases() {
  DependencyGraph graph;
  graph.AddDependency(Item("A"), Item("B"));
  graph.AddNode(Item("Z"));

  GraphAnalytics analytics(graph);
  assert(!analytics.ShortestPath("A", "Z").has_value());
  assert(!analytics.ShortestPath("A", "missing").has_value());
  assert(!analytics.ShortestPath("missing", "A").has_value());
  assert(!analytics.ShortestPath(NodeIndex{0}, NodeIndex{42}).has_value());

  const auto same = analytics.ShortestPath("A", "A");
  assert(same.has_value());
  assert(same->size() == 1);
}

void TestShortestPathTerminatesOnCycles() {
  DependencyGraph graph;
  graph.AddDependency(Item("A"), Item("B"));
  graph.AddDependency(Item("B"), Item("A"));
  graph.AddDependency(Item("B"), Item("C"));
  graph.AddNode(Item("D"));

  GraphAnalytics analytics(graph);
  assert(!analytics.ShortestPath("A", "D").has_value());
  const auto path = analytics.ShortestPath("A", "C");
  assert(path.has_value());
  assert(path->size() == 3);
}

void TestSingleNodeIsAnOrphan() {
  DependencyGraph graph;
  auto            p = Item("P");
  graph.AddNode(p);

  const auto orphans = GraphAnalytics(graph).FindOrphans();
  assert(orphans.size() == 1);
  assert(orphans[0] == p);
}

void TestOrphanTypeExclusion() {
  DependencyGraph graph;
  auto            db = MakeRecord(Types(), "Database", "db", "db");
  graph.AddDependency(db, Item("sword"));
  graph.AddNode(Item("unused"));

  GraphAnalytics analytics(graph);
  assert(analytics.FindOrphans().size() == 2);

  const auto orphans = analytics.FindOrphans({"Database"});
  assert(orphans.size() == 1);
  assert(orphans[0]->Identity() == "unused");
}

void TestStatsForRecord() {
  DependencyGraph graph;
  auto            a = Item("a");
  auto            b = Item("b");
  graph.AddDependency(a, b);

  GraphAnalytics analytics(graph);
  const auto     stats_b = analytics.StatsFor(*b);
  assert(stats_b.reference_count == 1);
  assert(stats_b.dependency_count == 0);
  assert(!stats_b.is_orphan);

  const auto stats_a = analytics.StatsFor(*a);
  assert(stats_a.dependency_count == 1);
  assert(stats_a.is_orphan);

  const auto missing = analytics.StatsFor(*Item("elsewhere"));
  assert(missing.reference_count == 0);
  assert(missing.dependency_count == 0);
  assert(missing.is_orphan);
}

void TestReferencersAndDependencies() {
  DependencyGraph graph;
  auto            a = Item("a");
  auto            b = Item("b");
  auto            c = Item("c");
  graph.AddDependency(a, c);
  graph.AddDependency(b, c);

  GraphAnalytics analytics(graph);
  const auto     referencers = analytics.Referencers(*c);
  assert(referencers.size() == 2);
  assert(referencers[0] == a);
  assert(referencers[1] == b);

  assert(analytics.Dependencies(*a).size() == 1);
  assert(analytics.Dependencies(*c).empty());
  assert(analytics.Referencers(*Item("elsewhere")).empty());
}

} // namespace

int main() {
  TestShortestPathPrefersFewestHops();
  TestShortestPathFollowsDependencyDirection();
  TestShortestPathEdgeCases();
  TestShortestPathTerminatesOnCycles();
  TestSingleNodeIsAnOrphan();
  TestOrphanTypeExclusion();
  TestStatsForRecord();
  TestReferencersAndDependencies();

  std::cout << "datalens_unit_graph_analytics: pass\n";
  return 0;
}
