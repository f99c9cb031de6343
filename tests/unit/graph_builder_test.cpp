#include "internal/graph/graph_builder.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>

#include "internal/catalog/memory_record_source.hpp"
#include "internal/util/errors.hpp"
#include "test_records.hpp"

namespace {

using datalens::catalog::MemoryRecordSource;
using datalens::graph::BuildReport;
using datalens::graph::GraphBuilder;
using datalens::graph::GraphCache;
using datalens::graph::ReferenceExtractor;
using datalens::model::Record;
using datalens::model::RecordPtr;
using datalens::model::RecordSet;
using datalens::testing::MakeRecord;
using datalens::testing::MakeUnitRegistry;

// References are scripted per identity; listed identities throw instead.
class ScriptedExtractor : public ReferenceExtractor {
 public:
  RecordSet ReferencesOf(const Record& record) const override {
    ++calls;
    if (failing.contains(record.Identity())) {
      throw std::runtime_error("cannot read " + record.Identity());
    }
    auto it = references.find(record.Identity());
    return it == references.end() ? RecordSet{} : it->second;
  }

  std::unordered_map<std::string, RecordSet> references;
  std::unordered_map<std::string, bool>      failing;
  mutable int                                calls = 0;
};

struct FakeClock {
  datalens::util::TimePoint now{std::chrono::seconds(1000)};

  datalens::util::ClockFn Fn() {
    return [this] { return now; };
  }
};

RecordPtr Unit(const std::string& id) {
  static auto types = MakeUnitRegistry();
  return MakeRecord(types, "Unit", id, id);
}

void TestBuildCreatesNodesAndEdges() {
  auto a = Unit("a");
  auto b = Unit("b");
  auto c = Unit("c");

  ScriptedExtractor extractor;
  extractor.references["a"] = {b, c};
  extractor.references["b"] = {c};

  BuildReport report;
  auto        graph = GraphBuilder::Build({a, b, c}, extractor, &report);
  assert(graph->NodeCount() == 3);
  assert(graph->EdgeCount() == 3);
  assert(report.records == 3);
  assert(report.edges == 3);
  assert(report.extraction_failures == 0);
}

void TestSelfReferencesAreDropped() {
  auto a = Unit("a");

  ScriptedExtractor extractor;
  extractor.references["a"] = {a};

  BuildReport report;
  auto        graph = GraphBuilder::Build({a}, extractor, &report);
  assert(graph->EdgeCount() == 0);
  assert(report.self_references == 1);
  assert(graph->GetNode(*graph->FindNode("a")).IsOrphan());
}

void TestExtractionFailureOnlyDropsThatRecordsEdges() {
  auto a = Unit("a");
  auto b = Unit("b");
  auto c = Unit("c");

  ScriptedExtractor extractor;
  extractor.references["a"] = {c};
  extractor.references["b"] = {c};
  extractor.failing["a"]    = true;

  BuildReport report;
  auto        graph = GraphBuilder::Build({a, b, c}, extractor, &report);
  assert(report.extraction_failures == 1);
  assert(graph->NodeCount() == 3);
  assert(graph->EdgeCount() == 1);
  assert(graph->HasEdge(*graph->FindNode("b"), *graph->FindNode("c")));
}

void TestReferencesOutsideTheSetBecomeNodes() {
  auto a        = Unit("a");
  auto external = Unit("external");

  ScriptedExtractor extractor;
  extractor.references["a"] = {external};

  auto graph = GraphBuilder::Build({a}, extractor);
  assert(graph->NodeCount() == 2);
  assert(graph->FindNode("external").has_value());
}

void TestCacheRejectsMissingCollaborators() {
  bool threw = false;
  try {
    GraphCache cache(nullptr, std::make_shared<ScriptedExtractor>());
  } catch (const datalens::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);

  threw = false;
  try {
    GraphCache cache(std::make_shared<MemoryRecordSource>(), nullptr);
  } catch (const datalens::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestCacheServesSameGraphWithinValidity() {
  auto source = std::make_shared<MemoryRecordSource>();
  source->Add(Unit("a"));
  auto      extractor = std::make_shared<ScriptedExtractor>();
  FakeClock clock;

  GraphCache cache(source, extractor, std::chrono::seconds(30), clock.Fn());
  assert(!cache.HasValidGraph());
  assert(!cache.LastBuildTime().has_value());

  auto first = cache.GetCachedGraph();
  assert(cache.Generation() == 1);
  assert(cache.LastBuildTime() == clock.now);

  clock.now += std::chrono::seconds(29);
  auto second = cache.GetCachedGraph();
  assert(first == second);
  assert(cache.Generation() == 1);
  assert(extractor->calls == 1);

  clock.now += std::chrono::seconds(1);
  assert(!cache.HasValidGraph());
  auto third = cache.GetCachedGraph();
  assert(third != first);
  assert(cache.Generation() == 2);
}

void TestInvalidateForcesRebuildAndKeepsOldSnapshot() {
  auto source = std::make_shared<MemoryRecordSource>();
  source->Add(Unit("a"));
  FakeClock clock;

  GraphCache cache(source, std::make_shared<ScriptedExtractor>(), std::chrono::seconds(30), clock.Fn());
  auto       before = cache.GetCachedGraph();
  assert(before->NodeCount() == 1);

  source->Add(Unit("b"));
  assert(cache.GetCachedGraph()->NodeCount() == 1);

  cache.InvalidateCache();
  assert(!cache.HasValidGraph());

  auto after = cache.GetCachedGraph();
  assert(after->NodeCount() == 2);
  assert(before->NodeCount() == 1);
}

void TestBuildGraphWithoutCacheAlwaysRebuilds() {
  auto source = std::make_shared<MemoryRecordSource>();
  source->Add(Unit("a"));
  FakeClock clock;

  GraphCache cache(source, std::make_shared<ScriptedExtractor>(), std::chrono::seconds(30), clock.Fn());
  (void)cache.BuildGraph();
  (void)cache.BuildGraph(false);
  assert(cache.Generation() == 2);
  assert(cache.LastBuildReport().has_value());
  assert(cache.LastBuildReport()->records == 1);
}

void TestClockMovingBackwardsExpiresGraph() {
  auto source = std::make_shared<MemoryRecordSource>();
  source->Add(Unit("a"));
  FakeClock clock;

  GraphCache cache(source, std::make_shared<ScriptedExtractor>(), std::chrono::seconds(30), clock.Fn());
  (void)cache.GetCachedGraph();
  assert(cache.HasValidGraph());

  clock.now -= std::chrono::seconds(1);
  assert(!cache.HasValidGraph());
  (void)cache.GetCachedGraph();
  assert(cache.Generation() == 2);
}

void TestDefaultValidityIsThirtySeconds() {
  GraphCache cache(std::make_shared<MemoryRecordSource>(), std::make_shared<ScriptedExtractor>());
  assert(cache.validity() == std::chrono::seconds(30));
}

} // namespace

int main() {
  TestBuildCreatesNodesAndEdges();
  TestSelfReferencesAreDropped();
  TestExtractionFailureOnlyDropsThatRecordsEdges();
  TestReferencesOutsideTheSetBecomeNodes();
  TestCacheRejectsMissingCollaborators();
  TestCacheServesSameGraphWithinValidity();
  TestInvalidateForcesRebuildAndKeepsOldSnapshot();
  TestBuildGraphWithoutCacheAlwaysRebuilds();
  TestClockMovingBackwardsExpiresGraph();
  TestDefaultValidityIsThirtySeconds();

  std::cout << "datalens_unit_graph_builder: pass\n";
  return 0;
}
