#include "graph_builder.hpp"

#include "internal/catalog/record_source.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace datalens::graph {

using observability::IntField;
using observability::SizeField;
using observability::StringField;

// ------------------------------------------------------------
// GraphBuilder
// ------------------------------------------------------------

std::shared_ptr<DependencyGraph> GraphBuilder::Build(const model::RecordSet& records, const ReferenceExtractor& extractor, BuildReport* report) {
  const auto started_at = util::SteadyClock::now();

  auto        graph = std::make_shared<DependencyGraph>();
  BuildReport local;
  local.records = records.size();

  for (const auto& record : records) {
    graph->AddNode(record);
  }

  for (const auto& record : records) {
    if (!record || record->Identity().empty()) continue;

    model::RecordSet references;
    try {
      references = extractor.ReferencesOf(*record);
    } catch (const std::exception& e) {
      ++local.extraction_failures;
      DATALENS_LOG_WARN("reference extraction failed", {StringField("record", record->Identity()), StringField("error", e.what())});
      continue;
    }

    for (const auto& reference : references) {
      if (!reference) continue;
      if (reference->Identity() == record->Identity()) {
        ++local.self_references;
        continue;
      }
      graph->AddDependency(record, reference);
    }
  }

  local.nodes      = graph->NodeCount();
  local.edges      = graph->EdgeCount();
  local.elapsed_ms = util::MillisSince(started_at);

  if (local.extraction_failures > 0) {
    DATALENS_LOG_WARN("dependency graph built with extraction failures", {SizeField("failures", local.extraction_failures),
                                                                           SizeField("records", local.records)});
  }
  DATALENS_LOG_INFO("dependency graph built", {SizeField("nodes", local.nodes), SizeField("edges", local.edges),
                                               observability::DoubleField("elapsed_ms", local.elapsed_ms)});

  if (report) *report = local;
  return graph;
}

// ------------------------------------------------------------
// GraphCache
// ------------------------------------------------------------

GraphCache::GraphCache(std::shared_ptr<const catalog::RecordSource> source, std::shared_ptr<const ReferenceExtractor> extractor,
                       std::chrono::seconds validity, util::ClockFn clock)
    : source_(std::move(source)), extractor_(std::move(extractor)), validity_(validity), clock_(std::move(clock)) {
  if (!source_) {
    throw util::InvalidArgument("graph cache requires a record source");
  }
  if (!extractor_) {
    throw util::InvalidArgument("graph cache requires a reference extractor");
  }
  if (!clock_) {
    clock_ = util::Now;
  }
}

bool GraphCache::IsFreshLocked(util::TimePoint now) const {
  return graph_ && util::IsWithin(built_at_, validity_, now);
}

std::shared_ptr<const DependencyGraph> GraphCache::RebuildLocked() {
  BuildReport report;
  graph_       = GraphBuilder::Build(source_->ListAllRecords(), *extractor_, &report);
  built_at_    = clock_();
  last_report_ = report;
  ++generation_;
  return graph_;
}

std::shared_ptr<const DependencyGraph> GraphCache::GetCachedGraph() {
  return BuildGraph(true);
}

std::shared_ptr<const DependencyGraph> GraphCache::BuildGraph(bool use_cache) {
  std::lock_guard lock(mutex_);
  if (use_cache && IsFreshLocked(clock_())) {
    return graph_;
  }
  return RebuildLocked();
}

void GraphCache::InvalidateCache() {
  std::lock_guard lock(mutex_);
  if (graph_) {
    DATALENS_LOG_DEBUG("dependency graph cache invalidated", {IntField("generation", static_cast<int64_t>(generation_))});
  }
  graph_.reset();
}

bool GraphCache::HasValidGraph() const {
  std::lock_guard lock(mutex_);
  return IsFreshLocked(clock_());
}

std::optional<util::TimePoint> GraphCache::LastBuildTime() const {
  std::lock_guard lock(mutex_);
  if (!graph_) return std::nullopt;
  return built_at_;
}

std::optional<BuildReport> GraphCache::LastBuildReport() const {
  std::lock_guard lock(mutex_);
  return last_report_;
}

uint64_t GraphCache::Generation() const {
  std::lock_guard lock(mutex_);
  return generation_;
}

} // namespace datalens::graph
