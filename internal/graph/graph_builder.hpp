#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>

#include "internal/graph/dependency_graph.hpp"
#include "internal/graph/reference_extractor.hpp"
#include "internal/util/time.hpp"

namespace datalens::catalog {
class RecordSource;
}

namespace datalens::graph {

struct BuildReport {
  size_t records             = 0;
  size_t nodes               = 0;
  size_t edges               = 0;
  size_t self_references     = 0;
  size_t extraction_failures = 0;
  double elapsed_ms          = 0;
};

/*
  Builds a graph from scratch: one node per record, then one edge per
  reference returned by the extractor. Self references are dropped. An
  extractor failure costs only that record's outgoing edges.
*/
class GraphBuilder {
 public:
  static std::shared_ptr<DependencyGraph> Build(const model::RecordSet& records, const ReferenceExtractor& extractor, BuildReport* report = nullptr);
};

/*
  Keeps the most recent graph for a validity window.

  Readers go through GetCachedGraph(), which rebuilds synchronously from the
  record source when there is no graph or it has expired. The check and the
  rebuild run under one mutex; callers receive an immutable snapshot that
  stays valid after invalidation. The cache cannot see changes to the
  record set on its own: the owner calls InvalidateCache() when it changes.
*/
class GraphCache {
 public:
  static constexpr std::chrono::seconds kDefaultValidity{30};

  // Throws InvalidArgument when source or extractor is null.
  GraphCache(std::shared_ptr<const catalog::RecordSource> source, std::shared_ptr<const ReferenceExtractor> extractor,
             std::chrono::seconds validity = kDefaultValidity, util::ClockFn clock = util::Now);

  std::shared_ptr<const DependencyGraph> GetCachedGraph();

  // use_cache=false forces a rebuild even when the cached graph is fresh.
  std::shared_ptr<const DependencyGraph> BuildGraph(bool use_cache = true);

  void InvalidateCache();

  bool                           HasValidGraph() const;
  std::optional<util::TimePoint> LastBuildTime() const;
  std::optional<BuildReport>     LastBuildReport() const;

  // Incremented on every rebuild.
  uint64_t Generation() const;

  std::chrono::seconds validity() const {
    return validity_;
  }

 private:
  bool IsFreshLocked(util::TimePoint now) const;
  std::shared_ptr<const DependencyGraph> RebuildLocked();

  std::shared_ptr<const catalog::RecordSource> source_;
  std::shared_ptr<const ReferenceExtractor>    extractor_;
  std::chrono::seconds                         validity_;
  util::ClockFn                                clock_;

  mutable std::mutex                     mutex_;
  std::shared_ptr<const DependencyGraph> graph_;
  util::TimePoint                        built_at_{};
  std::optional<BuildReport>             last_report_;
  uint64_t                               generation_ = 0;
};

} // namespace datalens::graph
