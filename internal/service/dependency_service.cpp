#include "dependency_service.hpp"

#include <unordered_set>

#include "internal/catalog/memory_record_source.hpp"
#include "internal/graph/graph_analytics.hpp"
#include "internal/graph/graph_builder.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "observe_call.hpp"
#include "proto_convert.hpp"

namespace datalens::service {

using namespace datalens::v1;

namespace {

RecordListResponse ToRecordList(const model::RecordSet& records) {
  RecordListResponse resp;
  for (const auto& record : records) {
    if (record) *resp.add_records() = ToRecordRef(*record);
  }
  return resp;
}

RankResponse ToRank(const graph::DependencyGraph& graph, const std::vector<graph::NodeIndex>& nodes) {
  RankResponse resp;
  for (const auto index : nodes) {
    *resp.add_nodes() = ToNodeSummary(graph.GetNode(index));
  }
  return resp;
}

} // namespace

DependencyService::DependencyService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

model::RecordPtr DependencyService::RequireRecord(const RecordID& id) const {
  if (id.value().empty()) {
    throw util::InvalidArgument("record id is required");
  }
  auto record = ctx_.records->LoadByIdentity(id.value());
  if (!record) {
    throw util::NotFound("record not found: " + id.value());
  }
  return record;
}

uint32_t DependencyService::TopN(uint32_t requested) const {
  return requested > 0 ? requested : ctx_.options.default_top_n;
}

FindOrphansResponse DependencyService::FindOrphans(const FindOrphansRequest& req) {
  return ObserveCall("DependencyService.FindOrphans", [&] {
    std::unordered_set<std::string> excluded(ctx_.options.orphan_excluded_types.begin(), ctx_.options.orphan_excluded_types.end());
    excluded.insert(req.excluded_types().begin(), req.excluded_types().end());

    const auto graph = ctx_.graph_cache->GetCachedGraph();

    FindOrphansResponse resp;
    for (const auto& record : graph::GraphAnalytics(*graph).FindOrphans(excluded)) {
      *resp.add_records() = ToRecordRef(*record);
    }
    return resp;
  });
}

RankResponse DependencyService::FindMostReferenced(const RankRequest& req) {
  return ObserveCall("DependencyService.FindMostReferenced", [&] {
    const auto graph = ctx_.graph_cache->GetCachedGraph();
    return ToRank(*graph, graph->MostReferenced(TopN(req.top_n())));
  });
}

RankResponse DependencyService::FindMostDependencies(const RankRequest& req) {
  return ObserveCall("DependencyService.FindMostDependencies", [&] {
    const auto graph = ctx_.graph_cache->GetCachedGraph();
    return ToRank(*graph, graph->MostDependencies(TopN(req.top_n())));
  });
}

RecordListResponse DependencyService::GetReferencers(const RecordRequest& req) {
  return ObserveCall("DependencyService.GetReferencers", [&] {
    const auto record = RequireRecord(req.id());
    const auto graph  = ctx_.graph_cache->GetCachedGraph();
    return ToRecordList(graph::GraphAnalytics(*graph).Referencers(*record));
  });
}

RecordListResponse DependencyService::GetDependencies(const RecordRequest& req) {
  return ObserveCall("DependencyService.GetDependencies", [&] {
    const auto record = RequireRecord(req.id());
    const auto graph  = ctx_.graph_cache->GetCachedGraph();
    return ToRecordList(graph::GraphAnalytics(*graph).Dependencies(*record));
  });
}

RecordStatsResponse DependencyService::GetRecordStats(const RecordRequest& req) {
  return ObserveCall("DependencyService.GetRecordStats", [&] {
    const auto record = RequireRecord(req.id());
    const auto graph  = ctx_.graph_cache->GetCachedGraph();
    const auto stats  = graph::GraphAnalytics(*graph).StatsFor(*record);

    RecordStatsResponse resp;
    auto*               summary = resp.mutable_summary();
    *summary->mutable_record()  = ToRecordRef(*record);
    summary->set_reference_count(stats.reference_count);
    summary->set_dependency_count(stats.dependency_count);
    summary->set_orphan(stats.is_orphan);
    return resp;
  });
}

ShortestPathResponse DependencyService::FindShortestPath(const ShortestPathRequest& req) {
  return ObserveCall("DependencyService.FindShortestPath", [&] {
    const auto graph = ctx_.graph_cache->GetCachedGraph();
    const auto path  = graph::GraphAnalytics(*graph).ShortestPath(req.from().value(), req.to().value());

    ShortestPathResponse resp;
    resp.set_found(path.has_value());
    if (path) {
      for (const auto index : *path) {
        *resp.add_path() = ToNodeSummary(graph->GetNode(index)).record();
      }
    }
    return resp;
  });
}

GraphStatsResponse DependencyService::GetGraphStats(const GraphStatsRequest&) {
  return ObserveCall("DependencyService.GetGraphStats", [&] {
    const auto graph = ctx_.graph_cache->GetCachedGraph();
    const auto stats = graph->Stats();

    GraphStatsResponse resp;
    resp.set_total_nodes(stats.total_nodes);
    resp.set_total_edges(stats.total_edges);
    resp.set_orphan_count(stats.orphan_count);
    resp.set_average_dependencies(stats.average_dependencies);
    resp.set_orphan_percentage(stats.OrphanPercentage());
    if (const auto built_at = ctx_.graph_cache->LastBuildTime()) {
      *resp.mutable_built_at() = util::ToProto(*built_at);
    }
    return resp;
  });
}

void DependencyService::InvalidateCache() {
  ObserveCall("DependencyService.InvalidateCache", [&] { ctx_.graph_cache->InvalidateCache(); });
}

} // namespace datalens::service
