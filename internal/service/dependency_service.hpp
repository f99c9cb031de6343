#pragma once

#include "datalens/v1.hpp"
#include "internal/model/record.hpp"
#include "service_context.hpp"

namespace datalens::service {

/*
  Graph-backed analyses. Every call reads one cached graph snapshot, so a
  response is consistent even when the cache is invalidated concurrently.
*/
class DependencyService {
 public:
  explicit DependencyService(ServiceContext ctx);

  datalens::v1::FindOrphansResponse FindOrphans(const datalens::v1::FindOrphansRequest& req);

  datalens::v1::RankResponse FindMostReferenced(const datalens::v1::RankRequest& req);
  datalens::v1::RankResponse FindMostDependencies(const datalens::v1::RankRequest& req);

  // Throw NotFound when the identity does not resolve to a record.
  datalens::v1::RecordListResponse GetReferencers(const datalens::v1::RecordRequest& req);
  datalens::v1::RecordListResponse GetDependencies(const datalens::v1::RecordRequest& req);
  datalens::v1::RecordStatsResponse GetRecordStats(const datalens::v1::RecordRequest& req);

  // found=false when either end is absent from the graph or unreachable.
  datalens::v1::ShortestPathResponse FindShortestPath(const datalens::v1::ShortestPathRequest& req);

  datalens::v1::GraphStatsResponse GetGraphStats(const datalens::v1::GraphStatsRequest& req);

  void InvalidateCache();

 private:
  model::RecordPtr RequireRecord(const datalens::v1::RecordID& id) const;
  uint32_t         TopN(uint32_t requested) const;

  ServiceContext ctx_;
};

} // namespace datalens::service
