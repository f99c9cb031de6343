#include <iostream>
#include <memory>
#include <string>

#include "internal/catalog/field_reference_extractor.hpp"
#include "internal/catalog/memory_record_source.hpp"
#include "internal/catalog/yaml_catalog_loader.hpp"
#include "internal/graph/graph_analytics.hpp"
#include "internal/graph/graph_builder.hpp"
#include "internal/query/field_accessor.hpp"

// Prints the most referenced records and the orphans of a catalog file.
int main(int argc, char** argv) {
  const std::string path = argc > 1 ? argv[1] : "examples/catalog/game_data.yaml";

  try {
    auto loaded  = datalens::catalog::YamlCatalogLoader::LoadFromFile(path);
    auto records = std::make_shared<datalens::catalog::MemoryRecordSource>();
    records->Reset(std::move(loaded.types), std::move(loaded.records));

    auto accessor  = std::make_shared<datalens::query::FieldAccessor>();
    auto extractor = std::make_shared<datalens::catalog::FieldReferenceExtractor>(records, accessor);

    datalens::graph::GraphCache cache(records, extractor);
    const auto                  graph = cache.GetCachedGraph();

    const auto stats = graph->Stats();
    std::cout << path << ": " << stats.total_nodes << " records, " << stats.total_edges << " references\n";

    std::cout << "most referenced:\n";
    for (const auto index : graph->MostReferenced(5)) {
      const auto& node = graph->GetNode(index);
      std::cout << "  " << node.DisplayName() << " <- " << node.ReferenceCount() << '\n';
    }

    std::cout << "orphans:\n";
    for (const auto& record : datalens::graph::GraphAnalytics(*graph).FindOrphans({"GameDatabase"})) {
      std::cout << "  " << record->Name() << " (" << record->Type().name() << ")\n";
    }
  } catch (const std::exception& e) {
    std::cerr << "dependency report failed: " << e.what() << '\n';
    return 1;
  }
  return 0;
}
