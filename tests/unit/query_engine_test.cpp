#include "internal/query/query_engine.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>

#include "internal/query/field_accessor.hpp"
#include "internal/util/errors.hpp"
#include "test_records.hpp"

namespace {

using datalens::model::RecordSet;
using datalens::model::Value;
using datalens::query::FieldAccessor;
using datalens::query::LogicalOperator;
using datalens::query::QueryEngine;
using datalens::query::QueryGroup;
using datalens::query::QueryOperator;
using datalens::testing::MakeRecord;
using datalens::testing::MakeUnitRegistry;

RecordSet MakeUnits() {
  auto types = MakeUnitRegistry();
  return {
      MakeRecord(types, "Unit", "units/goblin", "Goblin", {{"name", Value("Goblin")}, {"hp", Value(30)}}),
      MakeRecord(types, "Unit", "units/dragon", "Dragon", {{"name", Value("Dragon")}, {"hp", Value(500)}}),
      MakeRecord(types, "Unit", "units/golem", "Golem", {{"name", Value("Golem")}, {"hp", Value(220)}}),
  };
}

void TestNullAccessorIsRejected() {
  bool threw = false;
  try {
    QueryEngine engine(nullptr);
  } catch (const datalens::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestEmptyGroupReturnsInputInOrder() {
  QueryEngine engine(std::make_shared<FieldAccessor>());
  const auto  units = MakeUnits();

  const auto results = engine.Query(QueryGroup{}, units);
  assert(results.size() == units.size());
  for (size_t i = 0; i < units.size(); ++i) {
    assert(results[i] == units[i]);
  }
}

void TestResultsPreserveInputOrder() {
  QueryEngine engine(std::make_shared<FieldAccessor>());
  const auto  units = MakeUnits();

  QueryGroup group;
  group.AddCondition("hp", QueryOperator::kGreater, Value(100));
  const auto results = engine.Query(group, units);
  assert(results.size() == 2);
  assert(results[0]->Identity() == "units/dragon");
  assert(results[1]->Identity() == "units/golem");
}

void TestNullEntriesAreSkipped() {
  QueryEngine engine(std::make_shared<FieldAccessor>());
  auto        units = MakeUnits();
  units.insert(units.begin() + 1, nullptr);

  const auto results = engine.Query(QueryGroup{}, units);
  assert(results.size() == 3);
}

void TestOrGroup() {
  QueryEngine engine(std::make_shared<FieldAccessor>());
  const auto  units = MakeUnits();

  QueryGroup group(LogicalOperator::kOr);
  group.AddCondition("name", QueryOperator::kStartsWith, Value("go"));
  group.AddCondition("hp", QueryOperator::kGreaterOrEqual, Value(500));
  assert(engine.Query(group, units).size() == 3);

  group.mutable_conditions()[0].set_value(Value("gob"));
  const auto results = engine.Query(group, units);
  assert(results.size() == 2);
  assert(results[0]->Identity() == "units/goblin");
  assert(results[1]->Identity() == "units/dragon");
}

void TestQueryByField() {
  QueryEngine engine(std::make_shared<FieldAccessor>());
  const auto  results = engine.QueryByField("name", QueryOperator::kEqual, Value("Golem"), MakeUnits());
  assert(results.size() == 1);
  assert(results[0]->Name() == "Golem");
}

void TestSearchByName() {
  QueryEngine engine(std::make_shared<FieldAccessor>());
  const auto  units = MakeUnits();

  assert(engine.SearchByName("GO", false, units).size() == 2);
  assert(engine.SearchByName("GO", true, units).empty());
  assert(engine.SearchByName("Go", true, units).size() == 2);
  assert(engine.SearchByName("", false, units).size() == 3);
}

} // namespace

int main() {
  TestNullAccessorIsRejected();
  TestEmptyGroupReturnsInputInOrder();
  TestResultsPreserveInputOrder();
  TestNullEntriesAreSkipped();
  TestOrGroup();
  TestQueryByField();
  TestSearchByName();

  std::cout << "datalens_unit_query_engine: pass\n";
  return 0;
}
