#include "internal/query/field_accessor.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include "test_records.hpp"

namespace {

using datalens::model::Value;
using datalens::query::FieldAccessor;
using datalens::schema::FieldKind;
using datalens::schema::TypeRegistry;

std::shared_ptr<TypeRegistry> MakeHierarchy() {
  auto  types = std::make_shared<TypeRegistry>();
  auto& base  = types->Register("EnemyBase");
  base.AddField({"m_Script", FieldKind::kObject, {}});
  base.AddField({"hp", FieldKind::kInteger, {}});
  base.AddField({"onDeath", FieldKind::kString, {}});
  base.AddField({"title", FieldKind::kString, {}});

  auto& boss = types->Register("BossDefinition", "EnemyBase");
  boss.AddField({"hp", FieldKind::kFloat, {}});
  boss.AddField({"onDeath", FieldKind::kDelegate, {}});
  boss.AddField({"m_GameObject", FieldKind::kObject, {}});
  boss.AddField({"phase", FieldKind::kInteger, {}});
  return types;
}

// Record whose reads always fail.
class BrokenRecord : public datalens::model::Record {
 public:
  explicit BrokenRecord(const datalens::schema::RecordType& type) : type_(type) {
  }
  const std::string& Identity() const override {
    return identity_;
  }
  const std::string& Name() const override {
    return identity_;
  }
  const datalens::schema::RecordType& Type() const override {
    return type_;
  }
  Value Get(const datalens::schema::FieldDescriptor&) const override {
    throw std::runtime_error("storage unavailable");
  }

 private:
  std::string                         identity_ = "broken";
  const datalens::schema::RecordType& type_;
};

void TestMostDerivedDeclarationWins() {
  auto          types = MakeHierarchy();
  FieldAccessor accessor;

  auto hp = accessor.Resolve(*types->Find("BossDefinition"), "hp");
  assert(hp.has_value());
  assert(hp->kind == FieldKind::kFloat);
  assert(hp->owner == types->Find("BossDefinition"));

  auto base_hp = accessor.Resolve(*types->Find("EnemyBase"), "hp");
  assert(base_hp.has_value());
  assert(base_hp->kind == FieldKind::kInteger);
}

void TestInheritedFieldsResolveThroughBaseChain() {
  auto          types = MakeHierarchy();
  FieldAccessor accessor;

  auto title = accessor.Resolve(*types->Find("BossDefinition"), "title");
  assert(title.has_value());
  assert(title->owner == types->Find("EnemyBase"));
  assert(!accessor.Resolve(*types->Find("BossDefinition"), "missing").has_value());
  assert(!accessor.Resolve(*types->Find("BossDefinition"), "").has_value());
}

void TestDelegateShadowsBaseField() {
  auto          types = MakeHierarchy();
  FieldAccessor accessor;

  assert(!accessor.Resolve(*types->Find("BossDefinition"), "onDeath").has_value());
  assert(accessor.Resolve(*types->Find("EnemyBase"), "onDeath").has_value());
}

void TestReservedNamesAreNeverResolvable() {
  auto          types = MakeHierarchy();
  FieldAccessor accessor;

  assert(!accessor.Resolve(*types->Find("EnemyBase"), "m_Script").has_value());
  assert(!accessor.Resolve(*types->Find("BossDefinition"), "m_GameObject").has_value());

  assert(FieldAccessor::IsBuiltinReservedName("m_Script"));
  assert(FieldAccessor::IsBuiltinReservedName("m_ObjectHideFlags"));
  assert(FieldAccessor::IsBuiltinReservedName("m_EditorIcon"));
  assert(!FieldAccessor::IsBuiltinReservedName("m_Damage"));
  assert(!FieldAccessor::IsBuiltinReservedName("hideFlags"));
}

void TestExtraReservedNamesFromConfiguration() {
  auto          types = MakeHierarchy();
  FieldAccessor accessor({"phase"});

  assert(!accessor.Resolve(*types->Find("BossDefinition"), "phase").has_value());
  for (const auto& field : accessor.QueryableFields(*types->Find("BossDefinition"))) {
    assert(field.name != "phase");
  }
}

void TestMissesAreCachedAndClearable() {
  auto          types = MakeHierarchy();
  FieldAccessor accessor;
  const auto&   boss = *types->Find("BossDefinition");

  assert(accessor.CacheSize() == 0);
  (void)accessor.Resolve(boss, "hp");
  (void)accessor.Resolve(boss, "missing");
  (void)accessor.Resolve(boss, "missing");
  assert(accessor.CacheSize() == 2);

  accessor.ClearCache();
  assert(accessor.CacheSize() == 0);
}

void TestQueryableFieldsListOwnFieldsFirst() {
  auto          types = MakeHierarchy();
  FieldAccessor accessor;

  const auto fields = accessor.QueryableFields(*types->Find("BossDefinition"));
  // hp (own, float), phase (own), title (inherited). onDeath is shadowed
  // by a delegate; m_* names are reserved.
  assert(fields.size() == 3);
  assert(fields[0].name == "hp" && fields[0].kind == FieldKind::kFloat);
  assert(fields[1].name == "phase");
  assert(fields[2].name == "title");
}

void TestFailingReadYieldsNull() {
  auto          types = MakeHierarchy();
  FieldAccessor accessor;
  BrokenRecord  record(*types->Find("EnemyBase"));

  auto hp = accessor.Resolve(record.Type(), "hp");
  assert(hp.has_value());
  assert(accessor.GetValue(record, *hp).IsNull());
}

void TestGetValueReadsRecord() {
  auto          types = datalens::testing::MakeUnitRegistry();
  FieldAccessor accessor;
  auto          unit = datalens::testing::MakeRecord(types, "Unit", "u1", "Goblin", {{"hp", Value(30)}});

  auto hp = accessor.Resolve(unit->Type(), "hp");
  assert(hp.has_value());
  assert(accessor.GetValue(*unit, *hp) == Value(30));

  auto name = accessor.Resolve(unit->Type(), "name");
  assert(name.has_value());
  assert(accessor.GetValue(*unit, *name).IsNull());
}

} // namespace

int main() {
  TestMostDerivedDeclarationWins();
  TestInheritedFieldsResolveThroughBaseChain();
  TestDelegateShadowsBaseField();
  TestReservedNamesAreNeverResolvable();
  TestExtraReservedNamesFromConfiguration();
  TestMissesAreCachedAndClearable();
  TestQueryableFieldsListOwnFieldsFirst();
  TestFailingReadYieldsNull();
  TestGetValueReadsRecord();

  std::cout << "datalens_unit_field_accessor: pass\n";
  return 0;
}
