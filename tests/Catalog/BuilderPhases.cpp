// BuilderPhases.cpp - phase ordering and first-failure poisoning of DefinitionBuilder

#include <catch2/catch_test_macros.hpp>

#include "Fixtures.hpp"

#include <memory>
#include <string>

using namespace Tessera::Catalog;
using namespace CatalogFixtures;

namespace
{
  constexpr bool Instance = false;
}

TEST_CASE("PhasesAdvanceWithOperations", "[catalog][Builder]") {
  auto b = MakeBuilder();
  CHECK(b.CurrentPhase() == DefinitionBuilder::Phase::Structs);

  REQUIRE(b.AddMethod("Root", "hashCode", {}, Instance, TypeOf(b, "int"), {}).has_value());
  CHECK(b.CurrentPhase() == DefinitionBuilder::Phase::Members);

  REQUIRE(b.CopyStruct("Widget", {"Root"}).has_value());
  CHECK(b.CurrentPhase() == DefinitionBuilder::Phase::Inheritance);

  REQUIRE(b.AddTransform(TypeOf(b, "int"), TypeOf(b, "long"), false).has_value());
  CHECK(b.CurrentPhase() == DefinitionBuilder::Phase::Casts);

  REQUIRE(b.AddRuntimeClass("Widget").has_value());
  CHECK(b.CurrentPhase() == DefinitionBuilder::Phase::RuntimeClasses);

  auto def = std::move(b).Build();
  REQUIRE(def.has_value());
  CHECK((*def)->StructCount() == 12);
}

TEST_CASE("PhasesMayBeSkipped", "[catalog][Builder]") {
  auto b = MakeBuilder();
  REQUIRE(b.AddRuntimeClass("Widget").has_value());
  auto def = std::move(b).Build();
  REQUIRE(def.has_value());
  CHECK((*def)->CastCount() == 0);
  CHECK((*def)->RuntimeClassCount() == 1);
}

TEST_CASE("EmptyBuildProducesAnEmptyDefinition", "[catalog][Builder]") {
  DefinitionBuilder b{MakeRegistry()};
  auto def = std::move(b).Build();
  REQUIRE(def.has_value());
  CHECK((*def)->StructCount() == 0);
  CHECK((*def)->FindStruct("Widget") == nullptr);
  CHECK((*def)->GetStruct("Widget").error().code == ErrorCode::NotFound);
}

TEST_CASE("EarlierPhaseAfterLaterOneFails", "[catalog][Builder]") {
  auto b = MakeBuilder();
  REQUIRE(b.AddMethod("Root", "hashCode", {}, Instance, TypeOf(b, "int"), {}).has_value());

  auto late = b.AddStruct("Late", ClassIdOf<Gadget>());
  REQUIRE_FALSE(late.has_value());
  CHECK(late.error().code == ErrorCode::InvalidArgument);
  REQUIRE(b.FirstError().has_value());
  CHECK(b.FirstError()->code == ErrorCode::InvalidArgument);
}

TEST_CASE("FirstFailurePoisonsTheBuild", "[catalog][Builder]") {
  auto b = MakeBuilder();
  auto bad = b.AddMethod("Nope", "hashCode", {}, Instance, TypeOf(b, "int"), {});
  REQUIRE_FALSE(bad.has_value());
  CHECK(bad.error().code == ErrorCode::NotFound);

  // A valid operation after the failure is refused with the original code.
  auto next = b.AddMethod("Root", "hashCode", {}, Instance, TypeOf(b, "int"), {});
  REQUIRE_FALSE(next.has_value());
  CHECK(next.error().code == ErrorCode::NotFound);
  CHECK(next.error().message.find("already failed") != std::string::npos);

  auto cast = b.AddTransform(TypeOf(b, "int"), TypeOf(b, "long"), false);
  REQUIRE_FALSE(cast.has_value());
  CHECK(cast.error().code == ErrorCode::NotFound);

  // Type lookups still work against what was registered.
  CHECK(b.GetType("Widget").has_value());

  auto def = std::move(b).Build();
  REQUIRE_FALSE(def.has_value());
  CHECK(def.error().code == ErrorCode::NotFound);
}

TEST_CASE("BuilderNeedsABinder", "[catalog][Builder]") {
  DefinitionBuilder b{nullptr};
  auto added = b.AddStruct("Widget", ClassIdOf<Widget>());
  REQUIRE_FALSE(added.has_value());
  CHECK(added.error().code == ErrorCode::InvalidArgument);

  auto def = std::move(b).Build();
  REQUIRE_FALSE(def.has_value());
  CHECK(def.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("BuilderIsSpentAfterBuild", "[catalog][Builder]") {
  auto b = MakeBuilder();
  auto def = std::move(b).Build();
  REQUIRE(def.has_value());

  auto type = b.GetType("int");
  REQUIRE_FALSE(type.has_value());
  CHECK(type.error().code == ErrorCode::InvalidArgument);
  CHECK(type.error().message.find("already built") != std::string::npos);
  CHECK_FALSE(b.GetType("int", 1).has_value());

  auto added = b.AddStruct("Late", ClassIdOf<Gadget>());
  REQUIRE_FALSE(added.has_value());
  CHECK(added.error().code == ErrorCode::InvalidArgument);

  auto again = std::move(b).Build();
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error().code == ErrorCode::InvalidArgument);

  // The published definition is unaffected.
  CHECK((*def)->ResolveType("int").has_value());
}

TEST_CASE("DynamicTypeNameIsOwnedByTheDefinition", "[catalog][Builder]") {
  const auto makeOptions = [] {
    std::string name{"any"};
    name += "thing";
    return DefinitionOptions{.dynamicTypeName = name};
  };
  DefinitionBuilder b{MakeRegistry(), makeOptions()};
  REQUIRE(b.AddStruct("Root", ClassIdOf<Root>()).has_value());
  REQUIRE(b.AddStruct("anything", ClassIdOf<Root>()).has_value());
  auto def = std::move(b).Build().value();

  CHECK(def->Options().dynamicTypeName == "anything");
  CHECK(def->ResolveType("anything").value().GetSort() == Sort::Dynamic);
  CHECK(def->ResolveType("Root").value().GetSort() == Sort::Object);
}
