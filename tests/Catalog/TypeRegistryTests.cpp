// TypeRegistryTests.cpp - struct registration and type resolution

#include <catch2/catch_test_macros.hpp>

#include "Fixtures.hpp"

#include <cstdint>

using namespace Tessera::Catalog;
using namespace CatalogFixtures;

TEST_CASE("StructNamesFollowTheGrammar", "[catalog][TypeRegistry]") {
  CHECK(IsValidStructName("Widget"));
  CHECK(IsValidStructName("_internal2"));
  CHECK(IsValidStructName("Map<String,def>"));
  CHECK_FALSE(IsValidStructName(""));
  CHECK_FALSE(IsValidStructName("2fast"));
  CHECK_FALSE(IsValidStructName("int[]"));
  CHECK_FALSE(IsValidStructName("has space"));

  CHECK(IsValidMemberName("getX"));
  CHECK_FALSE(IsValidMemberName("List<Object>"));
  CHECK_FALSE(IsValidMemberName("9lives"));
}

TEST_CASE("AddStructRejectsInvalidNames", "[catalog][TypeRegistry]") {
  DefinitionBuilder b{MakeRegistry()};
  auto added = b.AddStruct("1Widget", ClassIdOf<Widget>());
  REQUIRE_FALSE(added.has_value());
  CHECK(added.error().code == ErrorCode::InvalidName);
}

TEST_CASE("AddStructRejectsDuplicateNames", "[catalog][TypeRegistry]") {
  DefinitionBuilder b{MakeRegistry()};
  REQUIRE(b.AddStruct("Widget", ClassIdOf<Widget>()).has_value());

  auto again = b.AddStruct("Widget", ClassIdOf<Gadget>());
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error().code == ErrorCode::DuplicateStruct);
}

TEST_CASE("SeveralStructsMayShareANativeClass", "[catalog][TypeRegistry]") {
  DefinitionBuilder b{MakeRegistry()};
  CHECK(b.AddStruct("Widget", ClassIdOf<Widget>()).has_value());
  CHECK(b.AddStruct("Widget<Fancy>", ClassIdOf<Widget>()).has_value());
  CHECK(b.GetType("Widget<Fancy>").value().Class() == ClassIdOf<Widget>());
  CHECK_FALSE(b.GetType("Widget<Fancy>").value() == b.GetType("Widget").value());
}

TEST_CASE("AddStructRejectsUnknownAndArrayClasses", "[catalog][TypeRegistry]") {
  auto registry = MakeRegistry();

  DefinitionBuilder unknown{registry};
  auto host = unknown.AddStruct("Registry", ClassIdOf<HostRegistry>());
  REQUIRE_FALSE(host.has_value());
  CHECK(host.error().code == ErrorCode::Binding);

  DefinitionBuilder arrays{registry};
  auto array = arrays.AddStruct("Widgets", registry->ArrayClass(ClassIdOf<Widget>(), 1).value());
  REQUIRE_FALSE(array.has_value());
  CHECK(array.error().code == ErrorCode::InvalidArgument);
}

TEST_CASE("AddStructByClassNameUsesHostLookup", "[catalog][TypeRegistry]") {
  DefinitionBuilder b{MakeRegistry()};
  REQUIRE(b.AddStructByClassName("Thing", "Widget").has_value());
  CHECK(b.GetType("Thing").value().Class() == ClassIdOf<Widget>());

  auto missing = b.AddStructByClassName("Other", "NoSuchClass");
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::Binding);
}

TEST_CASE("GetTypeAssignsSortsAndDescriptors", "[catalog][TypeRegistry]") {
  auto b = MakeBuilder();

  auto i = b.GetType("int").value();
  CHECK(i.GetSort() == Sort::Int);
  CHECK(i.Descriptor() == "I");
  CHECK(i.Dimensions() == 0);
  CHECK(i.Class() == ClassIdOf<std::int32_t>());

  CHECK(b.GetType("boolean").value().GetSort() == Sort::Bool);
  CHECK(b.GetType("void").value().GetSort() == Sort::Void);
  CHECK(b.GetType("def").value().GetSort() == Sort::Dynamic);

  auto widget = b.GetType("Widget").value();
  CHECK(widget.GetSort() == Sort::Object);
  CHECK(widget.Descriptor() == "LWidget;");
  CHECK(widget.Name() == "Widget");
  CHECK(widget.IsValid());
}

TEST_CASE("GetTypeParsesArraySuffixes", "[catalog][TypeRegistry]") {
  auto b = MakeBuilder();

  auto ints = b.GetType("int[][]").value();
  CHECK(ints.Name() == "int[][]");
  CHECK(ints.Dimensions() == 2);
  CHECK(ints.GetSort() == Sort::Array);
  CHECK(ints.Descriptor() == "[[I");
  CHECK(ints == b.GetType("int", 2).value());

  auto widgets = b.GetType("Widget[]").value();
  CHECK(widgets.Descriptor() == "[LWidget;");
  CHECK(widgets.StructIndex() == b.GetType("Widget").value().StructIndex());
  CHECK_FALSE(widgets == b.GetType("Widget").value());
  CHECK(widgets.Key() != b.GetType("Widget").value().Key());
}

TEST_CASE("GetTypeRejectsMalformedAndUnknownNames", "[catalog][TypeRegistry]") {
  auto b = MakeBuilder();

  for (auto name : {"int[", "int]", "int[]]", "int[x]", "int[][", "Missing", "Missing[]"}) {
    auto type = b.GetType(name);
    INFO(name);
    REQUIRE_FALSE(type.has_value());
    CHECK(type.error().code == ErrorCode::NotFound);
  }

  auto voids = b.GetType("void[]");
  REQUIRE_FALSE(voids.has_value());
  CHECK(voids.error().code == ErrorCode::InvalidArgument);

  // Failed lookups do not poison the build.
  CHECK_FALSE(b.FirstError().has_value());
  CHECK(b.AddStruct("Late", ClassIdOf<Gadget>()).has_value());
}

TEST_CASE("GetTypeByDimensionsFindsStruct", "[catalog][TypeRegistry]") {
  auto b = MakeBuilder();

  CHECK(b.GetType("Shape", 0).value() == b.GetType("Shape").value());
  CHECK(b.GetType("Shape", 3).value().Name() == "Shape[][][]");
  CHECK(b.GetType("Nope", 1).error().code == ErrorCode::NotFound);
  CHECK(b.GetType("Shape", MaxArrayDimensions + 1).error().code == ErrorCode::InvalidArgument);
}
