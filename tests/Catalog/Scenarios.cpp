// Scenarios.cpp - end-to-end use of the standard definition the way a script runtime drives it

#include <catch2/catch_test_macros.hpp>

#include <Tessera/Catalog/Catalog.hpp>
#include <Tessera/Catalog/Standard/Collections.hpp>
#include <Tessera/Catalog/Standard/FeatureTest.hpp>
#include <Tessera/Catalog/Standard/Lang.hpp>
#include <Tessera/Catalog/Standard/StandardDefinition.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <variant>

using namespace Tessera::Catalog;
using namespace Tessera::Catalog::Standard;

namespace
{
  const Definition &Std()
  {
    const auto &built = StandardDefinition();
    REQUIRE(built.has_value());
    return **built;
  }

  Ref NewFeatureTest(const Definition &def, std::int32_t x, std::int32_t y)
  {
    const auto *ctor = def.FindConstructor(*def.FindStruct("FeatureTest"), MethodKey{"new", 2});
    REQUIRE(ctor != nullptr);
    const std::array<Any, 2> args{Any{x}, Any{y}};
    auto made = ctor->Construct(args);
    REQUIRE(made.has_value());
    return made->Cast<Ref>();
  }
} // namespace

TEST_CASE("ScriptConstructsAndReadsAHostObject", "[catalog][Scenario]") {
  const auto &def = Std();
  auto ft = NewFeatureTest(def, 1, 2);
  const auto clazz = ClassIdOf<FeatureTest>();

  // x = ft.x; ft.x = 5; ft.y
  CHECK(def.LoadDynamic(clazz, ReceiverOf(ft), "x").value().Cast<std::int32_t>() == 1);
  REQUIRE(def.StoreDynamic(clazz, ReceiverOf(ft), "x", Any{5}).has_value());
  CHECK(std::dynamic_pointer_cast<FeatureTest>(ft)->GetX() == 5);
  CHECK(def.LoadDynamic(clazz, ReceiverOf(ft), "y").value().Cast<std::int32_t>() == 2);

  auto text = def.InvokeDynamic(clazz, ReceiverOf(ft), "toString", {});
  REQUIRE(text.has_value());
  CHECK(std::dynamic_pointer_cast<String>(text->Cast<Ref>())->Value() == "FeatureTest[x=5, y=2]");
}

TEST_CASE("StaticOverloadsResolveByArity", "[catalog][Scenario]") {
  const auto &def = Std();
  const auto &ft = *def.FindStruct("FeatureTest");

  auto none = def.ResolveMember(ft, MethodKey{"overloadedStatic", 0});
  REQUIRE(none.has_value());
  REQUIRE(std::holds_alternative<const Method *>(*none));
  const auto *noArgs = std::get<const Method *>(*none);
  CHECK(noArgs->isStatic);
  CHECK(noArgs->Invoke(nullptr, {}).value().Cast<bool>());

  const auto *oneArg = def.FindMethod(ft, MethodKey{"overloadedStatic", 1}, true);
  REQUIRE(oneArg != nullptr);
  const std::array<Any, 1> no{Any{false}};
  CHECK_FALSE(oneArg->Invoke(nullptr, no).value().Cast<bool>());

  // Statics and instance methods live in separate tables.
  CHECK(def.FindMethod(ft, MethodKey{"overloadedStatic", 0}, false) == nullptr);
  CHECK(def.FindMethod(ft, MethodKey{"getX", 0}, true) == nullptr);
  CHECK_FALSE(def.ResolveMember(ft, MethodKey{"overloadedStatic", 2}).has_value());
}

TEST_CASE("ScriptFillsAListThroughDynamicCalls", "[catalog][Scenario]") {
  const auto &def = Std();
  const auto &listStruct = *def.FindStruct("ArrayList<Object>");
  const auto *ctor = def.FindConstructor(listStruct, MethodKey{"new", 0});
  REQUIRE(ctor != nullptr);
  auto made = ctor->Construct({});
  REQUIRE(made.has_value());
  Ref list = made->Cast<Ref>();
  const auto clazz = ClassIdOf<ArrayList>();

  for (std::int32_t i = 0; i < 3; ++i) {
    const std::array<Any, 1> element{Any{Ref{Integer::ValueOf(i * 10)}}};
    auto added = def.InvokeDynamic(clazz, ReceiverOf(list), "add", element);
    REQUIRE(added.has_value());
    CHECK(added->Cast<bool>());
  }

  // list.length reads through the getLength alias of size().
  CHECK(def.LoadDynamic(clazz, ReceiverOf(list), "length").value().Cast<std::int32_t>() == 3);

  const std::array<Any, 1> index{Any{1}};
  auto second = def.InvokeDynamic(clazz, ReceiverOf(list), "get", index);
  REQUIRE(second.has_value());
  CHECK(std::dynamic_pointer_cast<Integer>(second->Cast<Ref>())->IntValue() == 10);

  const std::array<Any, 1> outOfRange{Any{7}};
  auto missing = def.InvokeDynamic(clazz, ReceiverOf(list), "get", outOfRange);
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::HostFailure);

  // "length" is a read-only property.
  auto stored = def.StoreDynamic(clazz, ReceiverOf(list), "length", Any{0});
  REQUIRE_FALSE(stored.has_value());
  CHECK(stored.error().code == ErrorCode::NoSuchMember);
}

TEST_CASE("ValuesCrossTheScriptBoundaryThroughCasts", "[catalog][Scenario]") {
  const auto &def = Std();
  const auto i = def.ResolveType("int").value();
  const auto dynamic = def.ResolveType("def").value();
  const auto d = def.ResolveType("double").value();

  // int x = 3; def boxed = x; double y = boxed;
  auto boxing = def.ResolveCast(i, dynamic, false);
  REQUIRE(boxing.has_value());
  auto boxed = (*boxing)->Apply(Any{3});
  REQUIRE(boxed.has_value());

  auto unboxing = def.ResolveCast(dynamic, d, false);
  REQUIRE(unboxing.has_value());
  auto unboxed = (*unboxing)->Apply(*boxed);
  REQUIRE(unboxed.has_value());
  CHECK(unboxed->Cast<double>() == 3.0);

  // int z = (int)2.9;
  auto narrow = def.ResolveCast(d, i, true);
  REQUIRE(narrow.has_value());
  CHECK((*narrow)->Apply(Any{2.9}).value().Cast<std::int32_t>() == 2);
  CHECK_FALSE(def.ResolveCast(d, i, false).has_value());
}

TEST_CASE("UnknownMembersFailLate", "[catalog][Scenario]") {
  const auto &def = Std();
  auto ft = NewFeatureTest(def, 0, 0);
  const auto clazz = ClassIdOf<FeatureTest>();

  auto load = def.LoadDynamic(clazz, ReceiverOf(ft), "z");
  REQUIRE_FALSE(load.has_value());
  CHECK(load.error().code == ErrorCode::NoSuchMember);

  const std::array<Any, 1> arg{Any{1}};
  auto call = def.InvokeDynamic(clazz, ReceiverOf(ft), "getX", arg);
  REQUIRE_FALSE(call.has_value());
  CHECK(call.error().code == ErrorCode::NoSuchMember);
}
