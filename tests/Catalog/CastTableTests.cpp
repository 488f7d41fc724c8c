// CastTableTests.cpp - primitive casts, adapter transforms and cast resolution

#include <catch2/catch_test_macros.hpp>

#include "Fixtures.hpp"

#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>

using namespace Tessera::Catalog;
using namespace CatalogFixtures;

namespace
{
  constexpr bool Static = true;
  constexpr bool Instance = false;
  constexpr bool Explicit = true;
  constexpr bool Implicit = false;

  // Members the transforms below use as adapters.
  void AddAdapters(DefinitionBuilder &b)
  {
    REQUIRE(b.AddMethod("Text", "length", {}, Instance, TypeOf(b, "int"), {}).has_value());
    REQUIRE(b.AddMethod("Widget", "box", {}, Static, TypeOf(b, "Root"), TypesOf(b, {"int"})).has_value());
    REQUIRE(b.AddMethod("Widget", "twice", {}, Static, TypeOf(b, "int"), TypesOf(b, {"int"})).has_value());
    REQUIRE(b.AddMethod("Widget", "stray", {}, Static, TypeOf(b, "Root"), TypesOf(b, {"int"})).has_value());
  }
} // namespace

TEST_CASE("PrimitiveCastsAreKeyedByDirectionAndKind", "[catalog][CastTable]") {
  auto b = MakeBuilder();
  const auto i = TypeOf(b, "int");
  const auto l = TypeOf(b, "long");
  const auto by = TypeOf(b, "byte");
  REQUIRE(b.AddTransform(i, l, Implicit).has_value());
  REQUIRE(b.AddTransform(l, i, Explicit).has_value());
  REQUIRE(b.AddTransform(i, by, Explicit).has_value());
  auto def = std::move(b).Build().value();

  CHECK(def->CastCount() == 3);
  CHECK(def->FindCast(i, l, false) != nullptr);
  CHECK(def->FindCast(i, l, true) == nullptr);
  CHECK(def->FindCast(l, i, true) != nullptr);
  CHECK(def->FindCast(l, i, false) == nullptr);
  CHECK_FALSE(def->FindCast(i, l, false)->IsTransform());
}

TEST_CASE("ResolveCastPrefersImplicitEdges", "[catalog][CastTable]") {
  auto b = MakeBuilder();
  const auto i = TypeOf(b, "int");
  const auto l = TypeOf(b, "long");
  const auto d = TypeOf(b, "double");
  REQUIRE(b.AddTransform(i, l, Implicit).has_value());
  REQUIRE(b.AddTransform(i, l, Explicit).has_value());
  REQUIRE(b.AddTransform(l, i, Explicit).has_value());
  auto def = std::move(b).Build().value();

  auto widen = def->ResolveCast(i, l, true);
  REQUIRE(widen.has_value());
  CHECK_FALSE((*widen)->isExplicit);

  auto narrowImplicitly = def->ResolveCast(l, i, false);
  REQUIRE_FALSE(narrowImplicitly.has_value());
  CHECK(narrowImplicitly.error().code == ErrorCode::Coercion);

  auto narrow = def->ResolveCast(l, i, true);
  REQUIRE(narrow.has_value());
  CHECK((*narrow)->isExplicit);

  auto missing = def->ResolveCast(i, d, true);
  REQUIRE_FALSE(missing.has_value());
  CHECK(missing.error().code == ErrorCode::Coercion);
}

TEST_CASE("PrimitiveCastsApplyArithmeticConversion", "[catalog][CastTable]") {
  auto b = MakeBuilder();
  const auto i = TypeOf(b, "int");
  REQUIRE(b.AddTransform(i, TypeOf(b, "byte"), Explicit).has_value());
  REQUIRE(b.AddTransform(i, TypeOf(b, "double"), Implicit).has_value());
  REQUIRE(b.AddTransform(TypeOf(b, "long"), i, Explicit).has_value());
  auto def = std::move(b).Build().value();

  auto toByte = def->FindCast(i, def->ResolveType("byte").value(), true)->Apply(Any{300});
  REQUIRE(toByte.has_value());
  CHECK(toByte->Cast<std::int8_t>() == 44);

  auto toDouble = def->FindCast(i, def->ResolveType("double").value(), false)->Apply(Any{3});
  REQUIRE(toDouble.has_value());
  CHECK(toDouble->Cast<double>() == 3.0);

  auto fromLong = def->FindCast(def->ResolveType("long").value(), i, true)->Apply(Any{std::int64_t{-5}});
  REQUIRE(fromLong.has_value());
  CHECK(fromLong->Cast<std::int32_t>() == -5);
}

TEST_CASE("FloatingToIntegralCastsSaturate", "[catalog][CastTable]") {
  auto b = MakeBuilder();
  const auto d = TypeOf(b, "double");
  REQUIRE(b.AddTransform(d, TypeOf(b, "int"), Explicit).has_value());
  REQUIRE(b.AddTransform(d, TypeOf(b, "long"), Explicit).has_value());
  REQUIRE(b.AddTransform(d, TypeOf(b, "byte"), Explicit).has_value());
  auto def = std::move(b).Build().value();

  const auto *toInt = def->FindCast(d, def->ResolveType("int").value(), true);
  REQUIRE(toInt != nullptr);
  CHECK(toInt->Apply(Any{1e20}).value().Cast<std::int32_t>() == std::numeric_limits<std::int32_t>::max());
  CHECK(toInt->Apply(Any{-1e20}).value().Cast<std::int32_t>() == std::numeric_limits<std::int32_t>::min());
  CHECK(toInt->Apply(Any{std::nan("")}).value().Cast<std::int32_t>() == 0);
  CHECK(toInt->Apply(Any{-2.7}).value().Cast<std::int32_t>() == -2);

  const auto *toLong = def->FindCast(d, def->ResolveType("long").value(), true);
  REQUIRE(toLong != nullptr);
  CHECK(toLong->Apply(Any{1e30}).value().Cast<std::int64_t>() == std::numeric_limits<std::int64_t>::max());
  CHECK(toLong->Apply(Any{std::nan("")}).value().Cast<std::int64_t>() == 0);

  // Through int first, then the low eight bits.
  const auto *toByte = def->FindCast(d, def->ResolveType("byte").value(), true);
  REQUIRE(toByte != nullptr);
  CHECK(toByte->Apply(Any{1e20}).value().Cast<std::int8_t>() == -1);
}

TEST_CASE("PrimitiveCastRegistrationErrors", "[catalog][CastTable]") {
  SECTION("identity") {
    auto b = MakeBuilder();
    auto added = b.AddTransform(TypeOf(b, "int"), TypeOf(b, "int"), Implicit);
    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().code == ErrorCode::InvalidArgument);
  }
  SECTION("duplicate") {
    auto b = MakeBuilder();
    REQUIRE(b.AddTransform(TypeOf(b, "int"), TypeOf(b, "long"), Implicit).has_value());
    auto again = b.AddTransform(TypeOf(b, "int"), TypeOf(b, "long"), Implicit);
    REQUIRE_FALSE(again.has_value());
    CHECK(again.error().code == ErrorCode::DuplicateCast);
  }
  SECTION("reference types need an adapter") {
    auto b = MakeBuilder();
    auto added = b.AddTransform(TypeOf(b, "Widget"), TypeOf(b, "int"), Explicit);
    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().code == ErrorCode::InvalidArgument);
  }
  SECTION("arrays need an adapter") {
    auto b = MakeBuilder();
    auto added = b.AddTransform(TypeOf(b, "int[]"), TypeOf(b, "long[]"), Explicit);
    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().code == ErrorCode::InvalidArgument);
  }
}

TEST_CASE("InstanceAdapterCallsTheSourceValue", "[catalog][CastTable]") {
  auto b = MakeBuilder();
  AddAdapters(b);
  REQUIRE(b.AddTransform(TypeOf(b, "Text"), TypeOf(b, "int"), "Text", "length", Instance, Explicit).has_value());
  auto def = std::move(b).Build().value();

  const auto *cast = def->FindCast(def->ResolveType("Text").value(), def->ResolveType("int").value(), true);
  REQUIRE(cast != nullptr);
  CHECK(cast->IsTransform());
  CHECK_FALSE(cast->upcast.has_value());
  CHECK_FALSE(cast->downcast.has_value());

  auto length = cast->Apply(Any{Ref{std::make_shared<Text>("abcd")}});
  REQUIRE(length.has_value());
  CHECK(length->Cast<std::int32_t>() == 4);

  auto null = cast->Apply(Any{Ref{}});
  REQUIRE_FALSE(null.has_value());
  CHECK(null.error().code == ErrorCode::HostFailure);

  auto notReference = cast->Apply(Any{1});
  REQUIRE_FALSE(notReference.has_value());
  CHECK(notReference.error().code == ErrorCode::Coercion);
}

TEST_CASE("AdapterOnASubclassRecordsAnUpcast", "[catalog][CastTable]") {
  auto b = MakeBuilder();
  AddAdapters(b);
  REQUIRE(b.AddTransform(TypeOf(b, "Root"), TypeOf(b, "int"), "Text", "length", Instance, Explicit).has_value());
  auto def = std::move(b).Build().value();

  const auto *cast = def->FindCast(def->ResolveType("Root").value(), def->ResolveType("int").value(), true);
  REQUIRE(cast != nullptr);
  REQUIRE(cast->upcast.has_value());
  CHECK(cast->upcast->Name() == "Text");
  CHECK_FALSE(cast->downcast.has_value());
}

TEST_CASE("AdapterReturningASupertypeRecordsADowncast", "[catalog][CastTable]") {
  auto b = MakeBuilder();
  AddAdapters(b);
  REQUIRE(b.AddTransform(TypeOf(b, "int"), TypeOf(b, "Widget"), "Widget", "box", Static, Explicit).has_value());
  auto def = std::move(b).Build().value();

  const auto *cast = def->FindCast(def->ResolveType("int").value(), def->ResolveType("Widget").value(), true);
  REQUIRE(cast != nullptr);
  CHECK_FALSE(cast->upcast.has_value());
  REQUIRE(cast->downcast.has_value());
  CHECK(cast->downcast->Name() == "Widget");

  auto boxed = cast->Apply(Any{6});
  REQUIRE(boxed.has_value());
  auto widget = std::dynamic_pointer_cast<Widget>(boxed->Cast<Ref>());
  REQUIRE(widget != nullptr);
  CHECK(widget->x == 6);
}

TEST_CASE("DowncastRejectsAResultOfTheWrongClass", "[catalog][CastTable]") {
  auto b = MakeBuilder();
  AddAdapters(b);
  REQUIRE(b.AddTransform(TypeOf(b, "int"), TypeOf(b, "Widget"), "Widget", "stray", Static, Explicit).has_value());
  auto def = std::move(b).Build().value();

  const auto *cast = def->FindCast(def->ResolveType("int").value(), def->ResolveType("Widget").value(), true);
  REQUIRE(cast != nullptr);
  REQUIRE(cast->downcast.has_value());

  auto stray = cast->Apply(Any{1});
  REQUIRE_FALSE(stray.has_value());
  CHECK(stray.error().code == ErrorCode::HostFailure);
  CHECK(stray.error().message.find("ClassCastException") != std::string::npos);
}

TEST_CASE("StaticAdapterMayWidenItsResult", "[catalog][CastTable]") {
  auto b = MakeBuilder();
  AddAdapters(b);
  REQUIRE(b.AddTransform(TypeOf(b, "int"), TypeOf(b, "Root"), "Widget", "box", Static, Implicit).has_value());
  auto def = std::move(b).Build().value();

  const auto *cast = def->FindCast(def->ResolveType("int").value(), def->ResolveType("Root").value(), false);
  REQUIRE(cast != nullptr);
  CHECK_FALSE(cast->downcast.has_value());
}

TEST_CASE("AdapterTransformErrors", "[catalog][CastTable]") {
  SECTION("undefined adapter") {
    auto b = MakeBuilder();
    AddAdapters(b);
    auto added = b.AddTransform(TypeOf(b, "Text"), TypeOf(b, "int"), "Text", "size", Instance, Explicit);
    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().code == ErrorCode::Binding);
  }
  SECTION("adapter of the wrong kind") {
    auto b = MakeBuilder();
    AddAdapters(b);
    // "length" is an instance method, so the static key length/1 does not exist.
    auto added = b.AddTransform(TypeOf(b, "Text"), TypeOf(b, "int"), "Text", "length", Static, Explicit);
    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().code == ErrorCode::Binding);
  }
  SECTION("unrelated source") {
    auto b = MakeBuilder();
    AddAdapters(b);
    auto added = b.AddTransform(TypeOf(b, "Gadget"), TypeOf(b, "int"), "Text", "length", Instance, Explicit);
    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().code == ErrorCode::TypeMismatch);
  }
  SECTION("unrelated target") {
    auto b = MakeBuilder();
    AddAdapters(b);
    auto added = b.AddTransform(TypeOf(b, "int"), TypeOf(b, "long"), "Widget", "twice", Static, Explicit);
    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().code == ErrorCode::TypeMismatch);
  }
  SECTION("identity") {
    auto b = MakeBuilder();
    AddAdapters(b);
    auto added = b.AddTransform(TypeOf(b, "int"), TypeOf(b, "int"), "Widget", "twice", Static, Implicit);
    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().code == ErrorCode::InvalidArgument);
  }
  SECTION("undefined owner") {
    auto b = MakeBuilder();
    auto added = b.AddTransform(TypeOf(b, "int"), TypeOf(b, "long"), "Nope", "twice", Static, Implicit);
    REQUIRE_FALSE(added.has_value());
    CHECK(added.error().code == ErrorCode::NotFound);
  }
}

TEST_CASE("ImplicitAndExplicitEdgesCoexist", "[catalog][CastTable]") {
  auto b = MakeBuilder();
  AddAdapters(b);
  const auto root = TypeOf(b, "Root");
  const auto i = TypeOf(b, "int");
  REQUIRE(b.AddTransform(root, i, "Text", "length", Instance, Implicit).has_value());
  REQUIRE(b.AddTransform(root, i, "Text", "length", Instance, Explicit).has_value());
  auto again = b.AddTransform(root, i, "Text", "length", Instance, Explicit);
  REQUIRE_FALSE(again.has_value());
  CHECK(again.error().code == ErrorCode::DuplicateCast);
}
