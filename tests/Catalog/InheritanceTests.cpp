// InheritanceTests.cpp - copying parent members down into owning structs

#include <catch2/catch_test_macros.hpp>

#include "Fixtures.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace Tessera::Catalog;
using namespace CatalogFixtures;

namespace
{
  constexpr bool Instance = false;

  // Root and Shape members plus the Widget struct, left in the member phase.
  void AddBaseMembers(DefinitionBuilder &b)
  {
    REQUIRE(b.AddMethod("Root", "equals", {}, Instance, TypeOf(b, "boolean"), TypesOf(b, {"Root"})).has_value());
    REQUIRE(b.AddMethod("Root", "hashCode", {}, Instance, TypeOf(b, "int"), {}).has_value());
    REQUIRE(b.AddField("Root", "tag", {}, Instance, TypeOf(b, "int")).has_value());
    REQUIRE(b.AddMethod("Shape", "area", {}, Instance, TypeOf(b, "int"), {}).has_value());
  }

  std::vector<std::string> MethodNames(const Struct &s)
  {
    std::vector<std::string> names;
    for (NGIN::UIntSize i = 0; i < s.methods.Size(); ++i)
      names.emplace_back(s.methods[i].name);
    return names;
  }

  std::shared_ptr<const Definition> BuildWidget(std::initializer_list<std::string_view> parents)
  {
    auto b = MakeBuilder();
    AddBaseMembers(b);
    REQUIRE(b.CopyStruct("Widget", parents).has_value());
    auto built = std::move(b).Build();
    REQUIRE(built.has_value());
    return *built;
  }
} // namespace

TEST_CASE("CopyStructBringsParentMembersDown", "[catalog][Inheritance]") {
  auto def = BuildWidget({"Root", "Shape"});
  const auto &widget = *def->FindStruct("Widget");

  const auto *hash = def->FindMethod(widget, MethodKey{"hashCode", 0}, false);
  REQUIRE(hash != nullptr);
  CHECK(hash->owner == widget.index);
  const auto *area = def->FindMethod(widget, MethodKey{"area", 0}, false);
  REQUIRE(area != nullptr);
  const auto *tag = def->ResolveField(widget, "tag", false);
  REQUIRE(tag != nullptr);
  CHECK(tag->owner == widget.index);

  auto owned = std::make_shared<Widget>(5);
  Ref w = owned;
  CHECK(area->Invoke(ReceiverOf(w), {}).value().Cast<std::int32_t>() == 15);
  CHECK(hash->Invoke(ReceiverOf(w), {}).value().Cast<std::int32_t>() == 17);
  CHECK(tag->Load(ReceiverOf(w)).value().Cast<std::int32_t>() == 1);
}

TEST_CASE("CopyStructIsIndependentOfParentOrder", "[catalog][Inheritance]") {
  auto forward = BuildWidget({"Root", "Shape"});
  auto reverse = BuildWidget({"Shape", "Root"});

  const auto forwardNames = MethodNames(*forward->FindStruct("Widget"));
  const auto reverseNames = MethodNames(*reverse->FindStruct("Widget"));
  CHECK(forwardNames == reverseNames);
  // Shape is below the root, so its members are copied first.
  REQUIRE(forwardNames.size() == 3);
  CHECK(forwardNames.front() == "area");
}

TEST_CASE("OwnMembersWinOverInheritedOnes", "[catalog][Inheritance]") {
  auto b = MakeBuilder();
  AddBaseMembers(b);
  REQUIRE(b.AddMethod("Widget", "equals", {}, Instance, TypeOf(b, "boolean"), TypesOf(b, {"Root"}), std::nullopt,
                      TypesOf(b, {"Widget"}))
              .has_value());
  REQUIRE(b.CopyStruct("Widget", {"Root"}).has_value());
  auto def = std::move(b).Build().value();

  const auto *equals = def->FindMethod(*def->FindStruct("Widget"), MethodKey{"equals", 1}, false);
  REQUIRE(equals != nullptr);
  CHECK(equals->arguments[0].Name() == "Widget");
}

TEST_CASE("CopiesRebindAgainstTheOwnerClass", "[catalog][Inheritance]") {
  auto b = MakeBuilder();
  AddBaseMembers(b);
  REQUIRE(b.CopyStruct("Text", {"Root"}).has_value());
  auto def = std::move(b).Build().value();

  const auto &text = *def->FindStruct("Text");
  const auto *inherited = def->FindMethod(text, MethodKey{"hashCode", 0}, false);
  const auto *original = def->FindMethod(*def->FindStruct("Root"), MethodKey{"hashCode", 0}, false);
  REQUIRE(inherited != nullptr);
  REQUIRE(original != nullptr);
  CHECK(inherited->native == original->native);
  CHECK(inherited->owner == text.index);
  CHECK(original->owner == def->FindStruct("Root")->index);
}

TEST_CASE("ParentMustBeASupertype", "[catalog][Inheritance]") {
  auto b = MakeBuilder();
  AddBaseMembers(b);
  auto copied = b.CopyStruct("Widget", {"Gadget"});
  REQUIRE_FALSE(copied.has_value());
  CHECK(copied.error().code == ErrorCode::Binding);
}

TEST_CASE("ParentMustBeDefined", "[catalog][Inheritance]") {
  auto b = MakeBuilder();
  auto copied = b.CopyStruct("Widget", {"Nope"});
  REQUIRE_FALSE(copied.has_value());
  CHECK(copied.error().code == ErrorCode::NotFound);
}

TEST_CASE("InheritedMethodMayNotCollideWithStatics", "[catalog][Inheritance]") {
  auto b = MakeBuilder();
  AddBaseMembers(b);
  // A static "hashCode"/0 on the owner blocks the inherited instance method.
  REQUIRE(b.AddMethod("Widget", "hashCode", "instances", true, TypeOf(b, "int"), {}).has_value());
  auto copied = b.CopyStruct("Widget", {"Root"});
  REQUIRE_FALSE(copied.has_value());
  CHECK(copied.error().code == ErrorCode::DuplicateOverload);
}

TEST_CASE("InterfacesReachRootMembersOnlyWithFallback", "[catalog][Inheritance]") {
  SECTION("without fallback the interface cannot rebind root methods") {
    auto b = MakeBuilder();
    AddBaseMembers(b);
    auto copied = b.CopyStruct("Shape", {"Root"});
    REQUIRE_FALSE(copied.has_value());
    CHECK(copied.error().code == ErrorCode::Binding);
  }
  SECTION("with fallback the root class is used") {
    auto b = MakeBuilder(DefinitionOptions{.interfaceRootFallback = true});
    AddBaseMembers(b);
    REQUIRE(b.CopyStruct("Shape", {"Root"}).has_value());
    auto def = std::move(b).Build().value();
    const auto &shape = *def->FindStruct("Shape");
    const auto *hash = def->FindMethod(shape, MethodKey{"hashCode", 0}, false);
    REQUIRE(hash != nullptr);
    CHECK(hash->native->declaringClass == ClassIdOf<Root>());
    CHECK(def->Options().interfaceRootFallback);
  }
}

TEST_CASE("StaticsAndConstructorsAreNotInherited", "[catalog][Inheritance]") {
  auto b = MakeBuilder();
  REQUIRE(b.AddConstructor("Text", "new", {}).has_value());
  REQUIRE(b.AddMethod("Widget", "twice", {}, true, TypeOf(b, "int"), TypesOf(b, {"int"})).has_value());
  REQUIRE(b.AddMethod("Root", "hashCode", {}, Instance, TypeOf(b, "int"), {}).has_value());
  REQUIRE(b.CopyStruct("Widget", {"Root"}).has_value());
  auto def = std::move(b).Build().value();

  const auto &widget = *def->FindStruct("Widget");
  CHECK(widget.constructors.Size() == 0);
  CHECK(widget.staticMethods.Size() == 1);
  CHECK(widget.methods.Size() == 1);
  CHECK(def->FindStruct("Root")->staticMethods.Size() == 0);
}
