// StandardDefinitionTests.cpp - shape of the standard whitelist and its cast matrix

#include <catch2/catch_test_macros.hpp>

#include <Tessera/Catalog/Catalog.hpp>
#include <Tessera/Catalog/Standard/Collections.hpp>
#include <Tessera/Catalog/Standard/Lang.hpp>
#include <Tessera/Catalog/Standard/StandardDefinition.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <string_view>
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

  Type T(std::string_view name)
  {
    return Std().ResolveType(name).value();
  }

  const Struct &S(std::string_view name)
  {
    const auto *s = Std().FindStruct(name);
    REQUIRE(s != nullptr);
    return *s;
  }
} // namespace

TEST_CASE("StandardDefinitionBuilds", "[catalog][Standard]") {
  const auto &def = Std();
  CHECK(def.StructCount() == 58);
  CHECK(def.RuntimeClassCount() == 30);
  CHECK(def.CastCount() == 263);
  CHECK(def.Options().interfaceRootFallback);

  // Built once and shared.
  CHECK(StandardDefinition().value() == StandardDefinition().value());
}

TEST_CASE("FeatureTestIsOptional", "[catalog][Standard]") {
  auto built = BuildStandardDefinition(StandardOptions{.includeFeatureTest = false});
  REQUIRE(built.has_value());
  CHECK((*built)->StructCount() == 57);
  CHECK((*built)->RuntimeClassCount() == 29);
  CHECK((*built)->FindStruct("FeatureTest") == nullptr);
}

TEST_CASE("StandardTypesCarryTheirSorts", "[catalog][Standard]") {
  CHECK(T("int").GetSort() == Sort::Int);
  CHECK(T("char").GetSort() == Sort::Char);
  CHECK(T("Integer").GetSort() == Sort::IntObj);
  CHECK(T("Character").GetSort() == Sort::CharObj);
  CHECK(T("Boolean").GetSort() == Sort::BoolObj);
  CHECK(T("Void").GetSort() == Sort::VoidObj);
  CHECK(T("Number").GetSort() == Sort::Number);
  CHECK(T("String").GetSort() == Sort::String);
  CHECK(T("Object").GetSort() == Sort::Object);
  CHECK(T("def").GetSort() == Sort::Dynamic);
  CHECK(T("List<String>").GetSort() == Sort::Object);
  CHECK(T("String[]").GetSort() == Sort::Array);

  // def and Object share a native class but remain distinct types.
  CHECK(T("def").Class() == T("Object").Class());
  CHECK_FALSE(T("def") == T("Object"));
}

TEST_CASE("PrimitiveMatrixWidensImplicitly", "[catalog][Standard]") {
  const auto &def = Std();
  constexpr std::array<std::string_view, 7> numeric{"byte", "short", "char", "int", "long", "float", "double"};

  for (const auto from : numeric) {
    for (const auto to : numeric) {
      INFO(from << " -> " << to);
      const bool implicitEdge = def.FindCast(T(from), T(to), false) != nullptr;
      const bool explicitEdge = def.FindCast(T(from), T(to), true) != nullptr;
      if (from == to) {
        CHECK_FALSE(implicitEdge);
        CHECK_FALSE(explicitEdge);
      } else {
        CHECK(implicitEdge != explicitEdge);
        CHECK(def.ResolveCast(T(from), T(to), true).has_value());
      }
    }
  }

  CHECK(def.FindCast(T("int"), T("long"), false) != nullptr);
  CHECK(def.FindCast(T("char"), T("int"), false) != nullptr);
  CHECK(def.FindCast(T("long"), T("float"), false) != nullptr);
  CHECK(def.FindCast(T("short"), T("char"), true) != nullptr);
  CHECK(def.FindCast(T("char"), T("short"), true) != nullptr);
  CHECK(def.FindCast(T("double"), T("float"), true) != nullptr);
  CHECK(def.ResolveCast(T("double"), T("int"), false).error().code == ErrorCode::Coercion);
}

TEST_CASE("BooleanDoesNotConvertToNumbers", "[catalog][Standard]") {
  const auto &def = Std();
  CHECK(def.ResolveCast(T("boolean"), T("int"), true).error().code == ErrorCode::Coercion);
  CHECK(def.ResolveCast(T("int"), T("boolean"), true).error().code == ErrorCode::Coercion);
}

TEST_CASE("BoxingRunsThroughValueOf", "[catalog][Standard]") {
  const auto &def = Std();
  auto cast = def.ResolveCast(T("int"), T("Integer"), false);
  REQUIRE(cast.has_value());
  REQUIRE((*cast)->IsTransform());
  CHECK((*cast)->adapter->name == "valueOf");

  auto boxed = (*cast)->Apply(Any{5});
  REQUIRE(boxed.has_value());
  auto integer = std::dynamic_pointer_cast<Integer>(boxed->Cast<Ref>());
  REQUIRE(integer != nullptr);
  CHECK(integer->IntValue() == 5);

  // Boxing to a supertype still calls the box's factory.
  auto toObject = def.ResolveCast(T("double"), T("Object"), false);
  REQUIRE(toObject.has_value());
  auto asObject = (*toObject)->Apply(Any{2.5});
  REQUIRE(asObject.has_value());
  CHECK(std::dynamic_pointer_cast<Double>(asObject->Cast<Ref>()) != nullptr);
}

TEST_CASE("UnboxingNarrowsOnlyExplicitly", "[catalog][Standard]") {
  const auto &def = Std();
  CHECK(def.FindCast(T("Integer"), T("int"), false) != nullptr);
  CHECK(def.FindCast(T("Integer"), T("long"), false) != nullptr);
  CHECK(def.FindCast(T("Integer"), T("byte"), false) == nullptr);
  CHECK(def.FindCast(T("Integer"), T("byte"), true) != nullptr);

  const auto *unbox = def.FindCast(T("Integer"), T("long"), false);
  auto value = unbox->Apply(Any{Ref{Integer::ValueOf(9)}});
  REQUIRE(value.has_value());
  CHECK(value->Cast<std::int64_t>() == 9);
}

TEST_CASE("DynamicTypeHasImplicitAndExplicitEdges", "[catalog][Standard]") {
  const auto &def = Std();
  const auto *implicitToByte = def.FindCast(T("def"), T("byte"), false);
  const auto *explicitToByte = def.FindCast(T("def"), T("byte"), true);
  REQUIRE(implicitToByte != nullptr);
  REQUIRE(explicitToByte != nullptr);
  CHECK(implicitToByte->adapter->name == "DefTobyteImplicit");
  CHECK(explicitToByte->adapter->name == "DefTobyteExplicit");

  const Any boxedInt{Ref{Integer::ValueOf(300)}};

  // An Integer does not implicitly narrow to byte.
  auto narrowed = implicitToByte->Apply(boxedInt);
  REQUIRE_FALSE(narrowed.has_value());
  CHECK(narrowed.error().code == ErrorCode::HostFailure);
  CHECK(narrowed.error().message.starts_with("ClassCastException"));

  auto forced = explicitToByte->Apply(boxedInt);
  REQUIRE(forced.has_value());
  CHECK(forced->Cast<std::int8_t>() == 44);

  // A Short widens implicitly to int.
  auto widened = def.FindCast(T("def"), T("int"), false)->Apply(Any{Ref{Short::ValueOf(7)}});
  REQUIRE(widened.has_value());
  CHECK(widened->Cast<std::int32_t>() == 7);

  auto fromNull = def.FindCast(T("def"), T("int"), false)->Apply(Any{Ref{}});
  REQUIRE_FALSE(fromNull.has_value());
  CHECK(fromNull.error().code == ErrorCode::HostFailure);
}

TEST_CASE("AdapterCastsNarrowTheirSource", "[catalog][Standard]") {
  const auto &def = Std();

  // Object unboxes through Number.intValue, so the value is narrowed to Number first.
  const auto *objectToInt = def.FindCast(T("Object"), T("int"), true);
  REQUIRE(objectToInt != nullptr);
  REQUIRE(objectToInt->upcast.has_value());
  CHECK(objectToInt->upcast->Name() == "Number");

  // Integer.valueOf already returns a Number.
  const auto *intToNumber = def.FindCast(T("int"), T("Number"), false);
  REQUIRE(intToNumber != nullptr);
  CHECK_FALSE(intToNumber->downcast.has_value());

  // Utility.NumberToLong takes a Number, which an Integer already is.
  const auto *integerToLong = def.FindCast(T("Integer"), T("Long"), false);
  REQUIRE(integerToLong != nullptr);
  CHECK_FALSE(integerToLong->upcast.has_value());
}

TEST_CASE("RootMembersReachEveryStruct", "[catalog][Standard]") {
  const auto &def = Std();
  for (const auto name : {"String", "Integer", "List<Object>", "Map<String,def>", "Iterator", "CharSequence",
                          "Exception", "FeatureTest"}) {
    INFO(name);
    const auto &s = S(name);
    CHECK(def.FindMethod(s, MethodKey{"equals", 1}, false) != nullptr);
    CHECK(def.FindMethod(s, MethodKey{"hashCode", 0}, false) != nullptr);
    CHECK(def.FindMethod(s, MethodKey{"toString", 0}, false) != nullptr);
  }
}

TEST_CASE("GenericStructsExposeNarrowedSignatures", "[catalog][Standard]") {
  const auto &def = Std();

  CHECK(def.FindMethod(S("List"), MethodKey{"get", 1}, false)->returnType.Name() == "def");
  CHECK(def.FindMethod(S("List<Object>"), MethodKey{"get", 1}, false)->returnType.Name() == "Object");
  CHECK(def.FindMethod(S("List<String>"), MethodKey{"get", 1}, false)->returnType.Name() == "String");
  CHECK(def.FindMethod(S("ArrayList<String>"), MethodKey{"get", 1}, false)->returnType.Name() == "String");

  const auto *put = def.FindMethod(S("Map<String,def>"), MethodKey{"put", 2}, false);
  REQUIRE(put != nullptr);
  CHECK(put->arguments[0].Name() == "String");
  CHECK(put->arguments[1].Name() == "def");

  const auto *add = def.FindMethod(S("Collection<String>"), MethodKey{"add", 1}, false);
  REQUIRE(add != nullptr);
  CHECK(add->arguments[0].Name() == "String");
  CHECK(def.FindMethod(S("Collection<Object>"), MethodKey{"add", 1}, false)->arguments[0].Name() == "Object");

  CHECK(def.FindMethod(S("Map<String,Object>"), MethodKey{"keySet", 0}, false)->returnType.Name() == "Set<String>");
}

TEST_CASE("ListLengthAliasesSize", "[catalog][Standard]") {
  const auto &def = Std();
  const auto *length = def.FindMethod(S("ArrayList<Object>"), MethodKey{"getLength", 0}, false);
  REQUIRE(length != nullptr);
  CHECK(length->native->name == "size");

  auto list = std::make_shared<ArrayList>();
  list->Add(String::Make("a"));
  list->Add(String::Make("b"));
  Ref ref = list;
  auto size = length->Invoke(ReceiverOf(ref), {});
  REQUIRE(size.has_value());
  CHECK(size->Cast<std::int32_t>() == 2);
}

TEST_CASE("OverloadsAreKeyedByArity", "[catalog][Standard]") {
  const auto &def = Std();
  const auto &string = S("String");
  CHECK(def.FindMethod(string, MethodKey{"indexOf", 1}, false) != nullptr);
  CHECK(def.FindMethod(string, MethodKey{"indexOf", 2}, false) != nullptr);
  CHECK(def.FindMethod(string, MethodKey{"indexOf", 3}, false) == nullptr);

  auto member = def.ResolveMember(S("Integer"), MethodKey{"new", 1});
  REQUIRE(member.has_value());
  CHECK(std::holds_alternative<const Constructor *>(*member));

  CHECK(def.FindMethod(S("Integer"), MethodKey{"parseInt", 1}, true) != nullptr);
  CHECK(def.FindMethod(S("Integer"), MethodKey{"parseInt", 1}, false) == nullptr);
  CHECK(def.ResolveField(S("Integer"), "MAX_VALUE", true) != nullptr);
  CHECK(def.ResolveField(S("Math"), "PI", true) != nullptr);
}

TEST_CASE("StaticsAreNotInheritedByBoxes", "[catalog][Standard]") {
  const auto &def = Std();
  // Integer gets Number's instance methods but none of Object's or Number's statics.
  CHECK(def.FindMethod(S("Integer"), MethodKey{"doubleValue", 0}, false) != nullptr);
  CHECK(S("Number").staticMethods.Size() == 0);
  CHECK(def.FindMethod(S("Integer"), MethodKey{"valueOf", 1}, true)->owner == S("Integer").index);
}
