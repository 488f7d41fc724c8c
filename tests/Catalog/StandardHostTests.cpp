// StandardHostTests.cpp - behaviour of the standard host classes

#include <catch2/catch_test_macros.hpp>

#include <Tessera/Catalog/Catalog.hpp>
#include <Tessera/Catalog/Standard/Collections.hpp>
#include <Tessera/Catalog/Standard/Conversions.hpp>
#include <Tessera/Catalog/Standard/Lang.hpp>
#include <Tessera/Catalog/Numeric.hpp>
#include <Tessera/Catalog/Standard/StandardDefinition.hpp>

#include <array>
#include <cmath>
#include <cstdint>
#include <limits>
#include <memory>
#include <string>

using namespace Tessera::Catalog;
using namespace Tessera::Catalog::Standard;

namespace
{
  std::string TextOf(const ObjectRef &value)
  {
    return value ? value->ToString()->Value() : std::string{"null"};
  }
} // namespace

TEST_CASE("ArrayListIndexesAndIterates", "[catalog][StandardHost]") {
  auto list = std::make_shared<ArrayList>();
  CHECK(list->IsEmpty());
  list->Add(String::Make("a"));
  list->Add(Integer::ValueOf(2));
  list->Add(nullptr);
  CHECK(list->Size() == 3);
  CHECK(TextOf(list) == "[a, 2, null]");

  CHECK(TextOf(list->GetAt(1).value()) == "2");
  auto outOfRange = list->GetAt(3);
  REQUIRE_FALSE(outOfRange.has_value());
  CHECK(outOfRange.error().message.starts_with("IndexOutOfBoundsException"));

  auto previous = list->SetAt(0, String::Make("z"));
  REQUIRE(previous.has_value());
  CHECK(TextOf(*previous) == "a");
  CHECK(list->Contains(String::Make("z")));
  CHECK(list->Contains(nullptr));

  auto it = list->MakeIterator();
  std::int32_t seen = 0;
  while (it->HasNext()) {
    REQUIRE(it->Next().has_value());
    ++seen;
  }
  CHECK(seen == 3);
  CHECK(it->Next().error().message.starts_with("NoSuchElementException"));
}

TEST_CASE("IteratorRemoveDropsTheLastElement", "[catalog][StandardHost]") {
  auto list = std::make_shared<ArrayList>();
  for (std::int32_t i = 0; i < 4; ++i)
    list->Add(Integer::ValueOf(i));

  auto it = list->MakeIterator();
  CHECK(it->Remove().error().message.starts_with("IllegalStateException"));
  while (it->HasNext()) {
    auto next = it->Next();
    REQUIRE(next.has_value());
    if (std::dynamic_pointer_cast<Integer>(*next)->IntValue() % 2 == 0)
      REQUIRE(it->Remove().has_value());
  }
  CHECK(TextOf(list) == "[1, 3]");
}

TEST_CASE("ListsCompareByContent", "[catalog][StandardHost]") {
  auto a = std::make_shared<ArrayList>();
  auto b = std::make_shared<ArrayList>();
  a->Add(String::Make("x"));
  b->Add(String::Make("x"));
  CHECK(a->Equals(b));
  CHECK(a->HashCode() == b->HashCode());
  b->Add(String::Make("y"));
  CHECK_FALSE(a->Equals(b));
}

TEST_CASE("HashSetUsesValueEquality", "[catalog][StandardHost]") {
  auto set = std::make_shared<HashSet>();
  CHECK(set->Add(String::Make("k")));
  CHECK_FALSE(set->Add(String::Make("k")));
  CHECK(set->Add(Integer::ValueOf(1)));
  CHECK(set->Size() == 2);
  CHECK(set->Contains(Integer::ValueOf(1)));
  CHECK_FALSE(set->Contains(Long::ValueOf(1)));
  CHECK(set->Remove(String::Make("k")));
  CHECK(set->Size() == 1);
}

TEST_CASE("HashMapStoresByKeyEquality", "[catalog][StandardHost]") {
  auto map = std::make_shared<HashMap>();
  CHECK(map->Put(String::Make("a"), Integer::ValueOf(1)) == nullptr);
  CHECK(TextOf(map->Put(String::Make("a"), Integer::ValueOf(2))) == "1");
  CHECK(TextOf(map->Get(String::Make("a"))) == "2");
  CHECK(map->Get(String::Make("b")) == nullptr);
  CHECK(map->ContainsKey(String::Make("a")));
  CHECK(map->ContainsValue(Integer::ValueOf(2)));

  // Key and value views are snapshots.
  auto keys = map->KeySet();
  auto values = map->Values();
  map->Put(String::Make("c"), Integer::ValueOf(3));
  CHECK(keys->Size() == 1);
  CHECK(values->Size() == 1);
  CHECK(map->Size() == 2);

  CHECK(TextOf(map->Remove(String::Make("a"))) == "2");
  CHECK(map->Remove(String::Make("a")) == nullptr);
}

TEST_CASE("StringOperations", "[catalog][StandardHost]") {
  auto s = String::Make("  hello world ");
  auto trimmed = s->Trim();
  CHECK(trimmed->Value() == "hello world");
  CHECK(trimmed->Length() == 11);
  CHECK(trimmed->IndexOf(String::Make("o")) == 4);
  CHECK(trimmed->IndexOfFrom(String::Make("o"), 5) == 7);
  CHECK(trimmed->IndexOf(String::Make("z")) == -1);
  CHECK(trimmed->StartsWith(String::Make("hell")));
  CHECK(trimmed->EndsWith(String::Make("world")));
  CHECK(trimmed->Concat(String::Make("!"))->Value() == "hello world!");
  CHECK(trimmed->Replace(String::Make("o"), String::Make("0"))->Value() == "hell0 w0rld");
  CHECK(trimmed->Substring(0, 5).value()->Value() == "hello");
  CHECK(trimmed->Substring(6, 3).error().message.starts_with("IndexOutOfBoundsException"));
  CHECK(trimmed->CharAt(1).value() == u'e');
  CHECK_FALSE(trimmed->CharAt(20).has_value());
  CHECK(trimmed->ToCharArray().size() == 11);

  CHECK(String::Make("abc")->Equals(String::Make("abc")));
  CHECK(String::Make("abc")->HashCode() == String::Make("abc")->HashCode());
  CHECK(String::Make("abc")->CompareTo(String::Make("abd")) < 0);
}

TEST_CASE("NumberParsingReportsFormatErrors", "[catalog][StandardHost]") {
  CHECK(Integer::ParseInt(String::Make("42")).value() == 42);
  CHECK(Integer::ParseInt(String::Make("+7")).value() == 7);
  CHECK(Integer::ParseInt(String::Make("-12")).value() == -12);
  CHECK(Long::ParseLong(String::Make("9000000000")).value() == 9000000000LL);
  CHECK(Double::ParseDouble(String::Make("2.5")).value() == 2.5);
  CHECK(Float::ParseFloat(String::Make("1.5f")).value() == 1.5f);

  for (const auto *bad : {"", "abc", "1.5", "99999999999", "+-1"}) {
    INFO(bad);
    auto parsed = Integer::ParseInt(String::Make(bad));
    REQUIRE_FALSE(parsed.has_value());
    CHECK(parsed.error().code == ErrorCode::HostFailure);
    CHECK(parsed.error().message.starts_with("NumberFormatException"));
  }
  CHECK_FALSE(Byte::ParseByte(String::Make("200")).has_value());
  CHECK_FALSE(Integer::ParseInt(nullptr).has_value());
}

TEST_CASE("BoxesFormatAndCompare", "[catalog][StandardHost]") {
  CHECK(Integer::ValueOf(5)->Equals(Integer::ValueOf(5)));
  CHECK_FALSE(Integer::ValueOf(5)->Equals(Long::ValueOf(5)));
  CHECK(Integer::ValueOf(5)->HashCode() == 5);
  CHECK(Integer::ValueOf(3)->CompareTo(Integer::ValueOf(5)) < 0);
  CHECK(Integer::ToHexString(255)->Value() == "ff");
  CHECK(Integer::ToHexString(-1)->Value() == "ffffffff");

  CHECK(TextOf(Double::ValueOf(1.0)) == "1.0");
  CHECK(TextOf(Double::ValueOf(2.5)) == "2.5");
  CHECK(FormatFloating(std::numeric_limits<double>::quiet_NaN()) == "NaN");
  CHECK(FormatFloating(-std::numeric_limits<float>::infinity()) == "-Infinity");
  CHECK(TextOf(Boolean::ValueOf(true)) == "true");
  CHECK(TextOf(Character::ValueOf(u'q')) == "q");

  CHECK(Double::Compare(std::nan(""), 1.0) > 0);
  CHECK(Double::Max(-0.0, 0.0) == 0.0);
  CHECK(std::isnan(Double::Min(std::nan(""), 1.0)));
}

TEST_CASE("CharacterPredicatesCoverLatinOne", "[catalog][StandardHost]") {
  CHECK(Character::IsDigit('7'));
  CHECK_FALSE(Character::IsDigit('x'));
  CHECK(Character::IsLetter('q'));
  CHECK(Character::IsUpperCase('Q'));
  CHECK(Character::IsWhitespace('\t'));
  CHECK(Character::Digit('f', 16) == 15);
  CHECK(Character::Digit('g', 16) == -1);
  CHECK(Character::ForDigit(11, 16) == u'b');
}

TEST_CASE("NumericCastFollowsScriptSemantics", "[catalog][StandardHost]") {
  CHECK(NumericCast<std::int8_t>(std::int32_t{300}) == 44);
  CHECK(NumericCast<std::int32_t>(3.9) == 3);
  CHECK(NumericCast<std::int32_t>(-3.9) == -3);
  CHECK(NumericCast<std::int32_t>(1e20) == std::numeric_limits<std::int32_t>::max());
  CHECK(NumericCast<std::int32_t>(std::nan("")) == 0);
  // Narrow integral targets saturate through int first, then keep the low bits.
  CHECK(NumericCast<std::int8_t>(1e20) == -1);
  CHECK(NumericCast<std::int64_t>(1e20) == std::numeric_limits<std::int64_t>::max());

  CHECK(IsWideningConversion(Sort::Byte, Sort::Double));
  CHECK(IsWideningConversion(Sort::Char, Sort::Int));
  CHECK_FALSE(IsWideningConversion(Sort::Char, Sort::Short));
  CHECK_FALSE(IsWideningConversion(Sort::Byte, Sort::Char));
  CHECK_FALSE(IsWideningConversion(Sort::Int, Sort::Int));
}

TEST_CASE("UtilityConversionsRejectNull", "[catalog][StandardHost]") {
  CHECK(Utility::NumberTochar(Integer::ValueOf(65)).value() == u'A');
  CHECK(Utility::NumberToboolean(Integer::ValueOf(0)).value() == false);
  CHECK(Utility::NumberToLong(Integer::ValueOf(7))->LongValue() == 7);
  CHECK(Utility::NumberToLong(nullptr) == nullptr);

  auto fromNull = Utility::NumberTochar(nullptr);
  REQUIRE_FALSE(fromNull.has_value());
  CHECK(fromNull.error().message.starts_with("NullPointerException"));

  CHECK(Utility::StringTochar(String::Make("x")).value() == u'x');
  CHECK_FALSE(Utility::StringTochar(String::Make("xy")).has_value());
}

TEST_CASE("MathIsReachableThroughTheDefinition", "[catalog][StandardHost]") {
  const auto &def = *StandardDefinition().value();
  const auto &math = *def.FindStruct("Math");

  const std::array<Any, 2> args{Any{2.0}, Any{10.0}};
  auto pow = def.FindMethod(math, MethodKey{"pow", 2}, true)->Invoke(nullptr, args);
  REQUIRE(pow.has_value());
  CHECK(pow->Cast<double>() == 1024.0);

  const std::array<Any, 1> half{Any{2.5}};
  auto round = def.FindMethod(math, MethodKey{"round", 1}, true)->Invoke(nullptr, half);
  REQUIRE(round.has_value());
  CHECK(round->Cast<std::int64_t>() == 3);

  const auto *pi = def.ResolveField(math, "PI", true);
  REQUIRE(pi != nullptr);
  CHECK(pi->Load(nullptr).value().Cast<double>() == Math::PI);
}

TEST_CASE("HostFailuresSurfaceThroughInvoke", "[catalog][StandardHost]") {
  const auto &def = *StandardDefinition().value();
  const auto *parseInt = def.FindMethod(*def.FindStruct("Integer"), MethodKey{"parseInt", 1}, true);
  REQUIRE(parseInt != nullptr);

  const std::array<Any, 1> bad{Any{Ref{String::Make("twelve")}}};
  auto parsed = parseInt->Invoke(nullptr, bad);
  REQUIRE_FALSE(parsed.has_value());
  CHECK(parsed.error().code == ErrorCode::HostFailure);
  CHECK(parsed.error().message.starts_with("NumberFormatException"));

  const std::array<Any, 1> good{Any{Ref{String::Make("12")}}};
  CHECK(parseInt->Invoke(nullptr, good).value().Cast<std::int32_t>() == 12);
}
