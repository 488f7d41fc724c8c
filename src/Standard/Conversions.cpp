#include <Tessera/Catalog/ClassBuilder.hpp>
#include <Tessera/Catalog/Standard/Conversions.hpp>

#include <fmt/format.h>

#include <cmath>
#include <optional>
#include <random>

namespace Tessera::Catalog::Standard
{

  namespace
  {
    Error NullValue(std::string_view target)
    {
      return HostError("NullPointerException", fmt::format("cannot convert null to [{}]", target));
    }

    std::optional<Sort> BoxedSort(const Object &value)
    {
      if (dynamic_cast<const Byte *>(&value))
        return Sort::Byte;
      if (dynamic_cast<const Short *>(&value))
        return Sort::Short;
      if (dynamic_cast<const Character *>(&value))
        return Sort::Char;
      if (dynamic_cast<const Integer *>(&value))
        return Sort::Int;
      if (dynamic_cast<const Long *>(&value))
        return Sort::Long;
      if (dynamic_cast<const Float *>(&value))
        return Sort::Float;
      if (dynamic_cast<const Double *>(&value))
        return Sort::Double;
      if (dynamic_cast<const Boolean *>(&value))
        return Sort::Bool;
      return std::nullopt;
    }

    template <class P>
    P NumberAs(const Number &n)
    {
      if constexpr (std::is_same_v<P, std::int8_t>)
        return n.ByteValue();
      else if constexpr (std::is_same_v<P, std::int16_t>)
        return n.ShortValue();
      else if constexpr (std::is_same_v<P, char16_t>)
        return static_cast<char16_t>(n.IntValue());
      else if constexpr (std::is_same_v<P, std::int32_t>)
        return n.IntValue();
      else if constexpr (std::is_same_v<P, std::int64_t>)
        return n.LongValue();
      else if constexpr (std::is_same_v<P, float>)
        return n.FloatValue();
      else
        return n.DoubleValue();
    }

    // Implicit unboxing accepts the target's own box and every box that widens to it;
    // explicit unboxing accepts any numeric box or a character.
    template <class P>
    std::expected<P, Error> Unbox(const ObjectRef &value, Sort target, std::string_view targetName, bool isExplicit)
    {
      if (!value)
        return std::unexpected(NullValue(targetName));
      const auto source = BoxedSort(*value);
      if (source && *source != Sort::Bool && (isExplicit || *source == target || IsWideningConversion(*source, target)))
      {
        if (*source == Sort::Char)
          return NumericCast<P>(static_cast<const Character &>(*value).CharValue());
        return NumberAs<P>(static_cast<const Number &>(*value));
      }
      return std::unexpected(HostError(
          "ClassCastException", fmt::format("cannot {} convert [{}] to [{}]", isExplicit ? "explicitly" : "implicitly",
                                            value->ToString()->Value(), targetName)));
    }

    template <class Box, class P>
    std::expected<std::shared_ptr<Box>, Error> UnboxTo(const ObjectRef &value, Sort target, std::string_view targetName,
                                                      bool isExplicit)
    {
      if (!value)
        return std::shared_ptr<Box>{};
      auto unboxed = Unbox<P>(value, target, targetName, isExplicit);
      if (!unboxed)
        return std::unexpected(std::move(unboxed.error()));
      return Box::ValueOf(*unboxed);
    }

    std::mt19937_64 &RandomEngine()
    {
      thread_local std::mt19937_64 engine{std::random_device{}()};
      return engine;
    }
  } // namespace

  // Math

  double Math::Abs(double x) { return std::fabs(x); }
  double Math::Acos(double x) { return std::acos(x); }
  double Math::Asin(double x) { return std::asin(x); }
  double Math::Atan(double x) { return std::atan(x); }
  double Math::Atan2(double y, double x) { return std::atan2(y, x); }
  double Math::Cbrt(double x) { return std::cbrt(x); }
  double Math::Ceil(double x) { return std::ceil(x); }
  double Math::Cos(double x) { return std::cos(x); }
  double Math::Cosh(double x) { return std::cosh(x); }
  double Math::Exp(double x) { return std::exp(x); }
  double Math::Expm1(double x) { return std::expm1(x); }
  double Math::Floor(double x) { return std::floor(x); }
  double Math::Hypot(double x, double y) { return std::hypot(x, y); }
  double Math::Log(double x) { return std::log(x); }
  double Math::Log10(double x) { return std::log10(x); }
  double Math::Log1p(double x) { return std::log1p(x); }
  double Math::Max(double a, double b) { return Double::Max(a, b); }
  double Math::Min(double a, double b) { return Double::Min(a, b); }
  double Math::Pow(double a, double b) { return std::pow(a, b); }

  double Math::Random()
  {
    return std::uniform_real_distribution<double>{0.0, 1.0}(RandomEngine());
  }

  // Ties round to even.
  double Math::Rint(double x) { return std::nearbyint(x); }

  // Ties round up; NaN is zero and out-of-range values saturate.
  std::int64_t Math::Round(double x) { return NumericCast<std::int64_t>(std::floor(x + 0.5)); }

  double Math::Sin(double x) { return std::sin(x); }
  double Math::Sinh(double x) { return std::sinh(x); }
  double Math::Sqrt(double x) { return std::sqrt(x); }
  double Math::Tan(double x) { return std::tan(x); }
  double Math::Tanh(double x) { return std::tanh(x); }
  double Math::ToDegrees(double radians) { return radians * 180.0 / PI; }
  double Math::ToRadians(double degrees) { return degrees / 180.0 * PI; }

  void TesseraDescribe(Tag<Math>, ClassBuilder<Math> &b)
  {
    b.SetName("Math")
        .StaticMethod<&Math::Abs>("abs")
        .StaticMethod<&Math::Acos>("acos")
        .StaticMethod<&Math::Asin>("asin")
        .StaticMethod<&Math::Atan>("atan")
        .StaticMethod<&Math::Atan2>("atan2")
        .StaticMethod<&Math::Cbrt>("cbrt")
        .StaticMethod<&Math::Ceil>("ceil")
        .StaticMethod<&Math::Cos>("cos")
        .StaticMethod<&Math::Cosh>("cosh")
        .StaticMethod<&Math::Exp>("exp")
        .StaticMethod<&Math::Expm1>("expm1")
        .StaticMethod<&Math::Floor>("floor")
        .StaticMethod<&Math::Hypot>("hypot")
        .StaticMethod<&Math::Log>("log")
        .StaticMethod<&Math::Log10>("log10")
        .StaticMethod<&Math::Log1p>("log1p")
        .StaticMethod<&Math::Max>("max")
        .StaticMethod<&Math::Min>("min")
        .StaticMethod<&Math::Pow>("pow")
        .StaticMethod<&Math::Random>("random")
        .StaticMethod<&Math::Rint>("rint")
        .StaticMethod<&Math::Round>("round")
        .StaticMethod<&Math::Sin>("sin")
        .StaticMethod<&Math::Sinh>("sinh")
        .StaticMethod<&Math::Sqrt>("sqrt")
        .StaticMethod<&Math::Tan>("tan")
        .StaticMethod<&Math::Tanh>("tanh")
        .StaticMethod<&Math::ToDegrees>("toDegrees")
        .StaticMethod<&Math::ToRadians>("toRadians")
        .StaticField<&Math::E>("E")
        .StaticField<&Math::PI>("PI");
  }

  // Utility. Conversions into a primitive fail on null; conversions into a box map null to null.

  std::expected<bool, Error> Utility::NumberToboolean(const NumberRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("boolean"));
    return value->LongValue() != 0;
  }

  std::expected<char16_t, Error> Utility::NumberTochar(const NumberRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("char"));
    return static_cast<char16_t>(value->IntValue());
  }

  Utility::BooleanRef Utility::NumberToBoolean(const NumberRef &value)
  {
    return value ? Boolean::ValueOf(value->LongValue() != 0) : nullptr;
  }

  Utility::ByteRef Utility::NumberToByte(const NumberRef &value)
  {
    return value ? Byte::ValueOf(value->ByteValue()) : nullptr;
  }

  Utility::ShortRef Utility::NumberToShort(const NumberRef &value)
  {
    return value ? Short::ValueOf(value->ShortValue()) : nullptr;
  }

  Utility::CharacterRef Utility::NumberToCharacter(const NumberRef &value)
  {
    return value ? Character::ValueOf(static_cast<char16_t>(value->IntValue())) : nullptr;
  }

  Utility::IntegerRef Utility::NumberToInteger(const NumberRef &value)
  {
    return value ? Integer::ValueOf(value->IntValue()) : nullptr;
  }

  Utility::LongRef Utility::NumberToLong(const NumberRef &value)
  {
    return value ? Long::ValueOf(value->LongValue()) : nullptr;
  }

  Utility::FloatRef Utility::NumberToFloat(const NumberRef &value)
  {
    return value ? Float::ValueOf(value->FloatValue()) : nullptr;
  }

  Utility::DoubleRef Utility::NumberToDouble(const NumberRef &value)
  {
    return value ? Double::ValueOf(value->DoubleValue()) : nullptr;
  }

  std::int8_t Utility::booleanTobyte(bool value) { return value ? 1 : 0; }
  std::int16_t Utility::booleanToshort(bool value) { return value ? 1 : 0; }
  char16_t Utility::booleanTochar(bool value) { return value ? 1 : 0; }
  std::int32_t Utility::booleanToint(bool value) { return value ? 1 : 0; }
  std::int64_t Utility::booleanTolong(bool value) { return value ? 1 : 0; }
  float Utility::booleanTofloat(bool value) { return value ? 1.0f : 0.0f; }
  double Utility::booleanTodouble(bool value) { return value ? 1.0 : 0.0; }
  Utility::IntegerRef Utility::booleanToInteger(bool value) { return Integer::ValueOf(value ? 1 : 0); }

  std::expected<std::int8_t, Error> Utility::BooleanTobyte(const BooleanRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("byte"));
    return booleanTobyte(value->BooleanValue());
  }

  std::expected<std::int16_t, Error> Utility::BooleanToshort(const BooleanRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("short"));
    return booleanToshort(value->BooleanValue());
  }

  std::expected<char16_t, Error> Utility::BooleanTochar(const BooleanRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("char"));
    return booleanTochar(value->BooleanValue());
  }

  std::expected<std::int32_t, Error> Utility::BooleanToint(const BooleanRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("int"));
    return booleanToint(value->BooleanValue());
  }

  std::expected<std::int64_t, Error> Utility::BooleanTolong(const BooleanRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("long"));
    return booleanTolong(value->BooleanValue());
  }

  std::expected<float, Error> Utility::BooleanTofloat(const BooleanRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("float"));
    return booleanTofloat(value->BooleanValue());
  }

  std::expected<double, Error> Utility::BooleanTodouble(const BooleanRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("double"));
    return booleanTodouble(value->BooleanValue());
  }

  Utility::ByteRef Utility::BooleanToByte(const BooleanRef &value)
  {
    return value ? Byte::ValueOf(booleanTobyte(value->BooleanValue())) : nullptr;
  }

  Utility::ShortRef Utility::BooleanToShort(const BooleanRef &value)
  {
    return value ? Short::ValueOf(booleanToshort(value->BooleanValue())) : nullptr;
  }

  Utility::CharacterRef Utility::BooleanToCharacter(const BooleanRef &value)
  {
    return value ? Character::ValueOf(booleanTochar(value->BooleanValue())) : nullptr;
  }

  Utility::IntegerRef Utility::BooleanToInteger(const BooleanRef &value)
  {
    return value ? Integer::ValueOf(booleanToint(value->BooleanValue())) : nullptr;
  }

  Utility::LongRef Utility::BooleanToLong(const BooleanRef &value)
  {
    return value ? Long::ValueOf(booleanTolong(value->BooleanValue())) : nullptr;
  }

  Utility::FloatRef Utility::BooleanToFloat(const BooleanRef &value)
  {
    return value ? Float::ValueOf(booleanTofloat(value->BooleanValue())) : nullptr;
  }

  Utility::DoubleRef Utility::BooleanToDouble(const BooleanRef &value)
  {
    return value ? Double::ValueOf(booleanTodouble(value->BooleanValue())) : nullptr;
  }

  bool Utility::byteToboolean(std::int8_t value) { return value != 0; }
  Utility::ShortRef Utility::byteToShort(std::int8_t value) { return Short::ValueOf(value); }
  Utility::CharacterRef Utility::byteToCharacter(std::int8_t value) { return Character::ValueOf(static_cast<char16_t>(value)); }
  Utility::IntegerRef Utility::byteToInteger(std::int8_t value) { return Integer::ValueOf(value); }
  Utility::LongRef Utility::byteToLong(std::int8_t value) { return Long::ValueOf(value); }
  Utility::FloatRef Utility::byteToFloat(std::int8_t value) { return Float::ValueOf(value); }
  Utility::DoubleRef Utility::byteToDouble(std::int8_t value) { return Double::ValueOf(value); }

  std::expected<bool, Error> Utility::ByteToboolean(const ByteRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("boolean"));
    return value->Value() != 0;
  }

  std::expected<char16_t, Error> Utility::ByteTochar(const ByteRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("char"));
    return static_cast<char16_t>(value->Value());
  }

  bool Utility::shortToboolean(std::int16_t value) { return value != 0; }
  Utility::ByteRef Utility::shortToByte(std::int16_t value) { return Byte::ValueOf(static_cast<std::int8_t>(value)); }
  Utility::CharacterRef Utility::shortToCharacter(std::int16_t value) { return Character::ValueOf(static_cast<char16_t>(value)); }
  Utility::IntegerRef Utility::shortToInteger(std::int16_t value) { return Integer::ValueOf(value); }
  Utility::LongRef Utility::shortToLong(std::int16_t value) { return Long::ValueOf(value); }
  Utility::FloatRef Utility::shortToFloat(std::int16_t value) { return Float::ValueOf(value); }
  Utility::DoubleRef Utility::shortToDouble(std::int16_t value) { return Double::ValueOf(value); }

  std::expected<bool, Error> Utility::ShortToboolean(const ShortRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("boolean"));
    return value->Value() != 0;
  }

  std::expected<char16_t, Error> Utility::ShortTochar(const ShortRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("char"));
    return static_cast<char16_t>(value->Value());
  }

  bool Utility::charToboolean(char16_t value) { return value != 0; }
  Utility::ByteRef Utility::charToByte(char16_t value) { return Byte::ValueOf(static_cast<std::int8_t>(value)); }
  Utility::ShortRef Utility::charToShort(char16_t value) { return Short::ValueOf(static_cast<std::int16_t>(value)); }
  Utility::IntegerRef Utility::charToInteger(char16_t value) { return Integer::ValueOf(value); }
  Utility::LongRef Utility::charToLong(char16_t value) { return Long::ValueOf(value); }
  Utility::FloatRef Utility::charToFloat(char16_t value) { return Float::ValueOf(value); }
  Utility::DoubleRef Utility::charToDouble(char16_t value) { return Double::ValueOf(value); }
  Utility::StringRef Utility::charToString(char16_t value) { return Character{value}.ToString(); }

  std::expected<bool, Error> Utility::CharacterToboolean(const CharacterRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("boolean"));
    return value->CharValue() != 0;
  }

  std::expected<std::int8_t, Error> Utility::CharacterTobyte(const CharacterRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("byte"));
    return static_cast<std::int8_t>(value->CharValue());
  }

  std::expected<std::int16_t, Error> Utility::CharacterToshort(const CharacterRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("short"));
    return static_cast<std::int16_t>(value->CharValue());
  }

  std::expected<std::int32_t, Error> Utility::CharacterToint(const CharacterRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("int"));
    return value->CharValue();
  }

  std::expected<std::int64_t, Error> Utility::CharacterTolong(const CharacterRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("long"));
    return value->CharValue();
  }

  std::expected<float, Error> Utility::CharacterTofloat(const CharacterRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("float"));
    return static_cast<float>(value->CharValue());
  }

  std::expected<double, Error> Utility::CharacterTodouble(const CharacterRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("double"));
    return static_cast<double>(value->CharValue());
  }

  Utility::BooleanRef Utility::CharacterToBoolean(const CharacterRef &value)
  {
    return value ? Boolean::ValueOf(value->CharValue() != 0) : nullptr;
  }

  Utility::ByteRef Utility::CharacterToByte(const CharacterRef &value)
  {
    return value ? charToByte(value->CharValue()) : nullptr;
  }

  Utility::ShortRef Utility::CharacterToShort(const CharacterRef &value)
  {
    return value ? charToShort(value->CharValue()) : nullptr;
  }

  Utility::IntegerRef Utility::CharacterToInteger(const CharacterRef &value)
  {
    return value ? charToInteger(value->CharValue()) : nullptr;
  }

  Utility::LongRef Utility::CharacterToLong(const CharacterRef &value)
  {
    return value ? charToLong(value->CharValue()) : nullptr;
  }

  Utility::FloatRef Utility::CharacterToFloat(const CharacterRef &value)
  {
    return value ? charToFloat(value->CharValue()) : nullptr;
  }

  Utility::DoubleRef Utility::CharacterToDouble(const CharacterRef &value)
  {
    return value ? charToDouble(value->CharValue()) : nullptr;
  }

  Utility::StringRef Utility::CharacterToString(const CharacterRef &value)
  {
    return value ? value->ToString() : nullptr;
  }

  bool Utility::intToboolean(std::int32_t value) { return value != 0; }
  Utility::ByteRef Utility::intToByte(std::int32_t value) { return Byte::ValueOf(static_cast<std::int8_t>(value)); }
  Utility::ShortRef Utility::intToShort(std::int32_t value) { return Short::ValueOf(static_cast<std::int16_t>(value)); }
  Utility::CharacterRef Utility::intToCharacter(std::int32_t value) { return Character::ValueOf(static_cast<char16_t>(value)); }
  Utility::LongRef Utility::intToLong(std::int32_t value) { return Long::ValueOf(value); }
  Utility::FloatRef Utility::intToFloat(std::int32_t value) { return Float::ValueOf(static_cast<float>(value)); }
  Utility::DoubleRef Utility::intToDouble(std::int32_t value) { return Double::ValueOf(value); }

  std::expected<bool, Error> Utility::IntegerToboolean(const IntegerRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("boolean"));
    return value->Value() != 0;
  }

  std::expected<char16_t, Error> Utility::IntegerTochar(const IntegerRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("char"));
    return static_cast<char16_t>(value->Value());
  }

  bool Utility::longToboolean(std::int64_t value) { return value != 0; }
  Utility::ByteRef Utility::longToByte(std::int64_t value) { return Byte::ValueOf(static_cast<std::int8_t>(value)); }
  Utility::ShortRef Utility::longToShort(std::int64_t value) { return Short::ValueOf(static_cast<std::int16_t>(value)); }
  Utility::CharacterRef Utility::longToCharacter(std::int64_t value) { return Character::ValueOf(static_cast<char16_t>(value)); }
  Utility::IntegerRef Utility::longToInteger(std::int64_t value) { return Integer::ValueOf(static_cast<std::int32_t>(value)); }
  Utility::FloatRef Utility::longToFloat(std::int64_t value) { return Float::ValueOf(static_cast<float>(value)); }
  Utility::DoubleRef Utility::longToDouble(std::int64_t value) { return Double::ValueOf(static_cast<double>(value)); }

  std::expected<bool, Error> Utility::LongToboolean(const LongRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("boolean"));
    return value->Value() != 0;
  }

  std::expected<char16_t, Error> Utility::LongTochar(const LongRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("char"));
    return static_cast<char16_t>(value->Value());
  }

  bool Utility::floatToboolean(float value) { return value != 0; }
  Utility::ByteRef Utility::floatToByte(float value) { return Byte::ValueOf(NumericCast<std::int8_t>(value)); }
  Utility::ShortRef Utility::floatToShort(float value) { return Short::ValueOf(NumericCast<std::int16_t>(value)); }
  Utility::CharacterRef Utility::floatToCharacter(float value) { return Character::ValueOf(NumericCast<char16_t>(value)); }
  Utility::IntegerRef Utility::floatToInteger(float value) { return Integer::ValueOf(NumericCast<std::int32_t>(value)); }
  Utility::LongRef Utility::floatToLong(float value) { return Long::ValueOf(NumericCast<std::int64_t>(value)); }
  Utility::DoubleRef Utility::floatToDouble(float value) { return Double::ValueOf(value); }

  std::expected<bool, Error> Utility::FloatToboolean(const FloatRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("boolean"));
    return value->Value() != 0;
  }

  std::expected<char16_t, Error> Utility::FloatTochar(const FloatRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("char"));
    return NumericCast<char16_t>(value->Value());
  }

  bool Utility::doubleToboolean(double value) { return value != 0; }
  Utility::ByteRef Utility::doubleToByte(double value) { return Byte::ValueOf(NumericCast<std::int8_t>(value)); }
  Utility::ShortRef Utility::doubleToShort(double value) { return Short::ValueOf(NumericCast<std::int16_t>(value)); }
  Utility::CharacterRef Utility::doubleToCharacter(double value) { return Character::ValueOf(NumericCast<char16_t>(value)); }
  Utility::IntegerRef Utility::doubleToInteger(double value) { return Integer::ValueOf(NumericCast<std::int32_t>(value)); }
  Utility::LongRef Utility::doubleToLong(double value) { return Long::ValueOf(NumericCast<std::int64_t>(value)); }
  Utility::FloatRef Utility::doubleToFloat(double value) { return Float::ValueOf(static_cast<float>(value)); }

  std::expected<bool, Error> Utility::DoubleToboolean(const DoubleRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("boolean"));
    return value->Value() != 0;
  }

  std::expected<char16_t, Error> Utility::DoubleTochar(const DoubleRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("char"));
    return NumericCast<char16_t>(value->Value());
  }

  std::expected<char16_t, Error> Utility::StringTochar(const StringRef &value)
  {
    if (!value)
      return std::unexpected(NullValue("char"));
    if (value->Length() != 1)
      return std::unexpected(HostError(
          "ClassCastException", fmt::format("cannot cast [String] with length [{}] to [char]", value->Length())));
    return value->CharAt(0);
  }

  std::expected<Utility::CharacterRef, Error> Utility::StringToCharacter(const StringRef &value)
  {
    if (!value)
      return CharacterRef{};
    auto c = StringTochar(value);
    if (!c)
      return std::unexpected(std::move(c.error()));
    return Character::ValueOf(*c);
  }

  void TesseraDescribe(Tag<Utility>, ClassBuilder<Utility> &b)
  {
    b.SetName("Utility")
        .StaticMethod<&Utility::NumberToboolean>("NumberToboolean")
        .StaticMethod<&Utility::NumberTochar>("NumberTochar")
        .StaticMethod<&Utility::NumberToBoolean>("NumberToBoolean")
        .StaticMethod<&Utility::NumberToByte>("NumberToByte")
        .StaticMethod<&Utility::NumberToShort>("NumberToShort")
        .StaticMethod<&Utility::NumberToCharacter>("NumberToCharacter")
        .StaticMethod<&Utility::NumberToInteger>("NumberToInteger")
        .StaticMethod<&Utility::NumberToLong>("NumberToLong")
        .StaticMethod<&Utility::NumberToFloat>("NumberToFloat")
        .StaticMethod<&Utility::NumberToDouble>("NumberToDouble")
        .StaticMethod<&Utility::booleanTobyte>("booleanTobyte")
        .StaticMethod<&Utility::booleanToshort>("booleanToshort")
        .StaticMethod<&Utility::booleanTochar>("booleanTochar")
        .StaticMethod<&Utility::booleanToint>("booleanToint")
        .StaticMethod<&Utility::booleanTolong>("booleanTolong")
        .StaticMethod<&Utility::booleanTofloat>("booleanTofloat")
        .StaticMethod<&Utility::booleanTodouble>("booleanTodouble")
        .StaticMethod<&Utility::booleanToInteger>("booleanToInteger")
        .StaticMethod<&Utility::BooleanTobyte>("BooleanTobyte")
        .StaticMethod<&Utility::BooleanToshort>("BooleanToshort")
        .StaticMethod<&Utility::BooleanTochar>("BooleanTochar")
        .StaticMethod<&Utility::BooleanToint>("BooleanToint")
        .StaticMethod<&Utility::BooleanTolong>("BooleanTolong")
        .StaticMethod<&Utility::BooleanTofloat>("BooleanTofloat")
        .StaticMethod<&Utility::BooleanTodouble>("BooleanTodouble")
        .StaticMethod<&Utility::BooleanToByte>("BooleanToByte")
        .StaticMethod<&Utility::BooleanToShort>("BooleanToShort")
        .StaticMethod<&Utility::BooleanToCharacter>("BooleanToCharacter")
        .StaticMethod<&Utility::BooleanToInteger>("BooleanToInteger")
        .StaticMethod<&Utility::BooleanToLong>("BooleanToLong")
        .StaticMethod<&Utility::BooleanToFloat>("BooleanToFloat")
        .StaticMethod<&Utility::BooleanToDouble>("BooleanToDouble")
        .StaticMethod<&Utility::byteToboolean>("byteToboolean")
        .StaticMethod<&Utility::byteToShort>("byteToShort")
        .StaticMethod<&Utility::byteToCharacter>("byteToCharacter")
        .StaticMethod<&Utility::byteToInteger>("byteToInteger")
        .StaticMethod<&Utility::byteToLong>("byteToLong")
        .StaticMethod<&Utility::byteToFloat>("byteToFloat")
        .StaticMethod<&Utility::byteToDouble>("byteToDouble")
        .StaticMethod<&Utility::ByteToboolean>("ByteToboolean")
        .StaticMethod<&Utility::ByteTochar>("ByteTochar")
        .StaticMethod<&Utility::shortToboolean>("shortToboolean")
        .StaticMethod<&Utility::shortToByte>("shortToByte")
        .StaticMethod<&Utility::shortToCharacter>("shortToCharacter")
        .StaticMethod<&Utility::shortToInteger>("shortToInteger")
        .StaticMethod<&Utility::shortToLong>("shortToLong")
        .StaticMethod<&Utility::shortToFloat>("shortToFloat")
        .StaticMethod<&Utility::shortToDouble>("shortToDouble")
        .StaticMethod<&Utility::ShortToboolean>("ShortToboolean")
        .StaticMethod<&Utility::ShortTochar>("ShortTochar")
        .StaticMethod<&Utility::charToboolean>("charToboolean")
        .StaticMethod<&Utility::charToByte>("charToByte")
        .StaticMethod<&Utility::charToShort>("charToShort")
        .StaticMethod<&Utility::charToInteger>("charToInteger")
        .StaticMethod<&Utility::charToLong>("charToLong")
        .StaticMethod<&Utility::charToFloat>("charToFloat")
        .StaticMethod<&Utility::charToDouble>("charToDouble")
        .StaticMethod<&Utility::charToString>("charToString")
        .StaticMethod<&Utility::CharacterToboolean>("CharacterToboolean")
        .StaticMethod<&Utility::CharacterTobyte>("CharacterTobyte")
        .StaticMethod<&Utility::CharacterToshort>("CharacterToshort")
        .StaticMethod<&Utility::CharacterToint>("CharacterToint")
        .StaticMethod<&Utility::CharacterTolong>("CharacterTolong")
        .StaticMethod<&Utility::CharacterTofloat>("CharacterTofloat")
        .StaticMethod<&Utility::CharacterTodouble>("CharacterTodouble")
        .StaticMethod<&Utility::CharacterToBoolean>("CharacterToBoolean")
        .StaticMethod<&Utility::CharacterToByte>("CharacterToByte")
        .StaticMethod<&Utility::CharacterToShort>("CharacterToShort")
        .StaticMethod<&Utility::CharacterToInteger>("CharacterToInteger")
        .StaticMethod<&Utility::CharacterToLong>("CharacterToLong")
        .StaticMethod<&Utility::CharacterToFloat>("CharacterToFloat")
        .StaticMethod<&Utility::CharacterToDouble>("CharacterToDouble")
        .StaticMethod<&Utility::CharacterToString>("CharacterToString")
        .StaticMethod<&Utility::intToboolean>("intToboolean")
        .StaticMethod<&Utility::intToByte>("intToByte")
        .StaticMethod<&Utility::intToShort>("intToShort")
        .StaticMethod<&Utility::intToCharacter>("intToCharacter")
        .StaticMethod<&Utility::intToLong>("intToLong")
        .StaticMethod<&Utility::intToFloat>("intToFloat")
        .StaticMethod<&Utility::intToDouble>("intToDouble")
        .StaticMethod<&Utility::IntegerToboolean>("IntegerToboolean")
        .StaticMethod<&Utility::IntegerTochar>("IntegerTochar")
        .StaticMethod<&Utility::longToboolean>("longToboolean")
        .StaticMethod<&Utility::longToByte>("longToByte")
        .StaticMethod<&Utility::longToShort>("longToShort")
        .StaticMethod<&Utility::longToCharacter>("longToCharacter")
        .StaticMethod<&Utility::longToInteger>("longToInteger")
        .StaticMethod<&Utility::longToFloat>("longToFloat")
        .StaticMethod<&Utility::longToDouble>("longToDouble")
        .StaticMethod<&Utility::LongToboolean>("LongToboolean")
        .StaticMethod<&Utility::LongTochar>("LongTochar")
        .StaticMethod<&Utility::floatToboolean>("floatToboolean")
        .StaticMethod<&Utility::floatToByte>("floatToByte")
        .StaticMethod<&Utility::floatToShort>("floatToShort")
        .StaticMethod<&Utility::floatToCharacter>("floatToCharacter")
        .StaticMethod<&Utility::floatToInteger>("floatToInteger")
        .StaticMethod<&Utility::floatToLong>("floatToLong")
        .StaticMethod<&Utility::floatToDouble>("floatToDouble")
        .StaticMethod<&Utility::FloatToboolean>("FloatToboolean")
        .StaticMethod<&Utility::FloatTochar>("FloatTochar")
        .StaticMethod<&Utility::doubleToboolean>("doubleToboolean")
        .StaticMethod<&Utility::doubleToByte>("doubleToByte")
        .StaticMethod<&Utility::doubleToShort>("doubleToShort")
        .StaticMethod<&Utility::doubleToCharacter>("doubleToCharacter")
        .StaticMethod<&Utility::doubleToInteger>("doubleToInteger")
        .StaticMethod<&Utility::doubleToLong>("doubleToLong")
        .StaticMethod<&Utility::doubleToFloat>("doubleToFloat")
        .StaticMethod<&Utility::DoubleToboolean>("DoubleToboolean")
        .StaticMethod<&Utility::DoubleTochar>("DoubleTochar")
        .StaticMethod<&Utility::StringTochar>("StringTochar")
        .StaticMethod<&Utility::StringToCharacter>("StringToCharacter");
  }

  // Def

  std::expected<std::int8_t, Error> Def::DefTobyteImplicit(const ObjectRef &value)
  {
    return Unbox<std::int8_t>(value, Sort::Byte, "byte", false);
  }

  std::expected<std::int16_t, Error> Def::DefToshortImplicit(const ObjectRef &value)
  {
    return Unbox<std::int16_t>(value, Sort::Short, "short", false);
  }

  std::expected<char16_t, Error> Def::DefTocharImplicit(const ObjectRef &value)
  {
    return Unbox<char16_t>(value, Sort::Char, "char", false);
  }

  std::expected<std::int32_t, Error> Def::DefTointImplicit(const ObjectRef &value)
  {
    return Unbox<std::int32_t>(value, Sort::Int, "int", false);
  }

  std::expected<std::int64_t, Error> Def::DefTolongImplicit(const ObjectRef &value)
  {
    return Unbox<std::int64_t>(value, Sort::Long, "long", false);
  }

  std::expected<float, Error> Def::DefTofloatImplicit(const ObjectRef &value)
  {
    return Unbox<float>(value, Sort::Float, "float", false);
  }

  std::expected<double, Error> Def::DefTodoubleImplicit(const ObjectRef &value)
  {
    return Unbox<double>(value, Sort::Double, "double", false);
  }

  std::expected<std::shared_ptr<Byte>, Error> Def::DefToByteImplicit(const ObjectRef &value)
  {
    return UnboxTo<Byte, std::int8_t>(value, Sort::Byte, "Byte", false);
  }

  std::expected<std::shared_ptr<Short>, Error> Def::DefToShortImplicit(const ObjectRef &value)
  {
    return UnboxTo<Short, std::int16_t>(value, Sort::Short, "Short", false);
  }

  std::expected<std::shared_ptr<Character>, Error> Def::DefToCharacterImplicit(const ObjectRef &value)
  {
    return UnboxTo<Character, char16_t>(value, Sort::Char, "Character", false);
  }

  std::expected<std::shared_ptr<Integer>, Error> Def::DefToIntegerImplicit(const ObjectRef &value)
  {
    return UnboxTo<Integer, std::int32_t>(value, Sort::Int, "Integer", false);
  }

  std::expected<std::shared_ptr<Long>, Error> Def::DefToLongImplicit(const ObjectRef &value)
  {
    return UnboxTo<Long, std::int64_t>(value, Sort::Long, "Long", false);
  }

  std::expected<std::shared_ptr<Float>, Error> Def::DefToFloatImplicit(const ObjectRef &value)
  {
    return UnboxTo<Float, float>(value, Sort::Float, "Float", false);
  }

  std::expected<std::shared_ptr<Double>, Error> Def::DefToDoubleImplicit(const ObjectRef &value)
  {
    return UnboxTo<Double, double>(value, Sort::Double, "Double", false);
  }

  std::expected<std::int8_t, Error> Def::DefTobyteExplicit(const ObjectRef &value)
  {
    return Unbox<std::int8_t>(value, Sort::Byte, "byte", true);
  }

  std::expected<std::int16_t, Error> Def::DefToshortExplicit(const ObjectRef &value)
  {
    return Unbox<std::int16_t>(value, Sort::Short, "short", true);
  }

  std::expected<char16_t, Error> Def::DefTocharExplicit(const ObjectRef &value)
  {
    return Unbox<char16_t>(value, Sort::Char, "char", true);
  }

  std::expected<std::int32_t, Error> Def::DefTointExplicit(const ObjectRef &value)
  {
    return Unbox<std::int32_t>(value, Sort::Int, "int", true);
  }

  std::expected<std::int64_t, Error> Def::DefTolongExplicit(const ObjectRef &value)
  {
    return Unbox<std::int64_t>(value, Sort::Long, "long", true);
  }

  std::expected<float, Error> Def::DefTofloatExplicit(const ObjectRef &value)
  {
    return Unbox<float>(value, Sort::Float, "float", true);
  }

  std::expected<double, Error> Def::DefTodoubleExplicit(const ObjectRef &value)
  {
    return Unbox<double>(value, Sort::Double, "double", true);
  }

  std::expected<std::shared_ptr<Byte>, Error> Def::DefToByteExplicit(const ObjectRef &value)
  {
    return UnboxTo<Byte, std::int8_t>(value, Sort::Byte, "Byte", true);
  }

  std::expected<std::shared_ptr<Short>, Error> Def::DefToShortExplicit(const ObjectRef &value)
  {
    return UnboxTo<Short, std::int16_t>(value, Sort::Short, "Short", true);
  }

  std::expected<std::shared_ptr<Character>, Error> Def::DefToCharacterExplicit(const ObjectRef &value)
  {
    return UnboxTo<Character, char16_t>(value, Sort::Char, "Character", true);
  }

  std::expected<std::shared_ptr<Integer>, Error> Def::DefToIntegerExplicit(const ObjectRef &value)
  {
    return UnboxTo<Integer, std::int32_t>(value, Sort::Int, "Integer", true);
  }

  std::expected<std::shared_ptr<Long>, Error> Def::DefToLongExplicit(const ObjectRef &value)
  {
    return UnboxTo<Long, std::int64_t>(value, Sort::Long, "Long", true);
  }

  std::expected<std::shared_ptr<Float>, Error> Def::DefToFloatExplicit(const ObjectRef &value)
  {
    return UnboxTo<Float, float>(value, Sort::Float, "Float", true);
  }

  std::expected<std::shared_ptr<Double>, Error> Def::DefToDoubleExplicit(const ObjectRef &value)
  {
    return UnboxTo<Double, double>(value, Sort::Double, "Double", true);
  }

  void TesseraDescribe(Tag<Def>, ClassBuilder<Def> &b)
  {
    b.SetName("Def")
        .StaticMethod<&Def::DefTobyteImplicit>("DefTobyteImplicit")
        .StaticMethod<&Def::DefToshortImplicit>("DefToshortImplicit")
        .StaticMethod<&Def::DefTocharImplicit>("DefTocharImplicit")
        .StaticMethod<&Def::DefTointImplicit>("DefTointImplicit")
        .StaticMethod<&Def::DefTolongImplicit>("DefTolongImplicit")
        .StaticMethod<&Def::DefTofloatImplicit>("DefTofloatImplicit")
        .StaticMethod<&Def::DefTodoubleImplicit>("DefTodoubleImplicit")
        .StaticMethod<&Def::DefToByteImplicit>("DefToByteImplicit")
        .StaticMethod<&Def::DefToShortImplicit>("DefToShortImplicit")
        .StaticMethod<&Def::DefToCharacterImplicit>("DefToCharacterImplicit")
        .StaticMethod<&Def::DefToIntegerImplicit>("DefToIntegerImplicit")
        .StaticMethod<&Def::DefToLongImplicit>("DefToLongImplicit")
        .StaticMethod<&Def::DefToFloatImplicit>("DefToFloatImplicit")
        .StaticMethod<&Def::DefToDoubleImplicit>("DefToDoubleImplicit")
        .StaticMethod<&Def::DefTobyteExplicit>("DefTobyteExplicit")
        .StaticMethod<&Def::DefToshortExplicit>("DefToshortExplicit")
        .StaticMethod<&Def::DefTocharExplicit>("DefTocharExplicit")
        .StaticMethod<&Def::DefTointExplicit>("DefTointExplicit")
        .StaticMethod<&Def::DefTolongExplicit>("DefTolongExplicit")
        .StaticMethod<&Def::DefTofloatExplicit>("DefTofloatExplicit")
        .StaticMethod<&Def::DefTodoubleExplicit>("DefTodoubleExplicit")
        .StaticMethod<&Def::DefToByteExplicit>("DefToByteExplicit")
        .StaticMethod<&Def::DefToShortExplicit>("DefToShortExplicit")
        .StaticMethod<&Def::DefToCharacterExplicit>("DefToCharacterExplicit")
        .StaticMethod<&Def::DefToIntegerExplicit>("DefToIntegerExplicit")
        .StaticMethod<&Def::DefToLongExplicit>("DefToLongExplicit")
        .StaticMethod<&Def::DefToFloatExplicit>("DefToFloatExplicit")
        .StaticMethod<&Def::DefToDoubleExplicit>("DefToDoubleExplicit");
  }

} // namespace Tessera::Catalog::Standard
