// Conversions.hpp
// Static-only host classes: math functions and the conversion helpers behind the cast matrix.
#pragma once

#include <Tessera/Catalog/Standard/Lang.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <numbers>

namespace Tessera::Catalog::Standard
{

  class TESSERA_CATALOG_STANDARD_API Math final
  {
  public:
    static constexpr double E = std::numbers::e;
    static constexpr double PI = std::numbers::pi;

    static double Abs(double x);
    static double Acos(double x);
    static double Asin(double x);
    static double Atan(double x);
    static double Atan2(double y, double x);
    static double Cbrt(double x);
    static double Ceil(double x);
    static double Cos(double x);
    static double Cosh(double x);
    static double Exp(double x);
    static double Expm1(double x);
    static double Floor(double x);
    static double Hypot(double x, double y);
    static double Log(double x);
    static double Log10(double x);
    static double Log1p(double x);
    static double Max(double a, double b);
    static double Min(double a, double b);
    static double Pow(double a, double b);
    static double Random();
    static double Rint(double x);
    static std::int64_t Round(double x);
    static double Sin(double x);
    static double Sinh(double x);
    static double Sqrt(double x);
    static double Tan(double x);
    static double Tanh(double x);
    static double ToDegrees(double radians);
    static double ToRadians(double degrees);

    friend void TesseraDescribe(Tag<Math>, ClassBuilder<Math> &);
  };

  // Conversions between primitives, boxes and strings that have no single host method.
  // Narrowing into char from a string requires exactly one character.
  class TESSERA_CATALOG_STANDARD_API Utility final
  {
  public:
    using NumberRef = std::shared_ptr<Number>;
    using BooleanRef = std::shared_ptr<Boolean>;
    using ByteRef = std::shared_ptr<Byte>;
    using ShortRef = std::shared_ptr<Short>;
    using CharacterRef = std::shared_ptr<Character>;
    using IntegerRef = std::shared_ptr<Integer>;
    using LongRef = std::shared_ptr<Long>;
    using FloatRef = std::shared_ptr<Float>;
    using DoubleRef = std::shared_ptr<Double>;
    using StringRef = std::shared_ptr<String>;

    static std::expected<bool, Error> NumberToboolean(const NumberRef &value);
    static std::expected<char16_t, Error> NumberTochar(const NumberRef &value);
    static BooleanRef NumberToBoolean(const NumberRef &value);
    static ByteRef NumberToByte(const NumberRef &value);
    static ShortRef NumberToShort(const NumberRef &value);
    static CharacterRef NumberToCharacter(const NumberRef &value);
    static IntegerRef NumberToInteger(const NumberRef &value);
    static LongRef NumberToLong(const NumberRef &value);
    static FloatRef NumberToFloat(const NumberRef &value);
    static DoubleRef NumberToDouble(const NumberRef &value);

    static std::int8_t booleanTobyte(bool value);
    static std::int16_t booleanToshort(bool value);
    static char16_t booleanTochar(bool value);
    static std::int32_t booleanToint(bool value);
    static std::int64_t booleanTolong(bool value);
    static float booleanTofloat(bool value);
    static double booleanTodouble(bool value);
    static IntegerRef booleanToInteger(bool value);

    static std::expected<std::int8_t, Error> BooleanTobyte(const BooleanRef &value);
    static std::expected<std::int16_t, Error> BooleanToshort(const BooleanRef &value);
    static std::expected<char16_t, Error> BooleanTochar(const BooleanRef &value);
    static std::expected<std::int32_t, Error> BooleanToint(const BooleanRef &value);
    static std::expected<std::int64_t, Error> BooleanTolong(const BooleanRef &value);
    static std::expected<float, Error> BooleanTofloat(const BooleanRef &value);
    static std::expected<double, Error> BooleanTodouble(const BooleanRef &value);
    static ByteRef BooleanToByte(const BooleanRef &value);
    static ShortRef BooleanToShort(const BooleanRef &value);
    static CharacterRef BooleanToCharacter(const BooleanRef &value);
    static IntegerRef BooleanToInteger(const BooleanRef &value);
    static LongRef BooleanToLong(const BooleanRef &value);
    static FloatRef BooleanToFloat(const BooleanRef &value);
    static DoubleRef BooleanToDouble(const BooleanRef &value);

    static bool byteToboolean(std::int8_t value);
    static ShortRef byteToShort(std::int8_t value);
    static CharacterRef byteToCharacter(std::int8_t value);
    static IntegerRef byteToInteger(std::int8_t value);
    static LongRef byteToLong(std::int8_t value);
    static FloatRef byteToFloat(std::int8_t value);
    static DoubleRef byteToDouble(std::int8_t value);
    static std::expected<bool, Error> ByteToboolean(const ByteRef &value);
    static std::expected<char16_t, Error> ByteTochar(const ByteRef &value);

    static bool shortToboolean(std::int16_t value);
    static ByteRef shortToByte(std::int16_t value);
    static CharacterRef shortToCharacter(std::int16_t value);
    static IntegerRef shortToInteger(std::int16_t value);
    static LongRef shortToLong(std::int16_t value);
    static FloatRef shortToFloat(std::int16_t value);
    static DoubleRef shortToDouble(std::int16_t value);
    static std::expected<bool, Error> ShortToboolean(const ShortRef &value);
    static std::expected<char16_t, Error> ShortTochar(const ShortRef &value);

    static bool charToboolean(char16_t value);
    static ByteRef charToByte(char16_t value);
    static ShortRef charToShort(char16_t value);
    static IntegerRef charToInteger(char16_t value);
    static LongRef charToLong(char16_t value);
    static FloatRef charToFloat(char16_t value);
    static DoubleRef charToDouble(char16_t value);
    static StringRef charToString(char16_t value);

    static std::expected<bool, Error> CharacterToboolean(const CharacterRef &value);
    static std::expected<std::int8_t, Error> CharacterTobyte(const CharacterRef &value);
    static std::expected<std::int16_t, Error> CharacterToshort(const CharacterRef &value);
    static std::expected<std::int32_t, Error> CharacterToint(const CharacterRef &value);
    static std::expected<std::int64_t, Error> CharacterTolong(const CharacterRef &value);
    static std::expected<float, Error> CharacterTofloat(const CharacterRef &value);
    static std::expected<double, Error> CharacterTodouble(const CharacterRef &value);
    static BooleanRef CharacterToBoolean(const CharacterRef &value);
    static ByteRef CharacterToByte(const CharacterRef &value);
    static ShortRef CharacterToShort(const CharacterRef &value);
    static IntegerRef CharacterToInteger(const CharacterRef &value);
    static LongRef CharacterToLong(const CharacterRef &value);
    static FloatRef CharacterToFloat(const CharacterRef &value);
    static DoubleRef CharacterToDouble(const CharacterRef &value);
    static StringRef CharacterToString(const CharacterRef &value);

    static bool intToboolean(std::int32_t value);
    static ByteRef intToByte(std::int32_t value);
    static ShortRef intToShort(std::int32_t value);
    static CharacterRef intToCharacter(std::int32_t value);
    static LongRef intToLong(std::int32_t value);
    static FloatRef intToFloat(std::int32_t value);
    static DoubleRef intToDouble(std::int32_t value);
    static std::expected<bool, Error> IntegerToboolean(const IntegerRef &value);
    static std::expected<char16_t, Error> IntegerTochar(const IntegerRef &value);

    static bool longToboolean(std::int64_t value);
    static ByteRef longToByte(std::int64_t value);
    static ShortRef longToShort(std::int64_t value);
    static CharacterRef longToCharacter(std::int64_t value);
    static IntegerRef longToInteger(std::int64_t value);
    static FloatRef longToFloat(std::int64_t value);
    static DoubleRef longToDouble(std::int64_t value);
    static std::expected<bool, Error> LongToboolean(const LongRef &value);
    static std::expected<char16_t, Error> LongTochar(const LongRef &value);

    static bool floatToboolean(float value);
    static ByteRef floatToByte(float value);
    static ShortRef floatToShort(float value);
    static CharacterRef floatToCharacter(float value);
    static IntegerRef floatToInteger(float value);
    static LongRef floatToLong(float value);
    static DoubleRef floatToDouble(float value);
    static std::expected<bool, Error> FloatToboolean(const FloatRef &value);
    static std::expected<char16_t, Error> FloatTochar(const FloatRef &value);

    static bool doubleToboolean(double value);
    static ByteRef doubleToByte(double value);
    static ShortRef doubleToShort(double value);
    static CharacterRef doubleToCharacter(double value);
    static IntegerRef doubleToInteger(double value);
    static LongRef doubleToLong(double value);
    static FloatRef doubleToFloat(double value);
    static std::expected<bool, Error> DoubleToboolean(const DoubleRef &value);
    static std::expected<char16_t, Error> DoubleTochar(const DoubleRef &value);

    static std::expected<char16_t, Error> StringTochar(const StringRef &value);
    static std::expected<CharacterRef, Error> StringToCharacter(const StringRef &value);

    friend void TesseraDescribe(Tag<Utility>, ClassBuilder<Utility> &);
  };

  // Conversions out of the dynamic type. Implicit variants accept only values whose box
  // widens to the target; explicit variants accept any numeric box or character.
  class TESSERA_CATALOG_STANDARD_API Def final
  {
  public:
    static std::expected<std::int8_t, Error> DefTobyteImplicit(const ObjectRef &value);
    static std::expected<std::int16_t, Error> DefToshortImplicit(const ObjectRef &value);
    static std::expected<char16_t, Error> DefTocharImplicit(const ObjectRef &value);
    static std::expected<std::int32_t, Error> DefTointImplicit(const ObjectRef &value);
    static std::expected<std::int64_t, Error> DefTolongImplicit(const ObjectRef &value);
    static std::expected<float, Error> DefTofloatImplicit(const ObjectRef &value);
    static std::expected<double, Error> DefTodoubleImplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Byte>, Error> DefToByteImplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Short>, Error> DefToShortImplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Character>, Error> DefToCharacterImplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Integer>, Error> DefToIntegerImplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Long>, Error> DefToLongImplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Float>, Error> DefToFloatImplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Double>, Error> DefToDoubleImplicit(const ObjectRef &value);

    static std::expected<std::int8_t, Error> DefTobyteExplicit(const ObjectRef &value);
    static std::expected<std::int16_t, Error> DefToshortExplicit(const ObjectRef &value);
    static std::expected<char16_t, Error> DefTocharExplicit(const ObjectRef &value);
    static std::expected<std::int32_t, Error> DefTointExplicit(const ObjectRef &value);
    static std::expected<std::int64_t, Error> DefTolongExplicit(const ObjectRef &value);
    static std::expected<float, Error> DefTofloatExplicit(const ObjectRef &value);
    static std::expected<double, Error> DefTodoubleExplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Byte>, Error> DefToByteExplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Short>, Error> DefToShortExplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Character>, Error> DefToCharacterExplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Integer>, Error> DefToIntegerExplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Long>, Error> DefToLongExplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Float>, Error> DefToFloatExplicit(const ObjectRef &value);
    static std::expected<std::shared_ptr<Double>, Error> DefToDoubleExplicit(const ObjectRef &value);

    friend void TesseraDescribe(Tag<Def>, ClassBuilder<Def> &);
  };

} // namespace Tessera::Catalog::Standard
