#include <Tessera/Catalog/ClassBuilder.hpp>
#include <Tessera/Catalog/Standard/Lang.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <string>
#include <system_error>

namespace Tessera::Catalog::Standard
{

  namespace
  {
    const std::string &TextOf(const std::shared_ptr<String> &s)
    {
      static const std::string empty;
      return s ? s->Value() : empty;
    }

    std::string TextOf(const std::shared_ptr<CharSequence> &seq)
    {
      if (!seq)
        return {};
      if (const auto *s = dynamic_cast<const String *>(seq.get()))
        return s->Value();
      std::string out;
      const auto length = seq->Length();
      out.reserve(static_cast<std::size_t>(length));
      for (std::int32_t i = 0; i < length; ++i)
      {
        if (auto c = seq->CharAt(i))
          out.push_back(static_cast<char>(*c));
      }
      return out;
    }

    std::string_view TrimWhitespace(std::string_view s)
    {
      while (!s.empty() && static_cast<unsigned char>(s.front()) <= ' ')
        s.remove_prefix(1);
      while (!s.empty() && static_cast<unsigned char>(s.back()) <= ' ')
        s.remove_suffix(1);
      return s;
    }

    Error NumberFormat(const std::shared_ptr<String> &text)
    {
      if (!text)
        return HostError("NumberFormatException", "null");
      return HostError("NumberFormatException", fmt::format("For input string: \"{}\"", text->Value()));
    }

    // A single leading '+' is accepted; from_chars only understands '-'.
    std::string_view StripPlus(std::string_view s)
    {
      if (s.size() > 1 && s.front() == '+' && s[1] != '-' && s[1] != '+')
        s.remove_prefix(1);
      return s;
    }

    template <class I>
    std::expected<I, Error> ParseIntegral(const std::shared_ptr<String> &text)
    {
      if (!text)
        return std::unexpected(NumberFormat(text));
      const auto digits = StripPlus(text->Value());
      I value{};
      const auto *end = digits.data() + digits.size();
      const auto [ptr, ec] = std::from_chars(digits.data(), end, value);
      if (digits.empty() || ec != std::errc{} || ptr != end)
        return std::unexpected(NumberFormat(text));
      return value;
    }

    template <class F>
    std::expected<F, Error> ParseFloating(const std::shared_ptr<String> &text)
    {
      if (!text)
        return std::unexpected(NumberFormat(text));
      auto digits = StripPlus(TrimWhitespace(text->Value()));
      // Type suffixes are part of the accepted literal syntax.
      if (!digits.empty() && (digits.back() == 'f' || digits.back() == 'F' || digits.back() == 'd' || digits.back() == 'D'))
        digits.remove_suffix(1);
      F value{};
      const auto *end = digits.data() + digits.size();
      const auto [ptr, ec] = std::from_chars(digits.data(), end, value);
      if (digits.empty() || ec != std::errc{} || ptr != end)
        return std::unexpected(NumberFormat(text));
      return value;
    }

    template <class F>
    std::int32_t CompareFloating(F a, F b) noexcept
    {
      if (a < b)
        return -1;
      if (a > b)
        return 1;
      // Equal or unordered: order by bits, so -0.0 < 0.0 and NaN sorts last and equals itself.
      using Bits = std::conditional_t<sizeof(F) == 8, std::int64_t, std::int32_t>;
      const auto canonical = [](F v) { return v != v ? std::numeric_limits<F>::quiet_NaN() : v; };
      const auto x = std::bit_cast<Bits>(canonical(a));
      const auto y = std::bit_cast<Bits>(canonical(b));
      return (x > y) - (x < y);
    }

    template <class F>
    F MinFloating(F a, F b) noexcept
    {
      if (a != a)
        return a;
      if (b != b)
        return b;
      if (a == 0 && b == 0)
        return std::signbit(a) ? a : b;
      return a < b ? a : b;
    }

    template <class F>
    F MaxFloating(F a, F b) noexcept
    {
      if (a != a)
        return a;
      if (b != b)
        return b;
      if (a == 0 && b == 0)
        return std::signbit(a) ? b : a;
      return a > b ? a : b;
    }

    template <class F>
    std::string FormatFloatingImpl(F value)
    {
      if (value != value)
        return "NaN";
      if (std::isinf(value))
        return value > 0 ? "Infinity" : "-Infinity";
      auto text = fmt::format("{}", value);
      if (text.find_first_of(".e") == std::string::npos)
        text += ".0";
      return text;
    }

    template <class F>
    std::shared_ptr<String> HexFloating(F value)
    {
      if (value != value)
        return String::Make("NaN");
      if (std::isinf(value))
        return String::Make(value > 0 ? "Infinity" : "-Infinity");
      if (value == 0)
        return String::Make(std::signbit(value) ? "-0x0.0p0" : "0x0.0p0");
      auto text = fmt::format("{:a}", value);
      const auto p = text.find('p');
      if (p != std::string::npos)
      {
        if (p + 1 < text.size() && text[p + 1] == '+')
          text.erase(p + 1, 1);
        if (text.find('.') == std::string::npos)
          text.insert(p, ".0");
      }
      return String::Make(std::move(text));
    }

    void AppendUtf8(std::string &out, std::uint32_t cp)
    {
      if (cp < 0x80)
      {
        out.push_back(static_cast<char>(cp));
      }
      else if (cp < 0x800)
      {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      }
      else
      {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
      }
    }

    bool IsLatinLetter(std::int32_t cp) noexcept
    {
      if ((cp >= 'a' && cp <= 'z') || (cp >= 'A' && cp <= 'Z'))
        return true;
      if (cp == 0xAA || cp == 0xB5 || cp == 0xBA)
        return true;
      return cp >= 0xC0 && cp <= 0xFF && cp != 0xD7 && cp != 0xF7;
    }

    bool IsSpaceSeparator(std::int32_t cp) noexcept
    {
      return cp == 0x20 || cp == 0xA0 || cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) || cp == 0x202F ||
             cp == 0x205F || cp == 0x3000;
    }

    Error IndexOutOfBounds(std::int32_t index, std::size_t length)
    {
      return HostError("IndexOutOfBoundsException", fmt::format("index {} out of bounds for length {}", index, length));
    }
  } // namespace

  Error HostError(std::string_view exceptionClass, std::string_view message)
  {
    return Error{ErrorCode::HostFailure, fmt::format("{}: {}", exceptionClass, message)};
  }

  std::string FormatFloating(float value)
  {
    return FormatFloatingImpl(value);
  }

  std::string FormatFloating(double value)
  {
    return FormatFloatingImpl(value);
  }

  // Object

  bool Object::Equals(const ObjectRef &other) const
  {
    return other.get() == this;
  }

  std::int32_t Object::HashCode() const
  {
    const auto bits = static_cast<std::uint64_t>(reinterpret_cast<std::uintptr_t>(this)) >> 4;
    return static_cast<std::int32_t>(static_cast<std::uint32_t>(bits ^ (bits >> 32)));
  }

  std::shared_ptr<String> Object::ToString() const
  {
    return String::Make(fmt::format("Object@{:x}", static_cast<std::uint32_t>(HashCode())));
  }

  void TesseraDescribe(Tag<Object>, ClassBuilder<Object> &b)
  {
    b.SetName("Object")
        .Root()
        .Method<&Object::Equals>("equals")
        .Method<&Object::HashCode>("hashCode")
        .Method<&Object::ToString>("toString");
  }

  void TesseraDescribe(Tag<Void>, ClassBuilder<Void> &b)
  {
    b.SetName("Void").Extends<Object>().BindSort(Sort::VoidObj);
  }

  void TesseraDescribe(Tag<Number>, ClassBuilder<Number> &b)
  {
    b.SetName("Number")
        .Extends<Object>()
        .BindSort(Sort::Number)
        .Method<&Number::ByteValue>("byteValue")
        .Method<&Number::ShortValue>("shortValue")
        .Method<&Number::IntValue>("intValue")
        .Method<&Number::LongValue>("longValue")
        .Method<&Number::FloatValue>("floatValue")
        .Method<&Number::DoubleValue>("doubleValue");
  }

  // Boolean

  const std::shared_ptr<Boolean> Boolean::True = std::make_shared<Boolean>(true);
  const std::shared_ptr<Boolean> Boolean::False = std::make_shared<Boolean>(false);

  // Null sorts first in every CompareTo.
  std::int32_t Boolean::CompareTo(const std::shared_ptr<Boolean> &other) const
  {
    return other ? Compare(m_value, other->m_value) : 1;
  }

  std::int32_t Boolean::Compare(bool a, bool b) noexcept
  {
    return a == b ? 0 : (a ? 1 : -1);
  }

  bool Boolean::ParseBoolean(const std::shared_ptr<String> &text)
  {
    const auto &s = TextOf(text);
    if (s.size() != 4)
      return false;
    constexpr std::string_view expected = "true";
    for (std::size_t i = 0; i < 4; ++i)
    {
      auto c = s[i];
      if (c >= 'A' && c <= 'Z')
        c = static_cast<char>(c - 'A' + 'a');
      if (c != expected[i])
        return false;
    }
    return true;
  }

  std::shared_ptr<Boolean> Boolean::ValueOf(bool value)
  {
    return value ? True : False;
  }

  bool Boolean::Equals(const ObjectRef &other) const
  {
    const auto *box = dynamic_cast<const Boolean *>(other.get());
    return box && box->m_value == m_value;
  }

  std::shared_ptr<String> Boolean::ToString() const
  {
    return String::Make(m_value ? "true" : "false");
  }

  void TesseraDescribe(Tag<Boolean>, ClassBuilder<Boolean> &b)
  {
    b.SetName("Boolean")
        .Extends<Object>()
        .BindSort(Sort::BoolObj)
        .Constructor<bool>()
        .Method<&Boolean::BooleanValue>("booleanValue")
        .StaticMethod<&Boolean::Compare>("compare")
        .Method<&Boolean::CompareTo>("compareTo")
        .StaticMethod<&Boolean::ParseBoolean>("parseBoolean")
        .StaticMethod<&Boolean::ValueOf>("valueOf")
        .StaticField<&Boolean::False>("FALSE")
        .StaticField<&Boolean::True>("TRUE");
  }

  // Byte, Short

  std::int32_t Byte::CompareTo(const std::shared_ptr<Byte> &other) const
  {
    return other ? Compare(m_value, other->m_value) : 1;
  }

  std::expected<std::int8_t, Error> Byte::ParseByte(const std::shared_ptr<String> &text)
  {
    return ParseIntegral<std::int8_t>(text);
  }

  std::shared_ptr<Byte> Byte::ValueOf(std::int8_t value)
  {
    return std::make_shared<Byte>(value);
  }

  void TesseraDescribe(Tag<Byte>, ClassBuilder<Byte> &b)
  {
    b.SetName("Byte")
        .Extends<Number>()
        .BindSort(Sort::ByteObj)
        .Constructor<std::int8_t>()
        .StaticMethod<&Byte::Compare>("compare")
        .Method<&Byte::CompareTo>("compareTo")
        .StaticMethod<&Byte::ParseByte>("parseByte")
        .StaticMethod<&Byte::ValueOf>("valueOf")
        .StaticField<&Byte::MinValue>("MIN_VALUE")
        .StaticField<&Byte::MaxValue>("MAX_VALUE");
  }

  std::int32_t Short::CompareTo(const std::shared_ptr<Short> &other) const
  {
    return other ? Compare(m_value, other->m_value) : 1;
  }

  std::expected<std::int16_t, Error> Short::ParseShort(const std::shared_ptr<String> &text)
  {
    return ParseIntegral<std::int16_t>(text);
  }

  std::shared_ptr<Short> Short::ValueOf(std::int16_t value)
  {
    return std::make_shared<Short>(value);
  }

  void TesseraDescribe(Tag<Short>, ClassBuilder<Short> &b)
  {
    b.SetName("Short")
        .Extends<Number>()
        .BindSort(Sort::ShortObj)
        .Constructor<std::int16_t>()
        .StaticMethod<&Short::Compare>("compare")
        .Method<&Short::CompareTo>("compareTo")
        .StaticMethod<&Short::ParseShort>("parseShort")
        .StaticMethod<&Short::ValueOf>("valueOf")
        .StaticField<&Short::MinValue>("MIN_VALUE")
        .StaticField<&Short::MaxValue>("MAX_VALUE");
  }

  // Character. Classification covers ASCII and Latin-1; other code points report false.

  std::int32_t Character::CompareTo(const std::shared_ptr<Character> &other) const
  {
    return other ? Compare(m_value, other->m_value) : 1;
  }

  std::int32_t Character::CharCount(std::int32_t codePoint) noexcept
  {
    return codePoint >= 0x10000 ? 2 : 1;
  }

  std::int32_t Character::Digit(std::int32_t codePoint, std::int32_t radix) noexcept
  {
    if (radix < 2 || radix > 36)
      return -1;
    std::int32_t value = -1;
    if (codePoint >= '0' && codePoint <= '9')
      value = codePoint - '0';
    else if (codePoint >= 'a' && codePoint <= 'z')
      value = codePoint - 'a' + 10;
    else if (codePoint >= 'A' && codePoint <= 'Z')
      value = codePoint - 'A' + 10;
    return value < radix ? value : -1;
  }

  char16_t Character::ForDigit(std::int32_t digit, std::int32_t radix) noexcept
  {
    if (radix < 2 || radix > 36 || digit < 0 || digit >= radix)
      return u'\0';
    return static_cast<char16_t>(digit < 10 ? u'0' + digit : u'a' + digit - 10);
  }

  std::int32_t Character::GetNumericValue(std::int32_t codePoint) noexcept
  {
    return Digit(codePoint, 36);
  }

  bool Character::IsAlphabetic(std::int32_t codePoint) noexcept
  {
    return IsLatinLetter(codePoint);
  }

  bool Character::IsDefined(std::int32_t codePoint) noexcept
  {
    return codePoint >= 0 && codePoint <= 0x10FFFF;
  }

  bool Character::IsDigit(std::int32_t codePoint) noexcept
  {
    return codePoint >= '0' && codePoint <= '9';
  }

  bool Character::IsLetter(std::int32_t codePoint) noexcept
  {
    return IsLatinLetter(codePoint);
  }

  bool Character::IsLetterOrDigit(std::int32_t codePoint) noexcept
  {
    return IsLetter(codePoint) || IsDigit(codePoint);
  }

  bool Character::IsLowerCase(std::int32_t codePoint) noexcept
  {
    if (codePoint >= 'a' && codePoint <= 'z')
      return true;
    if (codePoint == 0xAA || codePoint == 0xB5 || codePoint == 0xBA)
      return true;
    return codePoint >= 0xDF && codePoint <= 0xFF && codePoint != 0xF7;
  }

  bool Character::IsSpaceChar(std::int32_t codePoint) noexcept
  {
    return IsSpaceSeparator(codePoint) || codePoint == 0x2028 || codePoint == 0x2029;
  }

  bool Character::IsTitleCase(std::int32_t) noexcept
  {
    return false;
  }

  bool Character::IsUpperCase(std::int32_t codePoint) noexcept
  {
    if (codePoint >= 'A' && codePoint <= 'Z')
      return true;
    return codePoint >= 0xC0 && codePoint <= 0xDE && codePoint != 0xD7;
  }

  bool Character::IsWhitespace(std::int32_t codePoint) noexcept
  {
    if ((codePoint >= 0x09 && codePoint <= 0x0D) || (codePoint >= 0x1C && codePoint <= 0x1F))
      return true;
    if (codePoint == 0xA0 || codePoint == 0x2007 || codePoint == 0x202F)
      return false;
    return IsSpaceSeparator(codePoint) || codePoint == 0x2028 || codePoint == 0x2029;
  }

  std::shared_ptr<Character> Character::ValueOf(char16_t value)
  {
    return std::make_shared<Character>(value);
  }

  bool Character::Equals(const ObjectRef &other) const
  {
    const auto *box = dynamic_cast<const Character *>(other.get());
    return box && box->m_value == m_value;
  }

  // Characters above 0xFF are stored UTF-8 encoded.
  std::shared_ptr<String> Character::ToString() const
  {
    std::string text;
    if (m_value <= 0xFF)
      text.push_back(static_cast<char>(m_value));
    else
      AppendUtf8(text, m_value);
    return String::Make(std::move(text));
  }

  void TesseraDescribe(Tag<Character>, ClassBuilder<Character> &b)
  {
    b.SetName("Character")
        .Extends<Object>()
        .BindSort(Sort::CharObj)
        .Constructor<char16_t>()
        .StaticMethod<&Character::CharCount>("charCount")
        .Method<&Character::CharValue>("charValue")
        .StaticMethod<&Character::Compare>("compare")
        .Method<&Character::CompareTo>("compareTo")
        .StaticMethod<&Character::Digit>("digit")
        .StaticMethod<&Character::ForDigit>("forDigit")
        .StaticMethod<&Character::GetNumericValue>("getNumericValue")
        .StaticMethod<&Character::IsAlphabetic>("isAlphabetic")
        .StaticMethod<&Character::IsDefined>("isDefined")
        .StaticMethod<&Character::IsDigit>("isDigit")
        .StaticMethod<&Character::IsLetter>("isLetter")
        .StaticMethod<&Character::IsLetterOrDigit>("isLetterOrDigit")
        .StaticMethod<&Character::IsLowerCase>("isLowerCase")
        .StaticMethod<&Character::IsSpaceChar>("isSpaceChar")
        .StaticMethod<&Character::IsTitleCase>("isTitleCase")
        .StaticMethod<&Character::IsUpperCase>("isUpperCase")
        .StaticMethod<&Character::IsWhitespace>("isWhitespace")
        .StaticMethod<&Character::ValueOf>("valueOf")
        .StaticField<&Character::MinValue>("MIN_VALUE")
        .StaticField<&Character::MaxValue>("MAX_VALUE");
  }

  // Integer, Long

  std::int32_t Integer::CompareTo(const std::shared_ptr<Integer> &other) const
  {
    return other ? Compare(m_value, other->m_value) : 1;
  }

  std::expected<std::int32_t, Error> Integer::ParseInt(const std::shared_ptr<String> &text)
  {
    return ParseIntegral<std::int32_t>(text);
  }

  std::shared_ptr<String> Integer::ToHexString(std::int32_t value)
  {
    return String::Make(fmt::format("{:x}", static_cast<std::uint32_t>(value)));
  }

  std::shared_ptr<Integer> Integer::ValueOf(std::int32_t value)
  {
    return std::make_shared<Integer>(value);
  }

  void TesseraDescribe(Tag<Integer>, ClassBuilder<Integer> &b)
  {
    b.SetName("Integer")
        .Extends<Number>()
        .BindSort(Sort::IntObj)
        .Constructor<std::int32_t>()
        .StaticMethod<&Integer::Compare>("compare")
        .Method<&Integer::CompareTo>("compareTo")
        .StaticMethod<&Integer::Min>("min")
        .StaticMethod<&Integer::Max>("max")
        .StaticMethod<&Integer::ParseInt>("parseInt")
        .StaticMethod<&Integer::Signum>("signum")
        .StaticMethod<&Integer::ToHexString>("toHexString")
        .StaticMethod<&Integer::ValueOf>("valueOf")
        .StaticField<&Integer::MinValue>("MIN_VALUE")
        .StaticField<&Integer::MaxValue>("MAX_VALUE");
  }

  std::int32_t Long::CompareTo(const std::shared_ptr<Long> &other) const
  {
    return other ? Compare(m_value, other->m_value) : 1;
  }

  std::expected<std::int64_t, Error> Long::ParseLong(const std::shared_ptr<String> &text)
  {
    return ParseIntegral<std::int64_t>(text);
  }

  std::shared_ptr<String> Long::ToHexString(std::int64_t value)
  {
    return String::Make(fmt::format("{:x}", static_cast<std::uint64_t>(value)));
  }

  std::shared_ptr<Long> Long::ValueOf(std::int64_t value)
  {
    return std::make_shared<Long>(value);
  }

  void TesseraDescribe(Tag<Long>, ClassBuilder<Long> &b)
  {
    b.SetName("Long")
        .Extends<Number>()
        .BindSort(Sort::LongObj)
        .Constructor<std::int64_t>()
        .StaticMethod<&Long::Compare>("compare")
        .Method<&Long::CompareTo>("compareTo")
        .StaticMethod<&Long::Min>("min")
        .StaticMethod<&Long::Max>("max")
        .StaticMethod<&Long::ParseLong>("parseLong")
        .StaticMethod<&Long::Signum>("signum")
        .StaticMethod<&Long::ToHexString>("toHexString")
        .StaticMethod<&Long::ValueOf>("valueOf")
        .StaticField<&Long::MinValue>("MIN_VALUE")
        .StaticField<&Long::MaxValue>("MAX_VALUE");
  }

  // Float, Double

  std::int32_t Float::CompareTo(const std::shared_ptr<Float> &other) const
  {
    return other ? Compare(m_value, other->m_value) : 1;
  }

  std::int32_t Float::Compare(float a, float b) noexcept
  {
    return CompareFloating(a, b);
  }

  float Float::Min(float a, float b) noexcept
  {
    return MinFloating(a, b);
  }

  float Float::Max(float a, float b) noexcept
  {
    return MaxFloating(a, b);
  }

  std::expected<float, Error> Float::ParseFloat(const std::shared_ptr<String> &text)
  {
    return ParseFloating<float>(text);
  }

  std::shared_ptr<String> Float::ToHexString(float value)
  {
    return HexFloating(value);
  }

  std::shared_ptr<Float> Float::ValueOf(float value)
  {
    return std::make_shared<Float>(value);
  }

  void TesseraDescribe(Tag<Float>, ClassBuilder<Float> &b)
  {
    b.SetName("Float")
        .Extends<Number>()
        .BindSort(Sort::FloatObj)
        .Constructor<float>()
        .StaticMethod<&Float::Compare>("compare")
        .Method<&Float::CompareTo>("compareTo")
        .StaticMethod<&Float::Min>("min")
        .StaticMethod<&Float::Max>("max")
        .StaticMethod<&Float::ParseFloat>("parseFloat")
        .StaticMethod<&Float::ToHexString>("toHexString")
        .StaticMethod<&Float::ValueOf>("valueOf")
        .StaticField<&Float::MinValue>("MIN_VALUE")
        .StaticField<&Float::MaxValue>("MAX_VALUE");
  }

  std::int32_t Double::CompareTo(const std::shared_ptr<Double> &other) const
  {
    return other ? Compare(m_value, other->m_value) : 1;
  }

  std::int32_t Double::Compare(double a, double b) noexcept
  {
    return CompareFloating(a, b);
  }

  double Double::Min(double a, double b) noexcept
  {
    return MinFloating(a, b);
  }

  double Double::Max(double a, double b) noexcept
  {
    return MaxFloating(a, b);
  }

  std::expected<double, Error> Double::ParseDouble(const std::shared_ptr<String> &text)
  {
    return ParseFloating<double>(text);
  }

  std::shared_ptr<String> Double::ToHexString(double value)
  {
    return HexFloating(value);
  }

  std::shared_ptr<Double> Double::ValueOf(double value)
  {
    return std::make_shared<Double>(value);
  }

  void TesseraDescribe(Tag<Double>, ClassBuilder<Double> &b)
  {
    b.SetName("Double")
        .Extends<Number>()
        .BindSort(Sort::DoubleObj)
        .Constructor<double>()
        .StaticMethod<&Double::Compare>("compare")
        .Method<&Double::CompareTo>("compareTo")
        .StaticMethod<&Double::Min>("min")
        .StaticMethod<&Double::Max>("max")
        .StaticMethod<&Double::ParseDouble>("parseDouble")
        .StaticMethod<&Double::ToHexString>("toHexString")
        .StaticMethod<&Double::ValueOf>("valueOf")
        .StaticField<&Double::MinValue>("MIN_VALUE")
        .StaticField<&Double::MaxValue>("MAX_VALUE");
  }

  // CharSequence, String

  void TesseraDescribe(Tag<CharSequence>, ClassBuilder<CharSequence> &b)
  {
    b.SetName("CharSequence")
        .Interface()
        .Method<&CharSequence::CharAt>("charAt")
        .Method<&CharSequence::Length>("length");
  }

  std::shared_ptr<String> String::Make(std::string value)
  {
    return std::make_shared<String>(std::move(value));
  }

  std::expected<char16_t, Error> String::CharAt(std::int32_t index) const
  {
    if (index < 0 || static_cast<std::size_t>(index) >= m_value.size())
      return std::unexpected(IndexOutOfBounds(index, m_value.size()));
    return static_cast<char16_t>(static_cast<unsigned char>(m_value[static_cast<std::size_t>(index)]));
  }

  std::expected<std::int32_t, Error> String::CodePointAt(std::int32_t index) const
  {
    auto c = CharAt(index);
    if (!c)
      return std::unexpected(std::move(c.error()));
    return static_cast<std::int32_t>(*c);
  }

  // Null arguments read as the empty string.
  std::int32_t String::CompareTo(const std::shared_ptr<String> &other) const
  {
    const auto &rhs = TextOf(other);
    const auto n = std::min(m_value.size(), rhs.size());
    for (std::size_t i = 0; i < n; ++i)
    {
      const auto a = static_cast<unsigned char>(m_value[i]);
      const auto b = static_cast<unsigned char>(rhs[i]);
      if (a != b)
        return static_cast<std::int32_t>(a) - static_cast<std::int32_t>(b);
    }
    return static_cast<std::int32_t>(m_value.size()) - static_cast<std::int32_t>(rhs.size());
  }

  std::shared_ptr<String> String::Concat(const std::shared_ptr<String> &other) const
  {
    return Make(m_value + TextOf(other));
  }

  bool String::EndsWith(const std::shared_ptr<String> &suffix) const
  {
    return m_value.ends_with(TextOf(suffix));
  }

  std::int32_t String::IndexOf(const std::shared_ptr<String> &needle) const
  {
    return IndexOfFrom(needle, 0);
  }

  std::int32_t String::IndexOfFrom(const std::shared_ptr<String> &needle, std::int32_t from) const
  {
    const auto start = from < 0 ? std::size_t{0} : std::min(static_cast<std::size_t>(from), m_value.size());
    const auto pos = m_value.find(TextOf(needle), start);
    return pos == std::string::npos ? -1 : static_cast<std::int32_t>(pos);
  }

  std::shared_ptr<String> String::Replace(const std::shared_ptr<CharSequence> &target,
                                          const std::shared_ptr<CharSequence> &replacement) const
  {
    const auto from = TextOf(target);
    const auto to = TextOf(replacement);
    std::string out;
    if (from.empty())
    {
      // An empty target matches before every character and at the end.
      out.reserve(m_value.size() + (m_value.size() + 1) * to.size());
      for (const char c : m_value)
      {
        out += to;
        out.push_back(c);
      }
      out += to;
      return Make(std::move(out));
    }
    std::size_t pos = 0;
    for (auto hit = m_value.find(from); hit != std::string::npos; hit = m_value.find(from, pos))
    {
      out.append(m_value, pos, hit - pos);
      out += to;
      pos = hit + from.size();
    }
    out.append(m_value, pos, std::string::npos);
    return Make(std::move(out));
  }

  bool String::StartsWith(const std::shared_ptr<String> &prefix) const
  {
    return m_value.starts_with(TextOf(prefix));
  }

  std::expected<std::shared_ptr<String>, Error> String::Substring(std::int32_t begin, std::int32_t end) const
  {
    if (begin < 0 || end < begin || static_cast<std::size_t>(end) > m_value.size())
      return std::unexpected(HostError("IndexOutOfBoundsException",
                                       fmt::format("begin {}, end {}, length {}", begin, end, m_value.size())));
    return Make(m_value.substr(static_cast<std::size_t>(begin), static_cast<std::size_t>(end - begin)));
  }

  std::vector<char16_t> String::ToCharArray() const
  {
    std::vector<char16_t> chars;
    chars.reserve(m_value.size());
    for (const char c : m_value)
      chars.push_back(static_cast<char16_t>(static_cast<unsigned char>(c)));
    return chars;
  }

  std::shared_ptr<String> String::Trim() const
  {
    return Make(std::string{TrimWhitespace(m_value)});
  }

  bool String::Equals(const ObjectRef &other) const
  {
    const auto *s = dynamic_cast<const String *>(other.get());
    return s && s->m_value == m_value;
  }

  std::int32_t String::HashCode() const
  {
    std::uint32_t h = 0;
    for (const char c : m_value)
      h = 31 * h + static_cast<unsigned char>(c);
    return static_cast<std::int32_t>(h);
  }

  std::shared_ptr<String> String::ToString() const
  {
    return Make(m_value);
  }

  void TesseraDescribe(Tag<String>, ClassBuilder<String> &b)
  {
    b.SetName("String")
        .Extends<Object>()
        .Implements<CharSequence>()
        .BindSort(Sort::String)
        .Constructor<>()
        .Method<&String::CodePointAt>("codePointAt")
        .Method<&String::CompareTo>("compareTo")
        .Method<&String::Concat>("concat")
        .Method<&String::EndsWith>("endsWith")
        .Method<&String::IndexOf>("indexOf")
        .Method<&String::IndexOfFrom>("indexOf")
        .Method<&String::IsEmpty>("isEmpty")
        .Method<&String::Replace>("replace")
        .Method<&String::StartsWith>("startsWith")
        .Method<&String::Substring>("substring")
        .Method<&String::ToCharArray>("toCharArray")
        .Method<&String::Trim>("trim");
  }

  // Exceptions

  std::shared_ptr<String> Exception::ToString() const
  {
    if (!m_message)
      return String::Make("Exception");
    return String::Make(fmt::format("Exception: {}", m_message->Value()));
  }

  void TesseraDescribe(Tag<Exception>, ClassBuilder<Exception> &b)
  {
    b.SetName("Exception").Extends<Object>().Method<&Exception::GetMessage>("getMessage");
  }

  void TesseraDescribe(Tag<ArithmeticException>, ClassBuilder<ArithmeticException> &b)
  {
    b.SetName("ArithmeticException").Extends<Exception>().Constructor<std::shared_ptr<String>>();
  }

  void TesseraDescribe(Tag<IllegalArgumentException>, ClassBuilder<IllegalArgumentException> &b)
  {
    b.SetName("IllegalArgumentException").Extends<Exception>().Constructor<std::shared_ptr<String>>();
  }

  void TesseraDescribe(Tag<IllegalStateException>, ClassBuilder<IllegalStateException> &b)
  {
    b.SetName("IllegalStateException").Extends<Exception>().Constructor<std::shared_ptr<String>>();
  }

  void TesseraDescribe(Tag<NumberFormatException>, ClassBuilder<NumberFormatException> &b)
  {
    b.SetName("NumberFormatException").Extends<IllegalArgumentException>().Constructor<std::shared_ptr<String>>();
  }

} // namespace Tessera::Catalog::Standard
