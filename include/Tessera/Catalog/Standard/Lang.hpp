// Lang.hpp
// Core host classes of the standard library: the root object, boxes, strings and exceptions.
#pragma once

#include <Tessera/Catalog/Host.hpp>
#include <Tessera/Catalog/HostRegistry.hpp>
#include <Tessera/Catalog/Standard/Export.hpp>
#include <Tessera/Catalog/Numeric.hpp>
#include <Tessera/Catalog/Types.hpp>

#include <fmt/format.h>

#include <bit>
#include <cstdint>
#include <expected>
#include <limits>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace Tessera::Catalog::Standard
{

  class String;

  // Root of every reference class; the catalogue's universal supertype.
  class TESSERA_CATALOG_STANDARD_API Object : public virtual HostObject
  {
  public:
    ~Object() override = default;

    [[nodiscard]] virtual bool Equals(const std::shared_ptr<Object> &other) const;
    [[nodiscard]] virtual std::int32_t HashCode() const;
    [[nodiscard]] virtual std::shared_ptr<String> ToString() const;

    friend void TesseraDescribe(Tag<Object>, ClassBuilder<Object> &);
  };

  using ObjectRef = std::shared_ptr<Object>;

  // Equality and hashing that tolerate null references; used by the hashed collections.
  struct ObjectHash
  {
    std::size_t operator()(const ObjectRef &value) const
    {
      return value ? static_cast<std::size_t>(static_cast<std::uint32_t>(value->HashCode())) : 0;
    }
  };

  struct ObjectEqual
  {
    bool operator()(const ObjectRef &a, const ObjectRef &b) const
    {
      if (!a || !b)
        return a == b;
      return a == b || a->Equals(b);
    }
  };

  class TESSERA_CATALOG_STANDARD_API Void final : public Object
  {
  public:
    friend void TesseraDescribe(Tag<Void>, ClassBuilder<Void> &);
  };

  class TESSERA_CATALOG_STANDARD_API Number : public Object
  {
  public:
    [[nodiscard]] virtual std::int8_t ByteValue() const = 0;
    [[nodiscard]] virtual std::int16_t ShortValue() const = 0;
    [[nodiscard]] virtual std::int32_t IntValue() const = 0;
    [[nodiscard]] virtual std::int64_t LongValue() const = 0;
    [[nodiscard]] virtual float FloatValue() const = 0;
    [[nodiscard]] virtual double DoubleValue() const = 0;

    friend void TesseraDescribe(Tag<Number>, ClassBuilder<Number> &);
  };

  // Shared implementation of the numeric boxes; V is the boxed primitive.
  template <class V>
  class NumberBox : public Number
  {
  public:
    explicit NumberBox(V value) : m_value(value) {}

    [[nodiscard]] V Value() const noexcept { return m_value; }

    [[nodiscard]] std::int8_t ByteValue() const override { return NumericCast<std::int8_t>(m_value); }
    [[nodiscard]] std::int16_t ShortValue() const override { return NumericCast<std::int16_t>(m_value); }
    [[nodiscard]] std::int32_t IntValue() const override { return NumericCast<std::int32_t>(m_value); }
    [[nodiscard]] std::int64_t LongValue() const override { return NumericCast<std::int64_t>(m_value); }
    [[nodiscard]] float FloatValue() const override { return static_cast<float>(m_value); }
    [[nodiscard]] double DoubleValue() const override { return static_cast<double>(m_value); }

    [[nodiscard]] bool Equals(const ObjectRef &other) const override
    {
      const auto *box = dynamic_cast<const NumberBox *>(other.get());
      return box && box->m_value == m_value;
    }

    [[nodiscard]] std::int32_t HashCode() const override
    {
      if constexpr (std::is_same_v<V, double>)
      {
        const auto bits = std::bit_cast<std::uint64_t>(m_value);
        return static_cast<std::int32_t>(bits ^ (bits >> 32));
      }
      else if constexpr (std::is_same_v<V, float>)
      {
        return std::bit_cast<std::int32_t>(m_value);
      }
      else if constexpr (sizeof(V) == 8)
      {
        const auto bits = static_cast<std::uint64_t>(m_value);
        return static_cast<std::int32_t>(bits ^ (bits >> 32));
      }
      else
      {
        return static_cast<std::int32_t>(m_value);
      }
    }

    [[nodiscard]] std::shared_ptr<String> ToString() const override;

  protected:
    V m_value;
  };

  class TESSERA_CATALOG_STANDARD_API Boolean final : public Object
  {
  public:
    explicit Boolean(bool value) : m_value(value) {}

    static const std::shared_ptr<Boolean> True;
    static const std::shared_ptr<Boolean> False;

    [[nodiscard]] bool BooleanValue() const noexcept { return m_value; }
    [[nodiscard]] std::int32_t CompareTo(const std::shared_ptr<Boolean> &other) const;

    [[nodiscard]] static std::int32_t Compare(bool a, bool b) noexcept;
    [[nodiscard]] static bool ParseBoolean(const std::shared_ptr<String> &text);
    [[nodiscard]] static std::shared_ptr<Boolean> ValueOf(bool value);

    [[nodiscard]] bool Equals(const ObjectRef &other) const override;
    [[nodiscard]] std::int32_t HashCode() const override { return m_value ? 1231 : 1237; }
    [[nodiscard]] std::shared_ptr<String> ToString() const override;

    friend void TesseraDescribe(Tag<Boolean>, ClassBuilder<Boolean> &);

  private:
    bool m_value;
  };

  class TESSERA_CATALOG_STANDARD_API Byte final : public NumberBox<std::int8_t>
  {
  public:
    using NumberBox::NumberBox;

    static constexpr std::int8_t MinValue = std::numeric_limits<std::int8_t>::min();
    static constexpr std::int8_t MaxValue = std::numeric_limits<std::int8_t>::max();

    [[nodiscard]] std::int32_t CompareTo(const std::shared_ptr<Byte> &other) const;
    [[nodiscard]] static std::int32_t Compare(std::int8_t a, std::int8_t b) noexcept { return a - b; }
    [[nodiscard]] static std::expected<std::int8_t, Error> ParseByte(const std::shared_ptr<String> &text);
    [[nodiscard]] static std::shared_ptr<Byte> ValueOf(std::int8_t value);

    friend void TesseraDescribe(Tag<Byte>, ClassBuilder<Byte> &);
  };

  class TESSERA_CATALOG_STANDARD_API Short final : public NumberBox<std::int16_t>
  {
  public:
    using NumberBox::NumberBox;

    static constexpr std::int16_t MinValue = std::numeric_limits<std::int16_t>::min();
    static constexpr std::int16_t MaxValue = std::numeric_limits<std::int16_t>::max();

    [[nodiscard]] std::int32_t CompareTo(const std::shared_ptr<Short> &other) const;
    [[nodiscard]] static std::int32_t Compare(std::int16_t a, std::int16_t b) noexcept { return a - b; }
    [[nodiscard]] static std::expected<std::int16_t, Error> ParseShort(const std::shared_ptr<String> &text);
    [[nodiscard]] static std::shared_ptr<Short> ValueOf(std::int16_t value);

    friend void TesseraDescribe(Tag<Short>, ClassBuilder<Short> &);
  };

  class TESSERA_CATALOG_STANDARD_API Character final : public Object
  {
  public:
    explicit Character(char16_t value) : m_value(value) {}

    static constexpr char16_t MinValue = u'\u0000';
    static constexpr char16_t MaxValue = static_cast<char16_t>(0xFFFF);

    [[nodiscard]] char16_t CharValue() const noexcept { return m_value; }
    [[nodiscard]] std::int32_t CompareTo(const std::shared_ptr<Character> &other) const;

    [[nodiscard]] static std::int32_t CharCount(std::int32_t codePoint) noexcept;
    [[nodiscard]] static std::int32_t Compare(char16_t a, char16_t b) noexcept { return a - b; }
    [[nodiscard]] static std::int32_t Digit(std::int32_t codePoint, std::int32_t radix) noexcept;
    [[nodiscard]] static char16_t ForDigit(std::int32_t digit, std::int32_t radix) noexcept;
    [[nodiscard]] static std::int32_t GetNumericValue(std::int32_t codePoint) noexcept;
    [[nodiscard]] static bool IsAlphabetic(std::int32_t codePoint) noexcept;
    [[nodiscard]] static bool IsDefined(std::int32_t codePoint) noexcept;
    [[nodiscard]] static bool IsDigit(std::int32_t codePoint) noexcept;
    [[nodiscard]] static bool IsLetter(std::int32_t codePoint) noexcept;
    [[nodiscard]] static bool IsLetterOrDigit(std::int32_t codePoint) noexcept;
    [[nodiscard]] static bool IsLowerCase(std::int32_t codePoint) noexcept;
    [[nodiscard]] static bool IsSpaceChar(std::int32_t codePoint) noexcept;
    [[nodiscard]] static bool IsTitleCase(std::int32_t codePoint) noexcept;
    [[nodiscard]] static bool IsUpperCase(std::int32_t codePoint) noexcept;
    [[nodiscard]] static bool IsWhitespace(std::int32_t codePoint) noexcept;
    [[nodiscard]] static std::shared_ptr<Character> ValueOf(char16_t value);

    [[nodiscard]] bool Equals(const ObjectRef &other) const override;
    [[nodiscard]] std::int32_t HashCode() const override { return m_value; }
    [[nodiscard]] std::shared_ptr<String> ToString() const override;

    friend void TesseraDescribe(Tag<Character>, ClassBuilder<Character> &);

  private:
    char16_t m_value;
  };

  class TESSERA_CATALOG_STANDARD_API Integer final : public NumberBox<std::int32_t>
  {
  public:
    using NumberBox::NumberBox;

    static constexpr std::int32_t MinValue = std::numeric_limits<std::int32_t>::min();
    static constexpr std::int32_t MaxValue = std::numeric_limits<std::int32_t>::max();

    [[nodiscard]] std::int32_t CompareTo(const std::shared_ptr<Integer> &other) const;
    [[nodiscard]] static std::int32_t Compare(std::int32_t a, std::int32_t b) noexcept { return (a > b) - (a < b); }
    [[nodiscard]] static std::int32_t Min(std::int32_t a, std::int32_t b) noexcept { return a < b ? a : b; }
    [[nodiscard]] static std::int32_t Max(std::int32_t a, std::int32_t b) noexcept { return a > b ? a : b; }
    [[nodiscard]] static std::expected<std::int32_t, Error> ParseInt(const std::shared_ptr<String> &text);
    [[nodiscard]] static std::int32_t Signum(std::int32_t value) noexcept { return (value > 0) - (value < 0); }
    [[nodiscard]] static std::shared_ptr<String> ToHexString(std::int32_t value);
    [[nodiscard]] static std::shared_ptr<Integer> ValueOf(std::int32_t value);

    friend void TesseraDescribe(Tag<Integer>, ClassBuilder<Integer> &);
  };

  class TESSERA_CATALOG_STANDARD_API Long final : public NumberBox<std::int64_t>
  {
  public:
    using NumberBox::NumberBox;

    static constexpr std::int64_t MinValue = std::numeric_limits<std::int64_t>::min();
    static constexpr std::int64_t MaxValue = std::numeric_limits<std::int64_t>::max();

    [[nodiscard]] std::int32_t CompareTo(const std::shared_ptr<Long> &other) const;
    [[nodiscard]] static std::int32_t Compare(std::int64_t a, std::int64_t b) noexcept { return (a > b) - (a < b); }
    [[nodiscard]] static std::int64_t Min(std::int64_t a, std::int64_t b) noexcept { return a < b ? a : b; }
    [[nodiscard]] static std::int64_t Max(std::int64_t a, std::int64_t b) noexcept { return a > b ? a : b; }
    [[nodiscard]] static std::expected<std::int64_t, Error> ParseLong(const std::shared_ptr<String> &text);
    [[nodiscard]] static std::int32_t Signum(std::int64_t value) noexcept { return (value > 0) - (value < 0); }
    [[nodiscard]] static std::shared_ptr<String> ToHexString(std::int64_t value);
    [[nodiscard]] static std::shared_ptr<Long> ValueOf(std::int64_t value);

    friend void TesseraDescribe(Tag<Long>, ClassBuilder<Long> &);
  };

  class TESSERA_CATALOG_STANDARD_API Float final : public NumberBox<float>
  {
  public:
    using NumberBox::NumberBox;

    static constexpr float MinValue = std::numeric_limits<float>::denorm_min();
    static constexpr float MaxValue = std::numeric_limits<float>::max();

    [[nodiscard]] std::int32_t CompareTo(const std::shared_ptr<Float> &other) const;
    [[nodiscard]] static std::int32_t Compare(float a, float b) noexcept;
    [[nodiscard]] static float Min(float a, float b) noexcept;
    [[nodiscard]] static float Max(float a, float b) noexcept;
    [[nodiscard]] static std::expected<float, Error> ParseFloat(const std::shared_ptr<String> &text);
    [[nodiscard]] static std::shared_ptr<String> ToHexString(float value);
    [[nodiscard]] static std::shared_ptr<Float> ValueOf(float value);

    friend void TesseraDescribe(Tag<Float>, ClassBuilder<Float> &);
  };

  class TESSERA_CATALOG_STANDARD_API Double final : public NumberBox<double>
  {
  public:
    using NumberBox::NumberBox;

    static constexpr double MinValue = std::numeric_limits<double>::denorm_min();
    static constexpr double MaxValue = std::numeric_limits<double>::max();

    [[nodiscard]] std::int32_t CompareTo(const std::shared_ptr<Double> &other) const;
    [[nodiscard]] static std::int32_t Compare(double a, double b) noexcept;
    [[nodiscard]] static double Min(double a, double b) noexcept;
    [[nodiscard]] static double Max(double a, double b) noexcept;
    [[nodiscard]] static std::expected<double, Error> ParseDouble(const std::shared_ptr<String> &text);
    [[nodiscard]] static std::shared_ptr<String> ToHexString(double value);
    [[nodiscard]] static std::shared_ptr<Double> ValueOf(double value);

    friend void TesseraDescribe(Tag<Double>, ClassBuilder<Double> &);
  };

  class TESSERA_CATALOG_STANDARD_API CharSequence : public virtual HostObject
  {
  public:
    [[nodiscard]] virtual std::expected<char16_t, Error> CharAt(std::int32_t index) const = 0;
    [[nodiscard]] virtual std::int32_t Length() const = 0;

    friend void TesseraDescribe(Tag<CharSequence>, ClassBuilder<CharSequence> &);
  };

  // Immutable byte string; each byte is one script character.
  class TESSERA_CATALOG_STANDARD_API String final : public Object, public CharSequence
  {
  public:
    String() = default;
    explicit String(std::string value) : m_value(std::move(value)) {}

    [[nodiscard]] static std::shared_ptr<String> Make(std::string value);

    [[nodiscard]] const std::string &Value() const noexcept { return m_value; }

    [[nodiscard]] std::expected<char16_t, Error> CharAt(std::int32_t index) const override;
    [[nodiscard]] std::int32_t Length() const override { return static_cast<std::int32_t>(m_value.size()); }

    [[nodiscard]] std::expected<std::int32_t, Error> CodePointAt(std::int32_t index) const;
    [[nodiscard]] std::int32_t CompareTo(const std::shared_ptr<String> &other) const;
    [[nodiscard]] std::shared_ptr<String> Concat(const std::shared_ptr<String> &other) const;
    [[nodiscard]] bool EndsWith(const std::shared_ptr<String> &suffix) const;
    [[nodiscard]] std::int32_t IndexOf(const std::shared_ptr<String> &needle) const;
    [[nodiscard]] std::int32_t IndexOfFrom(const std::shared_ptr<String> &needle, std::int32_t from) const;
    [[nodiscard]] bool IsEmpty() const noexcept { return m_value.empty(); }
    [[nodiscard]] std::shared_ptr<String> Replace(const std::shared_ptr<CharSequence> &target,
                                                  const std::shared_ptr<CharSequence> &replacement) const;
    [[nodiscard]] bool StartsWith(const std::shared_ptr<String> &prefix) const;
    [[nodiscard]] std::expected<std::shared_ptr<String>, Error> Substring(std::int32_t begin, std::int32_t end) const;
    [[nodiscard]] std::vector<char16_t> ToCharArray() const;
    [[nodiscard]] std::shared_ptr<String> Trim() const;

    [[nodiscard]] bool Equals(const ObjectRef &other) const override;
    [[nodiscard]] std::int32_t HashCode() const override;
    [[nodiscard]] std::shared_ptr<String> ToString() const override;

    friend void TesseraDescribe(Tag<String>, ClassBuilder<String> &);

  private:
    std::string m_value;
  };

  class TESSERA_CATALOG_STANDARD_API Exception : public Object
  {
  public:
    explicit Exception(std::shared_ptr<String> message) : m_message(std::move(message)) {}

    [[nodiscard]] std::shared_ptr<String> GetMessage() const { return m_message; }
    [[nodiscard]] std::shared_ptr<String> ToString() const override;

    friend void TesseraDescribe(Tag<Exception>, ClassBuilder<Exception> &);

  private:
    std::shared_ptr<String> m_message;
  };

  class TESSERA_CATALOG_STANDARD_API ArithmeticException final : public Exception
  {
  public:
    using Exception::Exception;
    friend void TesseraDescribe(Tag<ArithmeticException>, ClassBuilder<ArithmeticException> &);
  };

  class TESSERA_CATALOG_STANDARD_API IllegalArgumentException : public Exception
  {
  public:
    using Exception::Exception;
    friend void TesseraDescribe(Tag<IllegalArgumentException>, ClassBuilder<IllegalArgumentException> &);
  };

  class TESSERA_CATALOG_STANDARD_API IllegalStateException final : public Exception
  {
  public:
    using Exception::Exception;
    friend void TesseraDescribe(Tag<IllegalStateException>, ClassBuilder<IllegalStateException> &);
  };

  class TESSERA_CATALOG_STANDARD_API NumberFormatException final : public IllegalArgumentException
  {
  public:
    using IllegalArgumentException::IllegalArgumentException;
    friend void TesseraDescribe(Tag<NumberFormatException>, ClassBuilder<NumberFormatException> &);
  };

  // Shorthand for host callables reporting a script-visible failure.
  [[nodiscard]] TESSERA_CATALOG_STANDARD_API Error HostError(std::string_view exceptionClass, std::string_view message);

  // Shortest round-trip text with a fractional part ("1.0", "NaN", "-Infinity").
  [[nodiscard]] TESSERA_CATALOG_STANDARD_API std::string FormatFloating(float value);
  [[nodiscard]] TESSERA_CATALOG_STANDARD_API std::string FormatFloating(double value);

  template <class V>
  std::shared_ptr<String> NumberBox<V>::ToString() const
  {
    if constexpr (std::is_floating_point_v<V>)
      return String::Make(FormatFloating(m_value));
    else
      return String::Make(fmt::format("{}", m_value));
  }

} // namespace Tessera::Catalog::Standard
