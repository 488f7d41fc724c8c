// Numeric.hpp
// Script-language numeric conversions between the primitive value types.
#pragma once

#include <Tessera/Catalog/Sort.hpp>

#include <cstdint>
#include <limits>
#include <type_traits>

namespace Tessera::Catalog
{

  namespace detail
  {
    // Floating to integral saturates to the int (or long) range, NaN becomes zero.
    template <class I, class F>
    constexpr I SaturatingTruncate(F value) noexcept
    {
      if (value != value)
        return 0;
      if (value <= static_cast<F>(std::numeric_limits<I>::min()))
        return std::numeric_limits<I>::min();
      if (value >= static_cast<F>(std::numeric_limits<I>::max()))
        return std::numeric_limits<I>::max();
      return static_cast<I>(value);
    }
  } // namespace detail

  // Primitive cast with the scripting language's semantics: integral narrowing keeps the
  // low bits, floating to integral saturates through int (or long for 64-bit targets).
  template <class To, class From>
  constexpr To NumericCast(From value) noexcept
  {
    if constexpr (std::is_floating_point_v<From> && std::is_integral_v<To> && !std::is_same_v<To, bool>)
    {
      if constexpr (sizeof(To) == 8)
        return static_cast<To>(detail::SaturatingTruncate<std::int64_t>(value));
      else
        return static_cast<To>(detail::SaturatingTruncate<std::int32_t>(value));
    }
    else
    {
      return static_cast<To>(value);
    }
  }

  // Widening primitive conversions: byte->short->int->long->float->double and char->int.
  [[nodiscard]] constexpr bool IsWideningConversion(Sort from, Sort to) noexcept
  {
    switch (from)
    {
    case Sort::Byte:
      return to == Sort::Short || to == Sort::Int || to == Sort::Long || to == Sort::Float || to == Sort::Double;
    case Sort::Short:
    case Sort::Char:
      return to == Sort::Int || to == Sort::Long || to == Sort::Float || to == Sort::Double;
    case Sort::Int:
      return to == Sort::Long || to == Sort::Float || to == Sort::Double;
    case Sort::Long:
      return to == Sort::Float || to == Sort::Double;
    case Sort::Float:
      return to == Sort::Double;
    default:
      return false;
    }
  }

} // namespace Tessera::Catalog
