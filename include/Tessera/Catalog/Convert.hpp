// Convert.hpp
// Any -> T conversion used by the host invokers.
#pragma once

#include <NGIN/Primitives.hpp>

#include <Tessera/Catalog/Host.hpp>
#include <Tessera/Catalog/Numeric.hpp>
#include <Tessera/Catalog/Types.hpp>

#include <expected>
#include <memory>
#include <type_traits>

namespace Tessera::Catalog::detail
{

  template <class T>
  inline constexpr bool is_numeric_v = std::is_arithmetic_v<std::remove_cv_t<std::remove_reference_t<T>>>;

  template <class T>
  struct IsHostRef : std::false_type
  {
  };
  template <class U>
  struct IsHostRef<std::shared_ptr<U>> : std::bool_constant<std::is_base_of_v<HostObject, std::remove_cv_t<U>>>
  {
  };

  // Exact match, arithmetic conversion with script semantics (NumericCast), or reference downcast.
  template <class To>
  inline std::expected<std::remove_cv_t<std::remove_reference_t<To>>, Error>
  ConvertAny(const Any &src)
  {
    using Dest = std::remove_cv_t<std::remove_reference_t<To>>;
    const auto tid = src.GetTypeId();
    if (tid == TypeIdOf<Dest>())
    {
      return src.template Cast<Dest>();
    }
    if constexpr (IsHostRef<Dest>::value)
    {
      using Pointee = typename Dest::element_type;
      if (tid == TypeIdOf<Ref>())
      {
        const auto &ref = src.template Cast<Ref>();
        if (!ref)
          return Dest{};
        if (auto cast = std::dynamic_pointer_cast<Pointee>(ref))
          return cast;
        return std::unexpected(Error{ErrorCode::InvalidArgument, "reference is not of the expected class"});
      }
    }
    if constexpr (is_numeric_v<Dest>)
    {
      if (tid == TypeIdOf<bool>())
        return NumericCast<Dest>(src.template Cast<bool>());
      if (tid == TypeIdOf<signed char>())
        return NumericCast<Dest>(src.template Cast<signed char>());
      if (tid == TypeIdOf<unsigned char>())
        return NumericCast<Dest>(src.template Cast<unsigned char>());
      if (tid == TypeIdOf<char>())
        return NumericCast<Dest>(src.template Cast<char>());
      if (tid == TypeIdOf<char16_t>())
        return NumericCast<Dest>(src.template Cast<char16_t>());
      if (tid == TypeIdOf<short>())
        return NumericCast<Dest>(src.template Cast<short>());
      if (tid == TypeIdOf<unsigned short>())
        return NumericCast<Dest>(src.template Cast<unsigned short>());
      if (tid == TypeIdOf<int>())
        return NumericCast<Dest>(src.template Cast<int>());
      if (tid == TypeIdOf<unsigned int>())
        return NumericCast<Dest>(src.template Cast<unsigned int>());
      if (tid == TypeIdOf<long>())
        return NumericCast<Dest>(src.template Cast<long>());
      if (tid == TypeIdOf<unsigned long>())
        return NumericCast<Dest>(src.template Cast<unsigned long>());
      if (tid == TypeIdOf<long long>())
        return NumericCast<Dest>(src.template Cast<long long>());
      if (tid == TypeIdOf<unsigned long long>())
        return NumericCast<Dest>(src.template Cast<unsigned long long>());
      if (tid == TypeIdOf<float>())
        return NumericCast<Dest>(src.template Cast<float>());
      if (tid == TypeIdOf<double>())
        return NumericCast<Dest>(src.template Cast<double>());
    }
    return std::unexpected(Error{ErrorCode::InvalidArgument, "argument type not convertible"});
  }

  // Normalizes a host return value: references are boxed as Ref, everything else by value.
  template <class R>
  inline Any BoxResult(R &&value)
  {
    using U = std::remove_cvref_t<R>;
    if constexpr (IsHostRef<U>::value)
      return Any{Ref{std::forward<R>(value)}};
    else
      return Any{std::forward<R>(value)};
  }

} // namespace Tessera::Catalog::detail
