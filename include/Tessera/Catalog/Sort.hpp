// Sort.hpp
// Canonical value categories and their fixed attributes
#pragma once

#include <NGIN/Primitives.hpp>

#include <array>
#include <string_view>

namespace Tessera::Catalog
{

  enum class Sort : NGIN::UInt8
  {
    Void,
    Bool,
    Byte,
    Short,
    Char,
    Int,
    Long,
    Float,
    Double,

    VoidObj,
    BoolObj,
    ByteObj,
    ShortObj,
    CharObj,
    IntObj,
    LongObj,
    FloatObj,
    DoubleObj,

    Number,
    String,

    Object,
    Dynamic,
    Array,
  };

  inline constexpr NGIN::UIntSize SortCount = static_cast<NGIN::UIntSize>(Sort::Array) + 1;

  struct SortInfo
  {
    std::string_view name;
    NGIN::UInt8 size{0};
    bool primitive{false};
    bool boolean{false};
    bool numeric{false};
    bool constant{false};
    // False for the sorts whose native class depends on the struct (Object, Dynamic, Array).
    bool fixedClass{true};
  };

  namespace detail
  {
    inline constexpr std::array<SortInfo, SortCount> SortTable{{
        {"void", 0, true, false, false, false, true},
        {"bool", 1, true, true, false, true, true},
        {"byte", 1, true, false, true, true, true},
        {"short", 1, true, false, true, true, true},
        {"char", 1, true, false, true, true, true},
        {"int", 1, true, false, true, true, true},
        {"long", 2, true, false, true, true, true},
        {"float", 1, true, false, true, true, true},
        {"double", 2, true, false, true, true, true},

        {"Void", 1, true, false, false, false, true},
        {"Bool", 1, false, true, false, false, true},
        {"Byte", 1, false, false, true, false, true},
        {"Short", 1, false, false, true, false, true},
        {"Char", 1, false, false, true, false, true},
        {"Int", 1, false, false, true, false, true},
        {"Long", 1, false, false, true, false, true},
        {"Float", 1, false, false, true, false, true},
        {"Double", 1, false, false, true, false, true},

        {"Number", 1, false, false, false, false, true},
        {"String", 1, false, false, false, true, true},

        {"Object", 1, false, false, false, false, false},
        {"Dynamic", 1, false, false, false, false, false},
        {"Array", 1, false, false, false, false, false},
    }};
  } // namespace detail

  [[nodiscard]] constexpr const SortInfo &GetSortInfo(Sort sort) noexcept
  {
    return detail::SortTable[static_cast<NGIN::UIntSize>(sort)];
  }

  [[nodiscard]] constexpr bool IsPrimitive(Sort sort) noexcept { return GetSortInfo(sort).primitive; }
  [[nodiscard]] constexpr bool IsNumeric(Sort sort) noexcept { return GetSortInfo(sort).numeric; }

} // namespace Tessera::Catalog
