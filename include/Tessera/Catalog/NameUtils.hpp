// NameUtils.hpp
// Identifier grammars and bean-style property names.
#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace Tessera::Catalog
{

  namespace detail
  {
    constexpr bool IsIdentStart(char c) noexcept
    {
      return c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
    }

    constexpr bool IsIdentPart(char c) noexcept { return IsIdentStart(c) || (c >= '0' && c <= '9'); }

    constexpr bool IsUpper(char c) noexcept { return c >= 'A' && c <= 'Z'; }

    constexpr char ToLower(char c) noexcept { return IsUpper(c) ? static_cast<char>(c - 'A' + 'a') : c; }
  } // namespace detail

  // [_a-zA-Z][<>,_a-zA-Z0-9]*  (generic instantiations such as "List<String>" are struct names)
  [[nodiscard]] constexpr bool IsValidStructName(std::string_view name) noexcept
  {
    if (name.empty() || !detail::IsIdentStart(name.front()))
      return false;
    for (auto i = std::size_t{1}; i < name.size(); ++i)
    {
      const char c = name[i];
      if (!detail::IsIdentPart(c) && c != '<' && c != '>' && c != ',')
        return false;
    }
    return true;
  }

  // [_a-zA-Z][_a-zA-Z0-9]*
  [[nodiscard]] constexpr bool IsValidMemberName(std::string_view name) noexcept
  {
    if (name.empty() || !detail::IsIdentStart(name.front()))
      return false;
    for (auto i = std::size_t{1}; i < name.size(); ++i)
    {
      if (!detail::IsIdentPart(name[i]))
        return false;
    }
    return true;
  }

  // "getFoo"/"isFoo" -> "foo"; nullopt when the name is not a getter name.
  [[nodiscard]] inline std::optional<std::string> GetterProperty(std::string_view methodName)
  {
    std::string_view rest{};
    if (methodName.size() > 3 && methodName.starts_with("get"))
      rest = methodName.substr(3);
    else if (methodName.size() > 2 && methodName.starts_with("is"))
      rest = methodName.substr(2);
    if (rest.empty() || !detail::IsUpper(rest.front()))
      return std::nullopt;
    std::string property{rest};
    property.front() = detail::ToLower(property.front());
    return property;
  }

  // "setFoo" -> "foo"
  [[nodiscard]] inline std::optional<std::string> SetterProperty(std::string_view methodName)
  {
    if (methodName.size() <= 3 || !methodName.starts_with("set") || !detail::IsUpper(methodName[3]))
      return std::nullopt;
    std::string property{methodName.substr(3)};
    property.front() = detail::ToLower(property.front());
    return property;
  }

} // namespace Tessera::Catalog
