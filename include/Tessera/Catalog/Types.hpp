// Types.hpp
// Public-facing error codes, the runtime value box and small id types
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Utilities/Any.hpp>

#include <Tessera/Catalog/Export.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <utility>

namespace Tessera::Catalog
{

  using Any = NGIN::Utilities::Any<>;
  using NameId = NGIN::UInt32;

  // Native class handle. The top byte holds the array dimension count, the
  // low 56 bits identify the component class.
  using ClassId = NGIN::UInt64;

  inline constexpr ClassId InvalidClassId = 0;
  inline constexpr NGIN::UInt32 MaxArrayDimensions = 255;

  enum class ErrorCode : unsigned
  {
    NotFound = 1,
    InvalidArgument = 2,
    InvalidName = 3,
    DuplicateStruct = 4,
    DuplicateOverload = 5,
    DuplicateField = 6,
    DuplicateCast = 7,
    TypeMismatch = 8,
    Binding = 9,
    Coercion = 10,
    NoSuchMember = 11,
    HostFailure = 12,
  };

  [[nodiscard]] TESSERA_CATALOG_API std::string_view ErrorCodeName(ErrorCode code) noexcept;

  struct Error
  {
    ErrorCode code{ErrorCode::InvalidArgument};
    std::string message{};

    Error() = default;
    Error(ErrorCode c, std::string m) : code(c), message(std::move(m)) {}
  };

} // namespace Tessera::Catalog
