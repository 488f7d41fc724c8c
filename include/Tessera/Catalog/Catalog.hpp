#pragma once

#include <string_view>

#include <Tessera/Catalog/Export.hpp>
#include <Tessera/Catalog/Types.hpp>
#include <Tessera/Catalog/Sort.hpp>
#include <Tessera/Catalog/NameUtils.hpp>
#include <Tessera/Catalog/HostRegistry.hpp>
#include <Tessera/Catalog/ClassBuilder.hpp>
#include <Tessera/Catalog/Definition.hpp>
#include <Tessera/Catalog/DefinitionBuilder.hpp>

namespace Tessera::Catalog
{

  // For quick sanity checks / examples.
  [[nodiscard]] constexpr std::string_view LibraryName() noexcept { return "Tessera.Catalog"; }

} // namespace Tessera::Catalog
