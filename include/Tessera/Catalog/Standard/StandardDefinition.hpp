// StandardDefinition.hpp
// The standard whitelist: host classes, members, inheritance, casts and runtime classes.
#pragma once

#include <Tessera/Catalog/Definition.hpp>
#include <Tessera/Catalog/HostRegistry.hpp>
#include <Tessera/Catalog/Standard/Export.hpp>

#include <expected>
#include <memory>

namespace Tessera::Catalog::Standard
{

  struct StandardOptions
  {
    // Registers the FeatureTest struct and enrols it as a runtime class.
    bool includeFeatureTest{true};
    DefinitionOptions definition{.interfaceRootFallback = true};
  };

  // Registers every standard host class with the registry.
  TESSERA_CATALOG_STANDARD_API void RegisterStandardHost(HostRegistry &registry);

  // Builds a fresh definition over a new registry populated by RegisterStandardHost.
  [[nodiscard]] TESSERA_CATALOG_STANDARD_API std::expected<std::shared_ptr<const Definition>, Error>
  BuildStandardDefinition(const StandardOptions &options = {});

  // Process-wide definition built once with default options; safe to share between threads.
  [[nodiscard]] TESSERA_CATALOG_STANDARD_API const std::expected<std::shared_ptr<const Definition>, Error> &
  StandardDefinition();

} // namespace Tessera::Catalog::Standard
