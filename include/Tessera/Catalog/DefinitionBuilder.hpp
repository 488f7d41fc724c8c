// DefinitionBuilder.hpp
// Single-threaded, one-pass construction of a Definition. Phases run in order:
// structs, members, inheritance copy-down, casts, runtime-class enrolment.
#pragma once

#include <NGIN/Primitives.hpp>

#include <Tessera/Catalog/Definition.hpp>
#include <Tessera/Catalog/Export.hpp>
#include <Tessera/Catalog/Host.hpp>
#include <Tessera/Catalog/Types.hpp>

#include <expected>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <string_view>

namespace Tessera::Catalog
{

  class TESSERA_CATALOG_API DefinitionBuilder
  {
  public:
    enum class Phase : NGIN::UInt8
    {
      Structs = 0,
      Members = 1,
      Inheritance = 2,
      Casts = 3,
      RuntimeClasses = 4,
    };

    // The binder must be fully populated; it is kept alive by the resulting definition.
    explicit DefinitionBuilder(std::shared_ptr<const NativeBinder> binder, DefinitionOptions options = {});

    // TypeRegistry
    std::expected<void, Error> AddStruct(std::string_view name, ClassId nativeClass);
    // Resolves the native class through the binder's class-by-name lookup.
    std::expected<void, Error> AddStructByClassName(std::string_view name, std::string_view hostClassName);

    [[nodiscard]] std::expected<Type, Error> GetType(std::string_view name) const;
    [[nodiscard]] std::expected<Type, Error> GetType(std::string_view structName, NGIN::UInt32 dimensions) const;

    // Binder. An empty generic argument list means "same as declared".
    std::expected<void, Error> AddConstructor(std::string_view owner, std::string_view name,
                                              std::span<const Type> arguments,
                                              std::span<const Type> genericArguments = {});
    std::expected<void, Error> AddMethod(std::string_view owner, std::string_view name, std::string_view alias,
                                         bool isStatic, const Type &returnType, std::span<const Type> arguments,
                                         const std::optional<Type> &genericReturn = std::nullopt,
                                         std::span<const Type> genericArguments = {});
    std::expected<void, Error> AddField(std::string_view owner, std::string_view name, std::string_view alias,
                                        bool isStatic, const Type &type,
                                        const std::optional<Type> &generic = std::nullopt);

    // InheritanceResolver
    std::expected<void, Error> CopyStruct(std::string_view owner, std::span<const std::string_view> parents);
    std::expected<void, Error> CopyStruct(std::string_view owner, std::initializer_list<std::string_view> parents)
    {
      return CopyStruct(owner, std::span<const std::string_view>{parents.begin(), parents.size()});
    }

    // CastTable
    std::expected<void, Error> AddTransform(const Type &from, const Type &to, bool isExplicit);
    std::expected<void, Error> AddTransform(const Type &from, const Type &to, std::string_view owner,
                                            std::string_view adapterName, bool isStatic, bool isExplicit);

    // DynamicDispatchIndex
    std::expected<void, Error> AddRuntimeClass(std::string_view structName);

    [[nodiscard]] Phase CurrentPhase() const noexcept { return m_phase; }
    [[nodiscard]] const std::optional<Error> &FirstError() const noexcept { return m_failure; }

    // Consumes the builder. Returns the first recorded failure if any operation failed.
    [[nodiscard]] std::expected<std::shared_ptr<const Definition>, Error> Build() &&;

  private:
    [[nodiscard]] std::expected<void, Error> Enter(Phase phase, std::string_view operation);
    std::expected<void, Error> Fail(Error error);

    [[nodiscard]] Struct *FindStruct(std::string_view name);
    [[nodiscard]] std::expected<Struct *, Error> RequireStruct(std::string_view name, std::string_view role);
    [[nodiscard]] std::expected<void, Error> CheckGenerics(std::string_view what, std::span<const Type> arguments,
                                                           std::span<const Type> genericArguments) const;
    [[nodiscard]] std::expected<void, Error> CopyFrom(Struct &owner, const Struct &parent);
    NameId Intern(std::string_view s);

    detail::DefinitionState m_state;
    Phase m_phase{Phase::Structs};
    std::optional<Error> m_failure;
  };

} // namespace Tessera::Catalog
