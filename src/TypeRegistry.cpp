#include <Tessera/Catalog/DefinitionBuilder.hpp>
#include <Tessera/Catalog/NameUtils.hpp>

#include <fmt/format.h>

#include <utility>

namespace Tessera::Catalog
{

  namespace
  {
    constexpr std::string_view PhaseName(DefinitionBuilder::Phase phase) noexcept
    {
      switch (phase)
      {
      case DefinitionBuilder::Phase::Structs:
        return "struct registration";
      case DefinitionBuilder::Phase::Members:
        return "member binding";
      case DefinitionBuilder::Phase::Inheritance:
        return "inheritance copy";
      case DefinitionBuilder::Phase::Casts:
        return "cast registration";
      case DefinitionBuilder::Phase::RuntimeClasses:
        return "runtime class enrolment";
      }
      return "unknown";
    }

    // Build() moves the state out of the builder.
    Error AlreadyBuilt() { return Error{ErrorCode::InvalidArgument, "definition builder was already built"}; }
  } // namespace

  namespace detail
  {
    const Struct *FindStruct(const DefinitionState &state, std::string_view name)
    {
      StringInterner::IdType id{};
      if (!state.names->TryGetId(name, id))
        return nullptr;
      if (const auto *p = state.structIndex.GetPtr(static_cast<NameId>(id)))
        return &state.structs[*p];
      return nullptr;
    }

    std::expected<Type, Error> MakeType(const DefinitionState &state, const Struct &owner, NGIN::UInt32 dimensions)
    {
      if (dimensions > MaxArrayDimensions)
        return std::unexpected(Error{ErrorCode::InvalidArgument,
                                     fmt::format("type [{}] has {} dimensions, at most {} are allowed", owner.name,
                                                 dimensions, MaxArrayDimensions)});
      if (dimensions > 0)
      {
        auto clazz = state.binder->ArrayClass(owner.clazz, dimensions);
        if (!clazz)
          return std::unexpected(std::move(clazz.error()));
        std::string name{owner.name};
        for (auto d = NGIN::UInt32{0}; d < dimensions; ++d)
          name += "[]";
        std::string descriptor(dimensions, '[');
        descriptor += owner.descriptor;
        return Type{std::move(name), dimensions, owner.index, *clazz, std::move(descriptor), Sort::Array};
      }

      Sort sort = Sort::Object;
      if (owner.name == state.options.dynamicTypeName)
      {
        sort = Sort::Dynamic;
      }
      else
      {
        for (auto i = NGIN::UIntSize{0}; i < SortCount; ++i)
        {
          const auto candidate = static_cast<Sort>(i);
          if (!GetSortInfo(candidate).fixedClass)
            continue;
          if (const auto clazz = state.binder->ClassForSort(candidate); clazz && *clazz == owner.clazz)
          {
            sort = candidate;
            break;
          }
        }
      }
      return Type{std::string{owner.name}, 0, owner.index, owner.clazz, owner.descriptor, sort};
    }

    std::expected<Type, Error> ResolveTypeName(const DefinitionState &state, std::string_view name)
    {
      auto base = name;
      NGIN::UInt32 dimensions = 0;
      if (const auto bracket = name.find('['); bracket != std::string_view::npos)
      {
        const auto suffix = name.substr(bracket);
        bool valid = suffix.size() % 2 == 0;
        for (auto i = std::size_t{0}; valid && i < suffix.size(); i += 2)
          valid = suffix[i] == '[' && suffix[i + 1] == ']';
        if (!valid)
          return std::unexpected(Error{ErrorCode::NotFound, fmt::format("invalid array braces in type [{}]", name)});
        base = name.substr(0, bracket);
        dimensions = static_cast<NGIN::UInt32>(suffix.size() / 2);
      }
      const auto *owner = FindStruct(state, base);
      if (!owner)
        return std::unexpected(Error{ErrorCode::NotFound, fmt::format("type [{}] is not defined", name)});
      return MakeType(state, *owner, dimensions);
    }
  } // namespace detail

  DefinitionBuilder::DefinitionBuilder(std::shared_ptr<const NativeBinder> binder, DefinitionOptions options)
  {
    m_state.binder = std::move(binder);
    m_state.options = std::move(options);
  }

  NameId DefinitionBuilder::Intern(std::string_view s)
  {
    return static_cast<NameId>(m_state.names->InsertOrGet(s));
  }

  std::expected<void, Error> DefinitionBuilder::Fail(Error error)
  {
    if (!m_failure)
      m_failure = error;
    return std::unexpected(std::move(error));
  }

  std::expected<void, Error> DefinitionBuilder::Enter(Phase phase, std::string_view operation)
  {
    if (m_failure)
      return std::unexpected(Error{m_failure->code, fmt::format("{} rejected, the build already failed: {}", operation,
                                                                m_failure->message)});
    if (!m_state.names)
      return std::unexpected(AlreadyBuilt());
    if (!m_state.binder)
      return Fail(Error{ErrorCode::InvalidArgument, "definition builder has no native binder"});
    if (phase < m_phase)
      return Fail(Error{ErrorCode::InvalidArgument, fmt::format("{} belongs to {} and cannot run after {} has started",
                                                                operation, PhaseName(phase), PhaseName(m_phase))});
    m_phase = phase;
    return {};
  }

  Struct *DefinitionBuilder::FindStruct(std::string_view name)
  {
    return const_cast<Struct *>(detail::FindStruct(m_state, name));
  }

  std::expected<Struct *, Error> DefinitionBuilder::RequireStruct(std::string_view name, std::string_view role)
  {
    if (auto *s = FindStruct(name))
      return s;
    return std::unexpected(Error{ErrorCode::NotFound, fmt::format("{} struct [{}] is not defined", role, name)});
  }

  std::expected<void, Error> DefinitionBuilder::AddStruct(std::string_view name, ClassId nativeClass)
  {
    if (auto entered = Enter(Phase::Structs, "AddStruct"); !entered)
      return entered;
    if (!IsValidStructName(name))
      return Fail(Error{ErrorCode::InvalidName, fmt::format("invalid struct name [{}]", name)});
    if (FindStruct(name))
      return Fail(Error{ErrorCode::DuplicateStruct, fmt::format("duplicate struct name [{}]", name)});
    if (m_state.structs.Size() >= MaxStructs)
      return Fail(Error{ErrorCode::InvalidArgument, fmt::format("too many structs, cannot add [{}]", name)});
    if (detail::DimensionsOf(nativeClass) != 0)
      return Fail(Error{ErrorCode::InvalidArgument, fmt::format("struct [{}] cannot wrap an array class", name)});

    auto descriptor = m_state.binder->Descriptor(nativeClass);
    if (descriptor.empty())
      return Fail(Error{ErrorCode::Binding, fmt::format("native class for struct [{}] is unknown to the host", name)});

    Struct s{};
    s.nameId = Intern(name);
    s.name = m_state.names->View(static_cast<detail::StringInterner::IdType>(s.nameId));
    s.index = static_cast<NGIN::UInt32>(m_state.structs.Size());
    s.clazz = nativeClass;
    s.descriptor = std::move(descriptor);
    const auto nameId = s.nameId;
    const auto index = s.index;
    m_state.structs.PushBack(std::move(s));
    m_state.structIndex.Insert(nameId, index);
    return {};
  }

  std::expected<void, Error> DefinitionBuilder::AddStructByClassName(std::string_view name,
                                                                     std::string_view hostClassName)
  {
    if (auto entered = Enter(Phase::Structs, "AddStruct"); !entered)
      return entered;
    const auto clazz = m_state.binder->FindClass(hostClassName);
    if (!clazz)
      return Fail(Error{ErrorCode::Binding,
                        fmt::format("host class [{}] for struct [{}] not found", hostClassName, name)});
    return AddStruct(name, *clazz);
  }

  std::expected<Type, Error> DefinitionBuilder::GetType(std::string_view name) const
  {
    if (!m_state.names)
      return std::unexpected(AlreadyBuilt());
    return detail::ResolveTypeName(m_state, name);
  }

  std::expected<Type, Error> DefinitionBuilder::GetType(std::string_view structName, NGIN::UInt32 dimensions) const
  {
    if (!m_state.names)
      return std::unexpected(AlreadyBuilt());
    const auto *owner = detail::FindStruct(m_state, structName);
    if (!owner)
      return std::unexpected(Error{ErrorCode::NotFound, fmt::format("type [{}] is not defined", structName)});
    return detail::MakeType(m_state, *owner, dimensions);
  }

} // namespace Tessera::Catalog
