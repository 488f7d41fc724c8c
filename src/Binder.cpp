#include <Tessera/Catalog/DefinitionBuilder.hpp>
#include <Tessera/Catalog/NameUtils.hpp>

#include <fmt/format.h>

#include <utility>
#include <vector>

namespace Tessera::Catalog
{

  namespace
  {
    std::vector<ClassId> NativeClasses(std::span<const Type> types)
    {
      std::vector<ClassId> out;
      out.reserve(types.size());
      for (const auto &t : types)
        out.push_back(t.Class());
      return out;
    }

    NGIN::Containers::Vector<Type> CopyTypes(std::span<const Type> types)
    {
      NGIN::Containers::Vector<Type> out;
      out.Reserve(types.size());
      for (const auto &t : types)
        out.PushBack(t);
      return out;
    }

    std::string Signature(std::string_view owner, std::string_view name, NGIN::UIntSize arity)
    {
      return fmt::format("{}.{}/{}", owner, name, arity);
    }
  } // namespace

  std::expected<void, Error> DefinitionBuilder::CheckGenerics(std::string_view what, std::span<const Type> arguments,
                                                              std::span<const Type> genericArguments) const
  {
    if (genericArguments.empty())
      return {};
    if (genericArguments.size() != arguments.size())
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   fmt::format("generic argument count {} does not match argument count {} for [{}]",
                                               genericArguments.size(), arguments.size(), what)});
    for (auto i = std::size_t{0}; i < arguments.size(); ++i)
    {
      if (!m_state.binder->IsAssignableFrom(arguments[i].Class(), genericArguments[i].Class()))
        return std::unexpected(Error{ErrorCode::TypeMismatch,
                                     fmt::format("generic argument [{}] is not a sub type of [{}] in [{}]",
                                                 genericArguments[i].Name(), arguments[i].Name(), what)});
    }
    return {};
  }

  std::expected<void, Error> DefinitionBuilder::AddConstructor(std::string_view ownerName, std::string_view name,
                                                               std::span<const Type> arguments,
                                                               std::span<const Type> genericArguments)
  {
    if (auto entered = Enter(Phase::Members, "AddConstructor"); !entered)
      return entered;
    auto found = RequireStruct(ownerName, "owner");
    if (!found)
      return Fail(std::move(found.error()));
    Struct &owner = **found;

    if (!IsValidMemberName(name))
      return Fail(Error{ErrorCode::InvalidName,
                        fmt::format("invalid constructor name [{}] with the struct [{}]", name, owner.name)});

    const auto nameId = Intern(name);
    const auto key = detail::PackMethodKey(nameId, static_cast<NGIN::UInt32>(arguments.size()));
    const auto signature = Signature(owner.name, name, arguments.size());
    if (owner.constructorIndex.GetPtr(key))
      return Fail(Error{ErrorCode::DuplicateOverload, fmt::format("duplicate constructor [{}]", signature)});
    if (owner.staticMethodIndex.GetPtr(key))
      return Fail(Error{ErrorCode::DuplicateOverload,
                        fmt::format("constructors and static methods may not share the key [{}]", signature)});
    if (owner.methodIndex.GetPtr(key))
      return Fail(Error{ErrorCode::DuplicateOverload,
                        fmt::format("constructors and methods may not share the key [{}]", signature)});

    if (auto generics = CheckGenerics(signature, arguments, genericArguments); !generics)
      return Fail(std::move(generics.error()));

    const auto classes = NativeClasses(arguments);
    auto native = m_state.binder->FindConstructor(owner.clazz, classes);
    if (!native)
      return Fail(Error{ErrorCode::Binding, fmt::format("constructor [{}] not found in the host: {}", signature,
                                                        native.error().message)});

    Constructor c{};
    c.name = m_state.names->View(static_cast<detail::StringInterner::IdType>(nameId));
    c.owner = owner.index;
    c.arguments = CopyTypes(genericArguments.empty() ? arguments : genericArguments);
    c.native = *native;
    owner.constructors.PushBack(std::move(c));
    owner.constructorIndex.Insert(key, static_cast<NGIN::UInt32>(owner.constructors.Size() - 1));
    return {};
  }

  std::expected<void, Error> DefinitionBuilder::AddMethod(std::string_view ownerName, std::string_view name,
                                                          std::string_view alias, bool isStatic,
                                                          const Type &returnType, std::span<const Type> arguments,
                                                          const std::optional<Type> &genericReturn,
                                                          std::span<const Type> genericArguments)
  {
    if (auto entered = Enter(Phase::Members, "AddMethod"); !entered)
      return entered;
    auto found = RequireStruct(ownerName, "owner");
    if (!found)
      return Fail(std::move(found.error()));
    Struct &owner = **found;

    if (!IsValidMemberName(name))
      return Fail(Error{ErrorCode::InvalidName,
                        fmt::format("invalid method name [{}] with the struct [{}]", name, owner.name)});

    const auto nameId = Intern(name);
    const auto key = detail::PackMethodKey(nameId, static_cast<NGIN::UInt32>(arguments.size()));
    const auto signature = Signature(owner.name, name, arguments.size());
    auto &own = isStatic ? owner.staticMethodIndex : owner.methodIndex;
    auto &other = isStatic ? owner.methodIndex : owner.staticMethodIndex;
    if (own.GetPtr(key))
      return Fail(Error{ErrorCode::DuplicateOverload,
                        fmt::format("duplicate {} method [{}]", isStatic ? "static" : "instance", signature)});
    if (owner.constructorIndex.GetPtr(key))
      return Fail(Error{ErrorCode::DuplicateOverload,
                        fmt::format("constructors and methods may not share the key [{}]", signature)});
    if (other.GetPtr(key))
      return Fail(Error{ErrorCode::DuplicateOverload,
                        fmt::format("static and instance methods may not share the key [{}]", signature)});

    if (genericReturn && !m_state.binder->IsAssignableFrom(returnType.Class(), genericReturn->Class()))
      return Fail(Error{ErrorCode::TypeMismatch, fmt::format("generic return [{}] is not a sub type of [{}] in [{}]",
                                                             genericReturn->Name(), returnType.Name(), signature)});
    if (auto generics = CheckGenerics(signature, arguments, genericArguments); !generics)
      return Fail(std::move(generics.error()));

    const auto nativeName = alias.empty() ? name : alias;
    const auto classes = NativeClasses(arguments);
    auto native = m_state.binder->FindMethod(owner.clazz, nativeName, classes);
    if (!native)
      return Fail(Error{ErrorCode::Binding, fmt::format("method [{}] not found in the host: {}", signature,
                                                        native.error().message)});
    const NativeMethod *bound = *native;
    if (bound->returnClass != returnType.Class())
      return Fail(Error{ErrorCode::Binding,
                        fmt::format("return type [{}] of method [{}] does not match the host return type [{}]",
                                    returnType.Name(), signature, m_state.binder->ClassName(bound->returnClass))});
    if (bound->isStatic != isStatic)
      return Fail(Error{ErrorCode::Binding, fmt::format("method [{}] is declared {} but the host method is {}", signature,
                                                        isStatic ? "static" : "instance",
                                                        bound->isStatic ? "static" : "instance")});

    Method m{};
    m.name = m_state.names->View(static_cast<detail::StringInterner::IdType>(nameId));
    m.owner = owner.index;
    m.returnType = genericReturn.value_or(returnType);
    m.arguments = CopyTypes(genericArguments.empty() ? arguments : genericArguments);
    m.native = bound;
    m.isStatic = isStatic;
    auto &methods = isStatic ? owner.staticMethods : owner.methods;
    methods.PushBack(std::move(m));
    own.Insert(key, static_cast<NGIN::UInt32>(methods.Size() - 1));
    return {};
  }

  std::expected<void, Error> DefinitionBuilder::AddField(std::string_view ownerName, std::string_view name,
                                                         std::string_view alias, bool isStatic, const Type &type,
                                                         const std::optional<Type> &generic)
  {
    if (auto entered = Enter(Phase::Members, "AddField"); !entered)
      return entered;
    auto found = RequireStruct(ownerName, "owner");
    if (!found)
      return Fail(std::move(found.error()));
    Struct &owner = **found;

    if (!IsValidMemberName(name))
      return Fail(Error{ErrorCode::InvalidName,
                        fmt::format("invalid field name [{}] with the struct [{}]", name, owner.name)});

    const auto nameId = Intern(name);
    auto &own = isStatic ? owner.staticMemberIndex : owner.memberIndex;
    auto &other = isStatic ? owner.memberIndex : owner.staticMemberIndex;
    if (own.GetPtr(nameId))
      return Fail(Error{ErrorCode::DuplicateField, fmt::format("duplicate {} field [{}.{}]",
                                                               isStatic ? "static" : "instance", owner.name, name)});
    if (other.GetPtr(nameId))
      return Fail(Error{ErrorCode::DuplicateField,
                        fmt::format("static and instance fields may not share the name [{}.{}]", owner.name, name)});

    if (generic && !m_state.binder->IsAssignableFrom(type.Class(), generic->Class()))
      return Fail(Error{ErrorCode::TypeMismatch, fmt::format("generic type [{}] is not a sub type of [{}] for [{}.{}]",
                                                             generic->Name(), type.Name(), owner.name, name)});

    const auto nativeName = alias.empty() ? name : alias;
    auto native = m_state.binder->FindField(owner.clazz, nativeName);
    if (!native)
      return Fail(Error{ErrorCode::Binding, fmt::format("field [{}.{}] not found in the host: {}", owner.name, name,
                                                        native.error().message)});
    const NativeField *bound = *native;
    if (bound->typeClass != type.Class())
      return Fail(Error{ErrorCode::Binding,
                        fmt::format("type [{}] of field [{}.{}] does not match the host field type [{}]", type.Name(),
                                    owner.name, name, m_state.binder->ClassName(bound->typeClass))});
    if (isStatic && !bound->isStatic)
      return Fail(Error{ErrorCode::Binding,
                        fmt::format("field [{}.{}] is declared static but the host field is not", owner.name, name)});
    if (isStatic && !bound->isFinal)
      return Fail(Error{ErrorCode::Binding,
                        fmt::format("static field [{}.{}] must be final in the host", owner.name, name)});
    if (!isStatic && bound->isStatic)
      return Fail(Error{ErrorCode::Binding,
                        fmt::format("field [{}.{}] is declared instance but the host field is static", owner.name, name)});

    Field f{};
    f.name = m_state.names->View(static_cast<detail::StringInterner::IdType>(nameId));
    f.owner = owner.index;
    f.type = type;
    f.generic = generic.value_or(type);
    f.native = bound;
    f.isStatic = isStatic;
    auto &fields = isStatic ? owner.staticMembers : owner.members;
    fields.PushBack(std::move(f));
    own.Insert(nameId, static_cast<NGIN::UInt32>(fields.Size() - 1));
    return {};
  }

} // namespace Tessera::Catalog
