#include <Tessera/Catalog/DefinitionBuilder.hpp>

#include <NGIN/Hashing/FNV.hpp>

#include <fmt/format.h>

#include <utility>

namespace Tessera::Catalog
{

  std::string_view ErrorCodeName(ErrorCode code) noexcept
  {
    switch (code)
    {
    case ErrorCode::NotFound:
      return "NotFound";
    case ErrorCode::InvalidArgument:
      return "InvalidArgument";
    case ErrorCode::InvalidName:
      return "InvalidName";
    case ErrorCode::DuplicateStruct:
      return "DuplicateStruct";
    case ErrorCode::DuplicateOverload:
      return "DuplicateOverload";
    case ErrorCode::DuplicateField:
      return "DuplicateField";
    case ErrorCode::DuplicateCast:
      return "DuplicateCast";
    case ErrorCode::TypeMismatch:
      return "TypeMismatch";
    case ErrorCode::Binding:
      return "Binding";
    case ErrorCode::Coercion:
      return "Coercion";
    case ErrorCode::NoSuchMember:
      return "NoSuchMember";
    case ErrorCode::HostFailure:
      return "HostFailure";
    }
    return "Unknown";
  }

  std::string MethodKey::ToString() const
  {
    return fmt::format("{}/{}", name, arity);
  }

  NGIN::UInt64 Type::Hash() const noexcept
  {
    return NGIN::Hashing::FNV1a64(m_descriptor.data(), m_descriptor.size()) ^ (static_cast<NGIN::UInt64>(m_struct) << 1);
  }

  std::expected<Any, Error> Constructor::Construct(std::span<const Any> args) const
  {
    return native->Construct(args.data(), args.size());
  }

  std::expected<Any, Error> Method::Invoke(void *receiver, std::span<const Any> args) const
  {
    if (!isStatic && !receiver)
      return std::unexpected(Error{ErrorCode::HostFailure, fmt::format("null receiver for method [{}]", name)});
    return native->Invoke(receiver, args.data(), args.size());
  }

  std::expected<Any, Error> Field::Load(const void *receiver) const
  {
    if (!isStatic && !receiver)
      return std::unexpected(Error{ErrorCode::HostFailure, fmt::format("null receiver for field [{}]", name)});
    return native->Load(receiver);
  }

  std::expected<void, Error> Field::Store(void *receiver, const Any &value) const
  {
    if (!native->Store)
      return std::unexpected(Error{ErrorCode::InvalidArgument, fmt::format("field [{}] is read-only", name)});
    return native->Store(receiver, value);
  }

  Definition::Definition(detail::DefinitionState state) : m_state(std::move(state))
  {
    m_runtimeClasses.Reserve(m_state.runtimeStructs.Size());
    for (auto i = NGIN::UIntSize{0}; i < m_state.runtimeStructs.Size(); ++i)
      DeriveRuntimeClass(m_state.structs[m_state.runtimeStructs[i]]);
  }

  bool Definition::FindNameId(std::string_view s, NameId &out) const
  {
    detail::StringInterner::IdType id{};
    if (!m_state.names->TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  const Struct *Definition::FindStruct(std::string_view name) const
  {
    return detail::FindStruct(m_state, name);
  }

  std::expected<const Struct *, Error> Definition::GetStruct(std::string_view name) const
  {
    if (const auto *s = FindStruct(name))
      return s;
    return std::unexpected(Error{ErrorCode::NotFound, fmt::format("struct [{}] is not defined", name)});
  }

  std::expected<Type, Error> Definition::ResolveType(std::string_view name) const
  {
    return detail::ResolveTypeName(m_state, name);
  }

  std::expected<Type, Error> Definition::ResolveType(const Struct &owner, NGIN::UInt32 dimensions) const
  {
    return detail::MakeType(m_state, owner, dimensions);
  }

  const Method *Definition::FindMethodIn(const Struct &owner, NGIN::UInt64 key, bool isStatic) const
  {
    const auto &index = isStatic ? owner.staticMethodIndex : owner.methodIndex;
    if (const auto *p = index.GetPtr(key))
      return isStatic ? &owner.staticMethods[*p] : &owner.methods[*p];
    return nullptr;
  }

  const Constructor *Definition::FindConstructor(const Struct &owner, const MethodKey &key) const
  {
    NameId id{};
    if (!FindNameId(key.name, id))
      return nullptr;
    if (const auto *p = owner.constructorIndex.GetPtr(detail::PackMethodKey(id, key.arity)))
      return &owner.constructors[*p];
    return nullptr;
  }

  const Method *Definition::FindMethod(const Struct &owner, const MethodKey &key, bool isStatic) const
  {
    NameId id{};
    if (!FindNameId(key.name, id))
      return nullptr;
    return FindMethodIn(owner, detail::PackMethodKey(id, key.arity), isStatic);
  }

  // Keys never overlap across the three maps, so at most one lookup hits.
  std::optional<Member> Definition::ResolveMember(const Struct &owner, const MethodKey &key) const
  {
    if (const auto *c = FindConstructor(owner, key))
      return Member{c};
    if (const auto *m = FindMethod(owner, key, true))
      return Member{m};
    if (const auto *m = FindMethod(owner, key, false))
      return Member{m};
    return std::nullopt;
  }

  const Field *Definition::ResolveField(const Struct &owner, std::string_view name, bool isStatic) const
  {
    NameId id{};
    if (!FindNameId(name, id))
      return nullptr;
    const auto &index = isStatic ? owner.staticMemberIndex : owner.memberIndex;
    if (const auto *p = index.GetPtr(id))
      return isStatic ? &owner.staticMembers[*p] : &owner.members[*p];
    return nullptr;
  }

  std::expected<std::shared_ptr<const Definition>, Error> DefinitionBuilder::Build() &&
  {
    if (m_failure)
      return std::unexpected(*m_failure);
    if (!m_state.names)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "definition builder was already built"});
    if (!m_state.binder)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "definition builder has no native binder"});
    return std::make_shared<const Definition>(std::move(m_state));
  }

} // namespace Tessera::Catalog
