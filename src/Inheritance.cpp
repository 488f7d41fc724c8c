#include <Tessera/Catalog/DefinitionBuilder.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace Tessera::Catalog
{

  namespace
  {
    std::vector<ClassId> ToClassList(const NGIN::Containers::Vector<ClassId> &classes)
    {
      std::vector<ClassId> out;
      out.reserve(classes.Size());
      for (auto i = NGIN::UIntSize{0}; i < classes.Size(); ++i)
        out.push_back(classes[i]);
      return out;
    }
  } // namespace

  std::expected<void, Error> DefinitionBuilder::CopyStruct(std::string_view ownerName,
                                                           std::span<const std::string_view> parents)
  {
    if (auto entered = Enter(Phase::Inheritance, "CopyStruct"); !entered)
      return entered;
    auto found = RequireStruct(ownerName, "owner");
    if (!found)
      return Fail(std::move(found.error()));
    Struct &owner = **found;

    std::vector<const Struct *> resolved;
    resolved.reserve(parents.size());
    for (const auto parentName : parents)
    {
      auto parent = RequireStruct(parentName, "parent");
      if (!parent)
        return Fail(std::move(parent.error()));
      if (!m_state.binder->IsAssignableFrom((*parent)->clazz, owner.clazz))
        return Fail(Error{ErrorCode::Binding, fmt::format("struct [{}] is not a super type of [{}]", parentName,
                                                          owner.name)});
      resolved.push_back(*parent);
    }

    // More derived parents first; the order of the list itself does not matter.
    std::vector<std::pair<NGIN::UIntSize, const Struct *>> ranked;
    ranked.reserve(resolved.size());
    for (const auto *candidate : resolved)
    {
      NGIN::UIntSize supertypes = 0;
      for (const auto *other : resolved)
      {
        if (other->clazz != candidate->clazz && m_state.binder->IsAssignableFrom(other->clazz, candidate->clazz))
          ++supertypes;
      }
      ranked.emplace_back(supertypes, candidate);
    }
    std::sort(ranked.begin(), ranked.end(), [](const auto &a, const auto &b) {
      if (a.first != b.first)
        return a.first > b.first;
      return a.second->name < b.second->name;
    });

    for (const auto &[rank, parent] : ranked)
    {
      if (auto copied = CopyFrom(owner, *parent); !copied)
        return Fail(std::move(copied.error()));
    }
    return {};
  }

  std::expected<void, Error> DefinitionBuilder::CopyFrom(Struct &owner, const Struct &parent)
  {
    const auto &binder = *m_state.binder;
    const bool viaRoot = m_state.options.interfaceRootFallback && parent.clazz == binder.RootClass() &&
                         binder.IsInterface(owner.clazz);
    const ClassId lookupClass = viaRoot ? binder.RootClass() : owner.clazz;

    for (auto i = NGIN::UIntSize{0}; i < parent.methods.Size(); ++i)
    {
      const Method &inherited = parent.methods[i];
      const auto nameId = Intern(inherited.name);
      const auto key = detail::PackMethodKey(nameId, static_cast<NGIN::UInt32>(inherited.arguments.Size()));
      if (owner.methodIndex.GetPtr(key))
        continue;
      if (owner.constructorIndex.GetPtr(key) || owner.staticMethodIndex.GetPtr(key))
        return std::unexpected(Error{ErrorCode::DuplicateOverload,
                                     fmt::format("inherited method [{}.{}/{}] collides with a constructor or static "
                                                 "method of [{}]",
                                                 parent.name, inherited.name, inherited.arguments.Size(), owner.name)});

      const auto params = ToClassList(inherited.native->paramClasses);
      auto native = binder.FindMethod(lookupClass, inherited.native->name, params);
      if (!native)
        return std::unexpected(Error{ErrorCode::Binding,
                                     fmt::format("cannot copy method [{}.{}/{}] to [{}]: {}", parent.name,
                                                 inherited.name, inherited.arguments.Size(), owner.name,
                                                 native.error().message)});

      Method copy = inherited;
      copy.owner = owner.index;
      copy.native = *native;
      owner.methods.PushBack(std::move(copy));
      owner.methodIndex.Insert(key, static_cast<NGIN::UInt32>(owner.methods.Size() - 1));
    }

    for (auto i = NGIN::UIntSize{0}; i < parent.members.Size(); ++i)
    {
      const Field &inherited = parent.members[i];
      const auto nameId = Intern(inherited.name);
      if (owner.memberIndex.GetPtr(nameId))
        continue;
      if (owner.staticMemberIndex.GetPtr(nameId))
        return std::unexpected(Error{ErrorCode::DuplicateField,
                                     fmt::format("inherited field [{}.{}] collides with a static field of [{}]",
                                                 parent.name, inherited.name, owner.name)});

      auto native = binder.FindField(lookupClass, inherited.native->name);
      if (!native)
        return std::unexpected(Error{ErrorCode::Binding, fmt::format("cannot copy field [{}.{}] to [{}]: {}",
                                                                     parent.name, inherited.name, owner.name,
                                                                     native.error().message)});

      Field copy = inherited;
      copy.owner = owner.index;
      copy.native = *native;
      owner.members.PushBack(std::move(copy));
      owner.memberIndex.Insert(nameId, static_cast<NGIN::UInt32>(owner.members.Size() - 1));
    }
    return {};
  }

} // namespace Tessera::Catalog
