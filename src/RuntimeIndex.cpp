#include <Tessera/Catalog/DefinitionBuilder.hpp>
#include <Tessera/Catalog/NameUtils.hpp>

#include <fmt/format.h>

#include <utility>

namespace Tessera::Catalog
{

  std::expected<void, Error> DefinitionBuilder::AddRuntimeClass(std::string_view structName)
  {
    if (auto entered = Enter(Phase::RuntimeClasses, "AddRuntimeClass"); !entered)
      return entered;
    auto found = RequireStruct(structName, "runtime");
    if (!found)
      return Fail(std::move(found.error()));
    const Struct &owner = **found;

    if (const auto *existing = m_state.runtimeByClass.GetPtr(owner.clazz))
    {
      const auto &enrolled = m_state.structs[m_state.runtimeStructs[*existing]];
      return Fail(Error{ErrorCode::DuplicateStruct,
                        fmt::format("native class of [{}] is already enrolled through [{}]", owner.name,
                                    enrolled.name)});
    }
    m_state.runtimeStructs.PushBack(owner.index);
    m_state.runtimeByClass.Insert(owner.clazz, static_cast<NGIN::UInt32>(m_state.runtimeStructs.Size() - 1));
    return {};
  }

  void Definition::DeriveRuntimeClass(const Struct &owner)
  {
    RuntimeClass rc{};
    rc.owner = &owner;

    auto add = [this](NGIN::Containers::Vector<Accessor> &list, NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> &index,
                      std::string_view property, Accessor accessor) {
      const auto id = static_cast<NameId>(m_state.names->InsertOrGet(property));
      if (index.GetPtr(id))
        return;
      accessor.property = m_state.names->View(static_cast<detail::StringInterner::IdType>(id));
      list.PushBack(accessor);
      index.Insert(id, static_cast<NGIN::UInt32>(list.Size() - 1));
    };

    // Fields first so that a field always wins over a same-named getter or setter.
    for (auto i = NGIN::UIntSize{0}; i < owner.members.Size(); ++i)
    {
      const Field &field = owner.members[i];
      add(rc.getters, rc.getterIndex, field.name, Accessor{{}, &field, nullptr});
      if (field.native->Store)
        add(rc.setters, rc.setterIndex, field.name, Accessor{{}, &field, nullptr});
    }

    for (auto i = NGIN::UIntSize{0}; i < owner.methods.Size(); ++i)
    {
      const Method &method = owner.methods[i];
      const auto arity = method.arguments.Size();
      if (arity == 0)
      {
        if (auto property = GetterProperty(method.name))
          add(rc.getters, rc.getterIndex, *property, Accessor{{}, nullptr, &method});
      }
      else if (arity == 1)
      {
        if (auto property = SetterProperty(method.name))
          add(rc.setters, rc.setterIndex, *property, Accessor{{}, nullptr, &method});
      }
    }

    m_runtimeClasses.PushBack(std::move(rc));
  }

  const RuntimeClass *Definition::FindRuntimeClass(ClassId clazz) const
  {
    if (const auto *p = m_state.runtimeByClass.GetPtr(clazz))
      return &m_runtimeClasses[*p];
    return nullptr;
  }

  const Accessor *Definition::ResolveDynamicGetter(ClassId clazz, std::string_view property) const
  {
    const auto *rc = FindRuntimeClass(clazz);
    NameId id{};
    if (!rc || !FindNameId(property, id))
      return nullptr;
    if (const auto *p = rc->getterIndex.GetPtr(id))
      return &rc->getters[*p];
    return nullptr;
  }

  const Accessor *Definition::ResolveDynamicSetter(ClassId clazz, std::string_view property) const
  {
    const auto *rc = FindRuntimeClass(clazz);
    NameId id{};
    if (!rc || !FindNameId(property, id))
      return nullptr;
    if (const auto *p = rc->setterIndex.GetPtr(id))
      return &rc->setters[*p];
    return nullptr;
  }

  const Method *Definition::ResolveDynamicMethod(ClassId clazz, const MethodKey &key) const
  {
    const auto *rc = FindRuntimeClass(clazz);
    NameId id{};
    if (!rc || !FindNameId(key.name, id))
      return nullptr;
    return FindMethodIn(*rc->owner, detail::PackMethodKey(id, key.arity), false);
  }

  std::expected<Any, Error> Definition::LoadDynamic(ClassId clazz, void *receiver, std::string_view property) const
  {
    const auto *getter = ResolveDynamicGetter(clazz, property);
    if (!getter)
      return std::unexpected(Error{ErrorCode::NoSuchMember, fmt::format("unable to find dynamic field [{}] for class [{}]",
                                                                        property, Binder().ClassName(clazz))});
    return getter->Get(receiver);
  }

  std::expected<void, Error> Definition::StoreDynamic(ClassId clazz, void *receiver, std::string_view property,
                                                      const Any &value) const
  {
    const auto *setter = ResolveDynamicSetter(clazz, property);
    if (!setter)
      return std::unexpected(Error{ErrorCode::NoSuchMember, fmt::format("unable to find dynamic field [{}] for class [{}]",
                                                                        property, Binder().ClassName(clazz))});
    return setter->Set(receiver, value);
  }

  std::expected<Any, Error> Definition::InvokeDynamic(ClassId clazz, void *receiver, std::string_view name,
                                                      std::span<const Any> args) const
  {
    const auto *method = ResolveDynamicMethod(clazz, MethodKey{name, static_cast<NGIN::UInt32>(args.size())});
    if (!method)
      return std::unexpected(Error{ErrorCode::NoSuchMember,
                                   fmt::format("unable to find dynamic method [{}/{}] for class [{}]", name, args.size(),
                                               Binder().ClassName(clazz))});
    return method->Invoke(receiver, args);
  }

  std::expected<Any, Error> Accessor::Get(void *receiver) const
  {
    if (field)
      return field->Load(receiver);
    return method->Invoke(receiver, {});
  }

  std::expected<void, Error> Accessor::Set(void *receiver, const Any &value) const
  {
    if (field)
      return field->Store(receiver, value);
    auto result = method->Invoke(receiver, std::span<const Any>{&value, 1});
    if (!result)
      return std::unexpected(std::move(result.error()));
    return {};
  }

} // namespace Tessera::Catalog
