#include <Tessera/Catalog/HostRegistry.hpp>

#include <fmt/format.h>

#include <cstdint>

namespace Tessera::Catalog
{

  namespace
  {
    bool SameParams(const NGIN::Containers::Vector<ClassId> &have, std::span<const ClassId> want)
    {
      if (have.Size() != want.size())
        return false;
      for (auto i = NGIN::UIntSize{0}; i < have.Size(); ++i)
      {
        if (have[i] != want[i])
          return false;
      }
      return true;
    }

    std::string FormatParams(const HostRegistry &reg, std::span<const ClassId> params)
    {
      std::string out;
      for (auto i = std::size_t{0}; i < params.size(); ++i)
      {
        if (i > 0)
          out += ", ";
        out += reg.ClassName(params[i]);
      }
      return out;
    }
  } // namespace

  HostRegistry::HostRegistry()
  {
    AddPrimitive(ClassIdOf<void>(), "void", "V", Sort::Void);
    AddPrimitive(ClassIdOf<bool>(), "bool", "Z", Sort::Bool);
    AddPrimitive(ClassIdOf<std::int8_t>(), "int8", "B", Sort::Byte);
    AddPrimitive(ClassIdOf<std::int16_t>(), "int16", "S", Sort::Short);
    AddPrimitive(ClassIdOf<char16_t>(), "char16", "C", Sort::Char);
    AddPrimitive(ClassIdOf<std::int32_t>(), "int32", "I", Sort::Int);
    AddPrimitive(ClassIdOf<std::int64_t>(), "int64", "J", Sort::Long);
    AddPrimitive(ClassIdOf<float>(), "float", "F", Sort::Float);
    AddPrimitive(ClassIdOf<double>(), "double", "D", Sort::Double);
  }

  NameId HostRegistry::InternId(std::string_view s)
  {
    return static_cast<NameId>(m_names.InsertOrGet(s));
  }

  std::string_view HostRegistry::NameOf(NameId id) const
  {
    return m_names.View(static_cast<detail::StringInterner::IdType>(id));
  }

  bool HostRegistry::FindNameId(std::string_view s, NameId &out) const
  {
    detail::StringInterner::IdType id{};
    if (!m_names.TryGetId(s, id))
      return false;
    out = static_cast<NameId>(id);
    return true;
  }

  NGIN::UInt32 HostRegistry::AddClass(ClassId id, std::string_view name)
  {
    auto rec = std::make_unique<detail::ClassDesc>();
    rec->id = id;
    rec->nameId = InternId(name);
    rec->name = NameOf(rec->nameId);

    const auto idx = static_cast<NGIN::UInt32>(m_classes.Size());
    m_classes.PushBack(std::move(rec));
    m_byId.Insert(id, idx);
    m_byName.Insert(m_classes[idx]->nameId, idx);
    // MSVC prefixes qualified names with "class "/"struct "; keep the bare spelling findable too.
#if defined(_MSC_VER)
    for (std::string_view prefix : {std::string_view{"class "}, std::string_view{"struct "}})
    {
      if (name.size() > prefix.size() && name.substr(0, prefix.size()) == prefix)
        m_byName.Insert(InternId(name.substr(prefix.size())), idx);
    }
#endif
    return idx;
  }

  void HostRegistry::AddPrimitive(ClassId id, std::string_view name, std::string_view descriptor, Sort sort)
  {
    const auto idx = AddClass(id, name);
    auto &rec = *m_classes[idx];
    rec.isPrimitive = true;
    rec.primitiveDescriptor = descriptor;
    BindSort(sort, id);
  }

  void HostRegistry::Rename(NGIN::UInt32 index, std::string_view name)
  {
    auto &rec = *m_classes[index];
    rec.nameId = InternId(name);
    rec.name = NameOf(rec.nameId);
    m_byName.Insert(rec.nameId, index);
  }

  void HostRegistry::AddMethod(NGIN::UInt32 index, NativeMethod method)
  {
    auto &rec = *m_classes[index];
    const auto nameId = InternId(method.name);
    method.name = NameOf(nameId);
    rec.methods.PushBack(std::move(method));
    const auto newIndex = static_cast<NGIN::UInt32>(rec.methods.Size() - 1);
    if (auto *vec = rec.methodsByName.GetPtr(nameId))
    {
      vec->PushBack(newIndex);
    }
    else
    {
      NGIN::Containers::Vector<NGIN::UInt32> v;
      v.PushBack(newIndex);
      rec.methodsByName.Insert(nameId, std::move(v));
    }
  }

  void HostRegistry::AddField(NGIN::UInt32 index, NativeField field)
  {
    auto &rec = *m_classes[index];
    const auto nameId = InternId(field.name);
    field.name = NameOf(nameId);
    rec.fields.PushBack(std::move(field));
    rec.fieldIndex.Insert(nameId, static_cast<NGIN::UInt32>(rec.fields.Size() - 1));
  }

  const detail::ClassDesc *HostRegistry::Find(ClassId id) const
  {
    if (auto *p = m_byId.GetPtr(id))
      return m_classes[*p].get();
    return nullptr;
  }

  bool HostRegistry::Contains(ClassId id) const
  {
    return Find(detail::ComponentOf(id)) != nullptr;
  }

  std::optional<ClassId> HostRegistry::FindClass(std::string_view name) const
  {
    NameId nid{};
    if (!FindNameId(name, nid))
      return std::nullopt;
    if (auto *p = m_byName.GetPtr(nid))
      return m_classes[*p]->id;
    return std::nullopt;
  }

  std::string HostRegistry::ClassName(ClassId id) const
  {
    const auto *rec = Find(detail::ComponentOf(id));
    std::string out = rec ? std::string{rec->name} : fmt::format("<unknown {:#x}>", detail::ComponentOf(id));
    for (auto d = detail::DimensionsOf(id); d > 0; --d)
      out += "[]";
    return out;
  }

  std::string HostRegistry::Descriptor(ClassId id) const
  {
    std::string out(detail::DimensionsOf(id), '[');
    const auto *rec = Find(detail::ComponentOf(id));
    if (!rec)
      return out;
    if (rec->isPrimitive)
      out += rec->primitiveDescriptor;
    else
      out += fmt::format("L{};", rec->name);
    return out;
  }

  bool HostRegistry::IsInterface(ClassId id) const
  {
    if (detail::DimensionsOf(id) > 0)
      return false;
    const auto *rec = Find(id);
    return rec && rec->isInterface;
  }

  bool HostRegistry::IsSubclassOf(const detail::ClassDesc &desc, ClassId target) const
  {
    for (auto i = NGIN::UIntSize{0}; i < desc.supertypes.Size(); ++i)
    {
      const auto super = desc.supertypes[i];
      if (super == target)
        return true;
      if (const auto *rec = Find(super); rec && IsSubclassOf(*rec, target))
        return true;
    }
    return false;
  }

  bool HostRegistry::IsAssignableFrom(ClassId target, ClassId source) const
  {
    if (target == source)
      return true;
    const auto *targetRec = Find(detail::ComponentOf(target));
    const auto *sourceRec = Find(detail::ComponentOf(source));
    if (!targetRec || !sourceRec)
      return false;

    const auto targetDims = detail::DimensionsOf(target);
    const auto sourceDims = detail::DimensionsOf(source);
    if (sourceDims > 0)
    {
      if (target == m_root)
        return true;
      // Reference arrays are covariant in their component.
      if (targetDims != sourceDims || targetRec->isPrimitive || sourceRec->isPrimitive)
        return false;
      return IsAssignableFrom(detail::ComponentOf(target), detail::ComponentOf(source));
    }
    if (targetDims > 0 || targetRec->isPrimitive || sourceRec->isPrimitive)
      return false;
    if (target == m_root)
      return true;
    return IsSubclassOf(*sourceRec, target);
  }

  bool HostRegistry::IsInstance(ClassId target, const HostObject &value) const
  {
    if (target == m_root)
      return true;
    const auto *rec = Find(target);
    return rec && rec->isInstance && rec->isInstance(value);
  }

  std::optional<ClassId> HostRegistry::ClassForSort(Sort sort) const
  {
    const auto id = m_sortClasses[static_cast<NGIN::UIntSize>(sort)];
    if (id == InvalidClassId)
      return std::nullopt;
    return id;
  }

  std::expected<ClassId, Error> HostRegistry::ArrayClass(ClassId component, NGIN::UInt32 dimensions) const
  {
    if (detail::DimensionsOf(component) != 0)
      return std::unexpected(Error{ErrorCode::InvalidArgument, "array component must not itself be an array class"});
    if (dimensions == 0 || dimensions > MaxArrayDimensions)
      return std::unexpected(Error{ErrorCode::InvalidArgument,
                                   fmt::format("array dimensions must be in [1, {}], got {}", MaxArrayDimensions, dimensions)});
    const auto *rec = Find(component);
    if (!rec)
      return std::unexpected(Error{ErrorCode::NotFound, fmt::format("unknown array component class {:#x}", component)});
    if (component == ClassIdOf<void>())
      return std::unexpected(Error{ErrorCode::InvalidArgument, "void cannot be an array component"});
    return detail::MakeArrayClass(component, dimensions);
  }

  std::expected<const NativeConstructor *, Error>
  HostRegistry::FindConstructor(ClassId owner, std::span<const ClassId> params) const
  {
    const auto *rec = Find(owner);
    if (rec)
    {
      for (auto i = NGIN::UIntSize{0}; i < rec->constructors.Size(); ++i)
      {
        if (SameParams(rec->constructors[i].paramClasses, params))
          return &rec->constructors[i];
      }
    }
    return std::unexpected(Error{ErrorCode::NotFound, fmt::format("constructor {}({}) not found", ClassName(owner),
                                                                  FormatParams(*this, params))});
  }

  const NativeMethod *HostRegistry::FindMethodIn(const detail::ClassDesc &desc, NameId name,
                                                 std::span<const ClassId> params) const
  {
    if (const auto *vec = desc.methodsByName.GetPtr(name))
    {
      for (auto i = NGIN::UIntSize{0}; i < vec->Size(); ++i)
      {
        const auto &m = desc.methods[(*vec)[i]];
        if (SameParams(m.paramClasses, params))
          return &m;
      }
    }
    for (auto i = NGIN::UIntSize{0}; i < desc.supertypes.Size(); ++i)
    {
      if (const auto *super = Find(desc.supertypes[i]))
      {
        if (const auto *m = FindMethodIn(*super, name, params))
          return m;
      }
    }
    return nullptr;
  }

  std::expected<const NativeMethod *, Error>
  HostRegistry::FindMethod(ClassId owner, std::string_view name, std::span<const ClassId> params) const
  {
    const auto *rec = Find(owner);
    NameId nid{};
    if (rec && FindNameId(name, nid))
    {
      if (const auto *m = FindMethodIn(*rec, nid, params))
        return m;
      // Every concrete class inherits the root's methods; interfaces do not.
      if (!rec->isInterface && !rec->isPrimitive && owner != m_root)
      {
        if (const auto *root = Find(m_root))
        {
          if (const auto *m = FindMethodIn(*root, nid, params))
            return m;
        }
      }
    }
    return std::unexpected(Error{ErrorCode::NotFound, fmt::format("method {}.{}({}) not found", ClassName(owner), name,
                                                                  FormatParams(*this, params))});
  }

  const NativeField *HostRegistry::FindFieldIn(const detail::ClassDesc &desc, NameId name) const
  {
    if (const auto *p = desc.fieldIndex.GetPtr(name))
      return &desc.fields[*p];
    for (auto i = NGIN::UIntSize{0}; i < desc.supertypes.Size(); ++i)
    {
      if (const auto *super = Find(desc.supertypes[i]))
      {
        if (const auto *f = FindFieldIn(*super, name))
          return f;
      }
    }
    return nullptr;
  }

  std::expected<const NativeField *, Error> HostRegistry::FindField(ClassId owner, std::string_view name) const
  {
    NameId nid{};
    if (const auto *rec = Find(owner); rec && FindNameId(name, nid))
    {
      if (const auto *f = FindFieldIn(*rec, nid))
        return f;
    }
    return std::unexpected(Error{ErrorCode::NotFound, fmt::format("field {}.{} not found", ClassName(owner), name)});
  }

} // namespace Tessera::Catalog
