// HostRegistry.hpp
// NativeBinder over C++ classes described through ClassBuilder<T>.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <Tessera/Catalog/Export.hpp>
#include <Tessera/Catalog/Host.hpp>
#include <Tessera/Catalog/Sort.hpp>
#include <Tessera/Catalog/Types.hpp>

#include <array>
#include <memory>
#include <string>
#include <string_view>

namespace Tessera::Catalog
{

  template <class T>
  struct Tag
  {
    using type = T;
  };

  template <class T>
  class ClassBuilder;

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    struct ClassDesc
    {
      ClassId id{InvalidClassId};
      std::string_view name;
      NameId nameId{static_cast<NameId>(-1)};
      // Primitive classes carry their one-letter descriptor; object classes derive theirs from the name.
      std::string_view primitiveDescriptor;
      bool isPrimitive{false};
      bool isInterface{false};
      // dynamic_cast check against the described class; null for primitives.
      bool (*isInstance)(const HostObject &){nullptr};
      // Superclass (if any) first, then interfaces, in declaration order.
      NGIN::Containers::Vector<ClassId> supertypes;
      NGIN::Containers::Vector<NativeConstructor> constructors;
      NGIN::Containers::Vector<NativeMethod> methods;
      NGIN::Containers::Vector<NativeField> fields;
      NGIN::Containers::FlatHashMap<NameId, NGIN::Containers::Vector<NGIN::UInt32>> methodsByName;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> fieldIndex;
    };
  } // namespace detail

  class TESSERA_CATALOG_API HostRegistry final : public NativeBinder
  {
  public:
    // Pre-registers the primitive classes and binds their sorts.
    HostRegistry();
    HostRegistry(const HostRegistry &) = delete;
    HostRegistry &operator=(const HostRegistry &) = delete;

    // Registers T (once) and runs its TesseraDescribe hook.
    template <class T>
    ClassId Register();

    template <class... T>
    void RegisterClasses()
    {
      (Register<T>(), ...);
    }

    [[nodiscard]] bool Contains(ClassId id) const;
    [[nodiscard]] NGIN::UIntSize ClassCount() const noexcept { return m_classes.Size(); }

    [[nodiscard]] std::optional<ClassId> FindClass(std::string_view name) const override;
    [[nodiscard]] std::string ClassName(ClassId id) const override;
    [[nodiscard]] std::string Descriptor(ClassId id) const override;
    [[nodiscard]] bool IsInterface(ClassId id) const override;
    [[nodiscard]] bool IsAssignableFrom(ClassId target, ClassId source) const override;
    [[nodiscard]] bool IsInstance(ClassId target, const HostObject &value) const override;
    [[nodiscard]] ClassId RootClass() const override { return m_root; }
    [[nodiscard]] std::optional<ClassId> ClassForSort(Sort sort) const override;
    [[nodiscard]] std::expected<ClassId, Error> ArrayClass(ClassId component, NGIN::UInt32 dimensions) const override;

    [[nodiscard]] std::expected<const NativeConstructor *, Error>
    FindConstructor(ClassId owner, std::span<const ClassId> params) const override;
    [[nodiscard]] std::expected<const NativeMethod *, Error>
    FindMethod(ClassId owner, std::string_view name, std::span<const ClassId> params) const override;
    [[nodiscard]] std::expected<const NativeField *, Error> FindField(ClassId owner, std::string_view name) const override;

  private:
    template <class T>
    friend class ClassBuilder;

    NGIN::UInt32 AddClass(ClassId id, std::string_view name);
    void AddPrimitive(ClassId id, std::string_view name, std::string_view descriptor, Sort sort);
    void Rename(NGIN::UInt32 index, std::string_view name);
    void BindSort(Sort sort, ClassId id) { m_sortClasses[static_cast<NGIN::UIntSize>(sort)] = id; }
    void SetRoot(ClassId id) { m_root = id; }

    void AddMethod(NGIN::UInt32 index, NativeMethod method);
    void AddField(NGIN::UInt32 index, NativeField field);

    [[nodiscard]] detail::ClassDesc &ClassAt(NGIN::UInt32 index) { return *m_classes[index]; }
    [[nodiscard]] const detail::ClassDesc *Find(ClassId id) const;
    NameId InternId(std::string_view s);
    [[nodiscard]] std::string_view NameOf(NameId id) const;
    [[nodiscard]] bool FindNameId(std::string_view s, NameId &out) const;

    [[nodiscard]] const NativeMethod *FindMethodIn(const detail::ClassDesc &desc, NameId name,
                                                   std::span<const ClassId> params) const;
    [[nodiscard]] const NativeField *FindFieldIn(const detail::ClassDesc &desc, NameId name) const;
    [[nodiscard]] bool IsSubclassOf(const detail::ClassDesc &desc, ClassId target) const;

    NGIN::Containers::Vector<std::unique_ptr<detail::ClassDesc>> m_classes;
    NGIN::Containers::FlatHashMap<ClassId, NGIN::UInt32> m_byId;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> m_byName;
    detail::StringInterner m_names;
    std::array<ClassId, SortCount> m_sortClasses{};
    ClassId m_root{InvalidClassId};
  };

} // namespace Tessera::Catalog
