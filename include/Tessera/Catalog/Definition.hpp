// Definition.hpp
// The catalogue data model and the immutable definition produced by DefinitionBuilder.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/HashMap.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Utilities/StringInterner.hpp>

#include <Tessera/Catalog/Export.hpp>
#include <Tessera/Catalog/Host.hpp>
#include <Tessera/Catalog/Sort.hpp>
#include <Tessera/Catalog/Types.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace Tessera::Catalog
{

  inline constexpr NGIN::UInt32 InvalidIndex = static_cast<NGIN::UInt32>(-1);
  inline constexpr NGIN::UInt32 MaxStructs = NGIN::UInt32{1} << 24;

  struct DefinitionOptions
  {
    // Struct whose types are always of the Dynamic sort.
    std::string dynamicTypeName{"def"};
    // Lets CopyStruct re-resolve the root's members against the root class when the owner is an interface.
    bool interfaceRootFallback{false};
  };

  // Overload identity: one overload per arity per name.
  struct MethodKey
  {
    std::string_view name;
    NGIN::UInt32 arity{0};

    friend bool operator==(const MethodKey &, const MethodKey &) = default;
    [[nodiscard]] TESSERA_CATALOG_API std::string ToString() const;
  };

  class TESSERA_CATALOG_API Type
  {
  public:
    Type() = default;
    Type(std::string name, NGIN::UInt32 dimensions, NGIN::UInt32 structIndex, ClassId clazz, std::string descriptor,
         Sort sort)
        : m_name(std::move(name)), m_descriptor(std::move(descriptor)), m_class(clazz), m_struct(structIndex),
          m_dimensions(dimensions), m_sort(sort)
    {
    }

    [[nodiscard]] bool IsValid() const noexcept { return m_struct != InvalidIndex; }
    [[nodiscard]] std::string_view Name() const noexcept { return m_name; }
    [[nodiscard]] std::string_view Descriptor() const noexcept { return m_descriptor; }
    [[nodiscard]] ClassId Class() const noexcept { return m_class; }
    [[nodiscard]] NGIN::UInt32 StructIndex() const noexcept { return m_struct; }
    [[nodiscard]] NGIN::UInt32 Dimensions() const noexcept { return m_dimensions; }
    [[nodiscard]] Sort GetSort() const noexcept { return m_sort; }

    // Packed (struct, dimensions); unique per type within one definition.
    [[nodiscard]] NGIN::UInt32 Key() const noexcept { return (m_struct << 8) | m_dimensions; }
    [[nodiscard]] NGIN::UInt64 Hash() const noexcept;

    friend bool operator==(const Type &a, const Type &b) noexcept
    {
      return a.m_struct == b.m_struct && a.m_descriptor == b.m_descriptor;
    }

  private:
    std::string m_name;
    std::string m_descriptor;
    ClassId m_class{InvalidClassId};
    NGIN::UInt32 m_struct{InvalidIndex};
    NGIN::UInt32 m_dimensions{0};
    Sort m_sort{Sort::Object};
  };

  struct Constructor
  {
    std::string_view name;
    NGIN::UInt32 owner{InvalidIndex};
    NGIN::Containers::Vector<Type> arguments;
    const NativeConstructor *native{nullptr};

    [[nodiscard]] MethodKey Key() const { return {name, static_cast<NGIN::UInt32>(arguments.Size())}; }
    [[nodiscard]] TESSERA_CATALOG_API std::expected<Any, Error> Construct(std::span<const Any> args) const;
  };

  // Return and argument types are the script-visible ones (generic where given);
  // the native signature stays with `native`.
  struct Method
  {
    std::string_view name;
    NGIN::UInt32 owner{InvalidIndex};
    Type returnType;
    NGIN::Containers::Vector<Type> arguments;
    const NativeMethod *native{nullptr};
    bool isStatic{false};

    [[nodiscard]] MethodKey Key() const { return {name, static_cast<NGIN::UInt32>(arguments.Size())}; }
    [[nodiscard]] TESSERA_CATALOG_API std::expected<Any, Error> Invoke(void *receiver, std::span<const Any> args) const;
  };

  struct Field
  {
    std::string_view name;
    NGIN::UInt32 owner{InvalidIndex};
    Type type;
    // Script-visible type; equals `type` unless a narrower generic type was declared.
    Type generic;
    const NativeField *native{nullptr};
    bool isStatic{false};

    [[nodiscard]] TESSERA_CATALOG_API std::expected<Any, Error> Load(const void *receiver) const;
    [[nodiscard]] TESSERA_CATALOG_API std::expected<void, Error> Store(void *receiver, const Any &value) const;
  };

  struct Struct
  {
    std::string_view name;
    NameId nameId{static_cast<NameId>(-1)};
    NGIN::UInt32 index{InvalidIndex};
    ClassId clazz{InvalidClassId};
    std::string descriptor;

    NGIN::Containers::Vector<Constructor> constructors;
    NGIN::Containers::Vector<Method> staticMethods;
    NGIN::Containers::Vector<Method> methods;
    NGIN::Containers::Vector<Field> staticMembers;
    NGIN::Containers::Vector<Field> members;

    // Method maps are keyed by (name id << 32 | arity), field maps by name id.
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> constructorIndex;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> staticMethodIndex;
    NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> methodIndex;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> staticMemberIndex;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> memberIndex;

    friend bool operator==(const Struct &a, const Struct &b) noexcept { return a.name == b.name; }
  };

  // A coercion edge. Transforms carry the adapter performing the conversion.
  struct Cast
  {
    Type from;
    Type to;
    bool isExplicit{false};
    std::optional<Method> adapter;
    // Narrow the source to `upcast` before calling the adapter.
    std::optional<Type> upcast;
    // Narrow the adapter's result to `downcast` afterwards.
    std::optional<Type> downcast;
    // Checks the downcast at run time; owned by the definition.
    const NativeBinder *binder{nullptr};

    [[nodiscard]] bool IsTransform() const noexcept { return adapter.has_value(); }
    // Converts a host value: arithmetic conversion for primitive edges, the adapter call otherwise.
    [[nodiscard]] TESSERA_CATALOG_API std::expected<Any, Error> Apply(const Any &value) const;
  };

  // Late-bound property accessor: a field, or a getX/isX/setX method.
  struct Accessor
  {
    std::string_view property;
    const Field *field{nullptr};
    const Method *method{nullptr};

    [[nodiscard]] TESSERA_CATALOG_API std::expected<Any, Error> Get(void *receiver) const;
    [[nodiscard]] TESSERA_CATALOG_API std::expected<void, Error> Set(void *receiver, const Any &value) const;
  };

  struct RuntimeClass
  {
    const Struct *owner{nullptr};
    NGIN::Containers::Vector<Accessor> getters;
    NGIN::Containers::Vector<Accessor> setters;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> getterIndex;
    NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> setterIndex;
  };

  using Member = std::variant<const Constructor *, const Method *>;

  namespace detail
  {
    using StringInterner = NGIN::Utilities::StringInterner<>;

    [[nodiscard]] constexpr NGIN::UInt64 PackMethodKey(NameId name, NGIN::UInt32 arity) noexcept
    {
      return (static_cast<NGIN::UInt64>(name) << 32) | arity;
    }

    [[nodiscard]] inline NGIN::UInt64 PackCastKey(const Type &from, const Type &to) noexcept
    {
      return (static_cast<NGIN::UInt64>(from.Key()) << 32) | to.Key();
    }

    // Everything a definition owns; built up by DefinitionBuilder and then handed over whole.
    struct DefinitionState
    {
      std::shared_ptr<const NativeBinder> binder;
      DefinitionOptions options{};
      std::unique_ptr<StringInterner> names{std::make_unique<StringInterner>()};

      NGIN::Containers::Vector<Struct> structs;
      NGIN::Containers::FlatHashMap<NameId, NGIN::UInt32> structIndex;

      NGIN::Containers::Vector<Cast> casts;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> implicitCasts;
      NGIN::Containers::FlatHashMap<NGIN::UInt64, NGIN::UInt32> explicitCasts;

      // Struct indices enrolled for dynamic dispatch, in enrolment order.
      NGIN::Containers::Vector<NGIN::UInt32> runtimeStructs;
      NGIN::Containers::FlatHashMap<ClassId, NGIN::UInt32> runtimeByClass;
    };

    // Shared by the builder and the finished definition.
    [[nodiscard]] TESSERA_CATALOG_API const Struct *FindStruct(const DefinitionState &state, std::string_view name);
    [[nodiscard]] TESSERA_CATALOG_API std::expected<Type, Error> MakeType(const DefinitionState &state,
                                                                         const Struct &owner,
                                                                         NGIN::UInt32 dimensions);
    [[nodiscard]] TESSERA_CATALOG_API std::expected<Type, Error> ResolveTypeName(const DefinitionState &state,
                                                                                std::string_view name);
  } // namespace detail

  class TESSERA_CATALOG_API Definition
  {
  public:
    // Takes ownership of a completed build and derives the dynamic dispatch index.
    explicit Definition(detail::DefinitionState state);
    Definition(const Definition &) = delete;
    Definition &operator=(const Definition &) = delete;

    [[nodiscard]] const NativeBinder &Binder() const noexcept { return *m_state.binder; }
    [[nodiscard]] const DefinitionOptions &Options() const noexcept { return m_state.options; }

    // Structs
    [[nodiscard]] NGIN::UIntSize StructCount() const noexcept { return m_state.structs.Size(); }
    [[nodiscard]] const Struct &StructAt(NGIN::UInt32 index) const { return m_state.structs[index]; }
    [[nodiscard]] const Struct *FindStruct(std::string_view name) const;
    [[nodiscard]] std::expected<const Struct *, Error> GetStruct(std::string_view name) const;

    // Types: "Name", "Name[]", "Name[][]"...
    [[nodiscard]] std::expected<Type, Error> ResolveType(std::string_view name) const;
    [[nodiscard]] std::expected<Type, Error> ResolveType(const Struct &owner, NGIN::UInt32 dimensions) const;

    // Flat, inheritance-complete member lookups; nullptr/nullopt when absent.
    [[nodiscard]] std::optional<Member> ResolveMember(const Struct &owner, const MethodKey &key) const;
    [[nodiscard]] const Constructor *FindConstructor(const Struct &owner, const MethodKey &key) const;
    [[nodiscard]] const Method *FindMethod(const Struct &owner, const MethodKey &key, bool isStatic) const;
    [[nodiscard]] const Field *ResolveField(const Struct &owner, std::string_view name, bool isStatic) const;

    // Casts
    [[nodiscard]] NGIN::UIntSize CastCount() const noexcept { return m_state.casts.Size(); }
    [[nodiscard]] const Cast *FindCast(const Type &from, const Type &to, bool isExplicit) const;
    // Implicit edge first, then the explicit edge when the context allows it; CoercionError otherwise.
    [[nodiscard]] std::expected<const Cast *, Error> ResolveCast(const Type &from, const Type &to,
                                                                 bool explicitAllowed) const;

    // Dynamic dispatch
    [[nodiscard]] NGIN::UIntSize RuntimeClassCount() const noexcept { return m_runtimeClasses.Size(); }
    [[nodiscard]] const RuntimeClass *FindRuntimeClass(ClassId clazz) const;
    [[nodiscard]] const Accessor *ResolveDynamicGetter(ClassId clazz, std::string_view property) const;
    [[nodiscard]] const Accessor *ResolveDynamicSetter(ClassId clazz, std::string_view property) const;
    [[nodiscard]] const Method *ResolveDynamicMethod(ClassId clazz, const MethodKey &key) const;

    // Late-bound access on a receiver of native class `clazz`. Misses are NoSuchMember errors.
    [[nodiscard]] std::expected<Any, Error> LoadDynamic(ClassId clazz, void *receiver, std::string_view property) const;
    [[nodiscard]] std::expected<void, Error> StoreDynamic(ClassId clazz, void *receiver, std::string_view property,
                                                          const Any &value) const;
    [[nodiscard]] std::expected<Any, Error> InvokeDynamic(ClassId clazz, void *receiver, std::string_view name,
                                                          std::span<const Any> args) const;

  private:
    [[nodiscard]] bool FindNameId(std::string_view s, NameId &out) const;
    [[nodiscard]] const Method *FindMethodIn(const Struct &owner, NGIN::UInt64 key, bool isStatic) const;
    void DeriveRuntimeClass(const Struct &owner);

    detail::DefinitionState m_state;
    NGIN::Containers::Vector<RuntimeClass> m_runtimeClasses;
  };

} // namespace Tessera::Catalog
