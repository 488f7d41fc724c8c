// Host.hpp
// The host-environment capability consumed while building a definition:
// class lookup, member lookup by exact signature, assignability and array synthesis.
#pragma once

#include <NGIN/Primitives.hpp>
#include <NGIN/Containers/Vector.hpp>
#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <Tessera/Catalog/Export.hpp>
#include <Tessera/Catalog/Sort.hpp>
#include <Tessera/Catalog/Types.hpp>

#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>
#include <vector>

namespace Tessera::Catalog
{

  // Polymorphic root of every reference value handed to host callables.
  class TESSERA_CATALOG_API HostObject : public std::enable_shared_from_this<HostObject>
  {
  public:
    virtual ~HostObject() = default;
  };

  using Ref = std::shared_ptr<HostObject>;

  // Receivers travel as void*. For HostObject classes the pointer is always the HostObject subobject.
  [[nodiscard]] inline void *ReceiverOf(const Ref &ref) noexcept
  {
    return static_cast<void *>(ref.get());
  }

  struct NativeField
  {
    std::string_view name;
    ClassId declaringClass{InvalidClassId};
    ClassId typeClass{InvalidClassId};
    bool isStatic{false};
    bool isFinal{false};
    // Receiver is ignored for static fields.
    std::expected<Any, Error> (*Load)(const void *){nullptr};
    std::expected<void, Error> (*Store)(void *, const Any &){nullptr};
  };

  struct NativeMethod
  {
    std::string_view name;
    ClassId declaringClass{InvalidClassId};
    ClassId returnClass{InvalidClassId};
    NGIN::Containers::Vector<ClassId> paramClasses;
    bool isStatic{false};
    std::expected<Any, Error> (*Invoke)(void *, const Any *, NGIN::UIntSize){nullptr};
  };

  struct NativeConstructor
  {
    ClassId declaringClass{InvalidClassId};
    NGIN::Containers::Vector<ClassId> paramClasses;
    std::expected<Any, Error> (*Construct)(const Any *, NGIN::UIntSize){nullptr};
  };

  // Returned pointers stay valid for the binder's lifetime; a binder is frozen (const) once bound against.
  class TESSERA_CATALOG_API NativeBinder
  {
  public:
    virtual ~NativeBinder() = default;

    [[nodiscard]] virtual std::optional<ClassId> FindClass(std::string_view name) const = 0;
    [[nodiscard]] virtual std::string ClassName(ClassId id) const = 0;
    [[nodiscard]] virtual std::string Descriptor(ClassId id) const = 0;
    [[nodiscard]] virtual bool IsInterface(ClassId id) const = 0;
    // True when a value of class `source` may be stored where `target` is expected.
    [[nodiscard]] virtual bool IsAssignableFrom(ClassId target, ClassId source) const = 0;
    // True when the dynamic class of value is target or derives from it.
    [[nodiscard]] virtual bool IsInstance(ClassId target, const HostObject &value) const = 0;
    [[nodiscard]] virtual ClassId RootClass() const = 0;
    [[nodiscard]] virtual std::optional<ClassId> ClassForSort(Sort sort) const = 0;
    [[nodiscard]] virtual std::expected<ClassId, Error> ArrayClass(ClassId component, NGIN::UInt32 dimensions) const = 0;

    [[nodiscard]] virtual std::expected<const NativeConstructor *, Error>
    FindConstructor(ClassId owner, std::span<const ClassId> params) const = 0;
    [[nodiscard]] virtual std::expected<const NativeMethod *, Error>
    FindMethod(ClassId owner, std::string_view name, std::span<const ClassId> params) const = 0;
    [[nodiscard]] virtual std::expected<const NativeField *, Error> FindField(ClassId owner, std::string_view name) const = 0;
  };

  namespace detail
  {
    inline constexpr ClassId ComponentMask = (ClassId{1} << 56) - 1;

    template <class T>
    inline NGIN::UInt64 TypeIdOf()
    {
      auto sv = NGIN::Meta::TypeName<std::remove_cv_t<std::remove_reference_t<T>>>::qualifiedName;
      return NGIN::Hashing::FNV1a64(sv.data(), sv.size());
    }

    template <class T>
    struct HostClassOf
    {
      using type = T;
    };
    template <class U>
    struct HostClassOf<std::shared_ptr<U>> : HostClassOf<std::remove_cv_t<U>>
    {
    };
    template <class U>
    struct HostClassOf<std::expected<U, Error>> : HostClassOf<std::remove_cvref_t<U>>
    {
    };

    template <class T>
    struct IsArrayValue : std::false_type
    {
    };
    template <class U, class A>
    struct IsArrayValue<std::vector<U, A>> : std::true_type
    {
    };

    [[nodiscard]] constexpr ClassId ComponentOf(ClassId id) noexcept { return id & ComponentMask; }
    [[nodiscard]] constexpr NGIN::UInt32 DimensionsOf(ClassId id) noexcept { return static_cast<NGIN::UInt32>(id >> 56); }
    [[nodiscard]] constexpr ClassId MakeArrayClass(ClassId component, NGIN::UInt32 dims) noexcept
    {
      return ComponentOf(component) | (static_cast<ClassId>(dims) << 56);
    }
  } // namespace detail

  // Native class of a C++ type as seen by the catalogue. Shared pointers and expected
  // results map to their payload class; std::vector<U> is the array class one dimension above U.
  template <class T>
  [[nodiscard]] inline ClassId ClassIdOf()
  {
    using U = typename detail::HostClassOf<std::remove_cvref_t<T>>::type;
    if constexpr (detail::IsArrayValue<U>::value)
    {
      const auto component = ClassIdOf<typename U::value_type>();
      return detail::MakeArrayClass(component, detail::DimensionsOf(component) + 1);
    }
    else if constexpr (std::is_void_v<U>)
    {
      constexpr std::string_view sv = "void";
      return detail::ComponentOf(NGIN::Hashing::FNV1a64(sv.data(), sv.size()));
    }
    else
    {
      return detail::ComponentOf(detail::TypeIdOf<U>());
    }
  }

} // namespace Tessera::Catalog
