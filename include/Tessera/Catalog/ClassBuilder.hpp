// ClassBuilder.hpp
// ClassBuilder<T> used inside the TesseraDescribe hook to describe a host class.
#pragma once

#include <NGIN/Hashing/FNV.hpp>
#include <NGIN/Meta/TypeName.hpp>

#include <Tessera/Catalog/Convert.hpp>
#include <Tessera/Catalog/HostRegistry.hpp>
#include <Tessera/Catalog/NameUtils.hpp>

#include <concepts>
#include <memory>
#include <optional>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <utility>

namespace Tessera::Catalog
{

  namespace detail
  {
    template <class T>
    concept HasTesseraDescribe = requires(ClassBuilder<T> &b) {
      // ADL friend should be declared as: friend void TesseraDescribe(Tag<T>, ClassBuilder<T>&)
      { TesseraDescribe(Tag<T>{}, b) } -> std::same_as<void>;
    };

    template <class M>
    struct MemberPtrTraits;
    template <class C, class M>
    struct MemberPtrTraits<M C::*>
    {
      using Class = C;
      using Member = M;
    };

    template <auto MemberPtr>
    using MemberClassT = typename MemberPtrTraits<decltype(MemberPtr)>::Class;
    template <auto MemberPtr>
    using MemberTypeT = typename MemberPtrTraits<decltype(MemberPtr)>::Member;

    template <class T>
    struct IsExpected : std::false_type
    {
    };
    template <class U>
    struct IsExpected<std::expected<U, Error>> : std::true_type
    {
    };

    template <class A>
    using ArgT = std::remove_cv_t<std::remove_reference_t<A>>;

    template <class C>
    inline C *ReceiverCast(void *obj)
    {
      if constexpr (std::is_base_of_v<HostObject, C>)
        return dynamic_cast<C *>(static_cast<HostObject *>(obj));
      else
        return static_cast<C *>(obj);
    }

    template <class C>
    inline const C *ReceiverCast(const void *obj)
    {
      if constexpr (std::is_base_of_v<HostObject, C>)
        return dynamic_cast<const C *>(static_cast<const HostObject *>(obj));
      else
        return static_cast<const C *>(obj);
    }

    template <class... A>
    inline NGIN::Containers::Vector<ClassId> ParamClasses()
    {
      NGIN::Containers::Vector<ClassId> v;
      v.Reserve(sizeof...(A));
      (v.PushBack(ClassIdOf<ArgT<A>>()), ...);
      return v;
    }

    // Converts every argument, then calls f with the converted values.
    template <class... A, class F, std::size_t... I>
    inline std::expected<Any, Error> CallConverted(const Any *args, F &&f, std::index_sequence<I...>)
    {
      auto converted = std::make_tuple(ConvertAny<ArgT<A>>(args[I])...);
      if (!(std::get<I>(converted).has_value() && ...))
        return std::unexpected(Error{ErrorCode::InvalidArgument, "argument conversion failed"});
      return f(std::move(*std::get<I>(converted))...);
    }

    template <class R, class F>
    inline std::expected<Any, Error> BoxCall(F &&f)
    {
      if constexpr (std::is_void_v<R>)
      {
        f();
        return Any::MakeVoid();
      }
      else if constexpr (IsExpected<std::remove_cvref_t<R>>::value)
      {
        auto r = f();
        if (!r)
          return std::unexpected(std::move(r.error()));
        if constexpr (std::is_void_v<typename std::remove_cvref_t<R>::value_type>)
          return Any::MakeVoid();
        else
          return BoxResult(std::move(*r));
      }
      else
      {
        return BoxResult(f());
      }
    }

    template <typename>
    struct MethodTraits;

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...)>
    {
      using Class = C;
      using Ret = R;
      static constexpr bool IsStatic = false;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      static NGIN::Containers::Vector<ClassId> Params() { return ParamClasses<A...>(); }

      template <auto MemFn>
      static std::expected<Any, Error> Invoke(void *obj, const Any *args, NGIN::UIntSize count)
      {
        if (count != Arity)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
        auto *c = ReceiverCast<C>(obj);
        if (!c)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "receiver is null or of the wrong class"});
        return CallConverted<A...>(
            args, [c](auto &&...a) { return BoxCall<R>([&] { return (c->*MemFn)(std::forward<decltype(a)>(a)...); }); },
            std::index_sequence_for<A...>{});
      }
    };

    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const>
    {
      using Class = C;
      using Ret = R;
      static constexpr bool IsStatic = false;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      static NGIN::Containers::Vector<ClassId> Params() { return ParamClasses<A...>(); }

      template <auto MemFn>
      static std::expected<Any, Error> Invoke(void *obj, const Any *args, NGIN::UIntSize count)
      {
        if (count != Arity)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
        const auto *c = ReceiverCast<C>(static_cast<const void *>(obj));
        if (!c)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "receiver is null or of the wrong class"});
        return CallConverted<A...>(
            args, [c](auto &&...a) { return BoxCall<R>([&] { return (c->*MemFn)(std::forward<decltype(a)>(a)...); }); },
            std::index_sequence_for<A...>{});
      }
    };

    template <class R, class... A>
    struct MethodTraits<R (*)(A...)>
    {
      using Ret = R;
      static constexpr bool IsStatic = true;
      static constexpr NGIN::UIntSize Arity = sizeof...(A);
      static NGIN::Containers::Vector<ClassId> Params() { return ParamClasses<A...>(); }

      template <auto Fn>
      static std::expected<Any, Error> Invoke(void *, const Any *args, NGIN::UIntSize count)
      {
        if (count != Arity)
          return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
        return CallConverted<A...>(
            args, [](auto &&...a) { return BoxCall<R>([&] { return Fn(std::forward<decltype(a)>(a)...); }); },
            std::index_sequence_for<A...>{});
      }
    };

    // noexcept is part of the function type; the invokers are the same.
    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) noexcept> : MethodTraits<R (C::*)(A...)>
    {
    };
    template <class C, class R, class... A>
    struct MethodTraits<R (C::*)(A...) const noexcept> : MethodTraits<R (C::*)(A...) const>
    {
    };
    template <class R, class... A>
    struct MethodTraits<R (*)(A...) noexcept> : MethodTraits<R (*)(A...)>
    {
    };

    template <auto MemberPtr>
    static std::expected<Any, Error> FieldLoad(const void *obj)
    {
      using C = MemberClassT<MemberPtr>;
      using M = std::remove_cv_t<MemberTypeT<MemberPtr>>;
      const auto *c = ReceiverCast<C>(obj);
      if (!c)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "receiver is null or of the wrong class"});
      return BoxResult(static_cast<const M &>(c->*MemberPtr));
    }

    template <auto MemberPtr>
    static std::expected<void, Error> FieldStore(void *obj, const Any &value)
    {
      using C = MemberClassT<MemberPtr>;
      using M = MemberTypeT<MemberPtr>;
      auto converted = ConvertAny<M>(value);
      if (!converted)
        return std::unexpected(std::move(converted.error()));
      auto *c = ReceiverCast<C>(obj);
      if (!c)
        return std::unexpected(Error{ErrorCode::InvalidArgument, "receiver is null or of the wrong class"});
      (c->*MemberPtr) = std::move(*converted);
      return {};
    }

    template <auto StaticPtr>
    static std::expected<Any, Error> StaticFieldLoad(const void *)
    {
      return BoxResult(*StaticPtr);
    }
  } // namespace detail

  template <class T>
  class ClassBuilder
  {
  public:
    // Constructed by the registry when running the describe hook; bound to one class record.
    ClassBuilder(HostRegistry &registry, NGIN::UInt32 classIndex) : m_registry(registry), m_index(classIndex) {}

    // Overrides the class name used for lookup and descriptors; defaults to Meta::TypeName<T>.
    ClassBuilder &SetName(std::string_view name)
    {
      m_registry.Rename(m_index, name);
      return *this;
    }

    ClassBuilder &Interface()
    {
      m_registry.ClassAt(m_index).isInterface = true;
      return *this;
    }

    // Marks T as the universal root every reference class is assignable to.
    ClassBuilder &Root()
    {
      m_registry.SetRoot(ClassIdOf<T>());
      return *this;
    }

    // Binds T as the native class of a fixed sort (boxes, Number, String).
    ClassBuilder &BindSort(Sort sort)
    {
      m_registry.BindSort(sort, ClassIdOf<T>());
      return *this;
    }

    template <class B>
    ClassBuilder &Extends()
    {
      static_assert(std::is_base_of_v<B, T>, "Extends<B> requires B to be a base of T");
      const auto id = m_registry.template Register<B>();
      m_registry.ClassAt(m_index).supertypes.PushBack(id);
      return *this;
    }

    template <class I>
    ClassBuilder &Implements()
    {
      static_assert(std::is_base_of_v<I, T>, "Implements<I> requires I to be a base of T");
      const auto id = m_registry.template Register<I>();
      m_registry.ClassAt(m_index).supertypes.PushBack(id);
      return *this;
    }

    // Public data member. Const members are final.
    template <auto MemberPtr>
    ClassBuilder &Field(std::string_view name)
    {
      using M = detail::MemberTypeT<MemberPtr>;
      NativeField f{};
      f.name = name;
      f.declaringClass = ClassIdOf<T>();
      f.typeClass = ClassIdOf<M>();
      f.isStatic = false;
      f.isFinal = std::is_const_v<M>;
      f.Load = &detail::FieldLoad<MemberPtr>;
      if constexpr (!std::is_const_v<M>)
        f.Store = &detail::FieldStore<MemberPtr>;
      m_registry.AddField(m_index, std::move(f));
      return *this;
    }

    // Static data member given by address (e.g. &T::MAX_VALUE).
    template <auto StaticPtr>
    ClassBuilder &StaticField(std::string_view name)
    {
      using M = std::remove_pointer_t<decltype(StaticPtr)>;
      NativeField f{};
      f.name = name;
      f.declaringClass = ClassIdOf<T>();
      f.typeClass = ClassIdOf<M>();
      f.isStatic = true;
      f.isFinal = std::is_const_v<M>;
      f.Load = &detail::StaticFieldLoad<StaticPtr>;
      m_registry.AddField(m_index, std::move(f));
      return *this;
    }

    template <auto MemFn>
    ClassBuilder &Method(std::string_view name)
    {
      using Traits = detail::MethodTraits<decltype(MemFn)>;
      static_assert(!Traits::IsStatic, "use StaticMethod for free functions");
      static_assert(std::is_base_of_v<typename Traits::Class, T>, "Method must belong to T or one of its bases");
      return AddMethod<Traits, MemFn>(name);
    }

    template <auto Fn>
    ClassBuilder &StaticMethod(std::string_view name)
    {
      using Traits = detail::MethodTraits<decltype(Fn)>;
      static_assert(Traits::IsStatic, "StaticMethod requires a function pointer");
      return AddMethod<Traits, Fn>(name);
    }

    // Constructor T(A...). HostObject classes are created shared and returned as Ref.
    template <class... A>
    ClassBuilder &Constructor()
    {
      NativeConstructor c{};
      c.declaringClass = ClassIdOf<T>();
      c.paramClasses = detail::ParamClasses<A...>();
      c.Construct = [](const Any *args, NGIN::UIntSize count) -> std::expected<Any, Error>
      {
        if (count != sizeof...(A))
          return std::unexpected(Error{ErrorCode::InvalidArgument, "bad arity"});
        return detail::CallConverted<A...>(
            args,
            [](auto &&...a) -> std::expected<Any, Error>
            {
              if constexpr (std::is_base_of_v<HostObject, T>)
                return Any{Ref{std::make_shared<T>(std::forward<decltype(a)>(a)...)}};
              else
                return Any{T{std::forward<decltype(a)>(a)...}};
            },
            std::index_sequence_for<A...>{});
      };
      m_registry.ClassAt(m_index).constructors.PushBack(std::move(c));
      return *this;
    }

  private:
    template <class Traits, auto Callable>
    ClassBuilder &AddMethod(std::string_view name)
    {
      NativeMethod m{};
      m.name = name;
      m.declaringClass = ClassIdOf<T>();
      m.returnClass = ClassIdOf<typename Traits::Ret>();
      m.paramClasses = Traits::Params();
      m.isStatic = Traits::IsStatic;
      m.Invoke = &Traits::template Invoke<Callable>;
      m_registry.AddMethod(m_index, std::move(m));
      return *this;
    }

    HostRegistry &m_registry;
    NGIN::UInt32 m_index{0};
  };

  template <class T>
  inline ClassId HostRegistry::Register()
  {
    using U = std::remove_cvref_t<T>;
    const auto id = ClassIdOf<U>();
    if (m_byId.GetPtr(id))
      return id;

    const auto idx = AddClass(id, NGIN::Meta::TypeName<U>::qualifiedName);
    if constexpr (std::is_base_of_v<HostObject, U>)
      m_classes[idx]->isInstance = [](const HostObject &value) { return dynamic_cast<const U *>(&value) != nullptr; };
    if constexpr (detail::HasTesseraDescribe<U>)
    {
      ClassBuilder<U> b{*this, idx};
      TesseraDescribe(Tag<U>{}, b); // ADL: the class describes its members
    }
    return id;
  }

} // namespace Tessera::Catalog
