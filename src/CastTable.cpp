#include <Tessera/Catalog/DefinitionBuilder.hpp>
#include <Tessera/Catalog/Convert.hpp>

#include <fmt/format.h>

#include <cstdint>
#include <utility>

namespace Tessera::Catalog
{

  namespace
  {
    template <class T>
    std::expected<Any, Error> ConvertTo(const Any &value)
    {
      auto converted = detail::ConvertAny<T>(value);
      if (!converted)
        return std::unexpected(std::move(converted.error()));
      return Any{*converted};
    }

    std::expected<Any, Error> ConvertPrimitive(Sort to, const Any &value)
    {
      switch (to)
      {
      case Sort::Bool:
        return ConvertTo<bool>(value);
      case Sort::Byte:
        return ConvertTo<std::int8_t>(value);
      case Sort::Short:
        return ConvertTo<std::int16_t>(value);
      case Sort::Char:
        return ConvertTo<char16_t>(value);
      case Sort::Int:
        return ConvertTo<std::int32_t>(value);
      case Sort::Long:
        return ConvertTo<std::int64_t>(value);
      case Sort::Float:
        return ConvertTo<float>(value);
      case Sort::Double:
        return ConvertTo<double>(value);
      default:
        return std::unexpected(Error{ErrorCode::Coercion, "target of a primitive cast is not a primitive type"});
      }
    }

    std::expected<Any, Error> CallAdapter(const Method &adapter, const Any &value)
    {
      const NativeMethod *native = adapter.native;
      if (adapter.isStatic)
        return native->Invoke(nullptr, &value, 1);

      if (value.GetTypeId() != detail::TypeIdOf<Ref>())
        return std::unexpected(Error{ErrorCode::Coercion,
                                     fmt::format("instance adapter [{}] needs a reference receiver", adapter.name)});
      const auto &receiver = value.Cast<Ref>();
      if (!receiver)
        return std::unexpected(Error{ErrorCode::HostFailure,
                                     fmt::format("cannot cast a null value with [{}]", adapter.name)});
      return native->Invoke(ReceiverOf(receiver), nullptr, 0);
    }
  } // namespace

  std::expected<void, Error> DefinitionBuilder::AddTransform(const Type &from, const Type &to, bool isExplicit)
  {
    if (auto entered = Enter(Phase::Casts, "AddTransform"); !entered)
      return entered;
    if (from == to)
      return Fail(Error{ErrorCode::InvalidArgument, fmt::format("cast from [{}] to itself is not allowed", from.Name())});
    if (!IsPrimitive(from.GetSort()) || !IsPrimitive(to.GetSort()))
      return Fail(Error{ErrorCode::InvalidArgument,
                        fmt::format("cast without an adapter requires primitive types, got [{}] to [{}]", from.Name(),
                                    to.Name())});

    const auto key = detail::PackCastKey(from, to);
    auto &edges = isExplicit ? m_state.explicitCasts : m_state.implicitCasts;
    if (edges.GetPtr(key))
      return Fail(Error{ErrorCode::DuplicateCast, fmt::format("duplicate {} cast from [{}] to [{}]",
                                                              isExplicit ? "explicit" : "implicit", from.Name(),
                                                              to.Name())});

    Cast cast{};
    cast.from = from;
    cast.to = to;
    cast.isExplicit = isExplicit;
    m_state.casts.PushBack(std::move(cast));
    edges.Insert(key, static_cast<NGIN::UInt32>(m_state.casts.Size() - 1));
    return {};
  }

  std::expected<void, Error> DefinitionBuilder::AddTransform(const Type &from, const Type &to,
                                                             std::string_view ownerName, std::string_view adapterName,
                                                             bool isStatic, bool isExplicit)
  {
    if (auto entered = Enter(Phase::Casts, "AddTransform"); !entered)
      return entered;
    auto found = RequireStruct(ownerName, "owner");
    if (!found)
      return Fail(std::move(found.error()));
    const Struct &owner = **found;

    if (from == to)
      return Fail(Error{ErrorCode::InvalidArgument, fmt::format("transform from [{}] to itself is not allowed",
                                                                from.Name())});
    const auto key = detail::PackCastKey(from, to);
    auto &edges = isExplicit ? m_state.explicitCasts : m_state.implicitCasts;
    if (edges.GetPtr(key))
      return Fail(Error{ErrorCode::DuplicateCast, fmt::format("duplicate {} transform from [{}] to [{}]",
                                                              isExplicit ? "explicit" : "implicit", from.Name(),
                                                              to.Name())});

    // Static adapters take the source value; instance adapters are called on it.
    const auto nameId = Intern(adapterName);
    const auto methodKey = detail::PackMethodKey(nameId, isStatic ? 1 : 0);
    const auto &index = isStatic ? owner.staticMethodIndex : owner.methodIndex;
    const auto *slot = index.GetPtr(methodKey);
    if (!slot)
      return Fail(Error{ErrorCode::Binding,
                        fmt::format("transform adapter [{}.{}/{}] is not defined", owner.name, adapterName,
                                    isStatic ? 1 : 0)});
    const Method &adapter = isStatic ? owner.staticMethods[*slot] : owner.methods[*slot];

    const auto &binder = *m_state.binder;
    std::optional<Type> upcast;
    std::optional<Type> downcast;

    if (isStatic)
    {
      const Type &argument = adapter.arguments[0];
      if (!binder.IsAssignableFrom(argument.Class(), from.Class()))
      {
        if (!binder.IsAssignableFrom(from.Class(), argument.Class()))
          return Fail(Error{ErrorCode::TypeMismatch,
                            fmt::format("transform adapter [{}.{}] argument [{}] is incompatible with [{}]", owner.name,
                                        adapterName, argument.Name(), from.Name())});
        upcast = argument;
      }
    }
    else if (!binder.IsAssignableFrom(owner.clazz, from.Class()))
    {
      if (!binder.IsAssignableFrom(from.Class(), owner.clazz))
        return Fail(Error{ErrorCode::TypeMismatch, fmt::format("transform owner [{}] is incompatible with [{}]",
                                                               owner.name, from.Name())});
      auto ownerType = detail::MakeType(m_state, owner, 0);
      if (!ownerType)
        return Fail(std::move(ownerType.error()));
      upcast = std::move(*ownerType);
    }

    const Type &result = adapter.returnType;
    if (!binder.IsAssignableFrom(to.Class(), result.Class()))
    {
      if (!binder.IsAssignableFrom(result.Class(), to.Class()))
        return Fail(Error{ErrorCode::TypeMismatch,
                          fmt::format("transform adapter [{}.{}] return [{}] is incompatible with [{}]", owner.name,
                                      adapterName, result.Name(), to.Name())});
      downcast = to;
    }

    Cast cast{};
    cast.from = from;
    cast.to = to;
    cast.isExplicit = isExplicit;
    cast.adapter = adapter;
    cast.upcast = std::move(upcast);
    cast.downcast = std::move(downcast);
    cast.binder = &binder;
    m_state.casts.PushBack(std::move(cast));
    edges.Insert(key, static_cast<NGIN::UInt32>(m_state.casts.Size() - 1));
    return {};
  }

  const Cast *Definition::FindCast(const Type &from, const Type &to, bool isExplicit) const
  {
    const auto &edges = isExplicit ? m_state.explicitCasts : m_state.implicitCasts;
    if (const auto *p = edges.GetPtr(detail::PackCastKey(from, to)))
      return &m_state.casts[*p];
    return nullptr;
  }

  std::expected<const Cast *, Error> Definition::ResolveCast(const Type &from, const Type &to,
                                                             bool explicitAllowed) const
  {
    if (const auto *cast = FindCast(from, to, false))
      return cast;
    if (explicitAllowed)
    {
      if (const auto *cast = FindCast(from, to, true))
        return cast;
    }
    return std::unexpected(Error{ErrorCode::Coercion, fmt::format("cannot {} cast from [{}] to [{}]",
                                                                  explicitAllowed ? "explicitly" : "implicitly",
                                                                  from.Name(), to.Name())});
  }

  std::expected<Any, Error> Cast::Apply(const Any &value) const
  {
    if (!adapter)
      return ConvertPrimitive(to.GetSort(), value);

    auto result = CallAdapter(*adapter, value);
    if (!result || !downcast)
      return result;
    // A null reference passes any downcast.
    if (result->GetTypeId() == detail::TypeIdOf<Ref>())
    {
      const auto &ref = result->Cast<Ref>();
      if (!ref || binder->IsInstance(downcast->Class(), *ref))
        return result;
    }
    return std::unexpected(Error{ErrorCode::HostFailure,
                                 fmt::format("ClassCastException: result of [{}] is not a [{}]", adapter->name,
                                             downcast->Name())});
  }

} // namespace Tessera::Catalog
