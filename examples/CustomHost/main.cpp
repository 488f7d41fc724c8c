#include <Tessera/Catalog/Catalog.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdio>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>

namespace Demo
{
  using namespace Tessera::Catalog;

  class Counter : public virtual HostObject
  {
  public:
    Counter() = default;
    explicit Counter(std::int32_t start) : m_value(start) {}

    std::int32_t GetValue() const { return m_value; }
    void SetValue(std::int32_t v) { m_value = v; }
    std::int32_t Add(std::int32_t delta) { return m_value += delta; }
    static std::shared_ptr<Counter> Of(std::int32_t v) { return std::make_shared<Counter>(v); }

    friend void TesseraDescribe(Tag<Counter>, ClassBuilder<Counter> &b)
    {
      b.SetName("Demo::Counter")
          .Root()
          .Constructor<>()
          .Constructor<std::int32_t>()
          .Method<&Counter::GetValue>("getValue")
          .Method<&Counter::SetValue>("setValue")
          .Method<&Counter::Add>("add")
          .StaticMethod<&Counter::Of>("of");
    }

  private:
    std::int32_t m_value{0};
  };

  std::expected<std::shared_ptr<const Definition>, Error> BuildCatalog()
  {
    auto registry = std::make_shared<HostRegistry>();
    registry->RegisterClasses<Counter>();

    DefinitionBuilder b{registry};
    if (auto r = b.AddStruct("void", ClassIdOf<void>()); !r)
      return std::unexpected(r.error());
    if (auto r = b.AddStruct("int", ClassIdOf<std::int32_t>()); !r)
      return std::unexpected(r.error());
    // Host classes can also be looked up by the name they registered under.
    if (auto r = b.AddStructByClassName("Counter", "Demo::Counter"); !r)
      return std::unexpected(r.error());

    const auto i = b.GetType("int").value();
    const auto v = b.GetType("void").value();
    const auto counter = b.GetType("Counter").value();
    const std::array<Type, 1> oneInt{i};

    if (auto r = b.AddConstructor("Counter", "new", {}); !r)
      return std::unexpected(r.error());
    if (auto r = b.AddConstructor("Counter", "new", oneInt); !r)
      return std::unexpected(r.error());
    if (auto r = b.AddMethod("Counter", "getValue", {}, false, i, {}); !r)
      return std::unexpected(r.error());
    if (auto r = b.AddMethod("Counter", "setValue", {}, false, v, oneInt); !r)
      return std::unexpected(r.error());
    if (auto r = b.AddMethod("Counter", "add", {}, false, i, oneInt); !r)
      return std::unexpected(r.error());
    if (auto r = b.AddMethod("Counter", "of", {}, true, counter, oneInt); !r)
      return std::unexpected(r.error());
    if (auto r = b.AddTransform(i, counter, "Counter", "of", true, false); !r)
      return std::unexpected(r.error());
    if (auto r = b.AddRuntimeClass("Counter"); !r)
      return std::unexpected(r.error());
    return std::move(b).Build();
  }
} // namespace Demo

int main()
{
  using namespace Tessera::Catalog;

  auto built = Demo::BuildCatalog();
  if (!built)
  {
    fmt::print(stderr, "catalog failed: {}\n", built.error().message);
    return 1;
  }
  const auto &def = **built;

  // int -> Counter through the static adapter Counter.of.
  const auto *cast = def.FindCast(def.ResolveType("int").value(), def.ResolveType("Counter").value(), false);
  auto boxed = cast->Apply(Any{40});
  if (!boxed)
  {
    fmt::print(stderr, "cast failed: {}\n", boxed.error().message);
    return 1;
  }
  Ref counter = boxed->Cast<Ref>();
  const auto clazz = ClassIdOf<Demo::Counter>();

  const std::array<Any, 1> two{Any{2}};
  if (auto sum = def.InvokeDynamic(clazz, ReceiverOf(counter), "add", two))
    fmt::print("counter.add(2) => {}\n", sum->Cast<std::int32_t>());
  fmt::print("counter.value => {}\n", def.LoadDynamic(clazz, ReceiverOf(counter), "value").value().Cast<std::int32_t>());

  // A second overload with the same arity is rejected.
  auto registry = std::make_shared<HostRegistry>();
  registry->RegisterClasses<Demo::Counter>();
  DefinitionBuilder again{registry};
  (void)again.AddStruct("int", ClassIdOf<std::int32_t>());
  (void)again.AddStruct("Counter", ClassIdOf<Demo::Counter>());
  const auto i = again.GetType("int").value();
  (void)again.AddMethod("Counter", "getValue", {}, false, i, {});
  auto duplicate = again.AddMethod("Counter", "getValue", {}, false, i, {});
  fmt::print("duplicate overload => {}\n", duplicate ? std::string{"accepted"} : duplicate.error().message);
  return 0;
}
