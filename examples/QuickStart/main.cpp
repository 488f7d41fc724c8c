#include <Tessera/Catalog/Catalog.hpp>
#include <Tessera/Catalog/Standard/FeatureTest.hpp>
#include <Tessera/Catalog/Standard/StandardDefinition.hpp>

#include <fmt/format.h>

#include <array>
#include <cstdio>
#include <cstdint>

int main()
{
  using namespace Tessera::Catalog;
  using namespace Tessera::Catalog::Standard;

  fmt::print("Library: {}\n", LibraryName());

  const auto &built = StandardDefinition();
  if (!built)
  {
    fmt::print(stderr, "standard definition failed: {}\n", built.error().message);
    return 1;
  }
  const Definition &def = **built;
  fmt::print("structs={} casts={} runtime classes={}\n", def.StructCount(), def.CastCount(), def.RuntimeClassCount());

  // Static call: Math.max(2.0, 7.5)
  const auto *max = def.FindMethod(*def.FindStruct("Math"), MethodKey{"max", 2}, true);
  const std::array<Any, 2> operands{Any{2.0}, Any{7.5}};
  if (auto r = max->Invoke(nullptr, operands))
    fmt::print("Math.max(2.0, 7.5) => {}\n", r->Cast<double>());

  // Cast lookup: long -> int needs an explicit cast.
  const auto l = def.ResolveType("long").value();
  const auto i = def.ResolveType("int").value();
  fmt::print("long -> int implicit: {}\n", def.ResolveCast(l, i, false).has_value());
  if (auto narrow = def.ResolveCast(l, i, true))
    fmt::print("(int)(long)5000000000 => {}\n",
               (*narrow)->Apply(Any{std::int64_t{5000000000}}).value().Cast<std::int32_t>());

  // Late-bound property access on a host object.
  const auto *ctor = def.FindConstructor(*def.FindStruct("FeatureTest"), MethodKey{"new", 2});
  const std::array<Any, 2> xy{Any{3}, Any{4}};
  auto made = ctor->Construct(xy);
  if (!made)
  {
    fmt::print(stderr, "construct failed: {}\n", made.error().message);
    return 1;
  }
  Ref ft = made->Cast<Ref>();
  const auto clazz = ClassIdOf<FeatureTest>();
  if (auto stored = def.StoreDynamic(clazz, ReceiverOf(ft), "x", Any{10}); !stored)
  {
    fmt::print(stderr, "store failed: {}\n", stored.error().message);
    return 1;
  }
  fmt::print("ft.x => {}\n", def.LoadDynamic(clazz, ReceiverOf(ft), "x").value().Cast<std::int32_t>());

  auto missing = def.LoadDynamic(clazz, ReceiverOf(ft), "z");
  fmt::print("ft.z => {}\n", missing ? "found" : missing.error().message);
  return 0;
}
