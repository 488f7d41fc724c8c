#include <iostream>

#include <NGIN/Benchmark.hpp>
#include <Tessera/Catalog/Catalog.hpp>
#include <Tessera/Catalog/Standard/FeatureTest.hpp>
#include <Tessera/Catalog/Standard/StandardDefinition.hpp>

#include <array>
#include <cstdint>
#include <memory>

using namespace NGIN;

int main()
{
  using namespace Tessera::Catalog;
  using namespace Tessera::Catalog::Standard;

  const auto &built = StandardDefinition();
  if (!built)
  {
    std::cerr << "standard definition failed: " << built.error().message << "\n";
    return 1;
  }
  const Definition &def = **built;
  const auto &list = *def.FindStruct("ArrayList<Object>");
  const auto i = def.ResolveType("int").value();
  const auto l = def.ResolveType("long").value();
  const auto clazz = ClassIdOf<FeatureTest>();

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int hits = 0;
    for (int n=0;n<10000;++n) {
      hits += def.FindStruct("HashMap<Object,Object>") != nullptr;
    }
    ctx.doNotOptimize(hits);
    ctx.stop(); }, "FindStruct by name 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int hits = 0;
    for (int n=0;n<10000;++n) {
      hits += def.FindMethod(list, MethodKey{"add", 1}, false) != nullptr;
    }
    ctx.doNotOptimize(hits);
    ctx.stop(); }, "FindMethod add/1 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    ctx.start();
    int hits = 0;
    for (int n=0;n<10000;++n) {
      hits += def.ResolveCast(i, l, true).has_value();
    }
    ctx.doNotOptimize(hits);
    ctx.stop(); }, "ResolveCast int->long 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Ref ft = std::make_shared<FeatureTest>(1, 2);
    ctx.start();
    std::int64_t sum = 0;
    for (int n=0;n<10000;++n) {
      sum += def.LoadDynamic(clazz, ReceiverOf(ft), "x").value().Cast<std::int32_t>();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "LoadDynamic ft.x 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    FeatureTest ft{1, 2};
    ctx.start();
    std::int64_t sum = 0;
    for (int n=0;n<10000;++n) {
      sum += ft.GetX();
    }
    ctx.doNotOptimize(sum);
    ctx.stop(); }, "Direct GetX 10k");

  Benchmark::Register([&](BenchmarkContext &ctx)
                      {
    Ref ft = std::make_shared<FeatureTest>(1, 2);
    const std::array<Any, 1> arg{Any{7}};
    ctx.start();
    for (int n=0;n<10000;++n) {
      (void)def.StoreDynamic(clazz, ReceiverOf(ft), "y", arg[0]);
    }
    ctx.stop(); }, "StoreDynamic ft.y 10k");

  auto results = Benchmark::RunAll<Milliseconds>();
  Benchmark::PrintSummaryTable(std::cout, results);
  return 0;
}
