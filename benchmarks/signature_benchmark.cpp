#include <benchmark/benchmark.h>

#include <string>

#include "core/guid_lookup.hpp"
#include "core/iid_cache.hpp"
#include "core/iid_encoder.hpp"
#include "core/signature.hpp"
#include "core/type_table.hpp"

namespace {

constexpr auto kIMap = iid::core::Guid{
    0x3c2925fe, 0x8519, 0x45c1, {0xaa, 0x79, 0x19, 0x7b, 0x67, 0x18, 0xc1, 0xc1}};
constexpr auto kIIterable = iid::core::Guid{
    0xfaa585ea, 0x6214, 0x4217, {0xaf, 0xda, 0x7f, 0x46, 0xde, 0x58, 0x69, 0xb3}};

struct NestedTable {
  iid::core::TypeTable table;
  iid::core::TypeHandle root{};

  NestedTable() {
    using iid::core::PrimitiveType;
    auto point = table.add_struct("Windows.Foundation.Point",
                                  {table.primitive(PrimitiveType::Float32),
                                   table.primitive(PrimitiveType::Float32)});
    auto map = table.add_generic_interface("Windows.Foundation.Collections.IMap`2", kIMap, 2);
    auto iterable = table.add_generic_interface(
        "Windows.Foundation.Collections.IIterable`1", kIIterable, 1);
    auto inner = table.instantiate(map, {table.string_type(), point});
    root = table.instantiate(iterable, {inner});
  }
};

auto nested_table() -> const NestedTable& {
  static const NestedTable instance;
  return instance;
}

void BM_BuildSignature(benchmark::State& state) {
  const auto& fixture = nested_table();
  for (auto _ : state) {
    auto sig = iid::core::build_signature(fixture.table, fixture.root);
    benchmark::DoNotOptimize(sig);
  }
}
BENCHMARK(BM_BuildSignature);

void BM_EncodeIid(benchmark::State& state) {
  const std::string sig = "pinterface({faa585ea-6214-4217-afda-7f46de5869b3};string)";
  for (auto _ : state) {
    auto iid = iid::core::encode_iid(sig);
    benchmark::DoNotOptimize(iid);
  }
}
BENCHMARK(BM_EncodeIid);

void BM_CreateIid(benchmark::State& state) {
  const auto& fixture = nested_table();
  for (auto _ : state) {
    auto iid = iid::core::create_iid(fixture.table, fixture.root);
    benchmark::DoNotOptimize(iid);
  }
}
BENCHMARK(BM_CreateIid);

void BM_CachedIid(benchmark::State& state) {
  const auto& fixture = nested_table();
  static iid::core::IidCache cache(fixture.table);
  for (auto _ : state) {
    auto iid = cache.get(fixture.root);
    benchmark::DoNotOptimize(iid);
  }
}
BENCHMARK(BM_CachedIid)->Threads(1)->Threads(8);

}  // namespace

BENCHMARK_MAIN();
