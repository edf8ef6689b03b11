#include <benchmark/benchmark.h>
#include <semsearch/kernels/dispatch.hpp>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

using namespace semsearch::kernels;

namespace {

std::vector<float> random_f32(std::size_t n, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  std::vector<float> v(n);
  for (auto& x : v) x = dist(rng);
  return v;
}

std::vector<std::int8_t> random_i8(std::size_t n, std::uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(-127, 127);
  std::vector<std::int8_t> v(n);
  for (auto& x : v) x = static_cast<std::int8_t>(dist(rng));
  return v;
}

const KernelOps& ops_for(std::int64_t which) {
  return which == 0 ? select_backend("scalar") : select_backend_auto();
}

} // namespace

static void BM_L2Sq(benchmark::State& state) {
  const auto dim = static_cast<std::size_t>(state.range(0));
  const auto& ops = ops_for(state.range(1));
  const auto a = random_f32(dim, 1), b = random_f32(dim, 2);
  for (auto _ : state) {
    benchmark::DoNotOptimize(ops.l2_sq(a, b));
  }
  state.SetLabel(std::string(ops.name));
  state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_L2Sq)->ArgsProduct({{64, 128, 384, 768}, {0, 1}});

static void BM_CosineDistance(benchmark::State& state) {
  const auto dim = static_cast<std::size_t>(state.range(0));
  const auto& ops = ops_for(state.range(1));
  const auto a = random_f32(dim, 3), b = random_f32(dim, 4);
  for (auto _ : state) {
    benchmark::DoNotOptimize(ops.cosine_distance(a, b));
  }
  state.SetLabel(std::string(ops.name));
}
BENCHMARK(BM_CosineDistance)->ArgsProduct({{128, 384}, {0, 1}});

static void BM_L2SqI8(benchmark::State& state) {
  const auto dim = static_cast<std::size_t>(state.range(0));
  const auto& ops = ops_for(state.range(1));
  const auto a = random_i8(dim, 5), b = random_i8(dim, 6);
  for (auto _ : state) {
    benchmark::DoNotOptimize(ops.l2_sq_i8(a, b));
  }
  state.SetLabel(std::string(ops.name));
}
BENCHMARK(BM_L2SqI8)->ArgsProduct({{128, 384, 768}, {0, 1}});

static void BM_BatchL2Sq(benchmark::State& state) {
  const std::size_t dim = 128;
  const auto nvec = static_cast<std::size_t>(state.range(0));
  const auto& ops = select_backend_auto();
  const auto q = random_f32(dim, 7);
  const auto rows = random_f32(nvec * dim, 8);
  std::vector<float> out(nvec);
  for (auto _ : state) {
    ops.batch_l2_sq(q, rows.data(), nvec, dim, out.data());
    benchmark::ClobberMemory();
  }
  state.SetItemsProcessed(state.iterations() * static_cast<std::int64_t>(nvec));
}
BENCHMARK(BM_BatchL2Sq)->Arg(256)->Arg(4096);

BENCHMARK_MAIN();
