#include <catch2/catch_all.hpp>
#include <semsearch/kernels/dispatch.hpp>
#include <semsearch/kernels/backends/scalar.hpp>

#include <algorithm>
#include <cmath>
#include <random>
#include <vector>

using namespace semsearch::kernels;
using Catch::Approx;

namespace {

std::vector<float> random_f32(std::mt19937& rng, std::size_t n) {
  std::uniform_real_distribution<float> dist(-1.0f, 1.0f);
  std::vector<float> v(n);
  for (auto& x : v) x = dist(rng);
  return v;
}

std::vector<std::int8_t> random_i8(std::mt19937& rng, std::size_t n) {
  std::uniform_int_distribution<int> dist(-127, 127);
  std::vector<std::int8_t> v(n);
  for (auto& x : v) x = static_cast<std::int8_t>(dist(rng));
  return v;
}

// Naive double-accumulating references.
double ref_l2_sq(const std::vector<float>& a, const std::vector<float>& b) {
  double acc = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    const double d = static_cast<double>(a[i]) - static_cast<double>(b[i]);
    acc += d * d;
  }
  return acc;
}

double ref_inner_product(const std::vector<float>& a, const std::vector<float>& b) {
  double acc = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) acc += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  return acc;
}

// Sum of |a_i * b_i|; the scale against which inner-product rounding is measured.
double abs_inner_product(const std::vector<float>& a, const std::vector<float>& b) {
  double acc = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) acc += std::fabs(static_cast<double>(a[i]) * static_cast<double>(b[i]));
  return acc;
}

double ref_cosine_distance(const std::vector<float>& a, const std::vector<float>& b) {
  const double na = std::sqrt(ref_inner_product(a, a));
  const double nb = std::sqrt(ref_inner_product(b, b));
  if (na == 0.0 || nb == 0.0) return 1.0;
  return std::clamp(1.0 - ref_inner_product(a, b) / (na * nb), 0.0, 2.0);
}

constexpr double kRelTol = 1e-4;

} // namespace

TEST_CASE("scalar and auto backends agree with a double-precision reference", "[kernels][simd][reference]") {
  const KernelOps* tables[] = {&get_scalar_ops(), &select_backend_auto()};

  std::mt19937 rng(2024);
  std::uniform_int_distribution<std::size_t> dim_dist(1, 1031);
  for (int trial = 0; trial < 150; ++trial) {
    const std::size_t dim = trial < 24 ? static_cast<std::size_t>(trial + 1) : dim_dist(rng);
    const auto a = random_f32(rng, dim);
    const auto b = random_f32(rng, dim);
    const double l2 = ref_l2_sq(a, b);
    const double ip = ref_inner_product(a, b);
    const double ip_scale = abs_inner_product(a, b);
    const double cd = ref_cosine_distance(a, b);

    for (const KernelOps* ops : tables) {
      INFO("backend: " << ops->name << " dim: " << dim);
      REQUIRE(std::fabs(ops->l2_sq(a, b) - l2) <= kRelTol * l2 + 1e-7);
      REQUIRE(std::fabs(ops->inner_product(a, b) - ip) <= kRelTol * ip_scale + 1e-7);
      // |cos| <= 1, so the absolute bound is the relative bound on the similarity.
      REQUIRE(std::fabs(ops->cosine_distance(a, b) - cd) <= kRelTol);
    }
  }
}

TEST_CASE("auto-selected backend matches scalar on random dimensions", "[kernels][simd]") {
  const auto& scalar = get_scalar_ops();
  const auto& best = select_backend_auto();
  INFO("backend: " << best.name);

  std::mt19937 rng(1234);
  std::uniform_int_distribution<std::size_t> dim_dist(1, 777);
  for (int trial = 0; trial < 200; ++trial) {
    // Non-multiples of 8 and 16 exercise the tails.
    const std::size_t dim = trial < 20 ? static_cast<std::size_t>(trial + 1) : dim_dist(rng);
    const auto a = random_f32(rng, dim);
    const auto b = random_f32(rng, dim);
    REQUIRE(best.l2_sq(a, b) == Approx(scalar.l2_sq(a, b)).epsilon(1e-4).margin(1e-5));
    REQUIRE(best.inner_product(a, b) == Approx(scalar.inner_product(a, b)).epsilon(1e-4).margin(1e-4));
    REQUIRE(best.cosine_distance(a, b) == Approx(scalar.cosine_distance(a, b)).epsilon(1e-4).margin(1e-5));

    const auto qa = random_i8(rng, dim);
    const auto qb = random_i8(rng, dim);
    REQUIRE(best.l2_sq_i8(qa, qb) == scalar.l2_sq_i8(qa, qb));
    REQUIRE(best.dot_i8(qa, qb) == scalar.dot_i8(qa, qb));
    REQUIRE(best.cosine_distance_i8(qa, qb) == Approx(scalar.cosine_distance_i8(qa, qb)).epsilon(1e-5).margin(1e-6));
  }
}

TEST_CASE("batched kernels agree with the single-pair kernels", "[kernels][simd][batch]") {
  const auto& ops = select_backend_auto();
  std::mt19937 rng(99);
  for (std::size_t dim : {5u, 16u, 33u, 384u}) {
    const std::size_t n = 37;
    const auto query = random_f32(rng, dim);
    const auto rows = random_f32(rng, n * dim);
    std::vector<float> l2(n), ip(n);
    ops.batch_l2_sq(query, rows.data(), n, dim, l2.data());
    ops.batch_inner_product(query, rows.data(), n, dim, ip.data());
    for (std::size_t i = 0; i < n; ++i) {
      std::span<const float> row(rows.data() + i * dim, dim);
      REQUIRE(l2[i] == Approx(ops.l2_sq(query, row)).epsilon(1e-5).margin(1e-6));
      REQUIRE(ip[i] == Approx(ops.inner_product(query, row)).epsilon(1e-5).margin(1e-4));
    }
  }
}

TEST_CASE("avx2 backend is selected by name only when available", "[kernels][simd]") {
  const auto& avx2 = select_backend("avx2");
  if (avx2_available()) {
    REQUIRE(avx2.name == "avx2");
  } else {
    REQUIRE(&avx2 == &get_scalar_ops());
  }
}
