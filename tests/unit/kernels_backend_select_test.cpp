#include <catch2/catch_all.hpp>
#include <semsearch/kernels/dispatch.hpp>
#include <semsearch/kernels/backends/scalar.hpp>
#include <semsearch/kernels/metric.hpp>

#include <cstdlib>
#include <random>
#include <vector>

using namespace semsearch::kernels;
using Catch::Approx;

TEST_CASE("backend selection returns stable references", "[kernels][dispatch]") {
  const auto& s1 = select_backend("scalar");
  const auto& s2 = select_backend("scalar");
  REQUIRE(&s1 == &s2);
  REQUIRE(s1.name == "scalar");

  const auto& u = select_backend("does-not-exist");
  REQUIRE(&u == &s1); // fallback to scalar

  const auto& a1 = select_backend_auto();
  const auto& a2 = select_backend_auto();
  REQUIRE(&a1 == &a2);
}

TEST_CASE("every op of the scalar table is wired", "[kernels][dispatch]") {
  const auto& ops = select_backend("scalar");
  REQUIRE(ops.l2_sq != nullptr);
  REQUIRE(ops.inner_product != nullptr);
  REQUIRE(ops.cosine_similarity != nullptr);
  REQUIRE(ops.cosine_distance != nullptr);
  REQUIRE(ops.batch_l2_sq != nullptr);
  REQUIRE(ops.batch_inner_product != nullptr);
  REQUIRE(ops.l2_sq_i8 != nullptr);
  REQUIRE(ops.dot_i8 != nullptr);
  REQUIRE(ops.cosine_distance_i8 != nullptr);

  float a[3]{1, 2, 3}; float b[3]{3, 2, 1};
  REQUIRE(ops.l2_sq(a, b) == Approx(8.0f));
  REQUIRE(ops.inner_product(a, b) == Approx(10.0f));
  REQUIRE(ops.cosine_similarity(a, a) == Approx(1.0f));
}

TEST_CASE("metric tags parse and stay stable", "[kernels][metric]") {
  REQUIRE(parse_metric("l2") == Metric::l2);
  REQUIRE(parse_metric("cosine") == Metric::cosine);
  REQUIRE(parse_metric("cos") == Metric::cosine);
  REQUIRE_FALSE(parse_metric("ip").has_value());
  REQUIRE(static_cast<std::uint32_t>(Metric::l2) == 0u);
  REQUIRE(static_cast<std::uint32_t>(Metric::cosine) == 1u);
  REQUIRE(is_known_metric(1));
  REQUIRE_FALSE(is_known_metric(2));
}
