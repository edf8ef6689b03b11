#pragma once

/** \file distance.hpp
 *  \brief Scalar reference distance kernels for f32 and int8 vectors.
 *
 * Preconditions
 * - a.size() == b.size() > 0 (the index fixes the dimension at build time)
 * - f32 inputs are finite
 * Cosine kernels return similarity 0 (distance 1) when either norm is zero.
 * Int8 kernels accumulate in std::int32_t; exact for dimensions below 2^17.
 * Determinism: pure functions, no allocations, no exceptions on hot paths.
 */

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <span>

#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
#include <immintrin.h>
#endif

namespace semsearch::kernels {

namespace detail {

/** \brief Software prefetch hint for scalar loops. */
inline void scalar_prefetch(const void* ptr) noexcept {
#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
    _mm_prefetch(static_cast<const char*>(ptr) + 64, _MM_HINT_T0);
#else
    __builtin_prefetch(static_cast<const char*>(ptr) + 64, 0, 3);
#endif
}

/** \brief Maps a similarity to a distance clamped into [0, 2]. */
inline float similarity_to_distance(float sim) noexcept {
    return std::clamp(1.0f - sim, 0.0f, 2.0f);
}

} // namespace detail

/** \brief Sum of squared differences: sum((a[i] - b[i])^2). O(d). */
inline float l2_sq(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  // 4-way unrolled loop for instruction-level parallelism
  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    if (i + 16 < n) {
      detail::scalar_prefetch(pa + i);
      detail::scalar_prefetch(pb + i);
    }
    const float d0 = pa[i] - pb[i];
    const float d1 = pa[i+1] - pb[i+1];
    const float d2 = pa[i+2] - pb[i+2];
    const float d3 = pa[i+3] - pb[i+3];
    s0 += d0 * d0;
    s1 += d1 * d1;
    s2 += d2 * d2;
    s3 += d3 * d3;
  }

  float s = (s0 + s1) + (s2 + s3);
  for (; i < n; ++i) {
    const float d = pa[i] - pb[i];
    s += d * d;
  }
  return s;
}

/** \brief Inner product: sum(a[i] * b[i]). O(d). */
inline float inner_product(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float s0 = 0.0f, s1 = 0.0f, s2 = 0.0f, s3 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~std::size_t{3};
  for (; i < unroll_end; i += 4) {
    if (i + 16 < n) {
      detail::scalar_prefetch(pa + i);
      detail::scalar_prefetch(pb + i);
    }
    s0 += pa[i] * pb[i];
    s1 += pa[i+1] * pb[i+1];
    s2 += pa[i+2] * pb[i+2];
    s3 += pa[i+3] * pb[i+3];
  }

  float s = (s0 + s1) + (s2 + s3);
  for (; i < n; ++i) {
    s += pa[i] * pb[i];
  }
  return s;
}

/** \brief Cosine similarity: (a·b) / (||a|| * ||b||); 0 if a norm is zero. O(d). */
inline float cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept {
  const std::size_t n = a.size();
  const float* pa = a.data();
  const float* pb = b.data();

  float dot0 = 0.0f, dot1 = 0.0f, na0 = 0.0f, na1 = 0.0f, nb0 = 0.0f, nb1 = 0.0f;
  std::size_t i = 0;

  const std::size_t unroll_end = n & ~std::size_t{1};
  for (; i < unroll_end; i += 2) {
    const float a0 = pa[i], b0 = pb[i];
    const float a1 = pa[i+1], b1 = pb[i+1];
    dot0 += a0 * b0; na0 += a0 * a0; nb0 += b0 * b0;
    dot1 += a1 * b1; na1 += a1 * a1; nb1 += b1 * b1;
  }

  float dot = dot0 + dot1;
  float na = na0 + na1;
  float nb = nb0 + nb1;
  for (; i < n; ++i) {
    dot += pa[i] * pb[i];
    na += pa[i] * pa[i];
    nb += pb[i] * pb[i];
  }

  const float denom = std::sqrt(na * nb);
  return denom > 0.0f ? dot / denom : 0.0f;
}

/** \brief Cosine distance defined as 1 - cosine_similarity(a,b), clamped to [0, 2]. O(d). */
inline float cosine_distance(std::span<const float> a, std::span<const float> b) noexcept {
  return detail::similarity_to_distance(cosine_similarity(a, b));
}

/** \brief Integer squared L2 over int8 codes. Zero points cancel, so raw codes are used. */
inline std::int32_t l2_sq_i8(std::span<const std::int8_t> a, std::span<const std::int8_t> b) noexcept {
  const std::size_t n = a.size();
  std::int32_t s = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const std::int32_t d = static_cast<std::int32_t>(a[i]) - static_cast<std::int32_t>(b[i]);
    s += d * d;
  }
  return s;
}

/** \brief Integer dot product over int8 codes. */
inline std::int32_t dot_i8(std::span<const std::int8_t> a, std::span<const std::int8_t> b) noexcept {
  const std::size_t n = a.size();
  std::int32_t s = 0;
  for (std::size_t i = 0; i < n; ++i) {
    s += static_cast<std::int32_t>(a[i]) * static_cast<std::int32_t>(b[i]);
  }
  return s;
}

/** \brief Cosine distance over symmetric int8 codes; scale-invariant. */
inline float cosine_distance_i8(std::span<const std::int8_t> a, std::span<const std::int8_t> b) noexcept {
  const std::size_t n = a.size();
  std::int32_t dot = 0, na = 0, nb = 0;
  for (std::size_t i = 0; i < n; ++i) {
    const std::int32_t av = a[i];
    const std::int32_t bv = b[i];
    dot += av * bv;
    na += av * av;
    nb += bv * bv;
  }
  const double denom = std::sqrt(static_cast<double>(na) * static_cast<double>(nb));
  const float sim = denom > 0.0 ? static_cast<float>(static_cast<double>(dot) / denom) : 0.0f;
  return detail::similarity_to_distance(sim);
}

} // namespace semsearch::kernels
