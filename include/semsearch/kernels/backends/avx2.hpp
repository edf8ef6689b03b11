#pragma once

#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)

/** \file avx2.hpp
 *  \brief AVX2 SIMD kernels for f32 and int8 distance computation.
 *
 * - 8-wide float operations with FMA instructions
 * - int8 codes widened to int16 and reduced with vpmaddwd into int32 lanes
 * - Scalar tails for dimensions that are not a multiple of the vector width
 *
 * Functions carry a target attribute so the translation unit builds without -mavx2; callers
 * must check avx2_available() before using get_avx2_ops().
 * Preconditions: a.size() == b.size() > 0; f32 inputs finite.
 * Thread-safety: Pure functions, no shared state
 */

#include <immintrin.h>

#include <cmath>
#include <cstdint>
#include <span>

#include "semsearch/kernels/dispatch.hpp"
#include "semsearch/kernels/distance.hpp"

#define SEMSEARCH_AVX2_TARGET gnu::target("avx2,fma")

namespace semsearch::kernels {

namespace detail {

/** \brief Horizontal sum of 8 floats in an AVX2 register. */
[[SEMSEARCH_AVX2_TARGET]]
inline auto hsum_ps(__m256 v) noexcept -> float {
    const __m128 hi = _mm256_extractf128_ps(v, 1);
    const __m128 lo = _mm256_castps256_ps128(v);
    const __m128 sum = _mm_add_ps(hi, lo);
    const __m128 shuf = _mm_movehdup_ps(sum);
    const __m128 sums = _mm_add_ps(sum, shuf);
    const __m128 shuf2 = _mm_movehl_ps(sums, sums);
    const __m128 result = _mm_add_ss(sums, shuf2);
    return _mm_cvtss_f32(result);
}

/** \brief Horizontal sum of 8 int32 lanes. */
[[SEMSEARCH_AVX2_TARGET]]
inline auto hsum_epi32(__m256i v) noexcept -> std::int32_t {
    const __m128i lo = _mm256_castsi256_si128(v);
    const __m128i hi = _mm256_extracti128_si256(v, 1);
    __m128i s = _mm_add_epi32(lo, hi);
    s = _mm_add_epi32(s, _mm_shuffle_epi32(s, _MM_SHUFFLE(1, 0, 3, 2)));
    s = _mm_add_epi32(s, _mm_shuffle_epi32(s, _MM_SHUFFLE(2, 3, 0, 1)));
    return _mm_cvtsi128_si32(s);
}

/** \brief Loads 16 int8 codes and sign-extends them to 16 int16 lanes. */
[[SEMSEARCH_AVX2_TARGET]]
inline auto load_widen_i8(const std::int8_t* p) noexcept -> __m256i {
    return _mm256_cvtepi8_epi16(_mm_loadu_si128(reinterpret_cast<const __m128i*>(p)));
}

} // namespace detail

/** \brief AVX2 L2 squared distance. */
[[gnu::hot, SEMSEARCH_AVX2_TARGET]]
inline auto avx2_l2_sq(std::span<const float> a, std::span<const float> b) noexcept -> float {
    const std::size_t n = a.size();
    const float* pa = a.data();
    const float* pb = b.data();

    __m256 sum = _mm256_setzero_ps();
    std::size_t i = 0;

    const std::size_t simd_end = n & ~std::size_t{7};
    for (; i < simd_end; i += 8) {
        const __m256 va = _mm256_loadu_ps(pa + i);
        const __m256 vb = _mm256_loadu_ps(pb + i);
        const __m256 diff = _mm256_sub_ps(va, vb);
        sum = _mm256_fmadd_ps(diff, diff, sum);
    }

    float result = detail::hsum_ps(sum);
    for (; i < n; ++i) {
        const float diff = pa[i] - pb[i];
        result += diff * diff;
    }
    return result;
}

/** \brief AVX2 inner product. */
[[gnu::hot, SEMSEARCH_AVX2_TARGET]]
inline auto avx2_inner_product(std::span<const float> a, std::span<const float> b) noexcept -> float {
    const std::size_t n = a.size();
    const float* pa = a.data();
    const float* pb = b.data();

    __m256 sum = _mm256_setzero_ps();
    std::size_t i = 0;

    const std::size_t simd_end = n & ~std::size_t{7};
    for (; i < simd_end; i += 8) {
        const __m256 va = _mm256_loadu_ps(pa + i);
        const __m256 vb = _mm256_loadu_ps(pb + i);
        sum = _mm256_fmadd_ps(va, vb, sum);
    }

    float result = detail::hsum_ps(sum);
    for (; i < n; ++i) {
        result += pa[i] * pb[i];
    }
    return result;
}

/** \brief AVX2 cosine similarity with dot product and both norms in one pass. */
[[gnu::hot, SEMSEARCH_AVX2_TARGET]]
inline auto avx2_cosine_similarity(std::span<const float> a, std::span<const float> b) noexcept -> float {
    const std::size_t n = a.size();
    const float* pa = a.data();
    const float* pb = b.data();

    __m256 dot_sum = _mm256_setzero_ps();
    __m256 norm_a_sum = _mm256_setzero_ps();
    __m256 norm_b_sum = _mm256_setzero_ps();
    std::size_t i = 0;

    const std::size_t simd_end = n & ~std::size_t{7};
    for (; i < simd_end; i += 8) {
        const __m256 va = _mm256_loadu_ps(pa + i);
        const __m256 vb = _mm256_loadu_ps(pb + i);
        dot_sum = _mm256_fmadd_ps(va, vb, dot_sum);
        norm_a_sum = _mm256_fmadd_ps(va, va, norm_a_sum);
        norm_b_sum = _mm256_fmadd_ps(vb, vb, norm_b_sum);
    }

    float dot = detail::hsum_ps(dot_sum);
    float norm_a_sq = detail::hsum_ps(norm_a_sum);
    float norm_b_sq = detail::hsum_ps(norm_b_sum);
    for (; i < n; ++i) {
        const float va = pa[i];
        const float vb = pb[i];
        dot += va * vb;
        norm_a_sq += va * va;
        norm_b_sq += vb * vb;
    }

    const float norm_prod = std::sqrt(norm_a_sq * norm_b_sq);
    return (norm_prod > 0.0f) ? (dot / norm_prod) : 0.0f;
}

[[gnu::hot, SEMSEARCH_AVX2_TARGET]]
inline auto avx2_cosine_distance(std::span<const float> a, std::span<const float> b) noexcept -> float {
    return detail::similarity_to_distance(avx2_cosine_similarity(a, b));
}

[[SEMSEARCH_AVX2_TARGET]]
inline void avx2_batch_l2_sq(std::span<const float> query,
                             const float* vectors, std::size_t nvec, std::size_t dim,
                             float* distances) noexcept {
    for (std::size_t v = 0; v < nvec; ++v) {
        if (v + 1 < nvec) {
            _mm_prefetch(reinterpret_cast<const char*>(vectors + (v + 1) * dim), _MM_HINT_T0);
        }
        distances[v] = avx2_l2_sq(query, std::span<const float>(vectors + v * dim, dim));
    }
}

[[SEMSEARCH_AVX2_TARGET]]
inline void avx2_batch_inner_product(std::span<const float> query,
                                     const float* vectors, std::size_t nvec, std::size_t dim,
                                     float* distances) noexcept {
    for (std::size_t v = 0; v < nvec; ++v) {
        if (v + 1 < nvec) {
            _mm_prefetch(reinterpret_cast<const char*>(vectors + (v + 1) * dim), _MM_HINT_T0);
        }
        distances[v] = avx2_inner_product(query, std::span<const float>(vectors + v * dim, dim));
    }
}

/** \brief AVX2 int8 squared L2; differences fit int16, pair sums fit int32. */
[[gnu::hot, SEMSEARCH_AVX2_TARGET]]
inline auto avx2_l2_sq_i8(std::span<const std::int8_t> a, std::span<const std::int8_t> b) noexcept -> std::int32_t {
    const std::size_t n = a.size();
    const std::int8_t* pa = a.data();
    const std::int8_t* pb = b.data();

    __m256i acc = _mm256_setzero_si256();
    std::size_t i = 0;
    const std::size_t simd_end = n & ~std::size_t{15};
    for (; i < simd_end; i += 16) {
        const __m256i diff = _mm256_sub_epi16(detail::load_widen_i8(pa + i), detail::load_widen_i8(pb + i));
        acc = _mm256_add_epi32(acc, _mm256_madd_epi16(diff, diff));
    }

    std::int32_t result = detail::hsum_epi32(acc);
    for (; i < n; ++i) {
        const std::int32_t d = static_cast<std::int32_t>(pa[i]) - static_cast<std::int32_t>(pb[i]);
        result += d * d;
    }
    return result;
}

[[gnu::hot, SEMSEARCH_AVX2_TARGET]]
inline auto avx2_dot_i8(std::span<const std::int8_t> a, std::span<const std::int8_t> b) noexcept -> std::int32_t {
    const std::size_t n = a.size();
    const std::int8_t* pa = a.data();
    const std::int8_t* pb = b.data();

    __m256i acc = _mm256_setzero_si256();
    std::size_t i = 0;
    const std::size_t simd_end = n & ~std::size_t{15};
    for (; i < simd_end; i += 16) {
        acc = _mm256_add_epi32(acc, _mm256_madd_epi16(detail::load_widen_i8(pa + i),
                                                      detail::load_widen_i8(pb + i)));
    }

    std::int32_t result = detail::hsum_epi32(acc);
    for (; i < n; ++i) {
        result += static_cast<std::int32_t>(pa[i]) * static_cast<std::int32_t>(pb[i]);
    }
    return result;
}

[[gnu::hot, SEMSEARCH_AVX2_TARGET]]
inline auto avx2_cosine_distance_i8(std::span<const std::int8_t> a, std::span<const std::int8_t> b) noexcept -> float {
    const std::size_t n = a.size();
    const std::int8_t* pa = a.data();
    const std::int8_t* pb = b.data();

    __m256i dot_acc = _mm256_setzero_si256();
    __m256i na_acc = _mm256_setzero_si256();
    __m256i nb_acc = _mm256_setzero_si256();
    std::size_t i = 0;
    const std::size_t simd_end = n & ~std::size_t{15};
    for (; i < simd_end; i += 16) {
        const __m256i va = detail::load_widen_i8(pa + i);
        const __m256i vb = detail::load_widen_i8(pb + i);
        dot_acc = _mm256_add_epi32(dot_acc, _mm256_madd_epi16(va, vb));
        na_acc = _mm256_add_epi32(na_acc, _mm256_madd_epi16(va, va));
        nb_acc = _mm256_add_epi32(nb_acc, _mm256_madd_epi16(vb, vb));
    }

    std::int32_t dot = detail::hsum_epi32(dot_acc);
    std::int32_t na = detail::hsum_epi32(na_acc);
    std::int32_t nb = detail::hsum_epi32(nb_acc);
    for (; i < n; ++i) {
        const std::int32_t av = pa[i];
        const std::int32_t bv = pb[i];
        dot += av * bv;
        na += av * av;
        nb += bv * bv;
    }

    const double denom = std::sqrt(static_cast<double>(na) * static_cast<double>(nb));
    const float sim = denom > 0.0 ? static_cast<float>(static_cast<double>(dot) / denom) : 0.0f;
    return detail::similarity_to_distance(sim);
}

inline const KernelOps& get_avx2_ops() noexcept {
    static const KernelOps ops{
        "avx2",
        &avx2_l2_sq, &avx2_inner_product, &avx2_cosine_similarity, &avx2_cosine_distance,
        &avx2_batch_l2_sq, &avx2_batch_inner_product,
        &avx2_l2_sq_i8, &avx2_dot_i8, &avx2_cosine_distance_i8
    };
    return ops;
}

} // namespace semsearch::kernels

#endif // x86_64
