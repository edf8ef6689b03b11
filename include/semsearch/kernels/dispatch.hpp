#pragma once

/** \file dispatch.hpp
 *  \brief SIMD-ready kernel interface and dispatcher. Scalar is the default backend.
 *
 * Preconditions for all ops: a.size() == b.size() > 0; f32 inputs finite.
 * Every backend agrees with the scalar reference in distance.hpp within a fixed relative
 * tolerance (f32) or exactly (int8).
 * Determinism: pure functions, O(d) complexity; no allocations; no exceptions on hot paths.
 */

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace semsearch::kernels {

struct KernelOps {
  std::string_view name;

  float (*l2_sq)(std::span<const float>, std::span<const float>) noexcept;
  float (*inner_product)(std::span<const float>, std::span<const float>) noexcept;
  float (*cosine_similarity)(std::span<const float>, std::span<const float>) noexcept;
  float (*cosine_distance)(std::span<const float>, std::span<const float>) noexcept;

  // One query against nvec contiguous rows of length dim
  void (*batch_l2_sq)(std::span<const float> query,
                      const float* vectors, std::size_t nvec, std::size_t dim,
                      float* distances) noexcept;
  void (*batch_inner_product)(std::span<const float> query,
                              const float* vectors, std::size_t nvec, std::size_t dim,
                              float* distances) noexcept;

  // Int8 codes, int32 accumulation; callers apply the quantization scale
  std::int32_t (*l2_sq_i8)(std::span<const std::int8_t>, std::span<const std::int8_t>) noexcept;
  std::int32_t (*dot_i8)(std::span<const std::int8_t>, std::span<const std::int8_t>) noexcept;
  float (*cosine_distance_i8)(std::span<const std::int8_t>, std::span<const std::int8_t>) noexcept;
};

// Returns a stable reference valid for the process lifetime. Unknown or unsupported names
// fall back to "scalar".
const KernelOps& select_backend(std::string_view name = "scalar") noexcept;

/** \brief Auto-selects a kernel backend based on CPU features.
 *
 * SEMSEARCH_KERNEL_BACKEND (scalar, avx2, auto) overrides detection.
 * Thread-safe initialization and stable reference semantics apply.
 */
const KernelOps& select_backend_auto() noexcept;

/** \brief True when the running CPU supports the AVX2 backend (AVX2 and FMA). */
bool avx2_available() noexcept;

} // namespace semsearch::kernels
