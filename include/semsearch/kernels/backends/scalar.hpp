#pragma once

/** \file scalar.hpp
 *  \brief Scalar backend implementing KernelOps via distance.hpp reference kernels.
 */

#include <span>

#include "semsearch/kernels/dispatch.hpp"
#include "semsearch/kernels/distance.hpp"

namespace semsearch::kernels {

inline void scalar_batch_l2_sq(std::span<const float> query,
                               const float* vectors, std::size_t nvec, std::size_t dim,
                               float* distances) noexcept {
    for (std::size_t v = 0; v < nvec; ++v) {
        distances[v] = l2_sq(query, std::span<const float>(vectors + v * dim, dim));
    }
}

inline void scalar_batch_inner_product(std::span<const float> query,
                                       const float* vectors, std::size_t nvec, std::size_t dim,
                                       float* distances) noexcept {
    for (std::size_t v = 0; v < nvec; ++v) {
        distances[v] = inner_product(query, std::span<const float>(vectors + v * dim, dim));
    }
}

inline const KernelOps& get_scalar_ops() noexcept {
  static const KernelOps ops{
      "scalar",
      &l2_sq, &inner_product, &cosine_similarity, &cosine_distance,
      &scalar_batch_l2_sq, &scalar_batch_inner_product,
      &l2_sq_i8, &dot_i8, &cosine_distance_i8
  };
  return ops;
}

} // namespace semsearch::kernels
