#pragma once

/** \file scalar_quantizer.hpp
 *  \brief Per-corpus int8 scalar quantization of f32 vectors.
 *
 * One scale (and optional zero point) is fitted over the whole build corpus and shared by
 * every vector in the index. Quantization approximately preserves distance ordering: with the
 * scale applied after integer accumulation, L2 distances are those of the dequantized vectors,
 * so ranking errors come only from rounding. Recall loss is the accepted price for 4x smaller
 * vectors and integer kernels.
 *
 * Code mapping:
 * - symmetric:  q = clamp(round(x / scale), -127, 127), zero point 0
 * - asymmetric: q = clamp(round(x / scale) + zero_point, -128, 127)
 * - dequantize: x = scale * (q - zero_point)
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

#include "semsearch/error.hpp"

namespace semsearch::index {

/** \brief Fitted quantization parameters. */
struct QuantizationScale {
    float scale{1.0f};                   /**< Real value per code step (> 0) */
    std::int32_t zero_point{0};          /**< Code representing 0.0 (asymmetric only) */
    bool has_zero_point{false};          /**< False for symmetric scales */

    [[nodiscard]] auto code_min() const noexcept -> std::int32_t { return has_zero_point ? -128 : -127; }
    [[nodiscard]] auto code_max() const noexcept -> std::int32_t { return 127; }
};

/** \brief Fitting parameters. */
struct QuantizerParams {
    bool symmetric{true};                /**< Symmetric range around 0 (required for cosine) */
    std::size_t sample_size{0};          /**< Rows sampled for fitting (0 = all rows) */
    std::uint32_t seed{42};              /**< Seed for row sampling */
};

/** \brief Fit a scale over n row-major vectors of dimension dim.
 *
 * Asymmetric zero points are not limited to the code range: a range that excludes 0 gets an
 * offset outside [-128, 127] so that lo and hi still map to the two code extremes.
 *
 * \return Scale, or invalid_argument for empty input, non-finite values in the sample, or an
 *         offset that does not fit in int32
 * Complexity: O(min(n, sample_size) * dim)
 */
auto fit(const float* data, std::size_t n, std::size_t dim, const QuantizerParams& params = {})
    -> std::expected<QuantizationScale, core::error>;

/** \brief Quantize one vector. Total: NaN maps to the zero point, infinities clamp.
 *
 * Preconditions: out.size() == v.size()
 */
void quantize(std::span<const float> v, const QuantizationScale& scale,
              std::span<std::int8_t> out) noexcept;

auto quantize(std::span<const float> v, const QuantizationScale& scale)
    -> std::vector<std::int8_t>;

/** \brief Reconstruct approximate f32 values. Preconditions: out.size() == q.size() */
void dequantize(std::span<const std::int8_t> q, const QuantizationScale& scale,
                std::span<float> out) noexcept;

} // namespace semsearch::index
