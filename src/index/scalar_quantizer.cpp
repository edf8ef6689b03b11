#include "semsearch/index/scalar_quantizer.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>

namespace semsearch::index {

namespace {

auto sample_rows(std::size_t n, const QuantizerParams& params) -> std::vector<std::size_t> {
    std::vector<std::size_t> rows(n);
    std::iota(rows.begin(), rows.end(), std::size_t{0});
    if (params.sample_size == 0 || params.sample_size >= n) {
        return rows;
    }
    std::mt19937 rng(params.seed);
    std::shuffle(rows.begin(), rows.end(), rng);
    rows.resize(params.sample_size);
    std::sort(rows.begin(), rows.end());
    return rows;
}

} // namespace

auto fit(const float* data, std::size_t n, std::size_t dim, const QuantizerParams& params)
    -> std::expected<QuantizationScale, core::error> {
    if (data == nullptr || n == 0 || dim == 0) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "cannot fit a quantizer on an empty corpus",
            "index.quantizer"});
    }

    float lo = std::numeric_limits<float>::max();
    float hi = std::numeric_limits<float>::lowest();
    for (const std::size_t row : sample_rows(n, params)) {
        const float* v = data + row * dim;
        for (std::size_t j = 0; j < dim; ++j) {
            if (!std::isfinite(v[j])) {
                return std::unexpected(core::error{
                    core::error_code::invalid_argument,
                    "non-finite value in quantizer sample at row " + std::to_string(row),
                    "index.quantizer"});
            }
            lo = std::min(lo, v[j]);
            hi = std::max(hi, v[j]);
        }
    }

    QuantizationScale scale;
    if (params.symmetric) {
        const float max_abs = std::max(std::fabs(lo), std::fabs(hi));
        scale.scale = max_abs > 0.0f ? max_abs / 127.0f : 1.0f;
        return scale;
    }

    const float range = hi - lo;
    scale.has_zero_point = true;
    scale.scale = range > 0.0f ? range / 255.0f : 1.0f;
    // The zero point may fall far outside the code range when [lo, hi] excludes 0.
    const double zp = std::round(-128.0 - static_cast<double>(lo) / static_cast<double>(scale.scale));
    if (!(std::fabs(zp) < static_cast<double>(std::numeric_limits<std::int32_t>::max()))) {
        return std::unexpected(core::error{
            core::error_code::invalid_argument,
            "value range is too narrow for its offset to be representable",
            "index.quantizer"});
    }
    scale.zero_point = static_cast<std::int32_t>(zp);
    return scale;
}

void quantize(std::span<const float> v, const QuantizationScale& scale,
              std::span<std::int8_t> out) noexcept {
    const double step = static_cast<double>(scale.scale);
    const double lo = static_cast<double>(scale.code_min());
    const double hi = static_cast<double>(scale.code_max());
    const double zp = static_cast<double>(scale.zero_point);
    for (std::size_t i = 0; i < v.size(); ++i) {
        const float x = v[i];
        double q;
        if (std::isnan(x)) {
            q = std::clamp(zp, lo, hi);
        } else {
            // Offset before clamping; infinities clamp to the range ends.
            q = std::clamp(std::round(static_cast<double>(x) / step) + zp, lo, hi);
        }
        out[i] = static_cast<std::int8_t>(q);
    }
}

auto quantize(std::span<const float> v, const QuantizationScale& scale)
    -> std::vector<std::int8_t> {
    std::vector<std::int8_t> out(v.size());
    quantize(v, scale, out);
    return out;
}

void dequantize(std::span<const std::int8_t> q, const QuantizationScale& scale,
                std::span<float> out) noexcept {
    for (std::size_t i = 0; i < q.size(); ++i) {
        out[i] = scale.scale * static_cast<float>(static_cast<std::int32_t>(q[i]) - scale.zero_point);
    }
}

} // namespace semsearch::index
