#include "semsearch/index/index_builder.hpp"
#include "semsearch/core/platform_utils.hpp"
#include "semsearch/index/hnsw_io.hpp"

#include <chrono>
#include <cmath>
#include <iostream>
#include <string>

namespace semsearch::index {

namespace {

auto builder_error(core::error_code code, std::string msg) -> core::error {
    return core::error{code, std::move(msg), "index.builder"};
}

auto validate_corpus(std::span<const float> vectors, std::size_t dim)
    -> std::expected<std::size_t, core::error> {
    if (dim == 0) {
        return std::unexpected(builder_error(core::error_code::invalid_argument, "dimension must be > 0"));
    }
    if (vectors.empty()) {
        return std::unexpected(builder_error(core::error_code::invalid_argument, "empty corpus"));
    }
    if (vectors.size() % dim != 0) {
        return std::unexpected(builder_error(core::error_code::invalid_argument,
            "corpus holds " + std::to_string(vectors.size()) + " values, not a multiple of dim " +
            std::to_string(dim)));
    }
    for (std::size_t i = 0; i < vectors.size(); ++i) {
        if (!std::isfinite(vectors[i])) {
            return std::unexpected(builder_error(core::error_code::invalid_argument,
                "non-finite value in row " + std::to_string(i / dim)));
        }
    }
    return vectors.size() / dim;
}

} // namespace

auto build_index(std::span<const float> vectors, std::size_t dim, const IndexBuildConfig& config)
    -> std::expected<HnswIndex, core::error> {
    const bool verbose = config.verbose || core::verbose_from_env();
    auto n = validate_corpus(vectors, dim);
    if (!n) return std::unexpected(n.error());

    const auto t0 = std::chrono::steady_clock::now();
    std::optional<QuantizationScale> scale;
    if (config.quantize) {
        auto qp = config.quantizer;
        if (config.hnsw.metric == kernels::Metric::cosine) {
            qp.symmetric = true;
        }
        auto fitted = fit(vectors.data(), *n, dim, qp);
        if (!fitted) return std::unexpected(fitted.error());
        scale = *fitted;
        if (verbose) {
            std::cerr << "[builder] quantizer scale=" << scale->scale
                      << " zero_point=" << scale->zero_point << std::endl;
        }
    }

    auto params = config.hnsw;
    params.verbose = params.verbose || verbose;

    HnswIndex index;
    if (auto r = index.init(dim, params, *n, scale); !r) {
        return std::unexpected(r.error());
    }
    if (verbose) {
        std::cerr << "[builder] inserting " << *n << " vectors (dim=" << dim << ")" << std::endl;
    }
    if (auto r = index.add_batch(vectors.data(), *n); !r) {
        return std::unexpected(r.error());
    }
    if (auto r = index.freeze(); !r) {
        return std::unexpected(r.error());
    }

    if (verbose) {
        const auto stats = index.get_stats();
        const double secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
        std::cerr << "[builder] built " << stats.n_nodes << " nodes, " << stats.n_levels
                  << " levels, avg_degree=" << stats.avg_degree << " in " << secs << "s" << std::endl;
    }
    return index;
}

auto build_and_save(std::span<const float> vectors, std::size_t dim, const IndexBuildConfig& config,
                    const std::filesystem::path& path)
    -> std::expected<HnswIndex, core::error> {
    auto index = build_index(vectors, dim, config);
    if (!index) return std::unexpected(index.error());
    if (auto r = save_index(*index, path); !r) {
        return std::unexpected(r.error());
    }
    if (config.verbose || core::verbose_from_env()) {
        std::cerr << "[builder] saved " << path << std::endl;
    }
    return index;
}

} // namespace semsearch::index
