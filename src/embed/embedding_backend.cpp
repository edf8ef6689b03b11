#include "semsearch/embed/embedding_backend.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <string_view>

namespace semsearch::embed {

namespace {

constexpr std::uint64_t kFnvOffset = 1469598103934665603ull;
constexpr std::uint64_t kFnvPrime = 1099511628211ull;

auto fnv1a(std::string_view s, std::uint64_t h = kFnvOffset) noexcept -> std::uint64_t {
    for (const char c : s) {
        h ^= static_cast<unsigned char>(c);
        h *= kFnvPrime;
    }
    return h;
}

auto tokenize(std::string_view text) -> std::vector<std::string> {
    std::vector<std::string> tokens;
    std::string current;
    for (const char c : text) {
        const auto u = static_cast<unsigned char>(c);
        if (std::isalnum(u)) {
            current.push_back(static_cast<char>(std::tolower(u)));
        } else if (!current.empty()) {
            tokens.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) tokens.push_back(std::move(current));
    return tokens;
}

} // namespace

auto HashingEmbedder::embed_one(std::string_view text, std::span<float> out) const -> void {
    std::fill(out.begin(), out.end(), 0.0f);
    const auto tokens = tokenize(text);

    auto accumulate = [&](std::uint64_t h, float weight) {
        const auto bucket = static_cast<std::size_t>(h % dim_);
        out[bucket] += ((h >> 63) != 0 ? -weight : weight);
    };
    for (std::size_t i = 0; i < tokens.size(); ++i) {
        accumulate(fnv1a(tokens[i]), 1.0f);
        if (i + 1 < tokens.size()) {
            // Bigram hash chains the second token onto the first with a separator.
            accumulate(fnv1a(tokens[i + 1], fnv1a("\x1f", fnv1a(tokens[i]))), 0.5f);
        }
    }

    double norm_sq = 0.0;
    for (const float v : out) norm_sq += static_cast<double>(v) * v;
    if (norm_sq > 0.0) {
        const auto inv = static_cast<float>(1.0 / std::sqrt(norm_sq));
        for (float& v : out) v *= inv;
    }
}

auto HashingEmbedder::embed(std::span<const std::string> texts)
    -> std::expected<std::vector<float>, core::error> {
    if (dim_ == 0) {
        return std::unexpected(core::error{core::error_code::embedding_failed,
                                           "embedder dimension is 0", "embed.hashing"});
    }
    std::vector<float> out(texts.size() * dim_);
    for (std::size_t i = 0; i < texts.size(); ++i) {
        embed_one(texts[i], std::span<float>(out.data() + i * dim_, dim_));
    }
    return out;
}

auto embed_corpus(EmbeddingBackend& backend, std::span<const std::string> texts,
                  std::size_t batch_size) -> std::expected<std::vector<float>, core::error> {
    const std::size_t dim = backend.dimension();
    if (batch_size == 0) batch_size = texts.size() > 0 ? texts.size() : 1;

    std::vector<float> all;
    all.reserve(texts.size() * dim);
    for (std::size_t start = 0; start < texts.size(); start += batch_size) {
        const auto count = std::min(batch_size, texts.size() - start);
        auto block = backend.embed(texts.subspan(start, count));
        if (!block) return std::unexpected(block.error());
        if (block->size() != count * dim) {
            return std::unexpected(core::error{core::error_code::embedding_failed,
                "backend returned " + std::to_string(block->size()) + " values for " +
                std::to_string(count) + " texts of dimension " + std::to_string(dim),
                "embed.corpus"});
        }
        all.insert(all.end(), block->begin(), block->end());
    }
    return all;
}

} // namespace semsearch::embed
