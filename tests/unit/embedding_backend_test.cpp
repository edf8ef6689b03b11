#include <catch2/catch_all.hpp>

#include <semsearch/embed/embedding_backend.hpp>

#include <algorithm>
#include <cmath>
#include <numeric>
#include <string>
#include <vector>

using namespace semsearch::embed;
using Catch::Approx;

static double norm(std::span<const float> v) {
    double s = 0.0;
    for (float x : v) s += static_cast<double>(x) * x;
    return std::sqrt(s);
}

static double dot(std::span<const float> a, std::span<const float> b) {
    double s = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) s += static_cast<double>(a[i]) * b[i];
    return s;
}

TEST_CASE("hashing embedder is deterministic and normalized", "[embed]") {
    HashingEmbedder e(64);
    REQUIRE(e.dimension() == 64);

    std::vector<std::string> texts{"The quick brown fox", "the QUICK brown fox!", "lorem ipsum"};
    auto a = e.embed(texts);
    auto b = e.embed(texts);
    REQUIRE(a.has_value());
    REQUIRE(b.has_value());
    REQUIRE(a->size() == 3 * 64);
    REQUIRE(*a == *b);

    std::span<const float> all(*a);
    for (std::size_t i = 0; i < 3; ++i) {
        REQUIRE(norm(all.subspan(i * 64, 64)) == Approx(1.0).epsilon(1e-5));
    }
    // Case and punctuation do not change the tokens.
    REQUIRE(dot(all.subspan(0, 64), all.subspan(64, 64)) == Approx(1.0).epsilon(1e-5));
}

TEST_CASE("texts without tokens embed to zero", "[embed]") {
    HashingEmbedder e(32);
    std::vector<float> out(32, 7.0f);
    e.embed_one("  ,;! ", out);
    REQUIRE(std::all_of(out.begin(), out.end(), [](float x) { return x == 0.0f; }));
}

TEST_CASE("shared words raise similarity", "[embed]") {
    HashingEmbedder e(256);
    std::vector<float> a(256), b(256), c(256);
    e.embed_one("vector search with graphs", a);
    e.embed_one("graph based vector search", b);
    e.embed_one("baking sourdough bread", c);
    REQUIRE(dot(a, b) > dot(a, c));
}

TEST_CASE("zero dimension embedder fails", "[embed][errors]") {
    HashingEmbedder e(0);
    std::vector<std::string> texts{"x"};
    auto r = e.embed(texts);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == semsearch::core::error_code::embedding_failed);
}

namespace {

class ShortBackend final : public EmbeddingBackend {
public:
    auto dimension() const noexcept -> std::size_t override { return 4; }
    auto embed(std::span<const std::string> texts)
        -> std::expected<std::vector<float>, semsearch::core::error> override {
        return std::vector<float>(texts.size() * 4 - 1, 0.0f);
    }
};

} // namespace

TEST_CASE("embed_corpus chunks and checks backend output", "[embed]") {
    HashingEmbedder e(16);
    std::vector<std::string> texts;
    for (int i = 0; i < 10; ++i) texts.push_back("document number " + std::to_string(i));

    auto chunked = embed_corpus(e, texts, 3);
    auto whole = e.embed(texts);
    REQUIRE(chunked.has_value());
    REQUIRE(whole.has_value());
    REQUIRE(*chunked == *whole);

    ShortBackend bad;
    auto r = embed_corpus(bad, texts, 4);
    REQUIRE_FALSE(r.has_value());
    REQUIRE(r.error().code == semsearch::core::error_code::embedding_failed);
}
