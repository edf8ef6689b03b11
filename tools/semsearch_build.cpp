#include "semsearch/core/platform_utils.hpp"
#include "semsearch/embed/corpus.hpp"
#include "semsearch/embed/embedding_backend.hpp"
#include "semsearch/index/hnsw_io.hpp"
#include "semsearch/index/index_builder.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

using semsearch::core::error;
using semsearch::embed::CorpusFormat;
using semsearch::index::IndexBuildConfig;

namespace {
struct Args {
    std::string corpus;
    std::string out;
    CorpusFormat format{CorpusFormat::lines};
    std::size_t csv_column{0};
    bool quantize{false};
    semsearch::kernels::Metric metric{semsearch::kernels::Metric::l2};
    std::uint32_t M{16};
    std::uint32_t ef_construction{200};
    std::uint32_t threads{0};
    std::uint64_t seed{42};
    std::size_t dim{384};
    bool verbose{false};
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "semsearch index builder\n"
              << "Usage: semsearch_build --corpus=PATH --out=PATH\n"
              << "  [--format=lines|csv|fvecs] [--csv_column=0] [--quantize] [--metric=l2|cosine]\n"
              << "  [--M=16] [--ef_construction=200] [--threads=N] [--seed=42] [--dim=384] [--verbose]\n";
}

static int fail(const error& e) {
    std::cerr << "error: " << semsearch::core::describe(e) << "\n";
    return 1;
}

static int bad_flag(std::string_view flag) {
    std::cerr << "error: invalid value for " << flag << "\n";
    print_usage();
    return 1;
}
} // namespace

int main(int argc, char** argv) {
    using semsearch::core::parse_unsigned;
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        else if (auto v = eat(a, "--corpus=")) args.corpus = *v;
        else if (auto v = eat(a, "--out=")) args.out = *v;
        else if (auto v = eat(a, "--format=")) {
            auto f = semsearch::embed::parse_corpus_format(*v);
            if (!f) return bad_flag("--format");
            args.format = *f;
        }
        else if (auto v = eat(a, "--csv_column=")) {
            auto n = parse_unsigned(*v);
            if (!n) return bad_flag("--csv_column");
            args.csv_column = static_cast<std::size_t>(*n);
        }
        else if (a == "--quantize") args.quantize = true;
        else if (auto v = eat(a, "--metric=")) {
            auto m = semsearch::kernels::parse_metric(*v);
            if (!m) return bad_flag("--metric");
            args.metric = *m;
        }
        else if (auto v = eat(a, "--M=")) {
            auto n = parse_unsigned(*v);
            if (!n || *n < 2 || *n > 1024) return bad_flag("--M");
            args.M = static_cast<std::uint32_t>(*n);
        }
        else if (auto v = eat(a, "--ef_construction=")) {
            auto n = parse_unsigned(*v);
            if (!n || *n == 0 || *n > 100000) return bad_flag("--ef_construction");
            args.ef_construction = static_cast<std::uint32_t>(*n);
        }
        else if (auto v = eat(a, "--threads=")) {
            auto n = parse_unsigned(*v);
            if (!n || *n > 4096) return bad_flag("--threads");
            args.threads = static_cast<std::uint32_t>(*n);
        }
        else if (auto v = eat(a, "--seed=")) {
            auto n = parse_unsigned(*v);
            if (!n) return bad_flag("--seed");
            args.seed = *n;
        }
        else if (auto v = eat(a, "--dim=")) {
            auto n = parse_unsigned(*v);
            if (!n || *n == 0 || *n > 65536) return bad_flag("--dim");
            args.dim = static_cast<std::size_t>(*n);
        }
        else if (a == "--verbose") args.verbose = true;
        else { std::cerr << "error: unknown argument " << a << "\n"; print_usage(); return 1; }
    }
    if (args.corpus.empty() || args.out.empty()) {
        print_usage();
        return 1;
    }
    args.verbose = args.verbose || semsearch::core::verbose_from_env();

    const auto t0 = std::chrono::steady_clock::now();
    std::vector<float> vectors;
    std::size_t dim = args.dim;
    if (args.format == CorpusFormat::fvecs) {
        auto corpus = semsearch::embed::load_fvecs(args.corpus);
        if (!corpus) return fail(corpus.error());
        vectors = std::move(corpus->data);
        dim = corpus->dim;
    } else {
        auto texts = args.format == CorpusFormat::csv
            ? semsearch::embed::load_csv_column(args.corpus, args.csv_column)
            : semsearch::embed::load_lines(args.corpus);
        if (!texts) return fail(texts.error());
        if (args.verbose) {
            std::cerr << "[build] embedding " << texts->size() << " documents (dim=" << dim << ")\n";
        }
        semsearch::embed::HashingEmbedder embedder(dim);
        auto embedded = semsearch::embed::embed_corpus(embedder, *texts);
        if (!embedded) return fail(embedded.error());
        vectors = std::move(*embedded);
    }

    IndexBuildConfig cfg;
    cfg.hnsw.M = args.M;
    cfg.hnsw.ef_construction = args.ef_construction;
    cfg.hnsw.metric = args.metric;
    cfg.hnsw.seed = args.seed;
    cfg.hnsw.num_threads = args.threads;
    cfg.quantize = args.quantize;
    cfg.verbose = args.verbose;

    auto index = semsearch::index::build_and_save(vectors, dim, cfg, args.out);
    if (!index) return fail(index.error());

    const auto secs = std::chrono::duration<double>(std::chrono::steady_clock::now() - t0).count();
    const auto stats = index->get_stats();
    std::cout << "built " << stats.n_nodes << " vectors (dim=" << dim
              << ", metric=" << semsearch::kernels::to_string(args.metric)
              << ", quantized=" << (args.quantize ? "yes" : "no")
              << ", levels=" << stats.n_levels << ", avg_degree=" << stats.avg_degree
              << ") in " << secs << "s -> " << args.out << "\n";
    return 0;
}
