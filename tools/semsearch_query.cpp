#include "semsearch/core/platform_utils.hpp"
#include "semsearch/embed/corpus.hpp"
#include "semsearch/embed/embedding_backend.hpp"
#include "semsearch/index/hnsw_io.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace {
struct Args {
    std::string index_path;
    std::string query;
    std::string corpus;
    semsearch::embed::CorpusFormat format{semsearch::embed::CorpusFormat::lines};
    std::size_t csv_column{0};
    std::uint32_t k{10};
    std::uint32_t ef{30};
};

static std::optional<std::string> eat(std::string_view a, std::string_view key) {
    if (a.rfind(key, 0) == 0) return std::string(a.substr(key.size()));
    return std::nullopt;
}

static void print_usage() {
    std::cout << "Usage: semsearch_query --index=PATH --query=TEXT [--corpus=PATH]\n"
              << "  [--format=lines|csv] [--csv_column=0] [--k=10] [--ef=30]\n";
}

static int fail(const semsearch::core::error& e) {
    std::cerr << "error: " << semsearch::core::describe(e) << "\n";
    return 1;
}
} // namespace

int main(int argc, char** argv) {
    using semsearch::core::parse_unsigned;
    Args args;
    for (int i = 1; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "--help" || a == "-h") { print_usage(); return 0; }
        else if (auto v = eat(a, "--index=")) args.index_path = *v;
        else if (auto v = eat(a, "--query=")) args.query = *v;
        else if (auto v = eat(a, "--corpus=")) args.corpus = *v;
        else if (auto v = eat(a, "--format=")) {
            auto f = semsearch::embed::parse_corpus_format(*v);
            if (!f || *f == semsearch::embed::CorpusFormat::fvecs) {
                std::cerr << "error: --format must be lines or csv\n";
                return 1;
            }
            args.format = *f;
        }
        else if (auto v = eat(a, "--csv_column=")) {
            auto n = parse_unsigned(*v);
            if (!n) { std::cerr << "error: invalid --csv_column\n"; return 1; }
            args.csv_column = static_cast<std::size_t>(*n);
        }
        else if (auto v = eat(a, "--k=")) {
            auto n = parse_unsigned(*v);
            if (!n || *n == 0 || *n > 100000) { std::cerr << "error: invalid --k\n"; return 1; }
            args.k = static_cast<std::uint32_t>(*n);
        }
        else if (auto v = eat(a, "--ef=")) {
            auto n = parse_unsigned(*v);
            if (!n || *n == 0 || *n > 100000) { std::cerr << "error: invalid --ef\n"; return 1; }
            args.ef = static_cast<std::uint32_t>(*n);
        }
        else { std::cerr << "error: unknown argument " << a << "\n"; print_usage(); return 1; }
    }
    if (args.index_path.empty() || args.query.empty()) {
        print_usage();
        return 1;
    }

    auto index = semsearch::index::load_index(args.index_path);
    if (!index) return fail(index.error());

    std::vector<std::string> corpus;
    if (!args.corpus.empty()) {
        auto texts = args.format == semsearch::embed::CorpusFormat::csv
            ? semsearch::embed::load_csv_column(args.corpus, args.csv_column)
            : semsearch::embed::load_lines(args.corpus);
        if (!texts) return fail(texts.error());
        corpus = std::move(*texts);
    }

    semsearch::embed::HashingEmbedder embedder(index->dimension());
    std::vector<std::string> batch{args.query};
    auto q = embedder.embed(batch);
    if (!q) return fail(q.error());

    semsearch::index::HnswSearchParams params;
    params.k = args.k;
    params.ef_search = args.ef;
    auto hits = index->search(*q, params);
    if (!hits) return fail(hits.error());

    for (std::size_t rank = 0; rank < hits->size(); ++rank) {
        const auto [id, dist] = (*hits)[rank];
        std::cout << "top " << rank + 1 << " | id : " << id << ", dist : " << dist << "\n";
        if (id < corpus.size()) {
            std::cout << corpus[id] << "\n";
        }
    }
    return 0;
}
