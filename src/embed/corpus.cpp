#include "semsearch/embed/corpus.hpp"

#include <cstdint>
#include <fstream>
#include <sstream>

namespace semsearch::embed {

namespace {

auto corpus_error(core::error_code code, std::string msg) -> core::error {
    return core::error{code, std::move(msg), "embed.corpus"};
}

auto read_all(const std::filesystem::path& path) -> std::expected<std::string, core::error> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(corpus_error(core::error_code::io_failed,
                                            "cannot open corpus '" + path.string() + "'"));
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(corpus_error(core::error_code::io_failed,
                                            "read failed for '" + path.string() + "'"));
    }
    return ss.str();
}

enum class RecordStatus { ok, end, unterminated };

/** \brief Parse the record starting at pos; quoted fields may span lines. */
auto next_record(std::string_view text, std::size_t& pos, std::vector<std::string>& fields) -> RecordStatus {
    fields.clear();
    if (pos >= text.size()) return RecordStatus::end;

    std::string field;
    bool quoted = false;
    bool in_quotes = false;
    while (pos < text.size()) {
        const char c = text[pos++];
        if (in_quotes) {
            if (c == '"') {
                if (pos < text.size() && text[pos] == '"') {
                    field.push_back('"');
                    ++pos;
                } else {
                    in_quotes = false;
                }
            } else {
                field.push_back(c);
            }
            continue;
        }
        if (c == '"' && field.empty() && !quoted) {
            in_quotes = true;
            quoted = true;
        } else if (c == ',') {
            fields.push_back(std::move(field));
            field.clear();
            quoted = false;
        } else if (c == '\n') {
            break;
        } else if (c != '\r') {
            field.push_back(c);
        }
    }
    if (in_quotes) return RecordStatus::unterminated;
    fields.push_back(std::move(field));
    return RecordStatus::ok;
}

} // namespace

auto parse_corpus_format(std::string_view s) -> std::optional<CorpusFormat> {
    if (s == "lines" || s == "txt") return CorpusFormat::lines;
    if (s == "csv") return CorpusFormat::csv;
    if (s == "fvecs") return CorpusFormat::fvecs;
    return std::nullopt;
}

auto load_lines(const std::filesystem::path& path)
    -> std::expected<std::vector<std::string>, core::error> {
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(corpus_error(core::error_code::io_failed,
                                            "cannot open corpus '" + path.string() + "'"));
    }
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        lines.push_back(std::move(line));
    }
    if (in.bad()) {
        return std::unexpected(corpus_error(core::error_code::io_failed,
                                            "read failed for '" + path.string() + "'"));
    }
    return lines;
}

auto split_csv_record(std::string_view record) -> std::optional<std::vector<std::string>> {
    std::size_t pos = 0;
    std::vector<std::string> fields;
    switch (next_record(record, pos, fields)) {
        case RecordStatus::unterminated: return std::nullopt;
        case RecordStatus::end: return std::vector<std::string>{std::string{}};
        case RecordStatus::ok: break;
    }
    return fields;
}

auto load_csv_column(const std::filesystem::path& path, std::size_t column, bool skip_header)
    -> std::expected<std::vector<std::string>, core::error> {
    auto text = read_all(path);
    if (!text) return std::unexpected(text.error());

    std::vector<std::string> out;
    std::vector<std::string> fields;
    std::size_t pos = 0;
    std::size_t record = 0;
    for (;;) {
        const auto status = next_record(*text, pos, fields);
        if (status == RecordStatus::end) break;
        if (status == RecordStatus::unterminated) {
            return std::unexpected(corpus_error(core::error_code::data_integrity,
                "unterminated quote in record " + std::to_string(record)));
        }
        const bool header = record++ == 0 && skip_header;
        if (header) continue;
        if (fields.size() == 1 && fields[0].empty()) continue;  // blank line
        if (column >= fields.size()) {
            return std::unexpected(corpus_error(core::error_code::data_integrity,
                "record " + std::to_string(record - 1) + " has no column " + std::to_string(column)));
        }
        out.push_back(std::move(fields[column]));
    }
    return out;
}

auto load_fvecs(const std::filesystem::path& path) -> std::expected<VectorCorpus, core::error> {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(corpus_error(core::error_code::io_failed,
                                            "cannot open '" + path.string() + "'"));
    }

    VectorCorpus corpus;
    std::vector<float> row;
    for (;;) {
        std::uint32_t dim = 0;
        in.read(reinterpret_cast<char*>(&dim), sizeof(dim));
        if (in.gcount() == 0) break;
        if (in.gcount() != sizeof(dim) || dim == 0) {
            return std::unexpected(corpus_error(core::error_code::data_integrity,
                                                "truncated or empty fvecs row header"));
        }
        if (corpus.dim == 0) {
            corpus.dim = dim;
        } else if (corpus.dim != dim) {
            return std::unexpected(corpus_error(core::error_code::data_integrity,
                "inconsistent dimensions in fvecs file (" + std::to_string(corpus.dim) + " vs " +
                std::to_string(dim) + ")"));
        }
        row.resize(dim);
        in.read(reinterpret_cast<char*>(row.data()), static_cast<std::streamsize>(dim * sizeof(float)));
        if (in.gcount() != static_cast<std::streamsize>(dim * sizeof(float))) {
            return std::unexpected(corpus_error(core::error_code::data_integrity, "truncated fvecs row"));
        }
        corpus.data.insert(corpus.data.end(), row.begin(), row.end());
    }
    return corpus;
}

} // namespace semsearch::embed
