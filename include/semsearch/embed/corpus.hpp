#pragma once

/** \file corpus.hpp
 *  \brief Corpus loaders for the build and query tools.
 *
 * Supports:
 * - lines: one document per line (empty lines are kept so ids match line numbers)
 * - csv: one column of a comma-separated file with an optional header row; RFC 4180 quoting
 * - fvecs: TEXMEX float vectors (u32 dimension then that many f32, per row)
 */

#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "semsearch/error.hpp"

namespace semsearch::embed {

/** \brief Corpus file formats. */
enum class CorpusFormat {
    lines,
    csv,
    fvecs,
};

auto parse_corpus_format(std::string_view s) -> std::optional<CorpusFormat>;

/** \brief Read every line of a text file. Errors: io_failed. */
auto load_lines(const std::filesystem::path& path)
    -> std::expected<std::vector<std::string>, core::error>;

/** \brief Read one column of a CSV file.
 *
 * \param skip_header Drop the first record
 * Errors: io_failed; data_integrity for a record without the column or an unterminated quote.
 */
auto load_csv_column(const std::filesystem::path& path, std::size_t column, bool skip_header = true)
    -> std::expected<std::vector<std::string>, core::error>;

/** \brief Split one CSV record into fields; nullopt on an unterminated quote. */
auto split_csv_record(std::string_view record) -> std::optional<std::vector<std::string>>;

/** \brief Row-major vectors loaded from an fvecs file. */
struct VectorCorpus {
    std::vector<float> data;   /**< [n x dim] */
    std::size_t dim{0};
    [[nodiscard]] auto rows() const noexcept -> std::size_t { return dim == 0 ? 0 : data.size() / dim; }
};

/** \brief Load an fvecs file. Errors: io_failed; data_integrity on inconsistent or truncated rows. */
auto load_fvecs(const std::filesystem::path& path) -> std::expected<VectorCorpus, core::error>;

} // namespace semsearch::embed
