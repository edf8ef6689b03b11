#pragma once

/** \file hnsw_io.hpp
 *  \brief Persistence of built HNSW indexes.
 *
 * File layout (little endian):
 *   [0, 64)      header (magic "SSHNSWIX", version, flags, dim, metric, counts, graph params,
 *                entry point, quantization scale)
 *   [64, end-12) one record per node in id order: vector payload padded to 4 bytes, u32 layer
 *                count, then per layer a u32 degree followed by that many u32 neighbor ids
 *   [end-12,end) "CHKS" + u64 FNV-1a over every preceding byte
 *
 * Saving writes `<path>.tmp`, fsyncs, renames over `path` and fsyncs the directory, so `path`
 * either holds the previous file or the complete new one.
 *
 * Loading validates the whole file before handing the graph to the index. Vectors stay in the
 * ByteSource (mapped or owned); adjacency lists are copied.
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>

#include "semsearch/error.hpp"
#include "semsearch/index/hnsw.hpp"
#include "semsearch/io/byte_source.hpp"
#include "semsearch/kernels/metric.hpp"

namespace semsearch::index {

inline constexpr char kIndexMagic[8] = {'S', 'S', 'H', 'N', 'S', 'W', 'I', 'X'};
inline constexpr std::uint16_t kIndexVersionMajor = 1;
inline constexpr std::uint16_t kIndexVersionMinor = 0;
inline constexpr std::size_t kIndexHeaderSize = 64;
inline constexpr std::size_t kIndexTrailerSize = 12;
inline constexpr std::uint32_t kMaxLayerCount = 64;

inline constexpr std::uint32_t kFlagQuantized = 1u << 0;
inline constexpr std::uint32_t kFlagZeroPoint = 1u << 1;

/** \brief Decoded fixed-size header. */
struct IndexFileHeader {
    std::uint16_t version_major{kIndexVersionMajor};
    std::uint16_t version_minor{kIndexVersionMinor};
    std::uint32_t flags{0};
    std::uint32_t dim{0};
    kernels::Metric metric{kernels::Metric::l2};
    std::uint64_t node_count{0};
    std::uint32_t M{0};
    std::uint32_t M0{0};
    std::uint32_t ef_construction{0};
    std::uint32_t entry_point{kNoNode};
    std::uint32_t max_layer{0};
    float scale{1.0f};
    std::int32_t zero_point{0};

    [[nodiscard]] auto quantized() const noexcept -> bool { return (flags & kFlagQuantized) != 0; }
};

/** \brief Options for load_index. */
struct LoadOptions {
    std::optional<std::size_t> expected_dim;         /**< Reject files of another dimension */
    std::optional<kernels::Metric> expected_metric;  /**< Reject files of another metric */
    bool use_mmap{true};                             /**< Map the file instead of reading it */
    bool verify_checksum{true};                      /**< Check the FNV-1a trailer */
};

/** \brief FNV-1a 64-bit hash, continuing from state. */
auto fnv1a64(const void* data, std::size_t size,
             std::uint64_t state = 1469598103934665603ull) noexcept -> std::uint64_t;

/** \brief Decode and validate the header at the start of bytes.
 *
 * Errors: data_integrity (short input, bad magic, unsupported major version, unknown flags or
 * metric, zero dimension, invalid graph parameters).
 */
auto parse_header(std::span<const std::byte> bytes)
    -> std::expected<IndexFileHeader, core::error>;

/** \brief Atomically write a built index to path.
 *
 * Errors: not_built, io_failed. On failure no temp file is left and path is untouched.
 */
auto save_index(const HnswIndex& index, const std::filesystem::path& path)
    -> std::expected<void, core::error>;

/** \brief Load an index file (mapped or read, per options.use_mmap). */
auto load_index(const std::filesystem::path& path, const LoadOptions& options = {})
    -> std::expected<HnswIndex, core::error>;

/** \brief Load an index from bytes already in memory or mapped.
 *
 * Errors: data_integrity for any malformed content, config_invalid when the file's dimension or
 * metric differs from options.
 */
auto load_index(std::shared_ptr<const io::ByteSource> source, const LoadOptions& options = {})
    -> std::expected<HnswIndex, core::error>;

} // namespace semsearch::index
