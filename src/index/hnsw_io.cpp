#include "semsearch/index/hnsw_io.hpp"
#include "semsearch/platform/filesystem.hpp"

#include <array>
#include <bit>
#include <cmath>
#include <cstring>
#include <string>
#include <system_error>
#include <vector>

namespace semsearch::index {

static_assert(std::endian::native == std::endian::little,
              "index files are little endian; big-endian hosts need byte swapping");

namespace {

constexpr char kTrailerTag[4] = {'C', 'H', 'K', 'S'};

auto format_error(std::string msg) -> core::error {
    return core::error{core::error_code::data_integrity, std::move(msg), "index.hnsw_io"};
}

auto config_error(std::string msg) -> core::error {
    return core::error{core::error_code::config_invalid, std::move(msg), "index.hnsw_io"};
}

auto io_error(std::string msg) -> core::error {
    return core::error{core::error_code::io_failed, std::move(msg), "index.hnsw_io"};
}

constexpr auto padded(std::size_t bytes) noexcept -> std::size_t {
    return (bytes + 3) & ~std::size_t{3};
}

template <typename T>
auto put(std::byte* dst, std::size_t offset, T value) noexcept -> void {
    std::memcpy(dst + offset, &value, sizeof(T));
}

template <typename T>
auto get(const std::byte* src, std::size_t offset) noexcept -> T {
    T value;
    std::memcpy(&value, src + offset, sizeof(T));
    return value;
}

auto encode_header(const IndexFileHeader& h) -> std::array<std::byte, kIndexHeaderSize> {
    std::array<std::byte, kIndexHeaderSize> out{};
    std::memcpy(out.data(), kIndexMagic, sizeof(kIndexMagic));
    put<std::uint16_t>(out.data(), 8, h.version_major);
    put<std::uint16_t>(out.data(), 10, h.version_minor);
    put<std::uint32_t>(out.data(), 12, h.flags);
    put<std::uint32_t>(out.data(), 16, h.dim);
    put<std::uint32_t>(out.data(), 20, static_cast<std::uint32_t>(h.metric));
    put<std::uint64_t>(out.data(), 24, h.node_count);
    put<std::uint32_t>(out.data(), 32, h.M);
    put<std::uint32_t>(out.data(), 36, h.M0);
    put<std::uint32_t>(out.data(), 40, h.ef_construction);
    put<std::uint32_t>(out.data(), 44, h.entry_point);
    put<std::uint32_t>(out.data(), 48, h.max_layer);
    put<float>(out.data(), 52, h.scale);
    put<std::int32_t>(out.data(), 56, h.zero_point);
    put<std::uint32_t>(out.data(), 60, 0u);
    return out;
}

/** \brief Buffered sequential writer that hashes everything it emits. */
class ChecksumWriter {
public:
    explicit ChecksumWriter(const platform::FileHandle& file) : file_(file) {
        buffer_.reserve(kBufferSize);
    }

    auto write(const void* data, std::size_t size) -> bool {
        hash_ = fnv1a64(data, size, hash_);
        const auto* p = static_cast<const std::byte*>(data);
        if (buffer_.size() + size > kBufferSize) {
            if (!flush()) return false;
            if (size >= kBufferSize) return platform::write_all(file_, p, size);
        }
        buffer_.insert(buffer_.end(), p, p + size);
        return true;
    }

    template <typename T>
    auto write_value(T value) -> bool {
        return write(&value, sizeof(T));
    }

    auto flush() -> bool {
        if (buffer_.empty()) return true;
        const bool ok = platform::write_all(file_, buffer_.data(), buffer_.size());
        buffer_.clear();
        return ok;
    }

    [[nodiscard]] auto hash() const noexcept -> std::uint64_t { return hash_; }

private:
    static constexpr std::size_t kBufferSize = 1u << 20;

    const platform::FileHandle& file_;
    std::vector<std::byte> buffer_;
    std::uint64_t hash_{1469598103934665603ull};
};

auto write_body(const HnswIndex& index, const IndexFileHeader& header,
                const platform::FileHandle& file) -> bool {
    ChecksumWriter out(file);
    const auto head = encode_header(header);
    if (!out.write(head.data(), head.size())) return false;

    static constexpr std::array<std::byte, 3> kZeros{};
    const auto n = static_cast<std::uint32_t>(header.node_count);
    for (std::uint32_t id = 0; id < n; ++id) {
        auto row = index.raw_vector(id);
        auto level = index.level_of(id);
        if (!row || !level) return false;
        if (!out.write(row->data(), row->size())) return false;
        if (const auto pad = padded(row->size()) - row->size(); pad > 0) {
            if (!out.write(kZeros.data(), pad)) return false;
        }
        if (!out.write_value<std::uint32_t>(*level + 1)) return false;
        for (std::uint32_t layer = 0; layer <= *level; ++layer) {
            auto list = index.neighbors(id, layer);
            if (!list) return false;
            if (!out.write_value<std::uint32_t>(static_cast<std::uint32_t>(list->size()))) return false;
            if (!list->empty() && !out.write(list->data(), list->size_bytes())) return false;
        }
    }

    const std::uint64_t checksum = out.hash();
    if (!out.write(kTrailerTag, sizeof(kTrailerTag))) return false;
    if (!out.write_value<std::uint64_t>(checksum)) return false;
    return out.flush();
}

} // namespace

auto fnv1a64(const void* data, std::size_t size, std::uint64_t state) noexcept -> std::uint64_t {
    const auto* p = static_cast<const unsigned char*>(data);
    for (std::size_t i = 0; i < size; ++i) {
        state ^= p[i];
        state *= 1099511628211ull;
    }
    return state;
}

auto parse_header(std::span<const std::byte> bytes)
    -> std::expected<IndexFileHeader, core::error> {
    if (bytes.size() < kIndexHeaderSize) {
        return std::unexpected(format_error("file too small for header (" +
                                            std::to_string(bytes.size()) + " bytes)"));
    }
    const std::byte* b = bytes.data();
    if (std::memcmp(b, kIndexMagic, sizeof(kIndexMagic)) != 0) {
        return std::unexpected(format_error("bad magic; not a semsearch index"));
    }

    IndexFileHeader h;
    h.version_major = get<std::uint16_t>(b, 8);
    h.version_minor = get<std::uint16_t>(b, 10);
    if (h.version_major != kIndexVersionMajor) {
        return std::unexpected(format_error("unsupported format version " +
                                            std::to_string(h.version_major) + "." +
                                            std::to_string(h.version_minor)));
    }
    h.flags = get<std::uint32_t>(b, 12);
    if ((h.flags & ~(kFlagQuantized | kFlagZeroPoint)) != 0 ||
        ((h.flags & kFlagZeroPoint) != 0 && (h.flags & kFlagQuantized) == 0)) {
        return std::unexpected(format_error("unknown flags " + std::to_string(h.flags)));
    }
    h.dim = get<std::uint32_t>(b, 16);
    if (h.dim == 0) {
        return std::unexpected(format_error("zero dimension"));
    }
    const auto metric_tag = get<std::uint32_t>(b, 20);
    if (!kernels::is_known_metric(metric_tag)) {
        return std::unexpected(format_error("unknown metric tag " + std::to_string(metric_tag)));
    }
    h.metric = static_cast<kernels::Metric>(metric_tag);
    h.node_count = get<std::uint64_t>(b, 24);
    if (h.node_count >= kNoNode) {
        return std::unexpected(format_error("node count out of range"));
    }
    h.M = get<std::uint32_t>(b, 32);
    h.M0 = get<std::uint32_t>(b, 36);
    h.ef_construction = get<std::uint32_t>(b, 40);
    if (h.M < 2 || h.M0 < h.M) {
        return std::unexpected(format_error("invalid degree bounds M=" + std::to_string(h.M) +
                                            " M0=" + std::to_string(h.M0)));
    }
    h.entry_point = get<std::uint32_t>(b, 44);
    h.max_layer = get<std::uint32_t>(b, 48);
    h.scale = get<float>(b, 52);
    h.zero_point = get<std::int32_t>(b, 56);
    if (h.quantized()) {
        if (!(h.scale > 0.0f) || !std::isfinite(h.scale)) {
            return std::unexpected(format_error("invalid quantization scale"));
        }
        if ((h.flags & kFlagZeroPoint) == 0 && h.zero_point != 0) {
            return std::unexpected(format_error("zero point set on a symmetric scale"));
        }
    }
    return h;
}

auto save_index(const HnswIndex& index, const std::filesystem::path& path)
    -> std::expected<void, core::error> {
    if (index.state() != IndexState::built) {
        return std::unexpected(core::error{core::error_code::not_built,
                                           "only a built index can be saved", "index.hnsw_io"});
    }

    IndexFileHeader header;
    const auto& params = index.build_params();
    const auto scale = index.quantization_scale();
    header.flags = (scale ? kFlagQuantized : 0u) | (scale && scale->has_zero_point ? kFlagZeroPoint : 0u);
    header.dim = static_cast<std::uint32_t>(index.dimension());
    header.metric = index.metric();
    header.node_count = index.size();
    header.M = params.M;
    header.M0 = params.M0;
    header.ef_construction = params.ef_construction;
    header.entry_point = index.entry_point();
    header.max_layer = index.max_layer();
    header.scale = scale ? scale->scale : 1.0f;
    header.zero_point = scale ? scale->zero_point : 0;

    auto tmp = path;
    tmp += ".tmp";
    auto fail = [&tmp](std::string msg) -> std::expected<void, core::error> {
        std::error_code rec;
        (void)std::filesystem::remove(tmp, rec);
        return std::unexpected(io_error(std::move(msg)));
    };

    {
        auto file = platform::open_file(tmp, /*write_mode=*/true, /*create=*/true);
        if (!file) {
            return fail("cannot create '" + tmp.string() + "': " + platform::last_error_message());
        }
        if (!write_body(index, header, *file)) {
            return fail("write to '" + tmp.string() + "' failed: " + platform::last_error_message());
        }
        if (!platform::sync_file(*file)) {
            return fail("fsync of '" + tmp.string() + "' failed: " + platform::last_error_message());
        }
    }

    std::error_code ec;
    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return fail("rename to '" + path.string() + "' failed: " + ec.message());
    }
    if (!platform::sync_directory(path.parent_path())) {
        return std::unexpected(io_error("directory fsync after rename failed: " +
                                        platform::last_error_message()));
    }
    return {};
}

auto load_index(const std::filesystem::path& path, const LoadOptions& options)
    -> std::expected<HnswIndex, core::error> {
    std::shared_ptr<const io::ByteSource> source;
    if (options.use_mmap) {
        auto mapped = io::MappedByteSource::open(path);
        if (!mapped) return std::unexpected(mapped.error());
        source = std::move(*mapped);
    } else {
        auto read = io::MemoryByteSource::read_file(path);
        if (!read) return std::unexpected(read.error());
        source = std::move(*read);
    }
    return load_index(std::move(source), options);
}

auto load_index(std::shared_ptr<const io::ByteSource> source, const LoadOptions& options)
    -> std::expected<HnswIndex, core::error> {
    if (!source) {
        return std::unexpected(core::error{core::error_code::invalid_argument,
                                           "null byte source", "index.hnsw_io"});
    }
    const auto bytes = source->bytes();
    if (bytes.size() < kIndexHeaderSize + kIndexTrailerSize) {
        return std::unexpected(format_error("file too small (" + std::to_string(bytes.size()) + " bytes)"));
    }

    auto header = parse_header(bytes);
    if (!header) return std::unexpected(header.error());
    const auto& h = *header;

    if (options.expected_dim && *options.expected_dim != h.dim) {
        return std::unexpected(config_error("index dimension " + std::to_string(h.dim) +
                                            " does not match expected " +
                                            std::to_string(*options.expected_dim)));
    }
    if (options.expected_metric && *options.expected_metric != h.metric) {
        return std::unexpected(config_error(std::string("index metric ") +
                                            std::string(kernels::to_string(h.metric)) +
                                            " does not match expected " +
                                            std::string(kernels::to_string(*options.expected_metric))));
    }

    const std::size_t body_end = bytes.size() - kIndexTrailerSize;
    const std::byte* b = bytes.data();
    if (std::memcmp(b + body_end, kTrailerTag, sizeof(kTrailerTag)) != 0) {
        return std::unexpected(format_error("missing checksum trailer"));
    }
    if (options.verify_checksum) {
        const auto stored = get<std::uint64_t>(b, body_end + sizeof(kTrailerTag));
        if (fnv1a64(b, body_end) != stored) {
            return std::unexpected(format_error("checksum mismatch"));
        }
    }

    const auto n = static_cast<std::size_t>(h.node_count);
    const auto type = h.quantized() ? ElementType::i8 : ElementType::f32;
    const std::size_t row_bytes = h.dim * element_size(type);
    const std::size_t record_min = padded(row_bytes) + sizeof(std::uint32_t) * 2;
    if (n > (body_end - kIndexHeaderSize) / record_min) {
        return std::unexpected(format_error("node count " + std::to_string(n) + " exceeds file size"));
    }

    HnswGraphImage image;
    image.dim = h.dim;
    image.params.M = h.M;
    image.params.M0 = h.M0;
    image.params.ef_construction = h.ef_construction;
    image.params.metric = h.metric;
    if (h.quantized()) {
        image.scale = QuantizationScale{h.scale, h.zero_point, (h.flags & kFlagZeroPoint) != 0};
    }
    image.entry_point = n > 0 ? h.entry_point : kNoNode;
    image.max_layer = h.max_layer;
    image.levels.resize(n);
    image.neighbors.resize(n);

    std::vector<std::size_t> offsets(n);
    std::size_t pos = kIndexHeaderSize;
    auto truncated = [](std::size_t id) {
        return std::unexpected(format_error("truncated record for node " + std::to_string(id)));
    };

    for (std::size_t id = 0; id < n; ++id) {
        if (body_end - pos < padded(row_bytes) + sizeof(std::uint32_t)) return truncated(id);
        offsets[id] = pos;
        pos += padded(row_bytes);

        const auto layer_count = get<std::uint32_t>(b, pos);
        pos += sizeof(std::uint32_t);
        if (layer_count == 0 || layer_count > kMaxLayerCount) {
            return std::unexpected(format_error("node " + std::to_string(id) + " has invalid layer count " +
                                                std::to_string(layer_count)));
        }
        image.levels[id] = layer_count - 1;
        auto& layers = image.neighbors[id];
        layers.resize(layer_count);

        for (std::uint32_t layer = 0; layer < layer_count; ++layer) {
            if (body_end - pos < sizeof(std::uint32_t)) return truncated(id);
            const auto degree = get<std::uint32_t>(b, pos);
            pos += sizeof(std::uint32_t);
            const std::uint32_t bound = layer == 0 ? h.M0 : h.M;
            if (degree > bound) {
                return std::unexpected(format_error("node " + std::to_string(id) + " degree " +
                                                    std::to_string(degree) + " above bound on layer " +
                                                    std::to_string(layer)));
            }
            if ((body_end - pos) / sizeof(std::uint32_t) < degree) return truncated(id);

            auto& list = layers[layer];
            list.resize(degree);
            if (degree > 0) {
                std::memcpy(list.data(), b + pos, degree * sizeof(std::uint32_t));
            }
            pos += degree * sizeof(std::uint32_t);
            for (const std::uint32_t nb : list) {
                if (nb >= n) {
                    return std::unexpected(format_error("node " + std::to_string(id) +
                                                        " references missing node " + std::to_string(nb)));
                }
                if (nb == id) {
                    return std::unexpected(format_error("node " + std::to_string(id) + " has a self loop"));
                }
            }
        }
    }
    if (pos != body_end) {
        return std::unexpected(format_error(std::to_string(body_end - pos) + " trailing bytes after last record"));
    }
    if (n > 0 && (h.entry_point >= n || image.levels[h.entry_point] != h.max_layer)) {
        return std::unexpected(format_error("bad entry point " + std::to_string(h.entry_point)));
    }

    image.vectors = VectorStore::borrowed(std::move(source), std::move(offsets), h.dim, type);
    return HnswIndex::from_image(std::move(image));
}

} // namespace semsearch::index
