#include "semsearch/io/byte_source.hpp"

#include <string>

namespace semsearch::io {

namespace {

auto io_error(const std::filesystem::path& path, const char* what) -> core::error {
    return core::error{core::error_code::io_failed,
                       std::string(what) + " '" + path.string() + "': " + platform::last_error_message(),
                       "io.byte_source"};
}

} // namespace

auto MemoryByteSource::read_file(const std::filesystem::path& path)
    -> std::expected<std::shared_ptr<MemoryByteSource>, core::error> {
    auto file = platform::open_file(path);
    if (!file) {
        return std::unexpected(io_error(path, "cannot open"));
    }
    const auto size = platform::get_file_size(*file);
    if (!size) {
        return std::unexpected(io_error(path, "cannot stat"));
    }
    std::vector<std::byte> bytes(static_cast<std::size_t>(*size));
    if (!bytes.empty() && !platform::read_exact(*file, bytes.data(), bytes.size())) {
        return std::unexpected(io_error(path, "short read from"));
    }
    return std::make_shared<MemoryByteSource>(std::move(bytes));
}

auto MappedByteSource::open(const std::filesystem::path& path)
    -> std::expected<std::shared_ptr<MappedByteSource>, core::error> {
    auto file = platform::open_file(path);
    if (!file) {
        return std::unexpected(io_error(path, "cannot open"));
    }
    const auto size = platform::get_file_size(*file);
    if (!size) {
        return std::unexpected(io_error(path, "cannot stat"));
    }
    if (*size == 0) {
        return std::shared_ptr<MappedByteSource>(new MappedByteSource(platform::MappedFile{}));
    }
    platform::MappedFile map(std::move(*file), static_cast<std::size_t>(*size));
    if (!map.is_valid()) {
        return std::unexpected(io_error(path, "cannot mmap"));
    }
    map.advise_random();
    return std::shared_ptr<MappedByteSource>(new MappedByteSource(std::move(map)));
}

} // namespace semsearch::io
