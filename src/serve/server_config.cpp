#include "semsearch/serve/server_config.hpp"
#include "semsearch/core/platform_utils.hpp"

#include <limits>
#include <optional>
#include <string>

namespace semsearch::serve {

namespace {

auto config_error(std::string msg) -> core::error {
    return core::error{core::error_code::config_invalid, std::move(msg), "serve.config"};
}

std::optional<std::string_view> eat(std::string_view a, std::string_view key) {
    if (a.substr(0, key.size()) == key) return a.substr(key.size());
    return std::nullopt;
}

auto parse_count(std::string_view name, std::string_view value, unsigned long long max_value)
    -> std::expected<unsigned long long, core::error> {
    const auto v = core::parse_unsigned(value);
    if (!v || *v > max_value) {
        return std::unexpected(config_error("invalid value '" + std::string(value) + "' for " +
                                            std::string(name)));
    }
    return *v;
}

auto set_batch_size(ServerConfig& c, std::string_view name, std::string_view v)
    -> std::expected<void, core::error> {
    auto n = parse_count(name, v, 1u << 20);
    if (!n) return std::unexpected(n.error());
    c.scheduler.max_batch_size = static_cast<std::size_t>(*n);
    return {};
}

auto set_max_wait(ServerConfig& c, std::string_view name, std::string_view v)
    -> std::expected<void, core::error> {
    auto n = parse_count(name, v, 60ull * 1000 * 1000);
    if (!n) return std::unexpected(n.error());
    c.scheduler.max_wait = std::chrono::microseconds(static_cast<std::int64_t>(*n));
    return {};
}

auto set_ef_search(ServerConfig& c, std::string_view name, std::string_view v)
    -> std::expected<void, core::error> {
    auto n = parse_count(name, v, std::numeric_limits<std::uint32_t>::max());
    if (!n) return std::unexpected(n.error());
    c.scheduler.ef_search = static_cast<std::uint32_t>(*n);
    return {};
}

auto set_workers(ServerConfig& c, std::string_view name, std::string_view v)
    -> std::expected<void, core::error> {
    auto n = parse_count(name, v, 4096);
    if (!n) return std::unexpected(n.error());
    c.scheduler.num_workers = static_cast<std::size_t>(*n);
    return {};
}

auto set_dim(ServerConfig& c, std::string_view name, std::string_view v)
    -> std::expected<void, core::error> {
    auto n = parse_count(name, v, 1u << 16);
    if (!n || *n == 0) return std::unexpected(config_error("invalid value '" + std::string(v) + "' for " + std::string(name)));
    c.embedding_dim = static_cast<std::size_t>(*n);
    return {};
}

} // namespace

auto apply_env_overrides(ServerConfig& config) -> std::expected<void, core::error> {
    if (auto v = core::safe_getenv("SEMSEARCH_LISTEN"); v && !v->empty()) {
        config.listen_address = *v;
    }
    if (auto v = core::safe_getenv("SEMSEARCH_MAX_BATCH_SIZE")) {
        if (auto r = set_batch_size(config, "SEMSEARCH_MAX_BATCH_SIZE", *v); !r) return r;
    }
    if (auto v = core::safe_getenv("SEMSEARCH_MAX_WAIT_US")) {
        if (auto r = set_max_wait(config, "SEMSEARCH_MAX_WAIT_US", *v); !r) return r;
    }
    if (auto v = core::safe_getenv("SEMSEARCH_EF_SEARCH")) {
        if (auto r = set_ef_search(config, "SEMSEARCH_EF_SEARCH", *v); !r) return r;
    }
    if (auto v = core::safe_getenv("SEMSEARCH_WORKERS")) {
        if (auto r = set_workers(config, "SEMSEARCH_WORKERS", *v); !r) return r;
    }
    if (core::verbose_from_env()) {
        config.verbose = true;
    }
    return {};
}

auto parse_server_args(int argc, const char* const* argv) -> std::expected<ServerConfig, core::error> {
    ServerConfig config;
    if (auto r = apply_env_overrides(config); !r) return std::unexpected(r.error());

    for (int i = 1; i < argc; ++i) {
        const std::string_view a(argv[i]);
        std::expected<void, core::error> r;
        if (a == "--help" || a == "-h") config.show_help = true;
        else if (auto v = eat(a, "--index=")) config.index_path = std::string(*v);
        else if (auto v = eat(a, "--listen=")) config.listen_address = std::string(*v);
        else if (auto v = eat(a, "--max_batch_size=")) r = set_batch_size(config, "--max_batch_size", *v);
        else if (auto v = eat(a, "--max_wait_us=")) r = set_max_wait(config, "--max_wait_us", *v);
        else if (auto v = eat(a, "--ef_search=")) r = set_ef_search(config, "--ef_search", *v);
        else if (auto v = eat(a, "--workers=")) r = set_workers(config, "--workers", *v);
        else if (auto v = eat(a, "--dim=")) r = set_dim(config, "--dim", *v);
        else if (a == "--no_mmap") config.use_mmap = false;
        else if (a == "--verbose") config.verbose = true;
        else return std::unexpected(config_error("unknown argument '" + std::string(a) + "'"));
        if (!r) return std::unexpected(r.error());
    }

    if (config.show_help) return config;
    if (config.index_path.empty()) {
        return std::unexpected(config_error("--index=PATH is required"));
    }
    if (config.listen_address.empty()) {
        return std::unexpected(config_error("listen address is empty"));
    }
    if (config.scheduler.max_batch_size == 0) {
        return std::unexpected(config_error("max_batch_size must be > 0"));
    }
    config.scheduler.verbose = config.verbose;
    return config;
}

auto server_usage() -> std::string_view {
    return "Usage: semsearch_server --index=PATH [--listen=127.0.0.1:50051]\n"
           "  [--max_batch_size=32] [--max_wait_us=2000] [--ef_search=64] [--workers=N]\n"
           "  [--dim=384] [--no_mmap] [--verbose]\n";
}

} // namespace semsearch::serve
