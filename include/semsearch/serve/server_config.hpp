#pragma once

/** \file server_config.hpp
 *  \brief Server configuration from command-line flags and SEMSEARCH_* environment variables.
 *
 * Precedence: defaults < environment < flags.
 *   SEMSEARCH_LISTEN          --listen=host:port
 *   SEMSEARCH_MAX_BATCH_SIZE  --max_batch_size=N
 *   SEMSEARCH_MAX_WAIT_US     --max_wait_us=N
 *   SEMSEARCH_EF_SEARCH       --ef_search=N
 *   SEMSEARCH_WORKERS         --workers=N
 *   SEMSEARCH_VERBOSE         --verbose
 */

#include <expected>
#include <string>
#include <string_view>

#include "semsearch/error.hpp"
#include "semsearch/serve/batch_scheduler.hpp"

namespace semsearch::serve {

struct ServerConfig {
    std::string listen_address{"127.0.0.1:50051"};
    std::string index_path;                 /**< Required */
    bool use_mmap{true};                    /**< Map the index file (--no_mmap reads it) */
    std::size_t embedding_dim{384};         /**< Hashing embedder dimension; must match the index */
    BatchSchedulerConfig scheduler;
    bool verbose{false};
    bool show_help{false};
};

/** \brief Apply SEMSEARCH_* overrides. Errors: config_invalid for malformed values. */
auto apply_env_overrides(ServerConfig& config) -> std::expected<void, core::error>;

/** \brief Defaults, then environment, then flags.
 *
 * Errors: config_invalid for unknown flags, malformed numbers, zero batch size, or a missing
 * --index (unless --help).
 */
auto parse_server_args(int argc, const char* const* argv) -> std::expected<ServerConfig, core::error>;

/** \brief Usage text for semsearch_server. */
auto server_usage() -> std::string_view;

} // namespace semsearch::serve
