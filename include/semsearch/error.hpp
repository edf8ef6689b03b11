#pragma once

/**
 * \file error.hpp
 * \brief Error taxonomy and structured error type used with std::expected.
 *
 * Design:
 * - Stable error codes for programmatic handling (values never change once shipped).
 * - Human-readable message and originating component for diagnostics.
 */

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace semsearch::core {

/** \brief Stable error codes used across the library. */
enum class error_code : std::uint32_t {
  ok = 0,
  io_failed = 1001,
  io_eof = 1002,
  config_invalid = 2001,       /**< file or request does not match the serving configuration */
  data_integrity = 3001,       /**< corrupt or incompatible index file */
  dimension_mismatch = 3002,
  precondition_failed = 4001,
  not_built = 4002,            /**< index used before it was frozen or loaded */
  resource_exhausted = 5001,
  not_found = 6001,
  unavailable = 7001,
  embedding_failed = 7002,
  cancelled = 8001,
  deadline_exceeded = 8002,
  internal = 9001,
  invalid_argument = 9002,
  out_of_range = 9004,
};

/** \brief Structured error payload accompanying an error_code. */
struct error {
  error_code code{error_code::internal};   /**< machine-parseable code */
  std::string message;                     /**< short human-readable message */
  std::string component;                   /**< subsystem, e.g., "index.hnsw" */
};

constexpr std::string_view to_string(error_code ec) noexcept {
  switch (ec) {
    case error_code::ok: return "ok";
    case error_code::io_failed: return "io_failed";
    case error_code::io_eof: return "io_eof";
    case error_code::config_invalid: return "config_invalid";
    case error_code::data_integrity: return "data_integrity";
    case error_code::dimension_mismatch: return "dimension_mismatch";
    case error_code::precondition_failed: return "precondition_failed";
    case error_code::not_built: return "not_built";
    case error_code::resource_exhausted: return "resource_exhausted";
    case error_code::not_found: return "not_found";
    case error_code::unavailable: return "unavailable";
    case error_code::embedding_failed: return "embedding_failed";
    case error_code::cancelled: return "cancelled";
    case error_code::deadline_exceeded: return "deadline_exceeded";
    case error_code::internal: return "internal";
    case error_code::invalid_argument: return "invalid_argument";
    case error_code::out_of_range: return "out_of_range";
  }
  return "unknown";
}

/** \brief "component: message" rendering used by tools and RPC statuses. */
inline std::string describe(const error& e) {
  if (e.component.empty()) return e.message;
  return e.component + ": " + e.message;
}

} // namespace semsearch::core
