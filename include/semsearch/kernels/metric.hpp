#pragma once

/** \file metric.hpp
 *  \brief Distance metric tags shared by kernels, the index and the on-disk format.
 */

#include <cstdint>
#include <optional>
#include <string_view>

namespace semsearch::kernels {

/** \brief Metric tag. Values are persisted in index headers and must stay stable. */
enum class Metric : std::uint32_t {
  l2 = 0,       /**< squared Euclidean distance */
  cosine = 1,   /**< 1 - cosine similarity, in [0, 2] */
};

constexpr std::string_view to_string(Metric m) noexcept {
  switch (m) {
    case Metric::l2: return "l2";
    case Metric::cosine: return "cosine";
  }
  return "unknown";
}

constexpr std::optional<Metric> parse_metric(std::string_view s) noexcept {
  if (s == "l2" || s == "L2") return Metric::l2;
  if (s == "cosine" || s == "cos") return Metric::cosine;
  return std::nullopt;
}

constexpr bool is_known_metric(std::uint32_t tag) noexcept {
  return tag == static_cast<std::uint32_t>(Metric::l2) ||
         tag == static_cast<std::uint32_t>(Metric::cosine);
}

} // namespace semsearch::kernels
