#pragma once

#include <charconv>
#include <cstdlib>
#include <optional>
#include <string>
#include <string_view>

namespace semsearch::core {

// Cross-platform safe getenv wrapper.
// - Windows: uses _dupenv_s and frees the allocated buffer
// - POSIX/others: uses std::getenv (read-only)
// Returns std::nullopt if the variable is not set. If set but empty, returns an
// engaged optional with an empty string.
inline std::optional<std::string> safe_getenv(const char* name) noexcept {
    if (name == nullptr || *name == '\0') return std::nullopt;
#if defined(_WIN32)
    char* buf = nullptr;
    size_t len = 0;
    const errno_t err = _dupenv_s(&buf, &len, name);
    if (err != 0 || buf == nullptr) {
        if (buf) std::free(buf);
        return std::nullopt;
    }
    std::string value(buf);
    std::free(buf);
    return value;
#else
    const char* v = std::getenv(name);
    if (!v) return std::nullopt;
    return std::string(v);
#endif
}

// True when the variable is set to "1", "true", "on" or "yes".
inline bool env_flag(const char* name) noexcept {
    const auto v = safe_getenv(name);
    if (!v) return false;
    return *v == "1" || *v == "true" || *v == "on" || *v == "yes";
}

// Parses an unsigned decimal; nullopt on any trailing garbage or overflow.
inline std::optional<unsigned long long> parse_unsigned(std::string_view s) noexcept {
    if (s.empty()) return std::nullopt;
    unsigned long long out = 0;
    const auto* first = s.data();
    const auto* last = s.data() + s.size();
    const auto [ptr, ec] = std::from_chars(first, last, out);
    if (ec != std::errc{} || ptr != last) return std::nullopt;
    return out;
}

// Verbose logging switch shared by all components.
inline bool verbose_from_env() noexcept {
    return env_flag("SEMSEARCH_VERBOSE");
}

} // namespace semsearch::core
