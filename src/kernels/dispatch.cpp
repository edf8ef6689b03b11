#include "semsearch/kernels/dispatch.hpp"
#include "semsearch/kernels/backends/scalar.hpp"
#include "semsearch/core/platform_utils.hpp"

#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
#include <cpuid.h>
#include "semsearch/kernels/backends/avx2.hpp"
#endif

#include <optional>
#include <string>

namespace semsearch::kernels {

namespace detail {

/** \brief CPU feature detection flags. */
struct CpuFeatures {
    bool has_avx2{false};
    bool has_fma{false};
};

/** \brief Detect CPU features at runtime using CPUID. Cached for the process lifetime. */
[[gnu::cold]]
inline auto detect_cpu_features() noexcept -> CpuFeatures {
    CpuFeatures features{};
#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
    unsigned int eax, ebx, ecx, edx;
    if (__get_cpuid(0, &eax, &ebx, &ecx, &edx)) {
        const unsigned int max_level = eax;

        // AVX2: CPUID.07H:EBX[bit 5]
        if (max_level >= 7) {
            __cpuid_count(7, 0, eax, ebx, ecx, edx);
            features.has_avx2 = (ebx & (1u << 5)) != 0;
        }

        // FMA: CPUID.01H:ECX[bit 12]; OSXSAVE: ECX[bit 27]
        if (__get_cpuid(1, &eax, &ebx, &ecx, &edx)) {
            const bool osxsave = (ecx & (1u << 27)) != 0;
            features.has_fma = (ecx & (1u << 12)) != 0;
            if (!osxsave) {
                features.has_avx2 = false;
            }
        }
    }
#endif
    return features;
}

inline const CpuFeatures& get_cpu_features() noexcept {
    static const CpuFeatures features = detect_cpu_features();
    return features;
}

/** \brief SEMSEARCH_KERNEL_BACKEND override.
 *
 * Accepted values (case-insensitive): scalar, avx2, auto. "auto" and unknown values are
 * ignored (no override).
 */
inline auto get_backend_name_override() noexcept -> std::string_view {
    static const std::optional<std::string> env = core::safe_getenv("SEMSEARCH_KERNEL_BACKEND");
    if (!env || env->empty()) return "";
    auto eq_ci = [](std::string_view a, std::string_view b) {
        if (a.size() != b.size()) return false;
        for (std::size_t i = 0; i < a.size(); ++i) {
            char ca = a[i]; char cb = b[i];
            if (ca >= 'A' && ca <= 'Z') ca = static_cast<char>(ca - 'A' + 'a');
            if (cb >= 'A' && cb <= 'Z') cb = static_cast<char>(cb - 'A' + 'a');
            if (ca != cb) return false;
        }
        return true;
    };
    const std::string_view s{*env};
    if (eq_ci(s, "scalar")) return "scalar";
    if (eq_ci(s, "avx2"))   return "avx2";
    return "";
}

} // namespace detail

bool avx2_available() noexcept {
    const auto& features = detail::get_cpu_features();
    return features.has_avx2 && features.has_fma;
}

const KernelOps& select_backend(std::string_view name) noexcept {
    if (name == "scalar") {
        return get_scalar_ops();
    }
#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
    if (name == "avx2" && avx2_available()) {
        return get_avx2_ops();
    }
#endif
    return get_scalar_ops();
}

const KernelOps& select_backend_auto() noexcept {
    const auto name_override = detail::get_backend_name_override();
    if (!name_override.empty()) {
        return select_backend(name_override);
    }
#if defined(__x86_64__) || defined(_M_X64) || defined(_M_AMD64)
    if (avx2_available()) {
        return get_avx2_ops();
    }
#endif
    return get_scalar_ops();
}

} // namespace semsearch::kernels
