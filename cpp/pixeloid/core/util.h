#ifndef PIXELOID_CORE_UTIL_H
#define PIXELOID_CORE_UTIL_H

#include <cmath>
#include <cstdint>
#include <cstddef>
#include <cstring>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
#else
#include <chrono>
// Polyfill for native builds and tests
inline double emscripten_get_now() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

namespace pixeloid {

// Millisecond clock shared by every cache. Tests replace it through TimeSource.
struct TimeSource {
    void* ctx = nullptr;
    double (*nowMs)(void* ctx) = nullptr;

    double now() const { return nowMs ? nowMs(ctx) : emscripten_get_now(); }
};

inline double engineNowMs(void*) {
    return emscripten_get_now();
}

// =============================================================================
// Hash/Digest (FNV-1a)
// =============================================================================

constexpr std::uint64_t kDigestOffset = 14695981039346656037ull;
constexpr std::uint64_t kDigestPrime = 1099511628211ull;

inline std::uint64_t hashU32(std::uint64_t h, std::uint32_t v) {
    h ^= v;
    return h * kDigestPrime;
}

inline std::uint32_t canonicalizeF32(float v) {
    if (std::isnan(v)) return 0x7fc00000u;
    if (v == 0.0f) return 0u;
    std::uint32_t bits = 0;
    std::memcpy(&bits, &v, sizeof(bits));
    return bits;
}

inline std::uint64_t hashF32(std::uint64_t h, float v) {
    return hashU32(h, canonicalizeF32(v));
}

inline bool isValidScale(float scale) {
    return std::isfinite(scale) && scale > 0.0f;
}

} // namespace pixeloid

#endif // PIXELOID_CORE_UTIL_H
