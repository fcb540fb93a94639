#ifndef SVGCORE_CORE_UTIL_H
#define SVGCORE_CORE_UTIL_H

#include <cstdint>
#include <cstddef>

#ifdef EMSCRIPTEN
#include <emscripten/emscripten.h>
inline double svgcore_now_ms() {
    return emscripten_get_now();
}
#else
#include <chrono>
// Polyfill for native testing
inline double svgcore_now_ms() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}
#endif

namespace svgcore {

// FNV-1a, 64 bit.
static constexpr std::uint64_t kFnvOffset64 = 14695981039346656037ull;
static constexpr std::uint64_t kFnvPrime64 = 1099511628211ull;

inline std::uint64_t fnv1a64(const char* data, std::size_t len, std::uint64_t h = kFnvOffset64) noexcept {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= static_cast<std::uint8_t>(data[i]);
        h *= kFnvPrime64;
    }
    return h;
}

} // namespace svgcore

#endif // SVGCORE_CORE_UTIL_H
