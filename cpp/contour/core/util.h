#ifndef CONTOUR_CORE_UTIL_H
#define CONTOUR_CORE_UTIL_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstring>

namespace contour {

inline double nowMs() {
    using namespace std::chrono;
    return duration_cast<duration<double, std::milli>>(steady_clock::now().time_since_epoch()).count();
}

// Fixed little-endian byte order regardless of the host.
static inline std::uint32_t readU32(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint32_t v = 0;
    for (int i = 3; i >= 0; --i) v = (v << 8) | src[offset + static_cast<std::size_t>(i)];
    return v;
}

static inline std::uint64_t readU64(const std::uint8_t* src, std::size_t offset) noexcept {
    std::uint64_t v = 0;
    for (int i = 7; i >= 0; --i) v = (v << 8) | src[offset + static_cast<std::size_t>(i)];
    return v;
}

static inline double readF64(const std::uint8_t* src, std::size_t offset) noexcept {
    const std::uint64_t bits = readU64(src, offset);
    double v;
    std::memcpy(&v, &bits, sizeof(v));
    return v;
}

static inline void writeU32LE(std::uint8_t* dst, std::size_t offset, std::uint32_t v) noexcept {
    for (std::size_t i = 0; i < 4; ++i) dst[offset + i] = static_cast<std::uint8_t>(v >> (8 * i));
}

static inline void writeU64LE(std::uint8_t* dst, std::size_t offset, std::uint64_t v) noexcept {
    for (std::size_t i = 0; i < 8; ++i) dst[offset + i] = static_cast<std::uint8_t>(v >> (8 * i));
}

static inline void writeF64LE(std::uint8_t* dst, std::size_t offset, double v) noexcept {
    std::uint64_t bits;
    std::memcpy(&bits, &v, sizeof(bits));
    writeU64LE(dst, offset, bits);
}

} // namespace contour

#endif // CONTOUR_CORE_UTIL_H
