#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace contour {

// =============================================================================
// ASCII helpers
// =============================================================================

inline std::string_view trimAscii(std::string_view s) {
    std::size_t a = 0;
    std::size_t b = s.size();
    while (a < b && (s[a] == ' ' || s[a] == '\t' || s[a] == '\r' || s[a] == '\n')) ++a;
    while (b > a && (s[b - 1] == ' ' || s[b - 1] == '\t' || s[b - 1] == '\r' || s[b - 1] == '\n')) --b;
    return s.substr(a, b - a);
}

inline std::string toUpperAscii(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 32);
    }
    return out;
}

inline std::string toLowerAscii(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (c >= 'A' && c <= 'Z') c = static_cast<char>(c + 32);
    }
    return out;
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

inline std::uint64_t hashBytes(std::uint64_t h, const std::uint8_t* data, std::size_t len) {
    for (std::size_t i = 0; i < len; ++i) {
        h ^= data[i];
        h *= kDigestPrime;
    }
    return h;
}

inline std::string toHex64(std::uint64_t v) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out(16, '0');
    for (int i = 15; i >= 0; --i) {
        out[static_cast<std::size_t>(i)] = digits[v & 0xFu];
        v >>= 4;
    }
    return out;
}

// Content hash of raw source bytes: FNV-1a over the bytes with the length
// folded in, rendered as 16 lowercase hex digits. Not collision resistant:
// two crafted inputs can share a cache entry. Cache records are only as
// trusted as the files fed to the service.
inline std::string contentHashHex(const std::uint8_t* data, std::size_t len) {
    std::uint64_t h = kDigestOffset;
    h = hashBytes(h, data, len);
    h = hashU32(h, static_cast<std::uint32_t>(len & 0xFFFFFFFFu));
    h = hashU32(h, static_cast<std::uint32_t>((static_cast<std::uint64_t>(len) >> 32) & 0xFFFFFFFFu));
    return toHex64(h);
}

} // namespace contour
