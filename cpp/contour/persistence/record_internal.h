#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace contour::persistence::detail {

constexpr std::uint32_t fourCC(char a, char b, char c, char d) {
    return static_cast<std::uint32_t>(a)
        | (static_cast<std::uint32_t>(b) << 8)
        | (static_cast<std::uint32_t>(c) << 16)
        | (static_cast<std::uint32_t>(d) << 24);
}

constexpr std::uint32_t kRecordMagic = fourCC('D', 'X', 'C', 'R');
constexpr std::uint32_t kRecordFormatVersion = 1;

// magic, format version, schema version, parser version length
constexpr std::size_t kFixedHeaderBytes = 4 * 4;
// payload size, payload crc
constexpr std::size_t kPayloadPrefixBytes = 2 * 4;
// width, height, contour count
constexpr std::size_t kDocumentHeaderBytes = 2 * 8 + 4;
// flags, point count
constexpr std::size_t kContourHeaderBytes = 2 * 4;
constexpr std::size_t kPointBytes = 2 * 8;

constexpr std::uint32_t kContourFlagClosed = 1u << 0;

// Parser version strings are short tags; anything longer is corruption.
constexpr std::uint32_t kMaxParserVersionBytes = 256;

inline std::uint32_t crc32(const std::uint8_t* bytes, std::size_t len) {
    static const std::array<std::uint32_t, 256> table = [] {
        std::array<std::uint32_t, 256> t{};
        for (std::uint32_t i = 0; i < 256; ++i) {
            std::uint32_t c = i;
            for (int k = 0; k < 8; ++k) {
                c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
            }
            t[i] = c;
        }
        return t;
    }();

    std::uint32_t crc = 0xFFFFFFFFu;
    for (std::size_t i = 0; i < len; ++i) {
        crc = table[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return (crc ^ 0xFFFFFFFFu);
}

inline bool tryMul(std::size_t a, std::size_t b, std::size_t& out) {
    if (a == 0 || b == 0) {
        out = 0;
        return true;
    }
    if (a > (std::numeric_limits<std::size_t>::max() / b)) return false;
    out = a * b;
    return true;
}

inline bool requireBytes(std::size_t offset, std::size_t size, std::size_t total) {
    if (offset > total) return false;
    return size <= (total - offset);
}

} // namespace contour::persistence::detail
