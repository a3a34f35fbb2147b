#ifndef CONTOUR_PERSISTENCE_RECORD_CODEC_H
#define CONTOUR_PERSISTENCE_RECORD_CODEC_H

#include "contour/core/types.h"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace contour::persistence {

// What goes to disk for one (content hash, compute mode) pair.
struct CacheRecord {
    std::uint32_t schemaVersion{kCacheSchemaVersion};
    std::string parserVersion{kParserVersion};
    ParsedDocument parsed;
};

// Version tags and payload location, readable without decoding the payload.
struct RecordHeader {
    std::uint32_t schemaVersion{0};
    std::string parserVersion;
    std::size_t payloadOffset{0};
    std::uint32_t payloadSize{0};
    std::uint32_t payloadCrc{0};
};

// Little-endian binary layout:
//   u32 magic 'DXCR', u32 format version, u32 schema version,
//   u32 parser version length, parser version bytes,
//   u32 payload size, u32 payload crc32, payload.
// Payload: f64 width, f64 height, u32 contour count, then per contour
//   u32 flags (bit 0 = closed), u32 point count, point count x (f64 x, f64 y).
std::vector<std::uint8_t> encodeRecord(const CacheRecord& record);

ContourError decodeRecordHeader(const std::uint8_t* src, std::size_t size, RecordHeader& out);

// Full decode with checksum verification. `out` is untouched on failure.
ContourError decodeRecord(const std::uint8_t* src, std::size_t size, CacheRecord& out);

// Structural sanity of a decoded document: at least one contour, finite
// positive extents, finite points, and the per-contour minimum point counts.
bool isValidDocument(const ParsedDocument& doc);

// Byte length encodeRecord would produce; used as the memory-tier entry size.
std::size_t encodedRecordSize(const CacheRecord& record);
std::size_t encodedRecordSize(const std::string& parserVersion, const ParsedDocument& doc);

} // namespace contour::persistence

#endif // CONTOUR_PERSISTENCE_RECORD_CODEC_H
