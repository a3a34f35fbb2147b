#include "contour/persistence/record_codec.h"

#include "contour/core/util.h"
#include "contour/persistence/record_internal.h"

#include <cmath>
#include <utility>

namespace contour::persistence {

using namespace detail;

std::size_t encodedRecordSize(const std::string& parserVersion, const ParsedDocument& doc) {
    std::size_t total = kFixedHeaderBytes + parserVersion.size() + kPayloadPrefixBytes + kDocumentHeaderBytes;
    for (const NormalizedContour& c : doc.contours) {
        total += kContourHeaderBytes + c.points.size() * kPointBytes;
    }
    return total;
}

std::size_t encodedRecordSize(const CacheRecord& record) {
    return encodedRecordSize(record.parserVersion, record.parsed);
}

std::vector<std::uint8_t> encodeRecord(const CacheRecord& record) {
    const std::size_t total = encodedRecordSize(record);
    std::vector<std::uint8_t> out(total, 0);
    std::uint8_t* dst = out.data();

    std::size_t o = 0;
    writeU32LE(dst, o, kRecordMagic); o += 4;
    writeU32LE(dst, o, kRecordFormatVersion); o += 4;
    writeU32LE(dst, o, record.schemaVersion); o += 4;
    writeU32LE(dst, o, static_cast<std::uint32_t>(record.parserVersion.size())); o += 4;
    for (char ch : record.parserVersion) {
        dst[o++] = static_cast<std::uint8_t>(ch);
    }

    const std::size_t prefixAt = o;
    o += kPayloadPrefixBytes;
    const std::size_t payloadStart = o;

    const ParsedDocument& doc = record.parsed;
    writeF64LE(dst, o, doc.width); o += 8;
    writeF64LE(dst, o, doc.height); o += 8;
    writeU32LE(dst, o, static_cast<std::uint32_t>(doc.contours.size())); o += 4;
    for (const NormalizedContour& c : doc.contours) {
        writeU32LE(dst, o, c.closed ? kContourFlagClosed : 0u); o += 4;
        writeU32LE(dst, o, static_cast<std::uint32_t>(c.points.size())); o += 4;
        for (const Point2& p : c.points) {
            writeF64LE(dst, o, p.x); o += 8;
            writeF64LE(dst, o, p.y); o += 8;
        }
    }

    const std::size_t payloadSize = o - payloadStart;
    writeU32LE(dst, prefixAt, static_cast<std::uint32_t>(payloadSize));
    writeU32LE(dst, prefixAt + 4, crc32(dst + payloadStart, payloadSize));
    return out;
}

ContourError decodeRecordHeader(const std::uint8_t* src, std::size_t size, RecordHeader& out) {
    if (!src || !requireBytes(0, kFixedHeaderBytes, size)) return ContourError::BufferTruncated;

    if (readU32(src, 0) != kRecordMagic) return ContourError::InvalidMagic;
    if (readU32(src, 4) != kRecordFormatVersion) return ContourError::UnsupportedVersion;

    RecordHeader header;
    header.schemaVersion = readU32(src, 8);
    const std::uint32_t versionLen = readU32(src, 12);
    if (versionLen > kMaxParserVersionBytes) return ContourError::BufferTruncated;

    std::size_t o = kFixedHeaderBytes;
    if (!requireBytes(o, versionLen, size)) return ContourError::BufferTruncated;
    header.parserVersion.assign(reinterpret_cast<const char*>(src + o), versionLen);
    o += versionLen;

    if (!requireBytes(o, kPayloadPrefixBytes, size)) return ContourError::BufferTruncated;
    header.payloadSize = readU32(src, o);
    header.payloadCrc = readU32(src, o + 4);
    o += kPayloadPrefixBytes;
    header.payloadOffset = o;

    if (!requireBytes(o, header.payloadSize, size)) return ContourError::BufferTruncated;
    out = std::move(header);
    return ContourError::Ok;
}

ContourError decodeRecord(const std::uint8_t* src, std::size_t size, CacheRecord& out) {
    RecordHeader header;
    const ContourError err = decodeRecordHeader(src, size, header);
    if (err != ContourError::Ok) return err;

    const std::uint8_t* payload = src + header.payloadOffset;
    const std::size_t payloadSize = header.payloadSize;
    if (header.payloadOffset + payloadSize != size) return ContourError::BufferTruncated;
    if (crc32(payload, payloadSize) != header.payloadCrc) return ContourError::ChecksumMismatch;

    if (!requireBytes(0, kDocumentHeaderBytes, payloadSize)) return ContourError::BufferTruncated;

    ParsedDocument doc;
    std::size_t o = 0;
    doc.width = readF64(payload, o); o += 8;
    doc.height = readF64(payload, o); o += 8;
    const std::uint32_t contourCount = readU32(payload, o); o += 4;

    // Each contour needs at least its header; reject counts the payload cannot hold.
    std::size_t minBytes = 0;
    if (!tryMul(contourCount, kContourHeaderBytes, minBytes) || !requireBytes(o, minBytes, payloadSize)) {
        return ContourError::BufferTruncated;
    }
    doc.contours.reserve(contourCount);

    for (std::uint32_t i = 0; i < contourCount; ++i) {
        if (!requireBytes(o, kContourHeaderBytes, payloadSize)) return ContourError::BufferTruncated;
        const std::uint32_t flags = readU32(payload, o); o += 4;
        const std::uint32_t pointCount = readU32(payload, o); o += 4;

        std::size_t pointBytes = 0;
        if (!tryMul(pointCount, kPointBytes, pointBytes)) return ContourError::BufferTruncated;
        if (!requireBytes(o, pointBytes, payloadSize)) return ContourError::BufferTruncated;

        NormalizedContour c;
        c.closed = (flags & kContourFlagClosed) != 0;
        c.points.resize(pointCount);
        for (std::uint32_t p = 0; p < pointCount; ++p) {
            c.points[p].x = readF64(payload, o); o += 8;
            c.points[p].y = readF64(payload, o); o += 8;
        }
        doc.contours.push_back(std::move(c));
    }
    if (o != payloadSize) return ContourError::BufferTruncated;

    out.schemaVersion = header.schemaVersion;
    out.parserVersion = std::move(header.parserVersion);
    out.parsed = std::move(doc);
    return ContourError::Ok;
}

bool isValidDocument(const ParsedDocument& doc) {
    if (doc.contours.empty()) return false;
    if (!std::isfinite(doc.width) || !std::isfinite(doc.height)) return false;
    if (!(doc.width > 0.0) || !(doc.height > 0.0)) return false;
    for (const NormalizedContour& c : doc.contours) {
        const std::size_t minPts = c.closed ? 3 : 2;
        if (c.points.size() < minPts) return false;
        for (const Point2& p : c.points) {
            if (!std::isfinite(p.x) || !std::isfinite(p.y)) return false;
        }
    }
    return true;
}

} // namespace contour::persistence
