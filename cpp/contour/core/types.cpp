#include "contour/core/types.h"
#include "contour/core/string_utils.h"

namespace contour {

const char* errorName(ContourError err) noexcept {
    switch (err) {
        case ContourError::Ok: return "ok";
        case ContourError::EmptyInput: return "empty input";
        case ContourError::NoValidContours: return "no valid contours";
        case ContourError::DegenerateExtent: return "degenerate extent";
        case ContourError::UnreadableSource: return "unreadable source";
        case ContourError::InternalFailure: return "internal failure";
        case ContourError::InvalidMagic: return "invalid magic";
        case ContourError::UnsupportedVersion: return "unsupported version";
        case ContourError::BufferTruncated: return "buffer truncated";
        case ContourError::ChecksumMismatch: return "checksum mismatch";
        case ContourError::IoFailure: return "io failure";
    }
    return "unknown";
}

const char* computeModeName(ComputeMode mode) noexcept {
    return mode == ComputeMode::Accelerated ? "accelerated" : "cpu";
}

const char* cacheSourceName(CacheSource source) noexcept {
    switch (source) {
        case CacheSource::Memory: return "memory";
        case CacheSource::Disk: return "disk";
        case CacheSource::None: break;
    }
    return "none";
}

ComputeMode parseComputeMode(std::string_view text) {
    const std::string mode = toLowerAscii(trimAscii(text));
    if (mode == "accelerated" || mode == "cuda" || mode == "gpu") return ComputeMode::Accelerated;
    return ComputeMode::Cpu;
}

} // namespace contour
