#ifndef CONTOUR_CORE_TYPES_H
#define CONTOUR_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

// Lightweight types and constants shared by the contour pipeline.

namespace contour {

// Version tags baked into every cache key and disk record. Bump kParserVersion
// whenever tessellation or normalization output changes.
static constexpr std::uint32_t kCacheSchemaVersion = 2;
static constexpr const char* kParserVersion = "contour-parse-v3";

// Tessellation constants
static constexpr double kDefaultChordTolerance = 0.8;
static constexpr double kMinChordTolerance = 0.05;
static constexpr double kGeomEpsilon = 1e-6;
static constexpr double kBulgeEpsilon = 1e-12;
static constexpr double kTessellationMergeTol = 1e-7;
static constexpr int kMinBulgeSteps = 2;
static constexpr int kMinArcSteps = 8;
static constexpr int kMaxCurveSteps = 1 << 20; // guards pathological radii

// Normalization constants
static constexpr double kNormalizeMergeDist2 = 1e-10;
static constexpr double kClosingSeamTol = 1e-5;

struct Point2 {
    double x;
    double y;
};

inline bool operator==(const Point2& a, const Point2& b) noexcept { return a.x == b.x && a.y == b.y; }
inline bool operator!=(const Point2& a, const Point2& b) noexcept { return !(a == b); }

// One entity's worth of tessellated points, straight out of the collector.
// May still hold duplicates and non-finite values.
struct RawContour {
    std::vector<Point2> points;
    bool closed{false};
};

// Cleaned and translated contour. Consecutive points are never within the
// merge tolerance; closed contours hold >= 3 points with no repeated seam,
// open contours hold >= 2.
struct NormalizedContour {
    std::vector<Point2> points;
    bool closed{false};
};

// width > 0, height > 0 and every point lies in [0,width] x [0,height].
struct ParsedDocument {
    std::vector<NormalizedContour> contours;
    double width{0.0};
    double height{0.0};
};

inline bool operator==(const NormalizedContour& a, const NormalizedContour& b) {
    return a.closed == b.closed && a.points == b.points;
}

inline bool operator==(const ParsedDocument& a, const ParsedDocument& b) {
    return a.width == b.width && a.height == b.height && a.contours == b.contours;
}

struct Bounds {
    double minX{0.0};
    double minY{0.0};
    double maxX{0.0};
    double maxY{0.0};
};

enum class ComputeMode : std::uint8_t {
    Cpu = 0,
    Accelerated = 1,
};

enum class CacheSource : std::uint8_t {
    None = 0,
    Memory = 1,
    Disk = 2,
};

enum class ContourError : std::uint32_t {
    Ok = 0,
    // Input errors: the caller has to fix the file.
    EmptyInput = 1,
    NoValidContours = 2,
    DegenerateExtent = 3,
    UnreadableSource = 4,
    // Internal errors: somebody has to look at the service.
    InternalFailure = 5,
    // Persistence codes. Confined to the cache layer, where each one is a miss.
    InvalidMagic = 16,
    UnsupportedVersion = 17,
    BufferTruncated = 18,
    ChecksumMismatch = 19,
    IoFailure = 20,
};

inline bool isInputError(ContourError err) noexcept {
    switch (err) {
        case ContourError::EmptyInput:
        case ContourError::NoValidContours:
        case ContourError::DegenerateExtent:
        case ContourError::UnreadableSource:
            return true;
        default:
            return false;
    }
}

const char* errorName(ContourError err) noexcept;
const char* computeModeName(ComputeMode mode) noexcept;
const char* cacheSourceName(CacheSource source) noexcept;

// Case-insensitive, whitespace-trimmed. "accelerated", "cuda" and "gpu" select
// the accelerated path; anything else is cpu.
ComputeMode parseComputeMode(std::string_view text);

} // namespace contour

#endif // CONTOUR_CORE_TYPES_H
