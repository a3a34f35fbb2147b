#include "contour/pipeline/normalizer.h"

#include "contour/core/logging.h"

#include <cmath>

namespace contour::pipeline {

bool normalizeContour(const RawContour& raw, const geometry::NumericBackend& backend, NormalizedContour& out) {
    std::vector<Point2> pts = backend.cleanPoints(raw.points, kNormalizeMergeDist2);
    if (pts.empty()) return false;

    // A "closed" contour with fewer than three points is treated as open.
    const bool closed = raw.closed && pts.size() >= 3;
    if (closed) {
        const Point2& a = pts.front();
        const Point2& b = pts.back();
        if (std::hypot(a.x - b.x, a.y - b.y) <= kClosingSeamTol) pts.pop_back();
    }

    const std::size_t minPts = closed ? 3 : 2;
    if (pts.size() < minPts) return false;

    out.points = std::move(pts);
    out.closed = closed;
    return true;
}

ContourError normalizeContours(const std::vector<RawContour>& contours, const geometry::NumericBackend& backend,
                               ParsedDocument& out) {
    std::vector<NormalizedContour> valid;
    valid.reserve(contours.size());
    for (const RawContour& raw : contours) {
        NormalizedContour c;
        if (normalizeContour(raw, backend, c)) valid.push_back(std::move(c));
    }
    if (valid.empty()) return ContourError::NoValidContours;

    Bounds b;
    if (!backend.computeBounds(valid, b)) return ContourError::NoValidContours;

    const double width = b.maxX - b.minX;
    const double height = b.maxY - b.minY;
    if (!(width > kGeomEpsilon && height > kGeomEpsilon)) {
        CONTOUR_LOG_DEBUG("rejecting degenerate extent %gx%g", width, height);
        return ContourError::DegenerateExtent;
    }

    for (NormalizedContour& c : valid) {
        backend.translate(c.points, b.minX, b.minY);
    }

    out.contours = std::move(valid);
    out.width = width;
    out.height = height;
    return ContourError::Ok;
}

} // namespace contour::pipeline
