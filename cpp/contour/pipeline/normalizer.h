#ifndef CONTOUR_PIPELINE_NORMALIZER_H
#define CONTOUR_PIPELINE_NORMALIZER_H

#include "contour/core/types.h"
#include "contour/geometry/numeric_backend.h"

#include <vector>

namespace contour::pipeline {

// Cleans every raw contour, drops the ones that end up too short, and moves the
// survivors into a frame whose bounding box starts at the origin.
//
// Returns NoValidContours when nothing survives and DegenerateExtent when the
// survivors span no area. `out` is only written on success.
ContourError normalizeContours(
    const std::vector<RawContour>& contours,
    const geometry::NumericBackend& backend,
    ParsedDocument& out);

// Single-contour step of the above, before translation. False if the contour
// is discarded.
bool normalizeContour(const RawContour& raw, const geometry::NumericBackend& backend, NormalizedContour& out);

} // namespace contour::pipeline

#endif // CONTOUR_PIPELINE_NORMALIZER_H
