#ifndef CONTOUR_PIPELINE_CONTOUR_COLLECTOR_H
#define CONTOUR_PIPELINE_CONTOUR_COLLECTOR_H

#include "contour/core/types.h"
#include "contour/dxf/dxf_entities.h"
#include "contour/geometry/numeric_backend.h"

#include <optional>
#include <vector>

namespace contour::pipeline {

// Tessellates every supported entity of the document into one raw contour.
// Entities that are unsupported, incomplete or degenerate are skipped.
std::vector<RawContour> collectContours(
    const dxf::Document& doc,
    const geometry::NumericBackend& backend,
    double chordTolerance = kDefaultChordTolerance);

// Bulge-aware outline of a polyline. Empty when it has fewer than two vertices.
std::optional<RawContour> polylineContour(const dxf::PolylineEntity& poly, double chordTolerance);

std::optional<RawContour> splineContour(const dxf::Document& doc, const dxf::SplineEntity& spline,
                                        double chordTolerance);

} // namespace contour::pipeline

#endif // CONTOUR_PIPELINE_CONTOUR_COLLECTOR_H
