#ifndef CONTOUR_GEOMETRY_TESSELLATION_H
#define CONTOUR_GEOMETRY_TESSELLATION_H

#include "contour/core/types.h"
#include "contour/geometry/numeric_backend.h"

#include <cmath>
#include <vector>

namespace contour::geometry {

inline double distance(const Point2& a, const Point2& b) noexcept {
    const double dx = a.x - b.x;
    const double dy = a.y - b.y;
    return std::sqrt(dx * dx + dy * dy);
}

// Step counts used by the samplers below. Both clamp the tolerance to
// kMinChordTolerance and cap the result at kMaxCurveSteps.
int bulgeStepCount(double includedAngle, double radius, double chordTolerance) noexcept;
int arcStepCount(double sweepDeg, double radius, double chordTolerance) noexcept;

// end - start folded into (0, 360]. Arcs always run counter-clockwise.
double normalizeSweep(double startDeg, double endDeg) noexcept;

// Polyline segment p1 -> p2 with the given bulge (tan of a quarter of the
// included angle). Straight segments come back as [p1, p2]; curved ones end on
// p2 exactly.
std::vector<Point2> bulgePoints(const Point2& p1, const Point2& p2, double bulge,
                                double chordTolerance = kDefaultChordTolerance);

// Counter-clockwise arc from startDeg. Empty for a non-positive radius.
std::vector<Point2> arcPoints(const Point2& center, double radius, double startDeg, double endDeg,
                              double chordTolerance, const NumericBackend& backend);

// Full circle with the duplicated seam point removed. Callers need >= 3 points
// for a usable contour.
std::vector<Point2> circlePoints(const Point2& center, double radius, double chordTolerance,
                                 const NumericBackend& backend);

// Keeps flattened spline output, falling back to the control polygon when the
// flattening produced fewer than two points. Near-duplicates are merged.
std::vector<Point2> splinePoints(const std::vector<Point2>& flattened, const std::vector<Point2>& controlPoints);

// Drops every point within tol of the last kept one.
std::vector<Point2> mergeClosePoints(const std::vector<Point2>& points, double tol);

void pushUniquePoint(const Point2& p, std::vector<Point2>& out, double tol);

} // namespace contour::geometry

#endif // CONTOUR_GEOMETRY_TESSELLATION_H
