#ifndef CONTOUR_DXF_SPLINE_EVAL_H
#define CONTOUR_DXF_SPLINE_EVAL_H

#include "contour/dxf/dxf_entities.h"

#include <optional>
#include <vector>

namespace contour::dxf {

struct SplineFlattenOptions {
    double tolerance{kDefaultChordTolerance};
    // Upper bound on the number of samples along one spline.
    std::size_t maxSamples{1u << 16};
};

// Degree >= 1, enough control points, n + degree + 1 non-decreasing knots with
// a non-empty domain, and either no weights or one positive weight per point.
bool hasValidKnotVector(const SplineEntity& spline);

// Parameter domain [knots[degree], knots[n]]. Only meaningful for valid splines.
void splineDomain(const SplineEntity& spline, double& t0, double& t1);

// NURBS point at t (clamped into the domain), evaluated by tinyspline in
// homogeneous coordinates. Empty if tinyspline rejects the curve.
std::optional<Point2> evaluateSpline(const SplineEntity& spline, double t);

// Uniform parameter sampling, doubled until every span's midpoint lies within
// the tolerance of its chord. Splines tinyspline cannot build return their
// fit points (possibly empty).
std::vector<Point2> flattenSpline(const SplineEntity& spline, const SplineFlattenOptions& opt);

} // namespace contour::dxf

#endif // CONTOUR_DXF_SPLINE_EVAL_H
