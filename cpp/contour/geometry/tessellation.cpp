#include "contour/geometry/tessellation.h"

#include <algorithm>
#include <cmath>

namespace contour::geometry {

namespace {

static constexpr double kPi = 3.14159265358979323846;

int clampSteps(double raw, int minSteps) noexcept {
    if (!(raw > 0.0)) return minSteps;
    if (raw >= static_cast<double>(kMaxCurveSteps)) return kMaxCurveSteps;
    return std::max(minSteps, static_cast<int>(std::ceil(raw)));
}

} // namespace

int bulgeStepCount(double includedAngle, double radius, double chordTolerance) noexcept {
    const double tol = std::max(chordTolerance, kMinChordTolerance);
    return clampSteps(std::abs(includedAngle) * radius / tol, kMinBulgeSteps);
}

int arcStepCount(double sweepDeg, double radius, double chordTolerance) noexcept {
    const double tol = std::max(chordTolerance, kMinChordTolerance);
    return clampSteps((kPi * sweepDeg / 180.0 * radius) / tol, kMinArcSteps);
}

double normalizeSweep(double startDeg, double endDeg) noexcept {
    double sweep = endDeg - startDeg;
    if (!std::isfinite(sweep)) return 0.0;
    if (sweep <= 0.0) {
        sweep = std::fmod(sweep, 360.0);
        if (sweep <= 0.0) sweep += 360.0;
    }
    return sweep;
}

std::vector<Point2> bulgePoints(const Point2& p1, const Point2& p2, double bulge, double chordTolerance) {
    if (!(std::abs(bulge) >= kBulgeEpsilon)) return {p1, p2};

    const double chord = distance(p1, p2);
    if (chord < kGeomEpsilon) return {p1, p2};

    const double theta = 4.0 * std::atan(bulge);
    const double sinHalf = std::sin(std::abs(theta) / 2.0);
    if (std::abs(sinHalf) < kGeomEpsilon) return {p1, p2};

    const double radius = chord / (2.0 * sinHalf);
    const Point2 mid{(p1.x + p2.x) * 0.5, (p1.y + p2.y) * 0.5};
    const Point2 normal{-(p2.y - p1.y) / chord, (p2.x - p1.x) / chord};
    const double half = chord * 0.5;
    const double offset = std::sqrt(std::max(radius * radius - half * half, 0.0));

    // Center sits left of p1->p2 for a counter-clockwise minor arc. A major arc
    // (|bulge| > 1) puts it on the other side.
    double side = bulge > 0.0 ? 1.0 : -1.0;
    if (std::abs(theta) > kPi) side = -side;
    const Point2 c{mid.x + normal.x * offset * side, mid.y + normal.y * offset * side};

    const double start = std::atan2(p1.y - c.y, p1.x - c.x);
    const int steps = bulgeStepCount(theta, radius, chordTolerance);

    std::vector<Point2> pts;
    pts.reserve(static_cast<std::size_t>(steps) + 1);
    pts.push_back(p1);
    for (int i = 1; i <= steps; ++i) {
        const double a = start + theta * (static_cast<double>(i) / static_cast<double>(steps));
        pts.push_back(Point2{c.x + radius * std::cos(a), c.y + radius * std::sin(a)});
    }
    pts.back() = p2;
    return pts;
}

std::vector<Point2> arcPoints(const Point2& center, double radius, double startDeg, double endDeg,
                              double chordTolerance, const NumericBackend& backend) {
    std::vector<Point2> pts;
    if (!(radius > 0.0) || !std::isfinite(radius)) return pts;

    const double sweep = normalizeSweep(startDeg, endDeg);
    if (!(sweep > 0.0)) return pts;

    const int steps = arcStepCount(sweep, radius, chordTolerance);
    const double startRad = startDeg * kPi / 180.0;
    const double sweepRad = sweep * kPi / 180.0;
    backend.sampleArc(center, radius, startRad, sweepRad, steps, pts);
    return pts;
}

std::vector<Point2> circlePoints(const Point2& center, double radius, double chordTolerance,
                                 const NumericBackend& backend) {
    std::vector<Point2> pts = arcPoints(center, radius, 0.0, 360.0, chordTolerance, backend);
    if (pts.size() > 1 && distance(pts.front(), pts.back()) <= kGeomEpsilon) {
        pts.pop_back();
    }
    return pts;
}

std::vector<Point2> splinePoints(const std::vector<Point2>& flattened, const std::vector<Point2>& controlPoints) {
    const std::vector<Point2>& source = flattened.size() >= 2 ? flattened : controlPoints;
    return mergeClosePoints(source, kTessellationMergeTol);
}

void pushUniquePoint(const Point2& p, std::vector<Point2>& out, double tol) {
    if (out.empty() || distance(out.back(), p) > tol) {
        out.push_back(p);
    }
}

std::vector<Point2> mergeClosePoints(const std::vector<Point2>& points, double tol) {
    std::vector<Point2> out;
    out.reserve(points.size());
    for (const Point2& p : points) {
        pushUniquePoint(p, out, tol);
    }
    return out;
}

} // namespace contour::geometry
