#include "contour/dxf/spline_eval.h"

#include "contour/core/logging.h"

#include <tinysplinecpp.h>

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <exception>
#include <memory>

namespace contour::dxf {

namespace {

// Homogeneous coordinates (x*w, y*w, w) so tinyspline evaluates the rational curve.
constexpr std::size_t kDim = 3;
constexpr std::size_t kMinSamples = 16;

inline double pointSegmentDistance(const Point2& p, const Point2& a, const Point2& b) noexcept {
    const double abx = b.x - a.x;
    const double aby = b.y - a.y;
    const double len2 = abx * abx + aby * aby;
    if (!(len2 > 1e-28)) return std::hypot(p.x - a.x, p.y - a.y);
    double t = ((p.x - a.x) * abx + (p.y - a.y) * aby) / len2;
    t = std::min(1.0, std::max(0.0, t));
    return std::hypot(p.x - (a.x + abx * t), p.y - (a.y + aby * t));
}

std::unique_ptr<tinyspline::BSpline> buildCurve(const SplineEntity& spl) {
    const std::size_t n = spl.controlPoints.size();
    std::vector<tinyspline::real> ctrl;
    ctrl.reserve(n * kDim);
    for (std::size_t i = 0; i < n; ++i) {
        const double w = spl.weights.empty() ? 1.0 : spl.weights[i];
        ctrl.push_back(spl.controlPoints[i].x * w);
        ctrl.push_back(spl.controlPoints[i].y * w);
        ctrl.push_back(w);
    }
    std::vector<tinyspline::real> knots(spl.knots.begin(), spl.knots.end());

    try {
        auto curve = std::make_unique<tinyspline::BSpline>(n, kDim, static_cast<std::size_t>(spl.degree), TS_CLAMPED);
        curve->setControlPoints(ctrl);
        curve->setKnots(knots);
        return curve;
    } catch (const std::exception& e) {
        CONTOUR_LOG_DEBUG("tinyspline rejected spline: %s", e.what());
        return nullptr;
    }
}

bool dehomogenize(const std::vector<tinyspline::real>& v, std::size_t offset, Point2& out) {
    if (offset + kDim > v.size()) return false;
    const double w = v[offset + 2];
    if (w == 0.0 || !std::isfinite(w)) return false;
    out = Point2{v[offset] / w, v[offset + 1] / w};
    return true;
}

bool evalAt(const tinyspline::BSpline& curve, double t, Point2& out) {
    return dehomogenize(curve.eval(t).result(), 0, out);
}

} // namespace

bool hasValidKnotVector(const SplineEntity& spl) {
    if (spl.degree < 1) return false;
    const std::size_t p = static_cast<std::size_t>(spl.degree);
    const std::size_t n = spl.controlPoints.size();
    if (n < p + 1 || n < 2) return false;
    if (spl.knots.size() != n + p + 1) return false;
    for (std::size_t i = 0; i < spl.knots.size(); ++i) {
        if (!std::isfinite(spl.knots[i])) return false;
        if (i > 0 && spl.knots[i] < spl.knots[i - 1]) return false;
    }
    if (!(spl.knots[n] > spl.knots[p])) return false;
    if (!spl.weights.empty()) {
        if (spl.weights.size() != n) return false;
        for (double w : spl.weights) {
            if (!(w > 0.0) || !std::isfinite(w)) return false;
        }
    }
    return true;
}

void splineDomain(const SplineEntity& spl, double& t0, double& t1) {
    const std::size_t p = static_cast<std::size_t>(spl.degree);
    const std::size_t n = spl.controlPoints.size();
    t0 = spl.knots[p];
    t1 = spl.knots[n];
}

std::optional<Point2> evaluateSpline(const SplineEntity& spl, double t) {
    if (!hasValidKnotVector(spl)) return std::nullopt;
    const auto curve = buildCurve(spl);
    if (!curve) return std::nullopt;

    double t0 = 0.0;
    double t1 = 0.0;
    splineDomain(spl, t0, t1);
    t = std::min(t1, std::max(t0, t));

    try {
        Point2 p;
        if (!evalAt(*curve, t, p)) return std::nullopt;
        return p;
    } catch (const std::exception& e) {
        CONTOUR_LOG_DEBUG("spline evaluation failed: %s", e.what());
        return std::nullopt;
    }
}

std::vector<Point2> flattenSpline(const SplineEntity& spl, const SplineFlattenOptions& opt) {
    if (!hasValidKnotVector(spl)) return spl.fitPoints;
    const auto curve = buildCurve(spl);
    if (!curve) return spl.fitPoints;

    const double tol = std::max(opt.tolerance, 1e-9);
    double t0 = 0.0;
    double t1 = 0.0;
    splineDomain(spl, t0, t1);

    const std::size_t spans = spl.controlPoints.size() - static_cast<std::size_t>(spl.degree);
    std::size_t count = std::max(kMinSamples, spans * 4 + 1);
    const std::size_t limit = std::max(count, opt.maxSamples);

    std::vector<Point2> pts;
    try {
        for (;;) {
            const std::vector<tinyspline::real> raw = curve->sample(count);
            pts.clear();
            pts.reserve(count);
            for (std::size_t off = 0; off + kDim <= raw.size(); off += kDim) {
                Point2 p;
                if (dehomogenize(raw, off, p)) pts.push_back(p);
            }
            if (pts.size() != count || count >= limit) break;

            // Sample i sits at t0 + i * step; check the parameter midpoint of every span.
            const double step = (t1 - t0) / static_cast<double>(count - 1);
            bool withinTolerance = true;
            for (std::size_t i = 0; i + 1 < pts.size() && withinTolerance; ++i) {
                Point2 mid;
                if (!evalAt(*curve, t0 + (static_cast<double>(i) + 0.5) * step, mid)) continue;
                withinTolerance = pointSegmentDistance(mid, pts[i], pts[i + 1]) <= tol;
            }
            if (withinTolerance) break;
            count = std::min(limit, (count - 1) * 2 + 1);
        }
    } catch (const std::exception& e) {
        CONTOUR_LOG_DEBUG("spline sampling failed: %s", e.what());
        return spl.fitPoints;
    }
    return pts;
}

} // namespace contour::dxf
