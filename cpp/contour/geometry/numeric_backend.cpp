#include "contour/geometry/numeric_backend.h"

#include <Eigen/Core>

#include <algorithm>
#include <cmath>
#include <cstring>
#include <limits>

namespace contour::geometry {

namespace {

using ArrayXd = Eigen::ArrayXd;
using ArrayXb = Eigen::Array<bool, Eigen::Dynamic, 1>;

void splitXY(const std::vector<Point2>& points, ArrayXd& xs, ArrayXd& ys) {
    const Eigen::Index n = static_cast<Eigen::Index>(points.size());
    xs.resize(n);
    ys.resize(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        xs(i) = points[static_cast<std::size_t>(i)].x;
        ys(i) = points[static_cast<std::size_t>(i)].y;
    }
}

} // namespace

// =============================================================================
// ScalarBackend
// =============================================================================

void ScalarBackend::sampleArc(const Point2& center, double radius, double startRad, double sweepRad, int steps,
                              std::vector<Point2>& out) const {
    if (steps < 1) return;
    out.reserve(out.size() + static_cast<std::size_t>(steps) + 1);
    for (int i = 0; i <= steps; ++i) {
        const double a = (i == steps)
            ? startRad + sweepRad
            : startRad + sweepRad * (static_cast<double>(i) / static_cast<double>(steps));
        out.push_back(Point2{center.x + radius * std::cos(a), center.y + radius * std::sin(a)});
    }
}

std::vector<Point2> ScalarBackend::cleanPoints(const std::vector<Point2>& points, double minDist2) const {
    std::vector<Point2> out;
    out.reserve(points.size());
    bool havePrev = false;
    Point2 prev{0.0, 0.0};
    for (const Point2& p : points) {
        if (!std::isfinite(p.x) || !std::isfinite(p.y)) continue;
        if (havePrev) {
            const double dx = p.x - prev.x;
            const double dy = p.y - prev.y;
            if (dx * dx + dy * dy > minDist2) out.push_back(p);
        } else {
            out.push_back(p);
        }
        prev = p;
        havePrev = true;
    }
    return out;
}

bool ScalarBackend::computeBounds(const std::vector<NormalizedContour>& contours, Bounds& out) const {
    bool any = false;
    Bounds b{std::numeric_limits<double>::max(), std::numeric_limits<double>::max(),
             std::numeric_limits<double>::lowest(), std::numeric_limits<double>::lowest()};
    for (const auto& c : contours) {
        for (const Point2& p : c.points) {
            b.minX = std::min(b.minX, p.x);
            b.minY = std::min(b.minY, p.y);
            b.maxX = std::max(b.maxX, p.x);
            b.maxY = std::max(b.maxY, p.y);
            any = true;
        }
    }
    if (any) out = b;
    return any;
}

void ScalarBackend::translate(std::vector<Point2>& points, double dx, double dy) const {
    for (Point2& p : points) {
        p.x -= dx;
        p.y -= dy;
    }
}

// =============================================================================
// EigenBackend
// =============================================================================

void EigenBackend::sampleArc(const Point2& center, double radius, double startRad, double sweepRad, int steps,
                             std::vector<Point2>& out) const {
    if (steps < 1) return;
    const Eigen::Index n = static_cast<Eigen::Index>(steps) + 1;
    const ArrayXd angles = ArrayXd::LinSpaced(n, startRad, startRad + sweepRad);
    const ArrayXd xs = center.x + radius * angles.cos();
    const ArrayXd ys = center.y + radius * angles.sin();

    const std::size_t base = out.size();
    out.resize(base + static_cast<std::size_t>(n));
    for (Eigen::Index i = 0; i < n; ++i) {
        out[base + static_cast<std::size_t>(i)] = Point2{xs(i), ys(i)};
    }
}

std::vector<Point2> EigenBackend::cleanPoints(const std::vector<Point2>& points, double minDist2) const {
    std::vector<Point2> out;
    if (points.empty()) return out;

    ArrayXd xs;
    ArrayXd ys;
    splitXY(points, xs, ys);

    const ArrayXb finite = xs.isFinite() && ys.isFinite();
    const Eigen::Index m = finite.count();
    if (m == 0) return out;

    ArrayXd fx(m);
    ArrayXd fy(m);
    for (Eigen::Index i = 0, j = 0; i < xs.size(); ++i) {
        if (!finite(i)) continue;
        fx(j) = xs(i);
        fy(j) = ys(i);
        ++j;
    }

    ArrayXb keep = ArrayXb::Constant(m, true);
    if (m > 1) {
        const ArrayXd dx = fx.tail(m - 1) - fx.head(m - 1);
        const ArrayXd dy = fy.tail(m - 1) - fy.head(m - 1);
        keep.tail(m - 1) = (dx * dx + dy * dy) > minDist2;
    }

    out.reserve(static_cast<std::size_t>(keep.count()));
    for (Eigen::Index i = 0; i < m; ++i) {
        if (keep(i)) out.push_back(Point2{fx(i), fy(i)});
    }
    return out;
}

bool EigenBackend::computeBounds(const std::vector<NormalizedContour>& contours, Bounds& out) const {
    std::size_t total = 0;
    for (const auto& c : contours) total += c.points.size();
    if (total == 0) return false;

    ArrayXd xs(static_cast<Eigen::Index>(total));
    ArrayXd ys(static_cast<Eigen::Index>(total));
    Eigen::Index k = 0;
    for (const auto& c : contours) {
        for (const Point2& p : c.points) {
            xs(k) = p.x;
            ys(k) = p.y;
            ++k;
        }
    }

    out.minX = xs.minCoeff();
    out.minY = ys.minCoeff();
    out.maxX = xs.maxCoeff();
    out.maxY = ys.maxCoeff();
    return true;
}

void EigenBackend::translate(std::vector<Point2>& points, double dx, double dy) const {
    if (points.empty()) return;
    ArrayXd xs;
    ArrayXd ys;
    splitXY(points, xs, ys);
    xs -= dx;
    ys -= dy;
    for (std::size_t i = 0; i < points.size(); ++i) {
        points[i] = Point2{xs(static_cast<Eigen::Index>(i)), ys(static_cast<Eigen::Index>(i))};
    }
}

// =============================================================================

const NumericBackend& backendFor(ComputeMode mode) noexcept {
    static const ScalarBackend scalar;
    static const EigenBackend eigen;
    if (mode == ComputeMode::Accelerated) return eigen;
    return scalar;
}

const char* simdInstructionSets() noexcept {
    return Eigen::SimdInstructionSetsInUse();
}

bool simdAvailable() noexcept {
    return std::strcmp(simdInstructionSets(), "None") != 0;
}

} // namespace contour::geometry
