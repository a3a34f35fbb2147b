#include "contour/pipeline/contour_collector.h"

#include "contour/core/logging.h"
#include "contour/geometry/tessellation.h"

#include <variant>

namespace contour::pipeline {

namespace {

using geometry::distance;

void dropClosingPoint(std::vector<Point2>& pts) {
    if (pts.size() > 1 && distance(pts.front(), pts.back()) <= kGeomEpsilon) {
        pts.pop_back();
    }
}

// One case per entity kind. Anything the visitor rejects is counted, not reported.
struct CollectVisitor {
    const dxf::Document& doc;
    const geometry::NumericBackend& backend;
    double tol;
    std::vector<RawContour>& out;
    std::size_t skipped{0};

    void operator()(const dxf::LineEntity& line) {
        if (!line.start || !line.end) {
            ++skipped;
            return;
        }
        out.push_back(RawContour{{*line.start, *line.end}, false});
    }

    void operator()(const dxf::PolylineEntity& poly) {
        if (auto c = polylineContour(poly, tol)) {
            out.push_back(std::move(*c));
        } else {
            ++skipped;
        }
    }

    void operator()(const dxf::ArcEntity& arc) {
        if (!arc.center || !(arc.radius > 0.0)) {
            ++skipped;
            return;
        }
        std::vector<Point2> pts = geometry::arcPoints(*arc.center, arc.radius, arc.startAngle, arc.endAngle, tol,
                                                      backend);
        if (pts.size() < 2) {
            ++skipped;
            return;
        }
        out.push_back(RawContour{std::move(pts), false});
    }

    void operator()(const dxf::CircleEntity& circle) {
        if (!circle.center || !(circle.radius > 0.0)) {
            ++skipped;
            return;
        }
        std::vector<Point2> pts = geometry::circlePoints(*circle.center, circle.radius, tol, backend);
        if (pts.size() < 3) {
            ++skipped;
            return;
        }
        out.push_back(RawContour{std::move(pts), true});
    }

    void operator()(const dxf::SplineEntity& spline) {
        auto c = splineContour(doc, spline, tol);
        if (!c) {
            ++skipped;
            return;
        }
        const std::size_t minPts = c->closed ? 3 : 2;
        if (c->points.size() < minPts) {
            ++skipped;
            return;
        }
        out.push_back(std::move(*c));
    }

    void operator()(const dxf::UnsupportedEntity&) { ++skipped; }
};

} // namespace

std::optional<RawContour> polylineContour(const dxf::PolylineEntity& poly, double chordTolerance) {
    const auto& verts = poly.vertices;
    if (verts.size() < 2) return std::nullopt;

    const std::size_t segCount = poly.closed ? verts.size() : verts.size() - 1;
    std::vector<Point2> pts;
    pts.push_back(Point2{verts[0].x, verts[0].y});

    for (std::size_t i = 0; i < segCount; ++i) {
        const std::size_t n = (i + 1) % verts.size();
        const Point2 p1{verts[i].x, verts[i].y};
        const Point2 p2{verts[n].x, verts[n].y};
        const std::vector<Point2> seg = geometry::bulgePoints(p1, p2, verts[i].bulge, chordTolerance);
        pts.insert(pts.end(), seg.begin() + 1, seg.end());
    }

    pts = geometry::mergeClosePoints(pts, kTessellationMergeTol);
    if (poly.closed) dropClosingPoint(pts);
    return RawContour{std::move(pts), poly.closed};
}

std::optional<RawContour> splineContour(const dxf::Document& doc, const dxf::SplineEntity& spline,
                                        double chordTolerance) {
    const std::vector<Point2> flattened = doc.flattenSpline(spline, chordTolerance);
    std::vector<Point2> pts = geometry::splinePoints(flattened, spline.controlPoints);
    if (pts.size() < 2) return std::nullopt;
    if (spline.closed) dropClosingPoint(pts);
    return RawContour{std::move(pts), spline.closed};
}

std::vector<RawContour> collectContours(const dxf::Document& doc, const geometry::NumericBackend& backend,
                                        double chordTolerance) {
    std::vector<RawContour> contours;
    contours.reserve(doc.entities().size());

    CollectVisitor visitor{doc, backend, chordTolerance, contours};
    for (const dxf::Entity& e : doc.entities()) {
        std::visit(visitor, e);
    }
    if (visitor.skipped > 0) {
        CONTOUR_LOG_DEBUG("collector skipped %zu of %zu entities", visitor.skipped, doc.entities().size());
    }
    return contours;
}

} // namespace contour::pipeline
