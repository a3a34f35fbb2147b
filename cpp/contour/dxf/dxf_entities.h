#ifndef CONTOUR_DXF_DXF_ENTITIES_H
#define CONTOUR_DXF_DXF_ENTITIES_H

#include "contour/core/types.h"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace contour::dxf {

// Modelspace entities as the reader hands them over. Only planar X/Y is kept.
// Fields a file may omit are optional; the collector skips entities that lack them.

struct LineEntity {
    std::optional<Point2> start;
    std::optional<Point2> end;
};

struct ArcEntity {
    std::optional<Point2> center;
    double radius{0.0};
    double startAngle{0.0}; // degrees
    double endAngle{0.0};   // degrees
};

struct CircleEntity {
    std::optional<Point2> center;
    double radius{0.0};
};

struct PolylineVertex {
    double x{0.0};
    double y{0.0};
    double bulge{0.0};
};

// LWPOLYLINE and POLYLINE + VERTEX records.
struct PolylineEntity {
    bool closed{false};
    std::vector<PolylineVertex> vertices;
};

struct SplineEntity {
    bool closed{false};
    int degree{3};
    std::vector<double> knots;
    std::vector<double> weights;
    std::vector<Point2> controlPoints;
    std::vector<Point2> fitPoints;
};

struct UnsupportedEntity {
    std::string type;
};

using Entity = std::variant<LineEntity, PolylineEntity, ArcEntity, CircleEntity, SplineEntity, UnsupportedEntity>;

const char* entityTypeName(const Entity& entity);

// What the pipeline needs from a CAD document.
class Document {
public:
    virtual ~Document() = default;

    virtual const std::vector<Entity>& entities() const = 0;

    // Ordered points along the spline, deviating at most `tolerance` from it.
    // May be empty when the spline data does not describe a curve.
    virtual std::vector<Point2> flattenSpline(const SplineEntity& spline, double tolerance) const = 0;
};

} // namespace contour::dxf

#endif // CONTOUR_DXF_DXF_ENTITIES_H
