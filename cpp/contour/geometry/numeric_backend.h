#ifndef CONTOUR_GEOMETRY_NUMERIC_BACKEND_H
#define CONTOUR_GEOMETRY_NUMERIC_BACKEND_H

#include "contour/core/types.h"

#include <vector>

namespace contour::geometry {

// The numeric kernels the pipeline spends its time in. Implementations must
// agree to within floating tolerance; picking one is a throughput decision.
class NumericBackend {
public:
    virtual ~NumericBackend() = default;

    virtual ComputeMode mode() const noexcept = 0;
    virtual const char* name() const noexcept = 0;

    // Appends steps + 1 points center + radius * (cos a, sin a), with a linear in
    // [startRad, startRad + sweepRad].
    virtual void sampleArc(
        const Point2& center,
        double radius,
        double startRad,
        double sweepRad,
        int steps,
        std::vector<Point2>& out) const = 0;

    // Drops non-finite points, then drops every point whose squared distance to
    // its (finite) predecessor is <= minDist2. The first point is always kept.
    virtual std::vector<Point2> cleanPoints(const std::vector<Point2>& points, double minDist2) const = 0;

    // Axis-aligned bounds over every point of every contour. False if there are none.
    virtual bool computeBounds(const std::vector<NormalizedContour>& contours, Bounds& out) const = 0;

    virtual void translate(std::vector<Point2>& points, double dx, double dy) const = 0;
};

class ScalarBackend final : public NumericBackend {
public:
    ComputeMode mode() const noexcept override { return ComputeMode::Cpu; }
    const char* name() const noexcept override { return "scalar"; }

    void sampleArc(const Point2& center, double radius, double startRad, double sweepRad, int steps,
                   std::vector<Point2>& out) const override;
    std::vector<Point2> cleanPoints(const std::vector<Point2>& points, double minDist2) const override;
    bool computeBounds(const std::vector<NormalizedContour>& contours, Bounds& out) const override;
    void translate(std::vector<Point2>& points, double dx, double dy) const override;
};

// Eigen array expressions; vectorized with whatever SIMD set Eigen was built for.
class EigenBackend final : public NumericBackend {
public:
    ComputeMode mode() const noexcept override { return ComputeMode::Accelerated; }
    const char* name() const noexcept override { return "eigen"; }

    void sampleArc(const Point2& center, double radius, double startRad, double sweepRad, int steps,
                   std::vector<Point2>& out) const override;
    std::vector<Point2> cleanPoints(const std::vector<Point2>& points, double minDist2) const override;
    bool computeBounds(const std::vector<NormalizedContour>& contours, Bounds& out) const override;
    void translate(std::vector<Point2>& points, double dx, double dy) const override;
};

// Shared stateless instances.
const NumericBackend& backendFor(ComputeMode mode) noexcept;

// True when Eigen is vectorizing (SSE/AVX/NEON/...) in this build.
bool simdAvailable() noexcept;
const char* simdInstructionSets() noexcept;

} // namespace contour::geometry

#endif // CONTOUR_GEOMETRY_NUMERIC_BACKEND_H
