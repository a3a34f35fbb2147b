#include <gtest/gtest.h>

#include "contour/dxf/dxf_reader.h"
#include "contour/geometry/numeric_backend.h"
#include "contour/geometry/tessellation.h"
#include "contour/pipeline/contour_collector.h"

#include <cmath>

using namespace contour;
using namespace contour::dxf;
using namespace contour::pipeline;

namespace {

const geometry::NumericBackend& scalar() { return geometry::backendFor(ComputeMode::Cpu); }

LineEntity makeLine(Point2 a, Point2 b) {
    LineEntity l;
    l.start = a;
    l.end = b;
    return l;
}

} // namespace

TEST(ContourCollectorTest, LineBecomesOpenTwoPointContour) {
    DxfDocument doc;
    doc.addEntity(makeLine({1.0, 2.0}, {3.0, 4.0}));
    const auto contours = collectContours(doc, scalar());
    ASSERT_EQ(contours.size(), 1u);
    EXPECT_FALSE(contours[0].closed);
    ASSERT_EQ(contours[0].points.size(), 2u);
    EXPECT_EQ(contours[0].points[1], (Point2{3.0, 4.0}));
}

TEST(ContourCollectorTest, IncompleteEntitiesAreSkipped) {
    DxfDocument doc;
    LineEntity noEnd;
    noEnd.start = Point2{0.0, 0.0};
    doc.addEntity(noEnd);

    CircleEntity noCenter;
    noCenter.radius = 4.0;
    doc.addEntity(noCenter);

    CircleEntity zeroRadius;
    zeroRadius.center = Point2{0.0, 0.0};
    doc.addEntity(zeroRadius);

    ArcEntity negativeRadius;
    negativeRadius.center = Point2{0.0, 0.0};
    negativeRadius.radius = -1.0;
    doc.addEntity(negativeRadius);

    PolylineEntity single;
    single.vertices = {{0.0, 0.0, 0.0}};
    doc.addEntity(single);

    doc.addEntity(UnsupportedEntity{"TEXT"});

    EXPECT_TRUE(collectContours(doc, scalar()).empty());
}

TEST(ContourCollectorTest, ArcIsOpenAndCircleIsClosed) {
    DxfDocument doc;
    ArcEntity arc;
    arc.center = Point2{0.0, 0.0};
    arc.radius = 10.0;
    arc.startAngle = 0.0;
    arc.endAngle = 180.0;
    doc.addEntity(arc);

    CircleEntity circle;
    circle.center = Point2{5.0, 5.0};
    circle.radius = 5.0;
    doc.addEntity(circle);

    const auto contours = collectContours(doc, scalar());
    ASSERT_EQ(contours.size(), 2u);

    EXPECT_FALSE(contours[0].closed);
    EXPECT_NEAR(contours[0].points.back().x, -10.0, 1e-9);
    for (const auto& p : contours[0].points) EXPECT_GE(p.y, -1e-9);

    EXPECT_TRUE(contours[1].closed);
    EXPECT_EQ(contours[1].points.size(), 40u);
}

TEST(ContourCollectorTest, ClosedSquarePolylineHasNoSeam) {
    PolylineEntity poly;
    poly.closed = true;
    poly.vertices = {{0.0, 0.0, 0.0}, {10.0, 0.0, 0.0}, {10.0, 10.0, 0.0}, {0.0, 10.0, 0.0}};
    const auto c = polylineContour(poly, kDefaultChordTolerance);
    ASSERT_TRUE(c.has_value());
    EXPECT_TRUE(c->closed);
    ASSERT_EQ(c->points.size(), 4u);
    EXPECT_EQ(c->points[2], (Point2{10.0, 10.0}));
}

TEST(ContourCollectorTest, OpenPolylineKeepsBothEnds) {
    PolylineEntity poly;
    poly.vertices = {{0.0, 0.0, 0.0}, {10.0, 0.0, 0.0}, {0.0, 0.0, 0.0}};
    const auto c = polylineContour(poly, kDefaultChordTolerance);
    ASSERT_TRUE(c.has_value());
    EXPECT_FALSE(c->closed);
    EXPECT_EQ(c->points.size(), 3u);
}

TEST(ContourCollectorTest, SplineIsFlattenedThroughTheDocument) {
    DxfDocument doc;
    SplineEntity s;
    s.degree = 3;
    s.knots = {0, 0, 0, 0, 1, 1, 1, 1};
    s.controlPoints = {{0, 0}, {0, 10}, {10, 10}, {10, 0}};
    doc.addEntity(s);

    const auto contours = collectContours(doc, scalar(), 0.1);
    ASSERT_EQ(contours.size(), 1u);
    EXPECT_FALSE(contours[0].closed);
    EXPECT_GT(contours[0].points.size(), 4u);
    EXPECT_NEAR(contours[0].points.front().x, 0.0, 1e-12);
    EXPECT_NEAR(contours[0].points.back().x, 10.0, 1e-12);
}

TEST(ContourCollectorTest, SplineWithoutCurveDataIsSkipped) {
    DxfDocument doc;
    SplineEntity s;
    s.degree = 3;
    s.knots = {0, 1};
    s.controlPoints = {{2, 2}};
    doc.addEntity(s);
    EXPECT_TRUE(collectContours(doc, scalar()).empty());
}

TEST(ContourCollectorTest, ClosedSplineNeedsThreePoints) {
    DxfDocument doc;
    SplineEntity s;
    s.closed = true;
    s.degree = 1;
    s.fitPoints = {{0, 0}, {5, 5}};
    doc.addEntity(s);
    EXPECT_TRUE(collectContours(doc, scalar()).empty());
}

TEST(ContourCollectorTest, OrderFollowsEntities) {
    DxfDocument doc;
    doc.addEntity(makeLine({0.0, 0.0}, {1.0, 0.0}));
    doc.addEntity(UnsupportedEntity{"HATCH"});
    doc.addEntity(makeLine({5.0, 5.0}, {6.0, 6.0}));
    const auto contours = collectContours(doc, scalar());
    ASSERT_EQ(contours.size(), 2u);
    EXPECT_EQ(contours[1].points[0], (Point2{5.0, 5.0}));
}
