#include <gtest/gtest.h>
#include <blockmesh/edge.hpp>
#include <common/errors.hpp>
#include <cmath>
#include <numbers>

using namespace tetris;

class EdgeTest : public ::testing::Test {
protected:
    VertexHandle origin = make_vertex(0, 0, 0);
    VertexHandle unit_x = make_vertex(1, 0, 0);
};

TEST_F(EdgeTest, LineByDefault) {
    Edge e(origin, unit_x);
    EXPECT_TRUE(e.is_line());
    EXPECT_EQ(e.type(), "line");
    EXPECT_EQ(e[0], origin);
    EXPECT_EQ(e[1], unit_x);
}

TEST_F(EdgeTest, ZeroLengthRejected) {
    auto same_place = make_vertex(0, 0, 0);
    EXPECT_THROW(Edge::line(origin, same_place), GeometryError);
    EXPECT_THROW(Edge::arc(origin, origin, {0.5, 0.5, 0}), GeometryError);
}

TEST_F(EdgeTest, NullEndpointRejected) {
    EXPECT_THROW(Edge::line(origin, nullptr), TypeContractError);
}

TEST_F(EdgeTest, TypeNames) {
    EXPECT_EQ(Edge::arc(origin, unit_x, {0.5, 0.5, 0})->type(), "arc");
    EXPECT_EQ(Edge::arc_origin(origin, unit_x, {0.5, -1, 0})->type(), "arc");
    EXPECT_EQ(Edge::spline(origin, unit_x, {{0.5, 0.2, 0}})->type(), "spline");
    EXPECT_EQ(Edge::bspline(origin, unit_x, {{0.5, 0.2, 0}})->type(), "BSpline");
    EXPECT_EQ(Edge::poly_line(origin, unit_x, {{0.5, 0.2, 0}})->type(), "polyLine");
    EXPECT_EQ(Edge::project(origin, unit_x, {Geometry::tri_surface("s", "s.stl")})->type(),
              "project");
}

TEST_F(EdgeTest, SplineDropsCollinearPoints) {
    auto e = Edge::spline(origin, unit_x, {{0.25, 0, 0}, {0.5, 0.3, 0}, {0.75, 0, 0}});
    const auto& seq = std::get<edge::Sequence>(e->shape());
    ASSERT_EQ(seq.points.size(), 3u);

    auto straight = Edge::poly_line(origin, make_vertex(3, 0, 0), {{1, 0, 0}, {2, 0, 0}});
    EXPECT_TRUE(straight->is_line());
    EXPECT_EQ(straight->type(), "line");
}

TEST_F(EdgeTest, SimplificationIsSinglePass) {
    // Both interior points are marked against the original sequence
    auto points = simplify_points({0, 0, 0}, {{1, 0, 0}, {2, 0, 0}, {2, 1, 0}}, {2, 2, 0});
    ASSERT_EQ(points.size(), 1u);
    EXPECT_EQ(points[0], Vec3(2, 0, 0));
}

TEST_F(EdgeTest, SimplifyKeepsCorners) {
    auto points = simplify_points({0, 0, 0}, {{1, 1, 0}}, {2, 0, 0});
    ASSERT_EQ(points.size(), 1u);
}

TEST_F(EdgeTest, InvertSwapsEndpointsAndReversesPoints) {
    auto e = Edge::spline(origin, unit_x, {{0.25, 0.1, 0}, {0.75, 0.3, 0}});
    Edge inverted = e->invert();
    EXPECT_EQ(inverted.v0(), unit_x);
    EXPECT_EQ(inverted.v1(), origin);
    const auto& seq = std::get<edge::Sequence>(inverted.shape());
    EXPECT_EQ(seq.points.front(), Vec3(0.75, 0.3, 0));
    EXPECT_EQ(inverted.invert(), *e);
}

TEST_F(EdgeTest, InvertKeepsArcPoint) {
    auto e = Edge::arc(origin, unit_x, {0.5, 0.5, 0});
    Edge inverted = e->invert();
    EXPECT_EQ(std::get<edge::ArcMid>(inverted.shape()).point, Vec3(0.5, 0.5, 0));
    EXPECT_EQ(inverted.invert(), *e);
}

TEST_F(EdgeTest, StructuralEquality) {
    auto a = Edge::arc(origin, unit_x, {0.5, 0.5, 0});
    auto b = Edge::arc(make_vertex(0, 0, 0), make_vertex(1, 0, 0), {0.5, 0.5, 0});
    auto c = Edge::arc(origin, unit_x, {0.5, -0.5, 0});
    EXPECT_EQ(*a, *b);
    EXPECT_NE(*a, *c);
    EXPECT_NE(*a, *Edge::line(origin, unit_x));
}

TEST_F(EdgeTest, LineLength) {
    EXPECT_DOUBLE_EQ(Edge::line(origin, make_vertex(3, 4, 0))->length(), 5.0);
}

TEST_F(EdgeTest, HalfCircleArcLength) {
    auto e = Edge::arc(make_vertex(-1, 0, 0), unit_x, {0, 1, 0});
    EXPECT_NEAR(e->length(), std::numbers::pi, 1e-12);
}

TEST_F(EdgeTest, QuarterCircleArcOriginLength) {
    auto e = Edge::arc_origin(unit_x, make_vertex(0, 1, 0), {0, 0, 0});
    EXPECT_NEAR(e->length(), std::numbers::pi / 2, 1e-12);
}

TEST_F(EdgeTest, PolyLineLength) {
    auto e = Edge::poly_line(origin, make_vertex(2, 0, 0), {{1, 1, 0}});
    EXPECT_NEAR(e->length(), 2.0 * std::sqrt(2.0), 1e-12);
}

TEST_F(EdgeTest, PointsFromRows) {
    auto points = points_from_rows({{1, 2, 3}, {4, 5, 6}});
    ASSERT_EQ(points.size(), 2u);
    EXPECT_EQ(points[1], Vec3(4, 5, 6));
    EXPECT_THROW(points_from_rows({{1, 2, 3}, {4, 5}}), ConfigurationError);
}

TEST_F(EdgeTest, InvertIsInvolutionForAllShapes) {
    std::vector<EdgeHandle> edges = {
        Edge::line(origin, unit_x),
        Edge::arc_origin(origin, unit_x, {0.5, -1, 0}, 1.2),
        Edge::bspline(origin, unit_x, {{0.2, 0.1, 0}, {0.5, 0.3, 0}, {0.8, 0.1, 0}}),
        Edge::project(origin, unit_x, {Geometry::tri_surface("s", "s.stl")}),
    };
    for (const auto& e : edges) {
        Edge inverted = e->invert();
        EXPECT_EQ(inverted.v0(), e->v1());
        EXPECT_EQ(inverted.type(), e->type());
        EXPECT_EQ(inverted.invert(), *e);
    }
}
