#ifndef TETRIS_BLOCKMESH_EDGE_HPP
#define TETRIS_BLOCKMESH_EDGE_HPP

#include <blockmesh/geometry.hpp>
#include <blockmesh/vertex.hpp>
#include <math/vec3.hpp>
#include <memory>
#include <string_view>
#include <variant>
#include <vector>

namespace tetris {

// Curve flavours that share the "ordered interior points" representation
enum class SequenceKind {
    Spline,
    BSpline,
    PolyLine
};

namespace edge {

// Straight connection; implicit in blockMeshDict and never written
struct Line {
    bool operator==(const Line&) const = default;
};

// Circular arc through a point between the endpoints
struct ArcMid {
    Vec3 point;
    bool operator==(const ArcMid&) const = default;
};

// Circular arc given by its centre, optionally scaled by `factor`
struct ArcOrigin {
    Vec3 origin;
    double factor = 1.0;
    bool operator==(const ArcOrigin&) const = default;
};

// Spline, B-spline or poly-line through interior points
struct Sequence {
    SequenceKind kind = SequenceKind::Spline;
    std::vector<Vec3> points;
    bool operator==(const Sequence&) const = default;
};

// Edge snapped onto one or more surfaces
struct Project {
    GeometryList surfaces;
    bool operator==(const Project&) const = default;
};

}  // namespace edge

using EdgeShape = std::variant<
    edge::Line,
    edge::ArcMid,
    edge::ArcOrigin,
    edge::Sequence,
    edge::Project
>;

class Edge;
using EdgeHandle = std::shared_ptr<const Edge>;

// A curve between two block corners.
class Edge {
public:
    // Throws GeometryError when both endpoints sit at the same point.
    // Sequence shapes are simplified on construction and may collapse into
    // a Line.
    Edge(VertexHandle v0, VertexHandle v1, EdgeShape shape = edge::Line{});

    static EdgeHandle line(VertexHandle v0, VertexHandle v1);
    static EdgeHandle arc(VertexHandle v0, VertexHandle v1, const Vec3& point);
    static EdgeHandle arc_origin(VertexHandle v0, VertexHandle v1,
                                 const Vec3& origin, double factor = 1.0);
    static EdgeHandle sequence(SequenceKind kind, VertexHandle v0, VertexHandle v1,
                               std::vector<Vec3> points);
    static EdgeHandle spline(VertexHandle v0, VertexHandle v1, std::vector<Vec3> points);
    static EdgeHandle bspline(VertexHandle v0, VertexHandle v1, std::vector<Vec3> points);
    static EdgeHandle poly_line(VertexHandle v0, VertexHandle v1, std::vector<Vec3> points);
    static EdgeHandle project(VertexHandle v0, VertexHandle v1, GeometryList surfaces);

    const VertexHandle& v0() const { return v0_; }
    const VertexHandle& v1() const { return v1_; }
    const VertexHandle& operator[](size_t i) const { return i == 0 ? v0_ : v1_; }

    const EdgeShape& shape() const { return shape_; }
    bool is_line() const { return std::holds_alternative<edge::Line>(shape_); }

    // blockMeshDict keyword: line, arc, spline, BSpline, polyLine, project
    std::string_view type() const;

    // Same curve traversed from v1 to v0
    Edge invert() const;

    double length() const;

    // Structural comparison: endpoint coordinates and curve data
    bool operator==(const Edge& other) const;
    bool operator!=(const Edge& other) const { return !(*this == other); }

private:
    VertexHandle v0_;
    VertexHandle v1_;
    EdgeShape shape_;
};

std::string_view to_string(SequenceKind kind);

// Drop interior points that are collinear with their neighbours in the
// sequence [v0, points..., v1]. All removals are decided on the original
// sequence in a single pass.
std::vector<Vec3> simplify_points(const Vec3& v0, const std::vector<Vec3>& points,
                                  const Vec3& v1);

// Convert rows of raw coordinates into points; every row must hold exactly
// three values (ConfigurationError otherwise).
std::vector<Vec3> points_from_rows(const std::vector<std::vector<double>>& rows);

}  // namespace tetris

#endif // TETRIS_BLOCKMESH_EDGE_HPP
