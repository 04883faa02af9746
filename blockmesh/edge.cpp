#include "edge.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <cmath>
#include <string>
#include <type_traits>

namespace tetris {

namespace {

double polyline_length(const Vec3& v0, const std::vector<Vec3>& points, const Vec3& v1) {
    double total = 0.0;
    Vec3 prev = v0;
    for (const auto& p : points) {
        total += prev.distance_to(p);
        prev = p;
    }
    return total + prev.distance_to(v1);
}

double angle_between(const Vec3& a, const Vec3& b) {
    return std::atan2(a.cross(b).length(), a.dot(b));
}

// Arc through p0, pm and p1 on their circumscribed circle
double arc_length_through(const Vec3& p0, const Vec3& pm, const Vec3& p1) {
    Vec3 a = p0 - pm;
    Vec3 b = p1 - pm;
    Vec3 axb = a.cross(b);
    double denom = 2.0 * axb.length_squared();
    if (denom == 0.0) {
        return polyline_length(p0, {pm}, p1);
    }

    Vec3 center = pm + (b * a.length_squared() - a * b.length_squared()).cross(axb) / denom;
    double radius = center.distance_to(p0);
    double angle = angle_between(p0 - center, pm - center) +
                   angle_between(pm - center, p1 - center);
    return radius * angle;
}

}  // namespace

Edge::Edge(VertexHandle v0, VertexHandle v1, EdgeShape shape)
    : v0_(std::move(v0)), v1_(std::move(v1)), shape_(std::move(shape))
{
    if (!v0_ || !v1_) {
        throw TypeContractError("Edge endpoints must be valid vertices");
    }

    if (*v0_ == *v1_) {
        throw GeometryError("Zero-length edge. Vertices are at the same point in space.");
    }

    if (auto* seq = std::get_if<edge::Sequence>(&shape_)) {
        seq->points = simplify_points(v0_->coords(), seq->points, v1_->coords());
        if (seq->points.empty()) {
            shape_ = edge::Line{};
        }
    }
}

EdgeHandle Edge::line(VertexHandle v0, VertexHandle v1) {
    return std::make_shared<const Edge>(std::move(v0), std::move(v1), edge::Line{});
}

EdgeHandle Edge::arc(VertexHandle v0, VertexHandle v1, const Vec3& point) {
    return std::make_shared<const Edge>(std::move(v0), std::move(v1), edge::ArcMid{point});
}

EdgeHandle Edge::arc_origin(VertexHandle v0, VertexHandle v1,
                            const Vec3& origin, double factor) {
    return std::make_shared<const Edge>(std::move(v0), std::move(v1),
                                        edge::ArcOrigin{origin, factor});
}

EdgeHandle Edge::sequence(SequenceKind kind, VertexHandle v0, VertexHandle v1,
                          std::vector<Vec3> points) {
    return std::make_shared<const Edge>(std::move(v0), std::move(v1),
                                        edge::Sequence{kind, std::move(points)});
}

EdgeHandle Edge::spline(VertexHandle v0, VertexHandle v1, std::vector<Vec3> points) {
    return sequence(SequenceKind::Spline, std::move(v0), std::move(v1), std::move(points));
}

EdgeHandle Edge::bspline(VertexHandle v0, VertexHandle v1, std::vector<Vec3> points) {
    return sequence(SequenceKind::BSpline, std::move(v0), std::move(v1), std::move(points));
}

EdgeHandle Edge::poly_line(VertexHandle v0, VertexHandle v1, std::vector<Vec3> points) {
    return sequence(SequenceKind::PolyLine, std::move(v0), std::move(v1), std::move(points));
}

EdgeHandle Edge::project(VertexHandle v0, VertexHandle v1, GeometryList surfaces) {
    return std::make_shared<const Edge>(std::move(v0), std::move(v1),
                                        edge::Project{std::move(surfaces)});
}

std::string_view Edge::type() const {
    return std::visit([](auto&& arg) -> std::string_view {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, edge::Line>) return "line";
        else if constexpr (std::is_same_v<T, edge::ArcMid>) return "arc";
        else if constexpr (std::is_same_v<T, edge::ArcOrigin>) return "arc";
        else if constexpr (std::is_same_v<T, edge::Sequence>) return to_string(arg.kind);
        else return "project";
    }, shape_);
}

Edge Edge::invert() const {
    EdgeShape shape = shape_;
    if (auto* seq = std::get_if<edge::Sequence>(&shape)) {
        std::reverse(seq->points.begin(), seq->points.end());
    }
    return Edge(v1_, v0_, std::move(shape));
}

double Edge::length() const {
    const Vec3& p0 = v0_->coords();
    const Vec3& p1 = v1_->coords();

    return std::visit([&](auto&& arg) -> double {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, edge::ArcMid>) {
            return arc_length_through(p0, arg.point, p1);
        } else if constexpr (std::is_same_v<T, edge::ArcOrigin>) {
            // Radius averaged over both ends; the scale factor only moves
            // the centre and is ignored here.
            Vec3 r0 = p0 - arg.origin;
            Vec3 r1 = p1 - arg.origin;
            double radius = 0.5 * (r0.length() + r1.length());
            return radius * angle_between(r0, r1);
        } else if constexpr (std::is_same_v<T, edge::Sequence>) {
            return polyline_length(p0, arg.points, p1);
        } else {
            return p0.distance_to(p1);
        }
    }, shape_);
}

bool Edge::operator==(const Edge& other) const {
    return *v0_ == *other.v0_ && *v1_ == *other.v1_ && shape_ == other.shape_;
}

std::string_view to_string(SequenceKind kind) {
    switch (kind) {
        case SequenceKind::Spline: return "spline";
        case SequenceKind::BSpline: return "BSpline";
        case SequenceKind::PolyLine: return "polyLine";
    }
    return "spline";
}

std::vector<Vec3> simplify_points(const Vec3& v0, const std::vector<Vec3>& points,
                                  const Vec3& v1) {
    std::vector<Vec3> augmented;
    augmented.reserve(points.size() + 2);
    augmented.push_back(v0);
    augmented.insert(augmented.end(), points.begin(), points.end());
    augmented.push_back(v1);

    // Mark against the unmodified sequence, then drop in one pass
    std::vector<bool> removable(augmented.size(), false);
    for (size_t i = 1; i + 1 < augmented.size(); ++i) {
        removable[i] = collinear(augmented[i - 1], augmented[i], augmented[i + 1]);
    }

    std::vector<Vec3> result;
    for (size_t i = 1; i + 1 < augmented.size(); ++i) {
        if (!removable[i]) {
            result.push_back(augmented[i]);
        }
    }
    return result;
}

std::vector<Vec3> points_from_rows(const std::vector<std::vector<double>>& rows) {
    std::vector<Vec3> points;
    points.reserve(rows.size());
    for (size_t i = 0; i < rows.size(); ++i) {
        if (rows[i].size() != 3) {
            throw ConfigurationError(
                "Incorrect points list: point " + std::to_string(i) + " has " +
                std::to_string(rows[i].size()) + " coordinates, expected 3");
        }
        points.emplace_back(rows[i][0], rows[i][1], rows[i][2]);
    }
    return points;
}

}  // namespace tetris
