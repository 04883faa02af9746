#include "vertex.hpp"
#include <numbers>

namespace tetris {

namespace {

double to_radians(double angle, bool degrees) {
    return degrees ? angle * std::numbers::pi / 180.0 : angle;
}

}  // namespace

Vertex Vertex::translate(const Vec3& vector) const {
    return Vertex(coords_ + vector, projections_);
}

Vertex Vertex::rotate(double yaw, double pitch, double roll,
                      const Vec3& origin, bool degrees) const {
    Vec3 rotated = rotate_euler(coords_,
                                to_radians(yaw, degrees),
                                to_radians(pitch, degrees),
                                to_radians(roll, degrees),
                                origin);
    return Vertex(rotated, projections_);
}

Vertex Vertex::move(const Vec3& vector, const Vec3& angles,
                    std::optional<Vec3> origin, bool degrees) const {
    Vec3 pivot = origin.value_or(coords_);
    return translate(vector).rotate(angles.x, angles.y, angles.z, pivot, degrees);
}

}  // namespace tetris
