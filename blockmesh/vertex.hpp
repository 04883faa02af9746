#ifndef TETRIS_BLOCKMESH_VERTEX_HPP
#define TETRIS_BLOCKMESH_VERTEX_HPP

#include <blockmesh/geometry.hpp>
#include <math/vec3.hpp>
#include <memory>
#include <optional>

namespace tetris {

// A block corner. Vertices are shared between blocks and edges through
// VertexHandle; the mesh identifies them by handle, so two handles with the
// same coordinates are still two vertices.
class Vertex {
public:
    Vertex() = default;
    explicit Vertex(const Vec3& coords) : coords_(coords) {}
    Vertex(double x, double y, double z) : coords_(x, y, z) {}
    Vertex(const Vec3& coords, GeometryList projections)
        : coords_(coords), projections_(std::move(projections)) {}

    const Vec3& coords() const { return coords_; }
    double operator[](size_t i) const { return coords_[i]; }

    // Surfaces the vertex is projected onto (empty for plain vertices)
    const GeometryList& projections() const { return projections_; }
    bool is_projected() const { return !projections_.empty(); }

    Vertex translate(const Vec3& vector) const;

    // Rotation about `origin`: yaw about z, pitch about y, roll about x.
    Vertex rotate(double yaw, double pitch, double roll,
                  const Vec3& origin = {}, bool degrees = true) const;

    // Translate, then rotate about `origin` (the position before the
    // translation when not given). `angles` holds yaw, pitch and roll.
    Vertex move(const Vec3& vector, const Vec3& angles,
                std::optional<Vec3> origin = std::nullopt,
                bool degrees = true) const;

    // Structural equality on coordinates only
    bool operator==(const Vertex& other) const { return coords_ == other.coords_; }
    bool operator!=(const Vertex& other) const { return !(*this == other); }
    bool operator==(const Vec3& point) const { return coords_ == point; }
    bool operator!=(const Vec3& point) const { return !(*this == point); }

private:
    Vec3 coords_;
    GeometryList projections_;
};

using VertexHandle = std::shared_ptr<const Vertex>;

inline VertexHandle make_vertex(double x, double y, double z) {
    return std::make_shared<const Vertex>(x, y, z);
}

inline VertexHandle make_vertex(const Vec3& coords) {
    return std::make_shared<const Vertex>(coords);
}

inline VertexHandle make_vertex(Vertex vertex) {
    return std::make_shared<const Vertex>(std::move(vertex));
}

inline VertexHandle make_projected_vertex(const Vec3& coords, GeometryList projections) {
    return std::make_shared<const Vertex>(coords, std::move(projections));
}

}  // namespace tetris

#endif // TETRIS_BLOCKMESH_VERTEX_HPP
