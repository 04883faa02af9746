#ifndef TETRIS_BLOCKMESH_GEOMETRY_HPP
#define TETRIS_BLOCKMESH_GEOMETRY_HPP

#include <string>
#include <utility>
#include <vector>

namespace tetris {

// Named reference to an external surface description. The file path is
// passed through to blockMesh untouched.
struct Geometry {
    std::string name;
    std::string file;
    std::string type = "triSurfaceMesh";

    static Geometry tri_surface(std::string name, std::string file) {
        return Geometry{std::move(name), std::move(file)};
    }

    // Two geometries are the same surface when they share a name
    bool operator==(const Geometry& other) const { return name == other.name; }
    bool operator!=(const Geometry& other) const { return !(*this == other); }
};

using GeometryList = std::vector<Geometry>;

}  // namespace tetris

#endif // TETRIS_BLOCKMESH_GEOMETRY_HPP
