#ifndef TETRIS_BLOCKMESH_PATCH_HPP
#define TETRIS_BLOCKMESH_PATCH_HPP

#include <blockmesh/block.hpp>
#include <blockmesh/geometry.hpp>
#include <blockmesh/topology.hpp>
#include <blockmesh/vertex.hpp>
#include <array>
#include <memory>
#include <string>
#include <vector>

namespace tetris {

// Four corners of a quad face; their order fixes the normal direction
using FaceVertices = std::array<VertexHandle, 4>;

// Block face projected onto a surface (the `faces` section)
struct ProjectedFace {
    FaceVertices vertices;
    Geometry geometry;
};

using FaceHandle = std::shared_ptr<const ProjectedFace>;

inline FaceHandle make_projected_face(const FaceVertices& vertices, Geometry geometry) {
    return std::make_shared<const ProjectedFace>(ProjectedFace{vertices, std::move(geometry)});
}

// Named group of block faces sharing a boundary condition type
class Patch {
public:
    Patch(std::string name, std::string type, std::vector<FaceVertices> faces = {});

    const std::string& name() const { return name_; }
    const std::string& type() const { return type_; }

    const std::vector<FaceVertices>& faces() const { return faces_; }
    const FaceVertices& operator[](size_t i) const { return faces_.at(i); }

    void add_face(const FaceVertices& face);
    void add_face(const Block& block, FaceLabel label) { add_face(block.face(label)); }

private:
    std::string name_;
    std::string type_;
    std::vector<FaceVertices> faces_;
};

using PatchHandle = std::shared_ptr<Patch>;

inline PatchHandle make_patch(std::string name, std::string type,
                              std::vector<FaceVertices> faces = {}) {
    return std::make_shared<Patch>(std::move(name), std::move(type), std::move(faces));
}

// Catch-all patch for faces not listed anywhere else
struct DefaultPatch {
    std::string name;
    std::string type;
};

// Faces of `slave` are stitched onto `master`
struct PatchPair {
    PatchHandle master;
    PatchHandle slave;
};

}  // namespace tetris

#endif // TETRIS_BLOCKMESH_PATCH_HPP
