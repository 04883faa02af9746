#ifndef TETRIS_SERIALIZATION_BLOCK_MESH_DICT_HPP
#define TETRIS_SERIALIZATION_BLOCK_MESH_DICT_HPP

#include <mesh/mesh.hpp>
#include <serialization/render_options.hpp>
#include <iosfwd>
#include <sstream>
#include <string>
#include <string_view>

namespace tetris {

// Renders a registered Mesh as an OpenFOAM blockMeshDict.
//
// Sections come in a fixed order. `vertices`, `blocks` and `edges` are
// always written; `geometry`, `faces`, `defaultPatch`, `boundary`,
// `patches` and `mergePatchPairs` are left out when empty. Vertices are
// referenced by their bare mesh id.
class BlockMeshDictWriter {
public:
    BlockMeshDictWriter(const Mesh& mesh, const RenderOptions& options);

    std::string render() const;

    // Single entries, without indentation or trailing newline
    std::string write_vertex(const Vertex& vertex, VertexId id) const;
    std::string write_edge(const Edge& edge) const;
    std::string write_block(const Block& block) const;
    std::string write_patch(const Patch& patch) const;
    std::string write_face(const ProjectedFace& face) const;
    static std::string write_geometry(const Geometry& geometry);
    static std::string write_patch_pair(const PatchPair& pair);

private:
    const Mesh& mesh_;
    const RenderOptions& options_;

    // Id of a vertex as text; RenderError naming `owner` when unregistered
    std::string ref(const VertexHandle& vertex, std::string_view owner) const;
    std::string face_refs(const FaceVertices& face, std::string_view owner) const;
    // RenderError when a block carries a curved edge the mesh never registered
    void check_block_edges() const;

    void write_header(std::ostringstream& ss) const;
    void write_boundary(std::ostringstream& ss, const Patch& patch) const;
};

std::string render_block_mesh_dict(const Mesh& mesh, const RenderOptions& options = {});

void print_block_mesh_dict(std::ostream& out, const Mesh& mesh,
                           const RenderOptions& options = {});

// The document is fully rendered before the file is opened
void write_block_mesh_dict(const std::string& path, const Mesh& mesh,
                           const RenderOptions& options = {});

}  // namespace tetris

#endif // TETRIS_SERIALIZATION_BLOCK_MESH_DICT_HPP
