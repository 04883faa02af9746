#ifndef TETRIS_MESH_MESH_HPP
#define TETRIS_MESH_MESH_HPP

#include <blockmesh/block.hpp>
#include <blockmesh/edge.hpp>
#include <blockmesh/geometry.hpp>
#include <blockmesh/patch.hpp>
#include <blockmesh/vertex.hpp>
#include <serialization/render_options.hpp>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tetris {

using VertexId = uint32_t;
using EdgeId = uint32_t;
using BlockId = uint32_t;
using PatchId = uint32_t;

// Aggregate root of a blockMeshDict. Elements are registered once, in
// insertion order, and receive an id per category starting at 0. Identity
// is the element handle: registering the same handle again is a no-op,
// while two distinct handles always get two ids.
class Mesh {
public:
    Mesh() = default;

    // Registration. Null handles raise TypeContractError before anything
    // is modified.
    VertexId add_vertex(const VertexHandle& vertex);

    // Registers the endpoints, then the edge. Straight lines are implicit
    // and return nullopt without touching the mesh.
    std::optional<EdgeId> add_edge(const EdgeHandle& edge);

    // Registers the 8 corners, then the 12 edges, then the block
    BlockId add_block(const BlockHandle& block);

    PatchId add_patch(const PatchHandle& patch);

    // Same as add_patch, but the patch is written in the `boundary` section
    PatchId add_boundary(const PatchHandle& patch);

    void add_merge_patch_pair(const PatchHandle& master, const PatchHandle& slave);

    void add_face(const FaceHandle& face);

    // Geometries are unique by name
    void add_geometry(const Geometry& geometry);

    void set_default_patch(std::string name, std::string type);
    void set_scale(double scale);

    // Identity lookups
    std::optional<VertexId> vertex_id(const Vertex* vertex) const;
    std::optional<VertexId> vertex_id(const VertexHandle& vertex) const { return vertex_id(vertex.get()); }
    std::optional<EdgeId> edge_id(const EdgeHandle& edge) const;
    std::optional<BlockId> block_id(const BlockHandle& block) const;
    std::optional<PatchId> patch_id(const PatchHandle& patch) const;

    // Registered elements in id order
    const std::vector<VertexHandle>& vertices() const { return vertices_; }
    const std::vector<EdgeHandle>& edges() const { return edges_; }
    const std::vector<BlockHandle>& blocks() const { return blocks_; }
    const std::vector<PatchHandle>& patches() const { return patches_; }
    const std::vector<PatchHandle>& boundaries() const { return boundaries_; }
    const std::vector<FaceHandle>& faces() const { return faces_; }
    const std::vector<Geometry>& geometries() const { return geometries_; }
    const std::vector<PatchPair>& merge_patch_pairs() const { return merge_patch_pairs_; }
    const std::optional<DefaultPatch>& default_patch() const { return default_patch_; }
    double scale() const { return scale_; }

    // Output
    std::string render(const RenderOptions& options = {}) const;
    void print(std::ostream& out, const RenderOptions& options = {}) const;
    void write(const std::string& path, const RenderOptions& options = {}) const;

private:
    struct IdCounters {
        VertexId vertex = 0;
        BlockId block = 0;
        EdgeId edge = 0;
        PatchId patch = 0;
    };

    IdCounters next_ids_;
    double scale_ = 1.0;

    std::vector<VertexHandle> vertices_;
    std::vector<EdgeHandle> edges_;
    std::vector<BlockHandle> blocks_;
    std::vector<PatchHandle> patches_;
    std::vector<PatchHandle> boundaries_;
    std::vector<FaceHandle> faces_;
    std::vector<Geometry> geometries_;
    std::vector<PatchPair> merge_patch_pairs_;
    std::optional<DefaultPatch> default_patch_;

    std::unordered_map<const Vertex*, VertexId> vertex_ids_;
    std::unordered_map<const Edge*, EdgeId> edge_ids_;
    std::unordered_map<const Block*, BlockId> block_ids_;
    std::unordered_map<const Patch*, PatchId> patch_ids_;
    std::unordered_map<const Patch*, PatchId> boundary_ids_;

    void add_geometries(const GeometryList& geometries);
    // ConfigurationError for an unnamed geometry or a name already bound to
    // another file or type, here or earlier in the list; registers nothing
    void check_geometries(const GeometryList& geometries) const;
    void add_face_vertices(const FaceVertices& face);
};

}  // namespace tetris

#endif // TETRIS_MESH_MESH_HPP
