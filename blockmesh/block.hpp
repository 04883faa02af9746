#ifndef TETRIS_BLOCKMESH_BLOCK_HPP
#define TETRIS_BLOCKMESH_BLOCK_HPP

#include <blockmesh/edge.hpp>
#include <blockmesh/topology.hpp>
#include <blockmesh/vertex.hpp>
#include <array>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tetris {

enum class GradingType {
    Simple,  // one expansion ratio per axis
    Edge     // one expansion ratio per block edge
};

std::string_view to_string(GradingType type);

// Hexahedral block: 8 corners in blockMesh order, the 12 edges joining them,
// cell counts per axis and a grading.
class Block {
public:
    Block() = default;
    explicit Block(const std::vector<VertexHandle>& vertices);

    static std::shared_ptr<Block> from_vertices(const std::vector<VertexHandle>& vertices);

    // Replaces the corners and resets all 12 edges to straight lines.
    // Custom edges set before are discarded.
    void set_vertices(const std::vector<VertexHandle>& vertices);
    const std::vector<VertexHandle>& vertices() const { return vertices_; }
    const VertexHandle& operator[](size_t i) const { return vertices_.at(i); }
    bool has_vertices() const { return !vertices_.empty(); }

    // Local corner index of a vertex handle (identity, not coordinates)
    std::optional<size_t> local_index(const VertexHandle& vertex) const;

    // Overwrite the table slot joining the edge's endpoints. The edge is
    // stored in table direction, inverted if needed.
    void set_edge(const EdgeHandle& edge);
    const std::vector<EdgeHandle>& edges() const { return edges_; }

    // Edge between two corners, oriented to start at `v0`. Corners are
    // matched by coordinates.
    EdgeHandle edge(const Vertex& v0, const Vertex& v1) const;
    EdgeHandle edge(size_t local0, size_t local1) const;

    // Corners of a face in outward-normal order
    std::array<VertexHandle, 4> face(FaceLabel label) const;

    // 3 values select simpleGrading, 12 values select edgeGrading
    void set_grading(const std::vector<double>& grading);
    const std::vector<double>& grading() const { return grading_; }
    GradingType grading_type() const { return grading_type_; }

    // Per-edge grading in table order, broadcasting simple grading
    std::array<double, topology::EDGE_COUNT> edge_grading() const;

    void set_cells(int nx, int ny, int nz);
    void set_cells(const std::array<int, 3>& cells) { set_cells(cells[0], cells[1], cells[2]); }
    const std::array<int, 3>& cells() const { return cells_; }

    // cells = ceil(edge length / size) along each axis, or a single axis
    void set_cell_size(double size);
    void set_cell_size(double size, Axis axis);

    // Length of the edge v0-v1 divided by the cell count on its axis
    double cell_size(const Vertex& v0, const Vertex& v1) const;

    void set_cell_zone(std::string zone) { cell_zone_ = std::move(zone); }
    const std::string& cell_zone() const { return cell_zone_; }

    void set_description(std::string description) { description_ = std::move(description); }
    const std::string& description() const { return description_; }

private:
    std::vector<VertexHandle> vertices_;
    std::vector<EdgeHandle> edges_;
    std::vector<double> grading_ = {1.0, 1.0, 1.0};
    GradingType grading_type_ = GradingType::Simple;
    std::array<int, 3> cells_ = {1, 1, 1};
    std::string cell_zone_;
    std::string description_;

    void require_vertices() const;
    size_t slot_between(const Vertex& v0, const Vertex& v1) const;
    // ConfigurationError unless the count fits in an int
    int cells_for_size(double size, Axis axis) const;
};

using BlockHandle = std::shared_ptr<Block>;

}  // namespace tetris

#endif // TETRIS_BLOCKMESH_BLOCK_HPP
