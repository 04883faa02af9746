#include "block.hpp"
#include <common/errors.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <string>

namespace tetris {

std::string_view to_string(GradingType type) {
    switch (type) {
        case GradingType::Simple: return "simple";
        case GradingType::Edge: return "edge";
    }
    return "simple";
}

Block::Block(const std::vector<VertexHandle>& vertices) {
    set_vertices(vertices);
}

std::shared_ptr<Block> Block::from_vertices(const std::vector<VertexHandle>& vertices) {
    return std::make_shared<Block>(vertices);
}

void Block::set_vertices(const std::vector<VertexHandle>& vertices) {
    if (vertices.size() != topology::VERTEX_COUNT) {
        throw ConfigurationError("Incorrect number of vertices. Expected 8, got " +
                                 std::to_string(vertices.size()));
    }
    for (const auto& v : vertices) {
        if (!v) {
            throw TypeContractError("Block vertices must be valid vertices");
        }
    }

    // Build the straight edges first so a degenerate corner pair leaves the
    // block untouched
    std::vector<EdgeHandle> edges;
    edges.reserve(topology::EDGE_COUNT);
    for (const auto& [a, b] : topology::EDGES) {
        edges.push_back(Edge::line(vertices[a], vertices[b]));
    }

    vertices_ = vertices;
    edges_ = std::move(edges);
}

std::optional<size_t> Block::local_index(const VertexHandle& vertex) const {
    auto it = std::find(vertices_.begin(), vertices_.end(), vertex);
    if (it == vertices_.end()) {
        return std::nullopt;
    }
    return static_cast<size_t>(std::distance(vertices_.begin(), it));
}

void Block::set_edge(const EdgeHandle& edge) {
    if (!edge) {
        throw TypeContractError("Block::set_edge: null edge");
    }
    require_vertices();

    auto id0 = local_index(edge->v0());
    auto id1 = local_index(edge->v1());
    if (!id0 || !id1) {
        throw GeometryError("Edge endpoints are not corners of this block");
    }

    auto slot = edge_slot(*id0, *id1);
    if (!slot) {
        throw GeometryError("Corners " + std::to_string(*id0) + " and " +
                            std::to_string(*id1) + " are not joined by a block edge");
    }

    bool right_order = topology::EDGES[*slot].first == *id0;
    edges_[*slot] = right_order ? edge : std::make_shared<const Edge>(edge->invert());
}

size_t Block::slot_between(const Vertex& v0, const Vertex& v1) const {
    require_vertices();
    for (size_t slot = 0; slot < edges_.size(); ++slot) {
        const Vertex& a = *edges_[slot]->v0();
        const Vertex& b = *edges_[slot]->v1();
        if ((a == v0 && b == v1) || (a == v1 && b == v0)) {
            return slot;
        }
    }
    throw GeometryError("The given vertices do not define an edge of this block");
}

EdgeHandle Block::edge(const Vertex& v0, const Vertex& v1) const {
    const EdgeHandle& stored = edges_[slot_between(v0, v1)];
    if (*stored->v0() == v0) {
        return stored;
    }
    return std::make_shared<const Edge>(stored->invert());
}

EdgeHandle Block::edge(size_t local0, size_t local1) const {
    require_vertices();
    if (local0 >= topology::VERTEX_COUNT || local1 >= topology::VERTEX_COUNT) {
        throw GeometryError("Local vertex index out of range");
    }
    return edge(*vertices_[local0], *vertices_[local1]);
}

std::array<VertexHandle, 4> Block::face(FaceLabel label) const {
    require_vertices();
    const auto& corners = face_corners(label);
    return {vertices_[corners[0]], vertices_[corners[1]],
            vertices_[corners[2]], vertices_[corners[3]]};
}

void Block::set_grading(const std::vector<double>& grading) {
    if (grading.size() == 3) {
        grading_ = grading;
        grading_type_ = GradingType::Simple;
        return;
    }

    if (grading.size() == topology::EDGE_COUNT) {
        grading_ = grading;
        grading_type_ = GradingType::Edge;
        return;
    }

    throw ConfigurationError(
        "The number of elements defining the grading must be either 3 "
        "(simpleGrading) or 12 (edgeGrading), got " + std::to_string(grading.size()));
}

std::array<double, topology::EDGE_COUNT> Block::edge_grading() const {
    std::array<double, topology::EDGE_COUNT> result{};
    for (size_t slot = 0; slot < topology::EDGE_COUNT; ++slot) {
        result[slot] = grading_type_ == GradingType::Simple
            ? grading_[static_cast<size_t>(edge_axis(slot))]
            : grading_[slot];
    }
    return result;
}

void Block::set_cells(int nx, int ny, int nz) {
    if (nx <= 0 || ny <= 0 || nz <= 0) {
        throw ConfigurationError("Cell counts must be positive, got (" +
                                 std::to_string(nx) + " " + std::to_string(ny) +
                                 " " + std::to_string(nz) + ")");
    }
    cells_ = {nx, ny, nz};
}

void Block::set_cell_size(double size) {
    std::array<int, 3> cells{};
    for (Axis axis : {Axis::X1, Axis::X2, Axis::X3}) {
        cells[static_cast<size_t>(axis)] = cells_for_size(size, axis);
    }
    cells_ = cells;
}

void Block::set_cell_size(double size, Axis axis) {
    cells_[static_cast<size_t>(axis)] = cells_for_size(size, axis);
}

int Block::cells_for_size(double size, Axis axis) const {
    if (!(size > 0.0)) {
        throw ConfigurationError("Cell size must be positive");
    }
    require_vertices();

    const auto& [a, b] = axis_edge(axis);
    double length = edges_[*edge_slot(a, b)]->length();
    double count = std::ceil(length / size);
    if (count > static_cast<double>(std::numeric_limits<int>::max())) {
        throw ConfigurationError("Cell size " + std::to_string(size) + " along an edge of length " +
                                 std::to_string(length) + " gives too many cells");
    }
    return std::max(1, static_cast<int>(count));
}

double Block::cell_size(const Vertex& v0, const Vertex& v1) const {
    size_t slot = slot_between(v0, v1);
    int count = cells_[static_cast<size_t>(edge_axis(slot))];
    return edges_[slot]->length() / count;
}

void Block::require_vertices() const {
    if (vertices_.empty()) {
        throw ConfigurationError("Block vertices have not been set");
    }
}

}  // namespace tetris
