#include "mesh.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <serialization/block_mesh_dict.hpp>
#include <algorithm>
#include <ostream>

namespace tetris {

namespace {

template <typename Map, typename Key>
auto lookup(const Map& ids, const Key* key) -> std::optional<typename Map::mapped_type> {
    auto it = ids.find(key);
    if (it == ids.end()) {
        return std::nullopt;
    }
    return it->second;
}

void append(GeometryList& list, const GeometryList& more) {
    list.insert(list.end(), more.begin(), more.end());
}

// Projections of the vertices plus, for projected edges, their surfaces
GeometryList edge_geometries(const Edge& edge) {
    GeometryList geometries = edge.v0()->projections();
    append(geometries, edge.v1()->projections());
    if (const auto* project = std::get_if<edge::Project>(&edge.shape())) {
        append(geometries, project->surfaces);
    }
    return geometries;
}

GeometryList face_geometries(const FaceVertices& face) {
    GeometryList geometries;
    for (const auto& vertex : face) {
        append(geometries, vertex->projections());
    }
    return geometries;
}

}  // namespace

VertexId Mesh::add_vertex(const VertexHandle& vertex) {
    if (!vertex) {
        throw TypeContractError("Mesh::add_vertex: null vertex");
    }

    if (auto id = lookup(vertex_ids_, vertex.get())) {
        return *id;
    }

    add_geometries(vertex->projections());

    VertexId id = next_ids_.vertex++;
    vertices_.push_back(vertex);
    vertex_ids_[vertex.get()] = id;
    logging::get_logger()->trace("Mesh: vertex {} registered", id);
    return id;
}

std::optional<EdgeId> Mesh::add_edge(const EdgeHandle& edge) {
    if (!edge) {
        throw TypeContractError("Mesh::add_edge: null edge");
    }

    if (edge->is_line()) {
        return std::nullopt;
    }

    check_geometries(edge_geometries(*edge));
    add_vertex(edge->v0());
    add_vertex(edge->v1());

    if (const auto* project = std::get_if<edge::Project>(&edge->shape())) {
        add_geometries(project->surfaces);
    }

    // Only handle identity is checked: a second edge object over the same
    // pair of vertices gets its own id.
    if (auto id = lookup(edge_ids_, edge.get())) {
        return *id;
    }

    EdgeId id = next_ids_.edge++;
    edges_.push_back(edge);
    edge_ids_[edge.get()] = id;
    logging::get_logger()->trace("Mesh: {} edge {} registered", edge->type(), id);
    return id;
}

BlockId Mesh::add_block(const BlockHandle& block) {
    if (!block) {
        throw TypeContractError("Mesh::add_block: null block");
    }
    if (!block->has_vertices()) {
        throw ConfigurationError("Mesh::add_block: block vertices have not been set");
    }

    GeometryList geometries;
    for (const auto& vertex : block->vertices()) {
        append(geometries, vertex->projections());
    }
    for (const auto& edge : block->edges()) {
        if (!edge->is_line()) {
            append(geometries, edge_geometries(*edge));
        }
    }
    check_geometries(geometries);

    for (const auto& vertex : block->vertices()) {
        add_vertex(vertex);
    }

    for (const auto& edge : block->edges()) {
        add_edge(edge);
    }

    if (auto id = lookup(block_ids_, block.get())) {
        return *id;
    }

    BlockId id = next_ids_.block++;
    blocks_.push_back(block);
    block_ids_[block.get()] = id;
    logging::get_logger()->debug("Mesh: block {} registered ({} vertices, {} edges so far)",
                                 id, vertices_.size(), edges_.size());
    return id;
}

PatchId Mesh::add_patch(const PatchHandle& patch) {
    if (!patch) {
        throw TypeContractError("Mesh::add_patch: null patch");
    }
    if (boundary_ids_.count(patch.get())) {
        throw TypeContractError("Patch '" + patch->name() +
                                "' is already registered as a boundary");
    }

    if (auto id = lookup(patch_ids_, patch.get())) {
        return *id;
    }

    GeometryList geometries;
    for (const auto& face : patch->faces()) {
        append(geometries, face_geometries(face));
    }
    check_geometries(geometries);

    for (const auto& face : patch->faces()) {
        add_face_vertices(face);
    }

    PatchId id = next_ids_.patch++;
    patches_.push_back(patch);
    patch_ids_[patch.get()] = id;
    logging::get_logger()->debug("Mesh: patch '{}' registered as {}", patch->name(), id);
    return id;
}

PatchId Mesh::add_boundary(const PatchHandle& patch) {
    if (!patch) {
        throw TypeContractError("Mesh::add_boundary: null patch");
    }
    if (patch_ids_.count(patch.get())) {
        throw TypeContractError("Patch '" + patch->name() +
                                "' is already registered in the patches section");
    }

    if (auto id = lookup(boundary_ids_, patch.get())) {
        return *id;
    }

    GeometryList geometries;
    for (const auto& face : patch->faces()) {
        append(geometries, face_geometries(face));
    }
    check_geometries(geometries);

    for (const auto& face : patch->faces()) {
        add_face_vertices(face);
    }

    PatchId id = next_ids_.patch++;
    boundaries_.push_back(patch);
    boundary_ids_[patch.get()] = id;
    logging::get_logger()->debug("Mesh: boundary '{}' registered as {}", patch->name(), id);
    return id;
}

void Mesh::add_merge_patch_pair(const PatchHandle& master, const PatchHandle& slave) {
    if (!master || !slave) {
        throw TypeContractError("Mesh::add_merge_patch_pair: null patch");
    }

    // Patches already written as boundaries keep their section
    for (const auto& patch : {master, slave}) {
        if (!patch_id(patch)) {
            add_patch(patch);
        }
    }

    merge_patch_pairs_.push_back(PatchPair{master, slave});
}

void Mesh::add_face(const FaceHandle& face) {
    if (!face) {
        throw TypeContractError("Mesh::add_face: null face");
    }
    for (const auto& v : face->vertices) {
        if (!v) {
            throw TypeContractError("Mesh::add_face: face with a null vertex");
        }
    }

    if (std::find(faces_.begin(), faces_.end(), face) != faces_.end()) {
        return;
    }

    GeometryList geometries = face_geometries(face->vertices);
    geometries.push_back(face->geometry);
    check_geometries(geometries);

    add_face_vertices(face->vertices);
    add_geometry(face->geometry);
    faces_.push_back(face);
}

void Mesh::add_geometry(const Geometry& geometry) {
    check_geometries({geometry});
    if (std::find(geometries_.begin(), geometries_.end(), geometry) == geometries_.end()) {
        geometries_.push_back(geometry);
    }
}

void Mesh::set_default_patch(std::string name, std::string type) {
    if (name.empty() || type.empty()) {
        throw ConfigurationError("Default patch needs both a name and a type");
    }
    default_patch_ = DefaultPatch{std::move(name), std::move(type)};
}

void Mesh::set_scale(double scale) {
    if (!(scale > 0.0)) {
        throw ConfigurationError("Mesh scale must be positive");
    }
    scale_ = scale;
}

std::optional<VertexId> Mesh::vertex_id(const Vertex* vertex) const {
    return lookup(vertex_ids_, vertex);
}

std::optional<EdgeId> Mesh::edge_id(const EdgeHandle& edge) const {
    return lookup(edge_ids_, edge.get());
}

std::optional<BlockId> Mesh::block_id(const BlockHandle& block) const {
    return lookup(block_ids_, block.get());
}

std::optional<PatchId> Mesh::patch_id(const PatchHandle& patch) const {
    if (auto id = lookup(patch_ids_, patch.get())) {
        return id;
    }
    return lookup(boundary_ids_, patch.get());
}

std::string Mesh::render(const RenderOptions& options) const {
    return render_block_mesh_dict(*this, options);
}

void Mesh::print(std::ostream& out, const RenderOptions& options) const {
    print_block_mesh_dict(out, *this, options);
}

void Mesh::write(const std::string& path, const RenderOptions& options) const {
    write_block_mesh_dict(path, *this, options);
}

void Mesh::add_geometries(const GeometryList& geometries) {
    check_geometries(geometries);
    for (const auto& geometry : geometries) {
        add_geometry(geometry);
    }
}

void Mesh::check_geometries(const GeometryList& geometries) const {
    auto conflicts = [](const Geometry& a, const Geometry& b) {
        return a == b && (a.file != b.file || a.type != b.type);
    };

    for (auto it = geometries.begin(); it != geometries.end(); ++it) {
        if (it->name.empty()) {
            throw ConfigurationError("Geometry name must not be empty");
        }
        auto same = [&](const Geometry& other) { return conflicts(*it, other); };
        if (std::any_of(geometries_.begin(), geometries_.end(), same) ||
            std::any_of(geometries.begin(), it, same)) {
            throw ConfigurationError("Conflicting definitions for geometry '" + it->name + "'");
        }
    }
}

void Mesh::add_face_vertices(const FaceVertices& face) {
    for (const auto& vertex : face) {
        add_vertex(vertex);
    }
}

}  // namespace tetris
