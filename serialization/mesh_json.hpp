#ifndef TETRIS_SERIALIZATION_MESH_JSON_HPP
#define TETRIS_SERIALIZATION_MESH_JSON_HPP

#include <nlohmann/json.hpp>
#include <blockmesh/block.hpp>
#include <blockmesh/edge.hpp>
#include <blockmesh/patch.hpp>
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <mesh/mesh.hpp>
#include "config_json.hpp"
#include <map>
#include <string>
#include <vector>

namespace tetris {

// A mesh built from a JSON description, together with the handles the
// description named so callers can keep editing it.
struct MeshDescription {
    Mesh mesh;
    std::vector<VertexHandle> vertices;
    std::vector<BlockHandle> blocks;
    std::map<std::string, PatchHandle> patches;
};

namespace detail {

inline const VertexHandle& vertex_at(const std::vector<VertexHandle>& vertices,
                                     const nlohmann::json& index) {
    if (!index.is_number_integer()) {
        throw ConfigurationError("Vertex references must be integers, got " + index.dump());
    }
    auto i = index.get<long long>();
    if (i < 0 || static_cast<size_t>(i) >= vertices.size()) {
        throw ConfigurationError("Vertex index " + std::to_string(i) + " is out of range");
    }
    return vertices[static_cast<size_t>(i)];
}

inline std::vector<VertexHandle> vertices_at(const std::vector<VertexHandle>& vertices,
                                             const nlohmann::json& indices) {
    if (!indices.is_array()) {
        throw ConfigurationError("Expected an array of vertex indices, got " + indices.dump());
    }
    std::vector<VertexHandle> result;
    for (const auto& index : indices) {
        result.push_back(vertex_at(vertices, index));
    }
    return result;
}

inline Geometry geometry_named(const std::map<std::string, Geometry>& geometries,
                               const std::string& name) {
    auto it = geometries.find(name);
    if (it == geometries.end()) {
        throw ConfigurationError("Unknown geometry: " + name);
    }
    return it->second;
}

inline GeometryList geometries_named(const std::map<std::string, Geometry>& geometries,
                                     const nlohmann::json& names) {
    GeometryList result;
    for (const auto& name : names) {
        result.push_back(geometry_named(geometries, name.get<std::string>()));
    }
    return result;
}

inline VertexHandle vertex_from_json(const nlohmann::json& j,
                                     const std::map<std::string, Geometry>& geometries) {
    if (j.is_array()) {
        return make_vertex(j.get<Vec3>());
    }
    Vec3 coords = j.at("coords").get<Vec3>();
    if (j.contains("project")) {
        return make_projected_vertex(coords, geometries_named(geometries, j["project"]));
    }
    return make_vertex(coords);
}

inline EdgeHandle edge_from_json(const nlohmann::json& j,
                                 const std::vector<VertexHandle>& vertices,
                                 const std::map<std::string, Geometry>& geometries) {
    auto ends = vertices_at(vertices, j.at("vertices"));
    if (ends.size() != 2) {
        throw ConfigurationError("An edge needs exactly 2 vertices, got " +
                                 std::to_string(ends.size()));
    }

    std::string type = j.at("type").get<std::string>();
    if (type == "line") {
        return Edge::line(ends[0], ends[1]);
    }
    if (type == "arc") {
        if (j.contains("origin")) {
            return Edge::arc_origin(ends[0], ends[1], j["origin"].get<Vec3>(),
                                    j.value("factor", 1.0));
        }
        return Edge::arc(ends[0], ends[1], j.at("point").get<Vec3>());
    }
    if (type == "spline" || type == "BSpline" || type == "polyLine") {
        auto rows = j.at("points").get<std::vector<std::vector<double>>>();
        SequenceKind kind = type == "spline" ? SequenceKind::Spline
                          : type == "BSpline" ? SequenceKind::BSpline
                          : SequenceKind::PolyLine;
        return Edge::sequence(kind, ends[0], ends[1], points_from_rows(rows));
    }
    if (type == "project") {
        return Edge::project(ends[0], ends[1], geometries_named(geometries, j.at("geometry")));
    }
    throw ConfigurationError("Unknown edge type: " + type);
}

inline FaceVertices face_from_json(const nlohmann::json& j,
                                   const std::vector<VertexHandle>& vertices,
                                   const std::vector<BlockHandle>& blocks) {
    if (j.is_object()) {
        auto index = j.at("block").get<long long>();
        if (index < 0 || static_cast<size_t>(index) >= blocks.size()) {
            throw ConfigurationError("Block index " + std::to_string(index) + " is out of range");
        }
        return blocks[static_cast<size_t>(index)]->face(
            face_label_from_string(j.at("face").get<std::string>()));
    }

    auto corners = vertices_at(vertices, j);
    if (corners.size() != 4) {
        throw ConfigurationError("A face needs exactly 4 vertices, got " +
                                 std::to_string(corners.size()));
    }
    return {corners[0], corners[1], corners[2], corners[3]};
}

inline PatchHandle patch_from_json(const nlohmann::json& j,
                                   const std::vector<VertexHandle>& vertices,
                                   const std::vector<BlockHandle>& blocks) {
    auto patch = make_patch(j.at("name").get<std::string>(), j.value("type", "patch"));
    for (const auto& face : j.value("faces", nlohmann::json::array())) {
        patch->add_face(face_from_json(face, vertices, blocks));
    }
    return patch;
}

inline void apply_edge(const EdgeHandle& edge, const std::vector<BlockHandle>& blocks) {
    bool applied = false;
    for (const auto& block : blocks) {
        auto id0 = block->local_index(edge->v0());
        auto id1 = block->local_index(edge->v1());
        if (id0 && id1 && edge_slot(*id0, *id1)) {
            block->set_edge(edge);
            applied = true;
        }
    }
    if (!applied) {
        throw GeometryError("Edge " + std::string(edge->type()) +
                            " does not lie on any block edge");
    }
}

inline void load_mesh(const nlohmann::json& j, MeshDescription& result) {
    auto log = logging::get_logger();

    if (j.contains("scale")) {
        result.mesh.set_scale(j["scale"].get<double>());
    }

    std::map<std::string, Geometry> geometries;
    for (const auto& entry : j.value("geometry", nlohmann::json::array())) {
        Geometry geometry = entry.get<Geometry>();
        result.mesh.add_geometry(geometry);
        geometries[geometry.name] = geometry;
    }

    // Registered up front so vertex ids follow the description order
    for (const auto& entry : j.value("vertices", nlohmann::json::array())) {
        result.vertices.push_back(vertex_from_json(entry, geometries));
        result.mesh.add_vertex(result.vertices.back());
    }
    log->debug("Loaded {} vertices", result.vertices.size());

    for (const auto& entry : j.value("blocks", nlohmann::json::array())) {
        auto block = Block::from_vertices(detail::vertices_at(result.vertices, entry.at("vertices")));
        if (entry.contains("cells")) {
            block->set_cells(entry["cells"].get<std::array<int, 3>>());
        }
        if (entry.contains("cell_size")) {
            block->set_cell_size(entry["cell_size"].get<double>());
        }
        if (entry.contains("grading")) {
            block->set_grading(entry["grading"].get<std::vector<double>>());
        }
        block->set_cell_zone(entry.value("zone", ""));
        block->set_description(entry.value("description", ""));
        result.blocks.push_back(block);
    }

    for (const auto& entry : j.value("edges", nlohmann::json::array())) {
        apply_edge(edge_from_json(entry, result.vertices, geometries), result.blocks);
    }

    for (const auto& block : result.blocks) {
        result.mesh.add_block(block);
    }
    log->debug("Loaded {} blocks", result.blocks.size());

    for (const auto& entry : j.value("faces", nlohmann::json::array())) {
        auto corners = face_from_json(entry.at("vertices"), result.vertices, result.blocks);
        result.mesh.add_face(make_projected_face(
            corners, geometry_named(geometries, entry.at("geometry").get<std::string>())));
    }

    if (j.contains("default_patch")) {
        const auto& entry = j["default_patch"];
        result.mesh.set_default_patch(entry.at("name").get<std::string>(),
                                      entry.at("type").get<std::string>());
    }

    for (const auto& entry : j.value("boundary", nlohmann::json::array())) {
        auto patch = patch_from_json(entry, result.vertices, result.blocks);
        result.mesh.add_boundary(patch);
        result.patches[patch->name()] = patch;
    }

    for (const auto& entry : j.value("patches", nlohmann::json::array())) {
        auto patch = patch_from_json(entry, result.vertices, result.blocks);
        result.mesh.add_patch(patch);
        result.patches[patch->name()] = patch;
    }

    for (const auto& entry : j.value("merge_patch_pairs", nlohmann::json::array())) {
        auto names = entry.get<std::vector<std::string>>();
        if (names.size() != 2) {
            throw ConfigurationError("A merge pair needs a master and a slave patch name");
        }
        auto master = result.patches.find(names[0]);
        auto slave = result.patches.find(names[1]);
        if (master == result.patches.end() || slave == result.patches.end()) {
            throw ConfigurationError("Merge pair (" + names[0] + " " + names[1] +
                                     ") references an unknown patch");
        }
        result.mesh.add_merge_patch_pair(master->second, slave->second);
    }
}

}  // namespace detail

// Build a mesh from its JSON description. Malformed JSON content is
// reported as ConfigurationError.
inline MeshDescription mesh_from_json(const nlohmann::json& j) {
    MeshDescription result;
    try {
        detail::load_mesh(j, result);
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid mesh description: ") + e.what());
    }
    return result;
}

// Element counts of a mesh, for reports
inline nlohmann::json mesh_stats(const Mesh& mesh) {
    return {
        {"vertices", mesh.vertices().size()},
        {"blocks", mesh.blocks().size()},
        {"edges", mesh.edges().size()},
        {"faces", mesh.faces().size()},
        {"patches", mesh.patches().size()},
        {"boundaries", mesh.boundaries().size()},
        {"merge_patch_pairs", mesh.merge_patch_pairs().size()},
        {"geometries", mesh.geometries().size()},
        {"scale", mesh.scale()}
    };
}

}  // namespace tetris

#endif // TETRIS_SERIALIZATION_MESH_JSON_HPP
