#include "block_mesh_dict.hpp"
#include "foam_format.hpp"
#include <common/errors.hpp>
#include <common/logging.hpp>
#include <fstream>
#include <ostream>
#include <stdexcept>
#include <type_traits>

namespace tetris {

namespace {

constexpr const char* SEPARATOR =
    "// * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * //";
constexpr const char* CLOSING =
    "// ************************************************************************* //";
constexpr const char* INDENT = "    ";

// "name\n(\n    entry\n    ...\n);\n\n"
template <typename Range, typename Fn>
void write_list_section(std::ostringstream& ss, std::string_view name,
                        const Range& entries, Fn&& write_entry) {
    ss << name << "\n(\n";
    for (const auto& entry : entries) {
        ss << INDENT << write_entry(entry) << "\n";
    }
    ss << ");\n\n";
}

}  // namespace

BlockMeshDictWriter::BlockMeshDictWriter(const Mesh& mesh, const RenderOptions& options)
    : mesh_(mesh), options_(options) {}

std::string BlockMeshDictWriter::render() const {
    auto log = logging::get_logger();

    if (options_.format == DocumentFormat::Binary) {
        throw UnsupportedError("blockMeshDict can only be written in ascii format");
    }

    log->debug("Rendering blockMeshDict: {} vertices, {} blocks, {} edges, {} patches",
               mesh_.vertices().size(), mesh_.blocks().size(),
               mesh_.edges().size(), mesh_.patches().size() + mesh_.boundaries().size());

    check_block_edges();

    std::ostringstream ss;
    write_header(ss);

    ss << "scale " << foam::number(mesh_.scale()) << ";\n";
    if (options_.fast_merge) {
        ss << "fastMerge yes;\n";
    }
    if (options_.merge_tolerance) {
        ss << "mergeTolerance " << foam::number(*options_.merge_tolerance) << ";\n";
    }
    ss << "\n";

    if (!mesh_.geometries().empty()) {
        ss << "geometry\n{\n";
        for (const auto& geometry : mesh_.geometries()) {
            ss << INDENT << write_geometry(geometry) << "\n";
        }
        ss << "}\n\n";
    }

    ss << "vertices\n(\n";
    for (size_t i = 0; i < mesh_.vertices().size(); ++i) {
        ss << INDENT << write_vertex(*mesh_.vertices()[i], static_cast<VertexId>(i)) << "\n";
    }
    ss << ");\n\n";

    write_list_section(ss, "blocks", mesh_.blocks(),
                       [this](const BlockHandle& b) { return write_block(*b); });

    // Straight lines are implicit in blockMesh
    ss << "edges\n(\n";
    for (const auto& edge : mesh_.edges()) {
        if (!edge->is_line()) {
            ss << INDENT << write_edge(*edge) << "\n";
        }
    }
    ss << ");\n\n";

    if (!mesh_.faces().empty()) {
        write_list_section(ss, "faces", mesh_.faces(),
                           [this](const FaceHandle& f) { return write_face(*f); });
    }

    if (const auto& default_patch = mesh_.default_patch()) {
        ss << "defaultPatch\n{\n"
           << INDENT << "name " << default_patch->name << ";\n"
           << INDENT << "type " << default_patch->type << ";\n"
           << "}\n\n";
    }

    if (!mesh_.boundaries().empty()) {
        ss << "boundary\n(\n";
        for (const auto& patch : mesh_.boundaries()) {
            write_boundary(ss, *patch);
        }
        ss << ");\n\n";
    }

    if (!mesh_.patches().empty()) {
        write_list_section(ss, "patches", mesh_.patches(),
                           [this](const PatchHandle& p) { return write_patch(*p); });
    }

    if (!mesh_.merge_patch_pairs().empty()) {
        write_list_section(ss, "mergePatchPairs", mesh_.merge_patch_pairs(),
                           [](const PatchPair& pair) { return write_patch_pair(pair); });
    }

    ss << CLOSING << "\n";
    if (!options_.footer.empty()) {
        ss << options_.footer << "\n";
    }

    std::string result = ss.str();
    log->debug("Rendered blockMeshDict: {} bytes", result.size());
    return result;
}

void BlockMeshDictWriter::write_header(std::ostringstream& ss) const {
    ss << "// Automatically generated by tetris v" << options_.version << "\n";
    if (!options_.header.empty()) {
        ss << options_.header << "\n";
    }
    ss << "FoamFile\n"
       << "{\n"
       << INDENT << "version     2.0;\n"
       << INDENT << "format      " << to_string(options_.format) << ";\n"
       << INDENT << "class       dictionary;\n"
       << INDENT << "object      blockMeshDict;\n"
       << "}\n"
       << SEPARATOR << "\n\n";
}

std::string BlockMeshDictWriter::write_vertex(const Vertex& vertex, VertexId id) const {
    std::string text;
    if (vertex.is_projected()) {
        text = "project " + foam::point(vertex.coords()) + " " +
               foam::list(vertex.projections(), [](const Geometry& g) { return g.name; });
    } else {
        text = foam::point(vertex.coords());
    }
    return text + foam::comment(std::to_string(id));
}

std::string BlockMeshDictWriter::write_edge(const Edge& edge) const {
    std::string head = std::string(edge.type()) + " " +
                       ref(edge.v0(), "edge") + " " + ref(edge.v1(), "edge");

    return std::visit([&](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, edge::Line>) {
            return head;
        } else if constexpr (std::is_same_v<T, edge::ArcMid>) {
            return head + " " + foam::point(arg.point);
        } else if constexpr (std::is_same_v<T, edge::ArcOrigin>) {
            return head + " origin " + foam::number(arg.factor) + " " + foam::point(arg.origin);
        } else if constexpr (std::is_same_v<T, edge::Sequence>) {
            return head + " " + foam::list(arg.points, [](const Vec3& p) { return foam::point(p); });
        } else {
            return head + " " + foam::list(arg.surfaces, [](const Geometry& g) { return g.name; });
        }
    }, edge.shape());
}

std::string BlockMeshDictWriter::write_block(const Block& block) const {
    std::string text = "hex " + foam::list(block.vertices(), [this](const VertexHandle& v) {
        return ref(v, "block");
    });

    if (!block.cell_zone().empty()) {
        text += " " + block.cell_zone();
    }

    text += " " + foam::list(block.cells(), [](int n) { return std::to_string(n); });
    text += " " + std::string(to_string(block.grading_type())) + "Grading ";
    text += foam::list(block.grading(), [](double g) { return foam::number(g); });

    return text + foam::comment(block.description());
}

std::string BlockMeshDictWriter::write_patch(const Patch& patch) const {
    std::string owner = "patch '" + patch.name() + "'";
    return patch.type() + " " + patch.name() + " " +
           foam::list(patch.faces(), [&](const FaceVertices& f) { return face_refs(f, owner); });
}

void BlockMeshDictWriter::write_boundary(std::ostringstream& ss, const Patch& patch) const {
    std::string owner = "boundary '" + patch.name() + "'";
    ss << INDENT << patch.name() << "\n"
       << INDENT << "{\n"
       << INDENT << INDENT << "type " << patch.type() << ";\n"
       << INDENT << INDENT << "faces\n"
       << INDENT << INDENT << "(\n";
    for (const auto& face : patch.faces()) {
        ss << INDENT << INDENT << INDENT << face_refs(face, owner) << "\n";
    }
    ss << INDENT << INDENT << ");\n"
       << INDENT << "}\n";
}

std::string BlockMeshDictWriter::write_face(const ProjectedFace& face) const {
    return "project " + face_refs(face.vertices, "face") + " " + face.geometry.name;
}

std::string BlockMeshDictWriter::write_geometry(const Geometry& geometry) {
    return geometry.name + " { type " + geometry.type + "; file \"" + geometry.file + "\"; }";
}

std::string BlockMeshDictWriter::write_patch_pair(const PatchPair& pair) {
    return foam::list(std::vector<std::string>{pair.master->name(), pair.slave->name()});
}

void BlockMeshDictWriter::check_block_edges() const {
    const auto& blocks = mesh_.blocks();
    for (size_t i = 0; i < blocks.size(); ++i) {
        for (const auto& edge : blocks[i]->edges()) {
            if (edge && !edge->is_line() && !mesh_.edge_id(edge)) {
                throw RenderError("Cannot render block " + std::to_string(i) + ": its " +
                                  std::string(edge->type()) +
                                  " edge is not registered in the mesh");
            }
        }
    }
}

std::string BlockMeshDictWriter::ref(const VertexHandle& vertex, std::string_view owner) const {
    auto id = mesh_.vertex_id(vertex);
    if (!id) {
        throw RenderError("Cannot render " + std::string(owner) +
                          ": it references a vertex that is not registered in the mesh");
    }
    return std::to_string(*id);
}

std::string BlockMeshDictWriter::face_refs(const FaceVertices& face, std::string_view owner) const {
    return foam::list(face, [&](const VertexHandle& v) { return ref(v, owner); });
}

std::string render_block_mesh_dict(const Mesh& mesh, const RenderOptions& options) {
    return BlockMeshDictWriter(mesh, options).render();
}

void print_block_mesh_dict(std::ostream& out, const Mesh& mesh, const RenderOptions& options) {
    out << render_block_mesh_dict(mesh, options);
}

void write_block_mesh_dict(const std::string& path, const Mesh& mesh,
                           const RenderOptions& options) {
    std::string content = render_block_mesh_dict(mesh, options);

    std::ofstream file(path);
    if (!file) {
        throw std::runtime_error("Cannot write to file: " + path);
    }
    file << content;
    if (!file) {
        throw std::runtime_error("Failed while writing file: " + path);
    }
    logging::get_logger()->debug("Wrote {} bytes to {}", content.size(), path);
}

}  // namespace tetris
