#include <gtest/gtest.h>
#include <mesh/mesh.hpp>
#include <serialization/block_mesh_dict.hpp>
#include <common/errors.hpp>
#include <cstdio>
#include <fstream>
#include <sstream>

using namespace tetris;

namespace {

std::vector<VertexHandle> unit_cube() {
    return {
        make_vertex(0, 0, 0), make_vertex(1, 0, 0), make_vertex(1, 1, 0), make_vertex(0, 1, 0),
        make_vertex(0, 0, 1), make_vertex(1, 0, 1), make_vertex(1, 1, 1), make_vertex(0, 1, 1),
    };
}

RenderOptions test_options() {
    RenderOptions options;
    options.version = "test";
    return options;
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

}  // namespace

TEST(BlockMeshDictTest, UnitCube) {
    Mesh mesh;
    auto block = Block::from_vertices(unit_cube());
    block->set_cells(2, 2, 2);
    mesh.add_block(block);

    std::string expected =
        "// Automatically generated by tetris vtest\n"
        "FoamFile\n"
        "{\n"
        "    version     2.0;\n"
        "    format      ascii;\n"
        "    class       dictionary;\n"
        "    object      blockMeshDict;\n"
        "}\n"
        "// * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * * //\n"
        "\n"
        "scale 1;\n"
        "fastMerge yes;\n"
        "\n"
        "vertices\n"
        "(\n"
        "    (0.000000 0.000000 0.000000) // 0\n"
        "    (1.000000 0.000000 0.000000) // 1\n"
        "    (1.000000 1.000000 0.000000) // 2\n"
        "    (0.000000 1.000000 0.000000) // 3\n"
        "    (0.000000 0.000000 1.000000) // 4\n"
        "    (1.000000 0.000000 1.000000) // 5\n"
        "    (1.000000 1.000000 1.000000) // 6\n"
        "    (0.000000 1.000000 1.000000) // 7\n"
        ");\n"
        "\n"
        "blocks\n"
        "(\n"
        "    hex (0 1 2 3 4 5 6 7) (2 2 2) simpleGrading (1 1 1)\n"
        ");\n"
        "\n"
        "edges\n"
        "(\n"
        ");\n"
        "\n"
        "// ************************************************************************* //\n";

    EXPECT_EQ(mesh.render(test_options()), expected);
}

TEST(BlockMeshDictTest, OptionalSectionsOmittedWhenEmpty) {
    Mesh mesh;
    mesh.add_block(Block::from_vertices(unit_cube()));
    std::string text = mesh.render();
    EXPECT_FALSE(contains(text, "geometry"));
    EXPECT_FALSE(contains(text, "faces"));
    EXPECT_FALSE(contains(text, "boundary"));
    EXPECT_FALSE(contains(text, "patches"));
    EXPECT_FALSE(contains(text, "defaultPatch"));
    EXPECT_FALSE(contains(text, "mergePatchPairs"));
    EXPECT_FALSE(contains(text, "mergeTolerance"));
}

TEST(BlockMeshDictTest, EmptyMesh) {
    Mesh mesh;
    std::string text = mesh.render();
    EXPECT_TRUE(contains(text, "vertices\n(\n);\n"));
    EXPECT_TRUE(contains(text, "blocks\n(\n);\n"));
    EXPECT_TRUE(contains(text, "edges\n(\n);\n"));
}

TEST(BlockMeshDictTest, BlockZoneGradingAndDescription) {
    Mesh mesh;
    auto block = Block::from_vertices(unit_cube());
    block->set_cells(10, 5, 1);
    block->set_grading({1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 0.5});
    block->set_cell_zone("fluid");
    block->set_description("inlet block");
    mesh.add_block(block);

    EXPECT_TRUE(contains(mesh.render(),
        "    hex (0 1 2 3 4 5 6 7) fluid (10 5 1) edgeGrading "
        "(1 2 3 4 5 6 7 8 9 10 11 0.5) // inlet block\n"));
}

TEST(BlockMeshDictTest, CurvedEdges) {
    Mesh mesh;
    auto v = unit_cube();
    auto block = Block::from_vertices(v);
    block->set_edge(Edge::arc(v[1], v[0], {0.5, -0.2, 0}));
    block->set_edge(Edge::arc_origin(v[4], v[5], {0.5, 0, 0}, 1.5));
    block->set_edge(Edge::spline(v[3], v[7], {{0, 1.1, 0.5}}));
    mesh.add_block(block);

    std::string text = mesh.render();
    // Stored in table direction, so the first arc is written from 0 to 1
    EXPECT_TRUE(contains(text, "    arc 0 1 (0.500000 -0.200000 0.000000)\n"));
    EXPECT_TRUE(contains(text, "    arc 4 5 origin 1.5 (0.500000 0.000000 0.000000)\n"));
    EXPECT_TRUE(contains(text, "    spline 3 7 ((0.000000 1.100000 0.500000))\n"));
    EXPECT_FALSE(contains(text, "line "));
}

TEST(BlockMeshDictTest, ProjectionsAndGeometry) {
    Mesh mesh;
    auto sphere = Geometry::tri_surface("sphere", "sphere.stl");
    auto v = unit_cube();
    v[6] = make_projected_vertex({1, 1, 1}, {sphere});
    auto block = Block::from_vertices(v);
    block->set_edge(Edge::project(v[5], v[6], {sphere}));
    mesh.add_block(block);
    mesh.add_face(make_projected_face(block->face(FaceLabel::Top), sphere));

    std::string text = mesh.render();
    EXPECT_TRUE(contains(text,
        "geometry\n{\n    sphere { type triSurfaceMesh; file \"sphere.stl\"; }\n}\n"));
    EXPECT_TRUE(contains(text, "    project (1.000000 1.000000 1.000000) (sphere) // 6\n"));
    EXPECT_TRUE(contains(text, "    project 5 6 (sphere)\n"));
    EXPECT_TRUE(contains(text, "faces\n(\n    project (4 5 6 7) sphere\n);\n"));
}

TEST(BlockMeshDictTest, PatchesAndBoundary) {
    Mesh mesh;
    auto block = Block::from_vertices(unit_cube());
    mesh.add_block(block);

    auto inlet = make_patch("inlet", "patch");
    inlet->add_face(*block, FaceLabel::Left);
    auto walls = make_patch("walls", "wall");
    walls->add_face(*block, FaceLabel::Bottom);
    walls->add_face(*block, FaceLabel::Top);
    mesh.add_patch(inlet);
    mesh.add_boundary(walls);
    mesh.set_default_patch("outside", "symmetry");

    std::string text = mesh.render();
    EXPECT_TRUE(contains(text, "patches\n(\n    patch inlet ((3 0 4 7))\n);\n"));
    EXPECT_TRUE(contains(text,
        "boundary\n"
        "(\n"
        "    walls\n"
        "    {\n"
        "        type wall;\n"
        "        faces\n"
        "        (\n"
        "            (0 3 2 1)\n"
        "            (4 5 6 7)\n"
        "        );\n"
        "    }\n"
        ");\n"));
    EXPECT_TRUE(contains(text, "defaultPatch\n{\n    name outside;\n    type symmetry;\n}\n"));
}

TEST(BlockMeshDictTest, MergePatchPairs) {
    Mesh mesh;
    mesh.add_block(Block::from_vertices(unit_cube()));
    mesh.add_merge_patch_pair(make_patch("master", "patch"), make_patch("slave", "patch"));
    EXPECT_TRUE(contains(mesh.render(), "mergePatchPairs\n(\n    (master slave)\n);\n"));
}

TEST(BlockMeshDictTest, ScaleAndMergeSettings) {
    Mesh mesh;
    mesh.set_scale(0.001);
    RenderOptions options;
    options.fast_merge = false;
    options.merge_tolerance = 1e-6;

    std::string text = mesh.render(options);
    EXPECT_TRUE(contains(text, "scale 0.001;\n"));
    EXPECT_TRUE(contains(text, "mergeTolerance 1e-06;\n"));
    EXPECT_FALSE(contains(text, "fastMerge"));
}

TEST(BlockMeshDictTest, ScaleAndGradingKeepPrecision) {
    Mesh mesh;
    mesh.set_scale(1234.5678);
    auto block = Block::from_vertices(unit_cube());
    block->set_grading({12.34567, 1, 1});
    mesh.add_block(block);

    std::string text = mesh.render();
    EXPECT_TRUE(contains(text, "scale 1234.5678;\n"));
    EXPECT_TRUE(contains(text, "simpleGrading (12.34567 1 1)\n"));
}

TEST(BlockMeshDictTest, HeaderAndFooter) {
    Mesh mesh;
    RenderOptions options = test_options();
    options.header = "// case: cavity";
    options.footer = "// end of file";

    std::string text = mesh.render(options);
    EXPECT_EQ(text.rfind("// Automatically generated by tetris vtest\n// case: cavity\nFoamFile\n", 0), 0u);
    std::string tail = "// end of file\n";
    ASSERT_GE(text.size(), tail.size());
    EXPECT_EQ(text.substr(text.size() - tail.size()), tail);
}

TEST(BlockMeshDictTest, UnregisteredVertexFailsRender) {
    Mesh mesh;
    auto inlet = make_patch("inlet", "patch");
    mesh.add_patch(inlet);
    // Face added after registration, its vertices are unknown to the mesh
    inlet->add_face(Block(unit_cube()).face(FaceLabel::Left));
    EXPECT_THROW(mesh.render(), RenderError);
}

TEST(BlockMeshDictTest, CurvedEdgeSetAfterAddBlockFailsRender) {
    Mesh mesh;
    auto v = unit_cube();
    auto block = Block::from_vertices(v);
    mesh.add_block(block);
    block->set_edge(Edge::arc(v[0], v[1], {0.5, -0.2, 0}));
    try {
        mesh.render();
        FAIL() << "expected RenderError";
    } catch (const RenderError& e) {
        std::string message = e.what();
        EXPECT_TRUE(contains(message, "block 0"));
        EXPECT_TRUE(contains(message, "arc"));
    }
}

TEST(BlockMeshDictTest, BinaryFormatUnsupported) {
    Mesh mesh;
    RenderOptions options;
    options.format = DocumentFormat::Binary;
    EXPECT_THROW(mesh.render(options), UnsupportedError);
}

TEST(BlockMeshDictTest, PrintMatchesRender) {
    Mesh mesh;
    mesh.add_block(Block::from_vertices(unit_cube()));
    std::ostringstream out;
    mesh.print(out);
    EXPECT_EQ(out.str(), mesh.render());
}

TEST(BlockMeshDictTest, WriteFile) {
    Mesh mesh;
    mesh.add_block(Block::from_vertices(unit_cube()));
    std::string path = ::testing::TempDir() + "tetris_write_test.blockMeshDict";
    mesh.write(path);

    std::ifstream file(path);
    std::stringstream content;
    content << file.rdbuf();
    EXPECT_EQ(content.str(), mesh.render());
    std::remove(path.c_str());
}

TEST(BlockMeshDictTest, WriteToMissingDirectoryFails) {
    Mesh mesh;
    EXPECT_THROW(mesh.write("/nonexistent-dir/blockMeshDict"), std::runtime_error);
}

TEST(BlockMeshDictTest, UniformEdgeGrading) {
    Mesh mesh;
    auto block = Block::from_vertices(unit_cube());
    block->set_grading(std::vector<double>(12, 1.0));
    mesh.add_block(block);
    EXPECT_TRUE(contains(mesh.render(), "edgeGrading (1 1 1 1 1 1 1 1 1 1 1 1)\n"));
}
