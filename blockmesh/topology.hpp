#ifndef TETRIS_BLOCKMESH_TOPOLOGY_HPP
#define TETRIS_BLOCKMESH_TOPOLOGY_HPP

#include <array>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace tetris {

// Local corner labelling follows the blockMesh hex convention:
//
//        7 ---- 6
//       /|     /|
//      4 ---- 5 |       x3
//      | 3 ---|-2       |  x2
//      |/     |/        | /
//      0 ---- 1         |/___ x1
//
enum class FaceLabel {
    Bottom,
    Top,
    Right,
    Left,
    Front,
    Back
};

enum class Axis {
    X1 = 0,
    X2 = 1,
    X3 = 2
};

using LocalEdge = std::pair<size_t, size_t>;

namespace topology {

constexpr size_t VERTEX_COUNT = 8;
constexpr size_t EDGE_COUNT = 12;
constexpr size_t FACE_COUNT = 6;
constexpr size_t EDGES_PER_AXIS = 4;

// Corners of each face, ordered so the right-hand rule yields an outward
// normal. Indexed by FaceLabel.
constexpr std::array<std::array<size_t, 4>, FACE_COUNT> FACES = {{
    {0, 3, 2, 1},  // bottom
    {4, 5, 6, 7},  // top
    {1, 2, 6, 5},  // right
    {3, 0, 4, 7},  // left
    {0, 1, 5, 4},  // front
    {2, 3, 7, 6},  // back
}};

// Block edges in edgeGrading order, four per axis. Each pair points along
// the positive direction of its axis.
constexpr std::array<LocalEdge, EDGE_COUNT> EDGES = {{
    {0, 1}, {3, 2}, {7, 6}, {4, 5},  // x1
    {0, 3}, {1, 2}, {5, 6}, {4, 7},  // x2
    {0, 4}, {1, 5}, {2, 6}, {3, 7},  // x3
}};

constexpr std::array<FaceLabel, FACE_COUNT> ALL_FACES = {
    FaceLabel::Bottom, FaceLabel::Top, FaceLabel::Right,
    FaceLabel::Left, FaceLabel::Front, FaceLabel::Back
};

}  // namespace topology

const std::array<size_t, 4>& face_corners(FaceLabel label);

// Slot of the edge joining two local corners, in either order
std::optional<size_t> edge_slot(size_t a, size_t b);

// Axis along which the edge in `slot` runs
Axis edge_axis(size_t slot);

// First table edge of an axis; its length stands for the axis
const LocalEdge& axis_edge(Axis axis);

std::string_view to_string(FaceLabel label);

// Throws ConfigurationError for unknown labels
FaceLabel face_label_from_string(std::string_view name);

}  // namespace tetris

#endif // TETRIS_BLOCKMESH_TOPOLOGY_HPP
