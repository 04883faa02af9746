#include "topology.hpp"
#include <common/errors.hpp>
#include <algorithm>

namespace tetris {

const std::array<size_t, 4>& face_corners(FaceLabel label) {
    return topology::FACES[static_cast<size_t>(label)];
}

std::optional<size_t> edge_slot(size_t a, size_t b) {
    LocalEdge key = std::minmax(a, b);
    for (size_t slot = 0; slot < topology::EDGE_COUNT; ++slot) {
        const auto& [v0, v1] = topology::EDGES[slot];
        if (LocalEdge(std::minmax(v0, v1)) == key) {
            return slot;
        }
    }
    return std::nullopt;
}

Axis edge_axis(size_t slot) {
    return static_cast<Axis>(slot / topology::EDGES_PER_AXIS);
}

const LocalEdge& axis_edge(Axis axis) {
    return topology::EDGES[static_cast<size_t>(axis) * topology::EDGES_PER_AXIS];
}

std::string_view to_string(FaceLabel label) {
    switch (label) {
        case FaceLabel::Bottom: return "bottom";
        case FaceLabel::Top: return "top";
        case FaceLabel::Right: return "right";
        case FaceLabel::Left: return "left";
        case FaceLabel::Front: return "front";
        case FaceLabel::Back: return "back";
    }
    return "unknown";
}

FaceLabel face_label_from_string(std::string_view name) {
    for (FaceLabel label : topology::ALL_FACES) {
        if (to_string(label) == name) {
            return label;
        }
    }
    throw ConfigurationError("Unknown face label: " + std::string(name));
}

}  // namespace tetris
