#include <gtest/gtest.h>
#include <blockmesh/topology.hpp>
#include <common/errors.hpp>
#include <set>

using namespace tetris;

TEST(TopologyTest, EdgeSlotsFollowGradingOrder) {
    EXPECT_EQ(edge_slot(0, 1), 0u);
    EXPECT_EQ(edge_slot(3, 2), 1u);
    EXPECT_EQ(edge_slot(7, 6), 2u);
    EXPECT_EQ(edge_slot(4, 5), 3u);
    EXPECT_EQ(edge_slot(0, 3), 4u);
    EXPECT_EQ(edge_slot(4, 7), 7u);
    EXPECT_EQ(edge_slot(0, 4), 8u);
    EXPECT_EQ(edge_slot(3, 7), 11u);
}

TEST(TopologyTest, EdgeSlotIgnoresOrder) {
    for (size_t slot = 0; slot < topology::EDGE_COUNT; ++slot) {
        const auto& [a, b] = topology::EDGES[slot];
        EXPECT_EQ(edge_slot(a, b), slot);
        EXPECT_EQ(edge_slot(b, a), slot);
    }
}

TEST(TopologyTest, DiagonalsAreNotEdges) {
    EXPECT_FALSE(edge_slot(0, 2).has_value());
    EXPECT_FALSE(edge_slot(0, 6).has_value());
    EXPECT_FALSE(edge_slot(1, 7).has_value());
}

TEST(TopologyTest, EdgeAxes) {
    EXPECT_EQ(edge_axis(0), Axis::X1);
    EXPECT_EQ(edge_axis(3), Axis::X1);
    EXPECT_EQ(edge_axis(4), Axis::X2);
    EXPECT_EQ(edge_axis(11), Axis::X3);
    EXPECT_EQ(axis_edge(Axis::X2), LocalEdge(0, 3));
    EXPECT_EQ(axis_edge(Axis::X3), LocalEdge(0, 4));
}

TEST(TopologyTest, EveryCornerOnThreeFaces) {
    std::array<int, topology::VERTEX_COUNT> count{};
    for (FaceLabel label : topology::ALL_FACES) {
        for (size_t corner : face_corners(label)) {
            ++count[corner];
        }
    }
    for (int c : count) {
        EXPECT_EQ(c, 3);
    }
}

TEST(TopologyTest, FaceCorners) {
    EXPECT_EQ(face_corners(FaceLabel::Bottom), (std::array<size_t, 4>{0, 3, 2, 1}));
    EXPECT_EQ(face_corners(FaceLabel::Top), (std::array<size_t, 4>{4, 5, 6, 7}));
    EXPECT_EQ(face_corners(FaceLabel::Back), (std::array<size_t, 4>{2, 3, 7, 6}));
}

TEST(TopologyTest, FaceLabelNames) {
    for (FaceLabel label : topology::ALL_FACES) {
        EXPECT_EQ(face_label_from_string(to_string(label)), label);
    }
    EXPECT_THROW(face_label_from_string("north"), ConfigurationError);
}
