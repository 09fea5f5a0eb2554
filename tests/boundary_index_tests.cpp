#include <gtest/gtest.h>

#include <vector>

#include "core/boundary_index.hpp"
#include "harness/timeline_builder.hpp"

namespace {

TEST(BoundaryIndexTest, IncludesZeroTotalAndStepEdges) {
    test::TimelineBuilder b;
    b.step(0, 400).step(400, 1000);

    const auto bounds = core::build_boundaries(b.steps(), 1000.0);

    EXPECT_EQ(bounds, (std::vector<double>{0.0, 400.0, 1000.0}));
}

TEST(BoundaryIndexTest, SortsAndDeduplicatesInterleavedSteps) {
    test::TimelineBuilder b;
    b.step(700, std::nullopt).step(100, 300).step(300, 700).step(100, 250);

    const auto bounds = core::build_boundaries(b.steps(), 2000.0);

    EXPECT_EQ(bounds, (std::vector<double>{0.0, 100.0, 250.0, 300.0, 700.0, 2000.0}));
}

TEST(BoundaryIndexTest, NoStepsStillHasEndpoints) {
    EXPECT_EQ(core::build_boundaries({}, 500.0), (std::vector<double>{0.0, 500.0}));
    EXPECT_EQ(core::build_boundaries({}, 0.0), (std::vector<double>{0.0}));
}

// Boundaries never leave [0, total_ms]
TEST(BoundaryIndexTest, DropsPointsBeyondTotal) {
    test::TimelineBuilder b;
    b.step(900, 1500);

    EXPECT_EQ(core::build_boundaries(b.steps(), 1000.0), (std::vector<double>{0.0, 900.0, 1000.0}));
}

TEST(BoundaryIndexTest, NextAndPreviousRespectEpsilon) {
    const std::vector<double> bounds{0.0, 400.0, 1000.0};

    EXPECT_EQ(core::next_boundary(bounds, 0.0, 1.0), 400.0);
    EXPECT_EQ(core::next_boundary(bounds, 399.5, 1.0), 1000.0);
    EXPECT_EQ(core::next_boundary(bounds, 400.0, 1.0), 1000.0);
    EXPECT_FALSE(core::next_boundary(bounds, 1000.0, 1.0).has_value());

    EXPECT_EQ(core::previous_boundary(bounds, 1000.0, 1.0), 400.0);
    EXPECT_EQ(core::previous_boundary(bounds, 400.5, 1.0), 0.0);
    EXPECT_FALSE(core::previous_boundary(bounds, 0.0, 1.0).has_value());
    EXPECT_FALSE(core::previous_boundary(bounds, 0.5, 1.0).has_value());
}

TEST(BoundaryIndexTest, EmptyIndexHasNoNeighbours) {
    const std::vector<double> empty;
    EXPECT_FALSE(core::next_boundary(empty, 0.0, 1.0).has_value());
    EXPECT_FALSE(core::previous_boundary(empty, 0.0, 1.0).has_value());
}

} // namespace
