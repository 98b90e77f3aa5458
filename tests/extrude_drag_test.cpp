#include "TestMeshes.hpp"

#include <facet/ExtrudeDrag.hpp>

#include <gtest/gtest.h>

namespace facet {

TEST(ExtrudeDrag, ClosestAxisParameter)
{
    Ray ray{{5.0f, 0.0f, 2.0f}, {-1.0f, 0.0f, 0.0f}};
    auto s = closestAxisParameter({0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, ray);
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(*s, 2.0f, 1e-6f);

    // Skew lines: the ray passes above the axis
    Ray skew{{3.0f, 1.0f, -1.5f}, {-1.0f, 0.0f, 0.0f}};
    s = closestAxisParameter({0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 2.0f}, skew);
    ASSERT_TRUE(s.has_value());
    EXPECT_NEAR(*s, -0.75f, 1e-6f);
}

TEST(ExtrudeDrag, ParallelLinesHaveNoParameter)
{
    Ray ray{{1.0f, 0.0f, 0.0f}, {0.0f, 0.0f, -1.0f}};
    EXPECT_FALSE(closestAxisParameter({0.0f, 0.0f, 0.0f}, {0.0f, 0.0f, 1.0f}, ray).has_value());
}

class ExtrudeDragTest : public ::testing::Test {
protected:
    void SetUp() override {
        grid = test::makeGrid(2, 2.0f);
        for (FaceIndex f = 0; f < grid.getFaceCount(); ++f) selection.insert(f);
        state.operation = ModelOperation::Extrude;
    }

    // Horizontal ray crossing the axis through (1, 1) at height z
    static Ray rayAtHeight(float z) {
        return Ray{{5.0f, 1.0f, z}, {-1.0f, 0.0f, 0.0f}};
    }

    EditMesh grid;
    FaceSet selection;
    ToolState state;
    Transform transform;
};

TEST_F(ExtrudeDragTest, DistanceFollowsCursorAlongAxis)
{
    state.extrudeDistance = 4.0f;

    // First frame anchors the drag and starts from zero
    updateExtrudeDrag(state, grid, selection, transform, true, rayAtHeight(0.25f));
    ASSERT_TRUE(state.isDragging());
    EXPECT_NEAR_VEC3(*state.dragOrigin, 1.0f, 1.0f, 0.0f, 1e-5f);
    EXPECT_NEAR_VEC3(*state.dragNormal, 0.0f, 0.0f, 1.0f, 1e-5f);
    EXPECT_NEAR(*state.dragBaseline, 0.25f, 1e-5f);
    EXPECT_EQ(state.extrudeDistance, 0.0f);

    EXPECT_TRUE(updateExtrudeDrag(state, grid, selection, transform, true, rayAtHeight(1.75f)));
    EXPECT_NEAR(state.extrudeDistance, 1.5f, 1e-5f);

    EXPECT_TRUE(updateExtrudeDrag(state, grid, selection, transform, true, rayAtHeight(-0.75f)));
    EXPECT_NEAR(state.extrudeDistance, -1.0f, 1e-5f);
}

TEST_F(ExtrudeDragTest, ParallelFrameKeepsDistance)
{
    updateExtrudeDrag(state, grid, selection, transform, true, rayAtHeight(0.0f));
    updateExtrudeDrag(state, grid, selection, transform, true, rayAtHeight(0.5f));
    ASSERT_NEAR(state.extrudeDistance, 0.5f, 1e-5f);

    Ray alongAxis{{1.0f, 1.0f, 10.0f}, {0.0f, 0.0f, -1.0f}};
    EXPECT_FALSE(updateExtrudeDrag(state, grid, selection, transform, true, alongAxis));
    EXPECT_NEAR(state.extrudeDistance, 0.5f, 1e-5f);
    EXPECT_TRUE(state.isDragging());
}

TEST_F(ExtrudeDragTest, ReleaseClearsAnchors)
{
    updateExtrudeDrag(state, grid, selection, transform, true, rayAtHeight(0.0f));
    updateExtrudeDrag(state, grid, selection, transform, true, rayAtHeight(0.8f));

    EXPECT_FALSE(updateExtrudeDrag(state, grid, selection, transform, false, rayAtHeight(3.0f)));
    EXPECT_FALSE(state.isDragging());
    EXPECT_FALSE(state.dragBaseline.has_value());
    EXPECT_NEAR(state.extrudeDistance, 0.8f, 1e-5f);
}

TEST_F(ExtrudeDragTest, OnlyRunsForExtrudeWithSelection)
{
    state.operation = ModelOperation::Cut;
    EXPECT_FALSE(updateExtrudeDrag(state, grid, selection, transform, true, rayAtHeight(1.0f)));
    EXPECT_FALSE(state.isDragging());

    state.operation = ModelOperation::Extrude;
    EXPECT_FALSE(updateExtrudeDrag(state, grid, {}, transform, true, rayAtHeight(1.0f)));
    EXPECT_FALSE(state.isDragging());
}

TEST_F(ExtrudeDragTest, ScaledTargetMeasuresLocalUnits)
{
    transform.setScale(2.0f);

    updateExtrudeDrag(state, grid, selection, transform, true, rayAtHeight(0.0f));
    updateExtrudeDrag(state, grid, selection, transform, true, Ray{{5.0f, 2.0f, 3.0f}, {-1.0f, 0.0f, 0.0f}});
    EXPECT_NEAR(state.extrudeDistance, 1.5f, 1e-5f);
}

} // namespace facet
