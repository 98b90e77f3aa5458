#include "TestMeshes.hpp"

#include <facet/Cutter.hpp>

#include <gtest/gtest.h>

namespace facet {

TEST(Cutter, TriangleCountIsConserved)
{
    EditMesh grid = test::makeGrid(4, 2.0f);
    const std::vector<FaceSet> selections = {
        {0},
        {0, 1, 2, 3},
        {5, 17, 30},
        {},
    };

    for (const FaceSet& faces : selections) {
        CutResult cut = cutFaces(grid, faces);
        EXPECT_EQ(cut.remaining.getFaceCount() + cut.cutOut.getFaceCount(), grid.getFaceCount());
        EXPECT_EQ(cut.cutOut.getFaceCount(), faces.size());
    }
}

TEST(Cutter, HalvesAreCompacted)
{
    EditMesh grid = test::makeGrid(4, 2.0f);
    CutResult cut = cutFaces(grid, {2, 3});

    // One quad: four corners
    EXPECT_EQ(cut.cutOut.getVertexCount(), 4u);
    for (const Triangle& tri : cut.cutOut.getTriangles()) {
        for (uint32_t idx : tri) {
            EXPECT_LT(idx, 4u);
        }
    }
    // Every grid vertex is still used by some remaining face
    EXPECT_EQ(cut.remaining.getVertexCount(), grid.getVertexCount());
    EXPECT_TRUE(cut.isValid());

    // Geometry is copied, not moved
    EXPECT_NEAR(cut.cutOut.getFaceArea(0) + cut.cutOut.getFaceArea(1), 0.25f, 1e-6f);
}

TEST(Cutter, FullSelectionLeavesEmptyRemainder)
{
    EditMesh cube = test::makeCube();
    FaceSet all;
    for (FaceIndex f = 0; f < 12; ++f) all.insert(f);

    CutResult cut = cutFaces(cube, all);
    EXPECT_EQ(cut.remaining.getFaceCount(), 0u);
    EXPECT_EQ(cut.remaining.getVertexCount(), 0u);
    EXPECT_EQ(cut.cutOut.getFaceCount(), 12u);
    EXPECT_FALSE(cut.isValid());
}

TEST(Cutter, EmptySelectionCutsNothing)
{
    EditMesh cube = test::makeCube();
    CutResult cut = cutFaces(cube, {});
    EXPECT_TRUE(cut.cutOut.empty());
    EXPECT_EQ(cut.remaining.getFaceCount(), 12u);
    EXPECT_FALSE(cut.isValid());
}

TEST(Cutter, OutOfRangeFacesAreIgnored)
{
    EditMesh cube = test::makeCube();
    CutResult cut = cutFaces(cube, {0, 1, 12, 400});
    EXPECT_EQ(cut.cutOut.getFaceCount(), 2u);
    EXPECT_EQ(cut.remaining.getFaceCount(), 10u);
}

TEST(Cutter, DeleteKeepsSharedVertices)
{
    EditMesh cube = test::makeCube();
    EditMesh result = deleteFaces(cube, {0, 1, 77});
    EXPECT_EQ(result.getFaceCount(), 10u);
    EXPECT_EQ(result.getVertexCount(), 8u);
    EXPECT_EQ(result.getTriangles()[0], cube.getTriangles()[2]);
}

TEST(Cutter, DeleteDropsUnreferencedVertices)
{
    // Vertex 0 is the grid corner, used only by quad (0, 0)
    EditMesh grid = test::makeGrid(2, 1.0f);
    EditMesh result = deleteFaces(grid, {0, 1});
    EXPECT_EQ(result.getFaceCount(), 6u);
    EXPECT_EQ(result.getVertexCount(), 8u);
    EXPECT_NEAR_VEC3(result.getBounds().min, 0.0f, 0.0f, 0.0f, 1e-6f);

    // Remaining faces keep their shape after renumbering
    for (FaceIndex f = 0; f < result.getFaceCount(); ++f) {
        EXPECT_NEAR_VEC3(result.getFaceCenter(f),
                         grid.getFaceCenter(f + 2).x, grid.getFaceCenter(f + 2).y,
                         grid.getFaceCenter(f + 2).z, 1e-6f);
    }
}

} // namespace facet
