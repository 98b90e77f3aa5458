#include "TestMeshes.hpp"

#include <facet/SelectOps.hpp>

#include <gtest/gtest.h>

namespace facet {

namespace {

// Two unit cubes side by side with no shared vertices
EditMesh makeTwoCubes() {
    RenderableMesh a = test::makeCubeRenderable();
    RenderableMesh b = test::makeCubeRenderable();
    const uint32_t offset = static_cast<uint32_t>(a.positions.size());
    for (const glm::vec3& p : b.positions) {
        a.positions.push_back(p + glm::vec3(3.0f, 0.0f, 0.0f));
    }
    for (uint32_t idx : b.indices) {
        a.indices.push_back(idx + offset);
    }
    return *EditMesh::fromRenderable(a);
}

} // namespace

TEST(SelectOps, GrowAddsEdgeNeighbours)
{
    EditMesh grid = test::makeGrid(4, 2.0f);
    // Face 0 shares its diagonal with face 1 and its right edge with face 3
    EXPECT_EQ(growSelection(grid, {0}), (FaceSet{0, 1, 3}));
}

TEST(SelectOps, ShrinkRemovesRim)
{
    EditMesh grid = test::makeGrid(4, 2.0f);
    FaceSet all;
    for (FaceIndex f = 0; f < grid.getFaceCount(); ++f) all.insert(f);

    // Faces touching the open border drop out
    FaceSet shrunk = shrinkSelection(grid, all);
    EXPECT_EQ(shrunk.size(), 18u);

    // Nothing is on the rim of a fully selected closed cube
    EditMesh cube = test::makeCube();
    FaceSet cubeAll;
    for (FaceIndex f = 0; f < 12; ++f) cubeAll.insert(f);
    EXPECT_EQ(shrinkSelection(cube, cubeAll).size(), 12u);

    EXPECT_TRUE(shrinkSelection(cube, {0, 1}).empty());
}

TEST(SelectOps, LinkedStopsAtDisconnectedPieces)
{
    EditMesh twoCubes = makeTwoCubes();
    ASSERT_EQ(twoCubes.getFaceCount(), 24u);

    FaceSet linked = selectLinked(twoCubes, {0});
    EXPECT_EQ(linked.size(), 12u);
    EXPECT_EQ(*linked.rbegin(), 11u);

    EXPECT_EQ(selectLinked(twoCubes, {0, 12}).size(), 24u);
}

TEST(SelectOps, ByNormalMatchesFacing)
{
    EditMesh cube = test::makeCube();
    EXPECT_EQ(selectByNormal(cube, {4}, 10.0f), (FaceSet{4, 5}));

    // +Z and +X average to a diagonal; both sides are 45 degrees off it
    EXPECT_EQ(selectByNormal(cube, {0, 4}, 46.0f), (FaceSet{0, 1, 4, 5}));
}

TEST(SelectOps, InvalidIndicesAreDropped)
{
    EditMesh cube = test::makeCube();
    EXPECT_TRUE(growSelection(cube, {40}).empty());
    EXPECT_TRUE(selectLinked(cube, {12}).empty());
    EXPECT_EQ(selectByNormal(cube, {4, 99}, 10.0f), (FaceSet{4, 5}));
}

} // namespace facet
