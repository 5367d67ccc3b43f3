#include "test.hpp"

#include "stvox/core/pipeline/VoxelPipeline.hpp"
#include "stvox/core/util/Bounds.hpp"
#include "stvox/core/util/Logging.hpp"
#include "stvox/core/util/SlicePartition.hpp"
#include "stvox/core/util/TestDataset.hpp"

using namespace stvox;

namespace {

Dataset triangleDataset()
{
    Dataset d;
    d.bounds = {0.0f, 10.0f, 0.0f, 10.0f, 4.0f};

    CellBoundary c;
    c.cellId = 7;
    c.planeId = 0;
    c.vertices = {{0.0f, 0.0f}, {5.0f, 5.0f}, {0.0f, 9.0f}};
    d.cells.push_back(c);
    return d;
}

bool sameScene(const VoxelScene& a, const VoxelScene& b)
{
    return a.bounds == b.bounds && a.extents == b.extents && a.totalPlanes == b.totalPlanes &&
           a.background == b.background && a.cellInterior == b.cellInterior &&
           a.boundary == b.boundary && a.genes == b.genes && a.links == b.links;
}

}  // namespace

TEST(Pipeline, TriangleScenarioEndToEnd)
{
    SetLogLevel("warn");
    const VoxelScene scene = buildVoxelScene(triangleDataset(), {}, GeneColorTable{});

    EXPECT_EQ(scene.extents.maxX, 10);
    EXPECT_EQ(scene.extents.maxZ, 10);
    EXPECT_EQ(scene.totalPlanes, 2);
    EXPECT_EQ(scene.background.size() + scene.cellInterior.size(), 200u);
    EXPECT_GT(scene.cellInterior.size(), 0u);
    EXPECT_GT(scene.boundary.size(), 0u);
    EXPECT_TRUE(scene.genes.empty());
    EXPECT_TRUE(scene.links.empty());

    EXPECT_TRUE(scene.diagnostics.missingVoxelConfig);
    EXPECT_TRUE(scene.diagnostics.estimatedPlaneCount);
    EXPECT_EQ(scene.diagnostics.degenerateBoundaries, 0u);
}

TEST(Pipeline, LinkScenarioEndToEnd)
{
    SetLogLevel("warn");
    Dataset d = triangleDataset();

    GeneSpot background;
    background.gene = "CD68";
    background.x = 6.0f;
    background.y = 6.0f;
    background.planeId = 1;
    background.parentCellId = 0;
    d.spots.push_back(background);

    GeneSpot linked;
    linked.gene = "CD68";
    linked.x = 1.5f;
    linked.y = 4.5f;
    linked.planeId = 0;
    linked.parentCellId = 7;
    linked.parentX = 2.0f;
    linked.parentY = 4.0f;
    linked.parentZ = 0.5f;
    d.spots.push_back(linked);

    GeneColorTable colors;
    colors.set("CD68", cv::Vec3b(0, 200, 0));
    const VoxelScene scene = buildVoxelScene(d, {}, colors);

    ASSERT_EQ(scene.genes.size(), 2u);
    ASSERT_EQ(scene.links.size(), 1u);
    EXPECT_EQ(scene.links[0].markerIndex, 1u);
    EXPECT_FLOAT_EQ(scene.links[0].source[0], static_cast<float>(scene.genes[1].voxel.gridX));
    EXPECT_FLOAT_EQ(scene.links[0].source[1], scene.genes[1].voxel.gridY);
    EXPECT_FLOAT_EQ(scene.links[0].source[2], static_cast<float>(scene.genes[1].voxel.gridZ));
    EXPECT_EQ(scene.links[0].color, cv::Vec4b(0, 200, 0, 128));
    EXPECT_EQ(scene.diagnostics.backgroundParentSpots, 1u);
}

TEST(Pipeline, VoxelSizeScalesPlanes)
{
    SetLogLevel("warn");
    VoxelConfig config;
    config.voxelSize = cv::Vec3f(1.0f, 1.0f, 2.0f);
    config.totalPlanes = 3;
    const VoxelScene scene = buildVoxelScene(triangleDataset(), config, GeneColorTable{});

    EXPECT_FALSE(scene.diagnostics.missingVoxelConfig);
    EXPECT_FALSE(scene.diagnostics.estimatedPlaneCount);
    EXPECT_FLOAT_EQ(scene.anisotropicScale, 2.0f);
    EXPECT_EQ(scene.extents.maxY, 5);
    EXPECT_EQ(scene.background.size() + scene.cellInterior.size(), 300u);
    for (const auto& v : scene.background) {
        EXPECT_FLOAT_EQ(v.gridY, v.planeId * 2.0f);
    }
    EXPECT_FLOAT_EQ(sliceYForPlane(scene, 2), 4.0f);
}

TEST(Pipeline, EmptyRegionPropagates)
{
    Dataset d = triangleDataset();
    d.bounds = {3.0f, 3.2f, 0.0f, 10.0f, 4.0f};
    EXPECT_THROW(buildVoxelScene(d, {}, GeneColorTable{}), EmptyRegionError);
}

TEST(Pipeline, CancelledBuildThrows)
{
    CancelToken token;
    token.cancel();
    EXPECT_THROW(buildVoxelScene(triangleDataset(), {}, GeneColorTable{}, checkpointFor(token)),
                 BuildCancelledError);
}

TEST(Pipeline, IdempotentOnSameSnapshot)
{
    SetLogLevel("warn");
    TestDatasetOptions options;
    options.bounds = {0.0f, 60.0f, 0.0f, 40.0f, 20.0f};
    options.cells = 4;
    options.spotsPerPlane = 10;
    const Dataset d = generateTestDataset(5, options);

    VoxelConfig config;
    config.voxelSize = cv::Vec3f(0.5f, 0.5f, 1.25f);
    config.totalPlanes = options.planes;

    GeneColorTable colors;
    colors.set("ACTB", cv::Vec3b(1, 2, 3));

    const VoxelScene a = buildVoxelScene(d, config, colors);
    const VoxelScene b = buildVoxelScene(d, config, colors);
    EXPECT_TRUE(sameScene(a, b));
    EXPECT_GT(a.genes.size(), 0u);
    EXPECT_GT(a.cellInterior.size(), 0u);
}

TEST(Pipeline, AllVoxelsInsideExtents)
{
    SetLogLevel("warn");
    TestDatasetOptions options;
    options.bounds = {0.0f, 50.0f, 0.0f, 30.0f, 15.0f};
    options.cells = 5;
    const Dataset d = generateTestDataset(11, options);
    const VoxelScene s = buildVoxelScene(d, {}, GeneColorTable{});

    for (const auto* list : {&s.background, &s.cellInterior, &s.boundary}) {
        for (const auto& v : *list) {
            EXPECT_GE(v.gridX, 0);
            EXPECT_LT(v.gridX, s.extents.maxX);
            EXPECT_GE(v.gridY, 0.0f);
            EXPECT_LT(v.gridY, static_cast<float>(s.extents.maxY));
            EXPECT_GE(v.gridZ, 0);
            EXPECT_LT(v.gridZ, s.extents.maxZ);
        }
    }
}
