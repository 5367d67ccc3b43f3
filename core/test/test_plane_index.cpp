#include "test.hpp"

#include "stvox/core/util/Bounds.hpp"
#include "stvox/core/util/GridMapping.hpp"
#include "stvox/core/util/PlaneIndex.hpp"

#include <limits>

using namespace stvox;

static CellBoundary cell(int id, int plane)
{
    CellBoundary c;
    c.cellId = id;
    c.planeId = plane;
    c.vertices = {{0, 0}, {4, 0}, {4, 4}, {0, 4}};
    return c;
}

static NormalizedBounds depthBounds(int depth)
{
    NormalizedBounds b;
    b.right = 9;
    b.bottom = 9;
    b.depth = depth;
    return b;
}

// --- estimatePlaneCount ------------------------------------------------------

TEST(EstimatePlaneCount, DepthOverTwoAndAHalf)
{
    EXPECT_EQ(estimatePlaneCount(depthBounds(4)), 2);
    EXPECT_EQ(estimatePlaneCount(depthBounds(119)), 48);
    EXPECT_EQ(estimatePlaneCount(depthBounds(120)), 48);
}

TEST(EstimatePlaneCount, AtLeastOnePlane)
{
    EXPECT_EQ(estimatePlaneCount(depthBounds(0)), 1);
    EXPECT_EQ(estimatePlaneCount(depthBounds(-5)), 1);
}

// --- PlaneIndex --------------------------------------------------------------

TEST(PlaneIndex, GroupsBoundariesByPlaneInInputOrder)
{
    const std::vector<CellBoundary> cells = {cell(1, 0), cell(2, 1), cell(3, 0), cell(4, 2)};
    const PlaneIndex index(cells, {}, depthBounds(10));

    const auto& plane0 = index.boundariesOnPlane(0);
    ASSERT_EQ(plane0.size(), 2u);
    EXPECT_EQ(plane0[0]->cellId, 1);
    EXPECT_EQ(plane0[1]->cellId, 3);
    EXPECT_EQ(index.boundariesOnPlane(1).size(), 1u);
    EXPECT_EQ(index.boundariesOnPlane(2).size(), 1u);
    EXPECT_EQ(index.boundsOnPlane(0).size(), 2u);
    EXPECT_EQ(index.planeCount(), 3u);
}

TEST(PlaneIndex, UnknownPlaneIsEmpty)
{
    const std::vector<CellBoundary> cells = {cell(1, 0)};
    const PlaneIndex index(cells, {}, depthBounds(10));
    EXPECT_TRUE(index.boundariesOnPlane(7).empty());
    EXPECT_TRUE(index.boundsOnPlane(-1).empty());
}

TEST(PlaneIndex, AnisotropicScaleFromVoxelSize)
{
    VoxelConfig config;
    config.voxelSize = cv::Vec3f(0.5f, 0.5f, 2.0f);
    config.totalPlanes = 6;
    const PlaneIndex index({}, config, depthBounds(10));

    EXPECT_TRUE(index.hasVoxelSize());
    EXPECT_FLOAT_EQ(index.anisotropicScale(), 4.0f);
    EXPECT_FLOAT_EQ(index.planeToY(0), 0.0f);
    EXPECT_FLOAT_EQ(index.planeToY(3), 12.0f);
    EXPECT_EQ(index.totalPlanes(), 6);
    EXPECT_FALSE(index.planeCountEstimated());
}

TEST(PlaneIndex, IdentityWithoutVoxelSize)
{
    const PlaneIndex index({}, {}, depthBounds(10));
    EXPECT_FALSE(index.hasVoxelSize());
    EXPECT_FLOAT_EQ(index.anisotropicScale(), 1.0f);
    EXPECT_FLOAT_EQ(index.planeToY(5), 5.0f);
}

TEST(PlaneIndex, UnusableVoxelSizeFallsBackToIdentity)
{
    VoxelConfig zero;
    zero.voxelSize = cv::Vec3f(0.0f, 1.0f, 2.0f);
    EXPECT_FALSE(PlaneIndex({}, zero, depthBounds(10)).hasVoxelSize());

    VoxelConfig nan;
    nan.voxelSize = cv::Vec3f(1.0f, 1.0f, std::numeric_limits<float>::quiet_NaN());
    const PlaneIndex index({}, nan, depthBounds(10));
    EXPECT_FALSE(index.hasVoxelSize());
    EXPECT_FLOAT_EQ(index.planeToY(2), 2.0f);
}

TEST(PlaneIndex, EstimatesPlaneCountWhenMissing)
{
    const PlaneIndex index({}, {}, depthBounds(9));
    EXPECT_TRUE(index.planeCountEstimated());
    EXPECT_EQ(index.totalPlanes(), 4);
}

// --- GridMapping -------------------------------------------------------------

TEST(GridMapping, ExtentsFollowPlaneMapping)
{
    VoxelConfig config;
    config.voxelSize = cv::Vec3f(1.0f, 1.0f, 2.5f);
    config.totalPlanes = 4;

    const NormalizedRegion region = normalizeBounds({10.0f, 30.0f, 5.0f, 15.0f, 8.0f});
    const PlaneIndex planes({}, config, region.bounds);
    const GridMapping mapping(region, planes);

    EXPECT_EQ(mapping.extents().maxX, 20);
    EXPECT_EQ(mapping.extents().maxZ, 10);
    // last plane sits at y = 3 * 2.5 = 7.5
    EXPECT_EQ(mapping.extents().maxY, 8);
}

TEST(GridMapping, SwapsSourceYIntoGridZ)
{
    VoxelConfig config;
    config.voxelSize = cv::Vec3f(1.0f, 1.0f, 3.0f);
    config.totalPlanes = 3;

    const NormalizedRegion region = normalizeBounds({10.0f, 30.0f, 5.0f, 15.0f, 8.0f});
    const PlaneIndex planes({}, config, region.bounds);
    const GridMapping mapping(region, planes);

    const GridPosition p = mapping.pointToGrid(12.7f, 9.2f, 2);
    EXPECT_EQ(p.x, 2);
    EXPECT_FLOAT_EQ(p.y, 6.0f);
    EXPECT_EQ(p.z, 4);

    const GridPosition d = mapping.depthPointToGrid(12.7f, 9.2f, 4.9f);
    EXPECT_EQ(d.x, 2);
    EXPECT_FLOAT_EQ(d.y, 4.0f);
    EXPECT_EQ(d.z, 4);

    const cv::Point2f c = mapping.sampleCenter(0, 0);
    EXPECT_FLOAT_EQ(c.x, 10.5f);
    EXPECT_FLOAT_EQ(c.y, 5.5f);
}

TEST(GridMapping, InGridChecksAllAxes)
{
    VoxelConfig config;
    config.totalPlanes = 2;
    const NormalizedRegion region = normalizeBounds({0.0f, 4.0f, 0.0f, 4.0f, 2.0f});
    const PlaneIndex planes({}, config, region.bounds);
    const GridMapping mapping(region, planes);

    EXPECT_TRUE(mapping.inGrid({0, 0.0f, 0}));
    EXPECT_TRUE(mapping.inGrid({3, 1.0f, 3}));
    EXPECT_FALSE(mapping.inGrid({4, 0.0f, 0}));
    EXPECT_FALSE(mapping.inGrid({0, 0.0f, -1}));
    EXPECT_FALSE(mapping.inGrid({0, 2.0f, 0}));
    EXPECT_TRUE(mapping.inPlaneRange({0, 2.0f, 0}));
}
