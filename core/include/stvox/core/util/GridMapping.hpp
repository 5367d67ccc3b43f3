#pragma once

#include "stvox/core/types/Voxel.hpp"
#include "stvox/core/util/Bounds.hpp"
#include "stvox/core/util/PlaneIndex.hpp"

#include <opencv2/core.hpp>

namespace stvox {

/**
 * @brief The one place where source pixel space is relabeled into grid space
 *
 * Source (x, y, plane/z) maps to grid (x, y, z) as
 *   grid.x = floor(x) - left
 *   grid.y = planeToY(plane)      (or floor(z) for continuous depths)
 *   grid.z = floor(y) - top
 * so the source y axis becomes the grid z axis and depth becomes the
 * vertical slicing axis.
 */
class GridMapping
{
public:
    GridMapping(const NormalizedRegion& region, const PlaneIndex& planes);

    const NormalizedBounds& bounds() const { return _bounds; }
    const GridExtents& extents() const { return _extents; }
    const PlaneIndex& planes() const { return _planes; }

    float planeToY(int planeId) const { return _planes.planeToY(planeId); }

    // Source-space center of the grid cell (gridX, gridZ)
    cv::Point2f sampleCenter(int gridX, int gridZ) const
    {
        return {static_cast<float>(gridX + _bounds.left) + 0.5f,
                static_cast<float>(gridZ + _bounds.top) + 0.5f};
    }

    // Integer source pixel on a plane
    GridPosition pixelToGrid(const cv::Point& pixel, int planeId) const
    {
        return {pixel.x - _bounds.left, planeToY(planeId), pixel.y - _bounds.top};
    }

    // Floating source point on a plane; coordinates are floored first
    GridPosition pointToGrid(float x, float y, int planeId) const;

    // Floating source point with a continuous depth instead of a plane id
    GridPosition depthPointToGrid(float x, float y, float z) const;

    bool inPlaneRange(const GridPosition& p) const
    {
        return p.x >= 0 && p.x < _extents.maxX && p.z >= 0 && p.z < _extents.maxZ;
    }

    bool inGrid(const GridPosition& p) const
    {
        return inPlaneRange(p) && p.y >= 0.0f && p.y < static_cast<float>(_extents.maxY);
    }

private:
    NormalizedBounds _bounds;
    GridExtents _extents;
    const PlaneIndex& _planes;
};

}  // namespace stvox
