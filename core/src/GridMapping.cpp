#include "stvox/core/util/GridMapping.hpp"

#include <cmath>

namespace stvox {

GridMapping::GridMapping(const NormalizedRegion& region, const PlaneIndex& planes)
    : _bounds(region.bounds), _planes(planes)
{
    _extents.maxX = region.maxX;
    _extents.maxZ = region.maxZ;

    const int planeCount = planes.totalPlanes();
    if (planeCount > 0) {
        _extents.maxY = static_cast<int>(std::floor(planes.planeToY(planeCount - 1))) + 1;
    }
}

GridPosition GridMapping::pointToGrid(float x, float y, int planeId) const
{
    const cv::Point pixel(static_cast<int>(std::floor(x)), static_cast<int>(std::floor(y)));
    return pixelToGrid(pixel, planeId);
}

GridPosition GridMapping::depthPointToGrid(float x, float y, float z) const
{
    return {static_cast<int>(std::floor(x)) - _bounds.left,
            std::floor(z),
            static_cast<int>(std::floor(y)) - _bounds.top};
}

}  // namespace stvox
