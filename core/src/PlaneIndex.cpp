#include "stvox/core/util/PlaneIndex.hpp"
#include "stvox/core/util/Geometry.hpp"
#include "stvox/core/util/Logging.hpp"

#include <algorithm>
#include <cmath>

namespace stvox {

int estimatePlaneCount(const NormalizedBounds& bounds)
{
    const int depthExtent = bounds.depth + 1;
    const int estimate = static_cast<int>(std::floor(depthExtent / kDepthPerPlaneEstimate));
    return std::max(1, estimate);
}

PlaneIndex::PlaneIndex(const std::vector<CellBoundary>& cells,
                       const VoxelConfig& config,
                       const NormalizedBounds& bounds)
{
    for (const auto& cell : cells) {
        auto& entry = _byPlane[cell.planeId];
        entry.boundaries.push_back(&cell);
        entry.bounds.push_back(polygonBounds(cell.vertices));
    }

    if (config.voxelSize) {
        const cv::Vec3f& vs = *config.voxelSize;
        if (std::isfinite(vs[0]) && std::isfinite(vs[2]) && vs[0] > 0.0f && vs[2] > 0.0f) {
            _scale = vs[2] / vs[0];
            _hasVoxelSize = true;
        } else {
            Logger()->warn("Ignoring unusable voxel size [{}, {}, {}], using identity plane scaling",
                           vs[0], vs[1], vs[2]);
        }
    }

    if (config.totalPlanes && *config.totalPlanes >= 0) {
        _totalPlanes = *config.totalPlanes;
    } else {
        _totalPlanes = estimatePlaneCount(bounds);
        _planeCountEstimated = true;
    }
}

const std::vector<const CellBoundary*>& PlaneIndex::boundariesOnPlane(int planeId) const
{
    static const std::vector<const CellBoundary*> empty;
    auto it = _byPlane.find(planeId);
    if (it == _byPlane.end()) {
        return empty;
    }
    return it->second.boundaries;
}

const std::vector<cv::Rect2f>& PlaneIndex::boundsOnPlane(int planeId) const
{
    static const std::vector<cv::Rect2f> empty;
    auto it = _byPlane.find(planeId);
    if (it == _byPlane.end()) {
        return empty;
    }
    return it->second.bounds;
}

}  // namespace stvox
