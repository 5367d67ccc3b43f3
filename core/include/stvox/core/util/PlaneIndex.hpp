#pragma once

#include "stvox/core/types/Dataset.hpp"
#include "stvox/core/types/Voxel.hpp"
#include "stvox/core/types/VoxelConfig.hpp"

#include <opencv2/core.hpp>

#include <unordered_map>
#include <vector>

namespace stvox {

// Planes per pixel of stack depth when no plane count is configured
constexpr float kDepthPerPlaneEstimate = 2.5f;

// floor((depth + 1) / 2.5), at least one plane
int estimatePlaneCount(const NormalizedBounds& bounds);

/**
 * @brief Cell boundaries grouped by plane, plus the plane -> render-y mapping
 *
 * Built once per pipeline run. Holds pointers into the boundary list it was
 * constructed from, which must outlive the index.
 */
class PlaneIndex
{
public:
    PlaneIndex(const std::vector<CellBoundary>& cells,
               const VoxelConfig& config,
               const NormalizedBounds& bounds);

    PlaneIndex(const PlaneIndex&) = delete;
    PlaneIndex& operator=(const PlaneIndex&) = delete;

    // Boundaries on one plane in input order; empty for planes without cells
    const std::vector<const CellBoundary*>& boundariesOnPlane(int planeId) const;

    // Axis-aligned bounds of a boundary's vertices, same order as boundariesOnPlane
    const std::vector<cv::Rect2f>& boundsOnPlane(int planeId) const;

    // planeId * (zVoxel / xVoxel), or planeId when voxel size is unknown
    float planeToY(int planeId) const { return static_cast<float>(planeId) * _scale; }

    float anisotropicScale() const { return _scale; }
    bool hasVoxelSize() const { return _hasVoxelSize; }
    int totalPlanes() const { return _totalPlanes; }
    bool planeCountEstimated() const { return _planeCountEstimated; }
    size_t planeCount() const { return _byPlane.size(); }

private:
    struct PlaneEntry {
        std::vector<const CellBoundary*> boundaries;
        std::vector<cv::Rect2f> bounds;
    };

    std::unordered_map<int, PlaneEntry> _byPlane;
    float _scale = 1.0f;
    bool _hasVoxelSize = false;
    int _totalPlanes = 0;
    bool _planeCountEstimated = false;
};

}  // namespace stvox
