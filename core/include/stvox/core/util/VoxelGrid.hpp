#pragma once

#include "stvox/core/types/Dataset.hpp"
#include "stvox/core/types/Voxel.hpp"
#include "stvox/core/util/Cancellation.hpp"
#include "stvox/core/util/GridMapping.hpp"

#include <vector>

namespace stvox {

struct VoxelGridResult {
    std::vector<Voxel> background;
    std::vector<Voxel> cellInterior;
    std::vector<Voxel> boundary;

    size_t degenerateBoundaries = 0;
    // voxel centers claimed by more than one polygon on their plane
    size_t ambiguousCells = 0;
    // traced pixels dropped for falling outside the grid
    size_t clippedBoundaryPixels = 0;
};

/**
 * @brief Classifies every (x, plane, z) grid cell and traces cell outlines
 *
 * Each cell is sampled at its center in source space and tested against the
 * boundaries on its plane in input order; the first containing polygon
 * claims it as CellInterior, otherwise it is Background. Boundary outlines
 * are traced per CellBoundary and clipped to the grid.
 *
 * Cost is O(maxX * planes * maxZ * polygons * vertices): meant for
 * user-sized selections, not whole images.
 */
class VoxelGridBuilder
{
public:
    VoxelGridBuilder(const std::vector<CellBoundary>& cells, const GridMapping& mapping);

    // Throws BuildCancelledError when the checkpoint asks to stop
    VoxelGridResult build(const BuildCheckpoint& checkpoint = neverCancel()) const;

    // First boundary on the plane containing the source point, or nullptr
    const CellBoundary* cellAt(const cv::Point2f& sourcePoint, int planeId,
                               bool* ambiguous = nullptr) const;

private:
    void fillPlanes(VoxelGridResult& out, const BuildCheckpoint& checkpoint) const;
    void traceOutlines(VoxelGridResult& out) const;

    const std::vector<CellBoundary>& _cells;
    const GridMapping& _mapping;
};

}  // namespace stvox
