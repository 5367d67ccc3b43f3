#include "stvox/core/util/VoxelGrid.hpp"
#include "stvox/core/util/BoundaryTracer.hpp"
#include "stvox/core/util/Color.hpp"
#include "stvox/core/util/Geometry.hpp"
#include "stvox/core/util/Logging.hpp"

#include <omp.h>

#include <atomic>

namespace stvox {

namespace {

struct ColumnVoxels {
    std::vector<Voxel> background;
    std::vector<Voxel> cellInterior;
};

}  // namespace

VoxelGridBuilder::VoxelGridBuilder(const std::vector<CellBoundary>& cells, const GridMapping& mapping)
    : _cells(cells), _mapping(mapping)
{
}

const CellBoundary* VoxelGridBuilder::cellAt(const cv::Point2f& sourcePoint, int planeId,
                                             bool* ambiguous) const
{
    const auto& boundaries = _mapping.planes().boundariesOnPlane(planeId);
    const auto& rects = _mapping.planes().boundsOnPlane(planeId);

    const CellBoundary* found = nullptr;
    for (size_t i = 0; i < boundaries.size(); ++i) {
        if (!boundsContain(rects[i], sourcePoint))
            continue;
        if (!pointInPolygon(sourcePoint, boundaries[i]->vertices))
            continue;

        if (!found) {
            found = boundaries[i];
            if (!ambiguous)
                return found;
        } else {
            *ambiguous = true;
            return found;
        }
    }
    return found;
}

void VoxelGridBuilder::fillPlanes(VoxelGridResult& out, const BuildCheckpoint& checkpoint) const
{
    const GridExtents& ext = _mapping.extents();
    const int totalPlanes = _mapping.planes().totalPlanes();

    std::vector<ColumnVoxels> columns(ext.maxX);
    std::atomic<bool> abandoned{false};
    size_t ambiguousCount = 0;

    #pragma omp parallel for schedule(dynamic) reduction(+:ambiguousCount)
    for (int x = 0; x < ext.maxX; ++x) {
        if (abandoned.load(std::memory_order_relaxed))
            continue;
        if (!checkpoint()) {
            abandoned.store(true, std::memory_order_relaxed);
            continue;
        }

        ColumnVoxels& column = columns[x];
        for (int planeId = 0; planeId < totalPlanes; ++planeId) {
            const float y = _mapping.planeToY(planeId);
            for (int z = 0; z < ext.maxZ; ++z) {
                bool ambiguous = false;
                const CellBoundary* cell = cellAt(_mapping.sampleCenter(x, z), planeId, &ambiguous);
                if (ambiguous)
                    ++ambiguousCount;

                Voxel v;
                v.gridX = x;
                v.gridY = y;
                v.gridZ = z;
                v.planeId = planeId;

                if (cell) {
                    v.category = VoxelCategory::CellInterior;
                    v.color = cell->fillColor.value_or(kNeutralCellColor);
                    v.sourceId = cell->cellId;
                    column.cellInterior.push_back(v);
                } else {
                    v.category = VoxelCategory::Background;
                    v.sourceId = 0;
                    column.background.push_back(v);
                }
            }
        }
    }

    if (abandoned.load()) {
        throw BuildCancelledError("voxel grid build abandoned");
    }

    size_t nBackground = 0, nInterior = 0;
    for (const auto& column : columns) {
        nBackground += column.background.size();
        nInterior += column.cellInterior.size();
    }
    out.background.reserve(nBackground);
    out.cellInterior.reserve(nInterior);
    for (auto& column : columns) {
        out.background.insert(out.background.end(), column.background.begin(), column.background.end());
        out.cellInterior.insert(out.cellInterior.end(), column.cellInterior.begin(), column.cellInterior.end());
    }
    out.ambiguousCells = ambiguousCount;
}

void VoxelGridBuilder::traceOutlines(VoxelGridResult& out) const
{
    for (const auto& cell : _cells) {
        if (cell.vertices.size() < 2) {
            ++out.degenerateBoundaries;
            Logger()->debug("Skipping boundary of cell {} on plane {}: {} vertices",
                            cell.cellId, cell.planeId, cell.vertices.size());
            continue;
        }

        const cv::Vec3b color = cell.fillColor.value_or(kNeutralCellColor);
        for (const auto& pixel : traceBoundaryPixels(cell.vertices)) {
            const GridPosition p = _mapping.pixelToGrid(pixel, cell.planeId);
            if (!_mapping.inGrid(p)) {
                ++out.clippedBoundaryPixels;
                continue;
            }

            Voxel v;
            v.gridX = p.x;
            v.gridY = p.y;
            v.gridZ = p.z;
            v.category = VoxelCategory::BoundaryOutline;
            v.color = color;
            v.sourceId = cell.cellId;
            v.planeId = cell.planeId;
            out.boundary.push_back(v);
        }
    }
}

VoxelGridResult VoxelGridBuilder::build(const BuildCheckpoint& checkpoint) const
{
    VoxelGridResult out;
    {
        ScopedTimer timer("voxel grid fill");
        fillPlanes(out, checkpoint);
    }
    if (!checkpoint()) {
        throw BuildCancelledError("voxel grid build abandoned before outline tracing");
    }
    traceOutlines(out);

    const GridExtents& ext = _mapping.extents();
    Logger()->debug("Voxel grid {}x{}x{}: {} background, {} interior, {} outline voxels",
                    ext.maxX, ext.maxY, ext.maxZ,
                    out.background.size(), out.cellInterior.size(), out.boundary.size());
    if (out.ambiguousCells > 0) {
        Logger()->debug("{} voxel centers lie in more than one cell polygon; first match kept",
                        out.ambiguousCells);
    }
    return out;
}

}  // namespace stvox
