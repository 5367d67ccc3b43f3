#include "stvox/core/types/Voxel.hpp"

namespace stvox {

const char* categoryName(VoxelCategory category)
{
    switch (category) {
        case VoxelCategory::Background:      return "background";
        case VoxelCategory::GeneMarker:      return "gene";
        case VoxelCategory::CellInterior:    return "cell";
        case VoxelCategory::BoundaryOutline: return "boundary";
    }
    return "unknown";
}

}  // namespace stvox
