#pragma once

#include "stvox/core/types/Dataset.hpp"
#include "stvox/core/types/Voxel.hpp"

#include <stdexcept>
#include <string>
#include <utility>

namespace stvox {

// The selection holds no voxel center; callers render nothing
class EmptyRegionError : public std::runtime_error
{
public:
    explicit EmptyRegionError(const std::string& what) : std::runtime_error(what) {}
};

struct NormalizedRegion {
    NormalizedBounds bounds;
    int maxX = 0;
    int maxZ = 0;
};

// Smallest and largest integer i whose center i+0.5 lies in [lo, hi].
// The range is empty when first > second.
std::pair<int, int> centerAlignedRange(float lo, float hi);

// Center-aligned integer grid for a float selection.
// Throws EmptyRegionError for zero-area, inverted or non-finite selections.
NormalizedRegion normalizeBounds(const SelectionBounds& bounds);

}  // namespace stvox
