#include "stvox/core/util/Bounds.hpp"

#include <cmath>

namespace stvox {

std::pair<int, int> centerAlignedRange(float lo, float hi)
{
    // i + 0.5 >= lo  =>  i >= lo - 0.5
    // i + 0.5 <= hi  =>  i <= hi - 0.5
    const int first = static_cast<int>(std::ceil(static_cast<double>(lo) - 0.5));
    const int last = static_cast<int>(std::floor(static_cast<double>(hi) - 0.5));
    return {first, last};
}

NormalizedRegion normalizeBounds(const SelectionBounds& b)
{
    if (!std::isfinite(b.left) || !std::isfinite(b.right) ||
        !std::isfinite(b.top) || !std::isfinite(b.bottom) || !std::isfinite(b.depth)) {
        throw EmptyRegionError("selection bounds are not finite");
    }

    auto [left, right] = centerAlignedRange(b.left, b.right);
    auto [top, bottom] = centerAlignedRange(b.top, b.bottom);

    if (right < left) {
        throw EmptyRegionError("selection holds no pixel center along x: [" +
                               std::to_string(b.left) + ", " + std::to_string(b.right) + "]");
    }
    if (bottom < top) {
        throw EmptyRegionError("selection holds no pixel center along y: [" +
                               std::to_string(b.top) + ", " + std::to_string(b.bottom) + "]");
    }

    NormalizedRegion region;
    region.bounds.left = left;
    region.bounds.right = right;
    region.bounds.top = top;
    region.bounds.bottom = bottom;
    region.bounds.depth = static_cast<int>(std::floor(b.depth));

    // +1 keeps the last pixel
    region.maxX = right - left + 1;
    region.maxZ = bottom - top + 1;
    return region;
}

}  // namespace stvox
