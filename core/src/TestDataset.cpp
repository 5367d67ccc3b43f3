#include "stvox/core/util/TestDataset.hpp"
#include "stvox/core/util/Random.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>
#include <numbers>

namespace stvox {

namespace {

const cv::Vec3b kCellPalette[] = {
    {228, 26, 28}, {55, 126, 184}, {77, 175, 74}, {152, 78, 163},
    {255, 127, 0}, {166, 86, 40}, {247, 129, 191}, {153, 153, 153}
};

std::string spotName(int planeId, int index)
{
    char buf[48];
    std::snprintf(buf, sizeof(buf), "plane%d_spot_%03d", planeId, index);
    return buf;
}

}  // namespace

Dataset generateTestDataset(uint64_t seed, const TestDatasetOptions& options)
{
    Random rng(seed);
    const SelectionBounds& b = options.bounds;
    const int numPlanes = std::max(1, options.planes);

    Dataset d;
    d.bounds = b;

    if (!options.genes.empty()) {
        for (int planeId = 0; planeId < numPlanes; ++planeId) {
            const int count = std::max(0, options.spotsPerPlane + rng.randInt(-5, 5));
            const float planeDepth = numPlanes > 1
                ? static_cast<float>(planeId) / static_cast<float>(numPlanes - 1) * b.depth
                : 0.0f;

            for (int i = 0; i < count; ++i) {
                GeneSpot s;
                s.x = rng.randFloat(b.left, b.right);
                s.y = rng.randFloat(b.top, b.bottom);
                s.z = planeDepth + rng.randFloat(-4.0f, 4.0f);
                s.gene = options.genes[rng.randInt(static_cast<int>(options.genes.size()))];
                s.planeId = planeId;
                s.spotId = spotName(planeId, i);

                if (!rng.chance(options.orphanSpotRatio)) {
                    s.parentCellId = rng.randInt(1, 51);
                    s.parentX = s.x + rng.randFloat(-10.0f, 10.0f);
                    s.parentY = s.y + rng.randFloat(-10.0f, 10.0f);
                    s.parentZ = s.z + rng.randFloat(-2.5f, 2.5f);
                }
                d.spots.push_back(std::move(s));
            }
        }
    }

    for (int cellId = 1; cellId <= options.cells; ++cellId) {
        const float baseX = rng.randFloat(b.left, b.right);
        const float baseY = rng.randFloat(b.top, b.bottom);
        const float baseRadius = rng.randFloat(60.0f, 140.0f);

        const int span = std::min(numPlanes, rng.randInt(2, 6));
        const int startPlane = rng.randInt(numPlanes - span + 1);

        for (int p = 0; p < span; ++p) {
            const float cx = baseX + rng.randFloat(-5.0f, 5.0f);
            const float cy = baseY + rng.randFloat(-5.0f, 5.0f);
            const float radius = baseRadius * rng.randFloat(0.8f, 1.2f);
            const int numVertices = rng.randInt(6, 12);

            CellBoundary cell;
            cell.cellId = cellId;
            cell.planeId = startPlane + p;
            for (int j = 0; j < numVertices; ++j) {
                const float angle = static_cast<float>(j) / static_cast<float>(numVertices) * 2.0f * std::numbers::pi_v<float>;
                const float r = radius * rng.randFloat(0.7f, 1.3f);
                const float x = std::clamp(cx + r * std::cos(angle), b.left, b.right);
                const float y = std::clamp(cy + r * std::sin(angle), b.top, b.bottom);
                cell.vertices.emplace_back(x, y);
            }
            cell.vertices.push_back(cell.vertices.front());

            if (options.colorCells) {
                cell.fillColor = kCellPalette[(cellId - 1) % std::size(kCellPalette)];
            }
            d.cells.push_back(std::move(cell));
        }
    }
    return d;
}

}  // namespace stvox
