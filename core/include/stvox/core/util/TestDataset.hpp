#pragma once

#include "stvox/core/types/Dataset.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace stvox {

struct TestDatasetOptions {
    SelectionBounds bounds{0.0f, 1000.0f, 0.0f, 800.0f, 120.0f};
    int planes = 6;
    int cells = 12;
    // average; each plane varies by up to +-5
    int spotsPerPlane = 25;
    // share of spots that carry no parent cell
    float orphanSpotRatio = 0.3f;
    bool colorCells = true;
    std::vector<std::string> genes{"ACTB", "GAPDH", "CD68", "KRT19", "DAPI", "PECAM1", "VIM", "PTPRC"};
};

/**
 * @brief Synthetic selection export for demos and tests
 *
 * Spots are scattered over every plane with a continuous depth near the
 * plane's share of the stack. Each cell is an irregular 6 to 11 sided
 * polygon repeated on 2 to 5 consecutive planes with small drift, clipped
 * to the bounds and explicitly closed. Deterministic for a given seed.
 */
Dataset generateTestDataset(uint64_t seed, const TestDatasetOptions& options = {});

}  // namespace stvox
