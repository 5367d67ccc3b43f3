#pragma once

#include <opencv2/core.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace stvox {

enum class VoxelCategory : uint8_t {
    Background = 0,
    GeneMarker = 1,
    CellInterior = 2,
    BoundaryOutline = 3
};

const char* categoryName(VoxelCategory category);

// Integer pixel-aligned bounds whose voxel centers lie inside the float selection
struct NormalizedBounds {
    int left = 0;
    int right = 0;
    int top = 0;
    int bottom = 0;
    int depth = 0;

    bool operator==(const NormalizedBounds&) const = default;
};

struct GridExtents {
    int maxX = 0;
    int maxY = 0;
    int maxZ = 0;

    bool operator==(const GridExtents&) const = default;
};

// Render-space position: x across, y the slicing axis (planes), z front-to-back
struct GridPosition {
    int x = 0;
    float y = 0.0f;
    int z = 0;

    bool operator==(const GridPosition&) const = default;
};

struct Voxel {
    int gridX = 0;
    float gridY = 0.0f;
    int gridZ = 0;
    VoxelCategory category = VoxelCategory::Background;
    cv::Vec3b color{0, 0, 0};
    // spot index for gene markers, cell id for cell voxels, 0 for background
    int64_t sourceId = 0;
    int planeId = 0;

    bool operator==(const Voxel&) const = default;
};

struct GeneMarker {
    Voxel voxel;
    std::string gene;
    std::string spotId;
    std::optional<int> parentCellId;
    std::optional<float> parentX;
    std::optional<float> parentY;
    std::optional<float> parentZ;

    bool operator==(const GeneMarker&) const = default;
};

// Connects a gene marker to its parent cell position in grid space
struct LinkLine {
    cv::Vec3f source{0, 0, 0};
    cv::Vec3f target{0, 0, 0};
    cv::Vec4b color{0, 0, 0, 0};
    std::string gene;
    std::string spotId;
    int parentCellId = 0;
    size_t markerIndex = 0;

    bool operator==(const LinkLine&) const = default;
};

// Non-fatal conditions met during one build
struct BuildDiagnostics {
    bool missingVoxelConfig = false;
    bool estimatedPlaneCount = false;
    size_t degenerateBoundaries = 0;
    size_t missingParentLinks = 0;
    size_t backgroundParentSpots = 0;
    size_t ambiguousCells = 0;
    size_t clippedBoundaryPixels = 0;
};

struct VoxelScene {
    NormalizedBounds bounds;
    GridExtents extents;
    int totalPlanes = 0;
    float anisotropicScale = 1.0f;

    std::vector<Voxel> background;
    std::vector<Voxel> cellInterior;
    std::vector<Voxel> boundary;
    std::vector<GeneMarker> genes;
    std::vector<LinkLine> links;

    BuildDiagnostics diagnostics;

    bool empty() const
    {
        return background.empty() && cellInterior.empty() && boundary.empty() &&
               genes.empty() && links.empty();
    }
};

}  // namespace stvox
