#pragma once

#include "stvox/core/types/Voxel.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace stvox {

// Genes currently shown; markers and lines of other genes are dropped
using GeneSelection = std::unordered_set<std::string>;

template<typename T>
struct SolidGhost {
    std::vector<T> solid;   // gridY <= sliceY
    std::vector<T> ghost;   // gridY >  sliceY
};

struct SlicePartition {
    float sliceY = 0.0f;
    SolidGhost<Voxel> background;
    SolidGhost<Voxel> cellInterior;
    SolidGhost<Voxel> boundary;
    SolidGhost<GeneMarker> genes;
    SolidGhost<LinkLine> links;
};

// Render-y of a plane, the threshold for partitionBySlice
float sliceYForPlane(const VoxelScene& scene, int planeId);

// Threshold that leaves every voxel solid
float fullStackSliceY(const VoxelScene& scene);

// Splits every category at sliceY. Links follow their source spot.
// One linear pass per category, no state kept between calls.
SlicePartition partitionBySlice(const VoxelScene& scene, float sliceY,
                                const GeneSelection* selection = nullptr);

struct DisplayOptions {
    bool showBackground = true;
    bool showCellInterior = false;
    bool showBoundary = false;
    bool showGhosting = true;
    bool showLinks = true;
};

constexpr float kBackgroundGhostOpacity = 0.005f;
constexpr float kGeneGhostOpacity = 0.01f;
constexpr float kLinkGhostOpacity = 0.001f;

enum class LayerKind {
    Voxels,
    Lines
};

// One draw batch handed to the renderer
struct RenderLayer {
    std::string id;
    LayerKind kind = LayerKind::Voxels;
    VoxelCategory category = VoxelCategory::Background;
    bool ghost = false;
    bool visible = true;
    bool pickable = false;
    float opacity = 1.0f;
    size_t count = 0;
};

// Solid layers first, then ghost layers, then links; empty layers are left out
std::vector<RenderLayer> planLayers(const SlicePartition& partition, const DisplayOptions& options);

}  // namespace stvox
