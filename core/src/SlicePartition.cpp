#include "stvox/core/util/SlicePartition.hpp"

namespace stvox {

namespace {

template<typename T, typename YFn, typename KeepFn>
SolidGhost<T> split(const std::vector<T>& items, float sliceY, YFn yOf, KeepFn keep)
{
    SolidGhost<T> out;
    for (const auto& item : items) {
        if (!keep(item))
            continue;
        if (yOf(item) <= sliceY)
            out.solid.push_back(item);
        else
            out.ghost.push_back(item);
    }
    return out;
}

SolidGhost<Voxel> splitVoxels(const std::vector<Voxel>& voxels, float sliceY)
{
    return split(voxels, sliceY,
                 [](const Voxel& v) { return v.gridY; },
                 [](const Voxel&) { return true; });
}

}  // namespace

float sliceYForPlane(const VoxelScene& scene, int planeId)
{
    return static_cast<float>(planeId) * scene.anisotropicScale;
}

float fullStackSliceY(const VoxelScene& scene)
{
    return static_cast<float>(scene.extents.maxY);
}

SlicePartition partitionBySlice(const VoxelScene& scene, float sliceY, const GeneSelection* selection)
{
    auto selected = [selection](const std::string& gene) {
        return !selection || selection->contains(gene);
    };

    SlicePartition p;
    p.sliceY = sliceY;
    p.background = splitVoxels(scene.background, sliceY);
    p.cellInterior = splitVoxels(scene.cellInterior, sliceY);
    p.boundary = splitVoxels(scene.boundary, sliceY);
    p.genes = split(scene.genes, sliceY,
                    [](const GeneMarker& m) { return m.voxel.gridY; },
                    [&](const GeneMarker& m) { return selected(m.gene); });
    p.links = split(scene.links, sliceY,
                    [](const LinkLine& l) { return l.source[1]; },
                    [&](const LinkLine& l) { return selected(l.gene); });
    return p;
}

std::vector<RenderLayer> planLayers(const SlicePartition& partition, const DisplayOptions& options)
{
    std::vector<RenderLayer> layers;

    auto add = [&layers](std::string id, LayerKind kind, VoxelCategory category, bool ghost,
                         bool visible, bool pickable, float opacity, size_t count) {
        if (count == 0)
            return;
        RenderLayer layer;
        layer.id = std::move(id);
        layer.kind = kind;
        layer.category = category;
        layer.ghost = ghost;
        layer.visible = visible;
        layer.pickable = pickable;
        layer.opacity = opacity;
        layer.count = count;
        layers.push_back(std::move(layer));
    };

    const bool ghosts = options.showGhosting;

    add("background-solid", LayerKind::Voxels, VoxelCategory::Background, false,
        options.showBackground, false, 1.0f, partition.background.solid.size());
    add("cells-solid", LayerKind::Voxels, VoxelCategory::CellInterior, false,
        options.showCellInterior, false, 1.0f, partition.cellInterior.solid.size());
    add("boundary-solid", LayerKind::Voxels, VoxelCategory::BoundaryOutline, false,
        options.showBoundary, false, 1.0f, partition.boundary.solid.size());
    add("genes-solid", LayerKind::Voxels, VoxelCategory::GeneMarker, false,
        true, true, 1.0f, partition.genes.solid.size());

    add("background-ghost", LayerKind::Voxels, VoxelCategory::Background, true,
        options.showBackground && ghosts, false, kBackgroundGhostOpacity, partition.background.ghost.size());
    add("cells-ghost", LayerKind::Voxels, VoxelCategory::CellInterior, true,
        options.showCellInterior && ghosts, false, kBackgroundGhostOpacity, partition.cellInterior.ghost.size());
    add("boundary-ghost", LayerKind::Voxels, VoxelCategory::BoundaryOutline, true,
        options.showBoundary && ghosts, false, kBackgroundGhostOpacity, partition.boundary.ghost.size());
    add("genes-ghost", LayerKind::Voxels, VoxelCategory::GeneMarker, true,
        ghosts, true, kGeneGhostOpacity, partition.genes.ghost.size());

    add("links-solid", LayerKind::Lines, VoxelCategory::GeneMarker, false,
        options.showLinks, false, 1.0f, partition.links.solid.size());
    add("links-ghost", LayerKind::Lines, VoxelCategory::GeneMarker, true,
        options.showLinks && ghosts, false, kLinkGhostOpacity, partition.links.ghost.size());

    return layers;
}

}  // namespace stvox
