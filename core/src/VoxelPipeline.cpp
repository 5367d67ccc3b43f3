#include "stvox/core/pipeline/VoxelPipeline.hpp"
#include "stvox/core/util/Bounds.hpp"
#include "stvox/core/util/GeneSpots.hpp"
#include "stvox/core/util/GridMapping.hpp"
#include "stvox/core/util/Logging.hpp"
#include "stvox/core/util/PlaneIndex.hpp"
#include "stvox/core/util/VoxelGrid.hpp"

namespace stvox {

VoxelScene buildVoxelScene(const Dataset& dataset,
                           const VoxelConfig& config,
                           const GeneColorTable& colors,
                           const BuildCheckpoint& checkpoint)
{
    ScopedTimer total("voxel scene build");

    const NormalizedRegion region = normalizeBounds(dataset.bounds);
    const PlaneIndex planes(dataset.cells, config, region.bounds);
    const GridMapping mapping(region, planes);

    VoxelGridResult grid = VoxelGridBuilder(dataset.cells, mapping).build(checkpoint);

    if (!checkpoint()) {
        throw BuildCancelledError("voxel scene build abandoned before gene mapping");
    }

    GeneSpotMapper mapper(mapping, colors);

    VoxelScene scene;
    scene.bounds = region.bounds;
    scene.extents = mapping.extents();
    scene.totalPlanes = planes.totalPlanes();
    scene.anisotropicScale = planes.anisotropicScale();
    scene.genes = mapper.mapSpots(dataset.spots);
    scene.links = mapper.linkLines(scene.genes);
    scene.background = std::move(grid.background);
    scene.cellInterior = std::move(grid.cellInterior);
    scene.boundary = std::move(grid.boundary);

    BuildDiagnostics& diag = scene.diagnostics;
    diag.missingVoxelConfig = !planes.hasVoxelSize();
    diag.estimatedPlaneCount = planes.planeCountEstimated();
    diag.degenerateBoundaries = grid.degenerateBoundaries;
    diag.ambiguousCells = grid.ambiguousCells;
    diag.clippedBoundaryPixels = grid.clippedBoundaryPixels;
    diag.missingParentLinks = mapper.missingParentLinks();
    diag.backgroundParentSpots = mapper.backgroundParentSpots();

    if (!config.voxelSize) {
        Logger()->warn("No voxel size configured; planes are spaced one voxel apart");
    }
    if (diag.estimatedPlaneCount) {
        Logger()->info("No plane count configured; estimated {} planes from depth {}",
                       scene.totalPlanes, scene.bounds.depth);
    }
    if (diag.degenerateBoundaries > 0) {
        Logger()->debug("{} cell boundaries had fewer than 2 vertices", diag.degenerateBoundaries);
    }
    if (diag.missingParentLinks > 0) {
        Logger()->debug("{} spots lack complete parent cell data; no link lines drawn for them",
                        diag.missingParentLinks);
    }

    Logger()->info("Voxel scene {}x{}x{} over {} planes (scale {}): {} background, {} interior, "
                   "{} outline, {} gene markers, {} links in {} ms",
                   scene.extents.maxX, scene.extents.maxY, scene.extents.maxZ,
                   scene.totalPlanes, scene.anisotropicScale,
                   scene.background.size(), scene.cellInterior.size(), scene.boundary.size(),
                   scene.genes.size(), scene.links.size(), total.milliseconds());
    return scene;
}

}  // namespace stvox
