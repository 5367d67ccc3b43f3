#pragma once

#include "stvox/core/types/Dataset.hpp"
#include "stvox/core/types/Voxel.hpp"
#include "stvox/core/types/VoxelConfig.hpp"
#include "stvox/core/util/Cancellation.hpp"
#include "stvox/core/util/Color.hpp"

namespace stvox {

/**
 * @brief Runs the whole voxelization for one dataset snapshot
 *
 * normalize bounds -> index planes -> classify grid cells -> trace outlines
 * -> place gene markers -> link markers to parent cells.
 *
 * Pure with respect to its inputs: the same snapshot always yields the same
 * scene, in the same order.
 *
 * @throws EmptyRegionError when the selection holds no voxel center
 * @throws BuildCancelledError when the checkpoint asks to stop
 */
VoxelScene buildVoxelScene(const Dataset& dataset,
                           const VoxelConfig& config,
                           const GeneColorTable& colors,
                           const BuildCheckpoint& checkpoint = neverCancel());

}  // namespace stvox
