#pragma once

#include <opencv2/core.hpp>

#include <optional>

namespace stvox {

// Acquisition metadata supplied by the host viewer. Both fields may be absent.
struct VoxelConfig {
    // physical voxel pitch as [x, y, z]
    std::optional<cv::Vec3f> voxelSize;
    std::optional<int> totalPlanes;
};

}  // namespace stvox
