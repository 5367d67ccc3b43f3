#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace stvox {

// Selection rectangle in source pixel space; depth spans the whole stack
struct SelectionBounds {
    float left = 0.0f;
    float right = 0.0f;
    float top = 0.0f;
    float bottom = 0.0f;
    float depth = 0.0f;
};

// One detected transcript
struct GeneSpot {
    std::string gene;
    float x = 0.0f;
    float y = 0.0f;
    float z = 0.0f;
    int planeId = 0;
    std::string spotId;

    // 0 is the background cell
    std::optional<int> parentCellId;
    std::optional<float> parentX;
    std::optional<float> parentY;
    std::optional<float> parentZ;

    bool hasCompleteParent() const
    {
        return parentCellId && *parentCellId != 0 && parentX && parentY && parentZ;
    }
};

// Footprint of one cell on one plane, already clipped to the selection
struct CellBoundary {
    int cellId = 0;
    int planeId = 0;
    std::vector<cv::Point2f> vertices;
    std::optional<cv::Vec3b> fillColor;
};

// One selection snapshot; immutable once handed to the pipeline
struct Dataset {
    SelectionBounds bounds;
    std::vector<GeneSpot> spots;
    std::vector<CellBoundary> cells;
};

}  // namespace stvox
