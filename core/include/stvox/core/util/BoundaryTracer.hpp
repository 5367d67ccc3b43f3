#pragma once

#include <opencv2/core.hpp>

#include <vector>

namespace stvox {

// Integer Bresenham from a to b, both endpoints included
std::vector<cv::Point> bresenhamLine(const cv::Point& a, const cv::Point& b);

/**
 * @brief Rasterize a polygon outline into unique pixels
 *
 * Vertices are floored to pixel coordinates, consecutive vertices are joined
 * with bresenhamLine(), and for more than two vertices the outline is closed
 * back to the first vertex unless it already ends there. Pixels shared by
 * adjacent segments appear once, in first-visit order.
 *
 * @return empty for fewer than two vertices
 */
std::vector<cv::Point> traceBoundaryPixels(const std::vector<cv::Point2f>& vertices);

}  // namespace stvox
