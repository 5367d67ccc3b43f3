#pragma once

#include <opencv2/core.hpp>

#include <vector>

namespace stvox {

// Even-odd ray cast toward +x. Edges are half-open in y, so a horizontal
// edge at the test height never counts and shared vertices count once.
// Points exactly on an edge fall on whichever side that rule gives.
bool pointInPolygon(const cv::Point2f& p, const std::vector<cv::Point2f>& polygon);

// Axis-aligned bounds of the vertices; empty rect for an empty polygon
cv::Rect2f polygonBounds(const std::vector<cv::Point2f>& polygon);

// Closed-interval containment, used as a cheap reject before pointInPolygon
inline bool boundsContain(const cv::Rect2f& r, const cv::Point2f& p)
{
    return p.x >= r.x && p.x <= r.x + r.width && p.y >= r.y && p.y <= r.y + r.height;
}

}  // namespace stvox
