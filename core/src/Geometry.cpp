#include "stvox/core/util/Geometry.hpp"

#include <algorithm>

namespace stvox {

bool pointInPolygon(const cv::Point2f& p, const std::vector<cv::Point2f>& polygon)
{
    const size_t n = polygon.size();
    if (n < 3) {
        return false;
    }

    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const cv::Point2f& a = polygon[i];
        const cv::Point2f& b = polygon[j];

        // (a.y > p.y) != (b.y > p.y) also guarantees b.y != a.y below
        if ((a.y > p.y) != (b.y > p.y)) {
            const float xCross = (b.x - a.x) * (p.y - a.y) / (b.y - a.y) + a.x;
            if (p.x < xCross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

cv::Rect2f polygonBounds(const std::vector<cv::Point2f>& polygon)
{
    if (polygon.empty()) {
        return {};
    }

    float minX = polygon[0].x, maxX = polygon[0].x;
    float minY = polygon[0].y, maxY = polygon[0].y;
    for (const auto& v : polygon) {
        minX = std::min(minX, v.x);
        maxX = std::max(maxX, v.x);
        minY = std::min(minY, v.y);
        maxY = std::max(maxY, v.y);
    }
    return {minX, minY, maxX - minX, maxY - minY};
}

}  // namespace stvox
