#include "stvox/core/util/BoundaryTracer.hpp"
#include "stvox/core/util/HashFunctions.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <unordered_set>

namespace stvox {

std::vector<cv::Point> bresenhamLine(const cv::Point& a, const cv::Point& b)
{
    const int dx = std::abs(b.x - a.x);
    const int dy = std::abs(b.y - a.y);
    const int sx = a.x < b.x ? 1 : -1;
    const int sy = a.y < b.y ? 1 : -1;
    int err = dx - dy;

    std::vector<cv::Point> pixels;
    pixels.reserve(std::max(dx, dy) + 1);

    int x = a.x;
    int y = a.y;
    while (true) {
        pixels.emplace_back(x, y);
        if (x == b.x && y == b.y) {
            break;
        }
        const int e2 = 2 * err;
        if (e2 > -dy) {
            err -= dy;
            x += sx;
        }
        if (e2 < dx) {
            err += dx;
            y += sy;
        }
    }
    return pixels;
}

std::vector<cv::Point> traceBoundaryPixels(const std::vector<cv::Point2f>& vertices)
{
    if (vertices.size() < 2) {
        return {};
    }

    std::vector<cv::Point> ints;
    ints.reserve(vertices.size());
    for (const auto& v : vertices) {
        ints.emplace_back(static_cast<int>(std::floor(v.x)), static_cast<int>(std::floor(v.y)));
    }

    std::vector<cv::Point> result;
    std::unordered_set<cv::Point, point2i_hash> seen;

    auto addSegment = [&](const cv::Point& a, const cv::Point& b) {
        for (const auto& p : bresenhamLine(a, b)) {
            if (seen.insert(p).second) {
                result.push_back(p);
            }
        }
    };

    for (size_t i = 0; i + 1 < ints.size(); ++i) {
        addSegment(ints[i], ints[i + 1]);
    }

    if (ints.size() > 2 && ints.front() != ints.back()) {
        addSegment(ints.back(), ints.front());
    }

    return result;
}

}  // namespace stvox
