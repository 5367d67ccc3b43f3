#pragma once

#include <opencv2/core.hpp>

#include <cstddef>
#include <functional>

namespace stvox {

struct point2i_hash {
    size_t operator()(const cv::Point& p) const noexcept
    {
        size_t hash1 = std::hash<int>{}(p.x);
        size_t hash2 = std::hash<int>{}(p.y);

        //magic numbers from boost
        return hash1 ^ (hash2 + 0x9e3779b9 + (hash1 << 6) + (hash1 >> 2));
    }
};

}  // namespace stvox
