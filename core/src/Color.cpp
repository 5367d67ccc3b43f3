#include "stvox/core/util/Color.hpp"

#include <cctype>
#include <cstdio>

namespace stvox {

static int hexDigit(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    return -1;
}

std::optional<cv::Vec3b> parseHexColor(const std::string& hex)
{
    size_t begin = hex.find_first_not_of(" \t");
    size_t end = hex.find_last_not_of(" \t");
    if (begin == std::string::npos) {
        return std::nullopt;
    }
    std::string s = hex.substr(begin, end - begin + 1);
    if (!s.empty() && s[0] == '#') {
        s.erase(0, 1);
    }

    if (s.size() == 3) {
        s = {s[0], s[0], s[1], s[1], s[2], s[2]};
    }
    if (s.size() != 6) {
        return std::nullopt;
    }

    cv::Vec3b rgb;
    for (int c = 0; c < 3; ++c) {
        int hi = hexDigit(s[2 * c]);
        int lo = hexDigit(s[2 * c + 1]);
        if (hi < 0 || lo < 0) {
            return std::nullopt;
        }
        rgb[c] = static_cast<uint8_t>(hi * 16 + lo);
    }
    return rgb;
}

std::string toHexColor(const cv::Vec3b& rgb)
{
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", rgb[0], rgb[1], rgb[2]);
    return buf;
}

cv::Vec3b GeneColorTable::colorFor(const std::string& gene) const
{
    auto it = _colors.find(gene);
    if (it == _colors.end()) {
        return _fallback;
    }
    return it->second;
}

}  // namespace stvox
