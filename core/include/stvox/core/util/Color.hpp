#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace stvox {

// Cells without a fill color
inline const cv::Vec3b kNeutralCellColor{200, 200, 200};
// Genes missing from the color table
inline const cv::Vec3b kFallbackGeneColor{0, 0, 255};
// Alpha applied to a gene color for its link lines
constexpr uint8_t kLinkLineAlpha = 128;

// Accepts "#rrggbb", "rrggbb" and the short "#rgb" form. Colors are RGB order.
std::optional<cv::Vec3b> parseHexColor(const std::string& hex);
std::string toHexColor(const cv::Vec3b& rgb);

// gene name -> display color, with a fixed fallback for unknown genes
class GeneColorTable
{
public:
    GeneColorTable() = default;
    explicit GeneColorTable(cv::Vec3b fallback) : _fallback(fallback) {}

    void set(const std::string& gene, const cv::Vec3b& rgb) { _colors[gene] = rgb; }
    bool contains(const std::string& gene) const { return _colors.contains(gene); }
    size_t size() const { return _colors.size(); }

    cv::Vec3b colorFor(const std::string& gene) const;
    cv::Vec3b fallback() const { return _fallback; }

private:
    std::unordered_map<std::string, cv::Vec3b> _colors;
    cv::Vec3b _fallback = kFallbackGeneColor;
};

}  // namespace stvox
