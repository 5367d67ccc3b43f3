#include "stvox/core/util/GeneSpots.hpp"

#include <map>

namespace stvox {

GeneSpotMapper::GeneSpotMapper(const GridMapping& mapping, const GeneColorTable& colors)
    : _mapping(mapping), _colors(colors)
{
}

std::vector<GeneMarker> GeneSpotMapper::mapSpots(const std::vector<GeneSpot>& spots) const
{
    std::vector<GeneMarker> markers;
    markers.reserve(spots.size());

    for (size_t i = 0; i < spots.size(); ++i) {
        const GeneSpot& spot = spots[i];
        const GridPosition p = _mapping.pointToGrid(spot.x, spot.y, spot.planeId);

        GeneMarker m;
        m.voxel.gridX = p.x;
        m.voxel.gridY = p.y;
        m.voxel.gridZ = p.z;
        m.voxel.category = VoxelCategory::GeneMarker;
        m.voxel.color = _colors.colorFor(spot.gene);
        m.voxel.sourceId = static_cast<int64_t>(i);
        m.voxel.planeId = spot.planeId;
        m.gene = spot.gene;
        m.spotId = spot.spotId;
        m.parentCellId = spot.parentCellId;
        m.parentX = spot.parentX;
        m.parentY = spot.parentY;
        m.parentZ = spot.parentZ;
        markers.push_back(std::move(m));
    }
    return markers;
}

std::vector<LinkLine> GeneSpotMapper::linkLines(const std::vector<GeneMarker>& markers)
{
    _missingParentLinks = 0;
    _backgroundParentSpots = 0;

    std::vector<LinkLine> lines;
    for (size_t i = 0; i < markers.size(); ++i) {
        const GeneMarker& m = markers[i];

        if (m.parentCellId && *m.parentCellId == 0) {
            ++_backgroundParentSpots;
            continue;
        }
        if (!m.parentCellId || !m.parentX || !m.parentY || !m.parentZ) {
            ++_missingParentLinks;
            continue;
        }

        // parent z is a continuous depth, so it lands on the slicing axis as is
        const GridPosition target = _mapping.depthPointToGrid(*m.parentX, *m.parentY, *m.parentZ);
        const cv::Vec3b& rgb = m.voxel.color;

        LinkLine line;
        line.source = cv::Vec3f(static_cast<float>(m.voxel.gridX), m.voxel.gridY,
                                static_cast<float>(m.voxel.gridZ));
        line.target = cv::Vec3f(static_cast<float>(target.x), target.y, static_cast<float>(target.z));
        line.color = cv::Vec4b(rgb[0], rgb[1], rgb[2], kLinkLineAlpha);
        line.gene = m.gene;
        line.spotId = m.spotId;
        line.parentCellId = *m.parentCellId;
        line.markerIndex = i;
        lines.push_back(std::move(line));
    }
    return lines;
}

std::vector<GeneSummary> summarizeGenes(const std::vector<GeneMarker>& markers,
                                        const GeneColorTable& colors)
{
    std::map<std::string, size_t> counts;
    for (const auto& m : markers) {
        ++counts[m.gene];
    }

    std::vector<GeneSummary> out;
    out.reserve(counts.size());
    for (const auto& [gene, count] : counts) {
        out.push_back({gene, count, toHexColor(colors.colorFor(gene))});
    }
    return out;
}

}  // namespace stvox
