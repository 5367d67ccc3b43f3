#pragma once

#include "stvox/core/types/Dataset.hpp"
#include "stvox/core/types/Voxel.hpp"
#include "stvox/core/util/Color.hpp"
#include "stvox/core/util/GridMapping.hpp"

#include <string>
#include <vector>

namespace stvox {

// Per-gene legend entry
struct GeneSummary {
    std::string gene;
    size_t spotCount = 0;
    std::string hexColor;
};

// Places gene spots in grid space and links them to their parent cells
class GeneSpotMapper
{
public:
    GeneSpotMapper(const GridMapping& mapping, const GeneColorTable& colors);

    // One marker per spot, in input order; sourceId is the spot index
    std::vector<GeneMarker> mapSpots(const std::vector<GeneSpot>& spots) const;

    // One line per marker with a complete, non-background parent
    std::vector<LinkLine> linkLines(const std::vector<GeneMarker>& markers);

    size_t missingParentLinks() const { return _missingParentLinks; }
    size_t backgroundParentSpots() const { return _backgroundParentSpots; }

private:
    const GridMapping& _mapping;
    const GeneColorTable& _colors;
    size_t _missingParentLinks = 0;
    size_t _backgroundParentSpots = 0;
};

// Unique genes sorted by name, with spot counts and display colors
std::vector<GeneSummary> summarizeGenes(const std::vector<GeneMarker>& markers,
                                        const GeneColorTable& colors);

}  // namespace stvox
