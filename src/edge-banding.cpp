#include "edge-banding.hpp"

#include <cmath>
#include <map>
#include <string>

#include "log.hpp"

namespace cutlist {

namespace {

double round3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

} // namespace

double edgeLength(const Part& part, Edge edge) {
    switch (edge) {
        case Edge::Top:
        case Edge::Bottom:
            return part.width_mm;
        case Edge::Left:
        case Edge::Right:
            return part.length_mm;
    }
    return 0.0;
}

EdgingTotals aggregateEdging(const NormalizedInput& input,
                             const std::vector<PackingResult>& layouts) {
    std::map<std::string, double> lengthById;

    for (std::size_t g = 0; g < input.groups.size() && g < layouts.size(); ++g) {
        std::map<std::string, const Part*> partsById;
        for (const auto& part : input.groups[g].parts) {
            partsById[part.id] = &part;
        }

        for (const auto& sheet : layouts[g].sheets) {
            for (const auto& placement : sheet.placements) {
                auto it = partsById.find(placement.part_id);
                if (it == partsById.end()) {
                    continue;
                }
                const Part& part = *it->second;
                // Glued layers are banded once per finished part
                const double share = 1.0 / boardLayers(part);
                for (std::size_t e = 0; e < kEdgeCount; ++e) {
                    const EdgeBand& band = part.edges[e];
                    if (!band.banded || !band.edging_material_id) {
                        continue;
                    }
                    lengthById[*band.edging_material_id] +=
                        edgeLength(part, static_cast<Edge>(e)) * share;
                }
            }
        }
    }

    EdgingTotals totals;
    for (const auto& material : input.edging) {
        auto it = lengthById.find(material.id);
        if (it == lengthById.end() || it->second <= 0.0) {
            continue;
        }

        EdgingSummaryEntry entry;
        entry.material_id = material.id;
        entry.name = material.name;
        entry.thickness_mm = material.thickness_mm;
        entry.length_mm = round3(it->second);
        entry.cost_per_meter = material.cost_per_meter;
        entry.component_reference = material.component_reference;
        totals.by_material.push_back(entry);

        // Legacy buckets by nominal thickness
        if (std::lround(material.thickness_mm) == 16) {
            totals.band_16mm += entry.length_mm;
        } else if (std::lround(material.thickness_mm) == 32) {
            totals.band_32mm += entry.length_mm;
        }
        totals.total += entry.length_mm;
    }

    totals.band_16mm = round3(totals.band_16mm);
    totals.band_32mm = round3(totals.band_32mm);
    totals.total = round3(totals.total);

    logDebug("Edge banding: ", totals.by_material.size(), " material(s), ", totals.total,
             "mm total");
    return totals;
}

} // namespace cutlist
