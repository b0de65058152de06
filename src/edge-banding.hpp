#ifndef CUTLIST_EDGE_BANDING_HPP
#define CUTLIST_EDGE_BANDING_HPP

#include <vector>

#include "normalizer.hpp"
#include "packing-engine.hpp"
#include "types.hpp"

namespace cutlist {

/**
 * Banded length per edging material plus the legacy 16/32 mm aggregates.
 */
struct EdgingTotals {
    std::vector<EdgingSummaryEntry> by_material;
    double band_16mm = 0.0;
    double band_32mm = 0.0;
    double total = 0.0;
};

/**
 * Physical length of a logical edge. Top and bottom run along the part's
 * width, left and right along its length, whatever the placement rotation.
 */
double edgeLength(const Part& part, Edge edge);

/**
 * Sum the banded edges of every placed instance. `layouts` holds one
 * packing result per group of `input`, in the same order. Entries follow the
 * order of the edging catalog; materials with no banded length are left out.
 */
EdgingTotals aggregateEdging(const NormalizedInput& input,
                             const std::vector<PackingResult>& layouts);

} // namespace cutlist

#endif // CUTLIST_EDGE_BANDING_HPP
