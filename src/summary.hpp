#ifndef CUTLIST_SUMMARY_HPP
#define CUTLIST_SUMMARY_HPP

#include <vector>

#include "errors.hpp"
#include "options.hpp"
#include "packing-engine.hpp"
#include "types.hpp"

namespace cutlist {

/**
 * One material's sheets with usage and waste filled in; billing is left at
 * zero for the billing resolver.
 */
MaterialLayout makeMaterialLayout(const BoardMaterial& board,
                                  const std::vector<PackedSheet>& sheets);

/**
 * Run the whole pipeline on one input snapshot: normalize, pack every
 * material, aggregate edging, match backers, bill and assemble. Equal
 * snapshots and options give equal summaries. A deep run that is cancelled
 * still returns its best layout so far; the caller decides whether to use it.
 */
Result<CutlistSummary> compute(const InputSnapshot& snapshot, const ComputeOptions& options = {});

} // namespace cutlist

#endif // CUTLIST_SUMMARY_HPP
