#ifndef CUTLIST_NORMALIZER_HPP
#define CUTLIST_NORMALIZER_HPP

#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace cutlist {

/**
 * Parts assigned to one primary board.
 */
struct MaterialGroup {
    BoardMaterial board;
    std::vector<Part> parts;
};

/**
 * Internally consistent input. Part ids are unique and every part names its
 * board and its effective lamination. Every banded edge names its edging
 * material and every WithBacker part its backer board.
 */
struct NormalizedInput {
    std::vector<MaterialGroup> groups;
    std::vector<EdgingMaterial> edging;
    /** Backer boards some part is laminated onto, in catalog order. */
    std::vector<BoardMaterial> backer_boards;
    double kerf_mm = 0.0;
    OptimizationPriority priority = OptimizationPriority::Fast;
    bool lamination_enabled = false;
    std::vector<SheetBillingOverride> sheet_overrides;
    bool global_full_board = false;
    std::vector<SheetBillingOverride> backer_sheet_overrides;
    bool backer_global_full_board = false;

    const EdgingMaterial* findEdging(const std::string& id) const;
};

/**
 * Validate and canonicalize a raw input snapshot. Pure.
 */
Result<NormalizedInput> normalize(const InputSnapshot& snapshot);

} // namespace cutlist

#endif // CUTLIST_NORMALIZER_HPP
