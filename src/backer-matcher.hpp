/**
 * Backer sheets for parts laminated with a backer.
 *
 * Every such instance placed on a primary sheet needs one panel of the same
 * size cut from the part's backer board. The panels are collected in primary sheet order and
 * nested onto the backer board with libnest2d, independently of how the
 * primary sheets were cut. Backer panels carry no grain, so quarter turns
 * are always allowed.
 */

#ifndef CUTLIST_BACKER_MATCHER_HPP
#define CUTLIST_BACKER_MATCHER_HPP

#include <string>
#include <vector>

#include "errors.hpp"
#include "normalizer.hpp"
#include "packing-engine.hpp"
#include "types.hpp"

namespace cutlist {

struct BackerPanel {
    const Part* part = nullptr;
    int instance = 0;
};

class BackerMatcher {
public:
    BackerMatcher(const BoardMaterial& backer, double kerfMm);

    /**
     * Panels of the parts laminated onto `backerId`, in primary group, sheet
     * and placement order. `layouts` holds one packing result per group of
     * `input`.
     */
    static std::vector<BackerPanel> collectPanels(const NormalizedInput& input,
                                                  const std::vector<PackingResult>& layouts,
                                                  const std::string& backerId);

    /**
     * Nest the panels onto backer sheets. Fails with PartExceedsSheet when a
     * panel fits no empty backer sheet.
     */
    Result<std::vector<PackedSheet>> nestPanels(const std::vector<BackerPanel>& panels) const;

private:
    BoardMaterial backer_;
    double kerf_;
};

} // namespace cutlist

#endif // CUTLIST_BACKER_MATCHER_HPP
