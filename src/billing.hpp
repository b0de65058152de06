#ifndef CUTLIST_BILLING_HPP
#define CUTLIST_BILLING_HPP

#include <vector>

#include "types.hpp"

namespace cutlist {

/**
 * Billing inputs for one role (primary or backer).
 */
struct BillingPolicy {
    std::vector<SheetBillingOverride> overrides;
    bool global_full_board = false;
};

double roundBilling(double value);

/**
 * Fraction of the sheet covered by parts, clamped to [0, 1] and rounded to
 * three decimals.
 */
double usedFraction(double usedAreaMm2, double sheetAreaMm2);

/**
 * Bill one sheet. Without an override every sheet but the last bills 1.0 and
 * the last bills its used fraction. globalFullBoard wins over any override.
 */
double sheetCharge(const MaterialLayout& layout, const SheetLayout& sheet, bool isLast,
                   const BillingPolicy& policy);

/**
 * Fill `billable` of every sheet and `sheets_billable` of each layout.
 */
void applyBilling(std::vector<MaterialLayout>& layouts, const BillingPolicy& policy);

/** Rounded sum of sheets_billable over the layouts. */
double totalBillable(const std::vector<MaterialLayout>& layouts);

} // namespace cutlist

#endif // CUTLIST_BILLING_HPP
