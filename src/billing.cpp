#include "billing.hpp"

#include <algorithm>
#include <cmath>

#include "log.hpp"

namespace cutlist {

namespace {

const SheetBillingOverride* findOverride(const BillingPolicy& policy, const std::string& materialId,
                                         int sheetIndex) {
    // Later entries win, matching the last write to a keyed map
    const SheetBillingOverride* found = nullptr;
    for (const auto& entry : policy.overrides) {
        if (entry.material_id == materialId && entry.sheet_index == sheetIndex) {
            found = &entry;
        }
    }
    return found;
}

} // namespace

double roundBilling(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

double usedFraction(double usedAreaMm2, double sheetAreaMm2) {
    if (sheetAreaMm2 <= 0.0) {
        return 0.0;
    }
    return roundBilling(std::clamp(usedAreaMm2 / sheetAreaMm2, 0.0, 1.0));
}

double sheetCharge(const MaterialLayout& layout, const SheetLayout& sheet, bool isLast,
                   const BillingPolicy& policy) {
    if (policy.global_full_board) {
        return 1.0;
    }

    double fraction =
        usedFraction(sheet.used_area_mm2, layout.sheet_length_mm * layout.sheet_width_mm);

    if (const auto* entry = findOverride(policy, layout.material_id, sheet.index)) {
        switch (entry->mode) {
            case BillingMode::Full:
                return 1.0;
            case BillingMode::Auto:
                return fraction;
            case BillingMode::Manual:
                return roundBilling(std::clamp(entry->manual_pct, 0.0, 100.0) / 100.0);
        }
    }
    return isLast ? fraction : 1.0;
}

void applyBilling(std::vector<MaterialLayout>& layouts, const BillingPolicy& policy) {
    for (auto& layout : layouts) {
        double total = 0.0;
        for (std::size_t i = 0; i < layout.sheets.size(); ++i) {
            auto& sheet = layout.sheets[i];
            sheet.billable = sheetCharge(layout, sheet, i + 1 == layout.sheets.size(), policy);
            total += sheet.billable;
        }
        layout.sheets_billable = roundBilling(total);
        logDebug("Billing ", layout.material_id, ": ", layout.sheets_used, " used, ",
                 layout.sheets_billable, " billable");
    }
}

double totalBillable(const std::vector<MaterialLayout>& layouts) {
    double total = 0.0;
    for (const auto& layout : layouts) {
        total += layout.sheets_billable;
    }
    return roundBilling(total);
}

} // namespace cutlist
