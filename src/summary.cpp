#include "summary.hpp"

#include <algorithm>
#include <chrono>

#include "backer-matcher.hpp"
#include "billing.hpp"
#include "edge-banding.hpp"
#include "log.hpp"
#include "normalizer.hpp"

namespace cutlist {

MaterialLayout makeMaterialLayout(const BoardMaterial& board,
                                  const std::vector<PackedSheet>& sheets) {
    MaterialLayout layout;
    layout.material_id = board.id;
    layout.name = board.name;
    layout.sheet_length_mm = board.sheet_length_mm;
    layout.sheet_width_mm = board.sheet_width_mm;
    layout.sheets_used = static_cast<int>(sheets.size());

    for (std::size_t i = 0; i < sheets.size(); ++i) {
        SheetLayout sheet;
        sheet.index = static_cast<int>(i);
        sheet.placements = sheets[i].placements;
        sheet.used_area_mm2 = sheets[i].used_area_mm2;
        layout.used_area_mm2 += sheet.used_area_mm2;
        layout.sheets.push_back(std::move(sheet));
    }
    layout.waste_area_mm2 =
        std::max(0.0, layout.sheets_used * board.sheetArea() - layout.used_area_mm2);
    return layout;
}

Result<CutlistSummary> compute(const InputSnapshot& snapshot, const ComputeOptions& options) {
    auto startTime = std::chrono::steady_clock::now();

    auto normalized = normalize(snapshot);
    if (!normalized) {
        logWarn("Input rejected: ", normalized.error().describe());
        return normalized.error();
    }
    const NormalizedInput& input = normalized.value();

    // Primary layouts, one engine per material
    std::vector<PackingResult> packed;
    packed.reserve(input.groups.size());
    for (const auto& group : input.groups) {
        PackingEngine engine(group.board, input.kerf_mm, options);
        auto result = engine.pack(group.parts, input.priority);
        if (!result) {
            logWarn("Packing failed: ", result.error().describe());
            return result.error();
        }
        packed.push_back(std::move(result.value()));
    }

    CutlistSummary summary;
    for (std::size_t g = 0; g < input.groups.size(); ++g) {
        summary.materials.push_back(makeMaterialLayout(input.groups[g].board, packed[g].sheets));
    }
    applyBilling(summary.materials,
                 BillingPolicy{input.sheet_overrides, input.global_full_board});

    EdgingTotals edging = aggregateEdging(input, packed);
    summary.edging_by_material = std::move(edging.by_material);
    summary.edgebanding_16mm = edging.band_16mm;
    summary.edgebanding_32mm = edging.band_32mm;
    summary.edgebanding_total = edging.total;

    summary.lamination_on = input.lamination_enabled;
    if (!input.backer_boards.empty()) {
        BackerResult backer;
        for (const auto& board : input.backer_boards) {
            BackerMatcher matcher(board, input.kerf_mm);
            auto panels = BackerMatcher::collectPanels(input, packed, board.id);
            auto nested = matcher.nestPanels(panels);
            if (!nested) {
                logWarn("Backer nesting failed: ", nested.error().describe());
                return nested.error();
            }
            backer.materials.push_back(makeMaterialLayout(board, nested.value()));
        }
        applyBilling(backer.materials, BillingPolicy{input.backer_sheet_overrides,
                                                     input.backer_global_full_board});
        for (const auto& layout : backer.materials) {
            summary.backer_sheets_used += layout.sheets_used;
        }
        summary.backer_sheets_billable = totalBillable(backer.materials);
        summary.backer_result = std::move(backer);
    }

    for (const auto& layout : summary.materials) {
        summary.primary_sheets_used += layout.sheets_used;
    }
    summary.primary_sheets_billable = totalBillable(summary.materials);

    auto totalMs = std::chrono::duration_cast<std::chrono::milliseconds>(
                       std::chrono::steady_clock::now() - startTime)
                       .count();
    logInfo("Computed ", summary.materials.size(), " material(s): ", summary.primary_sheets_used,
            " primary sheet(s), ", summary.backer_sheets_used, " backer sheet(s), ",
            summary.edgebanding_total, "mm banding in ", totalMs, "ms");
    return summary;
}

} // namespace cutlist
