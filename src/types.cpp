#include "types.hpp"

#include <tuple>

namespace cutlist {

bool operator==(const EdgeBand& a, const EdgeBand& b) {
    return a.banded == b.banded && a.edging_material_id == b.edging_material_id;
}

bool operator==(const Part& a, const Part& b) {
    return std::tie(a.id, a.label, a.length_mm, a.width_mm, a.thickness_mm, a.quantity,
                    a.material_id, a.grain_locked, a.edges, a.lamination, a.backer_material_id) ==
           std::tie(b.id, b.label, b.length_mm, b.width_mm, b.thickness_mm, b.quantity,
                    b.material_id, b.grain_locked, b.edges, b.lamination, b.backer_material_id);
}

bool operator==(const BoardMaterial& a, const BoardMaterial& b) {
    return std::tie(a.id, a.name, a.sheet_length_mm, a.sheet_width_mm, a.thickness_mm,
                    a.cost_per_sheet, a.component_reference, a.is_default) ==
           std::tie(b.id, b.name, b.sheet_length_mm, b.sheet_width_mm, b.thickness_mm,
                    b.cost_per_sheet, b.component_reference, b.is_default);
}

bool operator==(const EdgingMaterial& a, const EdgingMaterial& b) {
    return std::tie(a.id, a.name, a.thickness_mm, a.cost_per_meter, a.component_reference,
                    a.is_default_for_thickness) ==
           std::tie(b.id, b.name, b.thickness_mm, b.cost_per_meter, b.component_reference,
                    b.is_default_for_thickness);
}

bool operator==(const SheetBillingOverride& a, const SheetBillingOverride& b) {
    return std::tie(a.material_id, a.sheet_index, a.mode, a.manual_pct) ==
           std::tie(b.material_id, b.sheet_index, b.mode, b.manual_pct);
}

bool operator==(const InputSnapshot& a, const InputSnapshot& b) {
    return std::tie(a.parts, a.primary_boards, a.backer_boards, a.edging, a.kerf_mm, a.priority,
                    a.lamination_enabled, a.backer_material_id, a.sheet_overrides,
                    a.global_full_board, a.backer_sheet_overrides, a.backer_global_full_board,
                    a.line_refs) ==
           std::tie(b.parts, b.primary_boards, b.backer_boards, b.edging, b.kerf_mm, b.priority,
                    b.lamination_enabled, b.backer_material_id, b.sheet_overrides,
                    b.global_full_board, b.backer_sheet_overrides, b.backer_global_full_board,
                    b.line_refs);
}

bool operator==(const Placement& a, const Placement& b) {
    return std::tie(a.part_id, a.instance, a.x, a.y, a.rotated, a.width_used, a.length_used) ==
           std::tie(b.part_id, b.instance, b.x, b.y, b.rotated, b.width_used, b.length_used);
}

bool operator==(const SheetLayout& a, const SheetLayout& b) {
    return std::tie(a.index, a.placements, a.used_area_mm2, a.billable) ==
           std::tie(b.index, b.placements, b.used_area_mm2, b.billable);
}

bool operator==(const MaterialLayout& a, const MaterialLayout& b) {
    return std::tie(a.material_id, a.name, a.sheet_length_mm, a.sheet_width_mm, a.sheets_used,
                    a.sheets_billable, a.used_area_mm2, a.waste_area_mm2, a.sheets) ==
           std::tie(b.material_id, b.name, b.sheet_length_mm, b.sheet_width_mm, b.sheets_used,
                    b.sheets_billable, b.used_area_mm2, b.waste_area_mm2, b.sheets);
}

bool operator==(const EdgingSummaryEntry& a, const EdgingSummaryEntry& b) {
    return std::tie(a.material_id, a.name, a.thickness_mm, a.length_mm, a.cost_per_meter,
                    a.component_reference) ==
           std::tie(b.material_id, b.name, b.thickness_mm, b.length_mm, b.cost_per_meter,
                    b.component_reference);
}

bool operator==(const BackerResult& a, const BackerResult& b) {
    return a.materials == b.materials;
}

bool operator==(const CutlistSummary& a, const CutlistSummary& b) {
    return std::tie(a.materials, a.edging_by_material, a.backer_result, a.primary_sheets_used,
                    a.primary_sheets_billable, a.backer_sheets_used, a.backer_sheets_billable,
                    a.lamination_on, a.edgebanding_16mm, a.edgebanding_32mm,
                    a.edgebanding_total) ==
           std::tie(b.materials, b.edging_by_material, b.backer_result, b.primary_sheets_used,
                    b.primary_sheets_billable, b.backer_sheets_used, b.backer_sheets_billable,
                    b.lamination_on, b.edgebanding_16mm, b.edgebanding_32mm,
                    b.edgebanding_total);
}

int boardLayers(const Part& part) {
    return part.lamination == LaminationType::SameBoard ? 2 : 1;
}

double finishedThickness(const Part& part) {
    bool laminated = part.lamination && *part.lamination != LaminationType::None;
    return laminated ? part.thickness_mm * 2.0 : part.thickness_mm;
}

const char* priorityName(OptimizationPriority priority) {
    switch (priority) {
        case OptimizationPriority::Fast: return "fast";
        case OptimizationPriority::Offcut: return "offcut";
        case OptimizationPriority::Deep: return "deep";
    }
    return "fast";
}

const char* laminationTypeName(LaminationType type) {
    switch (type) {
        case LaminationType::None: return "none";
        case LaminationType::WithBacker: return "with-backer";
        case LaminationType::SameBoard: return "same-board";
    }
    return "none";
}

const char* billingModeName(BillingMode mode) {
    switch (mode) {
        case BillingMode::Auto: return "auto";
        case BillingMode::Full: return "full";
        case BillingMode::Manual: return "manual";
    }
    return "auto";
}

const char* edgeName(Edge edge) {
    switch (edge) {
        case Edge::Top: return "top";
        case Edge::Right: return "right";
        case Edge::Bottom: return "bottom";
        case Edge::Left: return "left";
    }
    return "top";
}

} // namespace cutlist
