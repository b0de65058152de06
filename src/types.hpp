/**
 * cutlist-packer: data model
 *
 * Input snapshot types (parts, board and edging catalogs, billing overrides)
 * and the derived, immutable CutlistSummary returned by compute().
 *
 * Sheet coordinates: X runs along the sheet width, Y along the sheet length.
 * A part's width_mm is its X extent and length_mm its Y extent when placed
 * unrotated.
 */

#ifndef CUTLIST_TYPES_HPP
#define CUTLIST_TYPES_HPP

#include <array>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cutlist {

enum class OptimizationPriority {
    Fast,
    Offcut,
    Deep
};

/**
 * Logical edges of a part, in fixed order. Banding flags stay attached to
 * these edges whatever the part's orientation on the sheet.
 */
enum class Edge {
    Top = 0,
    Right = 1,
    Bottom = 2,
    Left = 3
};

constexpr std::size_t kEdgeCount = 4;

/**
 * How a part is built up when lamination is on. WithBacker glues a backer
 * board panel to the part; SameBoard glues two panels of the part's own
 * board, so the part takes two pieces of primary sheet and is banded once.
 */
enum class LaminationType {
    None,
    WithBacker,
    SameBoard
};

struct EdgeBand {
    bool banded = false;
    std::optional<std::string> edging_material_id;
};

struct Part {
    std::string id;
    std::string label;
    double length_mm = 0.0;
    double width_mm = 0.0;
    double thickness_mm = 16.0;
    int quantity = 1;
    std::optional<std::string> material_id;
    bool grain_locked = false;
    std::array<EdgeBand, kEdgeCount> edges{};
    /** Unset: WithBacker when lamination is enabled. */
    std::optional<LaminationType> lamination;
    /** Backer board for this part; unset falls back to the snapshot's backer. */
    std::optional<std::string> backer_material_id;

    const EdgeBand& edge(Edge e) const { return edges[static_cast<std::size_t>(e)]; }
    EdgeBand& edge(Edge e) { return edges[static_cast<std::size_t>(e)]; }
};

struct BoardMaterial {
    std::string id;
    std::string name;
    double sheet_length_mm = 0.0;
    double sheet_width_mm = 0.0;
    double thickness_mm = 16.0;
    double cost_per_sheet = 0.0;
    std::optional<std::string> component_reference;
    bool is_default = false;

    double sheetArea() const { return sheet_length_mm * sheet_width_mm; }
};

struct EdgingMaterial {
    std::string id;
    std::string name;
    double thickness_mm = 16.0;
    double cost_per_meter = 0.0;
    std::optional<std::string> component_reference;
    bool is_default_for_thickness = false;
};

enum class BillingMode {
    Auto,
    Full,
    Manual
};

struct SheetBillingOverride {
    std::string material_id;
    int sheet_index = 0;
    BillingMode mode = BillingMode::Auto;
    double manual_pct = 100.0;
};

/** Costing line references keyed by slot name (primary_<id>, edging_<id>, backer, band16, band32). */
using LineRefs = std::map<std::string, std::string>;

constexpr int kSnapshotVersion = 2;

struct InputSnapshot {
    std::vector<Part> parts;
    std::vector<BoardMaterial> primary_boards;
    std::vector<BoardMaterial> backer_boards;
    std::vector<EdgingMaterial> edging;
    double kerf_mm = 3.0;
    OptimizationPriority priority = OptimizationPriority::Fast;
    bool lamination_enabled = false;
    std::optional<std::string> backer_material_id;
    std::vector<SheetBillingOverride> sheet_overrides;
    bool global_full_board = false;
    std::vector<SheetBillingOverride> backer_sheet_overrides;
    bool backer_global_full_board = false;
    LineRefs line_refs;
};

// --- Output ---

struct Placement {
    std::string part_id;
    int instance = 0;
    double x = 0.0;
    double y = 0.0;
    bool rotated = false;
    double width_used = 0.0;
    double length_used = 0.0;
};

struct SheetLayout {
    int index = 0;
    std::vector<Placement> placements;
    double used_area_mm2 = 0.0;
    double billable = 0.0;
};

struct MaterialLayout {
    std::string material_id;
    std::string name;
    double sheet_length_mm = 0.0;
    double sheet_width_mm = 0.0;
    int sheets_used = 0;
    double sheets_billable = 0.0;
    double used_area_mm2 = 0.0;
    double waste_area_mm2 = 0.0;
    std::vector<SheetLayout> sheets;
};

struct EdgingSummaryEntry {
    std::string material_id;
    std::string name;
    double thickness_mm = 0.0;
    double length_mm = 0.0;
    double cost_per_meter = 0.0;
    std::optional<std::string> component_reference;
};

struct BackerResult {
    std::vector<MaterialLayout> materials;
};

struct CutlistSummary {
    std::vector<MaterialLayout> materials;
    std::vector<EdgingSummaryEntry> edging_by_material;
    std::optional<BackerResult> backer_result;
    int primary_sheets_used = 0;
    double primary_sheets_billable = 0.0;
    int backer_sheets_used = 0;
    double backer_sheets_billable = 0.0;
    bool lamination_on = false;
    double edgebanding_16mm = 0.0;
    double edgebanding_32mm = 0.0;
    double edgebanding_total = 0.0;
};

// Structural equality, used for dirty tracking and persistence round trips.
bool operator==(const EdgeBand& a, const EdgeBand& b);
bool operator==(const Part& a, const Part& b);
bool operator==(const BoardMaterial& a, const BoardMaterial& b);
bool operator==(const EdgingMaterial& a, const EdgingMaterial& b);
bool operator==(const SheetBillingOverride& a, const SheetBillingOverride& b);
bool operator==(const InputSnapshot& a, const InputSnapshot& b);
bool operator==(const Placement& a, const Placement& b);
bool operator==(const SheetLayout& a, const SheetLayout& b);
bool operator==(const MaterialLayout& a, const MaterialLayout& b);
bool operator==(const EdgingSummaryEntry& a, const EdgingSummaryEntry& b);
bool operator==(const BackerResult& a, const BackerResult& b);
bool operator==(const CutlistSummary& a, const CutlistSummary& b);

/** Primary board pieces cut per finished part: 2 for SameBoard, else 1. */
int boardLayers(const Part& part);

/** Thickness of the finished part, which selects its default edging. */
double finishedThickness(const Part& part);

const char* priorityName(OptimizationPriority priority);
const char* laminationTypeName(LaminationType type);
const char* billingModeName(BillingMode mode);
const char* edgeName(Edge edge);

} // namespace cutlist

#endif // CUTLIST_TYPES_HPP
