#include "json-io.hpp"

#include <stdexcept>

namespace cutlist {

namespace {

const char* const kEdgeKeys[kEdgeCount] = {"top", "right", "bottom", "left"};

template <class T>
void putOptional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    }
}

template <class T>
std::optional<T> getOptional(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->template get<T>();
}

template <class T>
std::vector<T> getList(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return {};
    }
    return it->template get<std::vector<T>>();
}

} // namespace

OptimizationPriority parsePriority(const std::string& text) {
    if (text == "fast") return OptimizationPriority::Fast;
    if (text == "offcut") return OptimizationPriority::Offcut;
    if (text == "deep") return OptimizationPriority::Deep;
    throw std::invalid_argument("unknown optimizationPriority '" + text + "'");
}

LaminationType parseLaminationType(const std::string& text) {
    if (text == "none" || text == "16mm") return LaminationType::None;
    if (text == "with-backer" || text == "32mm-backer") return LaminationType::WithBacker;
    if (text == "same-board" || text == "32mm-both") return LaminationType::SameBoard;
    throw std::invalid_argument("unknown lamination_type '" + text + "'");
}

BillingMode parseBillingMode(const std::string& text) {
    if (text == "auto") return BillingMode::Auto;
    if (text == "full") return BillingMode::Full;
    if (text == "manual") return BillingMode::Manual;
    throw std::invalid_argument("unknown billing mode '" + text + "'");
}

// --- Snapshot ---

void to_json(json& j, const Part& part) {
    j = json{
        {"id", part.id},
        {"length_mm", part.length_mm},
        {"width_mm", part.width_mm},
        {"thickness_mm", part.thickness_mm},
        {"quantity", part.quantity},
        {"grain_locked", part.grain_locked},
    };
    if (!part.label.empty()) {
        j["label"] = part.label;
    }
    putOptional(j, "material_id", part.material_id);
    if (part.lamination) {
        j["lamination_type"] = laminationTypeName(*part.lamination);
    }
    putOptional(j, "backer_material_id", part.backer_material_id);

    json bands = json::object();
    json edging = json::object();
    for (std::size_t e = 0; e < kEdgeCount; ++e) {
        bands[kEdgeKeys[e]] = part.edges[e].banded;
        putOptional(edging, kEdgeKeys[e], part.edges[e].edging_material_id);
    }
    j["band_edges"] = bands;
    if (!edging.empty()) {
        j["edging_material_ids"] = edging;
    }
}

void from_json(const json& j, Part& part) {
    part = Part{};
    part.id = j.at("id").get<std::string>();
    part.label = j.value("label", std::string());
    part.length_mm = j.at("length_mm").get<double>();
    part.width_mm = j.at("width_mm").get<double>();
    part.thickness_mm = j.value("thickness_mm", 16.0);
    // Older documents used "qty"
    part.quantity = j.contains("quantity") ? j.at("quantity").get<int>() : j.value("qty", 1);
    part.material_id = getOptional<std::string>(j, "material_id");
    if (auto type = getOptional<std::string>(j, "lamination_type")) {
        part.lamination = parseLaminationType(*type);
    } else if (auto laminate = getOptional<bool>(j, "laminate")) {
        part.lamination = *laminate ? LaminationType::WithBacker : LaminationType::None;
    }
    part.backer_material_id = getOptional<std::string>(j, "backer_material_id");

    part.grain_locked = j.value("grain_locked", false);
    if (j.contains("grain") && j.at("grain").get<std::string>() != "any") {
        part.grain_locked = true;
    }

    const json bands = j.value("band_edges", json::object());
    const json edging = j.value("edging_material_ids", json::object());
    auto shared = getOptional<std::string>(j, "edging_material_id");
    for (std::size_t e = 0; e < kEdgeCount; ++e) {
        EdgeBand& band = part.edges[e];
        band.banded = bands.value(kEdgeKeys[e], false);
        band.edging_material_id = getOptional<std::string>(edging, kEdgeKeys[e]);
        if (!band.edging_material_id && band.banded) {
            band.edging_material_id = shared;
        }
    }
}

void to_json(json& j, const BoardMaterial& board) {
    j = json{
        {"id", board.id},
        {"name", board.name},
        {"sheet_length_mm", board.sheet_length_mm},
        {"sheet_width_mm", board.sheet_width_mm},
        {"thickness_mm", board.thickness_mm},
        {"cost_per_sheet", board.cost_per_sheet},
        {"is_default", board.is_default},
    };
    putOptional(j, "component_reference", board.component_reference);
}

void from_json(const json& j, BoardMaterial& board) {
    board = BoardMaterial{};
    board.id = j.at("id").get<std::string>();
    board.name = j.value("name", board.id);
    board.sheet_length_mm = j.at("sheet_length_mm").get<double>();
    board.sheet_width_mm = j.at("sheet_width_mm").get<double>();
    board.thickness_mm = j.value("thickness_mm", 16.0);
    board.cost_per_sheet = j.value("cost_per_sheet", 0.0);
    board.component_reference = getOptional<std::string>(j, "component_reference");
    board.is_default = j.value("is_default", false);
}

void to_json(json& j, const EdgingMaterial& edging) {
    j = json{
        {"id", edging.id},
        {"name", edging.name},
        {"thickness_mm", edging.thickness_mm},
        {"cost_per_meter", edging.cost_per_meter},
        {"is_default_for_thickness", edging.is_default_for_thickness},
    };
    putOptional(j, "component_reference", edging.component_reference);
}

void from_json(const json& j, EdgingMaterial& edging) {
    edging = EdgingMaterial{};
    edging.id = j.at("id").get<std::string>();
    edging.name = j.value("name", edging.id);
    edging.thickness_mm = j.value("thickness_mm", 16.0);
    edging.cost_per_meter = j.value("cost_per_meter", 0.0);
    edging.component_reference = getOptional<std::string>(j, "component_reference");
    edging.is_default_for_thickness = j.value("is_default_for_thickness", false);
}

void to_json(json& j, const SheetBillingOverride& entry) {
    j = json{
        {"materialId", entry.material_id},
        {"sheetIndex", entry.sheet_index},
        {"mode", billingModeName(entry.mode)},
        {"manualPct", entry.manual_pct},
    };
}

void from_json(const json& j, SheetBillingOverride& entry) {
    entry = SheetBillingOverride{};
    entry.material_id = j.at("materialId").get<std::string>();
    entry.sheet_index = j.at("sheetIndex").get<int>();
    entry.mode = parseBillingMode(j.value("mode", std::string("auto")));
    entry.manual_pct = j.value("manualPct", 100.0);
}

void to_json(json& j, const InputSnapshot& snapshot) {
    j = json{
        {"version", kSnapshotVersion},
        {"parts", snapshot.parts},
        {"primaryBoards", snapshot.primary_boards},
        {"backerBoards", snapshot.backer_boards},
        {"edging", snapshot.edging},
        {"kerf", snapshot.kerf_mm},
        {"optimizationPriority", priorityName(snapshot.priority)},
        {"laminationEnabled", snapshot.lamination_enabled},
        {"sheetOverrides", snapshot.sheet_overrides},
        {"globalFullBoard", snapshot.global_full_board},
        {"backerSheetOverrides", snapshot.backer_sheet_overrides},
        {"backerGlobalFullBoard", snapshot.backer_global_full_board},
        {"lineRefs", snapshot.line_refs},
    };
    putOptional(j, "backerMaterialId", snapshot.backer_material_id);
}

void from_json(const json& j, InputSnapshot& snapshot) {
    snapshot = InputSnapshot{};
    snapshot.parts = getList<Part>(j, "parts");
    snapshot.primary_boards = getList<BoardMaterial>(j, "primaryBoards");
    snapshot.backer_boards = getList<BoardMaterial>(j, "backerBoards");
    snapshot.edging = getList<EdgingMaterial>(j, "edging");
    snapshot.kerf_mm = j.value("kerf", 3.0);
    snapshot.priority = parsePriority(j.value("optimizationPriority", std::string("fast")));
    snapshot.lamination_enabled = j.value("laminationEnabled", false);
    snapshot.backer_material_id = getOptional<std::string>(j, "backerMaterialId");
    snapshot.sheet_overrides = getList<SheetBillingOverride>(j, "sheetOverrides");
    snapshot.global_full_board = j.value("globalFullBoard", false);
    snapshot.backer_sheet_overrides = getList<SheetBillingOverride>(j, "backerSheetOverrides");
    snapshot.backer_global_full_board = j.value("backerGlobalFullBoard", false);
    snapshot.line_refs = j.value("lineRefs", LineRefs{});
}

// --- Summary ---

void to_json(json& j, const Placement& placement) {
    j = json{
        {"part_id", placement.part_id},
        {"instance", placement.instance},
        {"x", placement.x},
        {"y", placement.y},
        {"rotated", placement.rotated},
        {"width_used", placement.width_used},
        {"length_used", placement.length_used},
    };
}

void to_json(json& j, const SheetLayout& sheet) {
    j = json{
        {"index", sheet.index},
        {"placements", sheet.placements},
        {"usedArea", sheet.used_area_mm2},
        {"billable", sheet.billable},
    };
}

void to_json(json& j, const MaterialLayout& layout) {
    j = json{
        {"materialId", layout.material_id},
        {"name", layout.name},
        {"sheetLength", layout.sheet_length_mm},
        {"sheetWidth", layout.sheet_width_mm},
        {"sheetsUsed", layout.sheets_used},
        {"sheetsBillable", layout.sheets_billable},
        {"usedArea", layout.used_area_mm2},
        {"wasteArea", layout.waste_area_mm2},
        {"sheets", layout.sheets},
    };
}

void to_json(json& j, const EdgingSummaryEntry& entry) {
    j = json{
        {"materialId", entry.material_id},
        {"name", entry.name},
        {"thickness_mm", entry.thickness_mm},
        {"length_mm", entry.length_mm},
        {"cost_per_meter", entry.cost_per_meter},
        {"component_reference", nullptr},
    };
    if (entry.component_reference) {
        j["component_reference"] = *entry.component_reference;
    }
}

void to_json(json& j, const CutlistSummary& summary) {
    j = json{
        {"materials", summary.materials},
        {"edgingByMaterial", summary.edging_by_material},
        {"backerResult", nullptr},
        {"primarySheetsUsed", summary.primary_sheets_used},
        {"primarySheetsBillable", summary.primary_sheets_billable},
        {"backerSheetsUsed", summary.backer_sheets_used},
        {"backerSheetsBillable", summary.backer_sheets_billable},
        {"laminationOn", summary.lamination_on},
        {"edgebanding16mm", summary.edgebanding_16mm},
        {"edgebanding32mm", summary.edgebanding_32mm},
        {"edgebandingTotal", summary.edgebanding_total},
    };
    if (summary.backer_result) {
        j["backerResult"] = json{{"materials", summary.backer_result->materials}};
    }
}

void to_json(json& j, const ValidationError& error) {
    j = json{
        {"error", error.describe()},
        {"errorKind", errorKindName(error.kind)},
        {"message", error.message},
    };
    if (!error.part_id.empty()) {
        j["partId"] = error.part_id;
    }
    if (!error.material_id.empty()) {
        j["materialId"] = error.material_id;
    }
}

void to_json(json& j, const ExportLine& line) {
    j = json{
        {"slot", line.slot},
        {"description", line.description},
        {"qty", line.qty},
        {"unit", line.unit},
        {"unit_cost", nullptr},
        {"component_reference", nullptr},
    };
    if (line.unit_cost) {
        j["unit_cost"] = *line.unit_cost;
    }
    if (line.component_reference) {
        j["component_reference"] = *line.component_reference;
    }
}

// --- Options ---

ComputeOptions optionsFromJson(const json& j, LogLevel& level) {
    ComputeOptions options;
    if (!j.is_object()) {
        return options;
    }
    options.deep_iterations = j.value("deepIterations", options.deep_iterations);
    options.deep_time_budget_ms = j.value("deepTimeBudgetMs", options.deep_time_budget_ms);
    options.seed = j.value("seed", options.seed);
    if (options.deep_iterations < 0) {
        throw std::invalid_argument("deepIterations must not be negative");
    }

    std::string levelText = j.value("logLevel", std::string());
    if (!levelText.empty() && !parseLogLevel(levelText, level)) {
        logWarn("Ignoring unknown logLevel '", levelText, "'");
    }
    return options;
}

} // namespace cutlist
