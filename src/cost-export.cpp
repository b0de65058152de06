#include "cost-export.hpp"

#include <algorithm>
#include <cmath>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

#include "log.hpp"

namespace cutlist {

namespace {

constexpr double kMinQuantity = 0.0001;

double round3(double value) {
    return std::round(value * 1000.0) / 1000.0;
}

template <class T>
const T* findById(const std::vector<T>& items, const std::string& id) {
    auto it = std::find_if(items.begin(), items.end(), [&id](const T& item) { return item.id == id; });
    return it == items.end() ? nullptr : &*it;
}

const EdgingMaterial* defaultEdgingFor(const std::vector<EdgingMaterial>& edging, int thickness) {
    auto it = std::find_if(edging.begin(), edging.end(), [thickness](const EdgingMaterial& e) {
        return e.is_default_for_thickness && std::lround(e.thickness_mm) == thickness;
    });
    return it == edging.end() ? nullptr : &*it;
}

void addLine(std::vector<ExportLine>& lines, ExportLine line) {
    line.qty = round3(line.qty);
    if (line.qty <= kMinQuantity) {
        return;
    }
    lines.push_back(std::move(line));
}

std::string bandDescription(int thickness, double metres) {
    std::ostringstream out;
    out << "Edge banding " << thickness << "mm (" << round3(metres) << " m)";
    return out.str();
}

} // namespace

ExportMode parseExportMode(const std::string& text) {
    if (text == "replace") return ExportMode::Replace;
    if (text == "append") return ExportMode::Append;
    throw std::invalid_argument("unknown export mode '" + text + "'");
}

std::string primarySlot(const std::string& materialId) {
    return "primary_" + materialId;
}

std::string edgingSlot(const std::string& materialId) {
    return "edging_" + materialId;
}

std::string backerSlot(const std::string& materialId, std::size_t backerBoardCount) {
    return backerBoardCount > 1 ? "backer_" + materialId : "backer";
}

std::vector<ExportLine> buildExportLines(const CutlistSummary& summary,
                                         const InputSnapshot& snapshot,
                                         const ExportSettings& settings) {
    std::vector<ExportLine> lines;

    for (const auto& layout : summary.materials) {
        const BoardMaterial* board = findById(snapshot.primary_boards, layout.material_id);
        ExportLine line;
        line.slot = primarySlot(layout.material_id);
        line.description = layout.name.empty() ? layout.material_id : layout.name;
        line.qty = layout.sheets_billable;
        line.unit = "sheet";
        if (board != nullptr) {
            line.unit_cost = board->cost_per_sheet;
            line.component_reference = board->component_reference;
        }
        addLine(lines, std::move(line));
    }

    if (summary.backer_result) {
        const auto& backers = summary.backer_result->materials;
        for (const auto& layout : backers) {
            const BoardMaterial* board = findById(snapshot.backer_boards, layout.material_id);
            ExportLine line;
            line.slot = backerSlot(layout.material_id, backers.size());
            line.description = "Backer: " + (layout.name.empty() ? layout.material_id : layout.name);
            line.qty = layout.sheets_billable;
            line.unit = "sheet";
            if (board != nullptr) {
                line.unit_cost = board->cost_per_sheet;
                line.component_reference = board->component_reference;
            }
            addLine(lines, std::move(line));
        }
    }

    for (const auto& entry : summary.edging_by_material) {
        ExportLine line;
        line.slot = edgingSlot(entry.material_id);
        line.description = entry.name.empty() ? entry.material_id : entry.name;
        line.qty = entry.length_mm / 1000.0;
        line.unit = "m";
        line.unit_cost = entry.cost_per_meter;
        line.component_reference = entry.component_reference;
        addLine(lines, std::move(line));
    }

    if (settings.include_legacy_band_lines) {
        const std::pair<int, double> bands[] = {{16, summary.edgebanding_16mm},
                                                {32, summary.edgebanding_32mm}};
        for (const auto& band : bands) {
            ExportLine line;
            line.slot = "band" + std::to_string(band.first);
            line.qty = band.second / 1000.0;
            line.description = bandDescription(band.first, line.qty);
            line.unit = "m";
            if (const EdgingMaterial* edging = defaultEdgingFor(snapshot.edging, band.first)) {
                line.unit_cost = edging->cost_per_meter;
                line.component_reference = edging->component_reference;
            }
            addLine(lines, std::move(line));
        }
    }
    return lines;
}

LineRefs exportLines(CostingStore& store, const std::string& itemId,
                     const std::vector<ExportLine>& lines, const LineRefs& existingRefs,
                     ExportMode mode) {
    LineRefs refs = existingRefs;

    if (mode == ExportMode::Append) {
        for (const auto& line : lines) {
            refs[line.slot] = store.insertLine(itemId, line);
        }
        logInfo("Appended ", lines.size(), " costing line(s) to ", itemId);
        return refs;
    }

    std::set<std::string> written;
    for (const auto& line : lines) {
        written.insert(line.slot);
        auto existing = existingRefs.find(line.slot);
        if (existing != existingRefs.end() && store.updateLine(existing->second, line)) {
            continue;
        }
        if (existing != existingRefs.end()) {
            logWarn("Costing line ", existing->second, " for ", line.slot,
                    " is gone, inserting a new one");
        }
        refs[line.slot] = store.insertLine(itemId, line);
    }

    // Slots with nothing left to bill lose their line
    for (const auto& ref : existingRefs) {
        if (written.count(ref.first) != 0) {
            continue;
        }
        try {
            store.deleteLine(ref.second);
        } catch (const StoreError& e) {
            logWarn("Failed to delete costing line ", ref.second, " for ", ref.first, ": ",
                    e.what());
        }
        refs.erase(ref.first);
    }

    logInfo("Exported ", lines.size(), " costing line(s) to ", itemId);
    return refs;
}

LineRefs exportSummary(CostingStore& store, const std::string& itemId,
                       const CutlistSummary& summary, const InputSnapshot& snapshot,
                       const LineRefs& existingRefs, ExportMode mode,
                       const ExportSettings& settings) {
    return exportLines(store, itemId, buildExportLines(summary, snapshot, settings), existingRefs,
                       mode);
}

} // namespace cutlist
