#include <gtest/gtest.h>

#include <map>
#include <string>
#include <vector>

#include "cost-export.hpp"
#include "summary.hpp"
#include "test_helpers.hpp"

using namespace cutlist;
using namespace cutlist::fixtures;

namespace {

/** Costing lines held in memory, keyed by line id. */
class MemoryCostingStore : public CostingStore {
public:
    std::string insertLine(const std::string& itemId, const ExportLine& line) override {
        std::string id = "line-" + std::to_string(++nextId_);
        lines[id] = Stored{itemId, line};
        ++inserts;
        return id;
    }

    bool updateLine(const std::string& lineId, const ExportLine& line) override {
        auto it = lines.find(lineId);
        if (it == lines.end()) {
            return false;
        }
        it->second.line = line;
        ++updates;
        return true;
    }

    void deleteLine(const std::string& lineId) override {
        if (failDeletes) {
            throw StoreError("delete rejected", true);
        }
        lines.erase(lineId);
    }

    struct Stored {
        std::string item_id;
        ExportLine line;
    };

    std::map<std::string, Stored> lines;
    int inserts = 0;
    int updates = 0;
    bool failDeletes = false;

private:
    int nextId_ = 0;
};

const ExportLine* findSlot(const std::vector<ExportLine>& lines, const std::string& slot) {
    for (const auto& line : lines) {
        if (line.slot == slot) {
            return &line;
        }
    }
    return nullptr;
}

ExportLine sheetLine(const std::string& slot, double qty) {
    ExportLine line;
    line.slot = slot;
    line.description = slot;
    line.qty = qty;
    line.unit = "sheet";
    return line;
}

/** 20 banded panels: two white sheets billing 1.191, 8 m of abs16. */
InputSnapshot bandedPanelSnapshot() {
    auto snapshot = standardSnapshot();
    snapshot.primary_boards[0].component_reference = std::string("BRD-WHITE");
    Part panel = makePart("panel", 600, 400, 20);
    panel.edge(Edge::Top).banded = true;
    snapshot.parts.push_back(panel);
    return snapshot;
}

} // namespace

TEST(CostExport, BuildsOneLinePerSlot) {
    auto snapshot = bandedPanelSnapshot();
    auto summary = compute(snapshot);
    ASSERT_TRUE(summary.ok());

    auto lines = buildExportLines(summary.value(), snapshot);
    ASSERT_EQ(lines.size(), 2u);

    const ExportLine* board = findSlot(lines, primarySlot("white"));
    ASSERT_NE(board, nullptr);
    EXPECT_DOUBLE_EQ(board->qty, 1.191);
    EXPECT_EQ(board->unit, "sheet");
    ASSERT_TRUE(board->unit_cost.has_value());
    EXPECT_DOUBLE_EQ(*board->unit_cost, 800.0);
    ASSERT_TRUE(board->component_reference.has_value());
    EXPECT_EQ(*board->component_reference, "BRD-WHITE");

    const ExportLine* edging = findSlot(lines, edgingSlot("abs16"));
    ASSERT_NE(edging, nullptr);
    EXPECT_DOUBLE_EQ(edging->qty, 8.0);
    EXPECT_EQ(edging->unit, "m");
    ASSERT_TRUE(edging->unit_cost.has_value());
    EXPECT_DOUBLE_EQ(*edging->unit_cost, 5.0);
}

TEST(CostExport, QuantitiesRoundToThreeDecimals) {
    CutlistSummary summary;
    EdgingSummaryEntry entry;
    entry.material_id = "abs16";
    entry.name = "ABS";
    entry.thickness_mm = 16.0;
    entry.length_mm = 1234.5678;
    entry.cost_per_meter = 5.0;
    summary.edging_by_material.push_back(entry);

    auto lines = buildExportLines(summary, standardSnapshot());
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_DOUBLE_EQ(lines[0].qty, 1.235);
}

TEST(CostExport, SkipsLinesWithNothingToBill) {
    CutlistSummary summary;
    MaterialLayout layout;
    layout.material_id = "white";
    layout.sheets_billable = 0.0;
    summary.materials.push_back(layout);
    EdgingSummaryEntry entry;
    entry.material_id = "abs16";
    entry.length_mm = 0.05;
    summary.edging_by_material.push_back(entry);

    EXPECT_TRUE(buildExportLines(summary, standardSnapshot()).empty());
}

TEST(CostExport, BackerLineUsesBackerBoard) {
    auto snapshot = standardSnapshot();
    BoardMaterial backer = makeBoard("mdf", 2440.0, 1220.0, false);
    backer.name = "MDF backer";
    backer.cost_per_sheet = 300.0;
    snapshot.backer_boards.push_back(backer);
    snapshot.lamination_enabled = true;
    snapshot.backer_material_id = std::string("mdf");
    Part door = makePart("door", 700, 500, 2);
    door.lamination = LaminationType::WithBacker;
    snapshot.parts.push_back(door);

    auto summary = compute(snapshot);
    ASSERT_TRUE(summary.ok());
    auto lines = buildExportLines(summary.value(), snapshot);

    const ExportLine* line = findSlot(lines, "backer");
    ASSERT_NE(line, nullptr);
    EXPECT_EQ(line->description, "Backer: MDF backer");
    ASSERT_TRUE(line->unit_cost.has_value());
    EXPECT_DOUBLE_EQ(*line->unit_cost, 300.0);
    EXPECT_GT(line->qty, 0.0);
    EXPECT_LE(line->qty, 1.0);
}

TEST(CostExport, SeveralBackerBoardsGetOneSlotEach) {
    auto snapshot = standardSnapshot();
    snapshot.lamination_enabled = true;
    snapshot.backer_boards.push_back(makeBoard("hdf", 2440.0, 1220.0, true));
    snapshot.backer_boards.push_back(makeBoard("mdf", 2440.0, 1220.0, false));
    Part top = makePart("top", 1200, 600, 2);
    Part door = makePart("door", 700, 500, 2);
    door.backer_material_id = "mdf";
    snapshot.parts = {top, door};

    auto summary = compute(snapshot);
    ASSERT_TRUE(summary.ok()) << summary.error().describe();
    ASSERT_TRUE(summary.value().backer_result.has_value());
    ASSERT_EQ(summary.value().backer_result->materials.size(), 2u);

    auto lines = buildExportLines(summary.value(), snapshot);
    EXPECT_EQ(findSlot(lines, "backer"), nullptr);
    const ExportLine* hdf = findSlot(lines, backerSlot("hdf", 2));
    const ExportLine* mdf = findSlot(lines, backerSlot("mdf", 2));
    ASSERT_NE(hdf, nullptr);
    ASSERT_NE(mdf, nullptr);
    EXPECT_EQ(hdf->slot, "backer_hdf");
    EXPECT_EQ(mdf->description, "Backer: Board mdf");
}

TEST(CostExport, LegacyBandLinesAreOptIn) {
    auto snapshot = bandedPanelSnapshot();
    auto summary = compute(snapshot);
    ASSERT_TRUE(summary.ok());

    EXPECT_EQ(findSlot(buildExportLines(summary.value(), snapshot), "band16"), nullptr);

    ExportSettings settings;
    settings.include_legacy_band_lines = true;
    auto lines = buildExportLines(summary.value(), snapshot, settings);
    const ExportLine* band = findSlot(lines, "band16");
    ASSERT_NE(band, nullptr);
    EXPECT_DOUBLE_EQ(band->qty, 8.0);
    ASSERT_TRUE(band->unit_cost.has_value());
    EXPECT_DOUBLE_EQ(*band->unit_cost, 5.0);
    EXPECT_EQ(findSlot(lines, "band32"), nullptr);
}

TEST(CostExport, ReplaceUpdatesExistingLines) {
    MemoryCostingStore store;
    LineRefs refs = exportLines(store, "item-1", {sheetLine("primary_white", 2.0)}, {},
                                ExportMode::Replace);
    ASSERT_EQ(refs.size(), 1u);
    std::string lineId = refs.at("primary_white");

    LineRefs again = exportLines(store, "item-1", {sheetLine("primary_white", 1.5)}, refs,
                                 ExportMode::Replace);

    EXPECT_EQ(again.at("primary_white"), lineId);
    EXPECT_EQ(store.inserts, 1);
    EXPECT_EQ(store.updates, 1);
    ASSERT_EQ(store.lines.size(), 1u);
    EXPECT_DOUBLE_EQ(store.lines.at(lineId).line.qty, 1.5);
}

TEST(CostExport, ReplaceInsertsWhenReferencedLineIsGone) {
    MemoryCostingStore store;
    LineRefs stale = {{"primary_white", "line-deleted-elsewhere"}};

    LineRefs refs = exportLines(store, "item-1", {sheetLine("primary_white", 2.0)}, stale,
                                ExportMode::Replace);

    EXPECT_NE(refs.at("primary_white"), "line-deleted-elsewhere");
    EXPECT_EQ(store.inserts, 1);
    EXPECT_EQ(store.lines.count(refs.at("primary_white")), 1u);
}

TEST(CostExport, ReplaceDeletesSlotsNoLongerBilled) {
    MemoryCostingStore store;
    LineRefs refs = exportLines(store, "item-1",
                                {sheetLine("primary_white", 2.0), sheetLine("primary_oak", 1.0)},
                                {}, ExportMode::Replace);
    ASSERT_EQ(store.lines.size(), 2u);

    LineRefs after = exportLines(store, "item-1", {sheetLine("primary_white", 2.0)}, refs,
                                 ExportMode::Replace);

    EXPECT_EQ(after.size(), 1u);
    EXPECT_EQ(after.count("primary_oak"), 0u);
    EXPECT_EQ(store.lines.size(), 1u);
}

TEST(CostExport, FailedDeleteStillDropsReference) {
    MemoryCostingStore store;
    LineRefs refs = exportLines(store, "item-1", {sheetLine("primary_oak", 1.0)}, {},
                                ExportMode::Replace);
    store.failDeletes = true;

    LineRefs after = exportLines(store, "item-1", {}, refs, ExportMode::Replace);

    EXPECT_TRUE(after.empty());
    EXPECT_EQ(store.lines.size(), 1u);
}

TEST(CostExport, AppendKeepsPriorLines) {
    MemoryCostingStore store;
    LineRefs refs = exportLines(store, "item-1", {sheetLine("primary_white", 2.0)}, {},
                                ExportMode::Append);
    LineRefs after = exportLines(store, "item-1", {sheetLine("primary_white", 3.0)}, refs,
                                 ExportMode::Append);

    EXPECT_EQ(store.lines.size(), 2u);
    EXPECT_EQ(store.updates, 0);
    EXPECT_NE(after.at("primary_white"), refs.at("primary_white"));
}

TEST(CostExport, ParsesExportMode) {
    EXPECT_EQ(parseExportMode("replace"), ExportMode::Replace);
    EXPECT_EQ(parseExportMode("append"), ExportMode::Append);
    EXPECT_THROW(parseExportMode("merge"), std::invalid_argument);
}
