/**
 * Export of a summary to the quote costing store.
 *
 * Every costing line belongs to a slot: primary_<materialId>,
 * edging_<materialId>, backer (backer_<materialId> once several backer
 * boards are billed) and, when asked for, the legacy band16 and band32
 * totals. The slot references returned by an export are kept in the
 * snapshot's lineRefs so the next export updates the same lines.
 */

#ifndef CUTLIST_COST_EXPORT_HPP
#define CUTLIST_COST_EXPORT_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace cutlist {

struct ExportLine {
    std::string slot;
    std::string description;
    double qty = 0.0;
    std::string unit;
    std::optional<double> unit_cost;
    std::optional<std::string> component_reference;
};

enum class ExportMode {
    Replace,
    Append
};

ExportMode parseExportMode(const std::string& text);

struct ExportSettings {
    bool include_legacy_band_lines = false;
};

/**
 * Quote costing lines. Failures throw StoreError.
 */
class CostingStore {
public:
    virtual ~CostingStore() = default;

    /** Returns the new line id. */
    virtual std::string insertLine(const std::string& itemId, const ExportLine& line) = 0;
    /** False when no line has this id any more. */
    virtual bool updateLine(const std::string& lineId, const ExportLine& line) = 0;
    virtual void deleteLine(const std::string& lineId) = 0;
};

/** Slot of a primary board line. */
std::string primarySlot(const std::string& materialId);
/** Slot of an edging material line. */
std::string edgingSlot(const std::string& materialId);
/** "backer" while a single backer board is billed, backer_<materialId> otherwise. */
std::string backerSlot(const std::string& materialId, std::size_t backerBoardCount);

/**
 * Costing lines for a summary. Sheet quantities are billable sheets, edging
 * quantities metres; all rounded to three decimals. Lines with nothing to
 * bill are left out.
 */
std::vector<ExportLine> buildExportLines(const CutlistSummary& summary,
                                         const InputSnapshot& snapshot,
                                         const ExportSettings& settings = {});

/**
 * Write `lines` for one quote item and return the updated slot references.
 *
 * Replace updates the line each slot already references (inserting when it
 * is gone) and deletes the lines of slots that no longer bill anything.
 * Append leaves every prior line alone and inserts the new ones.
 */
LineRefs exportLines(CostingStore& store, const std::string& itemId,
                     const std::vector<ExportLine>& lines, const LineRefs& existingRefs,
                     ExportMode mode);

/** buildExportLines followed by exportLines. */
LineRefs exportSummary(CostingStore& store, const std::string& itemId,
                       const CutlistSummary& summary, const InputSnapshot& snapshot,
                       const LineRefs& existingRefs, ExportMode mode,
                       const ExportSettings& settings = {});

} // namespace cutlist

#endif // CUTLIST_COST_EXPORT_HPP
