#ifndef CUTLIST_PACKING_ENGINE_HPP
#define CUTLIST_PACKING_ENGINE_HPP

#include <chrono>
#include <cstddef>
#include <vector>

#include "errors.hpp"
#include "options.hpp"
#include "sheet-packer.hpp"
#include "types.hpp"

namespace cutlist {

/**
 * Layout of one material: sheets in opening order.
 */
struct PackingResult {
    std::vector<PackedSheet> sheets;
    /** Area inside each sheet's placement bounding box not covered by parts. */
    double trapped_waste_mm2 = 0.0;
    std::size_t free_rect_count = 0;
    /** Candidate layouts the deep search evaluated; 0 for fast and offcut. */
    int candidates_evaluated = 0;

    int sheetCount() const { return static_cast<int>(sheets.size()); }
};

/**
 * Lexicographic quality order: fewer sheets, then less trapped waste, then
 * fewer free rectangles.
 */
bool isBetterLayout(const PackingResult& candidate, const PackingResult& incumbent);

/**
 * Kerfs a layout for `kerfMm` is searched at, ascending: the points of a
 * fixed ladder (quarter millimetres up to 8mm, then 8mm times powers of 1.5)
 * from `kerfMm` up to the largest kerf every part still fits at, followed
 * by that largest kerf. A layout found at a larger kerf stays valid at a
 * smaller one, and the ladder for a smaller kerf contains the ladder for a
 * larger one, so keeping the fewest sheets over it makes the sheet count
 * non-decreasing in the kerf.
 */
std::vector<double> layoutKerfs(const std::vector<Part>& parts, double sheetWidthMm,
                                double sheetLengthMm, double kerfMm);

/**
 * Packs the parts of one board material.
 */
class PackingEngine {
public:
    PackingEngine(const BoardMaterial& board, double kerfMm, ComputeOptions options = {});

    /**
     * Place every instance of every part. Fails with PartExceedsSheet if an
     * instance fits no empty sheet in any allowed orientation.
     *
     * The strategy runs at each of layoutKerfs() and the first layout with
     * the fewest sheets is kept, stopping early once the area lower bound is
     * reached. Placements always respect the requested kerf.
     */
    Result<PackingResult> pack(const std::vector<Part>& parts, OptimizationPriority priority) const;

    /**
     * Instances in packing order: descending area, longer side, part id,
     * instance. A SameBoard part yields two pieces per finished part.
     */
    static std::vector<PackItem> expandInstances(const std::vector<Part>& parts);

private:
    using Clock = std::chrono::steady_clock;

    PackingResult packAt(const std::vector<PackItem>& sorted, OptimizationPriority priority,
                         double kerf, Clock::time_point startTime) const;
    PackingResult packSequence(const std::vector<PackItem>& sequence, double kerf,
                               bool reuseOffcuts) const;
    PackingResult packFast(const std::vector<PackItem>& sorted, double kerf) const;
    PackingResult packOffcut(const std::vector<PackItem>& sorted, double kerf) const;
    PackingResult packDeep(const std::vector<PackItem>& sorted, double kerf,
                           Clock::time_point startTime) const;

    BoardMaterial board_;
    double kerf_;
    ComputeOptions options_;
};

} // namespace cutlist

#endif // CUTLIST_PACKING_ENGINE_HPP
