/**
 * Sequence placement primitive shared by all packing strategies.
 *
 * Instances are placed in the given order onto shelves of the current
 * sheet. In offcut mode every sheet also keeps a list of free rectangles
 * (gaps above short parts, closed shelf tails, the unused bottom of closed
 * sheets) that is searched best-fit before a new sheet is opened.
 *
 * All geometry is expressed in footprint space: a placed part occupies its
 * size plus one kerf to the right and to the top, so footprints tile the
 * sheet without overlapping and every part keeps one kerf of clearance.
 */

#ifndef CUTLIST_SHEET_PACKER_HPP
#define CUTLIST_SHEET_PACKER_HPP

#include <cstddef>
#include <vector>

#include "types.hpp"

namespace cutlist {

struct Rect {
    double x = 0.0;
    double y = 0.0;
    double w = 0.0;
    double h = 0.0;

    double area() const { return w * h; }
};

/**
 * One physical instance of a part, as fed to the packer.
 */
struct PackItem {
    const Part* part = nullptr;
    int instance = 1;
    bool prefer_rotated = false;

    double area() const { return part->length_mm * part->width_mm; }
    bool canRotate() const { return !part->grain_locked && part->length_mm != part->width_mm; }
};

struct PackedSheet {
    std::vector<Placement> placements;
    std::vector<Rect> free_rects;
    double used_area_mm2 = 0.0;
};

class SheetPacker {
public:
    SheetPacker(double sheetWidthMm, double sheetLengthMm, double kerfMm, bool reuseOffcuts);

    /**
     * Place every item of the sequence. Each item must fit an empty sheet in
     * at least one allowed orientation; the caller checks this up front.
     */
    void pack(const std::vector<PackItem>& sequence);

    std::vector<PackedSheet> takeSheets();

private:
    struct Orientation {
        double w;
        double h;
        bool rotated;
    };

    struct Shelf {
        double y = 0.0;
        double height = 0.0;
        double cursor = 0.0;
    };

    std::vector<Orientation> orientations(const PackItem& item) const;

    bool placeOnShelf(const PackItem& item);
    bool openShelf(const PackItem& item);
    bool placeInOffcut(const PackItem& item);
    void openSheet();
    void closeShelf();
    void closeSheet();
    void finish();

    void record(std::size_t sheetIndex, const PackItem& item, const Orientation& o, double x,
                double y);
    void addFreeRect(std::size_t sheetIndex, const Rect& rect);

    double sheetWidth_;
    double sheetLength_;
    double kerf_;
    bool reuseOffcuts_;

    std::vector<PackedSheet> sheets_;
    Shelf shelf_;
    bool hasShelf_ = false;
    bool finished_ = false;
};

/**
 * True if the part fits an empty sheet in at least one allowed orientation.
 */
bool fitsEmptySheet(const Part& part, double sheetWidthMm, double sheetLengthMm, double kerfMm);

/**
 * Largest kerf at which the part still fits an empty sheet; negative if it
 * does not fit even without kerf.
 */
double maxFittingKerf(const Part& part, double sheetWidthMm, double sheetLengthMm);

} // namespace cutlist

#endif // CUTLIST_SHEET_PACKER_HPP
