#include "sheet-packer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace cutlist {

namespace {

constexpr double kEpsilon = 1e-6;

bool fitsWithin(double needed, double available) {
    return needed <= available + kEpsilon;
}

} // namespace

bool fitsEmptySheet(const Part& part, double sheetWidthMm, double sheetLengthMm, double kerfMm) {
    double w = part.width_mm + kerfMm;
    double l = part.length_mm + kerfMm;
    if (fitsWithin(w, sheetWidthMm) && fitsWithin(l, sheetLengthMm)) {
        return true;
    }
    return !part.grain_locked && fitsWithin(l, sheetWidthMm) && fitsWithin(w, sheetLengthMm);
}

double maxFittingKerf(const Part& part, double sheetWidthMm, double sheetLengthMm) {
    double best = std::min(sheetWidthMm - part.width_mm, sheetLengthMm - part.length_mm);
    if (!part.grain_locked) {
        best = std::max(best, std::min(sheetWidthMm - part.length_mm,
                                       sheetLengthMm - part.width_mm));
    }
    return best;
}

SheetPacker::SheetPacker(double sheetWidthMm, double sheetLengthMm, double kerfMm,
                         bool reuseOffcuts)
    : sheetWidth_(sheetWidthMm),
      sheetLength_(sheetLengthMm),
      kerf_(kerfMm),
      reuseOffcuts_(reuseOffcuts) {}

std::vector<SheetPacker::Orientation> SheetPacker::orientations(const PackItem& item) const {
    const Part& part = *item.part;
    Orientation upright{part.width_mm + kerf_, part.length_mm + kerf_, false};
    if (!item.canRotate()) {
        return {upright};
    }
    Orientation turned{part.length_mm + kerf_, part.width_mm + kerf_, true};
    if (item.prefer_rotated) {
        return {turned, upright};
    }
    return {upright, turned};
}

void SheetPacker::pack(const std::vector<PackItem>& sequence) {
    for (const auto& item : sequence) {
        if (placeOnShelf(item) || openShelf(item)) {
            continue;
        }
        if (reuseOffcuts_ && placeInOffcut(item)) {
            continue;
        }
        openSheet();
        if (!openShelf(item)) {
            throw std::logic_error("part " + item.part->id + " does not fit an empty sheet");
        }
    }
    finish();
}

std::vector<PackedSheet> SheetPacker::takeSheets() {
    finish();
    return std::move(sheets_);
}

bool SheetPacker::placeOnShelf(const PackItem& item) {
    if (!hasShelf_) {
        return false;
    }

    // Rotation only wins when it leaves less dead space under the shelf top
    const Orientation* best = nullptr;
    double bestWaste = 0.0;
    auto options = orientations(item);
    for (const auto& o : options) {
        if (!fitsWithin(shelf_.cursor + o.w, sheetWidth_) || !fitsWithin(o.h, shelf_.height)) {
            continue;
        }
        double waste = (shelf_.height - o.h) * o.w;
        if (best == nullptr || waste < bestWaste - kEpsilon) {
            best = &o;
            bestWaste = waste;
        }
    }
    if (best == nullptr) {
        return false;
    }

    std::size_t sheetIndex = sheets_.size() - 1;
    record(sheetIndex, item, *best, shelf_.cursor, shelf_.y);
    addFreeRect(sheetIndex, Rect{shelf_.cursor, shelf_.y + best->h, best->w, shelf_.height - best->h});
    shelf_.cursor += best->w;
    return true;
}

bool SheetPacker::openShelf(const PackItem& item) {
    if (sheets_.empty()) {
        return false;
    }

    double y = hasShelf_ ? shelf_.y + shelf_.height : 0.0;
    for (const auto& o : orientations(item)) {
        if (!fitsWithin(o.w, sheetWidth_) || !fitsWithin(y + o.h, sheetLength_)) {
            continue;
        }
        closeShelf();
        shelf_ = Shelf{y, o.h, 0.0};
        hasShelf_ = true;
        record(sheets_.size() - 1, item, o, 0.0, y);
        shelf_.cursor = o.w;
        return true;
    }
    return false;
}

bool SheetPacker::placeInOffcut(const PackItem& item) {
    struct Candidate {
        std::size_t sheet;
        std::size_t rect;
        Orientation orientation;
        double leftover;
        std::size_t resultingRects;
    };

    auto splitCount = [this](const Rect& r, const Orientation& o) {
        double remW = r.w - o.w;
        double remH = r.h - o.h;
        std::size_t count = 0;
        if (remW > kerf_ + kEpsilon) {
            ++count;
        }
        if (remH > kerf_ + kEpsilon) {
            ++count;
        }
        return count;
    };

    bool found = false;
    Candidate best{0, 0, Orientation{0.0, 0.0, false}, 0.0, 0};
    auto options = orientations(item);

    for (std::size_t s = 0; s < sheets_.size(); ++s) {
        const auto& freeRects = sheets_[s].free_rects;
        for (std::size_t i = 0; i < freeRects.size(); ++i) {
            const Rect& r = freeRects[i];
            for (const auto& o : options) {
                if (!fitsWithin(o.w, r.w) || !fitsWithin(o.h, r.h)) {
                    continue;
                }
                double leftover = r.area() - o.w * o.h;
                std::size_t resulting = freeRects.size() - 1 + splitCount(r, o);
                bool better = !found || leftover < best.leftover - kEpsilon ||
                              (std::fabs(leftover - best.leftover) <= kEpsilon &&
                               resulting < best.resultingRects);
                if (better) {
                    best = Candidate{s, i, o, leftover, resulting};
                    found = true;
                }
            }
        }
    }
    if (!found) {
        return false;
    }

    auto& freeRects = sheets_[best.sheet].free_rects;
    Rect r = freeRects[best.rect];
    const Orientation& o = best.orientation;
    record(best.sheet, item, o, r.x, r.y);

    // Guillotine split keeping the larger remnant whole
    double remW = r.w - o.w;
    double remH = r.h - o.h;
    Rect right;
    Rect top;
    if (r.w * remH >= remW * r.h) {
        right = Rect{r.x + o.w, r.y, remW, o.h};
        top = Rect{r.x, r.y + o.h, r.w, remH};
    } else {
        right = Rect{r.x + o.w, r.y, remW, r.h};
        top = Rect{r.x, r.y + o.h, o.w, remH};
    }

    freeRects.erase(freeRects.begin() + static_cast<std::ptrdiff_t>(best.rect));
    auto at = freeRects.begin() + static_cast<std::ptrdiff_t>(best.rect);
    if (top.w > kerf_ + kEpsilon && top.h > kerf_ + kEpsilon) {
        at = freeRects.insert(at, top);
    }
    if (right.w > kerf_ + kEpsilon && right.h > kerf_ + kEpsilon) {
        freeRects.insert(at, right);
    }
    return true;
}

void SheetPacker::openSheet() {
    closeSheet();
    sheets_.emplace_back();
    hasShelf_ = false;
}

void SheetPacker::closeShelf() {
    if (!hasShelf_ || sheets_.empty()) {
        return;
    }
    addFreeRect(sheets_.size() - 1,
                Rect{shelf_.cursor, shelf_.y, sheetWidth_ - shelf_.cursor, shelf_.height});
}

void SheetPacker::closeSheet() {
    if (sheets_.empty()) {
        return;
    }
    double top = hasShelf_ ? shelf_.y + shelf_.height : 0.0;
    closeShelf();
    addFreeRect(sheets_.size() - 1, Rect{0.0, top, sheetWidth_, sheetLength_ - top});
    hasShelf_ = false;
}

void SheetPacker::finish() {
    if (finished_) {
        return;
    }
    closeSheet();
    finished_ = true;
}

void SheetPacker::record(std::size_t sheetIndex, const PackItem& item, const Orientation& o,
                         double x, double y) {
    const Part& part = *item.part;
    Placement placement;
    placement.part_id = part.id;
    placement.instance = item.instance;
    placement.x = x;
    placement.y = y;
    placement.rotated = o.rotated;
    placement.width_used = o.rotated ? part.length_mm : part.width_mm;
    placement.length_used = o.rotated ? part.width_mm : part.length_mm;

    auto& sheet = sheets_[sheetIndex];
    sheet.placements.push_back(placement);
    sheet.used_area_mm2 += part.length_mm * part.width_mm;
}

void SheetPacker::addFreeRect(std::size_t sheetIndex, const Rect& rect) {
    // Anything no wider than one kerf cannot hold a part
    if (rect.w <= kerf_ + kEpsilon || rect.h <= kerf_ + kEpsilon) {
        return;
    }
    sheets_[sheetIndex].free_rects.push_back(rect);
}

} // namespace cutlist
