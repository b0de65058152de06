#include "backer-matcher.hpp"

#include <chrono>
#include <cmath>
#include <map>
#include <string>

#include <libnest2d/libnest2d.hpp>

#include "log.hpp"
#include "sheet-packer.hpp"

namespace cutlist {

namespace {

using Point = libnest2d::PointImpl;
using Item = libnest2d::Item;
using Coord = libnest2d::TCoord<Point>;
using Placer = libnest2d::NfpPlacer;
using Selector = libnest2d::FirstFitSelection;

// libnest2d works on integers: millimetres become micrometres
constexpr double kScale = 1000.0;

Coord toCoord(double mm) {
    return static_cast<Coord>(std::llround(mm * kScale));
}

double toMm(Coord value) {
    return static_cast<double>(value) / kScale;
}

} // namespace

BackerMatcher::BackerMatcher(const BoardMaterial& backer, double kerfMm)
    : backer_(backer), kerf_(kerfMm) {}

std::vector<BackerPanel> BackerMatcher::collectPanels(const NormalizedInput& input,
                                                      const std::vector<PackingResult>& layouts,
                                                      const std::string& backerId) {
    std::vector<BackerPanel> panels;
    for (std::size_t g = 0; g < input.groups.size() && g < layouts.size(); ++g) {
        std::map<std::string, const Part*> laminated;
        for (const auto& part : input.groups[g].parts) {
            if (part.lamination == LaminationType::WithBacker &&
                part.backer_material_id == backerId) {
                laminated[part.id] = &part;
            }
        }
        if (laminated.empty()) {
            continue;
        }

        for (const auto& sheet : layouts[g].sheets) {
            for (const auto& placement : sheet.placements) {
                auto it = laminated.find(placement.part_id);
                if (it != laminated.end()) {
                    panels.push_back(BackerPanel{it->second, placement.instance});
                }
            }
        }
    }
    return panels;
}

Result<std::vector<PackedSheet>> BackerMatcher::nestPanels(
    const std::vector<BackerPanel>& panels) const {
    std::vector<PackedSheet> sheets;
    if (panels.empty()) {
        return sheets;
    }

    for (const auto& panel : panels) {
        Part unlocked = *panel.part;
        unlocked.grain_locked = false;
        if (!fitsEmptySheet(unlocked, backer_.sheet_width_mm, backer_.sheet_length_mm, kerf_)) {
            return makeError(ErrorKind::PartExceedsSheet,
                             "backer panel does not fit an empty " + backer_.id + " sheet",
                             panel.part->id, backer_.id);
        }
    }

    logDebug("Nesting ", panels.size(), " backer panel(s) onto ", backer_.id, " (",
             backer_.sheet_width_mm, " x ", backer_.sheet_length_mm, "mm)");
    auto packStart = std::chrono::steady_clock::now();

    // Each item is the panel footprint: panel size plus one kerf
    std::vector<Item> items;
    items.reserve(panels.size());
    for (const auto& panel : panels) {
        items.emplace_back(libnest2d::Rectangle(toCoord(panel.part->width_mm + kerf_),
                                                toCoord(panel.part->length_mm + kerf_)));
    }

    libnest2d::Box bin(Point(0, 0), Point(toCoord(backer_.sheet_width_mm),
                                          toCoord(backer_.sheet_length_mm)));

    Placer::Config placerConfig;
    placerConfig.rotations = {libnest2d::Radians(0.0), libnest2d::Radians(libnest2d::Pi / 2.0)};
    placerConfig.alignment = Placer::Config::Alignment::DONT_ALIGN;
    placerConfig.starting_point = Placer::Config::Alignment::BOTTOM_LEFT;
    // Serial evaluation keeps equal inputs on equal layouts
    placerConfig.parallel = false;

    std::size_t binCount =
        libnest2d::nest(items, bin, Coord(0), libnest2d::NestConfig<Placer, Selector>(placerConfig));

    auto packDuration = std::chrono::duration_cast<std::chrono::milliseconds>(
                            std::chrono::steady_clock::now() - packStart)
                            .count();

    sheets.resize(binCount);
    for (std::size_t i = 0; i < items.size(); ++i) {
        const Item& item = items[i];
        const Part& part = *panels[i].part;
        if (item.binId() == libnest2d::BIN_ID_UNSET ||
            static_cast<std::size_t>(item.binId()) >= sheets.size()) {
            return makeError(ErrorKind::PartExceedsSheet,
                             "backer panel could not be nested onto " + backer_.id,
                             part.id, backer_.id);
        }

        auto box = item.boundingBox();
        bool rotated = std::abs(std::sin(static_cast<double>(item.rotation()))) > 0.5;

        Placement placement;
        placement.part_id = part.id;
        placement.instance = panels[i].instance;
        placement.x = toMm(libnest2d::getX(box.minCorner()));
        placement.y = toMm(libnest2d::getY(box.minCorner()));
        placement.rotated = rotated;
        placement.width_used = rotated ? part.length_mm : part.width_mm;
        placement.length_used = rotated ? part.width_mm : part.length_mm;

        auto& sheet = sheets[static_cast<std::size_t>(item.binId())];
        sheet.placements.push_back(placement);
        sheet.used_area_mm2 += part.length_mm * part.width_mm;
    }

    logInfo("Nested ", panels.size(), " backer panel(s) onto ", binCount, " ", backer_.id,
            " sheet(s) in ", packDuration, "ms");
    return sheets;
}

} // namespace cutlist
