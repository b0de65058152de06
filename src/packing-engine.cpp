#include "packing-engine.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <functional>
#include <random>
#include <utility>

#include "log.hpp"

namespace cutlist {

namespace {

constexpr double kEpsilon = 1e-6;
constexpr double kFineKerfStep = 0.25;
constexpr double kFineKerfLimit = 8.0;
constexpr double kCoarseKerfRatio = 1.5;

using OrderKey = std::function<double(const PackItem&)>;

/**
 * Stable re-sort by a descending key; ties keep the base order.
 */
std::vector<PackItem> orderedBy(const std::vector<PackItem>& base, const OrderKey& key) {
    std::vector<PackItem> order = base;
    std::stable_sort(order.begin(), order.end(), [&key](const PackItem& a, const PackItem& b) {
        return key(a) > key(b);
    });
    return order;
}

/**
 * Uniform double in [0, 1) from the top 24 bits of one draw.
 */
double unitDraw(std::mt19937& rng) {
    return static_cast<double>(rng() >> 8) * (1.0 / 16777216.0);
}

std::size_t indexDraw(std::mt19937& rng, std::size_t n) {
    return static_cast<std::size_t>(rng() % static_cast<std::uint32_t>(n));
}

/**
 * Mutate a packing order in place: swap, insert, reverse a run, or flip an
 * item's rotation preference.
 */
void applyRandomMove(std::vector<PackItem>& order, std::mt19937& rng) {
    const std::size_t n = order.size();
    unsigned move = n < 2 ? 3u : rng() % 4u;

    if (move == 3) {
        std::vector<std::size_t> rotatable;
        for (std::size_t i = 0; i < n; ++i) {
            if (order[i].canRotate()) {
                rotatable.push_back(i);
            }
        }
        if (!rotatable.empty()) {
            auto& item = order[rotatable[indexDraw(rng, rotatable.size())]];
            item.prefer_rotated = !item.prefer_rotated;
            return;
        }
        if (n < 2) {
            return;
        }
        move = 0;
    }

    std::size_t i = indexDraw(rng, n);
    std::size_t j = indexDraw(rng, n - 1);
    if (j >= i) {
        ++j;
    }

    switch (move) {
        case 0:
            std::swap(order[i], order[j]);
            break;
        case 1: {
            PackItem item = order[i];
            order.erase(order.begin() + static_cast<std::ptrdiff_t>(i));
            order.insert(order.begin() + static_cast<std::ptrdiff_t>(j), item);
            break;
        }
        default:
            if (i > j) {
                std::swap(i, j);
            }
            std::reverse(order.begin() + static_cast<std::ptrdiff_t>(i),
                         order.begin() + static_cast<std::ptrdiff_t>(j) + 1);
            break;
    }
}

/**
 * Fewest sheets the instances could cover by area alone.
 */
int sheetLowerBound(const std::vector<PackItem>& items, double sheetArea) {
    double partArea = 0.0;
    for (const auto& item : items) {
        partArea += item.area();
    }
    return static_cast<int>(std::ceil(partArea / sheetArea - kEpsilon));
}

} // namespace

std::vector<double> layoutKerfs(const std::vector<Part>& parts, double sheetWidthMm,
                                double sheetLengthMm, double kerfMm) {
    if (parts.empty()) {
        return {kerfMm};
    }

    double limit = maxFittingKerf(parts.front(), sheetWidthMm, sheetLengthMm);
    for (const auto& part : parts) {
        limit = std::min(limit, maxFittingKerf(part, sheetWidthMm, sheetLengthMm));
    }
    if (limit < kerfMm) {
        return {kerfMm};
    }

    std::vector<double> kerfs;
    auto add = [&](double point) {
        if (point >= kerfMm - 1e-9 && point < limit - 1e-9) {
            kerfs.push_back(point);
        }
    };
    for (int i = 0; i * kFineKerfStep <= kFineKerfLimit; ++i) {
        add(i * kFineKerfStep);
    }
    for (double point = kFineKerfLimit * kCoarseKerfRatio; point < limit;
         point *= kCoarseKerfRatio) {
        add(point);
    }
    kerfs.push_back(limit);
    return kerfs;
}

bool isBetterLayout(const PackingResult& candidate, const PackingResult& incumbent) {
    if (candidate.sheetCount() != incumbent.sheetCount()) {
        return candidate.sheetCount() < incumbent.sheetCount();
    }
    if (std::fabs(candidate.trapped_waste_mm2 - incumbent.trapped_waste_mm2) > kEpsilon) {
        return candidate.trapped_waste_mm2 < incumbent.trapped_waste_mm2;
    }
    return candidate.free_rect_count < incumbent.free_rect_count;
}

PackingEngine::PackingEngine(const BoardMaterial& board, double kerfMm, ComputeOptions options)
    : board_(board), kerf_(kerfMm), options_(std::move(options)) {}

std::vector<PackItem> PackingEngine::expandInstances(const std::vector<Part>& parts) {
    std::vector<PackItem> items;
    for (const auto& part : parts) {
        const int pieces = part.quantity * boardLayers(part);
        for (int i = 0; i < pieces; ++i) {
            items.push_back(PackItem{&part, i + 1, false});
        }
    }

    std::sort(items.begin(), items.end(), [](const PackItem& a, const PackItem& b) {
        double areaA = a.area();
        double areaB = b.area();
        if (areaA != areaB) {
            return areaA > areaB;
        }
        double sideA = std::max(a.part->length_mm, a.part->width_mm);
        double sideB = std::max(b.part->length_mm, b.part->width_mm);
        if (sideA != sideB) {
            return sideA > sideB;
        }
        if (a.part->id != b.part->id) {
            return a.part->id < b.part->id;
        }
        return a.instance < b.instance;
    });
    return items;
}

Result<PackingResult> PackingEngine::pack(const std::vector<Part>& parts,
                                          OptimizationPriority priority) const {
    for (const auto& part : parts) {
        if (!fitsEmptySheet(part, board_.sheet_width_mm, board_.sheet_length_mm, kerf_)) {
            return makeError(ErrorKind::PartExceedsSheet,
                             "part does not fit an empty " + board_.id + " sheet in any allowed "
                             "orientation",
                             part.id, board_.id);
        }
    }

    const auto startTime = Clock::now();
    std::vector<PackItem> sorted = expandInstances(parts);
    const int lowerBound = sheetLowerBound(sorted, board_.sheetArea());

    PackingResult result;
    bool first = true;
    for (double kerf : layoutKerfs(parts, board_.sheet_width_mm, board_.sheet_length_mm, kerf_)) {
        PackingResult candidate = packAt(sorted, priority, kerf, startTime);
        if (first || candidate.sheetCount() < result.sheetCount()) {
            if (!first) {
                logDebug("Layout of ", board_.id, " at kerf ", kerf, "mm needs ",
                         candidate.sheetCount(), " sheet(s), down from ", result.sheetCount());
            }
            result = std::move(candidate);
            first = false;
        }
        if (result.sheetCount() <= lowerBound) {
            break;
        }
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                       Clock::now() - startTime)
                       .count();
    logInfo("Packed ", sorted.size(), " instance(s) of ", board_.id, " onto ",
            result.sheetCount(), " sheet(s) [", priorityName(priority), ", ", elapsed, "ms]");
    return result;
}

PackingResult PackingEngine::packAt(const std::vector<PackItem>& sorted,
                                    OptimizationPriority priority, double kerf,
                                    Clock::time_point startTime) const {
    switch (priority) {
        case OptimizationPriority::Fast:
            return packFast(sorted, kerf);
        case OptimizationPriority::Offcut:
            return packOffcut(sorted, kerf);
        case OptimizationPriority::Deep:
            return packDeep(sorted, kerf, startTime);
    }
    return packFast(sorted, kerf);
}

PackingResult PackingEngine::packSequence(const std::vector<PackItem>& sequence, double kerf,
                                          bool reuseOffcuts) const {
    SheetPacker packer(board_.sheet_width_mm, board_.sheet_length_mm, kerf, reuseOffcuts);
    packer.pack(sequence);

    PackingResult result;
    result.sheets = packer.takeSheets();
    for (const auto& sheet : result.sheets) {
        double maxX = 0.0;
        double maxY = 0.0;
        for (const auto& p : sheet.placements) {
            maxX = std::max(maxX, p.x + p.width_used + kerf);
            maxY = std::max(maxY, p.y + p.length_used + kerf);
        }
        maxX = std::min(maxX, board_.sheet_width_mm);
        maxY = std::min(maxY, board_.sheet_length_mm);
        result.trapped_waste_mm2 += std::max(0.0, maxX * maxY - sheet.used_area_mm2);
        result.free_rect_count += sheet.free_rects.size();
    }
    return result;
}

PackingResult PackingEngine::packFast(const std::vector<PackItem>& sorted, double kerf) const {
    return packSequence(sorted, kerf, false);
}

PackingResult PackingEngine::packOffcut(const std::vector<PackItem>& sorted, double kerf) const {
    PackingResult reused = packSequence(sorted, kerf, true);
    PackingResult shelvesOnly = packSequence(sorted, kerf, false);

    // Offcut reuse is greedy too; it must never cost a sheet over plain shelves
    if (reused.sheetCount() > shelvesOnly.sheetCount()) {
        logDebug("Offcut reuse on ", board_.id, " needed ", reused.sheetCount(),
                 " sheet(s), keeping the ", shelvesOnly.sheetCount(), "-sheet shelf layout");
        return shelvesOnly;
    }
    return reused;
}

PackingResult PackingEngine::packDeep(const std::vector<PackItem>& sorted, double kerf,
                                      Clock::time_point startTime) const {
    PackingResult best = packOffcut(sorted, kerf);
    if (sorted.empty()) {
        return best;
    }

    const double sheetArea = board_.sheetArea();
    const int lowerBound = sheetLowerBound(sorted, sheetArea);

    int evaluated = 0;
    auto canContinue = [&]() {
        if (options_.cancelled() || evaluated >= options_.deep_iterations) {
            return false;
        }
        if (best.sheetCount() <= lowerBound && best.trapped_waste_mm2 <= kEpsilon) {
            return false;
        }
        if (options_.deep_time_budget_ms > 0) {
            auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
                               Clock::now() - startTime)
                               .count();
            if (elapsed >= options_.deep_time_budget_ms) {
                return false;
            }
        }
        return true;
    };

    // Seed orders
    std::vector<PackItem> currentOrder = sorted;
    PackingResult current = packSequence(sorted, kerf, true);
    const std::vector<OrderKey> seedKeys = {
        [](const PackItem& i) { return std::max(i.part->length_mm, i.part->width_mm); },
        [](const PackItem& i) { return i.part->width_mm; },
        [](const PackItem& i) { return i.part->length_mm; },
        [](const PackItem& i) { return i.part->length_mm + i.part->width_mm; },
    };
    for (const auto& key : seedKeys) {
        if (!canContinue()) {
            break;
        }
        std::vector<PackItem> order = orderedBy(sorted, key);
        PackingResult candidate = packSequence(order, kerf, true);
        ++evaluated;
        if (isBetterLayout(candidate, current)) {
            current = candidate;
            currentOrder = std::move(order);
        }
        if (isBetterLayout(candidate, best)) {
            best = std::move(candidate);
        }
    }

    // Annealing walk over orders, energy in percent of one sheet
    auto energy = [sheetArea](const PackingResult& r) {
        return r.sheetCount() * 100.0 + r.trapped_waste_mm2 / sheetArea * 100.0;
    };

    std::mt19937 rng(options_.seed);
    const int walkLength = std::max(1, options_.deep_iterations - evaluated);
    const double startTemperature = 5.0;
    const double cooling = std::pow(0.01, 1.0 / walkLength);
    double temperature = startTemperature;

    while (canContinue()) {
        std::vector<PackItem> order = currentOrder;
        applyRandomMove(order, rng);
        PackingResult candidate = packSequence(order, kerf, true);
        ++evaluated;

        double delta = energy(candidate) - energy(current);
        bool accept = delta <= 0.0 || unitDraw(rng) < std::exp(-delta / temperature);
        if (isBetterLayout(candidate, best)) {
            best = candidate;
        }
        if (accept) {
            current = std::move(candidate);
            currentOrder = std::move(order);
        }
        temperature *= cooling;
    }

    best.candidates_evaluated = evaluated;
    if (options_.cancelled()) {
        logDebug("Deep search on ", board_.id, " cancelled after ", evaluated, " candidate(s)");
    } else {
        logDebug("Deep search on ", board_.id, " evaluated ", evaluated, " candidate(s), best ",
                 best.sheetCount(), " sheet(s)");
    }
    return best;
}

} // namespace cutlist
