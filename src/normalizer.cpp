#include "normalizer.hpp"

#include <algorithm>
#include <limits>
#include <map>
#include <set>
#include <sstream>

#include "log.hpp"

namespace cutlist {

namespace {

std::string formatMm(double value) {
    std::ostringstream out;
    out << value << "mm";
    return out.str();
}

std::optional<ValidationError> checkBoards(const std::vector<BoardMaterial>& boards,
                                           const char* role) {
    const BoardMaterial* defaultBoard = nullptr;
    for (const auto& board : boards) {
        if (!(board.sheet_length_mm > 0.0) || !(board.sheet_width_mm > 0.0)) {
            return makeError(ErrorKind::InvalidDimension,
                             std::string(role) + " board sheet dimensions must be positive", {},
                             board.id);
        }
        if (!(board.thickness_mm > 0.0)) {
            return makeError(ErrorKind::InvalidDimension,
                             std::string(role) + " board thickness must be positive", {}, board.id);
        }
        if (!(board.cost_per_sheet >= 0.0)) {
            return makeError(ErrorKind::InvalidDimension,
                             std::string(role) + " board cost must not be negative", {}, board.id);
        }
        if (board.is_default) {
            if (defaultBoard != nullptr) {
                return makeError(ErrorKind::AmbiguousDefault,
                                 std::string("more than one default ") + role + " board: " +
                                     defaultBoard->id + ", " + board.id,
                                 {}, board.id);
            }
            defaultBoard = &board;
        }
    }
    return std::nullopt;
}

std::optional<ValidationError> checkEdging(const std::vector<EdgingMaterial>& edging) {
    std::map<double, const EdgingMaterial*> defaults;
    for (const auto& material : edging) {
        if (!(material.thickness_mm > 0.0)) {
            return makeError(ErrorKind::InvalidDimension, "edging thickness must be positive", {},
                             material.id);
        }
        if (!(material.cost_per_meter >= 0.0)) {
            return makeError(ErrorKind::InvalidDimension, "edging cost must not be negative", {},
                             material.id);
        }
        if (!material.is_default_for_thickness) {
            continue;
        }
        auto inserted = defaults.emplace(material.thickness_mm, &material);
        if (!inserted.second) {
            return makeError(ErrorKind::AmbiguousDefault,
                             "more than one default edging for " + formatMm(material.thickness_mm) +
                                 ": " + inserted.first->second->id + ", " + material.id,
                             {}, material.id);
        }
    }
    return std::nullopt;
}

const BoardMaterial* findBoard(const std::vector<BoardMaterial>& boards, const std::string& id) {
    auto it = std::find_if(boards.begin(), boards.end(),
                           [&id](const BoardMaterial& board) { return board.id == id; });
    return it == boards.end() ? nullptr : &*it;
}

const BoardMaterial* findDefaultBoard(const std::vector<BoardMaterial>& boards) {
    auto it = std::find_if(boards.begin(), boards.end(),
                           [](const BoardMaterial& board) { return board.is_default; });
    return it == boards.end() ? nullptr : &*it;
}

const EdgingMaterial* findDefaultEdging(const std::vector<EdgingMaterial>& edging,
                                        double thicknessMm) {
    auto it = std::find_if(edging.begin(), edging.end(), [thicknessMm](const EdgingMaterial& e) {
        return e.is_default_for_thickness && e.thickness_mm == thicknessMm;
    });
    return it == edging.end() ? nullptr : &*it;
}

} // namespace

const EdgingMaterial* NormalizedInput::findEdging(const std::string& id) const {
    auto it = std::find_if(edging.begin(), edging.end(),
                           [&id](const EdgingMaterial& e) { return e.id == id; });
    return it == edging.end() ? nullptr : &*it;
}

Result<NormalizedInput> normalize(const InputSnapshot& snapshot) {
    if (!(snapshot.kerf_mm >= 0.0)) {
        return makeError(ErrorKind::InvalidDimension,
                         "kerf must not be negative, got " + formatMm(snapshot.kerf_mm));
    }

    if (auto error = checkBoards(snapshot.primary_boards, "primary")) {
        return *error;
    }
    if (auto error = checkBoards(snapshot.backer_boards, "backer")) {
        return *error;
    }
    if (auto error = checkEdging(snapshot.edging)) {
        return *error;
    }

    // Part dimensions and quantities
    double smallestSide = std::numeric_limits<double>::infinity();
    std::string smallestPartId;
    for (const auto& part : snapshot.parts) {
        if (!(part.length_mm > 0.0) || !(part.width_mm > 0.0) || !(part.thickness_mm > 0.0)) {
            return makeError(ErrorKind::InvalidDimension,
                             "part dimensions must be positive", part.id);
        }
        if (part.quantity <= 0) {
            return makeError(ErrorKind::InvalidQuantity,
                             "part quantity must be positive, got " +
                                 std::to_string(part.quantity),
                             part.id);
        }
        double side = std::min(part.length_mm, part.width_mm);
        if (side < smallestSide) {
            smallestSide = side;
            smallestPartId = part.id;
        }
    }

    std::set<std::string> seenIds;
    for (const auto& part : snapshot.parts) {
        if (!seenIds.insert(part.id).second) {
            return makeError(ErrorKind::DuplicatePartId,
                             "part id '" + part.id + "' is used by more than one part", part.id);
        }
    }

    if (!snapshot.parts.empty() && snapshot.kerf_mm >= smallestSide) {
        return makeError(ErrorKind::KerfTooLarge,
                         "kerf " + formatMm(snapshot.kerf_mm) +
                             " is not smaller than the smallest part side " +
                             formatMm(smallestSide),
                         smallestPartId);
    }

    NormalizedInput normalized;
    normalized.edging = snapshot.edging;
    normalized.kerf_mm = snapshot.kerf_mm;
    normalized.priority = snapshot.priority;
    normalized.lamination_enabled = snapshot.lamination_enabled;
    normalized.sheet_overrides = snapshot.sheet_overrides;
    normalized.global_full_board = snapshot.global_full_board;
    normalized.backer_sheet_overrides = snapshot.backer_sheet_overrides;
    normalized.backer_global_full_board = snapshot.backer_global_full_board;

    const BoardMaterial* defaultPrimary = findDefaultBoard(snapshot.primary_boards);
    std::map<std::string, std::vector<Part>> partsByBoard;
    std::set<std::string> usedBackers;

    for (const auto& source : snapshot.parts) {
        Part part = source;

        // Board
        const BoardMaterial* board = nullptr;
        if (part.material_id) {
            board = findBoard(snapshot.primary_boards, *part.material_id);
            if (board == nullptr) {
                return makeError(ErrorKind::UnknownMaterial,
                                 "part references unknown board '" + *part.material_id + "'",
                                 part.id, *part.material_id);
            }
        } else {
            if (defaultPrimary == nullptr) {
                return makeError(ErrorKind::NoDefaultMaterial,
                                 "part has no board and no default primary board is set",
                                 part.id);
            }
            board = defaultPrimary;
            part.material_id = board->id;
        }

        LaminationType lamination =
            snapshot.lamination_enabled ? part.lamination.value_or(LaminationType::WithBacker)
                                        : LaminationType::None;
        part.lamination = lamination;

        // Edging per banded edge, defaulting by finished thickness
        for (std::size_t e = 0; e < kEdgeCount; ++e) {
            EdgeBand& edge = part.edges[e];
            if (!edge.banded) {
                edge.edging_material_id.reset();
                continue;
            }
            if (edge.edging_material_id) {
                if (normalized.findEdging(*edge.edging_material_id) == nullptr) {
                    return makeError(ErrorKind::UnknownMaterial,
                                     "part references unknown edging '" +
                                         *edge.edging_material_id + "'",
                                     part.id, *edge.edging_material_id);
                }
                continue;
            }
            double thickness = finishedThickness(part);
            const EdgingMaterial* edging = findDefaultEdging(snapshot.edging, thickness);
            if (edging == nullptr) {
                return makeError(ErrorKind::NoDefaultMaterial,
                                 std::string("banded ") + edgeName(static_cast<Edge>(e)) +
                                     " edge needs a default edging for " + formatMm(thickness),
                                 part.id);
            }
            edge.edging_material_id = edging->id;
        }

        // Backer board
        if (lamination == LaminationType::WithBacker) {
            const std::optional<std::string>& backerId =
                part.backer_material_id ? part.backer_material_id : snapshot.backer_material_id;
            const BoardMaterial* backer = nullptr;
            if (backerId) {
                backer = findBoard(snapshot.backer_boards, *backerId);
                if (backer == nullptr) {
                    return makeError(ErrorKind::UnknownMaterial,
                                     "unknown backer board '" + *backerId + "'", part.id,
                                     *backerId);
                }
            } else {
                backer = findDefaultBoard(snapshot.backer_boards);
                if (backer == nullptr) {
                    return makeError(ErrorKind::NoBackerMaterial,
                                     "laminated part has no backer board and no default backer "
                                     "board is set",
                                     part.id);
                }
            }
            part.backer_material_id = backer->id;
            usedBackers.insert(backer->id);
        } else {
            part.backer_material_id.reset();
        }

        partsByBoard[board->id].push_back(std::move(part));
    }

    for (const auto& backer : snapshot.backer_boards) {
        if (usedBackers.count(backer.id) != 0) {
            normalized.backer_boards.push_back(backer);
        }
    }

    // Groups follow the catalog order of the primary boards
    for (const auto& board : snapshot.primary_boards) {
        auto it = partsByBoard.find(board.id);
        if (it == partsByBoard.end()) {
            continue;
        }
        normalized.groups.push_back(MaterialGroup{board, std::move(it->second)});
    }

    logDebug("Normalized ", snapshot.parts.size(), " part(s) into ", normalized.groups.size(),
             " material group(s)");
    return normalized;
}

} // namespace cutlist
