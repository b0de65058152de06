#include "errors.hpp"

#include <tuple>

namespace cutlist {

const char* errorKindName(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::InvalidDimension: return "InvalidDimension";
        case ErrorKind::InvalidQuantity: return "InvalidQuantity";
        case ErrorKind::KerfTooLarge: return "KerfTooLarge";
        case ErrorKind::PartExceedsSheet: return "PartExceedsSheet";
        case ErrorKind::NoDefaultMaterial: return "NoDefaultMaterial";
        case ErrorKind::NoBackerMaterial: return "NoBackerMaterial";
        case ErrorKind::UnknownMaterial: return "UnknownMaterial";
        case ErrorKind::AmbiguousDefault: return "AmbiguousDefault";
        case ErrorKind::DuplicatePartId: return "DuplicatePartId";
    }
    return "InvalidDimension";
}

std::string ValidationError::describe() const {
    std::string text = std::string(errorKindName(kind)) + ": " + message;
    if (!part_id.empty()) {
        text += " (part " + part_id + ")";
    }
    if (!material_id.empty()) {
        text += " (material " + material_id + ")";
    }
    return text;
}

bool operator==(const ValidationError& a, const ValidationError& b) {
    return std::tie(a.kind, a.message, a.part_id, a.material_id) ==
           std::tie(b.kind, b.message, b.part_id, b.material_id);
}

ValidationError makeError(ErrorKind kind, std::string message, std::string partId,
                          std::string materialId) {
    ValidationError error;
    error.kind = kind;
    error.message = std::move(message);
    error.part_id = std::move(partId);
    error.material_id = std::move(materialId);
    return error;
}

} // namespace cutlist
