#ifndef CUTLIST_ERRORS_HPP
#define CUTLIST_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

namespace cutlist {

enum class ErrorKind {
    InvalidDimension,
    InvalidQuantity,
    KerfTooLarge,
    PartExceedsSheet,
    NoDefaultMaterial,
    NoBackerMaterial,
    UnknownMaterial,
    AmbiguousDefault,
    DuplicatePartId
};

const char* errorKindName(ErrorKind kind);

/**
 * Validation or feasibility failure of a compute run. Returned as a value;
 * the run produced no summary at all.
 */
struct ValidationError {
    ErrorKind kind = ErrorKind::InvalidDimension;
    std::string message;
    std::string part_id;
    std::string material_id;

    std::string describe() const;
};

bool operator==(const ValidationError& a, const ValidationError& b);

ValidationError makeError(ErrorKind kind, std::string message, std::string partId = {},
                          std::string materialId = {});

/**
 * Either a value or the ValidationError explaining why there is none.
 */
template <class T>
class Result {
public:
    Result(T value) : state_(std::move(value)) {}
    Result(ValidationError error) : state_(std::move(error)) {}

    bool ok() const { return std::holds_alternative<T>(state_); }
    explicit operator bool() const { return ok(); }

    const T& value() const { return std::get<T>(state_); }
    T& value() { return std::get<T>(state_); }
    const ValidationError& error() const { return std::get<ValidationError>(state_); }

private:
    std::variant<T, ValidationError> state_;
};

/**
 * Failure of a persistence or export side channel. Kept apart from
 * ValidationError: the caller may retry, and its in-memory input is intact.
 */
class StoreError : public std::runtime_error {
public:
    StoreError(const std::string& what, bool retryable)
        : std::runtime_error(what), retryable_(retryable) {}

    bool retryable() const noexcept { return retryable_; }

private:
    bool retryable_;
};

} // namespace cutlist

#endif // CUTLIST_ERRORS_HPP
