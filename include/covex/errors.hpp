#pragma once

/// @file include/covex/errors.hpp
/// @brief Exception types raised by the covex core.
///
/// Recoverable data problems (a malformed row, a missing source column) derive
/// from `std::runtime_error`. A column identifier collision is an invariant
/// violation and derives from `std::logic_error`.

#include <cstddef>
#include <stdexcept>
#include <string>

namespace covex {

/// A raw record whose identity fields (code, name, date) cannot be parsed.
class MalformedRowError : public std::runtime_error {
public:
    MalformedRowError(std::string field, const std::string& reason);

    /// Name of the offending field.
    [[nodiscard]] const std::string& field() const noexcept { return field_; }

private:
    std::string field_;
};

/// A derivation referenced a column the table does not hold.
class MissingColumnError : public std::runtime_error {
public:
    explicit MissingColumnError(std::string slug);

    [[nodiscard]] const std::string& slug() const noexcept { return slug_; }

private:
    std::string slug_;
};

/// Two different column parameter tuples minted the same identifier.
class IdentifierCollisionError : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

}  // namespace covex
