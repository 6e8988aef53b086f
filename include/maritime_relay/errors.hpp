// === Error Types =============================================================
//
// Exception types for failures that the standard hierarchy does not name
// directly. Argument validation throughout the relay uses
// `std::invalid_argument`.

#pragma once

#include <stdexcept>
#include <string>

namespace maritime_relay {

/** @brief Raised when an operation is not permitted on an object by construction. */
class UnsupportedOperationError final : public std::logic_error {
  public:
    explicit UnsupportedOperationError(const std::string& message)
        : std::logic_error(message) {}
};

/** @brief Raised when encoded data cannot be turned back into a value. */
class DecodeError final : public std::runtime_error {
  public:
    explicit DecodeError(const std::string& message)
        : std::runtime_error(message) {}
};

}  // namespace maritime_relay
