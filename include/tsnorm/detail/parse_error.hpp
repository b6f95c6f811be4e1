#pragma once

#include <tsnorm/types.hpp>

namespace tsnorm {

/**
 * @brief Error information from a rejected date and time input
 *
 * Returned by every operation that copies a date and time value into an
 * instance. When an operation fails the instance keeps its previous state.
 *
 * This is a trivially copyable type.
 */
struct ParseError {
    ParseErrorCode code; ///< The reason the input was rejected

    /**
     * @brief Get a human-readable error message
     * @return Static string describing the error
     */
    [[nodiscard]] const char* message() const noexcept { return parse_error_string(code); }

    constexpr bool operator==(const ParseError&) const noexcept = default;
};

} // namespace tsnorm
