#pragma once

#include "../expected.hpp"
#include "parse_error.hpp"

namespace tsnorm {

/**
 * @brief Result type for date and time input operations
 *
 * Alias for expected<T, ParseError>. Holds either the produced value or a
 * ParseError describing why the input was rejected.
 *
 * Usage:
 * @code
 *   auto result = value.copy_from_date_time_string("2010-08-12 20:06:31");
 *   if (!result) {
 *       std::cerr << result.error().message() << "\n";
 *   }
 * @endcode
 *
 * @tparam T The type produced on success (void for in-place updates)
 */
template <typename T>
using ParseResult = expected<T, ParseError>;

/**
 * @brief Factory function for creating parse errors
 *
 * Usage:
 * @code
 *   return make_parse_error(ParseErrorCode::year_out_of_range);
 * @endcode
 *
 * @param code The reason the input was rejected
 * @return unexpected<ParseError> suitable for returning from parse functions
 */
inline auto make_parse_error(ParseErrorCode code) noexcept {
    return unexpected(ParseError{.code = code});
}

} // namespace tsnorm
