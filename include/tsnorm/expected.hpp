#pragma once

// TSNORM Expected Type
//
// Exposes tl::expected in the tsnorm namespace for consistent error handling.
// This provides a std::expected-compatible API (C++23) using the TartanLlama
// implementation for C++20 compatibility.
//
// Usage:
//   DotNetDateTime value;
//   auto result = value.copy_from_date_time_string("2010-08-12 20:06:31");
//   if (!result) {
//       handle(result.error());
//   }
//
// Monadic operations:
//   result.and_then(f)  - chain on success
//   result.map(f)       - transform value
//   result.or_else(f)   - chain on error
//   result.map_error(f) - transform error

#include <tl/expected.hpp>

namespace tsnorm {

using tl::expected;
using tl::make_unexpected;
using tl::unexpect;
using tl::unexpect_t;
using tl::unexpected;

} // namespace tsnorm
