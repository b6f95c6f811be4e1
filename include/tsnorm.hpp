#pragma once

/**
 * @file tsnorm.hpp
 * @brief Convenience header for the date and time normalization engine
 *
 * Types provided:
 * - DateTimeValues: Abstract value with the normalized timestamp cache
 * - TickTime<Format>: Engine shared by every tick-counting format
 * - DotNetDateTime, Filetime, PosixTime, JavaTime, WebKitTime, HFSTime,
 *   UUIDTime, APFSTime and the POSIX sub-second variants
 * - FATDateTime, RFC2579DateTime, TimeElements and its millisecond and
 *   microsecond variants: Element based formats
 * - Never: Semantic value without a position on the time line
 * - Decimal: Exact decimal used for normalized timestamps
 * - Factory: Format registry by class name
 * - Serializer: JSON projection (requires nlohmann_json)
 *
 * Input operations return ParseResult; output operations return
 * std::optional.
 */

#include "tsnorm/calendar.hpp"
#include "tsnorm/date_time_values.hpp"
#include "tsnorm/decimal.hpp"
#include "tsnorm/detail/parse_error.hpp"
#include "tsnorm/detail/parse_result.hpp"
#include "tsnorm/factory.hpp"
#include "tsnorm/fat_date_time.hpp"
#include "tsnorm/field.hpp"
#include "tsnorm/formats.hpp"
#include "tsnorm/rfc2579_date_time.hpp"
#include "tsnorm/semantic_time.hpp"
#include "tsnorm/serializer.hpp"
#include "tsnorm/tick_time.hpp"
#include "tsnorm/time_elements.hpp"
#include "tsnorm/types.hpp"
