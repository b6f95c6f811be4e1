#pragma once

#include "tsnorm/calendar.hpp"
#include "tsnorm/tick_time.hpp"
#include "tsnorm/types.hpp"

#include <limits>
#include <string_view>

#include <cstdint>

namespace tsnorm {

/**
 * Constant sets of the tick-counting formats.
 *
 * Adding a format means declaring one more struct here and registering its
 * TickTime alias in the Factory. Nothing else changes.
 */
namespace formats {

/// .NET DateTime: 100 ns intervals since January 1, year 1 (proleptic Gregorian)
struct DotNet {
    using timestamp_type = uint64_t;
    static constexpr std::string_view class_name = "DotNetDateTime";
    static constexpr Epoch epoch{1, 1, 1};
    static constexpr Precision precision = Precision::hundred_nanoseconds;
    static constexpr uint64_t ticks_per_second = 10'000'000;
    static constexpr timestamp_type min_timestamp = 0;
    static constexpr timestamp_type max_timestamp = std::numeric_limits<uint64_t>::max();
};

/// Windows FILETIME: 100 ns intervals since January 1, 1601
struct Filetime {
    using timestamp_type = uint64_t;
    static constexpr std::string_view class_name = "Filetime";
    static constexpr Epoch epoch{1601, 1, 1};
    static constexpr Precision precision = Precision::hundred_nanoseconds;
    static constexpr uint64_t ticks_per_second = 10'000'000;
    static constexpr timestamp_type min_timestamp = 0;
    static constexpr timestamp_type max_timestamp = std::numeric_limits<uint64_t>::max();
};

/// POSIX time: signed seconds since January 1, 1970
struct Posix {
    using timestamp_type = int64_t;
    static constexpr std::string_view class_name = "PosixTime";
    static constexpr Epoch epoch = posix_epoch;
    static constexpr Precision precision = Precision::seconds;
    static constexpr uint64_t ticks_per_second = 1;
    static constexpr timestamp_type min_timestamp = std::numeric_limits<int64_t>::min();
    static constexpr timestamp_type max_timestamp = std::numeric_limits<int64_t>::max();
};

struct PosixMilliseconds {
    using timestamp_type = int64_t;
    static constexpr std::string_view class_name = "PosixTimeInMilliseconds";
    static constexpr Epoch epoch = posix_epoch;
    static constexpr Precision precision = Precision::milliseconds;
    static constexpr uint64_t ticks_per_second = 1'000;
    static constexpr timestamp_type min_timestamp = std::numeric_limits<int64_t>::min();
    static constexpr timestamp_type max_timestamp = std::numeric_limits<int64_t>::max();
};

struct PosixMicroseconds {
    using timestamp_type = int64_t;
    static constexpr std::string_view class_name = "PosixTimeInMicroseconds";
    static constexpr Epoch epoch = posix_epoch;
    static constexpr Precision precision = Precision::microseconds;
    static constexpr uint64_t ticks_per_second = 1'000'000;
    static constexpr timestamp_type min_timestamp = std::numeric_limits<int64_t>::min();
    static constexpr timestamp_type max_timestamp = std::numeric_limits<int64_t>::max();
};

struct PosixNanoseconds {
    using timestamp_type = int64_t;
    static constexpr std::string_view class_name = "PosixTimeInNanoseconds";
    static constexpr Epoch epoch = posix_epoch;
    static constexpr Precision precision = Precision::nanoseconds;
    static constexpr uint64_t ticks_per_second = 1'000'000'000;
    static constexpr timestamp_type min_timestamp = std::numeric_limits<int64_t>::min();
    static constexpr timestamp_type max_timestamp = std::numeric_limits<int64_t>::max();
};

/// Java java.util.Date: signed milliseconds since January 1, 1970
struct Java {
    using timestamp_type = int64_t;
    static constexpr std::string_view class_name = "JavaTime";
    static constexpr Epoch epoch = posix_epoch;
    static constexpr Precision precision = Precision::milliseconds;
    static constexpr uint64_t ticks_per_second = 1'000;
    static constexpr timestamp_type min_timestamp = std::numeric_limits<int64_t>::min();
    static constexpr timestamp_type max_timestamp = std::numeric_limits<int64_t>::max();
};

/// WebKit: signed microseconds since January 1, 1601
struct WebKit {
    using timestamp_type = int64_t;
    static constexpr std::string_view class_name = "WebKitTime";
    static constexpr Epoch epoch{1601, 1, 1};
    static constexpr Precision precision = Precision::microseconds;
    static constexpr uint64_t ticks_per_second = 1'000'000;
    static constexpr timestamp_type min_timestamp = std::numeric_limits<int64_t>::min();
    static constexpr timestamp_type max_timestamp = std::numeric_limits<int64_t>::max();
};

/**
 * HFS: unsigned 32-bit seconds since January 1, 1904.
 *
 * Stored signed and wider than the declared range so out-of-range values
 * read from damaged structures can be held and reported as "no value".
 */
struct HFS {
    using timestamp_type = int64_t;
    static constexpr std::string_view class_name = "HFSTime";
    static constexpr Epoch epoch{1904, 1, 1};
    static constexpr Precision precision = Precision::seconds;
    static constexpr uint64_t ticks_per_second = 1;
    static constexpr timestamp_type min_timestamp = 0;
    static constexpr timestamp_type max_timestamp = std::numeric_limits<uint32_t>::max();
};

/// UUID version 1 time: 60-bit count of 100 ns intervals since October 15, 1582
struct UUID {
    using timestamp_type = uint64_t;
    static constexpr std::string_view class_name = "UUIDTime";
    static constexpr Epoch epoch{1582, 10, 15};
    static constexpr Precision precision = Precision::hundred_nanoseconds;
    static constexpr uint64_t ticks_per_second = 10'000'000;
    static constexpr timestamp_type min_timestamp = 0;
    static constexpr timestamp_type max_timestamp = (uint64_t{1} << 60) - 1;
};

/// APFS: signed nanoseconds since January 1, 1970
struct APFS {
    using timestamp_type = int64_t;
    static constexpr std::string_view class_name = "APFSTime";
    static constexpr Epoch epoch = posix_epoch;
    static constexpr Precision precision = Precision::nanoseconds;
    static constexpr uint64_t ticks_per_second = 1'000'000'000;
    static constexpr timestamp_type min_timestamp = std::numeric_limits<int64_t>::min();
    static constexpr timestamp_type max_timestamp = std::numeric_limits<int64_t>::max();
};

} // namespace formats

using DotNetDateTime = TickTime<formats::DotNet>;
using Filetime = TickTime<formats::Filetime>;
using PosixTime = TickTime<formats::Posix>;
using PosixTimeInMilliseconds = TickTime<formats::PosixMilliseconds>;
using PosixTimeInMicroseconds = TickTime<formats::PosixMicroseconds>;
using PosixTimeInNanoseconds = TickTime<formats::PosixNanoseconds>;
using JavaTime = TickTime<formats::Java>;
using WebKitTime = TickTime<formats::WebKit>;
using HFSTime = TickTime<formats::HFS>;
using UUIDTime = TickTime<formats::UUID>;
using APFSTime = TickTime<formats::APFS>;

// The difference between January 1, 0001 and January 1, 1970 in seconds
static_assert(DotNetDateTime::epoch_offset == 62'135'596'800);
static_assert(Filetime::epoch_offset == 11'644'473'600);

} // namespace tsnorm
