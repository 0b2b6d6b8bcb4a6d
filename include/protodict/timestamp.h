// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file timestamp.h
/// @brief Microsecond timestamps used for value ages.
///
/// Timestamps are boost::posix_time::ptime values at microsecond
/// resolution. On the wire they travel as signed microseconds since the
/// Unix epoch, which is lossless at that resolution.

#pragma once

#include <protodict/protodict_config.h>
#include <protodict/api.h>

#include <boost/date_time/posix_time/posix_time_types.hpp>

#include <cstdint>
#include <string>

namespace protodict {

using Timestamp = boost::posix_time::ptime;

/// Current UTC time truncated to microseconds
[[nodiscard]] PROTODICT_API Timestamp now();

[[nodiscard]] PROTODICT_API int64_t to_micros(const Timestamp& t);

[[nodiscard]] PROTODICT_API Timestamp from_micros(int64_t micros);

/// ISO 8601 extended rendering, e.g. "2012-12-11T00:00:00.000123"
[[nodiscard]] PROTODICT_API std::string format_timestamp(const Timestamp& t);

} // namespace protodict
