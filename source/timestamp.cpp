// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <protodict/timestamp.h>

#include <boost/date_time/posix_time/posix_time.hpp>

namespace protodict {

namespace {

const Timestamp& epoch()
{
    static const Timestamp value{boost::gregorian::date{1970, 1, 1}};
    return value;
}

} // anonymous namespace

Timestamp now()
{
    return boost::posix_time::microsec_clock::universal_time();
}

int64_t to_micros(const Timestamp& t)
{
    return (t - epoch()).total_microseconds();
}

Timestamp from_micros(int64_t micros)
{
    return epoch() + boost::posix_time::microseconds(micros);
}

std::string format_timestamp(const Timestamp& t)
{
    return boost::posix_time::to_iso_extended_string(t);
}

} // namespace protodict
