// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <protodict/domain_types.h>
#include <protodict/errors.h>
#include <protodict/object.h>

#include <boost/date_time/gregorian/gregorian_types.hpp>

#include <bit>
#include <cstring>

namespace protodict {

static_assert(std::endian::native == std::endian::little,
              "TimestampValue payloads are written in native (little-endian) order");

namespace {

ByteBuffer text_payload(std::string_view text)
{
    return ByteBuffer(text.begin(), text.end());
}

std::string payload_text(const ByteBuffer& payload)
{
    return std::string(payload.begin(), payload.end());
}

[[noreturn]] void reject(std::string_view type_name, const Object& value)
{
    std::string message = "cannot coerce " + value.to_string() + " into " + std::string{type_name};
    detail::log_error("coerce", message);
    throw ValueError(message);
}

} // anonymous namespace

// ============================================================
// TimestampValue
// ============================================================

TimestampValue::TimestampValue(Timestamp value)
    : value_(value)
{
}

std::shared_ptr<TimestampValue> TimestampValue::now()
{
    return std::make_shared<TimestampValue>(protodict::now());
}

std::shared_ptr<TimestampValue> TimestampValue::from_date(int year, int month, int day)
{
    const boost::gregorian::date date(static_cast<unsigned short>(year),
                                      static_cast<unsigned short>(month),
                                      static_cast<unsigned short>(day));
    return std::make_shared<TimestampValue>(Timestamp{date});
}

std::shared_ptr<TimestampValue> TimestampValue::deserialize(const ByteBuffer& payload)
{
    if (payload.size() != sizeof(int64_t)) {
        throw DecodeError("RDFDatetime payload must be 8 bytes, got " + std::to_string(payload.size()));
    }
    int64_t micros;
    std::memcpy(&micros, payload.data(), sizeof(micros));
    return std::make_shared<TimestampValue>(from_micros(micros));
}

std::shared_ptr<TimestampValue> TimestampValue::coerce(const Object& value)
{
    if (auto ts = value.as_domain<TimestampValue>()) {
        return std::make_shared<TimestampValue>(ts->value());
    }
    if (const auto* micros = value.get_if<int64_t>()) {
        return std::make_shared<TimestampValue>(from_micros(*micros));
    }
    reject(kTypeName, value);
}

ByteBuffer TimestampValue::serialize() const
{
    const int64_t micros = to_micros(value_);
    ByteBuffer payload(sizeof(micros));
    std::memcpy(payload.data(), &micros, sizeof(micros));
    return payload;
}

std::string TimestampValue::to_string() const
{
    return format_timestamp(value_);
}

// ============================================================
// StringValue
// ============================================================

StringValue::StringValue(std::string value)
    : value_(std::move(value))
{
}

std::shared_ptr<StringValue> StringValue::deserialize(const ByteBuffer& payload)
{
    return std::make_shared<StringValue>(payload_text(payload));
}

std::shared_ptr<StringValue> StringValue::coerce(const Object& value)
{
    if (auto str = value.as_domain<StringValue>()) {
        return std::make_shared<StringValue>(str->value());
    }
    if (const auto* text = value.get_if<std::string>()) {
        return std::make_shared<StringValue>(*text);
    }
    if (const auto* bytes = value.get_if<Bytes>()) {
        return std::make_shared<StringValue>(std::string{bytes->view()});
    }
    reject(kTypeName, value);
}

ByteBuffer StringValue::serialize() const
{
    return text_payload(value_);
}

// ============================================================
// UrnValue
// ============================================================

UrnValue::UrnValue(std::string_view urn)
{
    while (urn.size() > 1 && urn.back() == '/') {
        urn.remove_suffix(1);
    }
    urn_ = std::string{urn};
}

std::shared_ptr<UrnValue> UrnValue::deserialize(const ByteBuffer& payload)
{
    return std::make_shared<UrnValue>(payload_text(payload));
}

std::shared_ptr<UrnValue> UrnValue::coerce(const Object& value)
{
    if (auto urn = value.as_domain<UrnValue>()) {
        return std::make_shared<UrnValue>(urn->urn());
    }
    if (auto str = value.as_domain<StringValue>()) {
        return std::make_shared<UrnValue>(str->value());
    }
    if (const auto* text = value.get_if<std::string>()) {
        return std::make_shared<UrnValue>(*text);
    }
    reject(kTypeName, value);
}

ByteBuffer UrnValue::serialize() const
{
    return text_payload(urn_);
}

// ============================================================
// EnumValue
// ============================================================

EnumValue::EnumValue(int64_t value, std::string name)
    : value_(value)
    , name_(std::move(name))
{
}

ByteBuffer EnumValue::serialize() const
{
    ByteBuffer payload(sizeof(value_));
    std::memcpy(payload.data(), &value_, sizeof(value_));
    return payload;
}

std::string EnumValue::to_string() const
{
    return name_;
}

} // namespace protodict
