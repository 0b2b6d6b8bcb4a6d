// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file domain_types.h
/// @brief Standard domain types shipped with protodict.
///
/// | Type           | Wire name     | Payload                              |
/// |----------------|---------------|--------------------------------------|
/// | TimestampValue | "RDFDatetime" | int64 microseconds since epoch (LE)  |
/// | StringValue    | "RDFString"   | UTF-8 bytes                          |
/// | UrnValue       | "RDFURN"      | UTF-8 bytes, trailing '/' stripped   |
/// | EnumValue      | (none)        | integer-like, classified as Integer  |
///
/// TimestampValue, StringValue and UrnValue are registered in
/// DomainRegistry::global().

#pragma once

#include <protodict/protodict_config.h>
#include <protodict/api.h>
#include <protodict/domain_value.h>
#include <protodict/fwd.h>
#include <protodict/timestamp.h>

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace protodict {

class PROTODICT_API TimestampValue final : public DomainObject {
public:
    static constexpr std::string_view kTypeName = "RDFDatetime";

    explicit TimestampValue(Timestamp value);

    /// Current time
    [[nodiscard]] static std::shared_ptr<TimestampValue> now();

    /// Midnight UTC of the given calendar day
    [[nodiscard]] static std::shared_ptr<TimestampValue> from_date(int year, int month, int day);

    [[nodiscard]] static std::shared_ptr<TimestampValue> deserialize(const ByteBuffer& payload);

    /// Accepts TimestampValue and integers (microseconds since epoch)
    [[nodiscard]] static std::shared_ptr<TimestampValue> coerce(const Object& value);

    [[nodiscard]] std::string_view type_name() const noexcept override { return kTypeName; }
    [[nodiscard]] ByteBuffer serialize() const override;
    [[nodiscard]] std::string to_string() const override;

    [[nodiscard]] const Timestamp& value() const noexcept { return value_; }
    [[nodiscard]] int64_t micros() const { return to_micros(value_); }

private:
    Timestamp value_;
};

class PROTODICT_API StringValue final : public DomainObject {
public:
    static constexpr std::string_view kTypeName = "RDFString";

    explicit StringValue(std::string value);

    [[nodiscard]] static std::shared_ptr<StringValue> deserialize(const ByteBuffer& payload);

    /// Accepts StringValue, text and bytes
    [[nodiscard]] static std::shared_ptr<StringValue> coerce(const Object& value);

    [[nodiscard]] std::string_view type_name() const noexcept override { return kTypeName; }
    [[nodiscard]] ByteBuffer serialize() const override;
    [[nodiscard]] std::string to_string() const override { return value_; }

    [[nodiscard]] const std::string& value() const noexcept { return value_; }

private:
    std::string value_;
};

/// Resource name such as "aff4:/users"
class PROTODICT_API UrnValue final : public DomainObject {
public:
    static constexpr std::string_view kTypeName = "RDFURN";

    explicit UrnValue(std::string_view urn);

    [[nodiscard]] static std::shared_ptr<UrnValue> deserialize(const ByteBuffer& payload);

    /// Accepts UrnValue, StringValue and text
    [[nodiscard]] static std::shared_ptr<UrnValue> coerce(const Object& value);

    [[nodiscard]] std::string_view type_name() const noexcept override { return kTypeName; }
    [[nodiscard]] ByteBuffer serialize() const override;
    [[nodiscard]] std::string to_string() const override { return urn_; }

    [[nodiscard]] const std::string& urn() const noexcept { return urn_; }

private:
    std::string urn_;
};

/// Integer with a symbolic name. Integer-like: it classifies as Integer and
/// the name does not survive serialization.
class PROTODICT_API EnumValue final : public DomainObject {
public:
    static constexpr std::string_view kTypeName = "Enum";

    EnumValue(int64_t value, std::string name);

    [[nodiscard]] std::string_view type_name() const noexcept override { return kTypeName; }
    [[nodiscard]] ByteBuffer serialize() const override;
    [[nodiscard]] std::optional<int64_t> integer_value() const override { return value_; }
    [[nodiscard]] std::string to_string() const override;

    [[nodiscard]] int64_t value() const noexcept { return value_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

private:
    int64_t value_;
    std::string name_;
};

} // namespace protodict
