// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file domain_value.h
/// @brief Capability contract for externally typed values.
///
/// A host type takes part in protodict as a DomainValue by deriving from
/// DomainObject. The core only ever calls:
/// - type_name(): stable name written to the wire
/// - serialize(): payload bytes
/// - integer_value(): for integer-like types (classified as Integer)
/// - age() / set_age(): optional creation timestamp
///
/// Deserialization is a static function of the concrete type, reached
/// through the DomainRegistry (see domain_registry.h).

#pragma once

#include <protodict/protodict_config.h>
#include <protodict/api.h>
#include <protodict/fwd.h>
#include <protodict/timestamp.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace protodict {

class PROTODICT_API DomainObject {
public:
    virtual ~DomainObject() = default;

    [[nodiscard]] virtual std::string_view type_name() const noexcept = 0;

    [[nodiscard]] virtual ByteBuffer serialize() const = 0;

    /// Integer-like values return their numeric value
    [[nodiscard]] virtual std::optional<int64_t> integer_value() const { return std::nullopt; }

    /// Same type name and same serialized payload. Age is not compared.
    [[nodiscard]] virtual bool equals(const DomainObject& other) const;

    [[nodiscard]] virtual std::string to_string() const;

    [[nodiscard]] const std::optional<Timestamp>& age() const noexcept { return age_; }
    void set_age(std::optional<Timestamp> age) noexcept { age_ = age; }

protected:
    /// Age defaults to the construction time
    DomainObject();
    DomainObject(const DomainObject&) = default;
    DomainObject& operator=(const DomainObject&) = default;

private:
    std::optional<Timestamp> age_;
};

/// A DomainValue whose type name is not registered in this process.
/// Keeps the raw payload so it re-encodes unchanged.
class PROTODICT_API OpaqueDomainValue final : public DomainObject {
public:
    OpaqueDomainValue(std::string type_name, ByteBuffer payload);

    [[nodiscard]] std::string_view type_name() const noexcept override { return type_name_; }
    [[nodiscard]] ByteBuffer serialize() const override { return payload_; }
    [[nodiscard]] std::string to_string() const override;

    [[nodiscard]] const ByteBuffer& payload() const noexcept { return payload_; }

private:
    std::string type_name_;
    ByteBuffer payload_;
};

} // namespace protodict
