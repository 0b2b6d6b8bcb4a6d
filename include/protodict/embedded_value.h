// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file embedded_value.h
/// @brief Single-slot wrapper that carries a value together with its age.
///
/// wrap() captures the age of the wrapped value (TypedSequence and domain
/// objects carry one, OrderedMap does not). unwrap_*() hands the value back
/// with that age restored, also after a serialize/deserialize cycle.
/// Wrapping an EmbeddedValue forwards its payload and age unchanged.
///
/// The serialized envelope is a Mapping:
///   {"name": Text, "data": <payload>, "age": Integer (optional),
///    "element_type": Text (optional, constrained sequences only)}

#pragma once

#include <protodict/protodict_config.h>
#include <protodict/api.h>
#include <protodict/domain_registry.h>
#include <protodict/domain_value.h>
#include <protodict/fwd.h>
#include <protodict/ordered_map.h>
#include <protodict/timestamp.h>
#include <protodict/typed_sequence.h>
#include <protodict/typed_value.h>
#include <protodict/wire_codec.h>

#include <concepts>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace protodict {

class PROTODICT_API EmbeddedValue {
public:
    static constexpr std::string_view kSequenceName = "TypedSequence";
    static constexpr std::string_view kMapName      = "OrderedMap";

    using Unwrapped = std::variant<TypedSequence, OrderedMap, DomainPtr>;

    /// Empty slot
    EmbeddedValue() = default;

    [[nodiscard]] static EmbeddedValue wrap(const TypedSequence& value);
    [[nodiscard]] static EmbeddedValue wrap(const OrderedMap& value);

    /// Throws TypeError for a null pointer
    [[nodiscard]] static EmbeddedValue wrap(const DomainPtr& value);

    template <std::derived_from<DomainObject> T>
    [[nodiscard]] static EmbeddedValue wrap(const std::shared_ptr<T>& value) {
        return wrap(DomainPtr{value});
    }

    /// Forwards the original payload and age
    [[nodiscard]] static EmbeddedValue wrap(const EmbeddedValue& value) { return value; }

    // ============================================================
    // Unwrapping (TypeError when the payload is of another kind)
    // ============================================================

    [[nodiscard]] TypedSequence unwrap_sequence() const;
    [[nodiscard]] OrderedMap unwrap_map() const;
    [[nodiscard]] DomainPtr unwrap_domain(const DomainRegistry& registry = DomainRegistry::global()) const;
    [[nodiscard]] Unwrapped unwrap(const DomainRegistry& registry = DomainRegistry::global()) const;

    [[nodiscard]] bool empty() const noexcept { return name_.empty(); }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const TypedValue& payload() const noexcept { return payload_; }
    [[nodiscard]] const std::optional<Timestamp>& age() const noexcept { return age_; }

    /// Element constraint of a wrapped TypedSequence
    [[nodiscard]] const std::optional<std::string>& element_type() const noexcept { return element_type_; }

    // ============================================================
    // Serialization
    // ============================================================

    [[nodiscard]] TypedValue to_typed_value() const;

    /// Throws DecodeError for a malformed envelope
    [[nodiscard]] static EmbeddedValue from_typed_value(const TypedValue& envelope);

    [[nodiscard]] ByteBuffer serialize() const { return encode(to_typed_value()); }

    [[nodiscard]] static EmbeddedValue deserialize(const ByteBuffer& bytes, const DecodeOptions& options = {});

    bool operator==(const EmbeddedValue&) const = default;

private:
    EmbeddedValue(std::string name,
                  TypedValue payload,
                  std::optional<Timestamp> age,
                  std::optional<std::string> element_type = std::nullopt);

    std::string name_;
    TypedValue payload_;
    std::optional<Timestamp> age_;
    std::optional<std::string> element_type_;
};

} // namespace protodict
