// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <protodict/embedded_value.h>
#include <protodict/errors.h>

namespace protodict {

namespace {

constexpr const char* kNameKey = "name";
constexpr const char* kDataKey = "data";
constexpr const char* kAgeKey  = "age";
constexpr const char* kElementTypeKey = "element_type";

[[noreturn]] void wrong_kind(std::string_view wanted, const std::string& held)
{
    std::string message = "EmbeddedValue holds " + (held.empty() ? std::string{"nothing"} : held) +
                          ", not " + std::string{wanted};
    detail::log_error("EmbeddedValue::unwrap", message);
    throw TypeError(message);
}

[[noreturn]] void malformed(const std::string& reason)
{
    detail::log_error("EmbeddedValue::from_typed_value", reason);
    throw DecodeError("malformed EmbeddedValue envelope: " + reason);
}

} // anonymous namespace

EmbeddedValue::EmbeddedValue(std::string name,
                             TypedValue payload,
                             std::optional<Timestamp> age,
                             std::optional<std::string> element_type)
    : name_(std::move(name))
    , payload_(std::move(payload))
    , age_(age)
    , element_type_(std::move(element_type))
{
}

// ============================================================
// Wrapping
// ============================================================

EmbeddedValue EmbeddedValue::wrap(const TypedSequence& value)
{
    return EmbeddedValue{std::string{kSequenceName}, value.to_typed_value(), value.age(), value.element_type()};
}

EmbeddedValue EmbeddedValue::wrap(const OrderedMap& value)
{
    return EmbeddedValue{std::string{kMapName}, value.to_typed_value(), std::nullopt};
}

EmbeddedValue EmbeddedValue::wrap(const DomainPtr& value)
{
    if (!value) {
        throw TypeError("cannot wrap a null domain object");
    }

    // Built directly so integer-like types keep their payload
    DomainValue domain;
    domain.type_name = std::string{value->type_name()};
    domain.payload   = value->serialize();
    if (value->age()) {
        domain.age = to_micros(*value->age());
    }
    std::string name = domain.type_name;
    return EmbeddedValue{std::move(name), TypedValue{std::move(domain)}, value->age()};
}

// ============================================================
// Unwrapping
// ============================================================

TypedSequence EmbeddedValue::unwrap_sequence() const
{
    const Sequence* items = payload_.get_if<Sequence>();
    if (name_ != kSequenceName || !items) {
        wrong_kind(kSequenceName, name_);
    }
    TypedSequence result(*items, element_type_);
    if (age_) {
        result.set_age(*age_);
    }
    return result;
}

OrderedMap EmbeddedValue::unwrap_map() const
{
    const Mapping* mapping = payload_.get_if<Mapping>();
    if (name_ != kMapName || !mapping) {
        wrong_kind(kMapName, name_);
    }
    return OrderedMap(*mapping);
}

DomainPtr EmbeddedValue::unwrap_domain(const DomainRegistry& registry) const
{
    const DomainValue* domain = payload_.get_if<DomainValue>();
    if (!domain) {
        wrong_kind("a domain value", name_);
    }
    DomainPtr result = registry.deserialize(domain->type_name, domain->payload);
    result->set_age(age_);
    return result;
}

EmbeddedValue::Unwrapped EmbeddedValue::unwrap(const DomainRegistry& registry) const
{
    if (name_ == kSequenceName) {
        return unwrap_sequence();
    }
    if (name_ == kMapName) {
        return unwrap_map();
    }
    return unwrap_domain(registry);
}

// ============================================================
// Serialization
// ============================================================

TypedValue EmbeddedValue::to_typed_value() const
{
    Mapping envelope = Mapping{}.set(kNameKey, name_).set(kDataKey, payload_);
    if (age_) {
        envelope = envelope.set(kAgeKey, to_micros(*age_));
    }
    if (element_type_) {
        envelope = envelope.set(kElementTypeKey, *element_type_);
    }
    return TypedValue{std::move(envelope)};
}

EmbeddedValue EmbeddedValue::from_typed_value(const TypedValue& envelope)
{
    const Mapping* fields = envelope.get_if<Mapping>();
    if (!fields) {
        malformed("expected a Mapping, got " + std::string{kind_name(envelope.kind())});
    }

    const TypedValue* name = fields->find(kNameKey);
    if (!name || !name->is<std::string>()) {
        malformed("missing text field 'name'");
    }
    const TypedValue* data = fields->find(kDataKey);
    if (!data) {
        malformed("missing field 'data'");
    }

    std::optional<Timestamp> age;
    if (const TypedValue* micros = fields->find(kAgeKey)) {
        if (!micros->is<int64_t>()) {
            malformed("field 'age' must be an Integer");
        }
        age = from_micros(micros->as<int64_t>());
    }

    std::optional<std::string> element_type;
    if (const TypedValue* constraint = fields->find(kElementTypeKey)) {
        if (!constraint->is<std::string>()) {
            malformed("field 'element_type' must be Text");
        }
        element_type = constraint->as<std::string>();
    }

    const std::string& kind = name->as<std::string>();
    if (kind.empty()) {
        if (!data->is_null()) malformed("empty slot with data");
    } else if (kind == kSequenceName) {
        if (!data->is<Sequence>()) malformed("TypedSequence data must be a Sequence");
    } else if (kind == kMapName) {
        if (!data->is<Mapping>()) malformed("OrderedMap data must be a Mapping");
    } else if (!data->is<DomainValue>()) {
        malformed("'" + kind + "' data must be a DomainValue");
    } else if (data->as<DomainValue>().type_name != kind) {
        malformed("name '" + kind + "' does not match domain type '" + data->as<DomainValue>().type_name + "'");
    }

    if (element_type && kind != kSequenceName) {
        malformed("'element_type' given for " + (kind.empty() ? std::string{"an empty slot"} : kind));
    }

    return EmbeddedValue{kind, *data, age, std::move(element_type)};
}

EmbeddedValue EmbeddedValue::deserialize(const ByteBuffer& bytes, const DecodeOptions& options)
{
    return from_typed_value(decode(bytes, options));
}

} // namespace protodict
