// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <protodict/errors.h>
#include <protodict/typed_sequence.h>

#include <immer/flex_vector_transient.hpp>

namespace protodict {

Object TypedSequence::iterator::operator*() const
{
    return materialize(*items_[pos_], *registry_);
}

// ============================================================
// Construction
// ============================================================

TypedSequence::TypedSequence()
    : age_(now())
{
}

TypedSequence::TypedSequence(std::initializer_list<Object> init)
    : TypedSequence()
{
    auto items = Sequence{}.transient();
    for (const auto& value : init) {
        items.push_back(TypedValueBox{classify(value)});
    }
    items_ = items.persistent();
}

TypedSequence::TypedSequence(Sequence items, std::optional<std::string> element_type)
    : items_(std::move(items))
    , element_type_(std::move(element_type))
    , age_(now())
{
}

TypedSequence TypedSequence::constrained(std::string element_type)
{
    TypedSequence result;
    result.element_type_ = std::move(element_type);
    return result;
}

TypedSequence TypedSequence::from(const Object& plain, ClassifyMode mode)
{
    const ObjectList* list = plain.list_data();
    if (!list) {
        throw TypeError("TypedSequence requires a plain list, got " + plain.to_string());
    }
    return from(*list, mode);
}

TypedSequence TypedSequence::deserialize(const ByteBuffer& bytes,
                                         std::optional<std::string> element_type,
                                         const DecodeOptions& options)
{
    TypedValue value = decode(bytes, options);
    const Sequence* items = value.get_if<Sequence>();
    if (!items) {
        throw DecodeError("expected a Sequence, got " + std::string{kind_name(value.kind())});
    }
    return TypedSequence(*items, std::move(element_type));
}

// ============================================================
// Modification
// ============================================================

TypedSequence& TypedSequence::append_coerced(const TypedValue& value)
{
    if (const auto* marker = value.get_if<Unsupported>()) {
        detail::log_error("TypedSequence::append", marker->description);
        throw ValueError("cannot coerce into " + *element_type_ + ": " + marker->description);
    }
    DomainPtr coerced = DomainRegistry::global().coerce(*element_type_, materialize(value));
    items_ = items_.push_back(TypedValueBox{detail::classify_domain(*coerced)});
    return *this;
}

Object TypedSequence::pop()
{
    if (items_.empty()) {
        detail::log_index_error("TypedSequence::pop", 0, "pop from empty sequence");
        throw IndexError(0, 0);
    }
    return pop(items_.size() - 1);
}

Object TypedSequence::pop(std::size_t index)
{
    if (index >= items_.size()) {
        detail::log_index_error("TypedSequence::pop", index, "out of range");
        throw IndexError(index, items_.size());
    }
    Object value = materialize(*items_[index]);
    items_ = items_.erase(index);
    return value;
}

// ============================================================
// Access
// ============================================================

Object TypedSequence::at(std::size_t index) const
{
    if (index >= items_.size()) {
        detail::log_index_error("TypedSequence::at", index, "out of range");
        throw IndexError(index, items_.size());
    }
    return materialize(*items_[index]);
}

Object TypedSequence::to_plain_list(const DomainRegistry& registry) const
{
    return materialize(to_typed_value(), registry);
}

bool TypedSequence::operator==(const TypedSequence& other) const
{
    return items_ == other.items_;
}

} // namespace protodict
