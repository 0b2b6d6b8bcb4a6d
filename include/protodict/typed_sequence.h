// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file typed_sequence.h
/// @brief Ordered, index-accessible sequence of typed values.
///
/// A sequence may declare an element type (a registered domain type name).
/// Appended values are then coerced into that type; a value that cannot be
/// coerced is rejected with ValueError and the sequence is left unchanged.
///
/// ```cpp
/// auto names = TypedSequence::of<StringValue>();
/// names.append("hello");                         // stored as StringValue
/// names.append(TimestampValue::now());           // throws ValueError
///
/// TypedSequence plain = TypedSequence::from(std::vector<int>{1, 2, 3});
/// Object last = plain.pop();                     // 3
/// ```
///
/// Every sequence carries an age (creation time by default) which
/// EmbeddedValue preserves across serialization.

#pragma once

#include <protodict/protodict_config.h>
#include <protodict/api.h>
#include <protodict/concepts.h>
#include <protodict/domain_registry.h>
#include <protodict/fwd.h>
#include <protodict/object.h>
#include <protodict/timestamp.h>
#include <protodict/type_codec.h>
#include <protodict/typed_value.h>
#include <protodict/wire_codec.h>

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <optional>
#include <string>

namespace protodict {

class PROTODICT_API TypedSequence {
public:
    /// Iterates a snapshot taken by begin(); yields materialized values
    class PROTODICT_API iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type        = Object;
        using difference_type   = std::ptrdiff_t;
        using reference         = Object;

        iterator() = default;
        iterator(Sequence items, std::size_t pos, const DomainRegistry* registry)
            : items_(std::move(items)), pos_(pos), registry_(registry) {}

        [[nodiscard]] Object operator*() const;

        iterator& operator++() {
            ++pos_;
            return *this;
        }

        iterator operator++(int) {
            iterator tmp = *this;
            ++pos_;
            return tmp;
        }

        bool operator==(const iterator& other) const { return pos_ == other.pos_; }

    private:
        Sequence items_;
        std::size_t pos_ = 0;
        const DomainRegistry* registry_ = nullptr;
    };

    TypedSequence();

    /// Unconstrained sequence of the given values
    TypedSequence(std::initializer_list<Object> init);

    explicit TypedSequence(Sequence items, std::optional<std::string> element_type = std::nullopt);

    /// Sequence whose elements are coerced into the registered @p element_type
    [[nodiscard]] static TypedSequence constrained(std::string element_type);

    template <DomainType T>
    [[nodiscard]] static TypedSequence of() {
        return constrained(std::string{T::kTypeName});
    }

    /// Classify every element of a plain ordered collection
    template <ValueRange R>
    [[nodiscard]] static TypedSequence from(const R& range, ClassifyMode mode = ClassifyMode::Strict) {
        TypedSequence result;
        result.extend(range, mode);
        return result;
    }

    /// From a plain list Object; throws TypeError if @p plain is not a list
    [[nodiscard]] static TypedSequence from(const Object& plain, ClassifyMode mode = ClassifyMode::Strict);

    /// Throws DecodeError if the bytes are malformed or not a Sequence
    [[nodiscard]] static TypedSequence deserialize(const ByteBuffer& bytes,
                                                   std::optional<std::string> element_type = std::nullopt,
                                                   const DecodeOptions& options = {});

    // ============================================================
    // Modification
    // ============================================================

    template <typename T>
    TypedSequence& append(const T& value, ClassifyMode mode = ClassifyMode::Strict) {
        if (!element_type_) {
            items_ = items_.push_back(TypedValueBox{classify(value, mode)});
            return *this;
        }
        // Coercion decides what is acceptable, so classification never throws here
        return append_coerced(classify(value, ClassifyMode::Lenient));
    }

    /// Append every element; all-or-nothing
    template <ValueRange R>
    TypedSequence& extend(const R& range, ClassifyMode mode = ClassifyMode::Strict) {
        TypedSequence next = *this;
        for (const auto& value : range) {
            next.append(value, mode);
        }
        items_ = next.items_;
        return *this;
    }

    /// Remove and return the last element; throws IndexError when empty
    Object pop();

    /// Remove and return the element at @p index; throws IndexError
    Object pop(std::size_t index);

    void clear() { items_ = Sequence{}; }

    // ============================================================
    // Access
    // ============================================================

    /// Throws IndexError
    [[nodiscard]] Object at(std::size_t index) const;
    [[nodiscard]] Object operator[](std::size_t index) const { return at(index); }

    [[nodiscard]] std::size_t size() const noexcept { return items_.size(); }
    [[nodiscard]] bool empty() const noexcept { return items_.empty(); }

    [[nodiscard]] iterator begin() const { return {items_, 0, &DomainRegistry::global()}; }
    [[nodiscard]] iterator end() const { return {Sequence{}, items_.size(), nullptr}; }

    [[nodiscard]] Object to_plain_list(const DomainRegistry& registry = DomainRegistry::global()) const;

    [[nodiscard]] const std::optional<std::string>& element_type() const noexcept { return element_type_; }

    [[nodiscard]] const Timestamp& age() const noexcept { return age_; }
    void set_age(Timestamp age) noexcept { age_ = age; }

    // ============================================================
    // Conversion
    // ============================================================

    [[nodiscard]] ByteBuffer serialize() const { return encode(to_typed_value()); }
    [[nodiscard]] TypedValue to_typed_value() const { return TypedValue{items_}; }
    [[nodiscard]] const Sequence& items() const noexcept { return items_; }

    /// Element-wise comparison in order; age and element type are ignored
    [[nodiscard]] bool operator==(const TypedSequence& other) const;

private:
    TypedSequence& append_coerced(const TypedValue& value);

    Sequence items_;
    std::optional<std::string> element_type_;
    Timestamp age_;
};

} // namespace protodict
