// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file ordered_map.h
/// @brief String-keyed, insertion-ordered container of typed values.
///
/// Values are classified on the way in and materialized on the way out:
///
/// ```cpp
/// OrderedMap m{{"user", "alice"}, {"uid", 1000}};
/// m.set("home", std::string{"/home/alice"});
/// Object uid = m.get("uid");                     // 1000
/// for (const auto& [key, value] : m.items()) { ... }
///
/// OrderedMap copy = OrderedMap::deserialize(m.serialize());
/// assert(copy == m);
/// ```
///
/// Assigning a new OrderedMap replaces the previous contents wholesale.

#pragma once

#include <protodict/protodict_config.h>
#include <protodict/api.h>
#include <protodict/concepts.h>
#include <protodict/domain_registry.h>
#include <protodict/fwd.h>
#include <protodict/object.h>
#include <protodict/type_codec.h>
#include <protodict/typed_value.h>
#include <protodict/wire_codec.h>

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <string>
#include <utility>
#include <vector>

namespace protodict {

class PROTODICT_API OrderedMap {
public:
    /// Lazy view over a snapshot of the entries. Every begin() starts a new
    /// pass; values are materialized as the iterator is dereferenced.
    class PROTODICT_API ItemsView {
    public:
        class PROTODICT_API iterator {
        public:
            using iterator_category = std::input_iterator_tag;
            using value_type        = std::pair<std::string, Object>;
            using difference_type   = std::ptrdiff_t;
            using reference         = value_type;

            iterator() = default;
            iterator(const ItemsView* view, std::size_t pos) : view_(view), pos_(pos) {}

            [[nodiscard]] value_type operator*() const;

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
            const ItemsView* view_ = nullptr;
            std::size_t pos_ = 0;
        };

        ItemsView(Mapping snapshot, const DomainRegistry& registry)
            : snapshot_(std::move(snapshot)), registry_(&registry) {}

        [[nodiscard]] iterator begin() const { return {this, 0}; }
        [[nodiscard]] iterator end() const { return {this, snapshot_.size()}; }
        [[nodiscard]] std::size_t size() const noexcept { return snapshot_.size(); }

    private:
        Mapping snapshot_;
        const DomainRegistry* registry_;
    };

    OrderedMap() = default;

    /// Keyword construction: OrderedMap{{"a", 1}, {"b", "x"}}
    OrderedMap(std::initializer_list<std::pair<std::string, Object>> init);

    /// From a plain map Object; throws TypeError if @p plain is not a map
    explicit OrderedMap(const Object& plain, ClassifyMode mode = ClassifyMode::Strict);

    explicit OrderedMap(Mapping mapping) : mapping_(std::move(mapping)) {}

    /// From any string-keyed associative container
    template <StringKeyedMapping M>
    [[nodiscard]] static OrderedMap from_mapping(const M& plain, ClassifyMode mode = ClassifyMode::Strict) {
        OrderedMap result;
        for (const auto& [key, value] : plain) {
            result.set(std::string(std::string_view(key)), value, mode);
        }
        return result;
    }

    /// Throws DecodeError if the bytes are malformed or not a Mapping
    [[nodiscard]] static OrderedMap deserialize(const ByteBuffer& bytes, const DecodeOptions& options = {});

    // ============================================================
    // Modification
    // ============================================================

    /// Classify and store. An existing key keeps its position.
    template <typename T>
    OrderedMap& set(std::string key, const T& value, ClassifyMode mode = ClassifyMode::Strict) {
        mapping_ = mapping_.set(std::move(key), classify(value, mode));
        return *this;
    }

    /// Throws KeyError if absent
    void erase(const std::string& key);

    void clear() { mapping_ = Mapping{}; }

    // ============================================================
    // Access
    // ============================================================

    /// Materialized value; throws KeyError if absent
    [[nodiscard]] Object get(const std::string& key,
                             const DomainRegistry& registry = DomainRegistry::global()) const;

    [[nodiscard]] Object operator[](const std::string& key) const { return get(key); }

    [[nodiscard]] Object get_or(const std::string& key, Object fallback) const;

    /// Stored TypedValue, nullptr if absent
    [[nodiscard]] const TypedValue* find(const std::string& key) const { return mapping_.find(key); }

    [[nodiscard]] bool contains(const std::string& key) const { return mapping_.contains(key); }
    [[nodiscard]] std::size_t size() const noexcept { return mapping_.size(); }
    [[nodiscard]] bool empty() const noexcept { return mapping_.empty(); }

    [[nodiscard]] ItemsView items(const DomainRegistry& registry = DomainRegistry::global()) const {
        return ItemsView{mapping_, registry};
    }

    /// Keys in insertion order
    [[nodiscard]] std::vector<std::string> keys() const;

    /// Recursively materialized plain map
    [[nodiscard]] Object to_plain_mapping(const DomainRegistry& registry = DomainRegistry::global()) const;

    // ============================================================
    // Conversion
    // ============================================================

    [[nodiscard]] ByteBuffer serialize() const { return encode(to_typed_value()); }
    [[nodiscard]] TypedValue to_typed_value() const { return TypedValue{mapping_}; }
    [[nodiscard]] const Mapping& mapping() const noexcept { return mapping_; }

    /// Same key set and equal materialized values; order is ignored
    [[nodiscard]] bool operator==(const OrderedMap& other) const;
    [[nodiscard]] bool operator==(const Object& plain) const;

private:
    Mapping mapping_;
};

} // namespace protodict
