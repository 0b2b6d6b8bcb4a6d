// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file typed_value.h
/// @brief TypedValue: the closed set of shapes protodict can encode.
///
/// A TypedValue is one of:
/// - Null, Bool, Integer (int64), Float (double)
/// - Text (UTF-8 std::string), Bytes (raw byte string)
/// - DomainValue: an externally typed value, kept as (type name, payload, age)
/// - Mapping: insertion-ordered string-keyed entries
/// - Sequence: ordered values
/// - Unsupported: lossy marker left by lenient classification
///
/// Containers are immer persistent structures, so copying a TypedValue is
/// cheap and a TypedValue never changes once built.

#pragma once

#include <protodict/protodict_config.h>
#include <protodict/api.h>
#include <protodict/concepts.h>
#include <protodict/fwd.h>

#include <immer/box.hpp>
#include <immer/flex_vector.hpp>
#include <immer/flex_vector_transient.hpp>
#include <immer/map.hpp>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <iostream>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace protodict {

namespace detail {

inline void log_error(
    std::string_view func,
    std::string_view message,
    std::source_location loc = std::source_location::current()) noexcept
{
#if PROTODICT_VERBOSE_LOG
    std::cerr << "[" << func << "] " << message
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)message;
    (void)loc;
#endif
}

inline void log_key_error(
    std::string_view func,
    std::string_view key,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if PROTODICT_VERBOSE_LOG
    std::cerr << "[" << func << "] key '" << key << "' " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)key;
    (void)reason;
    (void)loc;
#endif
}

inline void log_index_error(
    std::string_view func,
    std::size_t index,
    std::string_view reason,
    std::source_location loc = std::source_location::current()) noexcept
{
#if PROTODICT_VERBOSE_LOG
    std::cerr << "[" << func << "] index " << index << " " << reason
              << " (called from " << loc.file_name()
              << ":" << loc.line() << ")\n";
#else
    (void)func;
    (void)index;
    (void)reason;
    (void)loc;
#endif
}

/// Narrows a 64-bit unsigned value; throws TypeError above INT64_MAX
[[nodiscard]] PROTODICT_API int64_t checked_int64(uint64_t value);

/// 64-bit unsigned types, which do not always fit an Integer
template <typename T>
concept WideUnsigned = std::unsigned_integral<T> && sizeof(T) >= sizeof(int64_t) && !CharacterType<T>;

/// Integers that always fit an Integer
template <typename T>
concept NarrowInteger = std::integral<T> && !std::same_as<T, bool> && !CharacterType<T> && !WideUnsigned<T>;

} // namespace detail

// ============================================================
// Scalar payload types
// ============================================================

/// Raw byte string. Distinct from Text by type, never by content.
struct Bytes {
    ByteBuffer data;

    Bytes() = default;
    explicit Bytes(ByteBuffer b) : data(std::move(b)) {}
    explicit Bytes(std::string_view s) : data(s.begin(), s.end()) {}

    [[nodiscard]] std::size_t size() const noexcept { return data.size(); }
    [[nodiscard]] bool empty() const noexcept { return data.empty(); }

    [[nodiscard]] std::string_view view() const noexcept {
        return {reinterpret_cast<const char*>(data.data()), data.size()};
    }

    bool operator==(const Bytes&) const = default;
};

/// Externally typed value, opaque to the core.
/// @c age is the creation timestamp in microseconds since the Unix epoch.
struct DomainValue {
    std::string type_name;
    ByteBuffer payload;
    std::optional<int64_t> age;

    bool operator==(const DomainValue&) const = default;
};

/// Marker produced by lenient classification.
/// The description always contains "Unsupported type".
struct Unsupported {
    std::string description;

    bool operator==(const Unsupported&) const = default;
};

// ============================================================
// Containers
// ============================================================

using TypedValueBox = immer::box<TypedValue, memory_policy>;

struct MappingEntry {
    std::string key;
    TypedValueBox value;

    bool operator==(const MappingEntry& other) const {
        return key == other.key && value == other.value;
    }

    bool operator!=(const MappingEntry& other) const {
        return !(*this == other);
    }
};

/// Insertion-ordered, string-keyed persistent mapping.
///
/// Entries live in a flex_vector (order); a hash map from key to position
/// gives O(1) lookup. Every "modifying" member returns a new Mapping.
class PROTODICT_API Mapping {
public:
    using entries_type = immer::flex_vector<MappingEntry, memory_policy>;
    using index_type   = immer::map<std::string,
                                    std::size_t,
                                    std::hash<std::string>,
                                    std::equal_to<std::string>,
                                    memory_policy>;
    using iterator       = entries_type::iterator;
    using const_iterator = entries_type::iterator;
    using size_type      = std::size_t;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] iterator begin() const { return entries_.begin(); }
    [[nodiscard]] iterator end() const { return entries_.end(); }

    [[nodiscard]] const MappingEntry& operator[](std::size_t pos) const { return entries_[pos]; }

    /// Returns nullptr when the key is absent
    [[nodiscard]] const TypedValue* find(const std::string& key) const;

    [[nodiscard]] bool contains(const std::string& key) const { return index_.count(key) > 0; }

    /// Insert or overwrite. An overwritten key keeps its position.
    [[nodiscard]] Mapping set(std::string key, TypedValue value) const;

    /// Remove a key, keeping the relative order of the others.
    /// Removing an absent key returns an unchanged copy.
    [[nodiscard]] Mapping erase(const std::string& key) const;

    [[nodiscard]] const entries_type& entries() const noexcept { return entries_; }

    /// Structural, order-sensitive comparison
    friend bool operator==(const Mapping& a, const Mapping& b) { return a.entries_ == b.entries_; }

private:
    entries_type entries_;
    index_type index_;
};

using Sequence = immer::flex_vector<TypedValueBox, memory_policy>;

// ============================================================
// TypedValue
// ============================================================

/// Variant order matches Kind
enum class Kind : uint8_t {
    Null = 0,
    Bool,
    Integer,
    Float,
    Text,
    Bytes,
    Domain,
    Mapping,
    Sequence,
    Unsupported,
};

[[nodiscard]] PROTODICT_API std::string_view kind_name(Kind kind) noexcept;

struct PROTODICT_API TypedValue
{
    std::variant<std::monostate,
                 bool,
                 int64_t,
                 double,
                 std::string,
                 Bytes,
                 DomainValue,
                 Mapping,
                 Sequence,
                 Unsupported>
        data;

    TypedValue() noexcept : data(std::monostate{}) {}
    TypedValue(bool v) noexcept : data(v) {}

    template <detail::NarrowInteger T>
    TypedValue(T v) noexcept : data(static_cast<int64_t>(v)) {}

    template <detail::WideUnsigned T>
    TypedValue(T v) : data(detail::checked_int64(static_cast<uint64_t>(v))) {}

    // Characters are one-character text, as classify() treats them
    TypedValue(char v) : data(std::string(1, v)) {}
    TypedValue(char8_t v) : data(std::string(1, static_cast<char>(v))) {}

    TypedValue(double v) noexcept : data(v) {}
    TypedValue(const std::string& v) : data(v) {}
    TypedValue(std::string&& v) noexcept : data(std::move(v)) {}
    TypedValue(const char* v) : data(std::monostate{}) {
        if (v != nullptr) data = std::string(v);
    }
    TypedValue(Bytes v) noexcept : data(std::move(v)) {}
    TypedValue(DomainValue v) : data(std::move(v)) {}
    TypedValue(Mapping v) : data(std::move(v)) {}
    TypedValue(Sequence v) : data(std::move(v)) {}
    TypedValue(Unsupported v) : data(std::move(v)) {}

    // Factory functions for container types
    static TypedValue mapping(std::initializer_list<std::pair<std::string, TypedValue>> init);
    static TypedValue sequence(std::initializer_list<TypedValue> init);

    template <typename T>
    [[nodiscard]] const T* get_if() const { return std::get_if<T>(&data); }

    template <typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(data); }

    template <typename T>
    [[nodiscard]] const T& as() const { return std::get<T>(data); }

    [[nodiscard]] Kind kind() const noexcept { return static_cast<Kind>(data.index()); }
    [[nodiscard]] bool is_null() const noexcept { return is<std::monostate>(); }
    [[nodiscard]] bool is_unsupported() const noexcept { return is<Unsupported>(); }
    [[nodiscard]] bool is_container() const noexcept { return is<Mapping>() || is<Sequence>(); }

    /// Number of children for containers, 0 otherwise
    [[nodiscard]] std::size_t size() const;
};

/// Structural equality: same tag, same scalar, same children in the same order
[[nodiscard]] PROTODICT_API bool operator==(const TypedValue& a, const TypedValue& b);

// Convert TypedValue to human-readable string
[[nodiscard]] PROTODICT_API std::string value_to_string(const TypedValue& val);

// Print TypedValue tree to stdout (for debugging)
PROTODICT_API void print_value(const TypedValue& val, const std::string& prefix = "", std::size_t depth = 0);

} // namespace protodict
