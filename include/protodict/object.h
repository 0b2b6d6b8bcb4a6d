// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file object.h
/// @brief Host-side runtime value produced by materialization.
///
/// Object is the mutable, plain counterpart of TypedValue. It holds:
/// - null, bool, int64_t, double, std::string, Bytes
/// - a domain object (DomainPtr)
/// - plain lists (std::vector) and plain maps (tsl::robin_map)
///
/// ## Key Differences from TypedValue
/// - Object allows in-place modification
/// - Plain maps are unordered; order lives in OrderedMap
/// - Containers are boxed (unique_ptr) to break the recursive type
///   dependency; copying performs a deep clone
///
/// ## Usage Example
/// ```cpp
/// Object plain = Object::map({{"a", 1}, {"b", Object::list({1, 2})}});
/// plain.set("c", "text");
/// if (const Object* b = plain.get("b")) {
///     std::cout << b->size() << std::endl;   // 2
/// }
/// ```

#pragma once

#include <protodict/protodict_config.h>
#include <protodict/api.h>
#include <protodict/domain_value.h>
#include <protodict/fwd.h>
#include <protodict/typed_value.h>

#include <tsl/robin_map.h>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace protodict {

// ============================================================
// Transparent Hash/Equal for robin_map heterogeneous lookup
// ============================================================

struct ObjectStringHash {
    using is_transparent = void;

    [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
        return std::hash<std::string_view>{}(sv);
    }

    [[nodiscard]] std::size_t operator()(const std::string& s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }

    [[nodiscard]] std::size_t operator()(const char* s) const noexcept { return std::hash<std::string_view>{}(s); }
};

struct ObjectStringEqual {
    using is_transparent = void;

    [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
};

/// Plain map - stores Object directly
using ObjectMap = tsl::robin_map<std::string, Object, ObjectStringHash, ObjectStringEqual>;

/// Plain list - stores Object directly
using ObjectList = std::vector<Object>;

using ObjectMapPtr  = std::unique_ptr<ObjectMap>;
using ObjectListPtr = std::unique_ptr<ObjectList>;

struct PROTODICT_API Object {
    using DataVariant = std::variant<std::monostate,
                                     bool,
                                     int64_t,
                                     double,
                                     std::string,
                                     Bytes,
                                     DomainPtr,
                                     ObjectListPtr,
                                     ObjectMapPtr>;

    DataVariant data;

    // ============================================================
    // Constructors
    // ============================================================
    // Not explicit, so plain literals convert:
    //   plain.set("name", "John");
    //   plain.set("age", 30);

    Object() : data(std::monostate{}) {}
    Object(std::nullptr_t) : data(std::monostate{}) {}
    Object(bool v) : data(v) {}

    template <detail::NarrowInteger T>
    Object(T v) : data(static_cast<int64_t>(v)) {}

    /// Throws TypeError above INT64_MAX
    template <detail::WideUnsigned T>
    Object(T v) : data(detail::checked_int64(static_cast<uint64_t>(v))) {}

    Object(char v) : data(std::string(1, v)) {}
    Object(char8_t v) : data(std::string(1, static_cast<char>(v))) {}

    Object(double v) : data(v) {}
    Object(std::string v) : data(std::move(v)) {}
    Object(const char* v) : data(std::monostate{}) {
        if (v != nullptr) data = std::string(v);
    }
    Object(std::string_view v) : data(std::string(v)) {}
    Object(Bytes v) : data(std::move(v)) {}
    Object(DomainPtr v) : data(std::move(v)) {}

    template <std::derived_from<DomainObject> T>
    Object(std::shared_ptr<T> v) : data(DomainPtr{std::move(v)}) {}

    Object(ObjectList v);
    Object(ObjectMap v);

    Object(const Object& other);
    Object& operator=(const Object& other);
    Object(Object&&) noexcept = default;
    Object& operator=(Object&&) noexcept = default;
    ~Object();

    // ============================================================
    // Factory Methods
    // ============================================================

    [[nodiscard]] static Object list(std::initializer_list<Object> init = {});
    [[nodiscard]] static Object map(std::initializer_list<std::pair<std::string, Object>> init = {});

    // ============================================================
    // Type Checking
    // ============================================================

    [[nodiscard]] bool is_null() const { return std::holds_alternative<std::monostate>(data); }

    template <typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(data);
    }

    [[nodiscard]] bool is_bool() const { return is<bool>(); }
    [[nodiscard]] bool is_int() const { return is<int64_t>(); }
    [[nodiscard]] bool is_double() const { return is<double>(); }
    [[nodiscard]] bool is_string() const { return is<std::string>(); }
    [[nodiscard]] bool is_bytes() const { return is<Bytes>(); }
    [[nodiscard]] bool is_domain() const { return is<DomainPtr>(); }
    [[nodiscard]] bool is_list() const { return is<ObjectListPtr>(); }
    [[nodiscard]] bool is_map() const { return is<ObjectMapPtr>(); }

    // ============================================================
    // Value Access
    // ============================================================

    /// Get value as specific type (throws std::bad_variant_access if wrong type)
    template <typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(data);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const {
        return std::get_if<T>(&data);
    }

    [[nodiscard]] int64_t as_int(int64_t default_val = 0) const {
        if (auto* p = get_if<int64_t>()) return *p;
        return default_val;
    }

    [[nodiscard]] std::string as_string(std::string default_val = "") const {
        if (auto* p = get_if<std::string>()) return *p;
        return default_val;
    }

    /// Domain object downcast; nullptr if not a domain value of type T
    template <typename T>
    [[nodiscard]] std::shared_ptr<T> as_domain() const {
        if (auto* p = get_if<DomainPtr>()) return std::dynamic_pointer_cast<T>(*p);
        return nullptr;
    }

    [[nodiscard]] const ObjectList* list_data() const {
        if (auto* p = get_if<ObjectListPtr>()) return p->get();
        return nullptr;
    }

    [[nodiscard]] const ObjectMap* map_data() const {
        if (auto* p = get_if<ObjectMapPtr>()) return p->get();
        return nullptr;
    }

    // ============================================================
    // Map Operations
    // ============================================================

    /// Get map child by key (nullptr if not found or not a map)
    [[nodiscard]] const Object* get(std::string_view key) const;

    /// Set map child by key (turns this value into a map if needed)
    Object& set(std::string_view key, Object value);

    [[nodiscard]] bool contains(std::string_view key) const { return get(key) != nullptr; }

    bool erase(std::string_view key);

    /// Map child by key; throws KeyError
    [[nodiscard]] const Object& operator[](std::string_view key) const;

    // ============================================================
    // List Operations
    // ============================================================

    /// Get list element (nullptr if out of bounds or not a list)
    [[nodiscard]] const Object* get(std::size_t index) const;

    /// Push value to end of list (turns this value into a list if needed)
    void push_back(Object value);

    /// List element; throws IndexError
    [[nodiscard]] const Object& operator[](std::size_t index) const;

    /// Number of children for lists and maps, 0 otherwise
    [[nodiscard]] std::size_t size() const;

    // ============================================================
    // Comparison
    // ============================================================

    /// Deep equality. Maps compare by key set, domain objects by equals().
    [[nodiscard]] bool operator==(const Object& other) const;

    // ============================================================
    // Utility
    // ============================================================

    [[nodiscard]] Object clone() const;

    [[nodiscard]] std::string to_string() const;

private:
    ObjectList& ensure_list();
    ObjectMap& ensure_map();
};

} // namespace protodict
