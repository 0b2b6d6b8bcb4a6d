// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file type_codec.h
/// @brief Conversion between host values and TypedValue.
///
/// classify() maps a host value onto the closed TypedValue set. Dispatch is
/// resolved at compile time for concrete C++ types and at run time for
/// Object and std::any, in this order:
///
///   1. null        nullptr, std::monostate, empty optional / any / pointer,
///                  null C string
///   2. Bool        bool (never collapses into Integer)
///   3. Integer     integral types, enums, integer-like domain objects
///   4. Float       float, double
///   5. Text/Bytes  by C++ type only: string types vs Bytes / ByteBuffer
///   6. containers  OrderedMap, TypedSequence, ranges, string-keyed maps
///   7. Domain      std::shared_ptr<T>, T derived from DomainObject
///   8. otherwise   Strict: TypeError, Lenient: Unsupported marker
///
/// materialize() is the inverse: it produces plain Objects, rebuilding
/// domain objects through the DomainRegistry.
///
/// ## Usage Example
/// ```cpp
/// TypedValue v = classify(std::vector<int>{1, 2, 3});
/// TypedValue u = classify(std::thread::id{}, ClassifyMode::Lenient);  // Unsupported
/// Object back = materialize(v);                                         // plain list
/// ```

#pragma once

#include <protodict/protodict_config.h>
#include <protodict/api.h>
#include <protodict/concepts.h>
#include <protodict/domain_registry.h>
#include <protodict/domain_value.h>
#include <protodict/errors.h>
#include <protodict/fwd.h>
#include <protodict/object.h>
#include <protodict/typed_value.h>

#include <boost/core/demangle.hpp>

#include <any>
#include <cstdint>
#include <limits>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <typeinfo>
#include <variant>

namespace protodict {

namespace detail {

template <typename T>
[[nodiscard]] std::string type_name()
{
    return boost::core::demangle(typeid(T).name());
}

/// DomainValue (or Integer for integer-like objects) with the age in microseconds
[[nodiscard]] PROTODICT_API TypedValue classify_domain(const DomainObject& object);

[[nodiscard]] PROTODICT_API TypedValue classify_unsigned(uint64_t value, ClassifyMode mode);

/// Strict: throws TypeError. Lenient: logs and returns an Unsupported marker.
[[nodiscard]] PROTODICT_API TypedValue unsupported(
    std::string_view type_name,
    ClassifyMode mode,
    std::source_location loc = std::source_location::current());

} // namespace detail

// ============================================================
// Classification
// ============================================================

[[nodiscard]] PROTODICT_API TypedValue classify(const Object& value, ClassifyMode mode = ClassifyMode::Strict);

/// Run-time dispatch over the same order as the compile-time overloads.
/// Pointers to registered domain types are recognized through the global registry.
[[nodiscard]] PROTODICT_API TypedValue classify(const std::any& value, ClassifyMode mode = ClassifyMode::Strict);

[[nodiscard]] PROTODICT_API TypedValue classify(const OrderedMap& value, ClassifyMode mode = ClassifyMode::Strict);

[[nodiscard]] PROTODICT_API TypedValue classify(const TypedSequence& value, ClassifyMode mode = ClassifyMode::Strict);

/// Already classified values pass through unchanged
[[nodiscard]] PROTODICT_API TypedValue classify(const TypedValue& value, ClassifyMode mode = ClassifyMode::Strict);

template <typename T>
[[nodiscard]] TypedValue classify(const T& value, ClassifyMode mode = ClassifyMode::Strict)
{
    using U = std::remove_cvref_t<T>;

    if constexpr (std::is_same_v<U, std::nullptr_t> || std::is_same_v<U, std::monostate>) {
        return TypedValue{};
    } else if constexpr (OptionalLike<U>) {
        if (!value) {
            return TypedValue{};
        }
        return classify(*value, mode);
    } else if constexpr (std::is_same_v<U, bool>) {
        return TypedValue{value};
    } else if constexpr (std::is_same_v<U, char> || std::is_same_v<U, char8_t>) {
        return TypedValue{std::string(1, static_cast<char>(value))};
    } else if constexpr (std::is_enum_v<U>) {
        return classify(static_cast<std::underlying_type_t<U>>(value), mode);
    } else if constexpr (IntegerLike<U>) {
        if constexpr (std::is_unsigned_v<U> && sizeof(U) >= sizeof(int64_t)) {
            return detail::classify_unsigned(static_cast<uint64_t>(value), mode);
        } else {
            return TypedValue{static_cast<int64_t>(value)};
        }
    } else if constexpr (std::is_floating_point_v<U>) {
        return TypedValue{static_cast<double>(value)};
    } else if constexpr (std::is_same_v<U, Bytes>) {
        return TypedValue{value};
    } else if constexpr (std::is_same_v<U, ByteBuffer>) {
        return TypedValue{Bytes{value}};
    } else if constexpr (StringLike<U>) {
        if constexpr (std::is_pointer_v<U>) {
            if (value == nullptr) {
                return TypedValue{};
            }
        }
        return TypedValue{std::string(std::string_view(value))};
    } else if constexpr (std::is_same_v<U, Mapping> || std::is_same_v<U, Sequence> ||
                         std::is_same_v<U, DomainValue> || std::is_same_v<U, Unsupported>) {
        return TypedValue{value};
    } else if constexpr (SharedPointer<U>) {
        if constexpr (std::derived_from<typename U::element_type, DomainObject>) {
            if (!value) {
                return TypedValue{};
            }
            return detail::classify_domain(*value);
        } else {
            return detail::unsupported(detail::type_name<U>(), mode);
        }
    } else if constexpr (StringKeyedMapping<U>) {
        Mapping result;
        for (const auto& [key, child] : value) {
            result = result.set(std::string(std::string_view(key)), classify(child, mode));
        }
        return TypedValue{std::move(result)};
    } else if constexpr (ValueRange<U>) {
        auto items = Sequence{}.transient();
        for (const auto& child : value) {
            items.push_back(TypedValueBox{classify(child, mode)});
        }
        return TypedValue{items.persistent()};
    } else {
        return detail::unsupported(detail::type_name<U>(), mode);
    }
}

// ============================================================
// Materialization
// ============================================================

/// Rebuild a plain host value. Mapping -> plain map, Sequence -> plain list,
/// DomainValue -> domain object with its age restored, Unsupported -> its
/// description string. Never throws for Unsupported.
[[nodiscard]] PROTODICT_API Object materialize(const TypedValue& value,
                                               const DomainRegistry& registry = DomainRegistry::global());

/// Semantic equality: mappings compare by key set, everything else structurally
[[nodiscard]] PROTODICT_API bool equivalent(const TypedValue& a, const TypedValue& b);

} // namespace protodict
