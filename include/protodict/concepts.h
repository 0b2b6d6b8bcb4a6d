// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file concepts.h
/// @brief C++20 Concepts driving classification dispatch.
///
/// The order in which classify() tests these concepts is the dispatch
/// order: bool before integers, integers before text, text before ranges.
///
/// @note Requires C++20 or later.

#pragma once

#include <concepts>
#include <cstdint>
#include <memory>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <type_traits>

namespace protodict {

// ============================================================
// Primitive Type Concepts
// ============================================================

/// Character types are text, not integers
template<typename T>
concept CharacterType = std::is_same_v<std::remove_cv_t<T>, char> ||
                        std::is_same_v<std::remove_cv_t<T>, char8_t> ||
                        std::is_same_v<std::remove_cv_t<T>, wchar_t> ||
                        std::is_same_v<std::remove_cv_t<T>, char16_t> ||
                        std::is_same_v<std::remove_cv_t<T>, char32_t>;

/// Integers and enumerations, excluding bool and character types
template<typename T>
concept IntegerLike = (std::is_integral_v<std::decay_t<T>> &&
                       !std::is_same_v<std::decay_t<T>, bool> &&
                       !CharacterType<std::decay_t<T>>) ||
                      std::is_enum_v<std::decay_t<T>>;

/// Concept for string-like types that can be viewed as UTF-8 text
template<typename T>
concept StringLike = std::is_same_v<std::decay_t<T>, std::string> ||
                     std::is_same_v<std::decay_t<T>, const char*> ||
                     std::is_convertible_v<const T&, std::string_view>;

// ============================================================
// Wrapper Concepts
// ============================================================

template<typename T>
struct is_optional : std::false_type {};

template<typename T>
struct is_optional<std::optional<T>> : std::true_type {};

template<typename T>
concept OptionalLike = is_optional<std::remove_cvref_t<T>>::value;

template<typename T>
struct is_shared_ptr : std::false_type {};

template<typename T>
struct is_shared_ptr<std::shared_ptr<T>> : std::true_type {};

template<typename T>
concept SharedPointer = is_shared_ptr<std::remove_cvref_t<T>>::value;

// ============================================================
// Container Concepts
// ============================================================

/// Associative container (has key_type and mapped_type)
template<typename T>
concept AssociativeContainer = std::ranges::input_range<const T> && requires {
    typename T::key_type;
    typename T::mapped_type;
};

/// Plain string-keyed associative structure
template<typename T>
concept StringKeyedMapping = AssociativeContainer<T> &&
                             std::is_convertible_v<const typename T::key_type&, std::string_view>;

/// Plain ordered collection of values
template<typename T>
concept ValueRange = std::ranges::input_range<const T> && !AssociativeContainer<T> && !StringLike<T>;

} // namespace protodict
