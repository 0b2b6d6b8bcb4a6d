// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

/// @file domain_registry.h
/// @brief Name-keyed registry of domain types.
///
/// The registry is the one extension point of the type codec. It answers:
/// - "which factory rebuilds type name N from its payload?" (materialize)
/// - "how is a host value coerced into type N?" (constrained sequences)
/// - "does this std::any hold a pointer to a registered domain type?" (classify)
///
/// Usage:
/// @code
///   DomainRegistry::global().register_type<MyDomainType>();
/// @endcode
///
/// The registry is not synchronized: register types at start-up, before
/// any concurrent lookup.

#pragma once

#include <protodict/protodict_config.h>
#include <protodict/api.h>
#include <protodict/domain_value.h>
#include <protodict/fwd.h>

#include <tsl/robin_map.h>

#include <any>
#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>

namespace protodict {

/// Requirements for a registrable domain type
template <typename T>
concept DomainType = std::derived_from<T, DomainObject> && requires(const ByteBuffer& bytes, const Object& value) {
    { T::kTypeName } -> std::convertible_to<std::string_view>;
    { T::deserialize(bytes) } -> std::convertible_to<std::shared_ptr<T>>;
    { T::coerce(value) } -> std::convertible_to<std::shared_ptr<T>>;
};

class PROTODICT_API DomainRegistry {
public:
    using Factory   = std::function<DomainPtr(const ByteBuffer&)>;
    using Coercer   = std::function<DomainPtr(const Object&)>;
    using AnyCaster = std::function<DomainPtr(const std::any&)>;

    struct Entry {
        std::string type_name;
        Factory deserialize;
        Coercer coerce;
    };

    /// Empty registry (only DomainPtr itself is recognized inside std::any)
    DomainRegistry();

    /// Process-wide registry with the standard domain types registered
    [[nodiscard]] static DomainRegistry& global();

    template <DomainType T>
    void register_type() {
        add(Entry{std::string{T::kTypeName},
                  [](const ByteBuffer& bytes) -> DomainPtr { return T::deserialize(bytes); },
                  [](const Object& value) -> DomainPtr { return T::coerce(value); }},
            std::type_index(typeid(std::shared_ptr<T>)),
            [](const std::any& value) -> DomainPtr { return std::any_cast<const std::shared_ptr<T>&>(value); });
    }

    /// Register (or replace) an entry together with the std::any holder type it answers to
    void add(Entry entry, std::type_index holder, AnyCaster caster);

    [[nodiscard]] const Entry* find(std::string_view type_name) const;

    [[nodiscard]] bool contains(std::string_view type_name) const { return find(type_name) != nullptr; }

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

    /// The domain pointer held by @p value (possibly a null pointer), or
    /// std::nullopt when @p value holds no registered pointer type
    [[nodiscard]] std::optional<DomainPtr> from_any(const std::any& value) const;

    /// Rebuild a domain object. Unregistered names yield an OpaqueDomainValue.
    [[nodiscard]] DomainPtr deserialize(std::string_view type_name, const ByteBuffer& payload) const;

    /// Coerce a host value into @p type_name; throws ValueError
    [[nodiscard]] DomainPtr coerce(std::string_view type_name, const Object& value) const;

private:
    struct StringHash {
        using is_transparent = void;
        [[nodiscard]] std::size_t operator()(std::string_view sv) const noexcept {
            return std::hash<std::string_view>{}(sv);
        }
    };

    struct StringEqual {
        using is_transparent = void;
        [[nodiscard]] bool operator()(std::string_view a, std::string_view b) const noexcept { return a == b; }
    };

    tsl::robin_map<std::string, Entry, StringHash, StringEqual> entries_;
    std::unordered_map<std::type_index, AnyCaster> casters_;
};

} // namespace protodict
