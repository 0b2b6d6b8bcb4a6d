// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <protodict/type_codec.h>
#include <protodict/ordered_map.h>
#include <protodict/typed_sequence.h>

#include <immer/flex_vector_transient.hpp>

#include <list>
#include <map>
#include <optional>
#include <unordered_map>
#include <vector>

namespace protodict {

// ============================================================
// Helpers
// ============================================================

namespace detail {

TypedValue classify_domain(const DomainObject& object)
{
    if (auto integer = object.integer_value()) {
        return TypedValue{*integer};
    }

    DomainValue value;
    value.type_name = std::string{object.type_name()};
    value.payload   = object.serialize();
    if (const auto& age = object.age()) {
        value.age = to_micros(*age);
    }
    return TypedValue{std::move(value)};
}

TypedValue classify_unsigned(uint64_t value, ClassifyMode mode)
{
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return unsupported("uint64 value " + std::to_string(value) + " (exceeds int64)", mode);
    }
    return TypedValue{static_cast<int64_t>(value)};
}

TypedValue unsupported(std::string_view type_name, ClassifyMode mode, std::source_location loc)
{
    std::string description = "Unsupported type: " + std::string{type_name};
    if (mode == ClassifyMode::Strict) {
        throw TypeError(description);
    }
    log_error("classify", description, loc);
    return TypedValue{Unsupported{std::move(description)}};
}

} // namespace detail

namespace {

template <typename T>
bool classify_as(const std::any& value, ClassifyMode mode, std::optional<TypedValue>& out)
{
    if (const T* held = std::any_cast<T>(&value)) {
        out = classify(*held, mode);
        return true;
    }
    return false;
}

/// First held type in the list wins
template <typename... Ts>
std::optional<TypedValue> classify_any_as(const std::any& value, ClassifyMode mode)
{
    std::optional<TypedValue> out;
    (void)(classify_as<Ts>(value, mode, out) || ...);
    return out;
}

} // anonymous namespace

// ============================================================
// Classification
// ============================================================

TypedValue classify(const Object& value, ClassifyMode mode)
{
    return std::visit([mode](const auto& val) -> TypedValue {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return TypedValue{};
        } else if constexpr (std::is_same_v<T, DomainPtr>) {
            if (!val) return TypedValue{};
            return detail::classify_domain(*val);
        } else if constexpr (std::is_same_v<T, ObjectListPtr>) {
            auto items = Sequence{}.transient();
            for (const auto& child : *val) {
                items.push_back(TypedValueBox{classify(child, mode)});
            }
            return TypedValue{items.persistent()};
        } else if constexpr (std::is_same_v<T, ObjectMapPtr>) {
            Mapping result;
            for (const auto& [key, child] : *val) {
                result = result.set(key, classify(child, mode));
            }
            return TypedValue{std::move(result)};
        } else {
            return TypedValue{val};
        }
    }, value.data);
}

TypedValue classify(const std::any& value, ClassifyMode mode)
{
    if (!value.has_value()) {
        return TypedValue{};
    }

    auto result = classify_any_as<
        std::nullptr_t, std::monostate,
        bool,
        char, signed char, unsigned char, short, unsigned short,
        int, unsigned int, long, unsigned long, long long, unsigned long long,
        float, double,
        std::string, std::string_view, const char*, Bytes, ByteBuffer,
        Object, TypedValue, OrderedMap, TypedSequence,
        std::vector<std::any>, std::list<std::any>,
        std::map<std::string, std::any>, std::unordered_map<std::string, std::any>,
        std::vector<int>, std::vector<int64_t>, std::vector<double>, std::vector<std::string>,
        std::map<std::string, int>, std::map<std::string, std::string>>(value, mode);
    if (result) {
        return *std::move(result);
    }

    if (auto domain = DomainRegistry::global().from_any(value)) {
        if (!*domain) return TypedValue{};
        return detail::classify_domain(**domain);
    }

    return detail::unsupported(boost::core::demangle(value.type().name()), mode);
}

TypedValue classify(const OrderedMap& value, ClassifyMode)
{
    return value.to_typed_value();
}

TypedValue classify(const TypedSequence& value, ClassifyMode)
{
    return value.to_typed_value();
}

TypedValue classify(const TypedValue& value, ClassifyMode)
{
    return value;
}

// ============================================================
// Materialization
// ============================================================

Object materialize(const TypedValue& value, const DomainRegistry& registry)
{
    return std::visit([&registry](const auto& val) -> Object {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            return Object{};
        } else if constexpr (std::is_same_v<T, DomainValue>) {
            DomainPtr object = registry.deserialize(val.type_name, val.payload);
            if (val.age) {
                object->set_age(from_micros(*val.age));
            } else {
                object->set_age(std::nullopt);
            }
            return Object{std::move(object)};
        } else if constexpr (std::is_same_v<T, Mapping>) {
            ObjectMap result;
            result.reserve(val.size());
            for (const auto& entry : val) {
                result.insert_or_assign(entry.key, materialize(*entry.value, registry));
            }
            return Object{std::move(result)};
        } else if constexpr (std::is_same_v<T, Sequence>) {
            ObjectList result;
            result.reserve(val.size());
            for (const auto& item : val) {
                result.push_back(materialize(*item, registry));
            }
            return Object{std::move(result)};
        } else if constexpr (std::is_same_v<T, Unsupported>) {
            return Object{val.description};
        } else {
            return Object{val};
        }
    }, value.data);
}

bool equivalent(const TypedValue& a, const TypedValue& b)
{
    if (a.kind() != b.kind()) return false;

    if (const auto* ma = a.get_if<Mapping>()) {
        const auto& mb = b.as<Mapping>();
        if (ma->size() != mb.size()) return false;
        for (const auto& entry : *ma) {
            const TypedValue* other = mb.find(entry.key);
            if (!other || !equivalent(*entry.value, *other)) return false;
        }
        return true;
    }

    if (const auto* sa = a.get_if<Sequence>()) {
        const auto& sb = b.as<Sequence>();
        if (sa->size() != sb.size()) return false;
        for (std::size_t i = 0; i < sa->size(); ++i) {
            if (!equivalent(*(*sa)[i], *sb[i])) return false;
        }
        return true;
    }

    if (const auto* da = a.get_if<DomainValue>()) {
        const auto& db = b.as<DomainValue>();
        return da->type_name == db.type_name && da->payload == db.payload;
    }

    return a == b;
}

} // namespace protodict
