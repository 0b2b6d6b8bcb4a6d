// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <protodict/typed_value.h>
#include <protodict/errors.h>

#include <immer/flex_vector_transient.hpp>
#include <immer/map_transient.hpp>

#include <iomanip>
#include <limits>
#include <sstream>

namespace protodict {

int64_t detail::checked_int64(uint64_t value)
{
    if (value > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        std::string message = "Unsupported type: uint64 value " + std::to_string(value) + " (exceeds int64)";
        log_error("checked_int64", message);
        throw TypeError(message);
    }
    return static_cast<int64_t>(value);
}

// ============================================================
// Mapping
// ============================================================

const TypedValue* Mapping::find(const std::string& key) const
{
    const std::size_t* pos = index_.find(key);
    if (!pos) return nullptr;
    return &entries_[*pos].value.get();
}

Mapping Mapping::set(std::string key, TypedValue value) const
{
    Mapping result = *this;
    if (const std::size_t* pos = index_.find(key)) {
        result.entries_ = entries_.set(*pos, MappingEntry{std::move(key), TypedValueBox{std::move(value)}});
    } else {
        result.index_   = index_.set(key, entries_.size());
        result.entries_ = entries_.push_back(MappingEntry{std::move(key), TypedValueBox{std::move(value)}});
    }
    return result;
}

Mapping Mapping::erase(const std::string& key) const
{
    const std::size_t* pos = index_.find(key);
    if (!pos) return *this;

    const std::size_t removed = *pos;
    Mapping result;
    result.entries_ = entries_.erase(removed);

    // Entries after the removed one moved down by one
    auto index = index_.erase(key).transient();
    for (std::size_t i = removed; i < result.entries_.size(); ++i) {
        index.set(result.entries_[i].key, i);
    }
    result.index_ = index.persistent();
    return result;
}

// ============================================================
// TypedValue
// ============================================================

std::string_view kind_name(Kind kind) noexcept
{
    switch (kind) {
        case Kind::Null:        return "Null";
        case Kind::Bool:        return "Bool";
        case Kind::Integer:     return "Integer";
        case Kind::Float:       return "Float";
        case Kind::Text:        return "Text";
        case Kind::Bytes:       return "Bytes";
        case Kind::Domain:      return "DomainValue";
        case Kind::Mapping:     return "Mapping";
        case Kind::Sequence:    return "Sequence";
        case Kind::Unsupported: return "Unsupported";
    }
    return "Unknown";
}

TypedValue TypedValue::mapping(std::initializer_list<std::pair<std::string, TypedValue>> init)
{
    Mapping result;
    for (const auto& [key, value] : init) {
        result = result.set(key, value);
    }
    return TypedValue{std::move(result)};
}

TypedValue TypedValue::sequence(std::initializer_list<TypedValue> init)
{
    auto items = Sequence{}.transient();
    for (const auto& value : init) {
        items.push_back(TypedValueBox{value});
    }
    return TypedValue{items.persistent()};
}

std::size_t TypedValue::size() const
{
    if (const auto* m = get_if<Mapping>()) return m->size();
    if (const auto* s = get_if<Sequence>()) return s->size();
    return 0;
}

bool operator==(const TypedValue& a, const TypedValue& b)
{
    return a.data == b.data;
}

// ============================================================
// Debug output
// ============================================================

std::string value_to_string(const TypedValue& val)
{
    return std::visit([](const auto& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::string>) {
            return "\"" + arg + "\"";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(arg);
        } else if constexpr (std::is_same_v<T, double>) {
            std::ostringstream oss;
            oss << std::setprecision(17) << arg;
            return oss.str();
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return "<bytes:" + std::to_string(arg.size()) + ">";
        } else if constexpr (std::is_same_v<T, DomainValue>) {
            return arg.type_name + "<" + std::to_string(arg.payload.size()) + " bytes>";
        } else if constexpr (std::is_same_v<T, Mapping>) {
            return "{mapping:" + std::to_string(arg.size()) + "}";
        } else if constexpr (std::is_same_v<T, Sequence>) {
            return "[sequence:" + std::to_string(arg.size()) + "]";
        } else if constexpr (std::is_same_v<T, Unsupported>) {
            return "<" + arg.description + ">";
        } else {
            return "null";
        }
    }, val.data);
}

void print_value(const TypedValue& val, const std::string& prefix, std::size_t depth)
{
    const std::string indent(depth * 2, ' ');

    if (const auto* m = val.get_if<Mapping>()) {
        for (const auto& entry : *m) {
            std::cout << indent << prefix << entry.key << ":\n";
            print_value(*entry.value, "", depth + 1);
        }
    } else if (const auto* s = val.get_if<Sequence>()) {
        for (std::size_t i = 0; i < s->size(); ++i) {
            std::cout << indent << prefix << "[" << i << "]:\n";
            print_value(*(*s)[i], "", depth + 1);
        }
    } else {
        std::cout << indent << prefix << value_to_string(val) << "\n";
    }
}

} // namespace protodict
