// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <protodict/errors.h>
#include <protodict/ordered_map.h>

namespace protodict {

// ============================================================
// ItemsView
// ============================================================

OrderedMap::ItemsView::iterator::value_type OrderedMap::ItemsView::iterator::operator*() const
{
    const MappingEntry& entry = view_->snapshot_[pos_];
    return {entry.key, materialize(*entry.value, *view_->registry_)};
}

// ============================================================
// Construction
// ============================================================

OrderedMap::OrderedMap(std::initializer_list<std::pair<std::string, Object>> init)
{
    for (const auto& [key, value] : init) {
        set(key, value);
    }
}

OrderedMap::OrderedMap(const Object& plain, ClassifyMode mode)
{
    const ObjectMap* map = plain.map_data();
    if (!map) {
        throw TypeError("OrderedMap requires a plain map, got " + plain.to_string());
    }
    for (const auto& [key, value] : *map) {
        set(key, value, mode);
    }
}

OrderedMap OrderedMap::deserialize(const ByteBuffer& bytes, const DecodeOptions& options)
{
    TypedValue value = decode(bytes, options);
    const Mapping* mapping = value.get_if<Mapping>();
    if (!mapping) {
        throw DecodeError("expected a Mapping, got " + std::string{kind_name(value.kind())});
    }
    return OrderedMap(*mapping);
}

// ============================================================
// Modification / Access
// ============================================================

void OrderedMap::erase(const std::string& key)
{
    if (!mapping_.contains(key)) {
        detail::log_key_error("OrderedMap::erase", key, "not found");
        throw KeyError(key);
    }
    mapping_ = mapping_.erase(key);
}

Object OrderedMap::get(const std::string& key, const DomainRegistry& registry) const
{
    const TypedValue* value = mapping_.find(key);
    if (!value) {
        detail::log_key_error("OrderedMap::get", key, "not found");
        throw KeyError(key);
    }
    return materialize(*value, registry);
}

Object OrderedMap::get_or(const std::string& key, Object fallback) const
{
    if (const TypedValue* value = mapping_.find(key)) {
        return materialize(*value);
    }
    return fallback;
}

std::vector<std::string> OrderedMap::keys() const
{
    std::vector<std::string> result;
    result.reserve(mapping_.size());
    for (const auto& entry : mapping_) {
        result.push_back(entry.key);
    }
    return result;
}

Object OrderedMap::to_plain_mapping(const DomainRegistry& registry) const
{
    return materialize(to_typed_value(), registry);
}

bool OrderedMap::operator==(const OrderedMap& other) const
{
    return to_plain_mapping() == other.to_plain_mapping();
}

bool OrderedMap::operator==(const Object& plain) const
{
    return to_plain_mapping() == plain;
}

} // namespace protodict
