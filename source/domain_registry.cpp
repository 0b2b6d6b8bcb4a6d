// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <protodict/domain_registry.h>
#include <protodict/domain_types.h>
#include <protodict/errors.h>
#include <protodict/object.h>

namespace protodict {

DomainRegistry::DomainRegistry()
{
    casters_.emplace(std::type_index(typeid(DomainPtr)),
                     [](const std::any& value) -> DomainPtr { return std::any_cast<const DomainPtr&>(value); });
}

DomainRegistry& DomainRegistry::global()
{
    static DomainRegistry instance = [] {
        DomainRegistry registry;
        registry.register_type<TimestampValue>();
        registry.register_type<StringValue>();
        registry.register_type<UrnValue>();
        return registry;
    }();
    return instance;
}

void DomainRegistry::add(Entry entry, std::type_index holder, AnyCaster caster)
{
    std::string name = entry.type_name;
    entries_.insert_or_assign(std::move(name), std::move(entry));
    casters_.insert_or_assign(holder, std::move(caster));
}

const DomainRegistry::Entry* DomainRegistry::find(std::string_view type_name) const
{
    auto it = entries_.find(type_name);
    if (it == entries_.end()) return nullptr;
    return &it->second;
}

std::optional<DomainPtr> DomainRegistry::from_any(const std::any& value) const
{
    auto it = casters_.find(std::type_index(value.type()));
    if (it == casters_.end()) return std::nullopt;
    return it->second(value);
}

DomainPtr DomainRegistry::deserialize(std::string_view type_name, const ByteBuffer& payload) const
{
    if (const Entry* entry = find(type_name)) {
        return entry->deserialize(payload);
    }
    return std::make_shared<OpaqueDomainValue>(std::string{type_name}, payload);
}

DomainPtr DomainRegistry::coerce(std::string_view type_name, const Object& value) const
{
    const Entry* entry = find(type_name);
    if (!entry) {
        std::string message = "unknown element type '" + std::string{type_name} + "'";
        detail::log_error("DomainRegistry::coerce", message);
        throw ValueError(message);
    }
    return entry->coerce(value);
}

} // namespace protodict
