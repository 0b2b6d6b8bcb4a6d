// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <protodict/domain_value.h>

namespace protodict {

DomainObject::DomainObject()
    : age_(now())
{
}

bool DomainObject::equals(const DomainObject& other) const
{
    return type_name() == other.type_name() && serialize() == other.serialize();
}

std::string DomainObject::to_string() const
{
    const ByteBuffer payload = serialize();
    return std::string(payload.begin(), payload.end());
}

OpaqueDomainValue::OpaqueDomainValue(std::string type_name, ByteBuffer payload)
    : type_name_(std::move(type_name))
    , payload_(std::move(payload))
{
}

std::string OpaqueDomainValue::to_string() const
{
    return "<" + std::to_string(payload_.size()) + " bytes>";
}

} // namespace protodict
