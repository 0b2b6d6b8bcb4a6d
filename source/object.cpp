// Copyright (c) 2024 chenmou. All rights reserved.
// Licensed under the MIT License. See LICENSE file in the project root.

#include <protodict/errors.h>
#include <protodict/object.h>

#include <sstream>

namespace protodict {

// ============================================================
// Construction
// ============================================================

Object::Object(ObjectList v)
    : data(std::make_unique<ObjectList>(std::move(v)))
{
}

Object::Object(ObjectMap v)
    : data(std::make_unique<ObjectMap>(std::move(v)))
{
}

Object::Object(const Object& other)
    : data(other.clone().data)
{
}

Object& Object::operator=(const Object& other)
{
    if (this != &other) {
        data = std::move(other.clone().data);
    }
    return *this;
}

Object::~Object() = default;

Object Object::list(std::initializer_list<Object> init)
{
    return Object{ObjectList(init)};
}

Object Object::map(std::initializer_list<std::pair<std::string, Object>> init)
{
    ObjectMap result;
    result.reserve(init.size());
    for (const auto& [key, value] : init) {
        result.insert_or_assign(key, value);
    }
    return Object{std::move(result)};
}

// ============================================================
// Map Operations
// ============================================================

const Object* Object::get(std::string_view key) const
{
    const auto* map = map_data();
    if (!map) return nullptr;

    // Heterogeneous lookup via transparent hash - no allocation
    auto it = map->find(key);
    if (it == map->end()) return nullptr;

    return &it->second;
}

Object& Object::set(std::string_view key, Object value)
{
    auto& map = ensure_map();
    auto it = map.find(key);
    if (it != map.end()) {
        it.value() = std::move(value);
        return it.value();
    }
    auto [inserted, _] = map.emplace(std::string{key}, std::move(value));
    return inserted.value();
}

bool Object::erase(std::string_view key)
{
    auto* map = is_map() ? std::get<ObjectMapPtr>(data).get() : nullptr;
    if (!map) return false;

    auto it = map->find(key);
    if (it == map->end()) return false;

    map->erase(it);
    return true;
}

const Object& Object::operator[](std::string_view key) const
{
    if (const Object* child = get(key)) {
        return *child;
    }
    detail::log_key_error("Object::operator[]", key, "not found");
    throw KeyError(std::string{key});
}

// ============================================================
// List Operations
// ============================================================

const Object* Object::get(std::size_t index) const
{
    const auto* list = list_data();
    if (!list || index >= list->size()) return nullptr;

    return &(*list)[index];
}

void Object::push_back(Object value)
{
    ensure_list().push_back(std::move(value));
}

const Object& Object::operator[](std::size_t index) const
{
    if (const Object* child = get(index)) {
        return *child;
    }
    detail::log_index_error("Object::operator[]", index, "out of range");
    throw IndexError(index, size());
}

std::size_t Object::size() const
{
    if (const auto* list = list_data()) {
        return list->size();
    }
    if (const auto* map = map_data()) {
        return map->size();
    }
    return 0;
}

ObjectList& Object::ensure_list()
{
    if (!is_list()) {
        data = std::make_unique<ObjectList>();
    }
    return *std::get<ObjectListPtr>(data);
}

ObjectMap& Object::ensure_map()
{
    if (!is_map()) {
        data = std::make_unique<ObjectMap>();
    }
    return *std::get<ObjectMapPtr>(data);
}

// ============================================================
// Comparison
// ============================================================

bool Object::operator==(const Object& other) const
{
    if (data.index() != other.data.index()) return false;

    return std::visit([&other](const auto& val) -> bool {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, ObjectMapPtr>) {
            const auto& other_map = *std::get<ObjectMapPtr>(other.data);
            if (val->size() != other_map.size()) return false;
            for (const auto& [k, v] : *val) {
                auto it = other_map.find(k);
                if (it == other_map.end()) return false;
                if (!(v == it->second)) return false;
            }
            return true;
        }
        else if constexpr (std::is_same_v<T, ObjectListPtr>) {
            const auto& other_list = *std::get<ObjectListPtr>(other.data);
            if (val->size() != other_list.size()) return false;
            for (std::size_t i = 0; i < val->size(); ++i) {
                if (!((*val)[i] == other_list[i])) return false;
            }
            return true;
        }
        else if constexpr (std::is_same_v<T, DomainPtr>) {
            const auto& other_ptr = std::get<DomainPtr>(other.data);
            if (!val && !other_ptr) return true;
            if (!val || !other_ptr) return false;
            return val->equals(*other_ptr);
        }
        else {
            return val == std::get<T>(other.data);
        }
    }, data);
}

// ============================================================
// Utility
// ============================================================

Object Object::clone() const
{
    return std::visit([](const auto& val) -> Object {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, ObjectMapPtr>) {
            ObjectMap new_map;
            new_map.reserve(val->size());
            for (const auto& [k, v] : *val) {
                new_map.emplace(k, v.clone());
            }
            return Object{std::move(new_map)};
        }
        else if constexpr (std::is_same_v<T, ObjectListPtr>) {
            ObjectList new_list;
            new_list.reserve(val->size());
            for (const auto& v : *val) {
                new_list.push_back(v.clone());
            }
            return Object{std::move(new_list)};
        }
        else if constexpr (std::is_same_v<T, std::monostate>) {
            return Object{};
        }
        else {
            // Domain objects are shared: they are never mutated through an Object
            return Object{val};
        }
    }, data);
}

namespace {

void write_object(std::ostringstream& oss, const Object& value)
{
    std::visit([&oss](const auto& val) {
        using T = std::decay_t<decltype(val)>;

        if constexpr (std::is_same_v<T, std::monostate>) {
            oss << "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            oss << (val ? "true" : "false");
        } else if constexpr (std::is_same_v<T, int64_t> || std::is_same_v<T, double>) {
            oss << val;
        } else if constexpr (std::is_same_v<T, std::string>) {
            oss << '"' << val << '"';
        } else if constexpr (std::is_same_v<T, Bytes>) {
            oss << "b\"" << val.view() << '"';
        } else if constexpr (std::is_same_v<T, DomainPtr>) {
            if (val) {
                oss << val->type_name() << '(' << val->to_string() << ')';
            } else {
                oss << "null";
            }
        } else if constexpr (std::is_same_v<T, ObjectListPtr>) {
            oss << '[';
            bool first = true;
            for (const auto& item : *val) {
                if (!first) oss << ", ";
                first = false;
                write_object(oss, item);
            }
            oss << ']';
        } else if constexpr (std::is_same_v<T, ObjectMapPtr>) {
            oss << '{';
            bool first = true;
            for (const auto& [k, v] : *val) {
                if (!first) oss << ", ";
                first = false;
                oss << '"' << k << "\": ";
                write_object(oss, v);
            }
            oss << '}';
        }
    }, value.data);
}

} // anonymous namespace

std::string Object::to_string() const
{
    std::ostringstream oss;
    write_object(oss, *this);
    return oss.str();
}

} // namespace protodict
