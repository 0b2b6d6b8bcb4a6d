// test_typed_value.cpp - Tests for TypedValue, Mapping and the host-side Object

#include <catch2/catch_all.hpp>
#include <protodict/errors.h>
#include <protodict/object.h>
#include <protodict/typed_value.h>

#include <cstdint>
#include <limits>

using namespace protodict;

// ============================================================
// TypedValue Construction
// ============================================================

TEST_CASE("TypedValue default construction", "[typed_value][construction]") {
    TypedValue v;
    REQUIRE(v.is_null());
    REQUIRE(v.kind() == Kind::Null);
    REQUIRE(v.size() == 0);
}

TEST_CASE("TypedValue scalar construction", "[typed_value][construction]") {
    SECTION("bool stays bool") {
        TypedValue v{true};
        REQUIRE(v.kind() == Kind::Bool);
        REQUIRE(v.as<bool>() == true);
    }

    SECTION("narrow integers widen to int64") {
        TypedValue v{int16_t{-7}};
        REQUIRE(v.kind() == Kind::Integer);
        REQUIRE(v.as<int64_t>() == -7);
    }

    SECTION("double") {
        TypedValue v{2.5};
        REQUIRE(v.kind() == Kind::Float);
        REQUIRE(v.as<double>() == Catch::Approx(2.5));
    }

    SECTION("text and bytes are distinct") {
        TypedValue text{"abc"};
        TypedValue bytes{Bytes{std::string_view{"abc"}}};
        REQUIRE(text.kind() == Kind::Text);
        REQUIRE(bytes.kind() == Kind::Bytes);
        REQUIRE_FALSE(text == bytes);
    }

    SECTION("wide unsigned values are range checked") {
        const uint64_t big = std::numeric_limits<uint64_t>::max();
        REQUIRE_THROWS_AS(TypedValue{big}, TypeError);
        REQUIRE(TypedValue{uint64_t{7}}.as<int64_t>() == 7);
        REQUIRE(TypedValue{std::numeric_limits<uint32_t>::max()}.as<int64_t>() == 4294967295);
    }

    SECTION("characters are text") {
        REQUIRE(TypedValue{'x'}.kind() == Kind::Text);
        REQUIRE(TypedValue{'x'}.as<std::string>() == "x");
        REQUIRE(TypedValue{static_cast<signed char>(120)}.as<int64_t>() == 120);
    }

    SECTION("null C string is null") {
        const char* missing = nullptr;
        REQUIRE(TypedValue{missing}.is_null());
    }

    SECTION("unsupported marker") {
        TypedValue v{Unsupported{"Unsupported type: Foo"}};
        REQUIRE(v.is_unsupported());
        REQUIRE(kind_name(v.kind()) == "Unsupported");
    }
}

TEST_CASE("TypedValue container factories", "[typed_value][construction]") {
    auto seq = TypedValue::sequence({1, "two", TypedValue::sequence({3})});
    REQUIRE(seq.kind() == Kind::Sequence);
    REQUIRE(seq.size() == 3);
    REQUIRE(seq.is_container());

    auto map = TypedValue::mapping({{"a", 1}, {"b", true}});
    REQUIRE(map.kind() == Kind::Mapping);
    REQUIRE(map.size() == 2);
}

TEST_CASE("TypedValue structural equality", "[typed_value][equality]") {
    REQUIRE(TypedValue{1} == TypedValue{int64_t{1}});
    REQUIRE_FALSE(TypedValue{1} == TypedValue{true});
    REQUIRE_FALSE(TypedValue{1} == TypedValue{1.0});
    REQUIRE(TypedValue::sequence({1, 2}) == TypedValue::sequence({1, 2}));
    REQUIRE_FALSE(TypedValue::sequence({1, 2}) == TypedValue::sequence({2, 1}));

    DomainValue a{"RDFString", {'x'}, 10};
    DomainValue b{"RDFString", {'x'}, 11};
    REQUIRE_FALSE(TypedValue{a} == TypedValue{b});
}

// ============================================================
// Mapping
// ============================================================

TEST_CASE("Mapping keeps insertion order", "[typed_value][mapping]") {
    Mapping m = Mapping{}.set("z", 1).set("a", 2).set("m", 3);

    REQUIRE(m.size() == 3);
    REQUIRE(m[0].key == "z");
    REQUIRE(m[1].key == "a");
    REQUIRE(m[2].key == "m");
}

TEST_CASE("Mapping overwrite keeps position", "[typed_value][mapping]") {
    Mapping m = Mapping{}.set("a", 1).set("b", 2).set("a", 10);

    REQUIRE(m.size() == 2);
    REQUIRE(m[0].key == "a");
    REQUIRE(m.find("a")->as<int64_t>() == 10);
}

TEST_CASE("Mapping erase closes the gap", "[typed_value][mapping]") {
    Mapping m = Mapping{}.set("a", 1).set("b", 2).set("c", 3);
    Mapping erased = m.erase("a");

    REQUIRE(erased.size() == 2);
    REQUIRE(erased[0].key == "b");
    REQUIRE(erased.find("c")->as<int64_t>() == 3);
    REQUIRE(erased.find("a") == nullptr);

    // original untouched
    REQUIRE(m.size() == 3);

    // set after erase appends at the end and lookups stay consistent
    Mapping again = erased.set("a", 4);
    REQUIRE(again[2].key == "a");
    REQUIRE(again.find("b")->as<int64_t>() == 2);

    REQUIRE(m.erase("missing") == m);
}

TEST_CASE("value_to_string", "[typed_value][debug]") {
    REQUIRE(value_to_string(TypedValue{}) == "null");
    REQUIRE(value_to_string(TypedValue{true}) == "true");
    REQUIRE(value_to_string(TypedValue{42}) == "42");
    REQUIRE(value_to_string(TypedValue{"hi"}) == "\"hi\"");
    REQUIRE(value_to_string(TypedValue::sequence({1, 2})) == "[sequence:2]");
}

// ============================================================
// Object
// ============================================================

TEST_CASE("Object primitive construction", "[object][construction]") {
    REQUIRE(Object{}.is_null());
    REQUIRE(Object{nullptr}.is_null());
    REQUIRE(Object{true}.is_bool());
    REQUIRE(Object{42}.as_int() == 42);
    REQUIRE(Object{1.5}.is_double());
    REQUIRE(Object{"text"}.as_string() == "text");
    REQUIRE(Object{Bytes{std::string_view{"raw"}}}.is_bytes());
}

TEST_CASE("Object integer and character construction", "[object][construction]") {
    const uint64_t big = std::numeric_limits<uint64_t>::max();
    REQUIRE_THROWS_AS(Object{big}, TypeError);
    REQUIRE(Object{uint64_t{9}}.as_int() == 9);
    REQUIRE(Object{uint8_t{200}}.as_int() == 200);

    REQUIRE(Object{'x'}.as_string() == "x");

    const char* missing = nullptr;
    REQUIRE(Object{missing}.is_null());
}

TEST_CASE("Object map operations", "[object][map]") {
    Object plain = Object::map({{"a", 1}});
    plain.set("b", "two");

    REQUIRE(plain.is_map());
    REQUIRE(plain.size() == 2);
    REQUIRE(plain.contains("b"));
    REQUIRE(plain["b"].as_string() == "two");
    REQUIRE(plain.get("missing") == nullptr);
    REQUIRE_THROWS_AS(plain["missing"], KeyError);

    REQUIRE(plain.erase("a"));
    REQUIRE_FALSE(plain.erase("a"));
    REQUIRE(plain.size() == 1);
}

TEST_CASE("Object list operations", "[object][list]") {
    Object list = Object::list({1, 2});
    list.push_back(3);

    REQUIRE(list.is_list());
    REQUIRE(list.size() == 3);
    REQUIRE(list[2].as_int() == 3);
    REQUIRE(list.get(5) == nullptr);
    REQUIRE_THROWS_AS(list[5], IndexError);
}

TEST_CASE("Object copy is deep", "[object][clone]") {
    Object original = Object::map({{"items", Object::list({1, 2})}});
    Object copy = original;

    copy.set("items", Object::list({9}));

    REQUIRE(original["items"].size() == 2);
    REQUIRE(copy["items"].size() == 1);
    REQUIRE_FALSE(original == copy);
}

TEST_CASE("Object equality ignores map order", "[object][equality]") {
    Object a = Object::map({{"x", 1}, {"y", Object::list({true, nullptr})}});
    Object b = Object::map({{"y", Object::list({true, nullptr})}, {"x", 1}});

    REQUIRE(a == b);
    REQUIRE_FALSE(a == Object::map({{"x", 1}}));
    REQUIRE_FALSE(Object{1} == Object{true});
}
