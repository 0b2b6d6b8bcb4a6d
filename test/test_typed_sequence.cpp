// test_typed_sequence.cpp - Tests for the ordered, optionally constrained sequence

#include <catch2/catch_all.hpp>
#include <protodict/domain_types.h>
#include <protodict/errors.h>
#include <protodict/ordered_map.h>
#include <protodict/typed_sequence.h>

#include <any>
#include <cstdint>
#include <limits>
#include <list>
#include <memory>
#include <string>
#include <vector>

using namespace protodict;

namespace {

struct Opaque {};

std::vector<Object> collect(const TypedSequence& seq)
{
    std::vector<Object> out;
    for (const Object& value : seq) {
        out.push_back(value);
    }
    return out;
}

} // anonymous namespace

// ============================================================
// Unconstrained sequences
// ============================================================

TEST_CASE("TypedSequence append and access", "[typed_sequence][access]") {
    TypedSequence seq;
    REQUIRE(seq.empty());
    REQUIRE_FALSE(seq.element_type().has_value());

    seq.append(1).append("two").append(3.0).append(nullptr);

    REQUIRE(seq.size() == 4);
    REQUIRE(seq.at(0).as_int() == 1);
    REQUIRE(seq[1].as_string() == "two");
    REQUIRE(seq[2].is_double());
    REQUIRE(seq[3].is_null());
    REQUIRE_THROWS_AS(seq.at(4), IndexError);
}

TEST_CASE("TypedSequence pop ordering", "[typed_sequence][pop]") {
    TypedSequence seq;
    seq.append("hello").append("world").append("!");

    REQUIRE(seq.pop().as_string() == "!");
    REQUIRE(seq.pop(1).as_string() == "world");
    REQUIRE(seq.pop().as_string() == "hello");
    REQUIRE(seq.empty());

    REQUIRE_THROWS_AS(seq.pop(), IndexError);
    REQUIRE_THROWS_AS(seq.pop(0), IndexError);
}

TEST_CASE("TypedSequence pop out of range leaves sequence intact", "[typed_sequence][pop]") {
    TypedSequence seq{1, 2};

    try {
        (void)seq.pop(5);
        FAIL("expected IndexError");
    } catch (const IndexError& e) {
        REQUIRE(e.index() == 5);
        REQUIRE(e.size() == 2);
    }
    REQUIRE(seq.size() == 2);
}

TEST_CASE("TypedSequence iteration is ordered and restartable", "[typed_sequence][iteration]") {
    TypedSequence seq{10, 20, 30};

    auto first = collect(seq);
    auto second = collect(seq);

    REQUIRE(first.size() == 3);
    REQUIRE(first == second);
    REQUIRE(first[0] == Object{10});
    REQUIRE(first[2] == Object{30});
}

TEST_CASE("TypedSequence from plain collections", "[typed_sequence][construction]") {
    SECTION("nested lists with empties and nulls") {
        Object plain = Object::list({1, Object::list(), nullptr, Object::list({Object::list({2})})});
        TypedSequence seq = TypedSequence::from(plain);

        REQUIRE(seq.size() == 4);
        REQUIRE(seq.to_plain_list() == plain);

        TypedSequence again = TypedSequence::from(seq.to_plain_list());
        REQUIRE(again == seq);
    }

    SECTION("standard containers") {
        TypedSequence seq = TypedSequence::from(std::list<std::string>{"a", "b"});
        REQUIRE(seq.to_plain_list() == Object::list({"a", "b"}));
    }

    SECTION("non-list object") {
        REQUIRE_THROWS_AS(TypedSequence::from(Object{1}), TypeError);
    }

    SECTION("mixed domain values keep their type") {
        auto ts = TimestampValue::now();
        std::vector<Object> mixed{ts, "plain", std::make_shared<StringValue>("typed"),
                                  std::make_shared<EnumValue>(5, "FIVE"), nullptr};
        TypedSequence seq = TypedSequence::from(mixed);

        REQUIRE(seq.size() == 5);
        REQUIRE(seq[0].as_domain<TimestampValue>() != nullptr);
        REQUIRE(seq[0].as_domain<TimestampValue>()->micros() == ts->micros());
        REQUIRE(seq[1].is_string());
        REQUIRE(seq[2].as_domain<StringValue>()->value() == "typed");
        REQUIRE(seq[3].as_int() == 5);
        REQUIRE(seq[4].is_null());

        TypedSequence back = TypedSequence::deserialize(seq.serialize());
        REQUIRE(back == seq);
        REQUIRE(back[0].as_domain<TimestampValue>() != nullptr);
        REQUIRE(back[3].as_int() == 5);
    }
}

TEST_CASE("TypedSequence initializer list agrees with append", "[typed_sequence][construction]") {
    REQUIRE_THROWS_AS((TypedSequence{std::numeric_limits<uint64_t>::max()}), TypeError);

    TypedSequence listed{'x', uint64_t{7}};
    TypedSequence appended;
    appended.append('x').append(uint64_t{7});

    REQUIRE(listed == appended);
    REQUIRE(listed[0].as_string() == "x");
    REQUIRE(listed[1].as_int() == 7);
}

TEST_CASE("TypedSequence extend is all-or-nothing", "[typed_sequence][extend]") {
    TypedSequence seq{1};
    seq.extend(std::vector<int>{2, 3});
    REQUIRE(seq.size() == 3);

    std::vector<std::any> mixed{4, Opaque{}};
    REQUIRE_THROWS_AS(seq.extend(mixed), TypeError);
    REQUIRE(seq.size() == 3);

    seq.extend(mixed, ClassifyMode::Lenient);
    REQUIRE(seq.size() == 5);
    REQUIRE(seq.items()[4]->is_unsupported());
}

TEST_CASE("TypedSequence order survives serialization", "[typed_sequence][roundtrip]") {
    TypedSequence seq;
    seq.append(3).append("b").append(true).append(std::vector<int>{1, 2}).append(2);

    TypedSequence back = TypedSequence::deserialize(seq.serialize());

    REQUIRE(back == seq);
    REQUIRE(collect(back) == collect(seq));
    REQUIRE(back[2].is_bool());
    REQUIRE_THROWS_AS(TypedSequence::deserialize(OrderedMap{}.serialize()), DecodeError);
}

// ============================================================
// Constrained sequences
// ============================================================

TEST_CASE("TypedSequence constrained append", "[typed_sequence][constrained]") {
    auto seq = TypedSequence::of<StringValue>();
    REQUIRE(seq.element_type() == std::optional<std::string>{"RDFString"});

    seq.append("hello");
    REQUIRE(seq.size() == 1);

    Object stored = seq[0];
    auto str = stored.as_domain<StringValue>();
    REQUIRE(str != nullptr);
    REQUIRE(str->value() == "hello");

    REQUIRE_THROWS_AS(seq.append(TimestampValue::now()), ValueError);
    REQUIRE_THROWS_AS(seq.append(Opaque{}), ValueError);
    REQUIRE_THROWS_AS(seq.append(42), ValueError);
    REQUIRE(seq.size() == 1);
}

TEST_CASE("TypedSequence keeps domain values distinct from plain values", "[typed_sequence][constrained]") {
    TypedSequence seq;
    seq.append(std::make_shared<StringValue>("same"));
    seq.append("same");

    Object typed = seq[0];
    Object plain = seq[1];

    REQUIRE(typed.as_domain<StringValue>() != nullptr);
    REQUIRE(plain.is_string());
    REQUIRE_FALSE(typed == plain);
}

TEST_CASE("TypedSequence constrained to an unknown type", "[typed_sequence][constrained]") {
    auto seq = TypedSequence::constrained("NoSuchType");
    REQUIRE_THROWS_AS(seq.append("x"), ValueError);
    REQUIRE(seq.empty());
}

TEST_CASE("TypedSequence urn coercion", "[typed_sequence][constrained]") {
    auto seq = TypedSequence::of<UrnValue>();
    seq.append("aff4:/users/");
    seq.append(std::make_shared<StringValue>("aff4:/hunts"));

    REQUIRE(seq[0].as_domain<UrnValue>()->urn() == "aff4:/users");
    REQUIRE(seq[1].as_domain<UrnValue>()->urn() == "aff4:/hunts");

    TypedSequence back = TypedSequence::deserialize(seq.serialize(), std::string{"RDFURN"});
    REQUIRE(back.element_type() == seq.element_type());
    REQUIRE(back == seq);
}

TEST_CASE("TypedSequence age", "[typed_sequence][age]") {
    TypedSequence seq;
    REQUIRE_FALSE(seq.age().is_not_a_date_time());

    seq.set_age(from_micros(1000));
    REQUIRE(to_micros(seq.age()) == 1000);
}
