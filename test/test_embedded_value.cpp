// test_embedded_value.cpp - Tests for age-preserving wrapping

#include <catch2/catch_all.hpp>
#include <protodict/domain_types.h>
#include <protodict/embedded_value.h>
#include <protodict/errors.h>

#include <memory>
#include <optional>
#include <string>

using namespace protodict;

namespace {

constexpr int64_t kAge = 1355184000000123;  // 2012-12-11 00:00:00.000123

} // anonymous namespace

TEST_CASE("EmbeddedValue default is empty", "[embedded_value]") {
    EmbeddedValue empty;
    REQUIRE(empty.empty());
    REQUIRE(empty.payload().is_null());
    REQUIRE_FALSE(empty.age().has_value());
    REQUIRE_THROWS_AS(empty.unwrap_domain(), TypeError);

    EmbeddedValue back = EmbeddedValue::deserialize(empty.serialize());
    REQUIRE(back == empty);
}

TEST_CASE("EmbeddedValue wraps a sequence", "[embedded_value][sequence]") {
    TypedSequence seq{1, "two"};
    seq.set_age(from_micros(kAge));

    EmbeddedValue wrapped = EmbeddedValue::wrap(seq);
    REQUIRE(wrapped.name() == "TypedSequence");
    REQUIRE(wrapped.age().has_value());

    TypedSequence back = wrapped.unwrap_sequence();
    REQUIRE(back == seq);
    REQUIRE(to_micros(back.age()) == kAge);

    REQUIRE_THROWS_AS(wrapped.unwrap_map(), TypeError);
    REQUIRE_THROWS_AS(wrapped.unwrap_domain(), TypeError);
}

TEST_CASE("EmbeddedValue keeps the element constraint of a sequence", "[embedded_value][sequence]") {
    auto seq = TypedSequence::of<StringValue>();
    seq.append("hello");

    EmbeddedValue wrapped = EmbeddedValue::wrap(seq);
    REQUIRE(wrapped.element_type() == std::optional<std::string>{"RDFString"});

    TypedSequence back = EmbeddedValue::deserialize(wrapped.serialize()).unwrap_sequence();
    REQUIRE(back.element_type() == seq.element_type());
    REQUIRE(back == seq);

    REQUIRE_THROWS_AS(back.append(TimestampValue::now()), ValueError);
    REQUIRE(back.size() == 1);

    back.append("world");
    REQUIRE(back[1].as_domain<StringValue>()->value() == "world");

    REQUIRE_FALSE(EmbeddedValue::wrap(TypedSequence{1}).element_type().has_value());
}

TEST_CASE("EmbeddedValue preserves age through serialization", "[embedded_value][age]") {
    TypedSequence seq;
    seq.append("hello").append(std::make_shared<StringValue>("typed"));
    const Timestamp captured = seq.age();

    EmbeddedValue restored = EmbeddedValue::deserialize(EmbeddedValue::wrap(seq).serialize());
    EmbeddedValue rewrapped = EmbeddedValue::wrap(restored);

    REQUIRE(rewrapped.age() == std::optional<Timestamp>{captured});

    TypedSequence back = rewrapped.unwrap_sequence();
    REQUIRE(to_micros(back.age()) == to_micros(captured));
    REQUIRE(back == seq);
    REQUIRE(back[1].as_domain<StringValue>() != nullptr);
}

TEST_CASE("EmbeddedValue nests arbitrarily deep", "[embedded_value][age]") {
    auto ts = TimestampValue::from_date(2012, 12, 11);
    ts->set_age(from_micros(kAge));

    EmbeddedValue wrapped = EmbeddedValue::wrap(ts);
    for (int i = 0; i < 4; ++i) {
        wrapped = EmbeddedValue::wrap(EmbeddedValue::deserialize(wrapped.serialize()));
    }

    DomainPtr back = wrapped.unwrap_domain();
    auto restored = std::dynamic_pointer_cast<TimestampValue>(back);
    REQUIRE(restored != nullptr);
    REQUIRE(restored->micros() == ts->micros());
    REQUIRE(to_micros(*restored->age()) == kAge);
}

TEST_CASE("EmbeddedValue wraps a map without age", "[embedded_value][map]") {
    OrderedMap m{{"a", 1}, {"b", "x"}};

    EmbeddedValue wrapped = EmbeddedValue::wrap(m);
    REQUIRE(wrapped.name() == "OrderedMap");
    REQUIRE_FALSE(wrapped.age().has_value());

    EmbeddedValue back = EmbeddedValue::deserialize(wrapped.serialize());
    REQUIRE(back.unwrap_map() == m);
    REQUIRE(back.unwrap_map().keys() == m.keys());
}

TEST_CASE("EmbeddedValue unwrap dispatches on kind", "[embedded_value]") {
    auto urn = std::make_shared<UrnValue>("aff4:/flows");

    auto unwrapped = EmbeddedValue::wrap(urn).unwrap();
    REQUIRE(std::holds_alternative<DomainPtr>(unwrapped));
    REQUIRE(std::get<DomainPtr>(unwrapped)->to_string() == "aff4:/flows");

    auto seq = EmbeddedValue::wrap(TypedSequence{1}).unwrap();
    REQUIRE(std::holds_alternative<TypedSequence>(seq));
}

TEST_CASE("EmbeddedValue wraps integer-like domain values", "[embedded_value][domain]") {
    auto e = std::make_shared<EnumValue>(7, "SEVEN");
    EmbeddedValue wrapped = EmbeddedValue::wrap(e);

    REQUIRE(wrapped.payload().kind() == Kind::Domain);
    REQUIRE(wrapped.name() == "Enum");
}

TEST_CASE("EmbeddedValue rejects malformed envelopes", "[embedded_value][error]") {
    REQUIRE_THROWS_AS(EmbeddedValue::wrap(DomainPtr{}), TypeError);

    REQUIRE_THROWS_AS(EmbeddedValue::from_typed_value(TypedValue{1}), DecodeError);
    REQUIRE_THROWS_AS(EmbeddedValue::from_typed_value(TypedValue::mapping({{"data", 1}})), DecodeError);
    REQUIRE_THROWS_AS(EmbeddedValue::from_typed_value(
                          TypedValue::mapping({{"name", "TypedSequence"}, {"data", 1}})),
                      DecodeError);
    REQUIRE_THROWS_AS(EmbeddedValue::from_typed_value(
                          TypedValue::mapping({{"name", "TypedSequence"},
                                               {"data", TypedValue::sequence({})},
                                               {"age", "yesterday"}})),
                      DecodeError);
    REQUIRE_THROWS_AS(EmbeddedValue::deserialize(ByteBuffer{0x07}), DecodeError);

    SECTION("name must match the embedded domain type") {
        TypedValue domain = EmbeddedValue::wrap(std::make_shared<StringValue>("x")).payload();
        REQUIRE_THROWS_AS(EmbeddedValue::from_typed_value(
                              TypedValue::mapping({{"name", "RDFURN"}, {"data", domain}})),
                          DecodeError);
        REQUIRE_NOTHROW(EmbeddedValue::from_typed_value(
            TypedValue::mapping({{"name", "RDFString"}, {"data", domain}})));
    }

    SECTION("element type only for sequences, and only as text") {
        REQUIRE_THROWS_AS(EmbeddedValue::from_typed_value(
                              TypedValue::mapping({{"name", "OrderedMap"},
                                                   {"data", TypedValue::mapping({})},
                                                   {"element_type", "RDFString"}})),
                          DecodeError);
        REQUIRE_THROWS_AS(EmbeddedValue::from_typed_value(
                              TypedValue::mapping({{"name", "TypedSequence"},
                                                   {"data", TypedValue::sequence({})},
                                                   {"element_type", 3}})),
                          DecodeError);
    }
}
