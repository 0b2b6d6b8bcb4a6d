// test_wire_codec.cpp - Tests for the tag-prefixed binary encoding

#include <catch2/catch_all.hpp>
#include <protodict/errors.h>
#include <protodict/wire_codec.h>

#include <limits>
#include <vector>

using namespace protodict;

namespace {

TypedValue sample_tree()
{
    return TypedValue::mapping({
        {"null", TypedValue{}},
        {"flag", true},
        {"count", int64_t{-42}},
        {"ratio", 0.25},
        {"name", "alice"},
        {"raw", Bytes{ByteBuffer{0x00, 0x01, 0xFF}}},
        {"when", DomainValue{"RDFDatetime", {1, 2, 3, 4, 5, 6, 7, 8}, 1355184000000123}},
        {"list", TypedValue::sequence({1, TypedValue::sequence({}), TypedValue::sequence({2, "x"})})},
        {"lost", Unsupported{"Unsupported type: Foo"}},
    });
}

} // anonymous namespace

// ============================================================
// Encoding layout
// ============================================================

TEST_CASE("encode scalar layout", "[wire_codec][encode]") {
    SECTION("null") {
        REQUIRE(encode(TypedValue{}) == ByteBuffer{0x00});
    }

    SECTION("bool") {
        REQUIRE(encode(TypedValue{true}) == ByteBuffer{0x01, 0x01});
        REQUIRE(encode(TypedValue{false}) == ByteBuffer{0x01, 0x00});
    }

    SECTION("integer is 8 bytes little-endian") {
        REQUIRE(encode(TypedValue{258}) == ByteBuffer{0x02, 0x02, 0x01, 0, 0, 0, 0, 0, 0});
    }

    SECTION("text carries a u32 length") {
        REQUIRE(encode(TypedValue{"hi"}) == ByteBuffer{0x04, 2, 0, 0, 0, 'h', 'i'});
    }

    SECTION("bytes use their own tag") {
        REQUIRE(encode(TypedValue{Bytes{std::string_view{"hi"}}}) == ByteBuffer{0x05, 2, 0, 0, 0, 'h', 'i'});
    }

    SECTION("domain value without age") {
        ByteBuffer expected{0x06, 1, 0, 0, 0, 'T', 1, 0, 0, 0, 0x7F, 0x00};
        REQUIRE(encode(TypedValue{DomainValue{"T", {0x7F}, std::nullopt}}) == expected);
    }
}

TEST_CASE("encode preserves container order", "[wire_codec][encode]") {
    TypedValue m = TypedValue::mapping({{"b", 1}, {"a", 2}});
    ByteBuffer bytes = encode(m);

    REQUIRE(bytes[0] == static_cast<uint8_t>(WireTag::Mapping));
    // count, then the first key "b"
    REQUIRE(bytes[1] == 2);
    REQUIRE(bytes[5] == 1);
    REQUIRE(bytes[9] == 'b');
}

// ============================================================
// Round trip
// ============================================================

TEST_CASE("decode inverts encode", "[wire_codec][roundtrip]") {
    TypedValue tree = sample_tree();
    TypedValue back = decode(encode(tree));

    REQUIRE(back == tree);

    const Mapping& m = back.as<Mapping>();
    REQUIRE(m[0].key == "null");
    REQUIRE(m[8].key == "lost");
    REQUIRE(m.find("when")->as<DomainValue>().age == 1355184000000123);
    REQUIRE(m.find("flag")->kind() == Kind::Bool);
}

TEST_CASE("repeated cycles do not drift", "[wire_codec][roundtrip]") {
    ByteBuffer first = encode(sample_tree());
    ByteBuffer bytes = first;
    for (int i = 0; i < 5; ++i) {
        bytes = encode(decode(bytes));
    }
    REQUIRE(bytes == first);
}

TEST_CASE("float extremes survive", "[wire_codec][roundtrip]") {
    for (double d : {0.0, -0.0, 1e308, -1e-308, std::numeric_limits<double>::infinity()}) {
        REQUIRE(decode(encode(TypedValue{d})).as<double>() == d);
    }
}

TEST_CASE("encoded_size and encode_to", "[wire_codec][size]") {
    TypedValue tree = sample_tree();
    ByteBuffer bytes = encode(tree);

    REQUIRE(encoded_size(tree) == bytes.size());

    std::vector<uint8_t> buffer(bytes.size());
    REQUIRE(encode_to(tree, buffer.data(), buffer.size()) == bytes.size());
    REQUIRE(buffer == bytes);

    REQUIRE_THROWS_AS(encode_to(tree, buffer.data(), buffer.size() - 1), Error);
}

// ============================================================
// Malformed input
// ============================================================

TEST_CASE("decode rejects malformed input", "[wire_codec][decode][error]") {
    SECTION("empty buffer") {
        REQUIRE_THROWS_AS(decode(ByteBuffer{}), DecodeError);
    }

    SECTION("unknown tag") {
        REQUIRE_THROWS_AS(decode(ByteBuffer{0x42}), DecodeError);
    }

    SECTION("truncated integer") {
        REQUIRE_THROWS_AS(decode(ByteBuffer{0x02, 0x01, 0x02}), DecodeError);
    }

    SECTION("truncated text") {
        REQUIRE_THROWS_AS(decode(ByteBuffer{0x04, 5, 0, 0, 0, 'a'}), DecodeError);
    }

    SECTION("invalid bool byte") {
        REQUIRE_THROWS_AS(decode(ByteBuffer{0x01, 0x02}), DecodeError);
    }

    SECTION("invalid age flag") {
        REQUIRE_THROWS_AS(decode(ByteBuffer{0x06, 1, 0, 0, 0, 'T', 0, 0, 0, 0, 0x05}), DecodeError);
    }

    SECTION("trailing bytes") {
        REQUIRE_THROWS_AS(decode(ByteBuffer{0x00, 0x00}), DecodeError);
    }

    SECTION("count larger than input") {
        REQUIRE_THROWS_AS(decode(ByteBuffer{0x08, 0xFF, 0xFF, 0xFF, 0x7F, 0x00}), DecodeError);
    }

    SECTION("duplicate mapping key") {
        ByteBuffer bytes{0x07, 2, 0, 0, 0,
                         1, 0, 0, 0, 'k', 0x00,
                         1, 0, 0, 0, 'k', 0x00};
        REQUIRE_THROWS_AS(decode(bytes), DecodeError);
    }

    SECTION("every strict prefix of a valid encoding fails") {
        ByteBuffer bytes = encode(sample_tree());
        for (std::size_t n = 0; n < bytes.size(); ++n) {
            REQUIRE_THROWS_AS(decode(bytes.data(), n), DecodeError);
        }
    }
}

TEST_CASE("decode honours max_depth", "[wire_codec][decode][depth]") {
    TypedValue nested = TypedValue::sequence({TypedValue::sequence({TypedValue::sequence({1})})});
    ByteBuffer bytes = encode(nested);

    REQUIRE(decode(bytes) == nested);
    REQUIRE(decode(bytes, DecodeOptions{3}) == nested);
    REQUIRE_THROWS_AS(decode(bytes, DecodeOptions{2}), DecodeError);
}
