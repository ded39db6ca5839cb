#include <DASL/Drisl/Decoder.hpp>
#include <DASL/Drisl/Encoder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>

#include "TestSupport.hpp"

using namespace DASL;
using namespace DASL::Drisl;

namespace
{
    std::string EncodeHex(const Value& value)
    {
        auto result = Encoder::Encode(value);
        REQUIRE(result.HasValue());
        return Utilities::ToHex(result.ValueUnsafe());
    }

    EncodeErrorCode EncodeErrorOf(const Value& value)
    {
        auto result = Encoder::Encode(value);
        REQUIRE_FALSE(result.HasValue());
        return result.ErrorUnsafe().code;
    }

    Value Text(const char* text)
    {
        return Value::MakeText(text);
    }

    Value UInt(UInt64 value)
    {
        return Value::MakeInteger(Integer::FromUnsigned(value));
    }

    Value Int(Int64 value)
    {
        return Value::MakeInteger(Integer::FromSigned(value));
    }

    Value Nested(UIntSize levels)
    {
        Value value = UInt(1);
        for (UIntSize i = 0; i < levels; ++i)
            value = Value::MakeArray({std::move(value)});
        return value;
    }
}// namespace

TEST_CASE("Encoder picks the shortest argument width", "[drisl][encoder]")
{
    REQUIRE(EncodeHex(UInt(0)) == "00");
    REQUIRE(EncodeHex(UInt(23)) == "17");
    REQUIRE(EncodeHex(UInt(24)) == "1818");
    REQUIRE(EncodeHex(UInt(255)) == "18ff");
    REQUIRE(EncodeHex(UInt(256)) == "190100");
    REQUIRE(EncodeHex(UInt(65535)) == "19ffff");
    REQUIRE(EncodeHex(UInt(65536)) == "1a00010000");
    REQUIRE(EncodeHex(UInt(0xFFFFFFFF)) == "1affffffff");
    REQUIRE(EncodeHex(UInt(UInt64 {1} << 32)) == "1b0000000100000000");
    REQUIRE(EncodeHex(UInt(std::numeric_limits<UInt64>::max())) == "1bffffffffffffffff");

    REQUIRE(EncodeHex(Int(-1)) == "20");
    REQUIRE(EncodeHex(Int(-24)) == "37");
    REQUIRE(EncodeHex(Int(-25)) == "3818");
    REQUIRE(EncodeHex(Int(-1000)) == "3903e7");
    REQUIRE(EncodeHex(Value::MakeInteger(Integer::FromNegativeArgument(std::numeric_limits<UInt64>::max()))) ==
            "3bffffffffffffffff");
}

TEST_CASE("Encoder writes scalars", "[drisl][encoder]")
{
    REQUIRE(EncodeHex(Value::MakeNull()) == "f6");
    REQUIRE(EncodeHex(Value::MakeBool(false)) == "f4");
    REQUIRE(EncodeHex(Value::MakeBool(true)) == "f5");
    REQUIRE(EncodeHex(Value::MakeFloat(1.5)) == "fb3ff8000000000000");
    REQUIRE(EncodeHex(Value::MakeFloat(0.0)) == "fb0000000000000000");
    REQUIRE(EncodeHex(Value::MakeFloat(-0.0)) == "fb8000000000000000");
    REQUIRE(EncodeHex(Text("")) == "60");
    REQUIRE(EncodeHex(Text("hi")) == "626869");
    REQUIRE(EncodeHex(Text("abcdefghijklmnopqrstuvwx")) == "78186162636465666768696a6b6c6d6e6f707172737475767778");
    REQUIRE(EncodeHex(Value::MakeBytes(Tests::Bytes({0xbe, 0xef}))) == "42beef");
}

TEST_CASE("Encoder writes containers", "[drisl][encoder]")
{
    REQUIRE(EncodeHex(Value::MakeArray({})) == "80");
    REQUIRE(EncodeHex(Value::MakeArray({UInt(1), Value::MakeArray({UInt(2), UInt(3)})})) == "8201820203");
    REQUIRE(EncodeHex(Value::MakeMap({})) == "a0");
}

TEST_CASE("Encoder writes maps in canonical key order", "[drisl][encoder]")
{
    const Value map = Value::MakeMap({{Text("b"), UInt(2)}, {Text("a"), UInt(1)}});
    REQUIRE(EncodeHex(map) == "a2616101616202");

    const Value mixed = Value::MakeMap({
            {Text("aa"), UInt(3)},
            {Text("b"), UInt(2)},
            {Value::MakeBytes(Tests::Bytes({'z'})), UInt(1)},
    });
    REQUIRE(EncodeHex(mixed) == "a3417a0161620262616103");
}

TEST_CASE("Encoder rejects values without a canonical form", "[drisl][encoder]")
{
    REQUIRE(EncodeErrorOf(Value::MakeFloat(std::numeric_limits<F64>::quiet_NaN())) == EncodeErrorCode::NonFiniteFloat);
    REQUIRE(EncodeErrorOf(Value::MakeFloat(std::numeric_limits<F64>::infinity())) == EncodeErrorCode::NonFiniteFloat);
    REQUIRE(EncodeErrorOf(Value::MakeFloat(-std::numeric_limits<F64>::infinity())) == EncodeErrorCode::NonFiniteFloat);

    REQUIRE(EncodeErrorOf(Value::MakeMap({{Text("k"), UInt(1)}, {Text("k"), UInt(2)}})) == EncodeErrorCode::DuplicateKey);
    REQUIRE(EncodeErrorOf(Value::MakeMap({{UInt(1), UInt(2)}})) == EncodeErrorCode::InvalidMapKey);
    REQUIRE(EncodeErrorOf(Value::MakeMap({{Value::MakeNull(), UInt(2)}})) == EncodeErrorCode::InvalidMapKey);
}

TEST_CASE("Encoder rejects text that is not valid UTF-8", "[drisl][encoder]")
{
    REQUIRE(EncodeErrorOf(Text("\xff\xfe")) == EncodeErrorCode::InvalidUtf8);
    // Overlong '/', a lone surrogate and a truncated sequence.
    REQUIRE(EncodeErrorOf(Text("\xc0\xaf")) == EncodeErrorCode::InvalidUtf8);
    REQUIRE(EncodeErrorOf(Text("\xed\xa0\x80")) == EncodeErrorCode::InvalidUtf8);
    REQUIRE(EncodeErrorOf(Text("ab\xe2\x82")) == EncodeErrorCode::InvalidUtf8);

    // Invalid keys and nested text are caught too.
    REQUIRE(EncodeErrorOf(Value::MakeMap({{Text("\x80"), UInt(1)}})) == EncodeErrorCode::InvalidUtf8);
    REQUIRE(EncodeErrorOf(Value::MakeArray({Text("ok"), Text("\xff")})) == EncodeErrorCode::InvalidUtf8);

    REQUIRE(EncodeHex(Text("\xf0\x9f\x98\x80")) == "64f09f9880");
}

TEST_CASE("Encoder limits nesting depth", "[drisl][encoder]")
{
    EncodeOptions options;
    options.maxDepth = 1;
    REQUIRE(Encoder::Encode(Value::MakeArray({UInt(1)}), options).HasValue());
    REQUIRE(Encoder::Encode(Value::MakeMap({}), options).HasValue());

    auto tooDeep = Encoder::Encode(Value::MakeArray({Value::MakeArray({})}), options);
    REQUIRE_FALSE(tooDeep.HasValue());
    REQUIRE(tooDeep.ErrorUnsafe().code == EncodeErrorCode::DepthExceeded);

    // The default limit matches the decoder's, so anything encoded decodes.
    auto deepest = Encoder::Encode(Nested(256));
    REQUIRE(deepest.HasValue());
    REQUIRE(Decoder::Decode(deepest.ValueUnsafe()).HasValue());
    REQUIRE(EncodeErrorOf(Nested(257)) == EncodeErrorCode::DepthExceeded);
}

TEST_CASE("EncodeTo appends and leaves the buffer unchanged on failure", "[drisl][encoder]")
{
    std::vector<Byte> out = Tests::Bytes({0x01});

    REQUIRE(Encoder::EncodeTo(UInt(2), out).HasValue());
    REQUIRE(out == Tests::Bytes({0x01, 0x02}));

    const Value bad = Value::MakeArray({UInt(3), Value::MakeFloat(std::numeric_limits<F64>::quiet_NaN())});
    auto        result = Encoder::EncodeTo(bad, out);
    REQUIRE_FALSE(result.HasValue());
    REQUIRE(result.ErrorUnsafe().code == EncodeErrorCode::NonFiniteFloat);
    REQUIRE(out == Tests::Bytes({0x01, 0x02}));
}

TEST_CASE("Encoded values decode back to themselves", "[drisl][encoder][roundtrip]")
{
    const std::vector<Value> values {
            Value::MakeNull(),
            Value::MakeBool(true),
            UInt(std::numeric_limits<UInt64>::max()),
            Value::MakeInteger(Integer::FromNegativeArgument(std::numeric_limits<UInt64>::max())),
            Int(-500),
            Value::MakeFloat(-0.0),
            Value::MakeFloat(3.14159),
            Value::MakeFloat(std::numeric_limits<F64>::denorm_min()),
            Text("\xe2\x82\xac uro"),
            Value::MakeBytes(std::vector<Byte>(300, Byte {0x5a})),
            Value::MakeArray({}),
            Value::MakeMap({
                    {Text("list"), Value::MakeArray({UInt(1), Text("two"), Value::MakeNull()})},
                    {Text("nested"), Value::MakeMap({{Value::MakeBytes(Tests::Bytes({1})), Value::MakeBool(false)}})},
                    {Text("n"), Int(-1)},
            }),
    };

    for (const Value& value: values)
    {
        INFO(ToDebugString(value));
        auto encoded = Encoder::Encode(value);
        REQUIRE(encoded.HasValue());

        auto decoded = Decoder::Decode(encoded.ValueUnsafe());
        REQUIRE(decoded.HasValue());
        REQUIRE(decoded.ValueUnsafe() == value);

        // Encoding is deterministic.
        auto again = Encoder::Encode(decoded.ValueUnsafe());
        REQUIRE(again.HasValue());
        REQUIRE(again.ValueUnsafe() == encoded.ValueUnsafe());
    }
}

TEST_CASE("Widening any argument breaks canonical decoding", "[drisl][encoder][canonical]")
{
    // 10 as a 1-byte argument, 100 as a 2-byte one, 1000 as a 4-byte one.
    REQUIRE(Decoder::Decode(Tests::Hex("180a")).ErrorUnsafe().code == DecodeErrorCode::NonCanonicalInt);
    REQUIRE(Decoder::Decode(Tests::Hex("190064")).ErrorUnsafe().code == DecodeErrorCode::NonCanonicalInt);
    REQUIRE(Decoder::Decode(Tests::Hex("1a000003e8")).ErrorUnsafe().code == DecodeErrorCode::NonCanonicalInt);
    REQUIRE(EncodeHex(UInt(10)) == "0a");
    REQUIRE(EncodeHex(UInt(100)) == "1864");
    REQUIRE(EncodeHex(UInt(1000)) == "1903e8");
}
