#include <DASL/Drisl/Decoder.hpp>
#include <DASL/Drisl/Encoder.hpp>
#include <DASL/Drisl/StreamDecoder.hpp>

#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <vector>

#include "TestSupport.hpp"

using namespace DASL;
using namespace DASL::Drisl;
using DASL::Tests::Hex;

namespace
{
    // {"a": 1, "b": 2}
    constexpr std::string_view kExampleMap = "a2616101616202";

    Value Int(Int64 value)
    {
        return Value::MakeInteger(Integer::FromSigned(value));
    }
}// namespace

TEST_CASE("StreamDecoder yields B ++ B twice and then ends", "[drisl][stream]")
{
    const auto       single = Hex(kExampleMap);
    const auto       data   = Tests::Concat(single, single);
    IO::MemoryReader reader(data);
    StreamDecoder    session(reader);

    const Value expected = Decoder::Decode(single).ValueUnsafe();

    const StreamItem first = session.Advance();
    REQUIRE(first.IsValue());
    REQUIRE(first.value == expected);
    REQUIRE(session.Offset() == single.size());
    REQUIRE(session.State() == StreamState::Ready);

    const StreamItem second = session.Advance();
    REQUIRE(second.IsValue());
    REQUIRE(second.value == expected);
    REQUIRE(session.Offset() == data.size());

    const StreamItem end = session.Advance();
    REQUIRE(end.IsEnd());
    REQUIRE(session.State() == StreamState::Exhausted);
    REQUIRE(session.ValuesDecoded() == 2);
}

TEST_CASE("StreamDecoder over empty input ends immediately", "[drisl][stream]")
{
    IO::MemoryReader reader(std::span<const Byte> {});
    StreamDecoder    session(reader);

    REQUIRE(session.Advance().IsEnd());
    REQUIRE(session.State() == StreamState::Exhausted);
    REQUIRE(session.ValuesDecoded() == 0);
    REQUIRE(session.Offset() == 0);
}

TEST_CASE("StreamDecoder terminal states are idempotent", "[drisl][stream]")
{
    SECTION("Exhausted")
    {
        const auto       data = Hex("01");
        IO::MemoryReader reader(data);
        StreamDecoder    session(reader);

        REQUIRE(session.Advance().IsValue());
        for (int i = 0; i < 3; ++i)
        {
            REQUIRE(session.Advance().IsEnd());
            REQUIRE(session.State() == StreamState::Exhausted);
        }
        REQUIRE(session.ValuesDecoded() == 1);
    }

    SECTION("Failed")
    {
        // A valid value followed by a non-canonical one and then a valid one that is never reached.
        const auto           data = Hex("01" "1817" "02");
        Tests::TrickleReader reader(data);
        StreamDecoder        session(reader);

        REQUIRE(session.Advance().IsValue());

        const StreamItem failed = session.Advance();
        REQUIRE(failed.IsError());
        REQUIRE(failed.error.code == DecodeErrorCode::NonCanonicalInt);
        REQUIRE(failed.error.offset == 1);
        REQUIRE(session.State() == StreamState::Failed);

        const UIntSize readsAfterFailure = reader.reads;
        const UIntSize offsetAfterFailure = session.Offset();
        for (int i = 0; i < 3; ++i)
        {
            const StreamItem again = session.Advance();
            REQUIRE(again.IsError());
            REQUIRE(again.error.code == failed.error.code);
            REQUIRE(again.error.offset == failed.error.offset);
            REQUIRE(again.error.message == failed.error.message);
        }
        // No re-parsing once failed.
        REQUIRE(reader.reads == readsAfterFailure);
        REQUIRE(session.Offset() == offsetAfterFailure);
        REQUIRE(session.ValuesDecoded() == 1);
    }
}

TEST_CASE("StreamDecoder distinguishes clean end, truncation and garbage", "[drisl][stream]")
{
    SECTION("partial trailing value is Truncated")
    {
        const auto       data = Tests::Concat(Hex(kExampleMap), Hex("a26161"));
        IO::MemoryReader reader(data);
        StreamDecoder    session(reader);

        REQUIRE(session.Advance().IsValue());
        const StreamItem item = session.Advance();
        REQUIRE(item.IsError());
        REQUIRE(item.error.code == DecodeErrorCode::Truncated);
        REQUIRE(item.error.offset == data.size());
    }

    SECTION("stray break byte is garbage")
    {
        const auto       data = Tests::Concat(Hex(kExampleMap), Hex("ff"));
        IO::MemoryReader reader(data);
        StreamDecoder    session(reader);

        REQUIRE(session.Advance().IsValue());
        const StreamItem item = session.Advance();
        REQUIRE(item.IsError());
        REQUIRE(item.error.code == DecodeErrorCode::UnknownTag);
        REQUIRE(item.error.offset == 7);
    }

    SECTION("last value ends exactly at the end of input")
    {
        const auto       data = Hex(kExampleMap);
        IO::MemoryReader reader(data);
        StreamDecoder    session(reader);

        REQUIRE(session.Advance().IsValue());
        REQUIRE(session.Advance().IsEnd());
    }
}

TEST_CASE("StreamDecoder matches separate single-value decodes", "[drisl][stream]")
{
    const std::vector<Value> values {
            Int(0),
            Value::MakeText("hello"),
            Value::MakeArray({Int(1), Value::MakeArray({})}),
            Value::MakeMap({{Value::MakeText("k"), Value::MakeFloat(-2.5)}}),
            Value::MakeBytes(std::vector<Byte>(70000, Byte {0x11})),
            Value::MakeNull(),
    };

    std::vector<Byte>     stream;
    std::vector<UIntSize> boundaries;
    for (const Value& value: values)
    {
        REQUIRE(Encoder::EncodeTo(value, stream).HasValue());
        boundaries.push_back(stream.size());
    }

    // A small chunk size forces values to straddle reads.
    DecodeOptions options;
    options.readChunkSize = 5;

    IO::MemoryReader reader(stream);
    StreamDecoder    session(reader, options);
    for (UIntSize i = 0; i < values.size(); ++i)
    {
        const StreamItem item = session.Advance();
        REQUIRE(item.IsValue());
        REQUIRE(item.value == values[i]);
        REQUIRE(session.Offset() == boundaries[i]);
    }
    REQUIRE(session.Advance().IsEnd());
}

TEST_CASE("StreamDecoder applies decode options per value", "[drisl][stream]")
{
    DecodeOptions options;
    options.maxDepth = 1;

    const auto       data = Hex("8101" "818101");
    IO::MemoryReader reader(data);
    StreamDecoder    session(reader, options);

    REQUIRE(session.Advance().IsValue());
    const StreamItem item = session.Advance();
    REQUIRE(item.IsError());
    REQUIRE(item.error.code == DecodeErrorCode::DepthExceeded);
    REQUIRE(item.error.offset == 3);
}

TEST_CASE("StreamDecoder reports source failures", "[drisl][stream]")
{
    const auto           data = Hex("0102");
    Tests::FailingReader reader(data);
    StreamDecoder        session(reader);

    REQUIRE(session.Advance().IsValue());
    REQUIRE(session.Advance().IsValue());

    // The failure surfaces while checking for the next value.
    const StreamItem item = session.Advance();
    REQUIRE(item.IsError());
    REQUIRE(item.error.code == DecodeErrorCode::SourceError);
    REQUIRE(session.State() == StreamState::Failed);
}

TEST_CASE("DecodeStream can own its source", "[drisl][stream]")
{
    // The backing bytes must outlive the reader, which the session owns.
    static const std::vector<Byte> data = Hex("0102");

    StreamDecoder session = DecodeStream(std::make_unique<IO::MemoryReader>(data));
    REQUIRE(session.Advance().value == Int(1));

    // Moving the session keeps the owned source alive.
    StreamDecoder moved = std::move(session);
    REQUIRE(moved.Advance().value == Int(2));
    REQUIRE(moved.Advance().IsEnd());
}

TEST_CASE("StreamDecoder without a source starts Failed", "[drisl][stream]")
{
    StreamDecoder session = DecodeStream(std::unique_ptr<IO::IByteReader> {});
    REQUIRE(session.State() == StreamState::Failed);

    const StreamItem item = session.Advance();
    REQUIRE(item.IsError());
    REQUIRE(item.error.code == DecodeErrorCode::SourceError);
    REQUIRE(item.error.offset == 0);
    REQUIRE(session.Advance().IsError());
    REQUIRE(session.ValuesDecoded() == 0);
}

TEST_CASE("StreamDecoder iterates values and stops after one error", "[drisl][stream]")
{
    SECTION("clean input")
    {
        const auto       data = Hex("010203");
        IO::MemoryReader reader(data);

        std::vector<Value> seen;
        for (auto&& item: DecodeStream(reader))
        {
            REQUIRE(item.HasValue());
            seen.push_back(item.ValueUnsafe());
        }
        REQUIRE(seen == std::vector<Value> {Int(1), Int(2), Int(3)});
    }

    SECTION("error is yielded once")
    {
        const auto       data = Hex("01" "f7" "02");
        IO::MemoryReader reader(data);
        StreamDecoder    session(reader);

        UIntSize values = 0;
        UIntSize errors = 0;
        for (auto it = session.begin(); it != session.end(); ++it)
        {
            if (it->HasValue())
            {
                ++values;
            }
            else
            {
                ++errors;
                REQUIRE(it->ErrorUnsafe().code == DecodeErrorCode::UnknownTag);
            }
        }
        REQUIRE(values == 1);
        REQUIRE(errors == 1);
        REQUIRE(session.State() == StreamState::Failed);
    }
}
