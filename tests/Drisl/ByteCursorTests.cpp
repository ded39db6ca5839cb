#include <DASL/Drisl/ByteCursor.hpp>

#include <catch2/catch_test_macros.hpp>

#include "TestSupport.hpp"

using namespace DASL;
using namespace DASL::Drisl;

TEST_CASE("ByteCursor peeks without consuming and takes exact counts", "[drisl][cursor]")
{
    const auto       data = Tests::Bytes({0x10, 0x20, 0x30, 0x40});
    IO::MemoryReader reader(data);
    ByteCursor       cursor(reader);

    auto peeked = cursor.Peek();
    REQUIRE(peeked.HasValue());
    REQUIRE(peeked.ValueUnsafe() == Byte {0x10});
    REQUIRE(cursor.Offset() == 0);

    auto taken = cursor.Take(3);
    REQUIRE(taken.HasValue());
    REQUIRE(taken.ValueUnsafe().size() == 3);
    REQUIRE(taken.ValueUnsafe()[2] == Byte {0x30});
    REQUIRE(cursor.Offset() == 3);

    auto empty = cursor.Take(0);
    REQUIRE(empty.HasValue());
    REQUIRE(empty.ValueUnsafe().empty());
    REQUIRE(cursor.Offset() == 3);

    auto atEnd = cursor.AtEnd();
    REQUIRE(atEnd.HasValue());
    REQUIRE_FALSE(atEnd.ValueUnsafe());

    REQUIRE(cursor.Take(1).HasValue());
    auto end = cursor.Peek();
    REQUIRE(end.HasValue());
    REQUIRE_FALSE(end.ValueUnsafe().has_value());
    REQUIRE(cursor.AtEnd().ValueUnsafe());
    REQUIRE(cursor.Offset() == 4);
}

TEST_CASE("ByteCursor Take fails with Truncated and consumes nothing", "[drisl][cursor]")
{
    const auto       data = Tests::Bytes({1, 2, 3});
    IO::MemoryReader reader(data);
    ByteCursor       cursor(reader);

    REQUIRE(cursor.Take(1).HasValue());

    auto tooMany = cursor.Take(5);
    REQUIRE_FALSE(tooMany.HasValue());
    REQUIRE(tooMany.ErrorUnsafe().code == DecodeErrorCode::Truncated);
    REQUIRE(tooMany.ErrorUnsafe().offset == 1);
    REQUIRE(cursor.Offset() == 1);
    REQUIRE(cursor.Buffered() == 2);

    auto rest = cursor.Take(2);
    REQUIRE(rest.HasValue());
    REQUIRE(rest.ValueUnsafe()[0] == Byte {2});
    REQUIRE(rest.ValueUnsafe()[1] == Byte {3});
}

TEST_CASE("ByteCursor on an empty source is at a clean end", "[drisl][cursor]")
{
    IO::MemoryReader reader(std::span<const Byte> {});
    ByteCursor       cursor(reader);

    auto peeked = cursor.Peek();
    REQUIRE(peeked.HasValue());
    REQUIRE_FALSE(peeked.ValueUnsafe().has_value());

    // A zero-byte take is not truncation; a one-byte take is.
    REQUIRE(cursor.Take(0).HasValue());
    REQUIRE(cursor.Take(1).ErrorUnsafe().code == DecodeErrorCode::Truncated);
}

TEST_CASE("ByteCursor assembles spans across many small reads", "[drisl][cursor]")
{
    std::vector<Byte> data;
    for (int i = 0; i < 300; ++i)
        data.push_back(static_cast<Byte>(i & 0xFF));

    Tests::TrickleReader reader(data);
    ByteCursor           cursor(reader, 7);

    auto head = cursor.Take(10);
    REQUIRE(head.HasValue());
    REQUIRE(head.ValueUnsafe()[9] == Byte {9});

    auto middle = cursor.Take(280);
    REQUIRE(middle.HasValue());
    REQUIRE(middle.ValueUnsafe().size() == 280);
    REQUIRE(middle.ValueUnsafe()[0] == Byte {10});
    REQUIRE(middle.ValueUnsafe()[279] == static_cast<Byte>(289 & 0xFF));

    auto tail = cursor.Take(11);
    REQUIRE_FALSE(tail.HasValue());
    REQUIRE(tail.ErrorUnsafe().code == DecodeErrorCode::Truncated);
    REQUIRE(cursor.Take(10).HasValue());
    REQUIRE(cursor.AtEnd().ValueUnsafe());
    REQUIRE(cursor.Offset() == 300);
}

TEST_CASE("ByteCursor does not allocate for bytes that never arrive", "[drisl][cursor]")
{
    const auto       data = Tests::Bytes({1, 2, 3, 4});
    IO::MemoryReader reader(data);
    ByteCursor       cursor(reader, 16);

    // A hostile length prefix asks for far more than the source holds.
    auto huge = cursor.Take(UIntSize {1} << 40);
    REQUIRE_FALSE(huge.HasValue());
    REQUIRE(huge.ErrorUnsafe().code == DecodeErrorCode::Truncated);
    REQUIRE(cursor.Buffered() == 4);
}

TEST_CASE("ByteCursor maps source failures to SourceError", "[drisl][cursor]")
{
    const auto           data = Tests::Bytes({0xAA, 0xBB});
    Tests::FailingReader reader(data);
    ByteCursor           cursor(reader);

    REQUIRE(cursor.Take(2).HasValue());

    auto peeked = cursor.Peek();
    REQUIRE_FALSE(peeked.HasValue());
    REQUIRE(peeked.ErrorUnsafe().code == DecodeErrorCode::SourceError);
    REQUIRE(peeked.ErrorUnsafe().offset == 2);
    REQUIRE(peeked.ErrorUnsafe().message.find("device unplugged") != std::string::npos);
}
