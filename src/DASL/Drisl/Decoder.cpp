#include <DASL/Drisl/Decoder.hpp>

#include <DASL/Cid/Cid.hpp>
#include <DASL/IO/MemoryReader.hpp>

#include "Utf8.hpp"

#include <bit>
#include <cmath>
#include <limits>
#include <new>
#include <optional>
#include <string>
#include <vector>

namespace DASL::Drisl
{
    namespace
    {
        constexpr UInt8  kMajorUnsigned = 0;
        constexpr UInt8  kMajorNegative = 1;
        constexpr UInt8  kMajorBytes    = 2;
        constexpr UInt8  kMajorText     = 3;
        constexpr UInt8  kMajorArray    = 4;
        constexpr UInt8  kMajorMap      = 5;
        constexpr UInt8  kMajorTag      = 6;
        constexpr UInt8  kMajorSimple   = 7;
        constexpr UInt64 kCidTag        = 42;

        constexpr UInt8 kSimpleFalse   = 20;
        constexpr UInt8 kSimpleTrue    = 21;
        constexpr UInt8 kSimpleNull    = 22;
        constexpr UInt8 kFloat16       = 25;
        constexpr UInt8 kFloat32       = 26;
        constexpr UInt8 kFloat64       = 27;
        constexpr UInt8 kIndefinite    = 31;

        /// An array or map whose children are still being decoded.
        struct Frame
        {
            bool                  isMap {false};
            UInt64                remaining {0};
            UIntSize              startOffset {0};
            std::vector<Value>    items {};
            std::vector<MapEntry> entries {};
            std::optional<Value>  pendingKey {};
        };

        struct DecodeContext
        {
            ByteCursor&          cursor;
            const DecodeOptions& options;
            std::vector<Frame>   stack {};
            UIntSize             itemOffset {0};
        };

        using ValueResult = DASL::Utilities::Expected<Value, DecodeError>;
        // A finished value, or std::nullopt after a container frame was opened.
        using ItemResult = DASL::Utilities::Expected<std::optional<Value>, DecodeError>;

        [[nodiscard]] DecodeError MakeError(const DecodeContext& ctx, DecodeErrorCode code, std::string message)
        {
            DecodeError err;
            err.code    = code;
            err.offset  = ctx.itemOffset;
            err.message = std::move(message);
            return err;
        }

        template <class T>
        [[nodiscard]] DASL::Utilities::Expected<T, DecodeError> Fail(const DecodeContext& ctx, DecodeErrorCode code, std::string message)
        {
            return DASL::Utilities::Expected<T, DecodeError>(
                    DASL::Utilities::Unexpected<DecodeError>(MakeError(ctx, code, std::move(message))));
        }

        template <class T, class U>
        [[nodiscard]] DASL::Utilities::Expected<T, DecodeError> Forward(DASL::Utilities::Expected<U, DecodeError>& failed)
        {
            return DASL::Utilities::Expected<T, DecodeError>(
                    DASL::Utilities::Unexpected<DecodeError>(std::move(failed.ErrorUnsafe())));
        }

        [[nodiscard]] UInt64 ReadBigEndian(std::span<const Byte> bytes) noexcept
        {
            UInt64 value = 0;
            for (const Byte b: bytes)
                value = (value << 8) | std::to_integer<UInt64>(b);
            return value;
        }

        /// Reads the argument that follows an initial byte of major type 0-6.
        DASL::Utilities::Expected<UInt64, DecodeError> ReadArgument(DecodeContext& ctx, UInt8 major, UInt8 info)
        {
            if (info < 24)
                return DASL::Utilities::Expected<UInt64, DecodeError>(UInt64 {info});

            if (info == kIndefinite)
            {
                if (major >= kMajorBytes && major <= kMajorMap)
                    return Fail<UInt64>(ctx, DecodeErrorCode::IndefiniteLength, "Indefinite-length items are not allowed");
                return Fail<UInt64>(ctx, DecodeErrorCode::UnknownTag, "Invalid additional information 31");
            }
            if (info > 27)
                return Fail<UInt64>(ctx, DecodeErrorCode::UnknownTag, "Reserved additional information " + std::to_string(info));

            // info 24..27 carry a 1, 2, 4 or 8 byte argument.
            const UIntSize width = UIntSize {1} << (info - 24);
            auto           bytes = ctx.cursor.Take(width);
            if (!bytes.HasValue())
                return Forward<UInt64>(bytes);

            const UInt64 argument = ReadBigEndian(bytes.ValueUnsafe());
            const UInt64 minimum  = (width == 1) ? 24 : (UInt64 {1} << (width * 4));
            if (argument < minimum)
            {
                return Fail<UInt64>(ctx, DecodeErrorCode::NonCanonicalInt,
                                    "Argument " + std::to_string(argument) + " not in shortest form (" +
                                            std::to_string(width) + "-byte encoding)");
            }
            return DASL::Utilities::Expected<UInt64, DecodeError>(argument);
        }

        DASL::Utilities::Expected<std::span<const Byte>, DecodeError> ReadPayload(DecodeContext& ctx, UInt64 length)
        {
            if (length > std::numeric_limits<UIntSize>::max())
            {
                DecodeError err = MakeError(ctx, DecodeErrorCode::Truncated, "Length exceeds addressable memory");
                err.offset      = ctx.cursor.Offset();
                return DASL::Utilities::Expected<std::span<const Byte>, DecodeError>(
                        DASL::Utilities::Unexpected<DecodeError>(std::move(err)));
            }
            return ctx.cursor.Take(static_cast<UIntSize>(length));
        }

        ItemResult DecodeSimple(DecodeContext& ctx, UInt8 info)
        {
            switch (info)
            {
                case kSimpleFalse:
                    return ItemResult(std::optional<Value> {Value::MakeBool(false)});
                case kSimpleTrue:
                    return ItemResult(std::optional<Value> {Value::MakeBool(true)});
                case kSimpleNull:
                    return ItemResult(std::optional<Value> {Value::MakeNull()});
                case kFloat16:
                case kFloat32:
                    return Fail<std::optional<Value>>(ctx, DecodeErrorCode::NonCanonicalFloat, "Floats must be encoded with 64 bits");
                case kFloat64:
                {
                    auto bytes = ctx.cursor.Take(8);
                    if (!bytes.HasValue())
                        return Forward<std::optional<Value>>(bytes);
                    const F64 value = std::bit_cast<F64>(ReadBigEndian(bytes.ValueUnsafe()));
                    if (std::isnan(value))
                        return Fail<std::optional<Value>>(ctx, DecodeErrorCode::NonCanonicalFloat, "NaN is not allowed");
                    if (std::isinf(value))
                        return Fail<std::optional<Value>>(ctx, DecodeErrorCode::NonCanonicalFloat, "Infinity is not allowed");
                    return ItemResult(std::optional<Value> {Value::MakeFloat(value)});
                }
                case kIndefinite:
                    return Fail<std::optional<Value>>(ctx, DecodeErrorCode::UnknownTag, "Unexpected break byte");
                default:
                    return Fail<std::optional<Value>>(ctx, DecodeErrorCode::UnknownTag, "Unsupported simple value " + std::to_string(info));
            }
        }

        /// Decodes the byte string wrapped by tag 42: multibase identity prefix 0x00 plus a binary CID.
        ItemResult DecodeCid(DecodeContext& ctx)
        {
            auto initial = ctx.cursor.Take(1);
            if (!initial.HasValue())
                return Forward<std::optional<Value>>(initial);

            const auto ib = std::to_integer<UInt8>(initial.ValueUnsafe()[0]);
            if ((ib >> 5) != kMajorBytes)
                return Fail<std::optional<Value>>(ctx, DecodeErrorCode::InvalidCid, "Tag 42 must wrap a byte string");

            auto length = ReadArgument(ctx, kMajorBytes, static_cast<UInt8>(ib & 0x1F));
            if (!length.HasValue())
                return Forward<std::optional<Value>>(length);
            auto payload = ReadPayload(ctx, length.ValueUnsafe());
            if (!payload.HasValue())
                return Forward<std::optional<Value>>(payload);

            const auto bytes = payload.ValueUnsafe();
            if (bytes.empty() || bytes[0] != Byte {0x00})
                return Fail<std::optional<Value>>(ctx, DecodeErrorCode::InvalidCid, "CID bytes must start with the 0x00 multibase prefix");

            auto cid = DASL::Cid::Cid::FromBytes(bytes.subspan(1));
            if (!cid.HasValue())
                return Fail<std::optional<Value>>(ctx, DecodeErrorCode::InvalidCid, "Invalid CID: " + cid.ErrorUnsafe().message);
            return ItemResult(std::optional<Value> {Value::MakeCid(cid.ValueUnsafe())});
        }

        ItemResult OpenContainer(DecodeContext& ctx, bool isMap, UInt64 count)
        {
            if (ctx.stack.size() >= ctx.options.maxDepth)
            {
                return Fail<std::optional<Value>>(ctx, DecodeErrorCode::DepthExceeded,
                                                  std::string(isMap ? "Map" : "Array") + " nesting too deep");
            }
            if (count == 0)
                return ItemResult(std::optional<Value> {isMap ? Value::MakeMap({}) : Value::MakeArray({})});

            Frame frame;
            frame.isMap       = isMap;
            frame.remaining   = count;
            frame.startOffset = ctx.itemOffset;
            ctx.stack.push_back(std::move(frame));
            return ItemResult(std::optional<Value> {});
        }

        ItemResult DecodeItem(DecodeContext& ctx)
        {
            ctx.itemOffset = ctx.cursor.Offset();
            auto initial   = ctx.cursor.Take(1);
            if (!initial.HasValue())
                return Forward<std::optional<Value>>(initial);

            const auto ib    = std::to_integer<UInt8>(initial.ValueUnsafe()[0]);
            const auto major = static_cast<UInt8>(ib >> 5);
            const auto info  = static_cast<UInt8>(ib & 0x1F);

            if (major == kMajorSimple)
                return DecodeSimple(ctx, info);

            auto argument = ReadArgument(ctx, major, info);
            if (!argument.HasValue())
                return Forward<std::optional<Value>>(argument);
            const UInt64 arg = argument.ValueUnsafe();

            switch (major)
            {
                case kMajorUnsigned:
                    return ItemResult(std::optional<Value> {Value::MakeInteger(Integer::FromUnsigned(arg))});
                case kMajorNegative:
                    return ItemResult(std::optional<Value> {Value::MakeInteger(Integer::FromNegativeArgument(arg))});
                case kMajorBytes:
                {
                    auto payload = ReadPayload(ctx, arg);
                    if (!payload.HasValue())
                        return Forward<std::optional<Value>>(payload);
                    const auto bytes = payload.ValueUnsafe();
                    return ItemResult(std::optional<Value> {Value::MakeBytes(std::vector<Byte>(bytes.begin(), bytes.end()))});
                }
                case kMajorText:
                {
                    auto payload = ReadPayload(ctx, arg);
                    if (!payload.HasValue())
                        return Forward<std::optional<Value>>(payload);
                    const auto bytes = payload.ValueUnsafe();
                    if (!detail::IsValidUtf8(bytes))
                        return Fail<std::optional<Value>>(ctx, DecodeErrorCode::InvalidUtf8, "Text string is not valid UTF-8");
                    return ItemResult(std::optional<Value> {
                            Value::MakeText(std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size()))});
                }
                case kMajorArray:
                    return OpenContainer(ctx, false, arg);
                case kMajorMap:
                    return OpenContainer(ctx, true, arg);
                case kMajorTag:
                    if (arg != kCidTag)
                        return Fail<std::optional<Value>>(ctx, DecodeErrorCode::UnknownTag, "Unsupported tag " + std::to_string(arg));
                    return DecodeCid(ctx);
                default:
                    DASL::Unreachable();
            }
        }

        /// Hands a finished value to the innermost open container, closing every container it
        /// completes. Returns the top-level value once the outermost container closes.
        DASL::Utilities::Expected<std::optional<Value>, DecodeError> Attach(DecodeContext& ctx, Value value)
        {
            while (!ctx.stack.empty())
            {
                Frame& top = ctx.stack.back();
                if (top.isMap)
                {
                    if (!top.pendingKey)
                    {
                        if (!value.IsText() && !value.IsBytes())
                        {
                            return Fail<std::optional<Value>>(ctx, DecodeErrorCode::InvalidMapKey,
                                                              std::string("Map keys must be text or bytes, got ") + ToString(value.GetType()));
                        }
                        // One strict comparison rejects both duplicates and misordering.
                        if (!top.entries.empty() && CompareKeys(top.entries.back().key, value) >= 0)
                        {
                            return Fail<std::optional<Value>>(ctx, DecodeErrorCode::UnsortedKeys,
                                                              "Map key " + ToDebugString(value) + " does not sort after " +
                                                                      ToDebugString(top.entries.back().key));
                        }
                        top.pendingKey.emplace(std::move(value));
                        return ItemResult(std::optional<Value> {});
                    }
                    top.entries.push_back(MapEntry {std::move(*top.pendingKey), std::move(value)});
                    top.pendingKey.reset();
                }
                else
                {
                    top.items.push_back(std::move(value));
                }

                if (--top.remaining > 0)
                    return ItemResult(std::optional<Value> {});

                // A closed container is reported as the item at its initial byte.
                ctx.itemOffset = top.startOffset;
                value          = top.isMap ? Value::MakeMap(std::move(top.entries)) : Value::MakeArray(std::move(top.items));
                ctx.stack.pop_back();
            }
            return ItemResult(std::optional<Value> {std::move(value)});
        }

        ValueResult DecodeValue(DecodeContext& ctx)
        {
            while (true)
            {
                auto item = DecodeItem(ctx);
                if (!item.HasValue())
                    return Forward<Value>(item);
                if (!item.ValueUnsafe())
                    continue;

                auto attached = Attach(ctx, std::move(*item.ValueUnsafe()));
                if (!attached.HasValue())
                    return Forward<Value>(attached);
                if (attached.ValueUnsafe())
                    return ValueResult(std::move(*attached.ValueUnsafe()));
            }
        }
    }// namespace

    DASL::Utilities::Expected<Value, DecodeError>
    Decoder::DecodeOne(ByteCursor& cursor, const DecodeOptions& options)
    {
        DecodeContext ctx {cursor, options};
        try
        {
            return DecodeValue(ctx);
        } catch (const std::bad_alloc&)
        {
            return Fail<Value>(ctx, DecodeErrorCode::SourceError, "Allocation failed");
        }
    }

    DASL::Utilities::Expected<Value, DecodeError>
    Decoder::Decode(DASL::IO::IByteReader& reader, const DecodeOptions& options)
    {
        ByteCursor cursor(reader, options.readChunkSize);

        auto result = DecodeOne(cursor, options);
        if (!result.HasValue())
            return result;

        auto atEnd = cursor.AtEnd();
        if (!atEnd.HasValue())
            return Forward<Value>(atEnd);
        if (!atEnd.ValueUnsafe())
        {
            DecodeError err;
            err.code    = DecodeErrorCode::TrailingData;
            err.offset  = cursor.Offset();
            err.message = "Trailing data after value";
            return DASL::Utilities::Expected<Value, DecodeError>(DASL::Utilities::Unexpected<DecodeError>(std::move(err)));
        }
        return result;
    }

    DASL::Utilities::Expected<Value, DecodeError>
    Decoder::Decode(std::span<const Byte> input, const DecodeOptions& options)
    {
        DASL::IO::MemoryReader reader(input);
        DecodeOptions          memoryOptions = options;
        // One read covers the whole buffer.
        if (!input.empty())
            memoryOptions.readChunkSize = input.size();
        return Decode(reader, memoryOptions);
    }
}// namespace DASL::Drisl
