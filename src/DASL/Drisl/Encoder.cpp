#include <DASL/Drisl/Encoder.hpp>

#include "Utf8.hpp"

#include <bit>
#include <cmath>
#include <string>

namespace DASL::Drisl
{
    namespace
    {
        enum class Major : UInt8
        {
            Unsigned = 0,
            Negative = 1,
            Bytes    = 2,
            Text     = 3,
            Array    = 4,
            Map      = 5,
            Tag      = 6,
            Simple   = 7,
        };

        constexpr UInt64 kCidTag = 42;

        using VoidResult = DASL::Utilities::Expected<void, EncodeError>;

        VoidResult Fail(EncodeErrorCode code, std::string message)
        {
            EncodeError err;
            err.code    = code;
            err.message = std::move(message);
            return VoidResult(DASL::Utilities::Unexpected<EncodeError>(std::move(err)));
        }

        void PushBigEndian(std::vector<Byte>& out, UInt64 value, UIntSize width)
        {
            for (UIntSize i = width; i-- > 0;)
                out.push_back(static_cast<Byte>(value >> (i * 8)));
        }

        /// Writes the initial byte and the shortest argument form.
        void WriteHeader(std::vector<Byte>& out, Major major, UInt64 argument)
        {
            const auto mt = static_cast<UInt8>(static_cast<UInt8>(major) << 5);
            if (argument < 24)
            {
                out.push_back(static_cast<Byte>(mt | argument));
            }
            else if (argument <= 0xFF)
            {
                out.push_back(static_cast<Byte>(mt | 24));
                PushBigEndian(out, argument, 1);
            }
            else if (argument <= 0xFFFF)
            {
                out.push_back(static_cast<Byte>(mt | 25));
                PushBigEndian(out, argument, 2);
            }
            else if (argument <= 0xFFFFFFFF)
            {
                out.push_back(static_cast<Byte>(mt | 26));
                PushBigEndian(out, argument, 4);
            }
            else
            {
                out.push_back(static_cast<Byte>(mt | 27));
                PushBigEndian(out, argument, 8);
            }
        }

        void WritePayload(std::vector<Byte>& out, Major major, std::span<const Byte> payload)
        {
            WriteHeader(out, major, payload.size());
            out.insert(out.end(), payload.begin(), payload.end());
        }

        /// @p depth is the number of arrays/maps enclosing @p value.
        VoidResult WriteValue(std::vector<Byte>& out, const Value& value, const EncodeOptions& options, UIntSize depth)
        {
            if ((value.IsArray() || value.IsMap()) && depth >= options.maxDepth)
            {
                return Fail(EncodeErrorCode::DepthExceeded,
                            "Nesting depth exceeds limit of " + std::to_string(options.maxDepth));
            }

            switch (value.GetType())
            {
                case Value::Type::Null:
                    out.push_back(Byte {0xF6});
                    return {};
                case Value::Type::Bool:
                    out.push_back(value.AsBool() ? Byte {0xF5} : Byte {0xF4});
                    return {};
                case Value::Type::Integer:
                {
                    const Integer integer = value.AsInteger();
                    WriteHeader(out, integer.IsNegative() ? Major::Negative : Major::Unsigned, integer.Argument());
                    return {};
                }
                case Value::Type::Float:
                {
                    const F64 number = value.AsFloat();
                    if (!std::isfinite(number))
                        return Fail(EncodeErrorCode::NonFiniteFloat, "NaN and infinity have no canonical encoding");
                    out.push_back(Byte {0xFB});
                    PushBigEndian(out, std::bit_cast<UInt64>(number), 8);
                    return {};
                }
                case Value::Type::Text:
                {
                    const auto                  text = value.AsText();
                    const std::span<const Byte> payload(reinterpret_cast<const Byte*>(text.data()), text.size());
                    if (!detail::IsValidUtf8(payload))
                        return Fail(EncodeErrorCode::InvalidUtf8, "Text string is not valid UTF-8");
                    WritePayload(out, Major::Text, payload);
                    return {};
                }
                case Value::Type::Bytes:
                    WritePayload(out, Major::Bytes, value.AsBytes());
                    return {};
                case Value::Type::Cid:
                {
                    const std::vector<Byte> cid = value.AsCid().ToBytes();
                    WriteHeader(out, Major::Tag, kCidTag);
                    // Multibase identity prefix, then the binary CID.
                    WriteHeader(out, Major::Bytes, cid.size() + 1);
                    out.push_back(Byte {0x00});
                    out.insert(out.end(), cid.begin(), cid.end());
                    return {};
                }
                case Value::Type::Array:
                {
                    const auto items = value.AsArray();
                    WriteHeader(out, Major::Array, items.size());
                    for (const Value& item: items)
                    {
                        auto result = WriteValue(out, item, options, depth + 1);
                        if (!result.HasValue())
                            return result;
                    }
                    return {};
                }
                case Value::Type::Map:
                {
                    const auto entries = value.AsMap();
                    WriteHeader(out, Major::Map, entries.size());
                    for (UIntSize i = 0; i < entries.size(); ++i)
                    {
                        const MapEntry& entry = entries[i];
                        if (!entry.key.IsText() && !entry.key.IsBytes())
                        {
                            return Fail(EncodeErrorCode::InvalidMapKey,
                                        std::string("Map keys must be text or bytes, got ") + ToString(entry.key.GetType()));
                        }
                        if (i > 0 && CompareKeys(entries[i - 1].key, entry.key) == 0)
                            return Fail(EncodeErrorCode::DuplicateKey, "Duplicate map key " + ToDebugString(entry.key));

                        auto keyResult = WriteValue(out, entry.key, options, depth + 1);
                        if (!keyResult.HasValue())
                            return keyResult;
                        auto valueResult = WriteValue(out, entry.value, options, depth + 1);
                        if (!valueResult.HasValue())
                            return valueResult;
                    }
                    return {};
                }
            }
            DASL::Unreachable();
        }
    }// namespace

    DASL::Utilities::Expected<std::vector<Byte>, EncodeError> Encoder::Encode(const Value& value, const EncodeOptions& options)
    {
        std::vector<Byte> out;
        auto              result = WriteValue(out, value, options, 0);
        if (!result.HasValue())
        {
            return DASL::Utilities::Expected<std::vector<Byte>, EncodeError>(
                    DASL::Utilities::Unexpected<EncodeError>(std::move(result.ErrorUnsafe())));
        }
        return DASL::Utilities::Expected<std::vector<Byte>, EncodeError>(std::move(out));
    }

    DASL::Utilities::Expected<void, EncodeError> Encoder::EncodeTo(const Value& value, std::vector<Byte>& out,
                                                                  const EncodeOptions& options)
    {
        const UIntSize mark   = out.size();
        auto           result = WriteValue(out, value, options, 0);
        if (!result.HasValue())
            out.resize(mark);
        return result;
    }
}// namespace DASL::Drisl
