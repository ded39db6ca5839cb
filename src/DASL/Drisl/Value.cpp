#include <DASL/Drisl/Value.hpp>

#include <DASL/Utilities/Encoding.hpp>

#include <algorithm>
#include <bit>
#include <charconv>
#include <cstring>

namespace DASL::Drisl
{
    namespace
    {
        constexpr UIntSize kMaxDebugDepth = 256;

        // Major type of the key's encoding; non-key values rank after every valid key.
        [[nodiscard]] int KeyRank(Value::Type type) noexcept
        {
            switch (type)
            {
                case Value::Type::Bytes:
                    return 2;
                case Value::Type::Text:
                    return 3;
                default:
                    return 8;
            }
        }

        [[nodiscard]] std::span<const Byte> KeyPayload(const Value& key) noexcept
        {
            if (key.IsBytes())
                return key.AsBytes();
            if (key.IsText())
            {
                const auto text = key.AsText();
                return std::span<const Byte>(reinterpret_cast<const Byte*>(text.data()), text.size());
            }
            return {};
        }

        [[nodiscard]] std::strong_ordering ComparePayloads(int lhsRank,
                                                           std::span<const Byte> lhs,
                                                           int rhsRank,
                                                           std::span<const Byte> rhs) noexcept
        {
            if (lhsRank != rhsRank)
                return lhsRank <=> rhsRank;
            if (lhs.size() != rhs.size())
                return lhs.size() <=> rhs.size();
            if (lhs.empty())
                return std::strong_ordering::equal;
            return std::memcmp(lhs.data(), rhs.data(), lhs.size()) <=> 0;
        }

        void AppendInteger(std::string& out, const Integer& value)
        {
            if (!value.IsNegative())
            {
                out += std::to_string(value.Argument());
                return;
            }
            // -1 - argument; the magnitude argument + 1 overflows only for -2^64.
            if (value.Argument() == std::numeric_limits<UInt64>::max())
            {
                out += "-18446744073709551616";
                return;
            }
            out += '-';
            out += std::to_string(value.Argument() + 1);
        }

        void AppendFloat(std::string& out, F64 value)
        {
            char buffer[64];
            const auto result = std::to_chars(buffer, buffer + sizeof(buffer), value);
            const std::string_view text(buffer, static_cast<UIntSize>(result.ptr - buffer));
            out += text;
            if (text.find_first_of(".eEn") == std::string_view::npos)
                out += ".0";
        }

        void AppendText(std::string& out, std::string_view text)
        {
            out += '"';
            for (const char c: text)
            {
                switch (c)
                {
                    case '"':
                        out += "\\\"";
                        break;
                    case '\\':
                        out += "\\\\";
                        break;
                    case '\n':
                        out += "\\n";
                        break;
                    case '\r':
                        out += "\\r";
                        break;
                    case '\t':
                        out += "\\t";
                        break;
                    default:
                        if (static_cast<unsigned char>(c) < 0x20)
                        {
                            static constexpr char kHex[] = "0123456789abcdef";
                            out += "\\u00";
                            out += kHex[(c >> 4) & 0x0F];
                            out += kHex[c & 0x0F];
                        }
                        else
                        {
                            out += c;
                        }
                        break;
                }
            }
            out += '"';
        }

        void AppendValue(std::string& out, const Value& value, UIntSize depth)
        {
            if (depth >= kMaxDebugDepth && (value.IsArray() || value.IsMap()))
            {
                out += value.IsArray() ? "[...]" : "{...}";
                return;
            }

            switch (value.GetType())
            {
                case Value::Type::Null:
                    out += "null";
                    return;
                case Value::Type::Bool:
                    out += value.AsBool() ? "true" : "false";
                    return;
                case Value::Type::Integer:
                    AppendInteger(out, value.AsInteger());
                    return;
                case Value::Type::Float:
                    AppendFloat(out, value.AsFloat());
                    return;
                case Value::Type::Text:
                    AppendText(out, value.AsText());
                    return;
                case Value::Type::Bytes:
                    out += "h'";
                    out += DASL::Utilities::ToHex(value.AsBytes());
                    out += '\'';
                    return;
                case Value::Type::Cid:
                    out += "42(\"";
                    out += value.AsCid().ToString();
                    out += "\")";
                    return;
                case Value::Type::Array:
                {
                    out += '[';
                    bool first = true;
                    for (const Value& item: value.AsArray())
                    {
                        if (!first)
                            out += ", ";
                        first = false;
                        AppendValue(out, item, depth + 1);
                    }
                    out += ']';
                    return;
                }
                case Value::Type::Map:
                {
                    out += '{';
                    bool first = true;
                    for (const MapEntry& entry: value.AsMap())
                    {
                        if (!first)
                            out += ", ";
                        first = false;
                        AppendValue(out, entry.key, depth + 1);
                        out += ": ";
                        AppendValue(out, entry.value, depth + 1);
                    }
                    out += '}';
                    return;
                }
            }
        }
    }// namespace

    Value::Value() noexcept                          = default;
    Value::Value(const Value& other)                 = default;
    Value::Value(Value&& other) noexcept             = default;
    Value& Value::operator=(const Value& other)      = default;
    Value& Value::operator=(Value&& other) noexcept  = default;
    Value::~Value()                                  = default;

    Value::Value(Storage storage) noexcept
        : m_storage(std::move(storage))
    {
    }

    Value Value::MakeBool(bool value)
    {
        return Value {Storage {std::in_place_type<bool>, value}};
    }

    Value Value::MakeInteger(Integer value)
    {
        return Value {Storage {std::in_place_type<Integer>, value}};
    }

    Value Value::MakeFloat(F64 value)
    {
        return Value {Storage {std::in_place_type<F64>, value}};
    }

    Value Value::MakeText(std::string value)
    {
        return Value {Storage {std::in_place_type<std::string>, std::move(value)}};
    }

    Value Value::MakeBytes(std::vector<Byte> value)
    {
        return Value {Storage {std::in_place_type<std::vector<Byte>>, std::move(value)}};
    }

    Value Value::MakeCid(const DASL::Cid::Cid& value)
    {
        return Value {Storage {std::in_place_type<DASL::Cid::Cid>, value}};
    }

    Value Value::MakeArray(std::vector<Value> items)
    {
        return Value {Storage {std::in_place_type<std::vector<Value>>, std::move(items)}};
    }

    Value Value::MakeMap(std::vector<MapEntry> entries)
    {
        const auto keyLess = [](const MapEntry& lhs, const MapEntry& rhs) {
            return CompareKeys(lhs.key, rhs.key) < 0;
        };
        // Decoded maps arrive in order already.
        if (!std::is_sorted(entries.begin(), entries.end(), keyLess))
            std::stable_sort(entries.begin(), entries.end(), keyLess);
        return Value {Storage {std::in_place_type<std::vector<MapEntry>>, std::move(entries)}};
    }

    bool Value::AsBool() const noexcept
    {
        DASL_ASSERT(IsBool());
        return *std::get_if<bool>(&m_storage);
    }

    Integer Value::AsInteger() const noexcept
    {
        DASL_ASSERT(IsInteger());
        return *std::get_if<Integer>(&m_storage);
    }

    F64 Value::AsFloat() const noexcept
    {
        DASL_ASSERT(IsFloat());
        return *std::get_if<F64>(&m_storage);
    }

    std::string_view Value::AsText() const noexcept
    {
        DASL_ASSERT(IsText());
        return *std::get_if<std::string>(&m_storage);
    }

    std::span<const Byte> Value::AsBytes() const noexcept
    {
        DASL_ASSERT(IsBytes());
        return *std::get_if<std::vector<Byte>>(&m_storage);
    }

    const DASL::Cid::Cid& Value::AsCid() const noexcept
    {
        DASL_ASSERT(IsCid());
        return *std::get_if<DASL::Cid::Cid>(&m_storage);
    }

    std::span<const Value> Value::AsArray() const noexcept
    {
        DASL_ASSERT(IsArray());
        return *std::get_if<std::vector<Value>>(&m_storage);
    }

    std::span<const MapEntry> Value::AsMap() const noexcept
    {
        DASL_ASSERT(IsMap());
        return *std::get_if<std::vector<MapEntry>>(&m_storage);
    }

    const Value* Value::Find(std::string_view key) const noexcept
    {
        if (!IsMap())
            return nullptr;

        const auto entries = AsMap();
        const std::span<const Byte> needle(reinterpret_cast<const Byte*>(key.data()), key.size());
        const int                   needleRank = KeyRank(Type::Text);

        const auto it = std::lower_bound(entries.begin(), entries.end(), needle, [&](const MapEntry& entry, std::span<const Byte> probe) {
            return ComparePayloads(KeyRank(entry.key.GetType()), KeyPayload(entry.key), needleRank, probe) < 0;
        });
        if (it == entries.end() || !it->key.IsText() || it->key.AsText() != key)
            return nullptr;
        return &it->value;
    }

    bool operator==(const Value& lhs, const Value& rhs) noexcept
    {
        if (lhs.GetType() != rhs.GetType())
            return false;
        if (lhs.IsFloat())
            return std::bit_cast<UInt64>(lhs.AsFloat()) == std::bit_cast<UInt64>(rhs.AsFloat());
        if (lhs.IsArray())
            return std::ranges::equal(lhs.AsArray(), rhs.AsArray());
        if (lhs.IsMap())
            return std::ranges::equal(lhs.AsMap(), rhs.AsMap());
        return lhs.m_storage == rhs.m_storage;
    }

    std::strong_ordering CompareKeys(const Value& lhs, const Value& rhs) noexcept
    {
        return ComparePayloads(KeyRank(lhs.GetType()), KeyPayload(lhs), KeyRank(rhs.GetType()), KeyPayload(rhs));
    }

    std::string ToDebugString(const Value& value)
    {
        std::string out;
        AppendValue(out, value, 0);
        return out;
    }

    const char* ToString(Value::Type type) noexcept
    {
        switch (type)
        {
            case Value::Type::Null:
                return "Null";
            case Value::Type::Bool:
                return "Bool";
            case Value::Type::Integer:
                return "Integer";
            case Value::Type::Float:
                return "Float";
            case Value::Type::Text:
                return "Text";
            case Value::Type::Bytes:
                return "Bytes";
            case Value::Type::Cid:
                return "Cid";
            case Value::Type::Array:
                return "Array";
            case Value::Type::Map:
                return "Map";
        }
        return "Unknown";
    }
}// namespace DASL::Drisl
