#pragma once

#include <DASL/Cid/Cid.hpp>
#include <DASL/Defines.hpp>
#include <DASL/Primitives.hpp>

#include <compare>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace DASL::Drisl
{
    /// @brief CBOR integer covering the full wire range [-2^64, 2^64 - 1].
    ///
    /// Stored the way the wire stores it: a sign flag plus the 64-bit argument, where the
    /// argument of a negative integer v is -1 - v.
    class Integer
    {
    public:
        constexpr Integer() noexcept = default;

        [[nodiscard]] static constexpr Integer FromUnsigned(UInt64 value) noexcept
        {
            return Integer {false, value};
        }

        [[nodiscard]] static constexpr Integer FromSigned(Int64 value) noexcept
        {
            if (value >= 0)
                return Integer {false, static_cast<UInt64>(value)};
            return Integer {true, static_cast<UInt64>(-(value + 1))};
        }

        /// @brief Builds the negative integer -1 - argument.
        [[nodiscard]] static constexpr Integer FromNegativeArgument(UInt64 argument) noexcept
        {
            return Integer {true, argument};
        }

        [[nodiscard]] constexpr bool   IsNegative() const noexcept { return m_negative; }
        [[nodiscard]] constexpr UInt64 Argument() const noexcept { return m_argument; }

        [[nodiscard]] constexpr std::optional<Int64> TryToInt64() const noexcept
        {
            constexpr auto kMax = static_cast<UInt64>(std::numeric_limits<Int64>::max());
            if (m_argument > kMax)
                return std::nullopt;
            const auto magnitude = static_cast<Int64>(m_argument);
            return m_negative ? -1 - magnitude : magnitude;
        }

        [[nodiscard]] constexpr std::optional<UInt64> TryToUInt64() const noexcept
        {
            if (m_negative)
                return std::nullopt;
            return m_argument;
        }

        friend constexpr bool operator==(const Integer&, const Integer&) noexcept = default;

        friend constexpr std::strong_ordering operator<=>(const Integer& lhs, const Integer& rhs) noexcept
        {
            if (lhs.m_negative != rhs.m_negative)
                return lhs.m_negative ? std::strong_ordering::less : std::strong_ordering::greater;
            // A larger argument means a larger magnitude, which is smaller when negative.
            return lhs.m_negative ? rhs.m_argument <=> lhs.m_argument : lhs.m_argument <=> rhs.m_argument;
        }

    private:
        constexpr Integer(bool negative, UInt64 argument) noexcept
            : m_negative(negative), m_argument(argument)
        {
        }

        bool   m_negative {false};
        UInt64 m_argument {0};
    };

    struct MapEntry;

    /// @brief Decoded DRISL value. Owns its children; arrays and maps form a tree.
    class DASL_API Value
    {
    public:
        /// Alternatives, in storage order.
        enum class Type : UInt8
        {
            Null,
            Bool,
            Integer,
            Float,
            Text,
            Bytes,
            Cid,
            Array,
            Map,
        };

        Value() noexcept;
        Value(const Value& other);
        Value(Value&& other) noexcept;
        Value& operator=(const Value& other);
        Value& operator=(Value&& other) noexcept;
        ~Value();

        static Value MakeNull() noexcept { return Value {}; }
        static Value MakeBool(bool value);
        static Value MakeInteger(Integer value);
        static Value MakeFloat(F64 value);
        static Value MakeText(std::string value);
        static Value MakeBytes(std::vector<Byte> value);
        static Value MakeCid(const DASL::Cid::Cid& value);
        static Value MakeArray(std::vector<Value> items);

        /// @brief Builds a map, sorting the entries into canonical key order.
        ///
        /// Duplicate keys are kept (adjacent after sorting); Encode() rejects them.
        static Value MakeMap(std::vector<MapEntry> entries);

        [[nodiscard]] Type GetType() const noexcept { return static_cast<Type>(m_storage.index()); }

        [[nodiscard]] bool IsNull() const noexcept { return GetType() == Type::Null; }
        [[nodiscard]] bool IsBool() const noexcept { return GetType() == Type::Bool; }
        [[nodiscard]] bool IsInteger() const noexcept { return GetType() == Type::Integer; }
        [[nodiscard]] bool IsFloat() const noexcept { return GetType() == Type::Float; }
        [[nodiscard]] bool IsText() const noexcept { return GetType() == Type::Text; }
        [[nodiscard]] bool IsBytes() const noexcept { return GetType() == Type::Bytes; }
        [[nodiscard]] bool IsCid() const noexcept { return GetType() == Type::Cid; }
        [[nodiscard]] bool IsArray() const noexcept { return GetType() == Type::Array; }
        [[nodiscard]] bool IsMap() const noexcept { return GetType() == Type::Map; }

        // Accessors require the matching type.
        [[nodiscard]] bool                    AsBool() const noexcept;
        [[nodiscard]] Integer                 AsInteger() const noexcept;
        [[nodiscard]] F64                     AsFloat() const noexcept;
        [[nodiscard]] std::string_view        AsText() const noexcept;
        [[nodiscard]] std::span<const Byte>   AsBytes() const noexcept;
        [[nodiscard]] const DASL::Cid::Cid&   AsCid() const noexcept;
        [[nodiscard]] std::span<const Value>  AsArray() const noexcept;
        [[nodiscard]] std::span<const MapEntry> AsMap() const noexcept;

        /// @brief Looks up a text key in a map value. Returns nullptr if absent or not a map.
        [[nodiscard]] const Value* Find(std::string_view key) const noexcept;

        /// @brief Structural equality; floats compare by bit pattern.
        friend DASL_API bool operator==(const Value& lhs, const Value& rhs) noexcept;

    private:
        using Storage = std::variant<std::monostate,
                                     bool,
                                     Integer,
                                     F64,
                                     std::string,
                                     std::vector<Byte>,
                                     DASL::Cid::Cid,
                                     std::vector<Value>,
                                     std::vector<MapEntry>>;

        explicit Value(Storage storage) noexcept;

        Storage m_storage;
    };

    /// @brief Key/value pair of a map value. Keys are Text or Bytes values.
    struct MapEntry
    {
        Value key {};
        Value value {};

        friend bool operator==(const MapEntry&, const MapEntry&) = default;
    };

    /// @brief Canonical map key order: the byte-wise order of the encoded keys.
    ///
    /// With minimal headers this is: byte strings before text strings, then shorter before
    /// longer, then lexicographic payload bytes. Values that are not valid keys sort last.
    [[nodiscard]] DASL_API std::strong_ordering CompareKeys(const Value& lhs, const Value& rhs) noexcept;

    /// @brief Renders a value in CBOR diagnostic notation (RFC 8949 section 8).
    /// Containers nested deeper than 256 levels are elided as `[...]` / `{...}`.
    [[nodiscard]] DASL_API std::string ToDebugString(const Value& value);

    [[nodiscard]] DASL_API const char* ToString(Value::Type type) noexcept;
}// namespace DASL::Drisl
