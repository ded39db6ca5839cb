#include <DASL/Utilities/Encoding.hpp>

namespace DASL::Utilities
{
    namespace
    {
        constexpr char kHexDigits[]    = "0123456789abcdef";
        constexpr char kBase32Digits[] = "abcdefghijklmnopqrstuvwxyz234567";

        [[nodiscard]] int HexValue(char c) noexcept
        {
            if (c >= '0' && c <= '9')
                return c - '0';
            if (c >= 'a' && c <= 'f')
                return c - 'a' + 10;
            if (c >= 'A' && c <= 'F')
                return c - 'A' + 10;
            return -1;
        }

        [[nodiscard]] int Base32Value(char c) noexcept
        {
            if (c >= 'a' && c <= 'z')
                return c - 'a';
            if (c >= 'A' && c <= 'Z')
                return c - 'A';
            if (c >= '2' && c <= '7')
                return c - '2' + 26;
            return -1;
        }
    }// namespace

    std::string ToHex(std::span<const Byte> data)
    {
        std::string out;
        out.reserve(data.size() * 2);
        for (const Byte b: data)
        {
            const auto v = std::to_integer<UInt8>(b);
            out.push_back(kHexDigits[v >> 4]);
            out.push_back(kHexDigits[v & 0x0F]);
        }
        return out;
    }

    std::optional<std::vector<Byte>> FromHex(std::string_view hex)
    {
        if (hex.size() % 2 != 0)
            return std::nullopt;

        std::vector<Byte> out;
        out.reserve(hex.size() / 2);
        for (UIntSize i = 0; i < hex.size(); i += 2)
        {
            const int hi = HexValue(hex[i]);
            const int lo = HexValue(hex[i + 1]);
            if (hi < 0 || lo < 0)
                return std::nullopt;
            out.push_back(static_cast<Byte>((hi << 4) | lo));
        }
        return out;
    }

    std::string ToBase32(std::span<const Byte> data)
    {
        std::string out;
        out.reserve((data.size() * 8 + 4) / 5);

        UInt32 buffer = 0;
        int    bits   = 0;
        for (const Byte b: data)
        {
            buffer = (buffer << 8) | std::to_integer<UInt32>(b);
            bits += 8;
            while (bits >= 5)
            {
                bits -= 5;
                out.push_back(kBase32Digits[(buffer >> bits) & 0x1F]);
            }
        }
        if (bits > 0)
            out.push_back(kBase32Digits[(buffer << (5 - bits)) & 0x1F]);
        return out;
    }

    std::optional<std::vector<Byte>> FromBase32(std::string_view text)
    {
        // Lengths of 1, 3 or 6 symbols mod 8 cannot come from whole bytes.
        const UIntSize tail = text.size() % 8;
        if (tail == 1 || tail == 3 || tail == 6)
            return std::nullopt;

        std::vector<Byte> out;
        out.reserve(text.size() * 5 / 8);

        UInt32 buffer = 0;
        int    bits   = 0;
        for (const char c: text)
        {
            const int v = Base32Value(c);
            if (v < 0)
                return std::nullopt;
            buffer = (buffer << 5) | static_cast<UInt32>(v);
            bits += 5;
            if (bits >= 8)
            {
                bits -= 8;
                out.push_back(static_cast<Byte>((buffer >> bits) & 0xFF));
            }
        }
        // Leftover bits must be zero padding.
        if ((buffer & ((1u << bits) - 1u)) != 0)
            return std::nullopt;
        return out;
    }
}// namespace DASL::Utilities
