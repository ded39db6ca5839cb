#include "Utf8.hpp"

namespace DASL::Drisl::detail
{
    bool IsValidUtf8(std::span<const Byte> bytes) noexcept
    {
        UIntSize i = 0;
        while (i < bytes.size())
        {
            const auto lead = std::to_integer<UInt8>(bytes[i]);
            if (lead < 0x80)
            {
                ++i;
                continue;
            }

            UIntSize length   = 0;
            UInt32   minValue = 0;
            UInt32   value    = 0;
            if ((lead & 0xE0) == 0xC0)
            {
                length   = 2;
                minValue = 0x80;
                value    = lead & 0x1F;
            }
            else if ((lead & 0xF0) == 0xE0)
            {
                length   = 3;
                minValue = 0x800;
                value    = lead & 0x0F;
            }
            else if ((lead & 0xF8) == 0xF0)
            {
                length   = 4;
                minValue = 0x10000;
                value    = lead & 0x07;
            }
            else
            {
                return false;
            }

            if (bytes.size() - i < length)
                return false;
            for (UIntSize k = 1; k < length; ++k)
            {
                const auto cont = std::to_integer<UInt8>(bytes[i + k]);
                if ((cont & 0xC0) != 0x80)
                    return false;
                value = (value << 6) | (cont & 0x3F);
            }

            if (value < minValue || value > 0x10FFFF || (value >= 0xD800 && value <= 0xDFFF))
                return false;
            i += length;
        }
        return true;
    }
}// namespace DASL::Drisl::detail
