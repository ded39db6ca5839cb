#pragma once

#include <DASL/Defines.hpp>
#include <DASL/Primitives.hpp>

#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace DASL::Utilities
{
    // Text encodings for binary data. Decoders return std::nullopt on malformed input.
    DASL_API std::string                            ToHex(std::span<const Byte> data);
    DASL_API std::optional<std::vector<Byte>>       FromHex(std::string_view hex);

    /// @brief RFC 4648 base32, lowercase alphabet, no padding.
    DASL_API std::string                            ToBase32(std::span<const Byte> data);
    /// @brief Inverse of ToBase32; accepts either letter case and rejects padding.
    DASL_API std::optional<std::vector<Byte>>       FromBase32(std::string_view text);
}// namespace DASL::Utilities
