#pragma once

#include <DASL/Primitives.hpp>

#include <span>

namespace DASL::Drisl::detail
{
    /// Validates UTF-8, rejecting overlong forms, surrogates and code points above U+10FFFF.
    [[nodiscard]] bool IsValidUtf8(std::span<const Byte> bytes) noexcept;
}// namespace DASL::Drisl::detail
