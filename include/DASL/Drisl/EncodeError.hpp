#pragma once

#include <DASL/Defines.hpp>
#include <DASL/Primitives.hpp>

#include <string>

namespace DASL::Drisl
{
    enum class EncodeErrorCode : UInt8
    {
        None,
        NonFiniteFloat,
        DuplicateKey,
        InvalidMapKey,
        InvalidUtf8,
        DepthExceeded,
    };

    struct EncodeError
    {
        EncodeErrorCode code {EncodeErrorCode::None};
        std::string     message {};
    };

    [[nodiscard]] DASL_API const char* ToString(EncodeErrorCode code) noexcept;
}// namespace DASL::Drisl
