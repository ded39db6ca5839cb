#pragma once

#include <DASL/Defines.hpp>
#include <DASL/Primitives.hpp>

#include <string>

namespace DASL::Drisl
{
    /// @brief Reason a decode call rejected its input.
    enum class DecodeErrorCode : UInt8
    {
        None,
        Truncated,         ///< Input ended inside a value.
        TrailingData,      ///< Bytes remain after a single-value decode.
        NonCanonicalInt,   ///< Integer or length argument not in its shortest form.
        NonCanonicalFloat, ///< Non 64-bit float, NaN or infinity.
        InvalidUtf8,
        UnsortedKeys,      ///< Map key not strictly greater than its predecessor.
        DepthExceeded,
        UnknownTag,        ///< Initial byte, tag number or simple value outside the format.
        IndefiniteLength,
        InvalidMapKey,     ///< Map key that is neither text nor bytes.
        InvalidCid,
        SourceError,       ///< The byte source failed, or buffering ran out of memory.
    };

    /// @brief Decode error payload with code, byte offset, and message.
    struct DecodeError
    {
        DecodeErrorCode code {DecodeErrorCode::None};
        /// Start of the offending item; for Truncated and SourceError, the position of the missing bytes.
        UIntSize        offset {0};
        std::string     message {};
    };

    [[nodiscard]] DASL_API const char* ToString(DecodeErrorCode code) noexcept;
}// namespace DASL::Drisl
