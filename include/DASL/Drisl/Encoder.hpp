#pragma once

#include <DASL/Defines.hpp>
#include <DASL/Drisl/EncodeError.hpp>
#include <DASL/Drisl/Value.hpp>
#include <DASL/Utilities/Expected.hpp>

#include <vector>

namespace DASL::Drisl
{
    /// @brief DRISL encoding configuration.
    struct EncodeOptions
    {
        /// Maximum nesting of arrays/maps; matches the decoder default so encoded output decodes.
        UIntSize maxDepth {256};
    };

    /// @brief Canonical DRISL encoder. Each value has exactly one encoding.
    class DASL_API Encoder
    {
    public:
        static DASL::Utilities::Expected<std::vector<Byte>, EncodeError> Encode(const Value& value,
                                                                               const EncodeOptions& options = {});

        /// @brief Appends the encoding of @p value to @p out. On failure @p out is left unchanged.
        static DASL::Utilities::Expected<void, EncodeError> EncodeTo(const Value& value, std::vector<Byte>& out,
                                                                     const EncodeOptions& options = {});
    };
}// namespace DASL::Drisl
