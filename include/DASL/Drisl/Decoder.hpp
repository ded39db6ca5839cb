#pragma once

#include <DASL/Drisl/ByteCursor.hpp>
#include <DASL/Drisl/DecodeError.hpp>
#include <DASL/Drisl/Value.hpp>
#include <DASL/IO/IByteReader.hpp>
#include <DASL/Utilities/Expected.hpp>

#include <span>

namespace DASL::Drisl
{
    /// @brief DRISL decoding configuration.
    struct DecodeOptions
    {
        /// Maximum number of simultaneously open arrays/maps.
        UIntSize maxDepth {256};
        /// Bytes requested from the source per read.
        UIntSize readChunkSize {ByteCursor::DefaultChunkSize};
    };

    /// @brief Canonical DRISL decoder entry points.
    ///
    /// Every input is validated against the canonical form: shortest integer and length
    /// arguments, definite lengths only, 64-bit finite floats, valid UTF-8 text, map keys
    /// strictly ascending in encoded byte order, and tag 42 (CID) as the only tag.
    class DASL_API Decoder
    {
    public:
        /// @brief Decodes exactly one value, consuming only that value's bytes.
        static DASL::Utilities::Expected<Value, DecodeError>
        DecodeOne(ByteCursor& cursor, const DecodeOptions& options = {});

        /// @brief Decodes a single value that must span the whole input.
        static DASL::Utilities::Expected<Value, DecodeError>
        Decode(std::span<const Byte> input, const DecodeOptions& options = {});

        /// @brief Decodes a single value that must span the whole source.
        static DASL::Utilities::Expected<Value, DecodeError>
        Decode(DASL::IO::IByteReader& reader, const DecodeOptions& options = {});
    };
}// namespace DASL::Drisl
