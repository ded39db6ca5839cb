#pragma once

#include <DASL/Defines.hpp>
#include <DASL/IO/IOError.hpp>
#include <DASL/Primitives.hpp>
#include <DASL/Utilities/Expected.hpp>

#include <span>

namespace DASL::IO
{
    /// @brief Pull-based byte source consumed by the DRISL decoders.
    ///
    /// @details Implementations may block inside Read() while waiting for data; this is the
    ///          only place a decode call can block. A successful Read() returning 0 bytes for a
    ///          non-empty destination signals the end of the source.
    class DASL_API IByteReader
    {
    public:
        virtual ~IByteReader() = default;

        /// @brief Read up to destination.size() bytes into destination.
        virtual DASL::Utilities::Expected<UIntSize, IOError> Read(std::span<Byte> destination) noexcept = 0;

        /// @brief Number of bytes handed out so far.
        virtual DASL::Utilities::Expected<UIntSize, IOError> Tell() const noexcept = 0;
    };
}// namespace DASL::IO
