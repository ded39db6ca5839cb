#pragma once

#include <DASL/Defines.hpp>
#include <DASL/Drisl/DecodeError.hpp>
#include <DASL/IO/IByteReader.hpp>
#include <DASL/Primitives.hpp>
#include <DASL/Utilities/Expected.hpp>

#include <optional>
#include <span>
#include <vector>

namespace DASL::Drisl
{
    /// @brief Forward-only cursor over an IByteReader with an internal lookahead buffer.
    ///
    /// The cursor reads from its source in chunks but only counts bytes as consumed when
    /// Take() hands them out, so bytes buffered past the current value stay available for
    /// the next decode call on the same cursor. One cursor serves one decode session.
    class DASL_API ByteCursor
    {
    public:
        static constexpr UIntSize DefaultChunkSize = 64 * 1024;

        explicit ByteCursor(DASL::IO::IByteReader& source, UIntSize chunkSize = DefaultChunkSize) noexcept;

        ByteCursor(const ByteCursor&)            = delete;
        ByteCursor& operator=(const ByteCursor&) = delete;
        ByteCursor(ByteCursor&&) noexcept            = default;
        ByteCursor& operator=(ByteCursor&&) noexcept = default;

        /// @brief Next byte without consuming it; std::nullopt at the end of the source.
        DASL::Utilities::Expected<std::optional<Byte>, DecodeError> Peek();

        /// @brief Consumes exactly @p count bytes.
        ///
        /// Fails with DecodeErrorCode::Truncated, consuming nothing, if the source ends first.
        /// The returned span stays valid until the next call on this cursor.
        DASL::Utilities::Expected<std::span<const Byte>, DecodeError> Take(UIntSize count);

        /// @brief True when no bytes remain in the buffer or the source.
        DASL::Utilities::Expected<bool, DecodeError> AtEnd();

        /// @brief Bytes consumed so far.
        [[nodiscard]] UIntSize Offset() const noexcept { return m_offset; }

        /// @brief Bytes read from the source but not yet consumed.
        [[nodiscard]] UIntSize Buffered() const noexcept { return m_buffer.size() - m_head; }

    private:
        /// Reads until at least @p count bytes are buffered or the source is exhausted.
        DASL::Utilities::Expected<void, DecodeError> Fill(UIntSize count);

        DASL::IO::IByteReader* m_source {nullptr};
        std::vector<Byte>      m_buffer {};
        UIntSize               m_head {0};
        UIntSize               m_offset {0};
        UIntSize               m_chunkSize {DefaultChunkSize};
        bool                   m_sourceDone {false};
    };
}// namespace DASL::Drisl
