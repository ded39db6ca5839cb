#include <DASL/Drisl/ByteCursor.hpp>

#include <new>
#include <string>

namespace DASL::Drisl
{
    ByteCursor::ByteCursor(DASL::IO::IByteReader& source, UIntSize chunkSize) noexcept
        : m_source(&source), m_chunkSize(chunkSize != 0 ? chunkSize : DefaultChunkSize)
    {
    }

    DASL::Utilities::Expected<void, DecodeError> ByteCursor::Fill(UIntSize count)
    {
        try
        {
            while (Buffered() < count && !m_sourceDone)
            {
                if (m_head == m_buffer.size())
                {
                    m_buffer.clear();
                    m_head = 0;
                }
                else if (m_head >= m_chunkSize)
                {
                    m_buffer.erase(m_buffer.begin(), m_buffer.begin() + static_cast<std::ptrdiff_t>(m_head));
                    m_head = 0;
                }

                // Grow one chunk at a time so a large length prefix only costs memory for
                // bytes the source actually delivers.
                const UIntSize used = m_buffer.size();
                m_buffer.resize(used + m_chunkSize);
                auto readResult = m_source->Read(std::span<Byte>(m_buffer.data() + used, m_chunkSize));
                if (!readResult.HasValue())
                {
                    m_buffer.resize(used);
                    DecodeError err;
                    err.code    = DecodeErrorCode::SourceError;
                    err.offset  = m_offset;
                    err.message = "Failed to read from source: " + readResult.ErrorUnsafe().message;
                    return DASL::Utilities::Expected<void, DecodeError>(DASL::Utilities::Unexpected<DecodeError>(std::move(err)));
                }

                const UIntSize readBytes = readResult.ValueUnsafe();
                m_buffer.resize(used + readBytes);
                if (readBytes == 0)
                    m_sourceDone = true;
            }
        } catch (const std::bad_alloc&)
        {
            DecodeError err;
            err.code    = DecodeErrorCode::SourceError;
            err.offset  = m_offset;
            err.message = "Allocation failed";
            return DASL::Utilities::Expected<void, DecodeError>(DASL::Utilities::Unexpected<DecodeError>(std::move(err)));
        }
        return {};
    }

    DASL::Utilities::Expected<std::optional<Byte>, DecodeError> ByteCursor::Peek()
    {
        auto fillResult = Fill(1);
        if (!fillResult.HasValue())
            return DASL::Utilities::Expected<std::optional<Byte>, DecodeError>(
                    DASL::Utilities::Unexpected<DecodeError>(std::move(fillResult.ErrorUnsafe())));

        if (Buffered() == 0)
            return DASL::Utilities::Expected<std::optional<Byte>, DecodeError>(std::optional<Byte> {});
        return DASL::Utilities::Expected<std::optional<Byte>, DecodeError>(std::optional<Byte> {m_buffer[m_head]});
    }

    DASL::Utilities::Expected<std::span<const Byte>, DecodeError> ByteCursor::Take(UIntSize count)
    {
        if (count == 0)
            return DASL::Utilities::Expected<std::span<const Byte>, DecodeError>(std::span<const Byte> {});

        auto fillResult = Fill(count);
        if (!fillResult.HasValue())
            return DASL::Utilities::Expected<std::span<const Byte>, DecodeError>(
                    DASL::Utilities::Unexpected<DecodeError>(std::move(fillResult.ErrorUnsafe())));

        if (Buffered() < count)
        {
            DecodeError err;
            err.code    = DecodeErrorCode::Truncated;
            err.offset  = m_offset;
            err.message = "Unexpected end of input: needed " + std::to_string(count) + " bytes, " +
                          std::to_string(Buffered()) + " available";
            return DASL::Utilities::Expected<std::span<const Byte>, DecodeError>(
                    DASL::Utilities::Unexpected<DecodeError>(std::move(err)));
        }

        const std::span<const Byte> bytes(m_buffer.data() + m_head, count);
        m_head += count;
        m_offset += count;
        return DASL::Utilities::Expected<std::span<const Byte>, DecodeError>(bytes);
    }

    DASL::Utilities::Expected<bool, DecodeError> ByteCursor::AtEnd()
    {
        auto peekResult = Peek();
        if (!peekResult.HasValue())
            return DASL::Utilities::Expected<bool, DecodeError>(
                    DASL::Utilities::Unexpected<DecodeError>(std::move(peekResult.ErrorUnsafe())));
        return DASL::Utilities::Expected<bool, DecodeError>(!peekResult.ValueUnsafe().has_value());
    }
}// namespace DASL::Drisl
