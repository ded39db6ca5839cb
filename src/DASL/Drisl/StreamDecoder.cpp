#include <DASL/Drisl/StreamDecoder.hpp>

#include <DASL/IO/MemoryReader.hpp>
#include <DASL/Log.hpp>

#include <utility>

namespace DASL::Drisl
{
    namespace
    {
        // Stands in for a missing owned source; a session bound to it is Failed and never reads.
        DASL::IO::IByteReader& NullSource()
        {
            static DASL::IO::MemoryReader empty {std::span<const Byte> {}};
            return empty;
        }
    }// namespace

    StreamDecoder::StreamDecoder(DASL::IO::IByteReader& source, const DecodeOptions& options)
        : m_cursor(source, options.readChunkSize), m_options(options)
    {
    }

    StreamDecoder::StreamDecoder(std::unique_ptr<DASL::IO::IByteReader> source, const DecodeOptions& options)
        : m_ownedSource(std::move(source))
        , m_cursor(m_ownedSource ? *m_ownedSource : NullSource(), options.readChunkSize)
        , m_options(options)
    {
        if (!m_ownedSource)
        {
            m_state         = StreamState::Failed;
            m_error.code    = DecodeErrorCode::SourceError;
            m_error.offset  = 0;
            m_error.message = "No byte source";
        }
    }

    StreamItem StreamDecoder::Advance()
    {
        StreamItem item;
        switch (m_state)
        {
            case StreamState::Exhausted:
                item.kind = StreamItem::Kind::End;
                return item;
            case StreamState::Failed:
                item.kind  = StreamItem::Kind::Error;
                item.error = m_error;
                return item;
            case StreamState::Ready:
                break;
        }

        auto next = m_cursor.Peek();
        if (next.HasValue() && !next.ValueUnsafe().has_value())
        {
            m_state   = StreamState::Exhausted;
            item.kind = StreamItem::Kind::End;
            DASL_LOG_DEBUG << "Stream exhausted after " << m_values << " values, " << m_cursor.Offset() << " bytes";
            return item;
        }

        if (next.HasValue())
        {
            auto decoded = Decoder::DecodeOne(m_cursor, m_options);
            if (decoded.HasValue())
            {
                ++m_values;
                item.kind  = StreamItem::Kind::Value;
                item.value = std::move(decoded.ValueUnsafe());
                return item;
            }
            m_error = std::move(decoded.ErrorUnsafe());
        }
        else
        {
            m_error = std::move(next.ErrorUnsafe());
        }

        m_state    = StreamState::Failed;
        item.kind  = StreamItem::Kind::Error;
        item.error = m_error;
        DASL_LOG_DEBUG << "Stream failed after " << m_values << " values: " << ToString(m_error.code) << " at offset "
                       << m_error.offset << ": " << m_error.message;
        return item;
    }

    void StreamDecoder::Iterator::Fetch()
    {
        if (m_session == nullptr)
        {
            m_current.reset();
            return;
        }

        StreamItem item = m_session->Advance();
        switch (item.kind)
        {
            case StreamItem::Kind::Value:
                m_current.emplace(std::move(item.value));
                return;
            case StreamItem::Kind::Error:
                m_current.emplace(DASL::Utilities::Unexpected<DecodeError>(std::move(item.error)));
                return;
            case StreamItem::Kind::End:
                m_current.reset();
                return;
        }
    }

    StreamDecoder DecodeStream(DASL::IO::IByteReader& source, const DecodeOptions& options)
    {
        return StreamDecoder(source, options);
    }

    StreamDecoder DecodeStream(std::unique_ptr<DASL::IO::IByteReader> source, const DecodeOptions& options)
    {
        return StreamDecoder(std::move(source), options);
    }
}// namespace DASL::Drisl
