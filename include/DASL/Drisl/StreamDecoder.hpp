#pragma once

#include <DASL/Defines.hpp>
#include <DASL/Drisl/ByteCursor.hpp>
#include <DASL/Drisl/DecodeError.hpp>
#include <DASL/Drisl/Decoder.hpp>
#include <DASL/Drisl/Value.hpp>
#include <DASL/IO/IByteReader.hpp>
#include <DASL/Utilities/Expected.hpp>

#include <iterator>
#include <memory>
#include <optional>

namespace DASL::Drisl
{
    /// @brief Decode session state.
    enum class StreamState : UInt8
    {
        Ready,     ///< At a value boundary.
        Exhausted, ///< Clean end of input reached. Terminal.
        Failed,    ///< A decode error occurred. Terminal.
    };

    /// @brief Result of one StreamDecoder::Advance() call.
    struct StreamItem
    {
        enum class Kind : UInt8
        {
            Value,
            End,
            Error,
        };

        Kind        kind {Kind::End};
        Value       value {};
        DecodeError error {};

        [[nodiscard]] bool IsValue() const noexcept { return kind == Kind::Value; }
        [[nodiscard]] bool IsEnd() const noexcept { return kind == Kind::End; }
        [[nodiscard]] bool IsError() const noexcept { return kind == Kind::Error; }
    };

    /// @brief Lazy decoder for a sequence of concatenated canonical values.
    ///
    /// Each Advance() decodes exactly one value from the shared cursor, so the bytes of the
    /// next value are never consumed early. Once Exhausted or Failed, Advance() keeps returning
    /// the same terminal item without touching the source again.
    ///
    /// @code
    /// DASL::IO::FileReader reader;
    /// ...
    /// for (auto&& item: DASL::Drisl::DecodeStream(reader))
    /// {
    ///     if (!item)
    ///         return Report(item.Error());
    ///     Consume(item.Value());
    /// }
    /// @endcode
    class DASL_API StreamDecoder
    {
    public:
        using ItemType = DASL::Utilities::Expected<Value, DecodeError>;

        /// @brief Session over a caller-owned source. @p source must outlive the session.
        explicit StreamDecoder(DASL::IO::IByteReader& source, const DecodeOptions& options = {});

        /// @brief Session that owns its source. A null @p source gives a session that is already Failed with SourceError.
        explicit StreamDecoder(std::unique_ptr<DASL::IO::IByteReader> source, const DecodeOptions& options = {});

        StreamDecoder(const StreamDecoder&)            = delete;
        StreamDecoder& operator=(const StreamDecoder&) = delete;
        StreamDecoder(StreamDecoder&&) noexcept            = default;
        StreamDecoder& operator=(StreamDecoder&&) noexcept = default;
        ~StreamDecoder()                                   = default;

        /// @brief Decodes the next value, or reports the terminal condition.
        StreamItem Advance();

        [[nodiscard]] StreamState State() const noexcept { return m_state; }

        /// @brief Bytes consumed so far; after a yielded value, the end of that value.
        [[nodiscard]] UIntSize Offset() const noexcept { return m_cursor.Offset(); }

        [[nodiscard]] UIntSize ValuesDecoded() const noexcept { return m_values; }

        /// @brief Input iterator over the session. Yields each value, then at most one error.
        class Iterator final
        {
        public:
            using value_type      = ItemType;
            using reference       = const ItemType&;
            using difference_type = std::ptrdiff_t;

            Iterator() noexcept = default;

            explicit Iterator(StreamDecoder& session)
                : m_session(&session)
            {
                Fetch();
            }

            reference operator*() const noexcept { return *m_current; }
            const ItemType* operator->() const noexcept { return &*m_current; }

            Iterator& operator++()
            {
                // Nothing follows an error.
                if (m_current && !m_current->HasValue())
                    m_current.reset();
                else
                    Fetch();
                return *this;
            }

            void operator++(int) { ++*this; }

            friend bool operator==(const Iterator& it, std::default_sentinel_t) noexcept
            {
                return !it.m_current.has_value();
            }

        private:
            void Fetch();

            StreamDecoder*          m_session {nullptr};
            std::optional<ItemType> m_current {};
        };

        /// @brief Starts iteration by advancing once. Single pass.
        [[nodiscard]] Iterator begin() { return Iterator {*this}; }

        [[nodiscard]] std::default_sentinel_t end() const noexcept { return {}; }

    private:
        std::unique_ptr<DASL::IO::IByteReader> m_ownedSource {};
        ByteCursor                             m_cursor;
        DecodeOptions                          m_options {};
        StreamState                            m_state {StreamState::Ready};
        DecodeError                            m_error {};
        UIntSize                               m_values {0};
    };

    /// @brief Starts a decode session over a caller-owned source.
    [[nodiscard]] DASL_API StreamDecoder DecodeStream(DASL::IO::IByteReader& source, const DecodeOptions& options = {});

    /// @brief Starts a decode session that owns @p source.
    [[nodiscard]] DASL_API StreamDecoder DecodeStream(std::unique_ptr<DASL::IO::IByteReader> source,
                                                      const DecodeOptions& options = {});
}// namespace DASL::Drisl
