#pragma once

#include <DASL/Defines.hpp>
#include <DASL/IO/IByteReader.hpp>
#include <DASL/IO/IOError.hpp>

#include <cstring>

namespace DASL::IO
{
    /// @brief In-memory implementation of IByteReader. Does not own the viewed bytes.
    class DASL_API MemoryReader final : public IByteReader
    {
    public:
        explicit MemoryReader(std::span<const Byte> data) noexcept
            : m_data(data.data()), m_size(data.size())
        {
        }

        DASL::Utilities::Expected<UIntSize, IOError> Read(std::span<Byte> destination) noexcept override
        {
            const UIntSize remaining = Remaining();
            const UIntSize toRead    = (destination.size() < remaining) ? destination.size() : remaining;
            if (toRead == 0)
                return DASL::Utilities::Expected<UIntSize, IOError>(UIntSize {0});
            std::memcpy(destination.data(), m_data + m_offset, toRead);
            m_offset += toRead;
            return DASL::Utilities::Expected<UIntSize, IOError>(toRead);
        }

        DASL::Utilities::Expected<UIntSize, IOError> Tell() const noexcept override
        {
            return DASL::Utilities::Expected<UIntSize, IOError>(m_offset);
        }

        [[nodiscard]] UIntSize Remaining() const noexcept
        {
            return (m_offset < m_size) ? (m_size - m_offset) : 0;
        }

    private:
        const Byte* m_data {nullptr};
        UIntSize    m_size {0};
        UIntSize    m_offset {0};
    };
}// namespace DASL::IO
