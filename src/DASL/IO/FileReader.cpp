#include <DASL/IO/FileReader.hpp>

#include <DASL/Log.hpp>

namespace DASL::IO
{
    DASL::Utilities::Expected<void, IOError> FileReader::Open(const std::string& path) noexcept
    {
        m_offset = 0;
        auto result = m_file.Open(path);
        if (!result.HasValue())
        {
            DASL_LOG_WARNING << "cannot open '" << path << "': " << result.ErrorUnsafe().message
                             << " (errno " << result.ErrorUnsafe().systemCode << ")";
            return result;
        }
        m_path = path;
        return result;
    }

    DASL::Utilities::Expected<UIntSize, IOError> FileReader::Read(std::span<Byte> destination) noexcept
    {
        auto result = m_file.Read(destination);
        if (!result.HasValue())
        {
            DASL_LOG_WARNING << "read from '" << m_path << "' failed at offset " << m_offset << ": "
                             << result.ErrorUnsafe().message;
            return result;
        }
        m_offset += result.ValueUnsafe();
        return result;
    }

    DASL::Utilities::Expected<UIntSize, IOError> FileReader::Tell() const noexcept
    {
        return DASL::Utilities::Expected<UIntSize, IOError>(m_offset);
    }
}// namespace DASL::IO
