#pragma once

#include <DASL/Defines.hpp>
#include <DASL/IO/File.hpp>
#include <DASL/IO/IByteReader.hpp>

#include <string>

namespace DASL::IO
{
    /// @brief IByteReader over a file opened for reading.
    class DASL_API FileReader final : public IByteReader
    {
    public:
        FileReader() noexcept = default;

        DASL::Utilities::Expected<void, IOError> Open(const std::string& path) noexcept;

        DASL::Utilities::Expected<UIntSize, IOError> Read(std::span<Byte> destination) noexcept override;
        DASL::Utilities::Expected<UIntSize, IOError> Tell() const noexcept override;

        [[nodiscard]] File&       Handle() noexcept { return m_file; }
        [[nodiscard]] const File& Handle() const noexcept { return m_file; }

    private:
        File        m_file {};
        std::string m_path {};
        UIntSize    m_offset {0};
    };
}// namespace DASL::IO
