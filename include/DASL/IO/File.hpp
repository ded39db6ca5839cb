#pragma once

#include <DASL/Defines.hpp>
#include <DASL/IO/IOError.hpp>
#include <DASL/Primitives.hpp>
#include <DASL/Utilities/Expected.hpp>

#include <span>
#include <string>

namespace DASL::IO
{
    /// @brief Read-only file handle wrapper using platform APIs.
    class DASL_API File
    {
    public:
        File() noexcept              = default;
        File(const File&)            = delete;
        File& operator=(const File&) = delete;
        File(File&& other) noexcept;
        File& operator=(File&& other) noexcept;
        ~File();

        DASL::Utilities::Expected<void, IOError> Open(const std::string& path) noexcept;
        void                                     Close() noexcept;

        [[nodiscard]] bool IsOpen() const noexcept;

        DASL::Utilities::Expected<UIntSize, IOError> Read(std::span<Byte> destination) noexcept;
        DASL::Utilities::Expected<UIntSize, IOError> Size() const noexcept;

    private:
#if defined(_WIN32)
        void* m_handle {nullptr};
#else
        int m_handle {-1};
#endif
    };
}// namespace DASL::IO
