#include <DASL/IO/File.hpp>

#include <cerrno>
#include <cstring>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#else
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace DASL::IO
{
    namespace
    {
        [[nodiscard]] IOError MakeSystemError(const char* message, int code)
        {
            IOError err;
            err.code       = IOErrorCode::SystemError;
            err.systemCode = code;
            err.message    = message ? message : "system error";
            return err;
        }

        [[nodiscard]] IOError MakeNotOpenError()
        {
            IOError err;
            err.code    = IOErrorCode::InvalidArgument;
            err.message = "file not open";
            return err;
        }
    }// namespace

    File::File(File&& other) noexcept
    {
        *this = std::move(other);
    }

    File& File::operator=(File&& other) noexcept
    {
        if (this != &other)
        {
            Close();
#if defined(_WIN32)
            m_handle       = other.m_handle;
            other.m_handle = nullptr;
#else
            m_handle       = other.m_handle;
            other.m_handle = -1;
#endif
        }
        return *this;
    }

    File::~File()
    {
        Close();
    }

    DASL::Utilities::Expected<void, IOError> File::Open(const std::string& path) noexcept
    {
        Close();
#if defined(_WIN32)
        HANDLE handle = CreateFileA(path.c_str(), GENERIC_READ, FILE_SHARE_READ, nullptr, OPEN_EXISTING, FILE_ATTRIBUTE_NORMAL, nullptr);
        if (handle == INVALID_HANDLE_VALUE)
        {
            return DASL::Utilities::Expected<void, IOError>(DASL::Utilities::Unexpected<IOError>(
                    MakeSystemError("CreateFileA failed", static_cast<int>(GetLastError()))));
        }
        m_handle = handle;
#else
        const int fd = ::open(path.c_str(), O_RDONLY);
        if (fd < 0)
        {
            return DASL::Utilities::Expected<void, IOError>(DASL::Utilities::Unexpected<IOError>(
                    MakeSystemError("open failed", errno)));
        }
        m_handle = fd;
#endif
        return {};
    }

    void File::Close() noexcept
    {
#if defined(_WIN32)
        if (m_handle)
        {
            CloseHandle(static_cast<HANDLE>(m_handle));
            m_handle = nullptr;
        }
#else
        if (m_handle >= 0)
        {
            ::close(m_handle);
            m_handle = -1;
        }
#endif
    }

    bool File::IsOpen() const noexcept
    {
#if defined(_WIN32)
        return m_handle != nullptr;
#else
        return m_handle >= 0;
#endif
    }

    DASL::Utilities::Expected<UIntSize, IOError> File::Read(std::span<Byte> destination) noexcept
    {
        if (!IsOpen())
            return DASL::Utilities::Expected<UIntSize, IOError>(DASL::Utilities::Unexpected<IOError>(MakeNotOpenError()));
        if (destination.empty())
            return DASL::Utilities::Expected<UIntSize, IOError>(UIntSize {0});
#if defined(_WIN32)
        DWORD bytesRead = 0;
        if (!ReadFile(static_cast<HANDLE>(m_handle), destination.data(), static_cast<DWORD>(destination.size()), &bytesRead, nullptr))
        {
            return DASL::Utilities::Expected<UIntSize, IOError>(DASL::Utilities::Unexpected<IOError>(
                    MakeSystemError("ReadFile failed", static_cast<int>(GetLastError()))));
        }
        return DASL::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(bytesRead));
#else
        ssize_t result = 0;
        do
        {
            result = ::read(m_handle, destination.data(), destination.size());
        } while (result < 0 && errno == EINTR);
        if (result < 0)
        {
            return DASL::Utilities::Expected<UIntSize, IOError>(DASL::Utilities::Unexpected<IOError>(
                    MakeSystemError("read failed", errno)));
        }
        return DASL::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(result));
#endif
    }

    DASL::Utilities::Expected<UIntSize, IOError> File::Size() const noexcept
    {
        if (!IsOpen())
            return DASL::Utilities::Expected<UIntSize, IOError>(DASL::Utilities::Unexpected<IOError>(MakeNotOpenError()));
#if defined(_WIN32)
        LARGE_INTEGER size;
        if (!GetFileSizeEx(static_cast<HANDLE>(m_handle), &size))
        {
            return DASL::Utilities::Expected<UIntSize, IOError>(DASL::Utilities::Unexpected<IOError>(
                    MakeSystemError("GetFileSizeEx failed", static_cast<int>(GetLastError()))));
        }
        return DASL::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(size.QuadPart));
#else
        struct stat st {};
        if (::fstat(m_handle, &st) != 0)
        {
            return DASL::Utilities::Expected<UIntSize, IOError>(DASL::Utilities::Unexpected<IOError>(
                    MakeSystemError("fstat failed", errno)));
        }
        return DASL::Utilities::Expected<UIntSize, IOError>(static_cast<UIntSize>(st.st_size));
#endif
    }
}// namespace DASL::IO
