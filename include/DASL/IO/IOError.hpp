#pragma once

#include <DASL/Defines.hpp>
#include <DASL/Primitives.hpp>

#include <string>

namespace DASL::IO
{
    /// @brief Error codes for low-level IO operations.
    enum class IOErrorCode : UInt8
    {
        None,
        InvalidArgument,
        SystemError,
    };

    /// @brief IO error payload with optional system code.
    struct IOError
    {
        IOErrorCode code {IOErrorCode::None};
        Int32       systemCode {0};
        std::string message {};
    };
}// namespace DASL::IO
