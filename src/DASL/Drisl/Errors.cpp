#include <DASL/Drisl/DecodeError.hpp>
#include <DASL/Drisl/EncodeError.hpp>

namespace DASL::Drisl
{
    const char* ToString(DecodeErrorCode code) noexcept
    {
        switch (code)
        {
            case DecodeErrorCode::None:
                return "None";
            case DecodeErrorCode::Truncated:
                return "Truncated";
            case DecodeErrorCode::TrailingData:
                return "TrailingData";
            case DecodeErrorCode::NonCanonicalInt:
                return "NonCanonicalInt";
            case DecodeErrorCode::NonCanonicalFloat:
                return "NonCanonicalFloat";
            case DecodeErrorCode::InvalidUtf8:
                return "InvalidUtf8";
            case DecodeErrorCode::UnsortedKeys:
                return "UnsortedKeys";
            case DecodeErrorCode::DepthExceeded:
                return "DepthExceeded";
            case DecodeErrorCode::UnknownTag:
                return "UnknownTag";
            case DecodeErrorCode::IndefiniteLength:
                return "IndefiniteLength";
            case DecodeErrorCode::InvalidMapKey:
                return "InvalidMapKey";
            case DecodeErrorCode::InvalidCid:
                return "InvalidCid";
            case DecodeErrorCode::SourceError:
                return "SourceError";
        }
        return "Unknown";
    }

    const char* ToString(EncodeErrorCode code) noexcept
    {
        switch (code)
        {
            case EncodeErrorCode::None:
                return "None";
            case EncodeErrorCode::NonFiniteFloat:
                return "NonFiniteFloat";
            case EncodeErrorCode::DuplicateKey:
                return "DuplicateKey";
            case EncodeErrorCode::InvalidMapKey:
                return "InvalidMapKey";
            case EncodeErrorCode::InvalidUtf8:
                return "InvalidUtf8";
            case EncodeErrorCode::DepthExceeded:
                return "DepthExceeded";
        }
        return "Unknown";
    }
}// namespace DASL::Drisl
