#include <DASL/Cid/Cid.hpp>

#include <DASL/Utilities/Encoding.hpp>

#include <algorithm>

namespace DASL::Cid
{
    namespace
    {
        constexpr char  kBase32Prefix = 'b';
        constexpr UInt8 kDigestLength = static_cast<UInt8>(Multihash::DigestSize);

        [[nodiscard]] DASL::Utilities::Expected<Cid, CidError> Fail(CidErrorCode code, std::string message)
        {
            return DASL::Utilities::Expected<Cid, CidError>(
                    DASL::Utilities::Unexpected<CidError>(CidError {code, std::move(message)}));
        }

        [[nodiscard]] bool IsKnownCodec(UInt8 value) noexcept
        {
            return value == static_cast<UInt8>(Codec::Raw) || value == static_cast<UInt8>(Codec::Drisl);
        }

        [[nodiscard]] bool IsKnownHash(UInt8 value) noexcept
        {
            return value == static_cast<UInt8>(MultihashCode::Sha2_256) ||
                   value == static_cast<UInt8>(MultihashCode::Blake3);
        }
    }// namespace

    DASL::Utilities::Expected<Cid, CidError> Cid::FromBytes(std::span<const Byte> bytes)
    {
        if (bytes.size() < 3)
            return Fail(CidErrorCode::TooShort, "CID shorter than 3 bytes");

        const auto version = std::to_integer<UInt8>(bytes[0]);
        if (version != Version)
            return Fail(CidErrorCode::InvalidVersion, "unsupported CID version " + std::to_string(version));

        const auto codec = std::to_integer<UInt8>(bytes[1]);
        if (!IsKnownCodec(codec))
            return Fail(CidErrorCode::UnknownCodec, "unknown codec 0x" + DASL::Utilities::ToHex(bytes.subspan(1, 1)));

        const auto multihash = bytes.subspan(2);
        if (multihash.size() != 2 + Multihash::DigestSize)
            return Fail(CidErrorCode::InvalidLength, "invalid multihash length " + std::to_string(multihash.size()));

        const auto hashCode = std::to_integer<UInt8>(multihash[0]);
        if (!IsKnownHash(hashCode))
            return Fail(CidErrorCode::UnknownHash, "unknown hash 0x" + DASL::Utilities::ToHex(multihash.subspan(0, 1)));
        if (std::to_integer<UInt8>(multihash[1]) != kDigestLength)
            return Fail(CidErrorCode::InvalidLengthPrefix, "digest length prefix must be 32");

        Multihash hash;
        hash.code = static_cast<MultihashCode>(hashCode);
        std::copy(multihash.begin() + 2, multihash.end(), hash.digest.begin());
        return DASL::Utilities::Expected<Cid, CidError>(Cid {static_cast<Codec>(codec), hash});
    }

    DASL::Utilities::Expected<Cid, CidError> Cid::FromString(std::string_view text)
    {
        if (text.empty() || text.front() != kBase32Prefix)
            return Fail(CidErrorCode::InvalidEncoding, "expected multibase base32 prefix 'b'");

        auto bytes = DASL::Utilities::FromBase32(text.substr(1));
        if (!bytes)
            return Fail(CidErrorCode::InvalidEncoding, "invalid base32 data");
        return FromBytes(*bytes);
    }

    std::vector<Byte> Cid::ToBytes() const
    {
        std::vector<Byte> out;
        out.reserve(EncodedSize);
        out.push_back(static_cast<Byte>(Version));
        out.push_back(static_cast<Byte>(m_codec));
        out.push_back(static_cast<Byte>(m_hash.code));
        out.push_back(static_cast<Byte>(kDigestLength));
        out.insert(out.end(), m_hash.digest.begin(), m_hash.digest.end());
        return out;
    }

    std::string Cid::ToString() const
    {
        const auto bytes = ToBytes();
        return kBase32Prefix + DASL::Utilities::ToBase32(bytes);
    }

    const char* ToString(CidErrorCode code) noexcept
    {
        switch (code)
        {
            case CidErrorCode::None:
                return "None";
            case CidErrorCode::InvalidEncoding:
                return "InvalidEncoding";
            case CidErrorCode::TooShort:
                return "TooShort";
            case CidErrorCode::InvalidVersion:
                return "InvalidVersion";
            case CidErrorCode::UnknownCodec:
                return "UnknownCodec";
            case CidErrorCode::UnknownHash:
                return "UnknownHash";
            case CidErrorCode::InvalidLength:
                return "InvalidLength";
            case CidErrorCode::InvalidLengthPrefix:
                return "InvalidLengthPrefix";
        }
        return "Unknown";
    }
}// namespace DASL::Cid
