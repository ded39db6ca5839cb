#pragma once

#include <DASL/Defines.hpp>
#include <DASL/Primitives.hpp>
#include <DASL/Utilities/Expected.hpp>

#include <array>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace DASL::Cid
{
    /// @brief Content codec of the addressed data.
    enum class Codec : UInt8
    {
        Raw   = 0x55,
        Drisl = 0x71,
    };

    /// @brief Hash function used for the digest.
    enum class MultihashCode : UInt8
    {
        Sha2_256 = 0x12,
        Blake3   = 0x1e,
    };

    enum class CidErrorCode : UInt8
    {
        None,
        InvalidEncoding,
        TooShort,
        InvalidVersion,
        UnknownCodec,
        UnknownHash,
        InvalidLength,
        InvalidLengthPrefix,
    };

    struct CidError
    {
        CidErrorCode code {CidErrorCode::None};
        std::string  message {};
    };

    /// @brief Fixed-size multihash: a hash function code plus its 32-byte digest.
    struct Multihash
    {
        static constexpr UIntSize DigestSize = 32;

        MultihashCode                  code {MultihashCode::Sha2_256};
        std::array<Byte, DigestSize>   digest {};

        friend bool operator==(const Multihash&, const Multihash&) = default;
    };

    /// @brief Version 1 content identifier (https://dasl.ing/cid.html).
    ///
    /// Binary layout: version (0x01), codec, multihash code, digest length (0x20), digest.
    class DASL_API Cid
    {
    public:
        static constexpr UInt8    Version     = 1;
        static constexpr UIntSize EncodedSize = 4 + Multihash::DigestSize;

        constexpr Cid() noexcept = default;
        constexpr Cid(Codec codec, const Multihash& hash) noexcept
            : m_codec(codec), m_hash(hash)
        {
        }

        static DASL::Utilities::Expected<Cid, CidError> FromBytes(std::span<const Byte> bytes);

        /// @brief Parses the multibase base32-lower text form ("b" prefix).
        static DASL::Utilities::Expected<Cid, CidError> FromString(std::string_view text);

        [[nodiscard]] Codec            GetCodec() const noexcept { return m_codec; }
        [[nodiscard]] const Multihash& Hash() const noexcept { return m_hash; }

        [[nodiscard]] std::vector<Byte> ToBytes() const;
        [[nodiscard]] std::string       ToString() const;

        friend bool operator==(const Cid&, const Cid&) = default;

    private:
        Codec     m_codec {Codec::Raw};
        Multihash m_hash {};
    };

    [[nodiscard]] DASL_API const char* ToString(CidErrorCode code) noexcept;
}// namespace DASL::Cid
