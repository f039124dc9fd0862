// /////////////////////////////////////////////////////////////////////////////
/// @file Encryption.hpp
/// @brief Declared payload encryption level.
///
/// Like Compression, this is a declaration carried in the flag byte; the
/// cipher itself is applied, if at all, by a layer outside the codec.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Types.hpp>

#include <optional>
#include <string_view>

namespace fdp::protocol {

enum class EncryptionLevel : core::u8
{
    None     = 0x00,
    ChaCha20 = 0x01, ///< ChaCha20-Poly1305
    Aes256   = 0x02, ///< AES-256-GCM
};

[[nodiscard]] constexpr core::u8 toCode(EncryptionLevel level) noexcept
{
    return static_cast<core::u8>(level);
}

/// @return The matching level, or std::nullopt for codes 3 and above.
[[nodiscard]] constexpr std::optional<EncryptionLevel> encryptionFromCode(core::u8 code) noexcept
{
    switch (code)
    {
        case 0x00: return EncryptionLevel::None;
        case 0x01: return EncryptionLevel::ChaCha20;
        case 0x02: return EncryptionLevel::Aes256;
        default:   return std::nullopt;
    }
}

[[nodiscard]] constexpr std::string_view toString(EncryptionLevel level) noexcept
{
    switch (level)
    {
        case EncryptionLevel::None:     return "None";
        case EncryptionLevel::ChaCha20: return "ChaCha20";
        case EncryptionLevel::Aes256:   return "Aes256";
    }
    return "Unknown";
}

} // namespace fdp::protocol
