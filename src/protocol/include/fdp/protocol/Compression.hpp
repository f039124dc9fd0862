// /////////////////////////////////////////////////////////////////////////////
/// @file Compression.hpp
/// @brief Declared payload compression algorithm.
///
/// The value is only a preference recorded in the flag byte. The codec
/// never compresses or decompresses anything.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Types.hpp>

#include <optional>
#include <string_view>

namespace fdp::protocol {

enum class Compression : core::u8
{
    None   = 0x00,
    Lz4    = 0x01,
    Zstd   = 0x02,
    Brotli = 0x03,
};

[[nodiscard]] constexpr core::u8 toCode(Compression compression) noexcept
{
    return static_cast<core::u8>(compression);
}

/// @return The matching algorithm, or std::nullopt for codes 4 and above.
[[nodiscard]] constexpr std::optional<Compression> compressionFromCode(core::u8 code) noexcept
{
    switch (code)
    {
        case 0x00: return Compression::None;
        case 0x01: return Compression::Lz4;
        case 0x02: return Compression::Zstd;
        case 0x03: return Compression::Brotli;
        default:   return std::nullopt;
    }
}

[[nodiscard]] constexpr std::string_view toString(Compression compression) noexcept
{
    switch (compression)
    {
        case Compression::None:   return "None";
        case Compression::Lz4:    return "Lz4";
        case Compression::Zstd:   return "Zstd";
        case Compression::Brotli: return "Brotli";
    }
    return "Unknown";
}

} // namespace fdp::protocol
