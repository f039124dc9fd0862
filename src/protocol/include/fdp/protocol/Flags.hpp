// /////////////////////////////////////////////////////////////////////////////
/// @file Flags.hpp
/// @brief Bit-packed flag byte.
///
///     bit   7    6    5    4 3   2 1 0
///          res  ack  frag  enc   comp
///
/// Bit 7 is reserved: it survives every setter and every encode/decode
/// round trip but is never interpreted.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Types.hpp>
#include <fdp/protocol/Compression.hpp>
#include <fdp/protocol/Encryption.hpp>

namespace fdp::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class Flags
/// @brief Opaque single-byte wrapper. Each setter read-modify-writes its
///        own mask only; each getter masks its own bits before decoding.
// /////////////////////////////////////////////////////////////////////////////
class Flags
{
public:
    static constexpr core::u8 kCompressionMask  = 0b0000'0111;
    static constexpr core::u8 kEncryptionMask   = 0b0001'1000;
    static constexpr core::u8 kEncryptionShift  = 3;
    static constexpr core::u8 kFragmentedBit    = 0b0010'0000;
    static constexpr core::u8 kAckRequiredBit   = 0b0100'0000;
    static constexpr core::u8 kReservedBit      = 0b1000'0000;

    constexpr Flags() noexcept = default;

    /// @brief Wraps a byte read from the wire, reserved bit included.
    [[nodiscard]] static constexpr Flags fromRaw(core::u8 raw) noexcept
    {
        Flags f;
        f.bits_ = raw;
        return f;
    }

    [[nodiscard]] constexpr core::u8 raw() const noexcept { return bits_; }

    // --------------------------------------------------------------------- //
    //  Compression (bits 0-2)                                               //
    // --------------------------------------------------------------------- //

    constexpr Flags& setCompression(Compression compression) noexcept
    {
        bits_ = static_cast<core::u8>(
            (bits_ & ~kCompressionMask) | (toCode(compression) & kCompressionMask));
        return *this;
    }

    /// @brief Unnamed patterns 4-7 read back as Compression::None.
    [[nodiscard]] constexpr Compression compression() const noexcept
    {
        return compressionFromCode(bits_ & kCompressionMask).value_or(Compression::None);
    }

    // --------------------------------------------------------------------- //
    //  Encryption (bits 3-4)                                                //
    // --------------------------------------------------------------------- //

    constexpr Flags& setEncryption(EncryptionLevel level) noexcept
    {
        bits_ = static_cast<core::u8>(
            (bits_ & ~kEncryptionMask) | ((toCode(level) << kEncryptionShift) & kEncryptionMask));
        return *this;
    }

    /// @brief Pattern 3 reads back as EncryptionLevel::None.
    [[nodiscard]] constexpr EncryptionLevel encryption() const noexcept
    {
        return encryptionFromCode(static_cast<core::u8>((bits_ & kEncryptionMask) >> kEncryptionShift))
            .value_or(EncryptionLevel::None);
    }

    // --------------------------------------------------------------------- //
    //  Booleans                                                             //
    // --------------------------------------------------------------------- //

    /// @brief Marks the packet as one fragment of a larger message.
    constexpr Flags& setFragmented(bool fragmented) noexcept
    {
        return setBit(kFragmentedBit, fragmented);
    }

    [[nodiscard]] constexpr bool isFragmented() const noexcept { return (bits_ & kFragmentedBit) != 0; }

    /// @brief Sender expects an acknowledgement.
    constexpr Flags& setAckRequired(bool required) noexcept
    {
        return setBit(kAckRequiredBit, required);
    }

    [[nodiscard]] constexpr bool ackRequired() const noexcept { return (bits_ & kAckRequiredBit) != 0; }

    constexpr bool operator==(const Flags&) const noexcept = default;

private:
    constexpr Flags& setBit(core::u8 mask, bool on) noexcept
    {
        bits_ = on ? static_cast<core::u8>(bits_ | mask)
                   : static_cast<core::u8>(bits_ & ~mask);
        return *this;
    }

    core::u8 bits_{0};
};

static_assert(sizeof(Flags) == 1);

} // namespace fdp::protocol
