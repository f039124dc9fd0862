// /////////////////////////////////////////////////////////////////////////////
/// @file PacketCodec.hpp
/// @brief Stateless encode / decode / verify of FDP packets.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Types.hpp>
#include <fdp/protocol/Packet.hpp>
#include <fdp/protocol/PacketError.hpp>
#include <fdp/protocol/ProtocolConfig.hpp>

#include <span>
#include <vector>

namespace fdp::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class PacketCodec
/// @brief Pure byte transform bound to a ProtocolConfig.
///
/// Holds no mutable state: one codec may be shared by any number of
/// threads calling encode() and decode() concurrently.
// /////////////////////////////////////////////////////////////////////////////
class PacketCodec final
{
public:
    explicit PacketCodec(const ProtocolConfig& config = ProtocolConfig::defaults());

    /// @brief Serialises @p packet and appends a freshly computed hash.
    ///
    /// The stored @c packet.hash is ignored. Output is always
    /// packet.wireSize() bytes long.
    [[nodiscard]] std::vector<core::u8> encode(const Packet& packet) const;

    /// @brief Parses and validates an encoded packet.
    ///
    /// Checks run in a fixed order and the first failure is returned:
    /// kTooSmall, kTooLarge, kUnsupportedVersion, kInvalidIntent,
    /// kLengthMismatch, kInvalidHash.
    [[nodiscard]] PacketResult<Packet> decode(std::span<const core::u8> bytes) const;

    /// @brief Recomputes the hash of @p packet and compares it with the stored one.
    [[nodiscard]] static bool verify(const Packet& packet);

    [[nodiscard]] const ProtocolConfig& config() const noexcept { return config_; }

private:
    [[nodiscard]] PacketResult<Packet> decodeChecked(std::span<const core::u8> bytes) const;

    ProtocolConfig config_;
};

/// @brief encode() with the default configuration.
[[nodiscard]] std::vector<core::u8> encode(const Packet& packet);

/// @brief decode() with the default configuration.
[[nodiscard]] PacketResult<Packet> decode(std::span<const core::u8> bytes);

/// @brief Same as Packet::verify().
[[nodiscard]] bool verify(const Packet& packet);

} // namespace fdp::protocol
