// /////////////////////////////////////////////////////////////////////////////
/// @file Packet.hpp
/// @brief The message record carried on the wire.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Types.hpp>
#include <fdp/protocol/Constants.hpp>
#include <fdp/protocol/Flags.hpp>
#include <fdp/protocol/IntegrityHash.hpp>
#include <fdp/protocol/Intent.hpp>
#include <fdp/protocol/PacketError.hpp>
#include <fdp/protocol/Priority.hpp>
#include <fdp/protocol/ProtocolConfig.hpp>
#include <fdp/protocol/SessionId.hpp>

#include <array>
#include <chrono>
#include <vector>

namespace fdp::protocol {

using Payload = std::vector<core::u8>;
using Header  = std::array<core::u8, kHeaderSize>;

// /////////////////////////////////////////////////////////////////////////////
/// @struct Packet
/// @brief Header fields, payload and integrity hash of one message.
///
/// A transient value object. Fields are public so the session layer can
/// assign @c sequence and tests can tamper with anything; verify() tells
/// whether @c hash still matches the current field values.
// /////////////////////////////////////////////////////////////////////////////
struct Packet
{
    using Clock = std::chrono::system_clock;

    core::u8  version{kProtocolVersion};
    SessionId sessionId{};
    Intent    intent{Intent::Ping};
    Priority  priority{Priority::normal()};
    Flags     flags{};
    core::u32 sequence{0};
    core::u64 timestamp{0}; ///< Milliseconds since the Unix epoch.
    Payload   payload{};
    Digest    hash{};

    /// @brief Builds a packet with the configured defaults.
    ///
    /// Priority and flags come from @p config, sequence is 0 and the
    /// timestamp is the current wall-clock time. The result is sealed;
    /// whoever changes a field afterwards must call seal() again.
    ///
    /// @return kPayloadTooLarge if @p payload exceeds config.maxPayloadSize().
    [[nodiscard]] static PacketResult<Packet> create(
        SessionId sessionId,
        Intent intent,
        Payload payload,
        const ProtocolConfig& config = ProtocolConfig::defaults());

    /// @brief Current wall-clock time in milliseconds since the epoch.
    [[nodiscard]] static core::u64 nowMillis() noexcept;

    /// @brief Serialises the 36-byte header from the current field values.
    /// @pre payload.size() <= kMaxPayloadSize.
    [[nodiscard]] Header headerBytes() const;

    /// @brief SHA-256 over headerBytes() followed by the payload.
    [[nodiscard]] Digest computeHash() const;

    /// @brief Stores computeHash() in @c hash.
    Packet& seal();

    /// @brief True when @c hash matches the current field values.
    [[nodiscard]] bool verify() const;

    /// @brief Encoded length: header + payload + hash.
    [[nodiscard]] core::usize wireSize() const noexcept { return kHeaderSize + payload.size() + kHashSize; }

    bool operator==(const Packet&) const = default;
};

} // namespace fdp::protocol
