// /////////////////////////////////////////////////////////////////////////////
/// @file Packet.cpp
/// @brief Packet construction and integrity.
// /////////////////////////////////////////////////////////////////////////////

#include <fdp/protocol/Packet.hpp>
#include <fdp/protocol/WireBuffer.hpp>
#include <fdp/core/Assert.hpp>

#include <algorithm>
#include <string>

namespace fdp::protocol {

PacketResult<Packet> Packet::create(SessionId sessionId, Intent intent, Payload payload,
                                    const ProtocolConfig& config)
{
    if (payload.size() > config.maxPayloadSize())
    {
        return makePacketError(PacketErrorCode::kPayloadTooLarge,
                               "payload of " + std::to_string(payload.size()) +
                               " bytes exceeds limit of " + std::to_string(config.maxPayloadSize()));
    }

    Packet packet;
    packet.sessionId = sessionId;
    packet.intent    = intent;
    packet.priority  = config.defaultPriority();
    packet.flags.setCompression(config.defaultCompression())
                .setEncryption(config.defaultEncryption())
                .setAckRequired(config.ackRequired());
    packet.timestamp = nowMillis();
    packet.payload   = std::move(payload);
    packet.seal();
    return packet;
}

core::u64 Packet::nowMillis() noexcept
{
    const auto sinceEpoch = Clock::now().time_since_epoch();
    return static_cast<core::u64>(
        std::chrono::duration_cast<std::chrono::milliseconds>(sinceEpoch).count());
}

Header Packet::headerBytes() const
{
    FDP_ASSERT(payload.size() <= kMaxPayloadSize);

    WireWriter writer{kHeaderSize};
    writer.writeU8(version);
    writer.writeBytes(sessionId.bytes());
    writer.writeU8(toCode(intent));
    writer.writeU8(priority.value());
    writer.writeU8(flags.raw());
    writer.writeU32(sequence);
    writer.writeU32(static_cast<core::u32>(payload.size()));
    writer.writeU64(timestamp);
    FDP_ASSERT(writer.size() == kHeaderSize);

    Header out{};
    std::copy_n(writer.data().begin(), kHeaderSize, out.begin());
    return out;
}

Digest Packet::computeHash() const
{
    const Header header = headerBytes();
    return IntegrityHasher{}.update(header).update(payload).finish();
}

Packet& Packet::seal()
{
    hash = computeHash();
    return *this;
}

bool Packet::verify() const
{
    return digestEquals(computeHash(), hash);
}

} // namespace fdp::protocol
