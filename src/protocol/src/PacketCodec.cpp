// /////////////////////////////////////////////////////////////////////////////
/// @file PacketCodec.cpp
/// @brief PacketCodec implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <fdp/protocol/PacketCodec.hpp>
#include <fdp/protocol/WireBuffer.hpp>
#include <fdp/core/Log.hpp>

#include <algorithm>
#include <cstdio>
#include <string>

namespace fdp::protocol {

namespace {

std::string hexByte(core::u8 value)
{
    char buf[5];
    std::snprintf(buf, sizeof(buf), "0x%02x", value);
    return buf;
}

} // namespace

PacketCodec::PacketCodec(const ProtocolConfig& config)
    : config_{config}
{}

// -------------------------------------------------------------------------- //
//  Encode                                                                    //
// -------------------------------------------------------------------------- //

std::vector<core::u8> PacketCodec::encode(const Packet& packet) const
{
    const Header header = packet.headerBytes();

    IntegrityHasher hasher;
    hasher.update(header).update(packet.payload);
    const Digest digest = hasher.finish();

    WireWriter writer{packet.wireSize()};
    writer.writeBytes(header);
    writer.writeBytes(packet.payload);
    writer.writeBytes(digest);
    return writer.release();
}

// -------------------------------------------------------------------------- //
//  Decode                                                                    //
// -------------------------------------------------------------------------- //

PacketResult<Packet> PacketCodec::decode(std::span<const core::u8> bytes) const
{
    auto result = decodeChecked(bytes);
    if (!result.has_value() && config_.logRejections())
    {
        core::Log::debug("codec", result.error().format());
    }
    return result;
}

PacketResult<Packet> PacketCodec::decodeChecked(std::span<const core::u8> bytes) const
{
    if (bytes.size() < kMinPacketSize)
    {
        return makePacketError(PacketErrorCode::kTooSmall,
                               std::to_string(bytes.size()) + " bytes, minimum is " +
                               std::to_string(kMinPacketSize));
    }
    if (bytes.size() > config_.maxPacketSize())
    {
        return makePacketError(PacketErrorCode::kTooLarge,
                               std::to_string(bytes.size()) + " bytes, maximum is " +
                               std::to_string(config_.maxPacketSize()));
    }

    // From here on the fixed header is known to be in bounds, so the
    // reader cannot underflow until the payload is sliced.
    WireReader reader{bytes};
    Packet packet;

    packet.version = *reader.readU8();
    if (packet.version != kProtocolVersion)
    {
        return makePacketError(PacketErrorCode::kUnsupportedVersion, packet.version,
                               "version " + hexByte(packet.version) + " is not supported");
    }

    packet.sessionId = SessionId::fromBytes(
        reader.readBytes(kSessionIdSize)->first<kSessionIdSize>());

    const core::u8 intentCode = *reader.readU8();
    const auto intent = intentFromCode(intentCode);
    if (!intent)
    {
        return makePacketError(PacketErrorCode::kInvalidIntent, intentCode,
                               "intent byte " + hexByte(intentCode) + " is not defined");
    }
    packet.intent = *intent;

    packet.priority  = Priority{*reader.readU8()};
    packet.flags     = Flags::fromRaw(*reader.readU8());
    packet.sequence  = *reader.readU32();
    const core::u64 payloadLength = *reader.readU32();
    packet.timestamp = *reader.readU64();

    if (kHeaderSize + payloadLength + kHashSize != bytes.size())
    {
        return makePacketError(PacketErrorCode::kLengthMismatch,
                               "declared payload of " + std::to_string(payloadLength) +
                               " bytes does not fit a " + std::to_string(bytes.size()) +
                               "-byte packet");
    }

    auto payload = reader.readBytes(static_cast<core::usize>(payloadLength));
    auto trailer = reader.readBytes(kHashSize);
    if (!payload || !trailer)
    {
        // Guarded by the length check above.
        return makePacketError(PacketErrorCode::kLengthMismatch, "truncated packet body");
    }

    packet.payload.assign(payload->begin(), payload->end());
    std::copy(trailer->begin(), trailer->end(), packet.hash.begin());

    if (!packet.verify())
    {
        return makePacketError(PacketErrorCode::kInvalidHash, "integrity hash mismatch");
    }
    return packet;
}

// -------------------------------------------------------------------------- //
//  Verify                                                                    //
// -------------------------------------------------------------------------- //

bool PacketCodec::verify(const Packet& packet)
{
    return packet.verify();
}

std::vector<core::u8> encode(const Packet& packet)
{
    return PacketCodec{}.encode(packet);
}

PacketResult<Packet> decode(std::span<const core::u8> bytes)
{
    return PacketCodec{}.decode(bytes);
}

bool verify(const Packet& packet)
{
    return packet.verify();
}

} // namespace fdp::protocol
