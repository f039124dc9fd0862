/**
 * @file TestPacket.cpp
 * @brief Unit tests for Packet construction and integrity.
 */

#include <catch2/catch.hpp>

#include "fdp/protocol/Packet.hpp"

using namespace fdp;
using namespace fdp::protocol;

namespace {

SessionId sampleSession()
{
    SessionId::Bytes raw{};
    for (core::usize i = 0; i < raw.size(); ++i)
        raw[i] = static_cast<core::u8>(0x10 + i);
    return SessionId{raw};
}

} // namespace

TEST_CASE("Packet::create applies the protocol defaults", "[protocol][packet]")
{
    const auto before = Packet::nowMillis();
    auto packet = Packet::create(sampleSession(), Intent::Search, {'r', 'u', 's', 't'});
    const auto after = Packet::nowMillis();

    REQUIRE(packet.has_value());
    REQUIRE(packet->version == kProtocolVersion);
    REQUIRE(packet->sessionId == sampleSession());
    REQUIRE(packet->intent == Intent::Search);
    REQUIRE(packet->priority == Priority::normal());
    REQUIRE(packet->flags.compression() == Compression::Lz4);
    REQUIRE(packet->flags.encryption() == EncryptionLevel::ChaCha20);
    REQUIRE_FALSE(packet->flags.isFragmented());
    REQUIRE_FALSE(packet->flags.ackRequired());
    REQUIRE(packet->sequence == 0);
    REQUIRE(packet->timestamp >= before);
    REQUIRE(packet->timestamp <= after);
    REQUIRE(packet->payload.size() == 4);
    REQUIRE(packet->wireSize() == kHeaderSize + 4 + kHashSize);
}

TEST_CASE("Packet::create honours configured defaults", "[protocol][packet]")
{
    const auto cfg = ProtocolConfig::Builder{}
        .defaultPriority(Priority::critical())
        .defaultCompression(Compression::None)
        .defaultEncryption(EncryptionLevel::Aes256)
        .ackRequired(true)
        .build();

    auto packet = Packet::create(SessionId{}, Intent::Close, {}, cfg);
    REQUIRE(packet.has_value());
    REQUIRE(packet->priority == Priority::critical());
    REQUIRE(packet->flags.compression() == Compression::None);
    REQUIRE(packet->flags.encryption() == EncryptionLevel::Aes256);
    REQUIRE(packet->flags.ackRequired());
}

TEST_CASE("Packet::create rejects oversized payloads up front", "[protocol][packet]")
{
    SECTION("protocol maximum is accepted")
    {
        auto packet = Packet::create(SessionId{}, Intent::DataPush, Payload(kMaxPayloadSize));
        REQUIRE(packet.has_value());
    }

    SECTION("one byte over the maximum is refused")
    {
        auto packet = Packet::create(SessionId{}, Intent::DataPush, Payload(kMaxPayloadSize + 1));
        REQUIRE_FALSE(packet.has_value());
        REQUIRE(packet.error().code() == PacketErrorCode::kPayloadTooLarge);
    }

    SECTION("a tighter configured cap applies")
    {
        const auto cfg = ProtocolConfig::Builder{}.maxPayloadSize(16).build();
        REQUIRE(Packet::create(SessionId{}, Intent::DataPush, Payload(16), cfg).has_value());

        auto packet = Packet::create(SessionId{}, Intent::DataPush, Payload(17), cfg);
        REQUIRE_FALSE(packet.has_value());
        REQUIRE(packet.error().code() == PacketErrorCode::kPayloadTooLarge);
    }
}

TEST_CASE("Header bytes follow the fixed layout", "[protocol][packet]")
{
    Packet packet;
    packet.sessionId = sampleSession();
    packet.intent    = Intent::DataDelta;
    packet.priority  = Priority{7};
    packet.flags     = Flags::fromRaw(0xA5);
    packet.sequence  = 0x01020304u;
    packet.timestamp = 0x0000018C'AABBCCDDull;
    packet.payload   = {1, 2, 3};

    const Header h = packet.headerBytes();
    REQUIRE(h[0] == kProtocolVersion);
    REQUIRE(h[1] == 0x10);
    REQUIRE(h[16] == 0x1F);
    REQUIRE(h[17] == 0x22);
    REQUIRE(h[18] == 7);
    REQUIRE(h[19] == 0xA5);
    REQUIRE(h[20] == 0x01);
    REQUIRE(h[23] == 0x04);
    REQUIRE(h[24] == 0x00);
    REQUIRE(h[27] == 0x03);
    REQUIRE(h[28] == 0x00);
    REQUIRE(h[30] == 0x01);
    REQUIRE(h[31] == 0x8C);
    REQUIRE(h[35] == 0xDD);
}

TEST_CASE("Created packets verify until a field changes", "[protocol][packet]")
{
    auto created = Packet::create(sampleSession(), Intent::RankingUpdate, {9, 8, 7, 6});
    REQUIRE(created.has_value());
    Packet packet = *created;

    REQUIRE(packet.verify());

    SECTION("sequence")  { packet.sequence = 1;                   REQUIRE_FALSE(packet.verify()); }
    SECTION("priority")  { packet.priority = Priority::high();    REQUIRE_FALSE(packet.verify()); }
    SECTION("flags")     { packet.flags.setFragmented(true);      REQUIRE_FALSE(packet.verify()); }
    SECTION("intent")    { packet.intent = Intent::RankingRequest; REQUIRE_FALSE(packet.verify()); }
    SECTION("timestamp") { packet.timestamp += 1;                 REQUIRE_FALSE(packet.verify()); }
    SECTION("payload")   { packet.payload[2] ^= 0x01;             REQUIRE_FALSE(packet.verify()); }
    SECTION("hash")      { packet.hash[31] ^= 0x80;               REQUIRE_FALSE(packet.verify()); }
    SECTION("session")
    {
        packet.sessionId = SessionId{};
        REQUIRE_FALSE(packet.verify());
    }
}

TEST_CASE("Integrity hash is SHA-256 over header and payload", "[protocol][packet]")
{
    Packet packet;
    packet.payload = {0xCA, 0xFE};

    const Header header = packet.headerBytes();
    std::vector<core::u8> whole(header.begin(), header.end());
    whole.insert(whole.end(), packet.payload.begin(), packet.payload.end());

    REQUIRE(packet.computeHash() == sha256(whole));
}

TEST_CASE("sha256 matches a known vector", "[protocol][hash]")
{
    const std::vector<core::u8> abc = {'a', 'b', 'c'};
    const Digest expected = {
        0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde, 0x5d, 0xae, 0x22, 0x23,
        0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c, 0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad,
    };
    REQUIRE(sha256(abc) == expected);
    REQUIRE(digestEquals(sha256(abc), expected));

    IntegrityHasher hasher;
    hasher.update(std::span<const core::u8>{abc}.first(1)).update(std::span<const core::u8>{abc}.subspan(1));
    REQUIRE(hasher.finish() == expected);
    // The context is re-armed after finish().
    REQUIRE(hasher.update(abc).finish() == expected);
}

TEST_CASE("Header declares the full length of a maximum payload", "[protocol][packet]")
{
    auto created = Packet::create(sampleSession(), Intent::DataPush, Payload(kMaxPayloadSize, 0x01));
    REQUIRE(created.has_value());

    const Header h = created->headerBytes();
    REQUIRE(h[kPayloadLengthOffset + 0] == 0x00);
    REQUIRE(h[kPayloadLengthOffset + 1] == 0xA0);
    REQUIRE(h[kPayloadLengthOffset + 2] == 0x00);
    REQUIRE(h[kPayloadLengthOffset + 3] == 0x00);
}
