/**
 * @file TestFlags.cpp
 * @brief Unit tests for the packed flag byte.
 */

#include <catch2/catch.hpp>

#include "fdp/protocol/Flags.hpp"

using namespace fdp::protocol;

TEST_CASE("Default flags are all clear", "[protocol][flags]")
{
    const Flags flags;
    REQUIRE(flags.raw() == 0);
    REQUIRE(flags.compression() == Compression::None);
    REQUIRE(flags.encryption() == EncryptionLevel::None);
    REQUIRE_FALSE(flags.isFragmented());
    REQUIRE_FALSE(flags.ackRequired());
}

TEST_CASE("Sub-fields land on their documented bits", "[protocol][flags]")
{
    REQUIRE(Flags{}.setCompression(Compression::Brotli).raw() == 0b0000'0011);
    REQUIRE(Flags{}.setEncryption(EncryptionLevel::Aes256).raw() == 0b0001'0000);
    REQUIRE(Flags{}.setFragmented(true).raw() == 0b0010'0000);
    REQUIRE(Flags{}.setAckRequired(true).raw() == 0b0100'0000);
}

TEST_CASE("Setters do not disturb other sub-fields", "[protocol][flags]")
{
    Flags flags;
    flags.setCompression(Compression::Zstd);
    flags.setEncryption(EncryptionLevel::ChaCha20);
    flags.setFragmented(true);
    flags.setAckRequired(true);

    REQUIRE(flags.compression() == Compression::Zstd);
    REQUIRE(flags.encryption() == EncryptionLevel::ChaCha20);
    REQUIRE(flags.isFragmented());
    REQUIRE(flags.ackRequired());

    SECTION("reverse order gives the same byte")
    {
        Flags other;
        other.setAckRequired(true);
        other.setFragmented(true);
        other.setEncryption(EncryptionLevel::ChaCha20);
        other.setCompression(Compression::Zstd);
        REQUIRE(other == flags);
    }

    SECTION("overwriting one field keeps the rest")
    {
        flags.setCompression(Compression::None);
        REQUIRE(flags.compression() == Compression::None);
        REQUIRE(flags.encryption() == EncryptionLevel::ChaCha20);
        REQUIRE(flags.isFragmented());
        REQUIRE(flags.ackRequired());

        flags.setFragmented(false);
        REQUIRE_FALSE(flags.isFragmented());
        REQUIRE(flags.ackRequired());
        REQUIRE(flags.encryption() == EncryptionLevel::ChaCha20);
    }
}

TEST_CASE("Every combination reads back exactly", "[protocol][flags]")
{
    const Compression comps[] = {Compression::None, Compression::Lz4, Compression::Zstd, Compression::Brotli};
    const EncryptionLevel encs[] = {EncryptionLevel::None, EncryptionLevel::ChaCha20, EncryptionLevel::Aes256};

    for (auto c : comps)
        for (auto e : encs)
            for (bool frag : {false, true})
                for (bool ack : {false, true})
                {
                    Flags flags = Flags::fromRaw(0xFF);
                    flags.setCompression(c).setEncryption(e).setFragmented(frag).setAckRequired(ack);

                    REQUIRE(flags.compression() == c);
                    REQUIRE(flags.encryption() == e);
                    REQUIRE(flags.isFragmented() == frag);
                    REQUIRE(flags.ackRequired() == ack);
                    REQUIRE((flags.raw() & Flags::kReservedBit) != 0);
                }
}

TEST_CASE("Reserved bit survives every setter", "[protocol][flags]")
{
    Flags flags = Flags::fromRaw(Flags::kReservedBit);
    flags.setCompression(Compression::Lz4)
         .setEncryption(EncryptionLevel::Aes256)
         .setFragmented(true)
         .setAckRequired(true)
         .setFragmented(false)
         .setAckRequired(false)
         .setCompression(Compression::None)
         .setEncryption(EncryptionLevel::None);

    REQUIRE(flags.raw() == Flags::kReservedBit);
}

TEST_CASE("Unnamed patterns fall back to None", "[protocol][flags]")
{
    for (fdp::core::u8 pattern = 4; pattern < 8; ++pattern)
    {
        REQUIRE(Flags::fromRaw(pattern).compression() == Compression::None);
    }
    REQUIRE(Flags::fromRaw(0b0001'1000).encryption() == EncryptionLevel::None);

    // Neighbouring bits set to 1 must not leak into the getters.
    REQUIRE(Flags::fromRaw(0b1111'1001).compression() == Compression::Lz4);
    REQUIRE(Flags::fromRaw(0b1110'1111).encryption() == EncryptionLevel::ChaCha20);
}
