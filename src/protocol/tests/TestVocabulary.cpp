/**
 * @file TestVocabulary.cpp
 * @brief Unit tests for Intent, Compression, EncryptionLevel and Priority.
 */

#include <catch2/catch.hpp>

#include "fdp/protocol/Compression.hpp"
#include "fdp/protocol/Encryption.hpp"
#include "fdp/protocol/Intent.hpp"
#include "fdp/protocol/Priority.hpp"

#include <array>

using namespace fdp::protocol;

namespace {

constexpr std::array kAllIntents = {
    Intent::Ping, Intent::Pong, Intent::HandshakeInit, Intent::HandshakeAck, Intent::Close,
    Intent::Search, Intent::SearchSuggest, Intent::FetchDocument, Intent::SearchStream,
    Intent::DataRequest, Intent::DataPush, Intent::DataDelta, Intent::DataVerify,
    Intent::RankingUpdate, Intent::RankingRequest,
    Intent::CacheQuery, Intent::CacheInvalidate,
    Intent::Error, Intent::Success,
};

} // namespace

TEST_CASE("Intent codes map back to the same intent", "[protocol][intent]")
{
    for (auto intent : kAllIntents)
    {
        const auto back = intentFromCode(toCode(intent));
        REQUIRE(back.has_value());
        REQUIRE(*back == intent);
    }
}

TEST_CASE("Every defined byte decodes and every other byte does not", "[protocol][intent]")
{
    int defined = 0;
    for (unsigned b = 0; b <= 0xFF; ++b)
    {
        const auto intent = intentFromCode(static_cast<fdp::core::u8>(b));
        if (intent)
        {
            ++defined;
            REQUIRE(toCode(*intent) == b);
        }
    }
    REQUIRE(defined == static_cast<int>(kAllIntents.size()));

    REQUIRE_FALSE(intentFromCode(0x00).has_value());
    REQUIRE_FALSE(intentFromCode(0x06).has_value());
    REQUIRE_FALSE(intentFromCode(0x7F).has_value());
    REQUIRE_FALSE(intentFromCode(0xFF).has_value());
}

TEST_CASE("Intent codes match the wire table", "[protocol][intent]")
{
    STATIC_REQUIRE(toCode(Intent::Ping) == 0x01);
    STATIC_REQUIRE(toCode(Intent::Search) == 0x10);
    STATIC_REQUIRE(toCode(Intent::DataPush) == 0x21);
    STATIC_REQUIRE(toCode(Intent::RankingRequest) == 0x31);
    STATIC_REQUIRE(toCode(Intent::CacheInvalidate) == 0x41);
    STATIC_REQUIRE(toCode(Intent::Success) == 0xF1);
}

TEST_CASE("Intents are grouped by category", "[protocol][intent]")
{
    REQUIRE(categoryOf(Intent::HandshakeAck) == IntentCategory::Control);
    REQUIRE(categoryOf(Intent::SearchStream) == IntentCategory::Search);
    REQUIRE(categoryOf(Intent::DataVerify) == IntentCategory::DataSync);
    REQUIRE(categoryOf(Intent::RankingUpdate) == IntentCategory::Ranking);
    REQUIRE(categoryOf(Intent::CacheQuery) == IntentCategory::Cache);
    REQUIRE(categoryOf(Intent::Error) == IntentCategory::Status);

    REQUIRE(toString(Intent::FetchDocument) == "FetchDocument");
    REQUIRE(toString(IntentCategory::DataSync) == "DataSync");
}

TEST_CASE("Compression and encryption codes are partial bijections", "[protocol][vocabulary]")
{
    for (unsigned b = 0; b < 8; ++b)
    {
        const auto c = compressionFromCode(static_cast<fdp::core::u8>(b));
        REQUIRE(c.has_value() == (b < 4));
        if (c)
            REQUIRE(toCode(*c) == b);
    }
    for (unsigned b = 0; b < 4; ++b)
    {
        const auto e = encryptionFromCode(static_cast<fdp::core::u8>(b));
        REQUIRE(e.has_value() == (b < 3));
        if (e)
            REQUIRE(toCode(*e) == b);
    }

    REQUIRE(toCode(Compression::Lz4) == 0x01);
    REQUIRE(compressionFromCode(0x02) == Compression::Zstd);
    REQUIRE(toString(EncryptionLevel::Aes256) == "Aes256");
}

TEST_CASE("Priority orders by raw value", "[protocol][priority]")
{
    STATIC_REQUIRE(Priority::critical() > Priority::high());
    STATIC_REQUIRE(Priority::high() > Priority::normal());
    STATIC_REQUIRE(Priority::normal() > Priority::low());
    STATIC_REQUIRE(Priority::low() > Priority::lowest());

    REQUIRE(Priority{}.value() == 128);
    REQUIRE(Priority{65} > Priority::low());
    REQUIRE(Priority{200} < Priority::critical());
}
