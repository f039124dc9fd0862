// /////////////////////////////////////////////////////////////////////////////
/// @file Intent.hpp
/// @brief Semantic operation codes carried by every packet.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Types.hpp>

#include <optional>
#include <string_view>

namespace fdp::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @enum Intent
/// @brief What the sender wants the receiver to do.
///
/// Codes are grouped by category in the high nibble. Bytes outside this
/// set are not intents; intentFromCode() reports them as std::nullopt.
// /////////////////////////////////////////////////////////////////////////////
enum class Intent : core::u8
{
    // Control
    Ping            = 0x01,
    Pong            = 0x02,
    HandshakeInit   = 0x03,
    HandshakeAck    = 0x04,
    Close           = 0x05,

    // Search
    Search          = 0x10,
    SearchSuggest   = 0x11,
    FetchDocument   = 0x12,
    SearchStream    = 0x13,

    // Data sync
    DataRequest     = 0x20,
    DataPush        = 0x21,
    DataDelta       = 0x22,
    DataVerify      = 0x23,

    // Ranking & personalisation
    RankingUpdate   = 0x30,
    RankingRequest  = 0x31,

    // Edge cache
    CacheQuery      = 0x40,
    CacheInvalidate = 0x41,

    // Status
    Error           = 0xF0,
    Success         = 0xF1,
};

/// @brief Coarse grouping used by dispatchers to route intents.
enum class IntentCategory : core::u8
{
    Control,
    Search,
    DataSync,
    Ranking,
    Cache,
    Status
};

/// @brief Returns the wire byte for @p intent.
[[nodiscard]] constexpr core::u8 toCode(Intent intent) noexcept
{
    return static_cast<core::u8>(intent);
}

/// @brief Maps a wire byte back to an Intent.
/// @return The matching intent, or std::nullopt for an undefined byte.
[[nodiscard]] constexpr std::optional<Intent> intentFromCode(core::u8 code) noexcept
{
    switch (code)
    {
        case 0x01: return Intent::Ping;
        case 0x02: return Intent::Pong;
        case 0x03: return Intent::HandshakeInit;
        case 0x04: return Intent::HandshakeAck;
        case 0x05: return Intent::Close;
        case 0x10: return Intent::Search;
        case 0x11: return Intent::SearchSuggest;
        case 0x12: return Intent::FetchDocument;
        case 0x13: return Intent::SearchStream;
        case 0x20: return Intent::DataRequest;
        case 0x21: return Intent::DataPush;
        case 0x22: return Intent::DataDelta;
        case 0x23: return Intent::DataVerify;
        case 0x30: return Intent::RankingUpdate;
        case 0x31: return Intent::RankingRequest;
        case 0x40: return Intent::CacheQuery;
        case 0x41: return Intent::CacheInvalidate;
        case 0xF0: return Intent::Error;
        case 0xF1: return Intent::Success;
        default:   return std::nullopt;
    }
}

/// @brief Returns the category an intent belongs to.
[[nodiscard]] constexpr IntentCategory categoryOf(Intent intent) noexcept
{
    switch (toCode(intent) & 0xF0u)
    {
        case 0x00: return IntentCategory::Control;
        case 0x10: return IntentCategory::Search;
        case 0x20: return IntentCategory::DataSync;
        case 0x30: return IntentCategory::Ranking;
        case 0x40: return IntentCategory::Cache;
        default:   return IntentCategory::Status;
    }
}

[[nodiscard]] std::string_view toString(Intent intent) noexcept;
[[nodiscard]] std::string_view toString(IntentCategory category) noexcept;

} // namespace fdp::protocol
