// /////////////////////////////////////////////////////////////////////////////
/// @file Intent.cpp
/// @brief Display names for intents and intent categories.
// /////////////////////////////////////////////////////////////////////////////

#include <fdp/protocol/Intent.hpp>

namespace fdp::protocol {

std::string_view toString(Intent intent) noexcept
{
    switch (intent)
    {
        case Intent::Ping:            return "Ping";
        case Intent::Pong:            return "Pong";
        case Intent::HandshakeInit:   return "HandshakeInit";
        case Intent::HandshakeAck:    return "HandshakeAck";
        case Intent::Close:           return "Close";
        case Intent::Search:          return "Search";
        case Intent::SearchSuggest:   return "SearchSuggest";
        case Intent::FetchDocument:   return "FetchDocument";
        case Intent::SearchStream:    return "SearchStream";
        case Intent::DataRequest:     return "DataRequest";
        case Intent::DataPush:        return "DataPush";
        case Intent::DataDelta:       return "DataDelta";
        case Intent::DataVerify:      return "DataVerify";
        case Intent::RankingUpdate:   return "RankingUpdate";
        case Intent::RankingRequest:  return "RankingRequest";
        case Intent::CacheQuery:      return "CacheQuery";
        case Intent::CacheInvalidate: return "CacheInvalidate";
        case Intent::Error:           return "Error";
        case Intent::Success:         return "Success";
    }
    return "Unknown";
}

std::string_view toString(IntentCategory category) noexcept
{
    switch (category)
    {
        case IntentCategory::Control:  return "Control";
        case IntentCategory::Search:   return "Search";
        case IntentCategory::DataSync: return "DataSync";
        case IntentCategory::Ranking:  return "Ranking";
        case IntentCategory::Cache:    return "Cache";
        case IntentCategory::Status:   return "Status";
    }
    return "Unknown";
}

} // namespace fdp::protocol
