// /////////////////////////////////////////////////////////////////////////////
/// @file SessionId.cpp
/// @brief SessionId generation, reconstruction and hex formatting.
// /////////////////////////////////////////////////////////////////////////////

#include <fdp/protocol/SessionId.hpp>
#include <fdp/protocol/EntropySource.hpp>

#include <algorithm>

namespace fdp::protocol {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

constexpr int hexValue(char c) noexcept
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

core::Expected<SessionId> SessionId::generate(IEntropySource& source)
{
    Bytes bytes{};
    FDP_TRY_VOID(source.fill(bytes));
    return SessionId{bytes};
}

core::Expected<SessionId> SessionId::generate()
{
    return generate(defaultEntropySource());
}

SessionId SessionId::fromBytes(std::span<const core::u8, kSessionIdSize> bytes) noexcept
{
    Bytes copy{};
    std::copy(bytes.begin(), bytes.end(), copy.begin());
    return SessionId{copy};
}

core::Expected<SessionId> SessionId::fromHex(std::string_view hex)
{
    if (hex.size() != kSessionIdSize * 2)
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "session id must be 32 hex characters");
    }

    Bytes bytes{};
    for (core::usize i = 0; i < kSessionIdSize; ++i)
    {
        const int hi = hexValue(hex[2 * i]);
        const int lo = hexValue(hex[2 * i + 1]);
        if (hi < 0 || lo < 0)
        {
            return core::makeError(core::ErrorCode::kInvalidArgument,
                                   "session id contains a non-hex character");
        }
        bytes[i] = static_cast<core::u8>((hi << 4) | lo);
    }
    return SessionId{bytes};
}

std::string SessionId::toString() const
{
    std::string out;
    out.reserve(kSessionIdSize * 2);
    for (auto b : bytes_)
    {
        out.push_back(kHexDigits[b >> 4]);
        out.push_back(kHexDigits[b & 0x0F]);
    }
    return out;
}

} // namespace fdp::protocol
