// /////////////////////////////////////////////////////////////////////////////
/// @file PacketError.hpp
/// @brief Closed taxonomy of packet construction and decode failures.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Types.hpp>

#include <expected>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>

namespace fdp::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @enum PacketErrorCode
/// @brief Why a packet was refused. Decode reports the first applicable
///        code in declaration order (kTooSmall through kInvalidHash).
// /////////////////////////////////////////////////////////////////////////////
enum class PacketErrorCode : core::u8
{
    kTooSmall,
    kTooLarge,
    kUnsupportedVersion,
    kInvalidIntent,
    kLengthMismatch,
    kInvalidHash,
    kPayloadTooLarge,
};

[[nodiscard]] constexpr std::string_view packetErrorName(PacketErrorCode code) noexcept
{
    switch (code)
    {
        case PacketErrorCode::kTooSmall:           return "TooSmall";
        case PacketErrorCode::kTooLarge:           return "TooLarge";
        case PacketErrorCode::kUnsupportedVersion: return "UnsupportedVersion";
        case PacketErrorCode::kInvalidIntent:      return "InvalidIntent";
        case PacketErrorCode::kLengthMismatch:     return "LengthMismatch";
        case PacketErrorCode::kInvalidHash:        return "InvalidHash";
        case PacketErrorCode::kPayloadTooLarge:    return "PayloadTooLarge";
    }
    return "Unknown";
}

// /////////////////////////////////////////////////////////////////////////////
/// @class PacketError
/// @brief Failure value returned by Packet::create() and decode().
///
/// kUnsupportedVersion and kInvalidIntent carry the offending wire byte.
// /////////////////////////////////////////////////////////////////////////////
class PacketError final
{
public:
    explicit PacketError(
        PacketErrorCode code,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : code_{code}, message_{std::move(message)}, location_{loc} {}

    PacketError(
        PacketErrorCode code,
        core::u8 offendingByte,
        std::string message,
        std::source_location loc = std::source_location::current()
    ) : code_{code}, offendingByte_{offendingByte}, message_{std::move(message)}, location_{loc} {}

    [[nodiscard]] PacketErrorCode         code()          const noexcept { return code_; }
    [[nodiscard]] std::optional<core::u8> offendingByte() const noexcept { return offendingByte_; }
    [[nodiscard]] const std::string&      message()       const noexcept { return message_; }
    [[nodiscard]] std::source_location    location()      const noexcept { return location_; }

    /// @brief Formats the error as "[Code] message (file:line)".
    [[nodiscard]] std::string format() const;

private:
    PacketErrorCode         code_;
    std::optional<core::u8> offendingByte_;
    std::string             message_;
    std::source_location    location_;
};

template <typename T>
using PacketResult = std::expected<T, PacketError>;

[[nodiscard]] inline auto makePacketError(
    PacketErrorCode code,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<PacketError>(PacketError{code, std::move(message), loc});
}

[[nodiscard]] inline auto makePacketError(
    PacketErrorCode code,
    core::u8 offendingByte,
    std::string message,
    std::source_location loc = std::source_location::current())
{
    return std::unexpected<PacketError>(PacketError{code, offendingByte, std::move(message), loc});
}

} // namespace fdp::protocol
