// /////////////////////////////////////////////////////////////////////////////
/// @file SessionId.hpp
/// @brief 128-bit identifier scoping a logical connection.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Expected.hpp>
#include <fdp/core/Types.hpp>
#include <fdp/protocol/Constants.hpp>

#include <array>
#include <cstring>
#include <functional>
#include <span>
#include <string>
#include <string_view>

namespace fdp::protocol {

class IEntropySource;

// /////////////////////////////////////////////////////////////////////////////
/// @class SessionId
/// @brief Opaque 16-byte value; equality and hashing use the raw bits,
///        display is 32 lowercase hex characters.
// /////////////////////////////////////////////////////////////////////////////
class SessionId
{
public:
    using Bytes = std::array<core::u8, kSessionIdSize>;

    /// @brief The all-zero id.
    constexpr SessionId() noexcept = default;
    constexpr explicit SessionId(const Bytes& bytes) noexcept : bytes_{bytes} {}

    /// @brief Draws 16 bytes from @p source.
    [[nodiscard]] static core::Expected<SessionId> generate(IEntropySource& source);

    /// @brief Draws 16 bytes from the process-wide OpenSSL source.
    [[nodiscard]] static core::Expected<SessionId> generate();

    /// @brief Reconstructs an id byte-for-byte from stored bytes.
    [[nodiscard]] static SessionId fromBytes(std::span<const core::u8, kSessionIdSize> bytes) noexcept;

    /// @brief Parses the 32-character hex form produced by toString().
    [[nodiscard]] static core::Expected<SessionId> fromHex(std::string_view hex);

    [[nodiscard]] constexpr const Bytes& bytes() const noexcept { return bytes_; }

    [[nodiscard]] std::string toString() const;

    [[nodiscard]] constexpr bool isNil() const noexcept
    {
        for (auto b : bytes_)
            if (b != 0)
                return false;
        return true;
    }

    constexpr bool operator==(const SessionId&) const noexcept = default;

private:
    Bytes bytes_{};
};

} // namespace fdp::protocol

template <>
struct std::hash<fdp::protocol::SessionId>
{
    std::size_t operator()(const fdp::protocol::SessionId& id) const noexcept
    {
        fdp::core::u64 hi = 0;
        fdp::core::u64 lo = 0;
        std::memcpy(&hi, id.bytes().data(), sizeof(hi));
        std::memcpy(&lo, id.bytes().data() + sizeof(hi), sizeof(lo));
        return static_cast<std::size_t>(hi ^ (lo + 0x9E3779B97F4A7C15ULL + (hi << 6) + (hi >> 2)));
    }
};
