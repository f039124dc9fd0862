// /////////////////////////////////////////////////////////////////////////////
/// @file EntropySource.hpp
/// @brief Injectable source of random bytes for session-id generation.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Expected.hpp>
#include <fdp/core/Types.hpp>

#include <span>

namespace fdp::protocol {

// /////////////////////////////////////////////////////////////////////////////
/// @class IEntropySource
/// @brief Fills a buffer with random bytes.
///
/// Implementations must be safe to call from several threads at once.
// /////////////////////////////////////////////////////////////////////////////
class IEntropySource
{
public:
    virtual ~IEntropySource() = default;

    /// @brief Fills @p out entirely, or fails without a partial result.
    [[nodiscard]] virtual core::ExpectedVoid fill(std::span<core::u8> out) = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class OpenSslEntropySource
/// @brief CSPRNG backed by OpenSSL RAND_bytes.
// /////////////////////////////////////////////////////////////////////////////
class OpenSslEntropySource final : public IEntropySource
{
public:
    [[nodiscard]] core::ExpectedVoid fill(std::span<core::u8> out) override;
};

/// @brief Process-wide OpenSSL-backed source used by SessionId::generate().
[[nodiscard]] IEntropySource& defaultEntropySource() noexcept;

} // namespace fdp::protocol
