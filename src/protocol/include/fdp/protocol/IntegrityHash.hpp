// /////////////////////////////////////////////////////////////////////////////
/// @file IntegrityHash.hpp
/// @brief Incremental SHA-256 used for the packet integrity trailer.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/NonCopyable.hpp>
#include <fdp/core/Types.hpp>
#include <fdp/protocol/Constants.hpp>

#include <array>
#include <memory>
#include <span>

namespace fdp::protocol {

using Digest = std::array<core::u8, kHashSize>;

// /////////////////////////////////////////////////////////////////////////////
/// @class IntegrityHasher
/// @brief Owns one OpenSSL digest context. Not shared between threads;
///        each encode/decode call builds its own.
// /////////////////////////////////////////////////////////////////////////////
class IntegrityHasher final : public core::NonCopyable<IntegrityHasher>
{
public:
    IntegrityHasher();
    ~IntegrityHasher();

    IntegrityHasher(IntegrityHasher&&) noexcept;
    IntegrityHasher& operator=(IntegrityHasher&&) noexcept;

    /// @brief Feeds @p data into the running digest.
    IntegrityHasher& update(std::span<const core::u8> data);

    /// @brief Produces the digest and re-arms the context for reuse.
    [[nodiscard]] Digest finish();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

/// @brief One-shot SHA-256 of a contiguous buffer.
[[nodiscard]] Digest sha256(std::span<const core::u8> data);

/// @brief Constant-time digest comparison.
[[nodiscard]] bool digestEquals(const Digest& a, const Digest& b) noexcept;

} // namespace fdp::protocol
