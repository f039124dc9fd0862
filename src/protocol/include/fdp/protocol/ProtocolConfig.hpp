// /////////////////////////////////////////////////////////////////////////////
/// @file ProtocolConfig.hpp
/// @brief Codec configuration (Builder pattern).
///
/// Immutable configuration object constructed via a fluent Builder. The
/// protocol version is fixed and deliberately absent from it.
// /////////////////////////////////////////////////////////////////////////////
#pragma once

#include <fdp/core/Types.hpp>
#include <fdp/protocol/Compression.hpp>
#include <fdp/protocol/Constants.hpp>
#include <fdp/protocol/Encryption.hpp>
#include <fdp/protocol/Priority.hpp>

namespace fdp::protocol {

/// @brief Immutable codec configuration.
class ProtocolConfig
{
public:
    /// @brief Fluent builder for ProtocolConfig.
    class Builder
    {
    public:
        /// @brief Caps accepted payloads; values above kMaxPayloadSize are clamped.
        Builder& maxPayloadSize(core::usize bytes) noexcept;
        Builder& defaultPriority(Priority priority) noexcept;
        Builder& defaultCompression(Compression compression) noexcept;
        Builder& defaultEncryption(EncryptionLevel level) noexcept;
        Builder& ackRequired(bool enabled) noexcept;
        Builder& logRejections(bool enabled) noexcept;

        [[nodiscard]] ProtocolConfig build() const noexcept;

    private:
        core::usize     maxPayloadSize_{kMaxPayloadSize};
        Priority        defaultPriority_{Priority::normal()};
        Compression     defaultCompression_{Compression::Lz4};
        EncryptionLevel defaultEncryption_{EncryptionLevel::ChaCha20};
        bool            ackRequired_{false};
        bool            logRejections_{true};
    };

    /// @brief The configuration used by the free encode/decode functions.
    [[nodiscard]] static const ProtocolConfig& defaults() noexcept;

    [[nodiscard]] core::usize     maxPayloadSize()     const noexcept { return maxPayloadSize_; }
    [[nodiscard]] core::usize     maxPacketSize()      const noexcept { return kHeaderSize + maxPayloadSize_ + kHashSize; }
    [[nodiscard]] Priority        defaultPriority()    const noexcept { return defaultPriority_; }
    [[nodiscard]] Compression     defaultCompression() const noexcept { return defaultCompression_; }
    [[nodiscard]] EncryptionLevel defaultEncryption()  const noexcept { return defaultEncryption_; }
    [[nodiscard]] bool            ackRequired()        const noexcept { return ackRequired_; }
    [[nodiscard]] bool            logRejections()      const noexcept { return logRejections_; }

private:
    friend class Builder;

    core::usize     maxPayloadSize_{kMaxPayloadSize};
    Priority        defaultPriority_{Priority::normal()};
    Compression     defaultCompression_{Compression::Lz4};
    EncryptionLevel defaultEncryption_{EncryptionLevel::ChaCha20};
    bool            ackRequired_{false};
    bool            logRejections_{true};
};

} // namespace fdp::protocol
