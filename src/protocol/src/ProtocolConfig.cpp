// /////////////////////////////////////////////////////////////////////////////
/// @file ProtocolConfig.cpp
/// @brief ProtocolConfig::Builder implementation.
// /////////////////////////////////////////////////////////////////////////////

#include <fdp/protocol/ProtocolConfig.hpp>

#include <algorithm>

namespace fdp::protocol {

ProtocolConfig::Builder& ProtocolConfig::Builder::maxPayloadSize(core::usize bytes) noexcept
{
    maxPayloadSize_ = std::min(bytes, kMaxPayloadSize);
    return *this;
}

ProtocolConfig::Builder& ProtocolConfig::Builder::defaultPriority(Priority priority) noexcept
{
    defaultPriority_ = priority;
    return *this;
}

ProtocolConfig::Builder& ProtocolConfig::Builder::defaultCompression(Compression compression) noexcept
{
    defaultCompression_ = compression;
    return *this;
}

ProtocolConfig::Builder& ProtocolConfig::Builder::defaultEncryption(EncryptionLevel level) noexcept
{
    defaultEncryption_ = level;
    return *this;
}

ProtocolConfig::Builder& ProtocolConfig::Builder::ackRequired(bool enabled) noexcept
{
    ackRequired_ = enabled;
    return *this;
}

ProtocolConfig::Builder& ProtocolConfig::Builder::logRejections(bool enabled) noexcept
{
    logRejections_ = enabled;
    return *this;
}

ProtocolConfig ProtocolConfig::Builder::build() const noexcept
{
    ProtocolConfig cfg;
    cfg.maxPayloadSize_     = maxPayloadSize_;
    cfg.defaultPriority_    = defaultPriority_;
    cfg.defaultCompression_ = defaultCompression_;
    cfg.defaultEncryption_  = defaultEncryption_;
    cfg.ackRequired_        = ackRequired_;
    cfg.logRejections_      = logRejections_;
    return cfg;
}

const ProtocolConfig& ProtocolConfig::defaults() noexcept
{
    static const ProtocolConfig kDefaults = Builder{}.build();
    return kDefaults;
}

} // namespace fdp::protocol
