// /////////////////////////////////////////////////////////////////////////////
/// @file EntropySource.cpp
/// @brief OpenSSL-backed entropy source.
// /////////////////////////////////////////////////////////////////////////////

#include <fdp/protocol/EntropySource.hpp>
#include <fdp/core/Log.hpp>

#include <openssl/err.h>
#include <openssl/rand.h>

#include <climits>
#include <string>

namespace fdp::protocol {

core::ExpectedVoid OpenSslEntropySource::fill(std::span<core::u8> out)
{
    if (out.empty())
        return {};

    if (out.size() > static_cast<core::usize>(INT_MAX))
    {
        return core::makeError(core::ErrorCode::kInvalidArgument,
                               "entropy request exceeds RAND_bytes limit");
    }

    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1)
    {
        char reason[256] = {};
        ERR_error_string_n(ERR_get_error(), reason, sizeof(reason));
        core::Log::error("entropy", reason);
        return core::makeError(core::ErrorCode::kEntropyUnavailable,
                               std::string{"RAND_bytes failed: "} + reason);
    }
    return {};
}

IEntropySource& defaultEntropySource() noexcept
{
    static OpenSslEntropySource source;
    return source;
}

} // namespace fdp::protocol
