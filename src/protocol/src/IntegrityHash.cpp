// /////////////////////////////////////////////////////////////////////////////
/// @file IntegrityHash.cpp
/// @brief SHA-256 through the OpenSSL EVP interface.
// /////////////////////////////////////////////////////////////////////////////

#include <fdp/protocol/IntegrityHash.hpp>
#include <fdp/core/Assert.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace fdp::protocol {

struct IntegrityHasher::Impl
{
    struct CtxDeleter
    {
        void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
    };

    std::unique_ptr<EVP_MD_CTX, CtxDeleter> ctx{EVP_MD_CTX_new()};

    void init()
    {
        // SHA-256 from the default provider only fails on allocation failure.
        FDP_VERIFY(ctx != nullptr);
        FDP_VERIFY(EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1);
    }
};

IntegrityHasher::IntegrityHasher()
    : impl_{std::make_unique<Impl>()}
{
    impl_->init();
}

IntegrityHasher::~IntegrityHasher() = default;

IntegrityHasher::IntegrityHasher(IntegrityHasher&&) noexcept = default;
IntegrityHasher& IntegrityHasher::operator=(IntegrityHasher&&) noexcept = default;

IntegrityHasher& IntegrityHasher::update(std::span<const core::u8> data)
{
    if (!data.empty())
    {
        FDP_VERIFY(EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) == 1);
    }
    return *this;
}

Digest IntegrityHasher::finish()
{
    Digest out{};
    unsigned int len = 0;
    FDP_VERIFY(EVP_DigestFinal_ex(impl_->ctx.get(), out.data(), &len) == 1);
    FDP_VERIFY(len == kHashSize);
    impl_->init();
    return out;
}

Digest sha256(std::span<const core::u8> data)
{
    return IntegrityHasher{}.update(data).finish();
}

bool digestEquals(const Digest& a, const Digest& b) noexcept
{
    return CRYPTO_memcmp(a.data(), b.data(), kHashSize) == 0;
}

} // namespace fdp::protocol
