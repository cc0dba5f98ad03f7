#pragma once

#include <openssl/bio.h>
#include <openssl/evp.h>

#include <memory>

namespace chunkvault::crypto::detail {

// RAII wrappers for OpenSSL handles
struct EVPCipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

struct EVPMDCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept {
        if (ctx) EVP_MD_CTX_free(ctx);
    }
};

struct EVPPKEYCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const noexcept {
        if (ctx) EVP_PKEY_CTX_free(ctx);
    }
};

struct EVPPKEYDeleter {
    void operator()(EVP_PKEY* key) const noexcept {
        if (key) EVP_PKEY_free(key);
    }
};

struct BIODeleter {
    void operator()(BIO* bio) const noexcept {
        if (bio) BIO_free(bio);
    }
};

using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, EVPCipherCtxDeleter>;
using UniqueMDCtx = std::unique_ptr<EVP_MD_CTX, EVPMDCtxDeleter>;
using UniquePKEYCtx = std::unique_ptr<EVP_PKEY_CTX, EVPPKEYCtxDeleter>;
using UniquePKEY = std::unique_ptr<EVP_PKEY, EVPPKEYDeleter>;
using UniqueBIO = std::unique_ptr<BIO, BIODeleter>;

}  // namespace chunkvault::crypto::detail
