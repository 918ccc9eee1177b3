/**
 * @file OpenSSLRAII.hpp
 * @brief Owning handles for the OpenSSL EVP contexts used by the crypto layer
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * @code
 * CipherCtx ctx(EVP_CIPHER_CTX_new());
 * if (!ctx) {
 *     return ErrorCode::CryptoError;
 * }
 * EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr);
 * @endcode
 */

#pragma once

#ifndef WARDEN_CRYPTO_OPENSSL_RAII_HPP
#define WARDEN_CRYPTO_OPENSSL_RAII_HPP

#include <openssl/err.h>
#include <openssl/evp.h>

#include <memory>
#include <string>

namespace Warden::Crypto {

/// Deleter that forwards to an OpenSSL *_free function
template<auto FreeFn>
struct OpenSSLFree {
    template<typename T>
    void operator()(T* ptr) const noexcept {
        FreeFn(ptr);
    }
};

using CipherCtx = std::unique_ptr<EVP_CIPHER_CTX, OpenSSLFree<&EVP_CIPHER_CTX_free>>;
using DigestCtx = std::unique_ptr<EVP_MD_CTX, OpenSSLFree<&EVP_MD_CTX_free>>;

/**
 * @brief Drain the thread's OpenSSL error queue into one line
 *
 * Returns "unknown OpenSSL error" when the queue is empty. The queue is
 * always left empty so stale entries cannot leak into a later report.
 */
inline std::string drainOpenSSLErrors() {
    std::string joined;
    char buffer[256];
    for (unsigned long code = ERR_get_error(); code != 0; code = ERR_get_error()) {
        ERR_error_string_n(code, buffer, sizeof(buffer));
        if (!joined.empty()) {
            joined += "; ";
        }
        joined += buffer;
    }
    return joined.empty() ? "unknown OpenSSL error" : joined;
}

} // namespace Warden::Crypto

#endif // WARDEN_CRYPTO_OPENSSL_RAII_HPP
