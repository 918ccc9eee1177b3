/**
 * @file AESCipher.cpp
 * @brief AES-256-GCM sealing for credential fields
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * Tag verification happens inside EVP_DecryptFinal_ex. Plaintext decrypted
 * before a failed verification is wiped and never returned.
 */

#include <Warden/Core/Crypto.hpp>
#include <Warden/Core/Crypto/OpenSSLRAII.hpp>
#include <Warden/Core/Logger.hpp>

#include <climits>

namespace Warden::Crypto {

namespace {

enum class Direction { Seal, Open };

bool fitsInt(size_t size) noexcept {
    return size <= static_cast<size_t>(INT_MAX);
}

/// Cipher context keyed for one message, with the associated data absorbed
Result<CipherCtx> startGcm(Direction direction, const AESKey& key, const AESNonce& nonce,
                           ByteSpan associatedData) {
    const ErrorCode failure =
        direction == Direction::Seal ? ErrorCode::EncryptionFailed : ErrorCode::DecryptionFailed;
    const int encrypt = direction == Direction::Seal ? 1 : 0;

    CipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return ErrorCode::CryptoError;
    }

    int unused = 0;
    const bool ready =
        EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, encrypt) == 1 &&
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(nonce.size()), nullptr) == 1 &&
        EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), encrypt) == 1 &&
        (associatedData.empty() ||
         EVP_CipherUpdate(ctx.get(), nullptr, &unused, associatedData.data(),
                          static_cast<int>(associatedData.size())) == 1);
    if (!ready) {
        const std::string reason = drainOpenSSLErrors();
        WARDEN_LOG_ERROR_F("AES-GCM setup failed: %s", reason.c_str());
        return failure;
    }
    return ctx;
}

} // anonymous namespace

// ============================================================================
// AESCipher::Impl
// ============================================================================

class AESCipher::Impl {
public:
    explicit Impl(const AESKey& key) : m_key(key) {}

    ~Impl() {
        secureZero(m_key.data(), m_key.size());
    }

    Result<SealedData> seal(ByteSpan plaintext, ByteSpan associatedData) {
        if (!fitsInt(plaintext.size()) || !fitsInt(associatedData.size())) {
            return ErrorCode::InvalidArgument;
        }

        AESNonce nonce{};
        WARDEN_TRY_ASSIGN(nonce, m_rng.generateNonce());
        SealedData sealed;
        sealed.nonce = nonce;

        CipherCtx ctx;
        WARDEN_TRY_ASSIGN(ctx, startGcm(Direction::Seal, m_key, sealed.nonce, associatedData));

        sealed.ciphertext.resize(plaintext.size());
        int produced = 0;
        int trailing = 0;
        Byte spill[16];
        if ((!plaintext.empty() &&
             EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &produced, plaintext.data(),
                               static_cast<int>(plaintext.size())) != 1) ||
            EVP_EncryptFinal_ex(ctx.get(), spill, &trailing) != 1 || trailing != 0 ||
            EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                                static_cast<int>(sealed.tag.size()), sealed.tag.data()) != 1) {
            drainOpenSSLErrors();
            return ErrorCode::EncryptionFailed;
        }

        // GCM is a stream mode: Final emits nothing
        sealed.ciphertext.resize(static_cast<size_t>(produced));
        return sealed;
    }

    Result<ByteBuffer> open(const SealedData& sealed, ByteSpan associatedData) {
        if (!fitsInt(sealed.ciphertext.size()) || !fitsInt(associatedData.size())) {
            return ErrorCode::InvalidArgument;
        }

        CipherCtx ctx;
        WARDEN_TRY_ASSIGN(ctx, startGcm(Direction::Open, m_key, sealed.nonce, associatedData));

        ByteBuffer plain(sealed.ciphertext.size());
        int produced = 0;
        if (!sealed.ciphertext.empty() &&
            EVP_DecryptUpdate(ctx.get(), plain.data(), &produced, sealed.ciphertext.data(),
                              static_cast<int>(sealed.ciphertext.size())) != 1) {
            secureZero(plain.data(), plain.size());
            drainOpenSSLErrors();
            return ErrorCode::DecryptionFailed;
        }

        AESTag expected = sealed.tag;
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                                static_cast<int>(expected.size()), expected.data()) != 1) {
            secureZero(plain.data(), plain.size());
            drainOpenSSLErrors();
            return ErrorCode::DecryptionFailed;
        }

        int trailing = 0;
        Byte spill[16];
        if (EVP_DecryptFinal_ex(ctx.get(), spill, &trailing) != 1 || trailing != 0) {
            secureZero(plain.data(), plain.size());
            drainOpenSSLErrors();
            return ErrorCode::AuthenticationFailed;
        }

        plain.resize(static_cast<size_t>(produced));
        return plain;
    }

private:
    AESKey m_key;
    SecureRandom m_rng;
};

// ============================================================================
// AESCipher
// ============================================================================

AESCipher::AESCipher(const AESKey& key) : m_impl(std::make_unique<Impl>(key)) {}

AESCipher::~AESCipher() = default;

Result<SealedData> AESCipher::seal(ByteSpan plaintext, ByteSpan associatedData) {
    return m_impl->seal(plaintext, associatedData);
}

Result<ByteBuffer> AESCipher::open(const SealedData& sealed, ByteSpan associatedData) {
    return m_impl->open(sealed, associatedData);
}

} // namespace Warden::Crypto
