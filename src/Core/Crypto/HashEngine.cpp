/**
 * @file HashEngine.cpp
 * @brief SHA-256 and SHA-512 through the EVP digest interface
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/Crypto.hpp>
#include <Warden/Core/Crypto/OpenSSLRAII.hpp>
#include <Warden/Core/Logger.hpp>

namespace Warden::Crypto {

namespace {

const EVP_MD* digestFor(HashAlgorithm algorithm) {
    return algorithm == HashAlgorithm::SHA512 ? EVP_sha512() : EVP_sha256();
}

ErrorInfo digestFailure(const char* step) {
    const std::string reason = drainOpenSSLErrors();
    WARDEN_LOG_ERROR_F("%s failed: %s", step, reason.c_str());
    return ErrorInfo(ErrorCode::HashFailed, std::string(step) + " failed");
}

template<size_t N>
Result<std::array<Byte, N>> oneShot(const EVP_MD* md, ByteSpan data) {
    std::array<Byte, N> digest{};
    unsigned int written = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &written, md, nullptr) != 1) {
        return digestFailure("EVP_Digest");
    }
    if (written != N) {
        return ErrorInfo(ErrorCode::HashFailed, "Unexpected digest length");
    }
    return digest;
}

} // anonymous namespace

// ============================================================================
// HashEngine::Impl
// ============================================================================

class HashEngine::Impl {
public:
    explicit Impl(HashAlgorithm algorithm) : m_algorithm(algorithm) {}

    Result<ByteBuffer> digest(ByteSpan data) {
        if (!m_ctx) {
            m_ctx.reset(EVP_MD_CTX_new());
            if (!m_ctx) {
                return ErrorCode::CryptoError;
            }
        }
        if (EVP_DigestInit_ex(m_ctx.get(), digestFor(m_algorithm), nullptr) != 1) {
            return digestFailure("EVP_DigestInit_ex");
        }
        if (!data.empty() && EVP_DigestUpdate(m_ctx.get(), data.data(), data.size()) != 1) {
            return digestFailure("EVP_DigestUpdate");
        }

        ByteBuffer out(getHashSize(m_algorithm));
        unsigned int written = 0;
        if (EVP_DigestFinal_ex(m_ctx.get(), out.data(), &written) != 1) {
            return digestFailure("EVP_DigestFinal_ex");
        }
        out.resize(written);
        return out;
    }

private:
    HashAlgorithm m_algorithm;
    DigestCtx m_ctx;
};

// ============================================================================
// HashEngine
// ============================================================================

HashEngine::HashEngine(HashAlgorithm algorithm)
    : m_impl(std::make_unique<Impl>(algorithm)) {}

HashEngine::~HashEngine() = default;

Result<ByteBuffer> HashEngine::hash(ByteSpan data) {
    return m_impl->digest(data);
}

Result<SHA256Hash> HashEngine::sha256(ByteSpan data) {
    return oneShot<32>(EVP_sha256(), data);
}

Result<SHA512Hash> HashEngine::sha512(ByteSpan data) {
    return oneShot<64>(EVP_sha512(), data);
}

Result<std::string> HashEngine::sha256Hex(std::string_view text) {
    auto digest = sha256(asBytes(text));
    if (digest.isFailure()) {
        return digest.errorInfo();
    }
    return toHex(digest.value());
}

size_t HashEngine::getHashSize(HashAlgorithm algorithm) noexcept {
    return algorithm == HashAlgorithm::SHA512 ? 64 : 32;
}

} // namespace Warden::Crypto
