/**
 * @file Crypto.hpp
 * @brief OpenSSL-backed primitives for secrets at rest and artifact digests
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * SecureConfigStore seals credential fields with AESCipher. Package
 * integrity checks and config integrity hashes go through HashEngine.
 */

#pragma once

#ifndef WARDEN_CORE_CRYPTO_HPP
#define WARDEN_CORE_CRYPTO_HPP

#include <Warden/Core/ErrorCodes.hpp>
#include <Warden/Core/Types.hpp>

#include <memory>
#include <string>
#include <string_view>

namespace Warden::Crypto {

using SHA512Hash = std::array<Byte, 64>;

// ============================================================================
// SecureRandom
// ============================================================================

/**
 * @brief Random bytes from the OpenSSL DRBG (RAND_bytes)
 *
 * Holds no state of its own; instances may be shared between threads.
 */
class SecureRandom {
public:
    /// An empty request succeeds; a null buffer with a size is InvalidArgument
    Result<void> generate(Byte* buffer, size_t size);
    Result<ByteBuffer> generate(size_t size);

    Result<AESKey> generateAESKey();
    Result<AESNonce> generateNonce();
};

// ============================================================================
// HashEngine
// ============================================================================

enum class HashAlgorithm {
    SHA256,
    SHA512
};

/**
 * @brief SHA-2 digests
 *
 * An engine is bound to one algorithm and reuses its digest context
 * across hash() calls. The static helpers cover fixed-algorithm one-shots.
 */
class HashEngine {
public:
    explicit HashEngine(HashAlgorithm algorithm = HashAlgorithm::SHA256);
    ~HashEngine();

    HashEngine(const HashEngine&) = delete;
    HashEngine& operator=(const HashEngine&) = delete;

    Result<ByteBuffer> hash(ByteSpan data);

    static Result<SHA256Hash> sha256(ByteSpan data);
    static Result<SHA512Hash> sha512(ByteSpan data);

    /// Lowercase hex SHA-256 of @p text, the form written into integrity files
    static Result<std::string> sha256Hex(std::string_view text);

    static size_t getHashSize(HashAlgorithm algorithm) noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// AESCipher
// ============================================================================

/// One AES-256-GCM message, kept in parts so callers choose the encoding
struct SealedData {
    AESNonce nonce{};
    ByteBuffer ciphertext;
    AESTag tag{};
};

/**
 * @brief AES-256-GCM with a fresh random nonce per seal()
 *
 * open() releases plaintext only after the tag verifies. A wrong key,
 * altered ciphertext, nonce, tag or associated data all surface as
 * AuthenticationFailed.
 *
 * @example
 * ```cpp
 * AESCipher cipher(key);
 * auto sealed = cipher.seal(asBytes(secret));
 * auto plain = cipher.open(sealed.value());
 * ```
 */
class AESCipher {
public:
    explicit AESCipher(const AESKey& key);
    ~AESCipher();

    AESCipher(const AESCipher&) = delete;
    AESCipher& operator=(const AESCipher&) = delete;

    Result<SealedData> seal(ByteSpan plaintext, ByteSpan associatedData = {});
    Result<ByteBuffer> open(const SealedData& sealed, ByteSpan associatedData = {});

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// Encoding and Memory
// ============================================================================

std::string toHex(ByteSpan data);

/// Accepts either case; odd length or a non-hex digit is InvalidHexString
Result<ByteBuffer> fromHex(std::string_view hex);

std::string toBase64(ByteSpan data);

/// Padded standard alphabet only; anything else is InvalidBase64
Result<ByteBuffer> fromBase64(std::string_view base64);

inline ByteSpan asBytes(std::string_view text) noexcept {
    return ByteSpan(reinterpret_cast<const Byte*>(text.data()), text.size());
}

/**
 * @brief Equality whose timing does not depend on where inputs differ
 *
 * Used for digests compared in our code. Lengths are not secret.
 */
bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept;

/// Zero memory in a way the optimizer cannot elide
void secureZero(void* data, size_t size) noexcept;

} // namespace Warden::Crypto

#endif // WARDEN_CORE_CRYPTO_HPP
