/**
 * @file SecureConfig.hpp
 * @brief Encrypted configuration storage and integrity checking
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 *
 * Sensitive configuration fields are stored as AES-256-GCM blobs beside the
 * cleartext fields of the same JSON document. The key is a raw 32-byte file
 * readable only by its owner.
 */

#pragma once

#ifndef WARDEN_CORE_SECURE_CONFIG_HPP
#define WARDEN_CORE_SECURE_CONFIG_HPP

#include <Warden/Core/Types.hpp>
#include <Warden/Core/ErrorCodes.hpp>
#include <nlohmann/json.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Warden::Config {

/// Algorithm identifier stored with every blob and bound as associated data
constexpr const char* ENCRYPTION_ALGORITHM = "aes-256-gcm";

/// Version written into the _encrypted metadata
constexpr const char* SECURE_CONFIG_VERSION = "1.0.0";

// ============================================================================
// Encrypted Blob
// ============================================================================

/**
 * @brief One encrypted value: hex ciphertext, 96-bit IV and 128-bit tag
 */
struct EncryptedBlob {
    std::string encrypted;
    std::string iv;
    std::string tag;
    std::string algorithm = ENCRYPTION_ALGORITHM;

    [[nodiscard]] nlohmann::json toJson() const;

    /**
     * @brief Read a blob object; a missing algorithm is kept empty
     * @return IntegrityError if a member is missing or not a string
     */
    static Result<EncryptedBlob> fromJson(const nlohmann::json& value);

    /// Whether a JSON value has the shape of a blob
    static bool isBlob(const nlohmann::json& value);
};

// ============================================================================
// SecureConfigStore
// ============================================================================

/**
 * @brief Encrypts sensitive fields of JSON configuration documents
 *
 * Fields named in sensitiveFields() are encrypted leaf by leaf: every
 * string inside them becomes a blob, other values are kept as they are.
 * The key is loaded (or created) once and kept in memory until the store
 * is destroyed.
 */
class SecureConfigStore {
public:
    static constexpr const char* DEFAULT_KEY_FILE = ".warden.key";

    explicit SecureConfigStore(std::filesystem::path keyPath = DEFAULT_KEY_FILE);
    ~SecureConfigStore();

    SecureConfigStore(const SecureConfigStore&) = delete;
    SecureConfigStore& operator=(const SecureConfigStore&) = delete;

    /**
     * @brief Load the key file, or create it with mode 0600
     * @return InvalidKey if an existing key file is not exactly 32 bytes
     */
    Result<void> initializeKey();

    [[nodiscard]] bool isKeyLoaded() const noexcept;

    /**
     * @brief Encrypt with a fresh IV
     * @return KeyNotLoaded before initializeKey()
     */
    Result<EncryptedBlob> encrypt(std::string_view plaintext);

    /**
     * @brief Decrypt and authenticate
     *
     * Failures: UnsupportedAlgorithm, IntegrityError for malformed
     * hex or IV/tag lengths, AuthenticationFailed for a wrong key or any
     * modification. No plaintext is returned on failure.
     */
    Result<std::string> decrypt(const EncryptedBlob& blob);

    /**
     * @brief Encrypt the sensitive fields and write the document atomically
     *        with mode 0600
     */
    Result<void> storeSecureConfig(const std::filesystem::path& configPath,
                                   const nlohmann::json& config);

    /**
     * @brief Read and decrypt a document
     * @return std::nullopt if the file does not exist; documents without
     *         _encrypted metadata are returned unchanged
     */
    Result<std::optional<nlohmann::json>> loadSecureConfig(const std::filesystem::path& configPath);

    /// encrypt() after initializeKey()
    Result<EncryptedBlob> encryptValue(std::string_view plaintext);

    /// decrypt() after initializeKey()
    Result<std::string> decryptValue(const EncryptedBlob& blob);

    /**
     * @brief Re-encrypt a document under a freshly generated key
     *
     * The previous key file is kept as <key>.old.
     */
    Result<void> rotateKey(const std::filesystem::path& configPath);

    [[nodiscard]] const std::filesystem::path& keyPath() const noexcept;

    /// tokens, apiKeys, secrets, passwords
    static const std::vector<std::string>& sensitiveFields();

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;
};

// ============================================================================
// ConfigIntegrityChecker
// ============================================================================

/**
 * @brief Outcome of an integrity check
 */
struct IntegrityVerification {
    bool valid = false;
    std::string reason;     ///< Empty when valid
};

/**
 * @brief SHA-256 integrity stamps for configuration documents
 */
class ConfigIntegrityChecker {
public:
    /**
     * @brief SHA-256 hex of the compact, key-sorted document without _integrity
     */
    static Result<std::string> generateHash(const nlohmann::json& config);

    /**
     * @brief Write the document with an _integrity {hash, timestamp} member
     */
    static Result<void> storeWithIntegrity(const std::filesystem::path& configPath,
                                           const nlohmann::json& config);

    static IntegrityVerification verifyIntegrity(const std::filesystem::path& configPath);
};

// ============================================================================
// Environment Audit
// ============================================================================

/**
 * @brief Deployment mode derived from WARDEN_ENV, then NODE_ENV
 */
struct EnvironmentInfo {
    std::string mode = "development";
    bool isProduction = false;
    bool isDevelopment = true;
    bool isTest = false;
};

/**
 * @brief A risky setting found in the process environment
 */
struct EnvironmentIssue {
    std::string variable;
    std::string message;
    std::string fix;
};

/**
 * @brief Checks the process environment for settings that weaken security
 */
class EnvironmentAudit {
public:
    static EnvironmentInfo current();

    /**
     * @brief In production, report NODE_TLS_REJECT_UNAUTHORIZED, DEBUG and
     *        NODE_DEBUG when set
     */
    static std::vector<EnvironmentIssue> validate();

    /**
     * @brief In production, unset DEBUG and NODE_DEBUG and force
     *        NODE_TLS_REJECT_UNAUTHORIZED=1 for child processes
     */
    static Result<void> sanitize();
};

} // namespace Warden::Config

#endif // WARDEN_CORE_SECURE_CONFIG_HPP
