/**
 * @file SecureConfigStore.cpp
 * @brief AES-256-GCM configuration field encryption
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/SecureConfig.hpp>
#include <Warden/Core/Crypto.hpp>
#include <Warden/Core/ErrorHandler.hpp>
#include <Warden/Core/FileUtils.hpp>
#include <Warden/Core/Logger.hpp>
#include <Warden/Core/TimeUtils.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <unistd.h>

namespace Warden::Config {

namespace {

using Json = nlohmann::json;

ByteSpan algorithmAad() {
    return Crypto::asBytes(ENCRYPTION_ALGORITHM);
}

} // anonymous namespace

// ============================================================================
// EncryptedBlob
// ============================================================================

Json EncryptedBlob::toJson() const {
    return Json{
        {"encrypted", encrypted},
        {"iv", iv},
        {"tag", tag},
        {"algorithm", algorithm},
    };
}

bool EncryptedBlob::isBlob(const Json& value) {
    return value.is_object() &&
           value.contains("encrypted") && value["encrypted"].is_string() &&
           value.contains("iv") && value["iv"].is_string() &&
           value.contains("tag") && value["tag"].is_string();
}

Result<EncryptedBlob> EncryptedBlob::fromJson(const Json& value) {
    if (!isBlob(value)) {
        return makeError(ErrorCode::IntegrityError, "Malformed encrypted value");
    }

    EncryptedBlob blob;
    blob.encrypted = value["encrypted"].get<std::string>();
    blob.iv = value["iv"].get<std::string>();
    blob.tag = value["tag"].get<std::string>();
    blob.algorithm.clear();
    if (value.contains("algorithm") && value["algorithm"].is_string()) {
        blob.algorithm = value["algorithm"].get<std::string>();
    }
    return blob;
}

// ============================================================================
// SecureConfigStore::Impl
// ============================================================================

class SecureConfigStore::Impl {
public:
    explicit Impl(std::filesystem::path path) : keyPath(std::move(path)) {}

    ~Impl() {
        clearKey();
    }

    void clearKey() noexcept {
        Crypto::secureZero(key.data(), key.size());
        keyLoaded = false;
    }

    Result<void> loadKey() {
        auto data = readFileSecure(keyPath, 1024);
        if (data.isFailure()) {
            if (data.error() == ErrorCode::FileTooLarge) {
                return makeError(ErrorCode::InvalidKey, "Key file must contain exactly 32 bytes",
                                 "keyPath");
            }
            return data.errorInfo();
        }

        std::string& raw = data.value();
        if (raw.size() != key.size()) {
            Crypto::secureZero(raw.data(), raw.size());
            return makeError(ErrorCode::InvalidKey, "Key file must contain exactly 32 bytes",
                             "keyPath");
        }

        std::memcpy(key.data(), raw.data(), key.size());
        Crypto::secureZero(raw.data(), raw.size());
        keyLoaded = true;
        return {};
    }

    Result<void> createKey() {
        Crypto::SecureRandom rng;
        AESKey fresh{};
        WARDEN_TRY_ASSIGN(fresh, rng.generateAESKey());

        int fd = ::open(keyPath.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC | O_NOFOLLOW, 0600);
        if (fd < 0) {
            int err = errno;
            Crypto::secureZero(fresh.data(), fresh.size());
            if (err == EEXIST) {
                // Another store created it first
                return loadKey();
            }
            return makeError(ErrorCode::FileWriteError, std::strerror(err), "keyPath");
        }

        size_t written = 0;
        while (written < fresh.size()) {
            ssize_t n = ::write(fd, fresh.data() + written, fresh.size() - written);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                int err = errno;
                ::close(fd);
                ::unlink(keyPath.c_str());
                Crypto::secureZero(fresh.data(), fresh.size());
                return makeError(ErrorCode::FileWriteError, std::strerror(err), "keyPath");
            }
            written += static_cast<size_t>(n);
        }

        if (::fsync(fd) != 0 || ::close(fd) != 0) {
            int err = errno;
            ::unlink(keyPath.c_str());
            Crypto::secureZero(fresh.data(), fresh.size());
            return makeError(ErrorCode::FileWriteError, std::strerror(err), "keyPath");
        }

        key = fresh;
        Crypto::secureZero(fresh.data(), fresh.size());
        keyLoaded = true;
        WARDEN_LOG_INFO("Generated new encryption key for configuration");
        return {};
    }

    Result<void> initializeKey() {
        if (keyLoaded) {
            return {};
        }
        if (fileExists(keyPath)) {
            return loadKey();
        }
        return createKey();
    }

    Result<EncryptedBlob> encrypt(std::string_view plaintext) {
        if (!keyLoaded) {
            return makeError(ErrorCode::KeyNotLoaded, "Encryption key not initialized");
        }

        Crypto::AESCipher cipher(key);
        Crypto::SealedData sealed;
        WARDEN_TRY_ASSIGN(sealed, cipher.seal(Crypto::asBytes(plaintext), algorithmAad()));

        EncryptedBlob blob;
        blob.encrypted = Crypto::toHex(sealed.ciphertext);
        blob.iv = Crypto::toHex(sealed.nonce);
        blob.tag = Crypto::toHex(sealed.tag);
        blob.algorithm = ENCRYPTION_ALGORITHM;
        return blob;
    }

    Result<std::string> decrypt(const EncryptedBlob& blob) {
        if (!keyLoaded) {
            return makeError(ErrorCode::KeyNotLoaded, "Encryption key not initialized");
        }
        if (blob.algorithm != ENCRYPTION_ALGORITHM) {
            return makeError(ErrorCode::UnsupportedAlgorithm, "Unsupported encryption algorithm",
                             "algorithm");
        }

        auto ciphertext = Crypto::fromHex(blob.encrypted);
        auto iv = Crypto::fromHex(blob.iv);
        auto tag = Crypto::fromHex(blob.tag);
        if (ciphertext.isFailure() || iv.isFailure() || tag.isFailure()) {
            return makeError(ErrorCode::IntegrityError, "Malformed encrypted value");
        }

        Crypto::SealedData sealed;
        if (iv.value().size() != sealed.nonce.size() || tag.value().size() != sealed.tag.size()) {
            return makeError(ErrorCode::IntegrityError, "Invalid IV or tag length");
        }
        std::copy(iv.value().begin(), iv.value().end(), sealed.nonce.begin());
        std::copy(tag.value().begin(), tag.value().end(), sealed.tag.begin());
        sealed.ciphertext = std::move(ciphertext).value();

        Crypto::AESCipher cipher(key);
        auto opened = cipher.open(sealed, algorithmAad());
        if (opened.isFailure()) {
            return makeError(ErrorCode::AuthenticationFailed,
                             "Decryption failed: wrong key or modified data");
        }

        ByteBuffer& bytes = opened.value();
        std::string plaintext(bytes.begin(), bytes.end());
        Crypto::secureZero(bytes.data(), bytes.size());
        return plaintext;
    }

    Result<void> encryptLeaves(Json& node) {
        if (node.is_string()) {
            EncryptedBlob blob;
            WARDEN_TRY_ASSIGN(blob, encrypt(node.get_ref<const std::string&>()));
            node = blob.toJson();
        } else if (node.is_object() || node.is_array()) {
            for (auto& child : node) {
                WARDEN_TRY(encryptLeaves(child));
            }
        }
        return {};
    }

    Result<void> decryptLeaves(Json& node) {
        if (EncryptedBlob::isBlob(node)) {
            EncryptedBlob blob;
            WARDEN_TRY_ASSIGN(blob, EncryptedBlob::fromJson(node));
            std::string plaintext;
            WARDEN_TRY_ASSIGN(plaintext, decrypt(blob));
            node = plaintext;
            Crypto::secureZero(plaintext.data(), plaintext.size());
        } else if (node.is_object() || node.is_array()) {
            for (auto& child : node) {
                WARDEN_TRY(decryptLeaves(child));
            }
        }
        return {};
    }

    std::filesystem::path keyPath;
    AESKey key{};
    bool keyLoaded = false;
};

// ============================================================================
// SecureConfigStore
// ============================================================================

SecureConfigStore::SecureConfigStore(std::filesystem::path keyPath)
    : m_impl(std::make_unique<Impl>(std::move(keyPath))) {}

SecureConfigStore::~SecureConfigStore() = default;

const std::vector<std::string>& SecureConfigStore::sensitiveFields() {
    static const std::vector<std::string> fields = {"tokens", "apiKeys", "secrets", "passwords"};
    return fields;
}

Result<void> SecureConfigStore::initializeKey() {
    return m_impl->initializeKey();
}

bool SecureConfigStore::isKeyLoaded() const noexcept {
    return m_impl->keyLoaded;
}

const std::filesystem::path& SecureConfigStore::keyPath() const noexcept {
    return m_impl->keyPath;
}

Result<EncryptedBlob> SecureConfigStore::encrypt(std::string_view plaintext) {
    return m_impl->encrypt(plaintext);
}

Result<std::string> SecureConfigStore::decrypt(const EncryptedBlob& blob) {
    return m_impl->decrypt(blob);
}

Result<EncryptedBlob> SecureConfigStore::encryptValue(std::string_view plaintext) {
    WARDEN_TRY(m_impl->initializeKey());
    return m_impl->encrypt(plaintext);
}

Result<std::string> SecureConfigStore::decryptValue(const EncryptedBlob& blob) {
    WARDEN_TRY(m_impl->initializeKey());
    return m_impl->decrypt(blob);
}

Result<void> SecureConfigStore::storeSecureConfig(const std::filesystem::path& configPath,
                                                  const Json& config) {
    if (!config.is_object()) {
        return makeError(ErrorCode::ConfigInvalid, "Configuration must be a JSON object");
    }

    WARDEN_TRY(m_impl->initializeKey());

    Json secure = config;
    Json encryptedFields = Json::array();

    for (const auto& field : sensitiveFields()) {
        auto it = secure.find(field);
        if (it == secure.end() || it->is_null()) {
            continue;
        }
        WARDEN_TRY(m_impl->encryptLeaves(*it));
        encryptedFields.push_back(field);
    }

    secure["_encrypted"] = {
        {"timestamp", formatIso8601(WallClock::now())},
        {"version", SECURE_CONFIG_VERSION},
        {"fields", encryptedFields},
    };

    return writeFileAtomic(configPath, secure.dump(2), 0600);
}

Result<std::optional<Json>> SecureConfigStore::loadSecureConfig(const std::filesystem::path& configPath) {
    if (!fileExists(configPath)) {
        return std::optional<Json>{};
    }

    WARDEN_TRY(m_impl->initializeKey());

    auto content = readFileSecure(configPath);
    if (content.isFailure()) {
        return content.errorInfo();
    }

    Json config = Json::parse(content.value(), nullptr, false);
    if (config.is_discarded()) {
        return makeError(ErrorCode::ConfigParseFailed, "Configuration is not valid JSON");
    }

    if (!config.is_object() || !config.contains("_encrypted")) {
        return std::optional<Json>(std::move(config));
    }

    const Json& metadata = config["_encrypted"];
    if (!metadata.is_object() || !metadata.contains("fields") || !metadata["fields"].is_array()) {
        return makeError(ErrorCode::ConfigInvalid, "Malformed encryption metadata", "_encrypted");
    }

    std::vector<std::string> fields;
    for (const auto& field : metadata["fields"]) {
        if (!field.is_string()) {
            return makeError(ErrorCode::ConfigInvalid, "Malformed encryption metadata", "_encrypted");
        }
        fields.push_back(field.get<std::string>());
    }

    for (const auto& field : fields) {
        auto it = config.find(field);
        if (it != config.end()) {
            WARDEN_TRY(m_impl->decryptLeaves(*it));
        }
    }

    config.erase("_encrypted");
    return std::optional<Json>(std::move(config));
}

Result<void> SecureConfigStore::rotateKey(const std::filesystem::path& configPath) {
    std::optional<Json> config;
    WARDEN_TRY_ASSIGN(config, loadSecureConfig(configPath));
    if (!config) {
        return makeError(ErrorCode::ConfigFileNotFound, "Configuration file not found");
    }

    std::filesystem::path oldKeyPath = m_impl->keyPath;
    oldKeyPath += ".old";

    std::error_code ec;
    std::filesystem::rename(m_impl->keyPath, oldKeyPath, ec);
    if (ec) {
        return makeError(ErrorCode::FileWriteError, ec.message(), "keyPath");
    }

    m_impl->clearKey();
    WARDEN_TRY(m_impl->initializeKey());
    WARDEN_TRY(storeSecureConfig(configPath, *config));

    WARDEN_LOG_INFO("Successfully rotated encryption key");
    return {};
}

} // namespace Warden::Config
