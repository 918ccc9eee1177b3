/**
 * @file ConfigIntegrity.cpp
 * @brief SHA-256 integrity stamps for configuration files
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

namespace Warden::Config {

using Json = nlohmann::json;

Result<std::string> ConfigIntegrityChecker::generateHash(const Json& config) {
    Json canonical = config;
    if (canonical.is_object()) {
        canonical.erase("_integrity");
    }
    // nlohmann::json keeps object keys sorted, so dump() is canonical
    return Crypto::HashEngine::sha256Hex(
        canonical.dump(-1, ' ', false, Json::error_handler_t::replace));
}

Result<void> ConfigIntegrityChecker::storeWithIntegrity(const std::filesystem::path& configPath,
                                                        const Json& config) {
    if (!config.is_object()) {
        return makeError(ErrorCode::ConfigInvalid, "Configuration must be a JSON object");
    }

    std::string hash;
    WARDEN_TRY_ASSIGN(hash, generateHash(config));

    Json stamped = config;
    stamped["_integrity"] = {
        {"hash", hash},
        {"timestamp", formatIso8601(WallClock::now())},
    };

    return writeFileAtomic(configPath, stamped.dump(2), 0644);
}

IntegrityVerification ConfigIntegrityChecker::verifyIntegrity(const std::filesystem::path& configPath) {
    if (!fileExists(configPath)) {
        return {false, "File not found"};
    }

    auto content = readFileSecure(configPath);
    if (content.isFailure()) {
        return {false, "Configuration could not be read"};
    }

    Json config = Json::parse(content.value(), nullptr, false);
    if (config.is_discarded() || !config.is_object()) {
        return {false, "Invalid configuration format"};
    }

    auto integrity = config.find("_integrity");
    if (integrity == config.end() || !integrity->is_object() ||
        !integrity->contains("hash") || !(*integrity)["hash"].is_string()) {
        return {false, "No integrity data found"};
    }
    const std::string storedHash = (*integrity)["hash"].get<std::string>();

    auto calculated = generateHash(config);
    if (calculated.isFailure()) {
        return {false, "Hash computation failed"};
    }

    if (!Crypto::constantTimeCompare(Crypto::asBytes(storedHash),
                                     Crypto::asBytes(calculated.value()))) {
        WARDEN_LOG_WARNING("Configuration integrity hash mismatch");
        return {false, "Hash mismatch - configuration may have been tampered with"};
    }

    return {true, ""};
}

} // namespace Warden::Config
