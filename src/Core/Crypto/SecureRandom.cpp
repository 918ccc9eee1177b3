/**
 * @file SecureRandom.cpp
 * @brief Random byte generation on top of RAND_bytes
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/Crypto.hpp>
#include <Warden/Core/Crypto/OpenSSLRAII.hpp>
#include <Warden/Core/Logger.hpp>

#include <openssl/rand.h>

#include <algorithm>
#include <climits>

namespace Warden::Crypto {

namespace {

template<size_t N>
Result<std::array<Byte, N>> randomArray(SecureRandom& rng) {
    std::array<Byte, N> out{};
    WARDEN_TRY(rng.generate(out.data(), out.size()));
    return out;
}

} // anonymous namespace

Result<void> SecureRandom::generate(Byte* buffer, size_t size) {
    if (size == 0) {
        return {};
    }
    if (buffer == nullptr) {
        return ErrorCode::InvalidArgument;
    }

    // RAND_bytes takes an int length
    for (size_t offset = 0; offset < size;) {
        const size_t chunk = std::min<size_t>(size - offset, INT_MAX);
        if (RAND_bytes(buffer + offset, static_cast<int>(chunk)) != 1) {
            const std::string reason = drainOpenSSLErrors();
            WARDEN_LOG_ERROR_F("RAND_bytes failed: %s", reason.c_str());
            return ErrorInfo(ErrorCode::RandomGenerationFailed, "RAND_bytes failed");
        }
        offset += chunk;
    }
    return {};
}

Result<ByteBuffer> SecureRandom::generate(size_t size) {
    ByteBuffer out(size);
    WARDEN_TRY(generate(out.data(), out.size()));
    return out;
}

Result<AESKey> SecureRandom::generateAESKey() {
    return randomArray<std::tuple_size_v<AESKey>>(*this);
}

Result<AESNonce> SecureRandom::generateNonce() {
    return randomArray<std::tuple_size_v<AESNonce>>(*this);
}

} // namespace Warden::Crypto
