/**
 * @file CryptoUtils.cpp
 * @brief Hex and base64 codecs, constant-time comparison and wiping
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/Crypto.hpp>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace Warden::Crypto {

namespace {

constexpr char kHexDigits[] = "0123456789abcdef";

int nibble(char c) noexcept {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    const char lower = static_cast<char>(c | 0x20);
    if (lower >= 'a' && lower <= 'f') {
        return lower - 'a' + 10;
    }
    return -1;
}

} // anonymous namespace

std::string toHex(ByteSpan data) {
    std::string out(data.size() * 2, '\0');
    for (size_t i = 0; i < data.size(); ++i) {
        out[2 * i] = kHexDigits[data[i] >> 4];
        out[2 * i + 1] = kHexDigits[data[i] & 0x0F];
    }
    return out;
}

Result<ByteBuffer> fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return ErrorInfo(ErrorCode::InvalidHexString, "Hex string has odd length");
    }

    ByteBuffer out(hex.size() / 2);
    for (size_t i = 0; i < out.size(); ++i) {
        const int high = nibble(hex[2 * i]);
        const int low = nibble(hex[2 * i + 1]);
        if (high < 0 || low < 0) {
            return ErrorInfo(ErrorCode::InvalidHexString, "Non-hex character in hex string");
        }
        out[i] = static_cast<Byte>((high << 4) | low);
    }
    return out;
}

std::string toBase64(ByteSpan data) {
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    if (out.empty()) {
        return out;
    }
    const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                                        data.data(), static_cast<int>(data.size()));
    out.resize(written > 0 ? static_cast<size_t>(written) : 0);
    return out;
}

Result<ByteBuffer> fromBase64(std::string_view base64) {
    if (base64.empty()) {
        return ByteBuffer{};
    }
    if (base64.size() % 4 != 0) {
        return ErrorInfo(ErrorCode::InvalidBase64, "Base64 length is not a multiple of 4");
    }

    ByteBuffer out(base64.size() / 4 * 3);
    const int decoded = EVP_DecodeBlock(out.data(),
                                        reinterpret_cast<const unsigned char*>(base64.data()),
                                        static_cast<int>(base64.size()));
    if (decoded < 0) {
        return ErrorInfo(ErrorCode::InvalidBase64, "Invalid base64 character");
    }

    // EVP_DecodeBlock decodes padding as zero bytes
    const size_t padding = base64.ends_with("==") ? 2 : (base64.ends_with('=') ? 1 : 0);
    out.resize(static_cast<size_t>(decoded) - padding);
    return out;
}

bool constantTimeCompare(ByteSpan a, ByteSpan b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    return a.empty() || CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

void secureZero(void* data, size_t size) noexcept {
    if (data != nullptr && size > 0) {
        OPENSSL_cleanse(data, size);
    }
}

} // namespace Warden::Crypto
