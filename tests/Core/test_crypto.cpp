/**
 * @file test_crypto.cpp
 * @brief Unit tests for cryptographic utilities
 * @author Warden Security Team
 * @version 1.0.0
 * @date 2025
 *
 * @copyright Copyright (c) 2025 Warden Security. All rights reserved.
 */

#include <Warden/Core/Crypto.hpp>
#include "TestHarness.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <cstring>
#include <set>
#include <thread>
#include <vector>

using namespace Warden;
using namespace Warden::Crypto;

// ============================================================================
// Unit Test 1: SecureRandom
// ============================================================================

TEST(SecureRandom, GenerateBytes_ReturnsCorrectSize) {
    SecureRandom rng;

    for (size_t size : {1u, 10u, 32u, 64u, 256u}) {
        auto result = rng.generate(size);
        ASSERT_TRUE(result.isSuccess()) << "Failed to generate " << size << " bytes";
        EXPECT_EQ(result.value().size(), size);
    }
}

TEST(SecureRandom, GenerateZeroBytes_ReturnsSuccess) {
    SecureRandom rng;
    auto result = rng.generate(0);
    ASSERT_TRUE(result.isSuccess());
    EXPECT_TRUE(result.value().empty());
}

TEST(SecureRandom, NullPointerWithNonZeroSize_Fails) {
    SecureRandom rng;
    EXPECT_TRUE(rng.generate(nullptr, 0).isSuccess());
    EXPECT_ERROR_CODE(rng.generate(nullptr, 16), ErrorCode::InvalidArgument);
}

TEST(SecureRandom, KeysAndNonces_AreUnique) {
    SecureRandom rng;
    std::set<AESKey> keys;
    std::set<AESNonce> nonces;

    for (int i = 0; i < 64; ++i) {
        auto key = rng.generateAESKey();
        auto nonce = rng.generateNonce();
        ASSERT_TRUE(key.isSuccess());
        ASSERT_TRUE(nonce.isSuccess());
        keys.insert(key.value());
        nonces.insert(nonce.value());
    }

    EXPECT_EQ(keys.size(), 64u);
    EXPECT_EQ(nonces.size(), 64u);
}

TEST(SecureRandom, ThreadSafety) {
    SecureRandom rng;
    std::vector<std::thread> threads;
    std::atomic<int> failures{0};

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&rng, &failures]() {
            for (int i = 0; i < 100; ++i) {
                if (rng.generate(32).isFailure()) {
                    failures++;
                }
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
}

// ============================================================================
// Unit Test 2: HashEngine
// ============================================================================

TEST(HashEngine, SHA256_EmptyString_MatchesRFC) {
    HashEngine hasher(HashAlgorithm::SHA256);
    auto result = hasher.hash(ByteSpan{});

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(toHex(result.value()),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(HashEngine, SHA256_Abc_MatchesKnown) {
    auto result = HashEngine::sha256Hex("abc");

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.value(),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(HashEngine, SHA256_HelloWorld_MatchesKnown) {
    HashEngine hasher;
    auto result = hasher.hash(asBytes("Hello, World!"));

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(toHex(result.value()),
              "dffd6021bb2bd5b0af676290809ec3a53191dd81c7f70a4b28688a362182986f");
}

TEST(HashEngine, SHA512_MatchesKnown) {
    auto result = HashEngine::sha512(asBytes("abc"));

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(toHex(result.value()),
              "ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
              "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f");
}

TEST(HashEngine, EngineMatchesOneShot) {
    const ByteBuffer data = Testing::randomBytes(10000);

    HashEngine engine(HashAlgorithm::SHA512);
    auto viaEngine = engine.hash(data);
    auto oneShot = HashEngine::sha512(data);

    ASSERT_TRUE(viaEngine.isSuccess());
    ASSERT_TRUE(oneShot.isSuccess());
    ASSERT_EQ(viaEngine.value().size(), 64u);
    EXPECT_TRUE(std::equal(viaEngine.value().begin(), viaEngine.value().end(),
                           oneShot.value().begin()));
}

TEST(HashEngine, EngineIsReusable) {
    HashEngine hasher;
    auto first = hasher.hash(asBytes("first"));
    auto second = hasher.hash(asBytes("first"));
    auto other = hasher.hash(asBytes("second"));

    ASSERT_TRUE(first.isSuccess());
    ASSERT_TRUE(second.isSuccess());
    ASSERT_TRUE(other.isSuccess());
    EXPECT_EQ(first.value(), second.value());
    EXPECT_NE(first.value(), other.value());
}

TEST(HashEngine, GetHashSize_ReturnsCorrectSizes) {
    EXPECT_EQ(HashEngine::getHashSize(HashAlgorithm::SHA256), 32u);
    EXPECT_EQ(HashEngine::getHashSize(HashAlgorithm::SHA512), 64u);
}

// ============================================================================
// Unit Test 3: Encoding
// ============================================================================

TEST(Encoding, HexRoundTripAndRejects) {
    const ByteBuffer bytes = {0x00, 0x0f, 0xa5, 0xff};
    EXPECT_EQ(toHex(bytes), "000fa5ff");

    auto parsed = fromHex("000FA5ff");
    ASSERT_TRUE(parsed.isSuccess());
    EXPECT_EQ(parsed.value(), bytes);

    EXPECT_ERROR_CODE(fromHex("abc"), ErrorCode::InvalidHexString);
    EXPECT_ERROR_CODE(fromHex("zz"), ErrorCode::InvalidHexString);
}

TEST(Encoding, Base64KnownValues) {
    EXPECT_EQ(toBase64(asBytes("")), "");
    EXPECT_EQ(toBase64(asBytes("f")), "Zg==");
    EXPECT_EQ(toBase64(asBytes("fo")), "Zm8=");
    EXPECT_EQ(toBase64(asBytes("foo")), "Zm9v");

    auto decoded = fromBase64("Zm8=");
    ASSERT_TRUE(decoded.isSuccess());
    EXPECT_EQ(std::string(decoded.value().begin(), decoded.value().end()), "fo");

    auto twoPad = fromBase64("Zg==");
    ASSERT_TRUE(twoPad.isSuccess());
    EXPECT_EQ(twoPad.value().size(), 1u);
}

TEST(Encoding, Base64RejectsMalformedInput) {
    EXPECT_ERROR_CODE(fromBase64("abc"), ErrorCode::InvalidBase64);
    EXPECT_ERROR_CODE(fromBase64("a!c="), ErrorCode::InvalidBase64);
}

// ============================================================================
// Unit Test 4: Constant Time Compare and Zeroing
// ============================================================================

TEST(ConstantTimeCompare, EqualArrays_ReturnsTrue) {
    const ByteBuffer a = {1, 2, 3, 4};
    const ByteBuffer b = {1, 2, 3, 4};
    EXPECT_TRUE(constantTimeCompare(a, b));
}

TEST(ConstantTimeCompare, DifferentArrays_ReturnsFalse) {
    const ByteBuffer a = {1, 2, 3, 4};
    const ByteBuffer b = {1, 2, 3, 5};
    EXPECT_FALSE(constantTimeCompare(a, b));
}

TEST(ConstantTimeCompare, DifferentLengths_ReturnsFalse) {
    const ByteBuffer a = {1, 2, 3};
    const ByteBuffer b = {1, 2, 3, 4};
    EXPECT_FALSE(constantTimeCompare(a, b));
}

TEST(ConstantTimeCompare, EmptyArrays_ReturnsTrue) {
    EXPECT_TRUE(constantTimeCompare(ByteSpan{}, ByteSpan{}));
}

TEST(SecureZero, ClearsBuffer) {
    ByteBuffer buffer(128);
    Testing::fillPattern(buffer.data(), buffer.size());
    secureZero(buffer.data(), buffer.size());
    ASSERT_ZEROED(buffer.data(), buffer.size());
}
