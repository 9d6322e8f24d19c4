#include <gtest/gtest.h>
#include <set>
#include <string>
#include <vector>
#include "crypto/crypto_engine.hpp"

using namespace peerdrop::crypto;

class CryptoEngineTest : public ::testing::Test {
protected:
    CryptoEngine::Key key = CryptoEngine::generate_key();
    CryptoEngine::Salt salt = CryptoEngine::generate_salt();
    CryptoEngine engine{key, salt};

    static std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
};

TEST_F(CryptoEngineTest, RoundTrip) {
    const auto plaintext = bytes("HelloWorld");
    const auto nonce = CryptoEngine::generate_nonce();

    const auto ciphertext = engine.encrypt(plaintext, nonce);
    EXPECT_EQ(ciphertext.size(), plaintext.size() + CryptoEngine::TAG_SIZE);
    EXPECT_EQ(engine.decrypt(ciphertext, nonce), plaintext);
}

TEST_F(CryptoEngineTest, EmptyPlaintextIsJustTheTag) {
    const auto nonce = engine.chunk_nonce(0);
    const auto ciphertext = engine.encrypt(std::vector<uint8_t>{}, nonce);
    EXPECT_EQ(ciphertext.size(), CryptoEngine::TAG_SIZE);
    EXPECT_TRUE(engine.decrypt(ciphertext, nonce).empty());
}

TEST_F(CryptoEngineTest, AnyFlippedBitFailsAuthentication) {
    const auto plaintext = bytes("integrity matters");
    const auto nonce = engine.chunk_nonce(3);
    const auto ciphertext = engine.encrypt(plaintext, nonce);

    for (std::size_t byte = 0; byte < ciphertext.size(); ++byte) {
        for (int bit = 0; bit < 8; bit += 3) {
            auto tampered = ciphertext;
            tampered[byte] ^= static_cast<uint8_t>(1u << bit);
            EXPECT_THROW(engine.decrypt(tampered, nonce), AuthFailure) << "byte " << byte << " bit " << bit;
        }
    }
}

TEST_F(CryptoEngineTest, WrongKeyFailsAuthentication) {
    const auto nonce = CryptoEngine::generate_nonce();
    const auto ciphertext = engine.encrypt(bytes("secret"), nonce);

    CryptoEngine other(CryptoEngine::generate_key());
    EXPECT_THROW(other.decrypt(ciphertext, nonce), AuthFailure);
}

TEST_F(CryptoEngineTest, WrongNonceFailsAuthentication) {
    const auto ciphertext = engine.encrypt(bytes("secret"), engine.chunk_nonce(1));
    EXPECT_THROW(engine.decrypt(ciphertext, engine.chunk_nonce(2)), AuthFailure);
}

TEST_F(CryptoEngineTest, MalformedInputsFailAuthentication) {
    const auto nonce = CryptoEngine::generate_nonce();
    const auto ciphertext = engine.encrypt(bytes("abc"), nonce);

    const std::vector<uint8_t> short_nonce(8, 0);
    EXPECT_THROW(engine.decrypt(ciphertext, short_nonce), AuthFailure);

    const std::vector<uint8_t> truncated(ciphertext.begin(), ciphertext.begin() + 10);
    EXPECT_THROW(engine.decrypt(truncated, nonce), AuthFailure);
}

TEST_F(CryptoEngineTest, ChunkNonceLayout) {
    const auto nonce = CryptoEngine::chunk_nonce(0x0102, salt);
    for (int i = 0; i < 6; ++i) {
        EXPECT_EQ(nonce[i], 0);
    }
    EXPECT_EQ(nonce[6], 0x01);
    EXPECT_EQ(nonce[7], 0x02);
    for (std::size_t i = 0; i < CryptoEngine::SALT_SIZE; ++i) {
        EXPECT_EQ(nonce[8 + i], salt[i]);
    }
    EXPECT_EQ(engine.chunk_nonce(0x0102), nonce);
}

TEST_F(CryptoEngineTest, ChunkNoncesNeverRepeatWithinASession) {
    std::set<CryptoEngine::Nonce> seen;
    for (uint64_t i = 0; i < 10000; ++i) {
        EXPECT_TRUE(seen.insert(engine.chunk_nonce(i)).second) << "index " << i;
    }
}

TEST_F(CryptoEngineTest, GeneratedKeysDiffer) {
    EXPECT_NE(CryptoEngine::generate_key(), CryptoEngine::generate_key());
    EXPECT_NE(CryptoEngine::generate_nonce(), CryptoEngine::generate_nonce());
}

TEST_F(CryptoEngineTest, KeyBase64RoundTrip) {
    const std::string encoded = CryptoEngine::key_to_base64(key);
    EXPECT_EQ(encoded.size(), 44u);
    EXPECT_EQ(CryptoEngine::key_from_base64(encoded), key);
    EXPECT_EQ(CryptoEngine::key_from_base64("  " + encoded + "\n"), key);
    EXPECT_EQ(CryptoEngine::key_from_base64("\t" + encoded + " \r\n"), key);
}

TEST_F(CryptoEngineTest, KeyFromBase64RejectsBadInput) {
    EXPECT_THROW(CryptoEngine::key_from_base64("not base64!"), InitializationError);
    // Valid base64, 16 bytes
    EXPECT_THROW(CryptoEngine::key_from_base64("AAAAAAAAAAAAAAAAAAAAAA=="), InitializationError);
    EXPECT_THROW(CryptoEngine::key_from_base64(""), InitializationError);
}
