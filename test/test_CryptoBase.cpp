#include <gtest/gtest.h>
#include "CryptoBase.hpp"
#include "Types.hpp"
#include <string>
#include <vector>

using namespace rendezvous;

class CryptoBaseTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize()) << "Failed to initialize libsodium";
    }

    static std::vector<uint8_t> bytes(const std::string& text) {
        return std::vector<uint8_t>(text.begin(), text.end());
    }
};

// ============================================================================
// HASHING
// ============================================================================

TEST_F(CryptoBaseTest, Sha256KnownVector) {
    EXPECT_EQ(CryptoBase::sha256(bytes("abc")),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(CryptoBase::sha256Bytes(bytes("abc")).size(), SHA256_HASH_SIZE);
}

TEST_F(CryptoBaseTest, Sha256OfEmptyInput) {
    EXPECT_EQ(CryptoBase::sha256({}),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST_F(CryptoBaseTest, HexEncodeKeepsLeadingZeros) {
    EXPECT_EQ(CryptoBase::hexEncode({0x00, 0x0f, 0xa0, 0xff}), "000fa0ff");
    EXPECT_EQ(CryptoBase::hexEncode({}), "");
}

// ============================================================================
// BASE58
// ============================================================================

TEST_F(CryptoBaseTest, Base58KnownVectors) {
    EXPECT_EQ(CryptoBase::base58Encode(bytes("hello world")), "StV1DL6CwTryKyV");
    EXPECT_EQ(CryptoBase::base58Encode({}), "");
    EXPECT_EQ(CryptoBase::base58Encode({0x00}), "1");
    EXPECT_EQ(CryptoBase::base58Encode({0x00, 0x00, 0x01}), "112");
    EXPECT_EQ(CryptoBase::base58Encode({0xff}), "5Q");
}

TEST_F(CryptoBaseTest, Base58DecodeInvertsEncode) {
    EXPECT_EQ(CryptoBase::base58Decode("StV1DL6CwTryKyV"), bytes("hello world"));
    EXPECT_EQ(CryptoBase::base58Decode("112"), std::vector<uint8_t>({0x00, 0x00, 0x01}));

    std::vector<uint8_t> random(48);
    ASSERT_TRUE(CryptoBase::randomBytes(random));
    random[0] = 0x00;
    EXPECT_EQ(CryptoBase::base58Decode(CryptoBase::base58Encode(random)), random);
}

TEST_F(CryptoBaseTest, Base58RejectsCharactersOutsideAlphabet) {
    EXPECT_THROW(CryptoBase::base58Decode("0abc"), std::invalid_argument);
    EXPECT_THROW(CryptoBase::base58Decode("abcO"), std::invalid_argument);
    EXPECT_THROW(CryptoBase::base58Decode("I"), std::invalid_argument);
    EXPECT_THROW(CryptoBase::base58Decode("l"), std::invalid_argument);
}

// ============================================================================
// KEYS & RANDOMNESS
// ============================================================================

TEST_F(CryptoBaseTest, SeedKeypairIsDeterministic) {
    std::vector<uint8_t> seed(SEED_SIZE, 0x42);
    std::vector<uint8_t> pub1, priv1, pub2, priv2;

    ASSERT_TRUE(CryptoBase::ed25519SeedKeypair(pub1, priv1, seed));
    ASSERT_TRUE(CryptoBase::ed25519SeedKeypair(pub2, priv2, seed));
    EXPECT_EQ(pub1, pub2);
    EXPECT_EQ(priv1, priv2);
    EXPECT_EQ(priv1.size(), PRIVATE_KEY_SIZE);

    std::vector<uint8_t> derived;
    ASSERT_TRUE(CryptoBase::ed25519SkToPk(derived, priv1));
    EXPECT_EQ(derived, pub1);
}

TEST_F(CryptoBaseTest, SeedKeypairRejectsWrongSeedSize) {
    std::vector<uint8_t> pub, priv;
    EXPECT_FALSE(CryptoBase::ed25519SeedKeypair(pub, priv, std::vector<uint8_t>(16, 1)));
    EXPECT_FALSE(CryptoBase::ed25519SkToPk(pub, std::vector<uint8_t>(32, 1)));
}

TEST_F(CryptoBaseTest, SecureCleanZeroesBuffer) {
    std::vector<uint8_t> secret(32, 0xAB);
    CryptoBase::secureClean(secret);
    EXPECT_EQ(secret, std::vector<uint8_t>(32, 0x00));
}

TEST_F(CryptoBaseTest, RandomBytesRejectsNullBuffer) {
    EXPECT_FALSE(CryptoBase::randomBytes(nullptr, 8));
}
