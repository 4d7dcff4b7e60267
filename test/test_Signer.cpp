#include <gtest/gtest.h>
#include "tacmesh/CryptoBase.hpp"
#include "tacmesh/Signer.hpp"
#include "tacmesh/Types.hpp"

#include <stdexcept>
#include <string>
#include <vector>

using namespace tacmesh;

class SignerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_TRUE(CryptoBase::initialize());
    }

    KeyRing ring;
    std::vector<uint8_t> data{'h', 'o', 'l', 'd'};
};

// ============================================================================
// KEY RING
// ============================================================================

TEST_F(SignerTest, SignerRegistersItsKey) {
    Ed25519Signer alpha("alpha", ring);

    EXPECT_TRUE(ring.hasKey("alpha"));
    EXPECT_EQ(ring.keyFor("alpha"), alpha.publicKey());
    EXPECT_EQ(ring.size(), 1u);
    EXPECT_TRUE(ring.keyFor("bravo").empty());
}

TEST_F(SignerTest, KeyRingRejectsBadAndConflictingKeys) {
    EXPECT_FALSE(ring.addKey("alpha", std::vector<uint8_t>(5, 1)));
    EXPECT_FALSE(ring.addKey("", std::vector<uint8_t>(PUBLIC_KEY_SIZE, 1)));
    EXPECT_FALSE(ring.addKeyEncoded("alpha", "not*base64"));

    ASSERT_TRUE(ring.addKey("alpha", std::vector<uint8_t>(PUBLIC_KEY_SIZE, 1)));
    EXPECT_TRUE(ring.addKey("alpha", std::vector<uint8_t>(PUBLIC_KEY_SIZE, 1)));
    EXPECT_FALSE(ring.addKey("alpha", std::vector<uint8_t>(PUBLIC_KEY_SIZE, 2)));
}

TEST_F(SignerTest, ProvisionedKeyMustMatchSeed) {
    std::vector<uint8_t> seed(SEED_SIZE, 7);
    KeyRing provisioning;
    Ed25519Signer original("alpha", seed, provisioning);

    ASSERT_TRUE(ring.addKeyEncoded("alpha", CryptoBase::base64Encode(original.publicKey())));
    EXPECT_NO_THROW(Ed25519Signer("alpha", seed, ring));

    std::vector<uint8_t> otherSeed(SEED_SIZE, 8);
    EXPECT_THROW(Ed25519Signer("alpha", otherSeed, ring), std::invalid_argument);
    EXPECT_THROW(Ed25519Signer("bravo", std::vector<uint8_t>(3, 0), ring), std::invalid_argument);
}

// ============================================================================
// SIGNATURES
// ============================================================================

TEST_F(SignerTest, SeedIsDeterministic) {
    std::vector<uint8_t> seed(SEED_SIZE, 9);
    KeyRing ringA;
    KeyRing ringB;
    Ed25519Signer a("alpha", seed, ringA);
    Ed25519Signer b("alpha", seed, ringB);

    EXPECT_EQ(a.publicKey(), b.publicKey());
    EXPECT_EQ(a.sign(data), b.sign(data));
}

TEST_F(SignerTest, SignAndVerifyThroughRing) {
    Ed25519Signer alpha("alpha", ring);
    Ed25519Signer bravo("bravo", ring);

    std::vector<uint8_t> signature = alpha.sign(data);
    ASSERT_EQ(signature.size(), SIGNATURE_SIZE);

    EXPECT_TRUE(bravo.verify("alpha", data, signature));
    EXPECT_FALSE(bravo.verify("bravo", data, signature));
    EXPECT_FALSE(bravo.verify("charlie", data, signature));
}

TEST_F(SignerTest, TamperingBreaksSignature) {
    Ed25519Signer alpha("alpha", ring);
    std::vector<uint8_t> signature = alpha.sign(data);

    std::vector<uint8_t> altered = data;
    altered[0] ^= 0x01;
    EXPECT_FALSE(alpha.verify("alpha", altered, signature));

    std::vector<uint8_t> badSignature = signature;
    badSignature[10] ^= 0x80;
    EXPECT_FALSE(alpha.verify("alpha", data, badSignature));

    EXPECT_FALSE(Ed25519Signer::verifyDetached(alpha.publicKey(), data, {}));
    EXPECT_FALSE(Ed25519Signer::verifyDetached({}, data, signature));
    EXPECT_TRUE(Ed25519Signer::verifyDetached(alpha.publicKey(), data, signature));
}
