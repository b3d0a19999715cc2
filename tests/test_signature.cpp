#include <gtest/gtest.h>
#include "evm_relay/address.hpp"
#include "evm_relay/crypto.hpp"
#include "evm_relay/errors.hpp"
#include "evm_relay/local_signer.hpp"
#include "evm_relay/signature.hpp"
#include "fakes.hpp"

using namespace evm_relay;

namespace {
    struct Signed {
        Hash256 digest;
        RawSignature signature;
        int recoveryId;
        PublicKeyBytes publicKey;
    };

    Signed signWithTestKey(const std::string_view message) {
        const auto key = parsePrivateKey(test::TEST_PRIVATE_KEY);
        const auto digest = keccakHash(message);
        const auto [signature, recoveryId] = signHash(digest, key);
        return {digest, signature, recoveryId, derivePublicKey(key)};
    }

    ErrorKind kindOf(const auto &func) {
        try {
            func();
        } catch (const RelayException &e) {
            return e.kind();
        }
        ADD_FAILURE() << "expected a RelayException";
        return ErrorKind::InvalidInput;
    }
} // namespace

TEST(SignatureRecovery, FindsParityOfOwnSignature) {
    for (const auto *message: {"relay", "bridge", "0x02ef"}) {
        const auto s = signWithTestKey(message);
        EXPECT_EQ(recoverIndicator(s.digest, s.signature, s.publicKey), s.recoveryId) << message;
        EXPECT_TRUE(isLowS(s.signature.s));
    }
}

TEST(SignatureRecovery, OtherDigestFails) {
    const auto s = signWithTestKey("relay");
    const auto other = keccakHash(std::string_view("another message"));
    EXPECT_EQ(kindOf([&] { static_cast<void>(recoverIndicator(other, s.signature, s.publicKey)); }),
              ErrorKind::SignatureRecoveryFailed);
}

TEST(SignatureRecovery, OtherKeyFails) {
    const auto s = signWithTestKey("relay");
    const auto otherKey = derivePublicKey(parsePrivateKey(
            "0x0000000000000000000000000000000000000000000000000000000000000001"));
    EXPECT_EQ(kindOf([&] { static_cast<void>(recoverIndicator(s.digest, s.signature, otherKey)); }),
              ErrorKind::SignatureRecoveryFailed);
}

TEST(SignatureRecovery, RejectsMalformedScalars) {
    const auto s = signWithTestKey("relay");

    auto zeroR = s.signature;
    zeroR.r.fill(0);
    EXPECT_EQ(kindOf([&] { static_cast<void>(recoverIndicator(s.digest, zeroR, s.publicKey)); }),
              ErrorKind::InvalidSignatureEncoding);

    auto sAtOrder = s.signature;
    sAtOrder.s = SECP256K1_ORDER;
    EXPECT_EQ(kindOf([&] { static_cast<void>(recoverIndicator(s.digest, sAtOrder, s.publicKey)); }),
              ErrorKind::InvalidSignatureEncoding);

    auto badPrefix = s.publicKey;
    badPrefix[0] = 0x03;
    EXPECT_EQ(kindOf([&] { static_cast<void>(recoverIndicator(s.digest, s.signature, badPrefix)); }),
              ErrorKind::InvalidPublicKey);
}

TEST(SignatureRecovery, ScalarRangeChecks) {
    std::array<uint8_t, WORD_SIZE> scalar{};
    EXPECT_FALSE(isValidSignatureScalar(scalar));
    scalar[31] = 1;
    EXPECT_TRUE(isValidSignatureScalar(scalar));
    EXPECT_FALSE(isValidSignatureScalar(SECP256K1_ORDER));
    EXPECT_FALSE(isLowS(SECP256K1_ORDER));
}

TEST(LocalKeySigner, SignsForDerivedKey) {
    const auto signer = test::makeTestSigner();
    const DerivationPath path{{0x01}, {0xde, 0xad}};
    const auto rootKey = signer->publicKey(test::TEST_KEY_ID, {}).get();
    const auto childKey = signer->publicKey(test::TEST_KEY_ID, path).get();
    EXPECT_EQ(deriveAddress(rootKey).toChecksumHex(), test::TEST_SIGNER_ADDRESS);
    EXPECT_NE(rootKey, childKey);

    const auto digest = keccakHash(std::string_view("derived"));
    const auto signature = signer->sign(digest, test::TEST_KEY_ID, path).get();
    EXPECT_NO_THROW(static_cast<void>(recoverIndicator(digest, signature, childKey)));
    EXPECT_EQ(kindOf([&] { static_cast<void>(recoverIndicator(digest, signature, rootKey)); }),
              ErrorKind::SignatureRecoveryFailed);
}

TEST(LocalKeySigner, RejectsUnknownKeyId) {
    const auto signer = test::makeTestSigner();
    auto pending = signer->sign(keccakHash(std::string_view("x")), "other_key", {});
    EXPECT_EQ(kindOf([&] { static_cast<void>(pending.get()); }), ErrorKind::SigningFailed);
    EXPECT_EQ(kindOf([] { LocalKeySigner bad(SecureString("0x1234"), test::TEST_KEY_ID); }), ErrorKind::SigningFailed);
}
