#include <algorithm>
#include <string_view>
#include <gtest/gtest.h>
#include "evm_relay/address.hpp"
#include "evm_relay/crypto.hpp"
#include "evm_relay/errors.hpp"
#include "evm_relay/rlp.hpp"

using namespace evm_relay;

namespace {
    PublicKeyBytes publicKeyFromHex(const std::string_view hex) {
        const auto bytes = hexToBytes(hex, true);
        PublicKeyBytes key{};
        std::ranges::copy(bytes, key.begin());
        return key;
    }

    constexpr std::string_view GENERATOR_KEY =
            "0479be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
            "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8";

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

TEST(Address, DeriveFromGeneratorKey) {
    const auto address = deriveAddress(publicKeyFromHex(GENERATOR_KEY));
    EXPECT_EQ(address.toHex(), "0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
    EXPECT_EQ(address.toChecksumHex(), "0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
    EXPECT_EQ(deriveAddress(publicKeyFromHex(GENERATOR_KEY)), address);
}

TEST(Address, DeriveFromPrivateKey) {
    const auto privateKey = parsePrivateKey("0x4c0883a69102937d6231471b5dbb6204fe5129617082792ae468d01a3f362318");
    const auto publicKey = derivePublicKey(privateKey);
    EXPECT_EQ(bytesToHex(publicKey),
              "0x044e3b81af9c2234cad09d679ce6035ed1392347ce64ce405f5dcd36228a25de6e"
              "47fd35c4215d1edf53e6f83de344615ce719bdb0fd878f6ed76f06dd277956de");
    EXPECT_EQ(deriveAddress(publicKey).toChecksumHex(), "0x2c7536E3605D9C16a7a3D7b1898e529396a65c23");
}

TEST(Address, RejectsMalformedPublicKeys) {
    auto compressedPrefix = publicKeyFromHex(GENERATOR_KEY);
    compressedPrefix[0] = 0x02;
    EXPECT_EQ(kindOf([&] { static_cast<void>(deriveAddress(compressedPrefix)); }), ErrorKind::InvalidPublicKey);

    PublicKeyBytes offCurve{};
    offCurve[0] = UNCOMPRESSED_KEY_PREFIX;
    EXPECT_EQ(kindOf([&] { static_cast<void>(deriveAddress(offCurve)); }), ErrorKind::InvalidPublicKey);
}

TEST(Address, ParsesHex) {
    const auto lower = Address::fromHex("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
    const auto checksummed = Address::fromHex("0x7E5F4552091A69125d5DfCb7b8C2659029395Bdf");
    const auto upper = Address::fromHex("0x7E5F4552091A69125D5DFCB7B8C2659029395BDF");
    EXPECT_EQ(lower, checksummed);
    EXPECT_EQ(lower, upper);
    EXPECT_EQ(lower.bytes()[0], 0x7e);
    EXPECT_EQ(lower.bytes()[19], 0xdf);
}

TEST(Address, RejectsBadHex) {
    EXPECT_EQ(kindOf([] { static_cast<void>(Address::fromHex("0x7e5F4552091A69125d5DfCb7b8C2659029395Bdf")); }),
              ErrorKind::InvalidAddress);
    EXPECT_EQ(kindOf([] { static_cast<void>(Address::fromHex("7e5f4552091a69125d5dfcb7b8c2659029395bdf")); }),
              ErrorKind::InvalidAddress);
    EXPECT_EQ(kindOf([] { static_cast<void>(Address::fromHex("0x7e5f4552091a69125d5dfcb7b8c2659029395bd")); }),
              ErrorKind::InvalidAddress);
    EXPECT_EQ(kindOf([] { static_cast<void>(Address::fromHex("0x7e5f4552091a69125d5dfcb7b8c2659029395bdg")); }),
              ErrorKind::InvalidAddress);

    EXPECT_TRUE(isValidAddress("0x2c7536E3605D9C16a7a3D7b1898e529396a65c23"));
    EXPECT_FALSE(isValidAddress("0x123"));
    EXPECT_FALSE(isValidAddress(""));
}
