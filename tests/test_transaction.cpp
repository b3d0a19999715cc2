#include <string>
#include <gtest/gtest.h>
#include "evm_relay/rlp.hpp"
#include "evm_relay/transaction.hpp"

using namespace evm_relay;

namespace {
    constexpr const char *GOLDEN_UNSIGNED =
            "0x02ef82210505843b9aca00843b9aca00825208947e5f4552091a69125d5dfcb7b8c2659029395bdf8649ab483a100080c0";
    constexpr const char *GOLDEN_DIGEST = "0x82bd7633e345fbe51c5aeed517303b727e9079b4008affc55bf0e18ef7929f24";
    constexpr const char *GOLDEN_SIGNED_HASH = "0x5f7eb1b426618c96eb28bec38b42077f90c4128e444d7ef31e5d10ef092335d7";

    UnsignedTransaction baseTransfer() {
        UnsignedTransaction tx;
        tx.chainId = 8453;
        tx.nonce = 5;
        tx.maxPriorityFeePerGas = 1'000'000'000;
        tx.maxFeePerGas = 1'000'000'000;
        tx.gasLimit = 21000;
        tx.to = Address::fromHex("0x7e5f4552091a69125d5dfcb7b8c2659029395bdf");
        tx.value = 81'000'000'000'000;
        return tx;
    }

    RawSignature fixedSignature() {
        RawSignature signature;
        signature.r.fill(0x11);
        signature.r[0] = 0x00;
        signature.s.fill(0x22);
        return signature;
    }

    std::string goldenSigned() {
        return "0x02f87182210505843b9aca00843b9aca00825208947e5f4552091a69125d5dfcb7b8c2659029395bdf8649ab483a100080c0"
               "01"
               "9f" + std::string(62, '1') + "a0" + std::string(64, '2');
    }
} // namespace

TEST(TransactionCodec, GoldenUnsignedEncoding) {
    const auto encoded = TransactionCodec::encodeUnsigned(baseTransfer());
    EXPECT_EQ(TransactionCodec::toHex(encoded), GOLDEN_UNSIGNED);
    EXPECT_EQ(bytesToHex(TransactionCodec::digest(encoded)), GOLDEN_DIGEST);
}

TEST(TransactionCodec, ZeroFieldsEncodeAsEmptyStrings) {
    UnsignedTransaction tx = baseTransfer();
    tx.chainId = 17000;
    tx.nonce = 0;
    tx.maxPriorityFeePerGas = 2'000'000'000;
    tx.maxFeePerGas = 20'000'000'000;
    tx.value = 0;
    EXPECT_EQ(bytesToHex(TransactionCodec::encodeUnsigned(tx)),
              "0x02ea8242688084773594008504a817c800825208947e5f4552091a69125d5dfcb7b8c2659029395bdf8080c0");
}

TEST(TransactionCodec, GoldenSignedEncoding) {
    const auto tx = baseTransfer();
    const auto encoded = TransactionCodec::encodeSigned(tx, 1, fixedSignature());
    EXPECT_EQ(bytesToHex(encoded), goldenSigned());
    EXPECT_EQ(bytesToHex(TransactionCodec::transactionHash(encoded)), GOLDEN_SIGNED_HASH);

    const SignedTransaction signedTx{tx, {1, fixedSignature()}};
    EXPECT_EQ(TransactionCodec::encodeSigned(signedTx), encoded);
}

TEST(TransactionCodec, DecodeSignedReproducesFields) {
    auto tx = baseTransfer();
    tx.data = {0xa9, 0x05, 0x9c, 0xbb};
    Hash256 storageKey{};
    storageKey[31] = 0x07;
    tx.accessList.push_back({Address::fromHex("0xa0a0a0a0a0a0a0a0a0a0a0a0a0a0a0a0a0a0a0a0"), {storageKey}});
    tx.value = intx::from_string<intx::uint256>("1000000000000000000000000");

    const auto decoded = TransactionCodec::decode(TransactionCodec::encodeSigned(tx, 0, fixedSignature()));
    EXPECT_EQ(decoded.tx, tx);
    ASSERT_TRUE(decoded.signature.has_value());
    EXPECT_EQ(decoded.signature->yParity, 0);
    EXPECT_EQ(decoded.signature->signature, fixedSignature());
}

TEST(TransactionCodec, DecodeUnsignedHasNoSignature) {
    const auto decoded = TransactionCodec::decode(hexToBytes(GOLDEN_UNSIGNED, true));
    EXPECT_EQ(decoded.tx, baseTransfer());
    EXPECT_FALSE(decoded.signature.has_value());
}

TEST(TransactionCodec, DecodeRejectsMalformedInput) {
    auto wrongType = hexToBytes(GOLDEN_UNSIGNED, true);
    wrongType[0] = 0x01;
    EXPECT_THROW(static_cast<void>(TransactionCodec::decode(wrongType)), RLPDecodingException);
    EXPECT_THROW(static_cast<void>(TransactionCodec::decode(Bytes{})), RLPDecodingException);

    std::vector<RLPItem> tooFew(3, RLPItem(std::vector<uint8_t>{0x01}));
    auto shortList = RLPEncoder::encode(tooFew);
    shortList.insert(shortList.begin(), EIP1559_TX_TYPE);
    EXPECT_THROW(static_cast<void>(TransactionCodec::decode(shortList)), RLPDecodingException);

    std::vector<RLPItem> fields;
    fields.emplace_back(std::vector<uint8_t>{0x21, 0x05});
    fields.emplace_back(std::vector<uint8_t>{0x00, 0x05});
    for (int i = 0; i < 3; ++i)
        fields.emplace_back(std::vector<uint8_t>{0x01});
    fields.emplace_back(std::vector<uint8_t>(20, 0x7e));
    fields.emplace_back(std::vector<uint8_t>{});
    fields.emplace_back(std::vector<uint8_t>{});
    fields.emplace_back(std::vector<RLPItem>{});
    auto leadingZeroNonce = RLPEncoder::encode(fields);
    leadingZeroNonce.insert(leadingZeroNonce.begin(), EIP1559_TX_TYPE);
    EXPECT_THROW(static_cast<void>(TransactionCodec::decode(leadingZeroNonce)), RLPException);
}

TEST(TransactionCodec, RejectsParityAboveOne) {
    EXPECT_THROW(static_cast<void>(TransactionCodec::encodeSigned(baseTransfer(), 2, fixedSignature())),
                 RLPEncodingException);
}
