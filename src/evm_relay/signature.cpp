#include "evm_relay/signature.hpp"

#include <algorithm>
#include <cstring>
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include "evm_relay/crypto.hpp"
#include "evm_relay/errors.hpp"

namespace evm_relay {
    namespace {
        constexpr std::array<uint8_t, WORD_SIZE> SECP256K1_HALF_ORDER = {
                0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
                0x5d, 0x57, 0x6e, 0x73, 0x57, 0xa4, 0x50, 0x1d, 0xdf, 0xe9, 0x2f, 0x46, 0x68, 0x1b, 0x20, 0xa0};

        bool isZero(const std::span<const uint8_t, WORD_SIZE> scalar) noexcept {
            return std::ranges::all_of(scalar, [](const uint8_t b) { return b == 0; });
        }
    } // namespace

    bool isValidSignatureScalar(const std::span<const uint8_t, WORD_SIZE> scalar) noexcept {
        return !isZero(scalar) && std::ranges::lexicographical_compare(scalar, SECP256K1_ORDER);
    }

    bool isLowS(const std::span<const uint8_t, WORD_SIZE> s) noexcept {
        return !std::ranges::lexicographical_compare(SECP256K1_HALF_ORDER, s);
    }

    RecoveryIndicator recoverIndicator(const Hash256 &digest, const RawSignature &signature,
                                       const PublicKeyBytes &expectedPublicKey) {
        if (!isValidSignatureScalar(signature.r))
            throw RelayException(ErrorKind::InvalidSignatureEncoding, "Signature r must be in [1, n-1]");
        if (!isValidSignatureScalar(signature.s))
            throw RelayException(ErrorKind::InvalidSignatureEncoding, "Signature s must be in [1, n-1]");
        const auto *ctx = Secp256k1Manager::getContext();
        secp256k1_pubkey expected;
        if (expectedPublicKey[0] != UNCOMPRESSED_KEY_PREFIX
            || !secp256k1_ec_pubkey_parse(ctx, &expected, expectedPublicKey.data(), expectedPublicKey.size()))
            throw RelayException(ErrorKind::InvalidPublicKey, "Expected public key is not a valid uncompressed key");

        std::array<uint8_t, 2 * WORD_SIZE> compact{};
        std::memcpy(compact.data(), signature.r.data(), WORD_SIZE);
        std::memcpy(compact.data() + WORD_SIZE, signature.s.data(), WORD_SIZE);
        for (int parity = 0; parity <= 1; ++parity) {
            secp256k1_ecdsa_recoverable_signature recoverable;
            if (!secp256k1_ecdsa_recoverable_signature_parse_compact(ctx, &recoverable, compact.data(), parity))
                throw RelayException(ErrorKind::InvalidSignatureEncoding, "Signature does not parse");
            secp256k1_pubkey recovered;
            if (!secp256k1_ecdsa_recover(ctx, &recovered, &recoverable, digest.data()))
                continue;
            PublicKeyBytes serialized{};
            size_t serializedLen = serialized.size();
            secp256k1_ec_pubkey_serialize(ctx, serialized.data(), &serializedLen, &recovered, SECP256K1_EC_UNCOMPRESSED);
            if (serialized == expectedPublicKey)
                return static_cast<RecoveryIndicator>(parity);
        }
        throw RelayException(ErrorKind::SignatureRecoveryFailed,
                             "Neither recovery parity reproduces the signer's public key");
    }
} // namespace evm_relay
