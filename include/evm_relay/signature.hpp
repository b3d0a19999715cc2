#pragma once

#include <array>
#include <span>
#include "evm_relay/types.hpp"

namespace evm_relay {
    /// secp256k1 group order n, big-endian.
    inline constexpr std::array<uint8_t, WORD_SIZE> SECP256K1_ORDER = {
            0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xfe,
            0xba, 0xae, 0xdc, 0xe6, 0xaf, 0x48, 0xa0, 0x3b, 0xbf, 0xd2, 0x5e, 0x8c, 0xd0, 0x36, 0x41, 0x41};

    /// True when 0 < scalar < n.
    [[nodiscard]] bool isValidSignatureScalar(std::span<const uint8_t, WORD_SIZE> scalar) noexcept;

    /// True when s <= n/2.
    [[nodiscard]] bool isLowS(std::span<const uint8_t, WORD_SIZE> s) noexcept;

    /**
     * Finds the y-parity bit for a raw (r, s) signature by recovering the public key for parity 0 and then 1 and
     * comparing each against the signer's known key.
     *
     * Throws InvalidSignatureEncoding when r or s is zero or not below n, InvalidPublicKey when the expected key
     * does not parse, and SignatureRecoveryFailed when neither candidate matches.
     */
    [[nodiscard]] RecoveryIndicator recoverIndicator(const Hash256 &digest, const RawSignature &signature,
                                                     const PublicKeyBytes &expectedPublicKey);
} // namespace evm_relay
