#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>
#include <intx/intx.hpp>
#include "evm_relay/address.hpp"
#include "evm_relay/rlp.hpp"
#include "evm_relay/types.hpp"

namespace evm_relay {
    inline constexpr uint8_t EIP1559_TX_TYPE = 0x02;

    struct AccessListEntry {
        Address address;
        std::vector<Hash256> storageKeys;

        bool operator==(const AccessListEntry &) const = default;
    };

    struct UnsignedTransaction {
        uint64_t chainId = 0;
        uint64_t nonce = 0;
        uint64_t maxPriorityFeePerGas = 0;
        uint64_t maxFeePerGas = 0;
        uint64_t gasLimit = 0;
        Address to;
        intx::uint256 value = 0;
        Bytes data;
        std::vector<AccessListEntry> accessList;

        bool operator==(const UnsignedTransaction &) const = default;
    };

    struct SignatureFields {
        RecoveryIndicator yParity = 0;
        RawSignature signature;

        bool operator==(const SignatureFields &) const = default;
    };

    struct SignedTransaction {
        UnsignedTransaction tx;
        SignatureFields signature;
    };

    struct DecodedTransaction {
        UnsignedTransaction tx;
        std::optional<SignatureFields> signature;
    };

    /**
     * EIP-1559 (type 0x02) wire codec.
     *
     * Unsigned form: 0x02 || rlp([chainId, nonce, maxPriorityFeePerGas, maxFeePerGas, gasLimit, to, value, data,
     * accessList]). The signed form appends [yParity, r, s] to the same list. Integers are minimal big-endian and zero
     * encodes as the empty string.
     */
    class TransactionCodec {
    public:
        [[nodiscard]] static Bytes encodeUnsigned(const UnsignedTransaction &tx);
        [[nodiscard]] static Hash256 digest(std::span<const uint8_t> unsignedEncoding);
        [[nodiscard]] static Bytes encodeSigned(const UnsignedTransaction &tx, RecoveryIndicator yParity,
                                                const RawSignature &signature);
        [[nodiscard]] static Bytes encodeSigned(const SignedTransaction &signedTx) {
            return encodeSigned(signedTx.tx, signedTx.signature.yParity, signedTx.signature.signature);
        }

        /// Accepts both the unsigned and the signed form.
        [[nodiscard]] static DecodedTransaction decode(std::span<const uint8_t> encoded);

        /// 0x-prefixed lowercase form accepted by eth_sendRawTransaction.
        [[nodiscard]] static std::string toHex(const std::span<const uint8_t> encoded) { return bytesToHex(encoded); }

        /// Hash a node reports for a submitted transaction: keccak256 over the signed encoding.
        [[nodiscard]] static Hash256 transactionHash(std::span<const uint8_t> signedEncoding) {
            return digest(signedEncoding);
        }
    };
} // namespace evm_relay
