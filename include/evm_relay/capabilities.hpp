#pragma once

#include <future>
#include <string>
#include <string_view>
#include "evm_relay/types.hpp"

namespace evm_relay {
    /// Threshold or remote signer. Returns the raw (r, s) pair only; the parity is recovered by the caller.
    class SigningCapability {
    public:
        virtual ~SigningCapability() = default;
        [[nodiscard]] virtual std::future<RawSignature> sign(const Hash256 &digest, const std::string &keyId,
                                                             const DerivationPath &path) = 0;
    };

    /// Uncompressed (0x04 || X || Y) public key of the signer for a key id and derivation path.
    class PublicKeyCapability {
    public:
        virtual ~PublicKeyCapability() = default;
        [[nodiscard]] virtual std::future<PublicKeyBytes> publicKey(const std::string &keyId,
                                                                    const DerivationPath &path) = 0;
    };

    /// Single-component path holding the caller's identity bytes; every caller gets its own address.
    [[nodiscard]] inline DerivationPath callerDerivationPath(const std::string_view callerId) {
        return {std::vector<uint8_t>(callerId.begin(), callerId.end())};
    }
} // namespace evm_relay
