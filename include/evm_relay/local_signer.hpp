#pragma once

#include <string>
#include "evm_relay/capabilities.hpp"
#include "evm_relay/crypto.hpp"

namespace evm_relay {
    /**
     * In-process stand-in for a threshold signer, backed by a single secp256k1 root key. Child keys are derived per
     * derivation path; requests for any key id other than the configured one fail with SigningFailed.
     */
    class LocalKeySigner final : public SigningCapability, public PublicKeyCapability {
        SecureBytes rootKey_;
        std::string keyId_;

        [[nodiscard]] SecureBytes childKey(const std::string &keyId, const DerivationPath &path) const;

    public:
        LocalKeySigner(const SecureString &privateKeyHex, std::string keyId);

        [[nodiscard]] std::future<RawSignature> sign(const Hash256 &digest, const std::string &keyId,
                                                     const DerivationPath &path) override;
        [[nodiscard]] std::future<PublicKeyBytes> publicKey(const std::string &keyId,
                                                            const DerivationPath &path) override;

        [[nodiscard]] const std::string &keyId() const noexcept { return keyId_; }
    };
} // namespace evm_relay
