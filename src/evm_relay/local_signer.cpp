#include "evm_relay/local_signer.hpp"

#include <stdexcept>
#include <fmt/format.h>
#include "evm_relay/errors.hpp"

namespace evm_relay {
    LocalKeySigner::LocalKeySigner(const SecureString &privateKeyHex, std::string keyId) : keyId_(std::move(keyId)) {
        try {
            rootKey_ = parsePrivateKey(privateKeyHex);
        } catch (const std::runtime_error &e) {
            throw RelayException(ErrorKind::SigningFailed, fmt::format("Unusable signer key: {}", e.what()));
        }
    }

    SecureBytes LocalKeySigner::childKey(const std::string &keyId, const DerivationPath &path) const {
        if (keyId != keyId_)
            throw RelayException(ErrorKind::SigningFailed, fmt::format("Unknown key id '{}'", keyId));
        try {
            return deriveChildKey(rootKey_, path);
        } catch (const std::runtime_error &e) {
            throw RelayException(ErrorKind::SigningFailed, e.what());
        }
    }

    std::future<RawSignature> LocalKeySigner::sign(const Hash256 &digest, const std::string &keyId,
                                                   const DerivationPath &path) {
        return std::async(std::launch::async, [this, digest, keyId, path] {
            const auto key = childKey(keyId, path);
            try {
                return signHash(digest, key).first;
            } catch (const std::runtime_error &e) {
                throw RelayException(ErrorKind::SigningFailed, e.what());
            }
        });
    }

    std::future<PublicKeyBytes> LocalKeySigner::publicKey(const std::string &keyId, const DerivationPath &path) {
        return std::async(std::launch::async, [this, keyId, path] {
            const auto key = childKey(keyId, path);
            try {
                return derivePublicKey(key);
            } catch (const std::runtime_error &e) {
                throw RelayException(ErrorKind::SigningFailed, e.what());
            }
        });
    }
} // namespace evm_relay
