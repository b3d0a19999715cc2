#include "evm_relay/crypto.hpp"

#include <array>
#include <cstring>
#include <memory>
#include <mutex>
#include <ethash/keccak.hpp>
#include <openssl/rand.h>
#include <secp256k1.h>
#include <secp256k1_recovery.h>
#include "evm_relay/rlp.hpp"

namespace evm_relay {
    secp256k1_context *Secp256k1Manager::getContext() {
        static std::shared_ptr<secp256k1_context> globalContext;
        static std::once_flag initFlag;
        std::call_once(initFlag, [] {
            globalContext.reset(secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY),
                                secp256k1_context_destroy);
            std::array<uint8_t, 32> seed{};
            if (!RAND_bytes(seed.data(), seed.size())) {
                throw std::runtime_error("Failed to generate random seed");
            }
            if (!secp256k1_context_randomize(globalContext.get(), seed.data())) {
                throw std::runtime_error("Failed to randomize secp256k1 context");
            }
            OPENSSL_cleanse(seed.data(), seed.size());
        });
        return globalContext.get();
    }

    Hash256 keccakHash(const std::span<const uint8_t> data) {
        const auto hash = ethash::keccak256(data.data(), data.size());
        Hash256 result{};
        std::memcpy(result.data(), hash.bytes, result.size());
        return result;
    }

    Hash256 keccakHash(const std::string_view text) {
        return keccakHash(std::span(reinterpret_cast<const uint8_t *>(text.data()), text.size()));
    }

    SecureBytes parsePrivateKey(const SecureString &keyHex) {
        const std::string_view key = stripHexPrefix(std::string_view(keyHex.data(), keyHex.size()));
        if (key.size() != 64)
            throw std::runtime_error("Invalid private key length");
        SecureBytes bytes(32);
        for (size_t i = 0; i < 32; ++i) {
            const uint8_t high = hexNibble(key[i * 2]);
            const uint8_t low = hexNibble(key[i * 2 + 1]);
            if (high == 0xFF || low == 0xFF)
                throw std::runtime_error("Invalid hex character in private key");
            bytes[i] = static_cast<uint8_t>(high << 4 | low);
        }
        if (!secp256k1_ec_seckey_verify(Secp256k1Manager::getContext(), bytes.data()))
            throw std::runtime_error("Private key is outside the curve order");
        return bytes;
    }

    SecureBytes deriveChildKey(const std::span<const uint8_t> rootKey, const DerivationPath &path) {
        if (rootKey.size() != 32)
            throw std::runtime_error("Invalid private key size");
        const auto *ctx = Secp256k1Manager::getContext();
        SecureBytes key(rootKey.begin(), rootKey.end());
        for (const auto &component: path) {
            auto tweak = keccakHash(component);
            const int ok = secp256k1_ec_seckey_tweak_add(ctx, key.data(), tweak.data());
            OPENSSL_cleanse(tweak.data(), tweak.size());
            if (!ok)
                throw std::runtime_error("Derivation path produced an invalid key");
        }
        return key;
    }

    PublicKeyBytes derivePublicKey(const std::span<const uint8_t> privateKey) {
        if (privateKey.size() != 32)
            throw std::runtime_error("Invalid private key size");
        const auto *ctx = Secp256k1Manager::getContext();
        secp256k1_pubkey pubkey;
        if (!secp256k1_ec_pubkey_create(ctx, &pubkey, privateKey.data()))
            throw std::runtime_error("Invalid private key");
        PublicKeyBytes out{};
        size_t outLen = out.size();
        secp256k1_ec_pubkey_serialize(ctx, out.data(), &outLen, &pubkey, SECP256K1_EC_UNCOMPRESSED);
        return out;
    }

    std::pair<RawSignature, int> signHash(const std::span<const uint8_t> hash, const std::span<const uint8_t> privateKey) {
        if (hash.size() != 32)
            throw std::runtime_error("Invalid digest size");
        if (privateKey.size() != 32)
            throw std::runtime_error("Invalid private key size");
        const auto *ctx = Secp256k1Manager::getContext();
        if (!secp256k1_ec_seckey_verify(ctx, privateKey.data())) {
            throw std::runtime_error("Invalid private key");
        }
        secp256k1_ecdsa_recoverable_signature rSignature;
        if (!secp256k1_ecdsa_sign_recoverable(ctx, &rSignature, hash.data(), privateKey.data(), nullptr, nullptr)) {
            throw std::runtime_error("Failed to sign hash");
        }
        int recoveryId = 0;
        std::array<uint8_t, 64> output{};
        secp256k1_ecdsa_recoverable_signature_serialize_compact(ctx, output.data(), &recoveryId, &rSignature);
        RawSignature signature;
        std::memcpy(signature.r.data(), output.data(), 32);
        std::memcpy(signature.s.data(), output.data() + 32, 32);
        return {signature, recoveryId};
    }
} // namespace evm_relay
