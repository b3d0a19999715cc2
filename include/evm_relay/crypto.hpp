#pragma once

#include <cstdlib>
#include <limits>
#include <new>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <openssl/crypto.h>
#include <sys/mman.h>
#include "evm_relay/types.hpp"

struct secp256k1_context_struct;

namespace evm_relay {
    template<typename T>
    struct SecureAllocator {
        using value_type = T;
        template<typename U>
        struct rebind {
            using other = SecureAllocator<U>;
        };
        SecureAllocator() = default;
        template<typename U>
        explicit SecureAllocator(const SecureAllocator<U> &) noexcept {}
        static T *allocate(const std::size_t n) {
            if (n > std::numeric_limits<std::size_t>::max() / sizeof(T))
                throw std::bad_alloc();
            void *ptr = std::aligned_alloc(alignof(T), n * sizeof(T));
            if (!ptr)
                throw std::bad_alloc();
            if (mlock(ptr, n * sizeof(T)) != 0) {
                std::free(ptr);
                throw std::runtime_error("Failed to lock memory");
            }
            return static_cast<T *>(ptr);
        }
        static void deallocate(T *ptr, const std::size_t n) noexcept {
            if (!ptr)
                return;
            OPENSSL_cleanse(ptr, n * sizeof(T));
            munlock(ptr, n * sizeof(T));
            std::free(ptr);
        }
        bool operator==(const SecureAllocator &) const noexcept { return true; }
        bool operator!=(const SecureAllocator &) const noexcept { return false; }
    };

    using SecureString = std::basic_string<char, std::char_traits<char>, SecureAllocator<char>>;
    using SecureBytes = std::vector<uint8_t, SecureAllocator<uint8_t>>;

    /// Process-wide secp256k1 context, created and randomized on first use.
    class Secp256k1Manager {
    public:
        static secp256k1_context_struct *getContext();
    };

    [[nodiscard]] Hash256 keccakHash(std::span<const uint8_t> data);
    [[nodiscard]] Hash256 keccakHash(std::string_view text);

    [[nodiscard]] SecureBytes parsePrivateKey(const SecureString &keyHex);

    /// Adds keccak256(component) to the key for each path component, in order.
    [[nodiscard]] SecureBytes deriveChildKey(std::span<const uint8_t> rootKey, const DerivationPath &path);

    [[nodiscard]] PublicKeyBytes derivePublicKey(std::span<const uint8_t> privateKey);

    /// Signs a 32-byte digest. Returns the compact (r, s) pair and the recovery id libsecp256k1 reports.
    [[nodiscard]] std::pair<RawSignature, int> signHash(std::span<const uint8_t> hash,
                                                        std::span<const uint8_t> privateKey);
} // namespace evm_relay
