#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include "evm_relay/types.hpp"

namespace evm_relay {
    class Address {
        std::array<uint8_t, ADDRESS_SIZE> bytes_{};

    public:
        Address() = default;
        explicit Address(const std::array<uint8_t, ADDRESS_SIZE> &bytes) noexcept : bytes_(bytes) {}

        /// Accepts "0x" followed by 40 hex digits. Mixed-case input must carry a valid EIP-55 checksum.
        [[nodiscard]] static Address fromHex(std::string_view hex);
        [[nodiscard]] static Address fromBytes(std::span<const uint8_t> bytes);

        [[nodiscard]] const std::array<uint8_t, ADDRESS_SIZE> &bytes() const noexcept { return bytes_; }
        [[nodiscard]] std::string toHex() const;
        [[nodiscard]] std::string toChecksumHex() const;

        bool operator==(const Address &) const = default;
    };

    /// Low 20 bytes of keccak256 over the 64-byte X||Y payload of an uncompressed secp256k1 key.
    [[nodiscard]] Address deriveAddress(const PublicKeyBytes &publicKey);

    [[nodiscard]] bool isValidAddress(std::string_view hex) noexcept;
} // namespace evm_relay
