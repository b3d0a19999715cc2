#pragma once

#include <array>
#include <cstdint>
#include <vector>

namespace evm_relay {
    using Bytes = std::vector<uint8_t>;
    using Hash256 = std::array<uint8_t, 32>;
    using PublicKeyBytes = std::array<uint8_t, 65>;
    using RecoveryIndicator = uint8_t;
    using DerivationPath = std::vector<Bytes>;

    inline constexpr size_t ADDRESS_SIZE = 20;
    inline constexpr size_t WORD_SIZE = 32;
    inline constexpr uint8_t UNCOMPRESSED_KEY_PREFIX = 0x04;

    struct RawSignature {
        std::array<uint8_t, WORD_SIZE> r{};
        std::array<uint8_t, WORD_SIZE> s{};

        bool operator==(const RawSignature &) const = default;
    };
} // namespace evm_relay
