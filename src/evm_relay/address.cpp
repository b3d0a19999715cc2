#include "evm_relay/address.hpp"

#include <algorithm>
#include <cctype>
#include <secp256k1.h>
#include "evm_relay/crypto.hpp"
#include "evm_relay/errors.hpp"
#include "evm_relay/rlp.hpp"

namespace evm_relay {
    namespace {
        std::string checksum(const std::string_view lowerHexDigits) {
            const auto hash = keccakHash(lowerHexDigits);
            std::string out;
            out.reserve(lowerHexDigits.size());
            for (size_t i = 0; i < lowerHexDigits.size(); ++i) {
                const char c = lowerHexDigits[i];
                const uint8_t nibble = i % 2 == 0 ? hash[i / 2] >> 4 : hash[i / 2] & 0x0f;
                out += nibble >= 8 ? static_cast<char>(std::toupper(static_cast<unsigned char>(c))) : c;
            }
            return out;
        }
    } // namespace

    Address Address::fromHex(const std::string_view hex) {
        if (hex.size() != 2 + 2 * ADDRESS_SIZE || stripHexPrefix(hex).size() != 2 * ADDRESS_SIZE)
            throw RelayException(ErrorKind::InvalidAddress, "Address must be 0x followed by 40 hex characters");
        const std::string_view digits = stripHexPrefix(hex);
        if (!std::ranges::all_of(digits, [](const char c) { return hexNibble(c) != 0xFF; }))
            throw RelayException(ErrorKind::InvalidAddress, "Invalid hex character in address");
        const bool hasLower = std::ranges::any_of(digits, [](const char c) { return c >= 'a' && c <= 'f'; });
        const bool hasUpper = std::ranges::any_of(digits, [](const char c) { return c >= 'A' && c <= 'F'; });
        std::string lower(digits);
        std::ranges::transform(lower, lower.begin(), [](const char c) {
            return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        });
        if (hasLower && hasUpper && checksum(lower) != digits)
            throw RelayException(ErrorKind::InvalidAddress, "Address checksum mismatch: " + std::string(hex));
        return fromBytes(hexToBytes(lower, true));
    }

    Address Address::fromBytes(const std::span<const uint8_t> bytes) {
        if (bytes.size() != ADDRESS_SIZE)
            throw RelayException(ErrorKind::InvalidAddress, "Address must be exactly 20 bytes");
        std::array<uint8_t, ADDRESS_SIZE> raw{};
        std::ranges::copy(bytes, raw.begin());
        return Address(raw);
    }

    std::string Address::toHex() const { return bytesToHex(bytes_); }

    std::string Address::toChecksumHex() const {
        const std::string lower = toHex();
        return "0x" + checksum(std::string_view(lower).substr(2));
    }

    Address deriveAddress(const PublicKeyBytes &publicKey) {
        if (publicKey[0] != UNCOMPRESSED_KEY_PREFIX)
            throw RelayException(ErrorKind::InvalidPublicKey, "Public key must be uncompressed (0x04 prefix)");
        secp256k1_pubkey parsed;
        if (!secp256k1_ec_pubkey_parse(Secp256k1Manager::getContext(), &parsed, publicKey.data(), publicKey.size()))
            throw RelayException(ErrorKind::InvalidPublicKey, "Public key is not a point on secp256k1");
        const auto hash = keccakHash(std::span(publicKey).subspan(1));
        return Address::fromBytes(std::span(hash).subspan(WORD_SIZE - ADDRESS_SIZE));
    }

    bool isValidAddress(const std::string_view hex) noexcept {
        try {
            static_cast<void>(Address::fromHex(hex));
            return true;
        } catch (const RelayException &) {
            return false;
        }
    }
} // namespace evm_relay
