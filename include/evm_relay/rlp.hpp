/**
 * RLP wire primitives for typed transactions, plus the hex helpers used at the JSON-RPC boundary.
 */
#pragma once

#include <cstdint>
#include <exception>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace evm_relay {
    class RLPException : public std::exception {
        std::string message_;

    public:
        explicit RLPException(std::string msg) : message_(std::move(msg)) {}
        [[nodiscard]] const char *what() const noexcept override { return message_.c_str(); }
    };

    class RLPEncodingException final : public RLPException {
    public:
        explicit RLPEncodingException(std::string msg) : RLPException("RLP Encoding error: " + std::move(msg)) {}
    };

    class RLPDecodingException final : public RLPException {
    public:
        explicit RLPDecodingException(std::string msg) : RLPException("RLP Decoding error: " + std::move(msg)) {}
    };

    /// Value of a single hex digit, 0xFF if c is not one.
    [[nodiscard]] uint8_t hexNibble(char c) noexcept;
    [[nodiscard]] std::string_view stripHexPrefix(std::string_view hex) noexcept;
    [[nodiscard]] bool isHexString(std::string_view hex) noexcept;

    /**
     * Decodes an optionally 0x-prefixed hex string. Without preserveLeadingZeros the input is read as a quantity:
     * leading zero digits are dropped and "0x0" yields no bytes. Odd digit counts are left-padded.
     */
    [[nodiscard]] std::vector<uint8_t> hexToBytes(std::string_view hex, bool preserveLeadingZeros = false);
    [[nodiscard]] std::string bytesToHex(std::span<const uint8_t> bytes);

    /// JSON-RPC quantity ("0x1f") to integer.
    [[nodiscard]] uint64_t safeHexToUint64(std::string_view hex);

    class RLPItem {
        bool list_ = false;
        std::vector<uint8_t> bytes_;
        std::vector<RLPItem> items_;

    public:
        RLPItem() = default;
        explicit RLPItem(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}
        explicit RLPItem(std::vector<RLPItem> items) : list_(true), items_(std::move(items)) {}

        /// Minimal big-endian string; zero is the empty string.
        [[nodiscard]] static RLPItem fromInteger(uint64_t value);

        [[nodiscard]] bool isList() const noexcept { return list_; }
        [[nodiscard]] size_t size() const noexcept { return list_ ? items_.size() : bytes_.size(); }
        [[nodiscard]] bool empty() const noexcept { return size() == 0; }

        [[nodiscard]] const std::vector<uint8_t> &getBytes() const;
        [[nodiscard]] const std::vector<RLPItem> &getItems() const;

        /// Rejects leading zero bytes, which have no canonical encoding.
        [[nodiscard]] uint64_t toInteger() const;
    };

    class RLPEncoder {
        static void appendHeader(std::vector<uint8_t> &out, size_t payloadLength, uint8_t base);
        static void appendString(std::vector<uint8_t> &out, std::span<const uint8_t> bytes);
        static void appendList(std::vector<uint8_t> &out, std::span<const RLPItem> items);
        static void appendItem(std::vector<uint8_t> &out, const RLPItem &item);

    public:
        [[nodiscard]] static std::vector<uint8_t> encode(const RLPItem &item);
        [[nodiscard]] static std::vector<uint8_t> encode(std::span<const RLPItem> items);
        [[nodiscard]] static std::vector<uint8_t> encodeBytes(std::span<const uint8_t> bytes);
        [[nodiscard]] static std::vector<uint8_t> encodeInteger(uint64_t value);
    };

    /// Strict decoder: non-minimal lengths, wrapped single bytes and trailing input are all rejected.
    class RLPDecoder {
        static constexpr size_t MAX_DEPTH = 1024;

        struct Header {
            bool list = false;
            size_t headerLength = 0;
            size_t payloadLength = 0;
        };

        static Header readHeader(std::span<const uint8_t> input);
        static RLPItem readItem(std::span<const uint8_t> input, size_t &consumed, size_t depth);

    public:
        [[nodiscard]] static RLPItem decode(std::span<const uint8_t> data);
        [[nodiscard]] static std::vector<RLPItem> decodeList(std::span<const uint8_t> data);
    };
} // namespace evm_relay
