#include "evm_relay/rlp.hpp"

#include <algorithm>
#include <charconv>
#include <numeric>
#include <system_error>

namespace evm_relay {
    namespace {
        constexpr uint8_t STRING_BASE = 0x80;
        constexpr uint8_t LIST_BASE = 0xc0;
        constexpr size_t SHORT_PAYLOAD_LIMIT = 55;

        size_t bigEndianWidth(size_t value) noexcept {
            size_t width = 0;
            for (; value != 0; value >>= 8)
                ++width;
            return width;
        }

        bool allHexDigits(const std::string_view digits) noexcept {
            return std::ranges::all_of(digits, [](const char c) { return hexNibble(c) != 0xFF; });
        }
    } // namespace

    uint8_t hexNibble(const char c) noexcept {
        if (c >= '0' && c <= '9')
            return static_cast<uint8_t>(c - '0');
        if (c >= 'a' && c <= 'f')
            return static_cast<uint8_t>(c - 'a' + 10);
        if (c >= 'A' && c <= 'F')
            return static_cast<uint8_t>(c - 'A' + 10);
        return 0xFF;
    }

    std::string_view stripHexPrefix(const std::string_view hex) noexcept {
        if (hex.starts_with("0x") || hex.starts_with("0X"))
            return hex.substr(2);
        return hex;
    }

    bool isHexString(const std::string_view hex) noexcept { return allHexDigits(stripHexPrefix(hex)); }

    std::vector<uint8_t> hexToBytes(const std::string_view hex, const bool preserveLeadingZeros) {
        auto digits = stripHexPrefix(hex);
        if (!allHexDigits(digits)) [[unlikely]]
            throw RLPException("Invalid hex string: " + std::string(hex));
        if (!preserveLeadingZeros) {
            const auto first = digits.find_first_not_of('0');
            digits = first == std::string_view::npos ? std::string_view{} : digits.substr(first);
        }
        std::vector<uint8_t> bytes((digits.size() + 1) / 2);
        size_t pos = digits.size();
        for (auto out = bytes.rbegin(); out != bytes.rend(); ++out) {
            const uint8_t low = hexNibble(digits[--pos]);
            const uint8_t high = pos > 0 ? hexNibble(digits[--pos]) : 0;
            *out = static_cast<uint8_t>(high << 4 | low);
        }
        return bytes;
    }

    std::string bytesToHex(const std::span<const uint8_t> bytes) {
        static constexpr char digits[] = "0123456789abcdef";
        std::string out(2 + bytes.size() * 2, '0');
        out[1] = 'x';
        for (size_t i = 0; i < bytes.size(); ++i) {
            out[2 + 2 * i] = digits[bytes[i] >> 4];
            out[3 + 2 * i] = digits[bytes[i] & 0x0f];
        }
        return out;
    }

    uint64_t safeHexToUint64(const std::string_view hex) {
        const auto digits = stripHexPrefix(hex);
        uint64_t value = 0;
        const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, 16);
        if (ec == std::errc::result_out_of_range) [[unlikely]]
            throw RLPException("Hex quantity exceeds uint64_t range: " + std::string(hex));
        if (digits.empty() || ec != std::errc{} || end != digits.data() + digits.size()) [[unlikely]]
            throw RLPException("Invalid hex quantity: " + std::string(hex));
        return value;
    }

    RLPItem RLPItem::fromInteger(uint64_t value) {
        std::vector<uint8_t> bytes(bigEndianWidth(value));
        for (auto out = bytes.rbegin(); out != bytes.rend(); ++out, value >>= 8)
            *out = static_cast<uint8_t>(value & 0xff);
        return RLPItem(std::move(bytes));
    }

    const std::vector<uint8_t> &RLPItem::getBytes() const {
        if (list_) [[unlikely]]
            throw RLPException("Expected an RLP string, found a list");
        return bytes_;
    }

    const std::vector<RLPItem> &RLPItem::getItems() const {
        if (!list_) [[unlikely]]
            throw RLPException("Expected an RLP list, found a string");
        return items_;
    }

    uint64_t RLPItem::toInteger() const {
        const auto &bytes = getBytes();
        if (bytes.size() > sizeof(uint64_t)) [[unlikely]]
            throw RLPDecodingException("Integer wider than 64 bits");
        if (!bytes.empty() && bytes.front() == 0) [[unlikely]]
            throw RLPDecodingException("Integer has leading zero bytes");
        return std::accumulate(bytes.begin(), bytes.end(), uint64_t{0},
                               [](const uint64_t acc, const uint8_t b) { return acc << 8 | b; });
    }

    void RLPEncoder::appendHeader(std::vector<uint8_t> &out, const size_t payloadLength, const uint8_t base) {
        if (payloadLength <= SHORT_PAYLOAD_LIMIT) {
            out.push_back(static_cast<uint8_t>(base + payloadLength));
            return;
        }
        const size_t width = bigEndianWidth(payloadLength);
        out.push_back(static_cast<uint8_t>(base + SHORT_PAYLOAD_LIMIT + width));
        for (size_t shift = width; shift-- > 0;)
            out.push_back(static_cast<uint8_t>(payloadLength >> (shift * 8)));
    }

    void RLPEncoder::appendString(std::vector<uint8_t> &out, const std::span<const uint8_t> bytes) {
        if (bytes.size() == 1 && bytes[0] < STRING_BASE) {
            out.push_back(bytes[0]);
            return;
        }
        appendHeader(out, bytes.size(), STRING_BASE);
        out.insert(out.end(), bytes.begin(), bytes.end());
    }

    void RLPEncoder::appendList(std::vector<uint8_t> &out, const std::span<const RLPItem> items) {
        std::vector<uint8_t> payload;
        for (const auto &item: items)
            appendItem(payload, item);
        appendHeader(out, payload.size(), LIST_BASE);
        out.insert(out.end(), payload.begin(), payload.end());
    }

    void RLPEncoder::appendItem(std::vector<uint8_t> &out, const RLPItem &item) {
        if (item.isList())
            appendList(out, item.getItems());
        else
            appendString(out, item.getBytes());
    }

    std::vector<uint8_t> RLPEncoder::encode(const RLPItem &item) {
        std::vector<uint8_t> out;
        appendItem(out, item);
        return out;
    }

    std::vector<uint8_t> RLPEncoder::encode(const std::span<const RLPItem> items) {
        std::vector<uint8_t> out;
        appendList(out, items);
        return out;
    }

    std::vector<uint8_t> RLPEncoder::encodeBytes(const std::span<const uint8_t> bytes) {
        std::vector<uint8_t> out;
        appendString(out, bytes);
        return out;
    }

    std::vector<uint8_t> RLPEncoder::encodeInteger(const uint64_t value) { return encode(RLPItem::fromInteger(value)); }

    RLPDecoder::Header RLPDecoder::readHeader(const std::span<const uint8_t> input) {
        if (input.empty()) [[unlikely]]
            throw RLPDecodingException("Unexpected end of input");
        const uint8_t prefix = input[0];
        if (prefix < STRING_BASE)
            return {false, 0, 1};

        Header header;
        header.list = prefix >= LIST_BASE;
        const size_t code = prefix - (header.list ? LIST_BASE : STRING_BASE);
        if (code <= SHORT_PAYLOAD_LIMIT) {
            header.headerLength = 1;
            header.payloadLength = code;
        } else {
            const size_t width = code - SHORT_PAYLOAD_LIMIT;
            if (input.size() < 1 + width) [[unlikely]]
                throw RLPDecodingException("Truncated length prefix");
            if (input[1] == 0) [[unlikely]]
                throw RLPDecodingException("Length prefix has leading zero bytes");
            size_t length = 0;
            for (size_t i = 1; i <= width; ++i)
                length = length << 8 | input[i];
            if (length <= SHORT_PAYLOAD_LIMIT) [[unlikely]]
                throw RLPDecodingException("Long-form length used for a short payload");
            header.headerLength = 1 + width;
            header.payloadLength = length;
        }
        if (header.payloadLength > input.size() - header.headerLength) [[unlikely]]
            throw RLPDecodingException("Payload runs past the end of input");
        if (!header.list && header.payloadLength == 1 && input[header.headerLength] < STRING_BASE) [[unlikely]]
            throw RLPDecodingException("Single byte below 0x80 must encode as itself");
        return header;
    }

    RLPItem RLPDecoder::readItem(const std::span<const uint8_t> input, size_t &consumed, const size_t depth) {
        if (depth > MAX_DEPTH) [[unlikely]]
            throw RLPDecodingException("Maximum nesting depth exceeded");
        const auto header = readHeader(input);
        const auto payload = input.subspan(header.headerLength, header.payloadLength);
        consumed = header.headerLength + header.payloadLength;
        if (!header.list)
            return RLPItem(std::vector<uint8_t>(payload.begin(), payload.end()));

        std::vector<RLPItem> items;
        for (size_t offset = 0; offset < payload.size();) {
            size_t used = 0;
            items.push_back(readItem(payload.subspan(offset), used, depth + 1));
            offset += used;
        }
        return RLPItem(std::move(items));
    }

    RLPItem RLPDecoder::decode(const std::span<const uint8_t> data) {
        if (data.empty()) [[unlikely]]
            throw RLPDecodingException("Cannot decode empty data");
        size_t consumed = 0;
        auto item = readItem(data, consumed, 0);
        if (consumed != data.size()) [[unlikely]]
            throw RLPDecodingException("Trailing bytes after RLP item");
        return item;
    }

    std::vector<RLPItem> RLPDecoder::decodeList(const std::span<const uint8_t> data) {
        auto item = decode(data);
        if (!item.isList()) [[unlikely]]
            throw RLPDecodingException("Data does not represent a list");
        return item.getItems();
    }
} // namespace evm_relay
