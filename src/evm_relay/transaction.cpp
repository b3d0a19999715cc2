#include "evm_relay/transaction.hpp"

#include <algorithm>
#include <array>
#include <string>
#include "evm_relay/crypto.hpp"
#include "evm_relay/rlp.hpp"

namespace evm_relay {
    namespace {
        constexpr size_t UNSIGNED_FIELD_COUNT = 9;
        constexpr size_t SIGNED_FIELD_COUNT = 12;

        std::vector<uint8_t> trimLeadingZeros(const std::span<const uint8_t> bytes) {
            const auto first = std::ranges::find_if(bytes, [](const uint8_t b) { return b != 0; });
            return std::vector<uint8_t>(first, bytes.end());
        }

        RLPItem uint256Item(const intx::uint256 &value) {
            std::array<uint8_t, WORD_SIZE> buffer{};
            intx::be::unsafe::store(buffer.data(), value);
            return RLPItem(trimLeadingZeros(buffer));
        }

        std::vector<RLPItem> buildTransactionItems(const UnsignedTransaction &tx) {
            std::vector<RLPItem> items;
            items.reserve(SIGNED_FIELD_COUNT);
            items.push_back(RLPItem::fromInteger(tx.chainId));
            items.push_back(RLPItem::fromInteger(tx.nonce));
            items.push_back(RLPItem::fromInteger(tx.maxPriorityFeePerGas));
            items.push_back(RLPItem::fromInteger(tx.maxFeePerGas));
            items.push_back(RLPItem::fromInteger(tx.gasLimit));
            items.emplace_back(std::vector<uint8_t>(tx.to.bytes().begin(), tx.to.bytes().end()));
            items.push_back(uint256Item(tx.value));
            items.emplace_back(tx.data);
            std::vector<RLPItem> accessListItems;
            accessListItems.reserve(tx.accessList.size());
            for (const auto &entry: tx.accessList) {
                std::vector<RLPItem> keyItems;
                keyItems.reserve(entry.storageKeys.size());
                for (const auto &key: entry.storageKeys) {
                    keyItems.emplace_back(std::vector<uint8_t>(key.begin(), key.end()));
                }
                std::vector<RLPItem> entryItems;
                entryItems.emplace_back(std::vector<uint8_t>(entry.address.bytes().begin(), entry.address.bytes().end()));
                entryItems.emplace_back(std::move(keyItems));
                accessListItems.emplace_back(std::move(entryItems));
            }
            items.emplace_back(std::move(accessListItems));
            return items;
        }

        Bytes withTypePrefix(const std::vector<uint8_t> &rlpEncoded) {
            Bytes result;
            result.reserve(rlpEncoded.size() + 1);
            result.push_back(EIP1559_TX_TYPE);
            result.insert(result.end(), rlpEncoded.begin(), rlpEncoded.end());
            return result;
        }

        intx::uint256 readUint256(const RLPItem &item, const char *field) {
            const auto &bytes = item.getBytes();
            if (bytes.size() > WORD_SIZE)
                throw RLPDecodingException(std::string(field) + " exceeds 256 bits");
            if (!bytes.empty() && bytes[0] == 0)
                throw RLPDecodingException(std::string(field) + " has leading zero bytes");
            std::array<uint8_t, WORD_SIZE> buffer{};
            std::ranges::copy(bytes, buffer.begin() + static_cast<std::ptrdiff_t>(WORD_SIZE - bytes.size()));
            return intx::be::unsafe::load<intx::uint256>(buffer.data());
        }

        std::array<uint8_t, WORD_SIZE> readScalar(const RLPItem &item, const char *field) {
            const auto &bytes = item.getBytes();
            if (bytes.size() > WORD_SIZE)
                throw RLPDecodingException(std::string(field) + " exceeds 32 bytes");
            if (!bytes.empty() && bytes[0] == 0)
                throw RLPDecodingException(std::string(field) + " has leading zero bytes");
            std::array<uint8_t, WORD_SIZE> scalar{};
            std::ranges::copy(bytes, scalar.begin() + static_cast<std::ptrdiff_t>(WORD_SIZE - bytes.size()));
            return scalar;
        }

        Address readAddress(const RLPItem &item) {
            if (item.isList() || item.size() != ADDRESS_SIZE)
                throw RLPDecodingException("Destination must be a 20-byte address");
            return Address::fromBytes(item.getBytes());
        }

        std::vector<AccessListEntry> readAccessList(const RLPItem &item) {
            if (!item.isList())
                throw RLPDecodingException("Access list must be a list");
            std::vector<AccessListEntry> accessList;
            accessList.reserve(item.size());
            for (const auto &entryItem: item.getItems()) {
                if (!entryItem.isList() || entryItem.size() != 2)
                    throw RLPDecodingException("Invalid access list entry format");
                const auto &fields = entryItem.getItems();
                AccessListEntry entry{readAddress(fields[0]), {}};
                if (!fields[1].isList())
                    throw RLPDecodingException("Access list storage keys must be a list");
                for (const auto &keyItem: fields[1].getItems()) {
                    if (keyItem.isList() || keyItem.size() != WORD_SIZE)
                        throw RLPDecodingException("Invalid storage key length");
                    Hash256 key{};
                    std::ranges::copy(keyItem.getBytes(), key.begin());
                    entry.storageKeys.push_back(key);
                }
                accessList.push_back(std::move(entry));
            }
            return accessList;
        }
    } // namespace

    Bytes TransactionCodec::encodeUnsigned(const UnsignedTransaction &tx) {
        return withTypePrefix(RLPEncoder::encode(buildTransactionItems(tx)));
    }

    Hash256 TransactionCodec::digest(const std::span<const uint8_t> unsignedEncoding) {
        return keccakHash(unsignedEncoding);
    }

    Bytes TransactionCodec::encodeSigned(const UnsignedTransaction &tx, const RecoveryIndicator yParity,
                                         const RawSignature &signature) {
        if (yParity > 1) [[unlikely]]
            throw RLPEncodingException("y-parity must be 0 or 1");
        auto items = buildTransactionItems(tx);
        items.push_back(RLPItem::fromInteger(yParity));
        items.emplace_back(trimLeadingZeros(signature.r));
        items.emplace_back(trimLeadingZeros(signature.s));
        return withTypePrefix(RLPEncoder::encode(items));
    }

    DecodedTransaction TransactionCodec::decode(const std::span<const uint8_t> encoded) {
        if (encoded.empty()) [[unlikely]]
            throw RLPDecodingException("Cannot decode empty transaction data");
        if (encoded[0] != EIP1559_TX_TYPE)
            throw RLPDecodingException("Unsupported transaction type: " + std::to_string(encoded[0]));
        const auto items = RLPDecoder::decodeList(encoded.subspan(1));
        if (items.size() != UNSIGNED_FIELD_COUNT && items.size() != SIGNED_FIELD_COUNT) [[unlikely]]
            throw RLPDecodingException("Invalid transaction format: expected 9 or 12 fields, got "
                                       + std::to_string(items.size()));
        DecodedTransaction decoded;
        auto &tx = decoded.tx;
        tx.chainId = items[0].toInteger();
        tx.nonce = items[1].toInteger();
        tx.maxPriorityFeePerGas = items[2].toInteger();
        tx.maxFeePerGas = items[3].toInteger();
        tx.gasLimit = items[4].toInteger();
        tx.to = readAddress(items[5]);
        tx.value = readUint256(items[6], "value");
        tx.data = items[7].getBytes();
        tx.accessList = readAccessList(items[8]);
        if (items.size() == SIGNED_FIELD_COUNT) {
            const uint64_t yParity = items[9].toInteger();
            if (yParity > 1)
                throw RLPDecodingException("y-parity must be 0 or 1");
            SignatureFields signature;
            signature.yParity = static_cast<RecoveryIndicator>(yParity);
            signature.signature.r = readScalar(items[10], "r");
            signature.signature.s = readScalar(items[11], "s");
            decoded.signature = signature;
        }
        return decoded;
    }
} // namespace evm_relay
