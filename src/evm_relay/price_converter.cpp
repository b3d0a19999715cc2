#include "evm_relay/price_converter.hpp"

#include <cctype>
#include <stdexcept>
#include <fmt/format.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "evm_relay/errors.hpp"
#include "evm_relay/event_ingestor.hpp"

namespace evm_relay {
    using json = nlohmann::json;

    namespace {
        constexpr size_t WEI_DECIMALS = 18;
        constexpr const char *SOURCE_COIN = "stellar";
        constexpr const char *DESTINATION_COIN = "ethereum";

        intx::uint256 parseDigits(const std::string_view digits) {
            intx::uint256 value = 0;
            for (const char c: digits) {
                if (!std::isdigit(static_cast<unsigned char>(c))) [[unlikely]]
                    throw RelayException(ErrorKind::InvalidAmount, fmt::format("Invalid digit '{}' in rate", c));
                value = value * 10 + static_cast<uint64_t>(c - '0');
            }
            return value;
        }

        double usdQuote(const json &document, const char *coin) {
            const auto entry = document.find(coin);
            if (entry == document.end() || !entry->is_object())
                throw std::runtime_error(fmt::format("price response has no {} entry", coin));
            const auto usd = entry->find("usd");
            if (usd == entry->end() || !usd->is_number())
                throw std::runtime_error(fmt::format("price response has no usd quote for {}", coin));
            return usd->get<double>();
        }
    } // namespace

    intx::uint256 parseRateToWei(const std::string_view decimalRate) {
        if (decimalRate.empty())
            throw RelayException(ErrorKind::InvalidAmount, "Empty rate");
        const auto dot = decimalRate.find('.');
        const auto whole = decimalRate.substr(0, dot);
        const auto fraction = dot == std::string_view::npos ? std::string_view{} : decimalRate.substr(dot + 1);
        if (whole.empty() && fraction.empty())
            throw RelayException(ErrorKind::InvalidAmount, fmt::format("Malformed rate '{}'", decimalRate));
        if (fraction.size() > WEI_DECIMALS)
            throw RelayException(ErrorKind::InvalidAmount,
                                 fmt::format("Rate '{}' has more than {} fractional digits", decimalRate, WEI_DECIMALS));

        auto fractionWei = parseDigits(fraction);
        for (size_t i = fraction.size(); i < WEI_DECIMALS; ++i)
            fractionWei *= 10;
        return parseDigits(whole) * WEI_PER_ETHER + fractionWei;
    }

    intx::uint256 minorUnitsToWei(const uint64_t minorUnits, const intx::uint256 &weiPerWholeUnit) {
        return intx::uint256{minorUnits} * weiPerWholeUnit / SOURCE_UNIT_SCALE;
    }

    HttpResponse normalizePriceResponse(HttpResponse response) {
        response.headers = retainHeaders(response.headers, {"Content-Type"});
        const auto body = json::parse(response.body, nullptr, false);
        if (body.is_discarded() || !body.is_object())
            return response;
        json kept = json::object();
        for (const char *coin: {SOURCE_COIN, DESTINATION_COIN}) {
            if (const auto it = body.find(coin); it != body.end())
                kept[coin] = *it;
        }
        response.body = kept.dump();
        return response;
    }

    PriceConverter::PriceConverter(std::shared_ptr<HttpClient> http, std::string priceApiUrl,
                                   const std::string_view fallbackRate) :
        http_(std::move(http)), priceApiUrl_(std::move(priceApiUrl)), fallbackWeiPerWholeUnit_(parseRateToWei(fallbackRate)) {}

    std::string PriceConverter::buildPriceUrl(const std::string_view baseUrl) {
        return fmt::format("{}{}ids={},{}&vs_currencies=usd", baseUrl,
                           baseUrl.find('?') == std::string_view::npos ? '?' : '&', SOURCE_COIN, DESTINATION_COIN);
    }

    std::optional<intx::uint256> PriceConverter::lookupRate() const {
        try {
            HttpRequest request;
            request.url = buildPriceUrl(priceApiUrl_);
            request.headers = {{"Accept", "application/json"}};
            request.maxResponseBytes = PRICE_RESPONSE_MAX_BYTES;
            request.transform = normalizePriceResponse;
            const auto response = http_->fetch(std::move(request)).get();
            if (!response.ok())
                throw std::runtime_error(fmt::format("HTTP status {}", response.status));
            const auto document = json::parse(response.body);
            const double sourceUsd = usdQuote(document, SOURCE_COIN);
            const double destinationUsd = usdQuote(document, DESTINATION_COIN);
            if (!(sourceUsd > 0.0) || !(destinationUsd > 0.0))
                throw std::runtime_error("non-positive usd quote");
            return parseRateToWei(fmt::format("{:.18f}", sourceUsd / destinationUsd));
        } catch (const std::exception &e) {
            spdlog::warn("Price lookup failed, using fallback rate: {}", e.what());
            return std::nullopt;
        }
    }

    std::future<ConversionResult> PriceConverter::toWei(const uint64_t minorUnits) const {
        return std::async(std::launch::async, [this, minorUnits] {
            ConversionResult result;
            result.weiPerWholeUnit = fallbackWeiPerWholeUnit_;
            if (!priceApiUrl_.empty()) {
                if (const auto live = lookupRate())
                    result.weiPerWholeUnit = *live;
                else
                    result.degraded = true;
            }
            result.wei = minorUnitsToWei(minorUnits, result.weiPerWholeUnit);
            spdlog::debug("Converted {} minor units ({} whole) to {} wei{}", minorUnits, scaleToWholeUnits(minorUnits),
                          intx::to_string(result.wei), result.degraded ? " (fallback rate)" : "");
            return result;
        });
    }
} // namespace evm_relay
