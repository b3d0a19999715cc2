#pragma once

#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <intx/intx.hpp>
#include "evm_relay/http.hpp"

namespace evm_relay {
    inline constexpr uint64_t WEI_PER_ETHER = 1'000'000'000'000'000'000ULL;
    inline constexpr size_t PRICE_RESPONSE_MAX_BYTES = 2000;
    inline constexpr std::string_view DEFAULT_FALLBACK_RATE = "0.000081";
    inline constexpr std::string_view DEFAULT_PRICE_API_URL = "https://api.coingecko.com/api/v3/simple/price";

    struct ConversionResult {
        intx::uint256 wei = 0;
        intx::uint256 weiPerWholeUnit = 0;
        /// Set when the live rate could not be obtained and the configured fallback rate was used instead.
        bool degraded = false;
    };

    /// Parses a non-negative decimal rate ("0.000081") into wei per whole source unit, exactly.
    [[nodiscard]] intx::uint256 parseRateToWei(std::string_view decimalRate);

    /// minorUnits * weiPerWholeUnit / SOURCE_UNIT_SCALE, rounded down.
    [[nodiscard]] intx::uint256 minorUnitsToWei(uint64_t minorUnits, const intx::uint256 &weiPerWholeUnit);

    /// Keeps the Content-Type header and the price document; drops everything else a provider adds per request.
    [[nodiscard]] HttpResponse normalizePriceResponse(HttpResponse response);

    /**
     * Converts source-chain minor units to destination wei. With a price endpoint configured, the XLM/ETH rate is
     * derived from the endpoint's USD quotes for both coins; any lookup failure falls back to the configured static
     * rate and marks the result degraded. Without an endpoint the static rate is the rate.
     */
    class PriceConverter {
        std::shared_ptr<HttpClient> http_;
        std::string priceApiUrl_;
        intx::uint256 fallbackWeiPerWholeUnit_;

        [[nodiscard]] std::optional<intx::uint256> lookupRate() const;

    public:
        PriceConverter(std::shared_ptr<HttpClient> http, std::string priceApiUrl, std::string_view fallbackRate);

        [[nodiscard]] std::future<ConversionResult> toWei(uint64_t minorUnits) const;

        [[nodiscard]] const intx::uint256 &fallbackRate() const noexcept { return fallbackWeiPerWholeUnit_; }
        [[nodiscard]] static std::string buildPriceUrl(std::string_view baseUrl);
    };
} // namespace evm_relay
