#pragma once

#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>

namespace moverwatch::mboum {

/// Mboum REST API endpoints
namespace endpoints {

/// Header carrying the API key
constexpr std::string_view AUTH_HEADER = "Authorization";

/// Build screener path for the day's gainers
/// @param limit Maximum number of rows
/// @return Path like "/v1/screener?metricType=overview&filter=day_gainers&limit=25"
[[nodiscard]] inline std::string screener_path(std::size_t limit) {
    return "/v1/screener?metricType=overview&filter=day_gainers&limit=" +
           std::to_string(limit);
}

/// Build insider trades path
/// @param ticker Uppercase symbol, or empty for the market-wide feed
[[nodiscard]] inline std::string insider_trades_path(std::string_view ticker) {
    std::string path = "/v1/markets/insider-trades";
    if (!ticker.empty()) {
        path += "?ticker=";
        path += ticker;
    }
    return path;
}

/// Unusual options activity feed (stocks)
[[nodiscard]] inline std::string unusual_options_path() {
    return "/v1/markets/options/unusual-options-activity?type=STOCKS";
}

/// Real-time quote, used for halt status
[[nodiscard]] inline std::string quote_path(std::string_view ticker) {
    std::string path = "/v1/markets/stock/quotes?ticker=";
    path += ticker;
    return path;
}

/// Convert symbol to uppercase for the API
[[nodiscard]] inline std::string to_uppercase(std::string_view symbol) {
    std::string result;
    result.reserve(symbol.size());
    for (char c : symbol) {
        result += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return result;
}

}  // namespace endpoints

}  // namespace moverwatch::mboum
