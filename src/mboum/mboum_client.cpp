#include "mboum/mboum_client.hpp"
#include "mboum/endpoints.hpp"
#include "mboum/message_parser.hpp"
#include <spdlog/spdlog.h>

namespace moverwatch::mboum {

MboumClient::MboumClient(const Config& config, std::shared_ptr<boost::asio::ssl::context> ssl_ctx)
    : host_(config.network.data_host)
    , port_(config.network.data_port)
    , api_key_(config.credentials.mboum_api_key)
    , caller_(std::move(ssl_ctx), config.network.request_timeout)
{}

Result<std::string, std::string> MboumClient::fetch(const std::string& target) {
    return caller_.get(
        host_,
        port_,
        target,
        {{std::string(endpoints::AUTH_HEADER), api_key_}}
    );
}

std::vector<InstrumentSnapshot> MboumClient::fetch_top_movers(std::size_t limit) {
    auto result = fetch(endpoints::screener_path(limit))
        .and_then([](const std::string& body) { return MessageParser::parse_screener(body); });

    if (result.is_err()) {
        spdlog::warn("Top movers unavailable: {}", result.error());
        return {};
    }

    auto movers = std::move(result).value();
    if (movers.size() > limit) {
        movers.resize(limit);
    }
    spdlog::debug("Fetched {} top movers", movers.size());
    return movers;
}

std::vector<InsiderTrade> MboumClient::fetch_insider_trades(const std::optional<Symbol>& symbol) {
    auto ticker = symbol ? endpoints::to_uppercase(*symbol) : std::string{};
    auto result = fetch(endpoints::insider_trades_path(ticker))
        .and_then([](const std::string& body) { return MessageParser::parse_insider_trades(body); });

    if (result.is_err()) {
        spdlog::warn("Insider trades unavailable{}: {}",
                     ticker.empty() ? "" : " for " + ticker, result.error());
        return {};
    }
    return std::move(result).value();
}

std::vector<DerivativeEvent> MboumClient::fetch_unusual_derivative_activity() {
    auto result = fetch(endpoints::unusual_options_path())
        .and_then([](const std::string& body) { return MessageParser::parse_unusual_options(body); });

    if (result.is_err()) {
        spdlog::warn("Unusual options activity unavailable: {}", result.error());
        return {};
    }
    return std::move(result).value();
}

bool MboumClient::fetch_halt_status(const Symbol& symbol) {
    auto ticker = endpoints::to_uppercase(symbol);
    auto result = fetch(endpoints::quote_path(ticker))
        .and_then([](const std::string& body) { return MessageParser::parse_halt_status(body); });

    if (result.is_err()) {
        spdlog::warn("Halt status unavailable for {}: {}", ticker, result.error());
        return false;
    }
    return result.value();
}

}  // namespace moverwatch::mboum
