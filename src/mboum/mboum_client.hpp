#pragma once

#include "core/config.hpp"
#include "market/data_source.hpp"
#include "network/https_caller.hpp"
#include <memory>
#include <string>

namespace moverwatch::mboum {

/// DataSource backed by the Mboum REST API
class MboumClient final : public DataSource {
public:
    /// @param config Full configuration (credentials, hosts, timeout)
    /// @param ssl_ctx Shared TLS client context
    MboumClient(const Config& config, std::shared_ptr<boost::asio::ssl::context> ssl_ctx);

    [[nodiscard]] std::vector<InstrumentSnapshot> fetch_top_movers(std::size_t limit) override;

    [[nodiscard]] std::vector<InsiderTrade> fetch_insider_trades(
        const std::optional<Symbol>& symbol) override;

    [[nodiscard]] std::vector<DerivativeEvent> fetch_unusual_derivative_activity() override;

    [[nodiscard]] bool fetch_halt_status(const Symbol& symbol) override;

private:
    [[nodiscard]] Result<std::string, std::string> fetch(const std::string& target);

    std::string host_;
    std::string port_;
    std::string api_key_;
    network::HttpsCaller caller_;
};

}  // namespace moverwatch::mboum
