#pragma once

#include "core/config.hpp"
#include "network/https_caller.hpp"
#include "output/notifier.hpp"
#include <memory>
#include <string>

namespace moverwatch::telegram {

/// Notifier posting to a Telegram chat through the Bot API
class TelegramNotifier final : public output::Notifier {
public:
    /// Telegram rejects longer message texts
    static constexpr std::size_t kMaxMessageLength = 4096;

    /// @param config Full configuration (bot token, chat id, host, timeout)
    /// @param ssl_ctx Shared TLS client context
    TelegramNotifier(const Config& config, std::shared_ptr<boost::asio::ssl::context> ssl_ctx);

    bool send(const std::string& text, output::MessageKind kind) override;

    /// Build the sendMessage request body
    [[nodiscard]] static std::string build_payload(const std::string& chat_id,
                                                   const std::string& text,
                                                   output::MessageKind kind);

    /// Check a sendMessage response for {"ok": true}
    [[nodiscard]] static Result<bool, std::string> parse_response(const std::string& body);

private:
    std::string host_;
    std::string port_;
    std::string target_;   // "/bot<token>/sendMessage"
    std::string chat_id_;
    network::HttpsCaller caller_;
};

}  // namespace moverwatch::telegram
