#include "telegram/telegram_notifier.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace moverwatch::telegram {

using json = nlohmann::json;

TelegramNotifier::TelegramNotifier(const Config& config,
                                   std::shared_ptr<boost::asio::ssl::context> ssl_ctx)
    : host_(config.network.notify_host)
    , port_(config.network.notify_port)
    , target_("/bot" + config.credentials.telegram_bot_token + "/sendMessage")
    , chat_id_(config.credentials.telegram_chat_id)
    , caller_(std::move(ssl_ctx), config.network.request_timeout)
{}

std::string TelegramNotifier::build_payload(const std::string& chat_id,
                                            const std::string& text,
                                            output::MessageKind kind) {
    std::string body = text;
    if (body.size() > kMaxMessageLength) {
        body.resize(kMaxMessageLength - 3);
        body += "...";
    }

    json payload{
        {"chat_id", chat_id},
        {"text", body},
        {"disable_web_page_preview", true}
    };

    // Routine notices arrive silently
    if (kind == output::MessageKind::Notice) {
        payload["disable_notification"] = true;
    }

    // Truncation may split a UTF-8 sequence; replace rather than throw
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

Result<bool, std::string> TelegramNotifier::parse_response(const std::string& body) {
    try {
        auto j = json::parse(body);
        if (j.value("ok", false)) {
            return Result<bool, std::string>::Ok(true);
        }
        return Result<bool, std::string>::Err(
            "Telegram rejected message: " + j.value("description", std::string("no description"))
        );
    } catch (const json::exception& e) {
        return Result<bool, std::string>::Err(std::string("JSON parse error: ") + e.what());
    }
}

bool TelegramNotifier::send(const std::string& text, output::MessageKind kind) {
    auto result = caller_.post_json(host_, port_, target_, build_payload(chat_id_, text, kind))
        .and_then([](const std::string& body) { return parse_response(body); });

    if (result.is_err()) {
        spdlog::warn("Telegram {} not delivered: {}", to_string(kind), result.error());
        return false;
    }

    spdlog::debug("Telegram {} delivered", to_string(kind));
    return true;
}

}  // namespace moverwatch::telegram
