#include "network/https_caller.hpp"
#include <optional>
#include <spdlog/spdlog.h>

namespace moverwatch::network {

HttpsCaller::HttpsCaller(std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                         std::chrono::milliseconds timeout)
    : ssl_ctx_(std::move(ssl_ctx))
    , timeout_(timeout)
{}

template <typename Start>
Result<std::string, std::string> HttpsCaller::run(Start&& start) {
    std::optional<Result<std::string, std::string>> outcome;

    auto client = std::make_shared<RestClient>(ioc_, ssl_ctx_, timeout_);
    auto deadline = std::chrono::steady_clock::now() + timeout_;
    start(*client, [&outcome](Result<std::string, std::string> result) {
        outcome.emplace(std::move(result));
    });

    ioc_.restart();
    while (!outcome) {
        if (ioc_.run_one_until(deadline) == 0) {
            break;
        }
    }

    if (outcome) {
        return std::move(*outcome);
    }

    bool timed_out = !ioc_.stopped();

    // Abort whatever is still pending (resolve included) and settle the
    // handlers the abort made ready. A resolve stuck in getaddrinfo
    // completes later as a no-op.
    client->cancel();
    ioc_.poll();

    if (timed_out) {
        spdlog::warn("HTTPS request timed out after {}ms", timeout_.count());
        return Result<std::string, std::string>::Err(
            "timed out after " + std::to_string(timeout_.count()) + "ms");
    }
    return Result<std::string, std::string>::Err("request finished without a response");
}

Result<std::string, std::string> HttpsCaller::get(
    std::string_view host,
    std::string_view port,
    std::string_view target,
    Headers headers
) {
    return run([&](RestClient& client, RestClient::ResponseHandler handler) {
        client.get(host, port, target, std::move(headers), std::move(handler));
    });
}

Result<std::string, std::string> HttpsCaller::post_json(
    std::string_view host,
    std::string_view port,
    std::string_view target,
    std::string body,
    Headers headers
) {
    return run([&](RestClient& client, RestClient::ResponseHandler handler) {
        client.post_json(host, port, target, std::move(body), std::move(headers),
                         std::move(handler));
    });
}

}  // namespace moverwatch::network
