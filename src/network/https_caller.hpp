#pragma once

#include "core/status.hpp"
#include "network/rest_client.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ssl/context.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <string_view>

namespace moverwatch::network {

/// Blocking facade over RestClient for the single-threaded scheduler.
/// Owns a private io_context and drives it until the exchange completes
/// or the request timeout, counted from the call, runs out.
class HttpsCaller {
public:
    /// @param ssl_ctx Shared SSL context
    /// @param timeout Upper bound for one call, resolve through response
    HttpsCaller(std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
                std::chrono::milliseconds timeout);

    HttpsCaller(const HttpsCaller&) = delete;
    HttpsCaller& operator=(const HttpsCaller&) = delete;

    /// GET target, returning the body of an HTTP 200 response
    [[nodiscard]] Result<std::string, std::string> get(
        std::string_view host,
        std::string_view port,
        std::string_view target,
        Headers headers = {}
    );

    /// POST a JSON body, returning the body of an HTTP 200 response
    [[nodiscard]] Result<std::string, std::string> post_json(
        std::string_view host,
        std::string_view port,
        std::string_view target,
        std::string body,
        Headers headers = {}
    );

private:
    template <typename Start>
    Result<std::string, std::string> run(Start&& start);

    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::chrono::milliseconds timeout_;
    boost::asio::io_context ioc_;
};

}  // namespace moverwatch::network
