#include "network/rest_client.hpp"
#include <boost/asio/ssl/error.hpp>
#include <boost/beast/core/stream_traits.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

// Helper to set SNI hostname without old-style cast warning
namespace {
inline bool set_sni_hostname(SSL* ssl, const char* hostname) {
    // SSL_set_tlsext_host_name is a macro with old-style cast
    return SSL_ctrl(ssl, SSL_CTRL_SET_TLSEXT_HOSTNAME,
                    TLSEXT_NAMETYPE_host_name,
                    const_cast<char*>(hostname)) != 0;
}
}  // namespace

namespace moverwatch::network {

namespace http = boost::beast::http;

RestClient::RestClient(
    boost::asio::io_context& ioc,
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
    std::chrono::milliseconds timeout
)
    : ioc_(ioc)
    , ssl_ctx_(std::move(ssl_ctx))
    , timeout_(timeout)
    , resolver_(ioc)
{}

RestClient::~RestClient() {
    if (stream_) {
        boost::system::error_code ec;
        boost::beast::get_lowest_layer(*stream_).socket().close(ec);
    }
}

void RestClient::get(
    std::string_view host,
    std::string_view port,
    std::string_view target,
    Headers headers,
    ResponseHandler handler
) {
    host_ = std::string(host);
    port_ = std::string(port);
    target_ = std::string(target);
    handler_ = std::move(handler);

    start(http::verb::get, {}, std::move(headers));
}

void RestClient::post_json(
    std::string_view host,
    std::string_view port,
    std::string_view target,
    std::string body,
    Headers headers,
    ResponseHandler handler
) {
    host_ = std::string(host);
    port_ = std::string(port);
    target_ = std::string(target);
    handler_ = std::move(handler);

    headers.emplace_back("Content-Type", "application/json");
    start(http::verb::post, std::move(body), std::move(headers));
}

void RestClient::start(http::verb method, std::string body, Headers headers) {
    req_.method(method);
    req_.target(target_);
    req_.version(11);
    req_.set(http::field::host, host_);
    req_.set(http::field::user_agent, "moverwatch/1.0");
    req_.set(http::field::accept, "application/json");
    for (auto& [name, value] : headers) {
        req_.set(name, value);
    }
    if (method != http::verb::get) {
        req_.body() = std::move(body);
        req_.prepare_payload();
    }

    deadline_ = std::chrono::steady_clock::now() + timeout_;

    // Never log the target: the Telegram path embeds the bot token
    spdlog::debug("REST {} https://{}:{}", std::string(http::to_string(method)), host_, port_);

    do_resolve();
}

void RestClient::do_resolve() {
    resolver_.async_resolve(
        host_,
        port_,
        [self = shared_from_this()](auto ec, auto results) {
            self->on_resolve(ec, results);
        }
    );
}

void RestClient::cancel() {
    cancelled_ = true;
    handler_ = nullptr;
    resolver_.cancel();
    if (stream_) {
        boost::beast::get_lowest_layer(*stream_).close();
    }
}

void RestClient::on_resolve(boost::system::error_code ec, tcp::resolver::results_type results) {
    if (cancelled_) {
        return;
    }
    if (ec) {
        return fail("resolve", ec);
    }

    stream_ = std::make_unique<ssl_stream>(ioc_, *ssl_ctx_);

    if (!set_sni_hostname(stream_->native_handle(), host_.c_str())) {
        boost::system::error_code ssl_ec{
            static_cast<int>(::ERR_get_error()),
            boost::asio::error::get_ssl_category()
        };
        return fail("ssl_sni", ssl_ec);
    }

    auto& tcp_layer = boost::beast::get_lowest_layer(*stream_);
    tcp_layer.expires_at(deadline_);
    tcp_layer.async_connect(
        results,
        [self = shared_from_this()](auto ec, auto /*endpoint*/) {
            self->on_connect(ec);
        }
    );
}

void RestClient::on_connect(boost::system::error_code ec) {
    if (ec) {
        return fail("connect", ec);
    }

    boost::beast::get_lowest_layer(*stream_).expires_at(deadline_);
    stream_->async_handshake(
        boost::asio::ssl::stream_base::client,
        [self = shared_from_this()](auto ec) {
            self->on_ssl_handshake(ec);
        }
    );
}

void RestClient::on_ssl_handshake(boost::system::error_code ec) {
    if (ec) {
        return fail("ssl_handshake", ec);
    }

    boost::beast::get_lowest_layer(*stream_).expires_at(deadline_);
    http::async_write(
        *stream_,
        req_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_write(ec, bytes);
        }
    );
}

void RestClient::on_write(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        return fail("write", ec);
    }

    boost::beast::get_lowest_layer(*stream_).expires_at(deadline_);
    http::async_read(
        *stream_,
        buffer_,
        res_,
        [self = shared_from_this()](auto ec, auto bytes) {
            self->on_read(ec, bytes);
        }
    );
}

void RestClient::on_read(boost::system::error_code ec, std::size_t /*bytes_transferred*/) {
    if (ec) {
        return fail("read", ec);
    }

    auto status = res_.result();
    if (status != http::status::ok) {
        std::string error = "HTTP " + std::to_string(static_cast<int>(status)) +
                            ": " + std::string(res_.reason());
        spdlog::warn("REST request to {} failed: {}", host_, error);
        complete(Result<std::string, std::string>::Err(std::move(error)));
    } else {
        spdlog::debug("REST response from {}: {} bytes", host_, res_.body().size());
        complete(Result<std::string, std::string>::Ok(std::move(res_.body())));
    }

    // One request per connection; close_notify is not awaited
    boost::beast::get_lowest_layer(*stream_).close();
}

void RestClient::fail(const std::string& what, boost::system::error_code ec) {
    if (cancelled_) {
        return;
    }
    std::string error = what + ": " + ec.message();
    if (ec == boost::beast::error::timeout) {
        error = what + ": timed out after " + std::to_string(timeout_.count()) + "ms";
    }
    spdlog::warn("REST {} error ({}): {}", what, host_, error);

    complete(Result<std::string, std::string>::Err(std::move(error)));
}

void RestClient::complete(Result<std::string, std::string> result) {
    // Deliver exactly once
    if (handler_) {
        auto handler = std::move(handler_);
        handler_ = nullptr;
        handler(std::move(result));
    }
}

}  // namespace moverwatch::network
