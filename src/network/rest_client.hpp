#pragma once

#include "core/status.hpp"
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/context.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <boost/beast/http/verb.hpp>
#include <boost/beast/ssl/ssl_stream.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace moverwatch::network {

/// Extra request header fields
using Headers = std::vector<std::pair<std::string, std::string>>;

/// One HTTPS request/response exchange, driven asynchronously.
/// Connect, handshake, write and read share one deadline, set when the
/// request starts. The socket is closed once the response is delivered.
class RestClient : public std::enable_shared_from_this<RestClient> {
public:
    using tcp = boost::asio::ip::tcp;
    using ssl_stream = boost::beast::ssl_stream<boost::beast::tcp_stream>;

    /// Response handler callback: body on HTTP 200, error text otherwise
    using ResponseHandler = std::function<void(Result<std::string, std::string>)>;

    /// Create a new REST client
    /// @param ioc IO context for async operations
    /// @param ssl_ctx Shared SSL context
    /// @param timeout Time allowed from the start of a request to its response
    RestClient(
        boost::asio::io_context& ioc,
        std::shared_ptr<boost::asio::ssl::context> ssl_ctx,
        std::chrono::milliseconds timeout
    );

    ~RestClient();

    // Non-copyable, non-movable
    RestClient(const RestClient&) = delete;
    RestClient& operator=(const RestClient&) = delete;

    /// Perform an async GET request
    /// @param host Hostname (e.g., "api.mboum.com")
    /// @param port Port (e.g., "443")
    /// @param target Path with query (e.g., "/v1/screener?limit=5")
    /// @param headers Extra header fields
    /// @param handler Callback with response body or error
    void get(
        std::string_view host,
        std::string_view port,
        std::string_view target,
        Headers headers,
        ResponseHandler handler
    );

    /// Perform an async POST request with a JSON body
    void post_json(
        std::string_view host,
        std::string_view port,
        std::string_view target,
        std::string body,
        Headers headers,
        ResponseHandler handler
    );

    /// Abort the exchange in flight. The handler is dropped and never called.
    void cancel();

private:
    void start(boost::beast::http::verb method, std::string body, Headers headers);
    void do_resolve();
    void on_resolve(boost::system::error_code ec, tcp::resolver::results_type results);
    void on_connect(boost::system::error_code ec);
    void on_ssl_handshake(boost::system::error_code ec);
    void on_write(boost::system::error_code ec, std::size_t bytes_transferred);
    void on_read(boost::system::error_code ec, std::size_t bytes_transferred);
    void fail(const std::string& what, boost::system::error_code ec);
    void complete(Result<std::string, std::string> result);

    boost::asio::io_context& ioc_;
    std::shared_ptr<boost::asio::ssl::context> ssl_ctx_;
    std::chrono::milliseconds timeout_;
    std::chrono::steady_clock::time_point deadline_;
    bool cancelled_ = false;
    tcp::resolver resolver_;
    std::unique_ptr<ssl_stream> stream_;
    boost::beast::flat_buffer buffer_;
    boost::beast::http::request<boost::beast::http::string_body> req_;
    boost::beast::http::response<boost::beast::http::string_body> res_;

    std::string host_;
    std::string port_;
    std::string target_;
    ResponseHandler handler_;
};

}  // namespace moverwatch::network
