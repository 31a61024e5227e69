#include <gtest/gtest.h>
#include "network/https_caller.hpp"
#include <boost/asio/ip/address.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <openssl/evp.h>
#include <openssl/ssl.h>
#include <openssl/x509.h>
#include <chrono>
#include <future>
#include <string>
#include <thread>

using namespace moverwatch;
using namespace moverwatch::network;
using namespace std::chrono_literals;

namespace {

namespace asio = boost::asio;
namespace http = boost::beast::http;
using tcp = asio::ip::tcp;

/// Install a throwaway self-signed certificate on a server context
void use_self_signed_certificate(asio::ssl::context& ctx) {
    EVP_PKEY* key = EVP_PKEY_Q_keygen(nullptr, nullptr, "RSA", static_cast<size_t>(2048));
    ASSERT_NE(key, nullptr);
    X509* cert = X509_new();
    ASSERT_NE(cert, nullptr);

    ASN1_INTEGER_set(X509_get_serialNumber(cert), 1);
    X509_gmtime_adj(X509_getm_notBefore(cert), 0);
    X509_gmtime_adj(X509_getm_notAfter(cert), 3600);
    X509_set_pubkey(cert, key);
    X509_NAME* name = X509_get_subject_name(cert);
    X509_NAME_add_entry_by_txt(name, "CN", MBSTRING_ASC,
                               reinterpret_cast<const unsigned char*>("localhost"), -1, -1, 0);
    X509_set_issuer_name(cert, name);
    ASSERT_GT(X509_sign(cert, key, EVP_sha256()), 0);

    EXPECT_EQ(SSL_CTX_use_certificate(ctx.native_handle(), cert), 1);
    EXPECT_EQ(SSL_CTX_use_PrivateKey(ctx.native_handle(), key), 1);
    X509_free(cert);
    EVP_PKEY_free(key);
}

/// Serves one connection on 127.0.0.1 and holds it open, without
/// close_notify, until destroyed. With tls off it accepts and stays silent.
class LoopbackServer {
public:
    LoopbackServer(bool tls, std::chrono::milliseconds reply_delay)
        : tls_(tls)
        , reply_delay_(reply_delay)
        , acceptor_(ioc_, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0))
        , released_(release_.get_future())
    {
        if (tls_) {
            use_self_signed_certificate(server_ctx_);
        }
        port_ = std::to_string(acceptor_.local_endpoint().port());
        thread_ = std::thread([this] { serve(); });
    }

    ~LoopbackServer() {
        release_.set_value();
        thread_.join();
    }

    const std::string& port() const { return port_; }

private:
    void serve() {
        boost::system::error_code ec;
        tcp::socket socket(ioc_);
        acceptor_.accept(socket, ec);
        if (ec) {
            return;
        }
        if (!tls_) {
            released_.wait();
            return;
        }

        asio::ssl::stream<tcp::socket> stream(std::move(socket), server_ctx_);
        stream.handshake(asio::ssl::stream_base::server, ec);
        if (ec) {
            return;
        }

        boost::beast::flat_buffer buffer;
        http::request<http::string_body> req;
        http::read(stream, buffer, req, ec);
        if (ec) {
            return;
        }

        std::this_thread::sleep_for(reply_delay_);
        http::response<http::string_body> res{http::status::ok, 11};
        res.body() = R"({"ok":true})";
        res.prepare_payload();
        http::write(stream, res, ec);

        released_.wait();
    }

    bool tls_;
    std::chrono::milliseconds reply_delay_;
    asio::io_context ioc_;
    asio::ssl::context server_ctx_{asio::ssl::context::tls_server};
    tcp::acceptor acceptor_;
    std::string port_;
    std::promise<void> release_;
    std::future<void> released_;
    std::thread thread_;
};

std::shared_ptr<asio::ssl::context> unverified_client_context() {
    auto ctx = std::make_shared<asio::ssl::context>(asio::ssl::context::tls_client);
    ctx->set_verify_mode(asio::ssl::verify_none);
    return ctx;
}

}  // namespace

TEST(HttpsCallerTest, ReturnsWithoutWaitingForCloseNotify) {
    LoopbackServer server(true, 300ms);
    HttpsCaller caller(unverified_client_context(), 2000ms);

    auto started = std::chrono::steady_clock::now();
    auto result = caller.get("127.0.0.1", server.port(), "/v1/markets/screener");
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value(), R"({"ok":true})");
    EXPECT_LT(elapsed, 2000ms);
}

TEST(HttpsCallerTest, SilentServerTimesOutWithinOneTimeout) {
    LoopbackServer server(false, 0ms);
    HttpsCaller caller(unverified_client_context(), 300ms);

    auto started = std::chrono::steady_clock::now();
    auto result = caller.get("127.0.0.1", server.port(), "/");
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(result.is_err());
    EXPECT_NE(result.error().find("timed out after 300ms"), std::string::npos) << result.error();
    EXPECT_LT(elapsed, 1000ms);
}

TEST(HttpsCallerTest, CallerIsReusableAfterTimeout) {
    auto ctx = unverified_client_context();
    HttpsCaller caller(ctx, 300ms);
    {
        LoopbackServer silent(false, 0ms);
        EXPECT_TRUE(caller.get("127.0.0.1", silent.port(), "/").is_err());
    }

    LoopbackServer server(true, 0ms);
    auto result = caller.get("127.0.0.1", server.port(), "/");

    ASSERT_TRUE(result.is_ok()) << result.error();
    EXPECT_EQ(result.value(), R"({"ok":true})");
}
