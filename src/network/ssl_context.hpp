#pragma once

#include <boost/asio/ssl/context.hpp>
#include <memory>

namespace moverwatch::network {

/// Create the TLS client context shared by the data source and notifier.
/// Peers are verified against the system certificate store.
[[nodiscard]] std::shared_ptr<boost::asio::ssl::context> create_ssl_context();

}  // namespace moverwatch::network
