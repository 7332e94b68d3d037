#include "http_transport.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace cloudstrap::provider::http {

namespace beast = boost::beast;
namespace bhttp = beast::http;
namespace net   = boost::asio;
namespace ssl   = net::ssl;
using tcp       = net::ip::tcp;

using cloudstrap::util::ProviderError;
using cloudstrap::util::ProviderErrorKind;

namespace {

/*
  Drive one async operation to completion on a private io_context so the
  tcp_stream deadline applies to it.
*/
template <typename Initiate>
void RunToCompletion(net::io_context& ioc, const char* step, Initiate&& initiate) {
  beast::error_code ec;
  initiate([&ec](beast::error_code result, auto&&...) { ec = result; });
  ioc.restart();
  ioc.run();
  if (ec) {
    throw ProviderError(ProviderErrorKind::kTransport, "Transport", std::string(step) + ": " + ec.message());
  }
}

} // namespace

struct BeastHttpsTransport::Impl {
  explicit Impl(std::chrono::milliseconds t) : timeout(t), ssl_ctx(ssl::context::tls_client) {
    ssl_ctx.set_default_verify_paths();
    ssl_ctx.set_verify_mode(ssl::verify_peer);
  }

  std::chrono::milliseconds timeout;
  ssl::context              ssl_ctx;
};

BeastHttpsTransport::BeastHttpsTransport(std::chrono::milliseconds timeout) : impl_(std::make_unique<Impl>(timeout)) {
}

BeastHttpsTransport::~BeastHttpsTransport() = default;

HttpResponse BeastHttpsTransport::Post(const HttpRequest& request) {
  net::io_context                      ioc;
  tcp::resolver                        resolver(ioc);
  beast::ssl_stream<beast::tcp_stream> stream(ioc, impl_->ssl_ctx);

  if (!SSL_set_tlsext_host_name(stream.native_handle(), request.host.c_str())) {
    throw ProviderError(ProviderErrorKind::kTransport, "Transport", "failed to set SNI host name for " + request.host);
  }
  stream.set_verify_callback(ssl::host_name_verification(request.host));

  tcp::resolver::results_type endpoints;
  RunToCompletion(ioc, "resolve", [&](auto handler) {
    resolver.async_resolve(request.host, "443", [&endpoints, handler](beast::error_code ec, tcp::resolver::results_type results) mutable {
      endpoints = std::move(results);
      handler(ec);
    });
  });

  beast::get_lowest_layer(stream).expires_after(impl_->timeout);
  RunToCompletion(ioc, "connect", [&](auto handler) { beast::get_lowest_layer(stream).async_connect(endpoints, handler); });
  RunToCompletion(ioc, "handshake", [&](auto handler) { stream.async_handshake(ssl::stream_base::client, handler); });

  bhttp::request<bhttp::string_body> req{bhttp::verb::post, request.target, 11};
  req.set(bhttp::field::host, request.host);
  for (const auto& [name, value] : request.headers) {
    req.set(name, value);
  }
  req.body() = request.body;
  req.prepare_payload();

  RunToCompletion(ioc, "write", [&](auto handler) { bhttp::async_write(stream, req, handler); });

  beast::flat_buffer                  buffer;
  bhttp::response<bhttp::string_body> res;
  RunToCompletion(ioc, "read", [&](auto handler) { bhttp::async_read(stream, buffer, res, handler); });

  // Peers commonly close without close_notify; the response is already complete.
  beast::get_lowest_layer(stream).expires_after(std::chrono::seconds(5));
  beast::error_code shutdown_ec;
  stream.async_shutdown([&shutdown_ec](beast::error_code ec) { shutdown_ec = ec; });
  ioc.restart();
  ioc.run();
  if (shutdown_ec && shutdown_ec != net::error::eof && shutdown_ec != ssl::error::stream_truncated) {
    CLOUDSTRAP_LOG_WARN("TLS shutdown failed", {observability::StringField("host", request.host),
                                                observability::StringField("error", shutdown_ec.message())});
  }

  HttpResponse response;
  response.status = res.result_int();
  response.body   = std::move(res.body());
  return response;
}

} // namespace cloudstrap::provider::http
