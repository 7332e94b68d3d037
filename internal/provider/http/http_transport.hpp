#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cloudstrap::provider::http {

struct HttpRequest {
  std::string                                      host;
  std::string                                      target{"/"};
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      body;
};

struct HttpResponse {
  unsigned    status = 0;
  std::string body;
};

/*
  Synchronous HTTPS POST.

  Connection, TLS and protocol failures throw util::ProviderError with
  kind kTransport. Non-2xx statuses are returned, not thrown.
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual HttpResponse Post(const HttpRequest& request) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

/*
  Boost.Beast over Asio SSL. One connection per request; the whole exchange
  (resolve, connect, handshake, write, read) is bounded by `timeout`.
*/
class BeastHttpsTransport final : public HttpTransport {
 public:
  explicit BeastHttpsTransport(std::chrono::milliseconds timeout);
  ~BeastHttpsTransport() override;

  BeastHttpsTransport(const BeastHttpsTransport&)            = delete;
  BeastHttpsTransport& operator=(const BeastHttpsTransport&) = delete;

  HttpResponse Post(const HttpRequest& request) override;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

} // namespace cloudstrap::provider::http
