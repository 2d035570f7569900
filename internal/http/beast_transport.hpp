#pragma once

#include <chrono>
#include <string>

#include "endpoint.hpp"
#include "http_transport.hpp"

namespace presence::http {

/*
  HTTP/1.1 over Boost.Beast.

  Every call opens a fresh connection on a private io_context. Resolve,
  connect, write and read all share one deadline of `timeout`.
*/
class BeastHttpTransport : public HttpTransport {
 public:
  BeastHttpTransport(Endpoint endpoint, std::chrono::milliseconds timeout);

  Response Send(const Request& request) override;

 private:
  Endpoint                  endpoint_;
  std::chrono::milliseconds timeout_;
};

} // namespace presence::http
