#pragma once

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace presence::http {

enum class Method {
  kGet,
  kPost,
  kDelete,
};

struct Request {
  Method                                           method{Method::kGet};
  std::string                                      target;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string                                      body;
};

struct Response {
  int         status{0};
  std::string body;
};

/*
  Blocking request/response exchange with the appliance.

  Implementations throw util::UnreachableError for anything that prevents a
  complete response (DNS, connect, IO, deadline). Any HTTP status, including
  4xx/5xx, is a successful exchange and is returned to the caller.
*/
class HttpTransport {
 public:
  virtual ~HttpTransport() = default;

  virtual Response Send(const Request& request) = 0;
};

using HttpTransportPtr = std::shared_ptr<HttpTransport>;

} // namespace presence::http
