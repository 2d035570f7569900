#include "beast_transport.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <string>
#include <string_view>
#include <utility>

#include "internal/util/errors.hpp"

namespace presence::http {

namespace beast = boost::beast;
namespace bhttp = boost::beast::http;
namespace net   = boost::asio;
using tcp       = net::ip::tcp;

namespace {

constexpr char kUserAgent[] = "pihole-presence/0.1";

bhttp::verb ToVerb(Method method) {
  switch (method) {
    case Method::kPost:
      return bhttp::verb::post;
    case Method::kDelete:
      return bhttp::verb::delete_;
    case Method::kGet:
    default:
      return bhttp::verb::get;
  }
}

} // namespace

BeastHttpTransport::BeastHttpTransport(Endpoint endpoint, std::chrono::milliseconds timeout)
    : endpoint_(std::move(endpoint)), timeout_(timeout) {
}

Response BeastHttpTransport::Send(const Request& request) {
  net::io_context   ioc;
  tcp::resolver     resolver(ioc);
  beast::tcp_stream stream(ioc);

  bhttp::request<bhttp::string_body> req{ToVerb(request.method), request.target, 11};
  req.set(bhttp::field::host, endpoint_.port == "80" ? endpoint_.host : endpoint_.host + ":" + endpoint_.port);
  req.set(bhttp::field::user_agent, kUserAgent);
  req.set(bhttp::field::accept, "application/json");
  for (const auto& [name, value] : request.headers) {
    req.set(name, value);
  }
  if (!request.body.empty()) {
    req.set(bhttp::field::content_type, "application/json");
    req.body() = request.body;
  }
  req.prepare_payload();

  beast::flat_buffer                  buffer;
  bhttp::response<bhttp::string_body> res;
  beast::error_code                   failure;
  std::string_view                    failed_step;
  bool                                done = false;

  auto fail = [&](beast::error_code ec, std::string_view step) {
    failure     = ec;
    failed_step = step;
  };

  // The stream deadline covers connect/write/read; run_for bounds resolve.
  stream.expires_after(timeout_);
  resolver.async_resolve(endpoint_.host, endpoint_.port, [&](beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail(ec, "resolve");
    stream.async_connect(results, [&](beast::error_code ec, const tcp::endpoint&) {
      if (ec) return fail(ec, "connect");
      bhttp::async_write(stream, req, [&](beast::error_code ec, std::size_t) {
        if (ec) return fail(ec, "write");
        bhttp::async_read(stream, buffer, res, [&](beast::error_code ec, std::size_t) {
          if (ec) return fail(ec, "read");
          done = true;
          beast::error_code ignored;
          stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
        });
      });
    });
  });

  ioc.run_for(timeout_);
  if (!ioc.stopped()) {
    resolver.cancel();
    stream.cancel();
    ioc.run();
    if (!done && !failure) {
      failure     = beast::error::timeout;
      failed_step = "deadline";
    }
  }

  const auto target = endpoint_.host + ":" + endpoint_.port + request.target;
  if (failure == beast::error::timeout || (failure == net::error::operation_aborted && !done)) {
    throw util::UnreachableError("request to " + target + " timed out after " + std::to_string(timeout_.count()) + "ms");
  }
  if (failure) {
    throw util::UnreachableError(std::string(failed_step) + " failed for " + target + ": " + failure.message());
  }
  if (!done) {
    throw util::UnreachableError("no response from " + target);
  }

  Response response;
  response.status = static_cast<int>(res.result_int());
  response.body   = std::move(res.body());
  return response;
}

} // namespace presence::http
