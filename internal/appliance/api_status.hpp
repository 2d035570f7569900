#pragma once

#include <string>
#include <string_view>

#include "internal/http/http_transport.hpp"

namespace presence::appliance {

inline constexpr char kSessionHeader[] = "X-FTL-SID";

// Best-effort human readable message from an appliance error body.
std::string ErrorMessage(const std::string& body);

/*
  Throws for statuses that are not 2xx:
    429, 5xx  -> util::UnreachableError (transient, retried by the scheduler)
    otherwise -> util::MalformedResponseError
  401 must be handled by the caller first; its meaning depends on the call.
*/
void RequireSuccess(const http::Response& response, std::string_view what);

} // namespace presence::appliance
