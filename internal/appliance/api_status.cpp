#include "api_status.hpp"

#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "presence/appliance/v1/pihole_api.pb.h"

namespace presence::appliance {

std::string ErrorMessage(const std::string& body) {
  if (body.empty()) {
    return "empty body";
  }

  presence::appliance::v1::ErrorResponse error;
  try {
    util::ParseJson(body, &error, "error body");
  } catch (const util::MalformedResponseError&) {
    return body.substr(0, 128);
  }

  if (error.error().message().empty()) {
    return body.substr(0, 128);
  }
  if (error.error().has_hint() && !error.error().hint().empty()) {
    return error.error().message() + " (" + error.error().hint() + ")";
  }
  return error.error().message();
}

void RequireSuccess(const http::Response& response, std::string_view what) {
  if (response.status >= 200 && response.status < 300) {
    return;
  }

  const auto detail = std::string(what) + " returned HTTP " + std::to_string(response.status) + ": " + ErrorMessage(response.body);
  if (response.status == 429 || response.status >= 500) {
    throw util::UnreachableError(detail);
  }
  throw util::MalformedResponseError(detail);
}

} // namespace presence::appliance
