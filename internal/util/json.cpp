#include "json.hpp"

#include <google/protobuf/message.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <stdexcept>
#include <string>

#include "internal/util/errors.hpp"

namespace presence::util {

void ParseJson(const std::string& body, google::protobuf::Message* message, std::string_view context) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(body, message, options);
  if (!status.ok()) {
    throw MalformedResponseError(std::string(context) + ": " + std::string(status.message()));
  }
}

void RequireListMember(const std::string& body, std::string_view member, std::string_view context) {
  google::protobuf::Struct envelope;
  ParseJson(body, &envelope, context);

  const auto& fields = envelope.fields();
  auto        it     = fields.find(std::string(member));
  if (it == fields.end()) {
    throw MalformedResponseError(std::string(context) + ": missing '" + std::string(member) + "'");
  }
  if (it->second.kind_case() != google::protobuf::Value::kListValue) {
    throw MalformedResponseError(std::string(context) + ": '" + std::string(member) + "' is not a list");
  }
}

std::string ToJson(const google::protobuf::Message& message, bool pretty) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = pretty;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = false;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw std::runtime_error("Failed to serialize " + message.GetTypeName() + " to JSON: " + std::string(status.message()));
  }
  return json;
}

} // namespace presence::util
