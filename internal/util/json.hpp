#pragma once

#include <string>
#include <string_view>

namespace google::protobuf {
class Message;
}

namespace presence::util {

/*
  JSON <-> protobuf helpers for appliance payloads.

  Parsing ignores unknown members; a body that is not JSON, or whose members
  have the wrong type, throws MalformedResponseError naming `context`.
*/
void ParseJson(const std::string& body, google::protobuf::Message* message, std::string_view context);

// Throws MalformedResponseError unless body is an object with a list under `member`.
void RequireListMember(const std::string& body, std::string_view member, std::string_view context);

std::string ToJson(const google::protobuf::Message& message, bool pretty = false);

} // namespace presence::util
