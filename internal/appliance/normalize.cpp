#include "normalize.hpp"

#include <cctype>

namespace presence::appliance {

std::optional<std::string> NormalizeMac(std::string_view raw) {
  std::string hex;
  hex.reserve(12);
  for (char c : raw) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isxdigit(uc)) {
      hex.push_back(static_cast<char>(std::tolower(uc)));
    } else if (c != ':' && c != '-' && c != '.') {
      return std::nullopt;
    }
  }

  if (hex.size() != 12 || hex == "000000000000") {
    return std::nullopt;
  }

  std::string mac;
  mac.reserve(17);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    if (i) mac.push_back(':');
    mac.append(hex, i, 2);
  }
  return mac;
}

std::optional<std::string> NormalizeName(std::string_view raw) {
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.front()))) raw.remove_prefix(1);
  while (!raw.empty() && std::isspace(static_cast<unsigned char>(raw.back()))) raw.remove_suffix(1);

  if (raw.empty() || raw == "*") {
    return std::nullopt;
  }
  return std::string(raw);
}

} // namespace presence::appliance
