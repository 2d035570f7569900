#include "device_key.hpp"

#include <cctype>

namespace presence::tracker {

namespace {

constexpr char kFallbackLabel[] = "device";

} // namespace

std::string Sanitize(std::string_view label) {
  std::string out;
  out.reserve(label.size());
  bool pending_separator = false;
  for (char c : label) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isalnum(uc)) {
      if (pending_separator && !out.empty()) out.push_back('_');
      pending_separator = false;
      out.push_back(static_cast<char>(std::tolower(uc)));
    } else {
      pending_separator = true;
    }
  }
  return out;
}

std::string MacSuffix(std::string_view mac) {
  std::string hex;
  for (char c : mac) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isxdigit(uc)) hex.push_back(static_cast<char>(std::tolower(uc)));
  }
  return hex.size() <= 4 ? hex : hex.substr(hex.size() - 4);
}

std::string IdentityOf(const appliance::RawDeviceRecord& record) {
  if (record.mac) return "mac:" + *record.mac;
  if (!record.ips.empty()) return "ip:" + *record.ips.begin();
  return {};
}

std::string DeviceLabel(const std::optional<std::string>& name, const std::optional<std::string>& vendor) {
  if (name) {
    if (auto label = Sanitize(*name); !label.empty()) return label;
  }
  if (vendor) {
    if (auto label = Sanitize(*vendor); !label.empty()) return label;
  }
  return kFallbackLabel;
}

DeviceKey DeriveDeviceKey(const std::optional<std::string>& name, const std::optional<std::string>& vendor,
                          const std::optional<std::string>& mac, std::string_view address) {
  const auto suffix = mac ? MacSuffix(*mac) : Sanitize(address);
  return DeviceLabel(name, vendor) + "_" + suffix;
}

} // namespace presence::tracker
