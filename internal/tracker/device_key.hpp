#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "internal/appliance/raw_device_record.hpp"

namespace presence::tracker {

using DeviceKey = std::string;

// Lower-case; every run of non-alphanumerics becomes one '_'; no leading/trailing '_'.
std::string Sanitize(std::string_view label);

// Last four hex digits of a normalized MAC ("aa:bb:cc:dd:ee:ff" -> "eeff").
std::string MacSuffix(std::string_view mac);

// "mac:<mac>" or, for MAC-less records, "ip:<lowest address>". Empty if neither exists.
std::string IdentityOf(const appliance::RawDeviceRecord& record);

// Sanitized name, else sanitized vendor, else "device".
std::string DeviceLabel(const std::optional<std::string>& name, const std::optional<std::string>& vendor);

/*
  "<label>_<suffix>".

  label:  sanitized name, else sanitized vendor, else "device"
  suffix: MacSuffix(mac), else the sanitized address
*/
DeviceKey DeriveDeviceKey(const std::optional<std::string>& name, const std::optional<std::string>& vendor,
                          const std::optional<std::string>& mac, std::string_view address);

} // namespace presence::tracker
