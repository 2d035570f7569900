#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace presence::appliance {

// Lower-case colon form, or nullopt for pseudo addresses ("ip-10.0.0.3"),
// the all-zero MAC and anything that is not 12 hex digits.
std::optional<std::string> NormalizeMac(std::string_view raw);

// Trimmed label, or nullopt when empty or the appliance placeholder "*".
std::optional<std::string> NormalizeName(std::string_view raw);

} // namespace presence::appliance
