#pragma once

#include <cstddef>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace presence::tracker {

/*
  MAC prefix (OUI, first 3 octets) -> vendor name.

  Reads the IEEE registry export ("00-22-72   (hex)\t\tVendor"), the
  Wireshark manuf layout ("00:22:72\tShort\tLong Vendor") and plain
  "002272 Vendor" lines. Entries for longer prefixes (".../28") are skipped.
*/
class OuiTable {
 public:
  static OuiTable LoadFromFile(const std::string& path);
  static OuiTable Parse(std::istream& in);

  void Add(std::string_view prefix, std::string vendor);

  std::optional<std::string> Lookup(std::string_view mac) const;

  std::size_t size() const {
    return vendors_.size();
  }

 private:
  static std::optional<std::string> PrefixKey(std::string_view text);

  std::unordered_map<std::string, std::string> vendors_;
};

} // namespace presence::tracker
