#include "oui_table.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <vector>

#include "internal/util/errors.hpp"

namespace presence::tracker {

namespace {

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front()))) text.remove_prefix(1);
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) text.remove_suffix(1);
  return text;
}

// Last non-empty tab separated field: the long vendor name in manuf files.
std::string_view VendorField(std::string_view rest) {
  std::string_view vendor;
  while (!rest.empty()) {
    const auto tab   = rest.find('\t');
    const auto field = Trim(rest.substr(0, tab));
    if (!field.empty()) vendor = field;
    if (tab == std::string_view::npos) break;
    rest.remove_prefix(tab + 1);
  }
  return vendor;
}

} // namespace

std::optional<std::string> OuiTable::PrefixKey(std::string_view text) {
  std::string key;
  for (char c : text) {
    const auto uc = static_cast<unsigned char>(c);
    if (std::isxdigit(uc)) {
      key.push_back(static_cast<char>(std::tolower(uc)));
      if (key.size() == 6) return key;
    } else if (c != ':' && c != '-' && c != '.') {
      return std::nullopt;
    }
  }
  return std::nullopt;
}

OuiTable OuiTable::LoadFromFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw util::InvalidConfig("cannot open OUI file '" + path + "'");
  }
  return Parse(in);
}

OuiTable OuiTable::Parse(std::istream& in) {
  OuiTable    table;
  std::string line;
  while (std::getline(in, line)) {
    auto text = Trim(line);
    if (text.empty() || text.front() == '#') continue;

    const auto split  = text.find_first_of(" \t");
    const auto prefix = text.substr(0, split);
    if (prefix.find('/') != std::string_view::npos) continue;
    if (split == std::string_view::npos) continue;

    auto rest = Trim(text.substr(split));
    for (std::string_view marker : {"(hex)", "(base 16)"}) {
      if (rest.substr(0, marker.size()) == marker) rest.remove_prefix(marker.size());
    }

    const auto vendor = VendorField(rest);
    if (vendor.empty()) continue;
    table.Add(prefix, std::string(vendor));
  }
  return table;
}

void OuiTable::Add(std::string_view prefix, std::string vendor) {
  auto key = PrefixKey(prefix);
  if (!key || vendor.empty()) return;
  // first entry wins; the IEEE export lists each prefix twice
  vendors_.emplace(std::move(*key), std::move(vendor));
}

std::optional<std::string> OuiTable::Lookup(std::string_view mac) const {
  auto key = PrefixKey(mac);
  if (!key) return std::nullopt;

  auto it = vendors_.find(*key);
  if (it == vendors_.end()) return std::nullopt;
  return it->second;
}

} // namespace presence::tracker
