#include "internal/tracker/oui_table.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/util/errors.hpp"

namespace {

using presence::tracker::OuiTable;

void TestParsesIeeeRegistryExport() {
  std::istringstream in(
      "OUI/MA-L                                                    Organization\n"
      "company_id                                                  Organization\n"
      "                                                            Address\n"
      "\n"
      "00-22-72   (hex)\t\tAmerican Micro-Fuel Device Corp.\n"
      "002272     (base 16)\t\tAmerican Micro-Fuel Device Corp.\n"
      "\t\t\t\t2181 Buchanan Loop\n"
      "\t\t\t\tFerndale  WA  98248\n"
      "\t\t\t\tUS\n"
      "\n"
      "F4-0F-24   (hex)\t\tApple, Inc.\n"
      "F40F24     (base 16)\t\tApple, Inc.\n");

  const auto table = OuiTable::Parse(in);
  assert(table.size() == 2);
  assert(table.Lookup("00:22:72:12:34:56") == std::string("American Micro-Fuel Device Corp."));
  assert(table.Lookup("f4:0f:24:00:00:01") == std::string("Apple, Inc."));
  assert(!table.Lookup("aa:bb:cc:dd:ee:ff"));
}

void TestParsesManufLayout() {
  std::istringstream in(
      "# Wireshark manuf\n"
      "00:00:0C\tCisco\tCisco Systems, Inc\n"
      "00:1B:C5:00:00/36\tConverging\tConverging Systems Inc.\n"
      "B8:27:EB\tRaspberr\tRaspberry Pi Foundation\n"
      "DC:A6:32\tRaspberr\n");

  const auto table = OuiTable::Parse(in);
  assert(table.Lookup("00:00:0c:01:02:03") == std::string("Cisco Systems, Inc"));
  assert(table.Lookup("b8:27:eb:aa:bb:cc") == std::string("Raspberry Pi Foundation"));
  assert(table.Lookup("dc:a6:32:aa:bb:cc") == std::string("Raspberr"));
  assert(!table.Lookup("00:1b:c5:00:00:01"));
}

void TestPlainLinesAndFirstEntryWins() {
  std::istringstream in("b827eb First Vendor\nB8-27-EB Second Vendor\n");
  const auto         table = OuiTable::Parse(in);
  assert(table.size() == 1);
  assert(table.Lookup("B8:27:EB:00:00:00") == std::string("First Vendor"));
  assert(!table.Lookup("not a mac"));
}

void TestLoadFromFile() {
  const auto path = std::filesystem::temp_directory_path() / "pihole_presence_oui_test.txt";
  {
    std::ofstream out(path);
    out << "B8:27:EB\tRaspberr\tRaspberry Pi Foundation\n";
  }
  const auto table = OuiTable::LoadFromFile(path.string());
  assert(table.size() == 1);
  std::filesystem::remove(path);

  bool threw = false;
  try {
    (void)OuiTable::LoadFromFile("/nonexistent/oui.txt");
  } catch (const presence::util::InvalidConfig&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestParsesIeeeRegistryExport();
  TestParsesManufLayout();
  TestPlainLinesAndFirstEntryWins();
  TestLoadFromFile();

  std::cout << "pihole_presence_unit_oui_table: pass\n";
  return 0;
}
