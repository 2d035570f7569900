#include "internal/appliance/appliance_client.hpp"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "internal/appliance/normalize.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "support/fake_appliance.hpp"

namespace {

using presence::appliance::ApplianceClient;
using presence::appliance::ApplianceClientOptions;
using presence::appliance::NormalizeMac;
using presence::appliance::NormalizeName;
using presence::appliance::RawDeviceRecord;
using presence::http::Method;
using presence::session::Session;
using presence::session::SessionStatus;
using presence::testing::FakeAppliance;
using presence::util::FromUnixSeconds;

constexpr char kNetwork[] = R"({"devices":[
  {"id":1,"hwaddr":"AA:BB:CC:DD:EE:01","interface":"eth0","firstSeen":1700000000,"lastQuery":1700000900,
   "numQueries":42,"macVendor":"Apple, Inc.",
   "ips":[{"ip":"192.168.1.20","name":"phone.lan","lastSeen":1700000900,"nameUpdated":1700000000},
          {"ip":"fd00::20","name":null,"lastSeen":1700000800,"nameUpdated":0}]},
  {"id":2,"hwaddr":"aa-bb-cc-dd-ee-02","interface":"wlan0","firstSeen":1700000000,"lastQuery":0,
   "numQueries":0,"macVendor":"","ips":[{"ip":"192.168.1.21","name":null}]},
  {"id":3,"hwaddr":"ip-192.168.1.30","interface":"eth0","firstSeen":1700000000,"lastQuery":1700000500,
   "numQueries":7,"macVendor":"","ips":[{"ip":"192.168.1.30","name":"printer"}]},
  {"id":4,"hwaddr":"00:00:00:00:00:00","interface":"lo","firstSeen":1700000000,"lastQuery":0,
   "numQueries":0,"ips":[]}
],"took":0.003})";

constexpr char kLeases[] = R"({"leases":[
  {"expires":1700086400,"name":"laptop","hwaddr":"aa:bb:cc:dd:ee:02","ip":"192.168.1.21","clientid":"01:aa"},
  {"expires":0,"name":"*","hwaddr":"aa:bb:cc:dd:ee:09","ip":"192.168.1.50","clientid":"*"}
],"took":0.001})";

constexpr char kQueries[] = R"({"queries":[
  {"id":10,"time":1700000950.5,"type":"A","domain":"example.com","client":{"ip":"192.168.1.20","name":"phone.lan"}},
  {"id":11,"time":1700000960.0,"type":"A","domain":"example.org","client":{"ip":"192.168.1.21","name":null}},
  {"id":12,"time":1700000970.0,"type":"AAAA","domain":"example.net","client":{"ip":"192.168.1.21","name":null}},
  {"id":13,"time":1700000980.0,"type":"A","domain":"tv.example","client":{"ip":"192.168.1.50","name":null}},
  {"id":14,"time":1700000990.0,"type":"A","domain":"local","client":{"ip":"127.0.0.1","name":"localhost"}},
  {"id":15,"time":1700000995.0,"type":"A","domain":"guest.example","client":{"ip":"192.168.1.77","name":"guest"}}
],"cursor":15,"recordsTotal":6,"recordsFiltered":6,"took":0.002})";

Session Anonymous() {
  Session session;
  session.status = SessionStatus::kAuthenticated;
  return session;
}

Session WithToken(const std::string& token) {
  auto session  = Anonymous();
  session.token = token;
  return session;
}

std::shared_ptr<FakeAppliance> LoadedAppliance() {
  auto appliance = std::make_shared<FakeAppliance>();
  appliance->SetNetwork(kNetwork);
  appliance->SetLeases(kLeases);
  appliance->SetQueries(kQueries);
  return appliance;
}

const RawDeviceRecord* FindByIp(const std::vector<RawDeviceRecord>& records, const std::string& ip) {
  for (const auto& record : records) {
    if (record.ips.count(ip)) return &record;
  }
  return nullptr;
}

template <typename Error, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Error&) {
    return true;
  }
  return false;
}

void TestNormalizeMac() {
  assert(NormalizeMac("AA:BB:CC:DD:EE:FF") == std::string("aa:bb:cc:dd:ee:ff"));
  assert(NormalizeMac("aa-bb-cc-dd-ee-ff") == std::string("aa:bb:cc:dd:ee:ff"));
  assert(NormalizeMac("aabb.ccdd.eeff") == std::string("aa:bb:cc:dd:ee:ff"));
  assert(!NormalizeMac("ip-192.168.1.30"));
  assert(!NormalizeMac("00:00:00:00:00:00"));
  assert(!NormalizeMac("aa:bb:cc"));
  assert(!NormalizeMac(""));
}

void TestNormalizeName() {
  assert(NormalizeName("  laptop ") == std::string("laptop"));
  assert(!NormalizeName("*"));
  assert(!NormalizeName("   "));
}

void TestFetchDevicesJoinsTables() {
  auto            appliance = LoadedAppliance();
  ApplianceClient client(appliance, ApplianceClientOptions{});

  const auto records = client.FetchDevices(Anonymous());

  // four network rows minus the all-zero/no-address one, plus two query-only clients
  assert(records.size() == 5);

  const auto* phone = FindByIp(records, "192.168.1.20");
  assert(phone && phone->mac == std::string("aa:bb:cc:dd:ee:01"));
  assert(phone->ips.count("fd00::20") == 1);
  assert(phone->name == std::string("phone.lan"));
  assert(phone->interface_name == std::string("eth0"));
  assert(phone->mac_vendor == std::string("Apple, Inc."));
  // network count wins over the query page
  assert(phone->num_queries == 42);
  // the query log is more recent than the network table
  assert(phone->last_query == FromUnixSeconds(1700000950.5));
  assert(!phone->dhcp_expires);

  const auto* laptop = FindByIp(records, "192.168.1.21");
  assert(laptop && laptop->mac == std::string("aa:bb:cc:dd:ee:02"));
  assert(laptop->name == std::string("laptop"));
  assert(laptop->dhcp_expires == FromUnixSeconds(1700086400));
  assert(!laptop->mac_vendor);
  assert(laptop->last_query == FromUnixSeconds(1700000970));
  assert(laptop->num_queries == 2);

  const auto* printer = FindByIp(records, "192.168.1.30");
  assert(printer && !printer->mac);
  assert(printer->name == std::string("printer"));

  // query-only client adopts the MAC of its lease; "*" is no name, expires 0 is infinite
  const auto* tv = FindByIp(records, "192.168.1.50");
  assert(tv && tv->mac == std::string("aa:bb:cc:dd:ee:09"));
  assert(!tv->name);
  assert(!tv->dhcp_expires);
  assert(tv->num_queries == 1);

  const auto* guest = FindByIp(records, "192.168.1.77");
  assert(guest && !guest->mac);
  assert(guest->name == std::string("guest"));

  assert(!FindByIp(records, "127.0.0.1"));
}

void TestRequestsCarryParametersAndSid() {
  auto                   appliance = LoadedAppliance();
  ApplianceClientOptions options;
  options.max_devices   = 50;
  options.max_addresses = 4;
  options.query_window  = 250;
  ApplianceClient client(appliance, options);

  (void)client.FetchDevices(WithToken("abc"));

  bool saw_network = false;
  bool saw_queries = false;
  for (const auto& request : appliance->requests()) {
    assert(FakeAppliance::HeaderOf(request, "X-FTL-SID") == std::string("abc"));
    if (request.target == "/api/network/devices?max_devices=50&max_addresses=4") saw_network = true;
    if (request.target == "/api/queries?length=250") saw_queries = true;
  }
  assert(saw_network && saw_queries);
}

void TestUnauthorizedMeansSessionExpired() {
  auto appliance = LoadedAppliance();
  appliance->Override("/api/dhcp/leases", 401, R"({"error":{"key":"unauthorized","message":"Unauthorized","hint":null}})");
  ApplianceClient client(appliance, ApplianceClientOptions{});

  assert(Throws<presence::util::SessionExpired>([&] { (void)client.FetchDevices(Anonymous()); }));
}

void TestServerErrorsAreUnreachable() {
  auto appliance = LoadedAppliance();
  appliance->Override("/api/network/devices", 503, "Service Unavailable");
  ApplianceClient client(appliance, ApplianceClientOptions{});
  assert(Throws<presence::util::UnreachableError>([&] { (void)client.FetchDevices(Anonymous()); }));

  appliance->Override("/api/network/devices", 429, R"({"error":{"key":"rate_limiting","message":"Rate-limiting","hint":null}})");
  assert(Throws<presence::util::UnreachableError>([&] { (void)client.FetchDevices(Anonymous()); }));

  appliance->ClearOverride("/api/network/devices");
  appliance->Unreachable(true);
  assert(Throws<presence::util::UnreachableError>([&] { (void)client.FetchDevices(Anonymous()); }));
}

void TestMalformedPayloadsAreRejected() {
  auto            appliance = LoadedAppliance();
  ApplianceClient client(appliance, ApplianceClientOptions{});

  appliance->SetNetwork("<html>not json</html>");
  assert(Throws<presence::util::MalformedResponseError>([&] { (void)client.FetchDevices(Anonymous()); }));

  appliance->SetNetwork(R"({"took":0.1})");
  assert(Throws<presence::util::MalformedResponseError>([&] { (void)client.FetchDevices(Anonymous()); }));

  appliance->SetNetwork(R"({"devices":{"id":1}})");
  assert(Throws<presence::util::MalformedResponseError>([&] { (void)client.FetchDevices(Anonymous()); }));

  appliance->SetNetwork(R"({"devices":[{"id":"one","ips":"192.168.1.2"}]})");
  assert(Throws<presence::util::MalformedResponseError>([&] { (void)client.FetchDevices(Anonymous()); }));

  appliance->SetNetwork(kNetwork);
  appliance->Override("/api/queries", 404, R"({"error":{"key":"not_found","message":"Not found","hint":null}})");
  assert(Throws<presence::util::MalformedResponseError>([&] { (void)client.FetchDevices(Anonymous()); }));
}

void TestSummarizeQueriesSkipsUndated() {
  presence::appliance::v1::QueriesResponse queries;
  presence::util::ParseJson(R"({"queries":[
    {"id":1,"time":0,"domain":"a","client":{"ip":"10.0.0.2"}},
    {"id":2,"time":1700000001,"domain":"b","client":{"ip":""}},
    {"id":3,"time":1700000002,"domain":"c","client":{"ip":"10.0.0.3","name":"*"}}]})",
                            &queries, "test");

  const auto summary = presence::appliance::SummarizeQueries(queries);
  assert(summary.size() == 1);
  assert(summary.at("10.0.0.3").count == 1);
  assert(!summary.at("10.0.0.3").name);
}

} // namespace

int main() {
  TestNormalizeMac();
  TestNormalizeName();
  TestFetchDevicesJoinsTables();
  TestRequestsCarryParametersAndSid();
  TestUnauthorizedMeansSessionExpired();
  TestServerErrorsAreUnreachable();
  TestMalformedPayloadsAreRejected();
  TestSummarizeQueriesSkipsUndated();

  std::cout << "pihole_presence_unit_appliance_client: pass\n";
  return 0;
}
