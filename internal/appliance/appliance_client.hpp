#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/http/http_transport.hpp"
#include "internal/session/session.hpp"
#include "presence/appliance/v1/pihole_api.pb.h"
#include "raw_device_record.hpp"

namespace presence::appliance {

struct ApplianceClientOptions {
  std::uint32_t max_devices{999};
  std::uint32_t max_addresses{24};
  std::uint32_t query_window{1000};
};

// Recent-query activity of one client IP.
struct QuerySummary {
  util::TimePoint            last_query{};
  std::int64_t               count{0};
  std::optional<std::string> name;
};

/*
  Typed reads of the appliance web API over an authenticated session.

  FetchDevices() issues the network-table, DHCP-lease and recent-query
  requests and joins them into one record per device. No retries happen
  here; errors are classified and thrown:
    401                    -> util::SessionExpired
    429 / 5xx / transport  -> util::UnreachableError
    anything unexpected    -> util::MalformedResponseError
*/
class ApplianceClient {
 public:
  ApplianceClient(http::HttpTransportPtr transport, ApplianceClientOptions options);

  std::vector<RawDeviceRecord> FetchDevices(const session::Session& session);

  presence::appliance::v1::NetworkDevicesResponse FetchNetworkTable(const session::Session& session);
  presence::appliance::v1::DhcpLeasesResponse     FetchLeases(const session::Session& session);
  std::unordered_map<std::string, QuerySummary>   FetchQuerySummary(const session::Session& session);

 private:
  std::string Get(const session::Session& session, const std::string& target, std::string_view what);

  http::HttpTransportPtr transport_;
  ApplianceClientOptions options_;
};

// Aggregates a recent-queries page per client IP.
std::unordered_map<std::string, QuerySummary> SummarizeQueries(const presence::appliance::v1::QueriesResponse& queries);

/*
  Joins the three appliance tables.

  One record per network-table device; leases join by MAC, then by IP;
  query summaries join by IP. Clients seen only in the query log become
  MAC-less records. Leases never create a record on their own.
*/
std::vector<RawDeviceRecord> JoinDeviceTables(const presence::appliance::v1::NetworkDevicesResponse& network,
                                              const presence::appliance::v1::DhcpLeasesResponse&     leases,
                                              const std::unordered_map<std::string, QuerySummary>&  queries);

} // namespace presence::appliance
