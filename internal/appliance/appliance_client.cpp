#include "appliance_client.hpp"

#include <algorithm>
#include <map>
#include <unordered_set>
#include <utility>

#include "api_status.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/json.hpp"
#include "normalize.hpp"

namespace presence::appliance {

using namespace presence::appliance::v1;

namespace {

bool IsLoopback(const std::string& ip) {
  return ip.rfind("127.", 0) == 0 || ip == "::1";
}

const DhcpLease* FindLease(const RawDeviceRecord& record, const std::unordered_map<std::string, const DhcpLease*>& by_mac,
                           const std::unordered_map<std::string, const DhcpLease*>& by_ip) {
  if (record.mac) {
    if (auto it = by_mac.find(*record.mac); it != by_mac.end()) return it->second;
  }
  for (const auto& ip : record.ips) {
    if (auto it = by_ip.find(ip); it != by_ip.end()) return it->second;
  }
  return nullptr;
}

void ApplyLease(RawDeviceRecord& record, const DhcpLease& lease) {
  // expires == 0 marks an infinite lease
  if (lease.has_expires() && lease.expires() > 0) {
    record.dhcp_expires = util::FromUnixSeconds(static_cast<double>(lease.expires()));
  }
  if (!record.name && lease.has_name()) {
    record.name = NormalizeName(lease.name());
  }
  if (!lease.ip().empty()) {
    record.ips.insert(lease.ip());
  }
}

void ApplyQuerySummary(RawDeviceRecord& record, const QuerySummary& summary, bool network_count_known) {
  if (!record.last_query || *record.last_query < summary.last_query) {
    record.last_query = summary.last_query;
  }
  // The network table count is cumulative but refreshed lazily by the
  // appliance; the query page is a lower bound for it.
  if (network_count_known) {
    record.num_queries = std::max(*record.num_queries, summary.count);
  } else {
    record.num_queries = record.num_queries.value_or(0) + summary.count;
  }
  if (!record.name && summary.name) {
    record.name = summary.name;
  }
}

} // namespace

ApplianceClient::ApplianceClient(http::HttpTransportPtr transport, ApplianceClientOptions options)
    : transport_(std::move(transport)), options_(options) {
}

// ------------------------------------------------------------
// Raw requests
// ------------------------------------------------------------

std::string ApplianceClient::Get(const session::Session& session, const std::string& target, std::string_view what) {
  http::Request request;
  request.method = http::Method::kGet;
  request.target = target;
  if (session.token) {
    request.headers.emplace_back(kSessionHeader, *session.token);
  }

  auto response = transport_->Send(request);
  if (response.status == 401) {
    throw util::SessionExpired(std::string(what) + ": " + ErrorMessage(response.body));
  }
  RequireSuccess(response, what);
  return std::move(response.body);
}

NetworkDevicesResponse ApplianceClient::FetchNetworkTable(const session::Session& session) {
  const auto target = "/api/network/devices?max_devices=" + std::to_string(options_.max_devices) +
                      "&max_addresses=" + std::to_string(options_.max_addresses);
  const auto body = Get(session, target, "network table");

  util::RequireListMember(body, "devices", "network table");
  NetworkDevicesResponse network;
  util::ParseJson(body, &network, "network table");
  return network;
}

DhcpLeasesResponse ApplianceClient::FetchLeases(const session::Session& session) {
  const auto body = Get(session, "/api/dhcp/leases", "dhcp leases");

  util::RequireListMember(body, "leases", "dhcp leases");
  DhcpLeasesResponse leases;
  util::ParseJson(body, &leases, "dhcp leases");
  return leases;
}

std::unordered_map<std::string, QuerySummary> ApplianceClient::FetchQuerySummary(const session::Session& session) {
  const auto body = Get(session, "/api/queries?length=" + std::to_string(options_.query_window), "recent queries");

  util::RequireListMember(body, "queries", "recent queries");
  QueriesResponse queries;
  util::ParseJson(body, &queries, "recent queries");
  return SummarizeQueries(queries);
}

// ------------------------------------------------------------
// FetchDevices
// ------------------------------------------------------------

std::vector<RawDeviceRecord> ApplianceClient::FetchDevices(const session::Session& session) {
  auto network = FetchNetworkTable(session);
  auto leases  = FetchLeases(session);
  auto queries = FetchQuerySummary(session);

  auto records = JoinDeviceTables(network, leases, queries);
  PRESENCE_LOG_DEBUG("Fetched appliance tables", {observability::IntField("network_devices", network.devices_size()),
                                                  observability::IntField("leases", leases.leases_size()),
                                                  observability::IntField("query_clients", static_cast<std::int64_t>(queries.size())),
                                                  observability::IntField("records", static_cast<std::int64_t>(records.size()))});
  return records;
}

std::unordered_map<std::string, QuerySummary> SummarizeQueries(const QueriesResponse& queries) {
  std::unordered_map<std::string, QuerySummary> summaries;
  for (const auto& query : queries.queries()) {
    const auto& ip = query.client().ip();
    if (ip.empty() || query.time() <= 0) continue;

    auto&      summary = summaries[ip];
    const auto when    = util::FromUnixSeconds(query.time());
    if (summary.count == 0 || summary.last_query < when) {
      summary.last_query = when;
    }
    ++summary.count;
    if (!summary.name && query.client().has_name()) {
      summary.name = NormalizeName(query.client().name());
    }
  }
  return summaries;
}

std::vector<RawDeviceRecord> JoinDeviceTables(const NetworkDevicesResponse& network, const DhcpLeasesResponse& leases,
                                              const std::unordered_map<std::string, QuerySummary>& queries) {
  std::unordered_map<std::string, const DhcpLease*> leases_by_mac;
  std::unordered_map<std::string, const DhcpLease*> leases_by_ip;
  for (const auto& lease : leases.leases()) {
    if (lease.has_hwaddr()) {
      if (auto mac = NormalizeMac(lease.hwaddr())) leases_by_mac.emplace(*mac, &lease);
    }
    if (!lease.ip().empty()) leases_by_ip.emplace(lease.ip(), &lease);
  }

  std::vector<RawDeviceRecord>    records;
  std::unordered_set<std::string> claimed_ips;
  records.reserve(network.devices_size());

  for (const auto& device : network.devices()) {
    RawDeviceRecord record;
    if (device.has_hwaddr()) record.mac = NormalizeMac(device.hwaddr());

    for (const auto& address : device.ips()) {
      if (address.ip().empty()) continue;
      record.ips.insert(address.ip());
      if (!record.name && address.has_name()) record.name = NormalizeName(address.name());
    }

    if (device.has_interface() && !device.interface().empty()) record.interface_name = device.interface();
    // zero means the appliance never saw a query from this device
    if (device.has_last_query() && device.last_query() > 0) {
      record.last_query = util::FromUnixSeconds(static_cast<double>(device.last_query()));
    }
    if (device.has_num_queries()) record.num_queries = device.num_queries();
    if (device.has_mac_vendor() && !device.mac_vendor().empty()) record.mac_vendor = device.mac_vendor();

    if (const auto* lease = FindLease(record, leases_by_mac, leases_by_ip)) {
      ApplyLease(record, *lease);
    }

    const bool network_count_known = record.num_queries.has_value();
    for (const auto& ip : record.ips) {
      auto it = queries.find(ip);
      if (it == queries.end()) continue;
      claimed_ips.insert(ip);
      ApplyQuerySummary(record, it->second, network_count_known);
    }

    if (!record.mac && record.ips.empty()) {
      PRESENCE_LOG_DEBUG("Skipping network device without MAC or address", {observability::IntField("id", device.id())});
      continue;
    }
    records.push_back(std::move(record));
  }

  // Query-log clients the network table does not know yet, in address order.
  std::map<std::string, const QuerySummary*> unclaimed;
  for (const auto& [ip, summary] : queries) {
    if (!claimed_ips.count(ip) && !IsLoopback(ip)) unclaimed.emplace(ip, &summary);
  }
  for (const auto& [ip, summary] : unclaimed) {
    RawDeviceRecord record;
    record.ips.insert(ip);
    if (const auto* lease = FindLease(record, leases_by_mac, leases_by_ip)) {
      if (lease->has_hwaddr()) record.mac = NormalizeMac(lease->hwaddr());
      ApplyLease(record, *lease);
    }
    ApplyQuerySummary(record, *summary, false);
    records.push_back(std::move(record));
  }

  return records;
}

} // namespace presence::appliance
