/**
 * @file server.hpp
 * @brief VPN server model: one region and the IP addresses serving it.
 *
 * Mirrors the role of a PoP descriptor: keep it small and value-like so lists
 * compare element-wise in tests and can be copied into the store freely.
 */
#pragma once

#include <string>
#include <vector>

#include "vpnlist/model/ip_address.hpp"

namespace vpnlist::model {

/**
 * @brief A provider server entry.
 *
 * @note `ips` is expected to be unique and sorted ascending; use
 *       make_server() to build one from raw resolver output.
 */
struct Server final {
  /// Human-readable region, e.g. "Germany Berlin".
  std::string region;

  /// Resolved addresses, unique and ascending.
  IpList ips;

  bool operator==(const Server&) const = default;
};

using ServerList = std::vector<Server>;

/// Build a Server, deduplicating and sorting `ips`.
[[nodiscard]] Server make_server(std::string region, IpList ips);

/// Stable sort ascending by region name (byte-wise).
void sort_by_region(ServerList& servers);

/// Render one server as a C++ aggregate initializer, e.g.
/// `{.region = "Albania", .ips = {"192.0.2.1"}}`.
[[nodiscard]] std::string to_source_literal(const Server& server);

/// Render the whole list as a function returning it, for embedding in code.
[[nodiscard]] std::string to_source_literal(const ServerList& servers,
                                            const std::string& function_name);

} // namespace vpnlist::model
