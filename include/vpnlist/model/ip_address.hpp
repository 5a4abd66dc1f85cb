/**
 * @file ip_address.hpp
 * @brief IPv4/IPv6 address value type used by resolver results and servers.
 *
 * Addresses are stored in network byte order. Ordering is total: every IPv4
 * address sorts before every IPv6 address, then byte-wise within a family.
 */
#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vpnlist::model {

enum class IpFamily : std::uint8_t {
  V4 = 0,
  V6 = 1
};

class IpAddress final {
public:
  IpAddress() = default;

  /// Build from 4 network-order bytes.
  static IpAddress v4(const std::array<std::uint8_t, 4>& bytes) noexcept;

  /// Build from 16 network-order bytes.
  static IpAddress v6(const std::array<std::uint8_t, 16>& bytes) noexcept;

  /// Parse a textual IPv4/IPv6 literal; nullopt if not a valid address.
  static std::optional<IpAddress> parse(std::string_view text);

  [[nodiscard]] IpFamily family() const noexcept { return family_; }

  /// Canonical text form ("192.0.2.1", "2001:db8::1").
  [[nodiscard]] std::string to_string() const;

  std::strong_ordering operator<=>(const IpAddress& other) const noexcept;
  bool operator==(const IpAddress& other) const noexcept;

private:
  IpFamily family_{IpFamily::V4};
  std::array<std::uint8_t, 16> bytes_{}; ///< IPv4 uses the first 4 bytes.
};

using IpList = std::vector<IpAddress>;

/**
 * @brief Sort ascending and drop duplicates.
 * @return A new list; the input is left untouched.
 */
[[nodiscard]] IpList unique_sorted(IpList ips);

} // namespace vpnlist::model
