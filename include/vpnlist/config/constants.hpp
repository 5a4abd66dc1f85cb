#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the updater components.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          Config Loader (JSON) for other providers or environments.
 */

#include <chrono>
#include <cstdint>
#include <string_view>

namespace vpnlist::config::constants {

// =====================
// Provider defaults (Surfshark zip of OpenVPN files)
// =====================
/// Archive with one .ovpn file per server and protocol.
inline constexpr std::string_view PROVIDER_NAME         = "Surfshark";
inline constexpr std::string_view PROVIDER_ARCHIVE_URL  = "https://my.surfshark.com/vpn/api/v1/server/configurations";
/// Files ending with this are TCP duplicates of a UDP file and are skipped.
inline constexpr std::string_view PROVIDER_SKIP_SUFFIX  = "_tcp.ovpn";
/// Hostname = <subdomain code> + suffix.
inline constexpr std::string_view PROVIDER_DOMAIN_SUFFIX = ".prod.surfshark.com";

// =====================
// Resolver defaults
// =====================
/// Archive hosts: strict pass, generous budget (20 tries x 1 s).
inline constexpr std::uint32_t RESOLVE_ARCHIVE_REPETITION = 20;
inline constexpr std::chrono::milliseconds RESOLVE_ARCHIVE_TIME_BETWEEN{1000};
inline constexpr bool          RESOLVE_ARCHIVE_FAIL_ON_ERR = true;

/// Table-only hosts: best-effort pass, same budget.
inline constexpr std::uint32_t RESOLVE_TABLE_REPETITION = 20;
inline constexpr std::chrono::milliseconds RESOLVE_TABLE_TIME_BETWEEN{1000};
inline constexpr bool          RESOLVE_TABLE_FAIL_ON_ERR = false;

// =====================
// HTTP fetch defaults
// =====================
inline constexpr std::chrono::seconds HTTP_TIMEOUT{30};          ///< Whole-transfer limit
inline constexpr std::uint64_t        HTTP_MAX_BODY_BYTES = 64ULL << 20; ///< 64 MiB
/// Cap on the declared uncompressed size of all zip members together.
inline constexpr std::uint64_t        ZIP_MAX_INFLATED_BYTES = 256ULL << 20; ///< 256 MiB

// =====================
// Output defaults
// =====================
/// Name of the function emitted by the source-literal renderer.
inline constexpr std::string_view OUTPUT_FUNCTION_NAME = "surfshark_servers";

} // namespace vpnlist::config::constants
