#pragma once
/**
 * @file ovpn_parser.hpp
 * @brief Extract the server hostname from one OpenVPN client configuration.
 */

#include <string>
#include <string_view>

#include "vpnlist/error.hpp"

namespace vpnlist::archive {

/** @struct ParsedHost
 *  @brief Host recovered from a file; `warning` is non-empty when the file
 *         looked unusual but a host was still found.
 */
struct ParsedHost {
    std::string host;
    std::string warning;
};

/**
 * @brief Find the first `remote <host> [port] [proto]` directive.
 * @return ParsedHost, or ErrorCode::Parse when no usable remote line exists.
 */
Result<ParsedHost> extract_host_from_ovpn(std::string_view content);

} // namespace vpnlist::archive
