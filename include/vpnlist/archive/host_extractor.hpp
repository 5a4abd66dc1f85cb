#pragma once
/**
 * @file host_extractor.hpp
 * @brief Archive contents -> deduplicated candidate hostnames.
 */

#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

#include "vpnlist/archive/ovpn_parser.hpp"
#include "vpnlist/error.hpp"

namespace vpnlist::archive {

/// Archive member base name -> raw file content.
using FileContents = std::map<std::string, std::string>;

/// Single-file parser seam; extract_host_from_ovpn by default.
using HostParser = std::function<Result<ParsedHost>(std::string_view content)>;

/** @struct HostExtraction
 *  @brief Distinct hosts (sorted) plus per-file warnings.
 */
struct HostExtraction {
    std::vector<std::string> hosts;
    std::vector<std::string> warnings;
};

/**
 * @brief Parse every eligible file in `contents`.
 * @param skip_suffix Files whose name ends with it are ignored silently
 *        (TCP twin of a UDP file). Empty disables skipping.
 * @param parser Parse failures become "<error> in <file>" warnings.
 */
HostExtraction extract_hosts(const FileContents& contents,
                             std::string_view skip_suffix,
                             const HostParser& parser = extract_host_from_ovpn);

} // namespace vpnlist::archive
