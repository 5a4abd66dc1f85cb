/**
 * @file host_extractor.cpp
 * @brief Skip rule, warning downgrade and host deduplication.
 */
#include "vpnlist/archive/host_extractor.hpp"

#include <algorithm>
#include <utility>

namespace vpnlist::archive {

HostExtraction extract_hosts(const FileContents& contents,
                             std::string_view skip_suffix,
                             const HostParser& parser) {
    HostExtraction out;
    out.hosts.reserve(contents.size());

    for (const auto& [name, content] : contents) {
        if (!skip_suffix.empty() && name.ends_with(skip_suffix)) continue;

        auto parsed = parser(content);
        if (!parsed) {
            out.warnings.push_back(parsed.error().message + " in " + name);
            continue;
        }
        if (!parsed->warning.empty()) out.warnings.push_back(parsed->warning);
        out.hosts.push_back(std::move(parsed->host));
    }

    std::sort(out.hosts.begin(), out.hosts.end());
    out.hosts.erase(std::unique(out.hosts.begin(), out.hosts.end()), out.hosts.end());
    return out;
}

} // namespace vpnlist::archive
