/**
 * @file ovpn_parser.cpp
 * @brief `remote` directive scanning.
 */
#include "vpnlist/archive/ovpn_parser.hpp"

#include <vector>

#include <fmt/format.h>

namespace vpnlist::archive {

namespace {

constexpr std::string_view kWhitespace = " \t\r";

std::string_view trim(std::string_view s) noexcept {
    const auto b = s.find_first_not_of(kWhitespace);
    if (b == std::string_view::npos) return {};
    const auto e = s.find_last_not_of(kWhitespace);
    return s.substr(b, e - b + 1);
}

/// Second whitespace-separated field of `line`, empty if absent.
std::string_view second_field(std::string_view line) noexcept {
    auto first_end = line.find_first_of(kWhitespace);
    if (first_end == std::string_view::npos) return {};
    auto rest = trim(line.substr(first_end));
    return rest.substr(0, rest.find_first_of(kWhitespace));
}

} // namespace

Result<ParsedHost> extract_host_from_ovpn(std::string_view content) {
    std::vector<std::string_view> hosts;

    std::size_t pos = 0;
    while (pos <= content.size()) {
        auto nl = content.find('\n', pos);
        if (nl == std::string_view::npos) nl = content.size();
        const auto line = trim(content.substr(pos, nl - pos));
        pos = nl + 1;

        if (line.size() < 6 || line.substr(0, 6) != "remote") continue;
        if (line.size() > 6 && line[6] != ' ' && line[6] != '\t') continue; // remote-random etc.

        const auto host = second_field(line);
        if (host.empty()) {
            return make_error(ErrorCode::Parse, fmt::format("remote line has no host: \"{}\"", line));
        }
        hosts.push_back(host);
    }

    if (hosts.empty()) return make_error(ErrorCode::Parse, "remote line not found");

    ParsedHost out{std::string(hosts.front()), {}};
    if (hosts.size() > 1) {
        out.warning = fmt::format("only using the first host \"{}\" and discarding {} other hosts",
                                  out.host, hosts.size() - 1);
    }
    return out;
}

} // namespace vpnlist::archive
