/**
 * @file server.cpp
 * @brief Server construction, ordering and source-literal rendering.
 */
#include "vpnlist/model/server.hpp"

#include <algorithm>
#include <utility>

#include <fmt/format.h>

namespace vpnlist::model {

namespace {

// C++ string literal body. Octal escapes are fixed width, unlike \x which
// would swallow a following hex digit.
std::string escape_literal(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (const char c : text) {
        const auto u = static_cast<unsigned char>(c);
        switch (c) {
        case '"':  out += "\\\""; break;
        case '\\': out += "\\\\"; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        default:
            if (u < 0x20 || u == 0x7F) {
                out += fmt::format("\\{:03o}", u);
            } else {
                out += c;
            }
        }
    }
    return out;
}

} // namespace

Server make_server(std::string region, IpList ips) {
    return Server{std::move(region), unique_sorted(std::move(ips))};
}

void sort_by_region(ServerList& servers) {
    std::stable_sort(servers.begin(), servers.end(),
                     [](const Server& a, const Server& b) { return a.region < b.region; });
}

std::string to_source_literal(const Server& server) {
    std::string ips;
    for (std::size_t i = 0; i < server.ips.size(); ++i) {
        if (i != 0) ips += ", ";
        ips += fmt::format("\"{}\"", server.ips[i].to_string());
    }
    return fmt::format("{{.region = \"{}\", .ips = {{{}}}}}", escape_literal(server.region), ips);
}

std::string to_source_literal(const ServerList& servers, const std::string& function_name) {
    std::string s = fmt::format("ServerList {}() {{\n", function_name);
    s += "    return ServerList{\n";
    for (const auto& server : servers) {
        s += "        " + to_source_literal(server) + ",\n";
    }
    s += "    };\n";
    s += "}";
    return s;
}

} // namespace vpnlist::model
