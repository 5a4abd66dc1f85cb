/**
 * @file server_store.cpp
 * @brief Mutex-guarded snapshot store and nlohmann::json persistence.
 */
#include "vpnlist/model/server_store.hpp"

#include <fstream>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

namespace vpnlist::model {

using nlohmann::json;

void ServerStore::publish(ServerList servers, std::int64_t timestamp) {
    std::lock_guard<std::mutex> lk(mu_);
    current_.servers = std::move(servers);
    current_.timestamp = timestamp;
    ++version_;
}

ServerSnapshot ServerStore::snapshot() const {
    std::lock_guard<std::mutex> lk(mu_);
    return current_;
}

std::uint64_t ServerStore::version() const {
    std::lock_guard<std::mutex> lk(mu_);
    return version_;
}

Result<void> save_snapshot_json(const std::string& path, const ServerSnapshot& snap) {
    json servers = json::array();
    for (const auto& s : snap.servers) {
        json ips = json::array();
        for (const auto& ip : s.ips) ips.push_back(ip.to_string());
        servers.push_back(json{{"region", s.region}, {"ips", std::move(ips)}});
    }
    const json doc = {{"timestamp", snap.timestamp}, {"servers", std::move(servers)}};

    // Serialize before touching the file so a bad region string leaves it intact.
    std::string text;
    try {
        text = doc.dump(2);
    } catch (const json::exception& e) {
        return make_error(ErrorCode::Io, "encoding " + path + ": " + e.what());
    }

    std::ofstream out(path, std::ios::trunc);
    if (!out) return make_error(ErrorCode::Io, "cannot open " + path + " for writing");
    out << text << '\n';
    if (!out) return make_error(ErrorCode::Io, "cannot write " + path);
    return {};
}

Result<ServerSnapshot> load_snapshot_json(const std::string& path) {
    std::ifstream in(path);
    if (!in) return make_error(ErrorCode::Io, "cannot open " + path);

    ServerSnapshot snap;
    try {
        const json doc = json::parse(in);
        snap.timestamp = doc.at("timestamp").get<std::int64_t>();
        for (const auto& js : doc.at("servers")) {
            IpList ips;
            for (const auto& jip : js.at("ips")) {
                const auto text = jip.get<std::string>();
                auto ip = IpAddress::parse(text);
                if (!ip) return make_error(ErrorCode::Config, "invalid IP address \"" + text + "\" in " + path);
                ips.push_back(*ip);
            }
            snap.servers.push_back(make_server(js.at("region").get<std::string>(), std::move(ips)));
        }
    } catch (const json::exception& e) {
        return make_error(ErrorCode::Config, "decoding " + path + ": " + e.what());
    }
    return snap;
}

} // namespace vpnlist::model
