/**
 * @file region_table.cpp
 * @brief JSON loading for the region table.
 */
#include "vpnlist/config/region_table.hpp"

#include <fstream>
#include <iterator>
#include <utility>

#include <nlohmann/json.hpp>

namespace vpnlist::config {

using nlohmann::json;

RegionTable::RegionTable(std::string provider, std::string domain_suffix, Map entries)
    : provider_(std::move(provider)),
      domain_suffix_(std::move(domain_suffix)),
      entries_(std::move(entries)) {}

Result<RegionTable> RegionTable::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return make_error(ErrorCode::Config, "cannot open region table " + path);
    const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    auto table = parse(text);
    if (!table) return vpnlist_detail::unexpected<Error>(table.error().wrap(path));
    return table;
}

Result<RegionTable> RegionTable::parse(std::string_view json_text) {
    const json doc = json::parse(json_text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded() || !doc.is_object()) {
        return make_error(ErrorCode::Config, "region table is not a JSON object");
    }

    std::string provider;
    std::string suffix;
    if (auto it = doc.find("provider"); it != doc.end() && it->is_string()) provider = it->get<std::string>();
    if (auto it = doc.find("domain_suffix"); it != doc.end() && it->is_string()) suffix = it->get<std::string>();

    const auto regions = doc.find("regions");
    if (regions == doc.end() || !regions->is_object()) {
        return make_error(ErrorCode::Config, "region table has no \"regions\" object");
    }

    Map entries;
    for (const auto& [code, name] : regions->items()) {
        if (code.empty() || !name.is_string() || name.get_ref<const std::string&>().empty()) {
            return make_error(ErrorCode::Config, "invalid region entry for code \"" + code + "\"");
        }
        entries.emplace(code, name.get<std::string>());
    }
    return RegionTable(std::move(provider), std::move(suffix), std::move(entries));
}

std::optional<std::string> RegionTable::region_for(std::string_view code) const {
    auto it = entries_.find(code);
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

} // namespace vpnlist::config
