/**
 * @file reconciler.cpp
 * @brief Two-pass resolve-then-reconcile.
 */
#include "vpnlist/update/reconciler.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include <fmt/format.h>

#include "vpnlist/obs/observability.hpp"

namespace vpnlist::update {

namespace {

template <class T>
void append(std::vector<T>& dst, std::vector<T>&& src) {
    dst.insert(dst.end(), std::make_move_iterator(src.begin()), std::make_move_iterator(src.end()));
}

std::vector<const resolve::HostToIps::value_type*> sorted_entries(const resolve::HostToIps& resolved) {
    std::vector<const resolve::HostToIps::value_type*> out;
    out.reserve(resolved.size());
    for (const auto& kv : resolved) out.push_back(&kv);
    std::sort(out.begin(), out.end(), [](const auto* a, const auto* b) { return a->first < b->first; });
    return out;
}

} // namespace

std::string subdomain_code(std::string_view host, std::string_view suffix) {
    if (!suffix.empty() && host.ends_with(suffix)) host.remove_suffix(suffix.size());
    return std::string(host);
}

PassOutput map_archive_hosts(const resolve::HostToIps& resolved,
                             std::string_view domain_suffix,
                             config::RegionTable::Map& remaining) {
    PassOutput out;
    out.servers.reserve(resolved.size());
    for (const auto* entry : sorted_entries(resolved)) {
        const auto& [host, ips] = *entry;
        if (ips.empty()) {
            out.warnings.push_back(resolve::no_ip_warning(host));
            continue;
        }
        auto code = subdomain_code(host, domain_suffix);
        std::string region;
        if (auto it = remaining.find(code); it != remaining.end()) {
            region = std::move(it->second);
            remaining.erase(it);
        } else {
            out.warnings.push_back(fmt::format("subdomain \"{}\" not found in region table", code));
            region = std::move(code);
        }
        out.servers.push_back(model::make_server(std::move(region), ips));
    }
    return out;
}

model::ServerList map_remaining_hosts(const resolve::HostToIps& resolved,
                                      std::string_view domain_suffix,
                                      const config::RegionTable::Map& remaining) {
    model::ServerList servers;
    servers.reserve(resolved.size());
    for (const auto& [host, ips] : resolved) {
        if (ips.empty()) continue;
        const auto it = remaining.find(subdomain_code(host, domain_suffix));
        if (it == remaining.end()) continue; // not one of ours
        servers.push_back(model::make_server(it->second, ips));
    }
    return servers;
}

std::vector<std::string> merge_duplicate_regions(model::ServerList& servers) {
    std::vector<std::string> warnings;
    model::sort_by_region(servers);
    model::ServerList merged;
    merged.reserve(servers.size());
    for (auto& s : servers) {
        if (!merged.empty() && merged.back().region == s.region) {
            warnings.push_back(fmt::format("region \"{}\" produced by more than one host, addresses merged", s.region));
            auto& ips = merged.back().ips;
            ips.insert(ips.end(), s.ips.begin(), s.ips.end());
            ips = model::unique_sorted(std::move(ips));
            continue;
        }
        merged.push_back(std::move(s));
    }
    servers = std::move(merged);
    return warnings;
}

std::vector<std::string> synthesize_hosts(const config::RegionTable::Map& remaining,
                                          std::string_view domain_suffix) {
    std::vector<std::string> hosts;
    hosts.reserve(remaining.size());
    for (const auto& [code, region] : remaining) {
        hosts.push_back(code + std::string(domain_suffix));
    }
    return hosts;
}

Reconciler::Reconciler(ReconcileSettings settings,
                       resolve::ParallelResolver resolver,
                       const config::RegionTable& table,
                       archive::HostParser parser)
    : settings_(std::move(settings)),
      resolver_(std::move(resolver)),
      table_(table),
      parser_(std::move(parser)) {
    settings_.archive_pass.fail_on_err = true;
    settings_.table_pass.fail_on_err = false;
}

Result<ReconcileResult> Reconciler::find_servers(const archive::FileContents& contents,
                                                 std::stop_token stop,
                                                 std::vector<std::string>* warnings_out) const {
    auto lg = obs::logger();
    ReconcileResult result;

    auto fail = [&](Error e) {
        if (warnings_out) *warnings_out = result.warnings;
        return vpnlist_detail::unexpected<Error>(std::move(e));
    };

    // Phase 1: archive -> hosts
    auto extraction = archive::extract_hosts(contents, settings_.skip_suffix, parser_);
    append(result.warnings, std::move(extraction.warnings));
    result.archive_hosts = extraction.hosts.size();
    lg->debug("extracted {} hosts from {} archive files", extraction.hosts.size(), contents.size());

    // Phase 2: strict resolve
    auto first = resolver_.resolve(extraction.hosts, settings_.archive_pass, stop);
    if (!first) return fail(first.error().wrap("resolving archive hosts"));

    // Phase 3: map against a private copy of the table
    config::RegionTable::Map remaining = table_.entries();
    auto mapped = map_archive_hosts(first->host_to_ips, settings_.domain_suffix, remaining);
    append(result.warnings, std::move(first->warnings));
    append(result.warnings, std::move(mapped.warnings));
    result.servers = std::move(mapped.servers);

    // Phase 4: best-effort resolve of codes the archive did not mention
    const auto fallback = synthesize_hosts(remaining, settings_.domain_suffix);
    result.fallback_hosts = fallback.size();
    lg->debug("{} archive servers, trying {} table-only hosts", result.servers.size(), fallback.size());
    if (!fallback.empty()) {
        auto second = resolver_.resolve(fallback, settings_.table_pass, stop);
        if (!second) return fail(second.error().wrap("resolving region table hosts"));
        append(result.warnings, std::move(second->warnings));
        append(result.servers, map_remaining_hosts(second->host_to_ips, settings_.domain_suffix, remaining));
    }

    // Phase 5: one server per region, ascending
    append(result.warnings, merge_duplicate_regions(result.servers));
    return result;
}

} // namespace vpnlist::update
