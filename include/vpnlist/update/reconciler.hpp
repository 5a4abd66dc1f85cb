#pragma once
/**
 * @file reconciler.hpp
 * @brief Merge archive-discovered hosts with the static region table.
 *
 * Phases (each internally parallel, strictly ordered between each other):
 *   1. extract hosts from the archive contents
 *   2. strict resolve of those hosts            (failure aborts)
 *   3. map resolved hosts to regions on a private copy of the table,
 *      erasing matched codes
 *   4. best-effort resolve of the codes left in the copy
 *   5. concatenate, sort by region
 *
 * The table is the source of truth for region names; the archive is the
 * source of truth for which hosts exist. Only the calling thread touches the
 * table copy.
 */

#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "vpnlist/archive/host_extractor.hpp"
#include "vpnlist/config/region_table.hpp"
#include "vpnlist/error.hpp"
#include "vpnlist/model/server.hpp"
#include "vpnlist/resolve/parallel_resolver.hpp"

namespace vpnlist::update {

/** @struct ReconcileSettings
 *  @brief Provider constants and per-pass resolver policy.
 */
struct ReconcileSettings {
    std::string skip_suffix;                 ///< e.g. "_tcp.ovpn"
    std::string domain_suffix;               ///< e.g. ".prod.surfshark.com"
    resolve::ResolveSettings archive_pass{}; ///< Forced strict
    resolve::ResolveSettings table_pass{};   ///< Forced best-effort
};

/** @struct ReconcileResult
 *  @brief Final sorted list plus every warning of the run.
 */
struct ReconcileResult {
    model::ServerList servers;
    std::vector<std::string> warnings;
    std::size_t archive_hosts{0};  ///< Distinct hosts extracted from the archive
    std::size_t fallback_hosts{0}; ///< Table-only hosts tried in the second pass
};

/// Host minus `suffix` when it ends with it, otherwise the host unchanged.
[[nodiscard]] std::string subdomain_code(std::string_view host, std::string_view suffix);

/** @struct PassOutput
 *  @brief Servers and warnings produced by mapping one resolver pass.
 */
struct PassOutput {
    model::ServerList servers;
    std::vector<std::string> warnings;
};

/**
 * @brief Map archive-pass resolver output to servers.
 * @param remaining Working table copy; matched codes are erased from it.
 * @details Unknown codes keep the bare code as region name and add a warning.
 *          Hosts with no address add a warning and no server.
 */
PassOutput map_archive_hosts(const resolve::HostToIps& resolved,
                             std::string_view domain_suffix,
                             config::RegionTable::Map& remaining);

/**
 * @brief Map fallback-pass resolver output to servers using `remaining` names.
 * @details Hosts with no address are skipped (the resolver already warned).
 */
model::ServerList map_remaining_hosts(const resolve::HostToIps& resolved,
                                      std::string_view domain_suffix,
                                      const config::RegionTable::Map& remaining);

/**
 * @brief Sort by region and fold servers sharing a region into one.
 * @return One warning per folded server. Only happens when the table maps
 *         two codes to the same name or an unknown code equals a region name.
 */
std::vector<std::string> merge_duplicate_regions(model::ServerList& servers);

/// `<code><suffix>` for every entry, in table order.
[[nodiscard]] std::vector<std::string> synthesize_hosts(const config::RegionTable::Map& remaining,
                                                        std::string_view domain_suffix);

/** @class Reconciler
 *  @brief Runs the two-pass algorithm for one provider.
 */
class Reconciler {
public:
    Reconciler(ReconcileSettings settings,
               resolve::ParallelResolver resolver,
               const config::RegionTable& table,
               archive::HostParser parser = archive::extract_host_from_ovpn);

    /**
     * @brief Produce the final server list from archive contents.
     * @return ReconcileResult, or the strict-pass error (wrapped with phase
     *         context) / ErrorCode::Cancelled.
     * @note On error, `warnings_out` (if given) receives warnings gathered
     *       before the failure.
     */
    Result<ReconcileResult> find_servers(const archive::FileContents& contents,
                                         std::stop_token stop,
                                         std::vector<std::string>* warnings_out = nullptr) const;

private:
    ReconcileSettings settings_;
    resolve::ParallelResolver resolver_;
    const config::RegionTable& table_;
    archive::HostParser parser_;
};

} // namespace vpnlist::update
