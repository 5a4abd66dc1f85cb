#pragma once
/**
 * @file updater.hpp
 * @brief One provider update run: fetch -> reconcile -> report -> store.
 */

#include <cstdint>
#include <functional>
#include <memory>
#include <ostream>
#include <stop_token>

#include "vpnlist/archive/archive_source.hpp"
#include "vpnlist/config/config_loader.hpp"
#include "vpnlist/config/region_table.hpp"
#include "vpnlist/error.hpp"
#include "vpnlist/model/server_store.hpp"
#include "vpnlist/obs/observability.hpp"
#include "vpnlist/resolve/host_lookup.hpp"

namespace vpnlist::update {

/// Unix time in seconds; injectable for tests.
using Clock = std::function<std::int64_t()>;

/// System clock in unix seconds.
std::int64_t unix_now();

/** @class Updater
 *  @brief Wires collaborators together. Warnings are always logged, even when
 *         the run fails; the store is only touched on success.
 */
class Updater {
public:
    Updater(config::UpdaterConfig cfg,
            const config::RegionTable& table,
            std::shared_ptr<archive::ArchiveSource> source,
            std::shared_ptr<resolve::HostLookup> lookup,
            model::ServerStore& store,
            obs::Observer* observer = obs::make_log_observer(),
            Clock clock = unix_now,
            std::ostream* out = nullptr);

    /// Run once. Returns the number of servers published.
    Result<std::size_t> run(std::stop_token stop);

private:
    config::UpdaterConfig cfg_;
    const config::RegionTable& table_;
    std::shared_ptr<archive::ArchiveSource> source_;
    std::shared_ptr<resolve::HostLookup> lookup_;
    model::ServerStore& store_;
    obs::Observer* observer_;
    Clock clock_;
    std::ostream* out_;
};

} // namespace vpnlist::update
