/**
 * @file updater.cpp
 * @brief Process-level orchestration of one update.
 */
#include "vpnlist/update/updater.hpp"

#include <chrono>
#include <utility>

#include "vpnlist/model/server.hpp"
#include "vpnlist/update/reconciler.hpp"

namespace vpnlist::update {

std::int64_t unix_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

Updater::Updater(config::UpdaterConfig cfg,
                 const config::RegionTable& table,
                 std::shared_ptr<archive::ArchiveSource> source,
                 std::shared_ptr<resolve::HostLookup> lookup,
                 model::ServerStore& store,
                 obs::Observer* observer,
                 Clock clock,
                 std::ostream* out)
    : cfg_(std::move(cfg)),
      table_(table),
      source_(std::move(source)),
      lookup_(std::move(lookup)),
      store_(store),
      observer_(observer),
      clock_(std::move(clock)),
      out_(out) {
    if (cfg_.provider.domain_suffix.empty()) cfg_.provider.domain_suffix = table_.domain_suffix();
}

Result<std::size_t> Updater::run(std::stop_token stop) {
    const auto started = std::chrono::steady_clock::now();
    auto lg = obs::logger();
    const auto& provider = cfg_.provider.name;

    obs::UpdateEvent ev;
    ev.provider = provider;
    auto finish = [&](const Error* err) {
        ev.ok = (err == nullptr);
        if (err) ev.error = err->message;
        ev.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        if (observer_) observer_->record(ev);
    };
    auto fail = [&](Error e) {
        e = e.wrap("cannot update " + provider + " servers");
        finish(&e);
        return vpnlist_detail::unexpected<Error>(std::move(e));
    };

    lg->info("{}: fetching {}", provider, cfg_.provider.archive_url);
    auto contents = source_->fetch(cfg_.provider.archive_url, stop);
    if (!contents) return fail(contents.error());

    Reconciler reconciler(ReconcileSettings{cfg_.provider.skip_suffix, cfg_.provider.domain_suffix,
                                            cfg_.archive_pass, cfg_.table_pass},
                          resolve::ParallelResolver(lookup_), table_);

    std::vector<std::string> partial_warnings;
    auto result = reconciler.find_servers(*contents, stop, &partial_warnings);
    const auto& warnings = result ? result->warnings : partial_warnings;
    for (const auto& w : warnings) lg->warn("{}: {}", provider, w);
    ev.warnings = warnings.size();
    if (!result) return fail(result.error());

    ev.archive_hosts = result->archive_hosts;
    ev.fallback_hosts = result->fallback_hosts;
    ev.servers = result->servers.size();

    if (cfg_.output.print_stdout && out_) {
        *out_ << model::to_source_literal(result->servers, cfg_.output.function_name) << '\n';
    }

    const std::size_t count = result->servers.size();
    store_.publish(std::move(result->servers), clock_());

    if (!cfg_.output.json_path.empty()) {
        if (auto saved = model::save_snapshot_json(cfg_.output.json_path, store_.snapshot()); !saved) {
            return fail(saved.error());
        }
        lg->info("{}: wrote {}", provider, cfg_.output.json_path);
    }

    finish(nullptr);
    return count;
}

} // namespace vpnlist::update
