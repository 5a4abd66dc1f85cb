// apps/vpnlist_update/src/main.cpp
// vpnlist - vpnlist_update
// Purpose: refresh the provider server list once and report it.
//
// Usage:
//   ./vpnlist_update [--config <file>] [--regions <file>] [--stdout] [--output <file>] [--verbose]
//
// Notes:
// - Exit 0 on success, 1 when the update fails, 2 on bad usage.
// - SIGINT/SIGTERM cancel in-flight downloads and DNS retries.

#include <csignal>
#include <ctime>
#include <iostream>
#include <memory>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

#include <pthread.h>
#include <spdlog/spdlog.h>

#include "vpnlist/archive/archive_source.hpp"
#include "vpnlist/config/config_loader.hpp"
#include "vpnlist/config/region_table.hpp"
#include "vpnlist/model/server_store.hpp"
#include "vpnlist/obs/observability.hpp"
#include "vpnlist/resolve/host_lookup.hpp"
#include "vpnlist/update/updater.hpp"
#include "vpnlist/version.hpp"

namespace {

struct Options {
    std::string config_path;
    std::string regions_path;
    std::string output_path;
    bool print_stdout{false};
    bool verbose{false};
};

void usage(std::ostream& os) {
    os << "usage: vpnlist_update [--config <file>] [--regions <file>] [--stdout] [--output <file>] [--verbose]\n";
}

bool parse_args(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg = argv[i];
        auto value = [&](std::string& dst) {
            if (i + 1 >= argc) return false;
            dst = argv[++i];
            return true;
        };
        if (arg == "--config")        { if (!value(opt.config_path)) return false; }
        else if (arg == "--regions")  { if (!value(opt.regions_path)) return false; }
        else if (arg == "--output")   { if (!value(opt.output_path)) return false; }
        else if (arg == "--stdout")   opt.print_stdout = true;
        else if (arg == "--verbose")  opt.verbose = true;
        else return false;
    }
    return true;
}

// Waits for SIGINT/SIGTERM (blocked in every other thread) and turns them into
// a stop request.
void watch_signals(std::stop_token self, std::stop_source run) {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    const timespec tick{0, 200'000'000};
    while (!self.stop_requested()) {
        if (sigtimedwait(&set, nullptr, &tick) > 0) {
            vpnlist::obs::logger()->warn("signal received, cancelling");
            run.request_stop();
            return;
        }
    }
}

} // namespace

int main(int argc, char** argv) {
    Options opt;
    if (!parse_args(argc, argv, opt)) {
        usage(std::cerr);
        return 2;
    }

    auto lg = vpnlist::obs::logger();
    if (opt.verbose) vpnlist::obs::set_level(spdlog::level::debug);
    lg->info("vpnlist_update {} starting", vpnlist::version_string);

    auto cfg = vpnlist::config::Loader::load_from_file(opt.config_path);
    if (!cfg) {
        lg->error("{}", cfg.error().message);
        return 1;
    }
    if (!opt.regions_path.empty()) cfg->provider.region_table_path = opt.regions_path;
    if (!opt.output_path.empty()) cfg->output.json_path = opt.output_path;
    if (opt.print_stdout) cfg->output.print_stdout = true;

    auto table = vpnlist::config::RegionTable::load_from_file(cfg->provider.region_table_path);
    if (!table) {
        lg->error("{}", table.error().message);
        return 1;
    }
    lg->info("{}: {} regions in table", cfg->provider.name, table->size());

    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGINT);
    sigaddset(&set, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &set, nullptr);

    std::stop_source run;
    std::jthread signals(watch_signals, run);

    vpnlist::model::ServerStore store;
    vpnlist::update::Updater updater(*cfg, *table,
                                     std::make_shared<vpnlist::archive::HttpZipSource>(cfg->http),
                                     std::make_shared<vpnlist::resolve::SystemLookup>(),
                                     store, vpnlist::obs::make_log_observer(),
                                     vpnlist::update::unix_now, &std::cout);

    auto result = updater.run(run.get_token());
    if (!result) {
        lg->error("{}", result.error().message);
        return 1;
    }
    return 0;
}
