/**
 * @file observability.cpp
 * @brief spdlog-backed logger and Observer.
 */
#include "vpnlist/obs/observability.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace vpnlist::obs {

    std::shared_ptr<spdlog::logger> logger() {
        static std::once_flag once;
        std::call_once(once, [] {
            if (!spdlog::get("vpnlist")) {
                auto lg = spdlog::stderr_color_mt("vpnlist");
                lg->set_pattern("%Y-%m-%dT%H:%M:%S%z %^%l%$ %v");
                lg->set_level(spdlog::level::info);
            }
        });
        return spdlog::get("vpnlist");
    }

    void set_level(spdlog::level::level_enum level) {
        logger()->set_level(level);
    }

    class LogObserver : public Observer {
    public:
        void record(const UpdateEvent& e) override {
            {
                std::lock_guard<std::mutex> lk(mu_);
                ctr_.runs++;
                ctr_.warnings += e.warnings;
                if (e.ok) ctr_.servers = e.servers;
                else      ctr_.failures++;
            }
            auto lg = logger();
            if (e.ok) {
                lg->info("{}: {} servers ({} from archive hosts, {} fallback hosts tried), {} warnings, took {}ms",
                         e.provider, e.servers, e.archive_hosts, e.fallback_hosts, e.warnings,
                         e.duration.count());
            } else {
                lg->error("{}: update failed after {}ms: {}", e.provider, e.duration.count(), e.error);
            }
        }
        Counters snapshot() const override {
            std::lock_guard<std::mutex> lk(mu_);
            return ctr_;
        }
    private:
        mutable std::mutex mu_;
        Counters ctr_;
    };

    Observer* make_log_observer() {
        static LogObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace vpnlist::obs
