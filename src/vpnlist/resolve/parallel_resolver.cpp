/**
 * @file parallel_resolver.cpp
 * @brief Worker-per-host resolution with a join barrier.
 */
#include "vpnlist/resolve/parallel_resolver.hpp"

#include <algorithm>
#include <condition_variable>
#include <mutex>
#include <string_view>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <utility>

#include <fmt/format.h>

#include "vpnlist/obs/observability.hpp"

namespace vpnlist::resolve {

std::string no_ip_warning(const std::string& host) {
    return fmt::format("no IP address found for host \"{}\"", host);
}

ParallelResolver::ParallelResolver(std::shared_ptr<HostLookup> lookup)
    : lookup_(std::move(lookup)) {}

ParallelResolver::Attempts ParallelResolver::resolve_repeat(const std::string& host,
                                                            const ResolveSettings& settings,
                                                            std::stop_token stop) const {
    const std::uint32_t budget = std::max<std::uint32_t>(1, settings.repetition);
    std::mutex mu;
    std::condition_variable_any cv;

    Attempts out;
    for (std::uint32_t i = 0; i < budget; ++i) {
        if (stop.stop_requested()) return out;
        ++out.tries;

        auto ips = lookup_->lookup(host, stop);
        if (ips && !ips->empty()) {
            out.ips = std::move(*ips);
            return out;
        }
        if (!ips) {
            obs::logger()->debug("lookup {} (attempt {}/{}): {}", host, out.tries, budget, ips.error().message);
        }

        if (i + 1 < budget && settings.time_between.count() > 0) {
            // Interruptible sleep: wakes early when stop is requested.
            std::unique_lock<std::mutex> lk(mu);
            (void)cv.wait_for(lk, stop, settings.time_between, [] { return false; });
        }
    }
    out.exhausted = !stop.stop_requested();
    return out;
}

Result<ResolveResult> ParallelResolver::resolve(const std::vector<std::string>& hosts,
                                                const ResolveSettings& settings,
                                                std::stop_token stop) const {
    if (stop.stop_requested()) return make_error(ErrorCode::Cancelled, "resolution cancelled");

    // One slot per distinct host, in first-seen order.
    struct Slot {
        std::string host;
        Attempts result;
    };
    std::vector<Slot> slots;
    slots.reserve(hosts.size());
    {
        std::unordered_set<std::string_view> seen;
        for (const auto& h : hosts) {
            if (seen.insert(h).second) slots.push_back(Slot{h, {}});
        }
    }

    std::stop_source batch;
    std::stop_callback forward(stop, [&batch] { batch.request_stop(); });

    std::string spawn_error;
    {
        std::vector<std::jthread> workers;
        workers.reserve(slots.size());
        for (auto& slot : slots) {
            try {
                workers.emplace_back([this, &slot, &settings, &batch] {
                    slot.result = resolve_repeat(slot.host, settings, batch.get_token());
                    if (settings.fail_on_err && slot.result.exhausted) batch.request_stop();
                });
            } catch (const std::system_error& e) {
                spawn_error = e.what();
                batch.request_stop();
                break;
            }
        }
    } // join barrier: every slot is final past this point

    if (stop.stop_requested()) return make_error(ErrorCode::Cancelled, "resolution cancelled");
    if (!spawn_error.empty()) return make_error(ErrorCode::Io, "starting resolver worker: " + spawn_error);

    if (settings.fail_on_err) {
        // Slots abandoned after a sibling failed are not exhausted; report the one that was.
        for (const auto& slot : slots) {
            if (slot.result.exhausted) {
                return make_error(ErrorCode::ResolutionExhausted,
                                  fmt::format("{} after {} tries", no_ip_warning(slot.host), slot.result.tries));
            }
        }
    }

    ResolveResult out;
    out.host_to_ips.reserve(slots.size());
    for (auto& slot : slots) {
        if (slot.result.ips.empty()) out.warnings.push_back(no_ip_warning(slot.host));
        out.host_to_ips.emplace(std::move(slot.host), std::move(slot.result.ips));
    }
    return out;
}

} // namespace vpnlist::resolve
