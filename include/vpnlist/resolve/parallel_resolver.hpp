#pragma once
/**
 * @file parallel_resolver.hpp
 * @brief Batch hostname resolution: one worker per host, fixed-spacing retries,
 *        strict or best-effort failure policy.
 *
 * Concurrency model:
 *   - Every host gets its own std::jthread; all start immediately.
 *   - Each worker writes only its own result slot; slots are read after the
 *     join barrier (no shared mutable map, no lock on results).
 *   - One batch stop_source is linked to the caller's token. In strict mode
 *     the first exhausted host requests stop so the others give up early.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <unordered_map>
#include <vector>

#include "vpnlist/error.hpp"
#include "vpnlist/model/ip_address.hpp"
#include "vpnlist/resolve/host_lookup.hpp"

namespace vpnlist::resolve {

/** @struct ResolveSettings
 *  @brief Retry budget and failure policy for one batch.
 */
struct ResolveSettings {
    std::uint32_t repetition{1};                ///< Max attempts per host (0 behaves as 1)
    std::chrono::milliseconds time_between{0};  ///< Fixed delay between attempts
    bool fail_on_err{false};                    ///< Strict when true, best-effort otherwise
};

using HostToIps = std::unordered_map<std::string, model::IpList>;

/** @struct ResolveResult
 *  @brief Per-host addresses (iteration order unspecified) plus warnings.
 *  @note In best-effort mode unresolved hosts are present with an empty list.
 */
struct ResolveResult {
    HostToIps host_to_ips;
    std::vector<std::string> warnings;
};

/// Warning text used for a host that never resolved.
[[nodiscard]] std::string no_ip_warning(const std::string& host);

/** @class ParallelResolver
 *  @brief Stateless batch resolver over a HostLookup.
 */
class ParallelResolver {
public:
    explicit ParallelResolver(std::shared_ptr<HostLookup> lookup);

    /**
     * @brief Resolve every host in `hosts` concurrently.
     * @return ResolveResult, or
     *         - ErrorCode::ResolutionExhausted (strict, some host never resolved),
     *         - ErrorCode::Cancelled (`stop` was requested; no partial result).
     */
    Result<ResolveResult> resolve(const std::vector<std::string>& hosts,
                                  const ResolveSettings& settings,
                                  std::stop_token stop) const;

private:
    /// Outcome of one host's retry loop.
    struct Attempts {
        model::IpList ips;
        std::uint32_t tries{0};
        bool exhausted{false}; ///< Ran the whole budget without an answer
    };

    Attempts resolve_repeat(const std::string& host,
                            const ResolveSettings& settings,
                            std::stop_token stop) const;

    std::shared_ptr<HostLookup> lookup_;
};

} // namespace vpnlist::resolve
