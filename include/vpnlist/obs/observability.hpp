#pragma once
/**
 * @file observability.hpp
 * @brief Observability facade: process logger, update events + counters.
 * @details Backed by spdlog. Components log through vpnlist::obs::logger();
 *          the updater reports one UpdateEvent per run to an Observer.
 */

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <spdlog/logger.h>

namespace vpnlist::obs {

    /// Shared process logger ("vpnlist"), created on first use (stderr, colour).
    std::shared_ptr<spdlog::logger> logger();

    /// Set the process logger level, e.g. spdlog::level::debug for --verbose.
    void set_level(spdlog::level::level_enum level);

    /** @struct Counters
     *  @brief Process-level counters for update runs.
     */
    struct Counters {
        uint64_t runs{0};       ///< Total runs recorded
        uint64_t failures{0};   ///< Runs that ended with an error
        uint64_t warnings{0};   ///< Warnings across all runs
        uint64_t servers{0};    ///< Servers produced by the last successful run
    };

    /** @struct UpdateEvent
     *  @brief Payload describing a single update run.
     */
    struct UpdateEvent {
        std::string provider;                 ///< Provider label, e.g. "Surfshark"
        bool        ok{false};                ///< Run completed without error
        std::string error;                    ///< Error message when !ok
        uint64_t    archive_hosts{0};         ///< Hostnames extracted from the archive
        uint64_t    fallback_hosts{0};        ///< Table-only hosts tried in the second pass
        uint64_t    servers{0};               ///< Servers in the final list
        uint64_t    warnings{0};              ///< Warnings emitted by the run
        std::chrono::milliseconds duration{0};
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single update event.
        virtual void record(const UpdateEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    // Process-wide observer that logs events through logger().
    Observer* make_log_observer();

} // namespace vpnlist::obs
