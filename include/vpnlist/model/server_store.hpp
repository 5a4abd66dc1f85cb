#pragma once
/**
 * @file server_store.hpp
 * @brief Timestamped holder for the latest server list, plus JSON persistence.
 */

#include <cstdint>
#include <mutex>
#include <string>

#include "vpnlist/error.hpp"
#include "vpnlist/model/server.hpp"

namespace vpnlist::model {

/** @struct ServerSnapshot
 *  @brief A server list and the unix time (seconds) it was produced.
 */
struct ServerSnapshot {
    std::int64_t timestamp{0};
    ServerList   servers;

    bool operator==(const ServerSnapshot&) const = default;
};

/** @class ServerStore
 *  @brief In-memory store for the most recent list. Safe to read while an
 *         update publishes a new one.
 */
class ServerStore {
public:
    /// Replace the stored list and stamp it.
    void publish(ServerList servers, std::int64_t timestamp);

    /// Copy of the current snapshot.
    [[nodiscard]] ServerSnapshot snapshot() const;

    /// Number of publications since construction.
    [[nodiscard]] std::uint64_t version() const;

private:
    mutable std::mutex mu_;
    ServerSnapshot current_;
    std::uint64_t version_{0};
};

/// Write a snapshot as JSON: {"timestamp": N, "servers": [{"region":..,"ips":[..]}]}.
/// A region that is not valid UTF-8 fails with ErrorCode::Io and leaves `path` untouched.
Result<void> save_snapshot_json(const std::string& path, const ServerSnapshot& snap);

/// Read a snapshot previously written by save_snapshot_json().
Result<ServerSnapshot> load_snapshot_json(const std::string& path);

} // namespace vpnlist::model
