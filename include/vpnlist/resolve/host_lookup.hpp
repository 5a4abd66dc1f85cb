#pragma once
/**
 * @file host_lookup.hpp
 * @brief Single-shot hostname -> addresses primitive consumed by the resolver.
 * @details Implementations do one query and return. Retry, spacing and
 *          concurrency are layered on top by ParallelResolver.
 */

#include <stop_token>
#include <string>

#include "vpnlist/error.hpp"
#include "vpnlist/model/ip_address.hpp"

namespace vpnlist::resolve {

/** @class HostLookup
 *  @brief Resolution primitive interface. Must be safe to call concurrently.
 */
class HostLookup {
public:
    virtual ~HostLookup() = default;

    /**
     * @brief Resolve `host` once.
     * @param stop Implementations should return early (any error) once stop is requested.
     * @return Addresses (possibly empty) or an error describing the failed query.
     */
    virtual Result<model::IpList> lookup(const std::string& host, std::stop_token stop) = 0;
};

/** @class SystemLookup
 *  @brief getaddrinfo(3) backed lookup (AF_UNSPEC, both families).
 *  @note getaddrinfo cannot be interrupted; the stop token is checked before
 *        and after the call.
 */
class SystemLookup final : public HostLookup {
public:
    Result<model::IpList> lookup(const std::string& host, std::stop_token stop) override;
};

} // namespace vpnlist::resolve
