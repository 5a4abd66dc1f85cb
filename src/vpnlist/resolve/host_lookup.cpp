/**
 * @file host_lookup.cpp
 * @brief getaddrinfo-based HostLookup.
 */
#include "vpnlist/resolve/host_lookup.hpp"

#include <array>
#include <cstring>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace vpnlist::resolve {

namespace {

struct AddrInfoDeleter {
    void operator()(addrinfo* p) const noexcept { freeaddrinfo(p); }
};
using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

} // namespace

Result<model::IpList> SystemLookup::lookup(const std::string& host, std::stop_token stop) {
    if (stop.stop_requested()) return make_error(ErrorCode::Cancelled, "lookup of " + host + " cancelled");

    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    const int rc = getaddrinfo(host.c_str(), nullptr, &hints, &raw);
    AddrInfoPtr res(raw);

    if (stop.stop_requested()) return make_error(ErrorCode::Cancelled, "lookup of " + host + " cancelled");
    if (rc == EAI_NONAME) return model::IpList{};
#ifdef EAI_NODATA
    if (rc == EAI_NODATA) return model::IpList{};
#endif
    if (rc != 0) {
        return make_error(ErrorCode::ResolutionExhausted,
                          "getaddrinfo " + host + ": " + gai_strerror(rc));
    }

    model::IpList ips;
    for (const addrinfo* ai = res.get(); ai != nullptr; ai = ai->ai_next) {
        if (ai->ai_family == AF_INET) {
            const auto* sin = reinterpret_cast<const sockaddr_in*>(ai->ai_addr);
            std::array<std::uint8_t, 4> b{};
            std::memcpy(b.data(), &sin->sin_addr, b.size());
            ips.push_back(model::IpAddress::v4(b));
        } else if (ai->ai_family == AF_INET6) {
            const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(ai->ai_addr);
            std::array<std::uint8_t, 16> b{};
            std::memcpy(b.data(), &sin6->sin6_addr, b.size());
            ips.push_back(model::IpAddress::v6(b));
        }
    }
    return ips;
}

} // namespace vpnlist::resolve
