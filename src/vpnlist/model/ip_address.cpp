/**
 * @file ip_address.cpp
 * @brief inet_pton/inet_ntop backed parsing and printing.
 */
#include "vpnlist/model/ip_address.hpp"

#include <algorithm>
#include <cstring>
#include <arpa/inet.h>

namespace vpnlist::model {

IpAddress IpAddress::v4(const std::array<std::uint8_t, 4>& bytes) noexcept {
    IpAddress a;
    a.family_ = IpFamily::V4;
    std::copy(bytes.begin(), bytes.end(), a.bytes_.begin());
    return a;
}

IpAddress IpAddress::v6(const std::array<std::uint8_t, 16>& bytes) noexcept {
    IpAddress a;
    a.family_ = IpFamily::V6;
    a.bytes_ = bytes;
    return a;
}

std::optional<IpAddress> IpAddress::parse(std::string_view text) {
    if (text.empty() || text.size() > INET6_ADDRSTRLEN) return std::nullopt;
    const std::string s(text);

    std::array<std::uint8_t, 16> buf{};
    if (inet_pton(AF_INET, s.c_str(), buf.data()) == 1) {
        return v4({buf[0], buf[1], buf[2], buf[3]});
    }
    if (inet_pton(AF_INET6, s.c_str(), buf.data()) == 1) {
        return v6(buf);
    }
    return std::nullopt;
}

std::string IpAddress::to_string() const {
    char out[INET6_ADDRSTRLEN] = {};
    const int af = (family_ == IpFamily::V4) ? AF_INET : AF_INET6;
    if (inet_ntop(af, bytes_.data(), out, sizeof(out)) == nullptr) return {};
    return out;
}

std::strong_ordering IpAddress::operator<=>(const IpAddress& other) const noexcept {
    if (family_ != other.family_) return family_ <=> other.family_;
    const std::size_t n = (family_ == IpFamily::V4) ? 4 : 16;
    const int c = std::memcmp(bytes_.data(), other.bytes_.data(), n);
    if (c < 0) return std::strong_ordering::less;
    if (c > 0) return std::strong_ordering::greater;
    return std::strong_ordering::equal;
}

bool IpAddress::operator==(const IpAddress& other) const noexcept {
    return (*this <=> other) == std::strong_ordering::equal;
}

IpList unique_sorted(IpList ips) {
    std::sort(ips.begin(), ips.end());
    ips.erase(std::unique(ips.begin(), ips.end()), ips.end());
    return ips;
}

} // namespace vpnlist::model
