/**
 * @file test_fakes.hpp
 * @brief Deterministic HostLookup / ArchiveSource / Observer doubles for tests.
 */
#pragma once

#include <condition_variable>
#include <map>
#include <optional>
#include <mutex>
#include <stop_token>
#include <string>
#include <vector>

#include "vpnlist/archive/archive_source.hpp"
#include "vpnlist/model/ip_address.hpp"
#include "vpnlist/obs/observability.hpp"
#include "vpnlist/resolve/host_lookup.hpp"

namespace vpnlist::test {

inline model::IpAddress ip(const char* text) {
  return *model::IpAddress::parse(text);
}

/**
 * @brief Scripted lookup.
 * A host answers `answer` once it has been asked `fail_first` times; hosts
 * that are not configured never resolve. Thread-safe.
 */
class FakeLookup final : public resolve::HostLookup {
public:
  struct Script {
    model::IpList answer;
    int fail_first{0};        ///< Attempts answered with an error before `answer`
    bool hang{false};         ///< Block until stop is requested
  };

  void set(const std::string& host, model::IpList answer, int fail_first = 0) {
    std::lock_guard<std::mutex> lk(mu_);
    scripts_[host] = Script{std::move(answer), fail_first};
  }

  /// `host` never answers; its lookup returns only once stop is requested.
  void hang(const std::string& host) {
    std::lock_guard<std::mutex> lk(mu_);
    scripts_[host] = Script{{}, 0, true};
  }

  Result<model::IpList> lookup(const std::string& host, std::stop_token stop) override {
    std::unique_lock<std::mutex> lk(mu_);
    const int n = ++calls_[host];
    auto it = scripts_.find(host);
    if (it == scripts_.end()) return model::IpList{};
    if (it->second.hang) {
      hang_cv_.wait(lk, stop, [] { return false; });
      return make_error(ErrorCode::Cancelled, "lookup of " + host + " cancelled");
    }
    if (n <= it->second.fail_first) return make_error(ErrorCode::ResolutionExhausted, "SERVFAIL " + host);
    return it->second.answer;
  }

  int calls(const std::string& host) const {
    std::lock_guard<std::mutex> lk(mu_);
    auto it = calls_.find(host);
    return it == calls_.end() ? 0 : it->second;
  }

private:
  mutable std::mutex mu_;
  std::condition_variable_any hang_cv_;
  std::map<std::string, Script> scripts_;
  std::map<std::string, int> calls_;
};

/// Archive source returning canned contents or a canned error.
class FakeArchiveSource final : public archive::ArchiveSource {
public:
  archive::FileContents contents;
  std::optional<Error> error;
  std::string last_url;

  Result<archive::FileContents> fetch(const std::string& url, std::stop_token) override {
    last_url = url;
    if (error) return vpnlist_detail::unexpected<Error>(*error);
    return contents;
  }
};

/// Observer that keeps every event.
class RecordingObserver final : public obs::Observer {
public:
  std::vector<obs::UpdateEvent> events;

  void record(const obs::UpdateEvent& e) override { events.push_back(e); }
  obs::Counters snapshot() const override {
    obs::Counters c;
    c.runs = events.size();
    return c;
  }
};

/// Minimal OpenVPN client file naming `host`.
inline std::string ovpn_for(const std::string& host) {
  return "client\ndev tun\nproto udp\nremote " + host + " 1194\nresolv-retry infinite\n";
}

} // namespace vpnlist::test
