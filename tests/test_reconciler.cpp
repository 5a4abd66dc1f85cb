/**
 * @file test_reconciler.cpp
 * @brief Tests for the two-pass archive/table reconciliation.
 *
 * Validates:
 *  - Table-complement: archive host + table-only hosts, no duplicates
 *  - Unmapped code falls back to the bare code with a warning
 *  - Strict pass failure aborts the run; earlier warnings still surfaced
 *  - Fallback misses only warn
 *  - Final list sorted, one server per region, source table untouched
 *  - Pure mapping helpers on canned resolver output
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <memory>
#include <set>
#include <stop_token>

#include "vpnlist/config/region_table.hpp"
#include "vpnlist/update/reconciler.hpp"
#include "test_fakes.hpp"

using vpnlist::ErrorCode;
using vpnlist::archive::FileContents;
using vpnlist::config::RegionTable;
using vpnlist::model::IpList;
using vpnlist::model::ServerList;
using vpnlist::resolve::HostToIps;
using vpnlist::resolve::ParallelResolver;
using vpnlist::resolve::ResolveSettings;
using vpnlist::test::FakeLookup;
using vpnlist::test::ip;
using vpnlist::test::ovpn_for;
using vpnlist::update::ReconcileSettings;
using vpnlist::update::Reconciler;

namespace {

constexpr const char* kSuffix = ".prod.surfshark.com";

std::string host(const std::string& code) { return code + kSuffix; }

ReconcileSettings settings() {
  ReconcileSettings s;
  s.skip_suffix = "_tcp.ovpn";
  s.domain_suffix = kSuffix;
  s.archive_pass = ResolveSettings{.repetition = 2, .time_between = std::chrono::milliseconds(0), .fail_on_err = true};
  s.table_pass = ResolveSettings{.repetition = 2, .time_between = std::chrono::milliseconds(0), .fail_on_err = false};
  return s;
}

RegionTable abc_table() {
  return RegionTable("surfshark", kSuffix, {{"A", "Region A"}, {"B", "Region B"}, {"C", "Region C"}});
}

FileContents archive_with(const std::vector<std::string>& codes) {
  FileContents files;
  for (const auto& c : codes) {
    files[host(c) + "_udp.ovpn"] = ovpn_for(host(c));
    files[host(c) + "_tcp.ovpn"] = ovpn_for(host(c));
  }
  return files;
}

std::vector<std::string> regions(const ServerList& servers) {
  std::vector<std::string> out;
  for (const auto& s : servers) out.push_back(s.region);
  return out;
}

} // namespace

// --------------------------- Full algorithm --------------------------------

/**
 * @test Table_Complement_Three_Servers
 * @brief Archive has only A; B and C recovered by the fallback pass.
 */
TEST(Reconciler, Table_Complement_Three_Servers) {
  auto lookup = std::make_shared<FakeLookup>();
  lookup->set(host("A"), {ip("192.0.2.1")});
  lookup->set(host("B"), {ip("192.0.2.2")});
  lookup->set(host("C"), {ip("192.0.2.3")});
  const auto table = abc_table();
  Reconciler rec(settings(), ParallelResolver(lookup), table);

  auto r = rec.find_servers(archive_with({"A"}), std::stop_token{});
  ASSERT_TRUE(r) << r.error().message;
  EXPECT_EQ(regions(r->servers), (std::vector<std::string>{"Region A", "Region B", "Region C"}));
  EXPECT_EQ(r->servers[1].ips, IpList{ip("192.0.2.2")});
  EXPECT_TRUE(r->warnings.empty());
  EXPECT_EQ(r->archive_hosts, 1u);
  EXPECT_EQ(r->fallback_hosts, 2u);
  // A matched in pass 1 is not resolved again in pass 2.
  EXPECT_EQ(lookup->calls(host("A")), 1);
}

/**
 * @test Unmapped_Code_Uses_Bare_Code
 * @brief Live host unknown to the table is kept, named by its code, with a warning.
 */
TEST(Reconciler, Unmapped_Code_Uses_Bare_Code) {
  auto lookup = std::make_shared<FakeLookup>();
  lookup->set(host("A"), {ip("192.0.2.1")});
  lookup->set(host("zz-new"), {ip("203.0.113.5"), ip("203.0.113.4"), ip("203.0.113.5")});
  const RegionTable table("surfshark", kSuffix, {{"A", "Region A"}});
  Reconciler rec(settings(), ParallelResolver(lookup), table);

  auto r = rec.find_servers(archive_with({"A", "zz-new"}), std::stop_token{});
  ASSERT_TRUE(r) << r.error().message;
  ASSERT_EQ(r->servers.size(), 2u);
  EXPECT_EQ(r->servers[0].region, "Region A");
  EXPECT_EQ(r->servers[1].region, "zz-new");
  EXPECT_EQ(r->servers[1].ips, (IpList{ip("203.0.113.4"), ip("203.0.113.5")}));
  ASSERT_EQ(r->warnings.size(), 1u);
  EXPECT_EQ(r->warnings[0], "subdomain \"zz-new\" not found in region table");
}

/**
 * @test Strict_Pass_Failure_Aborts
 * @brief Archive host that never resolves fails the run; parse warnings are kept.
 */
TEST(Reconciler, Strict_Pass_Failure_Aborts) {
  auto lookup = std::make_shared<FakeLookup>();
  lookup->set(host("A"), {ip("192.0.2.1")});
  const auto table = abc_table();
  Reconciler rec(settings(), ParallelResolver(lookup), table);

  auto files = archive_with({"A", "B"});
  files["junk_udp.ovpn"] = "nothing here";

  std::vector<std::string> partial;
  auto r = rec.find_servers(files, std::stop_token{}, &partial);
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::ResolutionExhausted);
  EXPECT_EQ(r.error().message.rfind("resolving archive hosts: ", 0), 0u);
  EXPECT_NE(r.error().message.find(host("B")), std::string::npos);
  ASSERT_EQ(partial.size(), 1u);
  EXPECT_EQ(partial[0], "remote line not found in junk_udp.ovpn");
}

/**
 * @test Fallback_Miss_Only_Warns
 * @brief Table-only code that no longer resolves yields a warning, no server.
 */
TEST(Reconciler, Fallback_Miss_Only_Warns) {
  auto lookup = std::make_shared<FakeLookup>();
  lookup->set(host("A"), {ip("192.0.2.1")});
  lookup->set(host("C"), {ip("192.0.2.3")});
  const auto table = abc_table();
  Reconciler rec(settings(), ParallelResolver(lookup), table);

  auto r = rec.find_servers(archive_with({"A"}), std::stop_token{});
  ASSERT_TRUE(r) << r.error().message;
  EXPECT_EQ(regions(r->servers), (std::vector<std::string>{"Region A", "Region C"}));
  ASSERT_EQ(r->warnings.size(), 1u);
  EXPECT_EQ(r->warnings[0], "no IP address found for host \"B.prod.surfshark.com\"");
  EXPECT_EQ(lookup->calls(host("B")), 2); // full best-effort budget
}

/**
 * @test Empty_Archive_Uses_Table_Only
 */
TEST(Reconciler, Empty_Archive_Uses_Table_Only) {
  auto lookup = std::make_shared<FakeLookup>();
  lookup->set(host("B"), {ip("192.0.2.2")});
  const auto table = abc_table();
  Reconciler rec(settings(), ParallelResolver(lookup), table);

  auto r = rec.find_servers(FileContents{}, std::stop_token{});
  ASSERT_TRUE(r);
  EXPECT_EQ(regions(r->servers), std::vector<std::string>{"Region B"});
  EXPECT_EQ(r->warnings.size(), 2u);
}

/**
 * @test At_Most_One_Per_Region_And_Sorted
 * @brief Many archive + table entries: unique regions, ascending order,
 *        source table unchanged across runs.
 */
TEST(Reconciler, At_Most_One_Per_Region_And_Sorted) {
  auto lookup = std::make_shared<FakeLookup>();
  RegionTable::Map entries;
  std::vector<std::string> in_archive;
  for (int i = 0; i < 20; ++i) {
    const std::string code = "c" + std::to_string(i);
    entries[code] = "Region " + std::to_string(19 - i);
    lookup->set(host(code), {ip("198.51.100.1"), ip(("198.51.100." + std::to_string(i + 10)).c_str())});
    if (i % 3 == 0) in_archive.push_back(code);
  }
  const RegionTable table("surfshark", kSuffix, entries);
  Reconciler rec(settings(), ParallelResolver(lookup), table);

  for (int run = 0; run < 2; ++run) {
    auto r = rec.find_servers(archive_with(in_archive), std::stop_token{});
    ASSERT_TRUE(r);
    ASSERT_EQ(r->servers.size(), 20u);
    const auto names = regions(r->servers);
    EXPECT_TRUE(std::is_sorted(names.begin(), names.end()));
    EXPECT_EQ(std::set<std::string>(names.begin(), names.end()).size(), names.size());
    for (const auto& s : r->servers) {
      EXPECT_TRUE(std::is_sorted(s.ips.begin(), s.ips.end()));
      EXPECT_EQ(std::adjacent_find(s.ips.begin(), s.ips.end()), s.ips.end());
    }
  }
  EXPECT_EQ(table.size(), 20u);
}

/**
 * @test Cancelled_Run_Has_No_Result
 */
TEST(Reconciler, Cancelled_Run_Has_No_Result) {
  auto lookup = std::make_shared<FakeLookup>();
  lookup->set(host("A"), {ip("192.0.2.1")});
  const auto table = abc_table();
  Reconciler rec(settings(), ParallelResolver(lookup), table);

  std::stop_source src;
  src.request_stop();
  auto r = rec.find_servers(archive_with({"A"}), src.get_token());
  ASSERT_FALSE(r);
  EXPECT_EQ(r.error().code, ErrorCode::Cancelled);
}

// --------------------------- Pure helpers ----------------------------------

/**
 * @test Map_Archive_Hosts_Erases_Matches
 * @brief Canned resolver output: matched codes leave the working copy.
 */
TEST(ReconcilerHelpers, Map_Archive_Hosts_Erases_Matches) {
  RegionTable::Map remaining{{"A", "Region A"}, {"B", "Region B"}};
  HostToIps resolved{
    {host("A"), {ip("192.0.2.9"), ip("192.0.2.1"), ip("192.0.2.9")}},
    {host("X"), {ip("192.0.2.5")}},
    {host("E"), {}},
  };

  auto out = vpnlist::update::map_archive_hosts(resolved, kSuffix, remaining);

  EXPECT_EQ(remaining, (RegionTable::Map{{"B", "Region B"}}));
  ASSERT_EQ(out.servers.size(), 2u);
  std::vector<std::string> names = regions(out.servers);
  std::sort(names.begin(), names.end());
  EXPECT_EQ(names, (std::vector<std::string>{"Region A", "X"}));
  for (const auto& s : out.servers) {
    if (s.region == "Region A") EXPECT_EQ(s.ips, (IpList{ip("192.0.2.1"), ip("192.0.2.9")}));
  }
  ASSERT_EQ(out.warnings.size(), 2u);
  EXPECT_EQ(out.warnings[0], "no IP address found for host \"E.prod.surfshark.com\"");
  EXPECT_EQ(out.warnings[1], "subdomain \"X\" not found in region table");
}

/**
 * @test Map_Remaining_Hosts_Skips_Empty
 */
TEST(ReconcilerHelpers, Map_Remaining_Hosts_Skips_Empty) {
  const RegionTable::Map remaining{{"B", "Region B"}, {"C", "Region C"}};
  HostToIps resolved{{host("B"), {ip("192.0.2.2")}}, {host("C"), {}}};

  auto servers = vpnlist::update::map_remaining_hosts(resolved, kSuffix, remaining);
  ASSERT_EQ(servers.size(), 1u);
  EXPECT_EQ(servers[0].region, "Region B");
}

/**
 * @test Synthesize_And_Strip_Suffix
 */
TEST(ReconcilerHelpers, Synthesize_And_Strip_Suffix) {
  const RegionTable::Map remaining{{"de-ber", "Germany Berlin"}, {"al-tia", "Albania"}};
  EXPECT_EQ(vpnlist::update::synthesize_hosts(remaining, kSuffix),
            (std::vector<std::string>{"al-tia.prod.surfshark.com", "de-ber.prod.surfshark.com"}));
  EXPECT_EQ(vpnlist::update::subdomain_code("de-ber.prod.surfshark.com", kSuffix), "de-ber");
  EXPECT_EQ(vpnlist::update::subdomain_code("other.example.net", kSuffix), "other.example.net");
}

/**
 * @test Merge_Duplicate_Regions
 * @brief Two codes sharing a name collapse into one server with the union of IPs.
 */
TEST(ReconcilerHelpers, Merge_Duplicate_Regions) {
  ServerList servers{
    vpnlist::model::make_server("Same", {ip("192.0.2.2")}),
    vpnlist::model::make_server("Other", {ip("192.0.2.9")}),
    vpnlist::model::make_server("Same", {ip("192.0.2.1"), ip("192.0.2.2")}),
  };
  auto warnings = vpnlist::update::merge_duplicate_regions(servers);

  ASSERT_EQ(servers.size(), 2u);
  EXPECT_EQ(servers[0].region, "Other");
  EXPECT_EQ(servers[1].region, "Same");
  EXPECT_EQ(servers[1].ips, (IpList{ip("192.0.2.1"), ip("192.0.2.2")}));
  EXPECT_EQ(warnings.size(), 1u);
}
