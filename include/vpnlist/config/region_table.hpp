#pragma once
/**
 * @file region_table.hpp
 * @brief Static subdomain code -> region name table for one provider.
 * @details Immutable once loaded. Consumers that need to remove entries take
 *          a copy via entries().
 */

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "vpnlist/error.hpp"

namespace vpnlist::config {

/** @class RegionTable
 *  @brief Provider region naming, keyed by subdomain code (e.g. "de-ber").
 */
class RegionTable {
public:
    /// Ordered so that iteration (and the hosts synthesized from it) is stable.
    using Map = std::map<std::string, std::string, std::less<>>;

    RegionTable() = default;
    RegionTable(std::string provider, std::string domain_suffix, Map entries);

    /**
     * @brief Load a table from JSON.
     * @details Format: {"provider": "...", "domain_suffix": "...", "regions": {"code": "name"}}.
     *          `provider` and `domain_suffix` are optional; `regions` must be an object
     *          of non-empty strings.
     */
    static Result<RegionTable> load_from_file(const std::string& path);

    /// Same as load_from_file() but from an in-memory document.
    static Result<RegionTable> parse(std::string_view json_text);

    [[nodiscard]] std::optional<std::string> region_for(std::string_view code) const;
    [[nodiscard]] const Map& entries() const noexcept { return entries_; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }
    [[nodiscard]] const std::string& provider() const noexcept { return provider_; }
    [[nodiscard]] const std::string& domain_suffix() const noexcept { return domain_suffix_; }

private:
    std::string provider_;
    std::string domain_suffix_;
    Map entries_;
};

} // namespace vpnlist::config
