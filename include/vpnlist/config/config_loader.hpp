#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults, optionally overridden by a JSON file.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <string>

#include "vpnlist/archive/archive_source.hpp"
#include "vpnlist/error.hpp"
#include "vpnlist/resolve/parallel_resolver.hpp"

namespace vpnlist::config {

    /** @struct ProviderConfig
     *  @brief Provider-specific constants the reconciler must not hard-code.
     */
    struct ProviderConfig {
        std::string name;               ///< Label used in logs and warnings
        std::string archive_url;        ///< Zip of per-server OpenVPN files
        std::string skip_suffix;        ///< File name suffix of redundant TCP variants
        std::string domain_suffix;      ///< Empty: use the region table's suffix
        std::string region_table_path;  ///< JSON region table
    };

    /** @struct OutputConfig
     *  @brief What to do with the final list.
     */
    struct OutputConfig {
        bool        print_stdout{false}; ///< Print the source literal on stdout
        std::string json_path;           ///< Persist the stamped list when non-empty
        std::string function_name;       ///< Function name used by the literal renderer
    };

    /** @struct UpdaterConfig
     *  @brief Aggregate of sub-configs required by one update run.
     */
    struct UpdaterConfig {
        ProviderConfig                  provider;
        vpnlist::resolve::ResolveSettings archive_pass; ///< Strict pass over archive hosts
        vpnlist::resolve::ResolveSettings table_pass;   ///< Best-effort pass over table-only codes
        vpnlist::archive::HttpSettings  http;
        OutputConfig                    output;
    };

    /** @class Loader
     *  @brief Source of updater configuration (defaults or parsed files).
     */
    class Loader {
    public:
        /// Built-in defaults (Surfshark).
        static UpdaterConfig defaults();

        /**
         * @brief Load configuration from a JSON file layered over defaults().
         * @param path File path; empty returns defaults().
         * @return UpdaterConfig, or ErrorCode::Config on unreadable/invalid input.
         */
        static Result<UpdaterConfig> load_from_file(const std::string& path);

        /// Same as load_from_file() for an in-memory document.
        static Result<UpdaterConfig> parse(const std::string& json_text);
    };

} // namespace vpnlist::config
