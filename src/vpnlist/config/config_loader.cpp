/**
* @file config_loader.cpp
 * @brief Defaults from named constants, overrides from nlohmann::json.
 *
 * Recognized document (every key optional):
 * {
 *   "provider": {"name", "archive_url", "skip_suffix", "domain_suffix", "region_table"},
 *   "resolve":  {"archive": {"repetition", "time_between_ms", "fail_on_err"},
 *                "table":   {...same...}},
 *   "http":     {"timeout_s", "max_body_bytes"},
 *   "output":   {"stdout", "json_path", "function_name"}
 * }
 */
#include "vpnlist/config/config_loader.hpp"
#include "vpnlist/config/constants.hpp"

#include <fstream>
#include <iterator>

#include <nlohmann/json.hpp>

#ifndef VPNLIST_DEFAULT_REGION_TABLE
#define VPNLIST_DEFAULT_REGION_TABLE "data/surfshark_regions.json"
#endif

namespace vpnlist::config {
    using nlohmann::json;
    using vpnlist::resolve::ResolveSettings;
    using namespace vpnlist::config::constants;

    namespace {

    template <class T>
    void assign_if(const json& obj, const char* key, T& out) {
        if (auto it = obj.find(key); it != obj.end() && !it->is_null()) out = it->get<T>();
    }

    void apply_resolve(const json& obj, ResolveSettings& s) {
        assign_if(obj, "repetition", s.repetition);
        assign_if(obj, "fail_on_err", s.fail_on_err);
        if (auto it = obj.find("time_between_ms"); it != obj.end()) {
            s.time_between = std::chrono::milliseconds(it->get<std::int64_t>());
        }
    }

    const json& section(const json& doc, const char* key) {
        static const json empty = json::object();
        auto it = doc.find(key);
        return (it != doc.end() && it->is_object()) ? *it : empty;
    }

    } // namespace

    UpdaterConfig Loader::defaults() {
        UpdaterConfig uc;
        uc.provider = ProviderConfig{
            .name = std::string(PROVIDER_NAME),
            .archive_url = std::string(PROVIDER_ARCHIVE_URL),
            .skip_suffix = std::string(PROVIDER_SKIP_SUFFIX),
            .domain_suffix = std::string(PROVIDER_DOMAIN_SUFFIX),
            .region_table_path = VPNLIST_DEFAULT_REGION_TABLE,
        };
        uc.archive_pass = ResolveSettings{RESOLVE_ARCHIVE_REPETITION, RESOLVE_ARCHIVE_TIME_BETWEEN, RESOLVE_ARCHIVE_FAIL_ON_ERR};
        uc.table_pass   = ResolveSettings{RESOLVE_TABLE_REPETITION, RESOLVE_TABLE_TIME_BETWEEN, RESOLVE_TABLE_FAIL_ON_ERR};
        uc.http = vpnlist::archive::HttpSettings{};
        uc.output.function_name = std::string(OUTPUT_FUNCTION_NAME);
        return uc;
    }

    Result<UpdaterConfig> Loader::load_from_file(const std::string& path) {
        if (path.empty()) return defaults();
        std::ifstream in(path);
        if (!in) return make_error(ErrorCode::Config, "cannot open config file " + path);
        const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        auto cfg = parse(text);
        if (!cfg) return vpnlist_detail::unexpected<Error>(cfg.error().wrap(path));
        return cfg;
    }

    Result<UpdaterConfig> Loader::parse(const std::string& json_text) {
        UpdaterConfig uc = defaults();
        try {
            const json doc = json::parse(json_text);
            if (!doc.is_object()) return make_error(ErrorCode::Config, "config is not a JSON object");

            const json& p = section(doc, "provider");
            assign_if(p, "name", uc.provider.name);
            assign_if(p, "archive_url", uc.provider.archive_url);
            assign_if(p, "skip_suffix", uc.provider.skip_suffix);
            assign_if(p, "domain_suffix", uc.provider.domain_suffix);
            assign_if(p, "region_table", uc.provider.region_table_path);

            const json& r = section(doc, "resolve");
            apply_resolve(section(r, "archive"), uc.archive_pass);
            apply_resolve(section(r, "table"), uc.table_pass);

            const json& h = section(doc, "http");
            if (auto it = h.find("timeout_s"); it != h.end()) uc.http.timeout = std::chrono::seconds(it->get<std::int64_t>());
            assign_if(h, "max_body_bytes", uc.http.max_body_bytes);

            const json& o = section(doc, "output");
            assign_if(o, "stdout", uc.output.print_stdout);
            assign_if(o, "json_path", uc.output.json_path);
            assign_if(o, "function_name", uc.output.function_name);
        } catch (const json::exception& e) {
            return make_error(ErrorCode::Config, e.what());
        }
        return uc;
    }

} // namespace vpnlist::config
