/**
 * @file http_zip_source.cpp
 * @brief libcurl easy-handle download of the provider archive.
 */
#include "vpnlist/archive/archive_source.hpp"

#include <memory>
#include <utility>

#include <curl/curl.h>
#include <fmt/format.h>

#include "vpnlist/archive/zip_reader.hpp"
#include "vpnlist/obs/observability.hpp"

namespace vpnlist::archive {

namespace {

struct CurlDeleter {
    void operator()(CURL* c) const noexcept { curl_easy_cleanup(c); }
};
using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

struct Transfer {
    std::string body;
    std::uint64_t limit{0};
    bool too_large{false};
    std::stop_token stop;
};

// Write callback: returning less than requested aborts the transfer.
size_t write_body(char* data, size_t size, size_t nmemb, void* user) {
    auto* t = static_cast<Transfer*>(user);
    const size_t n = size * nmemb;
    if (t->body.size() + n > t->limit) {
        t->too_large = true;
        return 0;
    }
    t->body.append(data, n);
    return n;
}

// Progress callback: non-zero aborts with CURLE_ABORTED_BY_CALLBACK.
int on_progress(void* user, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    return static_cast<Transfer*>(user)->stop.stop_requested() ? 1 : 0;
}

} // namespace

HttpZipSource::HttpZipSource(HttpSettings settings) : settings_(settings) {
    static const CURLcode global = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (global != CURLE_OK) {
        obs::logger()->error("curl_global_init: {}", curl_easy_strerror(global));
    }
}

Result<std::string> HttpZipSource::get(const std::string& url, std::stop_token stop) const {
    CurlPtr curl(curl_easy_init());
    if (!curl) return make_error(ErrorCode::Fetch, "failed to initialize libcurl");

    Transfer t;
    t.limit = settings_.max_body_bytes;
    t.stop = stop;

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(settings_.timeout.count()));
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &t);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFOFUNCTION, on_progress);
    curl_easy_setopt(curl.get(), CURLOPT_XFERINFODATA, &t);
    curl_easy_setopt(curl.get(), CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    const CURLcode rc = curl_easy_perform(curl.get());
    if (stop.stop_requested()) return make_error(ErrorCode::Cancelled, "fetching " + url + " cancelled");
    if (t.too_large) {
        return make_error(ErrorCode::Fetch, fmt::format("{}: body exceeds {} bytes", url, t.limit));
    }
    if (rc != CURLE_OK) return make_error(ErrorCode::Fetch, fmt::format("{}: {}", url, curl_easy_strerror(rc)));

    long status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
    if (status < 200 || status > 299) {
        return make_error(ErrorCode::Fetch, fmt::format("HTTP status code not OK: {} for {}", status, url));
    }
    return std::move(t.body);
}

Result<FileContents> HttpZipSource::fetch(const std::string& url, std::stop_token stop) {
    auto body = get(url, stop);
    if (!body) return vpnlist_detail::unexpected<Error>(body.error());
    obs::logger()->debug("downloaded {} bytes from {}", body->size(), url);

    auto files = extract_zip(*body);
    if (!files) return vpnlist_detail::unexpected<Error>(files.error().wrap(url));
    return files;
}

} // namespace vpnlist::archive
