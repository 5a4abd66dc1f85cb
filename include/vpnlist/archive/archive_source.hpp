#pragma once
/**
 * @file archive_source.hpp
 * @brief Retrieval of a provider's configuration archive.
 */

#include <chrono>
#include <cstdint>
#include <stop_token>
#include <string>

#include "vpnlist/archive/host_extractor.hpp"
#include "vpnlist/config/constants.hpp"
#include "vpnlist/error.hpp"

namespace vpnlist::archive {

/** @class ArchiveSource
 *  @brief Fetch an archive and return its members. Any failure is fatal for the run.
 */
class ArchiveSource {
public:
    virtual ~ArchiveSource() = default;
    virtual Result<FileContents> fetch(const std::string& url, std::stop_token stop) = 0;
};

/** @struct HttpSettings
 *  @brief Transfer limits for HttpZipSource.
 */
struct HttpSettings {
    std::chrono::seconds timeout{config::constants::HTTP_TIMEOUT};
    std::uint64_t max_body_bytes{config::constants::HTTP_MAX_BODY_BYTES};
};

/** @class HttpZipSource
 *  @brief libcurl GET followed by extract_zip().
 *  @details Non-2xx status -> ErrorCode::Fetch; bad zip -> ErrorCode::Archive;
 *           stop requested during transfer -> ErrorCode::Cancelled.
 */
class HttpZipSource final : public ArchiveSource {
public:
    explicit HttpZipSource(HttpSettings settings = {});
    Result<FileContents> fetch(const std::string& url, std::stop_token stop) override;

private:
    Result<std::string> get(const std::string& url, std::stop_token stop) const;

    HttpSettings settings_;
};

} // namespace vpnlist::archive
