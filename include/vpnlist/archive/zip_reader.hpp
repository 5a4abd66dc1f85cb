#pragma once
/**
 * @file zip_reader.hpp
 * @brief In-memory zip decoding (stored and deflated entries) using zlib.
 */

#include <cstdint>
#include <string>
#include <string_view>

#include "vpnlist/archive/host_extractor.hpp"
#include "vpnlist/config/constants.hpp"
#include "vpnlist/error.hpp"

namespace vpnlist::archive {

/**
 * @brief Decode every file entry of a zip archive held in memory.
 * @details Walks the central directory. Directory entries are skipped and
 *          member paths are reduced to their base name. Encrypted or
 *          zip64 archives, unknown compression methods and CRC mismatches
 *          are reported as ErrorCode::Archive.
 * @param max_inflated_bytes Limit on the sum of declared member sizes; checked
 *        before anything is allocated.
 * @note Two members with the same base name are an ErrorCode::Archive error.
 */
Result<FileContents> extract_zip(std::string_view data,
                                 std::uint64_t max_inflated_bytes = config::constants::ZIP_MAX_INFLATED_BYTES);

} // namespace vpnlist::archive
