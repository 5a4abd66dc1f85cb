/**
 * @file zip_reader.cpp
 * @brief Central-directory walk + raw inflate (zlib, windowBits = -MAX_WBITS).
 */
#include "vpnlist/archive/zip_reader.hpp"

#include <cstdint>
#include <utility>

#include <fmt/format.h>
#include <zlib.h>

namespace vpnlist::archive {

namespace {

// Record signatures and fixed sizes (APPNOTE.TXT 4.3).
constexpr std::uint32_t kSigLocalHeader = 0x04034b50;
constexpr std::uint32_t kSigCentralDir  = 0x02014b50;
constexpr std::uint32_t kSigEndOfDir    = 0x06054b50;
constexpr std::size_t   kLocalHeaderLen = 30;
constexpr std::size_t   kCentralDirLen  = 46;
constexpr std::size_t   kEndOfDirLen    = 22;
constexpr std::size_t   kMaxCommentLen  = 0xFFFF;

constexpr std::uint16_t kMethodStored   = 0;
constexpr std::uint16_t kMethodDeflated = 8;
constexpr std::uint16_t kFlagEncrypted  = 0x0001;

std::uint16_t le16(std::string_view d, std::size_t off) noexcept {
    return static_cast<std::uint16_t>(static_cast<std::uint8_t>(d[off]) |
                                      (static_cast<std::uint8_t>(d[off + 1]) << 8));
}

std::uint32_t le32(std::string_view d, std::size_t off) noexcept {
    return static_cast<std::uint32_t>(le16(d, off)) |
           (static_cast<std::uint32_t>(le16(d, off + 2)) << 16);
}

Result<std::string> inflate_raw(std::string_view in, std::size_t expected_size) {
    std::string out(expected_size, '\0');
    z_stream zs{};
    if (inflateInit2(&zs, -MAX_WBITS) != Z_OK) return make_error(ErrorCode::Archive, "inflateInit2 failed");

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(in.data()));
    zs.avail_in = static_cast<uInt>(in.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = static_cast<uInt>(out.size());

    const int rc = inflate(&zs, Z_FINISH);
    const auto produced = zs.total_out;
    inflateEnd(&zs);
    if (rc != Z_STREAM_END || produced != expected_size) {
        return make_error(ErrorCode::Archive, fmt::format("inflate failed (zlib code {})", rc));
    }
    return out;
}

std::string base_name(std::string_view path) {
    const auto slash = path.find_last_of('/');
    return std::string(slash == std::string_view::npos ? path : path.substr(slash + 1));
}

} // namespace

Result<FileContents> extract_zip(std::string_view data, std::uint64_t max_inflated_bytes) {
    if (data.size() < kEndOfDirLen) return make_error(ErrorCode::Archive, "zip archive too short");

    // End of central directory: last record, possibly followed by a comment.
    std::size_t eocd = std::string_view::npos;
    const std::size_t lowest = data.size() > kEndOfDirLen + kMaxCommentLen
                                   ? data.size() - kEndOfDirLen - kMaxCommentLen : 0;
    for (std::size_t off = data.size() - kEndOfDirLen + 1; off-- > lowest;) {
        if (le32(data, off) == kSigEndOfDir) { eocd = off; break; }
    }
    if (eocd == std::string_view::npos) return make_error(ErrorCode::Archive, "end of central directory not found");

    const std::uint16_t entries = le16(data, eocd + 10);
    const std::uint32_t cd_size = le32(data, eocd + 12);
    const std::uint32_t cd_off  = le32(data, eocd + 16);
    if (cd_off == 0xFFFFFFFF || entries == 0xFFFF) return make_error(ErrorCode::Archive, "zip64 archives are not supported");
    if (static_cast<std::uint64_t>(cd_off) + cd_size > eocd) return make_error(ErrorCode::Archive, "central directory out of bounds");

    FileContents files;
    std::uint64_t inflated_total = 0;
    std::size_t p = cd_off;
    for (std::uint16_t i = 0; i < entries; ++i) {
        if (p + kCentralDirLen > eocd || le32(data, p) != kSigCentralDir) {
            return make_error(ErrorCode::Archive, fmt::format("bad central directory entry {}", i));
        }
        const std::uint16_t flags     = le16(data, p + 8);
        const std::uint16_t method    = le16(data, p + 10);
        const std::uint32_t crc       = le32(data, p + 16);
        const std::uint32_t comp_size = le32(data, p + 20);
        const std::uint32_t size      = le32(data, p + 24);
        const std::uint16_t name_len  = le16(data, p + 28);
        const std::uint16_t extra_len = le16(data, p + 30);
        const std::uint16_t cmt_len   = le16(data, p + 32);
        const std::uint32_t local_off = le32(data, p + 42);
        if (p + kCentralDirLen + name_len > eocd) return make_error(ErrorCode::Archive, "entry name out of bounds");
        const std::string_view name = data.substr(p + kCentralDirLen, name_len);
        p += kCentralDirLen + name_len + extra_len + cmt_len;

        if (name.empty() || name.back() == '/') continue;
        if (flags & kFlagEncrypted) return make_error(ErrorCode::Archive, fmt::format("{}: encrypted entry", name));

        if (static_cast<std::uint64_t>(local_off) + kLocalHeaderLen > data.size() ||
            le32(data, local_off) != kSigLocalHeader) {
            return make_error(ErrorCode::Archive, fmt::format("{}: bad local header", name));
        }
        const std::size_t body = local_off + kLocalHeaderLen + le16(data, local_off + 26) + le16(data, local_off + 28);
        if (static_cast<std::uint64_t>(body) + comp_size > data.size()) {
            return make_error(ErrorCode::Archive, fmt::format("{}: data out of bounds", name));
        }
        const std::string_view raw = data.substr(body, comp_size);

        inflated_total += size;
        if (inflated_total > max_inflated_bytes) {
            return make_error(ErrorCode::Archive,
                              fmt::format("{}: uncompressed size {} exceeds the {} byte limit", name, size, max_inflated_bytes));
        }

        std::string content;
        if (method == kMethodStored) {
            if (comp_size != size) return make_error(ErrorCode::Archive, fmt::format("{}: size mismatch", name));
            content.assign(raw);
        } else if (method == kMethodDeflated) {
            auto inflated = inflate_raw(raw, size);
            if (!inflated) return vpnlist_detail::unexpected<Error>(inflated.error().wrap(std::string(name)));
            content = std::move(*inflated);
        } else {
            return make_error(ErrorCode::Archive, fmt::format("{}: unsupported compression method {}", name, method));
        }

        const auto actual = crc32(0L, reinterpret_cast<const Bytef*>(content.data()), static_cast<uInt>(content.size()));
        if (actual != crc) return make_error(ErrorCode::Archive, fmt::format("{}: CRC mismatch", name));

        auto [it, inserted] = files.try_emplace(base_name(name), std::move(content));
        if (!inserted) return make_error(ErrorCode::Archive, fmt::format("{}: duplicate file name {}", name, it->first));
    }
    return files;
}

} // namespace vpnlist::archive
