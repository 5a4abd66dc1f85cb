#pragma once
/**
 * @file error.hpp
 * @brief Error value carried through every fallible vpnlist operation.
 * @details Errors travel as `Result<T>` (expected-style); nothing throws across
 *          module boundaries. Non-fatal anomalies are warnings, not Errors.
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "vpnlist/compat/expected.hpp"

namespace vpnlist {

/// Error categories. Only Fetch/Archive and ResolutionExhausted abort a run.
enum class ErrorCode : std::uint8_t {
    Fetch,               ///< Archive download failed (transport or HTTP status).
    Archive,             ///< Archive bytes could not be decoded.
    Parse,               ///< A single configuration file yielded no host.
    ResolutionExhausted, ///< Strict pass: a host never resolved within its budget.
    Cancelled,           ///< The run's stop token was triggered.
    Config,              ///< Configuration or region table could not be loaded.
    Io                   ///< Local file read/write failed.
};

/// Stable lowercase name for logs, e.g. "resolution_exhausted".
std::string_view to_string(ErrorCode code) noexcept;

/** @struct Error
 *  @brief Error code plus a human readable message.
 */
struct Error {
    ErrorCode   code{ErrorCode::Io};
    std::string message;

    /// Return a copy whose message is prefixed with `context: `.
    [[nodiscard]] Error wrap(std::string_view context) const;

    bool operator==(const Error&) const = default;
};

template <class T>
using Result = vpnlist_detail::expected<T, Error>;

/// Shorthand for returning an error from a Result-returning function.
inline vpnlist_detail::unexpected<Error> make_error(ErrorCode code, std::string message) {
    return vpnlist_detail::unexpected<Error>(Error{code, std::move(message)});
}

} // namespace vpnlist
